#include <gtest/gtest.h>
#include "forensics/face_consistency_analyzer.hpp"
#include "test_helpers.hpp"

using namespace fakeprobe;
using namespace fakeprobe::testing_support;

class FaceConsistencyTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Dark frames get a small face at the top-left, bright frames a large
        // one further down, so size and appearance both flip every frame.
        flickering_detector = std::make_shared<ScriptedFaceDetector>(
            [](const cv::Mat& gray) {
                if (cv::mean(gray)[0] < 128.0) {
                    return std::vector<cv::Rect>{cv::Rect(10, 10, 40, 40)};
                }
                return std::vector<cv::Rect>{cv::Rect(60, 60, 100, 100)};
            },
            [](const cv::Mat&) { return std::vector<cv::Rect>(); });
    }

    ForensicsConfig config;
    std::shared_ptr<ScriptedFaceDetector> flickering_detector;
};

TEST_F(FaceConsistencyTest, StableFaceScoresFull) {
    FaceConsistencyAnalyzer analyzer(ScriptedFaceDetector::fixed(cv::Rect(50, 50, 80, 80)), config);

    cv::Mat frame = noiseFrame(200, 7);
    for (int i = 0; i < 10; ++i) {
        analyzer.addFrame(frame);
    }

    FaceConsistencyResult result = analyzer.result();
    EXPECT_EQ(result.frames_analyzed, 10);
    EXPECT_EQ(result.faces_detected, 10);
    EXPECT_NEAR(result.histogram_similarity, 1.0, 1e-6);
    EXPECT_NEAR(result.size_variation, 0.0, 1e-9);
    EXPECT_NEAR(result.score, 100.0, 1e-3);
}

TEST_F(FaceConsistencyTest, AlternatingFaceScoresLow) {
    FaceConsistencyAnalyzer analyzer(flickering_detector, config);

    for (int i = 0; i < 10; ++i) {
        analyzer.addFrame(uniformFrame(200, i % 2 == 0 ? 20 : 230));
    }

    FaceConsistencyResult result = analyzer.result();
    EXPECT_EQ(result.faces_detected, 10);
    EXPECT_NEAR(result.histogram_similarity, 0.0, 1e-6);
    EXPECT_NEAR(result.size_variation, 30.0 / 70.0, 1e-6);
    EXPECT_LT(result.score, 50.0);
    EXPECT_NEAR(result.score, 28.57, 0.1);
}

TEST_F(FaceConsistencyTest, TooFewFacesIsNeutral) {
    FaceConsistencyAnalyzer analyzer(ScriptedFaceDetector::none(), config);
    for (int i = 0; i < 5; ++i) {
        json frame_result = analyzer.addFrame(noiseFrame(120, i));
        EXPECT_FALSE(frame_result["face_detected"].get<bool>());
    }

    FaceConsistencyResult result = analyzer.result();
    EXPECT_EQ(result.frames_analyzed, 5);
    EXPECT_EQ(result.faces_detected, 0);
    EXPECT_DOUBLE_EQ(result.score, 100.0);
    EXPECT_EQ(result.reason, "Insufficient frames for analysis");
}

TEST_F(FaceConsistencyTest, FaceBoxIsClippedToFrame) {
    FaceConsistencyAnalyzer analyzer(ScriptedFaceDetector::fixed(cv::Rect(150, 150, 100, 100)), config);
    json frame_result = analyzer.addFrame(noiseFrame(200, 1));

    ASSERT_TRUE(frame_result["face_detected"].get<bool>());
    EXPECT_EQ(frame_result["face_box"][2].get<int>(), 50);
    EXPECT_EQ(frame_result["face_box"][3].get<int>(), 50);
}

TEST_F(FaceConsistencyTest, ResetForgetsPreviousVideo) {
    FaceConsistencyAnalyzer analyzer(flickering_detector, config);
    for (int i = 0; i < 6; ++i) {
        analyzer.addFrame(uniformFrame(200, i % 2 == 0 ? 20 : 230));
    }
    ASSERT_LT(analyzer.result().score, 50.0);

    analyzer.reset();
    EXPECT_EQ(analyzer.facesDetected(), 0);
    EXPECT_EQ(analyzer.result().frames_analyzed, 0);

    for (int i = 0; i < 6; ++i) {
        analyzer.addFrame(uniformFrame(200, 20));
    }
    EXPECT_NEAR(analyzer.result().score, 100.0, 1e-3);
}
