#include <gtest/gtest.h>
#include "forensics/forensics_analyzer.hpp"
#include "test_helpers.hpp"

using namespace fakeprobe;
using namespace fakeprobe::testing_support;

class ForensicsAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.stability_frame_size = 64;
        config.spectrum_size = 64;
        detector = ScriptedFaceDetector::fixed(cv::Rect(40, 40, 80, 80));

        cv::Mat frame = noiseFrame(160, 21);
        for (int i = 0; i < 12; ++i) {
            steady_frames.push_back(frame);
        }
    }

    ForensicsConfig config;
    std::shared_ptr<ScriptedFaceDetector> detector;
    std::vector<cv::Mat> steady_frames;
};

TEST_F(ForensicsAnalyzerTest, CombinesChecksWithConfiguredWeights) {
    ForensicsAnalyzer analyzer(detector, config);
    ForensicsMetrics metrics = analyzer.analyzeFrames(steady_frames);

    EXPECT_EQ(metrics.frame_count, 12);
    EXPECT_EQ(metrics.faces_detected, 12);
    EXPECT_NEAR(metrics.face_consistency_score, 100.0, 1e-3);
    EXPECT_NEAR(metrics.temporal_stability_score, 100.0, 1e-3);

    double expected = metrics.face_consistency_score * config.face_weight +
                      metrics.eye_blink_score * config.blink_weight +
                      metrics.temporal_stability_score * config.stability_weight +
                      (100.0 - metrics.compression_artifact_score) * config.artifact_weight;
    EXPECT_NEAR(metrics.overall_forensics_score, std::max(0.0, std::min(100.0, expected)), 1e-9);
    EXPECT_GE(metrics.overall_forensics_score, 0.0);
    EXPECT_LE(metrics.overall_forensics_score, 100.0);
}

TEST_F(ForensicsAnalyzerTest, RepeatedAnalysisIsDeterministic) {
    ForensicsAnalyzer analyzer(detector, config);
    ForensicsMetrics first = analyzer.analyzeFrames(steady_frames);
    ForensicsMetrics second = analyzer.analyzeFrames(steady_frames);

    EXPECT_EQ(first.frame_count, second.frame_count);
    EXPECT_DOUBLE_EQ(first.overall_forensics_score, second.overall_forensics_score);
    EXPECT_DOUBLE_EQ(first.eye_blink_score, second.eye_blink_score);
    EXPECT_DOUBLE_EQ(first.compression_artifact_score, second.compression_artifact_score);
}

TEST_F(ForensicsAnalyzerTest, ResetStartsANewVideo) {
    ForensicsAnalyzer analyzer(detector, config);
    for (const auto& frame : steady_frames) {
        analyzer.addFrame(frame);
    }
    ASSERT_EQ(analyzer.computeMetrics().frame_count, 12);

    analyzer.reset();
    ForensicsMetrics empty = analyzer.computeMetrics();
    EXPECT_EQ(empty.frame_count, 0);
    EXPECT_EQ(empty.faces_detected, 0);
    EXPECT_DOUBLE_EQ(empty.face_consistency_score, 100.0);
    EXPECT_DOUBLE_EQ(empty.eye_blink_score, 50.0);
}

TEST_F(ForensicsAnalyzerTest, FrameResultReportsEveryCheck) {
    ForensicsAnalyzer analyzer(detector, config);
    json frame_result = analyzer.addFrame(steady_frames.front());

    EXPECT_EQ(frame_result["frame_index"].get<int>(), 0);
    EXPECT_TRUE(frame_result.contains("face"));
    EXPECT_TRUE(frame_result.contains("blink"));
    EXPECT_TRUE(frame_result.contains("stability"));
    EXPECT_TRUE(frame_result.contains("artifacts"));
}

TEST_F(ForensicsAnalyzerTest, MissingVideoThrows) {
    ForensicsAnalyzer analyzer(detector, config);
    EXPECT_THROW(analyzer.analyzeVideo("/nonexistent/clip.mp4", 10), VideoOpenError);
}

TEST(ForensicsSummaryTest, FlagsFailingChecks) {
    ForensicsMetrics metrics;
    metrics.face_consistency_score = 30.0;
    metrics.eye_blink_score = 80.0;
    metrics.temporal_stability_score = 40.0;
    metrics.compression_artifact_score = 75.0;
    metrics.overall_forensics_score = 42.0;

    std::string summary = ForensicsAnalyzer::summarize(metrics);
    EXPECT_NE(summary.find("[!] Low face consistency (30.0%)"), std::string::npos);
    EXPECT_NE(summary.find("[ok] Blink pattern: 80.0%"), std::string::npos);
    EXPECT_NE(summary.find("[!] Low temporal stability (40.0%)"), std::string::npos);
    EXPECT_NE(summary.find("[!] High artifacts (75.0%)"), std::string::npos);
    EXPECT_NE(summary.find("Overall forensics score: 42.0%"), std::string::npos);
}

TEST(ForensicsMetricsTest, JsonCarriesScores) {
    ForensicsMetrics metrics;
    metrics.overall_forensics_score = 66.0;
    metrics.frame_count = 30;

    json j = metrics.toJson();
    EXPECT_DOUBLE_EQ(j["overall_forensics_score"].get<double>(), 66.0);
    EXPECT_EQ(j["frame_count"].get<int>(), 30);
}
