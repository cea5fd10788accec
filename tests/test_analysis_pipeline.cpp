#include <gtest/gtest.h>
#include "pipeline/analysis_pipeline.hpp"
#include "test_helpers.hpp"
#include <filesystem>

using namespace fakeprobe;
using namespace fakeprobe::testing_support;

class AnalysisPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.gradcam.max_frames = 4;
        config.audio.ffmpeg_binary = "/nonexistent/ffmpeg";
        detector = ScriptedFaceDetector::fixed(cv::Rect(20, 20, 80, 80));
        classifier = std::make_shared<BrightnessClassifier>();

        options.output_dir = (std::filesystem::path(::testing::TempDir()) / "fakeprobe_pipeline_test").string();
        for (int i = 0; i < 12; ++i) {
            frames.push_back(uniformFrame(128, 240));
        }
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(options.output_dir, ec);
    }

    AnalysisConfig config;
    PipelineOptions options;
    std::shared_ptr<ScriptedFaceDetector> detector;
    std::shared_ptr<BrightnessClassifier> classifier;
    std::vector<cv::Mat> frames;
};

TEST_F(AnalysisPipelineTest, RunsEveryStageWithClassifier) {
    AnalysisPipeline pipeline(config, detector, classifier);
    ASSERT_TRUE(pipeline.hasClassifier());

    AnalysisResult result = pipeline.analyzeFrames(frames, 30.0, "", options, ModelPrediction(), "clip");

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.prediction.isFake());
    EXPECT_GT(result.prediction.confidence, 90.0);

    ASSERT_TRUE(result.gradcam.available());
    EXPECT_EQ(result.gradcam.value().size(), 4u);
    EXPECT_TRUE(std::filesystem::exists(result.gradcam.value()[0].save_path));
    EXPECT_NE(result.gradcam.value()[0].save_path.find("clip_gradcam_frame_0000.png"), std::string::npos);

    ASSERT_TRUE(result.timeline.available());
    EXPECT_EQ(result.timeline.value().frames().size(), 4u);

    ASSERT_TRUE(result.forensics.available());
    EXPECT_EQ(result.forensics.value().frame_count, 12);
    EXPECT_FALSE(result.forensics_summary.empty());

    EXPECT_FALSE(result.multimodal.available());
    EXPECT_EQ(result.multimodal.reason(), "no audio source");

    ASSERT_TRUE(result.fake_type.available());
    ASSERT_TRUE(result.threat.available());
    EXPECT_DOUBLE_EQ(result.threat.value().effective_weights.at("audio_score"), 0.0);
    EXPECT_GT(result.threat.value().effective_weights.at("temporal_score"), 0.0);

    EXPECT_EQ(classifier->hookCount(), 0u);
    EXPECT_EQ(result.video_info.frame_count, 12);
    EXPECT_EQ(result.video_info.width, 128);
}

TEST_F(AnalysisPipelineTest, MaxFramesLimitsAnalysis) {
    options.max_frames = 5;
    options.enable_gradcam = false;
    AnalysisPipeline pipeline(config, detector, classifier);

    AnalysisResult result = pipeline.analyzeFrames(frames, 30.0, "", options);
    ASSERT_TRUE(result.forensics.available());
    EXPECT_EQ(result.forensics.value().frame_count, 5);
    EXPECT_EQ(result.timeline.value().frames().size(), 4u);
}

TEST_F(AnalysisPipelineTest, RepeatedRunsStartFromEmptyTimeline) {
    options.enable_gradcam = false;
    AnalysisPipeline pipeline(config, detector, classifier);

    AnalysisResult first = pipeline.analyzeFrames(frames, 30.0, "", options);
    AnalysisResult second = pipeline.analyzeFrames(frames, 30.0, "", options);
    ASSERT_TRUE(first.timeline.available());
    ASSERT_TRUE(second.timeline.available());
    EXPECT_EQ(first.timeline.value().stats().total_frames, 4);
    EXPECT_EQ(second.timeline.value().stats().total_frames, 4);
}

TEST_F(AnalysisPipelineTest, DisabledStagesAreUnavailable) {
    options.enable_gradcam = false;
    options.enable_timeline = false;
    options.enable_forensics = false;
    options.enable_multimodal = false;
    options.enable_fake_type = false;
    AnalysisPipeline pipeline(config, detector, classifier);

    AnalysisResult result = pipeline.analyzeFrames(frames, 30.0, "", options);
    EXPECT_EQ(result.gradcam.reason(), "disabled");
    EXPECT_EQ(result.timeline.reason(), "disabled");
    EXPECT_EQ(result.forensics.reason(), "disabled");
    EXPECT_EQ(result.multimodal.reason(), "disabled");
    EXPECT_EQ(result.fake_type.reason(), "disabled");
    EXPECT_EQ(detector->calls(), 0);

    // The model verdict alone still drives the threat level.
    ASSERT_TRUE(result.threat.available());
    EXPECT_DOUBLE_EQ(result.threat.value().effective_weights.at("model_confidence"), 1.0);
    EXPECT_EQ(result.threat.value().level, ThreatLevel::CRITICAL);
}

TEST_F(AnalysisPipelineTest, SuppliedPredictionWithoutClassifier) {
    AnalysisPipeline pipeline(config, detector, nullptr);
    EXPECT_FALSE(pipeline.hasClassifier());

    AnalysisResult result = pipeline.analyzeFrames(frames, 30.0, "", options,
                                                   ModelPrediction::fromLabel("REAL", 88.0));
    EXPECT_TRUE(result.prediction.isReal());
    EXPECT_DOUBLE_EQ(result.prediction.confidence, 88.0);
    EXPECT_EQ(result.gradcam.reason(), "classifier not loaded");
    EXPECT_EQ(result.timeline.reason(), "classifier not loaded");
    EXPECT_TRUE(result.forensics.available());
    EXPECT_TRUE(result.fake_type.available());
    ASSERT_TRUE(result.threat.available());
    EXPECT_DOUBLE_EQ(result.threat.value().effective_weights.at("temporal_score"), 0.0);
}

TEST_F(AnalysisPipelineTest, SuppliedPredictionOverridesClassifier) {
    options.enable_gradcam = false;
    AnalysisPipeline pipeline(config, detector, classifier);

    AnalysisResult result = pipeline.analyzeFrames(frames, 30.0, "", options,
                                                   ModelPrediction::fromLabel("REAL", 75.0));
    EXPECT_TRUE(result.prediction.isReal());
    EXPECT_TRUE(result.timeline.available());
}

TEST_F(AnalysisPipelineTest, UnreadableAudioStillProducesMultimodal) {
    options.enable_gradcam = false;
    AnalysisPipeline pipeline(config, detector, classifier);

    AnalysisResult result = pipeline.analyzeFrames(frames, 30.0, "/nonexistent/audio.mp4", options);
    ASSERT_TRUE(result.multimodal.available());
    EXPECT_FALSE(result.multimodal.value().audio_features.is_valid);
    EXPECT_DOUBLE_EQ(result.multimodal.value().combined_score, 50.0);
}

TEST_F(AnalysisPipelineTest, NoFramesLeavesForensicsUnavailable) {
    AnalysisPipeline pipeline(config, detector, classifier);

    AnalysisResult result = pipeline.analyzeFrames(std::vector<cv::Mat>(), 30.0, "", options);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.forensics.reason(), "no frames decoded");
    EXPECT_EQ(result.gradcam.reason(), "classifier not loaded");
    ASSERT_TRUE(result.threat.available());
    EXPECT_EQ(result.threat.value().level, ThreatLevel::SUSPICIOUS);
}

TEST_F(AnalysisPipelineTest, MissingVideoReportsError) {
    AnalysisPipeline pipeline(config, detector, classifier);

    AnalysisResult result = pipeline.analyzeVideo("/nonexistent/clip.mp4", options);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());

    json j = result.toJson();
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_TRUE(j.contains("error"));
}

TEST_F(AnalysisPipelineTest, JsonHasFlatAndDetailedFields) {
    options.enable_gradcam = false;
    AnalysisPipeline pipeline(config, detector, classifier);

    json j = pipeline.analyzeFrames(frames, 30.0, "", options).toJson();
    for (const char* key : {"success", "prediction", "prediction_label", "prediction_confidence", "video_info",
                            "gradcam_images", "gradcam_summary", "timeline_data", "timeline_stats",
                            "forensics_metrics", "forensics_summary", "multimodal_analysis", "audio_video_score",
                            "fake_type", "fake_type_confidence", "fake_type_explanation", "fake_type_details",
                            "threat_level", "threat_score", "threat_explanation", "threat_recommendations",
                            "threat_color", "threat_assessment", "analysis_timestamp", "analysis_duration_ms"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_FALSE(j.contains("error"));
    EXPECT_EQ(j["prediction_label"].get<std::string>(), "FAKE");
    EXPECT_FALSE(j["gradcam_summary"]["available"].get<bool>());
    EXPECT_EQ(j["gradcam_summary"]["reason"].get<std::string>(), "disabled");
    EXPECT_TRUE(j["gradcam_images"].empty());
    EXPECT_EQ(j["multimodal_analysis"]["reason"].get<std::string>(), "no audio source");
    EXPECT_DOUBLE_EQ(j["audio_video_score"].get<double>(), 50.0);
}

TEST(AnalysisPipelineConstructionTest, RequiresDetector) {
    EXPECT_THROW(AnalysisPipeline(AnalysisConfig(), nullptr, nullptr), std::invalid_argument);
}

TEST(VideoBaseNameTest, SanitizesStem) {
    EXPECT_EQ(videoBaseName("my clip.mp4"), "my_clip");
    EXPECT_EQ(videoBaseName("/data/videos/interview-01.mov"), "interview-01");
    EXPECT_EQ(videoBaseName("https://cdn.example.com/v/talk.mp4?token=abc"), "talk");
    EXPECT_EQ(videoBaseName(""), "video");
}
