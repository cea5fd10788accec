#include <gtest/gtest.h>
#include "pipeline/request_parsing.hpp"
#include <filesystem>
#include <fstream>

using namespace fakeprobe;

TEST(PredictionParsingTest, ReadsEitherLabelKey) {
    ModelPrediction a = predictionFromJson(json{{"prediction_label", "FAKE"}, {"confidence", 92.5}});
    EXPECT_TRUE(a.isFake());
    EXPECT_DOUBLE_EQ(a.confidence, 92.5);

    ModelPrediction b = predictionFromJson(json{{"label", "real"}, {"confidence", 70}});
    EXPECT_TRUE(b.isReal());
    EXPECT_EQ(b.label, "REAL");
}

TEST(PredictionParsingTest, UnknownLabelIsUnknownPrediction) {
    ModelPrediction prediction = predictionFromJson(json{{"label", "maybe"}, {"confidence", 60}});
    EXPECT_FALSE(prediction.isKnown());
    EXPECT_EQ(prediction.predicted_class, -1);

    EXPECT_FALSE(predictionFromJson(json::object()).isKnown());
}

TEST(PredictionParsingTest, RejectsWrongTypes) {
    EXPECT_THROW(predictionFromJson(json::array()), std::invalid_argument);
    EXPECT_THROW(predictionFromJson(json{{"label", 1}}), std::invalid_argument);
    EXPECT_THROW(predictionFromJson(json{{"label", "FAKE"}, {"confidence", "high"}}), std::invalid_argument);
}

TEST(PredictionParsingTest, ParsesCommandLineForm) {
    ModelPrediction prediction = predictionFromString("FAKE:95");
    EXPECT_TRUE(prediction.isFake());
    EXPECT_DOUBLE_EQ(prediction.confidence, 95.0);

    EXPECT_TRUE(predictionFromString("real:80").isReal());
    EXPECT_DOUBLE_EQ(predictionFromString("FAKE:150").confidence, 100.0);

    EXPECT_THROW(predictionFromString("FAKE"), std::invalid_argument);
    EXPECT_THROW(predictionFromString("FAKE:lots"), std::invalid_argument);
    EXPECT_THROW(predictionFromString("FORGED:90"), std::invalid_argument);
}

TEST(ForensicsParsingTest, MissingFieldsUseNeutralDefaults) {
    ForensicsMetrics metrics = forensicsFromJson(json{{"overall_forensics_score", 30.0}, {"frame_count", 80}});
    EXPECT_DOUBLE_EQ(metrics.overall_forensics_score, 30.0);
    EXPECT_EQ(metrics.frame_count, 80);
    EXPECT_DOUBLE_EQ(metrics.face_consistency_score, 100.0);
    EXPECT_DOUBLE_EQ(metrics.eye_blink_score, 50.0);
    EXPECT_DOUBLE_EQ(metrics.temporal_stability_score, 100.0);
    EXPECT_DOUBLE_EQ(metrics.compression_artifact_score, 0.0);

    EXPECT_DOUBLE_EQ(forensicsFromJson(json::object()).overall_forensics_score, 50.0);
    EXPECT_THROW(forensicsFromJson(json{{"eye_blink_score", "low"}}), std::invalid_argument);
    EXPECT_THROW(forensicsFromJson(json("metrics")), std::invalid_argument);
}

TEST(ForensicsParsingTest, CountsMustFitInInt) {
    EXPECT_THROW(forensicsFromJson(json{{"frame_count", 1e12}}), std::invalid_argument);
    EXPECT_THROW(forensicsFromJson(json{{"frame_count", -1}}), std::invalid_argument);
    EXPECT_THROW(forensicsFromJson(json{{"faces_detected", 3000000000.0}}), std::invalid_argument);
    EXPECT_EQ(forensicsFromJson(json{{"frame_count", 2147483647}}).frame_count, 2147483647);
}

TEST(MultimodalParsingTest, ReadsNestedFeatures) {
    json j = {
        {"audio_spoof_score", 70.0},
        {"lip_sync_score", 30.0},
        {"combined_score", 35.0},
        {"lip_sync_features", {{"correlation", 0.15}}},
        {"audio_features", {{"is_valid", true}}}
    };

    MultiModalAnalysis analysis = multimodalFromJson(j);
    EXPECT_DOUBLE_EQ(analysis.audio_spoof_score, 70.0);
    EXPECT_DOUBLE_EQ(analysis.combined_score, 35.0);
    EXPECT_DOUBLE_EQ(analysis.confidence, 30.0);
    EXPECT_TRUE(analysis.has_lip_sync);
    EXPECT_DOUBLE_EQ(analysis.lip_sync_features.correlation, 0.15);
    EXPECT_TRUE(analysis.audio_features.is_valid);
}

TEST(MultimodalParsingTest, DefaultsAndTypeErrors) {
    MultiModalAnalysis analysis = multimodalFromJson(json::object());
    EXPECT_DOUBLE_EQ(analysis.audio_spoof_score, 50.0);
    EXPECT_DOUBLE_EQ(analysis.lip_sync_score, 50.0);
    EXPECT_FALSE(analysis.has_lip_sync);

    MultiModalAnalysis bare_sync = multimodalFromJson(json{{"lip_sync_features", json::object()}});
    EXPECT_TRUE(bare_sync.has_lip_sync);
    EXPECT_DOUBLE_EQ(bare_sync.lip_sync_features.correlation, 1.0);

    EXPECT_THROW(multimodalFromJson(json{{"audio_features", {{"is_valid", 1}}}}), std::invalid_argument);
}

TEST(TimelineParsingTest, MinMaxFollowMean) {
    TimelineStats stats = timelineStatsFromJson(json{{"mean_fake_probability", 0.8}, {"anomaly_ratio", 0.25}});
    EXPECT_DOUBLE_EQ(stats.mean_fake_probability, 0.8);
    EXPECT_DOUBLE_EQ(stats.max_fake_probability, 0.8);
    EXPECT_DOUBLE_EQ(stats.min_fake_probability, 0.8);
    EXPECT_DOUBLE_EQ(stats.anomaly_ratio, 0.25);
    EXPECT_DOUBLE_EQ(stats.temporal_consistency_score, 50.0);

    EXPECT_DOUBLE_EQ(timelineStatsFromJson(json::object()).mean_fake_probability, 0.5);
}

TEST(TimelineParsingTest, CountsMustFitInInt) {
    EXPECT_THROW(timelineStatsFromJson(json{{"total_frames", 3e9}}), std::invalid_argument);
    EXPECT_THROW(timelineStatsFromJson(json{{"anomaly_count", -2}}), std::invalid_argument);
    EXPECT_EQ(timelineStatsFromJson(json{{"total_frames", 120}}).total_frames, 120);
}

TEST(FakeTypeParsingTest, ReadsTypeName) {
    FakeTypeResult result = fakeTypeFromJson(json{{"type", "lip_sync_manipulation"}, {"confidence", 82.0}});
    EXPECT_EQ(result.primary_type, FakeType::LIP_SYNC);
    EXPECT_DOUBLE_EQ(result.confidence, 82.0);

    FakeTypeResult fallback = fakeTypeFromJson(json::object());
    EXPECT_EQ(fallback.primary_type, FakeType::UNKNOWN_MANIPULATION);
    EXPECT_DOUBLE_EQ(fallback.confidence, 50.0);

    EXPECT_THROW(fakeTypeFromJson(json{{"type", 3}}), std::invalid_argument);
}

TEST(StageToggleTest, OnlyListedStagesChange) {
    PipelineOptions options;
    applyStageToggles(json{{"gradcam", false}, {"multimodal", false}}, options);

    EXPECT_FALSE(options.enable_gradcam);
    EXPECT_FALSE(options.enable_multimodal);
    EXPECT_TRUE(options.enable_timeline);
    EXPECT_TRUE(options.enable_forensics);
    EXPECT_TRUE(options.enable_fake_type);
    EXPECT_TRUE(options.enable_threat);
}

TEST(StageToggleTest, RejectsNonBooleans) {
    PipelineOptions options;
    EXPECT_THROW(applyStageToggles(json{{"threat", "off"}}, options), std::invalid_argument);
    EXPECT_THROW(applyStageToggles(json::array(), options), std::invalid_argument);
}

TEST(FrameRequestTest, ClampsToServerCap) {
    EXPECT_EQ(clampFrameRequest(50, 300), 50);
    EXPECT_EQ(clampFrameRequest(300, 300), 300);
    EXPECT_EQ(clampFrameRequest(10000, 300), 300);
    EXPECT_EQ(clampFrameRequest(0, 300), 300);
    EXPECT_EQ(clampFrameRequest(-5, 300), 300);
}

class VideoLocationTest : public ::testing::Test {
protected:
    void SetUp() override {
        base = std::filesystem::path(::testing::TempDir()) / "fakeprobe_location_test";
        std::filesystem::remove_all(base);
        std::filesystem::create_directories(base / "uploads");
        std::filesystem::create_directories(base / "private");
        std::ofstream(base / "private" / "secret.mp4") << "x";
        server.upload_root = (base / "uploads").string();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(base, ec);
    }

    std::filesystem::path uploads() const {
        return std::filesystem::weakly_canonical(base / "uploads");
    }

    std::filesystem::path base;
    ServerConfig server;
};

TEST_F(VideoLocationTest, RemoteUrlsFollowPolicy) {
    EXPECT_EQ(resolveVideoLocation("https://cdn.example.com/talk.mp4", server), "https://cdn.example.com/talk.mp4");

    server.allow_remote_urls = false;
    EXPECT_THROW(resolveVideoLocation("https://cdn.example.com/talk.mp4", server), std::invalid_argument);
}

TEST_F(VideoLocationTest, OtherSchemesAreRejected) {
    EXPECT_THROW(resolveVideoLocation("file:///etc/passwd", server), std::invalid_argument);
    EXPECT_THROW(resolveVideoLocation("ftp://example.com/clip.mp4", server), std::invalid_argument);
    EXPECT_THROW(resolveVideoLocation("", server), std::invalid_argument);
}

TEST_F(VideoLocationTest, LocalPathsNeedUploadRoot) {
    server.upload_root.clear();
    EXPECT_THROW(resolveVideoLocation("clip.mp4", server), std::invalid_argument);
}

TEST_F(VideoLocationTest, PathsInsideRootResolve) {
    EXPECT_EQ(resolveVideoLocation("clip.mp4", server), (uploads() / "clip.mp4").string());
    EXPECT_EQ(resolveVideoLocation("day1/../clip.mp4", server), (uploads() / "clip.mp4").string());

    std::string absolute = (base / "uploads" / "nested" / "clip.mp4").string();
    EXPECT_EQ(resolveVideoLocation(absolute, server), (uploads() / "nested" / "clip.mp4").string());
}

TEST_F(VideoLocationTest, PathsOutsideRootAreRejected) {
    EXPECT_THROW(resolveVideoLocation("../private/secret.mp4", server), std::invalid_argument);
    EXPECT_THROW(resolveVideoLocation("/etc/passwd", server), std::invalid_argument);
    EXPECT_THROW(resolveVideoLocation((base / "uploads_other" / "clip.mp4").string(), server),
                 std::invalid_argument);
}

TEST_F(VideoLocationTest, SymlinkOutOfRootIsRejected) {
    std::filesystem::create_directory_symlink(base / "private", base / "uploads" / "link");
    EXPECT_THROW(resolveVideoLocation("link/secret.mp4", server), std::invalid_argument);
}
