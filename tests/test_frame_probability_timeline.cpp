#include <gtest/gtest.h>
#include "explain/frame_probability_timeline.hpp"
#include "test_helpers.hpp"
#include <cmath>

using namespace fakeprobe;
using namespace fakeprobe::testing_support;

namespace {

// Two-class logits whose softmax gives fake_probability p.
std::vector<double> logitsFor(double p) {
    return {std::log(p / (1.0 - p)), 0.0};
}

} // namespace

class FrameProbabilityTimelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.fps = 10.0;
        timeline = std::make_unique<FrameProbabilityTimeline>(config);
    }

    TimelineConfig config;
    std::unique_ptr<FrameProbabilityTimeline> timeline;
};

TEST_F(FrameProbabilityTimelineTest, ProbabilitiesSumToOne) {
    FrameProbability frame = timeline->addFrame(0, {2.5, -1.0});
    EXPECT_NEAR(frame.fake_probability + frame.real_probability, 1.0, 1e-12);
    EXPECT_GT(frame.fake_probability, 0.9);

    FrameProbability even = timeline->addFrame(1, {0.0, 0.0});
    EXPECT_DOUBLE_EQ(even.fake_probability, 0.5);
    EXPECT_DOUBLE_EQ(even.real_probability, 0.5);
}

TEST_F(FrameProbabilityTimelineTest, TimestampsFollowFps) {
    timeline->addFrame(0, {0.0, 0.0});
    FrameProbability third = timeline->addFrame(3, {0.0, 0.0});
    FrameProbability explicit_time = timeline->addFrame(4, {0.0, 0.0}, 123.0);

    EXPECT_DOUBLE_EQ(third.timestamp_ms, 300.0);
    EXPECT_DOUBLE_EQ(explicit_time.timestamp_ms, 123.0);
}

TEST_F(FrameProbabilityTimelineTest, SuddenJumpIsAnomaly) {
    timeline->addFrame(0, logitsFor(0.1));
    timeline->addFrame(1, logitsFor(0.2));
    FrameProbability jump = timeline->addFrame(2, logitsFor(0.9));
    FrameProbability steady = timeline->addFrame(3, logitsFor(0.85));

    EXPECT_FALSE(timeline->frames()[0].is_anomaly);
    EXPECT_FALSE(timeline->frames()[1].is_anomaly);
    EXPECT_TRUE(jump.is_anomaly);
    EXPECT_NEAR(jump.anomaly_score, 0.7, 1e-9);
    EXPECT_FALSE(steady.is_anomaly);
}

TEST_F(FrameProbabilityTimelineTest, StatsSummarizeSequence) {
    timeline->addBatch(0, {logitsFor(0.2), logitsFor(0.4), logitsFor(0.2), logitsFor(0.4)});

    TimelineStats stats = timeline->stats();
    EXPECT_EQ(stats.total_frames, 4);
    EXPECT_NEAR(stats.mean_fake_probability, 0.3, 1e-9);
    EXPECT_NEAR(stats.max_fake_probability, 0.4, 1e-9);
    EXPECT_NEAR(stats.min_fake_probability, 0.2, 1e-9);
    EXPECT_NEAR(stats.temporal_variance, 0.2, 1e-9);
    EXPECT_NEAR(stats.temporal_consistency_score, 60.0, 1e-6);
    EXPECT_EQ(stats.anomaly_count, 0);
    EXPECT_DOUBLE_EQ(stats.anomaly_ratio, 0.0);
}

TEST_F(FrameProbabilityTimelineTest, ConstantSequenceIsFullyConsistent) {
    for (int i = 0; i < 5; ++i) {
        timeline->addFrame(i, logitsFor(0.7));
    }
    TimelineStats stats = timeline->stats();
    EXPECT_NEAR(stats.temporal_variance, 0.0, 1e-12);
    EXPECT_NEAR(stats.temporal_consistency_score, 100.0, 1e-9);
}

TEST_F(FrameProbabilityTimelineTest, SmoothingUsesCenteredWindow) {
    std::vector<double> probs = {0.1, 0.1, 0.6, 0.1, 0.1, 0.1};
    for (size_t i = 0; i < probs.size(); ++i) {
        timeline->addFrame(static_cast<int>(i), logitsFor(probs[i]));
    }

    std::vector<double> smoothed = timeline->smoothedProbabilities();
    ASSERT_EQ(smoothed.size(), probs.size());
    EXPECT_NEAR(smoothed[0], (0.1 + 0.1 + 0.6) / 3.0, 1e-9);
    EXPECT_NEAR(smoothed[2], 1.0 / 5.0, 1e-9);
    EXPECT_NEAR(smoothed[5], (0.1 + 0.1 + 0.1) / 3.0, 1e-9);
}

TEST_F(FrameProbabilityTimelineTest, ShortSequenceIsNotSmoothed) {
    timeline->addFrame(0, logitsFor(0.2));
    timeline->addFrame(1, logitsFor(0.8));

    std::vector<double> smoothed = timeline->smoothedProbabilities();
    ASSERT_EQ(smoothed.size(), 2u);
    EXPECT_NEAR(smoothed[0], 0.2, 1e-9);
    EXPECT_NEAR(smoothed[1], 0.8, 1e-9);
}

TEST_F(FrameProbabilityTimelineTest, ChartJsonHasDatasetsAndAnomalies) {
    timeline->addFrame(0, logitsFor(0.1));
    timeline->addFrame(1, logitsFor(0.9));

    json chart = timeline->toChartJson();
    ASSERT_EQ(chart["labels"].size(), 2u);
    EXPECT_EQ(chart["labels"][1].get<std::string>(), "Frame 1");
    EXPECT_NEAR(chart["timestamps"][1].get<double>(), 0.1, 1e-9);
    ASSERT_EQ(chart["datasets"].size(), 3u);
    EXPECT_NEAR(chart["datasets"][0]["data"][1].get<double>(), 90.0, 1e-6);
    EXPECT_NEAR(chart["datasets"][1]["data"][1].get<double>(), 10.0, 1e-6);
    ASSERT_EQ(chart["anomalies"].size(), 1u);
    EXPECT_EQ(chart["anomalies"][0]["x"].get<int>(), 1);
    EXPECT_TRUE(chart.contains("statistics"));
}

TEST_F(FrameProbabilityTimelineTest, EmptyTimelineExportsEmptyChart) {
    json chart = timeline->toChartJson();
    EXPECT_TRUE(chart["labels"].empty());
    EXPECT_TRUE(chart["datasets"].empty());
    EXPECT_EQ(timeline->stats().total_frames, 0);

    json full = timeline->toJson();
    EXPECT_EQ(full["metadata"]["total_frames"].get<int>(), 0);
}

TEST_F(FrameProbabilityTimelineTest, RejectsSingleLogit) {
    EXPECT_THROW(timeline->addFrame(0, {1.0}), std::invalid_argument);
    EXPECT_TRUE(timeline->empty());
}

TEST_F(FrameProbabilityTimelineTest, BatchUpdatesFpsAndResetClears) {
    timeline->addBatch(10, {logitsFor(0.5), logitsFor(0.5)}, 25.0);
    EXPECT_DOUBLE_EQ(timeline->fps(), 25.0);
    EXPECT_EQ(timeline->frames()[1].frame_index, 11);
    EXPECT_NEAR(timeline->frames()[1].timestamp_ms, 440.0, 1e-9);

    json full = timeline->toJson();
    EXPECT_EQ(full["frames"].size(), 2u);
    EXPECT_DOUBLE_EQ(full["metadata"]["fps"].get<double>(), 25.0);

    timeline->reset();
    EXPECT_TRUE(timeline->empty());
}

TEST_F(FrameProbabilityTimelineTest, FramesAccumulateUntilReset) {
    std::vector<std::vector<double>> clip = {logitsFor(0.2), logitsFor(0.6), logitsFor(0.4)};

    timeline->addBatch(0, clip);
    timeline->addBatch(0, clip);
    EXPECT_EQ(timeline->stats().total_frames, 6);
    EXPECT_EQ(timeline->frames().size(), 6u);

    timeline->reset();
    timeline->addBatch(0, clip);
    EXPECT_EQ(timeline->stats().total_frames, 3);
    EXPECT_NEAR(timeline->stats().mean_fake_probability, 0.4, 1e-9);
}

TEST(ExtractFrameProbabilitiesTest, OneEntryPerFrame) {
    BrightnessClassifier classifier;
    std::vector<cv::Mat> frames = {uniformFrame(32, 0), uniformFrame(32, 255), uniformFrame(32, 0)};

    TimelineConfig config;
    FrameProbabilityTimeline timeline = extractFrameProbabilities(classifier, frames, config);

    ASSERT_EQ(timeline.frames().size(), 3u);
    EXPECT_LT(timeline.frames()[0].fake_probability, 0.1);
    EXPECT_GT(timeline.frames()[1].fake_probability, 0.9);
    EXPECT_TRUE(timeline.frames()[1].is_anomaly);
    EXPECT_TRUE(timeline.frames()[2].is_anomaly);
    EXPECT_EQ(classifier.hookCount(), 0u);
}
