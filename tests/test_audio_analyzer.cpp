#include <gtest/gtest.h>
#include "multimodal/audio_analyzer.hpp"
#include "test_helpers.hpp"

using namespace fakeprobe;
using namespace fakeprobe::testing_support;

class AudioAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // One second of a 150 Hz tone at 16 kHz
        tone = sineWave(150.0, 16000, 1.0);
    }

    AudioConfig config;
    std::vector<double> tone;
};

TEST_F(AudioAnalyzerTest, DetectsPitchOfPureTone) {
    AudioAnalyzer analyzer(config);
    PitchStats pitch = analyzer.computePitch(tone, 16000);

    EXPECT_GT(pitch.voiced_frames, 0);
    EXPECT_NEAR(pitch.mean, 150.0, 3.0);
    // A perfectly flat contour is itself suspicious.
    EXPECT_GE(pitch.variance_score, 70.0);
}

TEST_F(AudioAnalyzerTest, PureToneHasNoJitter) {
    AudioAnalyzer analyzer(config);
    JitterStats jitter = analyzer.computeJitter(tone);

    EXPECT_GT(jitter.periods, 100);
    EXPECT_LT(jitter.jitter, config.perfect_jitter);
    EXPECT_DOUBLE_EQ(jitter.score, 80.0);
}

TEST_F(AudioAnalyzerTest, AnalyzeFillsEveryFeature) {
    AudioAnalyzer analyzer(config);
    AudioFeatures features = analyzer.analyze(tone, 16000);

    ASSERT_TRUE(features.is_valid);
    EXPECT_NEAR(features.duration_seconds, 1.0, 1e-9);
    EXPECT_EQ(features.sample_rate, 16000);
    EXPECT_NEAR(features.pitch_mean, 150.0, 3.0);
    EXPECT_DOUBLE_EQ(features.jitter_score, 80.0);
    EXPECT_EQ(features.energy_profile.size(), static_cast<size_t>(config.energy_segments));
    EXPECT_NEAR(features.zero_crossing_rate, 300.0 / 16000.0, 1e-3);
    EXPECT_GT(features.spectral_centroid_mean, 100.0);
    EXPECT_LT(features.spectral_centroid_mean, 400.0);
}

TEST_F(AudioAnalyzerTest, EnergyProfileOfSineIsRms) {
    AudioAnalyzer analyzer(config);
    std::vector<double> energy = analyzer.computeEnergyProfile(tone);

    ASSERT_FALSE(energy.empty());
    for (double e : energy) {
        EXPECT_NEAR(e, 0.5 / std::sqrt(2.0), 0.02);
    }
}

TEST_F(AudioAnalyzerTest, EmptyInputIsInvalid) {
    AudioAnalyzer analyzer(config);
    AudioFeatures features = analyzer.analyze(std::vector<double>(), 16000);
    EXPECT_FALSE(features.is_valid);
    EXPECT_FALSE(features.error_message.empty());
    EXPECT_DOUBLE_EQ(features.pitch_variance_score, 50.0);
    EXPECT_DOUBLE_EQ(features.jitter_score, 50.0);
}

TEST_F(AudioAnalyzerTest, SilenceHasNoPitch) {
    AudioAnalyzer analyzer(config);
    PitchStats pitch = analyzer.computePitch(std::vector<double>(16000, 0.0), 16000);
    EXPECT_EQ(pitch.voiced_frames, 0);
    EXPECT_DOUBLE_EQ(pitch.variance_score, 50.0);
}

TEST_F(AudioAnalyzerTest, MissingAudioTrackIsReportedNotThrown) {
    config.ffmpeg_binary = "/nonexistent/ffmpeg";
    AudioAnalyzer analyzer(config);
    AudioFeatures features;
    EXPECT_NO_THROW(features = analyzer.analyzeFile("/nonexistent/clip.mp4"));
    EXPECT_FALSE(features.is_valid);
    EXPECT_FALSE(features.error_message.empty());
}

TEST(ZeroCrossingTest, InterpolatesCrossingPosition) {
    std::vector<double> samples = {1.0, -1.0, -1.0, 3.0};
    std::vector<double> crossings = AudioAnalyzer::zeroCrossings(samples);

    ASSERT_EQ(crossings.size(), 2u);
    EXPECT_DOUBLE_EQ(crossings[0], 0.5);
    EXPECT_DOUBLE_EQ(crossings[1], 2.25);
    EXPECT_DOUBLE_EQ(AudioAnalyzer::zeroCrossingRate(samples), 0.5);
}
