#include <gtest/gtest.h>
#include "decision/threat_level_scorer.hpp"

using namespace fakeprobe;

class ThreatLevelScorerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clean.face_consistency_score = 90.0;
        clean.eye_blink_score = 80.0;
        clean.temporal_stability_score = 85.0;
        clean.compression_artifact_score = 20.0;
        clean.overall_forensics_score = 85.0;
        clean.frame_count = 100;

        tampered.face_consistency_score = 20.0;
        tampered.eye_blink_score = 20.0;
        tampered.temporal_stability_score = 20.0;
        tampered.compression_artifact_score = 80.0;
        tampered.overall_forensics_score = 20.0;
        tampered.frame_count = 30;

        synced.audio_features.is_valid = true;
        synced.lip_sync_score = 85.0;
        synced.audio_spoof_score = 20.0;
        synced.combined_score = 80.0;

        dubbed.lip_sync_score = 20.0;
        dubbed.audio_spoof_score = 80.0;
        dubbed.combined_score = 25.0;

        steady.mean_fake_probability = 0.1;
        steady.temporal_consistency_score = 90.0;

        authentic.primary_type = FakeType::AUTHENTIC;
        authentic.confidence = 85.0;
    }

    ThreatLevelScorer scorer;
    ForensicsMetrics clean;
    ForensicsMetrics tampered;
    MultiModalAnalysis synced;
    MultiModalAnalysis dubbed;
    TimelineStats steady;
    FakeTypeResult authentic;
};

TEST_F(ThreatLevelScorerTest, AuthenticSignalsAreSafe) {
    ThreatAssessment result = scorer.assess(ModelPrediction::fromLabel("REAL", 90.0), &clean, &synced, &steady,
                                            &authentic);

    EXPECT_EQ(result.level, ThreatLevel::SAFE);
    EXPECT_NEAR(result.overall_score, 13.25, 1e-9);
    EXPECT_NEAR(result.component_scores["model_confidence"], 10.0, 1e-9);
    EXPECT_NEAR(result.component_scores["forensics_score"], 15.0, 1e-9);
    EXPECT_NEAR(result.component_scores["audio_score"], 20.0, 1e-9);
    EXPECT_NEAR(result.component_scores["temporal_score"], 10.0, 1e-9);
    EXPECT_NEAR(result.component_scores["fake_type_score"], 15.0, 1e-9);
    EXPECT_DOUBLE_EQ(result.confidence, 95.0);
    EXPECT_TRUE(result.risk_factors.empty());
    EXPECT_EQ(result.mitigating_factors.size(), 6u);
    EXPECT_EQ(result.mitigating_factors.front(), "Model detects REAL with high confidence (90.0%)");
    EXPECT_EQ(result.color_code, "#28a745");
    EXPECT_EQ(result.level_display, "Safe");
}

TEST_F(ThreatLevelScorerTest, StrongFakeEvidenceIsCritical) {
    ThreatAssessment result = scorer.assess(ModelPrediction::fromLabel("FAKE", 95.0), &tampered, &dubbed, nullptr,
                                            nullptr);

    EXPECT_EQ(result.level, ThreatLevel::CRITICAL);
    EXPECT_NEAR(result.overall_score, 86.0, 1e-9);
    EXPECT_NEAR(result.effective_weights["model_confidence"], 0.35 / 0.75, 1e-9);
    EXPECT_NEAR(result.effective_weights["forensics_score"], 0.25 / 0.75, 1e-9);
    EXPECT_NEAR(result.effective_weights["audio_score"], 0.15 / 0.75, 1e-9);
    EXPECT_DOUBLE_EQ(result.effective_weights["temporal_score"], 0.0);
    EXPECT_DOUBLE_EQ(result.effective_weights["fake_type_score"], 0.0);
    EXPECT_DOUBLE_EQ(result.component_scores["temporal_score"], 50.0);
    EXPECT_DOUBLE_EQ(result.component_scores["fake_type_score"], 50.0);

    ASSERT_GE(result.recommendations.size(), 2u);
    EXPECT_EQ(result.recommendations[0], "BLOCK: Do not publish or distribute this content");
    EXPECT_EQ(result.recommendations[1], "Immediately escalate to security/legal team");

    ASSERT_FALSE(result.risk_factors.empty());
    EXPECT_EQ(result.risk_factors.front(), "Model detects FAKE with high confidence (95.0%)");
    EXPECT_NE(result.explanation.find("Overall threat score: 86.0/100."), std::string::npos);
    EXPECT_NE(result.explanation.find("Primary concern: model confidence (95.0/100)."), std::string::npos);
    EXPECT_NE(result.explanation.find("Key risk factors: "), std::string::npos);
    EXPECT_EQ(result.explanation.find("Poor lip-audio synchronization"), std::string::npos);

    // Forensics present but short clip, multimodal without valid audio.
    EXPECT_DOUBLE_EQ(result.confidence, 85.0);
}

TEST_F(ThreatLevelScorerTest, NothingAvailableIsUnknown) {
    ThreatAssessment result = scorer.assess(ModelPrediction(), nullptr, nullptr, nullptr, nullptr);

    EXPECT_EQ(result.level, ThreatLevel::UNKNOWN);
    EXPECT_DOUBLE_EQ(result.overall_score, 50.0);
    EXPECT_DOUBLE_EQ(result.confidence, 60.0);
    for (const auto& entry : result.effective_weights) {
        EXPECT_DOUBLE_EQ(entry.second, 0.0) << entry.first;
    }
    EXPECT_EQ(result.recommendations, ThreatLevelScorer::recommendationsFor(ThreatLevel::UNKNOWN));
    EXPECT_EQ(result.explanation.find("Primary concern"), std::string::npos);
}

TEST_F(ThreatLevelScorerTest, EffectiveWeightsSumToOne) {
    ThreatAssessment result = scorer.assess(ModelPrediction(), &clean, nullptr, &steady, nullptr);

    double total = 0.0;
    for (const auto& entry : result.effective_weights) {
        total += entry.second;
    }
    EXPECT_NEAR(total, 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(result.effective_weights["model_confidence"], 0.0);
    EXPECT_DOUBLE_EQ(result.component_scores["model_confidence"], 50.0);
    EXPECT_NEAR(result.overall_score, (15.0 * 0.25 + 10.0 * 0.15) / 0.40, 1e-9);
}

TEST_F(ThreatLevelScorerTest, UnknownFakeTypeIsNeutralRisk) {
    FakeTypeResult unknown;
    ThreatAssessment result = scorer.assess(ModelPrediction(), nullptr, nullptr, nullptr, &unknown);

    EXPECT_DOUBLE_EQ(result.component_scores["fake_type_score"], 50.0);
    EXPECT_DOUBLE_EQ(result.effective_weights["fake_type_score"], 1.0);
    EXPECT_EQ(result.level, ThreatLevel::SUSPICIOUS);
    ASSERT_EQ(result.risk_factors.size(), 1u);
    EXPECT_EQ(result.risk_factors[0], "Unable to determine manipulation type with confidence");
}

TEST_F(ThreatLevelScorerTest, LevelBoundariesAreInclusive) {
    EXPECT_EQ(scorer.levelFor(0.0), ThreatLevel::SAFE);
    EXPECT_EQ(scorer.levelFor(25.0), ThreatLevel::SAFE);
    EXPECT_EQ(scorer.levelFor(25.01), ThreatLevel::SUSPICIOUS);
    EXPECT_EQ(scorer.levelFor(55.0), ThreatLevel::SUSPICIOUS);
    EXPECT_EQ(scorer.levelFor(55.5), ThreatLevel::HIGH_RISK);
    EXPECT_EQ(scorer.levelFor(80.0), ThreatLevel::HIGH_RISK);
    EXPECT_EQ(scorer.levelFor(80.1), ThreatLevel::CRITICAL);
    EXPECT_EQ(scorer.levelFor(100.0), ThreatLevel::CRITICAL);
}

TEST_F(ThreatLevelScorerTest, JsonLayout) {
    ThreatAssessment result = scorer.assess(ModelPrediction::fromLabel("FAKE", 95.0), &tampered, &dubbed, nullptr,
                                            nullptr);
    json j = result.toJson();

    EXPECT_EQ(j["level"].get<std::string>(), "critical");
    EXPECT_EQ(j["level_display"].get<std::string>(), "Critical");
    EXPECT_EQ(j["color_code"].get<std::string>(), "#dc3545");
    EXPECT_EQ(j["component_scores"].size(), 5u);
    EXPECT_EQ(j["effective_weights"].size(), 5u);
    EXPECT_TRUE(j["risk_factors"].is_array());
    EXPECT_TRUE(j["recommendations"].is_array());
}

TEST(ThreatWeightsTest, WeightsAreNormalized) {
    ThreatConfig config;
    config.weights.model_confidence = 2.0;
    config.weights.forensics_score = 0.0;
    config.weights.audio_score = 0.0;
    config.weights.temporal_score = 0.0;
    config.weights.fake_type_score = 0.0;

    ThreatLevelScorer scorer(config);
    EXPECT_DOUBLE_EQ(scorer.weights().model_confidence, 1.0);
    EXPECT_DOUBLE_EQ(scorer.weights().forensics_score, 0.0);

    ForensicsMetrics metrics;
    ThreatAssessment result = scorer.assess(ModelPrediction::fromLabel("FAKE", 70.0), &metrics, nullptr, nullptr,
                                            nullptr);
    EXPECT_NEAR(result.overall_score, 70.0, 1e-9);
    EXPECT_EQ(result.level, ThreatLevel::HIGH_RISK);
}

TEST(ThreatWeightsTest, NonPositiveSumFallsBackToDefaults) {
    ThreatConfig config;
    config.weights.model_confidence = 0.0;
    config.weights.forensics_score = 0.0;
    config.weights.audio_score = 0.0;
    config.weights.temporal_score = 0.0;
    config.weights.fake_type_score = 0.0;

    ThreatLevelScorer scorer(config);
    EXPECT_DOUBLE_EQ(scorer.weights().model_confidence, 0.35);
    EXPECT_DOUBLE_EQ(scorer.weights().fake_type_score, 0.10);
}

TEST(ThreatThresholdsTest, MustBeAscending) {
    ThreatConfig config;
    config.suspicious_threshold = 90.0;
    EXPECT_THROW(ThreatLevelScorer{config}, std::invalid_argument);

    config = ThreatConfig();
    config.safe_threshold = 60.0;
    EXPECT_THROW(ThreatLevelScorer{config}, std::invalid_argument);

    config = ThreatConfig();
    config.safe_threshold = 40.0;
    config.suspicious_threshold = 40.0;
    ThreatLevelScorer scorer(config);
    EXPECT_EQ(scorer.levelFor(40.0), ThreatLevel::SAFE);
    EXPECT_EQ(scorer.levelFor(41.0), ThreatLevel::HIGH_RISK);
}

TEST(ThreatLevelNameTest, NamesAndColors) {
    EXPECT_EQ(threatLevelName(ThreatLevel::HIGH_RISK), "high_risk");
    EXPECT_EQ(threatLevelDisplay(ThreatLevel::HIGH_RISK), "High Risk");
    EXPECT_EQ(threatLevelColor(ThreatLevel::HIGH_RISK), "#fd7e14");
    EXPECT_EQ(threatLevelName(ThreatLevel::UNKNOWN), "unknown");
}
