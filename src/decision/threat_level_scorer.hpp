#ifndef FAKEPROBE_THREAT_LEVEL_SCORER_HPP
#define FAKEPROBE_THREAT_LEVEL_SCORER_HPP

#include "config/analysis_config.hpp"
#include "decision/fake_type_classifier.hpp"
#include "explain/frame_probability_timeline.hpp"
#include "forensics/forensics_analyzer.hpp"
#include "model/frame_classifier.hpp"
#include "multimodal/audio_video_analyzer.hpp"
#include <map>
#include <string>
#include <vector>

namespace fakeprobe {

enum class ThreatLevel {
    SAFE = 0,
    SUSPICIOUS = 1,
    HIGH_RISK = 2,
    CRITICAL = 3,
    UNKNOWN = 4
};

std::string threatLevelName(ThreatLevel level);      // "high_risk"
std::string threatLevelDisplay(ThreatLevel level);   // "High Risk"
std::string threatLevelColor(ThreatLevel level);     // "#fd7e14"

struct ThreatAssessment {
    ThreatLevel level;
    std::string level_display;
    double overall_score;                               // 0-100, higher = more threat
    double confidence;                                  // 0-100
    std::map<std::string, double> component_scores;     // 50 for missing inputs
    std::map<std::string, double> effective_weights;    // 0 for missing inputs
    std::vector<std::string> risk_factors;
    std::vector<std::string> mitigating_factors;
    std::string explanation;
    std::vector<std::string> recommendations;
    std::string color_code;

    ThreatAssessment() : level(ThreatLevel::UNKNOWN), overall_score(0.0), confidence(0.0) {}

    json toJson() const;
};

// Weighted fusion of every available signal into a threat level. Signals
// passed as nullptr (or an unknown model prediction) get weight zero and the
// remaining weights are rescaled to sum to one.
class ThreatLevelScorer {
public:
    explicit ThreatLevelScorer(const ThreatConfig& config = ThreatConfig());

    ThreatAssessment assess(const ModelPrediction& prediction,
                            const ForensicsMetrics* forensics,
                            const MultiModalAnalysis* multimodal,
                            const TimelineStats* timeline,
                            const FakeTypeResult* fake_type) const;

    ThreatLevel levelFor(double score) const;

    // Configured weights after normalization.
    const ThreatWeights& weights() const { return weights_; }

    static std::vector<std::string> recommendationsFor(ThreatLevel level);

private:
    struct Component {
        std::string name;
        double score;
        double weight;
        bool available;
    };

    Component scoreModel(const ModelPrediction& prediction, ThreatAssessment& out) const;
    Component scoreForensics(const ForensicsMetrics* metrics, ThreatAssessment& out) const;
    Component scoreMultimodal(const MultiModalAnalysis* analysis, ThreatAssessment& out) const;
    Component scoreTemporal(const TimelineStats* stats, ThreatAssessment& out) const;
    Component scoreFakeType(const FakeTypeResult* result, ThreatAssessment& out) const;

    static double assessmentConfidence(const ForensicsMetrics* forensics,
                                       const MultiModalAnalysis* multimodal,
                                       const TimelineStats* timeline);

    std::string explain(ThreatLevel level, double overall, const std::vector<Component>& components,
                        const std::vector<std::string>& risks) const;

    ThreatWeights weights_;
    double safe_threshold_;
    double suspicious_threshold_;
    double high_risk_threshold_;
};

} // namespace fakeprobe

#endif // FAKEPROBE_THREAT_LEVEL_SCORER_HPP
