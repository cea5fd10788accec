#ifndef FAKEPROBE_FAKE_TYPE_CLASSIFIER_HPP
#define FAKEPROBE_FAKE_TYPE_CLASSIFIER_HPP

#include "config/analysis_config.hpp"
#include "explain/frame_probability_timeline.hpp"
#include "forensics/forensics_analyzer.hpp"
#include "model/frame_classifier.hpp"
#include "multimodal/audio_video_analyzer.hpp"
#include <array>
#include <string>
#include <vector>

namespace fakeprobe {

// Declaration order breaks ties between equally scored manipulation types.
enum class FakeType {
    AUTHENTIC = 0,
    GAN_FACE_SWAP = 1,
    LIP_SYNC = 2,
    FACE_REENACTMENT = 3,
    UNKNOWN_MANIPULATION = 4
};

constexpr int FAKE_TYPE_COUNT = 5;

std::string fakeTypeName(FakeType type);        // "gan_face_swap"
std::string fakeTypeDisplay(FakeType type);     // "Gan Face Swap"

// Parses a name produced by fakeTypeName; unrecognized names map to
// UNKNOWN_MANIPULATION.
FakeType fakeTypeFromName(const std::string& name);

struct FakeTypeResult {
    FakeType primary_type;
    double confidence;                              // 0-100
    std::array<double, FAKE_TYPE_COUNT> scores;     // indexed by FakeType
    std::vector<std::string> evidence;
    std::string explanation;
    std::vector<std::string> recommendations;

    FakeTypeResult() : primary_type(FakeType::UNKNOWN_MANIPULATION), confidence(0.0) {
        scores.fill(0.0);
    }

    double score(FakeType type) const { return scores[static_cast<int>(type)]; }

    json toJson() const;
};

// Rule-based categorization of the manipulation from the other analyzers'
// outputs. Absent inputs are passed as nullptr and contribute nothing.
class FakeTypeClassifier {
public:
    explicit FakeTypeClassifier(const FakeTypeThresholds& thresholds = FakeTypeThresholds());

    FakeTypeResult classify(const ModelPrediction& prediction,
                            const ForensicsMetrics* forensics,
                            const MultiModalAnalysis* multimodal,
                            const TimelineStats* timeline) const;

    static std::string explanationFor(FakeType type);
    static std::vector<std::string> recommendationsFor(FakeType type);

private:
    void scoreForensics(const ForensicsMetrics& metrics, FakeTypeResult& result) const;
    void scoreMultimodal(const MultiModalAnalysis& analysis, FakeTypeResult& result) const;
    void scoreTimeline(const TimelineStats& stats, FakeTypeResult& result) const;
    void decide(const ModelPrediction& prediction, FakeTypeResult& result) const;

    FakeTypeThresholds thresholds_;
};

} // namespace fakeprobe

#endif // FAKEPROBE_FAKE_TYPE_CLASSIFIER_HPP
