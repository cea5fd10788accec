#include "decision/fake_type_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace fakeprobe {

namespace {

std::string formatValue(const char* format, double value) {
    char buffer[128];
    std::snprintf(buffer, sizeof(buffer), format, value);
    return buffer;
}

void add(FakeTypeResult& result, FakeType type, double points) {
    result.scores[static_cast<int>(type)] += points;
}

const FakeType kManipulationTypes[] = {
    FakeType::GAN_FACE_SWAP,
    FakeType::LIP_SYNC,
    FakeType::FACE_REENACTMENT,
    FakeType::UNKNOWN_MANIPULATION
};

} // namespace

std::string fakeTypeName(FakeType type) {
    switch (type) {
        case FakeType::AUTHENTIC: return "authentic";
        case FakeType::GAN_FACE_SWAP: return "gan_face_swap";
        case FakeType::LIP_SYNC: return "lip_sync_manipulation";
        case FakeType::FACE_REENACTMENT: return "face_reenactment";
        case FakeType::UNKNOWN_MANIPULATION: return "unknown_manipulation";
    }
    return "unknown_manipulation";
}

std::string fakeTypeDisplay(FakeType type) {
    std::string name = fakeTypeName(type);
    bool start = true;
    for (char& c : name) {
        if (c == '_') {
            c = ' ';
            start = true;
        } else if (start) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            start = false;
        }
    }
    return name;
}

FakeType fakeTypeFromName(const std::string& name) {
    for (int i = 0; i < FAKE_TYPE_COUNT; ++i) {
        FakeType type = static_cast<FakeType>(i);
        if (fakeTypeName(type) == name) {
            return type;
        }
    }
    return FakeType::UNKNOWN_MANIPULATION;
}

json FakeTypeResult::toJson() const {
    json all_scores = json::object();
    for (int i = 0; i < FAKE_TYPE_COUNT; ++i) {
        all_scores[fakeTypeName(static_cast<FakeType>(i))] = scores[i];
    }
    return json{
        {"classification", {
            {"type", fakeTypeName(primary_type)},
            {"type_display", fakeTypeDisplay(primary_type)},
            {"confidence", confidence}
        }},
        {"all_type_scores", all_scores},
        {"evidence", evidence},
        {"explanation", explanation},
        {"recommendations", recommendations}
    };
}

FakeTypeClassifier::FakeTypeClassifier(const FakeTypeThresholds& thresholds) : thresholds_(thresholds) {}

FakeTypeResult FakeTypeClassifier::classify(const ModelPrediction& prediction,
                                            const ForensicsMetrics* forensics,
                                            const MultiModalAnalysis* multimodal,
                                            const TimelineStats* timeline) const {
    FakeTypeResult result;

    if (prediction.isReal()) {
        if (prediction.confidence > thresholds_.model_confidence) {
            add(result, FakeType::AUTHENTIC, 50);
            result.evidence.push_back(formatValue("Model predicts REAL with %.1f%% confidence", prediction.confidence));
        }
    } else if (prediction.isFake()) {
        result.evidence.push_back(formatValue("Model predicts FAKE with %.1f%% confidence", prediction.confidence));
    }

    if (forensics != nullptr) {
        scoreForensics(*forensics, result);
    }
    if (multimodal != nullptr) {
        scoreMultimodal(*multimodal, result);
    }
    if (timeline != nullptr) {
        scoreTimeline(*timeline, result);
    }

    decide(prediction, result);

    result.explanation = explanationFor(result.primary_type);
    if (!result.evidence.empty()) {
        std::string indicators;
        size_t shown = std::min<size_t>(3, result.evidence.size());
        for (size_t i = 0; i < shown; ++i) {
            if (i > 0) {
                indicators += "; ";
            }
            indicators += result.evidence[i];
        }
        result.explanation += " Key indicators: " + indicators + ".";
    }
    result.recommendations = recommendationsFor(result.primary_type);
    return result;
}

void FakeTypeClassifier::scoreForensics(const ForensicsMetrics& metrics, FakeTypeResult& result) const {
    if (metrics.face_consistency_score < thresholds_.face_consistency) {
        add(result, FakeType::GAN_FACE_SWAP, 25);
        result.evidence.push_back(formatValue("Low face consistency: %.1f%%", metrics.face_consistency_score));
    } else {
        add(result, FakeType::AUTHENTIC, 15);
    }

    if (metrics.temporal_stability_score < thresholds_.temporal_stability) {
        add(result, FakeType::GAN_FACE_SWAP, 15);
        add(result, FakeType::FACE_REENACTMENT, 10);
        result.evidence.push_back(formatValue("Low temporal stability: %.1f%%", metrics.temporal_stability_score));
    }

    if (metrics.eye_blink_score < thresholds_.blink_score) {
        add(result, FakeType::GAN_FACE_SWAP, 20);
        add(result, FakeType::FACE_REENACTMENT, 15);
        result.evidence.push_back(formatValue("Abnormal blink pattern: %.1f%%", metrics.eye_blink_score));
    }

    if (metrics.compression_artifact_score > thresholds_.artifact_score) {
        add(result, FakeType::GAN_FACE_SWAP, 10);
        add(result, FakeType::UNKNOWN_MANIPULATION, 5);
        result.evidence.push_back(formatValue("High compression artifacts: %.1f%%", metrics.compression_artifact_score));
    }
}

void FakeTypeClassifier::scoreMultimodal(const MultiModalAnalysis& analysis, FakeTypeResult& result) const {
    if (analysis.lip_sync_score < thresholds_.lip_sync_score) {
        add(result, FakeType::LIP_SYNC, 35);
        result.evidence.push_back(formatValue("Poor lip-audio sync: %.1f%%", analysis.lip_sync_score));
    }

    if (analysis.audio_spoof_score > thresholds_.audio_spoof) {
        add(result, FakeType::LIP_SYNC, 20);
        result.evidence.push_back(formatValue("Audio spoofing indicators: %.1f%%", analysis.audio_spoof_score));
    }

    if (analysis.has_lip_sync && analysis.lip_sync_features.correlation < thresholds_.av_correlation) {
        add(result, FakeType::LIP_SYNC, 25);
        result.evidence.push_back(formatValue("Low audio-visual correlation: %.2f",
                                              analysis.lip_sync_features.correlation));
    }
}

void FakeTypeClassifier::scoreTimeline(const TimelineStats& stats, FakeTypeResult& result) const {
    if (stats.temporal_variance > thresholds_.temporal_variance) {
        add(result, FakeType::FACE_REENACTMENT, 15);
        result.evidence.push_back(formatValue("High temporal probability variance: %.3f", stats.temporal_variance));
    }

    if (stats.anomaly_ratio > thresholds_.anomaly_ratio) {
        add(result, FakeType::GAN_FACE_SWAP, 10);
        add(result, FakeType::FACE_REENACTMENT, 10);
        result.evidence.push_back(formatValue("High anomaly ratio: %.1f%%", stats.anomaly_ratio * 100.0));
    }

    if (stats.mean_fake_probability > thresholds_.high_fake_probability) {
        add(result, FakeType::GAN_FACE_SWAP, 10);
        result.evidence.push_back(formatValue("Consistently high fake probability: %.1f%%",
                                              stats.mean_fake_probability * 100.0));
    }
}

void FakeTypeClassifier::decide(const ModelPrediction& prediction, FakeTypeResult& result) const {
    FakeType best = kManipulationTypes[0];
    double best_score = result.score(best);
    double total = 0.0;
    for (FakeType type : kManipulationTypes) {
        double s = result.score(type);
        total += s;
        if (s > best_score) {
            best = type;
            best_score = s;
        }
    }

    if (prediction.isReal() && prediction.confidence > thresholds_.model_confidence &&
        result.score(FakeType::AUTHENTIC) >= best_score) {
        result.primary_type = FakeType::AUTHENTIC;
        result.confidence = std::min(thresholds_.max_confidence, prediction.confidence);
        return;
    }

    if (total <= 0.0) {
        result.primary_type = FakeType::UNKNOWN_MANIPULATION;
        result.confidence = 40.0;
        return;
    }

    double share = best_score / total * 100.0;
    if (best_score < thresholds_.min_evidence_score) {
        result.primary_type = FakeType::UNKNOWN_MANIPULATION;
        result.confidence = std::min(50.0, share);
        return;
    }

    result.primary_type = best;
    result.confidence = std::min(thresholds_.max_confidence, share);
}

std::string FakeTypeClassifier::explanationFor(FakeType type) {
    switch (type) {
        case FakeType::AUTHENTIC:
            return "Analysis indicates this video is likely authentic. Face consistency, temporal "
                   "stability and audio-visual sync are within normal parameters.";
        case FakeType::GAN_FACE_SWAP:
            return "This video shows signs of GAN-based face swap manipulation. Indicators include "
                   "inconsistent face features across frames, unnatural blink patterns and compression "
                   "artifacts around facial boundaries.";
        case FakeType::LIP_SYNC:
            return "This video appears to be a lip-sync manipulation. The audio track shows signs of "
                   "synthesis or modification, and the lip movements do not correlate with the audio.";
        case FakeType::FACE_REENACTMENT:
            return "This video shows signs of face reenactment manipulation. Facial expressions and "
                   "movements appear to be transferred from another source, with temporal "
                   "inconsistencies and unnatural expression transitions.";
        case FakeType::UNKNOWN_MANIPULATION:
            break;
    }
    return "This video shows signs of manipulation, but the specific type could not be determined "
           "with high confidence. Further manual analysis is recommended.";
}

std::vector<std::string> FakeTypeClassifier::recommendationsFor(FakeType type) {
    switch (type) {
        case FakeType::AUTHENTIC:
            return {
                "Video appears authentic based on automated analysis",
                "Manual verification recommended for high-stakes decisions",
                "Check video metadata and chain of custody"
            };
        case FakeType::GAN_FACE_SWAP:
            return {
                "Compare with known authentic footage of the subject",
                "Examine face boundaries and hairline carefully",
                "Check for inconsistent lighting on face vs. background",
                "Look for artifacts around ears and facial contours"
            };
        case FakeType::LIP_SYNC:
            return {
                "Compare audio with known samples of the speaker",
                "Look for timing mismatches between words and mouth movements",
                "Check for unnatural pauses or breathing patterns",
                "Examine if jaw movement matches speech intensity"
            };
        case FakeType::FACE_REENACTMENT:
            return {
                "Look for unnatural or exaggerated expressions",
                "Check if head movements match body language",
                "Examine expression transitions for smoothness",
                "Compare with subject's typical expression patterns"
            };
        case FakeType::UNKNOWN_MANIPULATION:
            break;
    }
    return {
        "Request professional forensic analysis",
        "Gather additional reference footage for comparison",
        "Check video metadata and encoding history",
        "Consider multiple analysis tools for verification"
    };
}

} // namespace fakeprobe
