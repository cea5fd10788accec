#include "decision/threat_level_scorer.hpp"
#include "score_utils.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <stdexcept>

namespace fakeprobe {

namespace {

std::string formatValue(const char* format, double value) {
    char buffer[160];
    std::snprintf(buffer, sizeof(buffer), format, value);
    return buffer;
}

std::string spaced(std::string name) {
    std::replace(name.begin(), name.end(), '_', ' ');
    return name;
}

} // namespace

std::string threatLevelName(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::SAFE: return "safe";
        case ThreatLevel::SUSPICIOUS: return "suspicious";
        case ThreatLevel::HIGH_RISK: return "high_risk";
        case ThreatLevel::CRITICAL: return "critical";
        case ThreatLevel::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::string threatLevelDisplay(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::SAFE: return "Safe";
        case ThreatLevel::SUSPICIOUS: return "Suspicious";
        case ThreatLevel::HIGH_RISK: return "High Risk";
        case ThreatLevel::CRITICAL: return "Critical";
        case ThreatLevel::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

std::string threatLevelColor(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::SAFE: return "#28a745";
        case ThreatLevel::SUSPICIOUS: return "#ffc107";
        case ThreatLevel::HIGH_RISK: return "#fd7e14";
        case ThreatLevel::CRITICAL: return "#dc3545";
        case ThreatLevel::UNKNOWN: return "#6c757d";
    }
    return "#6c757d";
}

json ThreatAssessment::toJson() const {
    return json{
        {"level", threatLevelName(level)},
        {"level_display", level_display},
        {"overall_score", overall_score},
        {"confidence", confidence},
        {"component_scores", component_scores},
        {"effective_weights", effective_weights},
        {"risk_factors", risk_factors},
        {"mitigating_factors", mitigating_factors},
        {"explanation", explanation},
        {"recommendations", recommendations},
        {"color_code", color_code}
    };
}

ThreatLevelScorer::ThreatLevelScorer(const ThreatConfig& config)
    : weights_(config.weights),
      safe_threshold_(config.safe_threshold),
      suspicious_threshold_(config.suspicious_threshold),
      high_risk_threshold_(config.high_risk_threshold) {
    if (!(safe_threshold_ <= suspicious_threshold_ && suspicious_threshold_ <= high_risk_threshold_)) {
        throw std::invalid_argument("Threat thresholds must satisfy safe <= suspicious <= high_risk");
    }
    double total = weights_.model_confidence + weights_.forensics_score + weights_.audio_score +
                   weights_.temporal_score + weights_.fake_type_score;
    if (total <= 0.0) {
        std::cerr << "ThreatLevelScorer: non-positive weight sum, using defaults" << std::endl;
        weights_ = ThreatWeights();
        return;
    }
    weights_.model_confidence /= total;
    weights_.forensics_score /= total;
    weights_.audio_score /= total;
    weights_.temporal_score /= total;
    weights_.fake_type_score /= total;
}

ThreatLevel ThreatLevelScorer::levelFor(double score) const {
    if (score <= safe_threshold_) {
        return ThreatLevel::SAFE;
    }
    if (score <= suspicious_threshold_) {
        return ThreatLevel::SUSPICIOUS;
    }
    if (score <= high_risk_threshold_) {
        return ThreatLevel::HIGH_RISK;
    }
    return ThreatLevel::CRITICAL;
}

ThreatLevelScorer::Component ThreatLevelScorer::scoreModel(const ModelPrediction& prediction,
                                                           ThreatAssessment& out) const {
    Component c{"model_confidence", 50.0, weights_.model_confidence, prediction.isKnown()};
    double confidence = clipScore(prediction.confidence);
    if (prediction.isFake()) {
        c.score = confidence;
        if (confidence > 80) {
            out.risk_factors.push_back(formatValue("Model detects FAKE with high confidence (%.1f%%)", confidence));
        } else if (confidence > 60) {
            out.risk_factors.push_back(formatValue("Model detects FAKE with moderate confidence (%.1f%%)", confidence));
        }
    } else if (prediction.isReal()) {
        c.score = 100.0 - confidence;
        if (confidence > 80) {
            out.mitigating_factors.push_back(formatValue("Model detects REAL with high confidence (%.1f%%)", confidence));
        }
    }
    return c;
}

ThreatLevelScorer::Component ThreatLevelScorer::scoreForensics(const ForensicsMetrics* metrics,
                                                               ThreatAssessment& out) const {
    Component c{"forensics_score", 50.0, weights_.forensics_score, metrics != nullptr};
    if (metrics == nullptr) {
        return c;
    }
    c.score = clipScore(100.0 - metrics->overall_forensics_score);

    if (metrics->face_consistency_score < 50) {
        out.risk_factors.push_back(formatValue("Low face consistency score (%.1f%%)", metrics->face_consistency_score));
    } else if (metrics->face_consistency_score > 80) {
        out.mitigating_factors.push_back(formatValue("High face consistency (%.1f%%)", metrics->face_consistency_score));
    }
    if (metrics->eye_blink_score < 40) {
        out.risk_factors.push_back(formatValue("Abnormal eye blink pattern (%.1f%%)", metrics->eye_blink_score));
    }
    if (metrics->temporal_stability_score < 50) {
        out.risk_factors.push_back(formatValue("Low temporal stability (%.1f%%)", metrics->temporal_stability_score));
    } else if (metrics->temporal_stability_score > 80) {
        out.mitigating_factors.push_back(formatValue("Good temporal stability (%.1f%%)", metrics->temporal_stability_score));
    }
    if (metrics->compression_artifact_score > 60) {
        out.risk_factors.push_back(formatValue("High compression artifacts (%.1f%%)", metrics->compression_artifact_score));
    }
    return c;
}

ThreatLevelScorer::Component ThreatLevelScorer::scoreMultimodal(const MultiModalAnalysis* analysis,
                                                                ThreatAssessment& out) const {
    Component c{"audio_score", 50.0, weights_.audio_score, analysis != nullptr};
    if (analysis == nullptr) {
        return c;
    }
    c.score = clipScore(100.0 - analysis->combined_score);

    if (analysis->lip_sync_score < 40) {
        out.risk_factors.push_back(formatValue("Poor lip-audio synchronization (%.1f%%)", analysis->lip_sync_score));
    } else if (analysis->lip_sync_score > 70) {
        out.mitigating_factors.push_back(formatValue("Good lip-audio sync (%.1f%%)", analysis->lip_sync_score));
    }
    if (analysis->audio_spoof_score > 60) {
        out.risk_factors.push_back(formatValue("Audio spoofing indicators detected (%.1f%%)", analysis->audio_spoof_score));
    }
    return c;
}

ThreatLevelScorer::Component ThreatLevelScorer::scoreTemporal(const TimelineStats* stats,
                                                              ThreatAssessment& out) const {
    Component c{"temporal_score", 50.0, weights_.temporal_score, stats != nullptr};
    if (stats == nullptr) {
        return c;
    }
    double authenticity = 0.6 * (1.0 - stats->mean_fake_probability) * 100.0 +
                          0.4 * stats->temporal_consistency_score;
    c.score = clipScore(100.0 - authenticity);

    if (stats->mean_fake_probability > 0.7) {
        out.risk_factors.push_back(formatValue("High average fake probability (%.1f%%)",
                                               stats->mean_fake_probability * 100.0));
    }
    if (stats->anomaly_ratio > 0.2) {
        out.risk_factors.push_back(formatValue("High temporal anomaly rate (%.1f%%)", stats->anomaly_ratio * 100.0));
    }
    if (stats->temporal_consistency_score > 80) {
        out.mitigating_factors.push_back(formatValue("High temporal consistency (%.1f%%)",
                                                     stats->temporal_consistency_score));
    }
    return c;
}

ThreatLevelScorer::Component ThreatLevelScorer::scoreFakeType(const FakeTypeResult* result,
                                                              ThreatAssessment& out) const {
    Component c{"fake_type_score", 50.0, weights_.fake_type_score, result != nullptr};
    if (result == nullptr) {
        return c;
    }

    switch (result->primary_type) {
        case FakeType::AUTHENTIC:
            c.score = clipScore(100.0 - result->confidence);
            if (result->confidence > 70) {
                out.mitigating_factors.push_back(formatValue("Classified as authentic (%.1f%% confidence)",
                                                             result->confidence));
            }
            break;
        case FakeType::GAN_FACE_SWAP:
        case FakeType::LIP_SYNC:
        case FakeType::FACE_REENACTMENT:
            c.score = clipScore(result->confidence);
            if (result->confidence > 60) {
                std::string prefix = "Classified as " + fakeTypeDisplay(result->primary_type);
                out.risk_factors.push_back(prefix + formatValue(" (%.1f%% confidence)", result->confidence));
            }
            break;
        case FakeType::UNKNOWN_MANIPULATION:
            c.score = 50.0;
            out.risk_factors.push_back("Unable to determine manipulation type with confidence");
            break;
    }
    return c;
}

double ThreatLevelScorer::assessmentConfidence(const ForensicsMetrics* forensics,
                                               const MultiModalAnalysis* multimodal,
                                               const TimelineStats* timeline) {
    double confidence = 60.0;
    if (forensics != nullptr) {
        confidence += 15.0;
        if (forensics->frame_count >= 50) {
            confidence += 5.0;
        }
    }
    if (multimodal != nullptr) {
        confidence += 10.0;
        if (multimodal->audio_features.is_valid) {
            confidence += 5.0;
        }
    }
    if (timeline != nullptr) {
        confidence += 5.0;
    }
    return std::min(95.0, confidence);
}

ThreatAssessment ThreatLevelScorer::assess(const ModelPrediction& prediction,
                                           const ForensicsMetrics* forensics,
                                           const MultiModalAnalysis* multimodal,
                                           const TimelineStats* timeline,
                                           const FakeTypeResult* fake_type) const {
    ThreatAssessment out;
    std::vector<Component> components = {
        scoreModel(prediction, out),
        scoreForensics(forensics, out),
        scoreMultimodal(multimodal, out),
        scoreTemporal(timeline, out),
        scoreFakeType(fake_type, out)
    };

    double available_weight = 0.0;
    for (const auto& c : components) {
        if (c.available) {
            available_weight += c.weight;
        }
    }

    double overall = 0.0;
    for (auto& c : components) {
        c.weight = (c.available && available_weight > 0.0) ? c.weight / available_weight : 0.0;
        out.component_scores[c.name] = c.score;
        out.effective_weights[c.name] = c.weight;
        overall += c.score * c.weight;
    }

    if (available_weight > 0.0) {
        out.level = levelFor(overall);
        out.overall_score = clipScore(overall);
    } else {
        out.level = ThreatLevel::UNKNOWN;
        out.overall_score = 50.0;
    }

    out.level_display = threatLevelDisplay(out.level);
    out.color_code = threatLevelColor(out.level);
    out.confidence = assessmentConfidence(forensics, multimodal, timeline);
    out.explanation = explain(out.level, out.overall_score, components, out.risk_factors);
    out.recommendations = recommendationsFor(out.level);
    return out;
}

std::string ThreatLevelScorer::explain(ThreatLevel level, double overall, const std::vector<Component>& components,
                                       const std::vector<std::string>& risks) const {
    std::string text;
    switch (level) {
        case ThreatLevel::SAFE:
            text = "Analysis indicates this content is likely authentic. Multiple verification methods "
                   "show consistent results within expected parameters for genuine content.";
            break;
        case ThreatLevel::SUSPICIOUS:
            text = "Analysis shows some indicators that warrant further investigation. While not "
                   "definitively manipulated, certain signals deviate from expected patterns for "
                   "authentic content.";
            break;
        case ThreatLevel::HIGH_RISK:
            text = "Strong indicators of potential manipulation detected. Multiple analysis methods "
                   "have identified concerning patterns consistent with known deepfake techniques.";
            break;
        case ThreatLevel::CRITICAL:
            text = "CRITICAL: Very strong evidence of manipulation detected. Analysis shows clear signs "
                   "of synthetic or manipulated content. This content should be treated as "
                   "potentially dangerous.";
            break;
        case ThreatLevel::UNKNOWN:
            text = "Unable to determine authenticity with sufficient confidence. Additional analysis "
                   "or manual review is recommended.";
            break;
    }

    text += formatValue("\n\nOverall threat score: %.1f/100.", overall);

    const Component* top = nullptr;
    for (const auto& c : components) {
        if (c.weight > 0.0 && (top == nullptr || c.score * c.weight > top->score * top->weight)) {
            top = &c;
        }
    }
    if (top != nullptr) {
        text += " Primary concern: " + spaced(top->name) + formatValue(" (%.1f/100).", top->score);
    }

    if (!risks.empty()) {
        text += "\n\nKey risk factors: ";
        size_t shown = std::min<size_t>(3, risks.size());
        for (size_t i = 0; i < shown; ++i) {
            if (i > 0) {
                text += "; ";
            }
            text += risks[i];
        }
    }
    return text;
}

std::vector<std::string> ThreatLevelScorer::recommendationsFor(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::SAFE:
            return {
                "Content appears authentic, but verify source if high-stakes",
                "Check metadata and chain of custody for additional assurance",
                "Consider context and source credibility"
            };
        case ThreatLevel::SUSPICIOUS:
            return {
                "Recommend manual review by trained analyst",
                "Cross-reference with known authentic content from the same source",
                "Check for additional corroborating evidence",
                "Consider running additional verification tools"
            };
        case ThreatLevel::HIGH_RISK:
            return {
                "Do NOT use this content without thorough verification",
                "Escalate to security team for professional analysis",
                "Attempt to locate original source content",
                "Document chain of custody for the content",
                "Consider potential impact if content is used"
            };
        case ThreatLevel::CRITICAL:
            return {
                "BLOCK: Do not publish or distribute this content",
                "Immediately escalate to security/legal team",
                "Preserve all metadata and source information",
                "Document detection for potential legal purposes",
                "Investigate the source and distribution chain"
            };
        case ThreatLevel::UNKNOWN:
            break;
    }
    return {
        "Seek additional analysis from specialized tools",
        "Request manual expert review",
        "Do not use content until verified",
        "Collect additional context about content origin"
    };
}

} // namespace fakeprobe
