#include "pipeline/request_parsing.hpp"
#include <algorithm>
#include <filesystem>
#include <limits>
#include <stdexcept>

namespace fakeprobe {

namespace {

double numberField(const json& j, const char* key, double fallback) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        return fallback;
    }
    if (!j.at(key).is_number()) {
        throw std::invalid_argument(std::string("Field '") + key + "' must be a number");
    }
    return j.at(key).get<double>();
}

// Counts arrive as JSON numbers; anything outside [0, INT_MAX] is refused
// before the conversion to int.
int countField(const json& j, const char* key) {
    double value = numberField(j, key, 0.0);
    if (!(value >= 0.0 && value <= static_cast<double>(std::numeric_limits<int>::max()))) {
        throw std::invalid_argument(std::string("Field '") + key + "' must be a count between 0 and " +
                                    std::to_string(std::numeric_limits<int>::max()));
    }
    return static_cast<int>(value);
}

void requireObject(const json& j, const char* what) {
    if (!j.is_object()) {
        throw std::invalid_argument(std::string(what) + " must be a JSON object");
    }
}

} // namespace

ModelPrediction predictionFromJson(const json& j) {
    requireObject(j, "prediction");
    std::string label;
    for (const char* key : {"prediction_label", "label"}) {
        if (j.contains(key)) {
            if (!j.at(key).is_string()) {
                throw std::invalid_argument(std::string("Field '") + key + "' must be a string");
            }
            label = j.at(key).get<std::string>();
            break;
        }
    }
    return ModelPrediction::fromLabel(label, numberField(j, "confidence", 0.0));
}

ModelPrediction predictionFromString(const std::string& text) {
    size_t colon = text.find(':');
    if (colon == std::string::npos) {
        throw std::invalid_argument("Prediction must look like LABEL:CONFIDENCE, got '" + text + "'");
    }
    double confidence;
    try {
        confidence = std::stod(text.substr(colon + 1));
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid prediction confidence in '" + text + "'");
    }
    ModelPrediction prediction = ModelPrediction::fromLabel(text.substr(0, colon), confidence);
    if (!prediction.isKnown()) {
        throw std::invalid_argument("Prediction label must be FAKE or REAL, got '" + text.substr(0, colon) + "'");
    }
    return prediction;
}

ForensicsMetrics forensicsFromJson(const json& j) {
    requireObject(j, "forensics_metrics");
    ForensicsMetrics metrics;
    metrics.face_consistency_score = numberField(j, "face_consistency_score", 100.0);
    metrics.eye_blink_rate = numberField(j, "eye_blink_rate", 0.0);
    metrics.eye_blink_score = numberField(j, "eye_blink_score", 50.0);
    metrics.temporal_stability_score = numberField(j, "temporal_stability_score", 100.0);
    metrics.compression_artifact_score = numberField(j, "compression_artifact_score", 0.0);
    metrics.blockiness_index = numberField(j, "blockiness_index", 0.0);
    metrics.frequency_anomaly_score = numberField(j, "frequency_anomaly_score", 0.0);
    metrics.overall_forensics_score = numberField(j, "overall_forensics_score", 50.0);
    metrics.frame_count = countField(j, "frame_count");
    metrics.faces_detected = countField(j, "faces_detected");
    return metrics;
}

MultiModalAnalysis multimodalFromJson(const json& j) {
    requireObject(j, "multimodal_metrics");
    MultiModalAnalysis analysis;
    analysis.audio_spoof_score = numberField(j, "audio_spoof_score", 50.0);
    analysis.lip_sync_score = numberField(j, "lip_sync_score", 50.0);
    analysis.combined_score = numberField(j, "combined_score", 50.0);
    analysis.confidence = numberField(j, "confidence", 30.0);

    if (j.contains("lip_sync_features") && j.at("lip_sync_features").is_object()) {
        analysis.has_lip_sync = true;
        analysis.lip_sync_features.correlation = numberField(j.at("lip_sync_features"), "correlation", 1.0);
        analysis.lip_sync_features.sync_score = analysis.lip_sync_score;
    }
    if (j.contains("audio_features") && j.at("audio_features").is_object()) {
        const json& audio = j.at("audio_features");
        if (audio.contains("is_valid")) {
            if (!audio.at("is_valid").is_boolean()) {
                throw std::invalid_argument("Field 'is_valid' must be a boolean");
            }
            analysis.audio_features.is_valid = audio.at("is_valid").get<bool>();
        }
    }
    return analysis;
}

TimelineStats timelineStatsFromJson(const json& j) {
    requireObject(j, "timeline_stats");
    TimelineStats stats;
    stats.mean_fake_probability = numberField(j, "mean_fake_probability", 0.5);
    stats.std_fake_probability = numberField(j, "std_fake_probability", 0.0);
    stats.max_fake_probability = numberField(j, "max_fake_probability", stats.mean_fake_probability);
    stats.min_fake_probability = numberField(j, "min_fake_probability", stats.mean_fake_probability);
    stats.temporal_variance = numberField(j, "temporal_variance", 0.0);
    stats.temporal_consistency_score = numberField(j, "temporal_consistency_score", 50.0);
    stats.anomaly_count = countField(j, "anomaly_count");
    stats.anomaly_ratio = numberField(j, "anomaly_ratio", 0.0);
    stats.total_frames = countField(j, "total_frames");
    return stats;
}

FakeTypeResult fakeTypeFromJson(const json& j) {
    requireObject(j, "fake_type");
    FakeTypeResult result;
    if (j.contains("type")) {
        if (!j.at("type").is_string()) {
            throw std::invalid_argument("Field 'type' must be a string");
        }
        result.primary_type = fakeTypeFromName(j.at("type").get<std::string>());
    }
    result.confidence = numberField(j, "confidence", 50.0);
    return result;
}

void applyStageToggles(const json& enable, PipelineOptions& options) {
    requireObject(enable, "enable");
    auto toggle = [&enable](const char* key, bool& flag) {
        if (!enable.contains(key)) {
            return;
        }
        if (!enable.at(key).is_boolean()) {
            throw std::invalid_argument(std::string("Stage toggle '") + key + "' must be a boolean");
        }
        flag = enable.at(key).get<bool>();
    };
    toggle("gradcam", options.enable_gradcam);
    toggle("timeline", options.enable_timeline);
    toggle("forensics", options.enable_forensics);
    toggle("multimodal", options.enable_multimodal);
    toggle("fake_type", options.enable_fake_type);
    toggle("threat", options.enable_threat);
}

int clampFrameRequest(int requested, int cap) {
    if (requested <= 0 || requested > cap) {
        return cap;
    }
    return requested;
}

std::string resolveVideoLocation(const std::string& video, const ServerConfig& server) {
    namespace fs = std::filesystem;

    if (video.empty()) {
        throw std::invalid_argument("Video location is empty");
    }
    if (VideoSource::isUrl(video)) {
        if (!server.allow_remote_urls) {
            throw std::invalid_argument("Remote video URLs are disabled on this server");
        }
        return video;
    }
    if (video.find("://") != std::string::npos) {
        throw std::invalid_argument("Unsupported video URL scheme: " + video);
    }
    if (server.upload_root.empty()) {
        throw std::invalid_argument("Local video paths are disabled on this server");
    }

    std::error_code ec;
    fs::path root = fs::weakly_canonical(fs::absolute(server.upload_root, ec), ec);
    if (ec) {
        throw std::runtime_error("Cannot resolve upload root " + server.upload_root + ": " + ec.message());
    }
    fs::path requested(video);
    if (requested.is_relative()) {
        requested = root / requested;
    }
    fs::path resolved = fs::weakly_canonical(requested, ec);
    if (ec) {
        throw std::invalid_argument("Cannot resolve video path " + video);
    }

    // Symlinks are resolved above, so a component-wise prefix check is enough.
    auto root_end = root.end();
    if (!root.empty() && root.filename().empty()) {
        --root_end;
    }
    auto mismatch = std::mismatch(root.begin(), root_end, resolved.begin(), resolved.end());
    if (mismatch.first != root_end) {
        throw std::invalid_argument("Video path is outside the upload directory: " + video);
    }
    return resolved.string();
}

} // namespace fakeprobe
