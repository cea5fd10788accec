#include "config/analysis_config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fakeprobe {

namespace {

template <typename T>
void readValue(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

const json& sectionOf(const json& root, const char* name) {
    static const json empty = json::object();
    if (!root.contains(name)) {
        return empty;
    }
    const json& section = root.at(name);
    if (!section.is_object()) {
        throw ConfigError(std::string("Config section '") + name + "' must be an object");
    }
    return section;
}

void readTriple(const json& section, const char* key, std::array<double, 3>& target) {
    if (!section.contains(key)) {
        return;
    }
    const json& values = section.at(key);
    if (!values.is_array() || values.size() != 3) {
        throw ConfigError(std::string("model.") + key + " must be an array of 3 numbers");
    }
    for (size_t i = 0; i < 3; ++i) {
        if (!values[i].is_number()) {
            throw ConfigError(std::string("model.") + key + " must be an array of 3 numbers");
        }
        target[i] = values[i].get<double>();
    }
}

void requireAtLeast(double value, double minimum, const char* name) {
    if (!(value >= minimum)) {
        std::ostringstream message;
        message << name << " must be at least " << minimum;
        throw ConfigError(message.str());
    }
}

void requirePositive(double value, const char* name) {
    if (!(value > 0.0)) {
        throw ConfigError(std::string(name) + " must be positive");
    }
}

} // namespace

AnalysisConfig AnalysisConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    AnalysisConfig config;
    try {
        const json& f = sectionOf(j, "forensics");
        readValue(f, "face_detector", config.forensics.face_detector);
        readValue(f, "cascade_dir", config.forensics.cascade_dir);
        readValue(f, "shape_predictor_path", config.forensics.shape_predictor_path);
        readValue(f, "default_fps", config.forensics.default_fps);
        readValue(f, "face_histogram_bins", config.forensics.face_histogram_bins);
        readValue(f, "face_crop_size", config.forensics.face_crop_size);
        readValue(f, "ear_threshold", config.forensics.ear_threshold);
        readValue(f, "blink_consecutive_frames", config.forensics.blink_consecutive_frames);
        readValue(f, "normal_blinks_per_minute", config.forensics.normal_blinks_per_minute);
        readValue(f, "stability_frame_size", config.forensics.stability_frame_size);
        readValue(f, "block_size", config.forensics.block_size);
        readValue(f, "spectrum_size", config.forensics.spectrum_size);
        readValue(f, "face_weight", config.forensics.face_weight);
        readValue(f, "blink_weight", config.forensics.blink_weight);
        readValue(f, "stability_weight", config.forensics.stability_weight);
        readValue(f, "artifact_weight", config.forensics.artifact_weight);

        const json& a = sectionOf(j, "audio");
        readValue(a, "ffmpeg_binary", config.audio.ffmpeg_binary);
        readValue(a, "sample_rate", config.audio.sample_rate);
        readValue(a, "extraction_timeout_seconds", config.audio.extraction_timeout_seconds);
        readValue(a, "pitch_frame_size", config.audio.pitch_frame_size);
        readValue(a, "pitch_hop_size", config.audio.pitch_hop_size);
        readValue(a, "min_pitch_hz", config.audio.min_pitch_hz);
        readValue(a, "max_pitch_hz", config.audio.max_pitch_hz);
        readValue(a, "voicing_threshold", config.audio.voicing_threshold);
        readValue(a, "min_period_samples", config.audio.min_period_samples);
        readValue(a, "max_period_samples", config.audio.max_period_samples);
        readValue(a, "perfect_jitter", config.audio.perfect_jitter);
        readValue(a, "erratic_jitter", config.audio.erratic_jitter);
        readValue(a, "energy_segments", config.audio.energy_segments);
        readValue(a, "centroid_frame_size", config.audio.centroid_frame_size);
        readValue(a, "centroid_hop_size", config.audio.centroid_hop_size);

        const json& l = sectionOf(j, "lip_sync");
        readValue(l, "max_frames", config.lip_sync.max_frames);
        readValue(l, "mouth_width", config.lip_sync.mouth_width);
        readValue(l, "mouth_height", config.lip_sync.mouth_height);
        readValue(l, "window_count", config.lip_sync.window_count);
        readValue(l, "mismatch_threshold", config.lip_sync.mismatch_threshold);
        readValue(l, "lag_tolerance_seconds", config.lip_sync.lag_tolerance_seconds);
        readValue(l, "max_lag_penalty", config.lip_sync.max_lag_penalty);
        readValue(l, "min_motion_samples", config.lip_sync.min_motion_samples);

        const json& t = sectionOf(j, "timeline");
        readValue(t, "fps", config.timeline.fps);
        readValue(t, "anomaly_threshold", config.timeline.anomaly_threshold);
        readValue(t, "smoothing_window", config.timeline.smoothing_window);

        const json& g = sectionOf(j, "gradcam");
        readValue(g, "alpha", config.gradcam.alpha);
        readValue(g, "save_images", config.gradcam.save_images);
        readValue(g, "max_frames", config.gradcam.max_frames);

        const json& ft = sectionOf(j, "fake_type");
        readValue(ft, "model_confidence", config.fake_type.model_confidence);
        readValue(ft, "face_consistency", config.fake_type.face_consistency);
        readValue(ft, "temporal_stability", config.fake_type.temporal_stability);
        readValue(ft, "blink_score", config.fake_type.blink_score);
        readValue(ft, "artifact_score", config.fake_type.artifact_score);
        readValue(ft, "lip_sync_score", config.fake_type.lip_sync_score);
        readValue(ft, "audio_spoof", config.fake_type.audio_spoof);
        readValue(ft, "av_correlation", config.fake_type.av_correlation);
        readValue(ft, "temporal_variance", config.fake_type.temporal_variance);
        readValue(ft, "anomaly_ratio", config.fake_type.anomaly_ratio);
        readValue(ft, "high_fake_probability", config.fake_type.high_fake_probability);
        readValue(ft, "min_evidence_score", config.fake_type.min_evidence_score);
        readValue(ft, "max_confidence", config.fake_type.max_confidence);

        const json& th = sectionOf(j, "threat");
        readValue(th, "safe_threshold", config.threat.safe_threshold);
        readValue(th, "suspicious_threshold", config.threat.suspicious_threshold);
        readValue(th, "high_risk_threshold", config.threat.high_risk_threshold);
        const json& w = sectionOf(th, "weights");
        readValue(w, "model_confidence", config.threat.weights.model_confidence);
        readValue(w, "forensics_score", config.threat.weights.forensics_score);
        readValue(w, "audio_score", config.threat.weights.audio_score);
        readValue(w, "temporal_score", config.threat.weights.temporal_score);
        readValue(w, "fake_type_score", config.threat.weights.fake_type_score);

        const json& m = sectionOf(j, "model");
        readValue(m, "backbone_path", config.model.backbone_path);
        readValue(m, "head_path", config.model.head_path);
        readValue(m, "temporal_path", config.model.temporal_path);
        readValue(m, "input_size", config.model.input_size);
        readTriple(m, "mean", config.model.mean);
        readTriple(m, "std", config.model.std);

        const json& p = sectionOf(j, "pipeline");
        readValue(p, "max_frames", config.pipeline.max_frames);
        readValue(p, "output_dir", config.pipeline.output_dir);
        readValue(p, "max_download_bytes", config.pipeline.max_download_bytes);
        readValue(p, "enable_gradcam", config.pipeline.enable_gradcam);
        readValue(p, "enable_timeline", config.pipeline.enable_timeline);
        readValue(p, "enable_forensics", config.pipeline.enable_forensics);
        readValue(p, "enable_multimodal", config.pipeline.enable_multimodal);
        readValue(p, "enable_fake_type", config.pipeline.enable_fake_type);
        readValue(p, "enable_threat", config.pipeline.enable_threat);

        const json& s = sectionOf(j, "server");
        readValue(s, "upload_root", config.server.upload_root);
        readValue(s, "allow_remote_urls", config.server.allow_remote_urls);
        readValue(s, "max_frames_cap", config.server.max_frames_cap);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
}

void AnalysisConfig::validate() const {
    if (forensics.face_detector != "cascade" && forensics.face_detector != "dlib") {
        throw ConfigError("forensics.face_detector must be 'cascade' or 'dlib'");
    }
    requireAtLeast(forensics.block_size, 2, "forensics.block_size");
    requireAtLeast(forensics.spectrum_size, 8, "forensics.spectrum_size");
    requireAtLeast(forensics.stability_frame_size, 8, "forensics.stability_frame_size");
    requireAtLeast(forensics.face_histogram_bins, 2, "forensics.face_histogram_bins");
    requireAtLeast(forensics.face_crop_size, 8, "forensics.face_crop_size");
    requireAtLeast(forensics.blink_consecutive_frames, 1, "forensics.blink_consecutive_frames");
    requirePositive(forensics.default_fps, "forensics.default_fps");

    requirePositive(audio.sample_rate, "audio.sample_rate");
    requireAtLeast(audio.extraction_timeout_seconds, 1, "audio.extraction_timeout_seconds");
    requireAtLeast(audio.pitch_frame_size, 2, "audio.pitch_frame_size");
    requireAtLeast(audio.pitch_hop_size, 1, "audio.pitch_hop_size");
    requireAtLeast(audio.centroid_frame_size, 2, "audio.centroid_frame_size");
    requireAtLeast(audio.centroid_hop_size, 1, "audio.centroid_hop_size");
    requireAtLeast(audio.energy_segments, 1, "audio.energy_segments");
    requireAtLeast(audio.min_period_samples, 1, "audio.min_period_samples");
    if (audio.max_period_samples < audio.min_period_samples) {
        throw ConfigError("audio.max_period_samples must not be below audio.min_period_samples");
    }
    if (!(audio.min_pitch_hz > 0.0 && audio.min_pitch_hz < audio.max_pitch_hz)) {
        throw ConfigError("audio pitch range must satisfy 0 < min_pitch_hz < max_pitch_hz");
    }

    requireAtLeast(lip_sync.mouth_width, 1, "lip_sync.mouth_width");
    requireAtLeast(lip_sync.mouth_height, 1, "lip_sync.mouth_height");
    requireAtLeast(lip_sync.window_count, 1, "lip_sync.window_count");

    requirePositive(timeline.fps, "timeline.fps");
    requireAtLeast(timeline.smoothing_window, 1, "timeline.smoothing_window");

    if (!(gradcam.alpha >= 0.0 && gradcam.alpha <= 1.0)) {
        throw ConfigError("gradcam.alpha must be within [0, 1]");
    }

    if (!(threat.safe_threshold <= threat.suspicious_threshold &&
          threat.suspicious_threshold <= threat.high_risk_threshold)) {
        throw ConfigError("threat thresholds must satisfy safe <= suspicious <= high_risk");
    }

    requireAtLeast(model.input_size, 1, "model.input_size");
    for (double stddev : model.std) {
        requirePositive(stddev, "model.std entries");
    }

    requireAtLeast(static_cast<double>(pipeline.max_download_bytes), 0, "pipeline.max_download_bytes");
    requireAtLeast(server.max_frames_cap, 1, "server.max_frames_cap");
}

AnalysisConfig AnalysisConfig::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("Cannot parse config file " + path + ": " + e.what());
    }

    std::cout << "Loaded configuration from " << path << std::endl;
    return fromJson(j);
}

void AnalysisConfig::applyEnvironment() {
    if (const char* ffmpeg = std::getenv("FAKEPROBE_FFMPEG_BIN")) {
        audio.ffmpeg_binary = ffmpeg;
    }
    if (const char* output_dir = std::getenv("FAKEPROBE_OUTPUT_DIR")) {
        pipeline.output_dir = output_dir;
    }
    if (const char* cascade_dir = std::getenv("FAKEPROBE_CASCADE_DIR")) {
        forensics.cascade_dir = cascade_dir;
    }
    if (const char* upload_root = std::getenv("FAKEPROBE_UPLOAD_ROOT")) {
        server.upload_root = upload_root;
    }
}

json AnalysisConfig::toJson() const {
    return json{
        {"forensics", {
            {"face_detector", forensics.face_detector},
            {"cascade_dir", forensics.cascade_dir},
            {"shape_predictor_path", forensics.shape_predictor_path},
            {"default_fps", forensics.default_fps},
            {"face_histogram_bins", forensics.face_histogram_bins},
            {"face_crop_size", forensics.face_crop_size},
            {"ear_threshold", forensics.ear_threshold},
            {"blink_consecutive_frames", forensics.blink_consecutive_frames},
            {"normal_blinks_per_minute", forensics.normal_blinks_per_minute},
            {"stability_frame_size", forensics.stability_frame_size},
            {"block_size", forensics.block_size},
            {"spectrum_size", forensics.spectrum_size},
            {"face_weight", forensics.face_weight},
            {"blink_weight", forensics.blink_weight},
            {"stability_weight", forensics.stability_weight},
            {"artifact_weight", forensics.artifact_weight}
        }},
        {"audio", {
            {"ffmpeg_binary", audio.ffmpeg_binary},
            {"sample_rate", audio.sample_rate},
            {"extraction_timeout_seconds", audio.extraction_timeout_seconds},
            {"pitch_frame_size", audio.pitch_frame_size},
            {"pitch_hop_size", audio.pitch_hop_size},
            {"min_pitch_hz", audio.min_pitch_hz},
            {"max_pitch_hz", audio.max_pitch_hz},
            {"voicing_threshold", audio.voicing_threshold},
            {"min_period_samples", audio.min_period_samples},
            {"max_period_samples", audio.max_period_samples},
            {"perfect_jitter", audio.perfect_jitter},
            {"erratic_jitter", audio.erratic_jitter},
            {"energy_segments", audio.energy_segments},
            {"centroid_frame_size", audio.centroid_frame_size},
            {"centroid_hop_size", audio.centroid_hop_size}
        }},
        {"lip_sync", {
            {"max_frames", lip_sync.max_frames},
            {"mouth_width", lip_sync.mouth_width},
            {"mouth_height", lip_sync.mouth_height},
            {"window_count", lip_sync.window_count},
            {"mismatch_threshold", lip_sync.mismatch_threshold},
            {"lag_tolerance_seconds", lip_sync.lag_tolerance_seconds},
            {"max_lag_penalty", lip_sync.max_lag_penalty},
            {"min_motion_samples", lip_sync.min_motion_samples}
        }},
        {"timeline", {
            {"fps", timeline.fps},
            {"anomaly_threshold", timeline.anomaly_threshold},
            {"smoothing_window", timeline.smoothing_window}
        }},
        {"gradcam", {
            {"alpha", gradcam.alpha},
            {"save_images", gradcam.save_images},
            {"max_frames", gradcam.max_frames}
        }},
        {"fake_type", {
            {"model_confidence", fake_type.model_confidence},
            {"face_consistency", fake_type.face_consistency},
            {"temporal_stability", fake_type.temporal_stability},
            {"blink_score", fake_type.blink_score},
            {"artifact_score", fake_type.artifact_score},
            {"lip_sync_score", fake_type.lip_sync_score},
            {"audio_spoof", fake_type.audio_spoof},
            {"av_correlation", fake_type.av_correlation},
            {"temporal_variance", fake_type.temporal_variance},
            {"anomaly_ratio", fake_type.anomaly_ratio},
            {"high_fake_probability", fake_type.high_fake_probability},
            {"min_evidence_score", fake_type.min_evidence_score},
            {"max_confidence", fake_type.max_confidence}
        }},
        {"threat", {
            {"weights", {
                {"model_confidence", threat.weights.model_confidence},
                {"forensics_score", threat.weights.forensics_score},
                {"audio_score", threat.weights.audio_score},
                {"temporal_score", threat.weights.temporal_score},
                {"fake_type_score", threat.weights.fake_type_score}
            }},
            {"safe_threshold", threat.safe_threshold},
            {"suspicious_threshold", threat.suspicious_threshold},
            {"high_risk_threshold", threat.high_risk_threshold}
        }},
        {"model", {
            {"backbone_path", model.backbone_path},
            {"head_path", model.head_path},
            {"temporal_path", model.temporal_path},
            {"input_size", model.input_size},
            {"mean", model.mean},
            {"std", model.std}
        }},
        {"pipeline", {
            {"max_frames", pipeline.max_frames},
            {"output_dir", pipeline.output_dir},
            {"max_download_bytes", pipeline.max_download_bytes},
            {"enable_gradcam", pipeline.enable_gradcam},
            {"enable_timeline", pipeline.enable_timeline},
            {"enable_forensics", pipeline.enable_forensics},
            {"enable_multimodal", pipeline.enable_multimodal},
            {"enable_fake_type", pipeline.enable_fake_type},
            {"enable_threat", pipeline.enable_threat}
        }},
        {"server", {
            {"upload_root", server.upload_root},
            {"allow_remote_urls", server.allow_remote_urls},
            {"max_frames_cap", server.max_frames_cap}
        }}
    };
}

} // namespace fakeprobe
