#ifndef FAKEPROBE_ANALYSIS_CONFIG_HPP
#define FAKEPROBE_ANALYSIS_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace fakeprobe {

using json = nlohmann::json;

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct ForensicsConfig {
    std::string face_detector = "cascade";     // "cascade" or "dlib"
    std::string cascade_dir;                    // empty = search install paths
    std::string shape_predictor_path;           // dlib 68-point model, optional
    double default_fps = 30.0;

    int face_histogram_bins = 64;
    int face_crop_size = 64;

    double ear_threshold = 0.2;
    int blink_consecutive_frames = 2;
    double normal_blinks_per_minute = 17.0;

    int stability_frame_size = 256;

    int block_size = 8;
    int spectrum_size = 256;

    // Weights for overall_forensics_score
    double face_weight = 0.25;
    double blink_weight = 0.20;
    double stability_weight = 0.25;
    double artifact_weight = 0.30;
};

struct AudioConfig {
    std::string ffmpeg_binary = "ffmpeg";
    int sample_rate = 16000;
    int extraction_timeout_seconds = 60;

    int pitch_frame_size = 1024;
    int pitch_hop_size = 512;
    double min_pitch_hz = 50.0;
    double max_pitch_hz = 500.0;
    double voicing_threshold = 0.3;

    int min_period_samples = 32;
    int max_period_samples = 640;
    double perfect_jitter = 0.001;
    double erratic_jitter = 0.02;

    int energy_segments = 50;
    int centroid_frame_size = 2048;
    int centroid_hop_size = 1024;
};

struct LipSyncConfig {
    int max_frames = 300;
    int mouth_width = 64;
    int mouth_height = 32;
    int window_count = 10;
    double mismatch_threshold = 0.2;
    double lag_tolerance_seconds = 0.5;
    double max_lag_penalty = 50.0;
    int min_motion_samples = 50;
};

struct TimelineConfig {
    double fps = 30.0;
    double anomaly_threshold = 0.3;
    int smoothing_window = 5;
};

struct GradCamConfig {
    double alpha = 0.5;
    bool save_images = true;
    int max_frames = 16;
};

struct FakeTypeThresholds {
    double model_confidence = 70.0;
    double face_consistency = 60.0;
    double temporal_stability = 55.0;
    double blink_score = 30.0;
    double artifact_score = 50.0;
    double lip_sync_score = 40.0;
    double audio_spoof = 60.0;
    double av_correlation = 0.3;
    double temporal_variance = 0.15;
    double anomaly_ratio = 0.2;
    double high_fake_probability = 0.8;
    double min_evidence_score = 20.0;
    double max_confidence = 95.0;
};

struct ThreatWeights {
    double model_confidence = 0.35;
    double forensics_score = 0.25;
    double audio_score = 0.15;
    double temporal_score = 0.15;
    double fake_type_score = 0.10;
};

struct ThreatConfig {
    ThreatWeights weights;
    double safe_threshold = 25.0;
    double suspicious_threshold = 55.0;
    double high_risk_threshold = 80.0;
};

struct ModelConfig {
    std::string backbone_path;          // cv::dnn network emitting the last conv feature map
    std::string head_path;              // JSON {"weights": [[...],[...]], "bias": [b0, b1]}
    std::string temporal_path;          // optional sequence model over pooled features
    int input_size = 112;
    std::array<double, 3> mean = {0.485, 0.456, 0.406};
    std::array<double, 3> std = {0.229, 0.224, 0.225};
};

struct PipelineOptions {
    int max_frames = 100;
    std::string output_dir = "./output";
    int64_t max_download_bytes = 512LL * 1024 * 1024;   // 0 = unlimited
    bool enable_gradcam = true;
    bool enable_timeline = true;
    bool enable_forensics = true;
    bool enable_multimodal = true;
    bool enable_fake_type = true;
    bool enable_threat = true;
};

// Limits applied to client requests by the HTTP service.
struct ServerConfig {
    std::string upload_root;            // local videos must live under it; empty = local paths refused
    bool allow_remote_urls = true;      // http(s) only
    int max_frames_cap = 300;
};

struct AnalysisConfig {
    ForensicsConfig forensics;
    AudioConfig audio;
    LipSyncConfig lip_sync;
    TimelineConfig timeline;
    GradCamConfig gradcam;
    FakeTypeThresholds fake_type;
    ThreatConfig threat;
    ModelConfig model;
    PipelineOptions pipeline;
    ServerConfig server;

    // Unknown keys are ignored; keys with the wrong type or out-of-range
    // values raise ConfigError.
    static AnalysisConfig fromJson(const json& j);
    static AnalysisConfig fromFile(const std::string& path);

    // FAKEPROBE_FFMPEG_BIN, FAKEPROBE_OUTPUT_DIR, FAKEPROBE_CASCADE_DIR,
    // FAKEPROBE_UPLOAD_ROOT
    void applyEnvironment();

    // Throws ConfigError for values the analyzers cannot run with.
    void validate() const;

    json toJson() const;
};

} // namespace fakeprobe

#endif // FAKEPROBE_ANALYSIS_CONFIG_HPP
