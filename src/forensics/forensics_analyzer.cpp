#include "forensics/forensics_analyzer.hpp"
#include "score_utils.hpp"
#include "video_source.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fakeprobe {

json ForensicsMetrics::toJson() const {
    return json{
        {"face_consistency_score", face_consistency_score},
        {"eye_blink_rate", eye_blink_rate},
        {"eye_blink_score", eye_blink_score},
        {"temporal_stability_score", temporal_stability_score},
        {"compression_artifact_score", compression_artifact_score},
        {"blockiness_index", blockiness_index},
        {"frequency_anomaly_score", frequency_anomaly_score},
        {"overall_forensics_score", overall_forensics_score},
        {"frame_count", frame_count},
        {"faces_detected", faces_detected},
        {"analysis_details", {
            {"face", face_details.toJson()},
            {"blink", blink_details.toJson()},
            {"stability", stability_details.toJson()},
            {"artifacts", artifact_details.toJson()}
        }}
    };
}

ForensicsAnalyzer::ForensicsAnalyzer(std::shared_ptr<FaceDetector> detector, const ForensicsConfig& config)
    : config_(config),
      fps_(config.default_fps),
      frame_count_(0),
      face_analyzer_(detector, config),
      blink_detector_(detector, config),
      stability_analyzer_(config),
      artifact_detector_(config) {}

void ForensicsAnalyzer::reset() {
    face_analyzer_.reset();
    blink_detector_.reset();
    stability_analyzer_.reset();
    artifact_detector_.reset();
    frame_count_ = 0;
}

json ForensicsAnalyzer::addFrame(const cv::Mat& frame) {
    frame_count_++;
    return json{
        {"frame_index", frame_count_ - 1},
        {"face", face_analyzer_.addFrame(frame)},
        {"blink", blink_detector_.addFrame(frame)},
        {"stability", stability_analyzer_.addFrame(frame)},
        {"artifacts", artifact_detector_.addFrame(frame)}
    };
}

ForensicsMetrics ForensicsAnalyzer::analyzeVideo(const std::string& video_path, int max_frames) {
    reset();

    VideoSource source(video_path, config_.default_fps);
    source.open();
    fps_ = source.info().fps;

    std::cout << "Forensics: analyzing " << video_path << " at " << fps_ << " fps" << std::endl;
    for (const auto& frame : source.readFrames(max_frames)) {
        addFrame(frame);
    }
    return computeMetrics();
}

ForensicsMetrics ForensicsAnalyzer::analyzeFrames(const std::vector<cv::Mat>& frames) {
    reset();
    for (const auto& frame : frames) {
        addFrame(frame);
    }
    return computeMetrics();
}

ForensicsMetrics ForensicsAnalyzer::computeMetrics() const {
    ForensicsMetrics metrics;
    metrics.face_details = face_analyzer_.result();
    metrics.blink_details = blink_detector_.result(fps_);
    metrics.stability_details = stability_analyzer_.result();
    metrics.artifact_details = artifact_detector_.result();

    metrics.face_consistency_score = metrics.face_details.score;
    metrics.eye_blink_rate = metrics.blink_details.blink_rate;
    metrics.eye_blink_score = metrics.blink_details.score;
    metrics.temporal_stability_score = metrics.stability_details.score;
    metrics.compression_artifact_score = metrics.artifact_details.combined_score;
    metrics.blockiness_index = metrics.artifact_details.mean_blockiness;
    metrics.frequency_anomaly_score = metrics.artifact_details.frequency_score;

    double overall = metrics.face_consistency_score * config_.face_weight +
                     metrics.eye_blink_score * config_.blink_weight +
                     metrics.temporal_stability_score * config_.stability_weight +
                     (100.0 - metrics.compression_artifact_score) * config_.artifact_weight;
    metrics.overall_forensics_score = clipScore(overall);
    metrics.frame_count = frame_count_;
    metrics.faces_detected = face_analyzer_.facesDetected();
    return metrics;
}

std::string ForensicsAnalyzer::summarize(const ForensicsMetrics& metrics) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);

    if (metrics.face_consistency_score < 60.0) {
        out << "[!] Low face consistency (" << metrics.face_consistency_score << "%)\n";
    } else {
        out << "[ok] Face consistency: " << metrics.face_consistency_score << "%\n";
    }

    if (metrics.eye_blink_score < 40.0) {
        out << "[!] Abnormal blink pattern (" << metrics.eye_blink_score << "%)\n";
    } else {
        out << "[ok] Blink pattern: " << metrics.eye_blink_score << "%\n";
    }

    if (metrics.temporal_stability_score < 50.0) {
        out << "[!] Low temporal stability (" << metrics.temporal_stability_score << "%)\n";
    } else {
        out << "[ok] Temporal stability: " << metrics.temporal_stability_score << "%\n";
    }

    if (metrics.compression_artifact_score > 60.0) {
        out << "[!] High artifacts (" << metrics.compression_artifact_score << "%)\n";
    }

    out << "Overall forensics score: " << metrics.overall_forensics_score << "%";
    return out.str();
}

} // namespace fakeprobe
