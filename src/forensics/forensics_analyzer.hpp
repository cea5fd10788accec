#ifndef FAKEPROBE_FORENSICS_ANALYZER_HPP
#define FAKEPROBE_FORENSICS_ANALYZER_HPP

#include "config/analysis_config.hpp"
#include "face_detector.hpp"
#include "forensics/compression_artifact_detector.hpp"
#include "forensics/eye_blink_detector.hpp"
#include "forensics/face_consistency_analyzer.hpp"
#include "forensics/temporal_stability_analyzer.hpp"
#include <opencv2/opencv.hpp>
#include <memory>
#include <string>
#include <vector>

namespace fakeprobe {

struct ForensicsMetrics {
    double face_consistency_score;
    double eye_blink_rate;              // blinks per second
    double eye_blink_score;
    double temporal_stability_score;
    double compression_artifact_score;
    double blockiness_index;
    double frequency_anomaly_score;
    double overall_forensics_score;     // higher = more likely authentic
    int frame_count;
    int faces_detected;

    FaceConsistencyResult face_details;
    BlinkResult blink_details;
    StabilityResult stability_details;
    ArtifactResult artifact_details;

    ForensicsMetrics() : face_consistency_score(0.0), eye_blink_rate(0.0), eye_blink_score(0.0),
                         temporal_stability_score(0.0), compression_artifact_score(0.0),
                         blockiness_index(0.0), frequency_anomaly_score(0.0),
                         overall_forensics_score(0.0), frame_count(0), faces_detected(0) {}

    json toJson() const;
};

// Runs the four visual forensics checks over one video. Not safe for use by
// more than one analysis at a time; call reset() between videos.
class ForensicsAnalyzer {
public:
    ForensicsAnalyzer(std::shared_ptr<FaceDetector> detector, const ForensicsConfig& config);

    void setFps(double fps) { fps_ = fps; }
    double fps() const { return fps_; }

    json addFrame(const cv::Mat& frame);

    // Resets, then reads up to max_frames (all when <= 0). Throws
    // VideoOpenError when the video cannot be opened.
    ForensicsMetrics analyzeVideo(const std::string& video_path, int max_frames = 0);

    // Resets, then analyzes the given frames.
    ForensicsMetrics analyzeFrames(const std::vector<cv::Mat>& frames);

    // Metrics over every frame added since the last reset.
    ForensicsMetrics computeMetrics() const;

    void reset();

    // Human-readable per-check status lines.
    static std::string summarize(const ForensicsMetrics& metrics);

private:
    ForensicsConfig config_;
    double fps_;
    int frame_count_;

    FaceConsistencyAnalyzer face_analyzer_;
    EyeBlinkDetector blink_detector_;
    TemporalStabilityAnalyzer stability_analyzer_;
    CompressionArtifactDetector artifact_detector_;
};

} // namespace fakeprobe

#endif // FAKEPROBE_FORENSICS_ANALYZER_HPP
