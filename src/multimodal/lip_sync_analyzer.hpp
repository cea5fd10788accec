#ifndef FAKEPROBE_LIP_SYNC_ANALYZER_HPP
#define FAKEPROBE_LIP_SYNC_ANALYZER_HPP

#include "config/analysis_config.hpp"
#include "face_detector.hpp"
#include <opencv2/opencv.hpp>
#include <memory>
#include <utility>
#include <vector>

namespace fakeprobe {

struct LipSyncFeatures {
    std::vector<double> mouth_movement_energy;
    std::vector<double> audio_energy;
    double correlation;                 // peak normalised cross-correlation
    double sync_score;                  // 0-100, higher = better sync
    int lag_frames;
    std::vector<std::pair<double, double>> mismatch_regions;   // (start_s, end_s)

    LipSyncFeatures() : correlation(0.0), sync_score(50.0), lag_frames(0) {}

    json toJson() const;
};

// Correlates mouth-region motion with the audio energy envelope.
class LipSyncAnalyzer {
public:
    LipSyncAnalyzer(std::shared_ptr<FaceDetector> detector, const LipSyncConfig& config);

    // Mouth box: lower part of the face starting at 60% height, 30% tall,
    // central 60% of the width. Empty when no face is found.
    cv::Mat extractMouthRegion(const cv::Mat& frame);

    // Mean absolute difference between consecutive resized mouth crops.
    // One value per frame; 0 for frames without a face and the first crop.
    std::vector<double> computeMouthMovement(const std::vector<cv::Mat>& frames);

    // Uses at most max_frames frames.
    LipSyncFeatures analyze(const std::vector<cv::Mat>& frames, const std::vector<double>& audio_energy,
                            double fps);

    // Signal-level synchronisation scoring, independent of any video.
    LipSyncFeatures correlate(const std::vector<double>& mouth_energy, const std::vector<double>& audio_energy,
                              double fps) const;

    // Linear resampling of signal onto length points spanning [0, 1].
    static std::vector<double> resample(const std::vector<double>& signal, size_t length);

    // Zero mean, unit variance (with a small epsilon on the deviation).
    static std::vector<double> zNormalize(const std::vector<double>& signal);

private:
    std::shared_ptr<FaceDetector> detector_;
    LipSyncConfig config_;
};

} // namespace fakeprobe

#endif // FAKEPROBE_LIP_SYNC_ANALYZER_HPP
