#ifndef FAKEPROBE_TEMPORAL_STABILITY_ANALYZER_HPP
#define FAKEPROBE_TEMPORAL_STABILITY_ANALYZER_HPP

#include "config/analysis_config.hpp"
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace fakeprobe {

struct StabilityResult {
    double score;
    double flow_mean;
    double flow_std;
    double flow_cv;
    double ssim_mean;
    double ssim_std;
    double flow_consistency_score;
    double ssim_quality_score;
    double ssim_consistency_score;
    std::string reason;

    StabilityResult() : score(100.0), flow_mean(0.0), flow_std(0.0), flow_cv(0.0), ssim_mean(0.0),
                        ssim_std(0.0), flow_consistency_score(0.0), ssim_quality_score(0.0),
                        ssim_consistency_score(0.0) {}

    json toJson() const;
};

// Frame-to-frame motion smoothness (Farneback flow) and structural
// similarity on downscaled grayscale frames.
class TemporalStabilityAnalyzer {
public:
    explicit TemporalStabilityAnalyzer(const ForensicsConfig& config);

    json addFrame(const cv::Mat& frame);
    StabilityResult result() const;
    void reset();

    // Gaussian-window SSIM of two single-channel images of equal size.
    static double computeSsim(const cv::Mat& a, const cv::Mat& b);

private:
    int frame_size_;
    cv::Mat prev_frame_;
    std::vector<double> flow_magnitudes_;
    std::vector<double> ssim_values_;

    static constexpr double FLOW_WEIGHT = 0.3;
    static constexpr double SSIM_WEIGHT = 0.4;
    static constexpr double SSIM_CONSISTENCY_WEIGHT = 0.3;
};

} // namespace fakeprobe

#endif // FAKEPROBE_TEMPORAL_STABILITY_ANALYZER_HPP
