#include "forensics/temporal_stability_analyzer.hpp"
#include "score_utils.hpp"

namespace fakeprobe {

json StabilityResult::toJson() const {
    json j = {
        {"score", score},
        {"flow_mean", flow_mean},
        {"flow_std", flow_std},
        {"flow_coefficient_variation", flow_cv},
        {"ssim_mean", ssim_mean},
        {"ssim_std", ssim_std},
        {"component_scores", {
            {"flow_consistency", flow_consistency_score},
            {"ssim_quality", ssim_quality_score},
            {"ssim_consistency", ssim_consistency_score}
        }}
    };
    if (!reason.empty()) {
        j["reason"] = reason;
    }
    return j;
}

TemporalStabilityAnalyzer::TemporalStabilityAnalyzer(const ForensicsConfig& config)
    : frame_size_(config.stability_frame_size) {}

void TemporalStabilityAnalyzer::reset() {
    prev_frame_.release();
    flow_magnitudes_.clear();
    ssim_values_.clear();
}

double TemporalStabilityAnalyzer::computeSsim(const cv::Mat& a, const cv::Mat& b) {
    const double C1 = (0.01 * 255) * (0.01 * 255);
    const double C2 = (0.03 * 255) * (0.03 * 255);
    const cv::Size window(11, 11);
    const double sigma = 1.5;

    cv::Mat img1, img2;
    a.convertTo(img1, CV_64F);
    b.convertTo(img2, CV_64F);

    cv::Mat mu1, mu2;
    cv::GaussianBlur(img1, mu1, window, sigma);
    cv::GaussianBlur(img2, mu2, window, sigma);

    cv::Mat mu1_sq = mu1.mul(mu1);
    cv::Mat mu2_sq = mu2.mul(mu2);
    cv::Mat mu1_mu2 = mu1.mul(mu2);

    cv::Mat sigma1_sq, sigma2_sq, sigma12;
    cv::GaussianBlur(img1.mul(img1), sigma1_sq, window, sigma);
    sigma1_sq -= mu1_sq;
    cv::GaussianBlur(img2.mul(img2), sigma2_sq, window, sigma);
    sigma2_sq -= mu2_sq;
    cv::GaussianBlur(img1.mul(img2), sigma12, window, sigma);
    sigma12 -= mu1_mu2;

    cv::Mat numerator = (2 * mu1_mu2 + C1).mul(2 * sigma12 + C2);
    cv::Mat denominator = (mu1_sq + mu2_sq + C1).mul(sigma1_sq + sigma2_sq + C2);
    cv::Mat ssim_map;
    cv::divide(numerator, denominator, ssim_map);
    return cv::mean(ssim_map)[0];
}

json TemporalStabilityAnalyzer::addFrame(const cv::Mat& frame) {
    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = frame.clone();
    }
    cv::resize(gray, gray, cv::Size(frame_size_, frame_size_));

    if (prev_frame_.empty()) {
        prev_frame_ = gray;
        return json{{"flow_magnitude", 0.0}, {"ssim", 1.0}};
    }

    cv::Mat flow;
    cv::calcOpticalFlowFarneback(prev_frame_, gray, flow, 0.5, 3, 15, 3, 5, 1.2, 0);

    std::vector<cv::Mat> components(2);
    cv::split(flow, components);
    cv::Mat magnitude;
    cv::magnitude(components[0], components[1], magnitude);
    double mean_magnitude = cv::mean(magnitude)[0];
    flow_magnitudes_.push_back(mean_magnitude);

    double ssim = computeSsim(prev_frame_, gray);
    ssim_values_.push_back(ssim);

    prev_frame_ = gray;
    return json{{"flow_magnitude", mean_magnitude}, {"ssim", ssim}};
}

StabilityResult TemporalStabilityAnalyzer::result() const {
    StabilityResult result;
    if (flow_magnitudes_.size() < 2) {
        result.score = 100.0;
        result.reason = "Insufficient frames";
        return result;
    }

    result.flow_mean = meanOf(flow_magnitudes_);
    result.flow_std = stdOf(flow_magnitudes_);
    result.flow_cv = result.flow_std / (result.flow_mean + 1e-6);
    result.ssim_mean = meanOf(ssim_values_);
    result.ssim_std = stdOf(ssim_values_);

    result.flow_consistency_score = std::max(0.0, 100.0 - result.flow_cv * 100.0);
    result.ssim_quality_score = result.ssim_mean * 100.0;
    result.ssim_consistency_score = std::max(0.0, 100.0 - result.ssim_std * 500.0);

    result.score = clipScore(result.flow_consistency_score * FLOW_WEIGHT +
                             result.ssim_quality_score * SSIM_WEIGHT +
                             result.ssim_consistency_score * SSIM_CONSISTENCY_WEIGHT);
    return result;
}

} // namespace fakeprobe
