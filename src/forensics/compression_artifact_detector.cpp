#include "forensics/compression_artifact_detector.hpp"
#include "score_utils.hpp"

namespace fakeprobe {

namespace {

// Swap quadrants so the zero frequency sits at the centre.
void shiftSpectrum(cv::Mat& mag) {
    int cx = mag.cols / 2;
    int cy = mag.rows / 2;
    cv::Mat q0(mag, cv::Rect(0, 0, cx, cy));
    cv::Mat q1(mag, cv::Rect(cx, 0, cx, cy));
    cv::Mat q2(mag, cv::Rect(0, cy, cx, cy));
    cv::Mat q3(mag, cv::Rect(cx, cy, cx, cy));
    cv::Mat tmp;
    q0.copyTo(tmp);
    q3.copyTo(q0);
    tmp.copyTo(q3);
    q1.copyTo(tmp);
    q2.copyTo(q1);
    tmp.copyTo(q2);
}

double meanAbsDiff(const cv::Mat& a, const cv::Mat& b) {
    cv::Mat diff;
    cv::absdiff(a, b, diff);
    return cv::mean(diff)[0];
}

} // namespace

json ArtifactResult::toJson() const {
    json j = {
        {"blockiness_score", blockiness_score},
        {"frequency_score", frequency_score},
        {"combined_score", combined_score},
        {"mean_blockiness", mean_blockiness},
        {"std_blockiness", std_blockiness},
        {"mean_frequency_anomaly", mean_frequency_anomaly},
        {"std_frequency_anomaly", std_frequency_anomaly}
    };
    if (!reason.empty()) {
        j["reason"] = reason;
    }
    return j;
}

CompressionArtifactDetector::CompressionArtifactDetector(const ForensicsConfig& config)
    : block_size_(config.block_size), spectrum_size_(config.spectrum_size) {}

void CompressionArtifactDetector::reset() {
    blockiness_values_.clear();
    frequency_anomalies_.clear();
}

double CompressionArtifactDetector::computeBlockiness(const cv::Mat& gray, int block_size) {
    int h_blocks = gray.rows / block_size;
    int w_blocks = gray.cols / block_size;
    if (h_blocks < 2 || w_blocks < 2) {
        return 0.0;
    }

    cv::Mat img;
    gray(cv::Rect(0, 0, w_blocks * block_size, h_blocks * block_size)).convertTo(img, CV_64F);
    const int half = block_size / 2;

    double h_diff = 0.0;
    for (int i = 1; i < h_blocks; ++i) {
        int row = i * block_size;
        double boundary = meanAbsDiff(img.row(row), img.row(row - 1));
        double internal = meanAbsDiff(img.row(row - half), img.row(row - half - 1));
        h_diff += boundary / (internal + 1e-6);
    }

    double v_diff = 0.0;
    for (int j = 1; j < w_blocks; ++j) {
        int col = j * block_size;
        double boundary = meanAbsDiff(img.col(col), img.col(col - 1));
        double internal = meanAbsDiff(img.col(col - half), img.col(col - half - 1));
        v_diff += boundary / (internal + 1e-6);
    }

    return (h_diff / h_blocks + v_diff / w_blocks) / 2.0;
}

double CompressionArtifactDetector::computeFrequencyAnomaly(const cv::Mat& gray, int size) {
    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(size, size));
    cv::Mat planar;
    resized.convertTo(planar, CV_32F);

    cv::Mat complex;
    cv::dft(planar, complex, cv::DFT_COMPLEX_OUTPUT);
    std::vector<cv::Mat> parts(2);
    cv::split(complex, parts);

    cv::Mat magnitude;
    cv::magnitude(parts[0], parts[1], magnitude);
    shiftSpectrum(magnitude);
    magnitude += cv::Scalar::all(1.0);
    cv::log(magnitude, magnitude);

    double min_val, max_val;
    cv::minMaxLoc(magnitude, &min_val, &max_val);
    magnitude = (magnitude - min_val) / (max_val - min_val + 1e-6);

    const double center = size / 2.0;
    std::vector<double> profile;
    for (int radius = 5; radius < size / 2; radius += 5) {
        double sum = 0.0;
        int count = 0;
        for (int y = 0; y < size; ++y) {
            const float* row = magnitude.ptr<float>(y);
            for (int x = 0; x < size; ++x) {
                double r = std::sqrt((x - center) * (x - center) + (y - center) * (y - center));
                if (r >= radius - 2.5 && r < radius + 2.5) {
                    sum += row[x];
                    count++;
                }
            }
        }
        if (count > 0) {
            profile.push_back(sum / count);
        }
    }

    if (profile.size() < 3) {
        return 0.0;
    }

    std::vector<double> diffs;
    double abs_sum = 0.0;
    for (size_t i = 0; i < profile.size(); ++i) {
        abs_sum += std::abs(profile[i]);
        if (i > 0) {
            diffs.push_back(std::abs(profile[i] - profile[i - 1]));
        }
    }
    return stdOf(diffs) / (abs_sum / profile.size() + 1e-6);
}

json CompressionArtifactDetector::addFrame(const cv::Mat& frame) {
    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = frame;
    }

    double blockiness = computeBlockiness(gray, block_size_);
    double anomaly = computeFrequencyAnomaly(gray, spectrum_size_);
    blockiness_values_.push_back(blockiness);
    frequency_anomalies_.push_back(anomaly);

    return json{{"blockiness", blockiness}, {"frequency_anomaly", anomaly}};
}

ArtifactResult CompressionArtifactDetector::result() const {
    ArtifactResult result;
    if (blockiness_values_.empty()) {
        result.reason = "No frames analyzed";
        return result;
    }

    result.mean_blockiness = meanOf(blockiness_values_);
    result.std_blockiness = stdOf(blockiness_values_);
    result.mean_frequency_anomaly = meanOf(frequency_anomalies_);
    result.std_frequency_anomaly = stdOf(frequency_anomalies_);

    result.blockiness_score = std::min(100.0, result.mean_blockiness * BLOCKINESS_SCALE);
    result.frequency_score = std::min(100.0, result.mean_frequency_anomaly * FREQUENCY_SCALE);
    result.combined_score = (result.blockiness_score + result.frequency_score) / 2.0;
    return result;
}

} // namespace fakeprobe
