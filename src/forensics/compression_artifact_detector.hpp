#ifndef FAKEPROBE_COMPRESSION_ARTIFACT_DETECTOR_HPP
#define FAKEPROBE_COMPRESSION_ARTIFACT_DETECTOR_HPP

#include "config/analysis_config.hpp"
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace fakeprobe {

struct ArtifactResult {
    double blockiness_score;     // 0-100, higher = more blocking
    double frequency_score;      // 0-100, higher = more spectral irregularity
    double combined_score;
    double mean_blockiness;
    double std_blockiness;
    double mean_frequency_anomaly;
    double std_frequency_anomaly;
    std::string reason;

    ArtifactResult() : blockiness_score(0.0), frequency_score(0.0), combined_score(0.0),
                       mean_blockiness(0.0), std_blockiness(0.0), mean_frequency_anomaly(0.0),
                       std_frequency_anomaly(0.0) {}

    json toJson() const;
};

class CompressionArtifactDetector {
public:
    explicit CompressionArtifactDetector(const ForensicsConfig& config);

    json addFrame(const cv::Mat& frame);
    ArtifactResult result() const;
    void reset();

    // Boundary-to-interior difference ratio across block edges. 0 for
    // images with fewer than two blocks in either direction.
    static double computeBlockiness(const cv::Mat& gray, int block_size = 8);

    // Irregularity of the radial profile of the normalised log spectrum.
    static double computeFrequencyAnomaly(const cv::Mat& gray, int size = 256);

private:
    int block_size_;
    int spectrum_size_;
    std::vector<double> blockiness_values_;
    std::vector<double> frequency_anomalies_;

    static constexpr double BLOCKINESS_SCALE = 30.0;
    static constexpr double FREQUENCY_SCALE = 100.0;
};

} // namespace fakeprobe

#endif // FAKEPROBE_COMPRESSION_ARTIFACT_DETECTOR_HPP
