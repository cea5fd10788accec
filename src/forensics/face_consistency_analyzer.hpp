#ifndef FAKEPROBE_FACE_CONSISTENCY_ANALYZER_HPP
#define FAKEPROBE_FACE_CONSISTENCY_ANALYZER_HPP

#include "config/analysis_config.hpp"
#include "face_detector.hpp"
#include <opencv2/opencv.hpp>
#include <memory>
#include <string>
#include <vector>

namespace fakeprobe {

struct FaceConsistencyResult {
    double score;                    // 0-100, higher = more consistent
    int frames_analyzed;
    int faces_detected;
    double histogram_similarity;     // mean clipped correlation
    double size_variation;           // std/mean of face width
    double movement_variation;       // std/mean of center displacement
    std::string reason;

    FaceConsistencyResult() : score(100.0), frames_analyzed(0), faces_detected(0),
                              histogram_similarity(0.0), size_variation(0.0),
                              movement_variation(0.0) {}

    json toJson() const;
};

// Tracks the largest detected face across frames and scores how stable its
// appearance, size and position are.
class FaceConsistencyAnalyzer {
public:
    FaceConsistencyAnalyzer(std::shared_ptr<FaceDetector> detector, const ForensicsConfig& config);

    json addFrame(const cv::Mat& frame);
    FaceConsistencyResult result() const;
    void reset();

    int facesDetected() const { return static_cast<int>(histograms_.size()); }

private:
    std::shared_ptr<FaceDetector> detector_;
    int histogram_bins_;
    int crop_size_;

    std::vector<cv::Mat> histograms_;
    std::vector<double> widths_;
    std::vector<cv::Point2d> centers_;
    int frames_seen_;

    static constexpr double SIMILARITY_WEIGHT = 0.5;
    static constexpr double SIZE_WEIGHT = 0.25;
    static constexpr double MOVEMENT_WEIGHT = 0.25;
    static constexpr double SIZE_PENALTY = 200.0;
    static constexpr double MOVEMENT_PENALTY = 50.0;

    cv::Mat faceHistogram(const cv::Mat& face_gray) const;
};

} // namespace fakeprobe

#endif // FAKEPROBE_FACE_CONSISTENCY_ANALYZER_HPP
