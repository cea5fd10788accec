#ifndef FAKEPROBE_FACE_DETECTOR_HPP
#define FAKEPROBE_FACE_DETECTOR_HPP

#include "config/analysis_config.hpp"
#include <opencv2/opencv.hpp>
#include <memory>
#include <string>
#include <vector>

namespace fakeprobe {

// Face and eye localisation shared by the forensics and lip-sync analyzers.
// Inputs are single-channel 8-bit images.
class FaceDetector {
public:
    virtual ~FaceDetector() = default;

    virtual std::vector<cv::Rect> detectFaces(const cv::Mat& gray) = 0;

    // Eye boxes in face_gray coordinates.
    virtual std::vector<cv::Rect> detectEyes(const cv::Mat& face_gray) = 0;

    virtual std::string name() const = 0;

    // Picks the face with the largest area; false when faces is empty.
    static bool largestFace(const std::vector<cv::Rect>& faces, cv::Rect& largest);
};

// OpenCV Haar cascades (frontal face + eye)
class CascadeFaceDetector : public FaceDetector {
public:
    explicit CascadeFaceDetector(const std::string& cascade_dir = "");

    bool initialize();
    bool isInitialized() const { return initialized_; }

    std::vector<cv::Rect> detectFaces(const cv::Mat& gray) override;
    std::vector<cv::Rect> detectEyes(const cv::Mat& face_gray) override;
    std::string name() const override { return "cascade"; }

private:
    std::string cascade_dir_;
    cv::CascadeClassifier face_cascade_;
    cv::CascadeClassifier eye_cascade_;
    bool initialized_;

    static constexpr double FACE_SCALE_FACTOR = 1.1;
    static constexpr int FACE_MIN_NEIGHBORS = 4;
    static constexpr int FACE_MIN_SIZE = 30;
    static constexpr double EYE_SCALE_FACTOR = 1.1;
    static constexpr int EYE_MIN_NEIGHBORS = 3;
    static constexpr int EYE_MIN_SIZE = 20;

    bool loadCascade(cv::CascadeClassifier& cascade, const std::string& filename);
};

// Builds the backend named by config.face_detector. Throws std::runtime_error
// when the backend cannot load its models.
std::shared_ptr<FaceDetector> createFaceDetector(const ForensicsConfig& config);

} // namespace fakeprobe

#endif // FAKEPROBE_FACE_DETECTOR_HPP
