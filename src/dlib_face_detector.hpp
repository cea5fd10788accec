#ifndef FAKEPROBE_DLIB_FACE_DETECTOR_HPP
#define FAKEPROBE_DLIB_FACE_DETECTOR_HPP

#include "face_detector.hpp"
#include <dlib/image_processing.h>
#include <dlib/image_processing/frontal_face_detector.h>

namespace fakeprobe {

// dlib HOG face detector. Eye boxes come from the 68-point shape predictor
// (points 36-41 and 42-47) when a predictor model is loaded.
class DlibFaceDetector : public FaceDetector {
public:
    DlibFaceDetector();

    // shape_predictor_path may be empty; detectEyes then returns nothing.
    bool initialize(const std::string& shape_predictor_path);

    std::vector<cv::Rect> detectFaces(const cv::Mat& gray) override;
    std::vector<cv::Rect> detectEyes(const cv::Mat& face_gray) override;
    std::string name() const override { return "dlib"; }

private:
    dlib::frontal_face_detector face_detector_;
    dlib::shape_predictor pose_model_;
    bool has_landmarks_;
    bool initialized_;

    static constexpr int EYE_PADDING = 5;

    static cv::Rect eyeBox(const dlib::full_object_detection& shape, unsigned long first,
                           const cv::Size& bounds);
};

} // namespace fakeprobe

#endif // FAKEPROBE_DLIB_FACE_DETECTOR_HPP
