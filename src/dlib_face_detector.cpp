#include "dlib_face_detector.hpp"
#include <dlib/opencv.h>
#include <iostream>

namespace fakeprobe {

DlibFaceDetector::DlibFaceDetector() : has_landmarks_(false), initialized_(false) {}

bool DlibFaceDetector::initialize(const std::string& shape_predictor_path) {
    try {
        face_detector_ = dlib::get_frontal_face_detector();
        if (!shape_predictor_path.empty()) {
            dlib::deserialize(shape_predictor_path) >> pose_model_;
            has_landmarks_ = true;
            std::cout << "Shape predictor loaded: " << shape_predictor_path << std::endl;
        } else {
            std::cout << "dlib detector running without shape predictor, eye detection disabled" << std::endl;
        }
        initialized_ = true;
    } catch (const std::exception& e) {
        std::cerr << "Error loading dlib models: " << e.what() << std::endl;
        initialized_ = false;
    }
    return initialized_;
}

std::vector<cv::Rect> DlibFaceDetector::detectFaces(const cv::Mat& gray) {
    std::vector<cv::Rect> faces;
    if (!initialized_ || gray.empty()) {
        return faces;
    }

    dlib::cv_image<unsigned char> dlib_image(gray);
    const cv::Rect bounds(0, 0, gray.cols, gray.rows);
    for (const auto& rect : face_detector_(dlib_image)) {
        cv::Rect face(static_cast<int>(rect.left()), static_cast<int>(rect.top()),
                      static_cast<int>(rect.width()), static_cast<int>(rect.height()));
        face &= bounds;
        if (face.area() > 0) {
            faces.push_back(face);
        }
    }
    return faces;
}

cv::Rect DlibFaceDetector::eyeBox(const dlib::full_object_detection& shape, unsigned long first,
                                  const cv::Size& bounds) {
    std::vector<cv::Point> points;
    for (unsigned long i = first; i < first + 6; ++i) {
        points.emplace_back(static_cast<int>(shape.part(i).x()), static_cast<int>(shape.part(i).y()));
    }
    cv::Rect box = cv::boundingRect(points);
    box.x -= EYE_PADDING;
    box.y -= EYE_PADDING;
    box.width += 2 * EYE_PADDING;
    box.height += 2 * EYE_PADDING;
    return box & cv::Rect(0, 0, bounds.width, bounds.height);
}

std::vector<cv::Rect> DlibFaceDetector::detectEyes(const cv::Mat& face_gray) {
    std::vector<cv::Rect> eyes;
    if (!initialized_ || !has_landmarks_ || face_gray.empty()) {
        return eyes;
    }

    dlib::cv_image<unsigned char> dlib_image(face_gray);
    dlib::rectangle face_rect(0, 0, face_gray.cols - 1, face_gray.rows - 1);
    dlib::full_object_detection shape = pose_model_(dlib_image, face_rect);
    if (shape.num_parts() < 48) {
        return eyes;
    }

    for (unsigned long first : {36UL, 42UL}) {
        cv::Rect eye = eyeBox(shape, first, face_gray.size());
        if (eye.area() > 0) {
            eyes.push_back(eye);
        }
    }
    return eyes;
}

} // namespace fakeprobe
