#include "face_detector.hpp"
#include "dlib_face_detector.hpp"
#include <iostream>
#include <stdexcept>

namespace fakeprobe {

bool FaceDetector::largestFace(const std::vector<cv::Rect>& faces, cv::Rect& largest) {
    if (faces.empty()) {
        return false;
    }
    largest = faces[0];
    for (const auto& face : faces) {
        if (face.area() > largest.area()) {
            largest = face;
        }
    }
    return true;
}

CascadeFaceDetector::CascadeFaceDetector(const std::string& cascade_dir)
    : cascade_dir_(cascade_dir), initialized_(false) {}

bool CascadeFaceDetector::loadCascade(cv::CascadeClassifier& cascade, const std::string& filename) {
    std::vector<std::string> search_paths;
    if (!cascade_dir_.empty()) {
        search_paths.push_back(cascade_dir_ + "/" + filename);
    }
    search_paths.push_back("/usr/share/opencv4/haarcascades/" + filename);
    search_paths.push_back("/usr/local/share/opencv4/haarcascades/" + filename);
    search_paths.push_back("/usr/share/opencv/haarcascades/" + filename);
    search_paths.push_back("/opt/homebrew/share/opencv4/haarcascades/" + filename);
    search_paths.push_back("./models/" + filename);

    for (const auto& path : search_paths) {
        if (cascade.load(path)) {
            std::cout << "Loaded cascade: " << path << std::endl;
            return true;
        }
    }
    std::cerr << "Could not find cascade " << filename << std::endl;
    return false;
}

bool CascadeFaceDetector::initialize() {
    try {
        initialized_ = loadCascade(face_cascade_, "haarcascade_frontalface_default.xml") &&
                       loadCascade(eye_cascade_, "haarcascade_eye.xml");
    } catch (const cv::Exception& e) {
        std::cerr << "Error loading Haar cascades: " << e.what() << std::endl;
        initialized_ = false;
    }
    return initialized_;
}

std::vector<cv::Rect> CascadeFaceDetector::detectFaces(const cv::Mat& gray) {
    std::vector<cv::Rect> faces;
    if (!initialized_ || gray.empty()) {
        return faces;
    }
    face_cascade_.detectMultiScale(gray, faces, FACE_SCALE_FACTOR, FACE_MIN_NEIGHBORS, 0,
                                   cv::Size(FACE_MIN_SIZE, FACE_MIN_SIZE));
    return faces;
}

std::vector<cv::Rect> CascadeFaceDetector::detectEyes(const cv::Mat& face_gray) {
    std::vector<cv::Rect> eyes;
    if (!initialized_ || face_gray.empty()) {
        return eyes;
    }
    eye_cascade_.detectMultiScale(face_gray, eyes, EYE_SCALE_FACTOR, EYE_MIN_NEIGHBORS, 0,
                                  cv::Size(EYE_MIN_SIZE, EYE_MIN_SIZE));
    return eyes;
}

std::shared_ptr<FaceDetector> createFaceDetector(const ForensicsConfig& config) {
    if (config.face_detector == "dlib") {
        auto detector = std::make_shared<DlibFaceDetector>();
        if (!detector->initialize(config.shape_predictor_path)) {
            throw std::runtime_error("Failed to initialize dlib face detector");
        }
        return detector;
    }

    auto detector = std::make_shared<CascadeFaceDetector>(config.cascade_dir);
    if (!detector->initialize()) {
        throw std::runtime_error("Failed to load Haar cascades for face detection");
    }
    return detector;
}

} // namespace fakeprobe
