#include "forensics/eye_blink_detector.hpp"
#include "score_utils.hpp"

namespace fakeprobe {

json BlinkResult::toJson() const {
    json j = {
        {"blink_rate", blink_rate},
        {"blinks_per_minute", blinks_per_minute},
        {"blink_count", blink_count},
        {"score", score},
        {"frames_analyzed", frames_analyzed},
        {"duration_seconds", duration_seconds},
        {"normal_range", "15-20 per minute"},
        {"ear_mean", ear_mean},
        {"ear_std", ear_std}
    };
    if (!reason.empty()) {
        j["reason"] = reason;
    }
    return j;
}

EyeBlinkDetector::EyeBlinkDetector(std::shared_ptr<FaceDetector> detector, const ForensicsConfig& config)
    : detector_(std::move(detector)),
      ear_threshold_(config.ear_threshold),
      consecutive_frames_(config.blink_consecutive_frames),
      normal_bpm_(config.normal_blinks_per_minute),
      blink_count_(0),
      consecutive_closed_(0),
      frame_count_(0) {}

void EyeBlinkDetector::reset() {
    ear_history_.clear();
    blink_count_ = 0;
    consecutive_closed_ = 0;
    frame_count_ = 0;
}

double EyeBlinkDetector::eyeAspectRatio(const cv::Mat& eye_gray) {
    if (eye_gray.empty()) {
        return 0.5;
    }

    cv::Mat thresh;
    cv::threshold(eye_gray, thresh, 0, 255, cv::THRESH_BINARY + cv::THRESH_OTSU);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(thresh, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
    if (contours.empty()) {
        return 0.5;
    }

    size_t largest = 0;
    double largest_area = cv::contourArea(contours[0]);
    for (size_t i = 1; i < contours.size(); ++i) {
        double area = cv::contourArea(contours[i]);
        if (area > largest_area) {
            largest_area = area;
            largest = i;
        }
    }

    cv::Rect box = cv::boundingRect(contours[largest]);
    if (box.width == 0) {
        return 0.5;
    }
    return static_cast<double>(box.height) / box.width;
}

void EyeBlinkDetector::recordMissingFace() {
    frame_count_++;
}

void EyeBlinkDetector::recordObservation(int eyes_found, double ear) {
    frame_count_++;

    if (eyes_found < 2) {
        ear_history_.push_back(HIDDEN_EYE_EAR);
        consecutive_closed_++;
        if (consecutive_closed_ >= consecutive_frames_ &&
            ear_history_.size() >= static_cast<size_t>(consecutive_frames_ + 2)) {
            // The two readings right before the closed run must look open.
            size_t end = ear_history_.size() - consecutive_frames_;
            double prev_open = (ear_history_[end - 2] + ear_history_[end - 1]) / 2.0;
            if (prev_open > ear_threshold_ * OPEN_EYE_FACTOR) {
                blink_count_++;
                consecutive_closed_ = 0;
            }
        }
        return;
    }

    ear_history_.push_back(ear);
    if (ear < ear_threshold_) {
        consecutive_closed_++;
    } else {
        if (consecutive_closed_ >= consecutive_frames_) {
            blink_count_++;
        }
        consecutive_closed_ = 0;
    }
}

json EyeBlinkDetector::addFrame(const cv::Mat& frame) {
    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = frame;
    }

    cv::Rect face;
    if (!FaceDetector::largestFace(detector_->detectFaces(gray), face) ||
        (face &= cv::Rect(0, 0, gray.cols, gray.rows)).area() <= 0) {
        recordMissingFace();
        return json{{"eyes_found", 0}, {"ear", nullptr}};
    }

    cv::Mat face_roi = gray(face);
    std::vector<cv::Rect> eyes = detector_->detectEyes(face_roi);
    int eyes_found = static_cast<int>(eyes.size());

    if (eyes_found < 2) {
        recordObservation(eyes_found, HIDDEN_EYE_EAR);
        return json{{"eyes_found", eyes_found}, {"ear", HIDDEN_EYE_EAR}};
    }

    double ear_sum = 0.0;
    for (size_t i = 0; i < 2; ++i) {
        cv::Rect eye = eyes[i] & cv::Rect(0, 0, face_roi.cols, face_roi.rows);
        ear_sum += eyeAspectRatio(eye.area() > 0 ? face_roi(eye) : cv::Mat());
    }
    double avg_ear = ear_sum / 2.0;

    recordObservation(eyes_found, avg_ear);
    return json{{"eyes_found", eyes_found}, {"ear", avg_ear}};
}

double EyeBlinkDetector::scoreBlinkRate(double bpm, double normal_bpm) {
    double score;
    if (bpm < 5.0) {
        score = std::max(0.0, 30.0 - (5.0 - bpm) * 6.0);
    } else if (bpm > 40.0) {
        // Too frequent is as implausible as too rare.
        score = std::min(30.0, std::max(0.0, 50.0 - (bpm - 40.0) * 2.0));
    } else {
        score = std::max(0.0, 100.0 - std::abs(bpm - normal_bpm) * 3.0);
    }
    return clipScore(score);
}

BlinkResult EyeBlinkDetector::result(double fps) const {
    BlinkResult result;
    result.frames_analyzed = frame_count_;
    result.blink_count = blink_count_;

    if (frame_count_ == 0) {
        result.reason = "No frames processed";
        return result;
    }
    if (!(fps > 0.0)) {
        result.reason = "Zero duration";
        return result;
    }

    result.duration_seconds = frame_count_ / fps;
    result.blink_rate = blink_count_ / result.duration_seconds;
    result.blinks_per_minute = result.blink_rate * 60.0;
    result.score = scoreBlinkRate(result.blinks_per_minute, normal_bpm_);
    result.ear_mean = meanOf(ear_history_);
    result.ear_std = stdOf(ear_history_);
    return result;
}

} // namespace fakeprobe
