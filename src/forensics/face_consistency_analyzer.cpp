#include "forensics/face_consistency_analyzer.hpp"
#include "score_utils.hpp"

namespace fakeprobe {

json FaceConsistencyResult::toJson() const {
    json j = {
        {"score", score},
        {"frames_analyzed", frames_analyzed},
        {"faces_detected", faces_detected},
        {"histogram_similarity", histogram_similarity},
        {"size_variation", size_variation},
        {"movement_variation", movement_variation}
    };
    if (!reason.empty()) {
        j["reason"] = reason;
    }
    return j;
}

FaceConsistencyAnalyzer::FaceConsistencyAnalyzer(std::shared_ptr<FaceDetector> detector,
                                                 const ForensicsConfig& config)
    : detector_(std::move(detector)),
      histogram_bins_(config.face_histogram_bins),
      crop_size_(config.face_crop_size),
      frames_seen_(0) {}

void FaceConsistencyAnalyzer::reset() {
    histograms_.clear();
    widths_.clear();
    centers_.clear();
    frames_seen_ = 0;
}

cv::Mat FaceConsistencyAnalyzer::faceHistogram(const cv::Mat& face_gray) const {
    cv::Mat resized;
    cv::resize(face_gray, resized, cv::Size(crop_size_, crop_size_));

    cv::Mat hist;
    int channels[] = {0};
    int hist_size[] = {histogram_bins_};
    float range[] = {0.0f, 256.0f};
    const float* ranges[] = {range};
    cv::calcHist(&resized, 1, channels, cv::Mat(), hist, 1, hist_size, ranges);
    cv::normalize(hist, hist);
    return hist;
}

json FaceConsistencyAnalyzer::addFrame(const cv::Mat& frame) {
    frames_seen_++;

    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = frame;
    }

    cv::Rect face;
    if (!FaceDetector::largestFace(detector_->detectFaces(gray), face)) {
        return json{{"face_detected", false}};
    }
    face &= cv::Rect(0, 0, gray.cols, gray.rows);
    if (face.area() <= 0) {
        return json{{"face_detected", false}};
    }

    histograms_.push_back(faceHistogram(gray(face)));
    widths_.push_back(static_cast<double>(face.width));
    centers_.emplace_back(face.x + face.width / 2.0, face.y + face.height / 2.0);

    return json{
        {"face_detected", true},
        {"face_box", {face.x, face.y, face.width, face.height}}
    };
}

FaceConsistencyResult FaceConsistencyAnalyzer::result() const {
    FaceConsistencyResult result;
    result.frames_analyzed = frames_seen_;
    result.faces_detected = static_cast<int>(histograms_.size());

    if (histograms_.size() < 2) {
        result.score = 100.0;
        result.reason = "Insufficient frames for analysis";
        return result;
    }

    std::vector<double> similarities;
    for (size_t i = 1; i < histograms_.size(); ++i) {
        double corr = cv::compareHist(histograms_[i - 1], histograms_[i], cv::HISTCMP_CORREL);
        similarities.push_back(std::max(0.0, corr));
    }

    std::vector<double> movements;
    for (size_t i = 1; i < centers_.size(); ++i) {
        movements.push_back(cv::norm(centers_[i] - centers_[i - 1]));
    }

    double width_mean = meanOf(widths_);
    result.histogram_similarity = meanOf(similarities);
    result.size_variation = width_mean > 0.0 ? stdOf(widths_) / width_mean : 0.0;
    result.movement_variation = stdOf(movements) / (meanOf(movements) + 1e-6);

    double score = SIMILARITY_WEIGHT * result.histogram_similarity * 100.0 +
                   SIZE_WEIGHT * std::max(0.0, 100.0 - result.size_variation * SIZE_PENALTY) +
                   MOVEMENT_WEIGHT * std::max(0.0, 100.0 - result.movement_variation * MOVEMENT_PENALTY);
    result.score = clipScore(score);
    return result;
}

} // namespace fakeprobe
