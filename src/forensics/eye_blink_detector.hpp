#ifndef FAKEPROBE_EYE_BLINK_DETECTOR_HPP
#define FAKEPROBE_EYE_BLINK_DETECTOR_HPP

#include "config/analysis_config.hpp"
#include "face_detector.hpp"
#include <opencv2/opencv.hpp>
#include <memory>
#include <string>
#include <vector>

namespace fakeprobe {

struct BlinkResult {
    double blink_rate;          // blinks per second
    double blinks_per_minute;
    int blink_count;
    double score;               // 0-100, physiological plausibility
    int frames_analyzed;
    double duration_seconds;
    double ear_mean;
    double ear_std;
    std::string reason;

    BlinkResult() : blink_rate(0.0), blinks_per_minute(0.0), blink_count(0), score(50.0),
                    frames_analyzed(0), duration_seconds(0.0), ear_mean(0.0), ear_std(0.0) {}

    json toJson() const;
};

class EyeBlinkDetector {
public:
    EyeBlinkDetector(std::shared_ptr<FaceDetector> detector, const ForensicsConfig& config);

    // Detects the face and eyes and feeds the blink state machine.
    json addFrame(const cv::Mat& frame);

    // One frame's observation: eyes_found < 2 means the eyes were not
    // visible (treated as closed). ear is ignored in that case.
    void recordObservation(int eyes_found, double ear);

    // Counts a frame in which no face was found.
    void recordMissingFace();

    BlinkResult result(double fps) const;
    void reset();

    int blinkCount() const { return blink_count_; }

    // Approximate eye aspect ratio: height/width of the largest
    // Otsu-thresholded contour. 0.5 when there is no usable contour.
    static double eyeAspectRatio(const cv::Mat& eye_gray);

    // Plausibility of a blink rate against a normal_bpm baseline.
    static double scoreBlinkRate(double blinks_per_minute, double normal_bpm = 17.0);

private:
    std::shared_ptr<FaceDetector> detector_;
    double ear_threshold_;
    int consecutive_frames_;
    double normal_bpm_;

    std::vector<double> ear_history_;
    int blink_count_;
    int consecutive_closed_;
    int frame_count_;

    static constexpr double HIDDEN_EYE_EAR = 0.3;
    static constexpr double OPEN_EYE_FACTOR = 1.5;
};

} // namespace fakeprobe

#endif // FAKEPROBE_EYE_BLINK_DETECTOR_HPP
