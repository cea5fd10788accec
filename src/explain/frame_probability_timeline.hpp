#ifndef FAKEPROBE_FRAME_PROBABILITY_TIMELINE_HPP
#define FAKEPROBE_FRAME_PROBABILITY_TIMELINE_HPP

#include "config/analysis_config.hpp"
#include "model/frame_classifier.hpp"
#include <opencv2/opencv.hpp>
#include <vector>

namespace fakeprobe {

struct FrameProbability {
    int frame_index;
    double fake_probability;
    double real_probability;
    double timestamp_ms;
    bool is_anomaly;
    double anomaly_score;

    FrameProbability() : frame_index(0), fake_probability(0.0), real_probability(0.0),
                         timestamp_ms(0.0), is_anomaly(false), anomaly_score(0.0) {}

    json toJson() const;
};

struct TimelineStats {
    double mean_fake_probability;
    double std_fake_probability;
    double max_fake_probability;
    double min_fake_probability;
    double temporal_variance;           // mean |consecutive delta|
    double temporal_consistency_score;  // 0-100
    int anomaly_count;
    double anomaly_ratio;
    int total_frames;

    TimelineStats() : mean_fake_probability(0.0), std_fake_probability(0.0), max_fake_probability(0.0),
                      min_fake_probability(0.0), temporal_variance(0.0), temporal_consistency_score(0.0),
                      anomaly_count(0), anomaly_ratio(0.0), total_frames(0) {}

    json toJson() const;
};

// Ordered per-frame fake/real probabilities for one video, with anomaly
// marking on sudden jumps and chart export.
class FrameProbabilityTimeline {
public:
    explicit FrameProbabilityTimeline(const TimelineConfig& config = TimelineConfig());

    void reset();

    // Softmax of logits; index 0 is FAKE. A negative timestamp means
    // index / fps.
    FrameProbability addFrame(int frame_index, const std::vector<double>& logits,
                              double timestamp_ms = -1.0);

    // fps <= 0 keeps the current rate.
    std::vector<FrameProbability> addBatch(int start_frame, const std::vector<std::vector<double>>& logits_sequence,
                                           double fps = 0.0);

    // Centered moving average of fake probability; shorter sequences are
    // returned as-is.
    std::vector<double> smoothedProbabilities() const;

    TimelineStats stats() const;

    // labels, timestamps (s), datasets in percent, anomaly markers, statistics
    json toChartJson() const;

    // frames + chart + metadata
    json toJson() const;

    const std::vector<FrameProbability>& frames() const { return frames_; }
    bool empty() const { return frames_.empty(); }
    double fps() const { return fps_; }

private:
    void detectAnomaly(size_t index);

    double fps_;
    double anomaly_threshold_;
    int smoothing_window_;
    std::vector<FrameProbability> frames_;
};

// Runs every frame through the backbone and linear head only, so each frame
// gets its own opinion independent of the temporal stage.
FrameProbabilityTimeline extractFrameProbabilities(FrameClassifier& classifier,
                                                   const std::vector<cv::Mat>& frames,
                                                   const TimelineConfig& config);

} // namespace fakeprobe

#endif // FAKEPROBE_FRAME_PROBABILITY_TIMELINE_HPP
