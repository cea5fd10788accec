#include "explain/frame_probability_timeline.hpp"
#include "score_utils.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fakeprobe {

namespace {

std::string isoTimestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

} // namespace

json FrameProbability::toJson() const {
    return json{
        {"frame_index", frame_index},
        {"fake_probability", fake_probability},
        {"real_probability", real_probability},
        {"timestamp_ms", timestamp_ms},
        {"is_anomaly", is_anomaly},
        {"anomaly_score", anomaly_score}
    };
}

json TimelineStats::toJson() const {
    return json{
        {"mean_fake_probability", mean_fake_probability},
        {"std_fake_probability", std_fake_probability},
        {"max_fake_probability", max_fake_probability},
        {"min_fake_probability", min_fake_probability},
        {"temporal_variance", temporal_variance},
        {"temporal_consistency_score", temporal_consistency_score},
        {"anomaly_count", anomaly_count},
        {"anomaly_ratio", anomaly_ratio},
        {"total_frames", total_frames}
    };
}

FrameProbabilityTimeline::FrameProbabilityTimeline(const TimelineConfig& config)
    : fps_(config.fps > 0.0 ? config.fps : 30.0),
      anomaly_threshold_(config.anomaly_threshold),
      smoothing_window_(std::max(1, config.smoothing_window)) {}

void FrameProbabilityTimeline::reset() {
    frames_.clear();
}

FrameProbability FrameProbabilityTimeline::addFrame(int frame_index, const std::vector<double>& logits,
                                                    double timestamp_ms) {
    if (logits.size() < 2) {
        throw std::invalid_argument("Timeline needs two-class logits, got " + std::to_string(logits.size()));
    }
    std::vector<double> probs = softmax(logits);

    FrameProbability frame;
    frame.frame_index = frame_index;
    frame.fake_probability = probs[CLASS_FAKE];
    frame.real_probability = probs[CLASS_REAL];
    frame.timestamp_ms = timestamp_ms < 0.0 ? frame_index / fps_ * 1000.0 : timestamp_ms;

    frames_.push_back(frame);
    detectAnomaly(frames_.size() - 1);
    return frames_.back();
}

std::vector<FrameProbability> FrameProbabilityTimeline::addBatch(int start_frame,
                                                                 const std::vector<std::vector<double>>& logits_sequence,
                                                                 double fps) {
    if (fps > 0.0) {
        fps_ = fps;
    }
    std::vector<FrameProbability> added;
    added.reserve(logits_sequence.size());
    for (size_t i = 0; i < logits_sequence.size(); ++i) {
        added.push_back(addFrame(start_frame + static_cast<int>(i), logits_sequence[i]));
    }
    return added;
}

void FrameProbabilityTimeline::detectAnomaly(size_t index) {
    if (index == 0) {
        return;
    }
    FrameProbability& current = frames_[index];
    double change = std::abs(current.fake_probability - frames_[index - 1].fake_probability);
    if (change > anomaly_threshold_) {
        current.is_anomaly = true;
        current.anomaly_score = change;
    }
}

std::vector<double> FrameProbabilityTimeline::smoothedProbabilities() const {
    std::vector<double> probs;
    probs.reserve(frames_.size());
    for (const auto& f : frames_) {
        probs.push_back(f.fake_probability);
    }
    if (static_cast<int>(probs.size()) < smoothing_window_) {
        return probs;
    }

    const int n = static_cast<int>(probs.size());
    const int half = smoothing_window_ / 2;
    std::vector<double> smoothed(probs.size());
    for (int i = 0; i < n; ++i) {
        int start = std::max(0, i - half);
        int end = std::min(n, i + half + 1);
        double sum = 0.0;
        for (int k = start; k < end; ++k) {
            sum += probs[k];
        }
        smoothed[i] = sum / (end - start);
    }
    return smoothed;
}

TimelineStats FrameProbabilityTimeline::stats() const {
    TimelineStats stats;
    if (frames_.empty()) {
        return stats;
    }

    std::vector<double> probs;
    probs.reserve(frames_.size());
    for (const auto& f : frames_) {
        probs.push_back(f.fake_probability);
        if (f.is_anomaly) {
            stats.anomaly_count++;
        }
    }

    stats.mean_fake_probability = meanOf(probs);
    stats.std_fake_probability = stdOf(probs);
    stats.max_fake_probability = *std::max_element(probs.begin(), probs.end());
    stats.min_fake_probability = *std::min_element(probs.begin(), probs.end());

    if (probs.size() > 1) {
        double total = 0.0;
        for (size_t i = 1; i < probs.size(); ++i) {
            total += std::abs(probs[i] - probs[i - 1]);
        }
        stats.temporal_variance = total / static_cast<double>(probs.size() - 1);
    }

    stats.temporal_consistency_score = std::max(0.0, 100.0 * (1.0 - stats.temporal_variance / 0.5));
    stats.total_frames = static_cast<int>(frames_.size());
    stats.anomaly_ratio = static_cast<double>(stats.anomaly_count) / stats.total_frames;
    return stats;
}

json FrameProbabilityTimeline::toChartJson() const {
    if (frames_.empty()) {
        return json{{"labels", json::array()}, {"datasets", json::array()}};
    }

    json labels = json::array();
    json timestamps = json::array();
    json fake = json::array();
    json real = json::array();
    json anomalies = json::array();
    for (const auto& f : frames_) {
        labels.push_back("Frame " + std::to_string(f.frame_index));
        timestamps.push_back(f.timestamp_ms / 1000.0);
        fake.push_back(f.fake_probability * 100.0);
        real.push_back(f.real_probability * 100.0);
        if (f.is_anomaly) {
            anomalies.push_back({{"x", f.frame_index}, {"y", f.fake_probability * 100.0}});
        }
    }

    json smoothed = json::array();
    for (double p : smoothedProbabilities()) {
        smoothed.push_back(p * 100.0);
    }

    json datasets = json::array();
    datasets.push_back({
        {"label", "Fake Probability (%)"},
        {"data", fake},
        {"borderColor", "rgb(255, 99, 132)"},
        {"backgroundColor", "rgba(255, 99, 132, 0.2)"},
        {"fill", true},
        {"tension", 0.1}
    });
    datasets.push_back({
        {"label", "Real Probability (%)"},
        {"data", real},
        {"borderColor", "rgb(75, 192, 192)"},
        {"backgroundColor", "rgba(75, 192, 192, 0.2)"},
        {"fill", true},
        {"tension", 0.1}
    });
    datasets.push_back({
        {"label", "Smoothed Fake Probability (%)"},
        {"data", smoothed},
        {"borderColor", "rgb(255, 159, 64)"},
        {"borderDash", {5, 5}},
        {"fill", false},
        {"tension", 0.3}
    });

    return json{
        {"labels", labels},
        {"timestamps", timestamps},
        {"datasets", datasets},
        {"anomalies", anomalies},
        {"statistics", stats().toJson()}
    };
}

json FrameProbabilityTimeline::toJson() const {
    json frames = json::array();
    for (const auto& f : frames_) {
        frames.push_back(f.toJson());
    }
    return json{
        {"frames", frames},
        {"chartjs_data", toChartJson()},
        {"metadata", {
            {"fps", fps_},
            {"total_frames", frames_.size()},
            {"duration_seconds", fps_ > 0.0 ? frames_.size() / fps_ : 0.0},
            {"generated_at", isoTimestamp()}
        }}
    };
}

FrameProbabilityTimeline extractFrameProbabilities(FrameClassifier& classifier,
                                                   const std::vector<cv::Mat>& frames,
                                                   const TimelineConfig& config) {
    FrameProbabilityTimeline timeline(config);
    std::lock_guard<std::recursive_mutex> lock(classifier.inferenceMutex());
    for (size_t i = 0; i < frames.size(); ++i) {
        ActivationMap activations = classifier.extractFeatures(i, frames[i]);
        timeline.addFrame(static_cast<int>(i), classifier.frameLogits(activations));
    }
    std::cout << "Timeline: " << timeline.frames().size() << " frame probabilities extracted" << std::endl;
    return timeline;
}

} // namespace fakeprobe
