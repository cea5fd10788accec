#include "multimodal/lip_sync_analyzer.hpp"
#include "score_utils.hpp"
#include <cmath>
#include <limits>

namespace fakeprobe {

json LipSyncFeatures::toJson() const {
    json regions = json::array();
    for (const auto& region : mismatch_regions) {
        regions.push_back({region.first, region.second});
    }
    return json{
        {"correlation", correlation},
        {"sync_score", sync_score},
        {"lag_frames", lag_frames},
        {"mismatch_regions", regions},
        {"mouth_samples", mouth_movement_energy.size()}
    };
}

LipSyncAnalyzer::LipSyncAnalyzer(std::shared_ptr<FaceDetector> detector, const LipSyncConfig& config)
    : detector_(std::move(detector)), config_(config) {}

cv::Mat LipSyncAnalyzer::extractMouthRegion(const cv::Mat& frame) {
    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = frame;
    }

    cv::Rect face;
    if (!FaceDetector::largestFace(detector_->detectFaces(gray), face)) {
        return cv::Mat();
    }

    cv::Rect mouth(face.x + static_cast<int>(face.width * 0.2),
                   face.y + static_cast<int>(face.height * 0.6),
                   static_cast<int>(face.width * 0.6),
                   static_cast<int>(face.height * 0.3));
    mouth &= cv::Rect(0, 0, gray.cols, gray.rows);
    if (mouth.area() <= 0) {
        return cv::Mat();
    }
    return gray(mouth);
}

std::vector<double> LipSyncAnalyzer::computeMouthMovement(const std::vector<cv::Mat>& frames) {
    std::vector<double> movements;
    movements.reserve(frames.size());
    cv::Mat prev_mouth;

    for (const auto& frame : frames) {
        cv::Mat mouth = extractMouthRegion(frame);
        if (mouth.empty()) {
            movements.push_back(0.0);
            continue;
        }

        cv::Mat resized;
        cv::resize(mouth, resized, cv::Size(config_.mouth_width, config_.mouth_height));

        if (!prev_mouth.empty()) {
            cv::Mat diff;
            cv::absdiff(resized, prev_mouth, diff);
            movements.push_back(cv::mean(diff)[0]);
        } else {
            movements.push_back(0.0);
        }
        prev_mouth = resized;
    }
    return movements;
}

std::vector<double> LipSyncAnalyzer::resample(const std::vector<double>& signal, size_t length) {
    std::vector<double> out;
    if (signal.empty() || length == 0) {
        return out;
    }
    out.resize(length);
    if (signal.size() == 1) {
        std::fill(out.begin(), out.end(), signal[0]);
        return out;
    }

    const double last = static_cast<double>(signal.size() - 1);
    for (size_t i = 0; i < length; ++i) {
        double pos = length == 1 ? 0.0 : last * static_cast<double>(i) / (length - 1);
        size_t lo = static_cast<size_t>(pos);
        if (lo >= signal.size() - 1) {
            out[i] = signal.back();
            continue;
        }
        double frac = pos - lo;
        out[i] = signal[lo] * (1.0 - frac) + signal[lo + 1] * frac;
    }
    return out;
}

std::vector<double> LipSyncAnalyzer::zNormalize(const std::vector<double>& signal) {
    double m = meanOf(signal);
    double s = stdOf(signal) + 1e-6;
    std::vector<double> out(signal.size());
    for (size_t i = 0; i < signal.size(); ++i) {
        out[i] = (signal[i] - m) / s;
    }
    return out;
}

LipSyncFeatures LipSyncAnalyzer::correlate(const std::vector<double>& mouth_energy,
                                           const std::vector<double>& audio_energy, double fps) const {
    LipSyncFeatures features;
    features.mouth_movement_energy = mouth_energy;
    features.audio_energy = audio_energy;
    if (!(fps > 0.0)) {
        fps = 30.0;
    }

    double max_corr = 0.0;
    int lag = 0;

    if (!mouth_energy.empty() && !audio_energy.empty()) {
        const size_t n = std::min(mouth_energy.size(), audio_energy.size());
        std::vector<double> audio = zNormalize(resample(audio_energy, n));
        std::vector<double> mouth = zNormalize(resample(mouth_energy, n));

        // Full cross-correlation; index k corresponds to lag k - (n - 1).
        const long count = static_cast<long>(n);
        double best = -std::numeric_limits<double>::infinity();
        long best_index = 0;
        for (long k = 0; k < 2 * count - 1; ++k) {
            long shift = k - (count - 1);
            double acc = 0.0;
            for (long i = 0; i < count; ++i) {
                long j = i - shift;
                if (j >= 0 && j < count) {
                    acc += audio[i] * mouth[j];
                }
            }
            if (acc > best) {
                best = acc;
                best_index = k;
            }
        }
        lag = static_cast<int>(best_index - (count - 1));
        max_corr = best / static_cast<double>(count);

        const size_t window = std::max<size_t>(1, n / static_cast<size_t>(std::max(1, config_.window_count)));
        const size_t step = std::max<size_t>(1, window / 2);
        for (size_t i = 0; i + window < n; i += step) {
            double local = pearson(audio.data() + i, mouth.data() + i, window);
            if (std::isnan(local) || local < config_.mismatch_threshold) {
                features.mismatch_regions.emplace_back(i / fps, (i + window) / fps);
            }
        }
    }

    double lag_penalty = 0.0;
    if (std::abs(lag) > fps * config_.lag_tolerance_seconds) {
        lag_penalty = std::min(config_.max_lag_penalty, std::abs(lag) / fps * 50.0);
    }

    features.correlation = max_corr;
    features.lag_frames = lag;
    features.sync_score = clipScore(std::max(0.0, max_corr * 100.0 - lag_penalty));
    return features;
}

LipSyncFeatures LipSyncAnalyzer::analyze(const std::vector<cv::Mat>& frames,
                                         const std::vector<double>& audio_energy, double fps) {
    if (frames.empty()) {
        LipSyncFeatures features;
        features.audio_energy = audio_energy;
        return features;
    }

    size_t limit = std::min(frames.size(), static_cast<size_t>(std::max(0, config_.max_frames)));
    std::vector<cv::Mat> window(frames.begin(), frames.begin() + limit);
    return correlate(computeMouthMovement(window), audio_energy, fps);
}

} // namespace fakeprobe
