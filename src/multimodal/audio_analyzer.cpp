#include "multimodal/audio_analyzer.hpp"
#include "score_utils.hpp"
#include <opencv2/core.hpp>
#include <cstring>
#include <iostream>

namespace fakeprobe {

json AudioFeatures::toJson() const {
    json j = {
        {"duration_seconds", duration_seconds},
        {"sample_rate", sample_rate},
        {"pitch_mean", pitch_mean},
        {"pitch_std", pitch_std},
        {"pitch_variance_score", pitch_variance_score},
        {"jitter_mean", jitter_mean},
        {"jitter_score", jitter_score},
        {"energy_profile", energy_profile},
        {"zero_crossing_rate", zero_crossing_rate},
        {"spectral_centroid_mean", spectral_centroid_mean},
        {"is_valid", is_valid}
    };
    if (!error_message.empty()) {
        j["error_message"] = error_message;
    }
    return j;
}

AudioAnalyzer::AudioAnalyzer(const AudioConfig& config) : config_(config), extractor_(config) {}

AudioFeatures AudioAnalyzer::analyzeFile(const std::string& video_path) const {
    ExtractionResult extraction = extractor_.extract(video_path);
    if (!extraction.ok) {
        return AudioFeatures::invalid(extraction.message.empty() ? "Failed to extract audio" : extraction.message);
    }
    if (extraction.audio.samples.empty()) {
        return AudioFeatures::invalid("Failed to load audio data");
    }
    return analyze(extraction.audio.samples, extraction.audio.sample_rate);
}

AudioFeatures AudioAnalyzer::analyze(const std::vector<double>& samples, int sample_rate) const {
    if (samples.empty() || sample_rate <= 0) {
        return AudioFeatures::invalid("Failed to load audio data");
    }

    AudioFeatures features;
    features.duration_seconds = static_cast<double>(samples.size()) / sample_rate;
    features.sample_rate = sample_rate;

    PitchStats pitch = computePitch(samples, sample_rate);
    features.pitch_mean = pitch.mean;
    features.pitch_std = pitch.std;
    features.pitch_variance_score = pitch.variance_score;

    JitterStats jitter = computeJitter(samples);
    features.jitter_mean = jitter.jitter;
    features.jitter_score = jitter.score;

    features.energy_profile = computeEnergyProfile(samples);
    features.zero_crossing_rate = zeroCrossingRate(samples);
    features.spectral_centroid_mean = computeSpectralCentroid(samples, sample_rate);
    features.is_valid = true;
    return features;
}

std::vector<double> AudioAnalyzer::autocorrelate(const double* frame, int size) {
    const int padded = cv::getOptimalDFTSize(2 * size - 1);
    cv::Mat buffer = cv::Mat::zeros(1, padded, CV_64F);
    std::memcpy(buffer.ptr<double>(0), frame, sizeof(double) * size);

    cv::Mat spectrum, power, corr;
    cv::dft(buffer, spectrum, cv::DFT_COMPLEX_OUTPUT);
    cv::mulSpectrums(spectrum, spectrum, power, 0, true);
    cv::idft(power, corr, cv::DFT_REAL_OUTPUT | cv::DFT_SCALE);

    const double* values = corr.ptr<double>(0);
    return std::vector<double>(values, values + size);
}

PitchStats AudioAnalyzer::computePitch(const std::vector<double>& samples, int sample_rate) const {
    PitchStats stats{0.0, 0.0, 50.0, 0};
    const int frame_size = config_.pitch_frame_size;
    const int min_lag = static_cast<int>(sample_rate / config_.max_pitch_hz);
    const int max_lag = static_cast<int>(sample_rate / config_.min_pitch_hz);

    std::vector<double> pitches;
    if (max_lag <= frame_size && min_lag < max_lag) {
        for (size_t i = 0; i + frame_size < samples.size(); i += config_.pitch_hop_size) {
            std::vector<double> corr = autocorrelate(samples.data() + i, frame_size);

            int peak = min_lag;
            for (int lag = min_lag + 1; lag < max_lag; ++lag) {
                if (corr[lag] > corr[peak]) {
                    peak = lag;
                }
            }

            if (peak > 0 && corr[peak] > config_.voicing_threshold * corr[0]) {
                double pitch = static_cast<double>(sample_rate) / peak;
                if (pitch > config_.min_pitch_hz && pitch < config_.max_pitch_hz) {
                    pitches.push_back(pitch);
                }
            }
        }
    }

    if (pitches.empty()) {
        return stats;
    }

    stats.mean = meanOf(pitches);
    stats.std = stdOf(pitches);
    stats.voiced_frames = static_cast<int>(pitches.size());

    double cv = stats.std / (stats.mean + 1e-6);
    double score;
    if (cv < 0.05) {
        score = 70.0 + (0.05 - cv) * 600.0;
    } else if (cv > 0.3) {
        score = 50.0 + (cv - 0.3) * 100.0;
    } else {
        score = cv * 100.0;
    }
    stats.variance_score = clipScore(score);
    return stats;
}

std::vector<double> AudioAnalyzer::zeroCrossings(const std::vector<double>& samples) {
    std::vector<double> crossings;
    for (size_t i = 0; i + 1 < samples.size(); ++i) {
        bool a = std::signbit(samples[i]);
        bool b = std::signbit(samples[i + 1]);
        if (a == b) {
            continue;
        }
        double denom = samples[i] - samples[i + 1];
        double frac = denom != 0.0 ? samples[i] / denom : 0.0;
        crossings.push_back(static_cast<double>(i) + std::max(0.0, std::min(1.0, frac)));
    }
    return crossings;
}

JitterStats AudioAnalyzer::computeJitter(const std::vector<double>& samples) const {
    JitterStats stats{0.0, 50.0, 0};

    std::vector<double> crossings = zeroCrossings(samples);
    if (crossings.size() < 4) {
        return stats;
    }

    // Every second crossing closes one period.
    std::vector<double> periods;
    for (size_t i = 0; i + 2 < crossings.size(); i += 2) {
        double period = crossings[i + 2] - crossings[i];
        if (period > config_.min_period_samples && period < config_.max_period_samples) {
            periods.push_back(period);
        }
    }
    stats.periods = static_cast<int>(periods.size());
    if (periods.size() < 3) {
        return stats;
    }

    std::vector<double> diffs;
    for (size_t i = 1; i < periods.size(); ++i) {
        diffs.push_back(std::abs(periods[i] - periods[i - 1]));
    }
    stats.jitter = meanOf(diffs) / (meanOf(periods) + 1e-6);

    double score;
    if (stats.jitter < config_.perfect_jitter) {
        score = 80.0;
    } else if (stats.jitter > config_.erratic_jitter) {
        score = std::min(100.0, 50.0 + stats.jitter * 1000.0);
    } else {
        score = stats.jitter * 2500.0;
    }
    stats.score = clipScore(score);
    return stats;
}

std::vector<double> AudioAnalyzer::computeEnergyProfile(const std::vector<double>& samples) const {
    std::vector<double> energy;
    if (config_.energy_segments <= 0) {
        return energy;
    }
    const size_t segment = samples.size() / config_.energy_segments;
    if (segment == 0) {
        return energy;
    }

    for (int s = 0; s < config_.energy_segments; ++s) {
        double acc = 0.0;
        for (size_t i = s * segment; i < (s + 1) * segment; ++i) {
            acc += samples[i] * samples[i];
        }
        energy.push_back(std::sqrt(acc / segment));
    }
    return energy;
}

double AudioAnalyzer::zeroCrossingRate(const std::vector<double>& samples) {
    if (samples.empty()) {
        return 0.0;
    }
    size_t count = 0;
    for (size_t i = 0; i + 1 < samples.size(); ++i) {
        if (std::signbit(samples[i]) != std::signbit(samples[i + 1])) {
            count++;
        }
    }
    return static_cast<double>(count) / samples.size();
}

double AudioAnalyzer::computeSpectralCentroid(const std::vector<double>& samples, int sample_rate) const {
    const int n = config_.centroid_frame_size;
    if (n < 2) {
        return 0.0;
    }

    cv::Mat window(1, n, CV_64F);
    for (int i = 0; i < n; ++i) {
        window.at<double>(0, i) = 0.5 - 0.5 * std::cos(2.0 * CV_PI * i / (n - 1));
    }

    std::vector<double> centroids;
    cv::Mat frame(1, n, CV_64F);
    for (size_t start = 0; start + n < samples.size(); start += config_.centroid_hop_size) {
        for (int i = 0; i < n; ++i) {
            frame.at<double>(0, i) = samples[start + i] * window.at<double>(0, i);
        }

        cv::Mat spectrum;
        cv::dft(frame, spectrum, cv::DFT_COMPLEX_OUTPUT);

        double weighted = 0.0;
        double total = 0.0;
        for (int k = 0; k <= n / 2; ++k) {
            const cv::Vec2d& bin = spectrum.at<cv::Vec2d>(0, k);
            double mag = std::sqrt(bin[0] * bin[0] + bin[1] * bin[1]);
            weighted += mag * (static_cast<double>(k) * sample_rate / n);
            total += mag;
        }
        if (total > 0.0) {
            centroids.push_back(weighted / total);
        }
    }
    return meanOf(centroids);
}

} // namespace fakeprobe
