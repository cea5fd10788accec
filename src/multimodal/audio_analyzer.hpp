#ifndef FAKEPROBE_AUDIO_ANALYZER_HPP
#define FAKEPROBE_AUDIO_ANALYZER_HPP

#include "config/analysis_config.hpp"
#include "multimodal/audio_extractor.hpp"
#include "multimodal/wav_reader.hpp"
#include <string>
#include <vector>

namespace fakeprobe {

struct AudioFeatures {
    double duration_seconds;
    int sample_rate;
    double pitch_mean;
    double pitch_std;
    double pitch_variance_score;     // 0-100, higher = more suspicious
    double jitter_mean;
    double jitter_score;             // 0-100, higher = more suspicious
    std::vector<double> energy_profile;
    double zero_crossing_rate;
    double spectral_centroid_mean;
    bool is_valid;
    std::string error_message;

    AudioFeatures() : duration_seconds(0.0), sample_rate(0), pitch_mean(0.0), pitch_std(0.0),
                      pitch_variance_score(50.0), jitter_mean(0.0), jitter_score(50.0),
                      zero_crossing_rate(0.0), spectral_centroid_mean(0.0), is_valid(false) {}

    static AudioFeatures invalid(const std::string& message) {
        AudioFeatures features;
        features.error_message = message;
        return features;
    }

    json toJson() const;
};

struct PitchStats {
    double mean;
    double std;
    double variance_score;
    int voiced_frames;
};

struct JitterStats {
    double jitter;
    double score;
    int periods;
};

// Spoofing indicators computed from a mono waveform.
class AudioAnalyzer {
public:
    explicit AudioAnalyzer(const AudioConfig& config);

    // Extracts the audio track and analyzes it; never throws.
    AudioFeatures analyzeFile(const std::string& video_path) const;

    AudioFeatures analyze(const std::vector<double>& samples, int sample_rate) const;

    // Autocorrelation pitch per window; variance score penalizes both an
    // unnaturally flat and an erratic contour.
    PitchStats computePitch(const std::vector<double>& samples, int sample_rate) const;

    // Cycle-to-cycle period variation from interpolated zero crossings.
    JitterStats computeJitter(const std::vector<double>& samples) const;

    std::vector<double> computeEnergyProfile(const std::vector<double>& samples) const;
    double computeSpectralCentroid(const std::vector<double>& samples, int sample_rate) const;

    static double zeroCrossingRate(const std::vector<double>& samples);

    // Linear-interpolated positions where the waveform changes sign.
    static std::vector<double> zeroCrossings(const std::vector<double>& samples);

private:
    AudioConfig config_;
    AudioExtractor extractor_;

    // Non-negative lags of the linear autocorrelation, lag 0 first.
    static std::vector<double> autocorrelate(const double* frame, int size);
};

} // namespace fakeprobe

#endif // FAKEPROBE_AUDIO_ANALYZER_HPP
