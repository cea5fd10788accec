#include "multimodal/audio_video_analyzer.hpp"
#include "score_utils.hpp"
#include "video_source.hpp"
#include <iostream>

namespace fakeprobe {

json MultiModalAnalysis::toJson() const {
    json j = {
        {"audio_spoof_score", audio_spoof_score},
        {"lip_sync_score", lip_sync_score},
        {"combined_score", combined_score},
        {"confidence", confidence},
        {"audio_features", audio_features.toJson()},
        {"analysis_details", {
            {"audio_valid", audio_features.is_valid},
            {"audio_duration", audio_features.duration_seconds},
            {"pitch_analysis", {
                {"mean", audio_features.pitch_mean},
                {"std", audio_features.pitch_std},
                {"score", audio_features.pitch_variance_score}
            }},
            {"jitter_analysis", {
                {"value", audio_features.jitter_mean},
                {"score", audio_features.jitter_score}
            }},
            {"lip_sync", {
                {"correlation", has_lip_sync ? lip_sync_features.correlation : 0.0},
                {"lag_frames", has_lip_sync ? lip_sync_features.lag_frames : 0},
                {"mismatch_count", has_lip_sync ? lip_sync_features.mismatch_regions.size() : 0}
            }}
        }}
    };
    j["lip_sync_features"] = has_lip_sync ? lip_sync_features.toJson() : json(nullptr);
    return j;
}

AudioVideoAnalyzer::AudioVideoAnalyzer(std::shared_ptr<FaceDetector> detector, const AudioConfig& audio_config,
                                       const LipSyncConfig& lip_sync_config)
    : audio_analyzer_(audio_config),
      lip_sync_analyzer_(std::move(detector), lip_sync_config),
      lip_sync_config_(lip_sync_config) {}

MultiModalAnalysis AudioVideoAnalyzer::combine(const AudioFeatures& audio, const LipSyncFeatures* lip_sync) const {
    MultiModalAnalysis analysis;
    analysis.audio_features = audio;

    analysis.audio_spoof_score = audio.is_valid
        ? audio.pitch_variance_score * 0.5 + audio.jitter_score * 0.5
        : 50.0;

    if (lip_sync != nullptr) {
        analysis.has_lip_sync = true;
        analysis.lip_sync_features = *lip_sync;
        analysis.lip_sync_score = lip_sync->sync_score;
    }

    analysis.combined_score = clipScore((100.0 - analysis.audio_spoof_score) * SPOOF_WEIGHT +
                                        analysis.lip_sync_score * SYNC_WEIGHT);

    double confidence = audio.is_valid ? 80.0 : 30.0;
    if (lip_sync != nullptr &&
        static_cast<int>(lip_sync->mouth_movement_energy.size()) >= lip_sync_config_.min_motion_samples) {
        confidence += 20.0;
    }
    analysis.confidence = std::min(confidence, 100.0);
    return analysis;
}

MultiModalAnalysis AudioVideoAnalyzer::analyzeWithAudio(const AudioFeatures& audio,
                                                        const std::vector<cv::Mat>& frames, double fps) {
    if (!audio.is_valid || audio.energy_profile.empty()) {
        return combine(audio, nullptr);
    }
    LipSyncFeatures lip_sync = lip_sync_analyzer_.analyze(frames, audio.energy_profile, fps);
    return combine(audio, &lip_sync);
}

MultiModalAnalysis AudioVideoAnalyzer::analyze(const std::string& video_path,
                                               const std::vector<cv::Mat>& frames, double fps) {
    AudioFeatures audio = audio_analyzer_.analyzeFile(video_path);
    if (!audio.is_valid) {
        std::cout << "Multimodal: audio unavailable (" << audio.error_message << ")" << std::endl;
        return combine(audio, nullptr);
    }

    if (!frames.empty()) {
        return analyzeWithAudio(audio, frames, fps);
    }

    VideoSource source(video_path, fps);
    source.open();
    std::vector<cv::Mat> video_frames = source.readFrames(lip_sync_config_.max_frames);
    return analyzeWithAudio(audio, video_frames, source.info().fps);
}

} // namespace fakeprobe
