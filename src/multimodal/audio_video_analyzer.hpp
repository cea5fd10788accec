#ifndef FAKEPROBE_AUDIO_VIDEO_ANALYZER_HPP
#define FAKEPROBE_AUDIO_VIDEO_ANALYZER_HPP

#include "config/analysis_config.hpp"
#include "face_detector.hpp"
#include "multimodal/audio_analyzer.hpp"
#include "multimodal/lip_sync_analyzer.hpp"
#include <opencv2/opencv.hpp>
#include <memory>
#include <string>
#include <vector>

namespace fakeprobe {

struct MultiModalAnalysis {
    AudioFeatures audio_features;
    bool has_lip_sync;
    LipSyncFeatures lip_sync_features;
    double audio_spoof_score;       // higher = more suspicious
    double lip_sync_score;          // higher = better sync
    double combined_score;          // higher = more authentic
    double confidence;

    MultiModalAnalysis() : has_lip_sync(false), audio_spoof_score(50.0), lip_sync_score(50.0),
                           combined_score(50.0), confidence(30.0) {}

    json toJson() const;
};

// Audio spoofing indicators plus lip-audio synchronisation, fused into one
// authenticity score.
class AudioVideoAnalyzer {
public:
    AudioVideoAnalyzer(std::shared_ptr<FaceDetector> detector, const AudioConfig& audio_config,
                       const LipSyncConfig& lip_sync_config);

    // Extracts and analyzes the audio of video_path. frames feed the
    // lip-sync check; when empty they are read from the video. Never throws
    // on missing or undecodable audio.
    MultiModalAnalysis analyze(const std::string& video_path, const std::vector<cv::Mat>& frames, double fps);

    // Fusion step given already-computed audio features.
    MultiModalAnalysis analyzeWithAudio(const AudioFeatures& audio, const std::vector<cv::Mat>& frames, double fps);

    // Combined score and confidence from the individual signals.
    MultiModalAnalysis combine(const AudioFeatures& audio, const LipSyncFeatures* lip_sync) const;

private:
    AudioAnalyzer audio_analyzer_;
    LipSyncAnalyzer lip_sync_analyzer_;
    LipSyncConfig lip_sync_config_;

    static constexpr double SPOOF_WEIGHT = 0.4;
    static constexpr double SYNC_WEIGHT = 0.6;
};

} // namespace fakeprobe

#endif // FAKEPROBE_AUDIO_VIDEO_ANALYZER_HPP
