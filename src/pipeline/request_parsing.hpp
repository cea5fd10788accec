#ifndef FAKEPROBE_REQUEST_PARSING_HPP
#define FAKEPROBE_REQUEST_PARSING_HPP

#include "config/analysis_config.hpp"
#include "decision/fake_type_classifier.hpp"
#include "explain/frame_probability_timeline.hpp"
#include "forensics/forensics_analyzer.hpp"
#include "model/frame_classifier.hpp"
#include "multimodal/audio_video_analyzer.hpp"
#include "video_source.hpp"
#include <string>

namespace fakeprobe {

// Parsers for externally supplied analysis inputs (HTTP bodies and CLI
// flags). Missing fields keep neutral defaults; fields of the wrong type
// throw std::invalid_argument.

// {"prediction_label" | "label": "FAKE", "confidence": 95}
ModelPrediction predictionFromJson(const json& j);

// "FAKE:95", "real:80"
ModelPrediction predictionFromString(const std::string& text);

// Score fields as emitted by ForensicsMetrics::toJson.
ForensicsMetrics forensicsFromJson(const json& j);

// audio_spoof_score, lip_sync_score, combined_score, confidence, optional
// lip_sync_features.correlation and audio_features.is_valid.
MultiModalAnalysis multimodalFromJson(const json& j);

TimelineStats timelineStatsFromJson(const json& j);

// {"type": "gan_face_swap", "confidence": 80}
FakeTypeResult fakeTypeFromJson(const json& j);

// {"gradcam": false, "multimodal": true, ...} applied over options.
void applyStageToggles(const json& enable, PipelineOptions& options);

// Frame budget for one request: values <= 0 ("all frames") or above cap
// become cap.
int clampFrameRequest(int requested, int cap);

// Checks a client-supplied video against the server limits. URLs must be
// http(s) and allowed by the config; local paths must resolve (symlinks
// followed) inside server.upload_root. Returns the location to open, or
// throws std::invalid_argument.
std::string resolveVideoLocation(const std::string& video, const ServerConfig& server);

} // namespace fakeprobe

#endif // FAKEPROBE_REQUEST_PARSING_HPP
