#ifndef FAKEPROBE_ANALYSIS_PIPELINE_HPP
#define FAKEPROBE_ANALYSIS_PIPELINE_HPP

#include "config/analysis_config.hpp"
#include "decision/fake_type_classifier.hpp"
#include "decision/signal_result.hpp"
#include "decision/threat_level_scorer.hpp"
#include "explain/frame_probability_timeline.hpp"
#include "explain/gradcam_explainer.hpp"
#include "face_detector.hpp"
#include "forensics/forensics_analyzer.hpp"
#include "model/frame_classifier.hpp"
#include "multimodal/audio_video_analyzer.hpp"
#include "video_source.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fakeprobe {

struct AnalysisResult {
    bool success;
    std::string error;                  // set only when the video could not be opened

    ModelPrediction prediction;
    VideoInfo video_info;

    SignalResult<std::vector<Heatmap>> gradcam;
    SignalResult<FrameProbabilityTimeline> timeline;
    SignalResult<ForensicsMetrics> forensics;
    std::string forensics_summary;
    SignalResult<MultiModalAnalysis> multimodal;
    SignalResult<FakeTypeResult> fake_type;
    SignalResult<ThreatAssessment> threat;

    std::string timestamp;
    int64_t duration_ms;

    AnalysisResult() : success(false), duration_ms(0) {}

    json toJson() const;
};

// Runs every enabled stage over one video. A stage that fails or has no
// input is recorded as unavailable and the remaining stages still run.
// Analyzer state is created per call, so one pipeline may serve
// concurrent requests as long as the classifier is shared through its
// inference mutex.
class AnalysisPipeline {
public:
    // classifier may be null; the model-driven stages are then unavailable
    // and a caller-supplied prediction is required for the decision stages.
    AnalysisPipeline(const AnalysisConfig& config, std::shared_ptr<FaceDetector> detector,
                     std::shared_ptr<FrameClassifier> classifier);

    // supplied_prediction, when known, replaces the classifier's verdict.
    AnalysisResult analyzeVideo(const std::string& video, const PipelineOptions& options,
                                const ModelPrediction& supplied_prediction = ModelPrediction(),
                                const std::string& video_name = "");

    // Analysis of already decoded frames; audio_path may be empty, in which
    // case the multimodal stage is unavailable.
    AnalysisResult analyzeFrames(const std::vector<cv::Mat>& frames, double fps, const std::string& audio_path,
                                 const PipelineOptions& options,
                                 const ModelPrediction& supplied_prediction = ModelPrediction(),
                                 const std::string& video_name = "video");

    const AnalysisConfig& config() const { return config_; }
    bool hasClassifier() const { return classifier_ && classifier_->isReady(); }

private:
    class Timer {
    private:
        std::chrono::high_resolution_clock::time_point start_time;
    public:
        Timer() : start_time(std::chrono::high_resolution_clock::now()) {}

        int64_t elapsed_ms() const {
            auto end_time = std::chrono::high_resolution_clock::now();
            return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
        }
    };

    void runStages(AnalysisResult& result, const std::vector<cv::Mat>& frames, double fps,
                   const std::string& audio_path, const PipelineOptions& options,
                   const ModelPrediction& supplied_prediction, const std::string& video_name);

    AnalysisConfig config_;
    std::shared_ptr<FaceDetector> detector_;
    std::shared_ptr<FrameClassifier> classifier_;
};

// "my clip.mp4" -> "my_clip"; URLs use their last path segment.
std::string videoBaseName(const std::string& location);

} // namespace fakeprobe

#endif // FAKEPROBE_ANALYSIS_PIPELINE_HPP
