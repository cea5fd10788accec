#include "pipeline/analysis_pipeline.hpp"
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fakeprobe {

namespace {

std::string currentTimestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

json unavailableJson(const std::string& reason) {
    return json{{"available", false}, {"reason", reason}};
}

} // namespace

std::string videoBaseName(const std::string& location) {
    std::string path = location;
    size_t query = path.find_first_of("?#");
    if (query != std::string::npos) {
        path = path.substr(0, query);
    }
    std::string stem = std::filesystem::path(path).stem().string();
    for (char& c : stem) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            c = '_';
        }
    }
    return stem.empty() ? "video" : stem;
}

json AnalysisResult::toJson() const {
    json j;
    j["success"] = success;
    if (!error.empty()) {
        j["error"] = error;
    }
    j["prediction"] = prediction.toJson();
    j["prediction_label"] = prediction.label;
    j["prediction_confidence"] = prediction.confidence;
    j["video_info"] = video_info.toJson();

    if (gradcam) {
        json summary = GradCamExplainer::summarize(gradcam.value());
        j["gradcam_images"] = summary["image_paths"];
        j["gradcam_summary"] = summary;
    } else {
        j["gradcam_images"] = json::array();
        j["gradcam_summary"] = unavailableJson(gradcam.reason());
    }

    if (timeline) {
        j["timeline_data"] = timeline.value().toChartJson();
        j["timeline_stats"] = timeline.value().stats().toJson();
    } else {
        j["timeline_data"] = json{{"labels", json::array()}, {"datasets", json::array()}};
        j["timeline_stats"] = unavailableJson(timeline.reason());
    }

    j["forensics_metrics"] = forensics ? forensics.value().toJson() : unavailableJson(forensics.reason());
    j["forensics_summary"] = forensics_summary;

    if (multimodal) {
        j["multimodal_analysis"] = multimodal.value().toJson();
        j["audio_video_score"] = multimodal.value().combined_score;
    } else {
        j["multimodal_analysis"] = unavailableJson(multimodal.reason());
        j["audio_video_score"] = 50.0;
    }

    if (fake_type) {
        const FakeTypeResult& ft = fake_type.value();
        j["fake_type"] = fakeTypeName(ft.primary_type);
        j["fake_type_confidence"] = ft.confidence;
        j["fake_type_explanation"] = ft.explanation;
        j["fake_type_details"] = ft.toJson();
    } else {
        j["fake_type"] = "unknown";
        j["fake_type_confidence"] = 0.0;
        j["fake_type_explanation"] = fake_type.reason();
        j["fake_type_details"] = unavailableJson(fake_type.reason());
    }

    if (threat) {
        const ThreatAssessment& ta = threat.value();
        j["threat_level"] = threatLevelName(ta.level);
        j["threat_score"] = ta.overall_score;
        j["threat_explanation"] = ta.explanation;
        j["threat_recommendations"] = ta.recommendations;
        j["threat_color"] = ta.color_code;
        j["threat_assessment"] = ta.toJson();
    } else {
        j["threat_level"] = threatLevelName(ThreatLevel::UNKNOWN);
        j["threat_score"] = 50.0;
        j["threat_explanation"] = threat.reason();
        j["threat_recommendations"] = json::array();
        j["threat_color"] = threatLevelColor(ThreatLevel::UNKNOWN);
        j["threat_assessment"] = unavailableJson(threat.reason());
    }

    j["analysis_timestamp"] = timestamp;
    j["analysis_duration_ms"] = duration_ms;
    return j;
}

AnalysisPipeline::AnalysisPipeline(const AnalysisConfig& config, std::shared_ptr<FaceDetector> detector,
                                   std::shared_ptr<FrameClassifier> classifier)
    : config_(config), detector_(std::move(detector)), classifier_(std::move(classifier)) {
    if (!detector_) {
        throw std::invalid_argument("AnalysisPipeline requires a face detector");
    }
}

AnalysisResult AnalysisPipeline::analyzeVideo(const std::string& video, const PipelineOptions& options,
                                              const ModelPrediction& supplied_prediction,
                                              const std::string& video_name) {
    Timer timer;
    AnalysisResult result;
    result.timestamp = currentTimestamp();

    VideoSource source(video, config_.forensics.default_fps, options.max_download_bytes);
    try {
        source.open();
    } catch (const VideoOpenError& e) {
        std::cerr << "Pipeline: " << e.what() << std::endl;
        result.error = e.what();
        result.prediction = supplied_prediction;
        result.duration_ms = timer.elapsed_ms();
        return result;
    }

    result.video_info = source.info();
    std::vector<cv::Mat> frames = source.readFrames(options.max_frames);
    std::cout << "Pipeline: " << video << " (" << frames.size() << " frames at "
              << result.video_info.fps << " fps)" << std::endl;

    std::string name = video_name.empty() ? videoBaseName(video) : video_name;
    runStages(result, frames, result.video_info.fps, source.localPath(), options, supplied_prediction, name);
    result.duration_ms = timer.elapsed_ms();
    return result;
}

AnalysisResult AnalysisPipeline::analyzeFrames(const std::vector<cv::Mat>& frames, double fps,
                                               const std::string& audio_path, const PipelineOptions& options,
                                               const ModelPrediction& supplied_prediction,
                                               const std::string& video_name) {
    Timer timer;
    AnalysisResult result;
    result.timestamp = currentTimestamp();

    std::vector<cv::Mat> limited = frames;
    if (options.max_frames > 0 && static_cast<int>(limited.size()) > options.max_frames) {
        limited.resize(options.max_frames);
    }

    result.video_info.fps = fps > 0.0 ? fps : config_.forensics.default_fps;
    result.video_info.frame_count = static_cast<int>(frames.size());
    if (!frames.empty()) {
        result.video_info.width = frames.front().cols;
        result.video_info.height = frames.front().rows;
    }
    result.video_info.duration_seconds = frames.size() / result.video_info.fps;

    runStages(result, limited, result.video_info.fps, audio_path, options, supplied_prediction, video_name);
    result.duration_ms = timer.elapsed_ms();
    return result;
}

void AnalysisPipeline::runStages(AnalysisResult& result, const std::vector<cv::Mat>& frames, double fps,
                                 const std::string& audio_path, const PipelineOptions& options,
                                 const ModelPrediction& supplied_prediction, const std::string& video_name) {
    result.success = true;

    // Frames seen by the model: Grad-CAM, the timeline and the model verdict.
    std::vector<cv::Mat> model_frames = frames;
    if (config_.gradcam.max_frames > 0 && static_cast<int>(model_frames.size()) > config_.gradcam.max_frames) {
        model_frames.resize(config_.gradcam.max_frames);
    }
    const bool model_ready = hasClassifier() && !model_frames.empty();

    result.prediction = supplied_prediction;
    if (!result.prediction.isKnown() && model_ready) {
        try {
            result.prediction = classifier_->predict(model_frames);
            std::cout << "Pipeline: model predicts " << result.prediction.label << " ("
                      << result.prediction.confidence << "%)" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Pipeline: prediction failed: " << e.what() << std::endl;
        }
    }

    if (!options.enable_gradcam) {
        result.gradcam = SignalResult<std::vector<Heatmap>>::unavailable("disabled");
    } else if (!model_ready) {
        result.gradcam = SignalResult<std::vector<Heatmap>>::unavailable("classifier not loaded");
    } else {
        try {
            GradCamExplainer explainer(classifier_, config_.gradcam);
            std::string gradcam_dir = (std::filesystem::path(options.output_dir) / "gradcam").string();
            result.gradcam = SignalResult<std::vector<Heatmap>>::ok(
                explainer.explainSequence(model_frames, gradcam_dir, video_name));
        } catch (const std::exception& e) {
            std::cerr << "Pipeline: Grad-CAM failed: " << e.what() << std::endl;
            result.gradcam = SignalResult<std::vector<Heatmap>>::unavailable(e.what());
        }
    }

    if (!options.enable_timeline) {
        result.timeline = SignalResult<FrameProbabilityTimeline>::unavailable("disabled");
    } else if (!model_ready) {
        result.timeline = SignalResult<FrameProbabilityTimeline>::unavailable("classifier not loaded");
    } else {
        try {
            TimelineConfig timeline_config = config_.timeline;
            timeline_config.fps = fps;
            result.timeline = SignalResult<FrameProbabilityTimeline>::ok(
                extractFrameProbabilities(*classifier_, model_frames, timeline_config));
        } catch (const std::exception& e) {
            std::cerr << "Pipeline: timeline failed: " << e.what() << std::endl;
            result.timeline = SignalResult<FrameProbabilityTimeline>::unavailable(e.what());
        }
    }

    if (!options.enable_forensics) {
        result.forensics = SignalResult<ForensicsMetrics>::unavailable("disabled");
    } else if (frames.empty()) {
        result.forensics = SignalResult<ForensicsMetrics>::unavailable("no frames decoded");
    } else {
        try {
            ForensicsAnalyzer analyzer(detector_, config_.forensics);
            analyzer.setFps(fps);
            ForensicsMetrics metrics = analyzer.analyzeFrames(frames);
            result.forensics_summary = ForensicsAnalyzer::summarize(metrics);
            result.forensics = SignalResult<ForensicsMetrics>::ok(metrics);
        } catch (const std::exception& e) {
            std::cerr << "Pipeline: forensics failed: " << e.what() << std::endl;
            result.forensics = SignalResult<ForensicsMetrics>::unavailable(e.what());
            result.forensics_summary = std::string("Forensics analysis failed: ") + e.what();
        }
    }

    if (!options.enable_multimodal) {
        result.multimodal = SignalResult<MultiModalAnalysis>::unavailable("disabled");
    } else if (audio_path.empty()) {
        result.multimodal = SignalResult<MultiModalAnalysis>::unavailable("no audio source");
    } else {
        try {
            AudioVideoAnalyzer analyzer(detector_, config_.audio, config_.lip_sync);
            result.multimodal = SignalResult<MultiModalAnalysis>::ok(analyzer.analyze(audio_path, frames, fps));
        } catch (const std::exception& e) {
            std::cerr << "Pipeline: multimodal analysis failed: " << e.what() << std::endl;
            result.multimodal = SignalResult<MultiModalAnalysis>::unavailable(e.what());
        }
    }

    TimelineStats timeline_stats;
    const TimelineStats* timeline_input = nullptr;
    if (result.timeline) {
        timeline_stats = result.timeline.value().stats();
        timeline_input = &timeline_stats;
    }

    if (!options.enable_fake_type) {
        result.fake_type = SignalResult<FakeTypeResult>::unavailable("disabled");
    } else {
        try {
            FakeTypeClassifier classifier(config_.fake_type);
            result.fake_type = SignalResult<FakeTypeResult>::ok(classifier.classify(
                result.prediction, result.forensics.get(), result.multimodal.get(), timeline_input));
        } catch (const std::exception& e) {
            std::cerr << "Pipeline: fake type classification failed: " << e.what() << std::endl;
            result.fake_type = SignalResult<FakeTypeResult>::unavailable(e.what());
        }
    }

    if (!options.enable_threat) {
        result.threat = SignalResult<ThreatAssessment>::unavailable("disabled");
    } else {
        try {
            ThreatLevelScorer scorer(config_.threat);
            result.threat = SignalResult<ThreatAssessment>::ok(scorer.assess(
                result.prediction, result.forensics.get(), result.multimodal.get(), timeline_input,
                result.fake_type.get()));
            std::cout << "Pipeline: threat level " << threatLevelName(result.threat.value().level)
                      << " (" << result.threat.value().overall_score << ")" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Pipeline: threat assessment failed: " << e.what() << std::endl;
            result.threat = SignalResult<ThreatAssessment>::unavailable(e.what());
        }
    }
}

} // namespace fakeprobe
