#include "web_server.hpp"
#include "face_detector.hpp"
#include "model/dnn_frame_classifier.hpp"
#include <ctime>
#include <filesystem>
#include <iostream>

namespace fakeprobe {

WebServer::WebServer(const AnalysisConfig& config_param) : config(config_param), initialized(false) {}

bool WebServer::initialize(const std::string& models_path_param) {
    models_path = models_path_param;

    try {
        std::cout << "Initializing analyzers (models: " << models_path << ")" << std::endl;

        if (config.forensics.face_detector == "dlib" && config.forensics.shape_predictor_path.empty()) {
            std::string shape_predictor = (std::filesystem::path(models_path) /
                                           "shape_predictor_68_face_landmarks.dat").string();
            std::error_code ec;
            if (std::filesystem::exists(shape_predictor, ec)) {
                config.forensics.shape_predictor_path = shape_predictor;
            }
        }

        // Fail early when no detector can be built; requests build their own.
        createFaceDetector(config.forensics);

        classifier = loadDnnClassifier(config.model, models_path);
        if (!classifier) {
            std::cerr << "Warning: requests must supply a prediction; Grad-CAM and timeline are unavailable"
                      << std::endl;
        }

        CROW_ROUTE(app, "/health").methods("GET"_method)
        ([this](const crow::request& req) {
            return handleHealthCheck(req);
        });

        CROW_ROUTE(app, "/analyze").methods("POST"_method)
        ([this](const crow::request& req) {
            return handleAnalyze(req);
        });

        CROW_ROUTE(app, "/threat-assessment").methods("POST"_method)
        ([this](const crow::request& req) {
            return handleThreatAssessment(req);
        });

        initialized = true;
        std::cout << "Web server initialized successfully!" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error initializing web server: " << e.what() << std::endl;
        return false;
    }
}

void WebServer::start(int port) {
    if (!initialized) {
        std::cerr << "Server not initialized. Call initialize() first." << std::endl;
        return;
    }

    std::cout << "Starting server on port " << port << std::endl;
    app.port(port).multithreaded().run();
}

void WebServer::stop() {
    app.stop();
}

crow::response WebServer::handleHealthCheck(const crow::request& req) {
    (void)req;
    json health_data = {
        {"status", "healthy"},
        {"classifier_loaded", classifier != nullptr && classifier->isReady()},
        {"face_detector", config.forensics.face_detector},
        {"ffmpeg_binary", config.audio.ffmpeg_binary},
        {"max_frames_cap", config.server.max_frames_cap},
        {"local_videos_enabled", !config.server.upload_root.empty()},
        {"remote_videos_enabled", config.server.allow_remote_urls},
        {"version", "1.0.0"},
        {"timestamp", std::time(nullptr)}
    };
    return createResponse(200, createSuccessResponse(health_data));
}

crow::response WebServer::handleAnalyze(const crow::request& req) {
    Timer timer;

    try {
        json request_data = parseRequestBody(req.body);

        if (!validateAnalyzeRequest(request_data)) {
            return createResponse(400, createErrorResponse("Invalid request format. Required: video"));
        }

        std::string video = resolveVideoLocation(request_data["video"].get<std::string>(), config.server);

        ModelPrediction prediction;
        PipelineOptions options;
        std::string video_name;
        if (request_data.contains("prediction")) {
            prediction = predictionFromJson(request_data["prediction"]);
        }
        options = optionsFromRequest(request_data);
        if (request_data.contains("video_name") && request_data["video_name"].is_string()) {
            video_name = request_data["video_name"];
        }

        if (!prediction.isKnown() && !classifier) {
            return createResponse(400, createErrorResponse(
                "No classifier loaded. Supply prediction: {prediction_label, confidence}"));
        }

        // Per-request detector and analyzers; only the classifier is shared.
        AnalysisPipeline pipeline(config, createFaceDetector(config.forensics), classifier);
        AnalysisResult result = pipeline.analyzeVideo(video, options, prediction, video_name);

        if (!result.success) {
            json error_response = createErrorResponse(result.error, 422);
            error_response["processing_time_ms"] = timer.elapsed_ms();
            return createResponse(422, error_response);
        }

        json response_data = result.toJson();
        response_data["processing_time_ms"] = timer.elapsed_ms();
        response_data["error"] = nullptr;
        return createResponse(200, createSuccessResponse(response_data));

    } catch (const std::invalid_argument& e) {
        json error_response = createErrorResponse(e.what());
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(400, error_response);
    } catch (const std::exception& e) {
        std::cerr << "Error analyzing video: " << e.what() << std::endl;
        json error_response = createErrorResponse("Internal server error", 500);
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(500, error_response);
    }
}

crow::response WebServer::handleThreatAssessment(const crow::request& req) {
    Timer timer;

    try {
        json request_data = parseRequestBody(req.body);

        if (!validateThreatRequest(request_data)) {
            return createResponse(400, createErrorResponse("Invalid request format. Required: prediction"));
        }

        ModelPrediction prediction;
        ForensicsMetrics forensics;
        MultiModalAnalysis multimodal;
        TimelineStats timeline;
        FakeTypeResult fake_type;
        bool has_forensics = request_data.contains("forensics_metrics");
        bool has_multimodal = request_data.contains("multimodal_metrics");
        bool has_timeline = request_data.contains("timeline_stats");
        bool has_fake_type = request_data.contains("fake_type");

        prediction = predictionFromJson(request_data["prediction"]);
        if (has_forensics) {
            forensics = forensicsFromJson(request_data["forensics_metrics"]);
        }
        if (has_multimodal) {
            multimodal = multimodalFromJson(request_data["multimodal_metrics"]);
        }
        if (has_timeline) {
            timeline = timelineStatsFromJson(request_data["timeline_stats"]);
        }
        if (has_fake_type) {
            fake_type = fakeTypeFromJson(request_data["fake_type"]);
        }

        const ForensicsMetrics* forensics_input = has_forensics ? &forensics : nullptr;
        const MultiModalAnalysis* multimodal_input = has_multimodal ? &multimodal : nullptr;
        const TimelineStats* timeline_input = has_timeline ? &timeline : nullptr;

        if (!has_fake_type) {
            FakeTypeClassifier fake_type_classifier(config.fake_type);
            fake_type = fake_type_classifier.classify(prediction, forensics_input, multimodal_input, timeline_input);
        }

        ThreatLevelScorer scorer(config.threat);
        ThreatAssessment assessment = scorer.assess(prediction, forensics_input, multimodal_input,
                                                    timeline_input, &fake_type);

        json response_data = {
            {"threat_assessment", assessment.toJson()},
            {"fake_type", has_fake_type
                ? json{{"type", fakeTypeName(fake_type.primary_type)}, {"confidence", fake_type.confidence}}
                : fake_type.toJson()},
            {"processing_time_ms", timer.elapsed_ms()},
            {"error", nullptr}
        };
        return createResponse(200, createSuccessResponse(response_data));

    } catch (const std::invalid_argument& e) {
        json error_response = createErrorResponse(e.what());
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(400, error_response);
    } catch (const std::exception& e) {
        std::cerr << "Error assessing threat: " << e.what() << std::endl;
        json error_response = createErrorResponse("Internal server error", 500);
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(500, error_response);
    }
}

json WebServer::parseRequestBody(const std::string& body) {
    try {
        return json::parse(body);
    } catch (const json::parse_error&) {
        throw std::invalid_argument("Invalid JSON in request body");
    }
}

PipelineOptions WebServer::optionsFromRequest(const json& request_data) const {
    PipelineOptions options = config.pipeline;
    if (request_data.contains("max_frames")) {
        if (!request_data["max_frames"].is_number_integer()) {
            throw std::invalid_argument("max_frames must be an integer");
        }
        options.max_frames = request_data["max_frames"].get<int>();
    }
    if (request_data.contains("enable")) {
        applyStageToggles(request_data["enable"], options);
    }
    options.max_frames = clampFrameRequest(options.max_frames, config.server.max_frames_cap);
    return options;
}

json WebServer::createErrorResponse(const std::string& error_message, int status_code) {
    return json{
        {"success", false},
        {"error", error_message},
        {"status_code", status_code}
    };
}

json WebServer::createSuccessResponse(const json& data) {
    json response = data;
    response["success"] = true;
    return response;
}

crow::response WebServer::createResponse(int status_code, const json& data) {
    crow::response res(status_code, data.dump());
    res.add_header("Access-Control-Allow-Origin", "*");
    res.add_header("Content-Type", "application/json");
    return res;
}

bool WebServer::validateAnalyzeRequest(const json& request_data) {
    return request_data.is_object() &&
           request_data.contains("video") &&
           request_data["video"].is_string() &&
           !request_data["video"].get<std::string>().empty();
}

bool WebServer::validateThreatRequest(const json& request_data) {
    return request_data.is_object() &&
           request_data.contains("prediction") &&
           request_data["prediction"].is_object();
}

} // namespace fakeprobe
