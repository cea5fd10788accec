#ifndef FAKEPROBE_WEB_SERVER_HPP
#define FAKEPROBE_WEB_SERVER_HPP

#include "config/analysis_config.hpp"
#include "model/frame_classifier.hpp"
#include "pipeline/analysis_pipeline.hpp"
#include "pipeline/request_parsing.hpp"
#include <crow.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace fakeprobe {

using json = nlohmann::json;

class WebServer {
public:
    explicit WebServer(const AnalysisConfig& config);
    ~WebServer() = default;

    // Loads the classifier from models_path (optional) and checks that a
    // face detector can be built.
    bool initialize(const std::string& models_path);

    // Start server (blocking)
    void start(int port = 8080);

    void stop();

private:
    AnalysisConfig config;
    std::shared_ptr<FrameClassifier> classifier;

    crow::SimpleApp app;

    bool initialized;
    std::string models_path;

    // Endpoint handlers
    crow::response handleHealthCheck(const crow::request& req);
    crow::response handleAnalyze(const crow::request& req);
    crow::response handleThreatAssessment(const crow::request& req);

    // Helper methods
    json parseRequestBody(const std::string& body);
    PipelineOptions optionsFromRequest(const json& request_data) const;
    json createErrorResponse(const std::string& error_message, int status_code = 400);
    json createSuccessResponse(const json& data);
    crow::response createResponse(int status_code, const json& data);

    // Validation methods
    bool validateAnalyzeRequest(const json& request_data);
    bool validateThreatRequest(const json& request_data);

    // Timing utility
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
};

} // namespace fakeprobe

#endif // FAKEPROBE_WEB_SERVER_HPP
