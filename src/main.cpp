#include "config/analysis_config.hpp"
#include "web_server.hpp"
#include <curl/curl.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>

// Global server instance for signal handling
std::unique_ptr<fakeprobe::WebServer> global_server;

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ". Shutting down gracefully..." << std::endl;
    if (global_server) {
        global_server->stop();
    }
}

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  --port PORT          Server port (default: 8080)\n"
              << "  --config FILE        JSON configuration file\n"
              << "  --model-dir PATH     Directory with the deepfake classifier (default: ./models)\n"
              << "  --output-dir PATH    Directory for Grad-CAM images (default: ./output)\n"
              << "  --max-frames N       Frames analyzed per video (default: 100)\n"
              << "  --upload-root PATH   Directory that local video paths must live in\n"
              << "  --help               Show this help message\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    int port = 8080;
    std::string config_path;
    std::string model_dir = "./models";
    std::string output_dir;
    int max_frames = -1;
    std::string upload_root;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                port = std::stoi(argv[++i]);
                if (port < 1 || port > 65535) {
                    std::cerr << "Error: Port must be between 1 and 65535" << std::endl;
                    return 1;
                }
            } catch (const std::exception& e) {
                std::cerr << "Error: Invalid port number" << std::endl;
                return 1;
            }
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--model-dir" && i + 1 < argc) {
            model_dir = argv[++i];
        } else if (arg == "--output-dir" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--upload-root" && i + 1 < argc) {
            upload_root = argv[++i];
        } else if (arg == "--max-frames" && i + 1 < argc) {
            try {
                max_frames = std::stoi(argv[++i]);
            } catch (const std::exception& e) {
                std::cerr << "Error: Invalid frame count" << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown argument " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    fakeprobe::AnalysisConfig config;
    try {
        if (!config_path.empty()) {
            config = fakeprobe::AnalysisConfig::fromFile(config_path);
        }
        config.applyEnvironment();
    } catch (const fakeprobe::ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (!output_dir.empty()) {
        config.pipeline.output_dir = output_dir;
    }
    if (max_frames > 0) {
        config.pipeline.max_frames = max_frames;
    }
    if (!upload_root.empty()) {
        config.server.upload_root = upload_root;
    }
    if (config.pipeline.max_frames > config.server.max_frames_cap) {
        std::cerr << "Warning: max frames " << config.pipeline.max_frames << " exceeds the server cap of "
                  << config.server.max_frames_cap << std::endl;
    }

    if (!std::filesystem::exists(model_dir)) {
        std::cerr << "Warning: Model directory does not exist: " << model_dir << std::endl;
        std::cerr << "Requests to /analyze must then include a prediction." << std::endl;
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int exit_code = 0;

    try {
        std::cout << "=== fakeprobe Deepfake Analysis Service ===" << std::endl;
        std::cout << "Port: " << port << std::endl;
        std::cout << "Model directory: " << model_dir << std::endl;
        std::cout << "Output directory: " << config.pipeline.output_dir << std::endl;
        std::cout << "Upload root: " << (config.server.upload_root.empty() ? "(local paths disabled)"
                                                                          : config.server.upload_root)
                  << std::endl;
        std::cout << "===========================================" << std::endl;

        global_server = std::make_unique<fakeprobe::WebServer>(config);

        if (!global_server->initialize(model_dir)) {
            std::cerr << "Failed to initialize server" << std::endl;
            exit_code = 1;
        } else {
            std::cout << "\nServer ready! Available endpoints:" << std::endl;
            std::cout << "  GET  /health              - Health check" << std::endl;
            std::cout << "  POST /analyze             - Full deepfake analysis of a video" << std::endl;
            std::cout << "  POST /threat-assessment   - Threat level from supplied metrics" << std::endl;
            std::cout << "\nPress Ctrl+C to stop the server." << std::endl;

            // Start server (blocking call)
            global_server->start(port);
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    global_server.reset();
    curl_global_cleanup();
    return exit_code;
}
