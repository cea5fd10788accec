#include <iostream>
#include <string>
#include <curl/curl.h>
#include "src/config/analysis_config.hpp"
#include "src/face_detector.hpp"
#include "src/model/dnn_frame_classifier.hpp"
#include "src/pipeline/analysis_pipeline.hpp"
#include "src/pipeline/request_parsing.hpp"

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <video> [OPTIONS]\n"
              << "Options:\n"
              << "  --prediction LABEL:CONF   Use this verdict instead of the classifier (e.g. FAKE:95)\n"
              << "  --config FILE             JSON configuration file\n"
              << "  --model-dir PATH          Directory with the deepfake classifier (default: ./models)\n"
              << "  --output-dir PATH         Directory for Grad-CAM images\n"
              << "  --max-frames N            Frames to analyze (default: 100)\n"
              << "  --no-gradcam              Skip Grad-CAM heatmaps\n"
              << "  --no-multimodal           Skip audio and lip-sync analysis\n"
              << "  --help                    Show this help message\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::string video;
    std::string prediction_text;
    std::string config_path;
    std::string model_dir = "./models";
    std::string output_dir;
    int max_frames = -1;
    bool gradcam = true;
    bool multimodal = true;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--prediction" && i + 1 < argc) {
            prediction_text = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--model-dir" && i + 1 < argc) {
            model_dir = argv[++i];
        } else if (arg == "--output-dir" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--max-frames" && i + 1 < argc) {
            try {
                max_frames = std::stoi(argv[++i]);
            } catch (const std::exception& e) {
                std::cerr << "Error: Invalid frame count" << std::endl;
                return 1;
            }
        } else if (arg == "--no-gradcam") {
            gradcam = false;
        } else if (arg == "--no-multimodal") {
            multimodal = false;
        } else if (!arg.empty() && arg[0] != '-' && video.empty()) {
            video = arg;
        } else {
            std::cerr << "Error: Unknown argument " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (video.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    fakeprobe::AnalysisConfig config;
    fakeprobe::ModelPrediction prediction;
    try {
        if (!config_path.empty()) {
            config = fakeprobe::AnalysisConfig::fromFile(config_path);
        }
        config.applyEnvironment();
        if (!prediction_text.empty()) {
            prediction = fakeprobe::predictionFromString(prediction_text);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    fakeprobe::PipelineOptions options = config.pipeline;
    if (!output_dir.empty()) {
        options.output_dir = output_dir;
    }
    if (max_frames > 0) {
        options.max_frames = max_frames;
    }
    options.enable_gradcam = options.enable_gradcam && gradcam;
    options.enable_multimodal = options.enable_multimodal && multimodal;

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int exit_code = 0;

    try {
        std::shared_ptr<fakeprobe::FrameClassifier> classifier;
        if (!prediction.isKnown() || options.enable_gradcam || options.enable_timeline) {
            classifier = fakeprobe::loadDnnClassifier(config.model, model_dir);
        }
        if (!prediction.isKnown() && !classifier) {
            std::cerr << "Error: no classifier available; pass --prediction LABEL:CONF" << std::endl;
            exit_code = 1;
        } else {
            fakeprobe::AnalysisPipeline pipeline(config, fakeprobe::createFaceDetector(config.forensics), classifier);
            fakeprobe::AnalysisResult result = pipeline.analyzeVideo(video, options, prediction);

            std::cout << result.toJson().dump(2) << std::endl;
            if (!result.success) {
                exit_code = 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    curl_global_cleanup();
    return exit_code;
}
