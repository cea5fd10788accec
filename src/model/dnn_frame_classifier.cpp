#include "model/dnn_frame_classifier.hpp"
#include <filesystem>
#include <opencv2/imgproc.hpp>
#include <iostream>
#include <stdexcept>

namespace fakeprobe {

DnnFrameClassifier::DnnFrameClassifier(const ModelConfig& config)
    : config_(config), has_temporal_(false), initialized_(false) {
    if (config_.input_size < 1) {
        throw std::invalid_argument("Classifier input size must be positive");
    }
    for (double stddev : config_.std) {
        if (!(stddev > 0.0)) {
            throw std::invalid_argument("Classifier normalization std must be positive");
        }
    }
}

bool DnnFrameClassifier::initialize() {
    try {
        if (config_.backbone_path.empty() || !std::filesystem::exists(config_.backbone_path)) {
            std::cerr << "Backbone model not found: " << config_.backbone_path << std::endl;
            return false;
        }
        if (config_.head_path.empty() || !std::filesystem::exists(config_.head_path)) {
            std::cerr << "Classifier head not found: " << config_.head_path << std::endl;
            return false;
        }

        std::cout << "Loading backbone: " << config_.backbone_path << std::endl;
        backbone_ = cv::dnn::readNet(config_.backbone_path);
        if (backbone_.empty()) {
            std::cerr << "Failed to load backbone network" << std::endl;
            return false;
        }
        backbone_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        backbone_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);

        head_ = LinearHead::fromFile(config_.head_path);
        std::cout << "Classifier head: " << head_.classes() << " classes x "
                  << head_.channels() << " features" << std::endl;

        if (!config_.temporal_path.empty()) {
            temporal_ = cv::dnn::readNet(config_.temporal_path);
            has_temporal_ = !temporal_.empty();
            if (!has_temporal_) {
                std::cerr << "Warning: temporal model failed to load, using mean frame logits" << std::endl;
            }
        }

        initialized_ = true;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error loading classifier: " << e.what() << std::endl;
        initialized_ = false;
        return false;
    }
}

cv::Mat DnnFrameClassifier::preprocess(const cv::Mat& frame) const {
    if (frame.empty()) {
        throw std::invalid_argument("Cannot preprocess an empty frame");
    }

    // The normalization below needs exactly three planes.
    cv::Mat bgr;
    if (frame.channels() == 1) {
        cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
    } else if (frame.channels() == 4) {
        cv::cvtColor(frame, bgr, cv::COLOR_BGRA2BGR);
    } else if (frame.channels() == 3) {
        bgr = frame;
    } else {
        throw std::invalid_argument("Unsupported frame channel count " + std::to_string(frame.channels()));
    }

    cv::Mat blob = cv::dnn::blobFromImage(bgr, 1.0 / 255.0, cv::Size(config_.input_size, config_.input_size),
                                          cv::Scalar(), true, false, CV_32F);
    const int plane = config_.input_size * config_.input_size;
    float* data = blob.ptr<float>();
    for (int c = 0; c < 3; ++c) {
        float* channel = data + c * plane;
        const float mean = static_cast<float>(config_.mean[c]);
        const float stddev = static_cast<float>(config_.std[c]);
        for (int i = 0; i < plane; ++i) {
            channel[i] = (channel[i] - mean) / stddev;
        }
    }
    return blob;
}

ActivationMap DnnFrameClassifier::runBackbone(const cv::Mat& frame) {
    if (!initialized_) {
        throw std::runtime_error("Classifier not initialized");
    }

    backbone_.setInput(preprocess(frame));
    cv::Mat output = backbone_.forward();

    int channels, height, width;
    if (output.dims == 4) {
        channels = output.size[1];
        height = output.size[2];
        width = output.size[3];
    } else if (output.dims == 2) {
        channels = output.size[1];
        height = 1;
        width = 1;
    } else {
        throw std::runtime_error("Unexpected backbone output rank " + std::to_string(output.dims));
    }

    const float* data = output.ptr<float>();
    ActivationMap activations;
    activations.reserve(channels);
    for (int c = 0; c < channels; ++c) {
        cv::Mat plane(height, width, CV_32F, const_cast<float*>(data + static_cast<size_t>(c) * height * width));
        activations.push_back(plane.clone());
    }
    return activations;
}

std::vector<double> DnnFrameClassifier::headLogits(const std::vector<double>& pooled) const {
    return head_.logits(pooled);
}

ActivationMap DnnFrameClassifier::headGradient(const ActivationMap& activations, int target_class) const {
    return head_.gradient(activations, target_class);
}

std::vector<double> DnnFrameClassifier::temporalLogits(const std::vector<std::vector<double>>& pooled_sequence) {
    if (!has_temporal_) {
        return FrameClassifier::temporalLogits(pooled_sequence);
    }

    const int steps = static_cast<int>(pooled_sequence.size());
    const int features = static_cast<int>(pooled_sequence.front().size());
    int sizes[] = {1, steps, features};
    cv::Mat input(3, sizes, CV_32F);
    float* data = input.ptr<float>();
    for (int t = 0; t < steps; ++t) {
        for (int f = 0; f < features; ++f) {
            data[t * features + f] = static_cast<float>(pooled_sequence[t][f]);
        }
    }

    temporal_.setInput(input);
    cv::Mat output = temporal_.forward();
    if (output.total() < 2) {
        throw std::runtime_error("Temporal model produced fewer than two logits");
    }
    const float* out = output.ptr<float>();
    return {static_cast<double>(out[0]), static_cast<double>(out[1])};
}

std::shared_ptr<FrameClassifier> loadDnnClassifier(ModelConfig config, const std::string& model_dir) {
    namespace fs = std::filesystem;
    if (!model_dir.empty()) {
        if (config.backbone_path.empty()) {
            config.backbone_path = (fs::path(model_dir) / "deepfake_backbone.onnx").string();
        }
        if (config.head_path.empty()) {
            config.head_path = (fs::path(model_dir) / "deepfake_head.json").string();
        }
        std::string temporal = (fs::path(model_dir) / "deepfake_temporal.onnx").string();
        std::error_code ec;
        if (config.temporal_path.empty() && fs::exists(temporal, ec)) {
            config.temporal_path = temporal;
        }
    }

    auto classifier = std::make_shared<DnnFrameClassifier>(config);
    if (!classifier->initialize()) {
        std::cerr << "Warning: deepfake classifier unavailable, model-driven stages disabled" << std::endl;
        return nullptr;
    }
    std::cout << "Deepfake classifier loaded" << std::endl;
    return classifier;
}

} // namespace fakeprobe
