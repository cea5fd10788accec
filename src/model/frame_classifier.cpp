#include "model/frame_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace fakeprobe {

std::vector<double> softmax(const std::vector<double>& logits) {
    std::vector<double> probs(logits.size());
    if (logits.empty()) {
        return probs;
    }
    double max_logit = *std::max_element(logits.begin(), logits.end());
    double sum = 0.0;
    for (size_t i = 0; i < logits.size(); ++i) {
        probs[i] = std::exp(logits[i] - max_logit);
        sum += probs[i];
    }
    for (double& p : probs) {
        p /= sum;
    }
    return probs;
}

ModelPrediction ModelPrediction::fromLogits(const std::vector<double>& logits) {
    ModelPrediction prediction;
    prediction.logits = logits;
    if (logits.size() < 2) {
        return prediction;
    }
    std::vector<double> probs = softmax(logits);
    int best = probs[CLASS_FAKE] >= probs[CLASS_REAL] ? CLASS_FAKE : CLASS_REAL;
    prediction.predicted_class = best;
    prediction.label = best == CLASS_FAKE ? "FAKE" : "REAL";
    prediction.confidence = probs[best] * 100.0;
    return prediction;
}

ModelPrediction ModelPrediction::fromLabel(const std::string& label, double confidence) {
    std::string upper = label;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    ModelPrediction prediction;
    prediction.confidence = std::max(0.0, std::min(100.0, confidence));
    if (upper == "FAKE") {
        prediction.label = "FAKE";
        prediction.predicted_class = CLASS_FAKE;
    } else if (upper == "REAL") {
        prediction.label = "REAL";
        prediction.predicted_class = CLASS_REAL;
    }
    return prediction;
}

json ModelPrediction::toJson() const {
    return json{
        {"prediction_label", label},
        {"predicted_class", predicted_class},
        {"confidence", confidence},
        {"logits", logits}
    };
}

LinearHead::LinearHead(const cv::Mat& weights, const std::vector<double>& bias) : bias_(bias) {
    weights.convertTo(weights_, CV_64F);
    if (static_cast<int>(bias_.size()) != weights_.rows) {
        throw std::runtime_error("Linear head bias size does not match weight rows");
    }
}

LinearHead LinearHead::fromJson(const json& j) {
    if (!j.contains("weights") || !j.contains("bias")) {
        throw std::runtime_error("Linear head requires 'weights' and 'bias'");
    }
    std::vector<std::vector<double>> rows;
    std::vector<double> bias;
    try {
        rows = j.at("weights").get<std::vector<std::vector<double>>>();
        bias = j.at("bias").get<std::vector<double>>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed linear head: ") + e.what());
    }
    if (rows.empty() || rows[0].empty()) {
        throw std::runtime_error("Linear head has no weights");
    }

    cv::Mat weights(static_cast<int>(rows.size()), static_cast<int>(rows[0].size()), CV_64F);
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != rows[0].size()) {
            throw std::runtime_error("Linear head weight rows differ in length");
        }
        for (size_t c = 0; c < rows[r].size(); ++c) {
            weights.at<double>(static_cast<int>(r), static_cast<int>(c)) = rows[r][c];
        }
    }
    return LinearHead(weights, bias);
}

LinearHead LinearHead::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open linear head file: " + path);
    }
    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Cannot parse linear head file " + path + ": " + e.what());
    }
    return fromJson(j);
}

std::vector<double> LinearHead::logits(const std::vector<double>& pooled) const {
    if (static_cast<int>(pooled.size()) != weights_.cols) {
        throw std::runtime_error("Feature size " + std::to_string(pooled.size()) +
                                 " does not match linear head input " + std::to_string(weights_.cols));
    }
    std::vector<double> out(bias_);
    for (int r = 0; r < weights_.rows; ++r) {
        const double* w = weights_.ptr<double>(r);
        for (int c = 0; c < weights_.cols; ++c) {
            out[r] += w[c] * pooled[c];
        }
    }
    return out;
}

ActivationMap LinearHead::gradient(const ActivationMap& activations, int target_class) const {
    if (target_class < 0 || target_class >= weights_.rows) {
        throw std::runtime_error("Target class out of range: " + std::to_string(target_class));
    }
    if (static_cast<int>(activations.size()) != weights_.cols) {
        throw std::runtime_error("Activation channels do not match linear head input");
    }

    ActivationMap gradient;
    gradient.reserve(activations.size());
    for (size_t c = 0; c < activations.size(); ++c) {
        const cv::Mat& plane = activations[c];
        double scale = weights_.at<double>(target_class, static_cast<int>(c)) / std::max(1, plane.rows * plane.cols);
        gradient.push_back(cv::Mat(plane.size(), CV_32F, cv::Scalar(scale)));
    }
    return gradient;
}

FrameClassifier::FrameClassifier() : next_handle_(1) {}

std::vector<double> FrameClassifier::globalAveragePool(const ActivationMap& activations) {
    std::vector<double> pooled;
    pooled.reserve(activations.size());
    for (const auto& plane : activations) {
        pooled.push_back(cv::mean(plane)[0]);
    }
    return pooled;
}

ActivationMap FrameClassifier::extractFeatures(size_t frame_index, const cv::Mat& frame) {
    std::lock_guard<std::recursive_mutex> lock(inference_mutex_);
    ActivationMap activations = runBackbone(frame);
    for (const auto& entry : forward_hooks_) {
        entry.second(frame_index, activations);
    }
    return activations;
}

std::vector<double> FrameClassifier::frameLogits(const ActivationMap& activations) const {
    return headLogits(globalAveragePool(activations));
}

std::vector<double> FrameClassifier::temporalLogits(const std::vector<std::vector<double>>& pooled_sequence) {
    std::vector<double> mean;
    for (const auto& pooled : pooled_sequence) {
        std::vector<double> logits = headLogits(pooled);
        if (mean.empty()) {
            mean.assign(logits.size(), 0.0);
        }
        for (size_t i = 0; i < logits.size() && i < mean.size(); ++i) {
            mean[i] += logits[i];
        }
    }
    for (double& v : mean) {
        v /= static_cast<double>(pooled_sequence.size());
    }
    return mean;
}

std::vector<double> FrameClassifier::sequenceLogits(const std::vector<cv::Mat>& frames) {
    if (frames.empty()) {
        throw std::runtime_error("Cannot classify an empty frame sequence");
    }
    std::lock_guard<std::recursive_mutex> lock(inference_mutex_);
    std::vector<std::vector<double>> pooled_sequence;
    pooled_sequence.reserve(frames.size());
    for (size_t i = 0; i < frames.size(); ++i) {
        pooled_sequence.push_back(globalAveragePool(extractFeatures(i, frames[i])));
    }
    return temporalLogits(pooled_sequence);
}

ModelPrediction FrameClassifier::predict(const std::vector<cv::Mat>& frames) {
    return ModelPrediction::fromLogits(sequenceLogits(frames));
}

void FrameClassifier::backward(size_t frame_index, const ActivationMap& activations, int target_class) {
    std::lock_guard<std::recursive_mutex> lock(inference_mutex_);
    ActivationMap gradient = headGradient(activations, target_class);
    for (const auto& entry : backward_hooks_) {
        entry.second(frame_index, gradient);
    }
}

FrameClassifier::HookHandle FrameClassifier::registerForwardHook(ForwardHook hook) {
    std::lock_guard<std::recursive_mutex> lock(inference_mutex_);
    HookHandle handle = next_handle_++;
    forward_hooks_[handle] = std::move(hook);
    return handle;
}

FrameClassifier::HookHandle FrameClassifier::registerBackwardHook(BackwardHook hook) {
    std::lock_guard<std::recursive_mutex> lock(inference_mutex_);
    HookHandle handle = next_handle_++;
    backward_hooks_[handle] = std::move(hook);
    return handle;
}

void FrameClassifier::removeHook(HookHandle handle) {
    std::lock_guard<std::recursive_mutex> lock(inference_mutex_);
    forward_hooks_.erase(handle);
    backward_hooks_.erase(handle);
}

size_t FrameClassifier::hookCount() const {
    std::lock_guard<std::recursive_mutex> lock(inference_mutex_);
    return forward_hooks_.size() + backward_hooks_.size();
}

} // namespace fakeprobe
