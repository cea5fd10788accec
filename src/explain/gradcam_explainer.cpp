#include "explain/gradcam_explainer.hpp"
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <map>
#include <stdexcept>

namespace fakeprobe {

namespace {

// Tensors seen by the hooks during one explainer call.
struct HookCapture {
    std::map<size_t, ActivationMap> activations;
    std::map<size_t, ActivationMap> gradients;
};

// Registers capture hooks on construction, removes them on destruction.
class ScopedHooks {
public:
    ScopedHooks(FrameClassifier& classifier, HookCapture& capture) : classifier_(classifier) {
        forward_ = classifier_.registerForwardHook([&capture](size_t index, const ActivationMap& activations) {
            ActivationMap copy;
            copy.reserve(activations.size());
            for (const auto& plane : activations) {
                copy.push_back(plane.clone());
            }
            capture.activations[index] = std::move(copy);
        });
        backward_ = classifier_.registerBackwardHook([&capture](size_t index, const ActivationMap& gradient) {
            capture.gradients[index] = gradient;
        });
    }

    ~ScopedHooks() {
        classifier_.removeHook(forward_);
        classifier_.removeHook(backward_);
    }

    ScopedHooks(const ScopedHooks&) = delete;
    ScopedHooks& operator=(const ScopedHooks&) = delete;

private:
    FrameClassifier& classifier_;
    FrameClassifier::HookHandle forward_;
    FrameClassifier::HookHandle backward_;
};

} // namespace

json Heatmap::toJson() const {
    json j = {
        {"frame_idx", frame_index},
        {"predicted_class", predicted_class},
        {"prediction_label", predicted_class == CLASS_FAKE ? "FAKE" : "REAL"},
        {"confidence", confidence * 100.0}
    };
    j["save_path"] = save_path.empty() ? json(nullptr) : json(save_path);
    return j;
}

GradCamExplainer::GradCamExplainer(std::shared_ptr<FrameClassifier> classifier, const GradCamConfig& config)
    : classifier_(std::move(classifier)), config_(config) {
    if (!classifier_) {
        throw std::invalid_argument("GradCamExplainer requires a classifier");
    }
}

cv::Mat GradCamExplainer::weightedActivation(const ActivationMap& activations, const ActivationMap& gradient) {
    if (activations.empty() || activations.size() != gradient.size()) {
        throw std::runtime_error("Activation and gradient channel counts differ");
    }

    cv::Mat cam = cv::Mat::zeros(activations[0].size(), CV_32F);
    for (size_t c = 0; c < activations.size(); ++c) {
        double weight = cv::mean(gradient[c])[0];
        cv::Mat plane;
        activations[c].convertTo(plane, CV_32F);
        cam += plane * weight;
    }

    cam = cv::max(cam, 0.0f);
    double min_val, max_val;
    cv::minMaxLoc(cam, &min_val, &max_val);
    cam -= min_val;
    if (max_val - min_val > 0.0) {
        cam /= (max_val - min_val);
    }
    return cam;
}

std::vector<CamResult> GradCamExplainer::computeCams(const std::vector<cv::Mat>& frames, int target_class,
                                                     const std::vector<int>& frame_indices) {
    if (frames.empty()) {
        throw std::invalid_argument("Grad-CAM needs at least one frame");
    }

    // Forward and backward must see the same hooks and weights.
    std::lock_guard<std::recursive_mutex> lock(classifier_->inferenceMutex());
    HookCapture capture;
    ScopedHooks hooks(*classifier_, capture);

    std::vector<double> logits = classifier_->sequenceLogits(frames);
    std::vector<double> probs = softmax(logits);
    if (probs.size() < 2) {
        throw std::runtime_error("Classifier produced fewer than two logits");
    }
    int predicted = probs[CLASS_FAKE] >= probs[CLASS_REAL] ? CLASS_FAKE : CLASS_REAL;
    int target = target_class < 0 ? predicted : target_class;

    std::vector<CamResult> results;
    results.reserve(frame_indices.size());
    for (int requested : frame_indices) {
        int index = requested < 0 ? static_cast<int>(frames.size()) - 1 : requested;
        if (index >= static_cast<int>(frames.size())) {
            throw std::out_of_range("Frame index " + std::to_string(index) + " outside sequence of " +
                                    std::to_string(frames.size()));
        }

        auto activations = capture.activations.find(static_cast<size_t>(index));
        if (activations == capture.activations.end()) {
            throw std::runtime_error("Failed to capture activations for frame " + std::to_string(index) +
                                     ". Check hook registration.");
        }

        capture.gradients.erase(static_cast<size_t>(index));
        classifier_->backward(static_cast<size_t>(index), activations->second, target);

        auto gradient = capture.gradients.find(static_cast<size_t>(index));
        if (gradient == capture.gradients.end()) {
            throw std::runtime_error("Failed to capture gradients for frame " + std::to_string(index) +
                                     ". Check hook registration.");
        }

        CamResult result;
        result.cam = weightedActivation(activations->second, gradient->second);
        result.frame_index = index;
        result.predicted_class = predicted;
        result.confidence = probs[predicted];
        results.push_back(result);
    }
    return results;
}

CamResult GradCamExplainer::generateCam(const std::vector<cv::Mat>& frames, int target_class, int frame_index) {
    return computeCams(frames, target_class, {frame_index}).front();
}

void GradCamExplainer::renderOverlay(const cv::Mat& cam, const cv::Mat& frame, double alpha,
                                     cv::Mat& heatmap, cv::Mat& overlay) {
    cv::Mat base;
    if (frame.channels() == 1) {
        cv::cvtColor(frame, base, cv::COLOR_GRAY2BGR);
    } else if (frame.channels() == 4) {
        cv::cvtColor(frame, base, cv::COLOR_BGRA2BGR);
    } else {
        base = frame;
    }
    if (base.depth() != CV_8U) {
        double max_val;
        cv::minMaxLoc(base.reshape(1), nullptr, &max_val);
        base.convertTo(base, CV_8U, max_val <= 1.0 ? 255.0 : 1.0);
    }

    cv::Mat resized;
    cv::resize(cam, resized, base.size());
    cv::Mat cam_8u;
    resized.convertTo(cam_8u, CV_8U, 255.0);
    cv::applyColorMap(cam_8u, heatmap, cv::COLORMAP_JET);
    cv::addWeighted(base, 1.0 - alpha, heatmap, alpha, 0.0, overlay);
}

Heatmap GradCamExplainer::generateHeatmapOverlay(const std::vector<cv::Mat>& frames, const cv::Mat& original_frame,
                                                 int target_class, int frame_index) {
    CamResult cam = generateCam(frames, target_class, frame_index);

    Heatmap heatmap;
    heatmap.frame_index = cam.frame_index;
    heatmap.cam = cam.cam;
    heatmap.predicted_class = cam.predicted_class;
    heatmap.confidence = cam.confidence;
    renderOverlay(cam.cam, original_frame, config_.alpha, heatmap.heatmap, heatmap.overlay);
    return heatmap;
}

std::vector<Heatmap> GradCamExplainer::explainSequence(const std::vector<cv::Mat>& frames,
                                                       const std::string& output_dir,
                                                       const std::string& video_name) {
    std::vector<Heatmap> heatmaps;
    if (frames.empty()) {
        return heatmaps;
    }

    int count = static_cast<int>(frames.size());
    if (config_.max_frames > 0) {
        count = std::min(count, config_.max_frames);
    }
    std::vector<cv::Mat> sequence(frames.begin(), frames.begin() + count);

    std::vector<int> indices(count);
    for (int i = 0; i < count; ++i) {
        indices[i] = i;
    }
    std::vector<CamResult> cams = computeCams(sequence, -1, indices);

    if (config_.save_images) {
        std::error_code ec;
        std::filesystem::create_directories(output_dir, ec);
        if (ec) {
            std::cerr << "Grad-CAM: cannot create " << output_dir << ": " << ec.message() << std::endl;
        }
    }

    for (const auto& cam : cams) {
        Heatmap heatmap;
        heatmap.frame_index = cam.frame_index;
        heatmap.cam = cam.cam;
        heatmap.predicted_class = cam.predicted_class;
        heatmap.confidence = cam.confidence;
        renderOverlay(cam.cam, sequence[cam.frame_index], config_.alpha, heatmap.heatmap, heatmap.overlay);

        if (config_.save_images) {
            char filename[64];
            std::snprintf(filename, sizeof(filename), "_gradcam_frame_%04d.png", cam.frame_index);
            std::string path = (std::filesystem::path(output_dir) / (video_name + filename)).string();
            if (cv::imwrite(path, heatmap.overlay)) {
                heatmap.save_path = path;
            } else {
                std::cerr << "Grad-CAM: failed to write " << path << std::endl;
            }
        }
        heatmaps.push_back(heatmap);
    }

    std::cout << "Grad-CAM: explained " << heatmaps.size() << " frames" << std::endl;
    return heatmaps;
}

json GradCamExplainer::summarize(const std::vector<Heatmap>& heatmaps) {
    json paths = json::array();
    json frames = json::array();
    for (const auto& h : heatmaps) {
        if (!h.save_path.empty()) {
            paths.push_back(h.save_path);
        }
        frames.push_back(h.toJson());
    }
    json summary = {
        {"frames_explained", heatmaps.size()},
        {"image_paths", paths},
        {"frames", frames}
    };
    if (!heatmaps.empty()) {
        summary["prediction_label"] = heatmaps.front().predicted_class == CLASS_FAKE ? "FAKE" : "REAL";
        summary["confidence"] = heatmaps.front().confidence * 100.0;
    }
    return summary;
}

} // namespace fakeprobe
