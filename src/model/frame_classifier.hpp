#ifndef FAKEPROBE_FRAME_CLASSIFIER_HPP
#define FAKEPROBE_FRAME_CLASSIFIER_HPP

#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace fakeprobe {

using json = nlohmann::json;

// One CV_32F plane per channel of the backbone's last convolutional layer.
using ActivationMap = std::vector<cv::Mat>;

// Output class indices of every classifier.
constexpr int CLASS_FAKE = 0;
constexpr int CLASS_REAL = 1;

struct ModelPrediction {
    std::string label;              // "FAKE", "REAL" or "UNKNOWN"
    int predicted_class;            // -1 when unknown
    double confidence;              // 0-100
    std::vector<double> logits;

    ModelPrediction() : label("UNKNOWN"), predicted_class(-1), confidence(0.0) {}

    bool isKnown() const { return predicted_class == CLASS_FAKE || predicted_class == CLASS_REAL; }
    bool isFake() const { return predicted_class == CLASS_FAKE; }
    bool isReal() const { return predicted_class == CLASS_REAL; }

    static ModelPrediction fromLogits(const std::vector<double>& logits);

    // label is case-insensitive "FAKE" or "REAL"; anything else is unknown.
    static ModelPrediction fromLabel(const std::string& label, double confidence);

    json toJson() const;
};

std::vector<double> softmax(const std::vector<double>& logits);

// Final fully connected layer applied to globally average-pooled features.
class LinearHead {
public:
    LinearHead() = default;
    LinearHead(const cv::Mat& weights, const std::vector<double>& bias);

    // {"weights": [[w00, w01, ...], [w10, w11, ...]], "bias": [b0, b1]}
    // Throws std::runtime_error on malformed input.
    static LinearHead fromJson(const json& j);
    static LinearHead fromFile(const std::string& path);

    bool empty() const { return weights_.empty(); }
    int classes() const { return weights_.rows; }
    int channels() const { return weights_.cols; }

    std::vector<double> logits(const std::vector<double>& pooled) const;

    // d logit[target] / d activation: each channel plane is the constant
    // weight[target][c] / (H * W).
    ActivationMap gradient(const ActivationMap& activations, int target_class) const;

private:
    cv::Mat weights_;           // classes x channels, CV_64F
    std::vector<double> bias_;
};

// Frame-sequence fake/real classifier. Subclasses provide the backbone and
// head; this class owns hook dispatch and the inference lock. Forward hooks
// see every activation map the backbone produces, backward hooks see the
// gradient of the selected logit with respect to that map.
class FrameClassifier {
public:
    using ForwardHook = std::function<void(size_t frame_index, const ActivationMap& activations)>;
    using BackwardHook = std::function<void(size_t frame_index, const ActivationMap& gradient)>;
    using HookHandle = size_t;

    FrameClassifier();
    virtual ~FrameClassifier() = default;

    FrameClassifier(const FrameClassifier&) = delete;
    FrameClassifier& operator=(const FrameClassifier&) = delete;

    virtual bool isReady() const = 0;
    virtual std::string name() const = 0;

    // Backbone pass on one frame; fires forward hooks.
    ActivationMap extractFeatures(size_t frame_index, const cv::Mat& frame);

    // Linear head on pooled features, bypassing any temporal stage.
    std::vector<double> frameLogits(const ActivationMap& activations) const;

    // Whole-sequence opinion (temporal stage when the model has one).
    std::vector<double> sequenceLogits(const std::vector<cv::Mat>& frames);

    ModelPrediction predict(const std::vector<cv::Mat>& frames);

    // Back-propagates target_class's frame logit to the activation map and
    // fires backward hooks.
    void backward(size_t frame_index, const ActivationMap& activations, int target_class);

    HookHandle registerForwardHook(ForwardHook hook);
    HookHandle registerBackwardHook(BackwardHook hook);
    void removeHook(HookHandle handle);
    size_t hookCount() const;

    // Held across a forward + backward pair when the model is shared.
    std::recursive_mutex& inferenceMutex() const { return inference_mutex_; }

    static std::vector<double> globalAveragePool(const ActivationMap& activations);

protected:
    virtual ActivationMap runBackbone(const cv::Mat& frame) = 0;
    virtual std::vector<double> headLogits(const std::vector<double>& pooled) const = 0;
    virtual ActivationMap headGradient(const ActivationMap& activations, int target_class) const = 0;

    // Default temporal stage: mean of the per-frame logits.
    virtual std::vector<double> temporalLogits(const std::vector<std::vector<double>>& pooled_sequence);

private:
    mutable std::recursive_mutex inference_mutex_;
    std::map<HookHandle, ForwardHook> forward_hooks_;
    std::map<HookHandle, BackwardHook> backward_hooks_;
    HookHandle next_handle_;
};

} // namespace fakeprobe

#endif // FAKEPROBE_FRAME_CLASSIFIER_HPP
