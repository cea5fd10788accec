#ifndef FAKEPROBE_DNN_FRAME_CLASSIFIER_HPP
#define FAKEPROBE_DNN_FRAME_CLASSIFIER_HPP

#include "config/analysis_config.hpp"
#include "model/frame_classifier.hpp"
#include <opencv2/dnn.hpp>
#include <memory>
#include <string>

namespace fakeprobe {

// FrameClassifier backed by cv::dnn. The backbone network must output the
// last convolutional feature map (1 x C x H x W); the linear head is read
// from JSON. An optional temporal network maps the pooled feature sequence
// (1 x T x C) to two sequence logits.
class DnnFrameClassifier : public FrameClassifier {
public:
    // Throws std::invalid_argument for a non-positive input size or std.
    explicit DnnFrameClassifier(const ModelConfig& config);

    bool initialize();
    bool isReady() const override { return initialized_; }
    std::string name() const override { return "dnn"; }

    // NCHW float blob: resized, RGB, ImageNet-normalised. Gray and BGRA
    // frames are expanded to BGR first.
    cv::Mat preprocess(const cv::Mat& frame) const;

protected:
    ActivationMap runBackbone(const cv::Mat& frame) override;
    std::vector<double> headLogits(const std::vector<double>& pooled) const override;
    ActivationMap headGradient(const ActivationMap& activations, int target_class) const override;
    std::vector<double> temporalLogits(const std::vector<std::vector<double>>& pooled_sequence) override;

private:
    ModelConfig config_;
    cv::dnn::Net backbone_;
    cv::dnn::Net temporal_;
    LinearHead head_;
    bool has_temporal_;
    bool initialized_;
};

// Fills empty model paths from model_dir (deepfake_backbone.onnx,
// deepfake_head.json, deepfake_temporal.onnx when present) and loads the
// classifier. Returns nullptr when the model files are missing or fail to
// load.
std::shared_ptr<FrameClassifier> loadDnnClassifier(ModelConfig config, const std::string& model_dir);

} // namespace fakeprobe

#endif // FAKEPROBE_DNN_FRAME_CLASSIFIER_HPP
