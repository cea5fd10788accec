#ifndef FAKEPROBE_GRADCAM_EXPLAINER_HPP
#define FAKEPROBE_GRADCAM_EXPLAINER_HPP

#include "config/analysis_config.hpp"
#include "model/frame_classifier.hpp"
#include <opencv2/opencv.hpp>
#include <memory>
#include <string>
#include <vector>

namespace fakeprobe {

struct CamResult {
    cv::Mat cam;            // CV_32F, backbone feature-map resolution, [0,1]
    int frame_index;
    int predicted_class;
    double confidence;      // 0-1, softmax of the sequence logits

    CamResult() : frame_index(0), predicted_class(-1), confidence(0.0) {}
};

struct Heatmap {
    int frame_index;
    cv::Mat cam;
    cv::Mat heatmap;        // JET-colorized cam at frame resolution
    cv::Mat overlay;        // heatmap blended onto the frame
    int predicted_class;
    double confidence;      // 0-1
    std::string save_path;  // empty when not written

    Heatmap() : frame_index(0), predicted_class(-1), confidence(0.0) {}

    json toJson() const;
};

// Gradient-weighted class activation maps over the classifier's backbone.
// Every call registers its own hooks and removes them before returning.
class GradCamExplainer {
public:
    GradCamExplainer(std::shared_ptr<FrameClassifier> classifier, const GradCamConfig& config);

    // target_class < 0 explains the predicted class; frame_index < 0 is the
    // last frame. Throws std::runtime_error when the hooks capture nothing.
    CamResult generateCam(const std::vector<cv::Mat>& frames, int target_class = -1, int frame_index = -1);

    Heatmap generateHeatmapOverlay(const std::vector<cv::Mat>& frames, const cv::Mat& original_frame,
                                   int target_class = -1, int frame_index = -1);

    // One overlay per frame (up to GradCamConfig::max_frames), written as
    // <video_name>_gradcam_frame_NNNN.png when save_images is set.
    std::vector<Heatmap> explainSequence(const std::vector<cv::Mat>& frames, const std::string& output_dir,
                                         const std::string& video_name);

    // Resize cam to the frame, apply the JET colormap and alpha-blend.
    static void renderOverlay(const cv::Mat& cam, const cv::Mat& frame, double alpha,
                              cv::Mat& heatmap, cv::Mat& overlay);

    // weights = spatial mean of each gradient plane; ReLU(sum w * A),
    // min-max normalized.
    static cv::Mat weightedActivation(const ActivationMap& activations, const ActivationMap& gradient);

    static json summarize(const std::vector<Heatmap>& heatmaps);

private:
    std::vector<CamResult> computeCams(const std::vector<cv::Mat>& frames, int target_class,
                                       const std::vector<int>& frame_indices);

    std::shared_ptr<FrameClassifier> classifier_;
    GradCamConfig config_;
};

} // namespace fakeprobe

#endif // FAKEPROBE_GRADCAM_EXPLAINER_HPP
