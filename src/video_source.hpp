#ifndef FAKEPROBE_VIDEO_SOURCE_HPP
#define FAKEPROBE_VIDEO_SOURCE_HPP

#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace fakeprobe {

using json = nlohmann::json;

class VideoOpenError : public std::runtime_error {
public:
    explicit VideoOpenError(const std::string& message) : std::runtime_error(message) {}
};

struct VideoInfo {
    double fps;
    int frame_count;
    int width;
    int height;
    double duration_seconds;

    VideoInfo() : fps(0.0), frame_count(0), width(0), height(0), duration_seconds(0.0) {}

    json toJson() const {
        return json{
            {"fps", fps},
            {"frame_count", frame_count},
            {"width", width},
            {"height", height},
            {"duration", duration_seconds}
        };
    }
};

// A readable video given as a local path or an http(s) URL. URLs are
// downloaded to a temporary file which is removed with the source.
class VideoSource {
public:
    // max_download_bytes bounds URL downloads; 0 means unlimited.
    explicit VideoSource(const std::string& location, double default_fps = 30.0,
                         int64_t max_download_bytes = 0);
    ~VideoSource();

    VideoSource(const VideoSource&) = delete;
    VideoSource& operator=(const VideoSource&) = delete;

    // Throws VideoOpenError when the video cannot be fetched or decoded.
    void open();

    bool isOpen() const { return capture_.isOpened(); }
    const VideoInfo& info() const { return info_; }
    const std::string& localPath() const { return local_path_; }
    const std::string& location() const { return location_; }

    // Reads up to max_frames frames (all when max_frames <= 0) from the start.
    std::vector<cv::Mat> readFrames(int max_frames);

    static bool isUrl(const std::string& location);
    static bool downloadToFile(const std::string& url, const std::string& destination,
                               int64_t max_bytes = 0);

private:
    std::string location_;
    std::string local_path_;
    double default_fps_;
    int64_t max_download_bytes_;
    bool downloaded_;
    cv::VideoCapture capture_;
    VideoInfo info_;

    static constexpr long DOWNLOAD_TIMEOUT_SECONDS = 60L;

    static std::string makeTempPath();
};

} // namespace fakeprobe

#endif // FAKEPROBE_VIDEO_SOURCE_HPP
