#include "video_source.hpp"
#include <curl/curl.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace fakeprobe {

namespace {

struct DownloadTarget {
    std::ofstream* out;
    int64_t written;
    int64_t max_bytes;      // 0 = unlimited
};

// Returning short aborts the transfer, which also covers servers that send
// no Content-Length.
size_t writeCallback(void* contents, size_t size, size_t nmemb, DownloadTarget* target) {
    size_t total_size = size * nmemb;
    if (target->max_bytes > 0 && target->written + static_cast<int64_t>(total_size) > target->max_bytes) {
        return 0;
    }
    target->out->write(static_cast<char*>(contents), static_cast<std::streamsize>(total_size));
    target->written += static_cast<int64_t>(total_size);
    return target->out->good() ? total_size : 0;
}

std::atomic<unsigned long> temp_counter{0};

} // namespace

VideoSource::VideoSource(const std::string& location, double default_fps, int64_t max_download_bytes)
    : location_(location), default_fps_(default_fps), max_download_bytes_(max_download_bytes), downloaded_(false) {}

VideoSource::~VideoSource() {
    if (capture_.isOpened()) {
        capture_.release();
    }
    if (downloaded_) {
        std::error_code ec;
        std::filesystem::remove(local_path_, ec);
        if (ec) {
            std::cerr << "Failed to remove temporary video " << local_path_ << ": " << ec.message() << std::endl;
        }
    }
}

bool VideoSource::isUrl(const std::string& location) {
    return location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0;
}

std::string VideoSource::makeTempPath() {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::filesystem::path dir = std::filesystem::temp_directory_path();
    return (dir / ("fakeprobe_" + std::to_string(getpid()) + "_" +
                   std::to_string(temp_counter++) + "_" + std::to_string(stamp) + ".mp4")).string();
}

bool VideoSource::downloadToFile(const std::string& url, const std::string& destination, int64_t max_bytes) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        std::cerr << "Failed to initialize CURL" << std::endl;
        return false;
    }

    std::ofstream outfile(destination, std::ios::binary);
    if (!outfile.is_open()) {
        std::cerr << "Failed to open temporary file: " << destination << std::endl;
        curl_easy_cleanup(curl);
        return false;
    }

    DownloadTarget target{&outfile, 0, max_bytes};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &target);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
#endif
    if (max_bytes > 0) {
        curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(max_bytes));
    }
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, DOWNLOAD_TIMEOUT_SECONDS);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "fakeprobe/1.0");

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);
    outfile.close();

    if (res != CURLE_OK) {
        std::cerr << "CURL error: " << curl_easy_strerror(res) << std::endl;
        std::error_code ec;
        std::filesystem::remove(destination, ec);
        return false;
    }
    return true;
}

void VideoSource::open() {
    if (isUrl(location_)) {
        local_path_ = makeTempPath();
        std::cout << "Downloading video from " << location_ << std::endl;
        if (!downloadToFile(location_, local_path_, max_download_bytes_)) {
            throw VideoOpenError("Cannot download video: " + location_);
        }
        downloaded_ = true;
    } else {
        local_path_ = location_;
    }

    if (!capture_.open(local_path_)) {
        throw VideoOpenError("Cannot open video: " + location_);
    }

    info_.fps = capture_.get(cv::CAP_PROP_FPS);
    if (!(info_.fps > 0.0)) {
        info_.fps = default_fps_;
    }
    info_.frame_count = static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_COUNT));
    info_.width = static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_WIDTH));
    info_.height = static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT));
    info_.duration_seconds = info_.frame_count > 0 ? info_.frame_count / info_.fps : 0.0;
}

std::vector<cv::Mat> VideoSource::readFrames(int max_frames) {
    std::vector<cv::Mat> frames;
    if (!capture_.isOpened()) {
        return frames;
    }

    capture_.set(cv::CAP_PROP_POS_FRAMES, 0);
    cv::Mat frame;
    while (max_frames <= 0 || static_cast<int>(frames.size()) < max_frames) {
        if (!capture_.read(frame) || frame.empty()) {
            break;
        }
        frames.push_back(frame.clone());
    }
    return frames;
}

} // namespace fakeprobe
