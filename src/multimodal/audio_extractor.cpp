#include "multimodal/audio_extractor.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <iostream>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace fakeprobe {

namespace {

std::atomic<unsigned long> wav_counter{0};

// Removes the decoder's output file when extraction finishes.
class ScopedTempFile {
public:
    ScopedTempFile() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        std::error_code ec;
        std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            dir = "/tmp";
        }
        path_ = (dir /
                 ("fakeprobe_audio_" + std::to_string(getpid()) + "_" +
                  std::to_string(wav_counter++) + "_" + std::to_string(stamp) + ".wav")).string();
    }

    ~ScopedTempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

AudioExtractor::AudioExtractor(const AudioConfig& config) : config_(config) {}

int AudioExtractor::runProcess(const std::vector<std::string>& argv, int timeout_seconds, std::string& error) {
    if (argv.empty()) {
        error = "empty command";
        return -1;
    }

    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        error = "failed to start " + argv[0] + ": " + std::strerror(rc);
        return -1;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    int status = 0;
    while (true) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            error = std::string("waitpid failed: ") + std::strerror(errno);
            return -1;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            error = argv[0] + " timed out after " + std::to_string(timeout_seconds) + "s";
            return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 127) {
            error = argv[0] + " could not be executed";
        }
        return code;
    }
    error = argv[0] + " terminated by signal";
    return -1;
}

ExtractionResult AudioExtractor::extract(const std::string& video_path) const {
    ExtractionResult result;

    std::error_code ec;
    if (!std::filesystem::exists(video_path, ec)) {
        result.message = "Video file not found: " + video_path;
        return result;
    }

    ScopedTempFile wav;
    std::vector<std::string> command = {
        config_.ffmpeg_binary, "-i", video_path,
        "-vn", "-acodec", "pcm_s16le",
        "-ar", std::to_string(config_.sample_rate),
        "-ac", "1", "-y", wav.path()
    };

    std::string error;
    int code = runProcess(command, config_.extraction_timeout_seconds, error);
    if (code != 0) {
        result.message = error.empty() ? "Audio extraction failed (no audio track?)" : "Audio extraction failed: " + error;
        std::cerr << "AudioExtractor: " << result.message << std::endl;
        return result;
    }

    WavReadResult wav_result = WavReader::readFile(wav.path());
    if (!wav_result.ok()) {
        result.message = std::string("Cannot read extracted audio (") +
                         WavReader::errorName(wav_result.error) + "): " + wav_result.message;
        std::cerr << "AudioExtractor: " << result.message << std::endl;
        return result;
    }

    result.ok = true;
    result.audio = std::move(wav_result.audio);
    return result;
}

} // namespace fakeprobe
