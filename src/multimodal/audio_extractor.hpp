#ifndef FAKEPROBE_AUDIO_EXTRACTOR_HPP
#define FAKEPROBE_AUDIO_EXTRACTOR_HPP

#include "config/analysis_config.hpp"
#include "multimodal/wav_reader.hpp"
#include <string>
#include <vector>

namespace fakeprobe {

struct ExtractionResult {
    bool ok;
    std::string message;
    WavAudio audio;

    ExtractionResult() : ok(false) {}
};

// Decodes a container's audio track to mono 16-bit PCM at the configured
// rate by running ffmpeg as a child process into a temporary WAV file.
// The child is killed once the configured timeout expires.
class AudioExtractor {
public:
    explicit AudioExtractor(const AudioConfig& config);

    // Never throws; failures are described in ExtractionResult::message.
    ExtractionResult extract(const std::string& video_path) const;

    // Runs argv[0] with the given arguments, discarding its output.
    // Returns the exit status, or -1 with error filled in when the process
    // could not be started, was killed or timed out.
    static int runProcess(const std::vector<std::string>& argv, int timeout_seconds, std::string& error);

private:
    AudioConfig config_;
};

} // namespace fakeprobe

#endif // FAKEPROBE_AUDIO_EXTRACTOR_HPP
