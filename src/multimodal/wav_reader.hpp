#ifndef FAKEPROBE_WAV_READER_HPP
#define FAKEPROBE_WAV_READER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace fakeprobe {

enum class WavError {
    NONE = 0,
    FILE_NOT_FOUND,
    NOT_RIFF,
    NOT_WAVE,
    TRUNCATED_CHUNK,
    MISSING_FMT,
    MISSING_DATA,
    UNSUPPORTED_FORMAT,
    EMPTY_DATA
};

struct WavAudio {
    int sample_rate;
    int channels;                 // channels in the file; samples are mono
    int bits_per_sample;
    std::vector<double> samples;  // [-1, 1)

    WavAudio() : sample_rate(0), channels(0), bits_per_sample(0) {}

    double durationSeconds() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

struct WavReadResult {
    WavError error;
    std::string message;
    WavAudio audio;

    WavReadResult() : error(WavError::NONE) {}

    bool ok() const { return error == WavError::NONE; }
};

// Bounds-checked RIFF/WAVE reader for 16-bit PCM. Walks RIFF -> "fmt " ->
// "data", skipping unknown chunks. Multi-channel audio is averaged to mono.
// Malformed input is reported through WavReadResult, never by throwing.
class WavReader {
public:
    static WavReadResult readFile(const std::string& path);
    static WavReadResult parse(const std::vector<uint8_t>& bytes);

    static const char* errorName(WavError error);

private:
    static uint16_t readU16(const uint8_t* p) {
        return static_cast<uint16_t>(p[0] | (p[1] << 8));
    }
    static uint32_t readU32(const uint8_t* p) {
        return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
               (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
    }

    static WavReadResult failure(WavError error, const std::string& message);
};

} // namespace fakeprobe

#endif // FAKEPROBE_WAV_READER_HPP
