#include "multimodal/wav_reader.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>

namespace fakeprobe {

namespace {

constexpr uint16_t FORMAT_PCM = 1;
constexpr uint16_t FORMAT_EXTENSIBLE = 0xFFFE;
constexpr size_t RIFF_HEADER_SIZE = 12;
constexpr size_t CHUNK_HEADER_SIZE = 8;
constexpr size_t MIN_FMT_SIZE = 16;

} // namespace

const char* WavReader::errorName(WavError error) {
    switch (error) {
        case WavError::NONE: return "none";
        case WavError::FILE_NOT_FOUND: return "file_not_found";
        case WavError::NOT_RIFF: return "not_riff";
        case WavError::NOT_WAVE: return "not_wave";
        case WavError::TRUNCATED_CHUNK: return "truncated_chunk";
        case WavError::MISSING_FMT: return "missing_fmt";
        case WavError::MISSING_DATA: return "missing_data";
        case WavError::UNSUPPORTED_FORMAT: return "unsupported_format";
        case WavError::EMPTY_DATA: return "empty_data";
    }
    return "unknown";
}

WavReadResult WavReader::failure(WavError error, const std::string& message) {
    WavReadResult result;
    result.error = error;
    result.message = message;
    return result;
}

WavReadResult WavReader::readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return failure(WavError::FILE_NOT_FOUND, "Cannot open WAV file: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parse(bytes);
}

WavReadResult WavReader::parse(const std::vector<uint8_t>& bytes) {
    const size_t size = bytes.size();
    const uint8_t* data = bytes.data();

    if (size < RIFF_HEADER_SIZE || std::memcmp(data, "RIFF", 4) != 0) {
        return failure(WavError::NOT_RIFF, "Missing RIFF header");
    }
    if (std::memcmp(data + 8, "WAVE", 4) != 0) {
        return failure(WavError::NOT_WAVE, "RIFF container is not WAVE");
    }

    bool have_fmt = false;
    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;
    const uint8_t* pcm = nullptr;
    size_t pcm_size = 0;

    size_t offset = RIFF_HEADER_SIZE;
    while (offset + CHUNK_HEADER_SIZE <= size) {
        const uint8_t* chunk = data + offset;
        uint32_t chunk_size = readU32(chunk + 4);
        size_t body = offset + CHUNK_HEADER_SIZE;
        size_t available = size - body;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunk_size < MIN_FMT_SIZE || chunk_size > available) {
                return failure(WavError::TRUNCATED_CHUNK, "fmt chunk is truncated");
            }
            format = readU16(data + body);
            channels = readU16(data + body + 2);
            sample_rate = readU32(data + body + 4);
            bits = readU16(data + body + 14);
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!have_fmt) {
                return failure(WavError::MISSING_FMT, "data chunk precedes fmt chunk");
            }
            // Streamed writers may leave a placeholder size; keep what is present.
            pcm = data + body;
            pcm_size = std::min<size_t>(chunk_size, available);
            break;
        } else if (chunk_size > available) {
            return failure(WavError::TRUNCATED_CHUNK, "chunk extends past end of file");
        }

        offset = body + chunk_size + (chunk_size & 1u);
    }

    if (!have_fmt) {
        return failure(WavError::MISSING_FMT, "No fmt chunk");
    }
    if (pcm == nullptr) {
        return failure(WavError::MISSING_DATA, "No data chunk");
    }
    if ((format != FORMAT_PCM && format != FORMAT_EXTENSIBLE) || bits != 16 ||
        channels == 0 || sample_rate == 0) {
        return failure(WavError::UNSUPPORTED_FORMAT,
                       "Only 16-bit PCM is supported (format " + std::to_string(format) +
                       ", " + std::to_string(bits) + " bits)");
    }

    const size_t frame_bytes = static_cast<size_t>(channels) * 2;
    const size_t frames = pcm_size / frame_bytes;
    if (frames == 0) {
        return failure(WavError::EMPTY_DATA, "data chunk holds no samples");
    }

    WavReadResult result;
    result.audio.sample_rate = static_cast<int>(sample_rate);
    result.audio.channels = channels;
    result.audio.bits_per_sample = bits;
    result.audio.samples.resize(frames);

    for (size_t i = 0; i < frames; ++i) {
        const uint8_t* frame = pcm + i * frame_bytes;
        double sum = 0.0;
        for (uint16_t c = 0; c < channels; ++c) {
            sum += static_cast<int16_t>(readU16(frame + c * 2)) / 32768.0;
        }
        result.audio.samples[i] = sum / channels;
    }
    return result;
}

} // namespace fakeprobe
