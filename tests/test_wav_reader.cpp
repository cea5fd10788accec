#include <gtest/gtest.h>
#include "multimodal/wav_reader.hpp"
#include <cstdio>
#include <fstream>

using namespace fakeprobe;

namespace {

void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void putU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

void putTag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

} // namespace

class WavReaderTest : public ::testing::Test {
protected:
    std::vector<uint8_t> header() {
        std::vector<uint8_t> bytes;
        putTag(bytes, "RIFF");
        putU32(bytes, 0);
        putTag(bytes, "WAVE");
        return bytes;
    }

    void fmtChunk(std::vector<uint8_t>& bytes, uint16_t channels, uint32_t rate, uint16_t bits,
                  uint16_t format = 1) {
        putTag(bytes, "fmt ");
        putU32(bytes, 16);
        putU16(bytes, format);
        putU16(bytes, channels);
        putU32(bytes, rate);
        putU32(bytes, rate * channels * bits / 8);
        putU16(bytes, static_cast<uint16_t>(channels * bits / 8));
        putU16(bytes, bits);
    }

    void dataChunk(std::vector<uint8_t>& bytes, const std::vector<int16_t>& samples, uint32_t declared) {
        putTag(bytes, "data");
        putU32(bytes, declared);
        for (int16_t s : samples) {
            putU16(bytes, static_cast<uint16_t>(s));
        }
    }

    std::vector<uint8_t> monoWav(const std::vector<int16_t>& samples) {
        std::vector<uint8_t> bytes = header();
        fmtChunk(bytes, 1, 16000, 16);
        dataChunk(bytes, samples, static_cast<uint32_t>(samples.size() * 2));
        return bytes;
    }
};

TEST_F(WavReaderTest, ParsesMonoPcm) {
    WavReadResult result = WavReader::parse(monoWav({0, 16384, -16384, -32768}));

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.audio.sample_rate, 16000);
    EXPECT_EQ(result.audio.channels, 1);
    EXPECT_EQ(result.audio.bits_per_sample, 16);
    ASSERT_EQ(result.audio.samples.size(), 4u);
    EXPECT_DOUBLE_EQ(result.audio.samples[0], 0.0);
    EXPECT_DOUBLE_EQ(result.audio.samples[1], 0.5);
    EXPECT_DOUBLE_EQ(result.audio.samples[2], -0.5);
    EXPECT_DOUBLE_EQ(result.audio.samples[3], -1.0);
    EXPECT_DOUBLE_EQ(result.audio.durationSeconds(), 4.0 / 16000.0);
}

TEST_F(WavReaderTest, AveragesStereoToMono) {
    std::vector<uint8_t> bytes = header();
    fmtChunk(bytes, 2, 8000, 16);
    dataChunk(bytes, {16384, 0, -16384, -16384}, 8);

    WavReadResult result = WavReader::parse(bytes);
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.audio.channels, 2);
    ASSERT_EQ(result.audio.samples.size(), 2u);
    EXPECT_DOUBLE_EQ(result.audio.samples[0], 0.25);
    EXPECT_DOUBLE_EQ(result.audio.samples[1], -0.5);
}

TEST_F(WavReaderTest, SkipsUnknownChunks) {
    std::vector<uint8_t> bytes = header();
    putTag(bytes, "LIST");
    putU32(bytes, 3);
    bytes.insert(bytes.end(), {'a', 'b', 'c', 0});   // odd size plus pad byte
    fmtChunk(bytes, 1, 16000, 16);
    dataChunk(bytes, {100, 200}, 4);

    WavReadResult result = WavReader::parse(bytes);
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.audio.samples.size(), 2u);
}

TEST_F(WavReaderTest, OversizedDataChunkKeepsAvailableSamples) {
    std::vector<uint8_t> bytes = header();
    fmtChunk(bytes, 1, 16000, 16);
    dataChunk(bytes, {1, 2, 3}, 0xFFFFFFFFu);

    WavReadResult result = WavReader::parse(bytes);
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.audio.samples.size(), 3u);
}

TEST_F(WavReaderTest, RejectsNonRiffInput) {
    std::vector<uint8_t> bytes = {'J', 'U', 'N', 'K', 0, 0, 0, 0, 'W', 'A', 'V', 'E'};
    EXPECT_EQ(WavReader::parse(bytes).error, WavError::NOT_RIFF);
    EXPECT_EQ(WavReader::parse(std::vector<uint8_t>()).error, WavError::NOT_RIFF);
}

TEST_F(WavReaderTest, RejectsNonWaveRiff) {
    std::vector<uint8_t> bytes;
    putTag(bytes, "RIFF");
    putU32(bytes, 0);
    putTag(bytes, "AVI ");
    EXPECT_EQ(WavReader::parse(bytes).error, WavError::NOT_WAVE);
}

TEST_F(WavReaderTest, DataBeforeFmtIsMissingFmt) {
    std::vector<uint8_t> bytes = header();
    dataChunk(bytes, {1, 2}, 4);
    EXPECT_EQ(WavReader::parse(bytes).error, WavError::MISSING_FMT);
}

TEST_F(WavReaderTest, NoDataChunk) {
    std::vector<uint8_t> bytes = header();
    fmtChunk(bytes, 1, 16000, 16);
    EXPECT_EQ(WavReader::parse(bytes).error, WavError::MISSING_DATA);
}

TEST_F(WavReaderTest, TruncatedFmtChunk) {
    std::vector<uint8_t> bytes = header();
    putTag(bytes, "fmt ");
    putU32(bytes, 16);
    putU16(bytes, 1);
    EXPECT_EQ(WavReader::parse(bytes).error, WavError::TRUNCATED_CHUNK);
}

TEST_F(WavReaderTest, RejectsEightBitPcm) {
    std::vector<uint8_t> bytes = header();
    fmtChunk(bytes, 1, 16000, 8);
    dataChunk(bytes, {1, 2}, 4);

    WavReadResult result = WavReader::parse(bytes);
    EXPECT_EQ(result.error, WavError::UNSUPPORTED_FORMAT);
    EXPECT_FALSE(result.message.empty());
}

TEST_F(WavReaderTest, EmptyDataChunk) {
    EXPECT_EQ(WavReader::parse(monoWav({})).error, WavError::EMPTY_DATA);
}

TEST_F(WavReaderTest, ReadsFromDisk) {
    std::string path = ::testing::TempDir() + "fakeprobe_wav_reader_test.wav";
    std::vector<uint8_t> bytes = monoWav({1000, -1000, 2000});
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    WavReadResult result = WavReader::readFile(path);
    std::remove(path.c_str());
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.audio.samples.size(), 3u);
}

TEST_F(WavReaderTest, MissingFile) {
    WavReadResult result = WavReader::readFile("/nonexistent/audio.wav");
    EXPECT_EQ(result.error, WavError::FILE_NOT_FOUND);
    EXPECT_STREQ(WavReader::errorName(result.error), "file_not_found");
}
