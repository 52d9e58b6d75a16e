#include "wav_io.hpp"

#include <gtest/gtest.h>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() /
            ("sonastream_" + std::to_string(::getpid()) + "_" + name)).string();
}

void put16(std::string& s, uint16_t v) {
    s.push_back(static_cast<char>(v & 0xFF));
    s.push_back(static_cast<char>(v >> 8));
}

void put32(std::string& s, uint32_t v) {
    for (int i = 0; i < 4; ++i) s.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

void putf(std::string& s, float f) {
    uint32_t u;
    std::memcpy(&u, &f, sizeof(u));
    put32(s, u);
}

} // namespace

TEST(WavIo, Pcm16WriteThenRead) {
    std::string path = temp_path("pcm16.wav");
    std::vector<float> samples = {0.0f, 0.5f, -0.5f, 1.0f, -1.0f, 2.0f};
    write_wav(path, samples, 16000);

    WavAudio audio = read_wav(path);
    std::remove(path.c_str());

    EXPECT_EQ(audio.sample_rate, 16000u);
    EXPECT_EQ(audio.channels, 1u);
    ASSERT_EQ(audio.samples.size(), samples.size());
    for (size_t i = 0; i < 5; ++i)
        EXPECT_NEAR(audio.samples[i], samples[i], 1.0 / 16384);
    EXPECT_NEAR(audio.samples[5], 1.0f, 1.0 / 16384);  // clipped
}

TEST(WavIo, StereoFloatIsMixedToMonoAndExtraChunksAreSkipped) {
    std::string body;
    body += "WAVE";
    body += "fmt ";
    put32(body, 16);
    put16(body, 3);        // IEEE float
    put16(body, 2);
    put32(body, 8000);
    put32(body, 8000 * 8);
    put16(body, 8);
    put16(body, 32);
    body += "LIST";
    put32(body, 3);
    body += "abc";
    body.push_back('\0');  // pad byte for the odd-sized chunk
    body += "data";
    put32(body, 16);
    putf(body, 0.5f);
    putf(body, -0.5f);
    putf(body, 1.0f);
    putf(body, 0.0f);

    std::string file = "RIFF";
    put32(file, static_cast<uint32_t>(body.size()));
    file += body;

    std::string path = temp_path("float.wav");
    {
        std::ofstream out(path, std::ios::binary);
        out.write(file.data(), static_cast<std::streamsize>(file.size()));
    }

    WavAudio audio = read_wav(path);
    std::remove(path.c_str());

    EXPECT_EQ(audio.sample_rate, 8000u);
    EXPECT_EQ(audio.channels, 2u);
    ASSERT_EQ(audio.samples.size(), 2u);
    EXPECT_FLOAT_EQ(audio.samples[0], 0.0f);
    EXPECT_FLOAT_EQ(audio.samples[1], 0.5f);
}

TEST(WavIo, RejectsFilesThatAreNotWav) {
    std::string path = temp_path("garbage.wav");
    {
        std::ofstream out(path, std::ios::binary);
        out << "definitely not audio";
    }
    EXPECT_THROW(read_wav(path), std::runtime_error);
    std::remove(path.c_str());

    EXPECT_THROW(read_wav(temp_path("missing.wav")), std::runtime_error);
}

TEST(WavIo, HeaderInfoDescribesTheFormat) {
    WAVHeader h{};
    h.audioFormat = 1;
    h.numChannels = 2;
    h.sampleRate = 44100;
    h.bitsPerSample = 16;
    h.dataSize = 400;
    EXPECT_EQ(headerInfo(h), "format 1, 2 channel(s), 44100 Hz, 16 bit, 400 data bytes");
}
