#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct WAVHeader {
    char riff[4];
    uint32_t fileSize;
    char wave[4];
    char fmt[4];
    uint32_t fmtSize;
    uint16_t audioFormat;
    uint16_t numChannels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
    char data[4];
    uint32_t dataSize;
};

struct WavAudio {
    uint32_t sample_rate = 0;
    uint16_t channels = 0;       // of the file; samples are always mono
    std::vector<float> samples;  // [-1, 1]
};

std::string headerInfo(const WAVHeader& header);

// Reads 16/32-bit PCM or 32-bit float WAV, mixing every channel down to mono.
// Throws std::runtime_error on unreadable or unsupported files.
WavAudio read_wav(const std::string& path);

// Writes mono 16-bit PCM, clipping to [-1, 1]
void write_wav(const std::string& path, const std::vector<float>& samples, uint32_t sample_rate);
