#include "wav_io.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

constexpr uint16_t FORMAT_PCM = 1;
constexpr uint16_t FORMAT_FLOAT = 3;
constexpr uint16_t FORMAT_EXTENSIBLE = 0xFFFE;

uint16_t le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

void put_le16(std::ostream& os, uint16_t v) {
    char b[2] = {static_cast<char>(v & 0xFF), static_cast<char>(v >> 8)};
    os.write(b, 2);
}

void put_le32(std::ostream& os, uint32_t v) {
    char b[4] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF),
                 static_cast<char>((v >> 16) & 0xFF), static_cast<char>((v >> 24) & 0xFF)};
    os.write(b, 4);
}

float sample_at(const uint8_t* p, uint16_t format, uint16_t bits) {
    if (format == FORMAT_FLOAT) {
        uint32_t u = le32(p);
        float f;
        std::memcpy(&f, &u, sizeof(f));
        return f;
    }
    if (bits == 16)
        return static_cast<int16_t>(le16(p)) / 32768.0f;
    return static_cast<float>(static_cast<int32_t>(le32(p)) / 2147483648.0);
}

} // namespace

std::string headerInfo(const WAVHeader& header) {
    std::ostringstream os;
    os << "format " << header.audioFormat << ", " << header.numChannels << " channel(s), "
       << header.sampleRate << " Hz, " << header.bitsPerSample << " bit, "
       << header.dataSize << " data bytes";
    return os.str();
}

WavAudio read_wav(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open " + path);

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0)
        throw std::runtime_error(path + " is not a RIFF/WAVE file");

    WAVHeader header{};
    std::memcpy(header.riff, "RIFF", 4);
    std::memcpy(header.wave, "WAVE", 4);
    header.fileSize = le32(bytes.data() + 4);

    bool have_fmt = false;
    const uint8_t* data = nullptr;
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        uint32_t size = le32(chunk + 4);
        size_t body = pos + 8;
        size_t avail = bytes.size() - body;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (size < 16 || size > avail) throw std::runtime_error(path + ": truncated fmt chunk");
            const uint8_t* f = bytes.data() + body;
            std::memcpy(header.fmt, "fmt ", 4);
            header.fmtSize = size;
            header.audioFormat = le16(f);
            header.numChannels = le16(f + 2);
            header.sampleRate = le32(f + 4);
            header.byteRate = le32(f + 8);
            header.blockAlign = le16(f + 12);
            header.bitsPerSample = le16(f + 14);
            if (header.audioFormat == FORMAT_EXTENSIBLE && size >= 26)
                header.audioFormat = le16(f + 24);  // sub-format GUID starts with the tag
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            std::memcpy(header.data, "data", 4);
            header.dataSize = static_cast<uint32_t>(std::min<size_t>(size, avail));
            data = bytes.data() + body;
            break;
        }
        pos = body + size + (size & 1);
    }

    if (!have_fmt) throw std::runtime_error(path + ": no fmt chunk");
    if (!data) throw std::runtime_error(path + ": no data chunk");

    const uint16_t format = header.audioFormat;
    const uint16_t bits = header.bitsPerSample;
    bool supported = (format == FORMAT_PCM && (bits == 16 || bits == 32)) ||
                     (format == FORMAT_FLOAT && bits == 32);
    if (!supported || header.numChannels == 0)
        throw std::runtime_error(path + ": unsupported WAV (" + headerInfo(header) + ")");

    std::cout << "[wav] " << path << ": " << headerInfo(header) << std::endl;

    const size_t width = bits / 8;
    const size_t frame = width * header.numChannels;
    const size_t frames = header.dataSize / frame;

    WavAudio audio;
    audio.sample_rate = header.sampleRate;
    audio.channels = header.numChannels;
    audio.samples.resize(frames);
    for (size_t i = 0; i < frames; ++i) {
        const uint8_t* p = data + i * frame;
        float sum = 0.0f;
        for (uint16_t ch = 0; ch < header.numChannels; ++ch)
            sum += sample_at(p + ch * width, format, bits);
        audio.samples[i] = sum / header.numChannels;
    }
    return audio;
}

void write_wav(const std::string& path, const std::vector<float>& samples, uint32_t sample_rate) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("cannot create " + path);

    const uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
    out.write("RIFF", 4);
    put_le32(out, 36 + data_size);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put_le32(out, 16);
    put_le16(out, FORMAT_PCM);
    put_le16(out, 1);
    put_le32(out, sample_rate);
    put_le32(out, sample_rate * 2);
    put_le16(out, 2);
    put_le16(out, 16);
    out.write("data", 4);
    put_le32(out, data_size);

    for (float s : samples) {
        float c = std::max(-1.0f, std::min(1.0f, s));
        put_le16(out, static_cast<uint16_t>(static_cast<int16_t>(c * 32767.0f)));
    }

    if (!out) throw std::runtime_error("writing " + path + " failed");
}
