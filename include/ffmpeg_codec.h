#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

#include "audio_transform.hpp"
#include <string>
#include <vector>

// Encodes every chunk independently with a libavcodec audio encoder chosen by
// name ("flac", "libopus", "aac", ...). A fresh codec context is opened per
// call so no state leaks between chunks.
//
// Payload: u32 extradata size | extradata | (u32 packet size | packet)*
// Shape:   {sample count, encoder delay in samples, encoder frame size}
class FFmpegAudioTransform : public AudioTransform {
public:
    // Bit rate asked from lossy encoders for each requested stream
    static constexpr int64_t BITRATE_PER_STREAM = 1500;

    explicit FFmpegAudioTransform(const std::string& codec_name = "flac");

    void prepare(uint32_t sample_rate) override;

    EncodedChunk encode(const std::vector<float>& samples, uint32_t num_streams) override;
    std::vector<float> decode(const std::vector<uint8_t>& payload,
                              const std::vector<uint32_t>& shape) override;

    std::string name() const override { return m_codecName; }

private:
    std::string m_codecName;
    int m_sampleRate = 16000;

    const AVCodec* encoder = nullptr;
    const AVCodec* decoder = nullptr;
};
