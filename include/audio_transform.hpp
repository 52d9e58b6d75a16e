#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct EncodedChunk {
    std::vector<uint8_t> payload;
    std::vector<uint32_t> shape;
};

// Codec capability injected into both endpoints. Each call is independent:
// implementations keep no state from one chunk to the next, and one worker
// uses an instance at a time. Failures are reported as TransformFailure.
class AudioTransform {
public:
    virtual ~AudioTransform() = default;

    // Called once per session, before the first encode/decode
    virtual void prepare(uint32_t sample_rate) { (void)sample_rate; }

    virtual EncodedChunk encode(const std::vector<float>& samples, uint32_t num_streams) = 0;
    virtual std::vector<float> decode(const std::vector<uint8_t>& payload,
                                      const std::vector<uint32_t>& shape) = 0;

    // Travels in the stream metadata; both ends must agree
    virtual std::string name() const = 0;
};

// Raw float32 samples in big-endian byte order, shape = {sample count}
class IdentityTransform : public AudioTransform {
public:
    EncodedChunk encode(const std::vector<float>& samples, uint32_t num_streams) override;
    std::vector<float> decode(const std::vector<uint8_t>& payload,
                              const std::vector<uint32_t>& shape) override;
    std::string name() const override { return "identity"; }
};
