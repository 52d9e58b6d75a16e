#include "audio_transform.hpp"
#include "stream_errors.hpp"
#include <cstring>

EncodedChunk IdentityTransform::encode(const std::vector<float>& samples, uint32_t num_streams) {
    (void)num_streams;

    EncodedChunk out;
    out.payload.reserve(samples.size() * 4);
    for (float s : samples) {
        uint32_t bits;
        std::memcpy(&bits, &s, sizeof(bits));
        out.payload.push_back((bits >> 24) & 0xFF);
        out.payload.push_back((bits >> 16) & 0xFF);
        out.payload.push_back((bits >> 8) & 0xFF);
        out.payload.push_back(bits & 0xFF);
    }
    out.shape = {static_cast<uint32_t>(samples.size())};
    return out;
}

std::vector<float> IdentityTransform::decode(const std::vector<uint8_t>& payload,
                                             const std::vector<uint32_t>& shape) {
    if (shape.size() != 1)
        throw TransformFailure("identity payload needs a one-dimensional shape");
    if (payload.size() != static_cast<size_t>(shape[0]) * 4)
        throw TransformFailure("identity payload is " + std::to_string(payload.size()) +
                               " byte, shape says " + std::to_string(shape[0]) + " samples");

    std::vector<float> samples(shape[0]);
    for (size_t i = 0; i < samples.size(); ++i) {
        const uint8_t* p = payload.data() + i * 4;
        uint32_t bits = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
                        (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
        std::memcpy(&samples[i], &bits, sizeof(bits));
    }
    return samples;
}
