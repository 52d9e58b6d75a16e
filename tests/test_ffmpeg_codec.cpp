#include "ffmpeg_codec.h"
#include "stream_errors.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

std::vector<float> tone(size_t n) {
    std::vector<float> v(n);
    for (size_t i = 0; i < n; ++i)
        v[i] = 0.5f * std::sin(2.0f * 3.14159265f * 440.0f * static_cast<float>(i) / 16000.0f);
    return v;
}

} // namespace

TEST(FFmpegAudioTransform, FlacRoundTripIsNearlyLossless) {
    FFmpegAudioTransform codec("flac");
    codec.prepare(16000);
    EXPECT_EQ(codec.name(), "flac");

    std::vector<float> in = tone(16000);
    EncodedChunk enc = codec.encode(in, 6);
    ASSERT_GE(enc.shape.size(), 2u);
    EXPECT_EQ(enc.shape[0], 16000u);
    EXPECT_FALSE(enc.payload.empty());

    std::vector<float> out = codec.decode(enc.payload, enc.shape);
    ASSERT_EQ(out.size(), in.size());
    for (size_t i = 0; i < in.size(); i += 97)
        EXPECT_NEAR(out[i], in[i], 1e-3) << "sample " << i;
}

TEST(FFmpegAudioTransform, GarbageIsATransformFailure) {
    FFmpegAudioTransform codec("flac");
    codec.prepare(16000);

    EXPECT_THROW(codec.decode({1, 2, 3}, {100}), TransformFailure);
    EXPECT_THROW(codec.decode({1, 2}, {100, 0, 0}), TransformFailure);
    EXPECT_THROW(codec.decode({0, 0, 0, 50, 1, 2}, {100, 0, 0}), TransformFailure);
}

TEST(FFmpegAudioTransform, UnknownEncoderIsRejected) {
    EXPECT_THROW(FFmpegAudioTransform("no-such-codec"), std::runtime_error);
}
