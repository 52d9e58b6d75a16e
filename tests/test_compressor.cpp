#include "compressor.hpp"
#include "packet_parser.hpp"
#include "stream_errors.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

std::vector<float> make_signal(size_t n) {
    std::vector<float> v(n);
    for (size_t i = 0; i < n; ++i)
        v[i] = 0.5f * std::sin(0.021f * static_cast<float>(i));
    return v;
}

CompressConfig compress_config(uint32_t chunk, uint32_t overlap) {
    CompressConfig c;
    c.geometry.chunk_size = chunk;
    c.geometry.overlap_size = overlap;
    return c;
}

class FailingDecode : public IdentityTransform {
public:
    explicit FailingDecode(int fail_at) : fail_at_(fail_at) {}

    std::vector<float> decode(const std::vector<uint8_t>& payload, const std::vector<uint32_t>& shape) override {
        if (++calls_ == fail_at_) throw TransformFailure("bad chunk");
        return IdentityTransform::decode(payload, shape);
    }

private:
    int fail_at_;
    int calls_ = 0;
};

class CancelOnEncode : public IdentityTransform {
public:
    CancelOnEncode(CancellationToken& cancel, int at) : cancel_(cancel), at_(at) {}

    EncodedChunk encode(const std::vector<float>& samples, uint32_t num_streams) override {
        if (++calls_ == at_) cancel_.cancel();
        return IdentityTransform::encode(samples, num_streams);
    }

private:
    CancellationToken& cancel_;
    int at_;
    int calls_ = 0;
};

} // namespace

TEST(CompressSignal, IdentityTransformReproducesTheInput) {
    std::vector<float> signal = make_signal(3000);
    IdentityTransform codec;
    CancellationToken cancel;
    CompressConfig config = compress_config(400, 40);
    config.keep_chunks = true;

    CompressResult r = compress_signal(signal, 16000, config, codec, cancel);

    EXPECT_EQ(r.samples, signal);
    EXPECT_EQ(r.chunks.size(), 9u);
    EXPECT_TRUE(r.report.completed) << r.report.error;
    EXPECT_EQ(r.report.role, "local");
    EXPECT_EQ(r.report.packets, 9u);
    EXPECT_EQ(r.report.chunks_processed, 9u);
    EXPECT_EQ(r.report.stage(Stage::Encode).count, 9u);
    EXPECT_EQ(r.report.stage(Stage::Decode).count, 9u);
}

TEST(CompressSignal, EncodedDumpHoldsOneDataMessagePerChunk) {
    std::vector<float> signal = make_signal(1000);
    IdentityTransform codec;
    CancellationToken cancel;

    CompressResult r = compress_signal(signal, 16000, compress_config(400, 0), codec, cancel);
    EXPECT_EQ(r.report.bytes_transferred, r.encoded.size());

    std::vector<uint32_t> indices;
    size_t pos = 0;
    while (pos < r.encoded.size()) {
        ASSERT_LE(pos + 4, r.encoded.size());
        uint32_t len = get_u32(r.encoded.data() + pos);
        pos += 4;
        ASSERT_LE(pos + len, r.encoded.size());
        WireMessage msg = parse_message(r.encoded.data() + pos, len);
        pos += len;
        ASSERT_EQ(msg.type, MessageType::Data);
        indices.push_back(msg.packet.chunk_index);
    }
    EXPECT_EQ(indices, (std::vector<uint32_t>{1, 2, 3}));
}

TEST(CompressSignal, DecodeFailureSkipsTheChunk) {
    std::vector<float> signal = make_signal(4500);  // 5 chunks of 1000, hop 900
    FailingDecode codec(2);
    CancellationToken cancel;

    CompressResult r = compress_signal(signal, 16000, compress_config(1000, 100), codec, cancel);

    EXPECT_TRUE(r.report.completed);
    EXPECT_EQ(r.report.chunks_skipped, 1u);
    EXPECT_EQ(r.report.chunks_processed, 4u);
    EXPECT_EQ(r.samples.size(), 4u * 900u + 100u);
}

TEST(CompressSignal, CancellationReturnsThePartialReconstruction) {
    std::vector<float> signal = make_signal(4500);
    CancellationToken cancel;
    CancelOnEncode codec(cancel, 2);

    CompressResult r = compress_signal(signal, 16000, compress_config(1000, 100), codec, cancel);

    EXPECT_FALSE(r.report.completed);
    EXPECT_EQ(r.report.error, "cancelled");
    EXPECT_EQ(r.report.chunks_processed, 2u);
    // two hops, then the held overlap of chunk 2
    ASSERT_EQ(r.samples.size(), 1900u);
    for (size_t i = 0; i < 900; ++i) ASSERT_EQ(r.samples[i], signal[i]);
}

TEST(CompressSignal, RejectsABadGeometry) {
    IdentityTransform codec;
    CancellationToken cancel;
    EXPECT_THROW(compress_signal(make_signal(10), 16000, compress_config(100, 100), codec, cancel),
                 std::invalid_argument);
    EXPECT_THROW(compress_signal(make_signal(10), 0, compress_config(100, 10), codec, cancel),
                 std::invalid_argument);
}
