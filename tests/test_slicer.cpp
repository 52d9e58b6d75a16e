#include "slicer.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace {

std::vector<float> ramp(size_t n) {
    std::vector<float> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = static_cast<float>(i);
    return v;
}

ChunkGeometry geometry(uint32_t chunk, uint32_t overlap) {
    ChunkGeometry g;
    g.chunk_size = chunk;
    g.overlap_size = overlap;
    return g;
}

} // namespace

TEST(ChunkCount, IsCeilingOfLengthOverHop) {
    ChunkGeometry g;  // 16000 / 1600, hop 14400
    EXPECT_EQ(count_chunks(0, g), 0u);
    EXPECT_EQ(count_chunks(1, g), 1u);
    EXPECT_EQ(count_chunks(14400, g), 1u);
    EXPECT_EQ(count_chunks(14401, g), 2u);
    EXPECT_EQ(count_chunks(48000, g), 4u);
}

TEST(ChunkGeometry, RejectsOverlapNotSmallerThanChunk) {
    EXPECT_THROW(geometry(0, 0).validate(), std::invalid_argument);
    EXPECT_THROW(geometry(100, 100).validate(), std::invalid_argument);
    EXPECT_THROW(geometry(100, 150).validate(), std::invalid_argument);
    EXPECT_NO_THROW(geometry(100, 0).validate());
    EXPECT_NO_THROW(geometry(100, 99).validate());
}

TEST(SignalSlicer, ProducesOverlappingChunksAndPadsTheLastOne) {
    std::vector<float> signal = ramp(25);
    SignalSlicer slicer(signal.data(), signal.size(), geometry(10, 3));  // hop 7
    ASSERT_EQ(slicer.total_chunks(), 4u);

    std::vector<AudioChunk> chunks;
    AudioChunk c;
    while (slicer.next(c)) chunks.push_back(c);

    ASSERT_EQ(chunks.size(), 4u);
    EXPECT_EQ(slicer.produced(), 4u);
    for (size_t k = 0; k < chunks.size(); ++k) {
        EXPECT_EQ(chunks[k].index, k + 1);
        ASSERT_EQ(chunks[k].samples.size(), 10u);
        EXPECT_GT(chunks[k].timestamp_us, 0);
    }

    EXPECT_FLOAT_EQ(chunks[1].samples[0], 7.0f);
    // tail of chunk 1 is the head of chunk 2
    EXPECT_FLOAT_EQ(chunks[0].samples[7], chunks[1].samples[0]);
    EXPECT_FLOAT_EQ(chunks[0].samples[9], chunks[1].samples[2]);

    const std::vector<float>& last = chunks[3].samples;
    EXPECT_FLOAT_EQ(last[0], 21.0f);
    EXPECT_FLOAT_EQ(last[3], 24.0f);
    for (size_t i = 4; i < last.size(); ++i) EXPECT_EQ(last[i], 0.0f);
}

TEST(SignalSlicer, EmptySignalHasNoChunks) {
    SignalSlicer slicer(nullptr, 0, geometry(10, 3));
    AudioChunk c;
    EXPECT_EQ(slicer.total_chunks(), 0u);
    EXPECT_FALSE(slicer.next(c));
}

TEST(LiveSlicer, EmitsWhenAFullChunkIsBufferedAndKeepsTheOverlap) {
    LiveSlicer slicer(geometry(10, 3));  // hop 7
    std::vector<float> signal = ramp(17);

    auto out = slicer.push(signal.data(), 5);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(slicer.buffered(), 5u);

    out = slicer.push(signal.data() + 5, 8);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].index, 1u);
    EXPECT_FLOAT_EQ(out[0].samples.front(), 0.0f);
    EXPECT_FLOAT_EQ(out[0].samples.back(), 9.0f);
    EXPECT_EQ(slicer.buffered(), 6u);

    out = slicer.push(signal.data() + 13, 4);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].index, 2u);
    EXPECT_FLOAT_EQ(out[0].samples.front(), 7.0f);
    EXPECT_FLOAT_EQ(out[0].samples.back(), 16.0f);
    EXPECT_EQ(slicer.buffered(), 3u);
    EXPECT_EQ(slicer.produced(), 2u);
}

TEST(LiveSlicer, OneLargeBurstYieldsSeveralChunks) {
    LiveSlicer slicer(geometry(10, 2));  // hop 8
    std::vector<float> signal = ramp(30);
    auto out = slicer.push(signal.data(), signal.size());
    // chunks start at 0, 8, 16 (16 + 10 = 26 <= 30); 24 + 10 > 30
    ASSERT_EQ(out.size(), 3u);
    EXPECT_FLOAT_EQ(out[2].samples.front(), 16.0f);
    EXPECT_EQ(slicer.buffered(), 6u);
}
