#include "overlap_reconstructor.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <utility>
#include <vector>

namespace {

ChunkGeometry geometry(uint32_t chunk, uint32_t overlap) {
    ChunkGeometry g;
    g.chunk_size = chunk;
    g.overlap_size = overlap;
    return g;
}

struct Collector {
    std::vector<std::pair<uint32_t, std::vector<float>>> runs;
    std::vector<float> signal;

    OverlapReconstructor::OutputCallback callback() {
        return [this](uint32_t index, const std::vector<float>& out) {
            runs.emplace_back(index, out);
            signal.insert(signal.end(), out.begin(), out.end());
        };
    }
};

} // namespace

TEST(OverlapReconstructor, AveragesTheOverlapRegion) {
    Collector c;
    OverlapReconstructor r(geometry(4, 2), 3, c.callback());

    EXPECT_TRUE(r.handle(1, {1, 1, 1, 1}));
    EXPECT_TRUE(r.handle(2, {3, 3, 3, 3}));
    EXPECT_TRUE(r.handle(3, {5, 5, 5, 5}));

    EXPECT_EQ(c.signal, (std::vector<float>{1, 1, 2, 2, 4, 4}));
    ASSERT_EQ(c.runs.size(), 3u);
    EXPECT_EQ(c.runs[0].first, 1u);
    EXPECT_EQ(c.runs[2].first, 3u);
    EXPECT_TRUE(r.finished());
}

TEST(OverlapReconstructor, SingleChunkStreamEmitsTheWholeChunk) {
    Collector c;
    OverlapReconstructor r(geometry(4, 2), 1, c.callback());
    r.handle(1, {1, 2, 3, 4});
    EXPECT_EQ(c.signal, (std::vector<float>{1, 2, 3, 4}));
    EXPECT_TRUE(r.finished());
}

TEST(OverlapReconstructor, ZeroOverlapConcatenatesChunks) {
    Collector c;
    OverlapReconstructor r(geometry(3, 0), 2, c.callback());
    r.handle(1, {1, 2, 3});
    r.handle(2, {4, 5, 6});
    EXPECT_EQ(c.signal, (std::vector<float>{1, 2, 3, 4, 5, 6}));
    EXPECT_FALSE(r.has_overlap());
}

TEST(OverlapReconstructor, IgnoresRepeatedOrOlderIndices) {
    Collector c;
    OverlapReconstructor r(geometry(4, 2), 0, c.callback());
    EXPECT_TRUE(r.handle(2, {1, 1, 1, 1}));
    EXPECT_FALSE(r.handle(2, {9, 9, 9, 9}));
    EXPECT_FALSE(r.handle(1, {9, 9, 9, 9}));
    EXPECT_EQ(r.last_index(), 2u);
    EXPECT_EQ(c.signal, (std::vector<float>{1, 1}));
}

TEST(OverlapReconstructor, ChunksAfterTheFinalOneAreIgnored) {
    Collector c;
    OverlapReconstructor r(geometry(4, 2), 1, c.callback());
    EXPECT_TRUE(r.handle(1, {1, 1, 1, 1}));
    EXPECT_FALSE(r.handle(2, {1, 1, 1, 1}));
}

TEST(OverlapReconstructor, FinishFlushesTheHeldTailOfALiveStream) {
    Collector c;
    OverlapReconstructor r(geometry(4, 2), 0, c.callback());
    r.handle(1, {1, 2, 3, 4});
    EXPECT_TRUE(r.has_overlap());

    r.finish();
    EXPECT_EQ(c.signal, (std::vector<float>{1, 2, 3, 4}));
    ASSERT_EQ(c.runs.size(), 2u);
    EXPECT_EQ(c.runs[1].first, 0u);
    EXPECT_FALSE(r.has_overlap());

    r.finish();
    EXPECT_EQ(c.runs.size(), 2u);
}

TEST(OverlapReconstructor, GapFlushesTheOverlapInsteadOfBlending) {
    Collector c;
    OverlapReconstructor r(geometry(4, 2), 0, c.callback());
    r.handle(1, {1, 1, 1, 1});
    r.handle(3, {5, 5, 5, 5});

    ASSERT_EQ(c.runs.size(), 3u);
    EXPECT_EQ(c.runs[1].first, 1u);
    EXPECT_EQ(c.runs[1].second, (std::vector<float>{1, 1}));
    EXPECT_EQ(c.runs[2].second, (std::vector<float>{5, 5}));
}

TEST(OverlapReconstructor, ShortChunkIsZeroPadded) {
    Collector c;
    OverlapReconstructor r(geometry(4, 2), 1, c.callback());
    r.handle(1, {7, 7});
    EXPECT_EQ(c.signal, (std::vector<float>{7, 7, 0, 0}));
}

TEST(OverlapReconstructor, RebuildsSlicedSignalExactly) {
    ChunkGeometry g;  // 16000 / 1600
    std::vector<float> signal(48000);
    for (size_t i = 0; i < signal.size(); ++i)
        signal[i] = 0.5f * std::sin(0.01f * static_cast<float>(i));

    SignalSlicer slicer(signal.data(), signal.size(), g);
    Collector c;
    OverlapReconstructor r(g, slicer.total_chunks(), c.callback());

    AudioChunk chunk;
    while (slicer.next(chunk)) r.handle(chunk.index, chunk.samples);

    ASSERT_EQ(slicer.total_chunks(), 4u);
    ASSERT_EQ(c.signal.size(), 4u * g.hop_size());
    for (size_t i = 0; i < signal.size(); ++i)
        ASSERT_EQ(c.signal[i], signal[i]) << "sample " << i;
}
