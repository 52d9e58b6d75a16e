#pragma once

#include "audio_transform.hpp"
#include "session.hpp"
#include "session_stats.hpp"
#include "slicer.hpp"

#include <cstdint>
#include <utility>
#include <vector>

struct CompressConfig {
    ChunkGeometry geometry;
    uint32_t num_streams = 6;
    bool realtime = false;       // wait chunk_size / sample_rate after each chunk
    bool keep_chunks = false;
};

struct CompressResult {
    std::vector<float> samples;  // reconstruction, same length as the input
    std::vector<std::pair<uint32_t, std::vector<float>>> chunks;
    // Every encoded chunk as a framed data message (u32 length | body),
    // the same layout as the receiver's packet log
    std::vector<uint8_t> encoded;
    SessionReport report;
};

// Runs slicer -> encode -> decode -> OverlapReconstructor on one thread,
// with no network in between. A chunk whose encode or decode fails is
// skipped; cancellation returns what was reconstructed so far.
CompressResult compress_signal(const std::vector<float>& samples, uint32_t sample_rate,
                               const CompressConfig& config, AudioTransform& transform,
                               const CancellationToken& cancel);
