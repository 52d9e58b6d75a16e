#pragma once

#include "slicer.hpp"
#include <functional>
#include <optional>
#include <vector>
#include <cstdint>

// Merges decoded chunks back into a continuous, non-overlapping signal by
// averaging the overlap region of neighbouring chunks.
class OverlapReconstructor {
public:
    // Receives every emitted run of samples, tagged with the chunk it came
    // from (0 for the tail flushed by finish()).
    using OutputCallback = std::function<void(uint32_t chunk_index, const std::vector<float>&)>;

    // total_chunks == 0 means a live stream with no known final chunk
    OverlapReconstructor(const ChunkGeometry& geometry, uint32_t total_chunks, OutputCallback callback);

    // Chunks must arrive with strictly increasing indices; anything else is
    // logged and ignored (returns false).
    bool handle(uint32_t index, std::vector<float> chunk);

    // Emits the pending overlap tail when the final chunk never arrived
    // (live stream, or a finite stream that ended early).
    void finish();

    bool has_overlap() const { return overlap_.has_value(); }
    bool finished() const { return finished_; }
    uint32_t last_index() const { return last_index_; }

private:
    void flush_overlap(uint32_t index);

    ChunkGeometry geometry_;
    uint32_t total_chunks_;
    OutputCallback callback_;

    std::optional<std::vector<float>> overlap_;
    uint32_t last_index_ = 0;
    bool finished_ = false;
};
