#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>

struct AudioChunk {
    uint32_t index = 0;          // 1-based
    int64_t timestamp_us = 0;    // capture time, microseconds since epoch
    std::vector<float> samples;
};

struct ChunkGeometry {
    uint32_t chunk_size = 16000;
    uint32_t overlap_size = 1600;

    uint32_t hop_size() const { return chunk_size - overlap_size; }

    // Throws std::invalid_argument unless 0 <= overlap < chunk
    void validate() const;
};

// Number of chunks a finite signal of `num_samples` splits into
uint32_t count_chunks(size_t num_samples, const ChunkGeometry& geometry);

int64_t now_us();

// Lazily slices a finite signal into overlapping chunks, advancing by hop.
// The signal must outlive the slicer.
class SignalSlicer {
public:
    SignalSlicer(const float* samples, size_t num_samples, const ChunkGeometry& geometry);

    // Fills `out` with the next chunk; the last one is zero-padded.
    // Returns false when the signal is exhausted.
    bool next(AudioChunk& out);

    uint32_t total_chunks() const { return total_chunks_; }
    uint32_t produced() const { return next_index_ - 1; }

private:
    const float* samples_;
    size_t num_samples_;
    ChunkGeometry geometry_;
    uint32_t total_chunks_;
    size_t cursor_ = 0;
    uint32_t next_index_ = 1;
};

// Accumulates bursts from an unbounded source and emits a chunk whenever a
// full chunk is buffered. After each chunk the buffer advances by hop_size,
// so the overlap stays buffered for the next chunk.
class LiveSlicer {
public:
    explicit LiveSlicer(const ChunkGeometry& geometry);

    std::vector<AudioChunk> push(const float* samples, size_t count);

    size_t buffered() const { return buffer_.size(); }
    uint32_t produced() const { return next_index_ - 1; }

private:
    ChunkGeometry geometry_;
    std::vector<float> buffer_;
    uint32_t next_index_ = 1;
};
