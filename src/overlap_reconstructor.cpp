#include "overlap_reconstructor.hpp"
#include <iostream>

OverlapReconstructor::OverlapReconstructor(const ChunkGeometry& geometry, uint32_t total_chunks,
                                           OutputCallback callback)
    : geometry_(geometry), total_chunks_(total_chunks), callback_(std::move(callback)) {
    geometry_.validate();
}

bool OverlapReconstructor::handle(uint32_t index, std::vector<float> chunk) {
    if (finished_) {
        std::cerr << "[reconstructor] Chunk " << index << " arrived after the final chunk, ignored" << std::endl;
        return false;
    }
    if (index <= last_index_) {
        std::cerr << "[reconstructor] Out of order chunk " << index
                  << " (last " << last_index_ << "), ignored" << std::endl;
        return false;
    }

    const uint32_t chunk_size = geometry_.chunk_size;
    const uint32_t overlap = geometry_.overlap_size;
    const uint32_t hop = geometry_.hop_size();

    if (chunk.size() != chunk_size) {
        std::cerr << "[reconstructor] Chunk " << index << " has " << chunk.size()
                  << " samples, expected " << chunk_size << std::endl;
        chunk.resize(chunk_size, 0.0f);
    }

    // Skipped chunks: the held tail belongs to another time position
    if (last_index_ != 0 && index != last_index_ + 1 && overlap_) {
        std::cerr << "[reconstructor] Gap before chunk " << index
                  << ", restarting overlap blending" << std::endl;
        flush_overlap(last_index_);
    }

    bool had_overlap = overlap_.has_value();
    if (had_overlap) {
        const std::vector<float>& prev = *overlap_;
        for (uint32_t i = 0; i < overlap; ++i)
            chunk[i] = (prev[i] + chunk[i]) / 2.0f;
        overlap_.reset();
    }

    last_index_ = index;
    bool is_final = total_chunks_ > 0 && index >= total_chunks_;

    if (!is_final) {
        if (overlap > 0)
            overlap_.emplace(chunk.end() - overlap, chunk.end());
        chunk.resize(hop);
        callback_(index, chunk);
        return true;
    }

    if (had_overlap) chunk.resize(hop);
    finished_ = true;
    callback_(index, chunk);
    return true;
}

void OverlapReconstructor::finish() {
    if (finished_) return;
    finished_ = true;
    if (overlap_) flush_overlap(0);
}

void OverlapReconstructor::flush_overlap(uint32_t index) {
    std::vector<float> tail = std::move(*overlap_);
    overlap_.reset();
    callback_(index, tail);
}
