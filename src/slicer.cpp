#include "slicer.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>

void ChunkGeometry::validate() const {
    if (chunk_size == 0)
        throw std::invalid_argument("chunk_size must be positive");
    if (overlap_size >= chunk_size)
        throw std::invalid_argument("overlap_size (" + std::to_string(overlap_size) +
                                    ") must be smaller than chunk_size (" +
                                    std::to_string(chunk_size) + ")");
}

uint32_t count_chunks(size_t num_samples, const ChunkGeometry& geometry) {
    geometry.validate();
    size_t hop = geometry.hop_size();
    return static_cast<uint32_t>((num_samples + hop - 1) / hop);
}

int64_t now_us() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

SignalSlicer::SignalSlicer(const float* samples, size_t num_samples, const ChunkGeometry& geometry)
    : samples_(samples), num_samples_(num_samples), geometry_(geometry),
      total_chunks_(count_chunks(num_samples, geometry)) {}

bool SignalSlicer::next(AudioChunk& out) {
    if (cursor_ >= num_samples_) return false;

    size_t len = std::min(static_cast<size_t>(geometry_.chunk_size), num_samples_ - cursor_);

    out.index = next_index_++;
    out.timestamp_us = now_us();
    out.samples.assign(geometry_.chunk_size, 0.0f);
    std::copy(samples_ + cursor_, samples_ + cursor_ + len, out.samples.begin());

    cursor_ += geometry_.hop_size();
    return true;
}

LiveSlicer::LiveSlicer(const ChunkGeometry& geometry) : geometry_(geometry) {
    geometry_.validate();
}

std::vector<AudioChunk> LiveSlicer::push(const float* samples, size_t count) {
    std::vector<AudioChunk> chunks;
    buffer_.insert(buffer_.end(), samples, samples + count);

    while (buffer_.size() >= geometry_.chunk_size) {
        AudioChunk c;
        c.index = next_index_++;
        c.timestamp_us = now_us();
        c.samples.assign(buffer_.begin(), buffer_.begin() + geometry_.chunk_size);
        chunks.push_back(std::move(c));

        buffer_.erase(buffer_.begin(), buffer_.begin() + geometry_.hop_size());
    }

    return chunks;
}
