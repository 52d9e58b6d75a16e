#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <cstddef>

constexpr uint8_t WIRE_VERSION = 1;

enum class MessageType : uint8_t {
    Metadata = 1,
    Data = 2,
    End = 3
};

struct StreamMetadata {
    uint32_t sample_rate = 16000;
    uint32_t chunk_size = 16000;
    uint32_t overlap_size = 1600;
    uint32_t num_streams = 6;
    uint32_t total_chunks = 0;   // 0 = live / unbounded
    uint64_t total_samples = 0;  // 0 = unknown
    std::string codec;

    uint32_t hop_size() const { return chunk_size - overlap_size; }
};

struct AudioPacket {
    uint32_t chunk_index = 0;
    int64_t timestamp_us = 0;
    std::vector<uint8_t> payload;
    std::vector<uint32_t> shape;  // whatever the transform needs to invert itself
};

struct WireMessage {
    MessageType type = MessageType::End;
    StreamMetadata metadata;  // valid for Metadata
    AudioPacket packet;       // valid for Data
};

// Message body layout (all integers big-endian):
// [0]     version (1 byte)
// [1]     message type (1 byte)
// [2...]  fields: tag (1 byte) | length (4 byte) | value (length byte)
// Unknown tags are skipped.
std::vector<uint8_t> serialize_metadata(const StreamMetadata& meta);
std::vector<uint8_t> serialize_packet(const AudioPacket& pkt);
std::vector<uint8_t> serialize_end();

// Throws MalformedMessage
WireMessage parse_message(const uint8_t* data, std::size_t len);

// Big-endian helpers shared with the framing layer
void put_u32(std::vector<uint8_t>& out, uint32_t value);
uint32_t get_u32(const uint8_t* data);
