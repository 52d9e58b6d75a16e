#include "packet_parser.hpp"
#include "stream_errors.hpp"
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <string>

namespace {

// Field tags, scoped by message type
enum MetadataTag : uint8_t {
    META_SAMPLE_RATE = 1,
    META_CHUNK_SIZE = 2,
    META_OVERLAP_SIZE = 3,
    META_NUM_STREAMS = 4,
    META_TOTAL_CHUNKS = 5,
    META_TOTAL_SAMPLES = 6,
    META_CODEC = 7
};

enum DataTag : uint8_t {
    DATA_CHUNK_INDEX = 1,
    DATA_TIMESTAMP = 2,
    DATA_PAYLOAD = 3,
    DATA_SHAPE = 4
};

enum EndTag : uint8_t {
    END_FLAG = 1
};

constexpr std::size_t HEADER_SIZE = 2;
constexpr std::size_t FIELD_HEADER_SIZE = 5;

void put_u64(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 7; i >= 0; --i)
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
}

uint64_t get_u64(const uint8_t* data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i)
        value = (value << 8) | data[i];
    return value;
}

void begin_message(std::vector<uint8_t>& out, MessageType type) {
    out.push_back(WIRE_VERSION);
    out.push_back(static_cast<uint8_t>(type));
}

void put_field(std::vector<uint8_t>& out, uint8_t tag, const uint8_t* value, std::size_t len) {
    out.push_back(tag);
    put_u32(out, static_cast<uint32_t>(len));
    out.insert(out.end(), value, value + len);
}

void put_u32_field(std::vector<uint8_t>& out, uint8_t tag, uint32_t value) {
    out.push_back(tag);
    put_u32(out, 4);
    put_u32(out, value);
}

void put_u64_field(std::vector<uint8_t>& out, uint8_t tag, uint64_t value) {
    out.push_back(tag);
    put_u32(out, 8);
    put_u64(out, value);
}

struct Field {
    uint8_t tag;
    const uint8_t* value;
    uint32_t len;
};

// Walks the tagged fields of a message body
class FieldReader {
public:
    FieldReader(const uint8_t* data, std::size_t len) : data_(data), len_(len) {}

    bool next(Field& field) {
        if (pos_ == len_) return false;
        if (len_ - pos_ < FIELD_HEADER_SIZE)
            throw MalformedMessage("truncated field header at offset " + std::to_string(pos_));

        field.tag = data_[pos_];
        field.len = get_u32(data_ + pos_ + 1);
        pos_ += FIELD_HEADER_SIZE;

        if (field.len > len_ - pos_)
            throw MalformedMessage("field " + std::to_string(field.tag) + " overruns message (" +
                                   std::to_string(field.len) + " byte)");
        field.value = data_ + pos_;
        pos_ += field.len;
        return true;
    }

private:
    const uint8_t* data_;
    std::size_t len_;
    std::size_t pos_ = 0;
};

uint32_t field_u32(const Field& f) {
    if (f.len != 4) throw MalformedMessage("field " + std::to_string(f.tag) + " must be 4 byte");
    return get_u32(f.value);
}

uint64_t field_u64(const Field& f) {
    if (f.len != 8) throw MalformedMessage("field " + std::to_string(f.tag) + " must be 8 byte");
    return get_u64(f.value);
}

StreamMetadata parse_metadata_fields(FieldReader& reader) {
    StreamMetadata meta;
    unsigned seen = 0;
    Field f;
    while (reader.next(f)) {
        switch (f.tag) {
            case META_SAMPLE_RATE:   meta.sample_rate = field_u32(f); break;
            case META_CHUNK_SIZE:    meta.chunk_size = field_u32(f); break;
            case META_OVERLAP_SIZE:  meta.overlap_size = field_u32(f); break;
            case META_NUM_STREAMS:   meta.num_streams = field_u32(f); break;
            case META_TOTAL_CHUNKS:  meta.total_chunks = field_u32(f); break;
            case META_TOTAL_SAMPLES: meta.total_samples = field_u64(f); break;
            case META_CODEC:
                meta.codec.assign(reinterpret_cast<const char*>(f.value), f.len);
                break;
            default: continue;
        }
        if (f.tag < 32) seen |= 1u << f.tag;
    }

    const unsigned required = (1u << META_SAMPLE_RATE) | (1u << META_CHUNK_SIZE) |
                              (1u << META_OVERLAP_SIZE) | (1u << META_NUM_STREAMS) |
                              (1u << META_TOTAL_CHUNKS);
    if ((seen & required) != required)
        throw MalformedMessage("metadata message is missing required fields");
    return meta;
}

AudioPacket parse_data_fields(FieldReader& reader) {
    AudioPacket pkt;
    bool has_index = false;
    bool has_payload = false;
    Field f;
    while (reader.next(f)) {
        switch (f.tag) {
            case DATA_CHUNK_INDEX:
                pkt.chunk_index = field_u32(f);
                has_index = true;
                break;
            case DATA_TIMESTAMP:
                pkt.timestamp_us = static_cast<int64_t>(field_u64(f));
                break;
            case DATA_PAYLOAD:
                pkt.payload.assign(f.value, f.value + f.len);
                has_payload = true;
                break;
            case DATA_SHAPE: {
                if (f.len < 4) throw MalformedMessage("shape field too short");
                uint32_t count = get_u32(f.value);
                if (f.len != 4 + static_cast<uint64_t>(count) * 4)
                    throw MalformedMessage("shape field length does not match its count");
                pkt.shape.resize(count);
                for (uint32_t i = 0; i < count; ++i)
                    pkt.shape[i] = get_u32(f.value + 4 + i * 4);
                break;
            }
            default:
                break;
        }
    }

    if (!has_index) throw MalformedMessage("data message without chunk index");
    if (!has_payload) throw MalformedMessage("data message without payload");
    if (pkt.chunk_index == 0) throw MalformedMessage("chunk index must start at 1");
    return pkt;
}

void parse_end_fields(FieldReader& reader) {
    bool end = false;
    Field f;
    while (reader.next(f)) {
        if (f.tag == END_FLAG) {
            if (f.len != 1) throw MalformedMessage("end flag must be 1 byte");
            end = f.value[0] != 0;
        }
    }
    if (!end) throw MalformedMessage("end message without end flag");
}

} // namespace

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back((value >> 24) & 0xFF);
    out.push_back((value >> 16) & 0xFF);
    out.push_back((value >> 8) & 0xFF);
    out.push_back(value & 0xFF);
}

uint32_t get_u32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

std::vector<uint8_t> serialize_metadata(const StreamMetadata& meta) {
    std::vector<uint8_t> buffer;
    buffer.reserve(HEADER_SIZE + 6 * FIELD_HEADER_SIZE + 28 + FIELD_HEADER_SIZE + meta.codec.size());

    begin_message(buffer, MessageType::Metadata);
    put_u32_field(buffer, META_SAMPLE_RATE, meta.sample_rate);
    put_u32_field(buffer, META_CHUNK_SIZE, meta.chunk_size);
    put_u32_field(buffer, META_OVERLAP_SIZE, meta.overlap_size);
    put_u32_field(buffer, META_NUM_STREAMS, meta.num_streams);
    put_u32_field(buffer, META_TOTAL_CHUNKS, meta.total_chunks);
    put_u64_field(buffer, META_TOTAL_SAMPLES, meta.total_samples);
    put_field(buffer, META_CODEC, reinterpret_cast<const uint8_t*>(meta.codec.data()), meta.codec.size());
    return buffer;
}

std::vector<uint8_t> serialize_packet(const AudioPacket& pkt) {
    std::vector<uint8_t> buffer;
    buffer.reserve(HEADER_SIZE + 4 * FIELD_HEADER_SIZE + 12 + pkt.payload.size() + 4 + 4 * pkt.shape.size());

    begin_message(buffer, MessageType::Data);
    put_u32_field(buffer, DATA_CHUNK_INDEX, pkt.chunk_index);
    put_u64_field(buffer, DATA_TIMESTAMP, static_cast<uint64_t>(pkt.timestamp_us));
    put_field(buffer, DATA_PAYLOAD, pkt.payload.data(), pkt.payload.size());

    buffer.push_back(DATA_SHAPE);
    put_u32(buffer, static_cast<uint32_t>(4 + 4 * pkt.shape.size()));
    put_u32(buffer, static_cast<uint32_t>(pkt.shape.size()));
    for (uint32_t dim : pkt.shape) put_u32(buffer, dim);

    return buffer;
}

std::vector<uint8_t> serialize_end() {
    std::vector<uint8_t> buffer;
    begin_message(buffer, MessageType::End);
    const uint8_t flag = 1;
    put_field(buffer, END_FLAG, &flag, 1);
    return buffer;
}

WireMessage parse_message(const uint8_t* data, std::size_t len) {
    if (len < HEADER_SIZE)
        throw MalformedMessage("message too short (" + std::to_string(len) + " byte)");
    if (data[0] != WIRE_VERSION)
        throw MalformedMessage("unsupported wire version " + std::to_string(data[0]));

    WireMessage msg;
    FieldReader reader(data + HEADER_SIZE, len - HEADER_SIZE);

    switch (data[1]) {
        case static_cast<uint8_t>(MessageType::Metadata):
            msg.type = MessageType::Metadata;
            msg.metadata = parse_metadata_fields(reader);
            break;
        case static_cast<uint8_t>(MessageType::Data):
            msg.type = MessageType::Data;
            msg.packet = parse_data_fields(reader);
            break;
        case static_cast<uint8_t>(MessageType::End):
            msg.type = MessageType::End;
            parse_end_fields(reader);
            break;
        default:
            throw MalformedMessage("unknown message type " + std::to_string(data[1]));
    }
    return msg;
}
