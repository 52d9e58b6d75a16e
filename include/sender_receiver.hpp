#pragma once

#include "audio_transform.hpp"
#include "bounded_queue.hpp"
#include "packet_parser.hpp"
#include "session.hpp"
#include "session_stats.hpp"
#include "slicer.hpp"
#include "tcp_transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

struct SenderConfig {
    std::string host = "localhost";
    int port = 8888;
    ChunkGeometry geometry;
    uint32_t num_streams = 6;

    bool enable_rate_limit = false;
    size_t rate_limit_bps = 375;    // 3 kbps

    bool realtime = false;          // pace chunks at playback speed
    size_t queue_capacity = 10;
    std::chrono::milliseconds poll_interval{100};

    // Called on every state change, possibly from a pipeline thread
    std::function<void(SessionState)> on_state_change;
};

// Streams one signal over one connection:
// producer (caller thread) -> chunk queue -> encode thread -> packet queue -> send thread
class StreamSender {
public:
    // Fills the next burst of live samples; returns false once the source is exhausted
    using LiveSource = std::function<bool(std::vector<float>&)>;

    StreamSender(SenderConfig config, AudioTransform& transform, CancellationToken& cancel);
    ~StreamSender();

    StreamSender(const StreamSender&) = delete;
    StreamSender& operator=(const StreamSender&) = delete;

    // Throws BindOrConnectFailure
    void connect();

    // Finite buffer; metadata carries the chunk and sample totals
    SessionReport stream_signal(const std::vector<float>& samples, uint32_t sample_rate);

    // Unbounded source, total_chunks = 0. A partial chunk left when the
    // source ends is not sent.
    SessionReport stream_live(const LiveSource& source, uint32_t sample_rate);

    SessionState state() const { return state_.load(); }

private:
    using Producer = std::function<bool(AudioChunk&)>;

    SessionReport run(StreamMetadata meta, const Producer& produce);
    void encode_loop(BoundedQueue<AudioChunk>& chunks, BoundedQueue<AudioPacket>& packets);
    void send_loop(BoundedQueue<AudioPacket>& packets);
    void fail(const std::string& reason);
    void set_state(SessionState state);

    SenderConfig config_;
    AudioTransform& transform_;
    CancellationToken& cancel_;

    TcpConnection conn_;
    std::unique_ptr<SessionAccounting> accounting_;  // fresh for every session
    std::atomic<SessionState> state_{SessionState::Idle};
};

struct ReceiverConfig {
    std::string host = "0.0.0.0";
    int port = 8888;                 // 0 = ephemeral, see StreamReceiver::port()
    size_t queue_capacity = 20;
    std::chrono::milliseconds poll_interval{100};

    bool keep_chunks = false;        // collect each chunk's reconstructed output
    std::string packet_log_path;     // raw frames appended here when set

    std::function<void(SessionState)> on_state_change;
};

struct ReceiveResult {
    StreamMetadata metadata;
    std::vector<float> samples;
    std::vector<std::pair<uint32_t, std::vector<float>>> chunks;
    std::vector<uint32_t> indices;   // chunk indices in arrival order
    SessionReport report;
};

// Accepts one sender and rebuilds its signal:
// receive thread -> packet queue -> decode thread -> OverlapReconstructor
class StreamReceiver {
public:
    StreamReceiver(ReceiverConfig config, AudioTransform& transform, CancellationToken& cancel);
    ~StreamReceiver();

    StreamReceiver(const StreamReceiver&) = delete;
    StreamReceiver& operator=(const StreamReceiver&) = delete;

    // Throws BindOrConnectFailure
    void listen();
    int port() const;

    // Serves one connection; may be called again for the next peer. Throws
    // BindOrConnectFailure if cancelled while waiting for the peer, and
    // ProtocolViolation for a bad handshake. A connection lost or cancelled
    // after accept is reported in the result.
    ReceiveResult receive();

    SessionState state() const { return state_.load(); }

private:
    StreamMetadata handshake(TcpConnection& conn);
    void receive_loop(TcpConnection& conn, BoundedQueue<AudioPacket>& packets, ReceiveResult& result);
    void decode_loop(BoundedQueue<AudioPacket>& packets, ReceiveResult& result);
    void log_frame(const std::vector<uint8_t>& body);
    void fail(const std::string& reason);
    void set_state(SessionState state);

    ReceiverConfig config_;
    AudioTransform& transform_;
    CancellationToken& cancel_;

    std::unique_ptr<TcpListener> listener_;
    std::unique_ptr<std::ofstream> packet_log_;
    std::unique_ptr<SessionAccounting> accounting_;  // fresh for every session
    bool end_received_ = false;
    std::atomic<SessionState> state_{SessionState::Idle};
};
