#include "sender_receiver.hpp"
#include "overlap_reconstructor.hpp"
#include "stream_errors.hpp"

#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace std;
typedef chrono::steady_clock Clock;

namespace {
constexpr chrono::milliseconds WATCH_INTERVAL(20);

// Runs on_cancel once, from its own thread, if the token fires before stop()
class CancelWatcher {
public:
    CancelWatcher(const CancellationToken& cancel, function<void()> on_cancel)
        : thread_([this, &cancel, on_cancel = std::move(on_cancel)] {
              while (!done_.load()) {
                  if (cancel.cancelled()) {
                      on_cancel();
                      return;
                  }
                  this_thread::sleep_for(WATCH_INTERVAL);
              }
          }) {}

    ~CancelWatcher() { stop(); }

    CancelWatcher(const CancelWatcher&) = delete;
    CancelWatcher& operator=(const CancelWatcher&) = delete;

    void stop() {
        done_ = true;
        if (thread_.joinable()) thread_.join();
    }

private:
    atomic<bool> done_{false};
    thread thread_;
};
}

StreamReceiver::StreamReceiver(ReceiverConfig config, AudioTransform& transform, CancellationToken& cancel)
    : config_(std::move(config)), transform_(transform), cancel_(cancel) {
    if (config_.queue_capacity == 0)
        throw invalid_argument("queue capacity must be positive");
}

StreamReceiver::~StreamReceiver() = default;

void StreamReceiver::set_state(SessionState state) {
    SessionState prev = state_.exchange(state);
    if (prev == state) return;
    cout << "[receiver] " << to_string(prev) << " -> " << to_string(state) << endl;
    if (config_.on_state_change) config_.on_state_change(state);
}

void StreamReceiver::fail(const string& reason) {
    if (!cancel_.cancelled()) {
        cerr << "[receiver] " << reason << endl;
        accounting_->fail(reason);
    }
    cancel_.cancel();
}

void StreamReceiver::listen() {
    listener_.reset(new TcpListener(config_.host, config_.port));
    set_state(SessionState::Listening);
    cout << "[receiver] Listening on " << config_.host << ":" << listener_->port() << endl;
}

int StreamReceiver::port() const {
    return listener_ ? listener_->port() : 0;
}

void StreamReceiver::log_frame(const vector<uint8_t>& body) {
    if (!packet_log_) return;
    vector<uint8_t> prefix;
    put_u32(prefix, static_cast<uint32_t>(body.size()));
    packet_log_->write(reinterpret_cast<const char*>(prefix.data()), prefix.size());
    packet_log_->write(reinterpret_cast<const char*>(body.data()), body.size());
    if (!*packet_log_) {
        cerr << "[receiver] Writing packet log " << config_.packet_log_path << " failed, logging stopped" << endl;
        packet_log_.reset();
    }
}

StreamMetadata StreamReceiver::handshake(TcpConnection& conn) {
    vector<uint8_t> body = conn.receive_frame();
    log_frame(body);
    accounting_->record_bytes(body.size() + 4);

    WireMessage msg;
    try {
        msg = parse_message(body.data(), body.size());
    } catch (const MalformedMessage& e) {
        throw ProtocolViolation(string("unreadable stream metadata: ") + e.what());
    }
    if (msg.type != MessageType::Metadata)
        throw ProtocolViolation("first message of a session must be the stream metadata");

    const StreamMetadata& meta = msg.metadata;
    if (meta.sample_rate == 0 || meta.chunk_size == 0 || meta.overlap_size >= meta.chunk_size)
        throw ProtocolViolation("invalid stream metadata: sample_rate " + to_string(meta.sample_rate) +
                                ", chunk_size " + to_string(meta.chunk_size) +
                                ", overlap_size " + to_string(meta.overlap_size));
    if (meta.codec.empty()) {
        cerr << "[receiver] Sender did not name its codec, assuming " << transform_.name() << endl;
    } else if (meta.codec != transform_.name()) {
        throw ProtocolViolation("codec mismatch: sender uses " + meta.codec +
                                ", receiver decodes " + transform_.name());
    }
    return meta;
}

ReceiveResult StreamReceiver::receive() {
    if (!listener_)
        throw logic_error("StreamReceiver: listen() must succeed before receive()");

    if (!config_.packet_log_path.empty()) {
        packet_log_.reset(new ofstream(config_.packet_log_path, ios::binary | ios::app));
        if (!*packet_log_)
            throw runtime_error("cannot open packet log " + config_.packet_log_path);
    }

    end_received_ = false;
    set_state(SessionState::Listening);
    TcpConnection conn = listener_->accept(cancel_);
    cout << "[receiver] Connection from " << conn.peer() << endl;
    accounting_.reset(new SessionAccounting("receiver"));
    accounting_->start();

    ReceiveResult result;
    BoundedQueue<AudioPacket> packet_queue(config_.queue_capacity);

    // Wakes the handshake or the reader out of recv() once the session is cancelled
    CancelWatcher watcher(cancel_, [&] {
        conn.shutdown();
        packet_queue.push_end();
    });

    try {
        result.metadata = handshake(conn);
    } catch (const ConnectionClosed& e) {
        watcher.stop();
        string reason = cancel_.cancelled() ? string("cancelled")
                                            : string("Connection closed before the stream metadata: ") + e.what();
        cerr << "[receiver] " << reason << endl;
        accounting_->fail(reason);
        conn.close();
        packet_log_.reset();
        set_state(SessionState::Closed);
        result.report = accounting_->snapshot();
        return result;
    } catch (const StreamError& e) {
        watcher.stop();
        accounting_->fail(e.what());
        conn.close();
        packet_log_.reset();
        set_state(SessionState::Closed);
        throw;
    }
    const StreamMetadata& meta = result.metadata;
    transform_.prepare(meta.sample_rate);
    set_state(SessionState::MetadataExchanged);

    cout << "[receiver] Stream: " << meta.sample_rate << " Hz, chunk " << meta.chunk_size
         << ", overlap " << meta.overlap_size << ", " << meta.num_streams << " streams, "
         << meta.total_chunks << " chunks, codec " << (meta.codec.empty() ? transform_.name() : meta.codec)
         << endl;

    set_state(SessionState::Streaming);
    thread reader([&] { receive_loop(conn, packet_queue, result); });
    thread decoder([&] { decode_loop(packet_queue, result); });

    decoder.join();
    // A reader still in recv() has nobody left to feed
    conn.shutdown();
    reader.join();
    watcher.stop();
    set_state(SessionState::Draining);

    if (end_received_ && !accounting_->failed()) {
        if (meta.total_samples > 0 && result.samples.size() > meta.total_samples)
            result.samples.resize(meta.total_samples);
        accounting_->complete();
        cout << "[receiver] Stream complete: " << result.samples.size() << " samples" << endl;
    } else {
        accounting_->fail(cancel_.cancelled() ? "cancelled" : "stream ended without end of stream message");
        cout << "[receiver] Stream aborted after " << accounting_->packets() << " packets, "
             << result.samples.size() << " samples recovered" << endl;
    }

    conn.close();
    packet_log_.reset();
    set_state(SessionState::Closed);
    result.report = accounting_->snapshot();
    return result;
}

void StreamReceiver::receive_loop(TcpConnection& conn, BoundedQueue<AudioPacket>& packets, ReceiveResult& result) {
    try {
        while (!cancel_.cancelled()) {
            auto t0 = Clock::now();
            vector<uint8_t> body;
            try {
                body = conn.receive_frame();
            } catch (const ConnectionClosed& e) {
                fail(string("Connection closed: ") + e.what());
                break;
            } catch (const ProtocolViolation& e) {
                fail(e.what());
                break;
            }
            auto elapsed = Clock::now() - t0;
            log_frame(body);

            WireMessage msg;
            try {
                msg = parse_message(body.data(), body.size());
            } catch (const MalformedMessage& e) {
                cerr << "[receiver] Dropping malformed message (" << body.size() << " bytes): " << e.what() << endl;
                accounting_->malformed_message();
                accounting_->record_bytes(body.size() + 4);
                continue;
            }

            if (msg.type == MessageType::End) {
                accounting_->record_bytes(body.size() + 4);
                end_received_ = true;
                cout << "[receiver] End of stream, " << packets.size() << " packets left to decode" << endl;
                set_state(SessionState::Draining);
                break;
            }
            if (msg.type == MessageType::Metadata) {
                cerr << "[receiver] Unexpected metadata in the middle of the stream, dropped" << endl;
                accounting_->malformed_message();
                accounting_->record_bytes(body.size() + 4);
                continue;
            }

            accounting_->record_stage(Stage::Receive, elapsed);
            accounting_->record_packet(body.size() + 4);
            result.indices.push_back(msg.packet.chunk_index);

            cout << "[receiver] Received chunk " << msg.packet.chunk_index << " (" << body.size() + 4
                 << " bytes)" << endl;

            if (!packets.push(std::move(msg.packet), cancel_, config_.poll_interval))
                break;
            accounting_->chunk_queued();
        }
    } catch (const exception& e) {
        fail(string("Receive stage failed: ") + e.what());
    }
    packets.push_end();
}

void StreamReceiver::decode_loop(BoundedQueue<AudioPacket>& packets, ReceiveResult& result) {
    const StreamMetadata& meta = result.metadata;
    ChunkGeometry geometry;
    geometry.chunk_size = meta.chunk_size;
    geometry.overlap_size = meta.overlap_size;

    uint32_t current = 0;
    OverlapReconstructor reconstructor(geometry, meta.total_chunks,
        [&](uint32_t index, const vector<float>& out) {
            result.samples.insert(result.samples.end(), out.begin(), out.end());
            if (config_.keep_chunks)
                result.chunks.emplace_back(index ? index : current, out);
        });

    try {
        AudioPacket pkt;
        while (true) {
            auto status = packets.pop(pkt, config_.poll_interval);
            if (status == BoundedQueue<AudioPacket>::PopStatus::Timeout) {
                if (cancel_.cancelled()) break;
                continue;
            }
            if (status == BoundedQueue<AudioPacket>::PopStatus::EndOfStream || cancel_.cancelled())
                break;

            auto t0 = Clock::now();
            vector<float> decoded;
            try {
                decoded = transform_.decode(pkt.payload, pkt.shape);
            } catch (const TransformFailure& e) {
                cerr << "[receiver] Decoding chunk " << pkt.chunk_index << " failed, skipped: " << e.what() << endl;
                accounting_->chunk_skipped();
                continue;
            }
            auto elapsed = Clock::now() - t0;
            accounting_->record_stage(Stage::Decode, elapsed);

            cout << "[receiver] Decoded chunk " << pkt.chunk_index << " in " << fixed << setprecision(4)
                 << chrono::duration<double>(elapsed).count() << "s" << endl;

            current = pkt.chunk_index;
            if (reconstructor.handle(pkt.chunk_index, std::move(decoded)))
                accounting_->chunk_processed();
            else
                accounting_->chunk_skipped();
        }
        reconstructor.finish();
    } catch (const exception& e) {
        fail(string("Decode stage failed: ") + e.what());
    }
}
