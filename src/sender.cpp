#include "sender_receiver.hpp"
#include "rate_limiter.hpp"
#include "stream_errors.hpp"

#include <deque>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace std;
typedef chrono::steady_clock Clock;

namespace {
constexpr chrono::milliseconds WATCH_INTERVAL(20);
}

StreamSender::StreamSender(SenderConfig config, AudioTransform& transform, CancellationToken& cancel)
    : config_(std::move(config)), transform_(transform), cancel_(cancel) {
    config_.geometry.validate();
    if (config_.queue_capacity == 0)
        throw invalid_argument("queue capacity must be positive");
}

StreamSender::~StreamSender() = default;

void StreamSender::set_state(SessionState state) {
    SessionState prev = state_.exchange(state);
    if (prev == state) return;
    cout << "[sender] " << to_string(prev) << " -> " << to_string(state) << endl;
    if (config_.on_state_change) config_.on_state_change(state);
}

void StreamSender::fail(const string& reason) {
    if (!cancel_.cancelled()) {
        cerr << "[sender] " << reason << endl;
        accounting_->fail(reason);
    }
    cancel_.cancel();
}

void StreamSender::connect() {
    set_state(SessionState::Connecting);
    try {
        conn_ = connect_tcp(config_.host, config_.port);
    } catch (const BindOrConnectFailure&) {
        set_state(SessionState::Closed);
        throw;
    }
    cout << "[sender] Connected to " << conn_.peer() << endl;
}

SessionReport StreamSender::stream_signal(const vector<float>& samples, uint32_t sample_rate) {
    StreamMetadata meta;
    meta.sample_rate = sample_rate;
    meta.chunk_size = config_.geometry.chunk_size;
    meta.overlap_size = config_.geometry.overlap_size;
    meta.num_streams = config_.num_streams;
    meta.total_chunks = count_chunks(samples.size(), config_.geometry);
    meta.total_samples = samples.size();

    cout << "[sender] Streaming " << samples.size() << " samples as " << meta.total_chunks
         << " chunks (hop " << meta.hop_size() << ")" << endl;

    SignalSlicer slicer(samples.data(), samples.size(), config_.geometry);
    return run(meta, [&slicer](AudioChunk& chunk) { return slicer.next(chunk); });
}

SessionReport StreamSender::stream_live(const LiveSource& source, uint32_t sample_rate) {
    StreamMetadata meta;
    meta.sample_rate = sample_rate;
    meta.chunk_size = config_.geometry.chunk_size;
    meta.overlap_size = config_.geometry.overlap_size;
    meta.num_streams = config_.num_streams;

    cout << "[sender] Streaming live input" << endl;

    LiveSlicer slicer(config_.geometry);
    deque<AudioChunk> ready;
    vector<float> burst;
    return run(meta, [&](AudioChunk& chunk) {
        while (ready.empty()) {
            if (cancel_.cancelled()) return false;
            burst.clear();
            if (!source(burst)) {
                if (slicer.buffered() > 0)
                    cout << "[sender] Live source ended, dropping " << slicer.buffered()
                         << " buffered samples" << endl;
                return false;
            }
            for (auto& c : slicer.push(burst.data(), burst.size()))
                ready.push_back(std::move(c));
        }
        chunk = std::move(ready.front());
        ready.pop_front();
        return true;
    });
}

SessionReport StreamSender::run(StreamMetadata meta, const Producer& produce) {
    if (!conn_.is_open())
        throw logic_error("StreamSender: connect() must succeed before streaming");
    if (meta.sample_rate == 0)
        throw invalid_argument("sample rate must be positive");

    transform_.prepare(meta.sample_rate);
    meta.codec = transform_.name();
    accounting_.reset(new SessionAccounting("sender"));
    accounting_->start();

    try {
        accounting_->record_bytes(conn_.send_frame(serialize_metadata(meta)));
    } catch (const ConnectionClosed& e) {
        fail(string("Failed to send metadata: ") + e.what());
        conn_.close();
        set_state(SessionState::Closed);
        return accounting_->snapshot();
    }
    set_state(SessionState::MetadataExchanged);

    BoundedQueue<AudioChunk> chunk_queue(config_.queue_capacity);
    BoundedQueue<AudioPacket> packet_queue(config_.queue_capacity);
    atomic<bool> send_done{false};

    set_state(SessionState::Streaming);
    thread encoder([&] { encode_loop(chunk_queue, packet_queue); });
    thread sender([&] {
        send_loop(packet_queue);
        send_done = true;
    });

    const auto pace = chrono::duration_cast<Clock::duration>(
        chrono::duration<double>(static_cast<double>(meta.chunk_size) / meta.sample_rate));

    try {
        AudioChunk chunk;
        while (!cancel_.cancelled() && produce(chunk)) {
            uint32_t index = chunk.index;
            if (!chunk_queue.push(std::move(chunk), cancel_, config_.poll_interval))
                break;
            accounting_->chunk_queued();
            cout << "[sender] Queued chunk " << index << endl;

            if (config_.realtime && !sleep_unless_cancelled(pace, cancel_))
                break;
        }
    } catch (const exception& e) {
        fail(string("Audio source failed: ") + e.what());
    }
    chunk_queue.push_end();

    // Unblock a send stuck on the socket once the session is cancelled
    bool aborted = false;
    while (!send_done.load()) {
        if (cancel_.cancelled() && !aborted) {
            chunk_queue.push_end();
            packet_queue.push_end();
            conn_.shutdown();
            aborted = true;
        }
        this_thread::sleep_for(WATCH_INTERVAL);
    }
    encoder.join();
    sender.join();

    if (!cancel_.cancelled()) {
        set_state(SessionState::Draining);
        try {
            accounting_->record_bytes(conn_.send_frame(serialize_end()));
            accounting_->complete();
            cout << "[sender] All chunks sent, end of stream" << endl;
        } catch (const ConnectionClosed& e) {
            fail(string("Failed to send end of stream: ") + e.what());
        }
    } else {
        accounting_->fail("cancelled");
        cout << "[sender] Session cancelled after " << accounting_->packets() << " packets" << endl;
    }

    conn_.close();
    set_state(SessionState::Closed);
    return accounting_->snapshot();
}

void StreamSender::encode_loop(BoundedQueue<AudioChunk>& chunks, BoundedQueue<AudioPacket>& packets) {
    try {
        AudioChunk chunk;
        while (true) {
            auto status = chunks.pop(chunk, config_.poll_interval);
            if (status == BoundedQueue<AudioChunk>::PopStatus::Timeout) {
                if (cancel_.cancelled()) break;
                continue;
            }
            if (status == BoundedQueue<AudioChunk>::PopStatus::EndOfStream || cancel_.cancelled())
                break;

            auto t0 = Clock::now();
            EncodedChunk encoded;
            try {
                encoded = transform_.encode(chunk.samples, config_.num_streams);
            } catch (const TransformFailure& e) {
                cerr << "[sender] Encoding chunk " << chunk.index << " failed, skipped: " << e.what() << endl;
                accounting_->chunk_skipped();
                continue;
            }
            auto elapsed = Clock::now() - t0;
            accounting_->record_stage(Stage::Encode, elapsed);

            cout << "[sender] Encoded chunk " << chunk.index << " in " << fixed << setprecision(4)
                 << chrono::duration<double>(elapsed).count() << "s" << endl;

            AudioPacket pkt;
            pkt.chunk_index = chunk.index;
            pkt.timestamp_us = chunk.timestamp_us;
            pkt.payload = std::move(encoded.payload);
            pkt.shape = std::move(encoded.shape);
            if (!packets.push(std::move(pkt), cancel_, config_.poll_interval))
                break;
            accounting_->chunk_processed();
        }
    } catch (const exception& e) {
        fail(string("Encode stage failed: ") + e.what());
    }
    packets.push_end();
}

void StreamSender::send_loop(BoundedQueue<AudioPacket>& packets) {
    unique_ptr<RateLimiter> limiter;
    if (config_.enable_rate_limit) {
        limiter.reset(new RateLimiter(config_.rate_limit_bps));
        cout << "[sender] Rate limiting to " << config_.rate_limit_bps << " bytes/second" << endl;
    }

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

            vector<uint8_t> body = serialize_packet(pkt);
            if (limiter && !limiter->acquire(body.size() + 4, cancel_))
                break;

            auto t0 = Clock::now();
            size_t wire = 0;
            try {
                wire = conn_.send_frame(body);
            } catch (const ConnectionClosed& e) {
                fail(string("Connection closed: ") + e.what());
                break;
            }
            auto elapsed = Clock::now() - t0;
            accounting_->record_stage(Stage::Send, elapsed);
            accounting_->record_packet(wire);

            cout << "[sender] Sent chunk " << pkt.chunk_index << " (" << wire << " bytes) in "
                 << fixed << setprecision(4) << chrono::duration<double>(elapsed).count() << "s" << endl;
        }
    } catch (const exception& e) {
        fail(string("Send stage failed: ") + e.what());
    }

    if (limiter)
        accounting_->set_rate_limit(limiter->budget(), limiter->total_wait());
}
