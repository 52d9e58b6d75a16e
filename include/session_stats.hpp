#ifndef SONASTREAM_SESSION_STATS_HPP
#define SONASTREAM_SESSION_STATS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

enum class Stage {
    Encode,
    Send,
    Receive,
    Decode
};

const char* to_string(Stage stage);

struct TimingSummary {
    size_t count = 0;
    double total_s = 0.0;
    double min_s = 0.0;
    double max_s = 0.0;

    double average_s() const { return count ? total_s / count : 0.0; }
};

struct SizeSummary {
    size_t count = 0;
    uint64_t total = 0;
    uint64_t min = 0;
    uint64_t max = 0;

    double average() const { return count ? static_cast<double>(total) / count : 0.0; }
};

// Immutable picture of one session, taken when it ends (normally or not)
struct SessionReport {
    std::string role;
    double total_time_s = 0.0;
    uint64_t bytes_transferred = 0;
    uint64_t packets = 0;
    SizeSummary packet_sizes;
    std::map<Stage, TimingSummary> stages;

    uint64_t chunks_queued = 0;
    uint64_t chunks_processed = 0;
    uint64_t chunks_skipped = 0;
    uint64_t malformed_messages = 0;

    bool rate_limited = false;
    size_t rate_limit_bps = 0;
    double rate_limit_wait_s = 0.0;

    bool completed = false;
    std::string error;

    double transfer_rate() const { return total_time_s > 0.0 ? bytes_transferred / total_time_s : 0.0; }
    const TimingSummary& stage(Stage s) const;
};

// Per-session accumulator shared by the pipeline stages
class SessionAccounting {
public:
    using Clock = std::chrono::steady_clock;

    explicit SessionAccounting(std::string role);

    void start();
    void record_stage(Stage stage, Clock::duration elapsed);

    // One framed data packet on the wire (length prefix included)
    void record_packet(size_t wire_bytes);
    // Control traffic (metadata, end) that is not a data packet
    void record_bytes(size_t wire_bytes);

    void chunk_queued();
    void chunk_processed();
    void chunk_skipped();
    void malformed_message();

    void set_rate_limit(size_t bytes_per_second, Clock::duration waited);

    // Keeps the first error only
    void fail(const std::string& error);
    void complete();

    uint64_t packets() const;
    bool failed() const;

    SessionReport snapshot() const;

private:
    mutable std::mutex mutex_;
    std::string role_;
    Clock::time_point start_;
    Clock::time_point end_;
    bool started_ = false;
    bool ended_ = false;

    SessionReport report_;
};

// Multi-line performance summary for the console
std::string format_report(const SessionReport& report);

#endif // SONASTREAM_SESSION_STATS_HPP
