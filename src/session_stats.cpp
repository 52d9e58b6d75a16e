#include "session_stats.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

using namespace std::chrono;

const char* to_string(Stage stage) {
    switch (stage) {
    case Stage::Encode: return "encoding";
    case Stage::Send: return "sending";
    case Stage::Receive: return "receiving";
    case Stage::Decode: return "decoding";
    }
    return "unknown";
}

const TimingSummary& SessionReport::stage(Stage s) const {
    static const TimingSummary empty;
    auto it = stages.find(s);
    return it != stages.end() ? it->second : empty;
}

SessionAccounting::SessionAccounting(std::string role) : role_(std::move(role)) {
    report_.role = role_;
}

void SessionAccounting::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    start_ = Clock::now();
    started_ = true;
}

void SessionAccounting::record_stage(Stage stage, Clock::duration elapsed) {
    std::lock_guard<std::mutex> lock(mutex_);
    double s = duration<double>(elapsed).count();
    auto& t = report_.stages[stage];
    if (t.count == 0) {
        t.min_s = s;
        t.max_s = s;
    } else {
        t.min_s = std::min(t.min_s, s);
        t.max_s = std::max(t.max_s, s);
    }
    t.count++;
    t.total_s += s;
}

void SessionAccounting::record_packet(size_t wire_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& sz = report_.packet_sizes;
    if (sz.count == 0) {
        sz.min = wire_bytes;
        sz.max = wire_bytes;
    } else {
        sz.min = std::min<uint64_t>(sz.min, wire_bytes);
        sz.max = std::max<uint64_t>(sz.max, wire_bytes);
    }
    sz.count++;
    sz.total += wire_bytes;
    report_.packets++;
    report_.bytes_transferred += wire_bytes;
}

void SessionAccounting::record_bytes(size_t wire_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.bytes_transferred += wire_bytes;
}

void SessionAccounting::chunk_queued() {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.chunks_queued++;
}

void SessionAccounting::chunk_processed() {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.chunks_processed++;
}

void SessionAccounting::chunk_skipped() {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.chunks_skipped++;
}

void SessionAccounting::malformed_message() {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.malformed_messages++;
}

void SessionAccounting::set_rate_limit(size_t bytes_per_second, Clock::duration waited) {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.rate_limited = true;
    report_.rate_limit_bps = bytes_per_second;
    report_.rate_limit_wait_s = duration<double>(waited).count();
}

void SessionAccounting::fail(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (report_.error.empty()) report_.error = error;
    report_.completed = false;
    if (!ended_) {
        end_ = Clock::now();
        ended_ = true;
    }
}

void SessionAccounting::complete() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (report_.error.empty()) report_.completed = true;
    if (!ended_) {
        end_ = Clock::now();
        ended_ = true;
    }
}

uint64_t SessionAccounting::packets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_.packets;
}

bool SessionAccounting::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !report_.error.empty();
}

SessionReport SessionAccounting::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionReport copy = report_;
    if (started_) {
        auto end = ended_ ? end_ : Clock::now();
        copy.total_time_s = duration<double>(end - start_).count();
    }
    return copy;
}

std::string format_report(const SessionReport& r) {
    std::ostringstream os;
    os << std::fixed;
    os << "\n=== Performance Statistics (" << r.role << ") ===\n";
    os << "Status: " << (r.completed ? "completed" : "aborted");
    if (!r.error.empty()) os << " (" << r.error << ")";
    os << "\n";
    os << std::setprecision(3) << "Total transmission time: " << r.total_time_s << " seconds\n";
    os << "Total bytes: " << r.bytes_transferred << " bytes in " << r.packets << " packets\n";
    os << std::setprecision(2) << "Average transmission rate: " << r.transfer_rate() << " bytes/second\n";

    if (r.rate_limited) {
        os << "Rate limiting: ENABLED - " << r.rate_limit_bps << " bytes/second ("
           << std::setprecision(1) << r.rate_limit_bps * 8 / 1000.0 << " kbps), waited "
           << std::setprecision(3) << r.rate_limit_wait_s << " seconds\n";
    } else {
        os << "Rate limiting: DISABLED\n";
    }

    os << "Chunks: " << r.chunks_queued << " queued, " << r.chunks_processed << " processed, "
       << r.chunks_skipped << " skipped";
    if (r.malformed_messages) os << ", " << r.malformed_messages << " malformed messages";
    os << "\n";

    for (const auto& [stage, t] : r.stages) {
        if (t.count == 0) continue;
        os << "\n" << to_string(stage) << " (" << t.count << " chunks):\n";
        os << std::setprecision(3) << "  Total: " << t.total_s << " seconds\n";
        os << std::setprecision(4) << "  Average per chunk: " << t.average_s() << " seconds\n";
        os << "  Min: " << t.min_s << " seconds\n";
        os << "  Max: " << t.max_s << " seconds\n";
    }

    if (r.packet_sizes.count) {
        os << "\nPacket Size Statistics:\n";
        os << std::setprecision(2) << "  Average packet size: " << r.packet_sizes.average() << " bytes\n";
        os << "  Min packet size: " << r.packet_sizes.min << " bytes\n";
        os << "  Max packet size: " << r.packet_sizes.max << " bytes\n";
    }

    if (r.total_time_s > 0.0 && !r.stages.empty()) {
        os << "\nTime ratios:\n" << std::setprecision(2);
        double busy = 0.0;
        for (const auto& [stage, t] : r.stages) {
            double pct = t.total_s / r.total_time_s * 100.0;
            busy += pct;
            os << "  " << to_string(stage) << ": " << pct << "% of total time\n";
        }
        os << "  idle: " << std::max(0.0, 100.0 - busy) << "% of total time\n";
    }
    return os.str();
}
