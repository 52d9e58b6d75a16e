#include "session.hpp"

#include <algorithm>

using namespace std::chrono;

namespace {
constexpr milliseconds SLEEP_SLICE(20);
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle:              return "Idle";
        case SessionState::Connecting:        return "Connecting";
        case SessionState::Listening:         return "Listening";
        case SessionState::MetadataExchanged: return "MetadataExchanged";
        case SessionState::Streaming:         return "Streaming";
        case SessionState::Draining:          return "Draining";
        case SessionState::Closed:            return "Closed";
    }
    return "Unknown";
}

bool sleep_unless_cancelled(steady_clock::duration duration, const CancellationToken& cancel) {
    auto deadline = steady_clock::now() + duration;
    while (!cancel.cancelled()) {
        auto now = steady_clock::now();
        if (now >= deadline) return true;
        auto slice = std::min<steady_clock::duration>(deadline - now, SLEEP_SLICE);
        std::this_thread::sleep_for(slice);
    }
    return false;
}
