#ifndef SONASTREAM_SESSION_HPP
#define SONASTREAM_SESSION_HPP

#include <atomic>
#include <chrono>
#include <thread>

enum class SessionState {
    Idle,
    Connecting,
    Listening,
    MetadataExchanged,
    Streaming,
    Draining,
    Closed
};

const char* to_string(SessionState state);

// Cooperative stop flag shared by every stage of one session.
// cancel() only does a lock-free atomic store, so it may be called from a
// signal handler.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Sleeps for `duration` in small slices; returns false if the token fired first
bool sleep_unless_cancelled(std::chrono::steady_clock::duration duration,
                            const CancellationToken& cancel);

#endif // SONASTREAM_SESSION_HPP
