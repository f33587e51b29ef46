#pragma once
#include <chrono>
#include <optional>

namespace VaultStream {

/**
 * Keepalive timer of one open connection.
 *
 * Driven by the session loop: it asks when the next ping is due, reports
 * pings it sent and any inbound activity (pong or data frame). A ping that
 * sees no activity within the ack timeout marks the connection dead.
 */
class Heartbeat {
public:
    using Clock = std::chrono::steady_clock;

    Heartbeat(std::chrono::milliseconds interval, std::chrono::milliseconds ackTimeout);

    void reset(Clock::time_point now);
    bool pingDue(Clock::time_point now) const { return now >= nextPing_; }
    void onPingSent(Clock::time_point now);
    void onActivity();
    bool expired(Clock::time_point now) const;

    // Earliest point at which the session loop has to act again
    Clock::time_point nextDeadline() const;

private:
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds ackTimeout_;
    Clock::time_point nextPing_;
    std::optional<Clock::time_point> awaitingSince_;
};

} // namespace VaultStream
