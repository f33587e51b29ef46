#include <vaultstream/core/connector/heartbeat.hpp>
#include <algorithm>

namespace VaultStream {

Heartbeat::Heartbeat(std::chrono::milliseconds interval, std::chrono::milliseconds ackTimeout)
    : interval_(interval), ackTimeout_(ackTimeout) {
    reset(Clock::now());
}

void Heartbeat::reset(Clock::time_point now) {
    nextPing_ = now + interval_;
    awaitingSince_.reset();
}

void Heartbeat::onPingSent(Clock::time_point now) {
    nextPing_ = now + interval_;
    // The ack window is measured from the oldest unanswered ping
    if (!awaitingSince_) {
        awaitingSince_ = now;
    }
}

void Heartbeat::onActivity() {
    awaitingSince_.reset();
}

bool Heartbeat::expired(Clock::time_point now) const {
    return awaitingSince_ && now >= *awaitingSince_ + ackTimeout_;
}

Heartbeat::Clock::time_point Heartbeat::nextDeadline() const {
    if (awaitingSince_) {
        return std::min(nextPing_, *awaitingSince_ + ackTimeout_);
    }
    return nextPing_;
}

} // namespace VaultStream
