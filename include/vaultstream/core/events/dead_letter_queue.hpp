#pragma once

#include <vaultstream/core/events/event_envelope.hpp>
#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace VaultStream {

/**
 * @class DeadLetterQueue
 * @brief Record of events dropped by the dispatcher.
 *
 * Events end up here when:
 * - a session buffer overflows under the drop_oldest policy
 * - the run stops with events still buffered
 *
 * Keeps the total and per-pattern drop counts plus the most recent
 * MAX_STORED_EVENTS envelopes for inspection. Thread-safe.
 */
class DeadLetterQueue {
public:
    static constexpr size_t MAX_STORED_EVENTS = 1000;

    DeadLetterQueue();
    ~DeadLetterQueue() = default;

    /**
     * @brief Record a dropped envelope
     * @param e The envelope that was dropped
     * @param reason Short cause for the log line
     */
    void push(const EventEnvelope& e, const char* reason);

    size_t totalDropped() const {
        return total_dropped_.load(std::memory_order_relaxed);
    }

    // Drops attributed to one topic pattern
    size_t droppedFor(const std::string& pattern) const;

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stored_events_.size();
    }

    /**
     * @brief Get recent dropped events, newest first
     */
    std::vector<EventEnvelope> getRecentEvents(size_t max_count = 100) const;

    void clear();

private:
    std::atomic<size_t> total_dropped_{0};
    mutable std::mutex mutex_;
    std::deque<EventEnvelope> stored_events_;
    std::map<std::string, size_t> per_pattern_;
};

} // namespace VaultStream
