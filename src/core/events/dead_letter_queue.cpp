#include <vaultstream/core/events/dead_letter_queue.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace VaultStream {

DeadLetterQueue::DeadLetterQueue() {
    spdlog::debug("[DLQ] Initialized (max stored: {})", MAX_STORED_EVENTS);
}

void DeadLetterQueue::push(const EventEnvelope& e, const char* reason) {
    size_t total = total_dropped_.fetch_add(1, std::memory_order_relaxed) + 1;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Ring buffer: remove oldest if at capacity
        if (stored_events_.size() >= MAX_STORED_EVENTS) {
            stored_events_.pop_front();
        }
        stored_events_.push_back(e);
        ++per_pattern_[e.origin()];
    }

    spdlog::warn("[DLQ] Dropped event type={} pattern={} seq={} ({}) (total: {})",
                 e.type(), e.origin(), e.provenance().sequence, reason, total);
}

size_t DeadLetterQueue::droppedFor(const std::string& pattern) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = per_pattern_.find(pattern);
    return it == per_pattern_.end() ? 0 : it->second;
}

std::vector<EventEnvelope> DeadLetterQueue::getRecentEvents(size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<EventEnvelope> result;
    size_t count = std::min(max_count, stored_events_.size());
    result.reserve(count);

    // Newest first
    auto it = stored_events_.rbegin();
    for (size_t i = 0; i < count && it != stored_events_.rend(); ++i, ++it) {
        result.push_back(*it);
    }
    return result;
}

void DeadLetterQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    stored_events_.clear();
    spdlog::info("[DLQ] Buffer cleared (total dropped remains: {})",
                 total_dropped_.load(std::memory_order_relaxed));
}

} // namespace VaultStream
