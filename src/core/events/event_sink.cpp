#include <vaultstream/core/events/event_sink.hpp>

namespace VaultStream {

BoundedEventQueue::BoundedEventQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void BoundedEventQueue::put(EventEnvelope envelope) {
    std::unique_lock<std::mutex> lock(mtx_);
    not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
    if (closed_) return;
    items_.push_back(std::move(envelope));
    lock.unlock();
    not_empty_.notify_one();
}

bool BoundedEventQueue::offer(EventEnvelope& envelope, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    if (!not_full_.wait_for(lock, timeout, [this] { return closed_ || items_.size() < capacity_; })) {
        return false;
    }
    if (closed_) return true;
    items_.push_back(std::move(envelope));
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

std::optional<EventEnvelope> BoundedEventQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); })) {
        return std::nullopt;
    }
    if (items_.empty()) return std::nullopt;

    EventEnvelope envelope = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return envelope;
}

void BoundedEventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

size_t BoundedEventQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.size();
}

bool BoundedEventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
}

} // namespace VaultStream
