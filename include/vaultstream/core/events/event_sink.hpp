#pragma once
#include <vaultstream/core/events/event_envelope.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace VaultStream {

/**
 * @class EventSink
 * @brief Downstream consumer of normalized events.
 *
 * put() and offer() are called from the dispatcher drain thread only. The
 * sink must outlive every run that writes to it.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void put(EventEnvelope envelope) = 0;

    /**
     * @brief Hand over an envelope, waiting at most timeout for room.
     * @return false if the sink is still full; envelope is left untouched
     *
     * The default forwards to put() and waits as long as put() does.
     */
    virtual bool offer(EventEnvelope& envelope, std::chrono::milliseconds timeout) {
        (void)timeout;
        put(std::move(envelope));
        return true;
    }
};

/**
 * @class BoundedEventQueue
 * @brief Blocking bounded channel; put() waits while the queue is full,
 * offer() only up to its timeout.
 *
 * After close() put() discards and pop() drains what is left, then returns
 * nullopt immediately.
 */
class BoundedEventQueue : public EventSink {
public:
    explicit BoundedEventQueue(size_t capacity);

    void put(EventEnvelope envelope) override;
    bool offer(EventEnvelope& envelope, std::chrono::milliseconds timeout) override;
    std::optional<EventEnvelope> pop(std::chrono::milliseconds timeout);
    void close();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    bool closed() const;

private:
    const size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<EventEnvelope> items_;
    bool closed_ = false;
};

} // namespace VaultStream
