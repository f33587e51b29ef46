#pragma once
#include <vaultstream/core/events/event_sink.hpp>
#include <atomic>
#include <mutex>
#include <ostream>

namespace VaultStream {

/**
 * Writes each envelope as one compact JSON object per line.
 */
class JsonLinesSink : public EventSink {
public:
    explicit JsonLinesSink(std::ostream& out) : out_(out) {}

    void put(EventEnvelope envelope) override;

    uint64_t written() const { return written_.load(std::memory_order_relaxed); }

private:
    std::ostream& out_;
    std::mutex mtx_;
    std::atomic<uint64_t> written_{0};
};

} // namespace VaultStream
