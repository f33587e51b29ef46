#pragma once
#include <vaultstream/core/config/app_config.hpp>
#include <vaultstream/core/connector/cancellation_token.hpp>
#include <vaultstream/core/events/dead_letter_queue.hpp>
#include <vaultstream/core/events/event_sink.hpp>
#include <vaultstream/core/metrics/metrics.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace VaultStream {

enum class DeliveryOutcome : uint8_t {
    QUEUED = 0,
    DROPPED_OLDEST = 1,     // queued, but the oldest buffered event was evicted
    CANCELLED = 2           // run is stopping; event was not queued
};

const char* toString(DeliveryOutcome outcome);

// Wakes the drain thread when any session buffer gets an event
struct DispatchSignal {
    std::mutex mtx;
    std::condition_variable cv;
    bool pending = false;

    void notify();
    void waitFor(std::chrono::milliseconds timeout);
};

/**
 * @class SessionChannel
 * @brief Bounded buffer owned by one session, drained by the Dispatcher.
 *
 * deliver() is called from the session thread only. Order within a
 * channel is preserved.
 */
class SessionChannel {
public:
    SessionChannel(std::string pattern,
                   size_t capacity,
                   AppConfig::DeliveryPolicy policy,
                   std::shared_ptr<SessionMetrics> metrics,
                   std::shared_ptr<DeadLetterQueue> dlq,
                   std::shared_ptr<const CancellationToken> token,
                   std::shared_ptr<DispatchSignal> signal);

    DeliveryOutcome deliver(EventEnvelope envelope);

    const std::string& pattern() const { return pattern_; }
    size_t depth() const;

private:
    friend class Dispatcher;

    std::optional<EventEnvelope> take();
    // Stops accepting events; returns what is still buffered
    std::deque<EventEnvelope> close();

    const std::string pattern_;
    const size_t capacity_;
    const AppConfig::DeliveryPolicy policy_;
    std::shared_ptr<SessionMetrics> metrics_;
    std::shared_ptr<DeadLetterQueue> dlq_;
    std::shared_ptr<const CancellationToken> token_;
    std::shared_ptr<DispatchSignal> signal_;

    mutable std::mutex mtx_;
    std::condition_variable not_full_;
    std::deque<EventEnvelope> items_;
    bool closed_ = false;
};

/**
 * @class Dispatcher
 * @brief Moves events from every session buffer into one sink.
 *
 * A single drain thread takes one event per channel per round, so a busy
 * session cannot starve the others and per-session order is kept. On stop
 * whatever is still buffered is recorded in the dead letter queue.
 *
 * The drain thread owns its state through a shared pointer, so stop() can
 * detach it when the sink does not return within the grace period.
 */
class Dispatcher {
public:
    static constexpr std::chrono::milliseconds DEFAULT_STOP_GRACE{5000};

    Dispatcher(EventSink& sink,
               size_t capacity,
               AppConfig::DeliveryPolicy policy,
               std::shared_ptr<DeadLetterQueue> dlq,
               std::shared_ptr<const CancellationToken> token);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    std::shared_ptr<SessionChannel> registerSession(const std::string& pattern,
                                                    std::shared_ptr<SessionMetrics> metrics);

    void start();

    /**
     * @brief Stop draining and record leftovers in the dead letter queue.
     * @param grace How long to wait for the drain thread to leave the sink
     * @return false if the drain thread was still blocked in the sink and
     *         had to be detached; its in-flight event is recorded as dropped
     */
    bool stop(std::chrono::milliseconds grace = DEFAULT_STOP_GRACE);

    bool isRunning() const;
    uint64_t delivered() const;

private:
    struct DrainState;

    static void drainLoop(const std::shared_ptr<DrainState>& state);
    static bool drainRound(DrainState& state);

    const size_t capacity_;
    const AppConfig::DeliveryPolicy policy_;
    std::shared_ptr<DeadLetterQueue> dlq_;
    std::shared_ptr<const CancellationToken> token_;
    std::shared_ptr<DrainState> state_;
    std::thread worker_;
};

} // namespace VaultStream
