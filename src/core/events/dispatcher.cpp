#include <vaultstream/core/events/dispatcher.hpp>
#include <spdlog/spdlog.h>

namespace VaultStream {

namespace {
constexpr std::chrono::milliseconds BLOCK_SLICE{100};
constexpr std::chrono::milliseconds IDLE_WAIT{100};
constexpr std::chrono::milliseconds SINK_SLICE{50};
} // namespace

const char* toString(DeliveryOutcome outcome) {
    switch (outcome) {
        case DeliveryOutcome::QUEUED: return "QUEUED";
        case DeliveryOutcome::DROPPED_OLDEST: return "DROPPED_OLDEST";
        case DeliveryOutcome::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

void DispatchSignal::notify() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        pending = true;
    }
    cv.notify_one();
}

void DispatchSignal::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_for(lock, timeout, [this] { return pending; });
    pending = false;
}

// ============================================================================
// SessionChannel
// ============================================================================

SessionChannel::SessionChannel(std::string pattern,
                               size_t capacity,
                               AppConfig::DeliveryPolicy policy,
                               std::shared_ptr<SessionMetrics> metrics,
                               std::shared_ptr<DeadLetterQueue> dlq,
                               std::shared_ptr<const CancellationToken> token,
                               std::shared_ptr<DispatchSignal> signal)
    : pattern_(std::move(pattern)),
      capacity_(capacity == 0 ? 1 : capacity),
      policy_(policy),
      metrics_(std::move(metrics)),
      dlq_(std::move(dlq)),
      token_(std::move(token)),
      signal_(std::move(signal)) {}

DeliveryOutcome SessionChannel::deliver(EventEnvelope envelope) {
    std::unique_lock<std::mutex> lock(mtx_);

    if (!closed_ && items_.size() >= capacity_) {
        if (policy_ == AppConfig::DeliveryPolicy::DROP_OLDEST) {
            EventEnvelope oldest = std::move(items_.front());
            items_.pop_front();
            items_.push_back(std::move(envelope));
            lock.unlock();

            metrics_->events_enqueued.fetch_add(1, std::memory_order_relaxed);
            metrics_->events_dropped.fetch_add(1, std::memory_order_relaxed);
            dlq_->push(oldest, "buffer full");
            signal_->notify();
            return DeliveryOutcome::DROPPED_OLDEST;
        }

        // BLOCK: hold the read loop until the drain thread frees a slot
        while (!closed_ && items_.size() >= capacity_ && !token_->stopRequested()) {
            not_full_.wait_for(lock, BLOCK_SLICE);
        }
    }

    if (closed_ || token_->stopRequested()) {
        lock.unlock();
        metrics_->events_dropped.fetch_add(1, std::memory_order_relaxed);
        dlq_->push(envelope, "cancelled");
        return DeliveryOutcome::CANCELLED;
    }

    items_.push_back(std::move(envelope));
    metrics_->current_queue_depth.store(items_.size(), std::memory_order_relaxed);
    lock.unlock();

    metrics_->events_enqueued.fetch_add(1, std::memory_order_relaxed);
    signal_->notify();
    return DeliveryOutcome::QUEUED;
}

size_t SessionChannel::depth() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.size();
}

std::optional<EventEnvelope> SessionChannel::take() {
    std::unique_lock<std::mutex> lock(mtx_);
    if (items_.empty()) return std::nullopt;

    EventEnvelope envelope = std::move(items_.front());
    items_.pop_front();
    metrics_->current_queue_depth.store(items_.size(), std::memory_order_relaxed);
    lock.unlock();
    not_full_.notify_one();
    return envelope;
}

std::deque<EventEnvelope> SessionChannel::close() {
    std::deque<EventEnvelope> leftovers;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
        leftovers.swap(items_);
        metrics_->current_queue_depth.store(0, std::memory_order_relaxed);
    }
    not_full_.notify_all();
    return leftovers;
}

// ============================================================================
// Dispatcher
// ============================================================================

struct Dispatcher::DrainState {
    DrainState(EventSink& s, std::shared_ptr<DeadLetterQueue> d)
        : sink(s), dlq(std::move(d)), signal(std::make_shared<DispatchSignal>()) {}

    EventSink& sink;
    std::shared_ptr<DeadLetterQueue> dlq;
    std::shared_ptr<DispatchSignal> signal;

    std::mutex channels_mtx;
    std::vector<std::shared_ptr<SessionChannel>> channels;
    std::vector<std::shared_ptr<SessionMetrics>> channel_metrics;

    std::atomic<bool> running{false};
    std::atomic<uint64_t> delivered{0};

    // Event being handed to the sink; stop() records it if it gives up
    std::mutex mtx;
    std::condition_variable exited_cv;
    bool exited = false;
    bool abandoned = false;
    std::optional<EventEnvelope> inflight;
    std::shared_ptr<SessionMetrics> inflight_metrics;
};

Dispatcher::Dispatcher(EventSink& sink,
                       size_t capacity,
                       AppConfig::DeliveryPolicy policy,
                       std::shared_ptr<DeadLetterQueue> dlq,
                       std::shared_ptr<const CancellationToken> token)
    : capacity_(capacity),
      policy_(policy),
      dlq_(std::move(dlq)),
      token_(std::move(token)),
      state_(std::make_shared<DrainState>(sink, dlq_)) {}

Dispatcher::~Dispatcher() {
    stop();
}

std::shared_ptr<SessionChannel> Dispatcher::registerSession(const std::string& pattern,
                                                            std::shared_ptr<SessionMetrics> metrics) {
    auto channel = std::make_shared<SessionChannel>(pattern, capacity_, policy_, metrics, dlq_, token_,
                                                    state_->signal);
    std::lock_guard<std::mutex> lock(state_->channels_mtx);
    state_->channels.push_back(channel);
    state_->channel_metrics.push_back(std::move(metrics));
    return channel;
}

void Dispatcher::start() {
    if (state_->running.exchange(true, std::memory_order_acq_rel)) return;
    {
        std::lock_guard<std::mutex> lock(state_->mtx);
        state_->exited = false;
    }
    worker_ = std::thread(&Dispatcher::drainLoop, state_);
    spdlog::info("[Dispatcher] Started (capacity per session: {}, policy: {})",
                 capacity_, AppConfig::toString(policy_));
}

bool Dispatcher::stop(std::chrono::milliseconds grace) {
    bool wasRunning = state_->running.exchange(false, std::memory_order_acq_rel);
    state_->signal->notify();

    bool drained = true;
    if (worker_.joinable()) {
        std::unique_lock<std::mutex> lock(state_->mtx);
        drained = state_->exited_cv.wait_for(lock, grace, [this] { return state_->exited; });
        if (!drained) {
            state_->abandoned = true;
            if (state_->inflight) {
                state_->dlq->push(*state_->inflight, "shutdown");
                if (state_->inflight_metrics) {
                    state_->inflight_metrics->events_dropped.fetch_add(1, std::memory_order_relaxed);
                }
                state_->inflight.reset();
                state_->inflight_metrics.reset();
            }
        }
        lock.unlock();

        if (drained) {
            worker_.join();
        } else {
            spdlog::warn("[Dispatcher] Sink still blocked after {}ms, abandoning drain thread", grace.count());
            worker_.detach();
        }
    }

    std::lock_guard<std::mutex> lock(state_->channels_mtx);
    size_t leftover = 0;
    for (size_t i = 0; i < state_->channels.size(); ++i) {
        auto remaining = state_->channels[i]->close();
        for (const auto& envelope : remaining) {
            dlq_->push(envelope, "shutdown");
            state_->channel_metrics[i]->events_dropped.fetch_add(1, std::memory_order_relaxed);
            ++leftover;
        }
    }
    if (wasRunning) {
        spdlog::info("[Dispatcher] Stopped (delivered: {}, undelivered at shutdown: {})",
                     state_->delivered.load(std::memory_order_relaxed), leftover);
    }
    return drained;
}

bool Dispatcher::isRunning() const {
    return state_->running.load(std::memory_order_acquire);
}

uint64_t Dispatcher::delivered() const {
    return state_->delivered.load(std::memory_order_relaxed);
}

void Dispatcher::drainLoop(const std::shared_ptr<DrainState>& state) {
    while (state->running.load(std::memory_order_acquire)) {
        if (!drainRound(*state)) {
            state->signal->waitFor(IDLE_WAIT);
        }
    }

    {
        std::lock_guard<std::mutex> lock(state->mtx);
        state->exited = true;
    }
    state->exited_cv.notify_all();
}

bool Dispatcher::drainRound(DrainState& state) {
    std::vector<std::shared_ptr<SessionChannel>> channels;
    std::vector<std::shared_ptr<SessionMetrics>> metrics;
    {
        std::lock_guard<std::mutex> lock(state.channels_mtx);
        channels = state.channels;
        metrics = state.channel_metrics;
    }

    bool moved = false;
    for (size_t i = 0; i < channels.size(); ++i) {
        if (!state.running.load(std::memory_order_acquire)) break;

        auto envelope = channels[i]->take();
        if (!envelope) continue;
        moved = true;

        {
            std::lock_guard<std::mutex> lock(state.mtx);
            state.inflight = *envelope;
            state.inflight_metrics = metrics[i];
        }

        // Retry in slices so a full sink cannot hold up stop()
        bool handed = false;
        bool failed = false;
        try {
            while (true) {
                if (state.sink.offer(*envelope, SINK_SLICE)) {
                    handed = true;
                    break;
                }
                if (!state.running.load(std::memory_order_acquire)) break;
            }
        } catch (const std::exception& e) {
            failed = true;
            spdlog::error("[Dispatcher] Sink rejected event from {}: {}", channels[i]->pattern(), e.what());
        }

        std::lock_guard<std::mutex> lock(state.mtx);
        state.inflight.reset();
        state.inflight_metrics.reset();
        if (state.abandoned) {
            // stop() already accounted for this event
            return moved;
        }
        if (handed) {
            metrics[i]->events_delivered.fetch_add(1, std::memory_order_relaxed);
            state.delivered.fetch_add(1, std::memory_order_relaxed);
        } else {
            metrics[i]->events_dropped.fetch_add(1, std::memory_order_relaxed);
            if (!failed) {
                state.dlq->push(*envelope, "shutdown");
            }
        }
    }
    return moved;
}

} // namespace VaultStream
