#include <vaultstream/core/metrics/reporter.hpp>
#include <vaultstream/core/connector/connection_state.hpp>
#include <spdlog/spdlog.h>

MetricsReporter::MetricsReporter(std::shared_ptr<MetricRegistry> registry, std::chrono::milliseconds interval)
    : registry_(std::move(registry)), interval_(interval) {}

MetricsReporter::~MetricsReporter() noexcept {
    stop();
}

void MetricsReporter::start() {
    if (!registry_ || interval_.count() <= 0) return;
    if (running_.exchange(true, std::memory_order_acq_rel)) return;
    worker_ = std::thread(&MetricsReporter::loop, this);
}

void MetricsReporter::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void MetricsReporter::loop() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (running_.load(std::memory_order_acquire)) {
        cv_.wait_for(lock, interval_, [this] { return !running_.load(std::memory_order_acquire); });
        if (!running_.load(std::memory_order_acquire)) break;
        lock.unlock();
        reportOnce();
        lock.lock();
    }
}

void MetricsReporter::reportOnce() const {
    if (!registry_) return;

    spdlog::info("========================================================");
    spdlog::info("                  CONNECTOR METRICS                     ");
    spdlog::info("========================================================");

    for (const auto& [pattern, s] : registry_->getSnapshots()) {
        auto state = static_cast<VaultStream::ConnectionState>(s.state);
        spdlog::info("");
        spdlog::info("[{}] {}", pattern, VaultStream::toString(state));
        spdlog::info("  +- Connects:   {} attempts, {} established", s.connect_attempts, s.connections_established);
        spdlog::info("  +- Failures:   {} transport, {} auth, {} heartbeat",
                     s.transport_failures, s.authorization_failures, s.heartbeat_timeouts);
        spdlog::info("  +- Frames:     {} received, {} malformed", s.frames_received, s.normalization_errors);
        spdlog::info("  +- Delivery:   {} delivered, {} dropped, {} queued",
                     s.events_delivered, s.events_dropped, s.current_queue_depth);
        if (s.events_dropped > 0) {
            spdlog::info("  +- Drop rate:  {}%", s.get_drop_rate_percent());
        }
    }

    spdlog::info("========================================================");
}
