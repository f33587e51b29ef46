#pragma once
#include <vaultstream/core/metrics/registry.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

/**
 * Periodically logs a snapshot of every session in a run
 */
class MetricsReporter {
public:
    MetricsReporter(std::shared_ptr<MetricRegistry> registry, std::chrono::milliseconds interval);
    ~MetricsReporter() noexcept;

    void start();
    void stop();

    // One report, also used by the loop
    void reportOnce() const;

private:
    void loop();

    std::shared_ptr<MetricRegistry> registry_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_{false};
    std::mutex mtx_;
    std::condition_variable cv_;
    std::thread worker_;
};
