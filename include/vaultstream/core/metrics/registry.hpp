#pragma once
#include <vaultstream/core/metrics/metrics.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

/**
 * @class MetricRegistry
 * @brief Per-run registry of session metrics, keyed by topic pattern.
 *
 * Entries are shared so a session abandoned at shutdown can keep writing
 * after the run has dropped its registry.
 */
class MetricRegistry {
public:
    MetricRegistry() = default;
    MetricRegistry(const MetricRegistry&) = delete;
    MetricRegistry& operator=(const MetricRegistry&) = delete;

    std::shared_ptr<SessionMetrics> getMetrics(const std::string& name);
    std::map<std::string, MetricSnapshot> getSnapshots() const;
    std::optional<MetricSnapshot> getSnapshot(const std::string& name) const;

    static MetricSnapshot snapshotOf(const SessionMetrics& m);

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::shared_ptr<SessionMetrics>> metrics_map_;
};
