#include <vaultstream/core/metrics/registry.hpp>

std::shared_ptr<SessionMetrics> MetricRegistry::getMetrics(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& slot = metrics_map_[name];
    if (!slot) slot = std::make_shared<SessionMetrics>();
    return slot;
}

std::map<std::string, MetricSnapshot> MetricRegistry::getSnapshots() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::map<std::string, MetricSnapshot> snaps;
    for (const auto& [name, m] : metrics_map_) {
        snaps.emplace(name, snapshotOf(*m));
    }
    return snaps;
}

std::optional<MetricSnapshot> MetricRegistry::getSnapshot(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = metrics_map_.find(name);
    if (it == metrics_map_.end()) return std::nullopt;
    return snapshotOf(*it->second);
}

MetricSnapshot MetricRegistry::snapshotOf(const SessionMetrics& m) {
    MetricSnapshot s;
    s.connect_attempts = m.connect_attempts.load(std::memory_order_relaxed);
    s.connections_established = m.connections_established.load(std::memory_order_relaxed);
    s.transport_failures = m.transport_failures.load(std::memory_order_relaxed);
    s.authorization_failures = m.authorization_failures.load(std::memory_order_relaxed);
    s.heartbeat_timeouts = m.heartbeat_timeouts.load(std::memory_order_relaxed);
    s.pings_sent = m.pings_sent.load(std::memory_order_relaxed);
    s.state_transitions = m.state_transitions.load(std::memory_order_relaxed);
    s.frames_received = m.frames_received.load(std::memory_order_relaxed);
    s.normalization_errors = m.normalization_errors.load(std::memory_order_relaxed);
    s.events_enqueued = m.events_enqueued.load(std::memory_order_relaxed);
    s.events_delivered = m.events_delivered.load(std::memory_order_relaxed);
    s.events_dropped = m.events_dropped.load(std::memory_order_relaxed);
    s.current_queue_depth = m.current_queue_depth.load(std::memory_order_relaxed);
    s.last_event_timestamp_ms = m.last_event_timestamp_ms.load(std::memory_order_relaxed);
    s.state = m.state.load(std::memory_order_relaxed);
    return s;
}
