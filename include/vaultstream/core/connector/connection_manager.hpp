#pragma once
#include <vaultstream/core/config/app_config.hpp>
#include <vaultstream/core/connector/cancellation_token.hpp>
#include <vaultstream/core/connector/connection_session.hpp>
#include <vaultstream/core/events/dead_letter_queue.hpp>
#include <vaultstream/core/events/dispatcher.hpp>
#include <vaultstream/core/events/event_sink.hpp>
#include <vaultstream/core/metrics/registry.hpp>
#include <vaultstream/core/transport/websocket_transport.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace VaultStream {

struct SessionStatus {
    uint32_t id = 0;
    std::string pattern;
    ConnectionState state = ConnectionState::CONNECTING;
    uint32_t attempt = 0;
    uint64_t epoch = 0;
    MetricSnapshot metrics;
};

struct StopReport {
    size_t stopped = 0;         // reached STOPPED within the grace period
    size_t abandoned = 0;       // detached, still winding down
    bool drain_abandoned = false;   // dispatcher left blocked in the sink
};

/**
 * @class ConnectorRun
 * @brief Handle of one started connector: its sessions, dispatcher,
 * metrics and dead letter queue. Destroying the handle stops the run.
 */
class ConnectorRun {
public:
    ~ConnectorRun();

    ConnectorRun(const ConnectorRun&) = delete;
    ConnectorRun& operator=(const ConnectorRun&) = delete;

    size_t sessionCount() const { return sessions_.size(); }
    std::vector<SessionStatus> sessionStatuses() const;
    const std::vector<std::shared_ptr<ConnectionSession>>& sessions() const { return sessions_; }

    std::shared_ptr<MetricRegistry> metrics() const { return metrics_; }
    std::shared_ptr<DeadLetterQueue> deadLetters() const { return dlq_; }
    const AppConfig::ConnectorConfig& config() const { return *config_; }

    // First fatal session error (authorization limit reached), if any
    std::optional<std::string> fatalError() const;

    bool stopped() const;

    /**
     * @brief Cancel every session and wait up to grace for them to stop.
     * Idempotent; later calls return the first report.
     */
    StopReport shutdown(std::chrono::milliseconds grace);

private:
    friend class ConnectionManager;

    ConnectorRun(EventSink& sink, std::shared_ptr<const AppConfig::ConnectorConfig> config);

    std::shared_ptr<const AppConfig::ConnectorConfig> config_;
    std::shared_ptr<CancellationToken> token_;
    std::shared_ptr<DeadLetterQueue> dlq_;
    std::shared_ptr<MetricRegistry> metrics_;
    std::unique_ptr<Dispatcher> dispatcher_;
    std::vector<std::shared_ptr<ConnectionSession>> sessions_;

    mutable std::mutex mtx_;
    bool stopped_ = false;
    StopReport report_;
};

using RunHandle = std::shared_ptr<ConnectorRun>;

/**
 * @class ConnectionManager
 * @brief Starts one ConnectionSession per topic pattern and stops them
 * together. All sessions of a run feed the same sink.
 */
class ConnectionManager {
public:
    explicit ConnectionManager(EventSink& sink, TransportFactory factory = makeBeastTransport);

    /**
     * @brief Validate the configuration and start every session.
     * @throws ConfigError before anything is started
     */
    RunHandle start(const AppConfig::ConnectorConfig& config);

    // Graceful stop using the run's configured grace period
    StopReport stop(const RunHandle& run);
    StopReport stop(const RunHandle& run, std::chrono::milliseconds grace);

    // Applied to sessions of runs started afterwards
    void setTransitionListener(TransitionListener listener);

private:
    EventSink& sink_;
    TransportFactory factory_;
    TransitionListener listener_;
};

} // namespace VaultStream
