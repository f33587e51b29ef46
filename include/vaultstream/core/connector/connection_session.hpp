#pragma once
#include <vaultstream/core/config/app_config.hpp>
#include <vaultstream/core/connector/backoff_policy.hpp>
#include <vaultstream/core/connector/cancellation_token.hpp>
#include <vaultstream/core/connector/connection_state.hpp>
#include <vaultstream/core/events/dispatcher.hpp>
#include <vaultstream/core/metrics/metrics.hpp>
#include <vaultstream/core/transport/websocket_transport.hpp>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace VaultStream {

using TransitionListener = std::function<void(const StateTransition&)>;

/**
 * @class ConnectionSession
 * @brief One long-lived subscription for one topic pattern.
 *
 * Runs on its own thread: connect, read frames into the session channel,
 * ping on the heartbeat interval and reconnect with exponential backoff
 * after any failure. Only the run's cancellation token ends the loop.
 *
 * The thread keeps the session alive, so a session that outlives its
 * shutdown grace period can be detached and finish on its own.
 */
class ConnectionSession : public std::enable_shared_from_this<ConnectionSession> {
public:
    ConnectionSession(uint32_t id,
                      std::string pattern,
                      SubscriptionUrl url,
                      std::shared_ptr<const AppConfig::ConnectorConfig> config,
                      TransportFactory factory,
                      std::shared_ptr<SessionChannel> channel,
                      std::shared_ptr<SessionMetrics> metrics,
                      std::shared_ptr<const CancellationToken> token);
    ~ConnectionSession();

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    void start();

    // Unblocks a pending connect; the caller has already stopped the token
    void interrupt();

    /**
     * @brief Wait until the session reached STOPPED
     * @return false on timeout
     */
    bool waitStopped(std::chrono::milliseconds timeout) const;
    void join();
    void detach();

    void setTransitionListener(TransitionListener listener);

    uint32_t id() const { return id_; }
    const std::string& pattern() const { return pattern_; }
    const SubscriptionUrl& url() const { return url_; }
    ConnectionState state() const { return state_.load(std::memory_order_acquire); }
    uint32_t attempt() const { return attempt_.load(std::memory_order_acquire); }
    uint64_t epoch() const { return epoch_.load(std::memory_order_acquire); }
    std::optional<std::string> fatalError() const;

private:
    void run();
    void connectOnce();
    void readLoop();
    bool backoff(const std::string& reason);
    void handleFrame(std::string body);
    void markConfirmed();
    void closeTransport();
    void finish(const std::string& reason);
    void transition(ConnectionState to, const std::string& reason,
                    std::chrono::milliseconds delay = std::chrono::milliseconds{0});

    std::vector<std::pair<std::string, std::string>> buildHeaders() const;

    const uint32_t id_;
    const std::string pattern_;
    const SubscriptionUrl url_;
    std::shared_ptr<const AppConfig::ConnectorConfig> config_;
    TransportFactory factory_;
    std::shared_ptr<SessionChannel> channel_;
    std::shared_ptr<SessionMetrics> metrics_;
    std::shared_ptr<const CancellationToken> token_;
    BackoffPolicy policy_;

    std::atomic<ConnectionState> state_{ConnectionState::CONNECTING};
    std::atomic<uint32_t> attempt_{0};
    std::atomic<uint64_t> epoch_{0};
    uint64_t sequence_ = 0;
    uint32_t consecutive_auth_failures_ = 0;
    bool confirmed_ = false;

    mutable std::mutex mtx_;
    std::unique_ptr<WebSocketTransport> transport_;
    bool connecting_ = false;
    TransitionListener listener_;
    std::optional<std::string> fatal_error_;

    mutable std::mutex stop_mtx_;
    mutable std::condition_variable stop_cv_;
    bool stopped_ = false;

    std::thread thread_;
};

} // namespace VaultStream
