#include <vaultstream/core/connector/connection_session.hpp>
#include <vaultstream/core/connector/heartbeat.hpp>
#include <vaultstream/core/errors.hpp>
#include <vaultstream/core/events/event_normalizer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace VaultStream {

namespace {

// Upper bound on how long the read loop goes without checking the token
constexpr std::chrono::milliseconds POLL_SLICE{250};

uint64_t wallClockMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

ConnectionSession::ConnectionSession(uint32_t id,
                                     std::string pattern,
                                     SubscriptionUrl url,
                                     std::shared_ptr<const AppConfig::ConnectorConfig> config,
                                     TransportFactory factory,
                                     std::shared_ptr<SessionChannel> channel,
                                     std::shared_ptr<SessionMetrics> metrics,
                                     std::shared_ptr<const CancellationToken> token)
    : id_(id),
      pattern_(std::move(pattern)),
      url_(std::move(url)),
      config_(std::move(config)),
      factory_(std::move(factory)),
      channel_(std::move(channel)),
      metrics_(std::move(metrics)),
      token_(std::move(token)),
      policy_(config_->backoff_initial, config_->backoff_max) {
    metrics_->state.store(static_cast<uint8_t>(ConnectionState::CONNECTING), std::memory_order_relaxed);
}

ConnectionSession::~ConnectionSession() {
    // The last reference may be dropped by the session thread itself
    if (thread_.joinable()) {
        thread_.detach();
    }
}

void ConnectionSession::start() {
    spdlog::info("[Session {}] Starting (id={}, url={})", pattern_, id_, url_.str());
    thread_ = std::thread([self = shared_from_this()] { self->run(); });
}

void ConnectionSession::interrupt() {
    std::lock_guard<std::mutex> lock(mtx_);
    // An open connection notices the token within one read slice and closes cleanly
    if (transport_ && connecting_) {
        transport_->cancel();
    }
}

bool ConnectionSession::waitStopped(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(stop_mtx_);
    return stop_cv_.wait_for(lock, timeout, [this] { return stopped_; });
}

void ConnectionSession::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void ConnectionSession::detach() {
    if (thread_.joinable()) {
        thread_.detach();
    }
}

void ConnectionSession::setTransitionListener(TransitionListener listener) {
    std::lock_guard<std::mutex> lock(mtx_);
    listener_ = std::move(listener);
}

std::optional<std::string> ConnectionSession::fatalError() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return fatal_error_;
}

// ============================================================================
// Session loop
// ============================================================================

void ConnectionSession::run() {
    std::string stopReason = "shutdown requested";

    while (!token_->stopRequested()) {
        std::string failure;
        try {
            connectOnce();
            readLoop();
        } catch (const AuthorizationError& e) {
            metrics_->authorization_failures.fetch_add(1, std::memory_order_relaxed);
            ++consecutive_auth_failures_;
            failure = e.what();

            uint32_t limit = config_->auth_failure_limit;
            if (limit > 0 && consecutive_auth_failures_ >= limit) {
                std::string fatal = "authorization rejected " + std::to_string(consecutive_auth_failures_) +
                                    " times in a row: " + e.what();
                spdlog::error("[Session {}] {}", pattern_, fatal);
                {
                    std::lock_guard<std::mutex> lock(mtx_);
                    fatal_error_ = fatal;
                }
                stopReason = std::move(fatal);
                break;
            }
            spdlog::warn("[Session {}] Authorization failed ({}/{}): {}", pattern_,
                         consecutive_auth_failures_, limit == 0 ? std::string("unlimited") : std::to_string(limit),
                         e.what());
        } catch (const TransportError& e) {
            failure = e.what();
            if (!token_->stopRequested()) {
                metrics_->transport_failures.fetch_add(1, std::memory_order_relaxed);
                spdlog::warn("[Session {}] Transport failure: {}", pattern_, e.what());
            }
        } catch (const std::exception& e) {
            failure = e.what();
            metrics_->transport_failures.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("[Session {}] Unexpected error: {}", pattern_, e.what());
        }

        if (token_->stopRequested()) break;

        closeTransport();
        if (!backoff(failure.empty() ? "connection ended" : failure)) break;
    }

    finish(stopReason);
}

void ConnectionSession::connectOnce() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        transport_ = factory_(url_);
        connecting_ = true;
    }
    // interrupt() may have run before the transport existed
    if (token_->stopRequested()) {
        throw TransportError("connect cancelled");
    }

    ConnectRequest request;
    request.url = url_;
    request.headers = buildHeaders();
    request.verify_tls = config_->verify_tls;
    request.timeout = config_->connect_timeout;

    metrics_->connect_attempts.fetch_add(1, std::memory_order_relaxed);
    try {
        transport_->connect(request);
    } catch (...) {
        std::lock_guard<std::mutex> lock(mtx_);
        connecting_ = false;
        throw;
    }
    {
        std::lock_guard<std::mutex> lock(mtx_);
        connecting_ = false;
    }

    epoch_.fetch_add(1, std::memory_order_acq_rel);
    metrics_->connections_established.fetch_add(1, std::memory_order_relaxed);
    consecutive_auth_failures_ = 0;
    confirmed_ = false;
    transition(ConnectionState::OPEN, "subscribed (epoch " + std::to_string(epoch()) + ")");
}

void ConnectionSession::readLoop() {
    using Clock = std::chrono::steady_clock;
    Heartbeat heartbeat(config_->heartbeat_interval, config_->heartbeat_timeout);
    heartbeat.reset(Clock::now());

    std::string body;
    while (!token_->stopRequested()) {
        auto now = Clock::now();
        if (heartbeat.expired(now)) {
            metrics_->heartbeat_timeouts.fetch_add(1, std::memory_order_relaxed);
            throw TransportError("heartbeat not acknowledged within " +
                                 std::to_string(config_->heartbeat_timeout.count()) + "ms");
        }
        if (heartbeat.pingDue(now)) {
            transport_->ping();
            heartbeat.onPingSent(now);
            metrics_->pings_sent.fetch_add(1, std::memory_order_relaxed);
        }

        auto untilDeadline = std::chrono::duration_cast<std::chrono::milliseconds>(heartbeat.nextDeadline() - now);
        auto wait = std::clamp(untilDeadline, std::chrono::milliseconds{1}, POLL_SLICE);

        switch (transport_->read(body, wait)) {
            case ReadStatus::MESSAGE:
                heartbeat.onActivity();
                markConfirmed();
                handleFrame(std::move(body));
                body.clear();
                break;
            case ReadStatus::PONG:
                heartbeat.onActivity();
                markConfirmed();
                break;
            case ReadStatus::TIMEOUT:
                break;
        }
    }
}

void ConnectionSession::handleFrame(std::string body) {
    metrics_->frames_received.fetch_add(1, std::memory_order_relaxed);
    metrics_->last_event_timestamp_ms.store(wallClockMs(), std::memory_order_relaxed);

    Provenance provenance;
    provenance.pattern = pattern_;
    provenance.session_id = id_;
    provenance.connection_epoch = epoch();
    provenance.sequence = ++sequence_;

    RawMessage raw{std::move(body), std::chrono::system_clock::now()};
    std::optional<EventEnvelope> envelope;
    try {
        envelope.emplace(EventNormalizer::normalize(raw, provenance));
    } catch (const NormalizationError& e) {
        metrics_->normalization_errors.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[Session {}] Dropping frame #{}: {}", pattern_, provenance.sequence, e.what());
        return;
    }

    if (envelope->isUnknownType()) {
        spdlog::debug("[Session {}] Frame #{} has no event type", pattern_, provenance.sequence);
    }

    auto outcome = channel_->deliver(std::move(*envelope));
    if (outcome != DeliveryOutcome::QUEUED) {
        spdlog::debug("[Session {}] Frame #{} delivery: {}", pattern_, provenance.sequence, toString(outcome));
    }
}

void ConnectionSession::markConfirmed() {
    if (confirmed_) return;
    confirmed_ = true;
    if (attempt_.exchange(0, std::memory_order_acq_rel) != 0) {
        spdlog::debug("[Session {}] Connection confirmed, backoff reset", pattern_);
    }
}

bool ConnectionSession::backoff(const std::string& reason) {
    auto delay = policy_.nextDelay(attempt());
    transition(ConnectionState::BACKOFF, reason, delay);

    bool stop = token_->waitFor(delay);
    attempt_.fetch_add(1, std::memory_order_acq_rel);
    if (stop) return false;

    transition(ConnectionState::CONNECTING, "reconnect attempt " + std::to_string(attempt()));
    return true;
}

void ConnectionSession::closeTransport() {
    std::unique_ptr<WebSocketTransport> transport;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        transport = std::move(transport_);
        connecting_ = false;
    }
    if (transport) {
        transport->close();
    }
}

void ConnectionSession::finish(const std::string& reason) {
    transition(ConnectionState::CLOSING, reason);
    closeTransport();
    transition(ConnectionState::STOPPED, reason);

    {
        std::lock_guard<std::mutex> lock(stop_mtx_);
        stopped_ = true;
    }
    stop_cv_.notify_all();
}

void ConnectionSession::transition(ConnectionState to, const std::string& reason,
                                   std::chrono::milliseconds delay) {
    ConnectionState from = state_.exchange(to, std::memory_order_acq_rel);
    metrics_->state.store(static_cast<uint8_t>(to), std::memory_order_relaxed);
    metrics_->state_transitions.fetch_add(1, std::memory_order_relaxed);

    if (to == ConnectionState::BACKOFF) {
        spdlog::warn("[Session {}] {} -> {} in {}ms (attempt {}): {}", pattern_, toString(from), toString(to),
                     delay.count(), attempt(), reason);
    } else {
        spdlog::info("[Session {}] {} -> {} ({})", pattern_, toString(from), toString(to), reason);
    }

    TransitionListener listener;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        listener = listener_;
    }
    if (!listener) return;

    StateTransition t;
    t.pattern = pattern_;
    t.session_id = id_;
    t.from = from;
    t.to = to;
    t.reason = reason;
    t.attempt = attempt();
    t.backoff_delay = delay;
    try {
        listener(t);
    } catch (const std::exception& e) {
        spdlog::error("[Session {}] Transition listener failed: {}", pattern_, e.what());
    }
}

std::vector<std::pair<std::string, std::string>> ConnectionSession::buildHeaders() const {
    std::vector<std::pair<std::string, std::string>> headers;
    headers.emplace_back("X-Vault-Token", config_->token);
    if (config_->tenant && !config_->tenant->empty()) {
        headers.emplace_back("X-Vault-Namespace", *config_->tenant);
    }
    for (const auto& [name, value] : config_->extra_headers) {
        headers.emplace_back(name, value);
    }
    return headers;
}

} // namespace VaultStream
