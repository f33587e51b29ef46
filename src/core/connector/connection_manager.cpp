#include <vaultstream/core/connector/connection_manager.hpp>
#include <vaultstream/core/config/loader.hpp>
#include <vaultstream/core/errors.hpp>
#include <vaultstream/core/transport/subscription_url.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace VaultStream {

namespace {
constexpr std::chrono::milliseconds MIN_DISPATCHER_GRACE{250};
} // namespace

// ============================================================================
// ConnectorRun
// ============================================================================

ConnectorRun::ConnectorRun(EventSink& sink, std::shared_ptr<const AppConfig::ConnectorConfig> config)
    : config_(std::move(config)),
      token_(std::make_shared<CancellationToken>()),
      dlq_(std::make_shared<DeadLetterQueue>()),
      metrics_(std::make_shared<MetricRegistry>()),
      dispatcher_(std::make_unique<Dispatcher>(sink, config_->buffer_capacity, config_->delivery_policy,
                                               dlq_, token_)) {}

ConnectorRun::~ConnectorRun() {
    shutdown(config_->stop_grace_period);
}

std::vector<SessionStatus> ConnectorRun::sessionStatuses() const {
    std::vector<SessionStatus> statuses;
    statuses.reserve(sessions_.size());
    for (const auto& session : sessions_) {
        SessionStatus s;
        s.id = session->id();
        s.pattern = session->pattern();
        s.state = session->state();
        s.attempt = session->attempt();
        s.epoch = session->epoch();
        if (auto snap = metrics_->getSnapshot(session->pattern())) {
            s.metrics = *snap;
        }
        statuses.push_back(std::move(s));
    }
    return statuses;
}

std::optional<std::string> ConnectorRun::fatalError() const {
    for (const auto& session : sessions_) {
        if (auto error = session->fatalError()) {
            return "[" + session->pattern() + "] " + *error;
        }
    }
    return std::nullopt;
}

bool ConnectorRun::stopped() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return stopped_;
}

StopReport ConnectorRun::shutdown(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopped_) return report_;

    spdlog::info("[ConnectionManager] Stopping {} session(s) (grace: {}ms)", sessions_.size(), grace.count());

    // Reverse order of start: sessions first, then the dispatcher
    token_->requestStop();
    for (const auto& session : sessions_) {
        session->interrupt();
    }

    auto deadline = std::chrono::steady_clock::now() + grace;
    for (const auto& session : sessions_) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (session->waitStopped(std::max(remaining, std::chrono::milliseconds{0}))) {
            session->join();
            ++report_.stopped;
        } else {
            spdlog::warn("[ConnectionManager] Session {} did not stop within {}ms, abandoning",
                         session->pattern(), grace.count());
            session->detach();
            ++report_.abandoned;
        }
    }

    // The dispatcher gets what is left of the grace period, but at least one poll slice
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    report_.drain_abandoned = !dispatcher_->stop(std::max(remaining, MIN_DISPATCHER_GRACE));
    stopped_ = true;

    spdlog::info("[ConnectionManager] Stopped (stopped: {}, abandoned: {}, drain abandoned: {}, dead letters: {})",
                 report_.stopped, report_.abandoned, report_.drain_abandoned, dlq_->totalDropped());
    return report_;
}

// ============================================================================
// ConnectionManager
// ============================================================================

ConnectionManager::ConnectionManager(EventSink& sink, TransportFactory factory)
    : sink_(sink), factory_(std::move(factory)) {}

void ConnectionManager::setTransitionListener(TransitionListener listener) {
    listener_ = std::move(listener);
}

RunHandle ConnectionManager::start(const AppConfig::ConnectorConfig& config) {
    ConfigLoader::validate(config);
    if (!factory_) {
        throw ConfigError("no transport factory configured");
    }

    // One session per distinct pattern, in configuration order
    std::vector<std::string> patterns;
    std::set<std::string> seen;
    for (const auto& pattern : config.topic_patterns) {
        if (seen.insert(pattern).second) {
            patterns.push_back(pattern);
        } else {
            spdlog::warn("[ConnectionManager] Ignoring duplicate topic pattern {}", pattern);
        }
    }

    // Every URL is built before any session starts
    std::vector<SubscriptionUrl> urls;
    urls.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        urls.push_back(buildSubscriptionUrl(config.endpoint, pattern, config.filter_expression));
    }

    auto shared = std::make_shared<const AppConfig::ConnectorConfig>(config);
    RunHandle run(new ConnectorRun(sink_, shared));

    if (patterns.size() > 1) {
        spdlog::info("[ConnectionManager] {} topic patterns configured, opening one connection per pattern",
                     patterns.size());
    }

    for (size_t i = 0; i < patterns.size(); ++i) {
        auto metrics = run->metrics_->getMetrics(patterns[i]);
        auto channel = run->dispatcher_->registerSession(patterns[i], metrics);
        auto session = std::make_shared<ConnectionSession>(static_cast<uint32_t>(i + 1), patterns[i], urls[i],
                                                           shared, factory_, std::move(channel),
                                                           std::move(metrics), run->token_);
        if (listener_) {
            session->setTransitionListener(listener_);
        }
        run->sessions_.push_back(std::move(session));
    }

    run->dispatcher_->start();
    for (const auto& session : run->sessions_) {
        session->start();
    }

    spdlog::info("[ConnectionManager] Started {} session(s) against {}", run->sessions_.size(), config.endpoint);
    return run;
}

StopReport ConnectionManager::stop(const RunHandle& run) {
    if (!run) return {};
    return run->shutdown(run->config().stop_grace_period);
}

StopReport ConnectionManager::stop(const RunHandle& run, std::chrono::milliseconds grace) {
    if (!run) return {};
    return run->shutdown(grace);
}

} // namespace VaultStream
