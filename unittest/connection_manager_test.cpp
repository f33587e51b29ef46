// ============================================================================
// CONNECTION MANAGER UNIT TESTS
// ============================================================================
// One session per topic pattern, shared sink, fail-fast validation and
// graceful shutdown
// ============================================================================

#include <gtest/gtest.h>
#include "common/fake_transport.hpp"

#include <vaultstream/core/connector/connection_manager.hpp>
#include <vaultstream/core/errors.hpp>

#include <mutex>
#include <set>
#include <thread>

using namespace VaultStream;
using namespace VaultStream::test;
using namespace std::chrono_literals;

namespace {

AppConfig::ConnectorConfig baseConfig(std::vector<std::string> patterns) {
    AppConfig::ConnectorConfig c;
    c.endpoint = "http://127.0.0.1:8200";
    c.token = "root";
    c.topic_patterns = std::move(patterns);
    c.heartbeat_interval = 50ms;
    c.heartbeat_timeout = 50ms;
    c.connect_timeout = 100ms;
    c.backoff_initial = 10ms;
    c.backoff_max = 40ms;
    c.stop_grace_period = 2000ms;
    return c;
}

template <class Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

bool allInState(const RunHandle& run, ConnectionState state) {
    for (const auto& status : run->sessionStatuses()) {
        if (status.state != state) return false;
    }
    return true;
}

} // namespace

// ============================================================================
// SESSION PER PATTERN
// ============================================================================

TEST(ConnectionManager, TwoPatternsGiveTwoSessionsStoppedWithinGrace) {
    auto server = FakeServer::create();
    server->add(ScriptedConnection::ok().message(R"({"type":"a"})"));
    server->add(ScriptedConnection::ok().message(R"({"type":"b"})"));

    BoundedEventQueue queue(64);
    ConnectionManager manager(queue, server->factory());
    auto run = manager.start(baseConfig({"kv-v2/*", "database/*"}));

    ASSERT_EQ(run->sessionCount(), 2u);
    ASSERT_TRUE(waitUntil([&] { return allInState(run, ConnectionState::OPEN); }));

    std::set<std::string> origins;
    for (int i = 0; i < 2; ++i) {
        auto env = queue.pop(3000ms);
        ASSERT_TRUE(env.has_value());
        origins.insert(env->origin());
    }
    EXPECT_EQ(origins, (std::set<std::string>{"kv-v2/*", "database/*"}));

    auto begin = std::chrono::steady_clock::now();
    auto report = manager.stop(run, 2000ms);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2000ms);
    EXPECT_EQ(report.stopped, 2u);
    EXPECT_EQ(report.abandoned, 0u);
    EXPECT_TRUE(allInState(run, ConnectionState::STOPPED));
    EXPECT_TRUE(run->stopped());
}

TEST(ConnectionManager, SameFilterForEveryPattern) {
    auto server = FakeServer::create();
    server->add(ScriptedConnection::ok());
    server->add(ScriptedConnection::ok());

    BoundedEventQueue queue(8);
    ConnectionManager manager(queue, server->factory());
    auto config = baseConfig({"kv-v2/*", "database/*"});
    config.filter_expression = "operation == write";
    auto run = manager.start(config);

    ASSERT_TRUE(waitUntil([&] { return server->connectCount() == 2; }));
    std::set<std::string> targets;
    for (const auto& request : server->requests()) {
        EXPECT_NE(request.url.target.find("&filter=operation%20%3D%3D%20write"), std::string::npos);
        targets.insert(request.url.target);
    }
    EXPECT_EQ(targets.size(), 2u);
    manager.stop(run);
}

TEST(ConnectionManager, DuplicatePatternsShareOneSession) {
    auto server = FakeServer::create();
    server->add(ScriptedConnection::ok());

    BoundedEventQueue queue(8);
    ConnectionManager manager(queue, server->factory());
    auto run = manager.start(baseConfig({"kv-v2/*", "kv-v2/*"}));
    EXPECT_EQ(run->sessionCount(), 1u);
    manager.stop(run);
}

TEST(ConnectionManager, FailureIsIsolatedToOneSession) {
    auto server = FakeServer::create();
    // First session to connect gets the good script, the other keeps failing
    server->add(ScriptedConnection::ok());

    BoundedEventQueue queue(8);
    ConnectionManager manager(queue, server->factory());
    auto run = manager.start(baseConfig({"kv-v2/*", "database/*"}));

    ASSERT_TRUE(waitUntil([&] {
        size_t open = 0;
        size_t retrying = 0;
        for (const auto& status : run->sessionStatuses()) {
            if (status.state == ConnectionState::OPEN) ++open;
            if (status.metrics.transport_failures >= 2) ++retrying;
        }
        return open == 1 && retrying == 1;
    }));
    manager.stop(run);
}

// ============================================================================
// VALIDATION
// ============================================================================

TEST(ConnectionManager, EmptyPatternListFailsFast) {
    auto server = FakeServer::create();
    BoundedEventQueue queue(8);
    ConnectionManager manager(queue, server->factory());

    EXPECT_THROW(manager.start(baseConfig({})), ConfigError);
    EXPECT_EQ(server->connectCount(), 0u);
}

TEST(ConnectionManager, InvalidEndpointFailsFast) {
    auto server = FakeServer::create();
    BoundedEventQueue queue(8);
    ConnectionManager manager(queue, server->factory());

    auto config = baseConfig({"kv-v2/*"});
    config.endpoint = "vault-without-scheme";
    EXPECT_THROW(manager.start(config), ConfigError);
    EXPECT_EQ(server->connectCount(), 0u);
}

// ============================================================================
// OBSERVABILITY AND SHUTDOWN
// ============================================================================

TEST(ConnectionManager, ListenerSeesEveryTransition) {
    auto server = FakeServer::create();
    server->add(ScriptedConnection::ok());

    std::mutex mtx;
    std::vector<StateTransition> seen;
    BoundedEventQueue queue(8);
    ConnectionManager manager(queue, server->factory());
    manager.setTransitionListener([&](const StateTransition& t) {
        std::lock_guard<std::mutex> lock(mtx);
        seen.push_back(t);
    });

    auto run = manager.start(baseConfig({"kv-v2/*"}));
    ASSERT_TRUE(waitUntil([&] { return allInState(run, ConnectionState::OPEN); }));
    manager.stop(run);

    std::lock_guard<std::mutex> lock(mtx);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].to, ConnectionState::OPEN);
    EXPECT_EQ(seen[1].to, ConnectionState::CLOSING);
    EXPECT_EQ(seen[2].to, ConnectionState::STOPPED);
    EXPECT_EQ(seen[0].pattern, "kv-v2/*");
}

TEST(ConnectionManager, FatalErrorIsReportedByRun) {
    auto server = FakeServer::create();
    server->add(ScriptedConnection::unauthorized());

    BoundedEventQueue queue(8);
    ConnectionManager manager(queue, server->factory());
    auto config = baseConfig({"kv-v2/*"});
    config.auth_failure_limit = 1;
    auto run = manager.start(config);

    ASSERT_TRUE(waitUntil([&] { return run->fatalError().has_value(); }));
    EXPECT_NE(run->fatalError()->find("kv-v2/*"), std::string::npos);
    manager.stop(run);
}

TEST(ConnectionManager, StopIsBoundedWhenConsumerStalls) {
    auto server = FakeServer::create();
    server->add(ScriptedConnection::ok()
                    .message(R"({"type":"a"})")
                    .message(R"({"type":"b"})")
                    .message(R"({"type":"c"})"));

    BoundedEventQueue queue(1);     // never popped
    ConnectionManager manager(queue, server->factory());
    auto run = manager.start(baseConfig({"kv-v2/*"}));

    ASSERT_TRUE(waitUntil([&] {
        auto statuses = run->sessionStatuses();
        return queue.size() == 1 && statuses[0].metrics.events_enqueued == 3;
    }));

    auto begin = std::chrono::steady_clock::now();
    auto report = manager.stop(run, 1000ms);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1500ms);
    EXPECT_EQ(report.stopped, 1u);
    EXPECT_FALSE(report.drain_abandoned);
    EXPECT_EQ(run->deadLetters()->droppedFor("kv-v2/*"), 2u);
}

TEST(ConnectionManager, StopIsIdempotent) {
    auto server = FakeServer::create();
    server->add(ScriptedConnection::ok());

    BoundedEventQueue queue(8);
    ConnectionManager manager(queue, server->factory());
    auto run = manager.start(baseConfig({"kv-v2/*"}));

    auto first = manager.stop(run);
    auto second = manager.stop(run);
    EXPECT_EQ(first.stopped, 1u);
    EXPECT_EQ(second.stopped, 1u);
}

TEST(ConnectionManager, DroppingHandleStopsSessions) {
    auto server = FakeServer::create();
    server->add(ScriptedConnection::ok());

    BoundedEventQueue queue(8);
    ConnectionManager manager(queue, server->factory());
    std::shared_ptr<ConnectionSession> session;
    {
        auto run = manager.start(baseConfig({"kv-v2/*"}));
        session = run->sessions().front();
        ASSERT_TRUE(waitUntil([&] { return session->state() == ConnectionState::OPEN; }));
    }
    EXPECT_EQ(session->state(), ConnectionState::STOPPED);
}
