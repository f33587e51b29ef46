#pragma once

#include <vaultstream/core/errors.hpp>
#include <vaultstream/core/transport/websocket_transport.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace VaultStream::test {

/*
===============================================================================
 ScriptedConnection
===============================================================================

What one connection attempt does: how the handshake ends, then the frames the
server sends, one per read() call. Once the actions are used up the
connection stays idle (reads time out) and answers pings unless silenced.
===============================================================================
*/
struct ScriptedConnection {
    enum class Handshake { OK, REFUSED, UNAUTHORIZED };

    struct Message { std::string body; };
    struct Pong {};
    struct Fail { std::string reason; };
    using Action = std::variant<Message, Pong, Fail>;

    Handshake handshake = Handshake::OK;
    std::vector<Action> actions;
    bool answer_pings = true;

    static ScriptedConnection ok() { return ScriptedConnection{}; }

    static ScriptedConnection refused() {
        ScriptedConnection c;
        c.handshake = Handshake::REFUSED;
        return c;
    }

    static ScriptedConnection unauthorized() {
        ScriptedConnection c;
        c.handshake = Handshake::UNAUTHORIZED;
        return c;
    }

    ScriptedConnection& message(std::string body) {
        actions.emplace_back(Message{std::move(body)});
        return *this;
    }

    ScriptedConnection& pong() {
        actions.emplace_back(Pong{});
        return *this;
    }

    ScriptedConnection& fail(std::string reason = "connection reset") {
        actions.emplace_back(Fail{std::move(reason)});
        return *this;
    }

    // Never acknowledge pings
    ScriptedConnection& silent() {
        answer_pings = false;
        return *this;
    }
};

class FakeServer;

class FakeTransport : public WebSocketTransport {
public:
    explicit FakeTransport(std::shared_ptr<FakeServer> server) : server_(std::move(server)) {}

    void connect(const ConnectRequest& request) override;
    ReadStatus read(std::string& out, std::chrono::milliseconds timeout) override;
    void ping() override;
    void close() noexcept override;
    void cancel() noexcept override { cancelled_ = true; }

private:
    std::shared_ptr<FakeServer> server_;
    ScriptedConnection script_;
    size_t next_ = 0;
    bool pong_pending_ = false;
    std::atomic<bool> cancelled_{false};
};

/*
===============================================================================
 FakeServer
===============================================================================

Hands out scripted connections in order, shared by every transport the
factory creates. Attempts beyond the script are refused.
===============================================================================
*/
class FakeServer : public std::enable_shared_from_this<FakeServer> {
public:
    static std::shared_ptr<FakeServer> create() { return std::shared_ptr<FakeServer>(new FakeServer()); }

    FakeServer& add(ScriptedConnection connection) {
        std::lock_guard<std::mutex> lock(mtx_);
        scripts_.push_back(std::move(connection));
        return *this;
    }

    TransportFactory factory() {
        auto self = shared_from_this();
        return [self](const SubscriptionUrl&) -> std::unique_ptr<WebSocketTransport> {
            return std::make_unique<FakeTransport>(self);
        };
    }

    std::vector<ConnectRequest> requests() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return requests_;
    }

    size_t connectCount() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return requests_.size();
    }

    uint64_t pings() const { return pings_.load(); }
    uint64_t closes() const { return closes_.load(); }

private:
    friend class FakeTransport;

    FakeServer() = default;

    ScriptedConnection accept(const ConnectRequest& request) {
        std::lock_guard<std::mutex> lock(mtx_);
        requests_.push_back(request);
        if (scripts_.empty()) return ScriptedConnection::refused();
        auto script = std::move(scripts_.front());
        scripts_.pop_front();
        return script;
    }

    mutable std::mutex mtx_;
    std::deque<ScriptedConnection> scripts_;
    std::vector<ConnectRequest> requests_;
    std::atomic<uint64_t> pings_{0};
    std::atomic<uint64_t> closes_{0};
};

inline void FakeTransport::connect(const ConnectRequest& request) {
    if (cancelled_) throw TransportError("connect cancelled");
    script_ = server_->accept(request);
    switch (script_.handshake) {
        case ScriptedConnection::Handshake::OK:
            return;
        case ScriptedConnection::Handshake::REFUSED:
            throw TransportError("connection refused");
        case ScriptedConnection::Handshake::UNAUTHORIZED:
            throw AuthorizationError(403, "subscription rejected with HTTP 403");
    }
}

inline ReadStatus FakeTransport::read(std::string& out, std::chrono::milliseconds timeout) {
    if (cancelled_) throw TransportError("read cancelled");

    if (pong_pending_) {
        pong_pending_ = false;
        return ReadStatus::PONG;
    }

    if (next_ < script_.actions.size()) {
        const auto& action = script_.actions[next_++];
        if (const auto* message = std::get_if<ScriptedConnection::Message>(&action)) {
            out = message->body;
            return ReadStatus::MESSAGE;
        }
        if (std::holds_alternative<ScriptedConnection::Pong>(action)) {
            return ReadStatus::PONG;
        }
        throw TransportError(std::get<ScriptedConnection::Fail>(action).reason);
    }

    // Idle connection
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cancelled_) throw TransportError("read cancelled");
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return ReadStatus::TIMEOUT;
}

inline void FakeTransport::ping() {
    server_->pings_.fetch_add(1);
    if (script_.answer_pings) {
        pong_pending_ = true;
    }
}

inline void FakeTransport::close() noexcept {
    server_->closes_.fetch_add(1);
}

} // namespace VaultStream::test
