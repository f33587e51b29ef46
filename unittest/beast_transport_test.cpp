// ============================================================================
// BEAST TRANSPORT TESTS
// ============================================================================
// Client transport against a local Boost.Beast WebSocket server on loopback
// ============================================================================

#include <gtest/gtest.h>
#include <vaultstream/core/connector/connection_manager.hpp>
#include <vaultstream/core/errors.hpp>
#include <vaultstream/core/events/event_sink.hpp>
#include <vaultstream/core/transport/subscription_url.hpp>
#include <vaultstream/core/transport/websocket_transport.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <mutex>
#include <thread>
#include <utility>
#include <vector>

using namespace VaultStream;
using namespace std::chrono_literals;

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

const std::string EVENT = R"({"type":"kv-v2/data-write","data":{"k":1}})";

/*
 * Serves exactly one client connection on 127.0.0.1, then exits.
 */
class LocalWsServer {
public:
    enum class Mode {
        SEND_EVENT,         // upgrade, send EVENT, answer pings until close
        SEND_LATE_EVENT,    // upgrade, wait 300ms, then send EVENT
        REJECT_403,         // answer the upgrade with 403
        STALL               // read the upgrade request and never answer
    };

    explicit LocalWsServer(Mode mode)
        : mode_(mode), acceptor_(ioc_, tcp::endpoint(net::ip::address_v4::loopback(), 0)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this] { serve(); });
    }

    ~LocalWsServer() {
        if (thread_.joinable()) thread_.join();
    }

    uint16_t port() const { return port_; }

    std::string header(const std::string& name) {
        auto values = headerValues(name);
        return values.empty() ? std::string() : values.front();
    }

    // Every value sent under name, in request order
    std::vector<std::string> headerValues(const std::string& name) {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<std::string> values;
        for (const auto& [field, value] : headers_) {
            if (beast::iequals(field, name)) values.push_back(value);
        }
        return values;
    }

    std::string target() {
        std::lock_guard<std::mutex> lock(mtx_);
        return target_;
    }

    std::string error() {
        std::lock_guard<std::mutex> lock(mtx_);
        return error_;
    }

private:
    void serve() {
        try {
            tcp::socket socket(ioc_);
            acceptor_.accept(socket);

            beast::flat_buffer buffer;
            http::request<http::string_body> request;
            http::read(socket, buffer, request);
            {
                std::lock_guard<std::mutex> lock(mtx_);
                target_ = std::string(request.target());
                for (const auto& field : request) {
                    headers_.emplace_back(std::string(field.name_string()), std::string(field.value()));
                }
            }

            if (mode_ == Mode::REJECT_403) {
                http::response<http::string_body> response{http::status::forbidden, request.version()};
                response.body() = R"({"errors":["permission denied"]})";
                response.prepare_payload();
                http::write(socket, response);
                return;
            }

            if (mode_ == Mode::STALL) {
                char byte;
                beast::error_code ec;
                socket.read_some(net::buffer(&byte, 1), ec);
                return;
            }

            websocket::stream<tcp::socket> ws(std::move(socket));
            ws.accept(request);

            if (mode_ == Mode::SEND_LATE_EVENT) {
                std::this_thread::sleep_for(300ms);
            }
            ws.text(true);
            ws.write(net::buffer(EVENT));

            // Reading answers pings with pongs; ends when the client closes
            beast::flat_buffer frames;
            beast::error_code ec;
            while (!ec) {
                ws.read(frames, ec);
                frames.consume(frames.size());
            }
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mtx_);
            error_ = e.what();
        }
    }

    Mode mode_;
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::thread thread_;

    std::mutex mtx_;
    std::vector<std::pair<std::string, std::string>> headers_;
    std::string target_;
    std::string error_;
};

ConnectRequest requestFor(uint16_t port, const std::string& pattern = "kv-v2/data-*") {
    ConnectRequest request;
    request.url = buildSubscriptionUrl("http://127.0.0.1:" + std::to_string(port), pattern,
                                       std::string("operation == write"));
    request.headers = {{"X-Vault-Token", "root"}, {"X-Vault-Namespace", "team-a"}};
    request.verify_tls = false;
    request.timeout = 2000ms;
    return request;
}

// Reads until a frame of the wanted kind arrives
ReadStatus readUntil(WebSocketTransport& transport, ReadStatus wanted, std::string& out,
                     std::chrono::milliseconds budget = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + budget;
    while (std::chrono::steady_clock::now() < deadline) {
        auto status = transport.read(out, 100ms);
        if (status == wanted) return status;
    }
    return ReadStatus::TIMEOUT;
}

} // namespace

// ============================================================================
// HANDSHAKE AND FRAMES
// ============================================================================

TEST(BeastTransport, HandshakeSendsHeadersAndReceivesEvent) {
    LocalWsServer server(LocalWsServer::Mode::SEND_EVENT);
    auto request = requestFor(server.port());
    auto transport = makeBeastTransport(request.url);

    ASSERT_NO_THROW(transport->connect(request));

    std::string body;
    ASSERT_EQ(readUntil(*transport, ReadStatus::MESSAGE, body), ReadStatus::MESSAGE);
    EXPECT_EQ(body, EVENT);

    EXPECT_EQ(server.target(), "/v1/sys/events/subscribe/kv-v2/data-*?json=true&filter=operation%20%3D%3D%20write");
    EXPECT_EQ(server.header("X-Vault-Token"), "root");
    EXPECT_EQ(server.header("X-Vault-Namespace"), "team-a");

    transport->ping();
    EXPECT_EQ(readUntil(*transport, ReadStatus::PONG, body), ReadStatus::PONG);

    transport->close();
    EXPECT_EQ(server.error(), "");
}

TEST(BeastTransport, ReadTimeoutKeepsConnectionUsable) {
    LocalWsServer server(LocalWsServer::Mode::SEND_LATE_EVENT);
    auto request = requestFor(server.port());
    auto transport = makeBeastTransport(request.url);
    transport->connect(request);

    std::string body;
    EXPECT_EQ(transport->read(body, 50ms), ReadStatus::TIMEOUT);
    ASSERT_EQ(readUntil(*transport, ReadStatus::MESSAGE, body), ReadStatus::MESSAGE);
    EXPECT_EQ(body, EVENT);
    transport->close();
}

TEST(BeastTransport, ExtraHeadersOverrideTokenAndNamespace) {
    LocalWsServer server(LocalWsServer::Mode::SEND_EVENT);

    AppConfig::ConnectorConfig config;
    config.endpoint = "http://127.0.0.1:" + std::to_string(server.port());
    config.token = "root";
    config.tenant = "team-a";
    config.topic_patterns = {"kv-v2/data-*"};
    config.extra_headers["X-Vault-Token"] = "override";
    config.extra_headers["X-Vault-Namespace"] = "team-b";

    BoundedEventQueue queue(8);
    ConnectionManager manager(queue);
    auto run = manager.start(config);

    auto env = queue.pop(5000ms);
    ASSERT_TRUE(env.has_value());
    EXPECT_EQ(env->type(), "kv-v2/data-write");
    manager.stop(run, 2000ms);

    EXPECT_EQ(server.headerValues("X-Vault-Token"), std::vector<std::string>{"override"});
    EXPECT_EQ(server.headerValues("X-Vault-Namespace"), std::vector<std::string>{"team-b"});
    EXPECT_EQ(server.target(), "/v1/sys/events/subscribe/kv-v2/data-*?json=true");
}

// ============================================================================
// FAILURES
// ============================================================================

TEST(BeastTransport, ForbiddenUpgradeRaisesAuthorizationError) {
    LocalWsServer server(LocalWsServer::Mode::REJECT_403);
    auto request = requestFor(server.port());
    auto transport = makeBeastTransport(request.url);

    try {
        transport->connect(request);
        FAIL() << "expected AuthorizationError";
    } catch (const AuthorizationError& e) {
        EXPECT_EQ(e.status(), 403);
    }
    transport->close();
}

TEST(BeastTransport, RefusedConnectionRaisesTransportError) {
    uint16_t port = 0;
    {
        // Grab a free port and release it again
        net::io_context ioc;
        tcp::acceptor scratch(ioc, tcp::endpoint(net::ip::address_v4::loopback(), 0));
        port = scratch.local_endpoint().port();
    }
    auto request = requestFor(port);
    auto transport = makeBeastTransport(request.url);
    EXPECT_THROW(transport->connect(request), TransportError);
}

TEST(BeastTransport, CancelUnblocksPendingHandshake) {
    LocalWsServer server(LocalWsServer::Mode::STALL);
    auto request = requestFor(server.port());
    request.timeout = 10000ms;
    auto transport = makeBeastTransport(request.url);

    std::thread canceller([&] {
        std::this_thread::sleep_for(200ms);
        transport->cancel();
    });

    auto begin = std::chrono::steady_clock::now();
    EXPECT_THROW(transport->connect(request), TransportError);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 3000ms);
    canceller.join();
}

TEST(BeastTransport, HandshakeTimesOut) {
    LocalWsServer server(LocalWsServer::Mode::STALL);
    auto request = requestFor(server.port());
    request.timeout = 300ms;
    auto transport = makeBeastTransport(request.url);

    EXPECT_THROW(transport->connect(request), TransportError);
    transport->close();
}
