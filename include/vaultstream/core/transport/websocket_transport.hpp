#pragma once
#include <vaultstream/core/transport/subscription_url.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace VaultStream {

struct ConnectRequest {
    SubscriptionUrl url;
    std::vector<std::pair<std::string, std::string>> headers;   // applied in order, later wins
    bool verify_tls = true;
    std::chrono::milliseconds timeout{10000};                   // resolve, connect, TLS and upgrade each
};

enum class ReadStatus : uint8_t {
    MESSAGE = 0,    // out holds one complete frame
    PONG = 1,       // heartbeat acknowledged, no data
    TIMEOUT = 2     // nothing arrived in time; connection still usable
};

/**
 * @class WebSocketTransport
 * @brief One client WebSocket connection, used by a single session thread.
 *
 * connect/read/ping/close are called from the owning thread only.
 * cancel() may be called from any thread and makes the blocked call return
 * promptly with a TransportError.
 *
 * Errors: TransportError for network, TLS, timeout and close failures;
 * AuthorizationError when the upgrade is rejected with 401 or 403.
 */
class WebSocketTransport {
public:
    virtual ~WebSocketTransport() = default;

    virtual void connect(const ConnectRequest& request) = 0;
    virtual ReadStatus read(std::string& out, std::chrono::milliseconds timeout) = 0;
    virtual void ping() = 0;
    virtual void close() noexcept = 0;
    virtual void cancel() noexcept = 0;
};

using TransportFactory = std::function<std::unique_ptr<WebSocketTransport>(const SubscriptionUrl&)>;

// Boost.Beast implementation; TLS when url.secure
std::unique_ptr<WebSocketTransport> makeBeastTransport(const SubscriptionUrl& url);

} // namespace VaultStream
