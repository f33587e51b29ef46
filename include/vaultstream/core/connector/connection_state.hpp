#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace VaultStream {

/**
 * Connection Session state machine
 *
 *   CONNECTING -> OPEN -> BACKOFF -> CONNECTING ...
 *   CONNECTING -> BACKOFF
 *   any        -> CLOSING -> STOPPED   (explicit shutdown only)
 *
 * Heartbeats are only sent while OPEN; reconnection is only scheduled from
 * BACKOFF. STOPPED is terminal.
 */
enum class ConnectionState : uint8_t {
    CONNECTING = 0,
    OPEN = 1,
    CLOSING = 2,
    BACKOFF = 3,
    STOPPED = 4
};

const char* toString(ConnectionState state);

/**
 * One observable state change of a session. Delivered to listeners on the
 * session's own thread; listeners must return quickly.
 */
struct StateTransition {
    std::string pattern;
    uint32_t session_id = 0;
    ConnectionState from = ConnectionState::CONNECTING;
    ConnectionState to = ConnectionState::CONNECTING;
    std::string reason;
    uint32_t attempt = 0;                           // reconnect attempt counter at transition time
    std::chrono::milliseconds backoff_delay{0};     // only meaningful when to == BACKOFF
};

} // namespace VaultStream
