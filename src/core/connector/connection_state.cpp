#include <vaultstream/core/connector/connection_state.hpp>

namespace VaultStream {

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::CONNECTING: return "CONNECTING";
        case ConnectionState::OPEN:       return "OPEN";
        case ConnectionState::CLOSING:    return "CLOSING";
        case ConnectionState::BACKOFF:    return "BACKOFF";
        case ConnectionState::STOPPED:    return "STOPPED";
        default:                          return "UNKNOWN";
    }
}

} // namespace VaultStream
