#pragma once
#include <stdexcept>
#include <string>

namespace VaultStream {

/**
 * Error taxonomy of the connector.
 *
 * ConfigError        - fatal, raised before any session starts
 * TransportError     - recovered by the session (backoff + reconnect)
 * AuthorizationError - handshake rejected with 401/403, recovered like a
 *                      transport error unless the auth failure limit is hit
 * NormalizationError - malformed payload, logged and dropped
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class AuthorizationError : public TransportError {
public:
    AuthorizationError(int status, const std::string& what)
        : TransportError(what), status_(status) {}

    int status() const noexcept { return status_; }

private:
    int status_;
};

class NormalizationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace VaultStream
