#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace VaultStream {

// Parsed server base address (scheme, host, port, path prefix)
struct EndpointAddress {
    bool secure = false;
    std::string host;
    uint16_t port = 0;
    std::string base_path;      // no trailing slash, may be empty
};

/**
 * @brief Parse a server address such as "https://vault.local:8200".
 *
 * Accepts http, https, ws and wss. https and wss select TLS. IPv6 hosts must
 * be bracketed. Throws ConfigError on anything else.
 */
EndpointAddress parseEndpoint(const std::string& endpoint);

// Event subscription endpoint of one topic pattern
struct SubscriptionUrl {
    bool secure = false;
    std::string host;
    uint16_t port = 0;
    std::string target;         // path + query

    // Host header value: port omitted when it is the scheme default
    std::string hostHeader() const;
    std::string str() const;
};

/**
 * @brief Throw ConfigError unless pattern can be placed in the request path
 * as is: non-empty, printable ASCII, no space, '?', '#' or '%'.
 */
void checkTopicPattern(const std::string& pattern);

/**
 * @brief Build ws(s)://host[:port]/v1/sys/events/subscribe/{pattern}?json=true
 * with "&filter=..." appended when a filter expression is set.
 * Throws ConfigError for a bad endpoint or topic pattern.
 */
SubscriptionUrl buildSubscriptionUrl(const std::string& endpoint,
                                     const std::string& pattern,
                                     const std::optional<std::string>& filter = std::nullopt);

// RFC 3986 percent-encoding; unreserved characters and '/' pass through
std::string percentEncode(std::string_view text);

} // namespace VaultStream
