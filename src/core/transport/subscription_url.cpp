#include <vaultstream/core/transport/subscription_url.hpp>
#include <vaultstream/core/errors.hpp>
#include <cctype>

namespace VaultStream {

namespace {

constexpr const char* SUBSCRIBE_PATH = "/v1/sys/events/subscribe/";

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

uint16_t parsePort(std::string_view text, const std::string& endpoint) {
    if (text.empty() || text.size() > 5) {
        throw ConfigError("invalid port in endpoint: " + endpoint);
    }
    uint32_t port = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ConfigError("invalid port in endpoint: " + endpoint);
        }
        port = port * 10 + static_cast<uint32_t>(c - '0');
    }
    if (port == 0 || port > 65535) {
        throw ConfigError("port out of range in endpoint: " + endpoint);
    }
    return static_cast<uint16_t>(port);
}

uint16_t defaultPort(bool secure) {
    return secure ? 443 : 80;
}

} // namespace

EndpointAddress parseEndpoint(const std::string& endpoint) {
    auto sep = endpoint.find("://");
    if (sep == std::string::npos) {
        throw ConfigError("endpoint has no scheme: " + endpoint);
    }

    EndpointAddress address;
    std::string_view scheme(endpoint.data(), sep);
    if (iequals(scheme, "http") || iequals(scheme, "ws")) {
        address.secure = false;
    } else if (iequals(scheme, "https") || iequals(scheme, "wss")) {
        address.secure = true;
    } else {
        throw ConfigError("unsupported endpoint scheme: " + std::string(scheme));
    }

    std::string_view rest(endpoint);
    rest.remove_prefix(sep + 3);
    if (rest.find_first_of("?#") != std::string_view::npos) {
        throw ConfigError("endpoint must not carry a query or fragment: " + endpoint);
    }

    auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    std::string_view path = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);

    if (authority.find('@') != std::string_view::npos) {
        throw ConfigError("endpoint must not carry credentials: " + endpoint);
    }

    std::string_view host;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            throw ConfigError("unterminated IPv6 address in endpoint: " + endpoint);
        }
        host = authority.substr(1, close - 1);
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                throw ConfigError("invalid authority in endpoint: " + endpoint);
            }
            port = after.substr(1);
            if (port.empty()) throw ConfigError("invalid port in endpoint: " + endpoint);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
            if (port.empty()) throw ConfigError("invalid port in endpoint: " + endpoint);
        } else {
            host = authority;
        }
    }

    if (host.empty()) {
        throw ConfigError("endpoint has no host: " + endpoint);
    }

    address.host = std::string(host);
    address.port = port.empty() ? defaultPort(address.secure) : parsePort(port, endpoint);

    std::string base(path);
    while (!base.empty() && base.back() == '/') base.pop_back();
    address.base_path = std::move(base);
    return address;
}

std::string SubscriptionUrl::hostHeader() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port != defaultPort(secure)) {
        h += ":" + std::to_string(port);
    }
    return h;
}

std::string SubscriptionUrl::str() const {
    return std::string(secure ? "wss://" : "ws://") + hostHeader() + target;
}

void checkTopicPattern(const std::string& pattern) {
    if (pattern.empty()) {
        throw ConfigError("topic patterns must not be empty strings");
    }
    for (char ch : pattern) {
        auto c = static_cast<unsigned char>(ch);
        if (c <= 0x20 || c >= 0x7F || c == '?' || c == '#' || c == '%') {
            throw ConfigError("topic pattern \"" + pattern + "\" contains a character not allowed in a URL path");
        }
    }
}

SubscriptionUrl buildSubscriptionUrl(const std::string& endpoint,
                                     const std::string& pattern,
                                     const std::optional<std::string>& filter) {
    checkTopicPattern(pattern);
    auto address = parseEndpoint(endpoint);

    SubscriptionUrl url;
    url.secure = address.secure;
    url.host = address.host;
    url.port = address.port;
    url.target = address.base_path + SUBSCRIBE_PATH + pattern + "?json=true";
    if (filter && !filter->empty()) {
        url.target += "&filter=" + percentEncode(*filter);
    }
    return url;
}

std::string percentEncode(std::string_view text) {
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

} // namespace VaultStream
