#include <vaultstream/core/config/loader.hpp>
#include <vaultstream/core/errors.hpp>
#include <vaultstream/core/transport/subscription_url.hpp>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdlib>

using VaultStream::ConfigError;

namespace AppConfig {

const char* toString(DeliveryPolicy policy) {
    switch (policy) {
        case DeliveryPolicy::DROP_OLDEST: return "drop_oldest";
        case DeliveryPolicy::BLOCK:       return "block";
        default:                          return "unknown";
    }
}

} // namespace AppConfig

namespace {

template <typename T>
T readScalar(const YAML::Node& node, const char* key) {
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid type for '") + key + "': " + e.what());
    }
}

// Durations are written in (fractional) seconds, as in the plugin options
std::chrono::milliseconds readSeconds(const YAML::Node& node, const char* key) {
    double seconds = readScalar<double>(node, key);
    if (!std::isfinite(seconds)) {
        throw ConfigError(std::string("invalid value for '") + key + "'");
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

std::optional<std::string> fromEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return std::nullopt;
    return std::string(value);
}

std::vector<std::string> readPatterns(const YAML::Node& node) {
    std::vector<std::string> patterns;
    if (node.IsScalar()) {
        patterns.push_back(node.as<std::string>());
        return patterns;
    }
    if (!node.IsSequence()) {
        throw ConfigError("invalid type for 'event_paths': expected a list of strings");
    }
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw ConfigError("invalid type for 'event_paths' entry: expected a string");
        }
        patterns.push_back(item.as<std::string>());
    }
    return patterns;
}

AppConfig::DeliveryPolicy parsePolicy(const std::string& value) {
    if (value == "drop_oldest") return AppConfig::DeliveryPolicy::DROP_OLDEST;
    if (value == "block")       return AppConfig::DeliveryPolicy::BLOCK;
    throw ConfigError("invalid value for 'delivery.policy': " + value);
}

AppConfig::ConnectorConfig parseConnector(const YAML::Node& node) {
    AppConfig::ConnectorConfig c;

    if (node["vault_addr"]) {
        c.endpoint = readScalar<std::string>(node, "vault_addr");
    } else if (auto env = fromEnv("VAULT_ADDR")) {
        c.endpoint = *env;
    } else {
        throw ConfigError("missing required field 'connector.vault_addr'");
    }

    if (node["vault_token"]) {
        c.token = readScalar<std::string>(node, "vault_token");
    } else if (auto env = fromEnv("VAULT_TOKEN")) {
        c.token = *env;
    } else {
        throw ConfigError("missing required field 'connector.vault_token'");
    }

    if (node["event_paths"]) {
        try {
            c.topic_patterns = readPatterns(node["event_paths"]);
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string("invalid type for 'event_paths': ") + e.what());
        }
    }

    if (node["verify_ssl"])      c.verify_tls = readScalar<bool>(node, "verify_ssl");
    if (node["ping_interval"])   c.heartbeat_interval = readSeconds(node, "ping_interval");
    c.heartbeat_timeout = node["ping_timeout"] ? readSeconds(node, "ping_timeout") : c.heartbeat_interval;
    if (node["connect_timeout"]) c.connect_timeout = readSeconds(node, "connect_timeout");
    if (node["backoff_initial"]) c.backoff_initial = readSeconds(node, "backoff_initial");
    if (node["backoff_max"])     c.backoff_max = readSeconds(node, "backoff_max");
    if (node["stop_grace"])      c.stop_grace_period = readSeconds(node, "stop_grace");

    if (node["namespace"]) {
        auto ns = readScalar<std::string>(node, "namespace");
        if (!ns.empty()) c.tenant = ns;
    }
    if (node["filter_expression"]) {
        auto filter = readScalar<std::string>(node, "filter_expression");
        if (!filter.empty()) c.filter_expression = filter;
    }
    if (node["headers"]) {
        const auto& headers = node["headers"];
        if (!headers.IsMap()) {
            throw ConfigError("invalid type for 'headers': expected a mapping");
        }
        try {
            for (const auto& kv : headers) {
                c.extra_headers[kv.first.as<std::string>()] = kv.second.as<std::string>();
            }
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string("invalid type for 'headers': ") + e.what());
        }
    }
    if (node["auth_failure_limit"]) {
        auto limit = readScalar<int64_t>(node, "auth_failure_limit");
        if (limit < 0) throw ConfigError("invalid value for 'auth_failure_limit'");
        c.auth_failure_limit = static_cast<uint32_t>(limit);
    }
    return c;
}

void parseDelivery(const YAML::Node& node, AppConfig::ConnectorConfig& c) {
    if (node["buffer_capacity"]) {
        auto capacity = readScalar<int64_t>(node, "buffer_capacity");
        if (capacity <= 0) throw ConfigError("invalid value for 'delivery.buffer_capacity'");
        c.buffer_capacity = static_cast<size_t>(capacity);
    }
    if (node["policy"]) {
        c.delivery_policy = parsePolicy(readScalar<std::string>(node, "policy"));
    }
}

AppConfig::AppConfiguration parseDocument(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw ConfigError("configuration root must be a mapping");
    }
    AppConfig::AppConfiguration config;
    if (root["app_name"]) config.app_name = readScalar<std::string>(root, "app_name");
    if (root["version"])  config.version = readScalar<std::string>(root, "version");

    if (!root["connector"] || !root["connector"].IsMap()) {
        throw ConfigError("missing required section 'connector'");
    }
    config.connector = parseConnector(root["connector"]);

    if (root["delivery"]) parseDelivery(root["delivery"], config.connector);

    if (const auto& logging = root["logging"]) {
        if (logging["level"])   config.logging.level = readScalar<std::string>(logging, "level");
        if (logging["pattern"]) config.logging.pattern = readScalar<std::string>(logging, "pattern");
        auto level = spdlog::level::from_str(config.logging.level);
        if (level == spdlog::level::off && config.logging.level != "off") {
            throw ConfigError("invalid value for 'logging.level': " + config.logging.level);
        }
    }

    if (const auto& metrics = root["metrics"]) {
        if (metrics["report_interval"]) {
            config.metrics.report_interval = readSeconds(metrics, "report_interval");
            if (config.metrics.report_interval.count() < 0) {
                throw ConfigError("invalid value for 'metrics.report_interval'");
            }
        }
    }

    ConfigLoader::validate(config.connector);
    return config;
}

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw ConfigError("config file not found: " + filepath);
    } catch (const YAML::Exception& e) {
        throw ConfigError("failed to parse " + filepath + ": " + e.what());
    }
    auto config = parseDocument(root);
    spdlog::info("[Config] Loaded {} with {} topic pattern(s)", filepath, config.connector.topic_patterns.size());
    return config;
}

AppConfig::AppConfiguration ConfigLoader::loadFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("failed to parse configuration: ") + e.what());
    }
    return parseDocument(root);
}

void ConfigLoader::validate(const AppConfig::ConnectorConfig& c) {
    if (c.endpoint.empty()) {
        throw ConfigError("endpoint address is empty");
    }
    // Throws ConfigError on an unparseable address
    VaultStream::parseEndpoint(c.endpoint);

    if (c.token.empty()) {
        throw ConfigError("authentication token is empty");
    }
    if (c.topic_patterns.empty()) {
        throw ConfigError("at least one topic pattern is required");
    }
    for (const auto& pattern : c.topic_patterns) {
        VaultStream::checkTopicPattern(pattern);
    }
    if (c.heartbeat_interval.count() <= 0) {
        throw ConfigError("heartbeat interval must be positive");
    }
    if (c.heartbeat_timeout.count() <= 0) {
        throw ConfigError("heartbeat timeout must be positive");
    }
    if (c.connect_timeout.count() <= 0) {
        throw ConfigError("connect timeout must be positive");
    }
    if (c.backoff_initial.count() <= 0) {
        throw ConfigError("initial backoff delay must be positive");
    }
    if (c.backoff_max < c.backoff_initial) {
        throw ConfigError("maximum backoff delay must not be smaller than the initial delay");
    }
    if (c.buffer_capacity == 0) {
        throw ConfigError("delivery buffer capacity must be positive");
    }
    if (c.stop_grace_period.count() < 0) {
        throw ConfigError("stop grace period must not be negative");
    }
}
