#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace AppConfig {

// What a session does when its delivery buffer is full
enum class DeliveryPolicy : uint8_t {
    DROP_OLDEST = 0,    // evict the oldest queued event of that session
    BLOCK = 1           // hold the session's read loop until space frees up
};

const char* toString(DeliveryPolicy policy);

struct ConnectorConfig {
    std::string endpoint;                                   // vault_addr
    std::string token;                                      // vault_token
    std::vector<std::string> topic_patterns{"kv-v2/data-*"};
    bool verify_tls = true;

    std::chrono::milliseconds heartbeat_interval{20000};
    std::chrono::milliseconds heartbeat_timeout{20000};
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds backoff_initial{1000};
    std::chrono::milliseconds backoff_max{30000};

    std::optional<std::string> tenant;                      // X-Vault-Namespace
    std::map<std::string, std::string> extra_headers;
    std::optional<std::string> filter_expression;

    size_t buffer_capacity = 1024;
    DeliveryPolicy delivery_policy = DeliveryPolicy::DROP_OLDEST;
    uint32_t auth_failure_limit = 0;                        // 0 = retry forever
    std::chrono::milliseconds stop_grace_period{5000};
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

struct MetricsConfig {
    std::chrono::milliseconds report_interval{0};           // 0 disables the reporter
};

struct AppConfiguration {
    std::string app_name = "VaultStream";
    std::string version = "1.0.0";
    ConnectorConfig connector;
    LoggingConfig logging;
    MetricsConfig metrics;
};

} // namespace AppConfig
