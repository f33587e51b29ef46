#pragma once
#include <atomic>
#include <cstdint>

/**
 * @brief Counters of one connection session
 *
 * All counters are lock-free atomics updated with relaxed ordering from the
 * session thread and the dispatcher drain thread.
 */
struct SessionMetrics {
    // Connection lifecycle
    std::atomic<uint64_t> connect_attempts{0};
    std::atomic<uint64_t> connections_established{0};
    std::atomic<uint64_t> transport_failures{0};        // network, TLS, abrupt close
    std::atomic<uint64_t> authorization_failures{0};    // 401/403 on upgrade
    std::atomic<uint64_t> heartbeat_timeouts{0};
    std::atomic<uint64_t> pings_sent{0};
    std::atomic<uint64_t> state_transitions{0};

    // Read path
    std::atomic<uint64_t> frames_received{0};
    std::atomic<uint64_t> normalization_errors{0};      // malformed frames dropped

    // Delivery
    std::atomic<uint64_t> events_enqueued{0};
    std::atomic<uint64_t> events_delivered{0};          // handed to the sink
    std::atomic<uint64_t> events_dropped{0};            // recorded in the DLQ
    std::atomic<uint64_t> current_queue_depth{0};

    std::atomic<uint64_t> last_event_timestamp_ms{0};   // wall clock of last frame
    std::atomic<uint8_t> state{0};                      // ConnectionState
};

/**
 * Non-atomic copy of SessionMetrics for consistent reads
 */
struct MetricSnapshot {
    uint64_t connect_attempts = 0;
    uint64_t connections_established = 0;
    uint64_t transport_failures = 0;
    uint64_t authorization_failures = 0;
    uint64_t heartbeat_timeouts = 0;
    uint64_t pings_sent = 0;
    uint64_t state_transitions = 0;

    uint64_t frames_received = 0;
    uint64_t normalization_errors = 0;

    uint64_t events_enqueued = 0;
    uint64_t events_delivered = 0;
    uint64_t events_dropped = 0;
    uint64_t current_queue_depth = 0;

    uint64_t last_event_timestamp_ms = 0;
    uint8_t state = 0;

    uint64_t get_drop_rate_percent() const {
        uint64_t total = events_delivered + events_dropped;
        return total > 0 ? (events_dropped * 100) / total : 0;
    }
};
