#pragma once
#include <vaultstream/core/events/payload.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace VaultStream {

using Timestamp = std::chrono::system_clock::time_point;

constexpr const char* UNKNOWN_EVENT_TYPE = "unknown";

// Which connection produced an envelope
struct Provenance {
    std::string pattern;
    uint32_t session_id = 0;
    uint64_t connection_epoch = 0;      // successful handshakes of that session
    uint64_t sequence = 0;              // frame number within the session
};

/**
 * Vault secrets-engine notification (CloudEvents body with data.event,
 * data.event_type and data.plugin_info).
 */
struct SecretEvent {
    std::string id;
    std::string event_type;
    std::string path;
    std::string operation;
    std::string mount_path;
    std::string plugin;
    std::string source;
    std::string event_time;
    bool modified = false;
};

// Fallback shape: everything lives in EventEnvelope::data()
struct GenericEvent {};

using EventDetail = std::variant<GenericEvent, SecretEvent>;

/**
 * @class EventEnvelope
 * @brief Canonical, immutable event handed to the downstream sink.
 */
class EventEnvelope {
public:
    EventEnvelope(std::string type,
                  Timestamp timestamp,
                  PayloadValue data,
                  EventDetail detail,
                  Provenance provenance)
        : type_(std::move(type)),
          timestamp_(timestamp),
          data_(std::move(data)),
          detail_(std::move(detail)),
          provenance_(std::move(provenance)) {}

    const std::string& type() const { return type_; }
    const std::string& origin() const { return provenance_.pattern; }
    Timestamp timestamp() const { return timestamp_; }
    const PayloadValue& data() const { return data_; }
    const EventDetail& detail() const { return detail_; }
    const Provenance& provenance() const { return provenance_; }

    bool isUnknownType() const { return type_ == UNKNOWN_EVENT_TYPE; }
    const SecretEvent* secretEvent() const { return std::get_if<SecretEvent>(&detail_); }

private:
    std::string type_;
    Timestamp timestamp_;
    PayloadValue data_;
    EventDetail detail_;
    Provenance provenance_;
};

} // namespace VaultStream
