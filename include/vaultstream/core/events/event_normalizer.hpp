#pragma once
#include <vaultstream/core/events/event_envelope.hpp>
#include <cstddef>
#include <string>

namespace VaultStream {

// Frame body as received, before parsing
struct RawMessage {
    std::string body;
    Timestamp received_at = std::chrono::system_clock::now();
};

/**
 * @class EventNormalizer
 * @brief Turns a raw frame into an EventEnvelope.
 *
 * Type resolution: data.event_type, then event_type, then type (the "*"
 * wildcard does not count). Without a type the envelope is "unknown" and
 * data holds the whole message. With a type, data holds the message's
 * "data" member when present.
 *
 * Throws NormalizationError when the body is not valid JSON or nests
 * objects and arrays deeper than MAX_NESTING_DEPTH.
 */
class EventNormalizer {
public:
    static constexpr size_t MAX_NESTING_DEPTH = 256;

    static EventEnvelope normalize(const RawMessage& raw, const std::string& origin);
    static EventEnvelope normalize(const RawMessage& raw, const Provenance& provenance);
};

} // namespace VaultStream
