#pragma once
#include <vaultstream/core/events/event_envelope.hpp>
#include <vaultstream/core/events/payload.hpp>
#include <nlohmann/json.hpp>

namespace VaultStream {

// Conversions between the nlohmann wire representation and the event model
PayloadValue fromJson(const nlohmann::json& value);
nlohmann::json toJson(const PayloadValue& value);

/**
 * Envelope as emitted to JSON consumers:
 * {"type","origin","timestamp","data","provenance":{...},"secret":{...}?}
 */
nlohmann::json toJson(const EventEnvelope& envelope);

} // namespace VaultStream
