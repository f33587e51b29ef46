#include <vaultstream/core/events/event_normalizer.hpp>
#include <vaultstream/core/events/json_codec.hpp>
#include <vaultstream/core/errors.hpp>
#include <nlohmann/json.hpp>
#include <optional>

namespace VaultStream {

namespace {

using json = nlohmann::json;

std::optional<std::string> stringMember(const json& object, const char* key) {
    if (!object.is_object()) return std::nullopt;
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return std::nullopt;
    auto value = it->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

const json* objectMember(const json& object, const char* key) {
    if (!object.is_object()) return nullptr;
    auto it = object.find(key);
    if (it == object.end() || !it->is_object()) return nullptr;
    return &(*it);
}

std::optional<std::string> resolveType(const json& doc) {
    if (const auto* data = objectMember(doc, "data")) {
        if (auto type = stringMember(*data, "event_type")) return type;
    }
    if (auto type = stringMember(doc, "event_type")) return type;
    if (auto type = stringMember(doc, "type")) {
        if (*type != "*") return type;
    }
    return std::nullopt;
}

// Vault reports "modified" as the string "true"; accept a real bool as well
bool modifiedFlag(const json& metadata) {
    auto it = metadata.find("modified");
    if (it == metadata.end()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_string()) return it->get<std::string>() == "true";
    return false;
}

std::optional<SecretEvent> extractSecretEvent(const json& doc, const std::string& type) {
    const auto* data = objectMember(doc, "data");
    if (!data) return std::nullopt;
    const auto* event = objectMember(*data, "event");
    if (!event) return std::nullopt;

    SecretEvent secret;
    secret.event_type = type;
    secret.id = stringMember(*event, "id").value_or(stringMember(doc, "id").value_or(""));
    secret.source = stringMember(doc, "source").value_or("");
    secret.event_time = stringMember(doc, "time").value_or("");

    if (const auto* metadata = objectMember(*event, "metadata")) {
        secret.path = stringMember(*metadata, "path").value_or(stringMember(*metadata, "data_path").value_or(""));
        secret.operation = stringMember(*metadata, "operation").value_or("");
        secret.modified = modifiedFlag(*metadata);
    }
    if (const auto* plugin = objectMember(*data, "plugin_info")) {
        secret.mount_path = stringMember(*plugin, "mount_path").value_or("");
        secret.plugin = stringMember(*plugin, "plugin").value_or("");
    }
    return secret;
}

} // namespace

EventEnvelope EventNormalizer::normalize(const RawMessage& raw, const std::string& origin) {
    Provenance provenance;
    provenance.pattern = origin;
    return normalize(raw, provenance);
}

EventEnvelope EventNormalizer::normalize(const RawMessage& raw, const Provenance& provenance) {
    // Conversion to PayloadValue recurses per level, so depth is capped while parsing
    json::parser_callback_t limitDepth = [](int depth, json::parse_event_t event, json&) {
        if ((event == json::parse_event_t::object_start || event == json::parse_event_t::array_start) &&
            depth >= static_cast<int>(EventNormalizer::MAX_NESTING_DEPTH)) {
            throw NormalizationError("payload nested deeper than " +
                                     std::to_string(EventNormalizer::MAX_NESTING_DEPTH) + " levels");
        }
        return true;
    };

    json doc;
    try {
        doc = json::parse(raw.body, limitDepth);
    } catch (const json::parse_error& e) {
        throw NormalizationError(std::string("malformed payload: ") + e.what());
    }

    auto type = resolveType(doc);
    if (!type) {
        return EventEnvelope(UNKNOWN_EVENT_TYPE, raw.received_at, fromJson(doc), GenericEvent{}, provenance);
    }

    PayloadValue data;
    auto it = doc.find("data");
    if (it != doc.end()) {
        data = fromJson(*it);
    } else {
        data = fromJson(doc);
    }

    EventDetail detail = GenericEvent{};
    if (auto secret = extractSecretEvent(doc, *type)) {
        detail = std::move(*secret);
    }
    return EventEnvelope(std::move(*type), raw.received_at, std::move(data), std::move(detail), provenance);
}

} // namespace VaultStream
