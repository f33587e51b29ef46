#include <vaultstream/core/events/json_codec.hpp>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <type_traits>

namespace VaultStream {

namespace {

// RFC 3339 UTC with millisecond precision
std::string formatTimestamp(Timestamp ts) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << (millis % 1000) << 'Z';
    return out.str();
}

} // namespace

PayloadValue fromJson(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return PayloadValue(nullptr);
        case nlohmann::json::value_t::boolean:
            return PayloadValue(value.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return PayloadValue(value.get<int64_t>());
        case nlohmann::json::value_t::number_unsigned: {
            auto u = value.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return PayloadValue(static_cast<int64_t>(u));
            }
            return PayloadValue(u);
        }
        case nlohmann::json::value_t::number_float:
            return PayloadValue(value.get<double>());
        case nlohmann::json::value_t::string:
            return PayloadValue(value.get<std::string>());
        case nlohmann::json::value_t::array: {
            PayloadValue::Array array;
            array.reserve(value.size());
            for (const auto& item : value) {
                array.push_back(fromJson(item));
            }
            return PayloadValue(std::move(array));
        }
        case nlohmann::json::value_t::object: {
            PayloadValue::Object object;
            for (auto it = value.begin(); it != value.end(); ++it) {
                object.emplace(it.key(), fromJson(it.value()));
            }
            return PayloadValue(std::move(object));
        }
        default:
            // binary / discarded never come out of the text parser
            return PayloadValue(nullptr);
    }
}

nlohmann::json toJson(const PayloadValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, PayloadValue::Array>) {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : v) array.push_back(toJson(item));
            return array;
        } else if constexpr (std::is_same_v<T, PayloadValue::Object>) {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& [key, item] : v) object[key] = toJson(item);
            return object;
        } else {
            return nlohmann::json(v);
        }
    }, value.storage());
}

nlohmann::json toJson(const EventEnvelope& envelope) {
    const auto& p = envelope.provenance();
    nlohmann::json out = {
        {"type", envelope.type()},
        {"origin", envelope.origin()},
        {"timestamp", formatTimestamp(envelope.timestamp())},
        {"data", toJson(envelope.data())},
        {"provenance", {
            {"pattern", p.pattern},
            {"session_id", p.session_id},
            {"connection_epoch", p.connection_epoch},
            {"sequence", p.sequence}
        }}
    };

    if (const auto* secret = envelope.secretEvent()) {
        out["secret"] = {
            {"id", secret->id},
            {"event_type", secret->event_type},
            {"path", secret->path},
            {"operation", secret->operation},
            {"mount_path", secret->mount_path},
            {"plugin", secret->plugin},
            {"source", secret->source},
            {"event_time", secret->event_time},
            {"modified", secret->modified}
        };
    }
    return out;
}

} // namespace VaultStream
