#include <vaultstream/core/events/json_lines_sink.hpp>
#include <vaultstream/core/events/json_codec.hpp>
#include <stdexcept>

namespace VaultStream {

void JsonLinesSink::put(EventEnvelope envelope) {
    // Invalid UTF-8 in a payload is replaced rather than failing the line
    auto line = toJson(envelope).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mtx_);
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        throw std::runtime_error("failed to write event to output stream");
    }
    written_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace VaultStream
