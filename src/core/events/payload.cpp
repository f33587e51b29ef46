#include <vaultstream/core/events/payload.hpp>

namespace VaultStream {

const PayloadValue* PayloadValue::find(const std::string& key) const {
    const auto* object = asObject();
    if (!object) return nullptr;
    auto it = object->find(key);
    return it == object->end() ? nullptr : &it->second;
}

size_t PayloadValue::size() const {
    if (const auto* array = asArray()) return array->size();
    if (const auto* object = asObject()) return object->size();
    return isNull() ? 0 : 1;
}

} // namespace VaultStream
