#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace VaultStream {

/**
 * @class PayloadValue
 * @brief Structured event data as received on the wire.
 *
 * Tagged union over the JSON value shapes. Objects keep their keys sorted.
 */
class PayloadValue {
public:
    using Array = std::vector<PayloadValue>;
    using Object = std::map<std::string, PayloadValue>;
    using Storage = std::variant<std::nullptr_t, bool, int64_t, uint64_t, double, std::string, Array, Object>;

    PayloadValue() : storage_(nullptr) {}
    PayloadValue(std::nullptr_t) : storage_(nullptr) {}
    PayloadValue(bool value) : storage_(value) {}
    PayloadValue(int value) : storage_(static_cast<int64_t>(value)) {}
    PayloadValue(int64_t value) : storage_(value) {}
    PayloadValue(uint64_t value) : storage_(value) {}
    PayloadValue(double value) : storage_(value) {}
    PayloadValue(const char* value) : storage_(std::string(value)) {}
    PayloadValue(std::string value) : storage_(std::move(value)) {}
    PayloadValue(Array value) : storage_(std::move(value)) {}
    PayloadValue(Object value) : storage_(std::move(value)) {}

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(storage_); }
    bool isBool() const { return std::holds_alternative<bool>(storage_); }
    bool isNumber() const {
        return std::holds_alternative<int64_t>(storage_) || std::holds_alternative<uint64_t>(storage_) ||
               std::holds_alternative<double>(storage_);
    }
    bool isString() const { return std::holds_alternative<std::string>(storage_); }
    bool isArray() const { return std::holds_alternative<Array>(storage_); }
    bool isObject() const { return std::holds_alternative<Object>(storage_); }

    const std::string* asString() const { return std::get_if<std::string>(&storage_); }
    const Array* asArray() const { return std::get_if<Array>(&storage_); }
    const Object* asObject() const { return std::get_if<Object>(&storage_); }

    // Member lookup; nullptr when this is not an object or the key is absent
    const PayloadValue* find(const std::string& key) const;

    size_t size() const;

    const Storage& storage() const { return storage_; }

    friend bool operator==(const PayloadValue& a, const PayloadValue& b) { return a.storage_ == b.storage_; }
    friend bool operator!=(const PayloadValue& a, const PayloadValue& b) { return !(a == b); }

private:
    Storage storage_;
};

} // namespace VaultStream
