// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __DPS150_DEVICE_SNAPSHOT_HPP__
#define __DPS150_DEVICE_SNAPSHOT_HPP__

#include "UtilitiesJson.hpp"
#include "protocol/ProtocolFields.hpp"

#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace dps150 {

// -----------------------------------------------------------------------------------------------

template<typename TDestination>
void serializeValue(const Value& value, TDestination dst) {
    std::visit([&dst](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, ProtectionState> || std::is_same_v<T, Mode>)
            dst.set(toString(v));
        else if constexpr (std::is_same_v<T, uint8_t>)
            dst.set(static_cast<unsigned>(v));
        else
            dst.set(v);
    },
               value);
}

inline void serializeUpdate(const Update& update, JsonVariant& obj) {
    for (const auto& [key, value] : update)
        serializeValue(value, obj[keyName(key)]);
}

inline std::string toJsonString(const Update& update) {
    JsonDocument doc;
    JsonVariant obj = doc.to<JsonObject>();
    serializeUpdate(update, obj);
    std::string output;
    serializeJson(doc, output);
    return output;
}

// -----------------------------------------------------------------------------------------------

// Last known value per key. Merging only touches the keys present in the update.
class DeviceSnapshot : public JsonSerializable {
public:
    void merge(const Update& update) {
        for (const auto& [key, value] : update)
            _values[key] = value;
    }
    void reset() {
        _values.clear();
    }

    bool has(const Key key) const {
        return _values.find(key) != _values.end();
    }
    size_t size() const {
        return _values.size();
    }
    bool empty() const {
        return _values.empty();
    }
    std::optional<Value> value(const Key key) const {
        const auto it = _values.find(key);
        if (it == _values.end())
            return std::nullopt;
        return it->second;
    }
    template<typename T>
    std::optional<T> get(const Key key) const {
        const auto it = _values.find(key);
        if (it == _values.end() || !std::holds_alternative<T>(it->second))
            return std::nullopt;
        return std::get<T>(it->second);
    }

    void serialize(JsonVariant& obj) const override {
        for (const auto& [key, value] : _values)
            serializeValue(value, obj[keyName(key)]);
    }

private:
    std::map<Key, Value> _values;
};

// -----------------------------------------------------------------------------------------------

}    // namespace dps150

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
