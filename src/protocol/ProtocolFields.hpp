// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __DPS150_PROTOCOL_FIELDS_HPP__
#define __DPS150_PROTOCOL_FIELDS_HPP__

#include "Debug.hpp"
#include "protocol/ProtocolConstants.hpp"
#include "protocol/ProtocolFrame.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace dps150 {

// -----------------------------------------------------------------------------------------------

enum class ProtectionState : uint8_t {
    None = 0,
    OverVoltage,
    OverCurrent,
    OverPower,
    OverTemperature,
    LowVoltage,
    Reverse
};
inline constexpr std::array<const char*, 7> PROTECTION_STATES = { "", "OVP", "OCP", "OPP", "OTP", "LVP", "REP" };
inline const char* toString(const ProtectionState state) {
    return PROTECTION_STATES[static_cast<size_t>(state)];
}

enum class Mode : uint8_t {
    ConstantCurrent = 0,
    ConstantVoltage = 1
};
inline const char* toString(const Mode mode) {
    return mode == Mode::ConstantCurrent ? "CC" : "CV";
}

// -----------------------------------------------------------------------------------------------

enum class Key : uint8_t {
    InputVoltage,
    SetVoltage,
    SetCurrent,
    OutputVoltage,
    OutputCurrent,
    OutputPower,
    Temperature,
    Group1SetVoltage,
    Group1SetCurrent,
    Group2SetVoltage,
    Group2SetCurrent,
    Group3SetVoltage,
    Group3SetCurrent,
    Group4SetVoltage,
    Group4SetCurrent,
    Group5SetVoltage,
    Group5SetCurrent,
    Group6SetVoltage,
    Group6SetCurrent,
    OverVoltageProtection,
    OverCurrentProtection,
    OverPowerProtection,
    OverTemperatureProtection,
    LowVoltageProtection,
    Brightness,
    Volume,
    MeteringClosed,
    OutputCapacity,
    OutputEnergy,
    OutputClosed,
    ProtectionState,
    Mode,
    ModelName,
    HardwareVersion,
    FirmwareVersion,
    UpperLimitVoltage,
    UpperLimitCurrent,
    Count_
};
inline constexpr size_t KEY_COUNT = static_cast<size_t>(Key::Count_);

inline constexpr std::array<const char*, KEY_COUNT> KEY_NAMES = {
    "inputVoltage", "setVoltage", "setCurrent", "outputVoltage", "outputCurrent", "outputPower", "temperature",
    "group1setVoltage", "group1setCurrent", "group2setVoltage", "group2setCurrent", "group3setVoltage", "group3setCurrent",
    "group4setVoltage", "group4setCurrent", "group5setVoltage", "group5setCurrent", "group6setVoltage", "group6setCurrent",
    "overVoltageProtection", "overCurrentProtection", "overPowerProtection", "overTemperatureProtection", "lowVoltageProtection",
    "brightness", "volume", "meteringClosed", "outputCapacity", "outputEnergy", "outputClosed", "protectionState", "mode",
    "modelName", "hardwareVersion", "firmwareVersion", "upperLimitVoltage", "upperLimitCurrent"
};
inline const char* keyName(const Key key) {
    return KEY_NAMES[static_cast<size_t>(key)];
}
inline std::optional<Key> keyFromName(const std::string& name) {
    for (size_t i = 0; i < KEY_COUNT; i++)
        if (name == KEY_NAMES[i])
            return static_cast<Key>(i);
    return std::nullopt;
}

using Value = std::variant<float, uint8_t, bool, ProtectionState, Mode, std::string>;
using Update = std::vector<std::pair<Key, Value>>;

// -----------------------------------------------------------------------------------------------

enum class Shape : uint8_t {
    Float,
    Byte,
    FlagWhenZero,
    FlagWhenOne,
    ProtectionIndex,
    ModeIndex,
    Ascii
};

struct Slot {
    Key key;
    size_t offset;
    Shape shape;
};

struct FieldSpec {
    uint8_t field;
    const char* name;
    std::vector<Slot> slots;
};

// Fixed per-field layouts. Ascii takes everything from its offset to the end of the payload.
inline const std::vector<FieldSpec>& fieldSpecs() {
    static const std::vector<FieldSpec> specs = {
        { Field::INPUT_VOLTAGE, "INPUT_VOLTAGE", { { Key::InputVoltage, 0, Shape::Float } } },
        { Field::VOLTAGE_SET, "VOLTAGE_SET", { { Key::SetVoltage, 0, Shape::Float } } },
        { Field::CURRENT_SET, "CURRENT_SET", { { Key::SetCurrent, 0, Shape::Float } } },
        { Field::OUTPUT_VOLTAGE_CURRENT_POWER, "OUTPUT_VOLTAGE_CURRENT_POWER", { { Key::OutputVoltage, 0, Shape::Float }, { Key::OutputCurrent, 4, Shape::Float }, { Key::OutputPower, 8, Shape::Float } } },
        { Field::TEMPERATURE, "TEMPERATURE", { { Key::Temperature, 0, Shape::Float } } },
        { Field::GROUP1_VOLTAGE_SET, "GROUP1_VOLTAGE_SET", { { Key::Group1SetVoltage, 0, Shape::Float } } },
        { Field::GROUP1_CURRENT_SET, "GROUP1_CURRENT_SET", { { Key::Group1SetCurrent, 0, Shape::Float } } },
        { Field::GROUP2_VOLTAGE_SET, "GROUP2_VOLTAGE_SET", { { Key::Group2SetVoltage, 0, Shape::Float } } },
        { Field::GROUP2_CURRENT_SET, "GROUP2_CURRENT_SET", { { Key::Group2SetCurrent, 0, Shape::Float } } },
        { Field::GROUP3_VOLTAGE_SET, "GROUP3_VOLTAGE_SET", { { Key::Group3SetVoltage, 0, Shape::Float } } },
        { Field::GROUP3_CURRENT_SET, "GROUP3_CURRENT_SET", { { Key::Group3SetCurrent, 0, Shape::Float } } },
        { Field::GROUP4_VOLTAGE_SET, "GROUP4_VOLTAGE_SET", { { Key::Group4SetVoltage, 0, Shape::Float } } },
        { Field::GROUP4_CURRENT_SET, "GROUP4_CURRENT_SET", { { Key::Group4SetCurrent, 0, Shape::Float } } },
        { Field::GROUP5_VOLTAGE_SET, "GROUP5_VOLTAGE_SET", { { Key::Group5SetVoltage, 0, Shape::Float } } },
        { Field::GROUP5_CURRENT_SET, "GROUP5_CURRENT_SET", { { Key::Group5SetCurrent, 0, Shape::Float } } },
        { Field::GROUP6_VOLTAGE_SET, "GROUP6_VOLTAGE_SET", { { Key::Group6SetVoltage, 0, Shape::Float } } },
        { Field::GROUP6_CURRENT_SET, "GROUP6_CURRENT_SET", { { Key::Group6SetCurrent, 0, Shape::Float } } },
        { Field::OVP, "OVP", { { Key::OverVoltageProtection, 0, Shape::Float } } },
        { Field::OCP, "OCP", { { Key::OverCurrentProtection, 0, Shape::Float } } },
        { Field::OPP, "OPP", { { Key::OverPowerProtection, 0, Shape::Float } } },
        { Field::OTP, "OTP", { { Key::OverTemperatureProtection, 0, Shape::Float } } },
        { Field::LVP, "LVP", { { Key::LowVoltageProtection, 0, Shape::Float } } },
        { Field::BRIGHTNESS, "BRIGHTNESS", { { Key::Brightness, 0, Shape::Byte } } },
        { Field::VOLUME, "VOLUME", { { Key::Volume, 0, Shape::Byte } } },
        { Field::METERING_ENABLE, "METERING_ENABLE", { { Key::MeteringClosed, 0, Shape::FlagWhenZero } } },
        { Field::OUTPUT_CAPACITY, "OUTPUT_CAPACITY", { { Key::OutputCapacity, 0, Shape::Float } } },
        { Field::OUTPUT_ENERGY, "OUTPUT_ENERGY", { { Key::OutputEnergy, 0, Shape::Float } } },
        { Field::OUTPUT_ENABLE, "OUTPUT_ENABLE", { { Key::OutputClosed, 0, Shape::FlagWhenOne } } },
        { Field::PROTECTION_STATE, "PROTECTION_STATE", { { Key::ProtectionState, 0, Shape::ProtectionIndex } } },
        { Field::MODE, "MODE", { { Key::Mode, 0, Shape::ModeIndex } } },
        { Field::MODEL_NAME, "MODEL_NAME", { { Key::ModelName, 0, Shape::Ascii } } },
        { Field::HARDWARE_VERSION, "HARDWARE_VERSION", { { Key::HardwareVersion, 0, Shape::Ascii } } },
        { Field::FIRMWARE_VERSION, "FIRMWARE_VERSION", { { Key::FirmwareVersion, 0, Shape::Ascii } } },
        { Field::UPPER_LIMIT_VOLTAGE, "UPPER_LIMIT_VOLTAGE", { { Key::UpperLimitVoltage, 0, Shape::Float } } },
        { Field::UPPER_LIMIT_CURRENT, "UPPER_LIMIT_CURRENT", { { Key::UpperLimitCurrent, 0, Shape::Float } } },
        { Field::ALL, "ALL", {
                                 { Key::InputVoltage, 0, Shape::Float },
                                 { Key::SetVoltage, 4, Shape::Float },
                                 { Key::SetCurrent, 8, Shape::Float },
                                 { Key::OutputVoltage, 12, Shape::Float },
                                 { Key::OutputCurrent, 16, Shape::Float },
                                 { Key::OutputPower, 20, Shape::Float },
                                 { Key::Temperature, 24, Shape::Float },
                                 { Key::Group1SetVoltage, 28, Shape::Float },
                                 { Key::Group1SetCurrent, 32, Shape::Float },
                                 { Key::Group2SetVoltage, 36, Shape::Float },
                                 { Key::Group2SetCurrent, 40, Shape::Float },
                                 { Key::Group3SetVoltage, 44, Shape::Float },
                                 { Key::Group3SetCurrent, 48, Shape::Float },
                                 { Key::Group4SetVoltage, 52, Shape::Float },
                                 { Key::Group4SetCurrent, 56, Shape::Float },
                                 { Key::Group5SetVoltage, 60, Shape::Float },
                                 { Key::Group5SetCurrent, 64, Shape::Float },
                                 { Key::Group6SetVoltage, 68, Shape::Float },
                                 { Key::Group6SetCurrent, 72, Shape::Float },
                                 { Key::OverVoltageProtection, 76, Shape::Float },
                                 { Key::OverCurrentProtection, 80, Shape::Float },
                                 { Key::OverPowerProtection, 84, Shape::Float },
                                 { Key::OverTemperatureProtection, 88, Shape::Float },
                                 { Key::LowVoltageProtection, 92, Shape::Float },
                                 { Key::Brightness, 96, Shape::Byte },
                                 { Key::Volume, 97, Shape::Byte },
                                 { Key::MeteringClosed, 98, Shape::FlagWhenZero },
                                 { Key::OutputCapacity, 99, Shape::Float },
                                 { Key::OutputEnergy, 103, Shape::Float },
                                 { Key::OutputClosed, 107, Shape::FlagWhenOne },
                                 { Key::ProtectionState, 108, Shape::ProtectionIndex },
                                 { Key::Mode, 109, Shape::ModeIndex },    // 110 reserved
                                 { Key::UpperLimitVoltage, 111, Shape::Float },
                                 { Key::UpperLimitCurrent, 115, Shape::Float },
                             } },
    };
    return specs;
}
inline constexpr size_t SIZE_PAYLOAD_ALL = 119;

inline const FieldSpec* findFieldSpec(const uint8_t field) {
    for (const auto& spec : fieldSpecs())
        if (spec.field == field)
            return &spec;
    return nullptr;
}

// -----------------------------------------------------------------------------------------------

class FieldDecoder {
public:
    static bool decode_Float(const uint8_t* payload, const size_t size, const size_t offset, Value* value) {
        if (offset + Constants::SIZE_FLOAT > size) return false;
        *value = unpackFloat(payload + offset);
        return true;
    }
    static bool decode_Byte(const uint8_t* payload, const size_t size, const size_t offset, Value* value) {
        if (offset >= size) return false;
        *value = payload[offset];
        return true;
    }
    static bool decode_Flag(const uint8_t* payload, const size_t size, const size_t offset, const uint8_t when, Value* value) {
        if (offset >= size) return false;
        *value = payload[offset] == when;
        return true;
    }
    static bool decode_Protection(const uint8_t* payload, const size_t size, const size_t offset, Value* value) {
        if (offset >= size || payload[offset] >= PROTECTION_STATES.size()) return false;
        *value = static_cast<ProtectionState>(payload[offset]);
        return true;
    }
    static bool decode_Mode(const uint8_t* payload, const size_t size, const size_t offset, Value* value) {
        if (offset >= size) return false;
        *value = payload[offset] == 0 ? Mode::ConstantCurrent : Mode::ConstantVoltage;
        return true;
    }
    static bool decode_Ascii(const uint8_t* payload, const size_t size, const size_t offset, Value* value) {
        if (offset > size) return false;
        size_t end = size;
        while (end > offset && (payload[end - 1] == '\0' || payload[end - 1] == ' ' || payload[end - 1] == '\r' || payload[end - 1] == '\n'))
            end--;
        std::string string;
        string.reserve(end - offset);
        for (size_t i = offset; i < end; i++) {
            if (payload[i] > 0x7F) return false;
            string += static_cast<char>(payload[i]);
        }
        *value = std::move(string);
        return true;
    }

    static bool decode(const Slot& slot, const uint8_t* payload, const size_t size, Value* value) {
        switch (slot.shape) {
            case Shape::Float: return decode_Float(payload, size, slot.offset, value);
            case Shape::Byte: return decode_Byte(payload, size, slot.offset, value);
            case Shape::FlagWhenZero: return decode_Flag(payload, size, slot.offset, 0, value);
            case Shape::FlagWhenOne: return decode_Flag(payload, size, slot.offset, 1, value);
            case Shape::ProtectionIndex: return decode_Protection(payload, size, slot.offset, value);
            case Shape::ModeIndex: return decode_Mode(payload, size, slot.offset, value);
            case Shape::Ascii: return decode_Ascii(payload, size, slot.offset, value);
        }
        return false;
    }
};

// -----------------------------------------------------------------------------------------------

// Decodes one payload into snapshot updates. A slot that cannot be decoded (short payload, bad
// enum index, non-ASCII string) is logged and skipped; its siblings still decode. Returns the
// number of skipped slots.
inline size_t decode(const uint8_t field, const uint8_t* payload, const size_t size, Update& update) {
    const FieldSpec* spec = findFieldSpec(field);
    if (spec == nullptr) {
        DPS150_DEBUG_PRINTF("decode: field=%u, unknown, length=%u\n", field, static_cast<unsigned>(size));
        return 0;
    }
    size_t skipped = 0;
    for (const auto& slot : spec->slots) {
        Value value;
        if (FieldDecoder::decode(slot, payload, size, &value))
            update.emplace_back(slot.key, std::move(value));
        else {
            DPS150_DEBUG_PRINTF("decode: field=%s, key=%s, offset=%u, length=%u, skipped\n", spec->name, keyName(slot.key), static_cast<unsigned>(slot.offset), static_cast<unsigned>(size));
            skipped++;
        }
    }
    return skipped;
}
inline Update decode(const Packet& packet, size_t* skipped = nullptr) {
    Update update;
    const size_t count = decode(packet.field, packet.payload.data(), packet.payload.size(), update);
    if (skipped) *skipped = count;
    return update;
}

// -----------------------------------------------------------------------------------------------

}    // namespace dps150

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
