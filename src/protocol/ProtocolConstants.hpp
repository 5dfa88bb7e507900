// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __DPS150_PROTOCOL_CONSTANTS_HPP__
#define __DPS150_PROTOCOL_CONSTANTS_HPP__

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace dps150 {

// -----------------------------------------------------------------------------------------------

/*
  FNIRSI DPS-150, USB CDC at 115200-8N1 with hardware flow control

  frame: [header] [command] [field] [length] [payload x length] [checksum]
  checksum = (field + length + sum(payload)) & 0xFF
  payload floats are 4 byte little-endian IEEE-754
*/

struct Constants {
    static constexpr size_t SIZE_HEADER = 4;
    static constexpr size_t SIZE_CHECKSUM = 1;
    static constexpr size_t SIZE_FRAME_MIN = SIZE_HEADER + SIZE_CHECKSUM;
    static constexpr size_t SIZE_PAYLOAD_MAX = 255;
    static constexpr size_t SIZE_FRAME_MAX = SIZE_HEADER + SIZE_PAYLOAD_MAX + SIZE_CHECKSUM;
    static constexpr size_t SIZE_FLOAT = 4;

    static constexpr size_t OFFSET_HEADER = 0;
    static constexpr size_t OFFSET_COMMAND = 1;
    static constexpr size_t OFFSET_FIELD = 2;
    static constexpr size_t OFFSET_LENGTH = 3;
    static constexpr size_t OFFSET_PAYLOAD = 4;
};

namespace Header {
    inline constexpr uint8_t INPUT = 0xF0;     // device -> host
    inline constexpr uint8_t OUTPUT = 0xF1;    // host -> device
}    // namespace Header

namespace Command {
    inline constexpr uint8_t GET = 0xA1;
    inline constexpr uint8_t BAUD = 0xB0;
    inline constexpr uint8_t SET = 0xB1;
    inline constexpr uint8_t RESERVED = 0xC0;    // seen in captures, never sent
    inline constexpr uint8_t SESSION = 0xC1;
}    // namespace Command

namespace Field {
    inline constexpr uint8_t NONE = 0;

    inline constexpr uint8_t INPUT_VOLTAGE = 192;
    inline constexpr uint8_t VOLTAGE_SET = 193;
    inline constexpr uint8_t CURRENT_SET = 194;
    inline constexpr uint8_t OUTPUT_VOLTAGE_CURRENT_POWER = 195;
    inline constexpr uint8_t TEMPERATURE = 196;

    inline constexpr uint8_t GROUP1_VOLTAGE_SET = 197;
    inline constexpr uint8_t GROUP1_CURRENT_SET = 198;
    inline constexpr uint8_t GROUP2_VOLTAGE_SET = 199;
    inline constexpr uint8_t GROUP2_CURRENT_SET = 200;
    inline constexpr uint8_t GROUP3_VOLTAGE_SET = 201;
    inline constexpr uint8_t GROUP3_CURRENT_SET = 202;
    inline constexpr uint8_t GROUP4_VOLTAGE_SET = 203;
    inline constexpr uint8_t GROUP4_CURRENT_SET = 204;
    inline constexpr uint8_t GROUP5_VOLTAGE_SET = 205;
    inline constexpr uint8_t GROUP5_CURRENT_SET = 206;
    inline constexpr uint8_t GROUP6_VOLTAGE_SET = 207;
    inline constexpr uint8_t GROUP6_CURRENT_SET = 208;

    inline constexpr uint8_t OVP = 209;
    inline constexpr uint8_t OCP = 210;
    inline constexpr uint8_t OPP = 211;
    inline constexpr uint8_t OTP = 212;
    inline constexpr uint8_t LVP = 213;

    inline constexpr uint8_t BRIGHTNESS = 214;
    inline constexpr uint8_t VOLUME = 215;
    inline constexpr uint8_t METERING_ENABLE = 216;
    inline constexpr uint8_t OUTPUT_CAPACITY = 217;
    inline constexpr uint8_t OUTPUT_ENERGY = 218;
    inline constexpr uint8_t OUTPUT_ENABLE = 219;
    inline constexpr uint8_t PROTECTION_STATE = 220;
    inline constexpr uint8_t MODE = 221;

    inline constexpr uint8_t MODEL_NAME = 222;
    inline constexpr uint8_t HARDWARE_VERSION = 223;
    inline constexpr uint8_t FIRMWARE_VERSION = 224;

    inline constexpr uint8_t UPPER_LIMIT_VOLTAGE = 226;
    inline constexpr uint8_t UPPER_LIMIT_CURRENT = 227;

    inline constexpr uint8_t ALL = 255;

    inline constexpr int GROUP_FIRST = 1, GROUP_LAST = 6;
}    // namespace Field

// -----------------------------------------------------------------------------------------------

enum class Protection : uint8_t {
    OVP,
    OCP,
    OPP,
    OTP,
    LVP
};

inline constexpr uint8_t protectionField(const Protection protection) {
    switch (protection) {
        case Protection::OVP: return Field::OVP;
        case Protection::OCP: return Field::OCP;
        case Protection::OPP: return Field::OPP;
        case Protection::OTP: return Field::OTP;
        case Protection::LVP: return Field::LVP;
    }
    return Field::NONE;
}

// -----------------------------------------------------------------------------------------------

inline constexpr std::array<unsigned long, 5> BAUD_RATES = { 9600, 19200, 38400, 57600, 115200 };

// select command carries the table position counted from 1
inline std::optional<uint8_t> baudRateSelector(const unsigned long baudRate) {
    for (size_t i = 0; i < BAUD_RATES.size(); i++)
        if (BAUD_RATES[i] == baudRate)
            return static_cast<uint8_t>(i + 1);
    return std::nullopt;
}

// -----------------------------------------------------------------------------------------------

}    // namespace dps150

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
