// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __DPS150_PROTOCOL_FRAME_HPP__
#define __DPS150_PROTOCOL_FRAME_HPP__

#include "Errors.hpp"
#include "Utilities.hpp"
#include "protocol/ProtocolConstants.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace dps150 {

// -----------------------------------------------------------------------------------------------

inline uint8_t checksum(const uint8_t field, const uint8_t* payload, const size_t size) {
    uint8_t sum = static_cast<uint8_t>(field + size);
    for (size_t i = 0; i < size; i++)
        sum += payload[i];
    return sum;
}
inline uint8_t checksum(const uint8_t field, const std::vector<uint8_t>& payload) {
    return checksum(field, payload.data(), payload.size());
}

// -----------------------------------------------------------------------------------------------

inline std::array<uint8_t, Constants::SIZE_FLOAT> packFloat(const float value) {
    static_assert(sizeof(float) == sizeof(uint32_t), "float must be 32 bit IEEE-754");
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return { static_cast<uint8_t>(bits), static_cast<uint8_t>(bits >> 8), static_cast<uint8_t>(bits >> 16), static_cast<uint8_t>(bits >> 24) };
}
inline float unpackFloat(const uint8_t* bytes) {
    const uint32_t bits = (static_cast<uint32_t>(bytes[3]) << 24) | (static_cast<uint32_t>(bytes[2]) << 16) | (static_cast<uint32_t>(bytes[1]) << 8) | static_cast<uint32_t>(bytes[0]);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

// -----------------------------------------------------------------------------------------------

struct Packet {
    uint8_t header = Header::INPUT;
    uint8_t command = Command::GET;
    uint8_t field = Field::NONE;
    std::vector<uint8_t> payload;

    uint8_t length() const {
        return static_cast<uint8_t>(payload.size());
    }
    uint8_t checksum() const {
        return dps150::checksum(field, payload);
    }
    std::string toString() const {
        std::string result = BytesToHexString(&header, 1) + ' ' + BytesToHexString(&command, 1) + ' ' + BytesToHexString(&field, 1) + " [" + std::to_string(payload.size()) + "]";
        if (!payload.empty())
            result += ' ' + BytesToHexString(payload.data(), payload.size());
        return result;
    }
    bool operator==(const Packet& other) const {
        return header == other.header && command == other.command && field == other.field && payload == other.payload;
    }
};

// -----------------------------------------------------------------------------------------------

inline std::vector<uint8_t> encode(const uint8_t header, const uint8_t command, const uint8_t field, const std::vector<uint8_t>& payload) {
    if (payload.size() > Constants::SIZE_PAYLOAD_MAX)
        throw EncodingError("payload of " + std::to_string(payload.size()) + " bytes exceeds " + std::to_string(Constants::SIZE_PAYLOAD_MAX));
    std::vector<uint8_t> frame;
    frame.reserve(Constants::SIZE_FRAME_MIN + payload.size());
    frame.push_back(header);
    frame.push_back(command);
    frame.push_back(field);
    frame.push_back(static_cast<uint8_t>(payload.size()));
    frame.insert(frame.end(), payload.begin(), payload.end());
    frame.push_back(checksum(field, payload));
    return frame;
}
inline std::vector<uint8_t> encode(const Packet& packet) {
    return encode(packet.header, packet.command, packet.field, packet.payload);
}
inline std::vector<uint8_t> encodeFloat(const uint8_t header, const uint8_t command, const uint8_t field, const float value) {
    const auto bytes = packFloat(value);
    return encode(header, command, field, std::vector<uint8_t>(bytes.begin(), bytes.end()));
}
inline std::vector<uint8_t> encodeByte(const uint8_t header, const uint8_t command, const uint8_t field, const uint8_t value) {
    return encode(header, command, field, std::vector<uint8_t>{ value });
}

// -----------------------------------------------------------------------------------------------

}    // namespace dps150

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
