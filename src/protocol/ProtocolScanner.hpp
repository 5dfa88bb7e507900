// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __DPS150_PROTOCOL_SCANNER_HPP__
#define __DPS150_PROTOCOL_SCANNER_HPP__

#include "Debug.hpp"
#include "Utilities.hpp"
#include "protocol/ProtocolConstants.hpp"
#include "protocol/ProtocolFrame.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <vector>

namespace dps150 {

// -----------------------------------------------------------------------------------------------

struct ScanStatistics {
    counter_t frames = 0;
    counter_t checksumErrors = 0;
    counter_t bytesDiscarded = 0;
    counter_t handlerErrors = 0;
};

// Scans data for inbound frames (F0 A1), appending good ones to packets. Returns the number of
// bytes consumed; anything after that is an incomplete frame (or a lone marker byte) to be kept
// and rescanned once more bytes arrive. Bad checksums consume the frame and are dropped.
inline size_t scan(const uint8_t* data, const size_t size, std::vector<Packet>& packets, ScanStatistics* statistics = nullptr) {
    size_t offset = 0;
    while (offset < size) {
        const size_t available = size - offset;
        if (data[offset] != Header::INPUT || (available > 1 && data[offset + 1] != Command::GET)) {
            offset++;
            if (statistics) statistics->bytesDiscarded++;
            continue;
        }
        if (available < Constants::SIZE_HEADER)
            break;
        const uint8_t field = data[offset + Constants::OFFSET_FIELD], length = data[offset + Constants::OFFSET_LENGTH];
        const size_t frameSize = Constants::SIZE_HEADER + length + Constants::SIZE_CHECKSUM;
        if (available < frameSize)
            break;
        const uint8_t* payload = data + offset + Constants::OFFSET_PAYLOAD;
        const uint8_t expected = checksum(field, payload, length), received = payload[length];
        offset += frameSize;
        if (expected != received) {
            DPS150_DEBUG_PRINTF("scan: checksum mismatch, field=%u, length=%u, expected=%02X, received=%02X\n", field, length, expected, received);
            if (statistics) statistics->checksumErrors++;
            continue;
        }
        packets.push_back(Packet{ .header = Header::INPUT, .command = Command::GET, .field = field, .payload = std::vector<uint8_t>(payload, payload + length) });
        if (statistics) statistics->frames++;
    }
    return offset;
}

// -----------------------------------------------------------------------------------------------

struct FeedResult {
    std::vector<Packet> packets;
    std::vector<uint8_t> remaining;
};

inline FeedResult feed(std::vector<uint8_t> buffer, const std::vector<uint8_t>& bytes) {
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    FeedResult result;
    const size_t consumed = scan(buffer.data(), buffer.size(), result.packets);
    result.remaining.assign(buffer.begin() + static_cast<std::ptrdiff_t>(consumed), buffer.end());
    return result;
}

// -----------------------------------------------------------------------------------------------

class Receiver {
public:
    using Handler = std::function<void(const Packet&)>;

    static constexpr size_t COMPACT_THRESHOLD = 4 * Constants::SIZE_FRAME_MAX;

    Receiver()
        : _handler([](const Packet&) {}) {}

    Receiver& registerHandler(Handler handler) {
        _handler = std::move(handler);
        return *this;
    }

    size_t process(const uint8_t* data, const size_t size) {
        _buffer.insert(_buffer.end(), data, data + size);
        std::vector<Packet> packets;
        _offset += scan(_buffer.data() + _offset, _buffer.size() - _offset, packets, &_statistics);
        if (_offset == _buffer.size()) {
            _buffer.clear();
            _offset = 0;
        } else if (_offset >= COMPACT_THRESHOLD) {
            _buffer.erase(_buffer.begin(), _buffer.begin() + static_cast<std::ptrdiff_t>(_offset));
            _offset = 0;
        }
        for (const auto& packet : packets) {
            try {
                _handler(packet);
            } catch (const std::exception& e) {
                DPS150_DEBUG_PRINTF("Receiver::process: handler failed, field=%u, %s\n", packet.field, e.what());
                _statistics.handlerErrors++;
            }
        }
        return packets.size();
    }
    size_t process(const std::vector<uint8_t>& bytes) {
        return process(bytes.data(), bytes.size());
    }
    void reset() {
        _buffer.clear();
        _offset = 0;
        _statistics = ScanStatistics{};
    }

    size_t buffered() const {
        return _buffer.size() - _offset;
    }
    const ScanStatistics& statistics() const {
        return _statistics;
    }

private:
    Handler _handler;
    std::vector<uint8_t> _buffer;
    size_t _offset = 0;
    ScanStatistics _statistics;
};

// -----------------------------------------------------------------------------------------------

}    // namespace dps150

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
