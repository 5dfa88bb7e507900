// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __DPS150_DEVICE_TRANSPORT_HPP__
#define __DPS150_DEVICE_TRANSPORT_HPP__

#include "Utilities.hpp"
#include "protocol/ProtocolFields.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace dps150 {

// -----------------------------------------------------------------------------------------------

// Byte stream to the device (serial port, USB CDC bulk endpoints). Every call reports I/O failure
// by throwing TransportError. read returns at most maxBytes, and an empty result on timeout.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void open() = 0;
    virtual void write(const uint8_t* data, size_t size) = 0;
    virtual std::vector<uint8_t> read(size_t maxBytes, std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;

    virtual unsigned long baudRate() const = 0;
};

// -----------------------------------------------------------------------------------------------

// Receives the keys decoded from one frame, on the thread that fed the bytes in.
using UpdateHandler = std::function<void(const Update&)>;

class UpdateQueue {
public:
    explicit UpdateQueue(const size_t depth)
        : _queue(depth) {}

    UpdateHandler handler() {
        return [this](const Update& update) {
            _queue.push(update);
        };
    }
    bool pull(Update& update) {
        return _queue.pull(update);
    }
    void drain() {
        _queue.drain();
    }
    size_t size() const {
        return _queue.size();
    }
    counter_t dropped() const {
        return _queue.dropped();
    }

private:
    QueueBoundedConcurrentSafe<Update> _queue;
};

// -----------------------------------------------------------------------------------------------

}    // namespace dps150

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
