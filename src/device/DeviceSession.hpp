// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __DPS150_DEVICE_SESSION_HPP__
#define __DPS150_DEVICE_SESSION_HPP__

#include "Debug.hpp"
#include "Errors.hpp"
#include "Utilities.hpp"
#include "UtilitiesJson.hpp"
#include "device/DeviceSnapshot.hpp"
#include "device/DeviceTransport.hpp"
#include "protocol/ProtocolConstants.hpp"
#include "protocol/ProtocolFields.hpp"
#include "protocol/ProtocolFrame.hpp"
#include "protocol/ProtocolScanner.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#ifndef DEFAULT_SETTLE_DELAY_MS
#define DEFAULT_SETTLE_DELAY_MS 50
#endif
#ifndef DEFAULT_POLL_INTERVAL_MS
#define DEFAULT_POLL_INTERVAL_MS 10
#endif
#ifndef DEFAULT_READ_SIZE
#define DEFAULT_READ_SIZE 512
#endif
#ifndef DEFAULT_READ_TIMEOUT_MS
#define DEFAULT_READ_TIMEOUT_MS 100
#endif
#ifndef DEFAULT_WRITE_RETRIES
#define DEFAULT_WRITE_RETRIES 9
#endif
#ifndef DEFAULT_WRITE_RETRY_DELAY_MS
#define DEFAULT_WRITE_RETRY_DELAY_MS 100
#endif
#ifndef DEFAULT_FLUSH_READS_MAX
#define DEFAULT_FLUSH_READS_MAX 16
#endif

namespace dps150 {

// -----------------------------------------------------------------------------------------------

class Session : public Diagnosticable {
public:
    enum class State : uint8_t {
        Disconnected,
        Connecting,
        Initializing,
        Streaming,
        Disconnecting
    };
    static const char* toString(const State state) {
        switch (state) {
            case State::Disconnected: return "disconnected";
            case State::Connecting: return "connecting";
            case State::Initializing: return "initializing";
            case State::Streaming: return "streaming";
            case State::Disconnecting: return "disconnecting";
        }
        return "unknown";
    }

    struct Config {
        std::chrono::milliseconds settleDelay{ DEFAULT_SETTLE_DELAY_MS };
        std::chrono::milliseconds pollInterval{ DEFAULT_POLL_INTERVAL_MS };
        std::chrono::milliseconds readTimeout{ DEFAULT_READ_TIMEOUT_MS };
        size_t readSize = DEFAULT_READ_SIZE;
        bool readerThread = true;
        unsigned writeRetries = DEFAULT_WRITE_RETRIES;    // attempts after the first
        std::chrono::milliseconds writeRetryDelay{ DEFAULT_WRITE_RETRY_DELAY_MS };
    };

    explicit Session(const Config& conf, Transport& transport, UpdateHandler handler = nullptr)
        : config(conf),
          _transport(transport),
          _handler(std::move(handler)) {
        _receiver.registerHandler([this](const Packet& packet) {
            dispatch(packet);
        });
    }
    ~Session() {
        disconnect();
        stopReader();
    }
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Opens the transport and issues the initialization sequence without waiting for replies.
    // Any failure closes the transport, returns to Disconnected and throws ConnectError.
    void connect() {
        std::lock_guard<std::mutex> guard(_lifecycleMutex);
        if (_state != State::Disconnected) {
            DPS150_DEBUG_PRINTF("Session::connect: already %s\n", toString(_state));
            return;
        }
        const std::optional<uint8_t> baudSelector = baudRateSelector(_transport.baudRate());
        if (!baudSelector)
            throw ValidationError("baud rate " + std::to_string(_transport.baudRate()) + " not supported by device");
        if (_reader.joinable()) {
            if (_reader.get_id() == std::this_thread::get_id())
                throw Error("connect called from the reader thread");
            _reader.join();
        }

        DPS150_DEBUG_PRINTF("Session::connect: baud=%lu, settle=%lldms, reader=%s\n", _transport.baudRate(), static_cast<long long>(config.settleDelay.count()), config.readerThread ? "thread" : "poll");
        _state = State::Connecting;
        try {
            _transport.open();
            _state = State::Initializing;
            flushInput();
            {
                std::lock_guard<std::mutex> guardReceive(_receiveMutex);
                _receiver.reset();
                _decodeErrors = 0;
                _handlerErrors = 0;
            }
            {
                std::lock_guard<std::mutex> guardSnapshot(_snapshotMutex);
                _snapshot.reset();
            }
            _running = true;
            if (config.readerThread)
                _reader = std::thread(&Session::readerLoop, this);
            initialize(*baudSelector);
            _state = State::Streaming;
        } catch (const std::exception& e) {
            DPS150_DEBUG_PRINTF("Session::connect: failed, %s\n", e.what());
            stopReader();
            closeTransport();
            _state = State::Disconnected;
            throw ConnectError(std::string("connect failed: ") + e.what());
        }
        DPS150_DEBUG_PRINTF("Session::connect: streaming\n");
    }

    // Reachable from any state, safe to repeat. When called from the update handler on the reader
    // thread, the reader stops after the handler returns and is joined by the next connect.
    void disconnect() {
        std::lock_guard<std::mutex> guard(_lifecycleMutex);
        if (_state == State::Disconnected)
            return;
        DPS150_DEBUG_PRINTF("Session::disconnect: from %s\n", toString(_state));
        _state = State::Disconnecting;
        try {
            send(encodeByte(Header::OUTPUT, Command::SESSION, Field::NONE, 0));
        } catch (const TransportError& e) {
            DPS150_DEBUG_PRINTF("Session::disconnect: stop toggle not sent, %s\n", e.what());
        }
        stopReader();
        closeTransport();
        _state = State::Disconnected;
    }

    // One read-then-parse pass, for callers that drive the session from their own loop.
    // Returns the number of bytes read.
    size_t poll() {
        if (_state != State::Initializing && _state != State::Streaming)
            return 0;
        return receive();
    }

    //

    void setFloatValue(const uint8_t field, const float value) {
        command(encodeFloat(Header::OUTPUT, Command::SET, field, value));
    }
    void setByteValue(const uint8_t field, const int value) {
        if (value < 0 || value > 0xFF)
            throw ValidationError("byte value " + std::to_string(value) + " out of range for field " + std::to_string(field));
        command(encodeByte(Header::OUTPUT, Command::SET, field, static_cast<uint8_t>(value)));
    }
    void setVoltage(const float voltage) {
        setFloatValue(Field::VOLTAGE_SET, voltage);
    }
    void setCurrent(const float current) {
        setFloatValue(Field::CURRENT_SET, current);
    }
    void enable() {
        setByteValue(Field::OUTPUT_ENABLE, 1);
    }
    void disable() {
        setByteValue(Field::OUTPUT_ENABLE, 0);
    }
    void startMetering() {
        setByteValue(Field::METERING_ENABLE, 1);
    }
    void stopMetering() {
        setByteValue(Field::METERING_ENABLE, 0);
    }
    void setBrightness(const int brightness) {
        setByteValue(Field::BRIGHTNESS, brightness);
    }
    void setVolume(const int volume) {
        setByteValue(Field::VOLUME, volume);
    }
    void setProtection(const Protection protection, const float value) {
        setFloatValue(protectionField(protection), value);
    }
    void setGroup(const int group, const std::optional<float> voltage, const std::optional<float> current = std::nullopt) {
        if (group < Field::GROUP_FIRST || group > Field::GROUP_LAST)
            throw ValidationError("group " + std::to_string(group) + " outside " + std::to_string(Field::GROUP_FIRST) + ".." + std::to_string(Field::GROUP_LAST));
        const uint8_t field = static_cast<uint8_t>(Field::GROUP1_VOLTAGE_SET + (group - Field::GROUP_FIRST) * 2);
        if (voltage)
            setFloatValue(field, *voltage);
        if (current)
            setFloatValue(static_cast<uint8_t>(field + 1), *current);
    }
    void getAll() {
        command(encodeByte(Header::OUTPUT, Command::GET, Field::ALL, 0));
    }

    //

    State state() const {
        return _state;
    }
    DeviceSnapshot snapshot() const {
        std::lock_guard<std::mutex> guard(_snapshotMutex);
        return _snapshot;
    }

    void collectDiagnostics(JsonVariant& obj) const override {
        JsonObject sub = obj["session"].to<JsonObject>();
        sub["state"] = toString(_state);
        sub["writes"] = _writes.load();
        sub["writeRetries"] = _writeRetries.load();
        sub["writeFailures"] = _writeFailures.load();
        sub["readFailures"] = _readFailures.load();
        sub["bytesFlushed"] = _bytesFlushed.load();
        {
            std::lock_guard<std::mutex> guard(_receiveMutex);
            const ScanStatistics& statistics = _receiver.statistics();
            sub["frames"] = statistics.frames;
            sub["checksumErrors"] = statistics.checksumErrors;
            sub["bytesDiscarded"] = statistics.bytesDiscarded;
            sub["decodeErrors"] = _decodeErrors;
            sub["handlerErrors"] = _handlerErrors + statistics.handlerErrors;
            sub["buffered"] = _receiver.buffered();
        }
        {
            std::lock_guard<std::mutex> guard(_snapshotMutex);
            sub["keys"] = _snapshot.size();
        }
    }

private:
    const Config config;

    Transport& _transport;
    UpdateHandler _handler;

    std::atomic<State> _state{ State::Disconnected };
    std::mutex _lifecycleMutex;
    std::mutex _writeMutex;
    std::mutex _readMutex;
    mutable std::mutex _receiveMutex;
    mutable std::mutex _snapshotMutex;

    Receiver _receiver;
    DeviceSnapshot _snapshot;
    counter_t _decodeErrors = 0, _handlerErrors = 0;

    std::atomic<bool> _running{ false };
    std::thread _reader;

    std::atomic<counter_t> _writes{ 0 }, _writeRetries{ 0 }, _writeFailures{ 0 }, _readFailures{ 0 }, _bytesFlushed{ 0 };

    void initialize(const uint8_t baudSelector) {
        send(encodeByte(Header::OUTPUT, Command::SESSION, Field::NONE, 1));
        send(encodeByte(Header::OUTPUT, Command::BAUD, Field::NONE, baudSelector));
        send(encodeByte(Header::OUTPUT, Command::GET, Field::MODEL_NAME, 0));
        send(encodeByte(Header::OUTPUT, Command::GET, Field::HARDWARE_VERSION, 0));
        send(encodeByte(Header::OUTPUT, Command::GET, Field::FIRMWARE_VERSION, 0));
        send(encodeByte(Header::OUTPUT, Command::GET, Field::ALL, 0));
    }

    void command(const std::vector<uint8_t>& frame) {
        if (_state != State::Streaming)
            throw TransportError(std::string("session ") + toString(_state) + ", command not sent");
        send(frame);
    }

    // single writer, each write followed by the settle delay the device needs between commands
    void send(const std::vector<uint8_t>& frame) {
        std::lock_guard<std::mutex> guard(_writeMutex);
        DPS150_DEBUG_PRINTF("Session::send: %s\n", BytesToHexString(frame.data(), frame.size()).c_str());
        for (unsigned attempt = 0;; attempt++) {
            try {
                _transport.write(frame.data(), frame.size());
                break;
            } catch (const TransportError& e) {
                if (attempt >= config.writeRetries) {
                    _writeFailures++;
                    throw;
                }
                DPS150_DEBUG_PRINTF("Session::send: attempt %u failed, %s\n", attempt + 1, e.what());
                _writeRetries++;
            }
            std::this_thread::sleep_for(config.writeRetryDelay);
        }
        _writes++;
        std::this_thread::sleep_for(config.settleDelay);
    }

    // drops whatever the device sent before this session, so replies start from a clean stream
    void flushInput() {
        std::lock_guard<std::mutex> guard(_readMutex);
        counter_t flushed = 0;
        for (int reads = 0; reads < DEFAULT_FLUSH_READS_MAX; reads++) {
            const std::vector<uint8_t> bytes = _transport.read(config.readSize, std::chrono::milliseconds(0));
            if (bytes.empty())
                break;
            flushed += bytes.size();
        }
        if (flushed > 0) {
            DPS150_DEBUG_PRINTF("Session::flushInput: discarded %lu bytes\n", flushed);
            _bytesFlushed += flushed;
        }
    }

    size_t receive() {
        std::lock_guard<std::mutex> guardRead(_readMutex);
        std::vector<uint8_t> bytes;
        try {
            bytes = _transport.read(config.readSize, config.readTimeout);
        } catch (const TransportError&) {
            _readFailures++;
            throw;
        }
        if (!bytes.empty()) {
            std::lock_guard<std::mutex> guard(_receiveMutex);
            _receiver.process(bytes);
        }
        return bytes.size();
    }

    // called with _receiveMutex held
    void dispatch(const Packet& packet) {
        size_t skipped = 0;
        const Update update = decode(packet, &skipped);
        _decodeErrors += skipped;
        if (update.empty())
            return;
        {
            std::lock_guard<std::mutex> guard(_snapshotMutex);
            _snapshot.merge(update);
        }
        if (_handler) {
            try {
                _handler(update);
            } catch (const std::exception& e) {
                DPS150_DEBUG_PRINTF("Session::dispatch: update handler failed, field=%u, %s\n", packet.field, e.what());
                _handlerErrors++;
            }
        }
    }

    void readerLoop() {
        DPS150_DEBUG_PRINTF("Session::readerLoop: started\n");
        while (_running) {
            size_t received = 0;
            try {
                received = receive();
            } catch (const TransportError& e) {
                DPS150_DEBUG_PRINTF("Session::readerLoop: read failed, %s\n", e.what());
            } catch (const std::exception& e) {
                DPS150_DEBUG_PRINTF("Session::readerLoop: receive failed, %s\n", e.what());
            }
            if (received == 0 && _running)
                std::this_thread::sleep_for(config.pollInterval);
        }
        DPS150_DEBUG_PRINTF("Session::readerLoop: stopped\n");
    }

    void stopReader() {
        _running = false;
        if (_reader.joinable() && _reader.get_id() != std::this_thread::get_id())
            _reader.join();
    }

    void closeTransport() {
        try {
            _transport.close();
        } catch (const TransportError& e) {
            DPS150_DEBUG_PRINTF("Session::closeTransport: %s\n", e.what());
        }
    }
};

// -----------------------------------------------------------------------------------------------

}    // namespace dps150

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
