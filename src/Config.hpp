// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __DPS150_CONFIG_HPP__
#define __DPS150_CONFIG_HPP__

#include "Errors.hpp"
#include "Logging.hpp"
#include "device/DeviceSession.hpp"
#include "device/DeviceTransport.hpp"

#include <ArduinoJson.h>

#include <chrono>
#include <cstdint>
#include <string>

#ifndef DEFAULT_SERIAL_BAUD
#define DEFAULT_SERIAL_BAUD 115200
#endif
#ifndef DEFAULT_UPDATE_QUEUE_DEPTH
#define DEFAULT_UPDATE_QUEUE_DEPTH 64
#endif

namespace dps150 {

// -----------------------------------------------------------------------------------------------

struct Config {
    unsigned long baudRate = DEFAULT_SERIAL_BAUD;
    size_t updateQueueDepth = DEFAULT_UPDATE_QUEUE_DEPTH;
    Session::Config session;
    LoggingManager::Config logging;
};

// -----------------------------------------------------------------------------------------------

namespace ConfigFunctions {
template<typename T>
void readValue(JsonObjectConst obj, const char* name, T& value) {
    JsonVariantConst variant = obj[name];
    if (variant.isNull())
        return;
    if (!variant.is<T>())
        throw ValidationError(std::string("config: '") + name + "' has the wrong type");
    value = variant.as<T>();
}
inline void readValue(JsonObjectConst obj, const char* name, std::chrono::milliseconds& value) {
    uint32_t count = static_cast<uint32_t>(value.count());
    readValue(obj, name, count);
    value = std::chrono::milliseconds(count);
}
inline void readValue(JsonObjectConst obj, const char* name, std::string& value) {
    JsonVariantConst variant = obj[name];
    if (variant.isNull())
        return;
    if (!variant.is<const char*>())
        throw ValidationError(std::string("config: '") + name + "' has the wrong type");
    value = variant.as<const char*>();
}
inline JsonObjectConst readSection(JsonObjectConst obj, const char* name) {
    JsonVariantConst variant = obj[name];
    if (!variant.isNull() && !variant.is<JsonObjectConst>())
        throw ValidationError(std::string("config: '") + name + "' is not an object");
    return variant.as<JsonObjectConst>();
}
}    // namespace ConfigFunctions

// Overrides the values present in the JSON document, leaving the others as they are.
inline void configLoad(const std::string& json, Config& config) {
    JsonDocument doc;
    const DeserializationError error = deserializeJson(doc, json);
    if (error)
        throw ValidationError(std::string("config: ") + error.c_str());
    if (!doc.is<JsonObjectConst>())
        throw ValidationError("config: document is not an object");
    const JsonObjectConst root = doc.as<JsonObjectConst>();

    ConfigFunctions::readValue(root, "baudRate", config.baudRate);
    ConfigFunctions::readValue(root, "updateQueueDepth", config.updateQueueDepth);
    if (const JsonObjectConst session = ConfigFunctions::readSection(root, "session")) {
        ConfigFunctions::readValue(session, "settleDelayMs", config.session.settleDelay);
        ConfigFunctions::readValue(session, "pollIntervalMs", config.session.pollInterval);
        ConfigFunctions::readValue(session, "readTimeoutMs", config.session.readTimeout);
        ConfigFunctions::readValue(session, "readSize", config.session.readSize);
        ConfigFunctions::readValue(session, "readerThread", config.session.readerThread);
        ConfigFunctions::readValue(session, "writeRetries", config.session.writeRetries);
        ConfigFunctions::readValue(session, "writeRetryDelayMs", config.session.writeRetryDelay);
    }
    if (const JsonObjectConst logging = ConfigFunctions::readSection(root, "logging")) {
        ConfigFunctions::readValue(logging, "enableStderr", config.logging.enableStderr);
        ConfigFunctions::readValue(logging, "filePath", config.logging.filePath);
    }
    if (!baudRateSelector(config.baudRate))
        throw ValidationError("config: baudRate " + std::to_string(config.baudRate) + " not supported by device");
    if (config.session.readSize == 0)
        throw ValidationError("config: readSize must be positive");
    if (config.updateQueueDepth == 0)
        throw ValidationError("config: updateQueueDepth must be positive");
}

// -----------------------------------------------------------------------------------------------

// The transport is built by the caller; it has to run at the configured rate.
inline void configVerify(const Config& config, const Transport& transport) {
    if (transport.baudRate() != config.baudRate)
        throw ValidationError("config: transport runs at " + std::to_string(transport.baudRate()) + ", configured " + std::to_string(config.baudRate));
}

inline UpdateQueue configUpdateQueue(const Config& config) {
    return UpdateQueue(config.updateQueueDepth);
}

// -----------------------------------------------------------------------------------------------

}    // namespace dps150

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
