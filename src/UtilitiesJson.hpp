// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __DPS150_UTILITIES_JSON_HPP__
#define __DPS150_UTILITIES_JSON_HPP__

#include <ArduinoJson.h>

#include <string>
#include <vector>

namespace dps150 {

// -----------------------------------------------------------------------------------------------

class JsonSerializable {
public:
    virtual ~JsonSerializable() = default;
    virtual void serialize(JsonVariant&) const = 0;
};
inline bool convertToJson(const JsonSerializable& src, JsonVariant dst) {
    src.serialize(dst);
    return true;
}

inline std::string toJsonString(const JsonSerializable& src) {
    JsonDocument doc;
    JsonVariant obj = doc.to<JsonObject>();
    src.serialize(obj);
    std::string output;
    serializeJson(doc, output);
    return output;
}

// -----------------------------------------------------------------------------------------------

class Diagnosticable {
protected:
    ~Diagnosticable() {};

public:
    typedef std::vector<Diagnosticable*> List;
    virtual void collectDiagnostics(JsonVariant&) const = 0;
};

inline std::string collectDiagnostics(const Diagnosticable::List& diagnosticables) {
    JsonDocument doc;
    JsonVariant obj = doc.to<JsonObject>();
    for (const auto& diagnosticable : diagnosticables)
        diagnosticable->collectDiagnostics(obj);
    std::string output;
    serializeJson(doc, output);
    return output;
}

// -----------------------------------------------------------------------------------------------

}    // namespace dps150

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
