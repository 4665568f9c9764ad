// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <ArduinoJson.h>

#include <string>

// -----------------------------------------------------------------------------------------------

class JsonCollector {
    JsonDocument doc;

public:
    explicit JsonCollector (const std::string &type, const std::string &time, const std::string &addr) {
        doc ["type"] = type;
        doc ["time"] = time;
        doc ["addr"] = addr;
    }
    inline JsonDocument &document () {
        return doc;
    }
    operator std::string () const {
        std::string output;
        serializeJson (doc, output);
        return output;
    }
};

// -----------------------------------------------------------------------------------------------

class JsonSerializable {
public:
    virtual void serialize (JsonVariant &) const = 0;
    virtual ~JsonSerializable () {};
};
inline bool convertToJson (const JsonSerializable &src, JsonVariant dst) {
    src.serialize (dst);
    return true;
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
