// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <Arduino.h>

class Intervalable {
    interval_t _interval, _previous;
    counter_t _exceeded = 0;

public:
    explicit Intervalable (const interval_t interval = 0, const interval_t previous = 0) :
        _interval (interval),
        _previous (previous) { }
    operator bool () {
        const interval_t current = millis ();
        if (current - _previous > _interval) {
            _previous = current;
            return true;
        }
        return false;
    }
    void reset () {
        _previous = millis ();
    }
    void wait () {
        const interval_t current = millis ();
        if (current - _previous < _interval)
            delay (_interval - (current - _previous));
        else if (_previous > 0)
            _exceeded++;
        _previous = millis ();
    }
    counter_t exceeded () const {
        return _exceeded;
    }
};

class Uptime {
    const interval_t _started;

public:
    Uptime () :
        _started (millis ()) { }
    inline interval_t seconds () const {
        return (millis () - _started) / 1000;
    }
};

// -----------------------------------------------------------------------------------------------

class ActivationTracker {
    counter_t _count = 0;
    interval_t _seconds = 0;

public:
    inline const interval_t &seconds () const {
        return _seconds;
    }
    inline const counter_t &count () const {
        return _count;
    }
    ActivationTracker &operator++ (int) {
        _seconds = millis () / 1000;
        _count++;
        return *this;
    }
    inline operator counter_t () const {
        return _count;
    }
};

class ActivationTrackerWithDetail : public ActivationTracker {
    String _detail;

public:
    inline const String &detail () const {
        return _detail;
    }
    ActivationTrackerWithDetail &operator+= (const String &detail) {
        ActivationTracker::operator++ (1);
        _detail = detail;
        return *this;
    }
};

inline bool convertToJson (const ActivationTracker &src, JsonVariant dst) {
    dst ["count"] = src.count ();
    dst ["seconds"] = src.seconds ();
    return true;
}
inline bool convertToJson (const ActivationTrackerWithDetail &src, JsonVariant dst) {
    dst ["count"] = src.count ();
    dst ["seconds"] = src.seconds ();
    dst ["detail"] = src.detail ();
    return true;
}
inline bool convertToJson (const Uptime &src, JsonVariant dst) {
    dst.set (src.seconds ());
    return true;
}

// -----------------------------------------------------------------------------------------------

#include <stdexcept>
#include <type_traits>

template <typename T>
class Singleton {
    static_assert (std::is_class_v<T>, "T must be a class type");
    inline static T *_instance = nullptr;

public:
    inline static T *instance () {
        return _instance;
    }
    explicit Singleton (T *t) {
        if (_instance != nullptr)
            throw std::logic_error ("Singleton: second instance");
        _instance = t;
    }
    virtual ~Singleton () {
        _instance = nullptr;
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <esp_mac.h>

inline String getMacAddressBase (const char *separator = ":") {
    uint8_t macaddr [6];
    esp_read_mac (macaddr, ESP_MAC_BASE);
    return String (BytesToHexString (macaddr, sizeof (macaddr), separator).c_str ());
}
inline String getMacAddressWifi (const char *separator = ":") {
    uint8_t macaddr [6];
    esp_read_mac (macaddr, ESP_MAC_WIFI_STA);
    return String (BytesToHexString (macaddr, sizeof (macaddr), separator).c_str ());
}

// -----------------------------------------------------------------------------------------------

#include <esp_system.h>

inline String getResetDetails () {
    static const struct {
        esp_reset_reason_t reason;
        const char *name;
    } reasons [] = {
        { ESP_RST_POWERON, "POWERON" },
        { ESP_RST_EXT, "EXTERNAL" },
        { ESP_RST_SW, "SOFTWARE" },
        { ESP_RST_PANIC, "PANIC" },
        { ESP_RST_INT_WDT, "WDT_INT" },
        { ESP_RST_TASK_WDT, "WDT_TASK" },
        { ESP_RST_WDT, "WDT_OTHER" },
        { ESP_RST_DEEPSLEEP, "DEEPSLEEP" },
        { ESP_RST_BROWNOUT, "BROWNOUT" },
    };
    const esp_reset_reason_t reason = esp_reset_reason ();
    for (const auto &entry : reasons)
        if (entry.reason == reason)
            return entry.name;
    return "UNKNOWN_(" + String (static_cast<int> (reason)) + ")";
}

// -----------------------------------------------------------------------------------------------

#include <esp_task_wdt.h>

class Watchdog {
    const int _timeout;
    bool _started;

public:
    explicit Watchdog (const int timeout) :
        _timeout (timeout),
        _started (false) {};
    void start () {
        if (! _started) {
            esp_task_wdt_deinit ();
            const esp_task_wdt_config_t wdt_config = {
                .timeout_ms = static_cast<uint32_t> (_timeout * 1000),
                .idle_core_mask = static_cast<uint32_t> ((1 << ESP.getChipCores ()) - 1),
                .trigger_panic = true
            };
            esp_task_wdt_init (&wdt_config);
            esp_task_wdt_add (NULL);
            if (esp_task_wdt_status (NULL) == ESP_OK) {
                _started = true;
                esp_task_wdt_reset ();
            }
        }
    }
    void reset () {
        esp_task_wdt_reset ();
    }
};

// -----------------------------------------------------------------------------------------------

class PlatformArduinoESP32 : public Component, public Diagnosticable {
public:
    typedef struct {
        uint32_t heapWarning;    // free heap below this is logged and counted, once per dip
    } Config;

private:
    const Config &config;
    const String _reset;
    ActivationTrackerWithDetail _heapLow;
    bool _heapBelow = false;

public:
    explicit PlatformArduinoESP32 (const Config &cfg) :
        config (cfg),
        _reset (getResetDetails ()) { }

    void process () override {
        const uint32_t heap = ESP.getFreeHeap ();
        if (heap < config.heapWarning && ! _heapBelow) {
            DEBUG_PRINTF ("PlatformArduinoESP32::process: heap low, free=%lu, warning=%lu\n", static_cast<unsigned long> (heap), static_cast<unsigned long> (config.heapWarning));
            _heapLow += String (heap);
        }
        _heapBelow = heap < config.heapWarning;
    }

protected:
    void collectDiagnostics (JsonVariant &obj) const override {
        JsonObject sub = obj ["platform"].to<JsonObject> ();
        sub ["reset"] = _reset;
        sub ["heap"] = ESP.getFreeHeap ();
        sub ["heapMin"] = ESP.getMinFreeHeap ();
        if (_heapLow)
            sub ["heapLow"] = _heapLow;
        sub ["chip"] = ESP.getChipModel ();
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
