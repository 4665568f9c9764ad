// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class ProgramLogging : private Singleton<ProgramLogging> {
public:
    typedef struct {
        bool enableSerial, enableMqtt;
        String mqttTopic;
        std::vector<String> mqttExclude;    // line prefixes kept off the network, e.g. bus frame dumps
    } Config;

#ifdef DEBUG
private:
    const Config &config;

    bool _enableSerial = false, _enableMqtt = false;
    __DebugLoggerFunc __debugLoggerPrevious = nullptr;
    MQTTClient *_mqttClient;
    const String _mqttTopic;

    static std::mutex _bufferMutex;
    static int constexpr _bufferLength = DEFAULT_DEBUG_LOGGING_BUFFER;
    static char _bufferContent [_bufferLength];
    static int _bufferOffset;

    bool forwardable (const char *line) const {
        if (line [0] == '\0')
            return false;
        for (const auto &prefix : config.mqttExclude)
            if (strncmp (line, prefix.c_str (), prefix.length ()) == 0)
                return false;
        return true;
    }

    // the scheduler and writer threads log too, so a line is assembled under the mutex across
    // calls and only sent once terminated
    static void __debugLoggerForwarding (const char *format, ...) {
        auto logging = Singleton<ProgramLogging>::instance ();
        if (! logging)
            return;

        std::lock_guard<std::mutex> guard (_bufferMutex);

        va_list args;
        va_start (args, format);
        const int printed = vsnprintf (_bufferContent + _bufferOffset, (_bufferLength - _bufferOffset), format, args);
        va_end (args);
        if (printed < 0)
            return;

        _bufferOffset = (printed >= (_bufferLength - _bufferOffset)) ? (_bufferLength - 1) : (_bufferOffset + printed);
        if (_bufferOffset == (_bufferLength - 1) || (_bufferOffset > 0 && _bufferContent [_bufferOffset - 1] == '\n')) {
            while (_bufferOffset > 0 && _bufferContent [_bufferOffset - 1] == '\n')
                _bufferContent [--_bufferOffset] = '\0';
            _bufferContent [_bufferOffset] = '\0';
            _bufferOffset = 0;

            if (logging->_enableSerial)
                Serial.println (_bufferContent);

            if (logging->_enableMqtt && logging->_mqttClient != nullptr && logging->forwardable (_bufferContent)) {
#ifdef DEFAULT_SCRUB_SENSITIVE_CONTENT_FROM_NETWORK_LOGGING
                for (char *location = _bufferContent; (location = strstr (location, "pass=")) != NULL;)
                    for (location += sizeof ("pass=") - 1; *location != '\0' && *location != ',' && *location != ' ';)
                        *location++ = '*';
#endif
                logging->_mqttClient->publish__native (logging->_mqttTopic.c_str (), _bufferContent);
            }
        }
    }

public:
    explicit ProgramLogging (const Config &cfg, const String &id, MQTTClient *mqttClient = nullptr) :
        Singleton<ProgramLogging> (this),
        config (cfg),
        _mqttClient (mqttClient),
        _mqttTopic (config.mqttTopic + "/logs/" + id) {
        if (config.enableMqtt && _mqttClient != nullptr) {
            _enableSerial = config.enableSerial;
            _enableMqtt = true;
            __debugLoggerPrevious = __debugLoggerSet (__debugLoggerForwarding);
            DEBUG_PRINTF ("ProgramLogging::init: logging directed to %sMQTT (as topic '%s' when online)\n", _enableSerial ? "Serial and " : "", _mqttTopic.c_str ());
        } else
            DEBUG_PRINTF ("ProgramLogging::init: logging left %s\n", config.enableSerial ? "to Serial" : "undirected");
    }
    ~ProgramLogging () {
        if (_enableMqtt)
            __debugLoggerSet (__debugLoggerPrevious);
        _enableSerial = false;
        _enableMqtt = false;
        _mqttClient = nullptr;
    }
#else
public:
    explicit ProgramLogging (const Config &, const String &, MQTTClient * = nullptr) :
        Singleton<ProgramLogging> (this) { }
#endif
};

#ifdef DEBUG
std::mutex ProgramLogging::_bufferMutex;
char ProgramLogging::_bufferContent [_bufferLength];
int ProgramLogging::_bufferOffset = 0;
#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
