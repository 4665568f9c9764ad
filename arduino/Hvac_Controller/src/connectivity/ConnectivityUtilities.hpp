// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <map>
#include <memory>

// control messages are json objects dispatched by their "type" member, queued from the
// network callback and handled on the program loop
class ConnectionReceiver : public JsonSerializable {
public:
    class Handler {
    public:
        virtual bool process (JsonDocument &) = 0;
        virtual ~Handler () {};
    };
    using Handlers = std::map<String, std::shared_ptr<Handler>>;

private:
    QueueSimpleConcurrentSafe<String> _queue;
    Handlers _handlers;
    ActivationTracker _processed;
    ActivationTrackerWithDetail _failures;

    void processJson (const String &str) {
        JsonDocument doc;
        DeserializationError error;
        if ((error = deserializeJson (doc, str)) != DeserializationError::Ok) {
            DEBUG_PRINTF ("ConnectionReceiver::process: deserializeJson fault: %s\n", error.c_str ());
            _failures += String ("failed to deserialize Json: ") + String (error.c_str ());
            return;
        }
        const char *type = doc ["type"];
        if (type == nullptr) {
            _failures += String ("failed to contain 'type'");
            return;
        }
        const auto handler = _handlers.find (String (type));
        if (handler == _handlers.end ()) {
            _failures += String ("failed to find handler for 'type': ") + String (type);
            return;
        }
        if (! handler->second->process (doc))
            _failures += String ("failed in handler for 'type': ") + String (type);
        else
            _processed++;
    }

public:
    explicit ConnectionReceiver (const size_t queueLimit = 16) :
        _queue (queueLimit) { }
    ConnectionReceiver &operator+= (const Handlers &handlers) {
        _handlers.insert (handlers.begin (), handlers.end ());
        return *this;
    }
    void insert (const String &str) {
        if (! _queue.push (str))
            _failures += String ("queue full, dropped message");
    }
    void process () {
        String str;
        while (_queue.pull (str)) {
            DEBUG_PRINTF ("ConnectionReceiver::process: content=<<<%s>>>\n", str.c_str ());
            processJson (str);
        }
    }
    //
    void serialize (JsonVariant &obj) const override {
        obj ["processed"] = _processed;
        if (_failures)
            obj ["failures"] = _failures;
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

template <typename Peer>
class ConnectionPeers {
public:
    using Peers = std::vector<String>;
    using Parser = std::function<Peer (const String &)>;

    struct Config {
        Peers order;
        int retries;
    };

private:
    const Config &_config;
    const Parser _parser;
    size_t _current = 0;
    int _attempts = 0;

public:
    explicit ConnectionPeers (const Config &config, const Parser &parser) :
        _config (config),
        _parser (parser) { }

    Peer select () {
        if (_config.order.empty ())
            return Peer {};
        return _parser (_config.order [_current]);
    }
    void update (const bool connected) {
        if (connected)
            _attempts = 0;
        else if (++_attempts > _config.retries) {
            _attempts = 0;
            _current = (_current + 1) % _config.order.size ();
        }
    }
    bool available () const {
        return ! _config.order.empty ();
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
