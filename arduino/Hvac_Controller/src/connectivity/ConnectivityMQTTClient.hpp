// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <WiFi.h>
#include <PubSubClient.h>

class MQTTClient : private Singleton<MQTTClient>, public JsonSerializable {
public:
    static inline constexpr uint16_t DEFAULT_PORT = 1883;
    struct Peer {
        String name;
        uint16_t port;
        String user;
        String pass;
    };
    using PeersManager = ConnectionPeers<Peer>;
    using MessageFunc = std::function<void (const String &payload)>;

    typedef struct {
        String client;
        PeersManager::Config peers;
        uint16_t bufferSize;
    } Config;

    // host[:port][/user@pass]
    static Peer parsePeer (const String &details) {
        Peer peer { .port = DEFAULT_PORT };
        const int slash = details.indexOf ('/');
        const String address = (slash != -1) ? details.substring (0, slash) : details;
        if (slash != -1) {
            const String credentials = details.substring (slash + 1);
            const int at = credentials.indexOf ('@');
            peer.user = (at != -1) ? credentials.substring (0, at) : credentials;
            if (at != -1)
                peer.pass = credentials.substring (at + 1);
        }
        const int colon = address.indexOf (':');
        peer.name = (colon != -1) ? address.substring (0, colon) : address;
        if (colon != -1)
            peer.port = static_cast<uint16_t> (address.substring (colon + 1).toInt ());
        return peer;
    }

private:
    const Config &config;

    struct Subscription {
        String topic;
        MessageFunc func;
    };

    PeersManager _peers;
    WiFiClient _wifiClient;
    PubSubClient _mqttClient;
    std::vector<Subscription> _subscriptions;
    ActivationTracker _connects, _received, _published;
    ActivationTrackerWithDetail _unhandled, _publishFailures;

    bool connect () {
        const Peer peer = _peers.select ();
        _mqttClient.setServer (peer.name.c_str (), peer.port);
        const bool result = peer.user.isEmpty () ? _mqttClient.connect (config.client.c_str ()) : _mqttClient.connect (config.client.c_str (), peer.user.c_str (), peer.pass.c_str ());
#ifdef DEFAULT_SCRUB_SENSITIVE_CONTENT_FROM_NETWORK_LOGGING
        const char *pass = peer.pass.isEmpty () ? "" : "****";
#else
        const char *pass = peer.pass.c_str ();
#endif
        DEBUG_PRINTF ("MQTTClient::connect: host=%s, port=%u, client=%s, user=%s, pass=%s, result=%d, state=%s\n", peer.name.c_str (), peer.port, config.client.c_str (), peer.user.c_str (), pass, result, stateString (_mqttClient.state ()));
        _peers.update (result);
        if (result) {
            _connects++;
            for (const auto &subscription : _subscriptions)
                if (! _mqttClient.subscribe (subscription.topic.c_str ()))
                    DEBUG_PRINTF ("MQTTClient::connect: subscribe failed, topic=%s\n", subscription.topic.c_str ());
        }
        return result;
    }
    void dispatch (const char *topic, const uint8_t *payload, const unsigned int length) {
        _received++;
        for (const auto &subscription : _subscriptions)
            if (subscription.topic == topic) {
                subscription.func (String (reinterpret_cast<const char *> (payload), length));
                return;
            }
        _unhandled += String (topic);
    }
    static void __mqttCallback (char *topic, uint8_t *payload, unsigned int length) {
        MQTTClient *instance = Singleton<MQTTClient>::instance ();
        if (instance != nullptr)
            instance->dispatch (topic, payload, length);
    }

public:
    explicit MQTTClient (const Config &cfg) :
        Singleton<MQTTClient> (this),
        config (cfg),
        _peers (config.peers, parsePeer),
        _mqttClient (_wifiClient) { }

    void begin () {
        _mqttClient.setBufferSize (config.bufferSize);
        _mqttClient.setCallback (__mqttCallback);
    }
    void process () {
        _mqttClient.loop ();
        if (! _mqttClient.connected () && _peers.available ())
            connect ();
    }
    inline bool available () {
        return _mqttClient.connected ();
    }
    //
    void subscribe (const String &topic, const MessageFunc &func) {
        _subscriptions.push_back ({ .topic = topic, .func = func });
        if (_mqttClient.connected ())
            _mqttClient.subscribe (topic.c_str ());
    }
    // status is retained so a late subscriber sees the last snapshot
    bool publish (const String &topic, const String &data, const bool retained = false) {
        if (data.length () + topic.length () + 8 > config.bufferSize) {
            _publishFailures += topic + " (" + String (data.length ()) + " bytes)";
            DEBUG_PRINTF ("MQTTClient::publish: topic=%s, length=%u exceeds buffer %u\n", topic.c_str (), data.length (), config.bufferSize);
            return false;
        }
        if (! _mqttClient.publish (topic.c_str (), data.c_str (), retained)) {
            _publishFailures += topic;
            DEBUG_PRINTF ("MQTTClient::publish: topic=%s, length=%u, failed\n", topic.c_str (), data.length ());
            return false;
        }
        _published++;
        return true;
    }
    void publish__native (const char *topic, const char *data) {    // no logging, silent dropping
        if (_mqttClient.connected ())
            _mqttClient.publish (topic, data);
    }
    //
    void serialize (JsonVariant &obj) const override {
        PubSubClient &mqttClient = const_cast<MQTTClient *> (this)->_mqttClient;
        obj ["state"] = stateString (mqttClient.state ());
        obj ["connects"] = _connects;
        obj ["received"] = _received;
        obj ["published"] = _published;
        if (_unhandled)
            obj ["unhandled"] = _unhandled;
        if (_publishFailures)
            obj ["failures"] = _publishFailures;
    }

private:
    static const char *stateString (const int state) {
        static const char *const names [] = { "CONNECTION_TIMEOUT", "CONNECTION_LOST", "CONNECT_FAILED", "DISCONNECTED", "CONNECTED", "BAD_PROTOCOL", "BAD_CLIENT_ID", "UNAVAILABLE", "BAD_CREDENTIALS", "UNAUTHORIZED" };
        const int index = state - MQTT_CONNECTION_TIMEOUT;
        return (index >= 0 && index < static_cast<int> (sizeof (names) / sizeof (names [0]))) ? names [index] : "UNDEFINED";
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
