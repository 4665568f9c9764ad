// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <WiFi.h>

#include <atomic>

class WiFiNetworkClient : private Singleton<WiFiNetworkClient>, public Component, public Diagnosticable {
public:
    struct Peer {
        String ssid;
        String pass;
    };
    using PeersManager = ConnectionPeers<Peer>;

    typedef struct {
        String host;
        PeersManager::Config peers;
        interval_t intervalConnectionCheck;
    } Config;

    // ssid[:pass]
    static Peer parsePeer (const String &details) {
        const int colon = details.indexOf (':');
        return (colon != -1) ? Peer { .ssid = details.substring (0, colon), .pass = details.substring (colon + 1) } : Peer { .ssid = details };
    }

private:
    const Config &config;

    enum class State : uint8_t { Idle, Associated, Addressed };
    std::atomic<State> _state { State::Idle };

    PeersManager _peers;
    Intervalable _intervalConnectionCheck;
    ActivationTracker _associations;
    ActivationTrackerWithDetail _disconnections;
    int8_t _rssi = 0;
    String _ssid;

    // runs on the event task, not the loop
    void events (const WiFiEvent_t event, const WiFiEventInfo_t info) {
        switch (event) {
        case WiFiEvent_t::ARDUINO_EVENT_WIFI_STA_CONNECTED :
            DEBUG_PRINTF ("WiFiNetworkClient::events: associated, channel=%d\n", static_cast<int> (info.wifi_sta_connected.channel));
            if (_state == State::Idle) {
                _state = State::Associated;
                _associations++;
                _intervalConnectionCheck.reset ();
                _peers.update (true);
            }
            break;
        case WiFiEvent_t::ARDUINO_EVENT_WIFI_STA_GOT_IP :
            DEBUG_PRINTF ("WiFiNetworkClient::events: addressed, address=%s\n", IPAddress (info.got_ip.ip_info.ip.addr).toString ().c_str ());
            if (_state == State::Associated)
                _state = State::Addressed;
            break;
        case WiFiEvent_t::ARDUINO_EVENT_WIFI_STA_DISCONNECTED : {
            const String reason (WiFi.disconnectReasonName (static_cast<wifi_err_reason_t> (info.wifi_sta_disconnected.reason)));
            DEBUG_PRINTF ("WiFiNetworkClient::events: disconnected, reason=%s\n", reason.c_str ());
            if (_state != State::Idle) {
                _state = State::Idle;
                _disconnections += reason;
                _intervalConnectionCheck.reset ();
            }
            break;
        }
        default :
            break;
        }
    }
    static void __wiFiEventHandler (WiFiEvent_t event, WiFiEventInfo_t info) {
        WiFiNetworkClient *instance = Singleton<WiFiNetworkClient>::instance ();
        if (instance != nullptr)
            instance->events (event, info);
    }

    void connect () {
        if (_state != State::Idle || ! _peers.available ())
            return;
        const Peer peer = _peers.select ();
        _ssid = peer.ssid;
        DEBUG_PRINTF ("WiFiNetworkClient::connect: ssid=%s, host=%s\n", peer.ssid.c_str (), config.host.c_str ());
        WiFi.begin (peer.ssid.c_str (), peer.pass.c_str ());
    }

public:
    explicit WiFiNetworkClient (const Config &cfg) :
        Singleton<WiFiNetworkClient> (this),
        config (cfg),
        _peers (config.peers, parsePeer),
        _intervalConnectionCheck (config.intervalConnectionCheck) { }

    void begin () override {
        WiFi.persistent (false);
        WiFi.onEvent (__wiFiEventHandler);
        WiFi.setHostname (config.host.c_str ());
        WiFi.setAutoReconnect (true);
        WiFi.mode (WIFI_STA);
        connect ();
    }
    // associated but never addressed within the check interval counts as a failed attempt
    void process () override {
        if (! _intervalConnectionCheck)
            return;
        switch (_state.load ()) {
        case State::Idle :
            _peers.update (false);
            connect ();
            break;
        case State::Associated :
            DEBUG_PRINTF ("WiFiNetworkClient::process: no address within %lu ms, restarting\n", config.intervalConnectionCheck);
            WiFi.disconnect (true);
            _state = State::Idle;
            _disconnections += String ("NO_ADDRESS");
            _peers.update (false);
            connect ();
            break;
        case State::Addressed :
            _rssi = WiFi.RSSI ();
            break;
        }
    }
    bool available () const {
        return _state == State::Addressed;
    }

protected:
    void collectDiagnostics (JsonVariant &obj) const override {
        JsonObject sub = obj ["network"].to<JsonObject> ();
        sub ["macaddr"] = getMacAddressWifi ();
        sub ["ssid"] = _ssid;
        if (available ()) {
            sub ["address"] = WiFi.localIP ().toString ();
            sub ["rssi"] = _rssi;
        }
        sub ["associations"] = _associations;
        if (_disconnections)
            sub ["disconnects"] = _disconnections;
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
