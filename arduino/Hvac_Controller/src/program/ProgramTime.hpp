// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <esp_sntp.h>

// wall clock from SNTP, the schedule runs against local time so the zone has to be right
class ProgramTime : public Component, public Diagnosticable {
public:
    typedef struct {
        String timezone;
        String server;
        int minimumYear;
    } Config;

    using BooleanFunc = std::function<bool ()>;

private:
    const Config &config;
    const BooleanFunc _networkIsAvailable;
    bool _started = false;
    ActivationTracker _synchronised;

    static void __timeSyncCallback (struct timeval *) {
        DEBUG_PRINTF ("ProgramTime::sync: time=%s\n", getTimeString ().c_str ());
    }

public:
    ProgramTime (const Config &cfg, const BooleanFunc &networkIsAvailable) :
        config (cfg),
        _networkIsAvailable (networkIsAvailable) { }

    void process () override {
        if (! _started && _networkIsAvailable ()) {
            sntp_set_time_sync_notification_cb (__timeSyncCallback);
            configTzTime (config.timezone.c_str (), config.server.c_str ());
            _started = true;
            DEBUG_PRINTF ("ProgramTime::process: sntp started, server=%s, timezone=%s\n", config.server.c_str (), config.timezone.c_str ());
        }
        if (_started && ! _synchronised && synchronised ())
            _synchronised++;
    }
    bool synchronised () const {
        struct tm now;
        const time_t t = time (nullptr);
        return localtime_r (&t, &now) != nullptr && (now.tm_year + 1900) >= config.minimumYear;
    }

protected:
    void collectDiagnostics (JsonVariant &obj) const override {
        JsonObject sub = obj ["time"].to<JsonObject> ();
        sub ["started"] = _started;
        sub ["synchronised"] = synchronised ();
        if (_synchronised)
            sub ["since"] = _synchronised.seconds ();
        sub ["now"] = getTimeString ();
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
