// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class ProgramDataControl : public Component, public Diagnosticable {
public:
    typedef struct {
        String topic;
    } Config;

private:
    const Config &config;

    ProgramManageHvac &_hvac;
    MQTTClient &_mqtt;
    ConnectionReceiver _receiver;

    // {"type":"set","mode":"heat"|"cool","temp":N}
    class Receiver_TypeSet : public ConnectionReceiver::Handler {
        ProgramManageHvac &_hvac;

    public:
        explicit Receiver_TypeSet (ProgramManageHvac &hvac) :
            _hvac (hvac) { }
        bool process (JsonDocument &doc) override {
            const auto kind = setpointKindFromString (doc ["mode"] | "heat");
            if (! kind.has_value () || ! doc ["temp"].is<int> ()) {
                DEBUG_PRINTF ("ProgramDataControl::set: malformed request\n");
                return false;
            }
            const int temp = doc ["temp"].as<int> ();
            const auto request = _hvac.requestSetpoint (*kind, temp);
            DEBUG_PRINTF ("ProgramDataControl::set: %s=%d, %s\n", toString (*kind), temp, request.status == ProgramManageHvac::RequestStatus::Accepted ? "accepted" : (request.status == ProgramManageHvac::RequestStatus::OutOfRange ? "out of range" : "unavailable"));
            return request.status == ProgramManageHvac::RequestStatus::Accepted;
        }
    };
    // {"type":"mode","mode":"manual"|"schedule"}
    class Receiver_TypeMode : public ConnectionReceiver::Handler {
        ProgramManageHvac &_hvac;

    public:
        explicit Receiver_TypeMode (ProgramManageHvac &hvac) :
            _hvac (hvac) { }
        bool process (JsonDocument &doc) override {
            const auto mode = scheduleModeFromString (doc ["mode"] | "");
            if (! mode.has_value ()) {
                DEBUG_PRINTF ("ProgramDataControl::mode: malformed request\n");
                return false;
            }
            return _hvac.setMode (*mode);
        }
    };
    // {"type":"schedule","weekday":[...],"weekend":[...]}, either list may be absent
    class Receiver_TypeSchedule : public ConnectionReceiver::Handler {
        ProgramManageHvac &_hvac;

    public:
        explicit Receiver_TypeSchedule (ProgramManageHvac &hvac) :
            _hvac (hvac) { }
        bool process (JsonDocument &doc) override {
            const auto weekday = ScheduleJson::deserializePeriods (doc ["weekday"].as<JsonVariantConst> ()), weekend = ScheduleJson::deserializePeriods (doc ["weekend"].as<JsonVariantConst> ());
            if (! weekday.has_value () && ! weekend.has_value ()) {
                DEBUG_PRINTF ("ProgramDataControl::schedule: malformed request\n");
                return false;
            }
            return _hvac.setSchedule (weekday, weekend);
        }
    };

public:
    ProgramDataControl (const Config &cfg, ProgramManageHvac &hvac, MQTTClient &mqtt) :
        config (cfg),
        _hvac (hvac),
        _mqtt (mqtt) {
        _receiver += {
            { String ("set"), std::make_shared<Receiver_TypeSet> (_hvac) },
            { String ("mode"), std::make_shared<Receiver_TypeMode> (_hvac) },
            { String ("schedule"), std::make_shared<Receiver_TypeSchedule> (_hvac) }
        };
    }

    void begin () override {
        _mqtt.subscribe (config.topic + "/control", [&] (const String &payload) {
            _receiver.insert (payload);
        });
    }
    void process () override {
        _receiver.process ();
    }

protected:
    void collectDiagnostics (JsonVariant &obj) const override {
        JsonVariant sub = obj ["control"].to<JsonVariant> ();
        _receiver.serialize (sub);
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
