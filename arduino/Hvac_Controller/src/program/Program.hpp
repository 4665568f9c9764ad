// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#define DEFAULT_WATCHDOG_SECS (60)
#define DEFAULT_INITIAL_DELAY (5 * 1000L)
#ifdef DEBUG
#define DEFAULT_DEBUG_LOGGING_BUFFER (2 * 1024)
#define DEFAULT_SCRUB_SENSITIVE_CONTENT_FROM_NETWORK_LOGGING
#endif

#define DEFAULT_NAME "HvacController"
#define DEFAULT_VERS "1.0.0"

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <Arduino.h>

#include <mutex>

#include "../HvacCore.hpp"
#include "../platform/PlatformArduinoESP32.hpp"

// -----------------------------------------------------------------------------------------------

#include "../hardware/HardwareSerialRS485.hpp"
#include "../storage/StorageSPIFFSFile.hpp"

// -----------------------------------------------------------------------------------------------

#include "../connectivity/ConnectivityUtilities.hpp"
#include "../connectivity/ConnectivityMQTTClient.hpp"
#include "../connectivity/ConnectivityWifiNetworkClient.hpp"

// -----------------------------------------------------------------------------------------------

#include "ProgramTime.hpp"
#include "ProgramLogging.hpp"
#include "../content/ProgramDataControl.hpp"
#include "ProgramSecrets.hpp"
#include "ProgramConfig.hpp"

// -----------------------------------------------------------------------------------------------

class Program : public Component, public Diagnosticable {

    const Config config;
    const String address;

    PlatformArduinoESP32 programPlatform;
    SPIFFSFile scheduleFile;
    SPIFFSScheduleStore scheduleStore;
    WiFiNetworkClient wifi;
    MQTTClient mqtt;

    ProgramManageHvac hvac;

    //

    ProgramDataControl dataControl;
    Intervalable dataStatusInterval, dataDiagnoseInterval;
    String dataCollect (const String &name, const std::function<void (JsonVariant &)> func) const {
        JsonCollector collector (name.c_str (), getTimeString (), address.c_str ());
        JsonVariant obj = collector.document ().as<JsonVariant> ();
        func (obj);
        return String (static_cast<std::string> (collector).c_str ());
    }
    bool dataPublish (const String &data, const String &name, const bool retained) {
        return mqtt.available () && mqtt.publish (config.dataTopic + "/" + name, data, retained);
    }

    // status goes out on the interval, or straight after a setpoint write completes
    void dataProcess () {

        const bool refresh = hvac.refreshRequested ();
        const bool dataShould = dataStatusInterval || refresh, diagShould = dataDiagnoseInterval;

        if (dataShould) {
            if (refresh)
                dataStatusInterval.reset ();
            const ProgramManageHvac::Snapshot snapshot = hvac.snapshot ();
            const String data = dataCollect ("data", [&] (JsonVariant &obj) {
                snapshot.serialize (obj);
            });
            DEBUG_PRINTF ("Program::process: data, refresh=%d, length=%d, content=<<<%s>>>\n", refresh, data.length (), data.c_str ());
            dataPublish (data, "data", true);
        }

        if (diagShould) {
            const String diag = dataCollect ("diag", [&] (JsonVariant &obj) {
                programDiagnostics.collect (obj);
            });
            DEBUG_PRINTF ("Program::process: diag, length=%d, content=<<<%s>>>\n", diag.length (), diag.c_str ());
            dataPublish (diag, "diag", false);
        }
    }

    void process () override {
        if (wifi.available ())
            mqtt.process ();
        dataProcess ();
    }

    //

    ProgramTime programTime;
    ProgramLogging programLogging;
    DiagnosticablesManager programDiagnostics;
    Uptime programUptime;
    ActivationTracker programCycles;
    Intervalable programInterval;
    Component::List programComponents;
    template <auto MethodPtr>
    void forEachComponent () {
        for (auto &component : programComponents)
            (component->*MethodPtr) ();
    }

    //

public:
    Program () :
        address (getMacAddressBase ("")),
        programPlatform (config.programPlatform),
        scheduleFile (config.scheduleFilename),
        scheduleStore (scheduleFile),
        wifi (config.wifi),
        mqtt (config.mqtt),
        hvac (config.hvac, [&] () { return std::make_unique<HardwareSerialRS485> (config.rs485); }, scheduleStore),
        //
        dataControl (config.dataControl, hvac, mqtt),
        dataStatusInterval (config.dataStatusInterval),
        dataDiagnoseInterval (config.dataDiagnoseInterval),
        //
        programTime (config.programTime, [&] () { return wifi.available (); }),
        programLogging (config.programLogging, getMacAddressBase (""), &mqtt),
        programDiagnostics (config.programDiagnostics, { &programPlatform, &wifi, &hvac, &dataControl, &programTime, this }),
        programComponents ({ &programPlatform, &wifi, &hvac, &dataControl, &programTime, this }),
        programInterval (config.programInterval) {
        DEBUG_PRINTF ("Program::constructor: intervals [program=%lu] - status=%lu, diagnose=%lu\n", config.programInterval, config.dataStatusInterval, config.dataDiagnoseInterval);
    };

    void setup () {
        scheduleFile.begin ();    // ahead of hvac, which loads the schedule in begin
        mqtt.begin ();
        forEachComponent<&Component::begin> ();
    }
    void loop () {
        programInterval.wait (); // regularity
        forEachComponent<&Component::process> ();
        programCycles++;
    }

protected:
    void collectDiagnostics (JsonVariant &obj) const override {
        JsonObject program = obj ["program"].to<JsonObject> ();
        extern const String build_info;
        program ["build"] = build_info;
        program ["uptime"] = programUptime;
        program ["cycles"] = programCycles;
        if (programInterval.exceeded () > 0)
            program ["delays"] = programInterval.exceeded ();
        obj ["storage"] = scheduleFile;
        obj ["mqtt"] = mqtt;
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
