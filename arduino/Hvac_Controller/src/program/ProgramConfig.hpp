// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

// #define DEFAULT_WIFI_PEERS { "ssid:pass", "ssid2:pass2" }
// #define DEFAULT_MQTT_PEERS { "mqtt.local:1883/user@pass" }

#if ! defined(DEFAULT_WIFI_PEERS)
#error "Require DEFAULT_WIFI_PEERS"
#endif
#ifndef DEFAULT_MQTT_PEERS
#define DEFAULT_MQTT_PEERS { "mqtt.local:1883/user@pass" }
#endif
#ifndef DEFAULT_TIMEZONE
#define DEFAULT_TIMEZONE "EST5EDT,M3.2.0,M11.1.0"
#endif

// -----------------------------------------------------------------------------------------------

/*
    ESP32-S3 to MAX3485 (3V3) transceiver, A/B to the thermostat bus A/B

    +-----+-----------+-------------+
    | DIR | ESP32-S3  | MAX3485     |
    +-----+-----------+-------------+
    | IN  | GPIO 5    | 1 RO        |
    | OUT | GPIO 7    | 2+3 /RE, DE |
    | OUT | GPIO 6    | 4 DI        |
    +-----+-----------+-------------+

    bus C (24VAC) and D (common) are not connected, the board is powered separately
*/

#define PIN_RS485_SERIAL_ID 1
#define PIN_RS485_SERIAL_RX GPIO_NUM_5
#define PIN_RS485_SERIAL_TX GPIO_NUM_6
#define PIN_RS485_SERIAL_EN GPIO_NUM_7

// -----------------------------------------------------------------------------------------------

struct Config {

    // PLATFORM
    PlatformArduinoESP32::Config programPlatform = { .heapWarning = 32 * 1024 };

    // HARDWARE
    HardwareSerialRS485::Config rs485 = { .serialId = PIN_RS485_SERIAL_ID, .pinRx = PIN_RS485_SERIAL_RX, .pinTx = PIN_RS485_SERIAL_TX, .pinEn = PIN_RS485_SERIAL_EN, .baud = HardwareSerialRS485::DEFAULT_BAUD };

    // HVAC
    ProgramManageHvac::Config hvac = {
        .connection = {
            .transport = { .responseWindow = 2 * 1000, .settleDelay = 50, .pollDelay = 10, .bufferLimit = 1024, .debugging = false },
            .device = { .profileRead = { .maxAttempts = 3, .backoff = 500 }, .writeRounds = 6, .writeInterval = 5 * 1000 } },
        .scheduler = { .interval = 60 * 1000, .minimumYear = 2024 }
    };
    String scheduleFilename = "/schedule.json";

    // CONNECTIVITY
    MQTTClient::Config mqtt = { .client = DEFAULT_NAME, .peers = { .order = DEFAULT_MQTT_PEERS, .retries = 3 }, .bufferSize = 2 * 1024 };
    WiFiNetworkClient::Config wifi = { .host = DEFAULT_NAME, .peers = { .order = DEFAULT_WIFI_PEERS, .retries = 3 }, .intervalConnectionCheck = 1 * 60 * 1000 };

    // CONTENT
    ProgramDataControl::Config dataControl = { .topic = DEFAULT_NAME };
    String dataTopic = DEFAULT_NAME;
    interval_t dataStatusInterval = 60 * 1000, dataDiagnoseInterval = 5 * 60 * 1000;

    // PROGRAM
    ProgramTime::Config programTime = { .timezone = DEFAULT_TIMEZONE, .server = "pool.ntp.org", .minimumYear = 2024 };
    ProgramLogging::Config programLogging = { .enableSerial = true, .enableMqtt = true, .mqttTopic = DEFAULT_NAME, .mqttExclude = { "Transport::send", "Transport::recv" } };
    DiagnosticablesManager::Config programDiagnostics = { .section = nullptr };
    interval_t programInterval = 1 * 1000;
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
