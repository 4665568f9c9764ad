// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

// local credentials, replace before flashing

#define DEFAULT_WIFI_PEERS { "ssid:pass" }
#define DEFAULT_MQTT_PEERS { "mqtt.local:1883/user@pass" }

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
