// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <HardwareSerial.h>
#include <driver/uart.h>

// RS-485 half duplex on an ESP32 UART, the driver toggles DE/RE from the RTS pin
class HardwareSerialRS485 : public abcd_bus::Connector {
public:
    typedef struct {
        int serialId;
        int8_t pinRx, pinTx, pinEn;
        unsigned long baud;
    } Config;
    static inline constexpr unsigned long DEFAULT_BAUD = 38400;

private:
    const Config &config;
    HardwareSerial _serial;
    bool _open = false;

public:
    explicit HardwareSerialRS485 (const Config &cfg) :
        config (cfg),
        _serial (config.serialId) { }
    ~HardwareSerialRS485 () override {
        end ();
    }

    bool begin () override {
        if (_open)
            return true;
        _serial.begin (config.baud, SERIAL_8N1, config.pinRx, config.pinTx);
        if (! _serial) {
            DEBUG_PRINTF ("HardwareSerialRS485::begin: serial=%d, failed\n", config.serialId);
            return false;
        }
        if (config.pinEn >= 0) {
            _serial.setPins (config.pinRx, config.pinTx, UART_PIN_NO_CHANGE, config.pinEn);
            if (! _serial.setMode (UART_MODE_RS485_HALF_DUPLEX)) {
                DEBUG_PRINTF ("HardwareSerialRS485::begin: serial=%d, half duplex mode failed\n", config.serialId);
                _serial.end ();
                return false;
            }
        }
        while (_serial.available ())
            _serial.read ();
        _open = true;
        DEBUG_PRINTF ("HardwareSerialRS485::begin: serial=%d, rx=%d, tx=%d, en=%d, baud=%lu\n", config.serialId, config.pinRx, config.pinTx, config.pinEn, config.baud);
        return true;
    }
    void end () override {
        if (_open) {
            _serial.flush ();
            _serial.end ();
            _open = false;
        }
    }
    bool isOpen () const override {
        return _open;
    }
    size_t available () override {
        const int count = _serial.available ();
        return count > 0 ? static_cast<size_t> (count) : 0;
    }
    size_t readBytes (uint8_t *buffer, const size_t size) override {
        return _serial.read (buffer, std::min (size, available ()));
    }
    bool sendBytes (const uint8_t *data, const size_t size) override {
        const bool result = _serial.write (data, size) == size;
        _serial.flush ();
        return result;
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
