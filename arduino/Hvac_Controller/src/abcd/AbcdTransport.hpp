// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <mutex>

namespace abcd_bus {

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class TransportError : public std::runtime_error {
public:
    explicit TransportError (const std::string &what) :
        std::runtime_error (what) { }
};

class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError (const std::string &what) :
        std::runtime_error (what) { }
};

// -----------------------------------------------------------------------------------------------

class Connector {
public:
    virtual ~Connector () = default;

    virtual bool begin () {
        return true;
    }
    virtual void end () { }
    virtual bool isOpen () const = 0;
    virtual size_t available () = 0;
    virtual size_t readBytes (uint8_t *buffer, const size_t size) = 0;
    virtual bool sendBytes (const uint8_t *data, const size_t size) = 0;

    void drain () {
        uint8_t scratch [64];
        size_t count;
        while ((count = available ()) > 0)
            if (readBytes (scratch, std::min (count, sizeof (scratch))) == 0)
                break;
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class Transport {
public:
    struct Config {
        interval_t responseWindow = 2 * 1000;
        interval_t settleDelay = 50;
        interval_t pollDelay = 10;
        size_t bufferLimit = 1024;
        bool debugging = false;
    };
    struct Statistics {
        counter_t reads, responses, timeouts, writes, failures;
    };

private:
    const Config _config;
    Connector &_connector;
    std::mutex _mutex;

    Counter _reads, _responses, _timeouts, _writes, _failures;
    std::atomic<bool> _faulted { false };

    // a link that failed once is not trusted again, the owner replaces it
    void fail (const char *what) {
        _failures++;
        _faulted = true;
        throw TransportError (what);
    }
    void send (const Bytes &frame) {
        if (! _connector.isOpen ())
            fail ("abcd_bus::Transport: connector is not open");
        if (_config.debugging)
            DEBUG_PRINTF ("Transport::send: %s\n", BytesToHexString (frame.data (), frame.size (), " ").c_str ());
        _connector.drain ();
        if (! _connector.sendBytes (frame.data (), frame.size ()))
            fail ("abcd_bus::Transport: connector send failed");
    }

public:
    explicit Transport (Connector &connector) :
        Transport (Config {}, connector) { }
    Transport (const Config &config, Connector &connector) :
        _config (config),
        _connector (connector) { }

    std::optional<Bytes> readTable (const DeviceAddress device, const TableId &table) {
        std::lock_guard<std::mutex> guard (_mutex);

        _reads++;
        send (Frame::build (device, DeviceAddress::SystemAccessModule, Opcode::Read, Bytes (table.data (), table.data () + table.size ())));

        Bytes buffer;
        uint8_t chunk [128];
        const auto started = std::chrono::steady_clock::now (), deadline = started + std::chrono::milliseconds (_config.responseWindow);
        while (std::chrono::steady_clock::now () < deadline) {
            const size_t count = _connector.available () > 0 ? _connector.readBytes (chunk, sizeof (chunk)) : 0;
            if (count > 0) {
                if (buffer.size () + count > _config.bufferLimit)
                    buffer.erase (buffer.begin (), buffer.begin () + static_cast<std::ptrdiff_t> (std::min (buffer.size (), buffer.size () + count - _config.bufferLimit)));
                buffer.insert (buffer.end (), chunk, chunk + count);
                const auto response = Frame::parseResponse (buffer, device, table);
                if (response.has_value () && response->size () >= Frame::Constants::SIZE_RESPONSE_HEADER) {
                    _responses++;
                    if (_config.debugging)
                        DEBUG_PRINTF ("Transport::recv: %s\n", BytesToHexString (response->data (), response->size (), " ").c_str ());
                    return Bytes (response->begin () + Frame::Constants::SIZE_RESPONSE_HEADER, response->end ());
                }
            } else if (! _connector.isOpen ())
                fail ("abcd_bus::Transport: connector closed while awaiting response");
            else
                std::this_thread::sleep_for (std::chrono::milliseconds (_config.pollDelay));
        }

        _timeouts++;
        DEBUG_PRINTF ("Transport::readTable: device=%s, table=%s, no response (buffered=%u)\n", toString (device), table.toString ().c_str (), static_cast<unsigned> (buffer.size ()));
        return std::nullopt;
    }

    void writeTable (const DeviceAddress device, const TableId &table, const Bytes &data) {
        std::lock_guard<std::mutex> guard (_mutex);

        Bytes payload (table.data (), table.data () + table.size ());
        payload.insert (payload.end (), { 0x00, 0x00, 0x00 });
        payload.insert (payload.end (), data.begin (), data.end ());
        _writes++;
        send (Frame::build (device, DeviceAddress::SystemAccessModule, Opcode::Write, payload));
        std::this_thread::sleep_for (std::chrono::milliseconds (_config.settleDelay));
    }

    bool isOpen () const {
        return _connector.isOpen ();
    }
    bool healthy () const {
        return _connector.isOpen () && ! _faulted;
    }
    Statistics statistics () const {
        return { .reads = _reads, .responses = _responses, .timeouts = _timeouts, .writes = _writes, .failures = _failures };
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

}    // namespace abcd_bus

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
