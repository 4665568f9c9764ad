// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include "HvacCore.hpp"

#include <deque>
#include <map>
#include <utility>

// -----------------------------------------------------------------------------------------------

// answers reads and applies writes the way the thermostat and heat pump do, over an in-memory line
class FakeBus : public abcd_bus::Connector {
public:
    using Key = std::pair<abcd_bus::DeviceAddress, std::string>;

    struct Sent {
        abcd_bus::DeviceAddress device;
        abcd_bus::Opcode opcode;
        abcd_bus::Bytes data;
    };

private:
    mutable std::mutex _mutex;
    std::map<Key, abcd_bus::Bytes> _tables;
    std::deque<uint8_t> _line;
    std::vector<Sent> _sent;
    int _attempts = 0;
    bool _open = false;

public:
    bool beginResult = true;
    bool echo = false;                  // half duplex, our own frame comes back ahead of the reply
    bool applyWrites = true;
    abcd_bus::Bytes noisePrefix;        // ahead of every reply
    int failSends = 0;                  // next n sends fail
    int failOnSend = -1;                // only the nth send overall fails
    int silentReads = 0;                // next n reads go unanswered
    int closeAfterSends = -1;           // line drops once this many frames have gone out
    std::optional<std::pair<size_t, uint8_t>> overwriteAfterWrite;    // thermostat puts its own byte back
    std::optional<abcd_bus::Bytes> replyPayload;                       // answers every read with this Ack payload

    static abcd_bus::Bytes profile (const uint8_t heat = 68, const uint8_t cool = 76) {
        abcd_bus::Bytes bytes (40, 0x01);
        bytes [0] = 0x10;
        bytes [25] = heat;
        bytes [26] = cool;
        bytes [30] = heat;    // the thermostat repeats setpoints further into the table
        bytes [33] = cool;
        return bytes;
    }
    static abcd_bus::Bytes withByte (const size_t size, const size_t offset, const uint8_t value) {
        abcd_bus::Bytes bytes (size, 0x00);
        bytes [offset] = value;
        return bytes;
    }
    static void putUInt16 (abcd_bus::Bytes &bytes, const size_t offset, const uint16_t value) {
        bytes [offset] = static_cast<uint8_t> (value >> 8);
        bytes [offset + 1] = static_cast<uint8_t> (value & 0xFF);
    }

    // a working system: indoor 72 / outdoor 45 from the primary sources, fallbacks distinct
    void populate () {
        using namespace abcd_bus;
        table (DeviceAddress::Thermostat, Tables::ComfortProfile, profile ());
        table (DeviceAddress::Thermostat, Tables::ThermostatIndoor, withByte (64, 60, 72));
        table (DeviceAddress::HeatPump, Tables::HeatPumpIndoor, withByte (16, 10, 71));
        table (DeviceAddress::HeatPump, Tables::HeatPumpOutdoor, withByte (40, 32, 45));
        table (DeviceAddress::Thermostat, Tables::ThermostatOutdoor, withByte (20, 16, 44));
        Bytes daily (20, 0x00);
        daily [0] = 5, daily [1] = 0, daily [2] = 1, daily [3] = 2, daily [4] = 0;
        daily [10] = 3, daily [11] = 4, daily [12] = 0, daily [13] = 1, daily [14] = 1;
        table (DeviceAddress::Thermostat, Tables::DailyEnergy, daily);
        Bytes yearly (40, 0x00);
        putUInt16 (yearly, 3, 1200);
        putUInt16 (yearly, 7, 300);
        putUInt16 (yearly, 11, 450);
        putUInt16 (yearly, 19, 800);
        putUInt16 (yearly, 23, 2100);
        putUInt16 (yearly, 27, 600);
        putUInt16 (yearly, 35, 250);
        table (DeviceAddress::Thermostat, Tables::YearlyEnergy, yearly);
    }

    void table (const abcd_bus::DeviceAddress device, const abcd_bus::TableId &id, const abcd_bus::Bytes &content) {
        std::lock_guard<std::mutex> guard (_mutex);
        _tables [{ device, id.toString () }] = content;
    }
    void remove (const abcd_bus::DeviceAddress device, const abcd_bus::TableId &id) {
        std::lock_guard<std::mutex> guard (_mutex);
        _tables.erase ({ device, id.toString () });
    }
    std::optional<abcd_bus::Bytes> content (const abcd_bus::DeviceAddress device, const abcd_bus::TableId &id) const {
        std::lock_guard<std::mutex> guard (_mutex);
        const auto it = _tables.find ({ device, id.toString () });
        return it != _tables.end () ? std::optional<abcd_bus::Bytes> (it->second) : std::nullopt;
    }
    std::vector<Sent> sent () const {
        std::lock_guard<std::mutex> guard (_mutex);
        return _sent;
    }
    size_t count (const abcd_bus::Opcode opcode) const {
        std::lock_guard<std::mutex> guard (_mutex);
        return static_cast<size_t> (std::count_if (_sent.begin (), _sent.end (), [&] (const Sent &s) {
            return s.opcode == opcode;
        }));
    }
    void close () {
        std::lock_guard<std::mutex> guard (_mutex);
        _open = false;
    }
    void inject (const abcd_bus::Bytes &bytes) {
        std::lock_guard<std::mutex> guard (_mutex);
        _line.insert (_line.end (), bytes.begin (), bytes.end ());
    }

    //

    bool begin () override {
        std::lock_guard<std::mutex> guard (_mutex);
        _open = beginResult;
        return _open;
    }
    void end () override {
        close ();
    }
    bool isOpen () const override {
        std::lock_guard<std::mutex> guard (_mutex);
        return _open;
    }
    size_t available () override {
        std::lock_guard<std::mutex> guard (_mutex);
        return _line.size ();
    }
    size_t readBytes (uint8_t *buffer, const size_t size) override {
        std::lock_guard<std::mutex> guard (_mutex);
        size_t count = 0;
        while (count < size && ! _line.empty ()) {
            buffer [count++] = _line.front ();
            _line.pop_front ();
        }
        return count;
    }
    bool sendBytes (const uint8_t *data, const size_t size) override {
        using namespace abcd_bus;
        std::lock_guard<std::mutex> guard (_mutex);
        if (! _open)
            return false;
        if (failSends > 0) {
            failSends--;
            return false;
        }
        if (++_attempts == failOnSend)
            return false;
        const Bytes frame (data, data + size);
        const auto device = static_cast<DeviceAddress> (Frame::getUInt16 (&frame [Frame::Constants::OFFSET_DST]));
        const auto opcode = static_cast<Opcode> (frame [Frame::Constants::OFFSET_OPCODE]);
        const Bytes payload (frame.begin () + Frame::Constants::OFFSET_DATA, frame.end () - Frame::Constants::SIZE_CHECKSUM);
        _sent.push_back ({ device, opcode, payload });
        if (closeAfterSends >= 0 && static_cast<int> (_sent.size ()) >= closeAfterSends)
            _open = false;
        if (echo)
            _line.insert (_line.end (), frame.begin (), frame.end ());

        const std::string id = BytesToHexString (payload.data (), TableId::SIZE);
        if (opcode == Opcode::Read) {
            if (silentReads > 0) {
                silentReads--;
                return true;
            }
            Bytes reply;
            if (replyPayload.has_value ())
                reply = *replyPayload;
            else {
                const auto it = _tables.find ({ device, id });
                if (it == _tables.end ())
                    return true;
                reply.assign (payload.begin (), payload.begin () + TableId::SIZE);
                reply.insert (reply.end (), { 0x00, 0x00, 0x00 });
                reply.insert (reply.end (), it->second.begin (), it->second.end ());
            }
            const Bytes response = Frame::build (DeviceAddress::SystemAccessModule, device, Opcode::Ack, reply);
            _line.insert (_line.end (), noisePrefix.begin (), noisePrefix.end ());
            _line.insert (_line.end (), response.begin (), response.end ());
        } else if (opcode == Opcode::Write && applyWrites) {
            auto &table = _tables [{ device, id }];
            table.assign (payload.begin () + Frame::Constants::SIZE_RESPONSE_HEADER, payload.end ());
            if (overwriteAfterWrite.has_value () && overwriteAfterWrite->first < table.size ())
                table [overwriteAfterWrite->first] = overwriteAfterWrite->second;
        }
        return true;
    }
};

// -----------------------------------------------------------------------------------------------

inline abcd_bus::Transport::Config fastTransport () {
    return { .responseWindow = 150, .settleDelay = 0, .pollDelay = 1, .bufferLimit = 1024, .debugging = true };
}
inline abcd_bus::Device::Config fastDevice () {
    return { .profileRead = { .maxAttempts = 3, .backoff = 0 }, .writeRounds = 6, .writeInterval = 0 };
}

inline struct tm makeTime (const int wday, const int hour, const int minute, const int year = 2025) {
    struct tm t = {};
    t.tm_year = year - 1900;
    t.tm_mon = 5;
    t.tm_mday = 1 + wday;
    t.tm_wday = wday;
    t.tm_hour = hour;
    t.tm_min = minute;
    return t;
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
