// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <cstdint>
#include <array>
#include <vector>
#include <string>
#include <optional>
#include <stdexcept>

namespace abcd_bus {

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

/*
  ABCD bus framing, point to point over RS-485, 38400 8N1, no start-of-frame delimiter

  +--------+--------+-----+------+------+----+----------+--------------+
  | dst:2  | src:2  | len | 0x00 | 0x00 | op | data:len | crc:2 (LE)   |
  +--------+--------+-----+------+------+----+----------+--------------+

  multi-byte fields big-endian except the crc, which is CRC-16/ARC over dst..data
  responses to table reads carry the table id and three further header bytes ahead of
  the table content
*/

using Bytes = std::vector<uint8_t>;

enum class DeviceAddress : uint16_t {
    Thermostat = 0x2001,
    SystemAccessModule = 0x9201,
    HeatPump = 0x5101
};

enum class Opcode : uint8_t {
    Read = 0x0B,
    Write = 0x0C,
    Ack = 0x06
};

inline const char *toString (const DeviceAddress address) {
    switch (address) {
    case DeviceAddress::Thermostat :
        return "Thermostat";
    case DeviceAddress::SystemAccessModule :
        return "SAM";
    case DeviceAddress::HeatPump :
        return "HeatPump";
    default :
        return "Unknown";
    }
}

// -----------------------------------------------------------------------------------------------

class TableId {
    std::array<uint8_t, 3> _id;

public:
    static constexpr size_t SIZE = 3;

    constexpr TableId (const uint8_t a, const uint8_t b, const uint8_t c) :
        _id { a, b, c } { }

    static std::optional<TableId> fromString (const std::string &hex) {
        if (hex.length () != SIZE * 2)
            return std::nullopt;
        const auto nibble = [] (const char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };
        uint8_t bytes [SIZE];
        for (size_t i = 0; i < SIZE; i++) {
            const int hi = nibble (hex [i * 2]), lo = nibble (hex [i * 2 + 1]);
            if (hi < 0 || lo < 0)
                return std::nullopt;
            bytes [i] = static_cast<uint8_t> ((hi << 4) | lo);
        }
        return TableId (bytes [0], bytes [1], bytes [2]);
    }

    const uint8_t *data () const {
        return _id.data ();
    }
    constexpr size_t size () const {
        return SIZE;
    }
    bool matches (const uint8_t *bytes) const {
        return bytes [0] == _id [0] && bytes [1] == _id [1] && bytes [2] == _id [2];
    }
    std::string toString () const {
        static const char HEX_CHARS [] = "0123456789abcdef";
        std::string result;
        for (const auto b : _id)
            result += HEX_CHARS [b >> 4], result += HEX_CHARS [b & 0x0F];
        return result;
    }
    bool operator== (const TableId &other) const {
        return _id == other._id;
    }
};

namespace Tables {
    inline constexpr TableId ComfortProfile { 0x00, 0x40, 0x0a };      // Thermostat
    inline constexpr TableId DailyEnergy { 0x00, 0x46, 0x0e };         // Thermostat
    inline constexpr TableId YearlyEnergy { 0x00, 0x46, 0x10 };        // Thermostat
    inline constexpr TableId ThermostatOutdoor { 0x00, 0x49, 0x01 };   // Thermostat, outdoor fallback
    inline constexpr TableId ThermostatIndoor { 0x00, 0x49, 0x07 };    // Thermostat, indoor primary
    inline constexpr TableId HeatPumpIndoor { 0x00, 0x03, 0x04 };      // HeatPump, indoor fallback
    inline constexpr TableId HeatPumpOutdoor { 0x00, 0x06, 0x1f };     // HeatPump, outdoor primary
}    // namespace Tables

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class Frame {
public:
    struct Constants {
        static constexpr size_t SIZE_HEADER = 8;
        static constexpr size_t SIZE_CHECKSUM = 2;
        static constexpr size_t SIZE_OVERHEAD = SIZE_HEADER + SIZE_CHECKSUM;
        static constexpr size_t SIZE_RESPONSE_HEADER = 6;

        static constexpr size_t OFFSET_DST = 0;
        static constexpr size_t OFFSET_SRC = 2;
        static constexpr size_t OFFSET_LENGTH = 4;
        static constexpr size_t OFFSET_RESERVED = 5;
        static constexpr size_t OFFSET_OPCODE = 7;
        static constexpr size_t OFFSET_DATA = 8;

        static constexpr size_t LENGTH_MINIMUM = 1;
        static constexpr size_t LENGTH_MAXIMUM = 200;
        static constexpr size_t LENGTH_LIMIT = 255;

        static constexpr uint16_t CRC_POLYNOMIAL = 0xA001;
    };

    static uint16_t crc16 (const uint8_t *data, const size_t size) {
        uint16_t crc = 0;
        for (size_t i = 0; i < size; i++) {
            crc ^= data [i];
            for (int bit = 0; bit < 8; bit++)
                crc = (crc & 0x0001) ? static_cast<uint16_t> ((crc >> 1) ^ Constants::CRC_POLYNOMIAL) : static_cast<uint16_t> (crc >> 1);
        }
        return crc;
    }
    static uint16_t crc16 (const Bytes &data) {
        return crc16 (data.data (), data.size ());
    }

    static Bytes build (const DeviceAddress dst, const DeviceAddress src, const Opcode op, const Bytes &data) {
        if (data.size () > Constants::LENGTH_LIMIT)
            throw std::length_error ("abcd_bus::Frame::build: data length exceeds 255");
        Bytes frame;
        frame.reserve (data.size () + Constants::SIZE_OVERHEAD);
        putUInt16 (frame, static_cast<uint16_t> (dst));
        putUInt16 (frame, static_cast<uint16_t> (src));
        frame.push_back (static_cast<uint8_t> (data.size ()));
        frame.push_back (0x00);
        frame.push_back (0x00);
        frame.push_back (static_cast<uint8_t> (op));
        frame.insert (frame.end (), data.begin (), data.end ());
        const uint16_t crc = crc16 (frame);
        frame.push_back (static_cast<uint8_t> (crc & 0xFF));
        frame.push_back (static_cast<uint8_t> (crc >> 8));
        return frame;
    }

    // first acceptable Ack in the buffer, resynchronising byte by byte over noise and echo
    static std::optional<Bytes> parseResponse (const Bytes &buffer, const DeviceAddress expectedSrc, const std::optional<TableId> &expectedTable = std::nullopt) {
        size_t position = 0;
        while (buffer.size () > Constants::SIZE_OVERHEAD && position < buffer.size () - Constants::SIZE_OVERHEAD) {
            const size_t length = buffer [position + Constants::OFFSET_LENGTH], size = length + Constants::SIZE_OVERHEAD;
            if (length < Constants::LENGTH_MINIMUM || length > Constants::LENGTH_MAXIMUM || position + size > buffer.size ()) {
                position++;
                continue;
            }
            const uint8_t *frame = &buffer [position];
            const uint16_t crcExpected = crc16 (frame, size - Constants::SIZE_CHECKSUM);
            const uint16_t crcReceived = static_cast<uint16_t> (frame [size - 2]) | (static_cast<uint16_t> (frame [size - 1]) << 8);
            if (crcExpected != crcReceived) {
                position++;
                continue;
            }
            const uint16_t dst = getUInt16 (frame + Constants::OFFSET_DST), src = getUInt16 (frame + Constants::OFFSET_SRC);
            const uint8_t op = frame [Constants::OFFSET_OPCODE];
            if (src == static_cast<uint16_t> (expectedSrc) && dst == static_cast<uint16_t> (DeviceAddress::SystemAccessModule) && op == static_cast<uint8_t> (Opcode::Ack)) {
                const uint8_t *data = frame + Constants::OFFSET_DATA;
                if (! expectedTable.has_value () || length < TableId::SIZE || expectedTable->matches (data))
                    return Bytes (data, data + length);
            }
            position += size;
        }
        return std::nullopt;
    }

    static uint16_t getUInt16 (const uint8_t *data) {
        return static_cast<uint16_t> ((static_cast<uint16_t> (data [0]) << 8) | static_cast<uint16_t> (data [1]));
    }

private:
    static void putUInt16 (Bytes &frame, const uint16_t value) {
        frame.push_back (static_cast<uint8_t> (value >> 8));
        frame.push_back (static_cast<uint8_t> (value & 0xFF));
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

}    // namespace abcd_bus

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
