// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <gtest/gtest.h>

#include "HvacCore.hpp"

using namespace abcd_bus;

// -----------------------------------------------------------------------------------------------

TEST (AbcdFrame, Crc16MatchesArcCheckValue) {
    const std::string check = "123456789";
    EXPECT_EQ (Frame::crc16 (reinterpret_cast<const uint8_t *> (check.data ()), check.size ()), 0xBB3D);
    EXPECT_EQ (Frame::crc16 (Bytes {}), 0x0000);
}

TEST (AbcdFrame, BuildLaysOutHeaderDataAndLittleEndianCrc) {
    const Bytes frame = Frame::build (DeviceAddress::Thermostat, DeviceAddress::SystemAccessModule, Opcode::Read, Bytes { 0x00, 0x40, 0x0a });
    const Bytes header { 0x20, 0x01, 0x92, 0x01, 0x03, 0x00, 0x00, 0x0B, 0x00, 0x40, 0x0a };
    ASSERT_EQ (frame.size (), header.size () + 2);
    EXPECT_TRUE (std::equal (header.begin (), header.end (), frame.begin ()));
    const uint16_t crc = Frame::crc16 (header);
    EXPECT_EQ (frame [11], crc & 0xFF);
    EXPECT_EQ (frame [12], crc >> 8);
}

TEST (AbcdFrame, BuildRejectsOversizedData) {
    EXPECT_THROW (Frame::build (DeviceAddress::Thermostat, DeviceAddress::SystemAccessModule, Opcode::Write, Bytes (256, 0x00)), std::length_error);
    EXPECT_NO_THROW (Frame::build (DeviceAddress::Thermostat, DeviceAddress::SystemAccessModule, Opcode::Write, Bytes (255, 0x00)));
}

TEST (AbcdFrame, ParseResynchronisesPastGarbage) {
    const Bytes data { 0x00, 0x40, 0x0a, 0x00, 0x00, 0x00, 0x44, 0x4c };
    const Bytes reply = Frame::build (DeviceAddress::SystemAccessModule, DeviceAddress::Thermostat, Opcode::Ack, data);
    Bytes buffer { 0xFF, 0x13, 0x37, 0x00, 0xC8, 0x55 };
    buffer.insert (buffer.end (), reply.begin (), reply.end ());
    const auto parsed = Frame::parseResponse (buffer, DeviceAddress::Thermostat, Tables::ComfortProfile);
    ASSERT_TRUE (parsed.has_value ());
    EXPECT_EQ (*parsed, data);
}

TEST (AbcdFrame, ParseSkipsEchoAndForeignFrames) {
    const Bytes echo = Frame::build (DeviceAddress::Thermostat, DeviceAddress::SystemAccessModule, Opcode::Read, Bytes { 0x00, 0x40, 0x0a });
    const Bytes foreign = Frame::build (DeviceAddress::SystemAccessModule, DeviceAddress::HeatPump, Opcode::Ack, Bytes { 0x00, 0x40, 0x0a, 0x00, 0x00, 0x00, 0x01 });
    const Bytes otherTable = Frame::build (DeviceAddress::SystemAccessModule, DeviceAddress::Thermostat, Opcode::Ack, Bytes { 0x00, 0x46, 0x0e, 0x00, 0x00, 0x00, 0x02 });
    const Bytes wanted = Frame::build (DeviceAddress::SystemAccessModule, DeviceAddress::Thermostat, Opcode::Ack, Bytes { 0x00, 0x40, 0x0a, 0x00, 0x00, 0x00, 0x03 });
    Bytes buffer;
    for (const auto *frame : { &echo, &foreign, &otherTable, &wanted })
        buffer.insert (buffer.end (), frame->begin (), frame->end ());
    const auto parsed = Frame::parseResponse (buffer, DeviceAddress::Thermostat, Tables::ComfortProfile);
    ASSERT_TRUE (parsed.has_value ());
    EXPECT_EQ (parsed->back (), 0x03);
}

TEST (AbcdFrame, ParseRejectsBadCrcAndIncompleteFrames) {
    Bytes reply = Frame::build (DeviceAddress::SystemAccessModule, DeviceAddress::Thermostat, Opcode::Ack, Bytes { 0x00, 0x40, 0x0a, 0x00, 0x00, 0x00, 0x44 });
    Bytes corrupted (reply);
    corrupted [9] ^= 0x01;
    EXPECT_FALSE (Frame::parseResponse (corrupted, DeviceAddress::Thermostat).has_value ());
    const Bytes truncated (reply.begin (), reply.end () - 1);
    EXPECT_FALSE (Frame::parseResponse (truncated, DeviceAddress::Thermostat).has_value ());
    EXPECT_TRUE (Frame::parseResponse (reply, DeviceAddress::Thermostat).has_value ());
    EXPECT_FALSE (Frame::parseResponse (Bytes {}, DeviceAddress::Thermostat).has_value ());
}

TEST (AbcdFrame, ParseSkipsOversizedFrameEvenWithValidCrc) {
    Bytes data { 0x00, 0x40, 0x0a, 0x00, 0x00, 0x00 };
    data.resize (201, 0x77);
    const Bytes oversized = Frame::build (DeviceAddress::SystemAccessModule, DeviceAddress::Thermostat, Opcode::Ack, data);
    ASSERT_EQ (oversized [Frame::Constants::OFFSET_LENGTH], 201);
    const Bytes wanted = Frame::build (DeviceAddress::SystemAccessModule, DeviceAddress::Thermostat, Opcode::Ack, Bytes { 0x00, 0x40, 0x0a, 0x00, 0x00, 0x00, 0x03 });
    Bytes buffer (oversized);
    buffer.insert (buffer.end (), wanted.begin (), wanted.end ());
    const auto parsed = Frame::parseResponse (buffer, DeviceAddress::Thermostat, Tables::ComfortProfile);
    ASSERT_TRUE (parsed.has_value ());
    EXPECT_EQ (parsed->size (), 7u);
    EXPECT_EQ (parsed->back (), 0x03);
}

TEST (AbcdFrame, ParseSkipsEmptyFrameEvenWithValidCrc) {
    const Bytes empty = Frame::build (DeviceAddress::SystemAccessModule, DeviceAddress::Thermostat, Opcode::Ack, Bytes {});
    ASSERT_EQ (empty.size (), Frame::Constants::SIZE_OVERHEAD);
    const Bytes wanted = Frame::build (DeviceAddress::SystemAccessModule, DeviceAddress::Thermostat, Opcode::Ack, Bytes { 0x00, 0x40, 0x0a, 0x00, 0x00, 0x00, 0x03 });
    Bytes buffer (empty);
    buffer.insert (buffer.end (), wanted.begin (), wanted.end ());
    const auto parsed = Frame::parseResponse (buffer, DeviceAddress::Thermostat);
    ASSERT_TRUE (parsed.has_value ());
    EXPECT_EQ (parsed->size (), 7u);
    EXPECT_EQ (parsed->back (), 0x03);
}

TEST (AbcdFrame, TableIdParsesAndPrintsHex) {
    const auto id = TableId::fromString ("00400A");
    ASSERT_TRUE (id.has_value ());
    EXPECT_TRUE (*id == Tables::ComfortProfile);
    EXPECT_EQ (Tables::HeatPumpOutdoor.toString (), "00061f");
    EXPECT_FALSE (TableId::fromString ("00400").has_value ());
    EXPECT_FALSE (TableId::fromString ("0040zz").has_value ());
}

TEST (AbcdFrame, GetUInt16IsBigEndian) {
    const uint8_t bytes [] = { 0x04, 0xB0 };
    EXPECT_EQ (Frame::getUInt16 (bytes), 1200);
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
