// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <gtest/gtest.h>

#include "FakeBus.hpp"

using namespace abcd_bus;

// -----------------------------------------------------------------------------------------------

class AbcdTransportTest : public ::testing::Test {
protected:
    FakeBus bus;
    Transport transport { fastTransport (), bus };

    void SetUp () override {
        bus.populate ();
        bus.begin ();
    }
};

TEST_F (AbcdTransportTest, ReadTableReturnsContentAfterResponseHeader) {
    const auto data = transport.readTable (DeviceAddress::Thermostat, Tables::ComfortProfile);
    ASSERT_TRUE (data.has_value ());
    EXPECT_EQ (*data, FakeBus::profile ());
    const auto sent = bus.sent ();
    ASSERT_EQ (sent.size (), 1u);
    EXPECT_EQ (sent [0].device, DeviceAddress::Thermostat);
    EXPECT_EQ (sent [0].opcode, Opcode::Read);
    EXPECT_EQ (sent [0].data, (Bytes { 0x00, 0x40, 0x0a }));
    const auto statistics = transport.statistics ();
    EXPECT_EQ (statistics.reads, 1u);
    EXPECT_EQ (statistics.responses, 1u);
    EXPECT_EQ (statistics.timeouts, 0u);
}

TEST_F (AbcdTransportTest, ReadTableIgnoresEchoAndLineNoise) {
    bus.echo = true;
    bus.noisePrefix = { 0xFF, 0x13, 0x37, 0x00, 0xC8, 0x55 };
    const auto data = transport.readTable (DeviceAddress::Thermostat, Tables::ThermostatIndoor);
    ASSERT_TRUE (data.has_value ());
    ASSERT_EQ (data->size (), 64u);
    EXPECT_EQ ((*data) [60], 72);
}

TEST_F (AbcdTransportTest, ReadTableDiscardsStaleBytesBeforeSending) {
    bus.inject (Frame::build (DeviceAddress::SystemAccessModule, DeviceAddress::Thermostat, Opcode::Ack, Bytes { 0x00, 0x40, 0x0a, 0x00, 0x00, 0x00, 0x99 }));
    const auto data = transport.readTable (DeviceAddress::Thermostat, Tables::ComfortProfile);
    ASSERT_TRUE (data.has_value ());
    EXPECT_EQ (*data, FakeBus::profile ());
}

TEST_F (AbcdTransportTest, ReadTableTimesOutWithoutResponse) {
    bus.silentReads = 1;
    EXPECT_FALSE (transport.readTable (DeviceAddress::Thermostat, Tables::ComfortProfile).has_value ());
    EXPECT_FALSE (transport.readTable (DeviceAddress::HeatPump, Tables::ComfortProfile).has_value ());
    EXPECT_EQ (transport.statistics ().timeouts, 2u);
}

TEST_F (AbcdTransportTest, ClosedConnectorRaisesTransportError) {
    bus.close ();
    EXPECT_FALSE (transport.isOpen ());
    EXPECT_THROW (transport.readTable (DeviceAddress::Thermostat, Tables::ComfortProfile), TransportError);
    EXPECT_THROW (transport.writeTable (DeviceAddress::Thermostat, Tables::ComfortProfile, Bytes { 0x01 }), TransportError);
    EXPECT_EQ (transport.statistics ().failures, 2u);
}

TEST_F (AbcdTransportTest, FailedSendRaisesTransportError) {
    EXPECT_TRUE (transport.healthy ());
    bus.failSends = 1;
    EXPECT_THROW (transport.readTable (DeviceAddress::Thermostat, Tables::ComfortProfile), TransportError);
    EXPECT_TRUE (transport.isOpen ());
    EXPECT_FALSE (transport.healthy ());
    EXPECT_TRUE (transport.readTable (DeviceAddress::Thermostat, Tables::ComfortProfile).has_value ());
}

TEST_F (AbcdTransportTest, ReadTableIgnoresAckShorterThanResponseHeader) {
    bus.replyPayload = Bytes { 0x00, 0x40, 0x0a, 0x00, 0x00 };
    EXPECT_FALSE (transport.readTable (DeviceAddress::Thermostat, Tables::ComfortProfile).has_value ());
    const auto statistics = transport.statistics ();
    EXPECT_EQ (statistics.responses, 0u);
    EXPECT_EQ (statistics.timeouts, 1u);
    EXPECT_TRUE (transport.healthy ());
}

TEST_F (AbcdTransportTest, ConnectorClosingMidResponseRaisesTransportError) {
    bus.closeAfterSends = 1;
    bus.silentReads = 1;
    EXPECT_THROW (transport.readTable (DeviceAddress::Thermostat, Tables::ComfortProfile), TransportError);
}

TEST_F (AbcdTransportTest, WriteTablePrefixesTableAndReservedBytes) {
    transport.writeTable (DeviceAddress::Thermostat, Tables::ComfortProfile, Bytes { 0x0a, 0x0b, 0x0c });
    const auto sent = bus.sent ();
    ASSERT_EQ (sent.size (), 1u);
    EXPECT_EQ (sent [0].opcode, Opcode::Write);
    EXPECT_EQ (sent [0].data, (Bytes { 0x00, 0x40, 0x0a, 0x00, 0x00, 0x00, 0x0a, 0x0b, 0x0c }));
    EXPECT_EQ (bus.content (DeviceAddress::Thermostat, Tables::ComfortProfile), (Bytes { 0x0a, 0x0b, 0x0c }));
    EXPECT_EQ (transport.statistics ().writes, 1u);
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
