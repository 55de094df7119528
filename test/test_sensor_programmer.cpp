#include <gtest/gtest.h>
#include <vector>
#include "sensor_programmer.h"
#include "i2c_mux.h"
#include "simulated_bus.h"
#include "scripted_bus.h"

namespace {

struct DelayRecorder {
    std::vector<uint32_t> waits;
    SensorProgrammer::DelayFn fn() {
        return [this](uint32_t ms) { waits.push_back(ms); };
    }
};

} // namespace

TEST(SensorProgrammer, SendsAddressCommandThenVerifiesAtNewAddress) {
    ScriptedBus bus;
    bus.readValue = 0x13;
    DelayRecorder delays;
    SensorProgrammer programmer(bus, delays.fn());

    ProgramResult result = programmer.programAndVerify(0x04, 0x13);

    EXPECT_EQ(result.kind, OutcomeKind::Programmed);
    ASSERT_EQ(bus.calls.size(), 2u);
    EXPECT_EQ(bus.calls[0].address, 0x04);
    EXPECT_FALSE(bus.calls[0].read);
    EXPECT_EQ(bus.calls[0].tx, (std::vector<uint8_t>{0x02, 0x00, 0x01, 0x13, 0xFF}));
    EXPECT_EQ(bus.calls[1].address, 0x13);
    EXPECT_TRUE(bus.calls[1].read);
    EXPECT_EQ(bus.calls[1].tx, (std::vector<uint8_t>{0x01, 0x00, 0x01, 0xFF}));
    EXPECT_EQ(delays.waits, (std::vector<uint32_t>{100}));
}

TEST(SensorProgrammer, SettleTimeComesFromProtocol) {
    ScriptedBus bus;
    bus.readValue = 0x20;
    DelayRecorder delays;
    SensorProtocol protocol;
    protocol.settleMs = 250;
    SensorProgrammer programmer(bus, delays.fn(), protocol);

    programmer.programAndVerify(0x04, 0x20);

    EXPECT_EQ(delays.waits, (std::vector<uint32_t>{250}));
}

TEST(SensorProgrammer, NoAckAtDefaultAddressIsNoResponse) {
    ScriptedBus bus;
    bus.writeStatus = I2CStatus::NackAddress;
    DelayRecorder delays;
    SensorProgrammer programmer(bus, delays.fn());

    ProgramResult result = programmer.programAndVerify(0x04, 0x10);

    EXPECT_EQ(result.kind, OutcomeKind::NoResponse);
    EXPECT_EQ(result.busStatus, I2CStatus::NackAddress);
    EXPECT_EQ(bus.calls.size(), 1u);
    EXPECT_TRUE(delays.waits.empty());
}

TEST(SensorProgrammer, AbsentSensorStaysNoResponseOnRepeat) {
    ScriptedBus bus;
    bus.writeStatus = I2CStatus::NackAddress;
    SensorProgrammer programmer(bus, nullptr);

    ProgramResult first = programmer.programAndVerify(0x04, 0x10);
    ProgramResult second = programmer.programAndVerify(0x04, 0x10);

    EXPECT_EQ(first.kind, OutcomeKind::NoResponse);
    EXPECT_EQ(second.kind, OutcomeKind::NoResponse);
    EXPECT_EQ(bus.calls.size(), 2u);
}

TEST(SensorProgrammer, WriteFaultOtherThanNackIsBusError) {
    ScriptedBus bus;
    bus.writeStatus = I2CStatus::Timeout;
    SensorProgrammer programmer(bus, nullptr);

    ProgramResult result = programmer.programAndVerify(0x04, 0x10);

    EXPECT_EQ(result.kind, OutcomeKind::BusError);
    EXPECT_EQ(result.busStatus, I2CStatus::Timeout);
}

TEST(SensorProgrammer, NoAckAtNewAddressIsNoResponse) {
    ScriptedBus bus;
    bus.readStatus = I2CStatus::NackAddress;
    SensorProgrammer programmer(bus, nullptr);

    ProgramResult result = programmer.programAndVerify(0x04, 0x10);

    EXPECT_EQ(result.kind, OutcomeKind::NoResponse);
    EXPECT_EQ(bus.calls.size(), 2u);
}

TEST(SensorProgrammer, ReadFaultIsBusError) {
    ScriptedBus bus;
    bus.readStatus = I2CStatus::Other;
    SensorProgrammer programmer(bus, nullptr);

    EXPECT_EQ(programmer.programAndVerify(0x04, 0x10).kind, OutcomeKind::BusError);
}

TEST(SensorProgrammer, WrongIdentityIsMismatch) {
    ScriptedBus bus;
    bus.readValue = 0x04;
    SensorProgrammer programmer(bus, nullptr);

    ProgramResult result = programmer.programAndVerify(0x04, 0x15);

    EXPECT_EQ(result.kind, OutcomeKind::VerificationMismatch);
    EXPECT_EQ(result.actual, 0x04);
}

TEST(SensorProgrammer, SameScriptGivesSameOutcome) {
    const I2CStatus statuses[] = {I2CStatus::Ok, I2CStatus::NackAddress, I2CStatus::Timeout};
    for (I2CStatus writeStatus : statuses) {
        for (I2CStatus readStatus : statuses) {
            ScriptedBus a;
            ScriptedBus b;
            a.writeStatus = b.writeStatus = writeStatus;
            a.readStatus = b.readStatus = readStatus;
            a.readValue = b.readValue = 0x11;
            SensorProgrammer pa(a, nullptr);
            SensorProgrammer pb(b, nullptr);

            ProgramResult ra = pa.programAndVerify(0x04, 0x11);
            ProgramResult rb = pb.programAndVerify(0x04, 0x11);

            EXPECT_EQ(ra.kind, rb.kind);
            EXPECT_EQ(ra.busStatus, rb.busStatus);
            EXPECT_EQ(a.calls.size(), b.calls.size());
        }
    }
}

TEST(SensorProgrammer, InvalidAddressTouchesNoBus) {
    ScriptedBus bus;
    SensorProgrammer programmer(bus, nullptr);

    ProgramResult result = programmer.programAndVerify(0x04, 0x80);

    EXPECT_EQ(result.kind, OutcomeKind::BusError);
    EXPECT_EQ(result.busStatus, I2CStatus::InvalidArgument);
    EXPECT_TRUE(bus.calls.empty());
}

TEST(SensorProgrammer, AlreadyMovedSensorIsLeftAlone) {
    SimulatedBus bus;
    I2CMux mux(bus);
    SensorProgrammer programmer(bus, nullptr);
    ASSERT_EQ(mux.selectChannel(2), I2CStatus::Ok);

    ASSERT_EQ(programmer.programAndVerify(0x04, 0x12).kind, OutcomeKind::Programmed);
    ProgramResult again = programmer.programAndVerify(0x04, 0x12);

    EXPECT_EQ(again.kind, OutcomeKind::NoResponse);
    EXPECT_EQ(bus.sensor(2).address, 0x12);
}

TEST(SensorProgrammer, IgnoredCommandIsCaughtByVerification) {
    SimulatedBus bus;
    I2CMux mux(bus);
    SensorProgrammer programmer(bus, nullptr);
    bus.sensor(0).ignoresAddressWrite = true;
    ASSERT_EQ(mux.selectChannel(0), I2CStatus::Ok);

    ProgramResult result = programmer.programAndVerify(0x04, 0x10);

    EXPECT_EQ(result.kind, OutcomeKind::NoResponse);
    EXPECT_EQ(bus.sensor(0).address, 0x04);
}
