#include "sensor_programmer.h"

SensorProgrammer::SensorProgrammer(I2CBus& bus, DelayFn delayMs, const SensorProtocol& protocol)
    : _bus(bus), _delayMs(delayMs), _protocol(protocol) {}

ProgramResult SensorProgrammer::programAndVerify(uint8_t defaultAddress, uint8_t targetAddress) {
    if (defaultAddress > 0x7F || targetAddress > 0x7F) {
        return failure(I2CStatus::InvalidArgument);
    }

    const uint8_t setAddress[] = {
        _protocol.writeCommand,
        _protocol.addressRegister,
        1,
        targetAddress,
        _protocol.frameEnd
    };
    I2CStatus status = _bus.write(defaultAddress, setAddress, sizeof(setAddress));
    if (status != I2CStatus::Ok) return failure(status);

    if (_delayMs) _delayMs(_protocol.settleMs);

    const uint8_t readAddress[] = {
        _protocol.readCommand,
        _protocol.addressRegister,
        1,
        _protocol.frameEnd
    };
    uint8_t identity = 0;
    status = _bus.writeThenRead(targetAddress, readAddress, sizeof(readAddress), &identity, 1);
    if (status != I2CStatus::Ok) return failure(status);

    if (identity != targetAddress) {
        return ProgramResult{OutcomeKind::VerificationMismatch, identity, I2CStatus::Ok};
    }
    return ProgramResult{OutcomeKind::Programmed, identity, I2CStatus::Ok};
}

// Nobody acknowledging the address is an absent (or already moved) sensor.
// Anything else went wrong on the wire.
ProgramResult SensorProgrammer::failure(I2CStatus status) {
    OutcomeKind kind = (status == I2CStatus::NackAddress) ? OutcomeKind::NoResponse
                                                          : OutcomeKind::BusError;
    return ProgramResult{kind, 0, status};
}
