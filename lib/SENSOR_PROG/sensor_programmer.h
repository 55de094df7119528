#ifndef SENSOR_PROGRAMMER_H
#define SENSOR_PROGRAMMER_H

#include <stdint.h>
#include <functional>
#include "i2c_bus.h"

enum class OutcomeKind : uint8_t {
    Programmed,
    VerificationMismatch,
    NoResponse,
    BusError
};

// Command framing of the force sensor's settings interface.
//   write: [writeCommand, register, length, data..., frameEnd]
//   read:  [readCommand, register, length, frameEnd] then length bytes back
struct SensorProtocol {
    uint8_t writeCommand = 0x02;
    uint8_t readCommand = 0x01;
    uint8_t frameEnd = 0xFF;
    uint8_t addressRegister = 0x00;
    // Time for the new address to commit to the sensor's non-volatile storage
    uint32_t settleMs = 100;
};

struct ProgramResult {
    OutcomeKind kind;
    uint8_t actual;       // identity byte read back, valid for VerificationMismatch
    I2CStatus busStatus;  // transport status behind NoResponse / BusError
};

class SensorProgrammer {
public:
    typedef std::function<void(uint32_t)> DelayFn;

    SensorProgrammer(I2CBus& bus, DelayFn delayMs, const SensorProtocol& protocol = SensorProtocol());

    // Moves the sensor answering at defaultAddress to targetAddress and reads
    // the address register back from targetAddress.
    ProgramResult programAndVerify(uint8_t defaultAddress, uint8_t targetAddress);

private:
    static ProgramResult failure(I2CStatus status);

    I2CBus& _bus;
    DelayFn _delayMs;
    SensorProtocol _protocol;
};

#endif // SENSOR_PROGRAMMER_H
