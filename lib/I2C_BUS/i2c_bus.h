#ifndef I2C_BUS_H
#define I2C_BUS_H

#include <stddef.h>
#include <stdint.h>

// Transaction result. Values 0..5 match the codes returned by
// Wire.endTransmission().
enum class I2CStatus : uint8_t {
    Ok = 0,
    DataTooLong = 1,
    NackAddress = 2,
    NackData = 3,
    Other = 4,
    Timeout = 5,
    InvalidArgument = 6
};

// Largest read a single requestFrom() can carry
static constexpr size_t kMaxReadLength = 255;

const char* i2cStatusName(I2CStatus status);

// InvalidArgument for a non 7-bit address or a read of 0 or more than
// kMaxReadLength bytes, Ok otherwise.
I2CStatus checkReadRequest(uint8_t address, size_t rxLength);

// Blocking I2C master transactions against 7-bit addresses.
class I2CBus {
public:
    virtual ~I2CBus() {}

    virtual I2CStatus write(uint8_t address, const uint8_t* data, size_t length) = 0;
    virtual I2CStatus writeThenRead(uint8_t address,
                                    const uint8_t* tx, size_t txLength,
                                    uint8_t* rx, size_t rxLength) = 0;
};

#endif // I2C_BUS_H
