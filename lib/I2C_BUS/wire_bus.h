#ifndef WIRE_BUS_H
#define WIRE_BUS_H

#include <Arduino.h>
#include <Wire.h>
#include "i2c_bus.h"

// I2CBus on top of an Arduino TwoWire instance.
class WireBus : public I2CBus {
public:
    WireBus(TwoWire& wire = Wire, uint32_t clockHz = 100000);
    void begin();

    I2CStatus write(uint8_t address, const uint8_t* data, size_t length) override;
    I2CStatus writeThenRead(uint8_t address,
                            const uint8_t* tx, size_t txLength,
                            uint8_t* rx, size_t rxLength) override;

private:
    static I2CStatus toStatus(uint8_t endTransmissionResult);

    TwoWire& _wire;
    uint32_t _clockHz;
};

#endif // WIRE_BUS_H
