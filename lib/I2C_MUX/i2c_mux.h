#ifndef I2C_MUX_H
#define I2C_MUX_H

#include <stdint.h>
#include "i2c_bus.h"

// TCA9548A / PCA9548A style multiplexer: one control byte, one bit per output.
class I2CMux {
public:
    static constexpr uint8_t kNoChannel = 0xFF;

    I2CMux(I2CBus& bus, uint8_t address = 0x70, uint8_t width = 8);

    // Disables every output. A failure here means the mux itself does not answer.
    I2CStatus begin();
    I2CStatus selectChannel(uint8_t channel);
    I2CStatus disableAll();

    uint8_t selectedChannel() const { return _selected; }

private:
    I2CStatus writeControl(uint8_t mask);

    I2CBus& _bus;
    uint8_t _address;
    uint8_t _width;
    uint8_t _selected;
};

#endif // I2C_MUX_H
