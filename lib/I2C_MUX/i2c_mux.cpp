#include "i2c_mux.h"

constexpr uint8_t I2CMux::kNoChannel;

I2CMux::I2CMux(I2CBus& bus, uint8_t address, uint8_t width)
    : _bus(bus), _address(address), _width(width > 8 ? 8 : width), _selected(kNoChannel) {}

I2CStatus I2CMux::begin() {
    return disableAll();
}

I2CStatus I2CMux::selectChannel(uint8_t channel) {
    if (channel >= _width) return I2CStatus::InvalidArgument;
    I2CStatus status = writeControl(static_cast<uint8_t>(1 << channel));
    _selected = (status == I2CStatus::Ok) ? channel : kNoChannel;
    return status;
}

I2CStatus I2CMux::disableAll() {
    I2CStatus status = writeControl(0x00);
    _selected = kNoChannel;
    return status;
}

I2CStatus I2CMux::writeControl(uint8_t mask) {
    return _bus.write(_address, &mask, 1);
}
