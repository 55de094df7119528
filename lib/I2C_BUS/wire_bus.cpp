#include "wire_bus.h"

WireBus::WireBus(TwoWire& wire, uint32_t clockHz) : _wire(wire), _clockHz(clockHz) {}

void WireBus::begin() {
    _wire.begin();
    _wire.setClock(_clockHz);
}

I2CStatus WireBus::write(uint8_t address, const uint8_t* data, size_t length) {
    if (address > 0x7F) return I2CStatus::InvalidArgument;
    _wire.beginTransmission(address);
    if (length > 0 && _wire.write(data, length) != length) {
        _wire.endTransmission();
        return I2CStatus::DataTooLong;
    }
    return toStatus(_wire.endTransmission());
}

I2CStatus WireBus::writeThenRead(uint8_t address,
                                 const uint8_t* tx, size_t txLength,
                                 uint8_t* rx, size_t rxLength) {
    I2CStatus request = checkReadRequest(address, rxLength);
    if (request != I2CStatus::Ok) return request;
    _wire.beginTransmission(address);
    if (txLength > 0 && _wire.write(tx, txLength) != txLength) {
        _wire.endTransmission();
        return I2CStatus::DataTooLong;
    }
    // Repeated start between the request frame and the read
    I2CStatus status = toStatus(_wire.endTransmission(false));
    if (status != I2CStatus::Ok) return status;

    size_t received = _wire.requestFrom(address, static_cast<uint8_t>(rxLength));
    if (received != rxLength) {
        // requestFrom gives no NACK detail; nothing read back means nobody answered
        while (_wire.available()) _wire.read();
        return received == 0 ? I2CStatus::NackAddress : I2CStatus::Other;
    }
    for (size_t i = 0; i < rxLength; i++) {
        rx[i] = static_cast<uint8_t>(_wire.read());
    }
    return I2CStatus::Ok;
}

I2CStatus WireBus::toStatus(uint8_t endTransmissionResult) {
    switch (endTransmissionResult) {
        case 0: return I2CStatus::Ok;
        case 1: return I2CStatus::DataTooLong;
        case 2: return I2CStatus::NackAddress;
        case 3: return I2CStatus::NackData;
        case 5: return I2CStatus::Timeout;
        default: return I2CStatus::Other;
    }
}
