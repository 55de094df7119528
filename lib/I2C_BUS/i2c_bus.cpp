#include "i2c_bus.h"

const char* i2cStatusName(I2CStatus status) {
    switch (status) {
        case I2CStatus::Ok:              return "ok";
        case I2CStatus::DataTooLong:     return "data too long";
        case I2CStatus::NackAddress:     return "nack addr";
        case I2CStatus::NackData:        return "nack data";
        case I2CStatus::Other:           return "bus fault";
        case I2CStatus::Timeout:         return "timeout";
        case I2CStatus::InvalidArgument: return "invalid argument";
    }
    return "unknown";
}

I2CStatus checkReadRequest(uint8_t address, size_t rxLength) {
    if (address > 0x7F || rxLength == 0 || rxLength > kMaxReadLength) {
        return I2CStatus::InvalidArgument;
    }
    return I2CStatus::Ok;
}
