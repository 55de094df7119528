#ifndef JIG_CONFIG_H
#define JIG_CONFIG_H

#include <stdint.h>

// Bus
static constexpr uint32_t I2C_CLOCK_HZ = 100000;
static constexpr uint8_t MUX_ADDRESS = 0x70;

// Sensors ship at this address; channel n is moved to TARGET_BASE_ADDRESS + n
static constexpr uint8_t SENSOR_DEFAULT_ADDRESS = 0x04;
static constexpr uint8_t TARGET_BASE_ADDRESS = 0x08;
static constexpr uint32_t SENSOR_SETTLE_MS = 100;

// Front panel
static constexpr int LED_PIN = 2;     // Most ESP32 dev boards use GPIO 2 for the onboard LED
static constexpr int BUTTON_PIN = 9;  // Start button, active low
static constexpr uint32_t BUTTON_DEBOUNCE_MS = 50;

static constexpr uint32_t SERIAL_BAUD = 115200;

#endif // JIG_CONFIG_H
