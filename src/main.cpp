#include <Arduino.h>
#include <Wire.h>
#include "jig_config.h"
#include "wire_bus.h"
#include "i2c_mux.h"
#include "sensor_programmer.h"
#include "address_sequencer.h"
#include "report_format.h"

// Serial log of every channel as the sequencer walks the mux
class SerialProgressLog : public SequencerListener {
public:
    void onChannelStart(uint8_t channel, uint8_t targetAddress) override {
        Serial.printf("[PROG] Channel %d: moving sensor 0x%02X -> 0x%02X \n",
                      channel, SENSOR_DEFAULT_ADDRESS, targetAddress);
    }

    void onChannelDone(const ChannelOutcome& outcome) override {
        char line[64];
        formatOutcome(outcome, line, sizeof(line));
        if (outcome.kind == OutcomeKind::Programmed) {
            Serial.printf("[PROG] %s \n", line);
        } else {
            Serial.printf("[ERROR] %s \n", line);
        }
    }

    void onRunDone(const Report& report, I2CStatus deselectStatus) override {
        if (deselectStatus != I2CStatus::Ok) {
            Serial.printf("[ERROR] Failed to release MUX channels (%s) \n", i2cStatusName(deselectStatus));
        }
        ReportSummary summary = summarize(report);
        Serial.printf("[DONE] %d programmed, %d mismatch, %d no response, %d bus error \n",
                      summary.programmed, summary.mismatch, summary.noResponse, summary.busError);
    }
};

SensorProtocol sensorProtocol() {
    SensorProtocol protocol;
    protocol.settleMs = SENSOR_SETTLE_MS;
    return protocol;
}

// Only Initializations
WireBus bus(Wire, I2C_CLOCK_HZ);
I2CMux mux(bus, MUX_ADDRESS);
SensorProgrammer programmer(bus, [](uint32_t ms) { delay(ms); }, sensorProtocol());
AddressSequencer sequencer(mux, programmer, SENSOR_DEFAULT_ADDRESS);
SerialProgressLog progressLog;

const AssignmentTable assignments = makeLinearAssignments(TARGET_BASE_ADDRESS);


// Utility function to handle errors
void throwError() {
    while(1){
        digitalWrite(LED_PIN, LOW); // Turn off the built-in LED to indicate error
        delay(500);
        digitalWrite(LED_PIN, HIGH); // Turn on the built-in LED to indicate error
        delay(500);
    }
}

void waitForButtonPress() {
    while (true) {
        while (digitalRead(BUTTON_PIN) == HIGH) {
            delay(5);
        }
        delay(BUTTON_DEBOUNCE_MS);
        if (digitalRead(BUTTON_PIN) == LOW) break;
    }
    while (digitalRead(BUTTON_PIN) == LOW) {
        delay(5);
    }
}

// Solid on when every sensor took its address, otherwise one blink per failed channel
void showResult(const Report& report) {
    uint8_t failed = kMuxChannelCount - summarize(report).programmed;
    if (failed == 0) {
        digitalWrite(LED_PIN, HIGH);
        return;
    }
    digitalWrite(LED_PIN, LOW);
    delay(500);
    for (uint8_t i = 0; i < failed; i++) {
        digitalWrite(LED_PIN, HIGH);
        delay(200);
        digitalWrite(LED_PIN, LOW);
        delay(200);
    }
}

void setup() {
    pinMode(LED_PIN, OUTPUT); // Set LED pin as output
    pinMode(BUTTON_PIN, INPUT_PULLUP);
    Serial.begin(SERIAL_BAUD); // Initialize Serial Monitor
    delay(1000);

    AssignmentError tableError = validateAssignments(assignments, MUX_ADDRESS, SENSOR_DEFAULT_ADDRESS);
    if (tableError != AssignmentError::None) {
        Serial.printf("[ERROR] Invalid address table: %s \n", assignmentErrorName(tableError));
        throwError();
    }

    // Initialize I2C Multiplexer
    Serial.println("[INIT] Starting I2C MUX setup...");
    bus.begin();
    I2CStatus muxStatus = mux.begin();
    if (muxStatus != I2CStatus::Ok) {
        Serial.printf("[ERROR] MUX not found at 0x%02X (%s), please check wiring! \n",
                      MUX_ADDRESS, i2cStatusName(muxStatus));
        throwError();
    }
    sequencer.setListener(&progressLog);

    Serial.printf("[INIT] Ready to program %d sensors from 0x%02X, press the button to start \n",
                  kMuxChannelCount, TARGET_BASE_ADDRESS);
}

void loop() {
    waitForButtonPress();
    digitalWrite(LED_PIN, LOW);
    Serial.println("[PROG] Starting device programming");

    unsigned long startTime = millis();
    Report report = sequencer.run(assignments);
    Serial.printf("[DONE] Run took %lu ms \n", millis() - startTime);

    showResult(report);
}
