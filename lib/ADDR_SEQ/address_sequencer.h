#ifndef ADDRESS_SEQUENCER_H
#define ADDRESS_SEQUENCER_H

#include <stdint.h>
#include <array>
#include "i2c_mux.h"
#include "sensor_programmer.h"

static constexpr uint8_t kMuxChannelCount = 8;

struct AddressAssignment {
    uint8_t channel;
    uint8_t address;
};

typedef std::array<AddressAssignment, kMuxChannelCount> AssignmentTable;

struct ChannelOutcome {
    uint8_t channel;
    OutcomeKind kind;
    uint8_t address;      // target address programmed (or expected)
    uint8_t actual;       // address read back on VerificationMismatch
    I2CStatus busStatus;
};

typedef std::array<ChannelOutcome, kMuxChannelCount> Report;

enum class AssignmentError : uint8_t {
    None,
    ChannelOrder,      // channels not 0..7 in ascending order
    ReservedAddress,   // outside 0x08..0x77
    DuplicateAddress,
    MuxCollision,
    DefaultCollision
};

enum class SequencerState : uint8_t {
    Idle,
    Selecting,
    Programming,
    Verified,
    Failed,
    Done
};

// Channel n gets base + n.
AssignmentTable makeLinearAssignments(uint8_t baseAddress);
AssignmentError validateAssignments(const AssignmentTable& table, uint8_t muxAddress, uint8_t defaultAddress);
const char* assignmentErrorName(AssignmentError error);

class SequencerListener {
public:
    virtual ~SequencerListener() {}
    virtual void onChannelStart(uint8_t /*channel*/, uint8_t /*targetAddress*/) {}
    virtual void onChannelDone(const ChannelOutcome& /*outcome*/) {}
    virtual void onRunDone(const Report& /*report*/, I2CStatus /*deselectStatus*/) {}
};

class AddressSequencer {
public:
    AddressSequencer(I2CMux& mux, SensorProgrammer& programmer, uint8_t defaultAddress);

    // One attempt per channel, in table order. Failures stay local to their
    // channel; the report always holds every entry of the table.
    Report run(const AssignmentTable& assignments);

    void setListener(SequencerListener* listener) { _listener = listener; }
    SequencerState state() const { return _state; }

private:
    ChannelOutcome programChannel(const AddressAssignment& assignment);

    I2CMux& _mux;
    SensorProgrammer& _programmer;
    uint8_t _defaultAddress;
    SequencerListener* _listener;
    SequencerState _state;
};

#endif // ADDRESS_SEQUENCER_H
