#include "address_sequencer.h"

AssignmentTable makeLinearAssignments(uint8_t baseAddress) {
    AssignmentTable table;
    for (uint8_t i = 0; i < kMuxChannelCount; i++) {
        table[i].channel = i;
        table[i].address = static_cast<uint8_t>(baseAddress + i);
    }
    return table;
}

AssignmentError validateAssignments(const AssignmentTable& table, uint8_t muxAddress, uint8_t defaultAddress) {
    for (uint8_t i = 0; i < table.size(); i++) {
        if (table[i].channel != i) return AssignmentError::ChannelOrder;
    }
    for (uint8_t i = 0; i < table.size(); i++) {
        uint8_t address = table[i].address;
        if (address < 0x08 || address > 0x77) return AssignmentError::ReservedAddress;
        if (address == muxAddress) return AssignmentError::MuxCollision;
        if (address == defaultAddress) return AssignmentError::DefaultCollision;
        for (uint8_t j = 0; j < i; j++) {
            if (table[j].address == address) return AssignmentError::DuplicateAddress;
        }
    }
    return AssignmentError::None;
}

const char* assignmentErrorName(AssignmentError error) {
    switch (error) {
        case AssignmentError::None:             return "ok";
        case AssignmentError::ChannelOrder:     return "channels must be 0..7 in order";
        case AssignmentError::ReservedAddress:  return "address outside 0x08..0x77";
        case AssignmentError::DuplicateAddress: return "duplicate target address";
        case AssignmentError::MuxCollision:     return "target collides with mux address";
        case AssignmentError::DefaultCollision: return "target equals sensor default address";
    }
    return "unknown";
}

AddressSequencer::AddressSequencer(I2CMux& mux, SensorProgrammer& programmer, uint8_t defaultAddress)
    : _mux(mux), _programmer(programmer), _defaultAddress(defaultAddress),
      _listener(nullptr), _state(SequencerState::Idle) {}

Report AddressSequencer::run(const AssignmentTable& assignments) {
    Report report;
    _state = SequencerState::Idle;
    for (size_t i = 0; i < assignments.size(); i++) {
        const AddressAssignment& assignment = assignments[i];
        _state = SequencerState::Selecting;
        if (_listener) _listener->onChannelStart(assignment.channel, assignment.address);
        report[i] = programChannel(assignment);
        if (_listener) _listener->onChannelDone(report[i]);
    }

    // Leave no sensor attached once the run is over
    I2CStatus deselect = _mux.disableAll();
    _state = SequencerState::Done;
    if (_listener) _listener->onRunDone(report, deselect);
    return report;
}

ChannelOutcome AddressSequencer::programChannel(const AddressAssignment& assignment) {
    ChannelOutcome outcome{assignment.channel, OutcomeKind::BusError, assignment.address, 0, I2CStatus::Ok};

    I2CStatus status = _mux.selectChannel(assignment.channel);
    if (status != I2CStatus::Ok) {
        outcome.busStatus = status;
        _state = SequencerState::Failed;
        return outcome;
    }

    _state = SequencerState::Programming;
    ProgramResult result = _programmer.programAndVerify(_defaultAddress, assignment.address);
    outcome.kind = result.kind;
    outcome.actual = result.actual;
    outcome.busStatus = result.busStatus;
    _state = (result.kind == OutcomeKind::Programmed) ? SequencerState::Verified : SequencerState::Failed;
    return outcome;
}
