#ifndef REPORT_FORMAT_H
#define REPORT_FORMAT_H

#include <stddef.h>
#include <stdint.h>
#include "address_sequencer.h"

struct ReportSummary {
    uint8_t programmed;
    uint8_t mismatch;
    uint8_t noResponse;
    uint8_t busError;
};

const char* outcomeName(OutcomeKind kind);

// Writes one log line such as "ch 3 -> 0x13 programmed". Returns the
// snprintf result; the buffer is always terminated.
int formatOutcome(const ChannelOutcome& outcome, char* buffer, size_t length);

ReportSummary summarize(const Report& report);
bool allProgrammed(const Report& report);

#endif // REPORT_FORMAT_H
