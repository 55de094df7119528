#include "report_format.h"
#include <stdio.h>

const char* outcomeName(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Programmed:           return "programmed";
        case OutcomeKind::VerificationMismatch: return "mismatch";
        case OutcomeKind::NoResponse:           return "no response";
        case OutcomeKind::BusError:             return "bus error";
    }
    return "unknown";
}

int formatOutcome(const ChannelOutcome& outcome, char* buffer, size_t length) {
    if (buffer == nullptr || length == 0) return 0;

    unsigned channel = outcome.channel;
    unsigned address = outcome.address;
    switch (outcome.kind) {
        case OutcomeKind::Programmed:
            return snprintf(buffer, length, "ch %u -> 0x%02X programmed", channel, address);
        case OutcomeKind::VerificationMismatch:
            return snprintf(buffer, length, "ch %u -> 0x%02X mismatch (read 0x%02X)",
                            channel, address, static_cast<unsigned>(outcome.actual));
        default:
            return snprintf(buffer, length, "ch %u -> 0x%02X %s (%s)", channel, address,
                            outcomeName(outcome.kind), i2cStatusName(outcome.busStatus));
    }
}

ReportSummary summarize(const Report& report) {
    ReportSummary summary{0, 0, 0, 0};
    for (const ChannelOutcome& outcome : report) {
        switch (outcome.kind) {
            case OutcomeKind::Programmed:           summary.programmed++; break;
            case OutcomeKind::VerificationMismatch: summary.mismatch++; break;
            case OutcomeKind::NoResponse:           summary.noResponse++; break;
            case OutcomeKind::BusError:             summary.busError++; break;
        }
    }
    return summary;
}

bool allProgrammed(const Report& report) {
    return summarize(report).programmed == report.size();
}
