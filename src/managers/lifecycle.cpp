#include "lifecycle.hpp"

Decision classify(const ClassifierInput& in) {
    bool failed = in.oracle_status && *in.oracle_status == SequencingStatus::Failed;

    if (failed && !in.copying) return Decision::Abort;
    if (failed && in.copying) return Decision::CopyingIgnoreAbort;
    if (in.copying) return Decision::Copying;
    if (in.finished) return Decision::Ready;
    return Decision::NotReady;
}

RunPhase phase_for(Decision decision) {
    switch (decision) {
        case Decision::NotReady:           return RunPhase::NotReady;
        case Decision::Ready:              return RunPhase::ReadyForCopy;
        case Decision::Copying:
        case Decision::CopyingIgnoreAbort: return RunPhase::Copying;
        case Decision::Abort:              return RunPhase::Aborted;
    }
    return RunPhase::NotReady;
}

const char* decision_name(Decision decision) {
    switch (decision) {
        case Decision::NotReady:           return "not_ready";
        case Decision::Ready:              return "ready";
        case Decision::Copying:            return "copying";
        case Decision::Abort:              return "abort";
        case Decision::CopyingIgnoreAbort: return "copying_ignore_abort";
    }
    return "unknown";
}

const char* phase_name(RunPhase phase) {
    switch (phase) {
        case RunPhase::NotReady:     return "not_ready";
        case RunPhase::ReadyForCopy: return "ready_for_copy";
        case RunPhase::Copying:      return "copying";
        case RunPhase::Completed:    return "completed";
        case RunPhase::Aborted:      return "aborted";
    }
    return "unknown";
}
