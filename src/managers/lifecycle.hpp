#pragma once

#include <optional>
#include <lims/status_oracle.hpp>
#include "monitored_run.hpp"

enum class Decision {
    NotReady,
    Ready,                // start a copy, subject to admission
    Copying,              // poll the running copy
    Abort,                // move to the aborted subdirectory
    CopyingIgnoreAbort,   // LIMS says failed but bytes are already moving; treat as Copying
};

struct ClassifierInput {
    bool finished = false;
    std::optional<SequencingStatus> oracle_status;   // nullopt = no LIMS record
    bool copying = false;
};

// The single authority on what happens to a run this cycle.
Decision classify(const ClassifierInput& in);

// Phase a run holds after the decision is carried out.
RunPhase phase_for(Decision decision);

const char* decision_name(Decision decision);
