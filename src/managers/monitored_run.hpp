#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <optional>
#include <filesystem>
#include "transfer_backend.hpp"

namespace fs = std::filesystem;

enum class RunPhase {
    NotReady,
    ReadyForCopy,
    Copying,
    Completed,   // terminal
    Aborted,     // terminal
};

// "not_ready", "ready_for_copy", "copying", "completed", "aborted"
const char* phase_name(RunPhase phase);

// One run directory under a configured root. Supervision state lives in
// memory only; phase == Copying exactly when copy_proc is set.
struct MonitoredRun {
    using TimePoint = std::chrono::steady_clock::time_point;

    fs::path root;
    std::string name;              // YYMMDD_...
    RunPhase phase = RunPhase::NotReady;

    std::unique_ptr<TransferProcess> copy_proc;
    std::vector<std::string> copy_args;    // args of the last launch, reused on restart
    std::optional<TimePoint> copy_start_time;
    std::optional<TimePoint> copy_end_time;

    MonitoredRun(fs::path root_dir, std::string run_name)
        : root(std::move(root_dir)), name(std::move(run_name)) {}

    fs::path path() const { return root / name; }
    bool is_copying() const { return copy_proc != nullptr; }
};
