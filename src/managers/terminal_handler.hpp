#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <filesystem>
#include <core/config.hpp>
#include <lims/status_oracle.hpp>
#include <notify/mailer.hpp>
#include <rundir/run_evidence.hpp>
#include <ssh/remote_shell.hpp>
#include "run_registry.hpp"

namespace fs = std::filesystem;

// A run directory could not be moved into its terminal subdirectory.
class TransitionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Moves finished and failed runs out of the monitored set.
class TerminalHandler {
public:
    TerminalHandler(const Config& config, RunRegistry& registry, StatusOracle& oracle,
                    RemoteShell& remote, Mailer& mailer);

    // Copy succeeded: diagnose, move to Runs_Completed, mark the remote
    // copy complete, forget the run, report. Throws TransitionError if the
    // move fails; the run then stays tracked and is retried next cycle.
    void complete(MonitoredRun& run, const RunEvidence& evidence,
                  const std::optional<RunRecord>& record);

    // LIMS says sequencing failed: move to Runs_Aborted, forget the run,
    // flag it in the LIMS, report. Throws TransitionError.
    void abort(MonitoredRun& run);

    // Same move and report for a run that was never tracked.
    // Returns the new location.
    fs::path abort_untracked(const fs::path& run_path);

    // Create the root and its Runs_Completed / Runs_Aborted subdirectories
    // (mode 0775), each with an OK-to-delete README.
    void prepare_run_root(const fs::path& root) const;

    // One line per field that differs between the run directory and the LIMS.
    static std::vector<std::string> check_against_lims(const std::string& run_name,
                                                       const RunEvidence& evidence,
                                                       const RunRecord& record);

private:
    const Config& config_;
    RunRegistry& registry_;
    StatusOracle& oracle_;
    RemoteShell& remote_;
    Mailer& mailer_;

    fs::path move_into(const fs::path& run_path, const std::string& subdir) const;
    void mark_remote_complete(const std::string& run_name);
    void leave_readme(const fs::path& dir) const;
};
