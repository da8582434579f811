#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/config.hpp>
#include <lims/status_oracle.hpp>
#include <notify/mailer.hpp>
#include "run_registry.hpp"
#include "transfer_backend.hpp"

enum class PollStatus {
    Running,
    Succeeded,   // handle left in place for the terminal handler
    Failed,      // run reverted to ReadyForCopy
};

struct PollResult {
    PollStatus status = PollStatus::Running;
    int exit_code = 0;
};

// Launches, polls and restarts copies, never more than
// max_copy_processes at once.
class TransferSupervisor {
public:
    TransferSupervisor(const Config& config, RunRegistry& registry, TransferBackend& backend,
                       StatusOracle& oracle, Mailer& mailer);

    // False once the number of copying runs has reached the cap.
    bool admit() const;

    // rsync arguments for this run (program name excluded).
    std::vector<std::string> copy_args(const MonitoredRun& run) const;

    // Start the copy and move the run to Copying.
    void launch(MonitoredRun& run);

    // Admission check, then launch. Returns true if a copy was started.
    bool try_start(MonitoredRun& run, const std::optional<RunRecord>& record);

    // Non-blocking. On a nonzero exit, notifies and reverts the run.
    PollResult poll(MonitoredRun& run);

    // Kill and relaunch with the same arguments once the copy has run
    // longer than seconds_before_copy_restart. Returns true if restarted.
    bool restart_if_stalled(MonitoredRun& run);

private:
    const Config& config_;
    RunRegistry& registry_;
    TransferBackend& backend_;
    StatusOracle& oracle_;
    Mailer& mailer_;

    void start_process(MonitoredRun& run, const std::vector<std::string>& args);
};
