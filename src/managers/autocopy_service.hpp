#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <core/config.hpp>
#include <lims/status_oracle.hpp>
#include <notify/mailer.hpp>
#include <notify/messages.hpp>
#include <rundir/run_evidence.hpp>
#include <ssh/remote_shell.hpp>
#include "run_registry.hpp"
#include "transfer_backend.hpp"
#include "transfer_supervisor.hpp"
#include "terminal_handler.hpp"

// The daemon's control loop. Owns the registry, the supervisor and the
// terminal handler; every external collaborator is injected.
class AutocopyService {
public:
    AutocopyService(const Config& config, EvidenceSource& evidence, StatusOracle& oracle,
                    TransferBackend& backend, RemoteShell& remote, Mailer& mailer);

    // Prepare every configured root (Runs_Completed/, Runs_Aborted/).
    void initialize_run_roots();

    // Loop until SIGTERM/SIGINT. Returns the process exit code.
    int run();

    // One pass: reconcile, classify and act on every run, housekeeping.
    void run_cycle();

    void send_status_summary();
    void check_free_space();

    RunRegistry& registry() { return registry_; }
    TransferSupervisor& supervisor() { return supervisor_; }
    TerminalHandler& terminal() { return terminal_; }

private:
    using Clock = std::chrono::steady_clock;

    const Config& config_;
    EvidenceSource& evidence_;
    StatusOracle& oracle_;
    Mailer& mailer_;
    RunRegistry registry_;
    TransferSupervisor supervisor_;
    TerminalHandler terminal_;

    std::optional<Clock::time_point> last_summary_;
    std::optional<Clock::time_point> last_freespace_check_;

    void process_run(MonitoredRun& run);
    std::optional<RunRecord> lookup(const std::string& run_name);
    void housekeeping();
    bool due(const std::optional<Clock::time_point>& last, int delay_seconds) const;
    void report_exception(const std::string& context, const std::exception& e);
    void sleep_between_cycles();
};
