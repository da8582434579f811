#include "transfer_supervisor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <notify/messages.hpp>
#include <fmt/format.h>
#include <chrono>

using Clock = std::chrono::steady_clock;

TransferSupervisor::TransferSupervisor(const Config& config, RunRegistry& registry,
                                       TransferBackend& backend, StatusOracle& oracle,
                                       Mailer& mailer)
    : config_(config), registry_(registry), backend_(backend), oracle_(oracle), mailer_(mailer) {}

bool TransferSupervisor::admit() const {
    return registry_.copying_count() < config_.max_copy_processes();
}

std::vector<std::string> TransferSupervisor::copy_args(const MonitoredRun& run) const {
    const auto& dest = config_.dest();
    std::string source = run.path().string();
    while (source.size() > 1 && source.back() == '/') source.pop_back();
    std::string dest_root = dest.run_root;
    while (dest_root.size() > 1 && dest_root.back() == '/') dest_root.pop_back();

    return {
        COPY_FLAGS,
        "-e", "ssh -l " + dest.user,
        std::string("--exclude=") + THUMBNAIL_SUBDIR + "/",
        COPY_CHMOD,
        source,
        dest.host + ":" + dest_root,
    };
}

void TransferSupervisor::start_process(MonitoredRun& run, const std::vector<std::string>& args) {
    run.copy_proc = backend_.launch(COPY_PROGRAM, args);
    run.copy_args = args;
    run.copy_start_time = Clock::now();
    run.copy_end_time.reset();
    run.phase = RunPhase::Copying;
}

void TransferSupervisor::launch(MonitoredRun& run) {
    autocopy_log(fmt::format("Starting copy of run {}", run.name));
    start_process(run, copy_args(run));
}

bool TransferSupervisor::try_start(MonitoredRun& run, const std::optional<RunRecord>& record) {
    if (!admit()) {
        autocopy_log(fmt::format(
            "Postponing copy of run {} because MAX_COPY_PROCESSES={} has been reached",
            run.name, config_.max_copy_processes()));
        return false;
    }

    if (!record) {
        mailer_.send(messages::run_not_found_in_lims(run.name));
    }
    launch(run);

    if (record) {
        try {
            oracle_.mark_analysis_started(run.name);
        } catch (const OracleError& e) {
            autocopy_log(fmt::format("Could not flag run {} as analysis started: {}",
                                     run.name, e.what()));
        }
    }
    return true;
}

PollResult TransferSupervisor::poll(MonitoredRun& run) {
    if (!run.copy_proc) {
        return {PollStatus::Failed, -1};
    }

    auto code = run.copy_proc->poll();
    if (!code) return {PollStatus::Running, 0};
    if (*code == 0) return {PollStatus::Succeeded, 0};

    autocopy_log(fmt::format("Copy of run {} failed with return code {}", run.name, *code));
    mailer_.send(messages::copy_failed(run.name, run.path().string(), mailer_.hostname(),
                                       config_.dest().host, config_.dest().run_root, *code));

    // Revert so the next cycle can retry.
    run.copy_proc.reset();
    run.copy_end_time = Clock::now();
    run.phase = RunPhase::ReadyForCopy;
    return {PollStatus::Failed, *code};
}

bool TransferSupervisor::restart_if_stalled(MonitoredRun& run) {
    if (!run.copy_proc || !run.copy_start_time) return false;

    auto limit = std::chrono::seconds(config_.intervals().seconds_before_copy_restart);
    if (Clock::now() - *run.copy_start_time <= limit) return false;

    autocopy_log(fmt::format("Copy of run {} has been running longer than {} seconds; restarting",
                             run.name, limit.count()));
    run.copy_proc->kill();
    run.copy_proc.reset();
    run.phase = RunPhase::ReadyForCopy;

    std::vector<std::string> args = run.copy_args.empty() ? copy_args(run) : run.copy_args;
    start_process(run, args);
    mailer_.send(messages::copy_restarted(run.name, config_.intervals().seconds_before_copy_restart));
    return true;
}
