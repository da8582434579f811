#include "autocopy_service.hpp"
#include "lifecycle.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/signals.hpp>
#include <fmt/format.h>

AutocopyService::AutocopyService(const Config& config, EvidenceSource& evidence,
                                 StatusOracle& oracle, TransferBackend& backend,
                                 RemoteShell& remote, Mailer& mailer)
    : config_(config),
      evidence_(evidence),
      oracle_(oracle),
      mailer_(mailer),
      registry_(config, oracle, mailer),
      supervisor_(config, registry_, backend, oracle, mailer),
      terminal_(config, registry_, oracle, remote, mailer) {}

void AutocopyService::initialize_run_roots() {
    for (const auto& root : config_.source_run_roots()) {
        terminal_.prepare_run_root(root);
    }
}

// ── Main loop ───────────────────────────────────────────────

int AutocopyService::run() {
    mailer_.send(messages::daemon_started());
    autocopy_log("Starting main loop");

    while (!platform::shutdown_requested()) {
        try {
            run_cycle();
        } catch (const std::exception& e) {
            report_exception("cycle", e);
        }
        if (platform::shutdown_requested()) break;
        sleep_between_cycles();
    }

    autocopy_log("Received kill signal; shutting down. Running copies are left to finish.");
    mailer_.send(messages::daemon_stopped());
    return 0;
}

void AutocopyService::sleep_between_cycles() {
    int delay = config_.intervals().main_loop_delay_seconds;
    autocopy_log(fmt::format("Sleeping for {} seconds", delay));

    auto until = Clock::now() + std::chrono::seconds(delay);
    while (Clock::now() < until && !platform::shutdown_requested()) {
        if (platform::take_summary_request()) {
            send_status_summary();
        }
        platform::sleep_ms(LOOP_SLEEP_SLICE_MS);
    }
}

void AutocopyService::run_cycle() {
    ReconcileResult reconciled = registry_.reconcile();

    for (const auto& path : reconciled.abort_candidates) {
        try {
            terminal_.abort_untracked(path);
        } catch (const std::exception& e) {
            report_exception(path.filename().string(), e);
        }
    }

    for (MonitoredRun* run : registry_.runs()) {
        std::string name = run->name;
        try {
            process_run(*run);
        } catch (const std::exception& e) {
            report_exception(name, e);
        }
    }

    housekeeping();
}

// ── Per-run decision ────────────────────────────────────────

std::optional<RunRecord> AutocopyService::lookup(const std::string& run_name) {
    try {
        return oracle_.query(run_name);
    } catch (const RunNotFoundError&) {
        return std::nullopt;
    } catch (const OracleError& e) {
        autocopy_log(fmt::format("Encountered an error accessing the LIMS: {}", e.what()));
        return std::nullopt;
    }
}

void AutocopyService::process_run(MonitoredRun& run) {
    auto evidence = evidence_.open(run.path());
    auto record = lookup(run.name);

    ClassifierInput in;
    in.finished = evidence->is_finished();
    if (record) in.oracle_status = record->status;
    in.copying = run.is_copying();

    Decision decision = classify(in);
    autocopy_log(fmt::format("{}: {}", run.name, decision_name(decision)));
    switch (decision) {
        case Decision::Abort:
            terminal_.abort(run);
            return;

        case Decision::CopyingIgnoreAbort:
            autocopy_log(fmt::format(
                "Run {} is flagged 'sequencing failed' but is already copying; letting the copy finish",
                run.name));
            [[fallthrough]];
        case Decision::Copying: {
            PollResult result = supervisor_.poll(run);
            if (result.status == PollStatus::Succeeded) {
                terminal_.complete(run, *evidence, record);
            } else if (result.status == PollStatus::Running) {
                supervisor_.restart_if_stalled(run);
            }
            return;
        }

        case Decision::Ready:
            run.phase = phase_for(decision);
            supervisor_.try_start(run, record);
            return;

        case Decision::NotReady:
            run.phase = phase_for(decision);
            return;
    }
}

// ── Housekeeping ────────────────────────────────────────────

bool AutocopyService::due(const std::optional<Clock::time_point>& last, int delay_seconds) const {
    if (!last) return true;
    return Clock::now() - *last > std::chrono::seconds(delay_seconds);
}

void AutocopyService::housekeeping() {
    if (due(last_summary_, config_.intervals().summary_delay_seconds)) {
        send_status_summary();
    }
    if (due(last_freespace_check_, config_.intervals().freespace_check_delay_seconds)) {
        check_free_space();
    }
}

void AutocopyService::send_status_summary() {
    std::vector<RootSummary> roots;
    for (const auto& root : config_.source_run_roots()) {
        RootSummary summary;
        summary.root = root.string();
        for (const MonitoredRun* run : registry_.runs_in(root)) {
            summary.runs.emplace_back(run->name, phase_name(run->phase));
        }
        summary.free_bytes = platform::free_space_bytes(root);
        roots.push_back(std::move(summary));
    }
    mailer_.send(messages::status_summary(roots));
    last_summary_ = Clock::now();
}

void AutocopyService::check_free_space() {
    for (const auto& root : config_.source_run_roots()) {
        int64_t free_bytes = platform::free_space_bytes(root);
        if (free_bytes < 0) {
            autocopy_log("Could not read free space for " + root.string());
            continue;
        }
        if (free_bytes < config_.min_free_space()) {
            mailer_.send(messages::low_free_space(root.string(), free_bytes, config_.min_free_space()));
        }
    }
    last_freespace_check_ = Clock::now();
}

void AutocopyService::report_exception(const std::string& context, const std::exception& e) {
    autocopy_log(fmt::format("Error ({}): {}", context, e.what()));
    mailer_.send(messages::unknown_exception(fmt::format("{}: {}", context, e.what())));
}
