#include "terminal_handler.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <notify/messages.hpp>
#include <fmt/format.h>
#include <chrono>
#include <fstream>

using Clock = std::chrono::steady_clock;

TerminalHandler::TerminalHandler(const Config& config, RunRegistry& registry,
                                 StatusOracle& oracle, RemoteShell& remote, Mailer& mailer)
    : config_(config), registry_(registry), oracle_(oracle), remote_(remote), mailer_(mailer) {}

// ── Diagnostics ─────────────────────────────────────────────

template <typename A, typename B>
static void compare_field(std::vector<std::string>& problems, const char* field,
                          const A& run_value, const B& lims_value) {
    if (run_value == lims_value) return;
    problems.push_back(fmt::format(
        "Mismatched value \"{}\". Value in run directory: \"{}\". Value in LIMS: \"{}\"",
        field, run_value, lims_value));
}

std::vector<std::string> TerminalHandler::check_against_lims(const std::string& run_name,
                                                             const RunEvidence& evidence,
                                                             const RunRecord& record) {
    // "HCS 1.5.15.1" is recorded in the LIMS as "hcs_1_5_15_1"
    std::string software = to_lower(replace_all(
        replace_all(evidence.control_software_version(), " ", "_"), ".", "_"));

    std::vector<std::string> problems;
    compare_field(problems, "Run name", run_name, record.run_name);
    compare_field(problems, "Sequencing instrument", to_lower(evidence.machine()),
                  to_lower(record.sequencing_instrument));
    compare_field(problems, "Sequencer software version", software,
                  to_lower(record.sequencer_software));
    compare_field(problems, "Paired end", evidence.is_paired_end(), record.paired_end);
    compare_field(problems, "Read 1 cycles", evidence.read1_cycles(), record.read1_cycles);
    compare_field(problems, "Read 2 cycles", evidence.read2_cycles(), record.read2_cycles);
    compare_field(problems, "Is indexed", evidence.has_index_read(), record.has_index_read);
    return problems;
}

// ── Moves ───────────────────────────────────────────────────

fs::path TerminalHandler::move_into(const fs::path& run_path, const std::string& subdir) const {
    fs::path dest = run_path.parent_path() / subdir / run_path.filename();

    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
        throw TransitionError(fmt::format("Cant move run {} to {}. {}",
                                          run_path.filename().string(), dest.string(), ec.message()));
    }
    if (fs::exists(dest, ec)) {
        throw TransitionError(fmt::format("Cant move run {} to {}. Destination already exists",
                                          run_path.filename().string(), dest.string()));
    }
    fs::rename(run_path, dest, ec);
    if (ec) {
        throw TransitionError(fmt::format("Cant move run {} to {}. {}",
                                          run_path.filename().string(), dest.string(), ec.message()));
    }
    autocopy_log(fmt::format("Moved {} to {}", run_path.string(), dest.string()));
    return dest;
}

void TerminalHandler::mark_remote_complete(const std::string& run_name) {
    std::string sentinel = config_.dest().run_root + "/" + run_name + "/" + COPY_COMPLETE_SENTINEL;
    // run_root is validated as command-line safe and may rely on ~ expansion
    std::string cmd = "touch " + config_.dest().run_root + "/" +
                      shell_quote(run_name + "/" + COPY_COMPLETE_SENTINEL);
    autocopy_log(fmt::format("Creating copy complete sentinel file {}:{}",
                             config_.dest().host, sentinel));

    SSHResult r = remote_.run(cmd);
    if (r.failed()) {
        autocopy_log_ssh("sentinel", cmd, r);
        autocopy_log(fmt::format("Could not create {} for run {}; continuing",
                                 COPY_COMPLETE_SENTINEL, run_name));
    }
}

// ── Transitions ─────────────────────────────────────────────

void TerminalHandler::complete(MonitoredRun& run, const RunEvidence& evidence,
                               const std::optional<RunRecord>& record) {
    CompletionReport report;
    report.run_name = run.name;
    report.original_path = run.path().string();
    report.hostname = mailer_.hostname();
    report.dest_host = config_.dest().host;
    report.dest_run_root = config_.dest().run_root;

    report.files_missing = !evidence.validate_files();
    if (record) {
        report.discrepancies = check_against_lims(run.name, evidence, *record);
    }
    report.read_count = evidence.read_count();
    report.cycle_list = evidence.cycle_list();
    report.disk_usage_bytes = evidence.disk_usage_bytes();

    run.copy_end_time = Clock::now();
    if (run.copy_start_time) {
        report.copy_duration = std::chrono::duration_cast<std::chrono::seconds>(
            *run.copy_end_time - *run.copy_start_time);
    }

    // The handle is kept until the move succeeds so a failed move is
    // retried from the same finished copy next cycle.
    move_into(run.path(), config_.subdir_completed());
    run.copy_proc.reset();
    run.phase = RunPhase::Completed;

    mark_remote_complete(run.name);

    autocopy_log(fmt::format("Finished copying run {}", run.name));
    registry_.remove(run);

    mailer_.send(messages::copy_complete(report));
}

void TerminalHandler::abort(MonitoredRun& run) {
    std::string name = run.name;
    fs::path source = run.path();
    fs::path dest = move_into(source, config_.subdir_aborted());
    run.phase = RunPhase::Aborted;
    registry_.remove(run);

    try {
        oracle_.mark_sequencing_failed(name);
    } catch (const OracleError& e) {
        autocopy_log(fmt::format("Could not flag run {} as sequencing failed: {}", name, e.what()));
    }

    mailer_.send(messages::run_aborted(name, source.string(), dest.string(),
                                       config_.subdir_aborted()));
}

fs::path TerminalHandler::abort_untracked(const fs::path& run_path) {
    fs::path dest = move_into(run_path, config_.subdir_aborted());
    mailer_.send(messages::run_aborted(run_path.filename().string(), run_path.string(),
                                       dest.string(), config_.subdir_aborted()));
    return dest;
}

// ── Startup ─────────────────────────────────────────────────

void TerminalHandler::leave_readme(const fs::path& dir) const {
    fs::path readme = dir / SUBDIR_README;
    if (fs::exists(readme)) return;
    std::ofstream out(readme);
    if (!out) {
        autocopy_log("Could not write " + readme.string());
        return;
    }
    out << SUBDIR_README_TEXT;
}

static void make_dir_0775(const fs::path& dir) {
    if (fs::exists(dir)) return;
    fs::create_directories(dir);
    fs::permissions(dir, fs::perms::owner_all | fs::perms::group_all |
                         fs::perms::others_read | fs::perms::others_exec);
}

void TerminalHandler::prepare_run_root(const fs::path& root) const {
    make_dir_0775(root);
    for (const auto& subdir : {config_.subdir_completed(), config_.subdir_aborted()}) {
        fs::path dir = root / subdir;
        make_dir_0775(dir);
        leave_readme(dir);
    }
}
