#include "run_registry.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <notify/messages.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <regex>

RunRegistry::RunRegistry(const Config& config, StatusOracle& oracle, Mailer& mailer)
    : config_(config), oracle_(oracle), mailer_(mailer) {}

bool RunRegistry::is_run_dir_name(const std::string& name) {
    static const std::regex pattern(RUNDIR_NAME_PATTERN);
    return std::regex_match(name, pattern);
}

Result<std::vector<std::string>> RunRegistry::scan_root(const fs::path& root) const {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(root, ec), end;
    if (ec) {
        return Result<std::vector<std::string>>::Err(
            fmt::format("Cannot scan run root {}: {}", root.string(), ec.message()));
    }
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return Result<std::vector<std::string>>::Err(
                fmt::format("Error scanning run root {}: {}", root.string(), ec.message()));
        }
        std::string name = it->path().filename().string();
        std::error_code stat_ec;
        if (it->is_directory(stat_ec) && is_run_dir_name(name)) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return Result<std::vector<std::string>>::Ok(std::move(names));
}

bool RunRegistry::admit_new_run(const std::string& name) {
    try {
        RunRecord record = oracle_.query(name);
        if (record.sequencing_failed()) return false;
    } catch (const RunNotFoundError&) {
        autocopy_log(fmt::format(
            "Run {} not found in LIMS; perhaps it just wasn't entered yet. Monitoring anyway.", name));
    } catch (const OracleError& e) {
        autocopy_log(fmt::format("Encountered an error accessing the LIMS: {}", e.what()));
    }
    return true;
}

void RunRegistry::handle_missing(MonitoredRun& run) {
    if (run.copy_proc) {
        autocopy_log(fmt::format("Stopping copy of vanished run {} (pid {})",
                                 run.name, run.copy_proc->pid()));
        run.copy_proc->kill();
        run.copy_proc.reset();
    }
    autocopy_log(fmt::format("Run {} is no longer on disk under {}; no longer monitoring it",
                             run.name, run.root.string()));
    if (config_.missing_run_policy() == MissingRunPolicy::Notify) {
        mailer_.send(messages::missing_run(run.name, run.path().string(), mailer_.hostname()));
    }
}

ReconcileResult RunRegistry::reconcile() {
    ReconcileResult result;
    std::vector<std::unique_ptr<MonitoredRun>> next;

    for (const auto& root : config_.source_run_roots()) {
        auto scan = scan_root(root);
        if (scan.is_err()) {
            // Unreadable this cycle: carry the root's runs over untouched
            autocopy_log(scan.error);
            for (auto& r : runs_) {
                if (r && r->root == root) next.push_back(std::move(r));
            }
            continue;
        }
        for (const auto& name : scan.value) {
            auto it = std::find_if(runs_.begin(), runs_.end(), [&](const auto& r) {
                return r && r->root == root && r->name == name;
            });
            if (it != runs_.end()) {
                next.push_back(std::move(*it));
                continue;
            }
            // Already picked up through a duplicate root entry
            bool seen = std::any_of(next.begin(), next.end(), [&](const auto& r) {
                return r->root == root && r->name == name;
            });
            if (seen) continue;

            if (admit_new_run(name)) {
                autocopy_log(fmt::format("Now monitoring run {}", name));
                next.push_back(std::make_unique<MonitoredRun>(root, name));
            } else {
                result.abort_candidates.push_back(root / name);
            }
        }
    }

    for (auto& old : runs_) {
        if (!old) continue;
        result.dropped.push_back(old->name);
        handle_missing(*old);
    }

    runs_ = std::move(next);
    return result;
}

MonitoredRun& RunRegistry::track(const fs::path& root, const std::string& name) {
    if (auto* existing = find(root, name)) return *existing;
    runs_.push_back(std::make_unique<MonitoredRun>(root, name));
    return *runs_.back();
}

MonitoredRun* RunRegistry::find(const fs::path& root, const std::string& name) {
    for (auto& r : runs_) {
        if (r->root == root && r->name == name) return r.get();
    }
    return nullptr;
}

std::vector<MonitoredRun*> RunRegistry::runs() const {
    std::vector<MonitoredRun*> out;
    out.reserve(runs_.size());
    for (const auto& r : runs_) out.push_back(r.get());
    return out;
}

std::vector<MonitoredRun*> RunRegistry::runs_in(const fs::path& root) const {
    std::vector<MonitoredRun*> out;
    for (const auto& r : runs_) {
        if (r->root == root) out.push_back(r.get());
    }
    return out;
}

int RunRegistry::copying_count() const {
    return static_cast<int>(std::count_if(runs_.begin(), runs_.end(),
                                          [](const auto& r) { return r->is_copying(); }));
}

void RunRegistry::remove(const MonitoredRun& run) {
    runs_.erase(std::remove_if(runs_.begin(), runs_.end(),
                               [&](const auto& r) { return r.get() == &run; }),
                runs_.end());
}
