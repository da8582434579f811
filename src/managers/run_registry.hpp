#pragma once

#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>
#include <lims/status_oracle.hpp>
#include <notify/mailer.hpp>
#include "monitored_run.hpp"

namespace fs = std::filesystem;

struct ReconcileResult {
    // New directories the LIMS already marks as failed. Not tracked.
    std::vector<fs::path> abort_candidates;
    // Tracked runs that are no longer on disk. Unreadable roots drop nothing.
    std::vector<std::string> dropped;
};

// The set of monitored runs, rebuilt from the configured roots every cycle.
class RunRegistry {
public:
    RunRegistry(const Config& config, StatusOracle& oracle, Mailer& mailer);

    // Scan every root, keep tracked runs still on disk, query the LIMS once
    // for each new one, drop runs that vanished. The new set is committed
    // before returning, so abort candidates can be handled afterwards.
    ReconcileResult reconcile();

    // Start tracking a run in NotReady. Returns the existing entry if already tracked.
    MonitoredRun& track(const fs::path& root, const std::string& name);

    MonitoredRun* find(const fs::path& root, const std::string& name);

    // Snapshot of tracked runs, safe to iterate while calling remove().
    std::vector<MonitoredRun*> runs() const;
    std::vector<MonitoredRun*> runs_in(const fs::path& root) const;

    int copying_count() const;
    size_t size() const { return runs_.size(); }

    // Destroys the entry. `run` must not be used afterwards.
    void remove(const MonitoredRun& run);

    static bool is_run_dir_name(const std::string& name);

private:
    const Config& config_;
    StatusOracle& oracle_;
    Mailer& mailer_;
    std::vector<std::unique_ptr<MonitoredRun>> runs_;

    Result<std::vector<std::string>> scan_root(const fs::path& root) const;
    // False if the LIMS marks the run as failed.
    bool admit_new_run(const std::string& name);
    // Stops and reaps a copy still running for the vanished run.
    void handle_missing(MonitoredRun& run);
};
