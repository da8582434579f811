#pragma once

#include "mailer.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

struct CompletionReport {
    std::string run_name;
    std::string original_path;     // path before the move into Runs_Completed
    std::string hostname;
    std::string dest_host;
    std::string dest_run_root;
    bool files_missing = false;
    std::vector<std::string> discrepancies;
    int read_count = 0;
    std::vector<int> cycle_list;
    std::chrono::seconds copy_duration{0};
    int64_t disk_usage_bytes = 0;

    bool has_problems() const { return files_missing || !discrepancies.empty(); }
};

struct RootSummary {
    std::string root;
    std::vector<std::pair<std::string, std::string>> runs;   // name, status
    int64_t free_bytes = 0;
};

namespace messages {

Email daemon_started();
Email daemon_stopped();
Email unknown_exception(const std::string& what);
Email run_aborted(const std::string& run_name, const std::string& run_path,
                  const std::string& dest_path, const std::string& subdir_aborted);
Email copy_failed(const std::string& run_name, const std::string& run_path,
                  const std::string& hostname, const std::string& dest_host,
                  const std::string& dest_run_root, int exit_code);
Email copy_complete(const CompletionReport& report);
Email missing_run(const std::string& run_name, const std::string& run_path,
                  const std::string& hostname);
Email low_free_space(const std::string& root, int64_t free_bytes, int64_t min_free_bytes);
Email status_summary(const std::vector<RootSummary>& roots);
Email run_not_found_in_lims(const std::string& run_name);
Email copy_restarted(const std::string& run_name, int seconds_before_restart);

// "12.3 GB", or "1.2 TB" above 1024 GB.
std::string format_disk_usage(int64_t bytes);

} // namespace messages
