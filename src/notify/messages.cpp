#include "messages.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>

namespace messages {

Email daemon_started() {
    return {"Daemon Started",
            "The Autocopy Daemon was started.\n\n"
            "You should receive a message with a summary of active run directories soon.\n"};
}

Email daemon_stopped() {
    return {"Daemon Stopped",
            "The Autocopy Daemon received a kill signal and is shutting down.\n\n"};
}

Email unknown_exception(const std::string& what) {
    return {"Autocopy unknown exception",
            "The autocopy daemon failed with Exception\n" + what + "\n"};
}

Email run_aborted(const std::string& run_name, const std::string& run_path,
                  const std::string& dest_path, const std::string& subdir_aborted) {
    std::string body;
    body += "The following run was flagged as 'sequencing failed' in the LIMS:\n\n";
    body += fmt::format("\t{}\n\n", run_name);
    body += fmt::format("Original Location:\t{}\n", run_path);
    body += fmt::format("It has been moved to this directory:\t{}\n\n", dest_path);
    body += fmt::format("If this was an error, please correct the sequencing status in the LIMS "
                        "and manually move the run out of the {} folder.\n\n", subdir_aborted);
    body += "Otherwise, this run may be safely deleted to free up disk space.\n";
    return {"Run Directory Aborted: " + run_name, body};
}

Email copy_failed(const std::string& run_name, const std::string& run_path,
                  const std::string& hostname, const std::string& dest_host,
                  const std::string& dest_run_root, int exit_code) {
    std::string body;
    body += "Please try to resolve the error. Autocopy will continue attempting to copy "
            "as long as the run remains in the run_root directory.\n\n";
    body += fmt::format("Run:\t\t\t{}\n", run_name);
    body += fmt::format("Original Location:\t{}:{}\n", hostname, run_path);
    body += "\n";
    body += fmt::format("FAILED TO COPY to:\t{}:{}/{}\n", dest_host, dest_run_root, run_name);
    body += fmt::format("Return code:\t{}\n", exit_code);
    return {"ERROR COPYING Run Dir " + run_name, body};
}

std::string format_disk_usage(int64_t bytes) {
    double gb = static_cast<double>(bytes) / ONEGIG;
    if (gb > ONEKILO) return fmt::format("{:.1f} TB", gb / ONEKILO);
    return fmt::format("{:.1f} GB", gb);
}

Email copy_complete(const CompletionReport& r) {
    std::string subject = fmt::format("Finished copying run dir {}", r.run_name);
    if (r.has_problems()) subject = "Problems found. " + subject;

    std::string body = fmt::format("Finished copying run {}\n\n", r.run_name);
    if (r.files_missing) {
        body += "*** RUN HAS MISSING FILES ***\n\n";
    }
    if (!r.discrepancies.empty()) {
        body += fmt::format("{}: *** RUN HAS INCONSISTENCIES WITH LIMS\n\n", r.run_name);
        body += "Check the problems below and correct any errors in the LIMS:\n\n";
        for (const auto& problem : r.discrepancies) body += problem + "\n";
        body += "\n";
    }

    std::string cycles;
    for (int c : r.cycle_list) {
        if (!cycles.empty()) cycles += " ";
        cycles += std::to_string(c);
    }

    body += fmt::format("Run:\t\t\t{}\n", r.run_name);
    body += fmt::format("NEW LOCATION:\t\t{}:{}/{}\n", r.dest_host, r.dest_run_root, r.run_name);
    body += fmt::format("Original Location:\t{}:{}\n", r.hostname, r.original_path);
    body += "\n";
    body += fmt::format("Read count:\t\t{}\n", r.read_count);
    body += fmt::format("Cycles:\t\t\t{}\n", cycles);
    body += "\n";
    body += fmt::format("Copy time:\t\t{}\n", format_duration(r.copy_duration));
    body += fmt::format("Disk usage:\t\t{}\n", format_disk_usage(r.disk_usage_bytes));
    return {subject, body};
}

Email missing_run(const std::string& run_name, const std::string& run_path,
                  const std::string& hostname) {
    std::string body;
    body += fmt::format("MISSING RUN:\t{}\n", run_name);
    body += fmt::format("Location:\t{}:{}\n\n", hostname, run_path);
    body += "Autocopy was tracking this run, but can no longer find it on disk.\n";
    return {"Missing Run Dir " + run_name, body};
}

Email low_free_space(const std::string& root, int64_t free_bytes, int64_t min_free_bytes) {
    std::string body;
    body += fmt::format("The following run root directory:\n\n {}\n\n", root);
    body += fmt::format("has {:.1f} GB remaining.\n\n", static_cast<double>(free_bytes) / ONEGIG);
    body += fmt::format("A warning is sent when free space is less than {:.1f} GB\n",
                        static_cast<double>(min_free_bytes) / ONEGIG);
    return {"Insufficient free space in " + root, body};
}

Email status_summary(const std::vector<RootSummary>& roots) {
    std::string body;
    for (const auto& root : roots) {
        body += root.root + "\n\n";
        for (const auto& run : root.runs) {
            body += fmt::format("{}\t{}\n", run.first, run.second);
        }
        body += "\n";
        body += fmt::format("\t{:.1f} GB free\n\n", static_cast<double>(root.free_bytes) / ONEGIG);
    }
    return {"Run status summary", body};
}

Email run_not_found_in_lims(const std::string& run_name) {
    return {"Run not found in LIMS " + run_name,
            fmt::format("Autocopy could not find run {} in the LIMS.\n"
                        "Autocopy will proceed with the copy anyway.\n", run_name)};
}

Email copy_restarted(const std::string& run_name, int seconds_before_restart) {
    std::string body;
    body += fmt::format("The copy process for run {} was in progress for longer than {:.1f} hours.\n",
                        run_name, seconds_before_restart / 3600.0);
    body += "Just in case this was a stalled process, autocopy killed and restarted the rsync.\n";
    body += "The copy should resume where it left off.\n";
    body += "If you see this email again, you may need to troubleshoot.\n";
    return {"Stalled copy suspected. Restarted run " + run_name, body};
}

} // namespace messages
