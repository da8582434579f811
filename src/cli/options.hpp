#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

struct DaemonOptions {
    std::string log_file;       // "-" = stdout, "" = <log_dir>/autocopy_<YYMMDD>.log
    std::string config_file;    // "" = default location
    bool no_copy = false;
    bool no_lims = false;
    bool no_email = false;
    bool test_mode_lims = false;
    bool show_help = false;
    bool show_version = false;
};

// Parse argv (without argv[0]). Unknown or stray arguments are an error.
Result<DaemonOptions> parse_daemon_options(const std::vector<std::string>& args);

std::string daemon_usage();

struct ArchiveOptions {
    std::string dest_dir;       // "" = each run's parent directory
    bool include_cif = false;
    bool skip_file_check = false;
    bool delete_after = false;
    bool verbose = false;
    bool show_help = false;
    std::vector<std::string> run_dirs;
};

Result<ArchiveOptions> parse_archive_options(const std::vector<std::string>& args);

std::string archive_usage();
