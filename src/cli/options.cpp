#include "options.hpp"

Result<DaemonOptions> parse_daemon_options(const std::vector<std::string>& args) {
    DaemonOptions opts;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        auto value = [&](std::string& out) -> bool {
            if (i + 1 >= args.size()) return false;
            out = args[++i];
            return true;
        };

        if (arg == "-l" || arg == "--log_file") {
            if (!value(opts.log_file)) return Result<DaemonOptions>::Err(arg + " requires a value");
        } else if (arg == "-g" || arg == "--config") {
            if (!value(opts.config_file)) return Result<DaemonOptions>::Err(arg + " requires a value");
        } else if (arg == "-c" || arg == "--no_copy") {
            opts.no_copy = true;
        } else if (arg == "-m" || arg == "--no_lims") {
            opts.no_lims = true;
        } else if (arg == "-e" || arg == "--no_email") {
            opts.no_email = true;
        } else if (arg == "-d" || arg == "--dry_run") {
            opts.no_copy = opts.no_lims = opts.no_email = true;
        } else if (arg == "-t" || arg == "--test_mode_lims") {
            opts.test_mode_lims = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (arg == "--version") {
            opts.show_version = true;
        } else {
            return Result<DaemonOptions>::Err("Unrecognized argument: " + arg);
        }
    }
    return Result<DaemonOptions>::Ok(opts);
}

std::string daemon_usage() {
    return
        "Usage: autocopy [options]\n"
        "\n"
        "  -l, --log_file <path>    Log file, or - for stdout\n"
        "                           (default <log_dir>/autocopy_<YYMMDD>.log)\n"
        "  -c, --no_copy            Monitor runs but never start a copy\n"
        "  -m, --no_lims            Do not contact the LIMS\n"
        "  -e, --no_email           Log emails instead of sending them\n"
        "  -d, --dry_run            Same as -c -m -e\n"
        "  -g, --config <file>      YAML config (default /etc/autocopy/autocopy.yaml)\n"
        "  -t, --test_mode_lims     Read LIMS records from lims.local_data\n"
        "  -h, --help               Show this help\n"
        "      --version            Show version\n";
}

Result<ArchiveOptions> parse_archive_options(const std::vector<std::string>& args) {
    ArchiveOptions opts;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "-d" || arg == "--destDir") {
            if (i + 1 >= args.size()) return Result<ArchiveOptions>::Err(arg + " requires a value");
            opts.dest_dir = args[++i];
        } else if (arg == "-c" || arg == "--cif") {
            opts.include_cif = true;
        } else if (arg == "-f" || arg == "--skipFileCheck") {
            opts.skip_file_check = true;
        } else if (arg == "-a" || arg == "--deleteAfter") {
            opts.delete_after = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return Result<ArchiveOptions>::Err("Unrecognized option: " + arg);
        } else {
            opts.run_dirs.push_back(arg);
        }
    }
    return Result<ArchiveOptions>::Ok(opts);
}

std::string archive_usage() {
    return
        "Usage: make_archive_tar [options] run_dir+\n"
        "\n"
        "  -d, --destDir <dir>      Where the tar file goes (default: the run's parent)\n"
        "  -c, --cif                Include .cif intensity files\n"
        "  -f, --skipFileCheck      Do not verify the tar after writing it\n"
        "  -a, --deleteAfter        Delete the run directory after a good tar\n"
        "  -v, --verbose            Verbose output\n"
        "  -h, --help               Show this help\n";
}
