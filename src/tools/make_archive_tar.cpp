#include <iostream>
#include <string>
#include <vector>
#include <algorithm>
#include <filesystem>
#include <fmt/format.h>
#include <cli/options.hpp>
#include <core/constants.hpp>
#include <platform/archive.hpp>

namespace fs = std::filesystem;

// Returns false if the run could not be archived.
static bool archive_run(const fs::path& run_dir, const ArchiveOptions& opts) {
    fs::path dest_dir = opts.dest_dir.empty() ? run_dir.parent_path() : fs::path(opts.dest_dir);
    fs::path tar_path = dest_dir / (run_dir.filename().string() + ".tar");

    if (opts.verbose) {
        std::cerr << fmt::format("Archiving {} to {}\n", run_dir.string(), tar_path.string());
    }

    platform::TarOptions tar_opts;
    tar_opts.include_cif = opts.include_cif;
    tar_opts.exclude_dirs = {THUMBNAIL_SUBDIR};

    auto written = platform::create_tar(tar_path, run_dir, tar_opts);
    if (written.is_err()) {
        std::cerr << "make_archive_tar: " << written.error << "\n";
        return false;
    }
    if (opts.verbose) {
        std::cerr << fmt::format("Wrote {} entries\n", written.value.size());
    }

    if (!opts.skip_file_check) {
        auto listed = platform::list_tar(tar_path);
        if (listed.is_err()) {
            std::cerr << "make_archive_tar: " << listed.error << "\n";
            return false;
        }
        auto expected = written.value;
        auto actual = listed.value;
        std::sort(expected.begin(), expected.end());
        std::sort(actual.begin(), actual.end());
        if (expected != actual) {
            std::cerr << fmt::format("make_archive_tar: {} does not match {} ({} entries written, {} read back)\n",
                                     tar_path.string(), run_dir.string(), expected.size(), actual.size());
            return false;
        }
        if (opts.verbose) std::cerr << "Tar file verified\n";
    }

    if (opts.delete_after) {
        std::error_code ec;
        fs::remove_all(run_dir, ec);
        if (ec) {
            std::cerr << fmt::format("make_archive_tar: could not delete {}: {}\n",
                                     run_dir.string(), ec.message());
            return false;
        }
        if (opts.verbose) std::cerr << "Deleted " << run_dir.string() << "\n";
    }
    return true;
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = parse_archive_options(args);
    if (parsed.is_err()) {
        std::cerr << parsed.error << "\n\n" << archive_usage();
        return 1;
    }
    const ArchiveOptions& opts = parsed.value;
    if (opts.show_help) {
        std::cout << archive_usage();
        return 0;
    }
    if (opts.run_dirs.empty()) {
        std::cerr << "make_archive_tar: No run directories given\n";
        return 1;
    }

    int failed = 0;
    for (const auto& arg : opts.run_dirs) {
        fs::path run_dir = fs::absolute(arg).lexically_normal();
        if (run_dir.filename().empty()) run_dir = run_dir.parent_path();

        bool ok = false;
        try {
            ok = archive_run(run_dir, opts);
        } catch (const fs::filesystem_error& e) {
            std::cerr << "make_archive_tar: " << e.what() << "\n";
        }
        if (!ok) {
            std::cerr << "make_archive_tar: " << run_dir.filename().string() << " failed\n";
            failed++;
        }
    }
    return failed;
}
