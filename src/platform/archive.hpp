#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

struct TarOptions {
    bool include_cif = false;                 // keep *.cif intensity files
    std::vector<std::string> exclude_dirs;    // directory names skipped anywhere in the tree
};

// Write run_dir as a ustar archive at tar_path. Entries are stored as
// "<run_dir name>/<relative path>". Returns the entry names written, in order.
Result<std::vector<std::string>> create_tar(const std::filesystem::path& tar_path,
                                            const std::filesystem::path& run_dir,
                                            const TarOptions& options);

// Read back every entry name in tar_path.
Result<std::vector<std::string>> list_tar(const std::filesystem::path& tar_path);

} // namespace platform
