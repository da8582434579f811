#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>
#include "types.hpp"

namespace YAML { class Node; }

namespace fs = std::filesystem;

class Config {
public:
    // Load config from a YAML file. A missing file is an error.
    static Result<Config> load(const fs::path& path);

    // Parse config from YAML text (same validation as load()).
    static Result<Config> parse(const std::string& yaml_text);

    // Defaults plus environment overrides, no file.
    static Config defaults();

    // Copy with the concurrency cap forced to 0 (--no_copy).
    Config with_copies_disabled() const;

    // Accessors
    const std::vector<fs::path>& source_run_roots() const { return source_run_roots_; }
    const DestConfig& dest() const { return dest_; }
    const EmailConfig& email() const { return email_; }
    const SmtpConfig& smtp() const { return smtp_; }
    const LimsConfig& lims() const { return lims_; }
    const LoopIntervals& intervals() const { return intervals_; }
    int max_copy_processes() const { return max_copy_processes_; }
    int64_t min_free_space() const { return min_free_space_; }
    const fs::path& log_dir() const { return log_dir_; }
    const std::string& subdir_completed() const { return subdir_completed_; }
    const std::string& subdir_aborted() const { return subdir_aborted_; }
    MissingRunPolicy missing_run_policy() const { return missing_run_policy_; }

    Config();

private:
    std::vector<fs::path> source_run_roots_;
    DestConfig dest_;
    EmailConfig email_;
    SmtpConfig smtp_;
    LimsConfig lims_;
    LoopIntervals intervals_;
    int max_copy_processes_;
    int64_t min_free_space_;
    fs::path log_dir_;
    std::string subdir_completed_;
    std::string subdir_aborted_;
    MissingRunPolicy missing_run_policy_ = MissingRunPolicy::Forget;

    static Result<Config> from_node(const YAML::Node& root);
    void apply_environment();
};

// Returns the default config path if it exists, empty path otherwise.
fs::path find_default_config();

// True if the value is safe to splice into a command line.
bool is_cmdline_safe(const std::string& value);
