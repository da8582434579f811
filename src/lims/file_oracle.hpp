#pragma once

#include "status_oracle.hpp"
#include <filesystem>
#include <string>
#include <vector>

// StatusOracle backed by a local YAML file keyed by run name:
//
//   200101_MACHINE1_0001_FC:
//     sequencing_instrument: MACHINE1
//     sequencing_status: sequencing failed
//
// The file is re-read on every query. Flag updates are recorded in
// memory only. Used by --test_mode_lims.
class FileOracle : public StatusOracle {
public:
    explicit FileOracle(std::filesystem::path path);

    RunRecord query(const std::string& run_name) override;
    void mark_sequencing_failed(const std::string& run_name) override;
    void mark_analysis_started(const std::string& run_name) override;

    // "<action> <run>" in call order.
    const std::vector<std::string>& flag_updates() const { return flag_updates_; }

private:
    std::filesystem::path path_;
    std::vector<std::string> flag_updates_;
};
