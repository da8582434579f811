#include "file_oracle.hpp"
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

FileOracle::FileOracle(std::filesystem::path path) : path_(std::move(path)) {}

RunRecord FileOracle::query(const std::string& run_name) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path_.string());
    } catch (const YAML::Exception& e) {
        throw OracleError(fmt::format("Cannot read LIMS data file {}: {}", path_.string(), e.what()));
    }

    if (!root.IsMap() || !root[run_name]) {
        throw RunNotFoundError(run_name);
    }
    return run_record_from_node(run_name, root[run_name]);
}

void FileOracle::mark_sequencing_failed(const std::string& run_name) {
    flag_updates_.push_back("sequencing_failed " + run_name);
    autocopy_log("LIMS (local): set sequencing_failed on run " + run_name);
}

void FileOracle::mark_analysis_started(const std::string& run_name) {
    flag_updates_.push_back("analysis_started " + run_name);
    autocopy_log("LIMS (local): set analysis_started on run " + run_name);
}
