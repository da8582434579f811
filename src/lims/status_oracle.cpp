#include "status_oracle.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>

SequencingStatus parse_sequencing_status(const std::string& text) {
    std::string s = to_lower(text);
    trim(s);
    if (s == "sequencing failed") return SequencingStatus::Failed;
    if (s == "sequencing exception") return SequencingStatus::Exception;
    return SequencingStatus::Normal;
}

template <typename T>
static T field_or(const YAML::Node& node, const char* key, T fallback) {
    const auto& v = node[key];
    if (!v || v.IsNull()) return fallback;
    return v.as<T>();
}

RunRecord run_record_from_node(const std::string& run_name, const YAML::Node& node) {
    if (!node.IsMap()) {
        throw OracleError("Malformed LIMS record for run " + run_name);
    }
    try {
        RunRecord r;
        r.run_name = field_or<std::string>(node, "run_name", run_name);
        r.sequencing_instrument = field_or<std::string>(node, "sequencing_instrument", "");
        r.sequencer_software = field_or<std::string>(node, "sequencer_software", "");
        r.paired_end = field_or<bool>(node, "paired_end", false);
        r.read1_cycles = field_or<int>(node, "read1_cycles", 0);
        r.read2_cycles = field_or<int>(node, "read2_cycles", 0);
        r.has_index_read = field_or<bool>(node, "has_index_read", false);
        r.status = parse_sequencing_status(field_or<std::string>(node, "sequencing_status", ""));
        return r;
    } catch (const YAML::Exception& e) {
        throw OracleError("Malformed LIMS record for run " + run_name + ": " + e.what());
    }
}

// ── NullOracle ──────────────────────────────────────────────

RunRecord NullOracle::query(const std::string& run_name) {
    throw RunNotFoundError(run_name);
}

void NullOracle::mark_sequencing_failed(const std::string& run_name) {
    autocopy_log("LIMS disabled; not flagging " + run_name + " as sequencing failed");
}

void NullOracle::mark_analysis_started(const std::string& run_name) {
    autocopy_log("LIMS disabled; not flagging " + run_name + " as analysis started");
}
