#pragma once

#include <string>
#include <stdexcept>

namespace YAML { class Node; }

enum class SequencingStatus {
    Normal,
    Failed,
    Exception,   // copied like Normal
};

// One run as the LIMS knows it.
struct RunRecord {
    std::string run_name;
    std::string sequencing_instrument;
    std::string sequencer_software;
    bool paired_end = false;
    int read1_cycles = 0;
    int read2_cycles = 0;
    bool has_index_read = false;
    SequencingStatus status = SequencingStatus::Normal;

    bool sequencing_failed() const { return status == SequencingStatus::Failed; }
};

// "sequencing failed" -> Failed, "sequencing exception" -> Exception, anything else -> Normal.
SequencingStatus parse_sequencing_status(const std::string& text);

// Build a record from a run_info map (JSON or YAML). Missing fields keep defaults.
RunRecord run_record_from_node(const std::string& run_name, const YAML::Node& node);

class OracleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The LIMS has no entry for the run (HTTP 404). It may simply not be entered yet.
class RunNotFoundError : public OracleError {
public:
    explicit RunNotFoundError(const std::string& run_name)
        : OracleError("Run " + run_name + " not found in LIMS") {}
};

class StatusOracle {
public:
    virtual ~StatusOracle() = default;

    // Throws RunNotFoundError or OracleError.
    virtual RunRecord query(const std::string& run_name) = 0;

    // Status flag updates. Throw OracleError on failure.
    virtual void mark_sequencing_failed(const std::string& run_name) = 0;
    virtual void mark_analysis_started(const std::string& run_name) = 0;
};

// --no_lims: nothing is ever found, flag updates are only logged.
class NullOracle : public StatusOracle {
public:
    RunRecord query(const std::string& run_name) override;
    void mark_sequencing_failed(const std::string& run_name) override;
    void mark_analysis_started(const std::string& run_name) override;
};
