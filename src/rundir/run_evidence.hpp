#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

// Read-only facts about one run directory, as left on disk by the
// instrument. Instances are opened fresh every cycle and never cached.
class RunEvidence {
public:
    virtual ~RunEvidence() = default;

    virtual bool is_finished() const = 0;
    virtual bool is_known_layout() const = 0;
    // All files required downstream are present.
    virtual bool validate_files() const = 0;

    virtual std::string machine() const = 0;
    // e.g. "HCS 2.2.58"
    virtual std::string control_software_version() const = 0;
    virtual bool is_paired_end() const = 0;
    virtual int read1_cycles() const = 0;
    virtual int read2_cycles() const = 0;
    virtual bool has_index_read() const = 0;
    virtual int read_count() const = 0;
    virtual std::vector<int> cycle_list() const = 0;
    virtual int64_t disk_usage_bytes() const = 0;
};

class EvidenceSource {
public:
    virtual ~EvidenceSource() = default;
    virtual std::unique_ptr<RunEvidence> open(const fs::path& run_path) const = 0;
};

struct ReadSpec {
    int num_cycles = 0;
    bool is_index = false;
};

// Evidence read from RunInfo.xml / runParameters.xml inside the directory.
class RunDirEvidence : public RunEvidence {
public:
    explicit RunDirEvidence(fs::path run_path);

    bool is_finished() const override;
    bool is_known_layout() const override;
    bool validate_files() const override;

    std::string machine() const override;
    std::string control_software_version() const override;
    bool is_paired_end() const override;
    int read1_cycles() const override;
    int read2_cycles() const override;
    bool has_index_read() const override;
    int read_count() const override;
    std::vector<int> cycle_list() const override;
    int64_t disk_usage_bytes() const override;

private:
    fs::path path_;
    std::string instrument_;
    std::vector<ReadSpec> reads_;
    std::string application_name_;
    std::string application_version_;

    fs::path run_parameters_path() const;
    std::vector<int> data_read_cycles() const;
};

class RunDirEvidenceSource : public EvidenceSource {
public:
    std::unique_ptr<RunEvidence> open(const fs::path& run_path) const override {
        return std::make_unique<RunDirEvidence>(run_path);
    }
};

// Parsing helpers, exposed for tests.
std::vector<ReadSpec> parse_run_info_reads(const std::string& xml);
std::string xml_element_text(const std::string& xml, const std::string& element);
std::string application_initials(const std::string& application_name);
