#include "run_evidence.hpp"
#include <core/constants.hpp>
#include <fstream>
#include <sstream>
#include <regex>
#include <cctype>

static std::string read_text_file(const fs::path& p) {
    std::ifstream in(p);
    if (!in) return "";
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static std::string attribute(const std::string& attrs, const std::string& name) {
    std::regex re(name + "\\s*=\\s*\"([^\"]*)\"");
    std::smatch m;
    if (std::regex_search(attrs, m, re)) return m[1].str();
    return "";
}

std::vector<ReadSpec> parse_run_info_reads(const std::string& xml) {
    std::vector<ReadSpec> reads;
    static const std::regex read_re("<Read\\s+([^>]*?)/?>");
    for (auto it = std::sregex_iterator(xml.begin(), xml.end(), read_re);
         it != std::sregex_iterator(); ++it) {
        std::string attrs = (*it)[1].str();
        std::string cycles = attribute(attrs, "NumCycles");
        if (cycles.empty()) continue;
        ReadSpec r;
        try {
            r.num_cycles = std::stoi(cycles);
        } catch (const std::exception&) {
            continue;
        }
        r.is_index = attribute(attrs, "IsIndexedRead") == "Y";
        reads.push_back(r);
    }
    return reads;
}

std::string xml_element_text(const std::string& xml, const std::string& element) {
    std::regex re("<" + element + ">\\s*([^<]*?)\\s*</" + element + ">");
    std::smatch m;
    if (std::regex_search(xml, m, re)) return m[1].str();
    return "";
}

std::string application_initials(const std::string& application_name) {
    std::string initials;
    std::istringstream words(application_name);
    std::string word;
    while (words >> word) {
        initials += static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
    }
    return initials;
}

// ── RunDirEvidence ──────────────────────────────────────────

RunDirEvidence::RunDirEvidence(fs::path run_path) : path_(std::move(run_path)) {
    std::string run_info = read_text_file(path_ / RUN_INFO_FILE);
    if (!run_info.empty()) {
        instrument_ = xml_element_text(run_info, "Instrument");
        reads_ = parse_run_info_reads(run_info);
    }

    std::string params = read_text_file(run_parameters_path());
    if (!params.empty()) {
        application_name_ = xml_element_text(params, "ApplicationName");
        application_version_ = xml_element_text(params, "ApplicationVersion");
    }
}

fs::path RunDirEvidence::run_parameters_path() const {
    fs::path p = path_ / RUN_PARAMETERS_FILE;
    if (fs::exists(p)) return p;
    return path_ / RUN_PARAMETERS_FILE_ALT;
}

bool RunDirEvidence::is_finished() const {
    return fs::exists(path_ / FINISHED_FLAG_FILE);
}

bool RunDirEvidence::is_known_layout() const {
    return fs::exists(path_ / RUN_INFO_FILE);
}

bool RunDirEvidence::validate_files() const {
    return fs::is_regular_file(path_ / RUN_INFO_FILE)
        && fs::is_regular_file(run_parameters_path())
        && fs::is_directory(path_ / BASECALLS_SUBDIR)
        && is_finished();
}

std::string RunDirEvidence::machine() const {
    if (!instrument_.empty()) return instrument_;
    // 200101_MACHINE1_0001_FLOWCELL
    std::string name = path_.filename().string();
    auto first = name.find('_');
    if (first == std::string::npos) return "";
    auto second = name.find('_', first + 1);
    return name.substr(first + 1, second == std::string::npos ? std::string::npos
                                                              : second - first - 1);
}

std::string RunDirEvidence::control_software_version() const {
    if (application_name_.empty() && application_version_.empty()) return "";
    return application_initials(application_name_) + " " + application_version_;
}

std::vector<int> RunDirEvidence::data_read_cycles() const {
    std::vector<int> cycles;
    for (const auto& r : reads_) {
        if (!r.is_index) cycles.push_back(r.num_cycles);
    }
    return cycles;
}

bool RunDirEvidence::is_paired_end() const {
    return data_read_cycles().size() >= 2;
}

int RunDirEvidence::read1_cycles() const {
    auto cycles = data_read_cycles();
    return cycles.empty() ? 0 : cycles[0];
}

int RunDirEvidence::read2_cycles() const {
    auto cycles = data_read_cycles();
    return cycles.size() < 2 ? 0 : cycles[1];
}

bool RunDirEvidence::has_index_read() const {
    for (const auto& r : reads_) {
        if (r.is_index) return true;
    }
    return false;
}

int RunDirEvidence::read_count() const {
    return static_cast<int>(reads_.size());
}

std::vector<int> RunDirEvidence::cycle_list() const {
    std::vector<int> cycles;
    for (const auto& r : reads_) cycles.push_back(r.num_cycles);
    return cycles;
}

int64_t RunDirEvidence::disk_usage_bytes() const {
    int64_t total = 0;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(path_, ec), end; !ec && it != end; it.increment(ec)) {
        auto status = it->symlink_status(ec);
        if (!ec && fs::is_regular_file(status)) {
            auto size = it->file_size(ec);
            if (!ec) total += static_cast<int64_t>(size);
        }
        ec.clear();
    }
    return total;
}
