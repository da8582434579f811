#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <regex>
#include <set>
#include <cstdlib>

namespace fs = std::filesystem;

// ── Validation helpers ────────────────────────────────────────

static const std::set<std::string> VALID_KEYS{
    "source_run_roots", "dest", "email", "smtp", "lims",
    "max_copy_processes", "min_free_space",
    "main_loop_delay_seconds", "freespace_check_delay_seconds",
    "summary_delay_seconds", "seconds_before_copy_restart",
    "log_dir", "subdir_completed", "subdir_aborted", "missing_run_policy",
};

bool is_cmdline_safe(const std::string& value) {
    static const std::regex safe("^[0-9a-zA-Z./_~-]*$");
    return std::regex_match(value, safe);
}

static std::string join_keys(const std::set<std::string>& keys) {
    std::string out;
    for (const auto& k : keys) {
        if (!out.empty()) out += ", ";
        out += k;
    }
    return out;
}

static int read_non_negative(const YAML::Node& node, const std::string& key, int fallback) {
    if (!node) return fallback;
    if (!node.IsScalar()) {
        throw std::runtime_error(fmt::format("Invalid value for config key {}. An integer is required.", key));
    }
    int value = node.as<int>();
    if (value < 0) {
        throw std::runtime_error(fmt::format("Invalid value {} for config key {}. Must be >= 0.", value, key));
    }
    return value;
}

static std::string read_string(const YAML::Node& node, const std::string& key,
                               const std::string& fallback) {
    if (!node) return fallback;
    if (!node.IsScalar()) {
        throw std::runtime_error(fmt::format("Invalid value for config key {}. A string is required.", key));
    }
    return node.as<std::string>();
}

static std::string read_safe_string(const YAML::Node& node, const std::string& key,
                                    const std::string& fallback) {
    std::string value = read_string(node, key, fallback);
    if (!is_cmdline_safe(value)) {
        throw std::runtime_error(fmt::format(
            "Invalid value {} for config key {}. Must match ^[0-9a-zA-Z./_~-]*$", value, key));
    }
    return value;
}

// ── Section parsers ───────────────────────────────────────────

static DestConfig parse_dest_config(const YAML::Node& node) {
    DestConfig dest;
    dest.user = platform::current_user();
    dest.group = platform::current_group();
    if (!node) return dest;
    if (!node.IsMap()) throw std::runtime_error("Config key dest must be a map");

    dest.host = read_safe_string(node["host"], "dest.host", dest.host);
    dest.user = read_safe_string(node["user"], "dest.user", dest.user);
    dest.group = read_safe_string(node["group"], "dest.group", dest.group);
    dest.run_root = read_safe_string(node["run_root"], "dest.run_root", dest.run_root);
    dest.port = read_non_negative(node["port"], "dest.port", dest.port);
    dest.timeout = read_non_negative(node["timeout"], "dest.timeout", dest.timeout);
    if (node["ssh_key_path"]) {
        dest.ssh_key_path = read_string(node["ssh_key_path"], "dest.ssh_key_path", "");
    }
    return dest;
}

static EmailConfig parse_email_config(const YAML::Node& node) {
    EmailConfig email;
    if (!node) return email;
    email.from = read_string(node["from"], "email.from", "");

    // `to` accepts a single address or a list
    const auto& to = node["to"];
    if (to && to.IsSequence()) {
        for (const auto& addr : to) {
            if (!email.to.empty()) email.to += ",";
            email.to += addr.as<std::string>();
        }
    } else {
        email.to = read_string(to, "email.to", "");
    }
    return email;
}

static SmtpConfig parse_smtp_config(const YAML::Node& node) {
    SmtpConfig smtp;
    if (!node) return smtp;
    smtp.server = read_string(node["server"], "smtp.server", "");
    smtp.port = read_non_negative(node["port"], "smtp.port", 0);
    smtp.username = read_string(node["username"], "smtp.username", "");
    smtp.token = read_string(node["token"], "smtp.token", "");
    return smtp;
}

static LimsConfig parse_lims_config(const YAML::Node& node) {
    LimsConfig lims;
    if (!node) return lims;
    lims.url = read_string(node["url"], "lims.url", "");
    lims.token = read_string(node["token"], "lims.token", "");
    lims.api_version = read_string(node["api_version"], "lims.api_version", lims.api_version);
    lims.local_data = read_string(node["local_data"], "lims.local_data", "");
    return lims;
}

static MissingRunPolicy parse_missing_run_policy(const YAML::Node& node) {
    std::string value = read_string(node, "missing_run_policy", "forget");
    if (value == "forget") return MissingRunPolicy::Forget;
    if (value == "notify") return MissingRunPolicy::Notify;
    throw std::runtime_error(fmt::format(
        "Invalid value {} for config key missing_run_policy. Use forget or notify.", value));
}

// ── Config ────────────────────────────────────────────────────

Config::Config()
    : source_run_roots_{fs::current_path()},
      max_copy_processes_(DEFAULT_MAX_COPY_PROCESSES),
      min_free_space_(DEFAULT_MIN_FREE_SPACE),
      log_dir_(DEFAULT_LOG_DIR),
      subdir_completed_(SUBDIR_COMPLETED),
      subdir_aborted_(SUBDIR_ABORTED) {
    dest_.user = platform::current_user();
    dest_.group = platform::current_group();
}

Config Config::defaults() {
    Config config;
    config.apply_environment();
    return config;
}

Config Config::with_copies_disabled() const {
    Config copy = *this;
    copy.max_copy_processes_ = 0;
    return copy;
}

// Env variables fill in whatever the file left unset.
void Config::apply_environment() {
    auto env = [](const char* name) -> std::string {
        const char* v = std::getenv(name);
        return v ? std::string(v) : std::string();
    };

    if (smtp_.server.empty()) smtp_.server = env("AUTOCOPY_SMTP_SERVER");
    if (smtp_.port == 0) {
        std::string port = env("AUTOCOPY_SMTP_PORT");
        if (!port.empty()) {
            try { smtp_.port = std::stoi(port); } catch (const std::exception&) { smtp_.port = 0; }
        }
    }
    if (smtp_.username.empty()) smtp_.username = env("AUTOCOPY_SMTP_USERNAME");
    if (smtp_.token.empty()) smtp_.token = env("AUTOCOPY_SMTP_TOKEN");
    if (lims_.url.empty()) lims_.url = env("UHTS_LIMS_URL");
    if (lims_.token.empty()) lims_.token = env("UHTS_LIMS_TOKEN");
}

Result<Config> Config::from_node(const YAML::Node& root) {
    try {
        Config config;

        if (root && !root.IsNull()) {
            if (!root.IsMap()) {
                return Result<Config>::Err("Config must be a YAML map");
            }
            for (const auto& kv : root) {
                std::string key = kv.first.as<std::string>();
                if (VALID_KEYS.count(key) == 0) {
                    return Result<Config>::Err(fmt::format(
                        "Config contains invalid key {}. Valid keys are {}", key, join_keys(VALID_KEYS)));
                }
            }

            if (root["source_run_roots"]) {
                const auto& roots = root["source_run_roots"];
                if (!roots.IsSequence()) {
                    return Result<Config>::Err(
                        "Invalid value for config key source_run_roots. A list is required.");
                }
                config.source_run_roots_.clear();
                for (const auto& r : roots) {
                    config.source_run_roots_.push_back(fs::absolute(r.as<std::string>()));
                }
            }

            config.dest_ = parse_dest_config(root["dest"]);
            config.email_ = parse_email_config(root["email"]);
            config.smtp_ = parse_smtp_config(root["smtp"]);
            config.lims_ = parse_lims_config(root["lims"]);

            config.max_copy_processes_ = read_non_negative(
                root["max_copy_processes"], "max_copy_processes", config.max_copy_processes_);
            if (root["min_free_space"]) {
                config.min_free_space_ = root["min_free_space"].as<int64_t>();
                if (config.min_free_space_ < 0) {
                    return Result<Config>::Err("Invalid value for config key min_free_space. Must be >= 0.");
                }
            }

            auto& iv = config.intervals_;
            iv.main_loop_delay_seconds = read_non_negative(
                root["main_loop_delay_seconds"], "main_loop_delay_seconds", iv.main_loop_delay_seconds);
            iv.freespace_check_delay_seconds = read_non_negative(
                root["freespace_check_delay_seconds"], "freespace_check_delay_seconds",
                iv.freespace_check_delay_seconds);
            iv.summary_delay_seconds = read_non_negative(
                root["summary_delay_seconds"], "summary_delay_seconds", iv.summary_delay_seconds);
            iv.seconds_before_copy_restart = read_non_negative(
                root["seconds_before_copy_restart"], "seconds_before_copy_restart",
                iv.seconds_before_copy_restart);

            config.log_dir_ = read_string(root["log_dir"], "log_dir", config.log_dir_.string());
            config.subdir_completed_ = read_safe_string(
                root["subdir_completed"], "subdir_completed", config.subdir_completed_);
            config.subdir_aborted_ = read_safe_string(
                root["subdir_aborted"], "subdir_aborted", config.subdir_aborted_);
            config.missing_run_policy_ = parse_missing_run_policy(root["missing_run_policy"]);
        }

        config.apply_environment();
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }
    try {
        return from_node(YAML::LoadFile(path.string()));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return from_node(YAML::Load(yaml_text));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

fs::path find_default_config() {
    fs::path p(DEFAULT_CONFIG_PATH);
    return fs::exists(p) ? p : fs::path();
}
