#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Configuration structures
struct DestConfig {
    std::string host = "localhost";
    std::string user;
    std::string group;
    std::string run_root = "~/copied_runs";
    std::optional<std::string> ssh_key_path;   // defaults to ~/.ssh/id_rsa
    int port = 22;
    int timeout = 30;
};

struct EmailConfig {
    std::string to;      // comma-separated recipients
    std::string from;
};

struct SmtpConfig {
    std::string server;
    int port = 0;
    std::string username;
    std::string token;

    bool configured() const { return !server.empty() && port > 0; }
};

struct LimsConfig {
    std::string url;
    std::string token;
    std::string api_version = "v1";
    std::string local_data;   // YAML record file used by --test_mode_lims
};

struct LoopIntervals {
    int main_loop_delay_seconds = 600;
    int freespace_check_delay_seconds = 3600;
    int summary_delay_seconds = 3600 * 24;
    int seconds_before_copy_restart = 3600 * 24;
};

// What happens to a tracked run that disappeared from disk between scans.
enum class MissingRunPolicy {
    Forget,   // drop it and log one line
    Notify,   // drop it and mail the operator
};
