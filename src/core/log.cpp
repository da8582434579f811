#include "log.hpp"
#include "time_utils.hpp"
#include <fmt/format.h>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

struct LogSink {
    std::ofstream file;
    std::string path;   // empty = stdout

    std::ostream& stream() {
        if (path.empty()) return std::cout;
        return file;
    }
};

LogSink& sink() {
    static LogSink s;
    return s;
}

} // namespace

Result<void> set_log_file(const std::string& path, const fs::path& log_dir) {
    auto& s = sink();
    if (s.file.is_open()) s.file.close();

    if (path == "-") {
        s.path.clear();
        return Result<void>::Ok();
    }

    std::string target = path;
    if (target.empty()) {
        std::string day = format_local_time(std::chrono::system_clock::now(), "%y%m%d");
        target = (log_dir / ("autocopy_" + day + ".log")).string();
    }

    std::error_code ec;
    auto parent = fs::path(target).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    s.file.open(target, std::ios::app);
    if (!s.file) {
        s.path.clear();
        return Result<void>::Err("Cannot open log file " + target);
    }
    s.path = target;
    return Result<void>::Ok();
}

std::string log_file_path() {
    return sink().path;
}

void autocopy_log(const std::string& msg) {
    auto& out = sink().stream();
    std::string ts = format_local_time(std::chrono::system_clock::now(), "%Y %b %d %H:%M:%S");

    std::istringstream lines(msg);
    std::string line;
    bool any = false;
    while (std::getline(lines, line)) {
        out << "[" << ts << "] " << line << "\n";
        any = true;
    }
    if (!any) out << "[" << ts << "] \n";
    out.flush();
}

void autocopy_log_ssh(const std::string& label, const std::string& cmd, const SSHResult& r) {
    autocopy_log(fmt::format("{} CMD: {}", label, cmd));
    autocopy_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                             r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        autocopy_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
