#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>

namespace platform {

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() = default;

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.exit_code_.reset();
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.exit_code_.reset();
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

std::optional<int> ProcessHandle::try_wait() {
    if (exit_code_) return exit_code_;
    if (pid_ <= 0) return std::nullopt;

    int status = 0;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        exit_code_ = decode_status(status);
    } else if (ret < 0) {
        // Reaped elsewhere or not our child; nothing left to wait for.
        exit_code_ = -1;
    }
    return exit_code_;
}

void ProcessHandle::terminate(int grace_ms) {
    if (pid_ <= 0 || exit_code_) return;
    kill(pid_, SIGTERM);
    for (int waited = 0; waited < grace_ms; waited += 100) {
        if (try_wait()) return;
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    int status = 0;
    if (waitpid(pid_, &status, 0) == pid_) {
        exit_code_ = decode_status(status);
    } else {
        exit_code_ = -1;
    }
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& output_log) {
    ProcessHandle handle;

    // Build argv before forking; only async-signal-safe calls in the child.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child process
        close(STDIN_FILENO);

        if (!output_log.empty()) {
            int fd = open(output_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDOUT_FILENO);
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        // Detach from the daemon's process group so a terminal ^C
        // does not reach in-flight copies.
        setpgid(0, 0);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    return handle;
}

} // namespace platform
