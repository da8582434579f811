#pragma once

#include <string>
#include <vector>
#include <optional>

namespace platform {

// Handle to a spawned child process. Destroying the handle does not
// signal or reap the child; a running child simply outlives it.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Non-blocking exit check. Returns the exit code once the child has
    // been reaped (128 + signal number if it was killed), nullopt while
    // it is still running. The status is cached after the first reap.
    std::optional<int> try_wait();

    // True if the process is still running.
    bool running() { return valid() && !try_wait().has_value(); }

    // SIGTERM, then SIGKILL if the child is still alive after grace_ms.
    // Always reaps the child.
    void terminate(int grace_ms);

    int pid() const { return pid_; }

private:
    int pid_ = -1;
    std::optional<int> exit_code_;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& output_log);
};

// Spawn a child process with stdin closed.
// output_log: if non-empty, append the child's stdout and stderr to this file.
// Returns an invalid handle if fork() fails.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& output_log = "");

} // namespace platform
