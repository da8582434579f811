#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <platform/process.hpp>

// A running copy. poll() never blocks.
class TransferProcess {
public:
    virtual ~TransferProcess() = default;

    // Exit code once finished, nullopt while running.
    virtual std::optional<int> poll() = 0;
    // SIGTERM, then SIGKILL after a grace period. Reaps the child.
    virtual void kill() = 0;
    virtual int pid() const = 0;
};

class TransferBackend {
public:
    virtual ~TransferBackend() = default;
    // Throws std::runtime_error if the process cannot be started.
    virtual std::unique_ptr<TransferProcess> launch(const std::string& program,
                                                    const std::vector<std::string>& args) = 0;
};

class ChildTransferProcess : public TransferProcess {
public:
    explicit ChildTransferProcess(platform::ProcessHandle handle) : handle_(std::move(handle)) {}

    std::optional<int> poll() override { return handle_.try_wait(); }
    void kill() override;
    int pid() const override { return handle_.pid(); }

private:
    platform::ProcessHandle handle_;
};

// Spawns the copy program as a child of the daemon. Its stdout and
// stderr are appended to output_log ("" leaves them on the daemon's stdout).
class RsyncBackend : public TransferBackend {
public:
    explicit RsyncBackend(std::string output_log) : output_log_(std::move(output_log)) {}

    std::unique_ptr<TransferProcess> launch(const std::string& program,
                                            const std::vector<std::string>& args) override;

private:
    std::string output_log_;
};
