#include "transfer_backend.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <stdexcept>

void ChildTransferProcess::kill() {
    handle_.terminate(TERMINATE_GRACE_MS);
}

std::unique_ptr<TransferProcess> RsyncBackend::launch(const std::string& program,
                                                      const std::vector<std::string>& args) {
    auto handle = platform::spawn(program, args, output_log_);
    if (!handle.valid()) {
        throw std::runtime_error("Failed to start " + program);
    }
    autocopy_log(fmt::format("Started {} (pid {})", program, handle.pid()));
    return std::make_unique<ChildTransferProcess>(std::move(handle));
}
