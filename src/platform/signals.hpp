#pragma once

namespace platform {

// Installs SIGTERM/SIGINT (shutdown) and SIGUSR1 (status summary) handlers.
// The handlers only set flags; the control loop polls them.
void install_signal_handlers();

bool shutdown_requested();

// Returns true once per SIGUSR1 received, clearing the flag.
bool take_summary_request();

// Test hooks mirroring what the handlers do.
void request_shutdown();
void request_summary();
void reset_signal_flags();

} // namespace platform
