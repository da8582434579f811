#include "signals.hpp"
#include <csignal>
#include <cstring>

namespace platform {

static volatile std::sig_atomic_t g_shutdown = 0;
static volatile std::sig_atomic_t g_summary = 0;

extern "C" void on_shutdown_signal(int) { g_shutdown = 1; }
extern "C" void on_summary_signal(int) { g_summary = 1; }

static void install(int sig, void (*handler)(int)) {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sigaction(sig, &sa, nullptr);
}

void install_signal_handlers() {
    install(SIGTERM, on_shutdown_signal);
    install(SIGINT, on_shutdown_signal);
    install(SIGUSR1, on_summary_signal);
}

bool shutdown_requested() {
    return g_shutdown != 0;
}

bool take_summary_request() {
    if (!g_summary) return false;
    g_summary = 0;
    return true;
}

void request_shutdown() { g_shutdown = 1; }
void request_summary() { g_summary = 1; }

void reset_signal_flags() {
    g_shutdown = 0;
    g_summary = 0;
}

} // namespace platform
