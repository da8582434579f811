#include "remote_shell.hpp"
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <chrono>

namespace {

using Clock = std::chrono::steady_clock;

constexpr int SSH_READ_BUF_SIZE = 4096;

// Retry a non-blocking libssh2 call until it stops returning EAGAIN or the deadline passes.
template <typename Fn>
auto retry_eagain(Fn fn, Clock::time_point deadline) -> decltype(fn()) {
    auto rc = fn();
    while (rc == LIBSSH2_ERROR_EAGAIN && Clock::now() < deadline) {
        platform::sleep_ms(10);
        rc = fn();
    }
    return rc;
}

} // namespace

RemoteTarget remote_target_for(const DestConfig& dest) {
    RemoteTarget t;
    t.host = dest.host;
    t.user = dest.user;
    t.private_key_path = dest.ssh_key_path
        ? platform::expand_user(*dest.ssh_key_path).string()
        : (platform::home_dir() / ".ssh" / "id_rsa").string();
    t.port = dest.port;
    t.timeout = dest.timeout;
    return t;
}

SSHRemoteShell::SSHRemoteShell(RemoteTarget target) : target_(std::move(target)) {}

SSHRemoteShell::~SSHRemoteShell() {
    close();
}

SSHResult SSHRemoteShell::run(const std::string& command) {
    auto r = establish();
    if (r.failed()) {
        close();
        return r;
    }
    r = exec(command);
    close();
    return r;
}

SSHResult SSHRemoteShell::establish() {
    auto sock = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000);
    if (sock.is_err()) {
        return SSHResult{-1, "", sock.error};
    }
    sock_ = sock.value;

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return SSHResult{-1, "", "Failed to create SSH session"};
    }
    libssh2_session_set_blocking(session_, 0);

    auto deadline = Clock::now() + std::chrono::seconds(target_.timeout);
    int ret = retry_eagain([&] { return libssh2_session_handshake(session_, sock_); }, deadline);
    if (ret != 0) {
        return SSHResult{-1, "", "SSH handshake with " + target_.host + " failed"};
    }

    return userauth();
}

SSHResult SSHRemoteShell::userauth() {
    auto deadline = Clock::now() + std::chrono::seconds(target_.timeout);
    int ret = retry_eagain([&] {
        return libssh2_userauth_publickey_fromfile(session_, target_.user.c_str(), nullptr,
                                                   target_.private_key_path.c_str(), nullptr);
    }, deadline);
    if (ret != 0) {
        char* msg = nullptr;
        libssh2_session_last_error(session_, &msg, nullptr, 0);
        return SSHResult{-1, "", "Public key authentication as " + target_.user + " failed: " +
                                 std::string(msg ? msg : "unknown error")};
    }
    return SSHResult{0, "", ""};
}

SSHResult SSHRemoteShell::exec(const std::string& command) {
    auto deadline = Clock::now() + std::chrono::seconds(target_.timeout);

    LIBSSH2_CHANNEL* ch = nullptr;
    while (Clock::now() < deadline) {
        ch = libssh2_channel_open_session(session_);
        if (ch || libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(10);
    }
    if (!ch) {
        return SSHResult{-1, "", "Failed to open exec channel"};
    }

    int rc = retry_eagain([&] { return libssh2_channel_exec(ch, command.c_str()); }, deadline);
    if (rc != 0) {
        libssh2_channel_free(ch);
        return SSHResult{-1, "", "Failed to exec command on channel"};
    }

    // Read stdout and stderr until the channel reports EOF
    std::string output;
    std::string stderr_data;
    char buf[SSH_READ_BUF_SIZE];
    bool timed_out = true;
    while (Clock::now() < deadline) {
        ssize_t n = libssh2_channel_read(ch, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
            continue;
        }
        ssize_t m = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
        if (m > 0) {
            stderr_data.append(buf, static_cast<size_t>(m));
            continue;
        }
        if ((n == 0 || n == LIBSSH2_ERROR_EAGAIN) && libssh2_channel_eof(ch)) {
            timed_out = false;
            break;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            timed_out = false;
            break;  // read error
        }
        platform::sleep_ms(10);
    }

    int exit_status = -1;
    rc = retry_eagain([&] { return libssh2_channel_close(ch); },
                      Clock::now() + std::chrono::seconds(5));
    if (rc == 0 && !timed_out) {
        exit_status = libssh2_channel_get_exit_status(ch);
    }
    libssh2_channel_free(ch);

    if (timed_out) {
        return SSHResult{-1, output, "Timed out waiting for: " + command};
    }
    return SSHResult{exit_status, output, stderr_data};
}

void SSHRemoteShell::close() {
    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}
