#pragma once

#include <string>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Runs a single command on the copy destination host.
class RemoteShell {
public:
    virtual ~RemoteShell() = default;
    virtual SSHResult run(const std::string& command) = 0;
};

struct RemoteTarget {
    std::string host;
    std::string user;
    std::string private_key_path;
    int port = 22;
    int timeout = 30;   // seconds, per phase
};

// RemoteShell over libssh2 with public-key auth. Each run() opens its
// own session and exec channel, and closes both before returning.
class SSHRemoteShell : public RemoteShell {
public:
    explicit SSHRemoteShell(RemoteTarget target);
    ~SSHRemoteShell() override;

    SSHRemoteShell(const SSHRemoteShell&) = delete;
    SSHRemoteShell& operator=(const SSHRemoteShell&) = delete;

    SSHResult run(const std::string& command) override;

private:
    RemoteTarget target_;
    LIBSSH2_SESSION* session_ = nullptr;
    int sock_ = -1;

    SSHResult establish();
    SSHResult userauth();
    SSHResult exec(const std::string& command);
    void close();
};

// RemoteTarget for the configured destination (key defaults to ~/.ssh/id_rsa).
RemoteTarget remote_target_for(const DestConfig& dest);
