#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "remote_session.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// libssh2-backed RemoteSession. Every command runs on its own exec channel
// (no PTY), so stdout, stderr and the exit status come back separated.
class SSHSession : public RemoteSession {
public:
    explicit SSHSession(const SessionTarget& target);
    ~SSHSession() override;

    SSHSession(const SSHSession&) = delete;
    SSHSession& operator=(const SSHSession&) = delete;

    // Connect, verify the host key, authenticate.
    SSHResult establish(StatusCallback callback = nullptr);

    SSHResult run(const RemoteCommand& command, int timeout_secs = 0) override;
    SSHResult upload(const fs::path& local, const std::string& remote) override;
    void close() override;
    bool is_active() const override { return active_; }
    const std::string& target() const override { return target_str_; }

    // SessionFactory implementation used by the CLI.
    static Result<std::unique_ptr<RemoteSession>> open(const SessionTarget& target,
                                                       StatusCallback callback);

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool active_;
    std::string target_str_;

    SSHResult verify_host_key(StatusCallback callback);
    SSHResult ssh_userauth(StatusCallback callback);
    bool auth_with_key_file(const std::string& private_key);
    bool auth_with_agent(StatusCallback callback);

    // Execute on a fresh exec channel, optionally feeding data to stdin.
    SSHResult exec(const std::string& command, const std::string& input, int timeout_secs);

    std::string last_error() const;
};
