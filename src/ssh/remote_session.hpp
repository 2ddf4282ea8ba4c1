#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>
#include "remote_command.hpp"

namespace fs = std::filesystem;

// The narrow transport the kernel lifecycle depends on: run a command and get
// separated stdout/stderr plus exit status back, copy a file to the remote host.
// Closing is idempotent; destroying an open session closes it.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // timeout_secs = 0 uses the session's configured per-command timeout.
    // exit_code < 0 on channel failure or timeout.
    virtual SSHResult run(const RemoteCommand& command, int timeout_secs = 0) = 0;

    // Copy a local file to a remote path.
    virtual SSHResult upload(const fs::path& local, const std::string& remote) = 0;

    virtual void close() = 0;
    virtual bool is_active() const = 0;

    // "user@host"
    virtual const std::string& target() const = 0;
};

// Opens an authenticated session. On failure returns the reason; never throws.
using SessionFactory =
    std::function<Result<std::unique_ptr<RemoteSession>>(const SessionTarget&, StatusCallback)>;
