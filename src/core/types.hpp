#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote command execution result.
// exit_code < 0 means the command never completed (channel error, timeout).
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
    bool transport_failed() const { return exit_code < 0; }
};

// Configuration structures
struct ManifestConfig {
    std::string path;                            // local kernels.json
};

struct RemoteConfig {
    std::string user = "ubuntu";
    std::string venv_root = "~/";
    int port = 22;
    int timeout = 30;
    int command_timeout = 1800;
    std::optional<std::string> ssh_key_path;
    std::string known_hosts;
    bool strict_host_key_checking = true;
};

struct KernelConfig {
    std::string package = "jupyter";             // installed into every kernel environment
    std::string language = "python";             // manifest "language" marker
};

struct RegistrarConfig {
    std::string program = "rk";
    bool use_sudo = true;
    int timeout_ms = 120000;
};

// Where and how to open a remote session
struct SessionTarget {
    std::string host;
    std::string user;
    int port = 22;
    int timeout = 30;                            // connect/handshake timeout (seconds)
    int command_timeout = 1800;                  // per-command timeout (seconds)
    std::optional<std::string> ssh_key_path;     // empty → agent, then ~/.ssh/id_*
    std::string known_hosts;
    bool strict_host_key_checking = true;
};

struct CreateOptions {
    bool overwrite = false;
    std::string remote_venv_root_dir = "~/";
    std::string remote_username = "ubuntu";
};

struct RemoveOptions {
    bool remote_deregister = true;               // also drop the kernelspec on the remote host
};

// What a successful create did
struct CreateOutcome {
    bool overwrote = false;
    bool venv_created = false;
    bool escalated = false;                      // install/registration ran through sudo
    std::vector<std::string> duplicate_ids;      // same (host, venv, interpreter) under other ids
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
