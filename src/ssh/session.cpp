#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <fstream>
#include <iterator>

static std::chrono::steady_clock::time_point deadline_after(int secs) {
    return std::chrono::steady_clock::now() + std::chrono::seconds(secs);
}

static bool expired(std::chrono::steady_clock::time_point deadline) {
    return std::chrono::steady_clock::now() >= deadline;
}

SSHSession::SSHSession(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(RKL_INVALID_SOCKET), active_(false),
      target_str_(target.user + "@" + target.host) {
}

SSHSession::~SSHSession() {
    close();
}

Result<std::unique_ptr<RemoteSession>> SSHSession::open(const SessionTarget& target,
                                                        StatusCallback callback) {
    auto session = std::make_unique<SSHSession>(target);
    auto result = session->establish(callback);
    if (result.failed()) {
        return Result<std::unique_ptr<RemoteSession>>::Err(result.stderr_data);
    }
    return Result<std::unique_ptr<RemoteSession>>::Ok(std::move(session));
}

std::string SSHSession::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : std::string("unknown libssh2 error");
}

SSHResult SSHSession::establish(StatusCallback callback) {
    if (callback) {
        callback("Connecting to " + target_str_ + "...");
    }

    // Initialize libssh2
    int rc = libssh2_init(0);
    if (rc != 0) {
        return SSHResult{-1, "", "Failed to initialize libssh2"};
    }

    auto sock = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000);
    if (sock.is_err()) {
        return SSHResult{-1, "", sock.error};
    }
    sock_ = sock.value;

    if (callback) callback("TCP connected, starting SSH handshake...");

    // Create SSH session
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        return SSHResult{-1, "", "Failed to create SSH session"};
    }

    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    auto deadline = deadline_after(target_.timeout);
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (expired(deadline)) {
            close();
            return SSHResult{-1, "", "SSH handshake timed out: " + target_.host};
        }
        platform::sleep_ms(10);
    }
    if (rc != 0) {
        std::string err = "SSH handshake failed: " + last_error();
        close();
        return SSHResult{-1, "", err};
    }

    platform::enable_keepalive(sock_);
    libssh2_keepalive_config(session_, 1, 30);

    auto host_key = verify_host_key(callback);
    if (host_key.failed()) {
        close();
        return host_key;
    }

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        close();
        return auth_result;
    }

    active_ = true;
    rkl_log(fmt::format("session: connected to {}:{}", target_str_, target_.port));

    if (callback) {
        callback("Connected to " + target_.host);
    }

    return SSHResult{0, "", ""};
}

SSHResult SSHSession::verify_host_key(StatusCallback callback) {
    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (!key) {
        return SSHResult{-1, "", "Server did not present a host key"};
    }

    LIBSSH2_KNOWNHOSTS* known = libssh2_knownhost_init(session_);
    if (!known) {
        return SSHResult{-1, "", "Failed to initialize known_hosts check"};
    }

    std::string known_hosts = expand_home(target_.known_hosts).string();
    if (!known_hosts.empty() && std::filesystem::exists(known_hosts)) {
        if (libssh2_knownhost_readfile(known, known_hosts.c_str(),
                                       LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
            rkl_log("session: could not parse " + known_hosts);
        }
    }

    struct libssh2_knownhost* match = nullptr;
    int check = libssh2_knownhost_checkp(known, target_.host.c_str(), target_.port,
                                         key, key_len,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW,
                                         &match);
    libssh2_knownhost_free(known);

    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        return SSHResult{0, "", ""};
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        return SSHResult{-1, "", fmt::format(
            "Host key for {} does not match {} (possible man-in-the-middle)",
            target_.host, known_hosts)};
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
        if (target_.strict_host_key_checking) {
            return SSHResult{-1, "", fmt::format(
                "Host {} is not in {}; connect once with ssh to record its key",
                target_.host, known_hosts)};
        }
        if (callback) callback("Host key not in known_hosts, continuing (strict checking off)");
        rkl_log("session: accepting unknown host key for " + target_.host);
        return SSHResult{0, "", ""};
    default:
        return SSHResult{-1, "", "Host key check failed for " + target_.host};
    }
}

bool SSHSession::auth_with_key_file(const std::string& private_key) {
    int rc;
    while ((rc = libssh2_userauth_publickey_fromfile(session_, target_.user.c_str(),
                                                     nullptr, private_key.c_str(),
                                                     nullptr)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(10);
    }
    if (rc != 0) {
        rkl_log(fmt::format("session: key {} rejected: {}", private_key, last_error()));
    }
    return rc == 0;
}

bool SSHSession::auth_with_agent(StatusCallback callback) {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent) return false;

    bool ok = false;
    if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        while (!ok && libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            int rc;
            while ((rc = libssh2_agent_userauth(agent, target_.user.c_str(), identity))
                   == LIBSSH2_ERROR_EAGAIN) {
                platform::sleep_ms(10);
            }
            if (rc == 0) {
                ok = true;
                if (callback) callback(fmt::format("Authenticated with agent key {}",
                                                   identity->comment ? identity->comment : ""));
            }
            prev = identity;
        }
        libssh2_agent_disconnect(agent);
    }
    libssh2_agent_free(agent);
    return ok;
}

SSHResult SSHSession::ssh_userauth(StatusCallback callback) {
    // Check what auth methods the server supports
    char* auth_list = nullptr;
    auto deadline = deadline_after(target_.timeout);
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              target_.user.length())) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            return SSHResult{0, "", ""};
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN || expired(deadline)) {
            break;
        }
        platform::sleep_ms(10);
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }
    if (!methods.empty() && methods.find("publickey") == std::string::npos) {
        return SSHResult{-1, "", fmt::format("{} does not accept public key authentication ({})",
                                             target_.host, methods)};
    }

    // An explicit key is the only thing tried
    if (target_.ssh_key_path) {
        std::string key = expand_home(*target_.ssh_key_path).string();
        if (!std::filesystem::exists(key)) {
            return SSHResult{-1, "", "SSH key not found: " + key};
        }
        if (auth_with_key_file(key)) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
        return SSHResult{-1, "", fmt::format("Authentication failed for {} with key {}",
                                             target_str_, key)};
    }

    if (auth_with_agent(callback)) {
        return SSHResult{0, "", ""};
    }

    for (const char* name : {"id_ed25519", "id_ecdsa", "id_rsa"}) {
        auto key = platform::home_dir() / ".ssh" / name;
        if (std::filesystem::exists(key) && auth_with_key_file(key.string())) {
            if (callback) callback(fmt::format("Authenticated with {}", key.string()));
            return SSHResult{0, "", ""};
        }
    }

    return SSHResult{-1, "", fmt::format(
        "Authentication failed for {} (no agent identity or ~/.ssh key accepted)", target_str_)};
}

SSHResult SSHSession::exec(const std::string& command, const std::string& input, int timeout_secs) {
    if (!session_ || !active_) {
        return SSHResult{-1, "", "No session available"};
    }

    // Open a new exec channel (no PTY, so stdout and stderr stay separate)
    LIBSSH2_CHANNEL* channel = nullptr;
    auto open_deadline = deadline_after(SSH_CHANNEL_OPEN_TIMEOUT_SECS);
    while ((channel = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return SSHResult{-1, "", "Failed to open exec channel: " + last_error()};
        }
        if (expired(open_deadline)) {
            return SSHResult{-1, "", "Timed out opening exec channel"};
        }
        platform::sleep_ms(10);
    }

    auto free_channel = [&]() {
        while (libssh2_channel_free(channel) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(10);
        }
    };

    int rc;
    auto exec_deadline = deadline_after(SSH_CHANNEL_OPEN_TIMEOUT_SECS);
    while ((rc = libssh2_channel_exec(channel, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        if (expired(exec_deadline)) break;
        platform::sleep_ms(10);
    }
    if (rc != 0) {
        free_channel();
        return SSHResult{-1, "", "Failed to exec command on channel"};
    }

    int effective_timeout = (timeout_secs > 0) ? timeout_secs : target_.command_timeout;
    auto deadline = deadline_after(effective_timeout);

    // Write all input to stdin
    size_t sent = 0;
    while (sent < input.size()) {
        ssize_t w = libssh2_channel_write(channel, input.data() + sent, input.size() - sent);
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (expired(deadline)) {
                libssh2_channel_close(channel);
                free_channel();
                return SSHResult{-1, "", "Write stalled sending data to channel"};
            }
            platform::sleep_ms(10);
            continue;
        }
        if (w < 0) {
            libssh2_channel_close(channel);
            free_channel();
            return SSHResult{-1, "", "Channel write error sending data"};
        }
        sent += static_cast<size_t>(w);
    }

    // Close stdin (send EOF) so the remote command knows input is done
    while (libssh2_channel_send_eof(channel) == LIBSSH2_ERROR_EAGAIN) {
        if (expired(deadline)) break;
        platform::sleep_ms(10);
    }

    // Drain stdout and stderr together so neither window fills up
    std::string out;
    std::string err;
    char buf[SSH_READ_BUF_SIZE];
    bool timed_out = false;

    while (true) {
        ssize_t n_out = libssh2_channel_read(channel, buf, sizeof(buf));
        if (n_out > 0) out.append(buf, static_cast<size_t>(n_out));

        ssize_t n_err = libssh2_channel_read_stderr(channel, buf, sizeof(buf));
        if (n_err > 0) err.append(buf, static_cast<size_t>(n_err));

        if ((n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) ||
            (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN)) {
            libssh2_channel_close(channel);
            free_channel();
            return SSHResult{-1, out, "SSH channel read error: " + last_error()};
        }
        if (n_out > 0 || n_err > 0) continue;

        if (libssh2_channel_eof(channel)) break;
        if (expired(deadline)) {
            timed_out = true;
            break;
        }
        platform::sleep_ms(10);
    }

    if (timed_out) {
        libssh2_channel_close(channel);
        free_channel();
        return SSHResult{-1, out, fmt::format("Command timed out after {}s", effective_timeout)};
    }

    // Get exit status
    int exit_status = -1;
    auto close_deadline = deadline_after(SSH_CHANNEL_OPEN_TIMEOUT_SECS);
    while ((rc = libssh2_channel_close(channel)) == LIBSSH2_ERROR_EAGAIN) {
        if (expired(close_deadline)) break;
        platform::sleep_ms(10);
    }
    if (rc == 0) {
        while (libssh2_channel_wait_closed(channel) == LIBSSH2_ERROR_EAGAIN) {
            if (expired(close_deadline)) break;
            platform::sleep_ms(10);
        }
        exit_status = libssh2_channel_get_exit_status(channel);
    }
    free_channel();

    if (exit_status < 0) {
        return SSHResult{-1, out, "Could not read exit status: " + err};
    }
    return SSHResult{exit_status, out, err};
}

SSHResult SSHSession::run(const RemoteCommand& command, int timeout_secs) {
    std::string text = command.render();
    auto result = exec(text, "", timeout_secs);
    rkl_log_ssh(target_str_, text, result);
    return result;
}

SSHResult SSHSession::upload(const fs::path& local, const std::string& remote) {
    std::ifstream file(local, std::ios::binary);
    if (!file) {
        return SSHResult{-1, "", "Cannot read file: " + local.string()};
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    // Stream the file through stdin of a remote cat; the exec channel is binary-clean
    RemoteCommand cmd("cat");
    cmd.redirect_stdout(remote);
    std::string text = cmd.render();
    auto result = exec(text, content, 0);
    rkl_log_ssh(target_str_, fmt::format("{} (<- {}, {} bytes)", text, local.string(), content.size()),
                result);
    return result;
}

void SSHSession::close() {
    active_ = false;

    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != RKL_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = RKL_INVALID_SOCKET;
    }
}
