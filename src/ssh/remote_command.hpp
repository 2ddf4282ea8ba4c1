#pragma once

#include <string>
#include <vector>
#include <optional>

// A remote shell invocation built from an argument vector.
//
// Arguments are quoted individually when rendered, so nothing a caller puts in
// a kernel id, venv name or path can change the shape of the command line.
// A leading "~/" on an argument is left unquoted so the remote shell expands it.
class RemoteCommand {
public:
    explicit RemoteCommand(std::string program, std::vector<std::string> args = {});

    RemoteCommand& arg(const std::string& a);
    RemoteCommand& args(const std::vector<std::string>& more);

    // Prefix the command with "sudo -n" (non-interactive: fail rather than prompt).
    RemoteCommand& escalate(bool enabled = true);

    // Send the command's stdout to a remote file ("> path").
    RemoteCommand& redirect_stdout(const std::string& path);

    const std::string& program() const { return program_; }
    const std::vector<std::string>& arguments() const { return args_; }
    bool escalated() const { return escalated_; }
    const std::optional<std::string>& stdout_target() const { return stdout_target_; }

    // Full argv including any sudo prefix (unquoted).
    std::vector<std::string> argv() const;

    // Shell text sent over the exec channel.
    std::string render() const;

private:
    std::string program_;
    std::vector<std::string> args_;
    bool escalated_ = false;
    std::optional<std::string> stdout_target_;
};

// POSIX single-quote escaping. Plain words pass through untouched.
std::string shell_quote(const std::string& word);

// shell_quote, but keep "~" / "~/" prefix expandable.
std::string shell_quote_path(const std::string& path);

// Join a remote directory and a name with exactly one '/'. Empty dir → name.
std::string join_remote_path(const std::string& dir, const std::string& name);
