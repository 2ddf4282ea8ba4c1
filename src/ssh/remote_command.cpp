#include "remote_command.hpp"
#include <core/utils.hpp>

static bool is_plain_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-' || c == '.' || c == '/' || c == ':' || c == ',' ||
           c == '@' || c == '%' || c == '+' || c == '=';
}

std::string shell_quote(const std::string& word) {
    if (word.empty()) return "''";

    bool plain = true;
    for (char c : word) {
        if (!is_plain_char(c)) { plain = false; break; }
    }
    if (plain) return word;

    std::string out = "'";
    for (char c : word) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string shell_quote_path(const std::string& path) {
    if (path == "~") return path;
    if (starts_with(path, "~/")) {
        std::string rest = path.substr(2);
        return rest.empty() ? std::string("~/") : "~/" + shell_quote(rest);
    }
    return shell_quote(path);
}

std::string join_remote_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

RemoteCommand::RemoteCommand(std::string program, std::vector<std::string> args)
    : program_(std::move(program)), args_(std::move(args)) {
}

RemoteCommand& RemoteCommand::arg(const std::string& a) {
    args_.push_back(a);
    return *this;
}

RemoteCommand& RemoteCommand::args(const std::vector<std::string>& more) {
    args_.insert(args_.end(), more.begin(), more.end());
    return *this;
}

RemoteCommand& RemoteCommand::escalate(bool enabled) {
    escalated_ = enabled;
    return *this;
}

RemoteCommand& RemoteCommand::redirect_stdout(const std::string& path) {
    stdout_target_ = path;
    return *this;
}

std::vector<std::string> RemoteCommand::argv() const {
    std::vector<std::string> out;
    if (escalated_) {
        out.push_back("sudo");
        out.push_back("-n");
    }
    out.push_back(program_);
    out.insert(out.end(), args_.begin(), args_.end());
    return out;
}

std::string RemoteCommand::render() const {
    std::string out;
    if (escalated_) out += "sudo -n ";
    out += shell_quote_path(program_);
    for (const auto& a : args_) {
        out += " ";
        out += shell_quote_path(a);
    }
    if (stdout_target_) {
        out += " > " + shell_quote_path(*stdout_target_);
    }
    return out;
}
