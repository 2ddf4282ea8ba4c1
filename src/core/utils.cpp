#include "utils.hpp"
#include <platform/platform.hpp>

namespace fs = std::filesystem;

fs::path expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (starts_with(path, "~/")) return platform::home_dir() / path.substr(2);
    return fs::path(path);
}

std::pair<std::string, std::string> split_user_host(const std::string& remote_host) {
    auto at = remote_host.rfind('@');
    if (at == std::string::npos) {
        return {"", remote_host};
    }
    return {remote_host.substr(0, at), remote_host.substr(at + 1)};
}
