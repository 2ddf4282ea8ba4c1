#include "config.hpp"
#include "utils.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

bool config_exists(const fs::path& path) {
    return fs::exists(path);
}

fs::path get_config_dir() {
    return platform::home_dir() / ".rkl";
}

fs::path get_config_path() {
    const char* env = std::getenv("RKL_CONFIG");
    if (env && *env) return expand_home(env);
    return get_config_dir() / "config.yaml";
}

fs::path get_default_manifest_path() {
    return get_config_dir() / "kernels.json";
}

Result<void> create_default_config(const fs::path& config_path) {
    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    if (config_path.has_parent_path()) {
        fs::create_directories(config_path.parent_path(), ec);
        if (ec) {
            return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                     ": " + ec.message());
        }
    }

    const char* default_config = R"(# Remote kernel launcher configuration

manifest:
  path: "~/.rkl/kernels.json"     # local kernel manifest (shared with the registrar)

remote:
  user: "ubuntu"                  # ssh user on the kernel hosts
  venv_root: "~/"                 # parent directory for remote virtualenvs
  port: 22
  timeout: 30                     # connect/handshake timeout, seconds
  command_timeout: 1800           # per remote command, seconds
  # ssh_key: "~/.ssh/id_rsa"      # default: ssh-agent, then ~/.ssh/id_*
  known_hosts: "~/.ssh/known_hosts"
  strict_host_key_checking: true

kernel:
  package: "jupyter"
  language: "python"

registrar:
  program: "rk"                   # invoked as: [sudo] rk install|uninstall <id>
  sudo: true
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    out.close();
    if (!out) {
        return Result<void>::Err("Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

class ConfigBuilder {
public:
    static Config from_node(const YAML::Node& root, const fs::path& source);
};

static ManifestConfig parse_manifest_config(const YAML::Node& node) {
    ManifestConfig manifest;
    manifest.path = node["path"].as<std::string>(get_default_manifest_path().string());
    if (manifest.path.empty()) {
        manifest.path = get_default_manifest_path().string();
    }
    return manifest;
}

static RemoteConfig parse_remote_config(const YAML::Node& node) {
    RemoteConfig remote;
    remote.user = node["user"].as<std::string>(DEFAULT_REMOTE_USER);
    remote.venv_root = node["venv_root"].as<std::string>(DEFAULT_VENV_ROOT);
    remote.port = node["port"].as<int>(DEFAULT_SSH_PORT);
    remote.timeout = node["timeout"].as<int>(SSH_CONNECT_TIMEOUT_SECS);
    remote.command_timeout = node["command_timeout"].as<int>(SSH_CMD_TIMEOUT_SECS);

    std::string key = node["ssh_key"].as<std::string>("");
    if (!key.empty()) {
        remote.ssh_key_path = key;
    }

    remote.known_hosts = node["known_hosts"].as<std::string>(
        (platform::home_dir() / ".ssh" / "known_hosts").string());
    remote.strict_host_key_checking = node["strict_host_key_checking"].as<bool>(true);

    if (remote.user.empty()) remote.user = DEFAULT_REMOTE_USER;
    if (remote.venv_root.empty()) remote.venv_root = DEFAULT_VENV_ROOT;
    return remote;
}

static KernelConfig parse_kernel_config(const YAML::Node& node) {
    KernelConfig kernel;
    kernel.package = node["package"].as<std::string>(DEFAULT_KERNEL_PACKAGE);
    kernel.language = node["language"].as<std::string>(DEFAULT_KERNEL_LANGUAGE);
    return kernel;
}

static RegistrarConfig parse_registrar_config(const YAML::Node& node) {
    RegistrarConfig registrar;
    registrar.program = node["program"].as<std::string>(DEFAULT_REGISTRAR);
    registrar.use_sudo = node["sudo"].as<bool>(true);
    registrar.timeout_ms = node["timeout_ms"].as<int>(REGISTRAR_TIMEOUT_MS);
    return registrar;
}

Config ConfigBuilder::from_node(const YAML::Node& root, const fs::path& source) {
    auto section = [&](const char* key) {
        return (root && root.IsMap() && root[key]) ? root[key] : YAML::Node();
    };

    Config config;
    config.manifest_ = parse_manifest_config(section("manifest"));
    config.remote_ = parse_remote_config(section("remote"));
    config.kernel_ = parse_kernel_config(section("kernel"));
    config.registrar_ = parse_registrar_config(section("registrar"));
    config.source_ = source;
    return config;
}

Config Config::defaults() {
    return ConfigBuilder::from_node(YAML::Node(), fs::path());
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root && !root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err("Config must be a YAML mapping");
        }
        return Result<Config>::Ok(ConfigBuilder::from_node(root, fs::path()));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!config_exists(path)) {
        Config config = defaults();
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root && !root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err("Config at " + path.string() + " must be a YAML mapping");
        }
        return Result<Config>::Ok(ConfigBuilder::from_node(root, path));
    } catch (const std::exception& e) {
        return Result<Config>::Err("Failed to parse config " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load() {
    return load(get_config_path());
}

fs::path Config::manifest_path() const {
    return expand_home(manifest_.path);
}

std::string Config::to_yaml() const {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "manifest" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "path" << YAML::Value << manifest_.path;
    out << YAML::EndMap;

    out << YAML::Key << "remote" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "user" << YAML::Value << remote_.user;
    out << YAML::Key << "venv_root" << YAML::Value << remote_.venv_root;
    out << YAML::Key << "port" << YAML::Value << remote_.port;
    out << YAML::Key << "timeout" << YAML::Value << remote_.timeout;
    out << YAML::Key << "command_timeout" << YAML::Value << remote_.command_timeout;
    out << YAML::Key << "ssh_key" << YAML::Value << remote_.ssh_key_path.value_or("");
    out << YAML::Key << "known_hosts" << YAML::Value << remote_.known_hosts;
    out << YAML::Key << "strict_host_key_checking" << YAML::Value << remote_.strict_host_key_checking;
    out << YAML::EndMap;

    out << YAML::Key << "kernel" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "package" << YAML::Value << kernel_.package;
    out << YAML::Key << "language" << YAML::Value << kernel_.language;
    out << YAML::EndMap;

    out << YAML::Key << "registrar" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "program" << YAML::Value << registrar_.program;
    out << YAML::Key << "sudo" << YAML::Value << registrar_.use_sudo;
    out << YAML::Key << "timeout_ms" << YAML::Value << registrar_.timeout_ms;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}
