#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Immutable after load; passed explicitly to the manifest store and manager.
class Config {
public:
    // Load from a YAML file. A missing file yields the built-in defaults.
    static Result<Config> load(const fs::path& path);

    // Load from the default location (see get_config_path()).
    static Result<Config> load();

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    // Built-in defaults only.
    static Config defaults();

    // Accessors
    const ManifestConfig& manifest() const { return manifest_; }
    const RemoteConfig& remote() const { return remote_; }
    const KernelConfig& kernel() const { return kernel_; }
    const RegistrarConfig& registrar() const { return registrar_; }
    const fs::path& source() const { return source_; }

    // Manifest path with "~" expanded
    fs::path manifest_path() const;

    // Render the effective configuration back to YAML
    std::string to_yaml() const;

public:
    Config() = default;

private:
    ManifestConfig manifest_;
    RemoteConfig remote_;
    KernelConfig kernel_;
    RegistrarConfig registrar_;
    fs::path source_;

    friend class ConfigBuilder;
};

// Helper to check if the config exists
bool config_exists(const fs::path& path);

// Get paths. get_config_path() honors $RKL_CONFIG, else ~/.rkl/config.yaml
fs::path get_config_dir();
fs::path get_config_path();
fs::path get_default_manifest_path();

// Write a commented default config. Leaves an existing file untouched.
Result<void> create_default_config(const fs::path& path);
