#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <managers/manifest_store.hpp>
#include <managers/kernel_registrar.hpp>
#include <managers/kernel_manager.hpp>

namespace fs = std::filesystem;

class BaseCLI {
public:
    // config_path empty → default location ($RKL_CONFIG or ~/.rkl/config.yaml)
    explicit BaseCLI(const fs::path& config_path = {});
    virtual ~BaseCLI() = default;

    // Handlers return the process exit code.
    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& usage,
                    const std::string& help);

    bool require_config();

    // Builds store, registrar and manager from the loaded config.
    bool init_managers();

    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    // Print a progress line from the manager
    static void print_status(const std::string& msg);

    // Public state
    std::optional<Config> config;
    std::string config_error;
    fs::path config_path;
    std::unique_ptr<ManifestStore> store;
    std::unique_ptr<KernelRegistrar> registrar;
    std::unique_ptr<KernelManager> kernels;

protected:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;
};
