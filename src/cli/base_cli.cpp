#include "base_cli.hpp"
#include "theme.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <ssh/session.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI(const fs::path& path)
    : config_path(path.empty() ? get_config_path() : path) {
    auto config_result = Config::load(config_path);
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error = config_result.error;
    }
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& usage,
                         const std::string& help) {
    commands_[name] = {handler, usage, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail("Could not load " + config_path.string());
        if (!config_error.empty()) std::cout << theme::step(config_error);
        return false;
    }
    return true;
}

bool BaseCLI::init_managers() {
    if (!require_config()) return false;
    if (kernels) return true;

    store = std::make_unique<ManifestStore>(config->manifest_path());
    registrar = std::make_unique<ProcessRegistrar>(config->registrar());
    kernels = std::make_unique<KernelManager>(config.value(), *store, *registrar,
                                              SessionFactory(&SSHSession::open));
    return true;
}

void BaseCLI::print_status(const std::string& msg) {
    std::cout << theme::log(msg) << std::flush;
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'rkl --help' for available commands.");
        return 1;
    }

    try {
        return it->second.handler(*this, args);
    } catch (const KernelError& e) {
        rkl_log(fmt::format("{} failed: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
        if (dynamic_cast<const RemoteCommandError*>(&e) || dynamic_cast<const TransportError*>(&e)) {
            std::cout << theme::step("Details in " + rkl_log_path());
        }
        return 1;
    } catch (const std::exception& e) {
        rkl_log(fmt::format("{} failed: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Kernels", {"create", "remove", "list"}},
        {"Setup",   {"init", "config"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            std::cout << theme::color::BLUE
                      << fmt::format("    rkl {:<10}", name)
                      << theme::color::RESET
                      << theme::color::DIM
                      << it->second.help
                      << theme::color::RESET << "\n";
            if (!it->second.usage.empty()) {
                std::cout << theme::color::DIM
                          << fmt::format("        {}", it->second.usage)
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}
