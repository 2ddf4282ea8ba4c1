#include "kernel_registrar.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

ProcessRegistrar::ProcessRegistrar(const RegistrarConfig& config) : config_(config) {
}

void ProcessRegistrar::install(const std::string& kernel_id) {
    invoke("install", kernel_id);
}

void ProcessRegistrar::uninstall(const std::string& kernel_id) {
    invoke("uninstall", kernel_id);
}

std::vector<std::string> ProcessRegistrar::command_for(const std::string& action,
                                                       const std::string& kernel_id) const {
    std::vector<std::string> cmd;
    if (config_.use_sudo) cmd.push_back("sudo");
    cmd.push_back(config_.program);
    cmd.push_back(action);
    cmd.push_back(kernel_id);
    return cmd;
}

void ProcessRegistrar::invoke(const std::string& action, const std::string& kernel_id) {
    auto cmd = command_for(action, kernel_id);
    std::string program = cmd.front();
    std::vector<std::string> args(cmd.begin() + 1, cmd.end());

    std::string printable = fmt::format("{}", fmt::join(cmd, " "));
    rkl_log("registrar: " + printable);

    auto proc = platform::spawn(program, args, rkl_log_path());
    if (!proc.valid()) {
        throw RegistrarError(kernel_id, "", "could not start '" + printable + "'");
    }

    int code = proc.wait(config_.timeout_ms);
    if (code < 0) {
        if (proc.running()) {
            proc.terminate();
            throw RegistrarError(kernel_id, "", fmt::format("'{}' timed out after {}ms",
                                                            printable, config_.timeout_ms));
        }
        // Exited between the deadline and the running() check
        code = proc.wait(0);
    }
    rkl_log(fmt::format("registrar: exit={}", code));

    if (code == 127) {
        throw RegistrarError(kernel_id, "", fmt::format("'{}' not found on PATH", program));
    }
    if (code != 0) {
        throw RegistrarError(kernel_id, "", fmt::format("'{}' exited with {} (output in {})",
                                                        printable, code, rkl_log_path()));
    }
}
