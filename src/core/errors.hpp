#pragma once

#include <stdexcept>
#include <string>
#include <fmt/format.h>

// Base for every failure surfaced by the kernel lifecycle.
// Carries the kernel id and host the failure belongs to (either may be empty).
class KernelError : public std::runtime_error {
public:
    KernelError(const std::string& kernel_id, const std::string& host, const std::string& msg)
        : std::runtime_error(compose(kernel_id, host, msg)),
          kernel_id_(kernel_id), host_(host), detail_(msg) {}

    const std::string& kernel_id() const { return kernel_id_; }
    const std::string& host() const { return host_; }
    const std::string& detail() const { return detail_; }

private:
    static std::string compose(const std::string& kernel_id, const std::string& host,
                               const std::string& msg) {
        if (kernel_id.empty() && host.empty()) return msg;
        if (host.empty()) return fmt::format("kernel '{}': {}", kernel_id, msg);
        if (kernel_id.empty()) return fmt::format("{}: {}", host, msg);
        return fmt::format("kernel '{}' on {}: {}", kernel_id, host, msg);
    }

    std::string kernel_id_;
    std::string host_;
    std::string detail_;
};

// Bad descriptor or bad local input (missing requirements file, ...)
class ValidationError : public KernelError {
public:
    using KernelError::KernelError;
};

// Connect, host key, authentication, channel or timeout failure
class TransportError : public KernelError {
public:
    using KernelError::KernelError;
};

// A provisioning command ran but exited non-zero
class RemoteCommandError : public KernelError {
public:
    RemoteCommandError(const std::string& kernel_id, const std::string& host,
                       const std::string& step, int exit_code, const std::string& stderr_excerpt)
        : KernelError(kernel_id, host,
                      fmt::format("{} failed (exit {}){}; remote state may be partially provisioned",
                                  step, exit_code,
                                  stderr_excerpt.empty() ? "" : ": " + stderr_excerpt)),
          step_(step), exit_code_(exit_code) {}

    const std::string& step() const { return step_; }
    int exit_code() const { return exit_code_; }

private:
    std::string step_;
    int exit_code_;
};

// Kernel id already in the local manifest and overwrite not set
class AlreadyExistsError : public KernelError {
public:
    using KernelError::KernelError;
};

// Kernelspec already registered on the remote host and overwrite not set
class RemoteAlreadyExistsError : public KernelError {
public:
    using KernelError::KernelError;
};

// Kernel id not present in the local manifest
class NotFoundError : public KernelError {
public:
    using KernelError::KernelError;
};

// Manifest missing, unreadable or not a JSON object of records
class ManifestUnreadable : public KernelError {
public:
    using KernelError::KernelError;
};

// Manifest could not be replaced; the previous file is left as it was
class ManifestWriteError : public KernelError {
public:
    using KernelError::KernelError;
};

// Local registrar program failed or could not be started
class RegistrarError : public KernelError {
public:
    using KernelError::KernelError;
};
