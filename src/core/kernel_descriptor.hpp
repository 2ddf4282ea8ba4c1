#pragma once

#include <string>
#include <optional>
#include <core/constants.hpp>

// Identifies one remote kernel: where it lives and which interpreter backs it.
//
// Two descriptors are equal when they would provision the same environment,
// i.e. same host, venv and interpreter. The kernel id and display name do not
// take part, so the same configuration registered under a second id compares
// equal to the first.
class KernelDescriptor {
public:
    // Throws ValidationError if host, kernel_id or python_cmd is empty.
    // An empty venv_name is treated as "no venv".
    KernelDescriptor(std::string host,
                     std::string kernel_id,
                     std::optional<std::string> venv_name = std::nullopt,
                     std::string python_cmd = DEFAULT_PYTHON_CMD,
                     std::optional<std::string> display_name = std::nullopt);

    const std::string& host() const { return host_; }
    const std::string& kernel_id() const { return kernel_id_; }
    const std::optional<std::string>& venv_name() const { return venv_name_; }
    const std::string& python_cmd() const { return python_cmd_; }
    const std::string& display_name() const { return display_name_; }

    bool has_venv() const { return venv_name_.has_value(); }

    // e.g. "RemoteKernel k1 :: host='10.0.0.5' venv='envA' python_cmd='python3.8'"
    std::string to_string() const;

    bool operator==(const KernelDescriptor& other) const;
    bool operator!=(const KernelDescriptor& other) const { return !(*this == other); }

private:
    std::string host_;
    std::string kernel_id_;
    std::optional<std::string> venv_name_;
    std::string python_cmd_;
    std::string display_name_;
};
