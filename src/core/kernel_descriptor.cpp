#include "kernel_descriptor.hpp"
#include "errors.hpp"
#include <fmt/format.h>

KernelDescriptor::KernelDescriptor(std::string host,
                                   std::string kernel_id,
                                   std::optional<std::string> venv_name,
                                   std::string python_cmd,
                                   std::optional<std::string> display_name)
    : host_(std::move(host)),
      kernel_id_(std::move(kernel_id)),
      venv_name_(std::move(venv_name)),
      python_cmd_(std::move(python_cmd)) {
    if (host_.empty() || kernel_id_.empty() || python_cmd_.empty()) {
        throw ValidationError(kernel_id_, host_,
            fmt::format("cannot describe kernel with host='{}' kernel_id='{}' python_cmd='{}'",
                        host_, kernel_id_, python_cmd_));
    }
    if (venv_name_ && venv_name_->empty()) {
        venv_name_.reset();
    }
    if (display_name && !display_name->empty()) {
        display_name_ = *display_name;
    } else {
        display_name_ = fmt::format("{} :: {}", host_, kernel_id_);
    }
}

std::string KernelDescriptor::to_string() const {
    std::string out = "RemoteKernel " + kernel_id_ + " ::";
    out += fmt::format(" host='{}'", host_);
    if (venv_name_) {
        out += fmt::format(" venv='{}'", *venv_name_);
    }
    out += fmt::format(" python_cmd='{}'", python_cmd_);
    return out;
}

bool KernelDescriptor::operator==(const KernelDescriptor& other) const {
    return host_ == other.host_
        && venv_name_ == other.venv_name_
        && python_cmd_ == other.python_cmd_;
}
