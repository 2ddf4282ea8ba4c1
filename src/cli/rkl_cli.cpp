#include "rkl_cli.hpp"

RklCLI::RklCLI(const fs::path& config_path) : BaseCLI(config_path) {
    register_all_commands();
}

void RklCLI::register_all_commands() {
    register_kernel_commands(*this);
    register_setup_commands(*this);
}
