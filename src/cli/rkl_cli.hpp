#pragma once

#include "base_cli.hpp"
#include <string>

void register_kernel_commands(BaseCLI& cli);
void register_setup_commands(BaseCLI& cli);

class RklCLI : public BaseCLI {
public:
    explicit RklCLI(const fs::path& config_path = {});

private:
    void register_all_commands();
};
