#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>

static int do_init(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!args.empty()) {
        std::cout << theme::fail("init takes no arguments.");
        return 2;
    }

    auto written = create_default_config(cli.config_path);
    if (written.is_err()) {
        std::cout << theme::fail(written.error);
        return 1;
    }
    std::cout << theme::ok("Config: " + cli.config_path.string());

    // Re-read in case an existing config points the manifest elsewhere
    auto reloaded = Config::load(cli.config_path);
    if (reloaded.is_err()) {
        std::cout << theme::fail(reloaded.error);
        return 1;
    }
    cli.config = reloaded.value;

    ManifestStore store(cli.config->manifest_path());
    auto created = store.initialize();
    if (created.is_err()) {
        std::cout << theme::fail(created.error);
        return 1;
    }
    std::cout << theme::ok("Manifest: " + store.path().string());
    return 0;
}

static int do_config(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!args.empty()) {
        std::cout << theme::fail("config takes no arguments.");
        return 2;
    }
    if (!cli.require_config()) return 1;

    std::cout << theme::section("Configuration");
    std::cout << theme::kv("source", config_exists(cli.config_path)
                                         ? cli.config_path.string()
                                         : "(built-in defaults)");
    std::cout << theme::kv("manifest", cli.config->manifest_path().string());
    std::cout << "\n" << cli.config->to_yaml() << "\n";
    return 0;
}

void register_setup_commands(BaseCLI& cli) {
    cli.add_command("init", do_init, "rkl init", "Write a default config and an empty manifest");
    cli.add_command("config", do_config, "rkl config", "Show the effective configuration");
}
