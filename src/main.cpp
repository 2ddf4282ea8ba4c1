#include <iostream>
#include <vector>
#include <string>
#include "cli/rkl_cli.hpp"
#include "cli/theme.hpp"

static const char* RKL_VERSION = "0.4.0";

static void print_usage(const BaseCLI& cli) {
    std::cout << theme::banner(RKL_VERSION);
    std::cout << theme::section("Usage");
    cli.print_help();
    std::cout << theme::color::DIM
              << "    rkl --config PATH ...   Use another config file\n"
              << "    rkl --version           Show version\n"
              << "    rkl --help              Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    fs::path config_path;
    size_t i = 0;
    while (i < args.size() && args[i].rfind("--", 0) == 0) {
        const std::string& opt = args[i];
        if (opt == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "rkl"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << RKL_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (opt == "--config") {
            if (i + 1 >= args.size()) {
                std::cout << theme::fail("--config needs a path.");
                return 2;
            }
            config_path = args[i + 1];
            i += 2;
        } else if (opt.rfind("--config=", 0) == 0) {
            config_path = opt.substr(9);
            i += 1;
        } else if (opt == "--help") {
            break;
        } else {
            std::cout << theme::fail("Unknown option: " + opt);
            return 2;
        }
    }

    try {
        RklCLI cli(config_path);

        if (i >= args.size() || args[i] == "--help" || args[i] == "help") {
            print_usage(cli);
            return i >= args.size() ? 1 : 0;
        }

        std::string cmd = args[i];
        std::vector<std::string> rest(args.begin() + i + 1, args.end());
        return cli.execute_command(cmd, rest);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
