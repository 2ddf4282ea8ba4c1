#include "../base_cli.hpp"
#include "../arg_parser.hpp"
#include "../theme.hpp"
#include <core/errors.hpp>
#include <iostream>
#include <fmt/format.h>

static void usage_error(const std::string& msg, const std::string& usage) {
    std::cout << theme::fail(msg);
    std::cout << theme::step("Usage: " + usage);
}

static const char* CREATE_USAGE =
    "rkl create <host> <kernel_id> [--venv NAME] [--python CMD] [--display-name NAME] "
    "[--ssh-key PATH] [--requirements FILE] [--overwrite] [--user NAME] [--venv-root DIR]";
static const char* REMOVE_USAGE = "rkl remove <kernel_id> [--ssh-key PATH] [--keep-remote]";
static const char* LIST_USAGE = "rkl list [--exclude-host HOST]";

// ── create ───────────────────────────────────────────────────

static int do_create(BaseCLI& cli, const std::vector<std::string>& raw) {
    auto parsed = parse_args(raw,
        {"venv", "python", "display-name", "ssh-key", "requirements", "user", "venv-root"},
        {"overwrite"});
    if (parsed.is_err()) { usage_error(parsed.error, CREATE_USAGE); return 2; }
    const auto& args = parsed.value;
    if (args.positional.size() != 2) {
        usage_error("Expected <host> and <kernel_id>.", CREATE_USAGE);
        return 2;
    }
    if (!cli.init_managers()) return 1;

    KernelDescriptor kernel(args.positional[0], args.positional[1],
                            args.option("venv"),
                            args.option("python").value_or(DEFAULT_PYTHON_CMD),
                            args.option("display-name"));

    CreateOptions options = cli.kernels->default_create_options();
    options.overwrite = args.flag("overwrite");
    if (auto user = args.option("user")) options.remote_username = *user;
    if (auto root = args.option("venv-root")) options.remote_venv_root_dir = *root;

    std::optional<fs::path> requirements;
    if (auto req = args.option("requirements")) requirements = fs::path(*req);

    std::cout << theme::section("Creating " + kernel.kernel_id());
    std::cout << theme::kv("host", options.remote_username + "@" + kernel.host());
    std::cout << theme::kv("venv", kernel.venv_name().value_or("(none)"));
    std::cout << theme::kv("interpreter", kernel.python_cmd());
    std::cout << "\n";

    auto outcome = cli.kernels->create(kernel, args.option("ssh-key"), requirements, options,
                                       BaseCLI::print_status);

    for (const auto& dup : outcome.duplicate_ids) {
        std::cout << theme::warn(fmt::format("'{}' describes the same environment as '{}'",
                                             dup, kernel.kernel_id()));
    }
    std::cout << theme::ok(fmt::format("Kernel {} {}", kernel.kernel_id(),
                                       outcome.overwrote ? "replaced" : "created"));
    return 0;
}

// ── remove ───────────────────────────────────────────────────

static int do_remove(BaseCLI& cli, const std::vector<std::string>& raw) {
    auto parsed = parse_args(raw, {"ssh-key"}, {"keep-remote"});
    if (parsed.is_err()) { usage_error(parsed.error, REMOVE_USAGE); return 2; }
    const auto& args = parsed.value;
    if (args.positional.size() != 1) {
        usage_error("Expected <kernel_id>.", REMOVE_USAGE);
        return 2;
    }
    if (!cli.init_managers()) return 1;

    const std::string& kernel_id = args.positional[0];
    auto record = cli.store->find(kernel_id);
    if (!record) {
        throw NotFoundError(kernel_id, "", "not in the local manifest " + cli.store->path().string());
    }

    RemoveOptions options;
    options.remote_deregister = !args.flag("keep-remote");

    std::cout << theme::section("Removing " + kernel_id);
    cli.kernels->remove(record->to_descriptor(), args.option("ssh-key"), options,
                        BaseCLI::print_status);
    std::cout << theme::ok("Kernel " + kernel_id + " removed");
    return 0;
}

// ── list ─────────────────────────────────────────────────────

static int do_list(BaseCLI& cli, const std::vector<std::string>& raw) {
    auto parsed = parse_args(raw, {"exclude-host"}, {});
    if (parsed.is_err()) { usage_error(parsed.error, LIST_USAGE); return 2; }
    if (!parsed.value.positional.empty()) {
        usage_error("Unexpected argument: " + parsed.value.positional[0], LIST_USAGE);
        return 2;
    }
    if (!cli.init_managers()) return 1;

    auto listed = cli.kernels->list(parsed.value.option("exclude-host"));
    if (listed.empty()) {
        std::cout << theme::info("No kernels in " + cli.store->path().string());
        return 0;
    }

    std::cout << theme::section("Kernels");
    for (const auto& k : listed) {
        std::cout << theme::color::BLUE << "    " << k.kernel_id() << theme::color::RESET << "\n";
        std::cout << theme::kv("  host", k.host());
        std::cout << theme::kv("  venv", k.venv_name().value_or("(none)"));
        std::cout << theme::kv("  interpreter", k.python_cmd());
        std::cout << theme::kv("  display", k.display_name());
    }
    std::cout << "\n";
    return 0;
}

void register_kernel_commands(BaseCLI& cli) {
    cli.add_command("create", do_create, CREATE_USAGE, "Provision a kernel on a remote host");
    cli.add_command("remove", do_remove, REMOVE_USAGE, "Deregister a kernel and drop it from the manifest");
    cli.add_command("list", do_list, LIST_USAGE, "Show kernels in the local manifest");
}
