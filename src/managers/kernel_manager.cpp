#include "kernel_manager.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <sstream>

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Tail of the command's diagnostics; pip and virtualenv put the cause last.
static std::string error_excerpt(const SSHResult& r) {
    std::string text = r.stderr_data.empty() ? r.stdout_data : r.stderr_data;
    trim(text);
    if (text.size() > LOG_EXCERPT_CHARS) {
        text = "..." + text.substr(text.size() - LOG_EXCERPT_CHARS);
    }
    return text;
}

// The store and registrar raise errors without knowing which kernel is being
// handled; fill in whatever they left blank.
template <typename Fn>
static auto attributed(const KernelDescriptor& kernel, Fn&& fn) -> decltype(fn()) {
    auto id = [&](const KernelError& e) {
        return e.kernel_id().empty() ? kernel.kernel_id() : e.kernel_id();
    };
    auto host = [&](const KernelError& e) {
        return e.host().empty() ? kernel.host() : e.host();
    };
    try {
        return fn();
    } catch (const ManifestUnreadable& e) {
        throw ManifestUnreadable(id(e), host(e), e.detail());
    } catch (const ManifestWriteError& e) {
        throw ManifestWriteError(id(e), host(e), e.detail());
    } catch (const RegistrarError& e) {
        throw RegistrarError(id(e), host(e), e.detail());
    }
}

// ── RemoteLayout ───────────────────────────────────────────

RemoteLayout RemoteLayout::resolve(const KernelDescriptor& kernel, const std::string& venv_root) {
    RemoteLayout layout;
    if (kernel.has_venv()) {
        layout.venv_dir = join_remote_path(venv_root, *kernel.venv_name());
        layout.python = join_remote_path(*layout.venv_dir, "bin/python");
        layout.requirements_path = join_remote_path(*layout.venv_dir, REQUIREMENTS_FILENAME);
    } else {
        layout.python = kernel.python_cmd();
        layout.requirements_path = join_remote_path(
            venv_root, kernel.kernel_id() + "-" + REQUIREMENTS_FILENAME);
    }
    return layout;
}

// ── KernelManager ──────────────────────────────────────────

KernelManager::KernelManager(const Config& config, const ManifestStore& store,
                             KernelRegistrar& registrar, SessionFactory sessions)
    : config_(config), store_(store), registrar_(registrar), sessions_(std::move(sessions)) {
}

CreateOptions KernelManager::default_create_options() const {
    CreateOptions options;
    options.remote_username = config_.remote().user;
    options.remote_venv_root_dir = config_.remote().venv_root;
    return options;
}

std::vector<KernelDescriptor> KernelManager::list(const std::optional<std::string>& filter_host) const {
    return store_.list(filter_host);
}

SSHResult KernelManager::checked(RemoteSession& session, const KernelDescriptor& kernel,
                                 const std::string& step, const RemoteCommand& command) {
    auto result = session.run(command);
    if (result.transport_failed()) {
        throw TransportError(kernel.kernel_id(), kernel.host(),
                             fmt::format("{}: {}", step, result.stderr_data));
    }
    if (result.failed()) {
        throw RemoteCommandError(kernel.kernel_id(), kernel.host(), step,
                                 result.exit_code, error_excerpt(result));
    }
    return result;
}

std::vector<std::string> KernelManager::check_local_collisions(const KernelDescriptor& kernel,
                                                               bool overwrite, StatusCallback cb) {
    auto manifest = store_.load();

    std::vector<std::string> duplicates;
    for (const auto& [id, rec] : manifest) {
        if (id == kernel.kernel_id()) continue;
        if (rec.to_descriptor() == kernel) {
            duplicates.push_back(id);
            std::string msg = fmt::format(
                "Duplicate kernel: existing kernel '{}' has the same host, venv and interpreter as '{}'",
                id, kernel.kernel_id());
            rkl_log("WARNING " + msg);
            if (cb) cb(msg);
        }
    }

    if (manifest.count(kernel.kernel_id())) {
        if (!overwrite) {
            throw AlreadyExistsError(kernel.kernel_id(), kernel.host(),
                "already in the local manifest; use --overwrite to replace it");
        }
        rkl_log("create: overwriting " + kernel.kernel_id());
        if (cb) cb("Overwriting kernel " + kernel.kernel_id());
    }
    return duplicates;
}

std::unique_ptr<RemoteSession> KernelManager::open_session(const KernelDescriptor& kernel,
                                                           const std::string& user,
                                                           const std::optional<std::string>& ssh_key,
                                                           StatusCallback cb) {
    const auto& remote = config_.remote();
    SessionTarget target;
    target.host = kernel.host();
    target.user = user;
    target.port = remote.port;
    target.timeout = remote.timeout;
    target.command_timeout = remote.command_timeout;
    target.ssh_key_path = ssh_key ? ssh_key : remote.ssh_key_path;
    target.known_hosts = remote.known_hosts;
    target.strict_host_key_checking = remote.strict_host_key_checking;

    auto opened = sessions_(target, cb);
    if (opened.is_err() || !opened.value) {
        throw TransportError(kernel.kernel_id(), kernel.host(),
                             opened.error.empty() ? "could not open session" : opened.error);
    }
    return std::move(opened.value);
}

bool KernelManager::ensure_venv(RemoteSession& session, const KernelDescriptor& kernel,
                                const RemoteLayout& layout, StatusCallback cb) {
    const std::string& dir = *layout.venv_dir;

    auto probe = session.run(RemoteCommand("test", {"-d", dir}));
    if (probe.transport_failed()) {
        throw TransportError(kernel.kernel_id(), kernel.host(),
                             "checking for venv: " + probe.stderr_data);
    }
    if (probe.success()) {
        if (cb) cb("Using existing venv " + dir);
        return false;
    }
    if (probe.exit_code != 1) {
        throw RemoteCommandError(kernel.kernel_id(), kernel.host(), "venv check",
                                 probe.exit_code, error_excerpt(probe));
    }

    if (cb) cb(fmt::format("Creating venv {} with {}", dir, kernel.python_cmd()));
    checked(session, kernel, "venv creation",
            RemoteCommand("virtualenv", {"-p", kernel.python_cmd(), dir}));
    return true;
}

bool KernelManager::needs_escalation(RemoteSession& session, const KernelDescriptor& kernel) {
    // TODO: check write permission on the interpreter's site-packages instead of its location
    auto located = checked(session, kernel, "interpreter lookup",
                           RemoteCommand("command", {"-v", kernel.python_cmd()}));
    std::string path = located.stdout_data;
    trim(path);
    rkl_log(fmt::format("create: {} resolves to '{}'", kernel.python_cmd(), path));
    return starts_with(path, SYSTEM_PREFIX);
}

std::set<std::string> KernelManager::parse_kernelspec_list(const std::string& output) {
    std::set<std::string> names;

    auto doc = nlohmann::json::parse(output, nullptr, false);
    if (!doc.is_discarded() && doc.is_object()) {
        auto specs = doc.find("kernelspecs");
        if (specs != doc.end() && specs->is_object()) {
            for (auto it = specs->begin(); it != specs->end(); ++it) {
                names.insert(lowercase(it.key()));
            }
        }
        return names;
    }

    // Plain table: "Available kernels:" then "  <name>    <path>"
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        trim(line);
        if (line.empty() || line.back() == ':') continue;
        std::istringstream words(line);
        std::string name;
        if (words >> name) names.insert(lowercase(name));
    }
    return names;
}

std::set<std::string> KernelManager::remote_kernelspecs(RemoteSession& session,
                                                        const KernelDescriptor& kernel,
                                                        const RemoteLayout& layout) {
    auto listed = checked(session, kernel, "kernelspec listing",
                          RemoteCommand(layout.python, {"-m", "jupyter", "kernelspec", "list", "--json"}));
    return parse_kernelspec_list(listed.stdout_data);
}

void KernelManager::install_requirements(RemoteSession& session, const KernelDescriptor& kernel,
                                         const RemoteLayout& layout, const fs::path& requirements_file,
                                         bool sudo, StatusCallback cb) {
    if (cb) cb("Uploading " + requirements_file.string());
    auto copied = session.upload(requirements_file, layout.requirements_path);
    if (copied.transport_failed()) {
        throw TransportError(kernel.kernel_id(), kernel.host(),
                             "requirements upload: " + copied.stderr_data);
    }
    if (copied.failed()) {
        throw RemoteCommandError(kernel.kernel_id(), kernel.host(), "requirements upload",
                                 copied.exit_code, error_excerpt(copied));
    }

    if (cb) cb("Installing requirements");
    RemoteCommand install(layout.python, {"-m", "pip", "install", "-r", layout.requirements_path});
    checked(session, kernel, "requirements install", install.escalate(sudo));
}

void KernelManager::commit_record(const KernelDescriptor& kernel, const std::string& user,
                                  const std::string& venv_root, bool overwrite) {
    auto guard = store_.lock();
    auto manifest = store_.load();

    // Another process may have claimed the id while we were provisioning
    if (manifest.count(kernel.kernel_id()) && !overwrite) {
        throw AlreadyExistsError(kernel.kernel_id(), kernel.host(),
            "was added to the local manifest while provisioning; use --overwrite to replace it");
    }

    manifest[kernel.kernel_id()] =
        ManifestRecord::from_descriptor(kernel, user, config_.kernel().language, venv_root);
    store_.save(manifest);
}

CreateOutcome KernelManager::create(const KernelDescriptor& kernel,
                                    const std::optional<std::string>& ssh_key,
                                    const std::optional<fs::path>& requirements_file,
                                    const CreateOptions& options,
                                    StatusCallback cb) {
    return attributed(kernel, [&] { return run_create(kernel, ssh_key, requirements_file, options, cb); });
}

CreateOutcome KernelManager::run_create(const KernelDescriptor& kernel,
                                        const std::optional<std::string>& ssh_key,
                                        const std::optional<fs::path>& requirements_file,
                                        const CreateOptions& options,
                                        StatusCallback cb) {
    rkl_log("========================================");
    rkl_log(fmt::format("=== create {} overwrite={} ===", kernel.to_string(), options.overwrite));

    if (requirements_file && !fs::is_regular_file(*requirements_file)) {
        throw ValidationError(kernel.kernel_id(), kernel.host(),
                              "requirements file not found: " + requirements_file->string());
    }

    CreateOutcome outcome;
    outcome.duplicate_ids = check_local_collisions(kernel, options.overwrite, cb);
    outcome.overwrote = store_.find(kernel.kernel_id()).has_value();

    const std::string user = options.remote_username.empty() ? config_.remote().user
                                                             : options.remote_username;
    const std::string venv_root = options.remote_venv_root_dir.empty() ? config_.remote().venv_root
                                                                       : options.remote_venv_root_dir;
    auto layout = RemoteLayout::resolve(kernel, venv_root);

    auto session = open_session(kernel, user, ssh_key, cb);

    if (layout.venv_dir) {
        outcome.venv_created = ensure_venv(*session, kernel, layout, cb);
    } else {
        outcome.escalated = needs_escalation(*session, kernel);
        if (outcome.escalated && cb) cb("System interpreter: installing with sudo");
    }
    bool sudo = outcome.escalated;

    if (cb) cb(fmt::format("Installing {} into {}", config_.kernel().package, layout.python));
    RemoteCommand install_pkg(layout.python, {"-m", "pip", "install", config_.kernel().package});
    checked(*session, kernel, "kernel package install", install_pkg.escalate(sudo));

    auto specs = remote_kernelspecs(*session, kernel, layout);
    if (specs.count(lowercase(kernel.kernel_id())) && !options.overwrite) {
        throw RemoteAlreadyExistsError(kernel.kernel_id(), kernel.host(),
            "kernelspec already registered on the remote host; use --overwrite to replace it");
    }

    if (cb) cb("Registering kernelspec " + kernel.kernel_id());
    RemoteCommand register_spec(layout.python, {"-m", "ipykernel", "install",
                                                "--name=" + kernel.kernel_id(),
                                                "--display-name=" + kernel.display_name()});
    // venvs and user-owned interpreters keep the kernelspec under their own prefix
    if (!sudo) register_spec.arg("--sys-prefix");
    checked(*session, kernel, "kernelspec registration", register_spec.escalate(sudo));

    if (requirements_file) {
        install_requirements(*session, kernel, layout, *requirements_file, sudo, cb);
    }

    session->close();

    commit_record(kernel, user, venv_root, options.overwrite);
    if (cb) cb("Recorded " + kernel.kernel_id() + " in " + store_.path().string());

    if (outcome.overwrote) {
        registrar_.uninstall(kernel.kernel_id());
    }
    registrar_.install(kernel.kernel_id());

    rkl_log(fmt::format("create: {} done (venv_created={} escalated={} overwrote={})",
                        kernel.kernel_id(), outcome.venv_created, outcome.escalated, outcome.overwrote));
    return outcome;
}

bool KernelManager::deregister_remote(RemoteSession& session, const KernelDescriptor& kernel,
                                      const std::string& venv_root, StatusCallback cb) {
    auto layout = RemoteLayout::resolve(kernel, venv_root);

    bool sudo = false;
    if (!layout.venv_dir) {
        auto located = session.run(RemoteCommand("command", {"-v", kernel.python_cmd()}));
        std::string path = located.stdout_data;
        trim(path);
        sudo = located.success() && starts_with(path, SYSTEM_PREFIX);
    }

    RemoteCommand drop(layout.python, {"-m", "jupyter", "kernelspec", "remove", "-f", kernel.kernel_id()});
    auto result = session.run(drop.escalate(sudo));
    if (result.failed()) {
        std::string msg = fmt::format("Could not remove remote kernelspec {} (exit {}): {}",
                                      kernel.kernel_id(), result.exit_code, error_excerpt(result));
        rkl_log("WARNING " + msg);
        if (cb) cb(msg);
        return false;
    }
    if (cb) cb("Removed remote kernelspec " + kernel.kernel_id());
    return true;
}

void KernelManager::remove(const KernelDescriptor& kernel,
                           const std::optional<std::string>& ssh_key,
                           const RemoveOptions& options,
                           StatusCallback cb) {
    attributed(kernel, [&] { run_remove(kernel, ssh_key, options, cb); });
}

void KernelManager::run_remove(const KernelDescriptor& kernel,
                               const std::optional<std::string>& ssh_key,
                               const RemoveOptions& options,
                               StatusCallback cb) {
    rkl_log("========================================");
    rkl_log(fmt::format("=== remove {} ===", kernel.to_string()));

    auto guard = store_.lock();
    auto manifest = store_.load();

    auto it = manifest.find(kernel.kernel_id());
    if (it == manifest.end()) {
        throw NotFoundError(kernel.kernel_id(), kernel.host(), "not in the local manifest");
    }

    if (options.remote_deregister) {
        std::string user = it->second.remote_user.empty() ? config_.remote().user
                                                          : it->second.remote_user;
        // Older records carry no venv_root; they were created under the configured one
        std::string venv_root = it->second.venv_root.value_or(config_.remote().venv_root);
        auto session = open_session(kernel, user, ssh_key, cb);
        deregister_remote(*session, kernel, venv_root, cb);
    }

    registrar_.uninstall(kernel.kernel_id());

    manifest.erase(it);
    store_.save(manifest);
    if (cb) cb("Removed " + kernel.kernel_id() + " from " + store_.path().string());
}
