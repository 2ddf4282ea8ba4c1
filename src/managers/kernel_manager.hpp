#pragma once

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <core/kernel_descriptor.hpp>
#include <ssh/remote_session.hpp>
#include "manifest_store.hpp"
#include "kernel_registrar.hpp"

namespace fs = std::filesystem;

// Remote locations for one kernel.
//   with venv:    venv_dir = <root>/<venv>, python = <venv_dir>/bin/python
//   without venv: python = the descriptor's interpreter, resolved on PATH
// pip and jupyter always run as "<python> -m ..." so they hit the same environment.
struct RemoteLayout {
    std::optional<std::string> venv_dir;
    std::string python;
    std::string requirements_path;

    static RemoteLayout resolve(const KernelDescriptor& kernel, const std::string& venv_root);
};

// Creates and removes remote kernels.
//
// create() chains several non-transactional remote steps. Each step's result
// is checked and the first failure aborts the rest; nothing is rolled back, so
// a failed create can leave a venv or packages behind on the host. Re-running
// is safe: the venv is reused and an existing kernelspec is replaced when
// overwrite is set. The manifest is only written after every remote step has
// succeeded.
class KernelManager {
public:
    KernelManager(const Config& config, const ManifestStore& store,
                  KernelRegistrar& registrar, SessionFactory sessions);

    // Options seeded from configuration (user, venv root).
    CreateOptions default_create_options() const;

    CreateOutcome create(const KernelDescriptor& kernel,
                         const std::optional<std::string>& ssh_key = std::nullopt,
                         const std::optional<fs::path>& requirements_file = std::nullopt,
                         const CreateOptions& options = CreateOptions{},
                         StatusCallback cb = nullptr);

    void remove(const KernelDescriptor& kernel,
                const std::optional<std::string>& ssh_key = std::nullopt,
                const RemoveOptions& options = RemoveOptions{},
                StatusCallback cb = nullptr);

    std::vector<KernelDescriptor> list(const std::optional<std::string>& filter_host = std::nullopt) const;

    // Kernel names from "jupyter kernelspec list" (--json output or the plain table).
    static std::set<std::string> parse_kernelspec_list(const std::string& output);

private:
    const Config& config_;
    const ManifestStore& store_;
    KernelRegistrar& registrar_;
    SessionFactory sessions_;

    CreateOutcome run_create(const KernelDescriptor& kernel,
                             const std::optional<std::string>& ssh_key,
                             const std::optional<fs::path>& requirements_file,
                             const CreateOptions& options, StatusCallback cb);
    void run_remove(const KernelDescriptor& kernel, const std::optional<std::string>& ssh_key,
                    const RemoveOptions& options, StatusCallback cb);

    // Returns the ids that already describe the same environment.
    std::vector<std::string> check_local_collisions(const KernelDescriptor& kernel,
                                                    bool overwrite, StatusCallback cb);

    std::unique_ptr<RemoteSession> open_session(const KernelDescriptor& kernel,
                                                const std::string& user,
                                                const std::optional<std::string>& ssh_key,
                                                StatusCallback cb);

    bool ensure_venv(RemoteSession& session, const KernelDescriptor& kernel,
                     const RemoteLayout& layout, StatusCallback cb);
    bool needs_escalation(RemoteSession& session, const KernelDescriptor& kernel);
    std::set<std::string> remote_kernelspecs(RemoteSession& session, const KernelDescriptor& kernel,
                                             const RemoteLayout& layout);
    void install_requirements(RemoteSession& session, const KernelDescriptor& kernel,
                              const RemoteLayout& layout, const fs::path& requirements_file,
                              bool sudo, StatusCallback cb);
    void commit_record(const KernelDescriptor& kernel, const std::string& user,
                       const std::string& venv_root, bool overwrite);
    bool deregister_remote(RemoteSession& session, const KernelDescriptor& kernel,
                           const std::string& venv_root, StatusCallback cb);

    // Run a step that must succeed: transport failure → TransportError,
    // non-zero exit → RemoteCommandError.
    SSHResult checked(RemoteSession& session, const KernelDescriptor& kernel,
                      const std::string& step, const RemoteCommand& command);
};
