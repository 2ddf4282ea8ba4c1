#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Finalizes (or withdraws) a kernel's registration with the local notebook
// front end. Both calls throw RegistrarError on failure.
class KernelRegistrar {
public:
    virtual ~KernelRegistrar() = default;

    virtual void install(const std::string& kernel_id) = 0;
    virtual void uninstall(const std::string& kernel_id) = 0;
};

// Runs the external registrar program: "[sudo] <program> install|uninstall <id>".
// Its output goes to the debug log.
class ProcessRegistrar : public KernelRegistrar {
public:
    explicit ProcessRegistrar(const RegistrarConfig& config);

    void install(const std::string& kernel_id) override;
    void uninstall(const std::string& kernel_id) override;

    // Program and arguments for one invocation (exposed for diagnostics).
    std::vector<std::string> command_for(const std::string& action,
                                         const std::string& kernel_id) const;

private:
    void invoke(const std::string& action, const std::string& kernel_id);

    RegistrarConfig config_;
};
