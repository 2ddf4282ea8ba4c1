#pragma once

#include <string>
#include <vector>

namespace platform {

// Handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running. Reaps the child if it has exited;
    // wait() then returns the recorded status.
    bool running() const;

    // Wait for the process to exit. Returns its exit code, or -1 if it was
    // killed by a signal or did not exit within timeout_ms.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // SIGTERM, then SIGKILL after 2s.
    void terminate();

private:
    int pid_ = -1;
    mutable bool reaped_ = false;
    mutable int status_ = -1;           // exit code once reaped, -1 for a signal

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& stderr_log);
};

// Spawn a child process, resolving program through PATH.
// stderr_log: if non-empty, redirect child's stdout and stderr to this file (append mode).
// The child inherits stdin so that sudo can prompt on the terminal.
// A child that cannot exec its program exits with 127.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log = "");

} // namespace platform
