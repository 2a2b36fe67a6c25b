#pragma once

#include <string>
#include <vector>

namespace platform {

// Owning handle to a spawned child process. Move-only; the destructor does
// not kill the child, callers terminate() explicitly.
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

    // Wait for the process to exit. Returns exit code, or -1 on timeout or
    // abnormal termination. timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // SIGTERM, then SIGKILL if the child has not exited after 2s. Always reaps.
    void terminate();

private:
    bool reap(int status);

    int pid_ = -1;
    bool exited_ = false;
    int exit_code_ = -1;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               int stdio_fd,
                               const std::string& stderr_log);
};

// Spawn a child process.
// stdio_fd: if >= 0, becomes the child's stdin and stdout (e.g. one end of a
//           socketpair); otherwise the child's stdin is closed.
// stderr_log: if non-empty, redirect child's stderr to this file (append mode).
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    int stdio_fd = -1,
                    const std::string& stderr_log = "");

struct CapturedOutput {
    int exit_code = -1;
    std::string output;     // stdout only
};

// Run a local program to completion and capture its stdout. stderr goes
// to stderr_log when given. Throws std::runtime_error if it cannot be spawned.
CapturedOutput run_capture(const std::string& program,
                           const std::vector<std::string>& args,
                           const std::string& stderr_log = "");

} // namespace platform
