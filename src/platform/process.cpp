#include "process.hpp"
#include "platform.hpp"
#include "socket_util.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <cerrno>
#include <fcntl.h>
#include <stdexcept>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() = default;

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), exited_(other.exited_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        exited_ = other.exited_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::reap(int status) {
    exited_ = true;
    exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return true;
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (exited_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        if (waitpid(pid_, &status, 0) == pid_) reap(status);
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        int status;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            reap(status);
            return exit_code_;
        }
        if (ret < 0) return -1;
        sleep_ms(100);
        elapsed += 100;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || exited_) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reap(status);
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) reap(status);
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    int stdio_fd,
                    const std::string& stderr_log) {
    ProcessHandle handle;

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child process
        if (stdio_fd >= 0) {
            dup2(stdio_fd, STDIN_FILENO);
            dup2(stdio_fd, STDOUT_FILENO);
            if (stdio_fd > STDERR_FILENO) close(stdio_fd);
        } else {
            close(STDIN_FILENO);
        }

        if (!stderr_log.empty()) {
            int fd = open(stderr_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        // Build argv array
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    return handle;
}

// ── run_capture ──────────────────────────────────────────────

CapturedOutput run_capture(const std::string& program,
                           const std::vector<std::string>& args,
                           const std::string& stderr_log) {
    socket_t fds[2];
    make_socket_pair(fds);

    ProcessHandle child = spawn(program, args, fds[1], stderr_log);
    close_socket(fds[1]);
    if (!child.valid()) {
        close_socket(fds[0]);
        throw std::runtime_error("Failed to spawn " + program);
    }

    CapturedOutput result;
    char buf[4096];
    while (true) {
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close_socket(fds[0]);

    result.exit_code = child.wait();
    return result;
}

} // namespace platform
