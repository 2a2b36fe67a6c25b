#include "tunnel_session.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <mutex>

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

static void init_libssh2() {
    static std::once_flag once;
    std::call_once(once, [] { libssh2_init(0); });
}

static int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// ── TunnelChannel ───────────────────────────────────────────

TunnelChannel::TunnelChannel(LIBSSH2_SESSION* session, LIBSSH2_CHANNEL* channel, socket_t sock)
    : session_(session), channel_(channel), sock_(sock) {
}

TunnelChannel::~TunnelChannel() {
    if (!closed_) close();
    if (channel_) libssh2_channel_free(channel_);
}

bool TunnelChannel::read(std::string& out, int wait_ms) {
    char buf[SSH_READ_BUF_SIZE];
    auto deadline = Clock::now() + std::chrono::milliseconds(wait_ms);
    bool got_data = false;

    while (true) {
        ssize_t n = libssh2_channel_read(channel_, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            got_data = true;
            continue;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            throw TunnelError(fmt::format("SSH channel read error ({})", n));
        }
        if (libssh2_channel_eof(channel_)) return got_data;
        if (got_data) return true;

        int left = remaining_ms(deadline);
        if (left <= 0) return true;
        platform::poll_socket(sock_, POLLIN, left < 50 ? left : 50);
    }
}

std::string TunnelChannel::read_stderr() {
    std::string err;
    char buf[SSH_READ_BUF_SIZE];
    while (true) {
        ssize_t n = libssh2_channel_read_stderr(channel_, buf, sizeof(buf));
        if (n <= 0) break;
        err.append(buf, static_cast<size_t>(n));
    }
    return err;
}

int TunnelChannel::close() {
    closed_ = true;
    int rc;
    auto deadline = Clock::now() + std::chrono::seconds(5);
    while ((rc = libssh2_channel_close(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        if (remaining_ms(deadline) == 0) return -1;
        platform::sleep_ms(10);
    }
    if (rc != 0) return -1;
    while (libssh2_channel_wait_closed(channel_) == LIBSSH2_ERROR_EAGAIN) {
        if (remaining_ms(deadline) == 0) break;
        platform::sleep_ms(10);
    }
    return libssh2_channel_get_exit_status(channel_);
}

// ── TunnelSession ───────────────────────────────────────────

TunnelSession::TunnelSession(BridgeProfile profile, fs::path helper_path)
    : profile_(std::move(profile)), helper_path_(std::move(helper_path)) {
}

TunnelSession::~TunnelSession() {
    close();
}

void TunnelSession::connect(int timeout_secs) {
    init_libssh2();
    auto deadline = Clock::now() + std::chrono::seconds(timeout_secs);

    socket_t fds[2];
    try {
        platform::make_socket_pair(fds);
    } catch (const std::runtime_error& e) {
        throw TunnelNotAvailableError(e.what());
    }

    // The helper speaks the SSH stream on its stdin/stdout.
    std::string target = fmt::format("stdio://localhost:{}", profile_.ssh_port);
    helper_ = platform::spawn(helper_path_.string(),
                              {websocket_url(profile_.proxy_url), target},
                              fds[1], "/dev/null");
    platform::close_socket(fds[1]);
    sock_ = fds[0];
    if (!helper_.valid()) {
        close();
        throw TunnelNotAvailableError("Failed to start " + helper_path_.string());
    }
    platform::set_nonblocking(sock_);

    session_ = libssh2_session_init();
    if (!session_) {
        close();
        throw TunnelNotAvailableError("Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (remaining_ms(deadline) == 0) break;
        platform::poll_socket(sock_, POLLIN, 100);
    }
    if (rc != 0) {
        bridge_log(fmt::format("tunnel: handshake with {} failed rc={}", profile_.name, rc));
        close();
        throw TunnelNotAvailableError("SSH handshake through " + profile_.proxy_url + " failed");
    }

    if (!authenticate(remaining_ms(deadline) / 1000 + 1)) {
        close();
        throw TunnelNotAvailableError("SSH authentication as " + profile_.ssh_user + " failed");
    }
    bridge_log(fmt::format("tunnel: connected to {} as {}", profile_.name, profile_.ssh_user));
}

bool TunnelSession::authenticate(int timeout_secs) {
    auto deadline = Clock::now() + std::chrono::seconds(timeout_secs);
    const std::string& user = profile_.ssh_user;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned>(user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        if (remaining_ms(deadline) == 0) return false;
        platform::sleep_ms(50);
    }
    // Servers accepting "none" auth are already done
    if (libssh2_userauth_authenticated(session_)) return true;

    std::string methods = auth_list ? auth_list : "";
    if (!methods.empty() && methods.find("publickey") == std::string::npos) {
        bridge_log("tunnel: server offers no publickey auth: " + methods);
        return false;
    }

    // ssh-agent identities
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (agent) {
        if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                int rc;
                while ((rc = libssh2_agent_userauth(agent, user.c_str(), identity)) ==
                       LIBSSH2_ERROR_EAGAIN) {
                    if (remaining_ms(deadline) == 0) break;
                    platform::sleep_ms(50);
                }
                if (rc == 0) {
                    libssh2_agent_disconnect(agent);
                    libssh2_agent_free(agent);
                    return true;
                }
                prev = identity;
            }
        }
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }

    // Default key files
    fs::path ssh_dir = platform::home_dir() / ".ssh";
    for (const char* name : {"id_ed25519", "id_ecdsa", "id_rsa"}) {
        fs::path key = ssh_dir / name;
        if (!fs::exists(key)) continue;
        int rc;
        while ((rc = libssh2_userauth_publickey_fromfile(session_, user.c_str(), nullptr,
                                                         key.c_str(), "")) ==
               LIBSSH2_ERROR_EAGAIN) {
            if (remaining_ms(deadline) == 0) break;
            platform::sleep_ms(50);
        }
        if (rc == 0) return true;
        bridge_log(fmt::format("tunnel: key {} rejected rc={}", key.string(), rc));
    }
    return false;
}

LIBSSH2_CHANNEL* TunnelSession::start_channel(const std::string& command, int timeout_secs) {
    if (!session_) throw TunnelError("Tunnel session is not connected");
    auto deadline = Clock::now() + std::chrono::seconds(timeout_secs);

    LIBSSH2_CHANNEL* channel = nullptr;
    while ((channel = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN ||
            remaining_ms(deadline) == 0) {
            throw TunnelError("Failed to open SSH channel");
        }
        platform::poll_socket(sock_, POLLIN, 50);
    }

    int rc;
    while ((rc = libssh2_channel_exec(channel, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        if (remaining_ms(deadline) == 0) break;
        platform::poll_socket(sock_, POLLIN, 50);
    }
    if (rc != 0) {
        libssh2_channel_free(channel);
        throw TunnelError("Failed to exec command on SSH channel");
    }
    return channel;
}

RemoteResult TunnelSession::exec(const std::string& command, int timeout_secs) {
    int effective_timeout = timeout_secs > 0 ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = Clock::now() + std::chrono::seconds(effective_timeout);

    TunnelChannel channel(session_, start_channel(command, effective_timeout), sock_);

    std::string out;
    std::string err;
    while (channel.read(out, 200)) {
        err += channel.read_stderr();
        if (remaining_ms(deadline) == 0) {
            throw TunnelError(fmt::format("Command timed out after {}s", effective_timeout));
        }
    }
    err += channel.read_stderr();

    RemoteResult result{channel.close(), out, err};
    bridge_log_remote("tunnel", command, result);
    return result;
}

std::unique_ptr<TunnelChannel> TunnelSession::open_exec(const std::string& command) {
    return std::make_unique<TunnelChannel>(session_, start_channel(command, SSH_CMD_TIMEOUT_SECS),
                                           sock_);
}

void TunnelSession::close() {
    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != BRIDGECTL_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = BRIDGECTL_INVALID_SOCKET;
    }
    if (helper_.valid()) helper_.terminate();
}
