#pragma once

#include <memory>
#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <platform/process.hpp>
#include <platform/socket_util.hpp>
#include "tunnel_config.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Output of a long-running remote command, read in bounded waits.
class RemoteStream {
public:
    virtual ~RemoteStream() = default;

    // Append whatever stdout arrives within wait_ms. Returns false once the
    // remote side has closed and nothing is left.
    virtual bool read(std::string& out, int wait_ms) = 0;

    // Stop the command. Returns its exit status, -1 if unavailable.
    virtual int close() = 0;
};

// One exec channel on a TunnelSession. Freed on destruction.
class TunnelChannel : public RemoteStream {
public:
    TunnelChannel(LIBSSH2_SESSION* session, LIBSSH2_CHANNEL* channel, socket_t sock);
    ~TunnelChannel() override;

    TunnelChannel(const TunnelChannel&) = delete;
    TunnelChannel& operator=(const TunnelChannel&) = delete;

    // Throws TunnelError on a channel error.
    bool read(std::string& out, int wait_ms) override;

    // Drain pending stderr without waiting.
    std::string read_stderr();

    // Close and collect the exit status (-1 if unavailable).
    int close() override;

private:
    LIBSSH2_SESSION* session_;
    LIBSSH2_CHANNEL* channel_;
    socket_t sock_;
    bool closed_ = false;
};

// SSH session to <user>@localhost:<port> carried over a socketpair whose
// other end is the helper's stdin/stdout. The helper does the actual
// WebSocket hop to the Bridge. Host keys are not checked.
class TunnelSession {
public:
    TunnelSession(BridgeProfile profile, std::filesystem::path helper_path);
    ~TunnelSession();

    TunnelSession(const TunnelSession&) = delete;
    TunnelSession& operator=(const TunnelSession&) = delete;

    // Spawn the helper, handshake and authenticate (ssh-agent, then
    // ~/.ssh/id_ed25519, id_ecdsa, id_rsa). Throws TunnelNotAvailableError.
    void connect(int timeout_secs);

    // Run a command to completion. Throws TunnelError on channel failure or
    // when timeout_secs elapses.
    RemoteResult exec(const std::string& command, int timeout_secs);

    // Start a long-running command and hand back its channel.
    std::unique_ptr<TunnelChannel> open_exec(const std::string& command);

    bool connected() const { return session_ != nullptr; }

    void close();

private:
    LIBSSH2_CHANNEL* start_channel(const std::string& command, int timeout_secs);
    bool authenticate(int timeout_secs);

    BridgeProfile profile_;
    std::filesystem::path helper_path_;
    platform::ProcessHandle helper_;
    LIBSSH2_SESSION* session_ = nullptr;
    socket_t sock_ = BRIDGECTL_INVALID_SOCKET;
};
