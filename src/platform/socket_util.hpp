#pragma once

#include <poll.h>

using socket_t = int;
#define BRIDGECTL_INVALID_SOCKET (-1)

namespace platform {

// Connected AF_UNIX stream pair. Throws std::runtime_error on failure.
void make_socket_pair(socket_t fds[2]);

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
