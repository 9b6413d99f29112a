#pragma once

// Socket helpers used by the libssh2 transport.

#include <poll.h>
#include <string>

using socket_t = int;
#define FLEETWATCH_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host:port and start a non-blocking connect, waiting up to
// timeout_ms for it to finish. Returns the socket, or
// FLEETWATCH_INVALID_SOCKET with `error` filled in. `timed_out` is set
// when the wait expired.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
                     std::string& error, bool& timed_out);

} // namespace platform
