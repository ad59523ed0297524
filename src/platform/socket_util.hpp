#pragma once

// Socket helpers used by the SSH transport.

#include <poll.h>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define DELTA_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve host (IPv4, IPv6 or name) and open a non-blocking TCP connection,
// waiting up to timeout_ms for it to complete. Tries every resolved address.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Enable TCP keepalive probing on a connected socket.
void enable_keepalive(socket_t sock);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
