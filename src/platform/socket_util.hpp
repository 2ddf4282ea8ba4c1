#pragma once

#include <string>
#include <poll.h>
#include <core/types.hpp>

using socket_t = int;
#define RKL_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host (IPv4, IPv6 or name) and open a non-blocking TCP connection,
// trying each resolved address in turn until one connects within timeout_ms.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Enable TCP keepalive with a short probe interval.
void enable_keepalive(socket_t sock);

} // namespace platform
