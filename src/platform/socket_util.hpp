#pragma once

#include <string>
#include <poll.h>
#include <core/types.hpp>

#define KTUN_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(int sock);

// Restore blocking mode.
void set_blocking(int sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(int sock, short events, int timeout_ms);

// Resolve host and open a TCP connection within timeout_ms.
// Returns a connected blocking socket, or the error (resolve/refused/timeout).
Result<int> tcp_connect(const std::string& host, int port, int timeout_ms);

// Close a socket.
void close_socket(int sock);

} // namespace platform
