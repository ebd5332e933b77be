#pragma once

// Cross-platform socket utilities.

#include <string>
#include <core/types.hpp>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define JUMPLINE_INVALID_SOCKET INVALID_SOCKET
#else
#  include <poll.h>
   using socket_t = int;
#  define JUMPLINE_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host (name or address) and connect with a timeout.
// The returned socket is in blocking mode.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Connected pair of local stream sockets (AF_UNIX on Unix).
Result<void> socket_pair(socket_t fds[2]);

// Enable TCP keepalive probing on a connected socket.
void enable_keepalive(socket_t sock);

} // namespace platform
