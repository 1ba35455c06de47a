#pragma once

// Cross-platform socket utilities.

#include <string>
#include <cstddef>
#include <core/types.hpp>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define ROXY_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define ROXY_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Switch a socket between non-blocking and blocking mode.
void set_nonblocking(socket_t sock, bool enable = true);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Shut down both directions without releasing the descriptor. Wakes any
// thread blocked in accept/recv on it.
void shutdown_socket(socket_t sock);

// Bind and listen on address:port (SO_REUSEADDR set). port 0 picks an
// ephemeral port.
Result<socket_t> open_listener(const std::string& address, int port, int backlog);

// Port a bound socket ended up on, or -1.
int bound_port(socket_t sock);

// Resolve host and connect, giving up after timeout_ms. The returned socket
// is in blocking mode.
Result<socket_t> connect_with_timeout(const std::string& host, int port, int timeout_ms);

// Receive up to len bytes. Returns bytes read, 0 on EOF, -1 on error.
long recv_some(socket_t sock, char* buf, size_t len);

// Write the whole buffer. False on error or peer reset.
bool send_all(socket_t sock, const char* buf, size_t len);

// Check if a TCP port on host is accepting connections.
bool is_port_open(const std::string& host, int port);

// Text for the last socket error (errno / WSAGetLastError).
std::string last_socket_error();

} // namespace platform
