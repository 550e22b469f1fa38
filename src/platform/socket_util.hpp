#pragma once

// Cross-platform socket utilities.

#include <string>
#include <core/types.hpp>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define MCPCORE_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define MCPCORE_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, ignore SIGPIPE on Unix).
void init_networking();

// Switch a socket between blocking and non-blocking mode.
void set_nonblocking(socket_t sock, bool enabled = true);

// Send/receive timeout for blocking IO on the socket.
void set_io_timeout(socket_t sock, int timeout_ms);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve host and connect over TCP, trying each address in turn.
// The returned socket is in blocking mode.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Owns a socket for the length of a scope.
class SocketGuard {
public:
    explicit SocketGuard(socket_t sock) : sock_(sock) {}
    ~SocketGuard() { if (sock_ != MCPCORE_INVALID_SOCKET) close_socket(sock_); }

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    socket_t get() const { return sock_; }

private:
    socket_t sock_;
};

} // namespace platform
