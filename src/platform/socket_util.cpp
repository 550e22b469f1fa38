#include "socket_util.hpp"
#include <fmt/format.h>
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <sys/time.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#  include <csignal>
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#else
    // A peer closing mid-write must surface as EPIPE, not kill the process
    signal(SIGPIPE, SIG_IGN);
#endif
}

void set_nonblocking(socket_t sock, bool enabled) {
#ifdef _WIN32
    u_long mode = enabled ? 1 : 0;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0) return;
    fcntl(sock, F_SETFL, enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK));
#endif
}

void set_io_timeout(socket_t sock, int timeout_ms) {
#ifdef _WIN32
    DWORD tv = static_cast<DWORD>(timeout_ms);
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&tv), sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, reinterpret_cast<const char*>(&tv), sizeof(tv));
#else
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

static int last_socket_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

static bool connect_in_progress(int err) {
#ifdef _WIN32
    return err == WSAEWOULDBLOCK;
#else
    return err == EINPROGRESS;
#endif
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    init_networking();

    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        return Result<socket_t>::Err(ErrorKind::Transport,
            fmt::format("cannot resolve {}: {}", host, gai_strerror(gai)));
    }

    std::string last_error = "no addresses";
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == MCPCORE_INVALID_SOCKET) {
            last_error = strerror(last_socket_error());
            continue;
        }

        set_nonblocking(sock);
        int ret = connect(sock, ai->ai_addr, static_cast<int>(ai->ai_addrlen));
        if (ret != 0 && connect_in_progress(last_socket_error())) {
            if (poll_socket(sock, POLLOUT, timeout_ms) == 0) {
                last_error = fmt::format("timed out after {}ms", timeout_ms);
                close_socket(sock);
                continue;
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&so_error), &len);
            ret = so_error == 0 ? 0 : -1;
            if (ret != 0) last_error = strerror(so_error);
        } else if (ret != 0) {
            last_error = strerror(last_socket_error());
        }

        if (ret == 0) {
            set_nonblocking(sock, false);
            set_io_timeout(sock, timeout_ms);
            freeaddrinfo(res);
            return Result<socket_t>::Ok(sock);
        }
        close_socket(sock);
    }

    freeaddrinfo(res);
    return Result<socket_t>::Err(ErrorKind::Transport,
        fmt::format("cannot connect to {}:{}: {}", host, port, last_error));
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

} // namespace platform
