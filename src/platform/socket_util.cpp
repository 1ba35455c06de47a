#include "socket_util.hpp"
#include <fmt/format.h>
#include <chrono>
#include <cstring>
#include <cerrno>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <sys/types.h>
#  include <netinet/in.h>
#  include <arpa/inet.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

#ifndef MSG_NOSIGNAL
#  define MSG_NOSIGNAL 0
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
#endif
}

void set_nonblocking(socket_t sock, bool enable) {
#ifdef _WIN32
    u_long mode = enable ? 1 : 0;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK));
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

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

void shutdown_socket(socket_t sock) {
#ifdef _WIN32
    shutdown(sock, SD_BOTH);
#else
    shutdown(sock, SHUT_RDWR);
#endif
}

std::string last_socket_error() {
#ifdef _WIN32
    return fmt::format("winsock error {}", WSAGetLastError());
#else
    return std::strerror(errno);
#endif
}

Result<socket_t> open_listener(const std::string& address, int port, int backlog) {
    init_networking();

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return Result<socket_t>::Err(fmt::format("invalid bind address '{}'", address));
    }

    socket_t fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd == ROXY_INVALID_SOCKET) {
        return Result<socket_t>::Err("socket() failed: " + last_socket_error());
    }

    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR,
               reinterpret_cast<const char*>(&reuse), sizeof(reuse));

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = last_socket_error();
        close_socket(fd);
        return Result<socket_t>::Err(fmt::format("bind() failed for {}:{}: {}", address, port, err));
    }

    if (listen(fd, backlog) < 0) {
        std::string err = last_socket_error();
        close_socket(fd);
        return Result<socket_t>::Err(fmt::format("listen() failed for {}:{}: {}", address, port, err));
    }

    return Result<socket_t>::Ok(fd);
}

int bound_port(socket_t sock) {
    struct sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(sock, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        return -1;
    }
    return ntohs(addr.sin_port);
}

using Deadline = std::chrono::steady_clock::time_point;

static int ms_until(Deadline deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// Non-blocking connect to one resolved address, waiting until deadline.
static socket_t try_connect(const struct addrinfo* ai, Deadline deadline, std::string& err) {
    socket_t fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd == ROXY_INVALID_SOCKET) {
        err = "socket() failed: " + last_socket_error();
        return ROXY_INVALID_SOCKET;
    }

    set_nonblocking(fd, true);
    int rc = connect(fd, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
    if (rc < 0) {
#ifdef _WIN32
        bool pending = WSAGetLastError() == WSAEWOULDBLOCK;
#else
        bool pending = errno == EINPROGRESS;
#endif
        if (!pending) {
            err = last_socket_error();
            close_socket(fd);
            return ROXY_INVALID_SOCKET;
        }

        // poll returns early on EINTR; only the deadline ends the wait
        int revents = 0;
        while (revents == 0) {
            int left = ms_until(deadline);
            if (left == 0) break;
            revents = poll_socket(fd, POLLOUT, left);
        }
        if (revents == 0) {
            err = "timed out";
            close_socket(fd);
            return ROXY_INVALID_SOCKET;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&so_error), &len);
        if (so_error != 0) {
            err = std::strerror(so_error);
            close_socket(fd);
            return ROXY_INVALID_SOCKET;
        }
    }

    set_nonblocking(fd, false);
    return fd;
}

Result<socket_t> connect_with_timeout(const std::string& host, int port, int timeout_ms) {
    init_networking();

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        return Result<socket_t>::Err(fmt::format("cannot resolve {}: {}", host, gai_strerror(gai)));
    }

    // One budget shared by every resolved address
    Deadline deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string err = "no addresses";
    socket_t fd = ROXY_INVALID_SOCKET;
    for (auto* ai = res; ai != nullptr; ai = ai->ai_next) {
        if (ai != res && ms_until(deadline) == 0) break;
        fd = try_connect(ai, deadline, err);
        if (fd != ROXY_INVALID_SOCKET) break;
    }
    freeaddrinfo(res);

    if (fd == ROXY_INVALID_SOCKET) {
        return Result<socket_t>::Err(fmt::format("connect to {}:{} failed: {}", host, port, err));
    }
    return Result<socket_t>::Ok(fd);
}

long recv_some(socket_t sock, char* buf, size_t len) {
    for (;;) {
        auto n = recv(sock, buf, static_cast<int>(len), 0);
#ifndef _WIN32
        if (n < 0 && errno == EINTR) continue;
#endif
        return static_cast<long>(n);
    }
}

bool send_all(socket_t sock, const char* buf, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        auto w = send(sock, buf + sent, static_cast<int>(len - sent), MSG_NOSIGNAL);
        if (w < 0) {
#ifndef _WIN32
            if (errno == EINTR) continue;
#endif
            return false;
        }
        if (w == 0) return false;
        sent += static_cast<size_t>(w);
    }
    return true;
}

bool is_port_open(const std::string& host, int port) {
    auto r = connect_with_timeout(host, port, 1000);
    if (r.is_err()) return false;
    close_socket(r.value);
    return true;
}

} // namespace platform
