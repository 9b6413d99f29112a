#include "socket_util.hpp"

#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <cerrno>
#include <cstring>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    close(sock);
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
                     std::string& error, bool& timed_out) {
    timed_out = false;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    // getaddrinfo is reentrant; gethostbyname is not, and many hosts
    // connect at once.
    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        error = "Failed to resolve host: " + host + " (" + gai_strerror(rc) + ")";
        return FLEETWATCH_INVALID_SOCKET;
    }

    socket_t sock = FLEETWATCH_INVALID_SOCKET;
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            error = "Failed to create socket";
            continue;
        }
        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            error = "Failed to connect: " + std::string(strerror(errno));
            close_socket(sock);
            sock = FLEETWATCH_INVALID_SOCKET;
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            int revents = poll_socket(sock, POLLOUT, timeout_ms);
            if (revents == 0) {
                error = "Connection timed out: " + host;
                timed_out = true;
                close_socket(sock);
                sock = FLEETWATCH_INVALID_SOCKET;
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
            if (sock_err != 0) {
                error = "Connection failed: " + std::string(strerror(sock_err));
                close_socket(sock);
                sock = FLEETWATCH_INVALID_SOCKET;
                continue;
            }
        }
        break;
    }
    freeaddrinfo(res);

    if (sock != FLEETWATCH_INVALID_SOCKET) {
        int keepalive = 1;
        setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
#ifdef TCP_KEEPIDLE
        int keepidle = 60;
        setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
        error.clear();
        timed_out = false;
    }
    return sock;
}

} // namespace platform
