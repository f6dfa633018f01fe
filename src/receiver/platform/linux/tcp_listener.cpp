#include "platform/linux/tcp_listener.hpp"

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <print>
#include <unistd.h>

TcpListener::TcpListener() = default;

TcpListener::~TcpListener() {
    stop();
}

bool TcpListener::start(const Endpoint& endpoint) {
    if (server_fd_ >= 0) stop();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo* res = nullptr;
    auto port = std::to_string(endpoint.port);
    const char* host = endpoint.host.empty() ? nullptr : endpoint.host.c_str();
    int rc = ::getaddrinfo(host, port.c_str(), &hints, &res);
    if (rc != 0) {
        std::println(stderr, "listener: cannot resolve {}: {}", endpoint.host, gai_strerror(rc));
        return false;
    }

    server_fd_ = ::socket(res->ai_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "listener: socket() failed: {}", std::strerror(errno));
        ::freeaddrinfo(res);
        return false;
    }

    // Allow an immediate rebind on the same port after a failure
    int one = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(server_fd_, res->ai_addr, res->ai_addrlen) < 0) {
        std::println(stderr, "listener: bind({}) failed: {}", endpoint.to_string(),
                     std::strerror(errno));
        ::freeaddrinfo(res);
        stop();
        return false;
    }
    ::freeaddrinfo(res);

    if (::listen(server_fd_, SOMAXCONN) < 0) {
        std::println(stderr, "listener: listen() failed: {}", std::strerror(errno));
        stop();
        return false;
    }

    return true;
}

void TcpListener::stop() {
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

AcceptResult TcpListener::accept_client() {
    AcceptResult result;
    if (server_fd_ < 0) {
        result.status = AcceptStatus::ListenerFailed;
        result.error = "listener is not open";
        return result;
    }

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    int fd = ::accept4(server_fd_, reinterpret_cast<sockaddr*>(&addr), &len,
                       SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd >= 0) {
        result.status = AcceptStatus::Accepted;
        result.fd = fd;
        result.peer = peer_name(addr, len);
        return result;
    }

    int err = errno;
    result.error = std::strerror(err);
    switch (err) {
        case EAGAIN:
#if EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
            result.status = AcceptStatus::WouldBlock;
            break;
        case EBADF:
        case EINVAL:
        case ENOTSOCK:
        case EOPNOTSUPP:
        case EFAULT:
            result.status = AcceptStatus::ListenerFailed;
            break;
        case EMFILE:
        case ENFILE:
        case ENOBUFS:
        case ENOMEM:
            result.status = AcceptStatus::Exhausted;
            break;
        default:
            // ECONNABORTED, EINTR, EPROTO, pending network errors...
            result.status = AcceptStatus::Transient;
            break;
    }
    return result;
}

std::string TcpListener::peer_name(const sockaddr_storage& addr, socklen_t len) {
    char host[NI_MAXHOST];
    char serv[NI_MAXSERV];
    if (::getnameinfo(reinterpret_cast<const sockaddr*>(&addr), len, host, sizeof(host), serv,
                      sizeof(serv), NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
        return "unknown";
    }
    if (addr.ss_family == AF_INET6) {
        return std::string("[") + host + "]:" + serv;
    }
    return std::string(host) + ":" + serv;
}
