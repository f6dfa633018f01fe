#include "platform/linux/tcp_signal_sender.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

TcpSignalSender::TcpSignalSender(Endpoint target, std::string payload, uint32_t connect_timeout_ms)
    : target_(std::move(target)), payload_(std::move(payload)),
      connect_timeout_(connect_timeout_ms) {}

TcpSignalSender::~TcpSignalSender() {
    for (auto& p : pending_) {
        ::close(p.fd);
    }
}

std::expected<int, std::string> TcpSignalSender::begin() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    addrinfo* res = nullptr;
    auto port = std::to_string(target_.port);
    int rc = ::getaddrinfo(target_.host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0) {
        return std::unexpected(std::string("cannot resolve ") + target_.host + ": " + gai_strerror(rc));
    }

    int fd = ::socket(res->ai_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        std::string err = std::strerror(errno);
        ::freeaddrinfo(res);
        return std::unexpected("socket() failed: " + err);
    }

    rc = ::connect(fd, res->ai_addr, res->ai_addrlen);
    int connect_errno = errno;
    ::freeaddrinfo(res);

    if (rc < 0 && connect_errno != EINPROGRESS) {
        ::close(fd);
        return std::unexpected(std::string("connect() failed: ") + std::strerror(connect_errno));
    }

    // Even an immediate connect is finished through complete() once writable
    pending_.push_back({fd, std::chrono::steady_clock::now()});
    return fd;
}

std::expected<void, std::string> TcpSignalSender::complete(int fd) {
    if (!is_pending(fd)) {
        return std::unexpected("not a pending signal connection");
    }

    if (connecting(fd)) {
        return std::unexpected("connect still in progress");
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
        so_error = errno;
    }

    if (so_error != 0) {
        drop(fd);
        return std::unexpected(std::string("connection failed: ") + std::strerror(so_error));
    }

    ssize_t sent = ::send(fd, payload_.data(), payload_.size(), MSG_NOSIGNAL);
    int send_errno = errno;
    drop(fd);

    if (sent < 0) {
        return std::unexpected(std::string("send failed: ") + std::strerror(send_errno));
    }
    if (static_cast<size_t>(sent) != payload_.size()) {
        return std::unexpected(std::format("short send: {} of {} bytes", sent, payload_.size()));
    }
    return {};
}

size_t TcpSignalSender::expire() {
    auto now = std::chrono::steady_clock::now();
    size_t dropped = 0;

    std::erase_if(pending_, [&](const Pending& p) {
        if (now - p.started < connect_timeout_) return false;
        ::close(p.fd);
        dropped++;
        return true;
    });
    return dropped;
}

bool TcpSignalSender::connecting(int fd) const {
    if (!is_pending(fd)) return false;

    // getsockopt(SO_ERROR) clears the error, so peek with getpeername only
    sockaddr_storage peer{};
    socklen_t len = sizeof(peer);
    if (::getpeername(fd, reinterpret_cast<sockaddr*>(&peer), &len) == 0) return false;
    if (errno != ENOTCONN) return false;

    pollfd pfd{fd, POLLOUT, 0};
    return ::poll(&pfd, 1, 0) == 0;
}

bool TcpSignalSender::is_pending(int fd) const {
    return std::ranges::any_of(pending_, [fd](const Pending& p) { return p.fd == fd; });
}

void TcpSignalSender::drop(int fd) {
    ::close(fd);
    std::erase_if(pending_, [fd](const Pending& p) { return p.fd == fd; });
}
