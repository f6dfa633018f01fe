#pragma once

#include "endpoint.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

// One-shot TCP signal delivery: connect, write the payload once, close.
// Connects are non-blocking; the caller watches the returned fd for
// writability and then calls complete().
class TcpSignalSender {
public:
    TcpSignalSender(Endpoint target, std::string payload, uint32_t connect_timeout_ms);
    ~TcpSignalSender();

    TcpSignalSender(const TcpSignalSender&) = delete;
    TcpSignalSender& operator=(const TcpSignalSender&) = delete;

    // Start connecting. Returns the socket fd to watch for EPOLLOUT.
    std::expected<int, std::string> begin();

    // The socket became writable or errored. Sends the payload and closes the
    // socket whatever the outcome, unless the connect is still in progress,
    // in which case it stays pending.
    std::expected<void, std::string> complete(int fd);

    // Pending connect with no result yet (no error, no peer).
    bool connecting(int fd) const;

    // Close connects older than the timeout. Returns the number dropped.
    size_t expire();

    bool is_pending(int fd) const;
    size_t pending() const { return pending_.size(); }

    const Endpoint& target() const { return target_; }

private:
    struct Pending {
        int fd;
        std::chrono::steady_clock::time_point started;
    };

    void drop(int fd);

    Endpoint target_;
    std::string payload_;
    std::chrono::milliseconds connect_timeout_;
    std::vector<Pending> pending_;
};
