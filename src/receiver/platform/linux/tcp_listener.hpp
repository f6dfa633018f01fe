#pragma once

#include "platform/listener.hpp"

#include <string>
#include <sys/socket.h>

class TcpListener : public Listener {
public:
    TcpListener();
    ~TcpListener() override;

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    bool start(const Endpoint& endpoint) override;
    void stop() override;
    bool is_listening() const override { return server_fd_ >= 0; }
    int server_fd() const override { return server_fd_; }
    AcceptResult accept_client() override;

private:
    static std::string peer_name(const sockaddr_storage& addr, socklen_t len);

    int server_fd_ = -1;
};
