#pragma once

#include "endpoint.hpp"

#include <string>

enum class AcceptStatus {
    Accepted,
    WouldBlock,     // nothing left in the backlog
    Transient,      // this connection failed, the listener is fine
    Exhausted,      // out of fds or buffers; retrying right away would spin
    ListenerFailed, // the listening socket is unusable
};

struct AcceptResult {
    AcceptStatus status = AcceptStatus::WouldBlock;
    int fd = -1;
    std::string peer;
    std::string error;
};

class Listener {
public:
    virtual ~Listener() = default;
    virtual bool start(const Endpoint& endpoint) = 0;
    virtual void stop() = 0;
    virtual bool is_listening() const = 0;
    virtual int server_fd() const = 0;
    virtual AcceptResult accept_client() = 0;
};
