#pragma once

#include "endpoint.hpp"
#include "platform/listener.hpp"

#include <cstddef>
#include <string>

// Keeps exactly one listener alive on a fixed endpoint while running.
//
// Lifecycle: start() binds once and reports failure to the caller (fatal at
// startup). Every later failure observation discards the handle and makes a
// single rebind attempt; a failed attempt leaves the listener absent until
// the next observation. shutdown() closes the listener and stops rebinding.
//
// Not thread-safe; all calls come from the receiver's event loop thread.
class ListenerSupervisor {
public:
    ListenerSupervisor(Listener& listener, Endpoint endpoint, bool verbose = false);

    bool start();

    // The listener reported a failure. Returns true if it was rebound.
    bool on_failure(const std::string& reason);

    // Rebind if running and no listener is present. Returns true if listening.
    bool ensure_listening();

    void shutdown();

    bool running() const { return running_; }
    bool listening() const { return listener_.is_listening(); }
    int server_fd() const { return listener_.server_fd(); }
    size_t rebind_attempts() const { return rebind_attempts_; }
    const Endpoint& endpoint() const { return endpoint_; }

private:
    bool rebind();
    void log(const std::string& msg);

    Listener& listener_;
    Endpoint endpoint_;
    bool verbose_;
    bool running_ = false;
    size_t rebind_attempts_ = 0;
};
