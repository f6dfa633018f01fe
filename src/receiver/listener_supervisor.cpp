#include "listener_supervisor.hpp"

#include <print>

ListenerSupervisor::ListenerSupervisor(Listener& listener, Endpoint endpoint, bool verbose)
    : listener_(listener), endpoint_(std::move(endpoint)), verbose_(verbose) {}

bool ListenerSupervisor::start() {
    if (!listener_.start(endpoint_)) {
        std::println(stderr, "listener: failed to listen on {}", endpoint_.to_string());
        return false;
    }
    running_ = true;
    log("Listening on " + endpoint_.to_string());
    return true;
}

bool ListenerSupervisor::on_failure(const std::string& reason) {
    if (!running_) return false;

    std::println(stderr, "listener: failed: {}", reason);
    listener_.stop();
    return rebind();
}

bool ListenerSupervisor::ensure_listening() {
    if (!running_) return false;
    if (listener_.is_listening()) return true;
    return rebind();
}

void ListenerSupervisor::shutdown() {
    running_ = false;
    listener_.stop();
}

bool ListenerSupervisor::rebind() {
    rebind_attempts_++;
    if (!listener_.start(endpoint_)) {
        std::println(stderr, "listener: failed to restart on {}", endpoint_.to_string());
        return false;
    }
    log("Listener restarted successfully");
    return true;
}

void ListenerSupervisor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[display-sync-receiver] {}", msg);
    }
}
