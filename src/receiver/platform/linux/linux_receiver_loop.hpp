#pragma once

#include "config.hpp"
#include "connection.hpp"
#include "endpoint.hpp"
#include "listener_supervisor.hpp"
#include "platform/display_sleeper.hpp"
#include "platform/listener.hpp"

#include <atomic>
#include <string>
#include <unordered_map>

class LinuxReceiverLoop {
public:
    LinuxReceiverLoop(Config config, Endpoint bind, Listener& listener, DisplaySleeper& sleeper,
                      bool verbose = false);
    ~LinuxReceiverLoop();

    LinuxReceiverLoop(const LinuxReceiverLoop&) = delete;
    LinuxReceiverLoop& operator=(const LinuxReceiverLoop&) = delete;

    // Returns false if the listener cannot be bound; the caller should exit.
    bool init();
    void run();

    // Safe to call from another thread once init() has returned.
    void request_stop();

private:
    void accept_clients();
    void read_connection(int fd);
    void close_connection(int fd, const std::string& error = {});

    void on_listener_failure(const std::string& reason);
    void on_accept_exhausted(const std::string& reason);
    void on_retry_timer();
    void watch_listener();
    void unwatch_listener();
    void arm_retry_timer();

    void trigger_sleep(const Connection& conn);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    DisplaySleeper& sleeper_;

    Listener& listener_;
    ListenerSupervisor supervisor_;
    std::unordered_map<int, Connection> connections_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int stop_event_fd_ = -1;
    int retry_timer_fd_ = -1;
    int watched_listener_fd_ = -1;
    bool accept_backoff_ = false;

    std::atomic<bool> running_{false};
};
