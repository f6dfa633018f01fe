#pragma once

#include "change_detector.hpp"
#include "config.hpp"
#include "endpoint.hpp"
#include "platform/display_probe.hpp"
#include "platform/linux/tcp_signal_sender.hpp"

#include <atomic>
#include <string>

class LinuxSenderLoop {
public:
    LinuxSenderLoop(Config config, Endpoint target, DisplayProbe& probe, bool verbose = false);
    ~LinuxSenderLoop();

    LinuxSenderLoop(const LinuxSenderLoop&) = delete;
    LinuxSenderLoop& operator=(const LinuxSenderLoop&) = delete;

    bool init();
    void run();

    // Safe to call from another thread or after init() from anywhere.
    void request_stop();

private:
    void on_tick();
    void start_signal();
    void finish_signal(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    TcpSignalSender sender_;
    ChangeDetector detector_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int timer_fd_ = -1;
    int stop_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
