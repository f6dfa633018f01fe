#include "platform/linux/linux_sender_loop.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxSenderLoop::LinuxSenderLoop(Config config, Endpoint target, DisplayProbe& probe, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      sender_(std::move(target), config_.sender.content, config_.sender.connect_timeout_ms),
      detector_(probe, [this]() { start_signal(); }, verbose_) {}

LinuxSenderLoop::~LinuxSenderLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
    if (stop_event_fd_ >= 0) ::close(stop_event_fd_);
}

bool LinuxSenderLoop::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Wakes epoll_wait for request_stop()
    stop_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (stop_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // Poll timer
    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }

    auto interval_ms = config_.sender.poll_interval_ms;
    itimerspec spec{};
    spec.it_interval.tv_sec = interval_ms / 1000;
    spec.it_interval.tv_nsec = static_cast<long>(interval_ms % 1000) * 1000000L;
    spec.it_value = spec.it_interval;
    if (timerfd_settime(timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(stop_event_fd_, EPOLLIN) ||
        !add_fd(timer_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxSenderLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == stop_event_fd_) {
                uint64_t val;
                ::read(stop_event_fd_, &val, sizeof(val));
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                ::read(timer_fd_, &expirations, sizeof(expirations));
                on_tick();
                continue;
            }

            // Pending signal connection became writable or failed
            finish_signal(fd);
        }
    }

    // Stop the timer; pending connects are closed with sender_
    if (timer_fd_ >= 0) {
        ::close(timer_fd_);
        timer_fd_ = -1;
    }
    log("Shutting down gracefully...");
}

void LinuxSenderLoop::request_stop() {
    running_.store(false, std::memory_order_release);
    if (stop_event_fd_ >= 0) {
        uint64_t val = 1;
        ::write(stop_event_fd_, &val, sizeof(val));
    }
}

void LinuxSenderLoop::on_tick() {
    if (auto dropped = sender_.expire(); dropped > 0) {
        std::println(stderr, "sender: {} connection(s) to {} timed out", dropped,
                     sender_.target().to_string());
    }
    detector_.tick();
}

void LinuxSenderLoop::start_signal() {
    auto fd = sender_.begin();
    if (!fd) {
        std::println(stderr, "sender: {}: {}", sender_.target().to_string(), fd.error());
        return;
    }

    epoll_event ev{.events = EPOLLOUT, .data = {.fd = *fd}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, *fd, &ev) < 0) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        // Finish it now rather than leaking a connect nobody watches
        finish_signal(*fd);
        return;
    }
    log("Connecting to " + sender_.target().to_string());
}

void LinuxSenderLoop::finish_signal(int fd) {
    if (!sender_.is_pending(fd)) return;

    // A tick in the same batch may have expired an fd and reused its number
    // for a new connect; the old readiness says nothing about the new one.
    if (sender_.connecting(fd)) return;

    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    auto res = sender_.complete(fd);
    if (!res) {
        std::println(stderr, "sender: {}: {}", sender_.target().to_string(), res.error());
        return;
    }
    log("Signal sent: " + config_.sender.content);
}

void LinuxSenderLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[display-sync-sender] {}", msg);
    }
}
