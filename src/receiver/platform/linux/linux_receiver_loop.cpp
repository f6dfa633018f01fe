#include "platform/linux/linux_receiver_loop.hpp"

#include "signal_message.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <string>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/socket.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxReceiverLoop::LinuxReceiverLoop(Config config, Endpoint bind, Listener& listener,
                                     DisplaySleeper& sleeper, bool verbose)
    : config_(std::move(config)), verbose_(verbose), sleeper_(sleeper), listener_(listener),
      supervisor_(listener_, std::move(bind), verbose_) {}

LinuxReceiverLoop::~LinuxReceiverLoop() {
    connections_.clear();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (stop_event_fd_ >= 0) ::close(stop_event_fd_);
    if (retry_timer_fd_ >= 0) ::close(retry_timer_fd_);
}

bool LinuxReceiverLoop::init() {
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

    // One-shot retry for a failed rebind or an accept backoff; disarmed until needed
    retry_timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (retry_timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(stop_event_fd_, EPOLLIN) ||
        !add_fd(retry_timer_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    if (!supervisor_.start()) return false;
    watch_listener();

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxReceiverLoop::run() {
    constexpr int MAX_EVENTS = 64;
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
            uint32_t ev = events[i].events;

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

            if (fd == retry_timer_fd_) {
                uint64_t expirations;
                ::read(retry_timer_fd_, &expirations, sizeof(expirations));
                on_retry_timer();
                continue;
            }

            if (fd == watched_listener_fd_) {
                if (ev & (EPOLLERR | EPOLLHUP)) {
                    int so_error = 0;
                    socklen_t len = sizeof(so_error);
                    ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
                    on_listener_failure(so_error ? std::strerror(so_error) : "socket hung up");
                } else {
                    accept_clients();
                }
                continue;
            }

            read_connection(fd);
        }
    }

    // In-flight connections are abandoned, not drained
    supervisor_.shutdown();
    watched_listener_fd_ = -1;
    connections_.clear();
    log("Shutting down gracefully...");
}

void LinuxReceiverLoop::request_stop() {
    running_.store(false, std::memory_order_release);
    if (stop_event_fd_ >= 0) {
        uint64_t val = 1;
        ::write(stop_event_fd_, &val, sizeof(val));
    }
}

void LinuxReceiverLoop::accept_clients() {
    // Bounded like reads; a connect storm must not hold the loop either
    constexpr int MAX_ACCEPTS = 64;

    for (int i = 0; i < MAX_ACCEPTS; i++) {
        auto result = listener_.accept_client();

        switch (result.status) {
            case AcceptStatus::Accepted: {
                epoll_event ev{.events = EPOLLIN, .data = {.fd = result.fd}};
                if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, result.fd, &ev) < 0) {
                    std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
                    ::close(result.fd);
                    break;
                }
                Connection conn(result.fd, result.peer, config_.receiver.signal);
                conn.start();
                connections_.emplace(result.fd, std::move(conn));
                accept_backoff_ = false;
                log("New connection from " + result.peer);
                break;
            }
            case AcceptStatus::WouldBlock:
                return;
            case AcceptStatus::Transient:
                std::println(stderr, "listener: accept failed: {}", result.error);
                return;
            case AcceptStatus::Exhausted:
                on_accept_exhausted(result.error);
                return;
            case AcceptStatus::ListenerFailed:
                on_listener_failure(result.error);
                return;
        }
    }
}

void LinuxReceiverLoop::read_connection(int fd) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) return;
    auto& conn = it->second;

    // One chunk per readiness event; epoll is level-triggered, so a busy peer
    // is picked up again on the next wait alongside everything else.
    char buf[signal_message::MAX_BYTES];
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);

    if (n > 0) {
        std::string_view chunk(buf, static_cast<size_t>(n));
        switch (conn.on_chunk(chunk)) {
            case ChunkOutcome::Matched:
                log("Received " + config_.receiver.signal + " signal from " + conn.peer());
                trigger_sleep(conn);
                break;
            case ChunkOutcome::Ignored:
                log("Received unexpected message from " + conn.peer() + ": " + std::string(chunk));
                break;
            case ChunkOutcome::Undecodable:
                log("Ignoring non-UTF-8 data from " + conn.peer());
                break;
            case ChunkOutcome::Rejected:
                break;
        }
        return;
    }

    if (n == 0) {
        close_connection(fd);
        return;
    }

    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;

    std::string err = std::strerror(errno);
    std::println(stderr, "connection {}: receive error: {}", conn.peer(), err);
    close_connection(fd, err);
}

void LinuxReceiverLoop::close_connection(int fd, const std::string& error) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) return;

    auto& conn = it->second;
    log("Connection from " + conn.peer() + " closed (last " + to_string(conn.state()) + ", " +
        std::to_string(conn.chunks()) + " chunk(s))");

    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    if (error.empty()) {
        conn.on_complete();
    } else {
        conn.on_error(error);
    }
    connections_.erase(it);

    // A connection ending is also a chance to notice a missing listener, and
    // frees an fd for a listener parked by on_accept_exhausted()
    if (supervisor_.ensure_listening()) {
        watch_listener();
    }
}

void LinuxReceiverLoop::on_listener_failure(const std::string& reason) {
    unwatch_listener();
    if (supervisor_.on_failure(reason)) {
        watch_listener();
    } else if (supervisor_.running()) {
        arm_retry_timer();
    }
}

void LinuxReceiverLoop::on_accept_exhausted(const std::string& reason) {
    // The pending client stays in the backlog and keeps the listener readable;
    // park it until the retry timer or a closing connection frees resources.
    if (!accept_backoff_) {
        std::println(stderr, "listener: accept failed: {}, pausing accepts", reason);
    }
    accept_backoff_ = true;
    unwatch_listener();
    arm_retry_timer();
}

void LinuxReceiverLoop::on_retry_timer() {
    if (supervisor_.listening()) {
        // Accept backoff over; a still-exhausted accept parks it again
        watch_listener();
        return;
    }
    if (supervisor_.ensure_listening()) {
        watch_listener();
    } else if (supervisor_.running()) {
        arm_retry_timer();
    }
}

void LinuxReceiverLoop::watch_listener() {
    int fd = supervisor_.server_fd();
    if (fd < 0 || fd == watched_listener_fd_) return;

    unwatch_listener();
    epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return;
    }
    watched_listener_fd_ = fd;
}

void LinuxReceiverLoop::unwatch_listener() {
    if (watched_listener_fd_ >= 0) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, watched_listener_fd_, nullptr);
        watched_listener_fd_ = -1;
    }
}

void LinuxReceiverLoop::arm_retry_timer() {
    auto ms = config_.receiver.rebind_retry_ms > 0 ? config_.receiver.rebind_retry_ms : 1000;
    itimerspec spec{};
    spec.it_value.tv_sec = ms / 1000;
    spec.it_value.tv_nsec = static_cast<long>(ms % 1000) * 1000000L;
    if (timerfd_settime(retry_timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
    }
}

void LinuxReceiverLoop::trigger_sleep(const Connection& conn) {
    auto res = sleeper_.sleep_display();
    if (!res) {
        std::println(stderr, "Error putting display to sleep ({}): {}", conn.peer(), res.error());
        return;
    }
    log("Display sleep signal sent successfully");
}

void LinuxReceiverLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[display-sync-receiver] {}", msg);
    }
}
