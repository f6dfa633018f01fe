#include <catch2/catch_test_macros.hpp>

#include "platform/linux/linux_receiver_loop.hpp"
#include "platform/linux/tcp_listener.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <sys/resource.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace std::chrono_literals;
using test_support::CountingSleeper;
using test_support::send_signal;
using test_support::wait_until;

namespace {

Config receiver_config(uint16_t port) {
    Config cfg;
    cfg.receiver.ip = "127.0.0.1";
    cfg.receiver.port = port;
    cfg.receiver.rebind_retry_ms = 50;
    return cfg;
}

// Real TCP listener whose next start() calls can be made to fail.
class FlakyListener : public Listener {
public:
    bool start(const Endpoint& endpoint) override {
        bool ok = false;
        if (fail_starts.load() > 0) {
            fail_starts.fetch_sub(1);
        } else {
            ok = inner_.start(endpoint);
        }
        fd.store(inner_.server_fd());
        starts.fetch_add(1);
        return ok;
    }

    void stop() override {
        inner_.stop();
        fd.store(-1);
    }

    bool is_listening() const override { return inner_.is_listening(); }
    int server_fd() const override { return inner_.server_fd(); }
    AcceptResult accept_client() override { return inner_.accept_client(); }

    std::atomic<int> starts{0};
    std::atomic<int> fail_starts{0};
    std::atomic<int> fd{-1};

private:
    TcpListener inner_;
};

// Receiver loop running on a background thread for the test's lifetime.
struct RunningReceiver {
    uint16_t port;
    CountingSleeper sleeper;
    FlakyListener listener;
    LinuxReceiverLoop loop;
    std::atomic<bool> finished{false};
    std::thread thread;

    explicit RunningReceiver(uint16_t p)
        : port(p), loop(receiver_config(p), Endpoint{"127.0.0.1", p}, listener, sleeper) {}

    bool start() {
        if (!loop.init()) return false;
        thread = std::thread([this] {
            loop.run();
            finished.store(true);
        });
        return true;
    }

    void stop() {
        loop.request_stop();
        if (thread.joinable()) thread.join();
    }

    ~RunningReceiver() { stop(); }
};

double cpu_seconds() {
    rusage usage{};
    ::getrusage(RUSAGE_SELF, &usage);
    auto secs = [](const timeval& tv) { return tv.tv_sec + tv.tv_usec / 1e6; };
    return secs(usage.ru_utime) + secs(usage.ru_stime);
}

} // namespace

TEST_CASE("Receiver loop", "[receiver]") {
    RunningReceiver rx(test_support::free_port());
    REQUIRE(rx.start());

    SECTION("ExactSignalTriggersOnce") {
        REQUIRE(send_signal(rx.port, "sleep_display"));
        REQUIRE(wait_until([&] { return rx.sleeper.calls.load() == 1; }));
        std::this_thread::sleep_for(100ms);
        REQUIRE(rx.sleeper.calls.load() == 1);
    }

    SECTION("OtherPayloadsIgnored") {
        REQUIRE(send_signal(rx.port, "sleep_displayX"));
        REQUIRE(send_signal(rx.port, "Sleep_Display"));
        REQUIRE(send_signal(rx.port, "\xFF\xFE\xFD"));
        REQUIRE(send_signal(rx.port, "hello"));
        std::this_thread::sleep_for(200ms);
        REQUIRE(rx.sleeper.calls.load() == 0);

        // Still serving afterwards
        REQUIRE(send_signal(rx.port, "sleep_display"));
        REQUIRE(wait_until([&] { return rx.sleeper.calls.load() == 1; }));
    }

    SECTION("EmptyConnectionIgnored") {
        int fd = test_support::connect_loopback(rx.port);
        REQUIRE(fd >= 0);
        ::close(fd);
        std::this_thread::sleep_for(100ms);
        REQUIRE(rx.sleeper.calls.load() == 0);
    }

    SECTION("SplitSignalDoesNotTrigger") {
        int fd = test_support::connect_loopback(rx.port);
        REQUIRE(fd >= 0);
        REQUIRE(test_support::send_all(fd, "sleep_disp"));
        std::this_thread::sleep_for(100ms);
        REQUIRE(test_support::send_all(fd, "lay"));
        std::this_thread::sleep_for(100ms);
        REQUIRE(rx.sleeper.calls.load() == 0);

        // A whole signal later on the same connection still counts
        REQUIRE(test_support::send_all(fd, "sleep_display"));
        REQUIRE(wait_until([&] { return rx.sleeper.calls.load() == 1; }));
        ::close(fd);
    }

    SECTION("RepeatedSignalsOnOneConnection") {
        int fd = test_support::connect_loopback(rx.port);
        REQUIRE(fd >= 0);
        for (int i = 1; i <= 3; i++) {
            REQUIRE(test_support::send_all(fd, "sleep_display"));
            REQUIRE(wait_until([&] { return rx.sleeper.calls.load() == i; }));
        }
        ::close(fd);
    }

    SECTION("ConcurrentConnections") {
        constexpr int N = 16;
        std::vector<int> fds;
        for (int i = 0; i < N; i++) {
            int fd = test_support::connect_loopback(rx.port);
            REQUIRE(fd >= 0);
            fds.push_back(fd);
        }
        for (int fd : fds) {
            REQUIRE(test_support::send_all(fd, "sleep_display"));
        }
        for (int fd : fds) ::close(fd);

        REQUIRE(wait_until([&] { return rx.sleeper.calls.load() == N; }));
        std::this_thread::sleep_for(100ms);
        REQUIRE(rx.sleeper.calls.load() == N);
    }

    SECTION("StopReleasesPort") {
        rx.stop();
        REQUIRE(test_support::connect_loopback(rx.port) < 0);
    }

    SECTION("StopWithIdleConnection") {
        int fd = test_support::connect_loopback(rx.port);
        REQUIRE(fd >= 0);
        std::this_thread::sleep_for(50ms);

        auto begin = std::chrono::steady_clock::now();
        rx.stop();
        REQUIRE(std::chrono::steady_clock::now() - begin < 2s);
        ::close(fd);
    }
}

TEST_CASE("Receiver loop startup", "[receiver]") {

    SECTION("PortInUseFailsInit") {
        uint16_t port = test_support::free_port();
        TcpListener squatter;
        REQUIRE(squatter.start(Endpoint{"127.0.0.1", port}));

        CountingSleeper sleeper;
        TcpListener listener;
        LinuxReceiverLoop loop(receiver_config(port), Endpoint{"127.0.0.1", port}, listener,
                               sleeper);
        REQUIRE_FALSE(loop.init());
    }

    SECTION("StopBeforeRunReturnsImmediately") {
        RunningReceiver rx(test_support::free_port());
        REQUIRE(rx.loop.init());
        rx.loop.request_stop();
        rx.loop.run();
        REQUIRE(rx.sleeper.calls.load() == 0);
    }
}

TEST_CASE("Receiver loop under load", "[receiver]") {
    RunningReceiver rx(test_support::free_port());
    REQUIRE(rx.start());

    SECTION("FloodingPeersDoNotStarveSignals") {
        std::atomic<bool> flooding{true};
        std::vector<int> flood_fds;
        std::vector<std::thread> flooders;
        for (int i = 0; i < 4; i++) {
            int fd = test_support::connect_loopback(rx.port);
            REQUIRE(fd >= 0);
            flood_fds.push_back(fd);
        }
        for (int fd : flood_fds) {
            flooders.emplace_back([fd, &flooding] {
                std::string block(64 * 1024, 'x');
                while (flooding.load()) {
                    if (::send(fd, block.data(), block.size(), MSG_NOSIGNAL) <= 0) break;
                }
            });
        }
        std::this_thread::sleep_for(100ms);

        bool sent = send_signal(rx.port, "sleep_display");
        bool triggered = wait_until([&] { return rx.sleeper.calls.load() == 1; }, 2000ms);

        auto begin = std::chrono::steady_clock::now();
        rx.stop();
        auto took = std::chrono::steady_clock::now() - begin;

        flooding.store(false);
        for (int fd : flood_fds) ::shutdown(fd, SHUT_RDWR);
        for (auto& t : flooders) t.join();
        for (int fd : flood_fds) ::close(fd);

        REQUIRE(sent);
        REQUIRE(triggered);
        REQUIRE(took < 1s);
    }

    SECTION("FdExhaustionPausesAccepts") {
        rlimit saved{};
        REQUIRE(::getrlimit(RLIMIT_NOFILE, &saved) == 0);

        int client = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        REQUIRE(client >= 0);

        rlimit low = saved;
        low.rlim_cur = std::min<rlim_t>(saved.rlim_cur, 256);
        REQUIRE(::setrlimit(RLIMIT_NOFILE, &low) == 0);

        std::vector<int> fillers;
        while (true) {
            int fd = ::dup(client);
            if (fd < 0) break;
            fillers.push_back(fd);
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(rx.port);
        bool connected = ::connect(client, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;

        // The pending client cannot be accepted; the loop must wait, not spin
        double cpu_before = cpu_seconds();
        std::this_thread::sleep_for(500ms);
        double cpu_used = cpu_seconds() - cpu_before;

        for (int fd : fillers) ::close(fd);
        ::setrlimit(RLIMIT_NOFILE, &saved);

        REQUIRE(connected);
        REQUIRE(cpu_used < 0.2);

        // Accepting resumes once fds are available again
        REQUIRE(test_support::send_all(client, "sleep_display"));
        REQUIRE(wait_until([&] { return rx.sleeper.calls.load() == 1; }));
        ::close(client);
    }
}

TEST_CASE("Receiver loop listener recovery", "[receiver]") {
    RunningReceiver rx(test_support::free_port());
    REQUIRE(rx.start());
    REQUIRE(rx.listener.starts.load() == 1);

    SECTION("FailedListenerRebindsSamePort") {
        ::shutdown(rx.listener.fd.load(), SHUT_RDWR);

        REQUIRE(wait_until([&] { return rx.listener.starts.load() == 2; }));
        REQUIRE(wait_until([&] { return send_signal(rx.port, "sleep_display"); }));
        REQUIRE(wait_until([&] { return rx.sleeper.calls.load() == 1; }));
    }

    SECTION("FailedRebindRetriedByTimer") {
        rx.listener.fail_starts.store(1);
        ::shutdown(rx.listener.fd.load(), SHUT_RDWR);

        // Failure, failed rebind, then the timer's retry
        REQUIRE(wait_until([&] { return rx.listener.starts.load() == 3; }));
        REQUIRE(rx.listener.fail_starts.load() == 0);

        REQUIRE(wait_until([&] { return send_signal(rx.port, "sleep_display"); }));
        REQUIRE(wait_until([&] { return rx.sleeper.calls.load() == 1; }));

        std::this_thread::sleep_for(200ms);
        REQUIRE(rx.listener.starts.load() == 3);
    }
}

TEST_CASE("Receiver loop interrupt", "[receiver]") {
    RunningReceiver rx(test_support::free_port());
    // init() blocks SIGINT for this thread and the loop thread it spawns
    REQUIRE(rx.start());

    REQUIRE(::kill(::getpid(), SIGINT) == 0);

    REQUIRE(wait_until([&] { return rx.finished.load(); }));
    REQUIRE(test_support::connect_loopback(rx.port) < 0);
    REQUIRE(rx.sleeper.calls.load() == 0);
}
