#include <catch2/catch_test_macros.hpp>

#include "listener_supervisor.hpp"
#include "platform/linux/tcp_listener.hpp"
#include "test_support.hpp"

#include <deque>
#include <poll.h>
#include <unistd.h>

class MockListener : public Listener {
public:
    // Results for successive start() calls; true once the script runs out.
    std::deque<bool> start_results;
    int starts = 0;
    int stops = 0;

    bool start(const Endpoint& endpoint) override {
        starts++;
        last_endpoint = endpoint;
        bool ok = true;
        if (!start_results.empty()) {
            ok = start_results.front();
            start_results.pop_front();
        }
        listening_ = ok;
        return ok;
    }
    void stop() override {
        stops++;
        listening_ = false;
    }
    bool is_listening() const override { return listening_; }
    int server_fd() const override { return listening_ ? 42 : -1; }
    AcceptResult accept_client() override { return {}; }

    Endpoint last_endpoint;

private:
    bool listening_ = false;
};

TEST_CASE("Listener supervisor", "[supervisor]") {
    MockListener listener;
    ListenerSupervisor sup(listener, Endpoint{"127.0.0.1", 12345});

    SECTION("InitialBindFailureIsFatal") {
        listener.start_results = {false};
        REQUIRE_FALSE(sup.start());
        REQUIRE_FALSE(sup.running());
        REQUIRE_FALSE(sup.listening());
        // Not running, so nothing is rebound
        REQUIRE_FALSE(sup.ensure_listening());
        REQUIRE_FALSE(sup.on_failure("boom"));
        REQUIRE(listener.starts == 1);
    }

    SECTION("StartListens") {
        REQUIRE(sup.start());
        REQUIRE(sup.running());
        REQUIRE(sup.listening());
        REQUIRE(sup.server_fd() == 42);
        REQUIRE(listener.last_endpoint.port == 12345);
        REQUIRE(sup.rebind_attempts() == 0);
    }

    SECTION("FailureRebindsExactlyOnce") {
        REQUIRE(sup.start());
        REQUIRE(sup.on_failure("accept failed"));
        REQUIRE(listener.stops == 1);
        REQUIRE(listener.starts == 2);
        REQUIRE(sup.rebind_attempts() == 1);
        REQUIRE(sup.listening());
    }

    SECTION("FailedRebindLeavesListenerAbsent") {
        listener.start_results = {true, false};
        REQUIRE(sup.start());
        REQUIRE_FALSE(sup.on_failure("accept failed"));
        REQUIRE(listener.starts == 2);
        REQUIRE_FALSE(sup.listening());
        REQUIRE(sup.running());

        // The next observation tries again
        REQUIRE(sup.ensure_listening());
        REQUIRE(listener.starts == 3);
        REQUIRE(sup.rebind_attempts() == 2);
        REQUIRE(sup.listening());
    }

    SECTION("EnsureListeningIsNoopWhileHealthy") {
        REQUIRE(sup.start());
        REQUIRE(sup.ensure_listening());
        REQUIRE(listener.starts == 1);
        REQUIRE(sup.rebind_attempts() == 0);
    }

    SECTION("NoRebindAfterShutdown") {
        REQUIRE(sup.start());
        sup.shutdown();
        REQUIRE_FALSE(sup.running());
        REQUIRE_FALSE(sup.listening());
        REQUIRE_FALSE(sup.on_failure("late failure"));
        REQUIRE_FALSE(sup.ensure_listening());
        REQUIRE(listener.starts == 1);
    }
}

TEST_CASE("TCP listener", "[listener]") {
    TcpListener listener;
    uint16_t port = test_support::free_port();
    Endpoint endpoint{"127.0.0.1", port};

    SECTION("AcceptWhenIdleWouldBlock") {
        REQUIRE(listener.start(endpoint));
        REQUIRE(listener.is_listening());
        auto res = listener.accept_client();
        REQUIRE(res.status == AcceptStatus::WouldBlock);
    }

    SECTION("AcceptReportsPeer") {
        REQUIRE(listener.start(endpoint));
        int client = test_support::connect_loopback(port);
        REQUIRE(client >= 0);

        pollfd pfd{listener.server_fd(), POLLIN, 0};
        REQUIRE(::poll(&pfd, 1, 2000) == 1);

        auto res = listener.accept_client();
        REQUIRE(res.status == AcceptStatus::Accepted);
        REQUIRE(res.fd >= 0);
        REQUIRE(res.peer.starts_with("127.0.0.1:"));
        ::close(res.fd);
        ::close(client);
    }

    SECTION("AcceptWithoutSocketFailsListener") {
        auto res = listener.accept_client();
        REQUIRE(res.status == AcceptStatus::ListenerFailed);
    }

    SECTION("PortInUse") {
        REQUIRE(listener.start(endpoint));
        TcpListener second;
        REQUIRE_FALSE(second.start(endpoint));
        REQUIRE_FALSE(second.is_listening());
    }

    SECTION("SupervisorRebindsSamePort") {
        ListenerSupervisor sup(listener, endpoint);
        REQUIRE(sup.start());
        int old_fd = sup.server_fd();

        REQUIRE(sup.on_failure("simulated"));
        REQUIRE(sup.listening());
        REQUIRE(old_fd >= 0);

        int client = test_support::connect_loopback(port);
        REQUIRE(client >= 0);
        pollfd pfd{sup.server_fd(), POLLIN, 0};
        REQUIRE(::poll(&pfd, 1, 2000) == 1);
        auto res = listener.accept_client();
        REQUIRE(res.status == AcceptStatus::Accepted);
        ::close(res.fd);
        ::close(client);
        sup.shutdown();
    }
}
