#include <gtest/gtest.h>
#include <managers/proxy_registry.hpp>
#include "net_test_utils.hpp"
#include <thread>
#include <sys/socket.h>
#include <netinet/in.h>

using testutil::BannerEchoServer;
using testutil::connect_local;
using testutil::free_port;
using testutil::read_n;
using testutil::sees_eof;
using testutil::wait_until;

class ProxyRegistryTest : public ::testing::Test {
protected:
    ServerConfig config;

    void SetUp() override {
        config.bind_address = "127.0.0.1";
        config.accept_poll_ms = 50;
        config.connect_timeout_ms = 1000;
    }

    // Round-trip one payload through an established proxied connection.
    static void expect_relay(socket_t client, const std::string& banner, const std::string& payload) {
        EXPECT_EQ(read_n(client, banner.size()), banner);
        ASSERT_TRUE(platform::send_all(client, payload.data(), payload.size()));
        EXPECT_EQ(read_n(client, payload.size()), payload);
    }

    // Descriptor of the listening socket bound to port in this process, or -1.
    static int find_listener_fd(int port) {
        for (int fd = 3; fd < 4096; ++fd) {
            struct sockaddr_in addr{};
            socklen_t len = sizeof(addr);
            if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) continue;
            if (addr.sin_family != AF_INET || ntohs(addr.sin_port) != port) continue;
            int listening = 0;
            socklen_t optlen = sizeof(listening);
            if (getsockopt(fd, SOL_SOCKET, SO_ACCEPTCONN, &listening, &optlen) == 0 && listening) {
                return fd;
            }
        }
        return -1;
    }
};

TEST_F(ProxyRegistryTest, EnsureStartsListenerAndRelaysBothWays) {
    BannerEchoServer remote("HELLO-A\n");
    ProxyRegistry registry(config);
    int port = free_port();

    EXPECT_EQ(registry.state(port), ProxyState::Absent);
    auto r = registry.ensure(port, {"127.0.0.1", remote.port()});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, EnsureOutcome::Started);
    EXPECT_EQ(registry.state(port), ProxyState::Running);

    socket_t client = connect_local(port);
    ASSERT_NE(client, ROXY_INVALID_SOCKET);

    std::string payload(10000, '\0');
    for (size_t i = 0; i < payload.size(); i++) payload[i] = static_cast<char>(i * 31);
    expect_relay(client, "HELLO-A\n", payload);

    platform::close_socket(client);
}

TEST_F(ProxyRegistryTest, EnsureSameTargetIsNoop) {
    BannerEchoServer remote("X");
    ProxyRegistry registry(config);
    int port = free_port();

    ASSERT_TRUE(registry.ensure(port, {"127.0.0.1", remote.port()}).is_ok());
    auto before = registry.snapshot();

    auto again = registry.ensure(port, {"127.0.0.1", remote.port()});
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value, EnsureOutcome::Unchanged);

    auto after = registry.snapshot();
    ASSERT_EQ(after.size(), 1u);
    EXPECT_EQ(after[0].started_at, before[0].started_at);
}

TEST_F(ProxyRegistryTest, EnsureDifferentTargetReplaces) {
    BannerEchoServer a("AAAA");
    BannerEchoServer b("BBBB");
    ProxyRegistry registry(config);
    int port = free_port();

    ASSERT_TRUE(registry.ensure(port, {"127.0.0.1", a.port()}).is_ok());
    socket_t old_client = connect_local(port);
    ASSERT_NE(old_client, ROXY_INVALID_SOCKET);
    EXPECT_EQ(read_n(old_client, 4), "AAAA");

    auto r = registry.ensure(port, {"127.0.0.1", b.port()});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, EnsureOutcome::Replaced);
    EXPECT_EQ(registry.target(port)->port, b.port());

    socket_t new_client = connect_local(port);
    ASSERT_NE(new_client, ROXY_INVALID_SOCKET);
    EXPECT_EQ(read_n(new_client, 4), "BBBB");

    // The connection accepted before the replacement still reaches the old target
    ASSERT_TRUE(platform::send_all(old_client, "ping", 4));
    EXPECT_EQ(read_n(old_client, 4), "ping");

    platform::close_socket(old_client);
    platform::close_socket(new_client);
}

TEST_F(ProxyRegistryTest, StopRefusesNewConnections) {
    BannerEchoServer remote("X");
    ProxyRegistry registry(config);
    int port = free_port();

    ASSERT_TRUE(registry.ensure(port, {"127.0.0.1", remote.port()}).is_ok());
    EXPECT_TRUE(platform::is_port_open("127.0.0.1", port));

    EXPECT_TRUE(registry.stop(port));
    EXPECT_EQ(registry.state(port), ProxyState::Absent);
    EXPECT_FALSE(platform::is_port_open("127.0.0.1", port));
    EXPECT_TRUE(registry.snapshot().empty());

    // Second stop: nothing running, not an error
    EXPECT_FALSE(registry.stop(port));
    EXPECT_FALSE(registry.stop(free_port()));
}

TEST_F(ProxyRegistryTest, StopLeavesInFlightConnectionsRunning) {
    BannerEchoServer remote("HI");
    ProxyRegistry registry(config);
    int port = free_port();

    ASSERT_TRUE(registry.ensure(port, {"127.0.0.1", remote.port()}).is_ok());
    socket_t client = connect_local(port);
    ASSERT_NE(client, ROXY_INVALID_SOCKET);
    EXPECT_EQ(read_n(client, 2), "HI");

    ASSERT_TRUE(registry.stop(port));

    ASSERT_TRUE(platform::send_all(client, "still", 5));
    EXPECT_EQ(read_n(client, 5), "still");
    platform::close_socket(client);
}

TEST_F(ProxyRegistryTest, StopWithCloseConnectionsTearsThemDown) {
    BannerEchoServer remote("HI");
    ProxyRegistry registry(config);
    int port = free_port();

    ASSERT_TRUE(registry.ensure(port, {"127.0.0.1", remote.port()}).is_ok());
    socket_t client = connect_local(port);
    ASSERT_NE(client, ROXY_INVALID_SOCKET);
    EXPECT_EQ(read_n(client, 2), "HI");

    ASSERT_TRUE(registry.stop(port, StopMode::CloseConnections));
    EXPECT_TRUE(sees_eof(client));
    platform::close_socket(client);
}

TEST_F(ProxyRegistryTest, BindFailureRollsBack) {
    auto blocker = platform::open_listener("127.0.0.1", 0, 1);
    ASSERT_TRUE(blocker.is_ok());
    int port = platform::bound_port(blocker.value);

    ProxyRegistry registry(config);
    auto r = registry.ensure(port, {"127.0.0.1", 9});
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("bind"), std::string::npos);
    EXPECT_EQ(registry.state(port), ProxyState::Absent);
    EXPECT_FALSE(registry.is_running(port));
    EXPECT_TRUE(registry.snapshot().empty());
    EXPECT_FALSE(registry.stop(port));

    platform::close_socket(blocker.value);

    // Once the port frees up the same call succeeds
    EXPECT_TRUE(registry.ensure(port, {"127.0.0.1", 9}).is_ok());
    EXPECT_TRUE(registry.is_running(port));
}

TEST_F(ProxyRegistryTest, SnapshotCountsForwardedConnections) {
    BannerEchoServer remote("HI");
    ProxyRegistry registry(config);
    int port = free_port();
    ASSERT_TRUE(registry.ensure(port, {"127.0.0.1", remote.port()}).is_ok());

    socket_t c1 = connect_local(port);
    socket_t c2 = connect_local(port);
    EXPECT_EQ(read_n(c1, 2), "HI");
    EXPECT_EQ(read_n(c2, 2), "HI");

    EXPECT_TRUE(wait_until([&]() {
        auto s = registry.snapshot();
        return s.size() == 1 && s[0].connections == 2;
    }));
    auto s = registry.snapshot();
    EXPECT_EQ(s[0].external_port, port);
    EXPECT_EQ(s[0].remote_host, "127.0.0.1");
    EXPECT_EQ(s[0].remote_port, remote.port());

    platform::close_socket(c1);
    platform::close_socket(c2);
    EXPECT_TRUE(wait_until([&]() { return registry.snapshot()[0].connections == 0; }));
}

TEST_F(ProxyRegistryTest, UnreachableTargetClosesClientOnly) {
    ProxyRegistry registry(config);
    int dead = free_port();  // nothing listens here
    int port = free_port();
    ASSERT_NE(port, dead);
    ASSERT_TRUE(registry.ensure(port, {"127.0.0.1", dead}).is_ok());

    socket_t client = connect_local(port);
    ASSERT_NE(client, ROXY_INVALID_SOCKET);
    EXPECT_TRUE(sees_eof(client));
    platform::close_socket(client);

    // The listener keeps accepting
    EXPECT_TRUE(registry.is_running(port));
    socket_t again = connect_local(port);
    EXPECT_NE(again, ROXY_INVALID_SOCKET);
    if (again != ROXY_INVALID_SOCKET) platform::close_socket(again);
}

TEST_F(ProxyRegistryTest, SlowTargetDoesNotBlockAccept) {
    // A listener that never accepts: connects complete via the backlog but
    // no banner ever arrives. Acceptance of further clients must continue.
    auto silent = platform::open_listener("127.0.0.1", 0, 64);
    ASSERT_TRUE(silent.is_ok());
    int silent_port = platform::bound_port(silent.value);

    ProxyRegistry registry(config);
    int port = free_port();
    ASSERT_TRUE(registry.ensure(port, {"127.0.0.1", silent_port}).is_ok());

    std::vector<socket_t> clients;
    for (int i = 0; i < 5; i++) {
        socket_t c = connect_local(port);
        ASSERT_NE(c, ROXY_INVALID_SOCKET);
        clients.push_back(c);
    }
    EXPECT_TRUE(wait_until([&]() { return registry.snapshot()[0].connections == 5; }));

    registry.stop(port, StopMode::CloseConnections);
    for (auto c : clients) platform::close_socket(c);
    platform::close_socket(silent.value);
}

TEST_F(ProxyRegistryTest, ConcurrentEnsureOnSamePortStartsOnce) {
    BannerEchoServer remote("X");
    ProxyRegistry registry(config);
    int port = free_port();

    const int N = 8;
    std::vector<Result<EnsureOutcome>> results(N, Result<EnsureOutcome>::Err("not run"));
    std::vector<std::thread> threads;
    for (int i = 0; i < N; i++) {
        threads.emplace_back([&, i]() { results[i] = registry.ensure(port, {"127.0.0.1", remote.port()}); });
    }
    for (auto& t : threads) t.join();

    int started = 0;
    for (const auto& r : results) {
        ASSERT_TRUE(r.is_ok()) << r.error;
        if (r.value == EnsureOutcome::Started) started++;
    }
    EXPECT_EQ(started, 1);
    EXPECT_EQ(registry.snapshot().size(), 1u);
}

TEST_F(ProxyRegistryTest, ShutdownStopsEverything) {
    ProxyRegistry registry(config);
    int p1 = free_port();
    ASSERT_TRUE(registry.ensure(p1, {"127.0.0.1", 9}).is_ok());
    int p2 = free_port();  // p1 is bound now, so this differs
    ASSERT_TRUE(registry.ensure(p2, {"127.0.0.1", 9}).is_ok());
    EXPECT_EQ(registry.snapshot().size(), 2u);

    registry.shutdown();
    EXPECT_TRUE(registry.snapshot().empty());
    EXPECT_FALSE(platform::is_port_open("127.0.0.1", p1));
    EXPECT_FALSE(platform::is_port_open("127.0.0.1", p2));
}

TEST_F(ProxyRegistryTest, DeadAcceptLoopReportsNotRunningAndRestarts) {
    BannerEchoServer remote("D");
    ProxyRegistry registry(config);
    int port = free_port();
    ProxyTarget target{"127.0.0.1", remote.port()};
    ASSERT_TRUE(registry.ensure(port, target).is_ok());

    // Break the listener underneath the accept loop
    int fd = find_listener_fd(port);
    ASSERT_GE(fd, 0);
    ASSERT_EQ(::shutdown(fd, SHUT_RDWR), 0);
    ASSERT_TRUE(wait_until([&] { return !registry.is_running(port); }));

    EXPECT_EQ(registry.state(port), ProxyState::Absent);
    EXPECT_TRUE(registry.snapshot().empty());
    EXPECT_FALSE(registry.target(port).has_value());

    // Cleaned up, but it was not running
    EXPECT_FALSE(registry.stop(port));
    EXPECT_FALSE(registry.stop(port));

    auto again = registry.ensure(port, target);
    ASSERT_TRUE(again.is_ok()) << again.error;
    EXPECT_EQ(again.value, EnsureOutcome::Started);
    socket_t client = connect_local(port);
    ASSERT_NE(client, ROXY_INVALID_SOCKET);
    EXPECT_EQ(read_n(client, 1), "D");
    platform::close_socket(client);
}
