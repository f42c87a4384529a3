#include <gtest/gtest.h>
#include <platform/socket_util.hpp>
#include <atomic>
#include <chrono>

TEST(SocketUtil, ExpiredDeadlineStopsBeforeResolving) {
    auto deadline = Deadline(Deadline::clock::now() - std::chrono::seconds(1));
    auto started = std::chrono::steady_clock::now();
    auto conn = platform::connect_tcp("resolver.invalid", 22, deadline);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(conn.ok());
    EXPECT_EQ(conn.failure, platform::ConnectFailure::TimedOut);
    EXPECT_NE(conn.error.find("resolver.invalid"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(1));
}

TEST(SocketUtil, CancelStopsResolving) {
    std::atomic<bool> cancel{true};
    auto deadline = Deadline::after(std::chrono::seconds(30), &cancel);
    auto conn = platform::connect_tcp("resolver.invalid", 22, deadline);

    EXPECT_FALSE(conn.ok());
    EXPECT_EQ(conn.failure, platform::ConnectFailure::Cancelled);
}

TEST(SocketUtil, SocketpairEndsAreConnected) {
    auto pair = platform::make_socketpair();
    ASSERT_TRUE(pair.is_ok()) << pair.error;
    auto [a, b] = pair.value;
    EXPECT_NE(a, JUMPRUN_INVALID_SOCKET);
    EXPECT_NE(b, JUMPRUN_INVALID_SOCKET);
    EXPECT_NE(platform::poll_socket(a, POLLOUT, 100) & POLLOUT, 0);
    platform::close_socket(a);
    platform::close_socket(b);
}
