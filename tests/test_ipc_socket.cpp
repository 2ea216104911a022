#include "net/ipc_socket.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>

using namespace pursuit::net;

namespace {

std::string socket_path(const std::string& tag) {
    return "/tmp/pursuit_" + tag + "_" + std::to_string(::getpid()) + ".sock";
}

}  // namespace

TEST(IPCSocket, FramedRoundTrip) {
    const std::string path = socket_path("roundtrip");
    IPCSocket server = IPCSocket::listen(path);

    std::string client_got;
    std::thread client([&] {
        IPCSocket sock = IPCSocket::connect(path);
        sock.send("ping");
        sock.send("");
        client_got = sock.receive();
    });

    IPCSocket conn = server.accept();
    EXPECT_EQ(conn.receive(), "ping");
    EXPECT_EQ(conn.receive(), "");
    EXPECT_TRUE(conn.send(std::string(100000, 'x')));
    client.join();

    EXPECT_EQ(client_got.size(), 100000u);
    server.close();
    EXPECT_NE(::access(path.c_str(), F_OK), 0);
}

TEST(IPCSocket, ReceiveTimeoutAndHangUp) {
    const std::string path = socket_path("timeout");
    IPCSocket server = IPCSocket::listen(path);

    IPCSocket client = IPCSocket::connect(path);
    IPCSocket conn = server.accept();

    EXPECT_FALSE(client.receive_timeout(20).has_value());
    EXPECT_TRUE(client.is_connected());

    conn.close();
    EXPECT_FALSE(client.receive_timeout(200).has_value());
    EXPECT_FALSE(client.is_connected());
    EXPECT_FALSE(client.send("after close"));
}

TEST(IPCSocket, StalledFrameTimesOutAndCloses) {
    using Clock = std::chrono::steady_clock;
    // Half a header, then a header promising 8 bytes followed by only 3
    const std::string partials[] = {std::string("\0\0", 2), std::string("\0\0\0\x08abc", 7)};

    for (const std::string& partial : partials) {
        int fds[2];
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        IPCSocket reader = IPCSocket::adopt(fds[0]);
        IPCSocket writer = IPCSocket::adopt(fds[1]);
        ASSERT_EQ(::write(fds[1], partial.data(), partial.size()), static_cast<ssize_t>(partial.size()));

        auto start = Clock::now();
        EXPECT_FALSE(reader.receive_timeout(200).has_value());
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
        EXPECT_GE(elapsed, 150);
        EXPECT_LT(elapsed, 2000);
        EXPECT_FALSE(reader.is_connected());
        EXPECT_TRUE(writer.is_connected());
    }
}

TEST(IPCSocket, ConnectWithoutListenerThrows) {
    EXPECT_THROW(IPCSocket::connect(socket_path("nobody")), std::runtime_error);
    EXPECT_THROW(IPCSocket::listen("/tmp/" + std::string(200, 'p')), std::runtime_error);
}

TEST(UnixSocketTransport, RequestReply) {
    const std::string path = socket_path("transport");
    IPCSocket server = IPCSocket::listen(path);

    std::thread policy([&] {
        IPCSocket conn = server.accept();
        for (int i = 0; i < 2; i++) {
            std::string req = conn.receive();
            conn.send("echo:" + req);
        }
    });

    UnixSocketTransport transport(path);
    auto a = transport.request("hello", 1000);
    auto b = transport.request("again", 1000);
    policy.join();

    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*a, "echo:hello");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, "echo:again");
    EXPECT_EQ(transport.path(), path);
}

TEST(UnixSocketTransport, NoListenerGivesNoReply) {
    UnixSocketTransport transport(socket_path("absent"));
    EXPECT_FALSE(transport.request("{}", 50).has_value());
    EXPECT_FALSE(transport.request("{}", 50).has_value());
}
