#include "hotkey/hotkey_channel.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace {

// Loopback UDP peer standing in for the hotkey helper.
class UdpPeer {
public:
    UdpPeer() {
        sock_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (sock_ < 0) throw std::runtime_error("socket() failed");

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (::bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            ::close(sock_);
            throw std::runtime_error("bind() failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(sock_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        timeval tv{};
        tv.tv_sec = 2;
        ::setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }

    ~UdpPeer() { ::close(sock_); }

    void send(uint16_t port, const std::string& payload) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        ::sendto(sock_, payload.data(), payload.size(), 0, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    }

    // Empty on timeout
    std::string receive() {
        char buff[2048];
        const ssize_t n = ::recv(sock_, buff, sizeof(buff), 0);
        return n > 0 ? std::string(buff, (size_t)n) : std::string();
    }

    uint16_t port() const { return port_; }

private:
    int sock_ = -1;
    uint16_t port_ = 0;
};

struct Received {
    HotkeyChannel::Command command;
    std::string ip;
    uint16_t port;
};

} // namespace

TEST(HotkeyChannelTest, ParsesCommandsCaseInsensitively) {
    EXPECT_EQ(HotkeyChannel::parse("press"), HotkeyChannel::Command::Press);
    EXPECT_EQ(HotkeyChannel::parse("  RELEASE\n"), HotkeyChannel::Command::Release);
    EXPECT_EQ(HotkeyChannel::parse("Cancel"), HotkeyChannel::Command::Cancel);
    EXPECT_EQ(HotkeyChannel::parse("repeat\n"), HotkeyChannel::Command::Repeat);
    EXPECT_EQ(HotkeyChannel::parse("cleanup on"), HotkeyChannel::Command::CleanupOn);
    EXPECT_EQ(HotkeyChannel::parse("CLEANUP   OFF"), HotkeyChannel::Command::CleanupOff);
}

TEST(HotkeyChannelTest, UnknownPayloadsAreRejected) {
    EXPECT_EQ(HotkeyChannel::parse(""), HotkeyChannel::Command::Unknown);
    EXPECT_EQ(HotkeyChannel::parse("pressed"), HotkeyChannel::Command::Unknown);
    EXPECT_EQ(HotkeyChannel::parse("cleanupon"), HotkeyChannel::Command::Unknown);
    EXPECT_EQ(HotkeyChannel::parse("cleanup maybe"), HotkeyChannel::Command::Unknown);
}

TEST(HotkeyChannelTest, DeliversDatagramsAndRepliesToActiveClient) {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<Received> received;

    HotkeyChannel channel("127.0.0.1", 0,
        [&](HotkeyChannel::Command command, SteadyClock::time_point, const std::string& ip, uint16_t port) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(Received{command, ip, port});
        cv.notify_all();
    });

    EXPECT_FALSE(channel.sendToActive("nobody yet"));

    channel.start();
    ASSERT_TRUE(channel.isRunning());
    ASSERT_NE(channel.boundPort(), 0);

    UdpPeer peer;
    peer.send(channel.boundPort(), "press");
    peer.send(channel.boundPort(), "not a command");
    peer.send(channel.boundPort(), "release\n");

    {
        std::unique_lock<std::mutex> lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(3), [&] { return received.size() >= 2; }));
        ASSERT_EQ(received.size(), 2u);
        EXPECT_EQ(received[0].command, HotkeyChannel::Command::Press);
        EXPECT_EQ(received[1].command, HotkeyChannel::Command::Release);
        EXPECT_EQ(received[0].ip, "127.0.0.1");
        EXPECT_EQ(received[0].port, peer.port());
    }

    EXPECT_TRUE(channel.sendToActive("{\"type\":\"state\"}"));
    EXPECT_EQ(peer.receive(), "{\"type\":\"state\"}");

    channel.stop();
    EXPECT_FALSE(channel.isRunning());
    EXPECT_FALSE(channel.sendToActive("after stop"));
}

TEST(HotkeyChannelTest, CallbackExceptionDoesNotStopTheChannel) {
    std::mutex mutex;
    std::condition_variable cv;
    int calls = 0;

    HotkeyChannel channel("127.0.0.1", 0,
        [&](HotkeyChannel::Command, SteadyClock::time_point, const std::string&, uint16_t) {
        std::lock_guard<std::mutex> lock(mutex);
        ++calls;
        cv.notify_all();
        throw std::runtime_error("handler failed");
    });
    channel.start();

    UdpPeer peer;
    peer.send(channel.boundPort(), "press");
    peer.send(channel.boundPort(), "release");

    std::unique_lock<std::mutex> lock(mutex);
    EXPECT_TRUE(cv.wait_for(lock, std::chrono::seconds(3), [&] { return calls == 2; }));
}

TEST(HotkeyChannelTest, InvalidBindAddressThrows) {
    HotkeyChannel channel("not-an-ip", 0, nullptr);
    EXPECT_THROW(channel.start(), std::runtime_error);
    EXPECT_FALSE(channel.isRunning());
}

TEST(HotkeyChannelTest, StopIsIdempotent) {
    HotkeyChannel channel("127.0.0.1", 0, nullptr);
    channel.start();
    channel.stop();
    channel.stop();
    EXPECT_FALSE(channel.isRunning());
}
