#include "hotkey/session_publisher.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace {

int boundUdpSocket(uint16_t& port) {
    const int sock = ::socket(AF_INET, SOCK_DGRAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    ::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len);
    port = ntohs(addr.sin_port);

    timeval tv{};
    tv.tv_sec = 2;
    ::setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    return sock;
}

std::string receiveFrom(int sock) {
    char buff[4096];
    const ssize_t n = ::recv(sock, buff, sizeof(buff), 0);
    return n > 0 ? std::string(buff, (size_t)n) : std::string();
}

} // namespace

TEST(SessionPublisherTest, EscapesJsonStrings) {
    EXPECT_EQ(SessionPublisher::escape("plain"), "plain");
    EXPECT_EQ(SessionPublisher::escape("say \"hi\""), "say \\\"hi\\\"");
    EXPECT_EQ(SessionPublisher::escape("a\\b"), "a\\\\b");
    EXPECT_EQ(SessionPublisher::escape("line\nbreak\t"), "line\\nbreak\\t");
    EXPECT_EQ(SessionPublisher::escape(std::string(1, '\x01')), "\\u0001");
}

TEST(SessionPublisherTest, ReportJsonCarriesOutcomeAndTimings) {
    SessionReport report;
    report.sessionId = 7;
    report.outcome = SessionOutcome::Delivered;
    report.text = "He said, \"Hi.\"";
    report.rawText = "he said hi";
    report.audioSeconds = 1.5;
    report.transcribeMs = 820.25;
    report.cleanupMs = 12.0;
    report.totalMs = 900.0;

    const std::string json = SessionPublisher::reportJson(report, 1700000000.0);

    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_NE(json.find("\"type\":\"session_done\""), std::string::npos);
    EXPECT_NE(json.find("\"session\":7"), std::string::npos);
    EXPECT_NE(json.find("\"outcome\":\"delivered\""), std::string::npos);
    EXPECT_NE(json.find("\"reason\":\"none\""), std::string::npos);
    EXPECT_NE(json.find("\"text\":\"He said, \\\"Hi.\\\"\""), std::string::npos);
    EXPECT_NE(json.find("\"raw\":\"he said hi\""), std::string::npos);
    EXPECT_NE(json.find("\"audio_s\":1.500"), std::string::npos);
    EXPECT_NE(json.find("\"transcribe_ms\":820.250"), std::string::npos);
    EXPECT_NE(json.find("\"ts\":1700000000}"), std::string::npos);
    EXPECT_EQ(json.find('\n'), std::string::npos);
}

TEST(SessionPublisherTest, SkippedReportNamesTheReason) {
    SessionReport report;
    report.outcome = SessionOutcome::Skipped;
    report.skipReason = SkipReason::TooShort;

    const std::string json = SessionPublisher::reportJson(report, 0.0);
    EXPECT_NE(json.find("\"outcome\":\"skipped\""), std::string::npos);
    EXPECT_NE(json.find("\"reason\":\"too_short\""), std::string::npos);
}

TEST(SessionPublisherTest, StateAndNoticeJson) {
    StateTransition t;
    t.sessionId = 3;
    t.from = SessionState::Processing;
    t.to = SessionState::ShuttingDown;
    t.forced = true;

    EXPECT_EQ(SessionPublisher::stateJson(t, 5.0),
              "{\"type\":\"state\",\"session\":3,\"from\":\"processing\",\"to\":\"shutting_down\","
              "\"forced\":true,\"ts\":5}");
    EXPECT_EQ(SessionPublisher::noticeJson(3, "Took too long", 5.0),
              "{\"type\":\"notice\",\"session\":3,\"message\":\"Took too long\",\"ts\":5}");
}

TEST(SessionPublisherTest, SendsToActiveClientAndEventsEndpoint) {
    std::mutex mutex;
    std::condition_variable cv;
    bool pressed = false;

    HotkeyChannel channel("127.0.0.1", 0,
        [&](HotkeyChannel::Command, SteadyClock::time_point, const std::string&, uint16_t) {
        std::lock_guard<std::mutex> lock(mutex);
        pressed = true;
        cv.notify_all();
    });
    channel.start();

    uint16_t clientPort = 0;
    uint16_t eventsPort = 0;
    const int client = boundUdpSocket(clientPort);
    const int events = boundUdpSocket(eventsPort);

    sockaddr_in to{};
    to.sin_family = AF_INET;
    to.sin_port = htons(channel.boundPort());
    ::inet_pton(AF_INET, "127.0.0.1", &to.sin_addr);
    const std::string press = "press";
    ::sendto(client, press.data(), press.size(), 0, reinterpret_cast<sockaddr*>(&to), sizeof(to));
    {
        std::unique_lock<std::mutex> lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(3), [&] { return pressed; }));
    }

    SessionPublisher publisher(channel, "127.0.0.1", eventsPort);
    publisher.onNotice(1, "Microphone error: busy");

    const std::string expectedPrefix = "{\"type\":\"notice\",\"session\":1,\"message\":\"Microphone error: busy\"";
    EXPECT_EQ(receiveFrom(client).compare(0, expectedPrefix.size(), expectedPrefix), 0);
    EXPECT_EQ(receiveFrom(events).compare(0, expectedPrefix.size(), expectedPrefix), 0);

    channel.stop();
    ::close(client);
    ::close(events);
}
