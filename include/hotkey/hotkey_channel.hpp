#ifndef HOTKEY_CHANNEL_HPP
#define HOTKEY_CHANNEL_HPP

#include "session/session_types.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

using socket_t = int;
static constexpr socket_t kInvalidSocket = -1;

// UDP endpoint the OS hotkey helper talks to. Datagrams are one command each:
// "press", "release", "cancel", "repeat", "cleanup on", "cleanup off".
class HotkeyChannel {
public:
    enum class Command { Press, Release, Cancel, Repeat, CleanupOn, CleanupOff, Unknown };

    using CallBack = std::function<void(Command command,
                                        SteadyClock::time_point receivedAt,
                                        const std::string& senderIp,
                                        uint16_t senderPort)>;

    HotkeyChannel(std::string bind_ip, int port, CallBack callback_function);
    ~HotkeyChannel();

    HotkeyChannel(const HotkeyChannel&) = delete;
    HotkeyChannel& operator=(const HotkeyChannel&) = delete;

    // Binds the socket and starts the receive thread. Throws std::runtime_error.
    void start();
    void stop();

    bool sendTo(const std::string& ip, uint16_t port, const std::string& payload);
    bool sendToActive(const std::string& payload);

    // Port actually bound; differs from the configured one when that was 0
    uint16_t boundPort() const { return bound_port_.load(); }

    bool isRunning() const { return running_.load(); }

    static Command parse(const std::string& payload);
    static const char* toString(Command command);

private:
    void run();

    void setActiveClient(const std::string& ip, uint16_t port);
    void closeSocket();

    std::string bind_ip_;
    int port_;
    CallBack callback_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};

    std::mutex sock_mutex_;
    socket_t sock_{kInvalidSocket};

    std::mutex client_mutex_;
    std::string active_ip_{"127.0.0.1"};
    uint16_t active_port_{0};
    bool has_active_client_{false};
};

#endif
