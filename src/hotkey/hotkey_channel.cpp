#include "hotkey/hotkey_channel.hpp"
#include "pipeline/text_formatter.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

// Constructor
HotkeyChannel::HotkeyChannel(std::string bind_ip, int port, CallBack callback_function)
    : bind_ip_(std::move(bind_ip)), port_(port), callback_(std::move(callback_function)) {}

// Destructor
HotkeyChannel::~HotkeyChannel() { stop(); }

HotkeyChannel::Command HotkeyChannel::parse(const std::string& payload) {
    std::string p = text_formatter::trim(payload);
    std::transform(p.begin(), p.end(), p.begin(), [](unsigned char c) { return (char)std::tolower(c); });

    if (p == "press") return Command::Press;
    if (p == "release") return Command::Release;
    if (p == "cancel") return Command::Cancel;
    if (p == "repeat") return Command::Repeat;

    // "cleanup on" with any run of whitespace between the words
    if (p.compare(0, 7, "cleanup") == 0) {
        const std::string arg = text_formatter::trim(p.substr(7));
        if (p.size() > 7 && std::isspace((unsigned char)p[7])) {
            if (arg == "on") return Command::CleanupOn;
            if (arg == "off") return Command::CleanupOff;
        }
    }
    return Command::Unknown;
}

const char* HotkeyChannel::toString(Command command) {
    switch (command) {
        case Command::Press:      return "press";
        case Command::Release:    return "release";
        case Command::Cancel:     return "cancel";
        case Command::Repeat:     return "repeat";
        case Command::CleanupOn:  return "cleanup on";
        case Command::CleanupOff: return "cleanup off";
        case Command::Unknown:    return "unknown";
    }
    return "unknown";
}

// Binds the datagram socket and starts the receive thread
void HotkeyChannel::start() {
    if (running_.load()) return;

    socket_t sock = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sock == kInvalidSocket) {
        throw std::runtime_error(std::string("HotkeyChannel socket() failed: ") + std::strerror(errno));
    }

    int reuse = 1;
    if (::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        std::cout << "[Hotkey Channel] [WARN] SO_REUSEADDR failed: " << std::strerror(errno) << std::endl;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));

    if (::inet_pton(AF_INET, bind_ip_.c_str(), &addr.sin_addr) != 1) {
        ::close(sock);
        throw std::runtime_error("HotkeyChannel: invalid bind ip: " + bind_ip_);
    }

    if (::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const std::string err = std::strerror(errno);
        ::close(sock);
        throw std::runtime_error("HotkeyChannel bind() to " + bind_ip_ + ":" + std::to_string(port_) +
                                 " failed: " + err);
    }

    sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(sock, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = static_cast<uint16_t>(port_);
    }

    {
        std::lock_guard<std::mutex> lock(sock_mutex_);
        sock_ = sock;
    }
    running_ = true;
    thread_ = std::thread(&HotkeyChannel::run, this);

    std::cout << "[Hotkey Channel] Listening on " << bind_ip_ << ":" << bound_port_.load() << std::endl;
}

// Stops the receive thread and closes the socket
void HotkeyChannel::stop() {
    if (!running_.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lock(sock_mutex_);
        // Wakes the blocking recvfrom
        if (sock_ != kInvalidSocket) ::shutdown(sock_, SHUT_RDWR);
    }

    if (thread_.joinable()) thread_.join();
    closeSocket();
}

void HotkeyChannel::closeSocket() {
    std::lock_guard<std::mutex> lock(sock_mutex_);
    if (sock_ != kInvalidSocket) {
        ::close(sock_);
        sock_ = kInvalidSocket;
    }
}

// Sets current active client the channel replies to
void HotkeyChannel::setActiveClient(const std::string& ip, uint16_t port) {
    std::lock_guard<std::mutex> lock(client_mutex_);
    active_ip_ = ip;
    active_port_ = port;
    has_active_client_ = true;
}

// Sends a payload to an ip and port without blocking
bool HotkeyChannel::sendTo(const std::string& ip, uint16_t port, const std::string& payload) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return false;
    }

    std::lock_guard<std::mutex> lock(sock_mutex_);
    if (sock_ == kInvalidSocket) return false;

    ssize_t n = ::sendto(sock_, payload.data(), payload.size(), MSG_DONTWAIT,
                         reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    return n == (ssize_t)payload.size();
}

// Sends a payload to the active client
bool HotkeyChannel::sendToActive(const std::string& payload) {
    std::string ip;
    uint16_t port = 0;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (!has_active_client_) return false;
        ip = active_ip_;
        port = active_port_;
    }
    return sendTo(ip, port, payload);
}

// Thread function that receives commands from the hotkey helper
void HotkeyChannel::run() {
    socket_t sock;
    {
        std::lock_guard<std::mutex> lock(sock_mutex_);
        sock = sock_;
    }

    while (running_.load()) {
        char buff[2048];
        sockaddr_in src{};
        socklen_t slen = sizeof(src);
        const ssize_t n = ::recvfrom(sock, buff, sizeof(buff) - 1, 0,
                                     reinterpret_cast<sockaddr*>(&src), &slen);
        const auto receivedAt = SteadyClock::now();

        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            if (n < 0 && running_.load()) {
                std::cerr << "[Hotkey Channel] [ERROR] recvfrom() failed: " << std::strerror(errno) << std::endl;
            }
            break;
        }
        buff[n] = '\0';

        char ipstr[INET_ADDRSTRLEN]{};
        const char* ok = ::inet_ntop(AF_INET, &src.sin_addr, ipstr, sizeof(ipstr));
        std::string senderIp = ok ? std::string(ipstr) : std::string("127.0.0.1");
        uint16_t senderPort = ntohs(src.sin_port);

        setActiveClient(senderIp, senderPort);

        const Command command = parse(std::string(buff, (size_t)n));
        if (command == Command::Unknown) {
            std::cout << "[Hotkey Channel] [WARN] Ignoring unknown command '" << text_formatter::trim(buff)
                      << "' from " << senderIp << ":" << senderPort << std::endl;
            continue;
        }

        std::cout << "[Hotkey Channel] " << toString(command) << " from " << senderIp << ":" << senderPort << std::endl;

        try {
            if (callback_) callback_(command, receivedAt, senderIp, senderPort);
        } catch (const std::exception& e) {
            std::cerr << "[Hotkey Channel] [ERROR] Callback threw: " << e.what() << std::endl;
        }
    }
}
