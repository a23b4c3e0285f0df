#include "infrastructure/network/PingService.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <optional>
#include <random>

#ifdef __linux__
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace hostwake::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;

#ifdef __linux__

std::optional<in_addr> resolveIpv4(const std::string& address) {
    in_addr addr{};
    if (inet_pton(AF_INET, address.c_str(), &addr) == 1) {
        return addr;
    }

    struct addrinfo hints {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    struct addrinfo* result = nullptr;
    if (getaddrinfo(address.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
        return std::nullopt;
    }

    addr = reinterpret_cast<struct sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return addr;
}

// Errors that mean "no route to the host" rather than a broken probe.
bool isUnreachableError(int err) {
    return err == ENETUNREACH || err == EHOSTUNREACH || err == EHOSTDOWN;
}

class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

#endif

} // namespace

PingService::PingService() {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
    spdlog::debug("PingService initialized with identifier: {}", identifier_);
}

uint16_t PingService::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> PingService::buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(64, 0);

    packet[0] = ICMP_ECHO_REQUEST;
    packet[1] = 0;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    // Timestamp as payload
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[8], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

core::PingResult PingService::ping(const std::string& address, std::chrono::milliseconds timeout) {
    core::PingResult result;
    result.timestamp = std::chrono::system_clock::now();

#ifdef __linux__
    auto destAddr = address.empty() ? std::nullopt : resolveIpv4(address);
    if (!destAddr) {
        result.probeError = true;
        result.errorMessage = "Invalid or unresolvable address";
        spdlog::debug("Ping to '{}' failed: {}", address, result.errorMessage);
        return result;
    }

    bool rawSocket = false;
    int fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    if (fd < 0) {
        fd = socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
        rawSocket = true;
    }
    if (fd < 0) {
        result.probeError = true;
        result.errorMessage = std::string("Failed to create ICMP socket: ") + std::strerror(errno);
        spdlog::warn("Ping to {} failed: {}", address, result.errorMessage);
        return result;
    }
    SocketGuard sock(fd);

    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    dest.sin_addr = *destAddr;

    uint16_t seq = sequenceNumber_++;
    auto packet = buildIcmpEchoRequest(identifier_, seq);

    auto sendTime = std::chrono::steady_clock::now();
    auto deadline = sendTime + timeout;

    ssize_t sent = sendto(sock.get(), packet.data(), packet.size(), 0,
                          reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        int err = errno;
        result.probeError = !isUnreachableError(err);
        result.errorMessage = std::string("Failed to send ICMP packet: ") + std::strerror(err);
        return result;
    }

    std::array<uint8_t, 1024> recvBuffer{};

    // Raw sockets see every ICMP packet on the host; keep reading until our
    // reply shows up or the deadline passes.
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.errorMessage = "Timeout";
            return result;
        }

        struct pollfd pfd {};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready == 0) {
            result.errorMessage = "Timeout";
            return result;
        }
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.probeError = true;
            result.errorMessage = std::string("poll failed: ") + std::strerror(errno);
            return result;
        }

        struct sockaddr_in from {};
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(sock.get(), recvBuffer.data(), recvBuffer.size(), 0,
                                    reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        auto recvTime = std::chrono::steady_clock::now();

        if (received < 0) {
            int err = errno;
            if (err == EINTR || err == EAGAIN) {
                continue;
            }
            result.probeError = !isUnreachableError(err);
            result.errorMessage = std::string("Receive error: ") + std::strerror(err);
            return result;
        }

        if (from.sin_addr.s_addr != dest.sin_addr.s_addr) {
            continue;
        }

        // Raw sockets deliver the IP header, datagram sockets only the ICMP message.
        size_t offset = 0;
        if (rawSocket) {
            if (received < 20) {
                continue;
            }
            offset = static_cast<size_t>((recvBuffer[0] & 0x0F) * 4);
        }
        if (static_cast<size_t>(received) < offset + 8) {
            continue;
        }

        const uint8_t* icmpHeader = recvBuffer.data() + offset;
        if (icmpHeader[0] != ICMP_ECHO_REPLY) {
            continue;
        }

        uint16_t recvId = (static_cast<uint16_t>(icmpHeader[4]) << 8) | icmpHeader[5];
        uint16_t recvSeq = (static_cast<uint16_t>(icmpHeader[6]) << 8) | icmpHeader[7];

        // The kernel rewrites the identifier of datagram ICMP sockets.
        if (recvSeq != seq || (rawSocket && recvId != identifier_)) {
            continue;
        }

        result.success = true;
        result.latency = std::chrono::duration_cast<std::chrono::microseconds>(recvTime - sendTime);
        if (rawSocket) {
            result.ttl = recvBuffer[8];
        }

        spdlog::debug("Ping to {} successful: {:.2f}ms", address, result.latencyMs());
        return result;
    }
#else
    result.probeError = true;
    result.errorMessage = "ICMP ping not implemented for this platform";
    return result;
#endif
}

} // namespace hostwake::infra
