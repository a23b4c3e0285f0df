#pragma once

#include "core/services/IPingService.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace hostwake::infra {

/**
 * @brief ICMP echo probe used for reachability checks and ARP priming.
 *
 * Sends exactly one echo request per call. An unprivileged datagram ICMP
 * socket is tried first; if the kernel refuses it a raw socket is used.
 * Implements the core::IPingService interface.
 *
 * @note On Linux, requires net.ipv4.ping_group_range to include the process
 *       group, or CAP_NET_RAW for the raw socket fallback.
 */
class PingService : public core::IPingService {
public:
    PingService();

    /**
     * @brief Sends one echo request and waits for the matching reply.
     * @param address Target hostname or IPv4 address.
     * @param timeout Maximum time to wait for a response.
     * @return PingResult with latency on success; probeError is set when the
     *         probe could not be sent at all.
     */
    core::PingResult ping(const std::string& address, std::chrono::milliseconds timeout) override;

    // ICMP helpers
    static uint16_t calculateChecksum(const uint8_t* data, size_t length);
    static std::vector<uint8_t> buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence);

private:
    std::atomic<uint16_t> sequenceNumber_{0};
    uint16_t identifier_;
};

} // namespace hostwake::infra
