/**
 * @file IPingService.hpp
 * @brief Interface for the ICMP reachability probe.
 *
 * This file defines the abstract interface used by the status poller and the
 * address resolver to send a single echo request to a host.
 */

#pragma once

#include "core/types/PingResult.hpp"

#include <chrono>
#include <string>

namespace hostwake::core {

/**
 * @brief Interface for a single-packet ICMP probe.
 *
 * @note On Linux, the probe needs either net.ipv4.ping_group_range to cover
 *       the process group or the CAP_NET_RAW capability.
 */
class IPingService {
public:
    virtual ~IPingService() = default;

    /**
     * @brief Sends one echo request and waits for the reply.
     *
     * Blocks the calling thread for at most @p timeout. Failures are reported
     * in the result; implementations may still throw on unexpected errors.
     *
     * @param address IPv4 address or hostname to probe.
     * @param timeout Maximum time to wait for a reply.
     * @return The probe result.
     */
    virtual PingResult ping(const std::string& address, std::chrono::milliseconds timeout) = 0;
};

} // namespace hostwake::core
