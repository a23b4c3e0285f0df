/**
 * @file PingResult.hpp
 * @brief Result type of a single reachability probe.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace hostwake::core {

/**
 * @brief Result of a single ICMP echo request.
 *
 * A probe that did not get a reply is either a plain miss (timeout, host
 * unreachable) or a probe error (invalid address, socket failure). The poller
 * maps the former to Offline and the latter to Error.
 */
struct PingResult {
    std::chrono::system_clock::time_point timestamp; ///< When the probe was sent
    std::chrono::microseconds latency{0}; ///< Round-trip time in microseconds
    bool success{false};     ///< Whether an echo reply was received
    bool probeError{false};  ///< Whether the probe could not be performed at all
    std::optional<int> ttl;  ///< Time-to-live from the reply (raw sockets only)
    std::string errorMessage; ///< Reason when no reply was received

    /**
     * @brief Converts the latency to milliseconds.
     * @return Latency as a floating-point number of milliseconds.
     */
    [[nodiscard]] double latencyMs() const {
        return static_cast<double>(latency.count()) / 1000.0;
    }

    bool operator==(const PingResult& other) const = default;
};

} // namespace hostwake::core
