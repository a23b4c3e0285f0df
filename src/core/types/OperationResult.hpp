/**
 * @file OperationResult.hpp
 * @brief Result types for best-effort network operations.
 *
 * MAC resolution and Wake-on-LAN never throw to their callers; their outcome
 * is reported through these structures instead.
 */

#pragma once

#include <string>

namespace hostwake::core {

/**
 * @brief Outcome of a MAC address resolution attempt.
 */
struct ResolveResult {
    bool success{false};    ///< Whether a usable MAC address was found
    std::string macAddress; ///< The resolved address, empty on failure
    std::string message;    ///< Human-readable outcome for the API response
};

/**
 * @brief Outcome of sending a Wake-on-LAN packet.
 */
struct WakeResult {
    bool success{false};        ///< Whether the datagram was sent
    bool invalidAddress{false}; ///< Whether the MAC address was missing or malformed
    std::string message;        ///< Confirmation or failure reason
};

} // namespace hostwake::core
