/**
 * @file Host.hpp
 * @brief Host entry and status types for the wake registry.
 *
 * This file defines the Host structure which represents a registered machine
 * that can be monitored and woken, together with its status enumeration and
 * the field sets used to create and modify entries.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace hostwake::core {

/**
 * @brief Reachability status of a registered host.
 *
 * Only the status poller writes this value; entries start as Offline.
 */
enum class HostStatus : int {
    Offline = 0, ///< Probe timed out or the host is unreachable
    Online = 1,  ///< Host answered the last echo request
    Error = 2    ///< The probe itself failed (bad address, socket error)
};

inline constexpr const char* kDefaultHostName = "New Host";
inline constexpr const char* kDefaultOwner = "Unknown";

/**
 * @brief A machine tracked by the registry.
 */
struct Host {
    int64_t id{0};                         ///< Unique identifier (max existing + 1)
    std::string ipAddress;                 ///< IPv4 address used for probing and resolution
    std::string macAddress;                ///< Hardware address, empty when unknown
    std::string name{kDefaultHostName};    ///< Display name
    std::string owner{kDefaultOwner};      ///< Owner label
    HostStatus status{HostStatus::Offline}; ///< Last observed reachability

    /**
     * @brief Converts the host status to its wire representation.
     * @return "online", "offline" or "error".
     */
    [[nodiscard]] std::string statusToString() const;

    /**
     * @brief Parses a wire status string.
     * @param str The string to parse.
     * @return The matching status, Offline for anything unrecognised.
     */
    static HostStatus statusFromString(const std::string& str);

    bool operator==(const Host& other) const = default;
};

/**
 * @brief Fields supplied when creating a host.
 *
 * Empty name and owner are replaced by the defaults.
 */
struct HostFields {
    std::string ipAddress;
    std::string macAddress;
    std::string name;
    std::string owner;
};

/**
 * @brief Partial modification of a host's identity fields.
 *
 * Fields left as nullopt keep their current value.
 */
struct HostUpdate {
    std::optional<std::string> ipAddress;
    std::optional<std::string> macAddress;
    std::optional<std::string> name;
    std::optional<std::string> owner;
};

} // namespace hostwake::core
