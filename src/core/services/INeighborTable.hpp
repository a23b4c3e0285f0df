/**
 * @file INeighborTable.hpp
 * @brief Interface for the operating system's neighbor (ARP) table.
 */

#pragma once

#include <optional>
#include <string>

namespace hostwake::core {

/**
 * @brief Read access to the kernel's IPv4 neighbor cache.
 */
class INeighborTable {
public:
    virtual ~INeighborTable() = default;

    /**
     * @brief Looks up the hardware address bound to an IPv4 address.
     * @param ipAddress Address to look up.
     * @return The MAC address as reported by the OS, or nullopt if there is no entry.
     * @throws std::runtime_error if the table cannot be read.
     */
    virtual std::optional<std::string> lookup(const std::string& ipAddress) = 0;
};

} // namespace hostwake::core
