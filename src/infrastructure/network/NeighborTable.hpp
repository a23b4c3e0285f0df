#pragma once

#include "core/services/INeighborTable.hpp"

#include <filesystem>

namespace hostwake::infra {

/**
 * @brief Reads the kernel IPv4 neighbor cache from procfs.
 *
 * Parses the /proc/net/arp format:
 * @code
 * IP address       HW type     Flags       HW address            Mask     Device
 * 192.168.1.10     0x1         0x2         aa:bb:cc:dd:ee:ff     *        eth0
 * @endcode
 * Rows with flags 0x0 are incomplete resolutions and are skipped.
 */
class NeighborTable : public core::INeighborTable {
public:
    /**
     * @brief Constructs a reader for the given table file.
     * @param tablePath Path to the table (defaults to /proc/net/arp).
     */
    explicit NeighborTable(std::filesystem::path tablePath = "/proc/net/arp");

    std::optional<std::string> lookup(const std::string& ipAddress) override;

private:
    std::filesystem::path tablePath_;
};

} // namespace hostwake::infra
