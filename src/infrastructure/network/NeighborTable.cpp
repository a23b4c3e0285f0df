#include "infrastructure/network/NeighborTable.hpp"

#include "core/types/MacAddress.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace hostwake::infra {

NeighborTable::NeighborTable(std::filesystem::path tablePath) : tablePath_(std::move(tablePath)) {}

std::optional<std::string> NeighborTable::lookup(const std::string& ipAddress) {
    std::ifstream arpFile(tablePath_);
    if (!arpFile.is_open()) {
        throw std::runtime_error("Cannot open neighbor table: " + tablePath_.string());
    }

    std::optional<std::string> found;
    std::string line;
    std::getline(arpFile, line); // header

    while (std::getline(arpFile, line)) {
        std::istringstream ss(line);
        std::string ip, hwType, flags, mac, mask, dev;
        if (!(ss >> ip >> hwType >> flags >> mac)) {
            continue;
        }
        ss >> mask >> dev;

        if (ip != ipAddress || flags == "0x0") {
            continue;
        }

        spdlog::debug("Neighbor entry for {}: {} on {}", ip, mac, dev);

        // The same address may appear on several interfaces; prefer a usable binding.
        if (core::isUsableMacAddress(mac)) {
            return mac;
        }
        if (!found) {
            found = mac;
        }
    }

    return found;
}

} // namespace hostwake::infra
