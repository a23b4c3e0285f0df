#include "infrastructure/network/AddressResolver.hpp"

#include "core/types/MacAddress.hpp"

#include <spdlog/spdlog.h>

namespace hostwake::infra {

namespace {

core::ResolveResult failure(const std::string& ipAddress) {
    core::ResolveResult result;
    result.message = "Could not resolve MAC address for " + ipAddress + "; host saved without MAC";
    return result;
}

} // namespace

AddressResolver::AddressResolver(std::shared_ptr<core::IPingService> pingService,
                                 std::shared_ptr<core::INeighborTable> neighborTable,
                                 std::chrono::milliseconds primeTimeout)
    : pingService_(std::move(pingService)), neighborTable_(std::move(neighborTable)),
      primeTimeout_(primeTimeout) {}

core::ResolveResult AddressResolver::resolve(const std::string& ipAddress) {
    try {
        // Prime the neighbor cache; the probe outcome does not matter.
        auto prime = pingService_->ping(ipAddress, primeTimeout_);
        spdlog::debug("Priming probe to {}: {}", ipAddress,
                      prime.success ? "reply" : prime.errorMessage);

        auto mac = neighborTable_->lookup(ipAddress);
        if (!mac || !core::isUsableMacAddress(*mac)) {
            spdlog::warn("No usable neighbor entry for {} (got '{}')", ipAddress,
                         mac.value_or(""));
            return failure(ipAddress);
        }

        core::ResolveResult result;
        result.success = true;
        result.macAddress = *mac;
        result.message = "MAC address resolved automatically: " + *mac;
        spdlog::info("Resolved {} to {}", ipAddress, *mac);
        return result;
    } catch (const std::exception& e) {
        spdlog::warn("MAC resolution for {} failed: {}", ipAddress, e.what());
        return failure(ipAddress);
    }
}

} // namespace hostwake::infra
