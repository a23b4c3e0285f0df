#pragma once

#include "core/services/INeighborTable.hpp"
#include "core/services/IPingService.hpp"
#include "core/types/OperationResult.hpp"

#include <chrono>
#include <memory>

namespace hostwake::infra {

/**
 * @brief Best-effort discovery of a host's MAC address from its IPv4 address.
 *
 * The neighbor cache has no entry for a host that was never contacted, so a
 * short echo request is sent first to make the kernel resolve it. The reply
 * is irrelevant; only the resulting cache entry is read. The entry then has
 * to pass core::isUsableMacAddress.
 *
 * Never throws: failures become a ResolveResult with success == false.
 */
class AddressResolver {
public:
    static constexpr std::chrono::milliseconds kDefaultPrimeTimeout{200};

    AddressResolver(std::shared_ptr<core::IPingService> pingService,
                    std::shared_ptr<core::INeighborTable> neighborTable,
                    std::chrono::milliseconds primeTimeout = kDefaultPrimeTimeout);

    /**
     * @brief Resolves the MAC address bound to @p ipAddress.
     * @param ipAddress IPv4 address of the host.
     * @return The resolved MAC with a success message, or an empty MAC with a warning.
     */
    core::ResolveResult resolve(const std::string& ipAddress);

private:
    std::shared_ptr<core::IPingService> pingService_;
    std::shared_ptr<core::INeighborTable> neighborTable_;
    std::chrono::milliseconds primeTimeout_;
};

} // namespace hostwake::infra
