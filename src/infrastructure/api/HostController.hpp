#pragma once

#include "core/types/Host.hpp"
#include "infrastructure/network/AddressResolver.hpp"
#include "infrastructure/network/WakeOnLanService.hpp"
#include "infrastructure/registry/HostRegistry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hostwake::infra {

/**
 * @brief Outcome category of a controller operation.
 */
enum class RequestStatus {
    Ok,           ///< Operation applied
    NotFound,     ///< No host with the given id
    InvalidInput, ///< A required field is missing or malformed
    Failed        ///< The operation was attempted and failed (wake send error)
};

/**
 * @brief Result of a controller operation.
 */
struct ControllerResult {
    RequestStatus status{RequestStatus::Ok};
    std::optional<core::Host> host; ///< The affected host, when there is one
    std::string message;            ///< Informational or error message, may be empty

    [[nodiscard]] bool ok() const { return status == RequestStatus::Ok; }
};

/**
 * @brief Implements the host management operations behind the HTTP API.
 *
 * Input is trimmed before it reaches the registry. Add and update resolve the
 * MAC address synchronously when it is left empty; a failed resolution is
 * reported in the message and does not block the write.
 */
class HostController {
public:
    HostController(std::shared_ptr<HostRegistry> registry,
                   std::shared_ptr<AddressResolver> resolver,
                   std::shared_ptr<WakeOnLanService> wakeService);

    std::vector<core::Host> listHosts() const;

    /**
     * @brief Registers a new host.
     *
     * Requires a non-empty IP address. An empty MAC triggers resolution; a
     * non-empty MAC must parse to a non-zero address and is stored as
     * lowercase colon-separated hex.
     */
    ControllerResult addHost(core::HostFields fields);

    /**
     * @brief Modifies the identity fields of a host.
     *
     * A MAC of "" is a request to re-resolve from the (new or current) IP
     * address. A non-empty MAC is normalized like in addHost and stored
     * without resolution. An IP address, when present, must not be empty.
     */
    ControllerResult updateHost(int64_t id, core::HostUpdate update);

    ControllerResult deleteHost(int64_t id);

    /**
     * @brief Sends a wake packet; independent of registry membership.
     */
    ControllerResult wake(const std::string& macAddress);

private:
    std::shared_ptr<HostRegistry> registry_;
    std::shared_ptr<AddressResolver> resolver_;
    std::shared_ptr<WakeOnLanService> wakeService_;
};

} // namespace hostwake::infra
