#include "infrastructure/api/HostController.hpp"

#include "core/types/MacAddress.hpp"

namespace hostwake::infra {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

void trimOptional(std::optional<std::string>& value) {
    if (value) {
        *value = trim(*value);
    }
}

// Caller-supplied addresses are stored in canonical form; the all-zero address never is.
std::optional<std::string> normalizeMacAddress(const std::string& mac) {
    auto bytes = core::parseMacAddress(mac);
    if (!bytes || *bytes == core::MacBytes{}) {
        return std::nullopt;
    }
    return core::formatMacAddress(*bytes);
}

ControllerResult invalidInput(std::string message) {
    ControllerResult result;
    result.status = RequestStatus::InvalidInput;
    result.message = std::move(message);
    return result;
}

} // namespace

HostController::HostController(std::shared_ptr<HostRegistry> registry,
                               std::shared_ptr<AddressResolver> resolver,
                               std::shared_ptr<WakeOnLanService> wakeService)
    : registry_(std::move(registry)), resolver_(std::move(resolver)),
      wakeService_(std::move(wakeService)) {}

std::vector<core::Host> HostController::listHosts() const {
    return registry_->list();
}

ControllerResult HostController::addHost(core::HostFields fields) {
    fields.ipAddress = trim(fields.ipAddress);
    fields.macAddress = trim(fields.macAddress);
    fields.name = trim(fields.name);
    fields.owner = trim(fields.owner);

    if (fields.ipAddress.empty()) {
        return invalidInput("No IP");
    }
    if (!fields.macAddress.empty()) {
        auto normalized = normalizeMacAddress(fields.macAddress);
        if (!normalized) {
            return invalidInput("Invalid MAC address: " + fields.macAddress);
        }
        fields.macAddress = *normalized;
    }

    ControllerResult result;
    if (fields.macAddress.empty()) {
        auto resolved = resolver_->resolve(fields.ipAddress);
        fields.macAddress = resolved.macAddress;
        result.message = resolved.message;
    }

    result.host = registry_->add(fields);
    return result;
}

ControllerResult HostController::updateHost(int64_t id, core::HostUpdate update) {
    auto existing = registry_->find(id);
    if (!existing) {
        ControllerResult result;
        result.status = RequestStatus::NotFound;
        result.message = "Not found";
        return result;
    }

    trimOptional(update.ipAddress);
    trimOptional(update.macAddress);
    trimOptional(update.name);
    trimOptional(update.owner);

    if (update.ipAddress && update.ipAddress->empty()) {
        return invalidInput("No IP");
    }
    if (update.macAddress && !update.macAddress->empty()) {
        auto normalized = normalizeMacAddress(*update.macAddress);
        if (!normalized) {
            return invalidInput("Invalid MAC address: " + *update.macAddress);
        }
        update.macAddress = *normalized;
    }

    ControllerResult result;
    if (update.macAddress && update.macAddress->empty()) {
        auto ipAddress = update.ipAddress.value_or(existing->ipAddress);
        if (!ipAddress.empty()) {
            auto resolved = resolver_->resolve(ipAddress);
            update.macAddress = resolved.macAddress;
            result.message = resolved.message;
        }
    }

    // The host may have been deleted while the resolver was running.
    result.host = registry_->update(id, update);
    if (!result.host) {
        result.status = RequestStatus::NotFound;
        result.message = "Not found";
    }
    return result;
}

ControllerResult HostController::deleteHost(int64_t id) {
    ControllerResult result;
    if (!registry_->remove(id)) {
        result.status = RequestStatus::NotFound;
        result.message = "Not found";
    }
    return result;
}

ControllerResult HostController::wake(const std::string& macAddress) {
    auto wakeResult = wakeService_->wake(trim(macAddress));

    ControllerResult result;
    result.message = wakeResult.message;
    if (wakeResult.invalidAddress) {
        result.status = RequestStatus::InvalidInput;
    } else if (!wakeResult.success) {
        result.status = RequestStatus::Failed;
    }
    return result;
}

} // namespace hostwake::infra
