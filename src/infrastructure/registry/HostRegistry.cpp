#include "infrastructure/registry/HostRegistry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hostwake::infra {

HostRegistry::HostRegistry(std::shared_ptr<core::IRegistryStorage> storage)
    : storage_(std::move(storage)) {}

void HostRegistry::load() {
    auto hosts = storage_->load();

    std::lock_guard lock(mutex_);
    hosts_ = std::move(hosts);
    spdlog::debug("Registry loaded with {} hosts", hosts_.size());
}

std::vector<core::Host> HostRegistry::list() const {
    std::lock_guard lock(mutex_);
    return hosts_;
}

std::optional<core::Host> HostRegistry::find(int64_t id) const {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(hosts_.begin(), hosts_.end(), [id](const auto& h) { return h.id == id; });
    if (it == hosts_.end()) {
        return std::nullopt;
    }
    return *it;
}

core::Host HostRegistry::add(const core::HostFields& fields) {
    std::lock_guard lock(mutex_);

    core::Host host;
    host.id = nextId();
    host.ipAddress = fields.ipAddress;
    host.macAddress = fields.macAddress;
    host.name = fields.name.empty() ? core::kDefaultHostName : fields.name;
    host.owner = fields.owner.empty() ? core::kDefaultOwner : fields.owner;
    host.status = core::HostStatus::Offline;

    auto previous = hosts_;
    hosts_.push_back(host);
    persist(std::move(previous));

    spdlog::info("Added host '{}' ({}) with id {}", host.name, host.ipAddress, host.id);
    return host;
}

std::optional<core::Host> HostRegistry::update(int64_t id, const core::HostUpdate& update) {
    std::lock_guard lock(mutex_);

    auto it = std::find_if(hosts_.begin(), hosts_.end(), [id](const auto& h) { return h.id == id; });
    if (it == hosts_.end()) {
        return std::nullopt;
    }

    auto previous = hosts_;
    if (update.ipAddress)
        it->ipAddress = *update.ipAddress;
    if (update.macAddress)
        it->macAddress = *update.macAddress;
    if (update.name)
        it->name = *update.name;
    if (update.owner)
        it->owner = *update.owner;

    core::Host updated = *it;
    persist(std::move(previous));

    spdlog::info("Updated host '{}' (id: {})", updated.name, updated.id);
    return updated;
}

bool HostRegistry::remove(int64_t id) {
    std::lock_guard lock(mutex_);

    auto it = std::find_if(hosts_.begin(), hosts_.end(), [id](const auto& h) { return h.id == id; });
    if (it == hosts_.end()) {
        return false;
    }

    auto previous = hosts_;
    hosts_.erase(it);
    persist(std::move(previous));

    spdlog::info("Removed host id: {}", id);
    return true;
}

bool HostRegistry::setStatus(int64_t id, core::HostStatus status) {
    std::lock_guard lock(mutex_);

    auto it = std::find_if(hosts_.begin(), hosts_.end(), [id](const auto& h) { return h.id == id; });
    if (it == hosts_.end()) {
        return false;
    }

    it->status = status;
    return true;
}

size_t HostRegistry::size() const {
    std::lock_guard lock(mutex_);
    return hosts_.size();
}

int64_t HostRegistry::nextId() const {
    if (hosts_.empty()) {
        return 1;
    }
    auto maxIt = std::max_element(hosts_.begin(), hosts_.end(),
                                  [](const auto& a, const auto& b) { return a.id < b.id; });
    return maxIt->id + 1;
}

// Caller holds mutex_.
void HostRegistry::persist(std::vector<core::Host> previous) {
    try {
        storage_->save(hosts_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to persist registry, reverting change: {}", e.what());
        hosts_ = std::move(previous);
        throw;
    }
}

} // namespace hostwake::infra
