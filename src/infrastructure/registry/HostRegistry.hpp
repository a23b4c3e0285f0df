#pragma once

#include "core/services/IRegistryStorage.hpp"
#include "core/types/Host.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace hostwake::infra {

/**
 * @brief In-memory registry of hosts, mirrored to durable storage.
 *
 * All access is serialized by an internal mutex. Structural mutations (add,
 * update, remove) write a complete snapshot through the storage before they
 * return; if the write fails the change is rolled back and the error is
 * rethrown. Status updates from the poller only touch memory.
 *
 * Ids are allocated as one greater than the current maximum, so the id of a
 * deleted entry comes back if that entry held the maximum.
 */
class HostRegistry {
public:
    /**
     * @brief Constructs an empty registry backed by the given storage.
     * @param storage Durable storage for snapshots.
     */
    explicit HostRegistry(std::shared_ptr<core::IRegistryStorage> storage);

    HostRegistry(const HostRegistry&) = delete;
    HostRegistry& operator=(const HostRegistry&) = delete;

    /**
     * @brief Replaces the registry content with the stored snapshot.
     * @throws std::runtime_error if the storage cannot be read.
     */
    void load();

    /**
     * @brief Returns a copy of all entries in insertion order.
     */
    std::vector<core::Host> list() const;

    /**
     * @brief Finds a host by its ID.
     * @param id ID of the host to find.
     * @return Copy of the host if found, nullopt otherwise.
     */
    std::optional<core::Host> find(int64_t id) const;

    /**
     * @brief Creates a new entry with status Offline and persists the registry.
     * @param fields Identity fields; empty name/owner are replaced by defaults.
     * @return The stored entry including its new id.
     */
    core::Host add(const core::HostFields& fields);

    /**
     * @brief Replaces the identity fields present in @p update and persists.
     * @param id ID of the host to modify.
     * @param update Fields to replace.
     * @return The updated entry, or nullopt if no host has this id (nothing is written).
     */
    std::optional<core::Host> update(int64_t id, const core::HostUpdate& update);

    /**
     * @brief Removes a host and persists the registry.
     * @param id ID of the host to remove.
     * @return False if no host has this id (nothing is written).
     */
    bool remove(int64_t id);

    /**
     * @brief Sets the reachability status of a host without persisting.
     * @param id ID of the host.
     * @param status New status value.
     * @return False if the host no longer exists.
     */
    bool setStatus(int64_t id, core::HostStatus status);

    /**
     * @brief Returns the number of registered hosts.
     */
    size_t size() const;

private:
    int64_t nextId() const;
    void persist(std::vector<core::Host> previous);

    std::shared_ptr<core::IRegistryStorage> storage_;
    std::vector<core::Host> hosts_;
    mutable std::mutex mutex_;
};

} // namespace hostwake::infra
