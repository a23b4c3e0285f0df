/**
 * @file IRegistryStorage.hpp
 * @brief Interface for durable storage of the host registry.
 */

#pragma once

#include "core/types/Host.hpp"

#include <vector>

namespace hostwake::core {

/**
 * @brief Loads and saves complete registry snapshots.
 */
class IRegistryStorage {
public:
    virtual ~IRegistryStorage() = default;

    /**
     * @brief Reads the last saved snapshot.
     * @return All stored hosts, empty if nothing was saved yet.
     * @throws std::runtime_error if the stored data cannot be read or parsed.
     */
    virtual std::vector<Host> load() = 0;

    /**
     * @brief Replaces the stored snapshot.
     * @param hosts The complete registry content.
     * @throws std::runtime_error if the snapshot cannot be written.
     */
    virtual void save(const std::vector<Host>& hosts) = 0;
};

} // namespace hostwake::core
