#pragma once

#include "core/services/IRegistryStorage.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace hostwake::infra {

/**
 * @brief Stores the host registry as a JSON array in a single file.
 *
 * Each entry is an object with the keys id, ip, mac, name, user and status.
 * Text is written as UTF-8 without escaping, so localized names stay readable
 * in the file. Saves go through a temporary file that is renamed over the
 * previous snapshot.
 */
class JsonRegistryStorage : public core::IRegistryStorage {
public:
    /**
     * @brief Constructs the storage for the given file.
     * @param path Path to the JSON data file (created on first save).
     */
    explicit JsonRegistryStorage(std::filesystem::path path);

    std::vector<core::Host> load() override;
    void save(const std::vector<core::Host>& hosts) override;

    const std::filesystem::path& path() const { return path_; }

    static nlohmann::json hostToJson(const core::Host& host);
    static core::Host hostFromJson(const nlohmann::json& j);

private:
    std::filesystem::path path_;
};

} // namespace hostwake::infra
