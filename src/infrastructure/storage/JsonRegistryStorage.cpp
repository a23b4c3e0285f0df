#include "infrastructure/storage/JsonRegistryStorage.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace hostwake::infra {

namespace {

// Older data files store a missing MAC as null.
std::string stringOrEmpty(const nlohmann::json& j, const char* key, const std::string& fallback) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    return j[key].get<std::string>();
}

} // namespace

JsonRegistryStorage::JsonRegistryStorage(std::filesystem::path path) : path_(std::move(path)) {}

nlohmann::json JsonRegistryStorage::hostToJson(const core::Host& host) {
    nlohmann::json j;
    j["id"] = host.id;
    j["ip"] = host.ipAddress;
    j["mac"] = host.macAddress;
    j["name"] = host.name;
    j["user"] = host.owner;
    j["status"] = host.statusToString();
    return j;
}

core::Host JsonRegistryStorage::hostFromJson(const nlohmann::json& j) {
    core::Host host;
    host.id = j.at("id").get<int64_t>();
    host.ipAddress = stringOrEmpty(j, "ip", "");
    host.macAddress = stringOrEmpty(j, "mac", "");
    host.name = stringOrEmpty(j, "name", core::kDefaultHostName);
    host.owner = stringOrEmpty(j, "user", core::kDefaultOwner);
    host.status = core::Host::statusFromString(stringOrEmpty(j, "status", "offline"));
    return host;
}

std::vector<core::Host> JsonRegistryStorage::load() {
    std::vector<core::Host> hosts;

    if (!std::filesystem::exists(path_)) {
        spdlog::info("Data file {} not found, starting with an empty registry", path_.string());
        return hosts;
    }

    std::ifstream file(path_);
    if (!file) {
        throw std::runtime_error("Failed to open data file: " + path_.string());
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_array()) {
            throw std::runtime_error("Data file does not contain a JSON array");
        }

        hosts.reserve(j.size());
        for (const auto& entry : j) {
            hosts.push_back(hostFromJson(entry));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse data file " + path_.string() + ": " + e.what());
    }

    spdlog::info("Loaded {} hosts from {}", hosts.size(), path_.string());
    return hosts;
}

void JsonRegistryStorage::save(const std::vector<core::Host>& hosts) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& host : hosts) {
        j.push_back(hostToJson(host));
    }

    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }

    auto tempPath = path_;
    tempPath += ".tmp";

    {
        std::ofstream file(tempPath, std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Failed to open data file for writing: " + tempPath.string());
        }
        file << j.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
        if (!file) {
            throw std::runtime_error("Failed to write data file: " + tempPath.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, path_, ec);
    if (ec) {
        throw std::runtime_error("Failed to replace data file " + path_.string() + ": " +
                                 ec.message());
    }

    spdlog::debug("Saved {} hosts to {}", hosts.size(), path_.string());
}

} // namespace hostwake::infra
