#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace hostwake::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    j["server"]["port"] = config_.serverPort;
    j["server"]["bind_address"] = config_.bindAddress;
    j["server"]["static_dir"] = config_.staticDir;
    j["server"]["worker_threads"] = config_.workerThreads;

    j["storage"]["data_file"] = config_.dataFile;

    j["monitoring"]["poll_interval_seconds"] = config_.pollIntervalSeconds;
    j["monitoring"]["probe_timeout_ms"] = config_.probeTimeoutMs;

    j["resolver"]["prime_timeout_ms"] = config_.primeTimeoutMs;
    j["resolver"]["neighbor_table_path"] = config_.neighborTablePath;

    j["wake"]["broadcast_address"] = config_.wakeBroadcastAddress;
    j["wake"]["port"] = config_.wakePort;

    j["logging"]["level"] = config_.logLevel;
    j["logging"]["file"] = config_.logFile;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    const AppConfig defaults;

    if (j.contains("server")) {
        const auto& s = j["server"];
        config_.serverPort = s.value("port", defaults.serverPort);
        config_.bindAddress = s.value("bind_address", defaults.bindAddress);
        config_.staticDir = s.value("static_dir", defaults.staticDir);
        config_.workerThreads =
            std::max(kMinWorkerThreads, s.value("worker_threads", defaults.workerThreads));
    }

    if (j.contains("storage")) {
        config_.dataFile = j["storage"].value("data_file", defaults.dataFile);
    }

    if (j.contains("monitoring")) {
        const auto& m = j["monitoring"];
        config_.pollIntervalSeconds = m.value("poll_interval_seconds", defaults.pollIntervalSeconds);
        config_.probeTimeoutMs = m.value("probe_timeout_ms", defaults.probeTimeoutMs);
    }

    if (j.contains("resolver")) {
        const auto& r = j["resolver"];
        config_.primeTimeoutMs = r.value("prime_timeout_ms", defaults.primeTimeoutMs);
        config_.neighborTablePath = r.value("neighbor_table_path", defaults.neighborTablePath);
    }

    if (j.contains("wake")) {
        const auto& w = j["wake"];
        config_.wakeBroadcastAddress = w.value("broadcast_address", defaults.wakeBroadcastAddress);
        config_.wakePort = w.value("port", defaults.wakePort);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config_.logLevel = l.value("level", defaults.logLevel);
        config_.logFile = l.value("file", defaults.logFile);
    }
}

std::filesystem::path ConfigManager::resolve(const std::string& path) const {
    std::filesystem::path p(path);
    return p.is_absolute() ? p : configDir_ / p;
}

std::filesystem::path ConfigManager::dataFilePath() const {
    return resolve(config_.dataFile);
}

std::filesystem::path ConfigManager::logFilePath() const {
    return resolve(config_.logFile);
}

std::filesystem::path ConfigManager::staticDirPath() const {
    return resolve(config_.staticDir);
}

} // namespace hostwake::infra
