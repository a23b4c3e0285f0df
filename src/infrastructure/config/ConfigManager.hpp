#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace hostwake::infra {

/// An address resolution blocks one HTTP worker; a second keeps requests flowing.
inline constexpr int kMinWorkerThreads = 2;

/**
 * @brief Application configuration settings.
 *
 * Relative paths are resolved against the configuration directory.
 */
struct AppConfig {
    // HTTP server
    uint16_t serverPort{5000};              ///< Listening port.
    std::string bindAddress{"0.0.0.0"};     ///< Listening address.
    std::string staticDir{"templates"};     ///< Directory holding dashboard.html.
    int workerThreads{4};                   ///< Asio worker threads (at least kMinWorkerThreads).

    // Storage
    std::string dataFile{"machines.json"};  ///< Registry snapshot file.

    // Status polling
    int pollIntervalSeconds{3};             ///< Pause between polling cycles.
    int probeTimeoutMs{500};                ///< Echo request timeout.

    // MAC resolution
    int primeTimeoutMs{200};                ///< Timeout of the cache priming probe.
    std::string neighborTablePath{"/proc/net/arp"}; ///< Kernel neighbor table.

    // Wake-on-LAN
    std::string wakeBroadcastAddress{"255.255.255.255"}; ///< Magic packet destination.
    uint16_t wakePort{9};                   ///< Magic packet UDP port.

    // Logging
    std::string logLevel{"info"};           ///< spdlog level name.
    std::string logFile{"hostwake.log"};    ///< Rotating log file.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of the configuration from config.json in the
 * configuration directory. Missing keys keep their defaults.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory (created if missing).
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, writing defaults if no file exists.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }
    std::filesystem::path configDir() const { return configDir_; }

    /**
     * @brief Returns the path of the registry data file.
     */
    std::filesystem::path dataFilePath() const;

    /**
     * @brief Returns the path of the log file.
     */
    std::filesystem::path logFilePath() const;

    /**
     * @brief Returns the directory static pages are served from.
     */
    std::filesystem::path staticDirPath() const;

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);
    std::filesystem::path resolve(const std::string& path) const;

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace hostwake::infra
