#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>

using namespace hostwake::infra;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "hostwake_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

    void write(const std::string& content) const {
        std::ofstream file(configDir_ / "config.json", std::ios::trunc);
        file << content;
    }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "hostwake_config_new_test";
        std::filesystem::remove_all(tempPath);

        REQUIRE_FALSE(std::filesystem::exists(tempPath));

        ConfigManager manager(tempPath);

        REQUIRE(std::filesystem::is_directory(tempPath));

        std::filesystem::remove_all(tempPath);
    }

    SECTION("Sets correct config path") {
        TestConfigDir testDir;
        ConfigManager manager(testDir.path());

        REQUIRE(manager.configPath() == testDir.path() / "config.json");
        REQUIRE(manager.configDir() == testDir.path());
    }
}

TEST_CASE("ConfigManager defaults", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.path());

    REQUIRE(manager.load());

    const auto& config = manager.config();
    REQUIRE(config.serverPort == 5000);
    REQUIRE(config.bindAddress == "0.0.0.0");
    REQUIRE(config.staticDir == "templates");
    REQUIRE(config.workerThreads == 4);
    REQUIRE(config.dataFile == "machines.json");
    REQUIRE(config.pollIntervalSeconds == 3);
    REQUIRE(config.probeTimeoutMs == 500);
    REQUIRE(config.primeTimeoutMs == 200);
    REQUIRE(config.neighborTablePath == "/proc/net/arp");
    REQUIRE(config.wakeBroadcastAddress == "255.255.255.255");
    REQUIRE(config.wakePort == 9);
    REQUIRE(config.logLevel == "info");
    REQUIRE(config.logFile == "hostwake.log");

    SECTION("Defaults are written when no file exists") {
        REQUIRE(std::filesystem::exists(manager.configPath()));

        std::ifstream file(manager.configPath());
        auto j = nlohmann::json::parse(file);
        REQUIRE(j["server"]["port"] == 5000);
        REQUIRE(j["storage"]["data_file"] == "machines.json");
        REQUIRE(j["wake"]["broadcast_address"] == "255.255.255.255");
    }
}

TEST_CASE("ConfigManager save and load", "[ConfigManager]") {
    TestConfigDir testDir;

    {
        ConfigManager manager(testDir.path());
        manager.config().serverPort = 8080;
        manager.config().dataFile = "/var/lib/hostwake/machines.json";
        manager.config().pollIntervalSeconds = 10;
        manager.config().wakeBroadcastAddress = "192.168.1.255";
        manager.config().wakePort = 7;
        manager.config().logLevel = "debug";
        REQUIRE(manager.save());
    }

    ConfigManager reloaded(testDir.path());
    REQUIRE(reloaded.load());

    const auto& config = reloaded.config();
    REQUIRE(config.serverPort == 8080);
    REQUIRE(config.dataFile == "/var/lib/hostwake/machines.json");
    REQUIRE(config.pollIntervalSeconds == 10);
    REQUIRE(config.wakeBroadcastAddress == "192.168.1.255");
    REQUIRE(config.wakePort == 7);
    REQUIRE(config.logLevel == "debug");
}

TEST_CASE("ConfigManager partial files", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Missing keys keep their defaults") {
        testDir.write(R"({"server": {"port": 6000}, "monitoring": {}})");

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().serverPort == 6000);
        REQUIRE(manager.config().bindAddress == "0.0.0.0");
        REQUIRE(manager.config().pollIntervalSeconds == 3);
        REQUIRE(manager.config().dataFile == "machines.json");
    }

    SECTION("Worker thread count has a floor") {
        for (const char* content : {R"({"server": {"worker_threads": 0}})",
                                    R"({"server": {"worker_threads": 1}})",
                                    R"({"server": {"worker_threads": -3}})"}) {
            testDir.write(content);

            ConfigManager manager(testDir.path());
            REQUIRE(manager.load());
            REQUIRE(manager.config().workerThreads == kMinWorkerThreads);
        }
    }

    SECTION("Larger worker thread counts are kept") {
        testDir.write(R"({"server": {"worker_threads": 8}})");

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().workerThreads == 8);
    }

    SECTION("Malformed file is reported and defaults remain") {
        testDir.write("{ not json");

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().serverPort == 5000);
    }
}

TEST_CASE("ConfigManager path resolution", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.path());

    SECTION("Relative paths are resolved against the config directory") {
        REQUIRE(manager.dataFilePath() == testDir.path() / "machines.json");
        REQUIRE(manager.logFilePath() == testDir.path() / "hostwake.log");
        REQUIRE(manager.staticDirPath() == testDir.path() / "templates");
    }

    SECTION("Absolute paths are kept") {
        manager.config().dataFile = "/srv/machines.json";
        REQUIRE(manager.dataFilePath() == std::filesystem::path("/srv/machines.json"));
    }
}
