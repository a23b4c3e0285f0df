#include <catch2/catch_test_macros.hpp>

#include "infrastructure/storage/JsonRegistryStorage.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace hostwake::core;
using namespace hostwake::infra;

namespace {

class TestDataFile {
public:
    TestDataFile()
        : dir_(std::filesystem::temp_directory_path() / "hostwake_storage_test") {
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    ~TestDataFile() { std::filesystem::remove_all(dir_); }

    std::filesystem::path path() const { return dir_ / "machines.json"; }

    void write(const std::string& content) const {
        std::ofstream file(path());
        file << content;
    }

    std::string read() const {
        std::ifstream file(path());
        std::ostringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

private:
    std::filesystem::path dir_;
};

Host makeHost(int64_t id, const std::string& ip, const std::string& name) {
    Host host;
    host.id = id;
    host.ipAddress = ip;
    host.name = name;
    return host;
}

} // namespace

TEST_CASE("JsonRegistryStorage load without file", "[JsonRegistryStorage]") {
    TestDataFile file;
    JsonRegistryStorage storage(file.path());

    REQUIRE(storage.load().empty());
    REQUIRE_FALSE(std::filesystem::exists(file.path()));
}

TEST_CASE("JsonRegistryStorage round trip", "[JsonRegistryStorage]") {
    TestDataFile file;
    JsonRegistryStorage storage(file.path());

    Host greek = makeHost(1, "192.168.1.10", "Εργαστήριο 1");
    greek.owner = "Γιώργος";
    greek.macAddress = "aa:bb:cc:dd:ee:ff";
    greek.status = HostStatus::Online;

    Host plain = makeHost(4, "192.168.1.11", "Printer");
    plain.status = HostStatus::Error;

    std::vector<Host> hosts{greek, plain};
    storage.save(hosts);

    SECTION("Loaded entries are identical") {
        auto loaded = storage.load();
        REQUIRE(loaded == hosts);
    }

    SECTION("Non-ASCII text is written verbatim") {
        auto content = file.read();
        REQUIRE(content.find("Εργαστήριο 1") != std::string::npos);
        REQUIRE(content.find("Γιώργος") != std::string::npos);
        REQUIRE(content.find("\\u") == std::string::npos);
    }

    SECTION("Uses the wire field names") {
        auto content = file.read();
        REQUIRE(content.find("\"ip\"") != std::string::npos);
        REQUIRE(content.find("\"mac\"") != std::string::npos);
        REQUIRE(content.find("\"user\"") != std::string::npos);
        REQUIRE(content.find("\"online\"") != std::string::npos);
    }

    SECTION("No temporary file is left behind") {
        auto temp = file.path();
        temp += ".tmp";
        REQUIRE_FALSE(std::filesystem::exists(temp));
    }
}

TEST_CASE("JsonRegistryStorage tolerates older data files", "[JsonRegistryStorage]") {
    TestDataFile file;
    file.write(R"([
        {"id": 2, "ip": "10.0.0.2", "mac": null, "name": "Old", "user": "Admin", "status": "offline"},
        {"id": 5, "ip": "10.0.0.5"}
    ])");

    JsonRegistryStorage storage(file.path());
    auto hosts = storage.load();

    REQUIRE(hosts.size() == 2);
    REQUIRE(hosts[0].id == 2);
    REQUIRE(hosts[0].macAddress.empty());
    REQUIRE(hosts[0].owner == "Admin");
    REQUIRE(hosts[1].name == "New Host");
    REQUIRE(hosts[1].owner == "Unknown");
    REQUIRE(hosts[1].status == HostStatus::Offline);
}

TEST_CASE("JsonRegistryStorage rejects corrupt files", "[JsonRegistryStorage]") {
    TestDataFile file;
    JsonRegistryStorage storage(file.path());

    SECTION("Invalid JSON") {
        file.write("[{\"id\": 1,");
        REQUIRE_THROWS_AS(storage.load(), std::runtime_error);
    }

    SECTION("Not an array") {
        file.write(R"({"id": 1})");
        REQUIRE_THROWS_AS(storage.load(), std::runtime_error);
    }

    SECTION("Entry without id") {
        file.write(R"([{"ip": "10.0.0.1"}])");
        REQUIRE_THROWS_AS(storage.load(), std::runtime_error);
    }
}
