#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/NeighborTable.hpp"

#include <filesystem>
#include <fstream>

using namespace hostwake::infra;

namespace {

class TestArpFile {
public:
    TestArpFile() {
        path_ = std::filesystem::temp_directory_path() / "hostwake_test_arp";
        std::ofstream file(path_, std::ios::trunc);
        file << "IP address       HW type     Flags       HW address            Mask     Device\n"
             << "192.168.1.10     0x1         0x2         aa:bb:cc:dd:ee:ff     *        eth0\n"
             << "192.168.1.20     0x1         0x0         00:00:00:00:00:00     *        eth0\n"
             << "192.168.1.30     0x1         0x2         00:00:00:00:00:00     *        eth0\n"
             << "192.168.1.40     0x1         0x2         00:00:00:00:00:00     *        wlan0\n"
             << "192.168.1.40     0x1         0x2         11:22:33:44:55:66     *        eth0\n"
             << "garbage\n";
    }

    ~TestArpFile() { std::filesystem::remove(path_); }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("NeighborTable lookup", "[NeighborTable]") {
    TestArpFile arp;
    NeighborTable table(arp.path());

    SECTION("Complete entry is returned") {
        auto mac = table.lookup("192.168.1.10");
        REQUIRE(mac.has_value());
        REQUIRE(*mac == "aa:bb:cc:dd:ee:ff");
    }

    SECTION("Incomplete entries are skipped") {
        REQUIRE_FALSE(table.lookup("192.168.1.20").has_value());
    }

    SECTION("Complete entry with an unusable address is still reported") {
        auto mac = table.lookup("192.168.1.30");
        REQUIRE(mac.has_value());
        REQUIRE(*mac == "00:00:00:00:00:00");
    }

    SECTION("Usable binding wins over an earlier unusable one") {
        REQUIRE(table.lookup("192.168.1.40") == std::optional<std::string>("11:22:33:44:55:66"));
    }

    SECTION("Unknown address") {
        REQUIRE_FALSE(table.lookup("10.0.0.1").has_value());
    }

    SECTION("Address prefix does not match") {
        REQUIRE_FALSE(table.lookup("192.168.1.1").has_value());
    }
}

TEST_CASE("NeighborTable unreadable file", "[NeighborTable]") {
    NeighborTable table(std::filesystem::temp_directory_path() / "hostwake_no_such_arp_table");
    REQUIRE_THROWS_AS(table.lookup("192.168.1.10"), std::runtime_error);
}
