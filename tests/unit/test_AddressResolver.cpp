#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/AddressResolver.hpp"
#include "support/FakeServices.hpp"

using namespace hostwake::infra;
using hostwake::testing::FakeNeighborTable;
using hostwake::testing::FakePingService;

TEST_CASE("AddressResolver resolves through the neighbor table", "[AddressResolver]") {
    auto ping = std::make_shared<FakePingService>();
    auto table = std::make_shared<FakeNeighborTable>();
    table->requirePrimingBy(ping);
    AddressResolver resolver(ping, table);

    SECTION("Usable binding after priming") {
        table->set("192.168.1.10", "aa:bb:cc:dd:ee:ff");

        auto result = resolver.resolve("192.168.1.10");
        REQUIRE(result.success);
        REQUIRE(result.macAddress == "aa:bb:cc:dd:ee:ff");
        REQUIRE(result.message == "MAC address resolved automatically: aa:bb:cc:dd:ee:ff");
    }

    SECTION("Priming probe uses the short timeout and precedes the lookup") {
        table->set("192.168.1.10", "aa:bb:cc:dd:ee:ff");
        resolver.resolve("192.168.1.10");

        auto calls = ping->calls();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].address == "192.168.1.10");
        REQUIRE(calls[0].timeout == std::chrono::milliseconds(200));
        REQUIRE(table->lookups().size() == 1);
    }

    SECTION("Unanswered probe still allows resolution") {
        // FakePingService times out for addresses not marked alive.
        table->set("192.168.1.11", "11:22:33:44:55:66");
        REQUIRE(resolver.resolve("192.168.1.11").success);
    }

    SECTION("All-zero address is rejected") {
        table->set("192.168.1.12", "00:00:00:00:00:00");

        auto result = resolver.resolve("192.168.1.12");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.macAddress.empty());
        REQUIRE(result.message ==
                "Could not resolve MAC address for 192.168.1.12; host saved without MAC");
    }

    SECTION("Short address is rejected") {
        table->set("192.168.1.13", "aa:bb:cc");
        REQUIRE_FALSE(resolver.resolve("192.168.1.13").success);
    }

    SECTION("Missing entry") {
        auto result = resolver.resolve("192.168.1.99");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.macAddress.empty());
    }
}

TEST_CASE("AddressResolver never throws", "[AddressResolver]") {
    auto ping = std::make_shared<FakePingService>();
    auto table = std::make_shared<FakeNeighborTable>();
    table->set("192.168.1.10", "aa:bb:cc:dd:ee:ff");

    SECTION("Unreadable neighbor table") {
        table->setFailing(true);
        AddressResolver resolver(ping, table);

        auto result = resolver.resolve("192.168.1.10");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.macAddress.empty());
    }

    SECTION("Probe raises") {
        ping->setThrowing("192.168.1.10");
        AddressResolver resolver(ping, table);

        auto result = resolver.resolve("192.168.1.10");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.message.find("192.168.1.10") != std::string::npos);
    }
}

TEST_CASE("AddressResolver honours a configured prime timeout", "[AddressResolver]") {
    auto ping = std::make_shared<FakePingService>();
    auto table = std::make_shared<FakeNeighborTable>();
    AddressResolver resolver(ping, table, std::chrono::milliseconds(50));

    resolver.resolve("10.0.0.1");
    REQUIRE(ping->calls().at(0).timeout == std::chrono::milliseconds(50));
}
