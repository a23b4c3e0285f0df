#include <catch2/catch_test_macros.hpp>

#include "core/types/PingResult.hpp"
#include "infrastructure/network/PingService.hpp"

#include <chrono>

using namespace hostwake::core;
using namespace hostwake::infra;

TEST_CASE("PingResult structure", "[PingService]") {
    SECTION("Default values") {
        PingResult result;
        REQUIRE_FALSE(result.success);
        REQUIRE_FALSE(result.probeError);
        REQUIRE(result.latency.count() == 0);
        REQUIRE_FALSE(result.ttl.has_value());
        REQUIRE(result.errorMessage.empty());
    }

    SECTION("Latency conversion") {
        PingResult result;
        result.latency = std::chrono::microseconds(1500);
        REQUIRE(result.latencyMs() == 1.5);

        result.latency = std::chrono::microseconds(10000);
        REQUIRE(result.latencyMs() == 10.0);
    }
}

TEST_CASE("ICMP checksum", "[PingService]") {
    SECTION("Known vector") {
        // Echo request header with id 0x0001, seq 0x0001 and zero checksum field.
        const uint8_t header[] = {0x08, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x01};
        REQUIRE(PingService::calculateChecksum(header, sizeof(header)) == 0xF7FD);
    }

    SECTION("Odd length pads the last byte") {
        const uint8_t data[] = {0x01};
        REQUIRE(PingService::calculateChecksum(data, sizeof(data)) == 0xFEFF);
    }
}

TEST_CASE("ICMP echo request layout", "[PingService]") {
    auto packet = PingService::buildIcmpEchoRequest(0x1234, 0x0102);

    REQUIRE(packet.size() == 64);
    REQUIRE(packet[0] == 8);
    REQUIRE(packet[1] == 0);
    REQUIRE(packet[4] == 0x12);
    REQUIRE(packet[5] == 0x34);
    REQUIRE(packet[6] == 0x01);
    REQUIRE(packet[7] == 0x02);

    // A packet carrying its own checksum sums to zero.
    REQUIRE(PingService::calculateChecksum(packet.data(), packet.size()) == 0);
}

TEST_CASE("PingService rejects unusable addresses", "[PingService]") {
    PingService service;

    SECTION("Empty address") {
        auto result = service.ping("", std::chrono::milliseconds(100));
        REQUIRE_FALSE(result.success);
        REQUIRE(result.probeError);
        REQUIRE_FALSE(result.errorMessage.empty());
    }

    SECTION("Malformed IPv4 address") {
        auto result = service.ping("999.999.999.999", std::chrono::milliseconds(100));
        REQUIRE_FALSE(result.success);
        REQUIRE(result.probeError);
    }
}

TEST_CASE("PingService probe completes within its timeout", "[PingService][Network]") {
    PingService service;

    auto start = std::chrono::steady_clock::now();
    auto result = service.ping("127.0.0.1", std::chrono::milliseconds(500));
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Without ICMP permissions the probe reports an error instead of a reply.
    REQUIRE((result.success || result.probeError || !result.errorMessage.empty()));
    REQUIRE(elapsed < std::chrono::seconds(2));
    if (result.success) {
        REQUIRE_FALSE(result.probeError);
        REQUIRE(result.latency.count() >= 0);
    }
}
