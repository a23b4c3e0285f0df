#include "infrastructure/network/WakeOnLanService.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace hostwake::infra {

WakeOnLanService::WakeOnLanService(AsioContext& context, std::string broadcastAddress,
                                   uint16_t port)
    : context_(context), broadcastAddress_(std::move(broadcastAddress)), port_(port) {}

std::vector<uint8_t> WakeOnLanService::buildMagicPacket(const core::MacBytes& mac) {
    std::vector<uint8_t> packet;
    packet.reserve(kMagicPacketSize);

    packet.insert(packet.end(), 6, 0xFF);
    for (int i = 0; i < 16; ++i) {
        packet.insert(packet.end(), mac.begin(), mac.end());
    }
    return packet;
}

void WakeOnLanService::sendMagicPacket(const std::string& macAddress) {
    auto mac = core::parseMacAddress(macAddress);
    if (!mac) {
        throw std::invalid_argument("Malformed MAC address: " + macAddress);
    }

    auto packet = buildMagicPacket(*mac);
    asio::ip::udp::endpoint endpoint(asio::ip::make_address_v4(broadcastAddress_), port_);

    asio::ip::udp::socket socket(context_.getContext());
    socket.open(asio::ip::udp::v4());
    socket.set_option(asio::socket_base::broadcast(true));
    socket.send_to(asio::buffer(packet), endpoint);

    spdlog::debug("Sent {} byte magic packet for {} to {}:{}", packet.size(),
                  core::formatMacAddress(*mac), broadcastAddress_, port_);
}

core::WakeResult WakeOnLanService::wake(const std::string& macAddress) {
    core::WakeResult result;

    if (macAddress.empty()) {
        result.invalidAddress = true;
        result.message = "No MAC";
        return result;
    }

    if (!core::parseMacAddress(macAddress)) {
        result.invalidAddress = true;
        result.message = "Invalid MAC address: " + macAddress;
        spdlog::warn("Wake request rejected: {}", result.message);
        return result;
    }

    try {
        sendMagicPacket(macAddress);
        result.success = true;
        result.message = "Packet sent to " + macAddress;
        spdlog::info("Wake-on-LAN packet sent to {}", macAddress);
    } catch (const std::exception& e) {
        result.message = std::string("Failed to send wake packet: ") + e.what();
        spdlog::error("Wake-on-LAN to {} failed: {}", macAddress, e.what());
    }
    return result;
}

} // namespace hostwake::infra
