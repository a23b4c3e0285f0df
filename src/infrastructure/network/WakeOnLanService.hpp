#pragma once

#include "core/types/MacAddress.hpp"
#include "core/types/OperationResult.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace hostwake::infra {

/**
 * @brief Sends Wake-on-LAN magic packets.
 *
 * A magic packet is six 0xFF bytes followed by the target MAC repeated
 * sixteen times, sent as a single UDP broadcast datagram.
 */
class WakeOnLanService {
public:
    static constexpr const char* kDefaultBroadcastAddress = "255.255.255.255";
    static constexpr uint16_t kDefaultPort = 9;
    static constexpr size_t kMagicPacketSize = 102;

    /**
     * @brief Constructs the service.
     * @param context AsioContext providing the io_context for the UDP socket.
     * @param broadcastAddress IPv4 destination of the datagram.
     * @param port UDP destination port.
     */
    WakeOnLanService(AsioContext& context,
                     std::string broadcastAddress = kDefaultBroadcastAddress,
                     uint16_t port = kDefaultPort);

    /**
     * @brief Sends one magic packet to @p macAddress.
     *
     * Never throws; a missing or malformed address and send errors are
     * reported in the result.
     */
    core::WakeResult wake(const std::string& macAddress);

    /**
     * @brief Builds and transmits the magic packet.
     * @throws std::invalid_argument if the MAC address is malformed.
     * @throws asio::system_error if the datagram cannot be sent.
     */
    void sendMagicPacket(const std::string& macAddress);

    static std::vector<uint8_t> buildMagicPacket(const core::MacBytes& mac);

private:
    AsioContext& context_;
    std::string broadcastAddress_;
    uint16_t port_;
};

} // namespace hostwake::infra
