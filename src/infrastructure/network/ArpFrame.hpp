#pragma once

#include <asio.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::infra {

using HardwareAddress = std::array<uint8_t, 6>;

/**
 * @brief Ethernet II framed ARP (RFC 826) request builder and reply parser.
 *
 * Frames are encoded byte by byte in network order, so the helpers do not
 * depend on platform headers and can be exercised without a packet socket.
 */
class ArpFrame {
public:
    static constexpr size_t kEthernetHeaderSize = 14;
    static constexpr size_t kArpPayloadSize = 28;
    static constexpr size_t kFrameSize = kEthernetHeaderSize + kArpPayloadSize;

    static constexpr uint16_t kEtherTypeArp = 0x0806;
    static constexpr uint16_t kEtherTypeIpv4 = 0x0800;
    static constexpr uint16_t kHardwareEthernet = 1;
    static constexpr uint16_t kOpRequest = 1;
    static constexpr uint16_t kOpReply = 2;

    static constexpr HardwareAddress kBroadcast{0xff, 0xff, 0xff, 0xff, 0xff, 0xff};

    /**
     * @brief Builds a broadcast who-has request.
     * @param senderMac Hardware address of the scanning interface.
     * @param senderIp IPv4 address of the scanning interface.
     * @param targetIp Address being resolved.
     */
    static std::vector<uint8_t> buildRequest(const HardwareAddress& senderMac,
                                             const asio::ip::address_v4& senderIp,
                                             const asio::ip::address_v4& targetIp);

    /**
     * @brief Extracts the responder's hardware address from a reply frame.
     *
     * Accepts only Ethernet/IPv4 ARP replies (opcode 2) whose sender protocol
     * address equals @p targetIp.
     *
     * @return Sender hardware address, or std::nullopt if the frame does not match.
     */
    static std::optional<HardwareAddress> parseReply(const uint8_t* frame, size_t length,
                                                     const asio::ip::address_v4& targetIp);

    /**
     * @brief Formats as lowercase colon-separated hex, e.g. "00:1a:2b:3c:4d:5e".
     */
    static std::string toString(const HardwareAddress& address);
};

} // namespace netsweep::infra
