#include "infrastructure/network/ArpFrame.hpp"

#include <cstdio>

namespace netsweep::infra {

namespace {

void putUint16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void putBytes(std::vector<uint8_t>& out, const uint8_t* data, size_t size) {
    out.insert(out.end(), data, data + size);
}

uint16_t readUint16(const uint8_t* data) {
    return static_cast<uint16_t>((data[0] << 8) | data[1]);
}

} // namespace

std::vector<uint8_t> ArpFrame::buildRequest(const HardwareAddress& senderMac,
                                            const asio::ip::address_v4& senderIp,
                                            const asio::ip::address_v4& targetIp) {
    std::vector<uint8_t> frame;
    frame.reserve(kFrameSize);

    // Ethernet II header
    putBytes(frame, kBroadcast.data(), kBroadcast.size());
    putBytes(frame, senderMac.data(), senderMac.size());
    putUint16(frame, kEtherTypeArp);

    // ARP payload
    putUint16(frame, kHardwareEthernet);
    putUint16(frame, kEtherTypeIpv4);
    frame.push_back(6); // hardware address length
    frame.push_back(4); // protocol address length
    putUint16(frame, kOpRequest);

    auto senderBytes = senderIp.to_bytes();
    auto targetBytes = targetIp.to_bytes();
    putBytes(frame, senderMac.data(), senderMac.size());
    putBytes(frame, senderBytes.data(), senderBytes.size());
    // Target hardware address is unknown and left zeroed
    frame.insert(frame.end(), 6, 0);
    putBytes(frame, targetBytes.data(), targetBytes.size());

    return frame;
}

std::optional<HardwareAddress> ArpFrame::parseReply(const uint8_t* frame, size_t length,
                                                    const asio::ip::address_v4& targetIp) {
    if (frame == nullptr || length < kFrameSize) {
        return std::nullopt;
    }
    if (readUint16(frame + 12) != kEtherTypeArp) {
        return std::nullopt;
    }

    const uint8_t* arp = frame + kEthernetHeaderSize;
    if (readUint16(arp) != kHardwareEthernet || readUint16(arp + 2) != kEtherTypeIpv4 ||
        arp[4] != 6 || arp[5] != 4 || readUint16(arp + 6) != kOpReply) {
        return std::nullopt;
    }

    auto expected = targetIp.to_bytes();
    const uint8_t* senderIp = arp + 14;
    for (size_t i = 0; i < expected.size(); ++i) {
        if (senderIp[i] != expected[i]) {
            return std::nullopt;
        }
    }

    HardwareAddress sender{};
    for (size_t i = 0; i < sender.size(); ++i) {
        sender[i] = arp[8 + i];
    }
    return sender;
}

std::string ArpFrame::toString(const HardwareAddress& address) {
    std::array<char, 18> buffer{};
    std::snprintf(buffer.data(), buffer.size(), "%02x:%02x:%02x:%02x:%02x:%02x", address[0],
                  address[1], address[2], address[3], address[4], address[5]);
    return buffer.data();
}

} // namespace netsweep::infra
