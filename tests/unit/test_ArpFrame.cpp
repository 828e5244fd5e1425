#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/ArpFrame.hpp"

using namespace netsweep::infra;

namespace {

const HardwareAddress kScanner{0x02, 0x00, 0x5e, 0x10, 0x20, 0x30};
const HardwareAddress kTarget{0xa4, 0x83, 0xe7, 0x01, 0x02, 0x03};

std::vector<uint8_t> makeReply(const HardwareAddress& senderMac, const std::string& senderIp,
                               const std::string& targetIp, uint16_t opcode = ArpFrame::kOpReply) {
    // A reply is a request with the roles swapped and the opcode changed
    auto frame = ArpFrame::buildRequest(senderMac, asio::ip::make_address_v4(senderIp),
                                        asio::ip::make_address_v4(targetIp));
    frame[ArpFrame::kEthernetHeaderSize + 6] = static_cast<uint8_t>(opcode >> 8);
    frame[ArpFrame::kEthernetHeaderSize + 7] = static_cast<uint8_t>(opcode & 0xFF);
    return frame;
}

} // namespace

TEST_CASE("ArpFrame request layout", "[ArpFrame]") {
    auto frame = ArpFrame::buildRequest(kScanner, asio::ip::make_address_v4("192.168.1.10"),
                                        asio::ip::make_address_v4("192.168.1.77"));

    REQUIRE(frame.size() == ArpFrame::kFrameSize);

    SECTION("Ethernet header") {
        for (size_t i = 0; i < 6; ++i) {
            REQUIRE(frame[i] == 0xff);
            REQUIRE(frame[6 + i] == kScanner[i]);
        }
        REQUIRE(frame[12] == 0x08);
        REQUIRE(frame[13] == 0x06);
    }

    SECTION("ARP payload") {
        const uint8_t* arp = frame.data() + ArpFrame::kEthernetHeaderSize;
        REQUIRE(arp[0] == 0x00);
        REQUIRE(arp[1] == 0x01); // Ethernet
        REQUIRE(arp[2] == 0x08);
        REQUIRE(arp[3] == 0x00); // IPv4
        REQUIRE(arp[4] == 6);
        REQUIRE(arp[5] == 4);
        REQUIRE(arp[6] == 0x00);
        REQUIRE(arp[7] == 0x01); // request

        for (size_t i = 0; i < 6; ++i) {
            REQUIRE(arp[8 + i] == kScanner[i]);
            REQUIRE(arp[18 + i] == 0);
        }
        REQUIRE(arp[14] == 192);
        REQUIRE(arp[17] == 10);
        REQUIRE(arp[24] == 192);
        REQUIRE(arp[27] == 77);
    }
}

TEST_CASE("ArpFrame reply parsing", "[ArpFrame]") {
    auto target = asio::ip::make_address_v4("192.168.1.77");

    SECTION("Reply from the requested address") {
        auto frame = makeReply(kTarget, "192.168.1.77", "192.168.1.10");
        auto mac = ArpFrame::parseReply(frame.data(), frame.size(), target);

        REQUIRE(mac.has_value());
        REQUIRE(*mac == kTarget);
    }

    SECTION("Ethernet padding is accepted") {
        auto frame = makeReply(kTarget, "192.168.1.77", "192.168.1.10");
        frame.resize(60, 0);
        REQUIRE(ArpFrame::parseReply(frame.data(), frame.size(), target).has_value());
    }

    SECTION("Reply from another address") {
        auto frame = makeReply(kTarget, "192.168.1.78", "192.168.1.10");
        REQUIRE_FALSE(ArpFrame::parseReply(frame.data(), frame.size(), target).has_value());
    }

    SECTION("Requests are not replies") {
        auto frame = makeReply(kTarget, "192.168.1.77", "192.168.1.10", ArpFrame::kOpRequest);
        REQUIRE_FALSE(ArpFrame::parseReply(frame.data(), frame.size(), target).has_value());
    }

    SECTION("Other ethertypes") {
        auto frame = makeReply(kTarget, "192.168.1.77", "192.168.1.10");
        frame[12] = 0x08;
        frame[13] = 0x00;
        REQUIRE_FALSE(ArpFrame::parseReply(frame.data(), frame.size(), target).has_value());
    }

    SECTION("Short frames") {
        auto frame = makeReply(kTarget, "192.168.1.77", "192.168.1.10");
        REQUIRE_FALSE(
            ArpFrame::parseReply(frame.data(), ArpFrame::kFrameSize - 1, target).has_value());
        REQUIRE_FALSE(ArpFrame::parseReply(nullptr, 0, target).has_value());
    }
}

TEST_CASE("ArpFrame hardware address formatting", "[ArpFrame]") {
    REQUIRE(ArpFrame::toString(kTarget) == "a4:83:e7:01:02:03");
    REQUIRE(ArpFrame::toString(ArpFrame::kBroadcast) == "ff:ff:ff:ff:ff:ff");
    REQUIRE(ArpFrame::toString(HardwareAddress{}) == "00:00:00:00:00:00");
}
