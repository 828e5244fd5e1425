#pragma once

#include "core/services/IEchoProber.hpp"
#include "infrastructure/network/SocketProbe.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace netsweep::infra {

/**
 * @brief ICMP echo request/reply over a raw socket.
 *
 * Needs CAP_NET_RAW. Every echo opens its own socket, so concurrent callers
 * never share receive buffers; replies are matched on source address,
 * identifier and sequence number.
 */
class IcmpEchoTechnique : public core::IEchoTechnique {
public:
    IcmpEchoTechnique();

    std::optional<std::chrono::microseconds> echo(const asio::ip::address_v4& address,
                                                  std::chrono::milliseconds timeout) override;

    std::string name() const override { return "icmp"; }

    [[nodiscard]] uint16_t identifier() const { return identifier_; }

    /**
     * @brief Internet checksum (RFC 1071) over @p length bytes.
     */
    static uint16_t calculateChecksum(const uint8_t* data, size_t length);

    /**
     * @brief Builds a 64-byte echo request with a valid checksum.
     */
    static std::vector<uint8_t> buildEchoRequest(uint16_t identifier, uint16_t sequence);

    /**
     * @brief Checks whether a received IPv4 datagram is the reply to our request.
     * @param datagram Raw bytes as read from the socket, IP header included.
     * @param length Number of valid bytes.
     * @param identifier Expected echo identifier.
     * @param sequence Expected echo sequence number.
     */
    static bool isMatchingReply(const uint8_t* datagram, size_t length, uint16_t identifier,
                                uint16_t sequence);

    /**
     * @brief Receive timeout for the time left until the reply deadline.
     *
     * Rounded up to whole microseconds and never zero, since a zero
     * SO_RCVTIMEO makes the receive block indefinitely.
     */
    static std::chrono::microseconds receiveWait(std::chrono::steady_clock::duration remaining);

    /**
     * @brief Checks whether this process may open raw ICMP sockets.
     */
    static bool rawSocketsAvailable();

private:
    uint16_t identifier_;
    std::atomic<uint16_t> sequenceNumber_{0};
};

/**
 * @brief Unprivileged echo: timed TCP connects against a short port list.
 *
 * The first port that accepts a connection ends the probe and its connect
 * time is reported as the round-trip time.
 */
class TcpEchoTechnique : public core::IEchoTechnique {
public:
    TcpEchoTechnique(SocketProbe& probe, std::vector<uint16_t> ports = defaultPorts());

    std::optional<std::chrono::microseconds> echo(const asio::ip::address_v4& address,
                                                  std::chrono::milliseconds timeout) override;

    std::string name() const override { return "tcp"; }

    [[nodiscard]] const std::vector<uint16_t>& ports() const { return ports_; }

    static std::vector<uint16_t> defaultPorts();

private:
    SocketProbe& probe_;
    std::vector<uint16_t> ports_;
};

/**
 * @brief Picks the echo technique once, based on raw-socket privilege.
 * @param probe Socket probe used by the TCP fallback.
 * @return IcmpEchoTechnique when raw sockets are available, TcpEchoTechnique otherwise.
 */
std::shared_ptr<core::IEchoTechnique> makeEchoTechnique(SocketProbe& probe);

} // namespace netsweep::infra
