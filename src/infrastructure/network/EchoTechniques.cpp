#include "infrastructure/network/EchoTechniques.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <random>

#ifdef __linux__
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#endif

namespace netsweep::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr size_t ICMP_PACKET_SIZE = 64;

} // namespace

IcmpEchoTechnique::IcmpEchoTechnique() {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
    spdlog::debug("ICMP echo initialized with identifier: {}", identifier_);
}

uint16_t IcmpEchoTechnique::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> IcmpEchoTechnique::buildEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(ICMP_PACKET_SIZE, 0);

    packet[0] = ICMP_ECHO_REQUEST;
    packet[1] = 0;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    static constexpr char tag[] = "netsweep";
    std::memcpy(&packet[8], tag, sizeof(tag) - 1);

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

bool IcmpEchoTechnique::isMatchingReply(const uint8_t* datagram, size_t length,
                                        uint16_t identifier, uint16_t sequence) {
    if (length < 28) { // Minimum IP header (20) + ICMP header (8)
        return false;
    }

    size_t ipHeaderLen = static_cast<size_t>((datagram[0] & 0x0F) * 4);
    if (ipHeaderLen < 20 || length < ipHeaderLen + 8) {
        return false;
    }

    const uint8_t* icmpHeader = datagram + ipHeaderLen;
    if (icmpHeader[0] != ICMP_ECHO_REPLY) {
        return false;
    }

    uint16_t recvId = static_cast<uint16_t>((icmpHeader[4] << 8) | icmpHeader[5]);
    uint16_t recvSeq = static_cast<uint16_t>((icmpHeader[6] << 8) | icmpHeader[7]);
    return recvId == identifier && recvSeq == sequence;
}

std::chrono::microseconds
IcmpEchoTechnique::receiveWait(std::chrono::steady_clock::duration remaining) {
    auto wait = std::chrono::ceil<std::chrono::microseconds>(remaining);
    return std::max(wait, std::chrono::microseconds{1});
}

bool IcmpEchoTechnique::rawSocketsAvailable() {
#ifdef __linux__
    int sock = socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
    if (sock < 0) {
        return false;
    }
    close(sock);
    return true;
#else
    return false;
#endif
}

std::optional<std::chrono::microseconds>
IcmpEchoTechnique::echo(const asio::ip::address_v4& address, std::chrono::milliseconds timeout) {
#ifdef __linux__
    int sock = socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
    if (sock < 0) {
        spdlog::debug("Echo to {} failed: cannot create raw socket", address.to_string());
        return std::nullopt;
    }

    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    dest.sin_addr.s_addr = htonl(address.to_uint());

    uint16_t seq = sequenceNumber_++;
    auto packet = buildEchoRequest(identifier_, seq);

    auto sendTime = std::chrono::steady_clock::now();
    auto deadline = sendTime + timeout;

    ssize_t sent = sendto(sock, packet.data(), packet.size(), 0,
                          reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        spdlog::debug("Echo to {} failed: send error", address.to_string());
        close(sock);
        return std::nullopt;
    }

    // A raw socket sees every ICMP datagram the host receives, so keep
    // reading until our reply shows up or the deadline passes
    std::array<uint8_t, 1500> recvBuffer{};
    std::optional<std::chrono::microseconds> rtt;
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }

        auto wait = receiveWait(deadline - now);
        struct timeval tv {};
        tv.tv_sec = static_cast<time_t>(wait.count() / 1000000);
        tv.tv_usec = static_cast<suseconds_t>(wait.count() % 1000000);
        setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        struct sockaddr_in from {};
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(sock, recvBuffer.data(), recvBuffer.size(), 0,
                                    reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        if (received < 0) {
            break;
        }

        if (from.sin_addr.s_addr != dest.sin_addr.s_addr) {
            continue;
        }
        if (isMatchingReply(recvBuffer.data(), static_cast<size_t>(received), identifier_, seq)) {
            rtt = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - sendTime);
            break;
        }
    }

    close(sock);

    if (rtt) {
        spdlog::debug("Echo reply from {}: {:.2f}ms", address.to_string(),
                      static_cast<double>(rtt->count()) / 1000.0);
    }
    return rtt;
#else
    (void)address;
    (void)timeout;
    return std::nullopt;
#endif
}

TcpEchoTechnique::TcpEchoTechnique(SocketProbe& probe, std::vector<uint16_t> ports)
    : probe_(probe), ports_(std::move(ports)) {}

std::vector<uint16_t> TcpEchoTechnique::defaultPorts() {
    return {22, 80, 443, 445, 3389};
}

std::optional<std::chrono::microseconds>
TcpEchoTechnique::echo(const asio::ip::address_v4& address, std::chrono::milliseconds timeout) {
    for (uint16_t port : ports_) {
        auto result = probe_.connect(address, port, timeout);
        if (result.outcome == ConnectOutcome::Connected) {
            spdlog::debug("TCP echo to {} answered on port {}", address.to_string(), port);
            return result.elapsed;
        }
    }
    return std::nullopt;
}

std::shared_ptr<core::IEchoTechnique> makeEchoTechnique(SocketProbe& probe) {
    if (IcmpEchoTechnique::rawSocketsAvailable()) {
        spdlog::info("Echo probing uses ICMP");
        return std::make_shared<IcmpEchoTechnique>();
    }
    spdlog::info("Raw sockets unavailable (need CAP_NET_RAW), echo probing falls back to TCP");
    return std::make_shared<TcpEchoTechnique>(probe);
}

} // namespace netsweep::infra
