#include "infrastructure/network/LinkLayerResolver.hpp"

#include "core/types/DiscoveryError.hpp"
#include "infrastructure/concurrency/BoundedRunner.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <thread>

#ifdef __linux__
#include <arpa/inet.h>
#include <linux/if_packet.h>
#include <net/ethernet.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace netsweep::infra {

using core::DiscoveryErrc;
using core::DiscoveryError;

namespace {

[[noreturn]] void throwUnavailable(const std::string& interfaceName, const std::string& what,
                                   int err) {
    throw DiscoveryError(DiscoveryErrc::ResourceUnavailable,
                         "Cannot open link-layer socket on " + interfaceName + ": " + what + ": " +
                             std::strerror(err));
}

} // namespace

#ifdef __linux__

PacketSocket::PacketSocket(const std::string& interfaceName) {
    fd_ = socket(AF_PACKET, SOCK_RAW, htons(ETH_P_ARP));
    if (fd_ < 0) {
        throwUnavailable(interfaceName, "socket", errno);
    }

    ifindex_ = static_cast<int>(if_nametoindex(interfaceName.c_str()));
    if (ifindex_ == 0) {
        int err = errno;
        close(fd_);
        throwUnavailable(interfaceName, "no such interface", err);
    }

    struct sockaddr_ll sll {};
    sll.sll_family = AF_PACKET;
    sll.sll_protocol = htons(ETH_P_ARP);
    sll.sll_ifindex = ifindex_;
    if (::bind(fd_, reinterpret_cast<struct sockaddr*>(&sll), sizeof(sll)) == -1) {
        int err = errno;
        close(fd_);
        throwUnavailable(interfaceName, "bind", err);
    }

    struct ifreq ifr {};
    ifr.ifr_addr.sa_family = AF_INET;
    std::strncpy(ifr.ifr_name, interfaceName.c_str(), IFNAMSIZ - 1);

    if (ioctl(fd_, SIOCGIFHWADDR, &ifr) == -1) {
        int err = errno;
        close(fd_);
        throwUnavailable(interfaceName, "SIOCGIFHWADDR", err);
    }
    std::memcpy(hardwareAddress_.data(), ifr.ifr_hwaddr.sa_data, hardwareAddress_.size());

    if (ioctl(fd_, SIOCGIFADDR, &ifr) == -1) {
        int err = errno;
        close(fd_);
        throwUnavailable(interfaceName, "SIOCGIFADDR", err);
    }
    const auto* sin = reinterpret_cast<const struct sockaddr_in*>(&ifr.ifr_addr);
    address_ = asio::ip::address_v4(ntohl(sin->sin_addr.s_addr));
}

PacketSocket::~PacketSocket() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

std::optional<HardwareAddress> PacketSocket::request(const asio::ip::address_v4& target,
                                                     std::chrono::milliseconds timeout) {
    auto frame = ArpFrame::buildRequest(hardwareAddress_, address_, target);

    struct sockaddr_ll sll {};
    sll.sll_family = AF_PACKET;
    sll.sll_ifindex = ifindex_;
    sll.sll_halen = ETH_ALEN;
    std::memcpy(sll.sll_addr, ArpFrame::kBroadcast.data(), ArpFrame::kBroadcast.size());

    if (sendto(fd_, frame.data(), frame.size(), 0, reinterpret_cast<struct sockaddr*>(&sll),
               sizeof(sll)) == -1) {
        spdlog::debug("ARP request for {} not sent: {}", target.to_string(), std::strerror(errno));
        return std::nullopt;
    }

    // Other hosts' replies arrive on the same socket; skip them until ours
    // shows up or the deadline passes
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<uint8_t> buffer(1514);
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::nullopt;
        }

        struct pollfd pfd {};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0 && errno == EINTR) {
            continue;
        }
        if (ready <= 0) {
            return std::nullopt;
        }

        ssize_t received = recv(fd_, buffer.data(), buffer.size(), 0);
        if (received < 0) {
            spdlog::debug("ARP receive on ifindex {} failed: {}", ifindex_, std::strerror(errno));
            return std::nullopt;
        }

        auto sender = ArpFrame::parseReply(buffer.data(), static_cast<size_t>(received), target);
        if (sender) {
            return sender;
        }
    }
}

#else

PacketSocket::PacketSocket(const std::string& interfaceName) {
    throw DiscoveryError(DiscoveryErrc::ResourceUnavailable,
                         "Link-layer sockets are not supported on this platform (" +
                             interfaceName + ")");
}

PacketSocket::~PacketSocket() = default;

std::optional<HardwareAddress> PacketSocket::request(const asio::ip::address_v4& /*target*/,
                                                     std::chrono::milliseconds /*timeout*/) {
    return std::nullopt;
}

#endif

LinkLayerResolver::LinkLayerResolver(LinkLayerResolverOptions options,
                                     std::shared_ptr<core::IVendorLookup> vendors)
    : options_(std::move(options)), vendors_(std::move(vendors)) {
    if (options_.interfaceName.empty()) {
        throw DiscoveryError(DiscoveryErrc::InvalidConfiguration,
                             "Link-layer resolution needs an interface name");
    }
    if (!vendors_) {
        vendors_ = std::make_shared<core::NullVendorLookup>();
    }

    socket_ = std::make_unique<PacketSocket>(options_.interfaceName);
    spdlog::info("Link-layer resolver bound to {} ({}, {})", options_.interfaceName,
                 socket_->address().to_string(), ArpFrame::toString(socket_->hardwareAddress()));
}

std::optional<core::LinkLayerAnswer>
LinkLayerResolver::resolveWith(PacketSocket& socket, const asio::ip::address_v4& address) {
    for (int attempt = 0; attempt <= options_.retryCount; ++attempt) {
        auto mac = socket.request(address, options_.timeout);
        if (mac) {
            core::LinkLayerAnswer answer;
            answer.hardwareAddress = ArpFrame::toString(*mac);
            answer.vendor = vendors_->lookup(answer.hardwareAddress);
            spdlog::debug("{} is at {}", address.to_string(), answer.hardwareAddress);
            return answer;
        }
    }
    return std::nullopt;
}

std::optional<core::LinkLayerAnswer>
LinkLayerResolver::resolve(const asio::ip::address_v4& address) {
    std::lock_guard lock(socketMutex_);
    return resolveWith(*socket_, address);
}

void LinkLayerResolver::resolveMany(const std::vector<asio::ip::address_v4>& addresses,
                                    const core::FindingCallback& onFound) {
    spdlog::debug("ARP resolving {} addresses on {}", addresses.size(), options_.interfaceName);

    BoundedRunner<asio::ip::address_v4> runner(options_.workers, "arp");
    runner.run(addresses, [this, &onFound](size_t workerIndex) {
        // Each worker owns its socket for the whole session; a failure here
        // aborts the batch through the runner
        auto socket = std::make_shared<PacketSocket>(options_.interfaceName);
        spdlog::trace("ARP worker {} opened its socket", workerIndex);

        return [this, socket, &onFound](const asio::ip::address_v4& address) {
            if (options_.rateLimit.count() > 0) {
                std::this_thread::sleep_for(options_.rateLimit);
            }
            auto answer = resolveWith(*socket, address);
            if (answer && onFound) {
                onFound(core::ProbeFinding::linkLayer(address.to_string(),
                                                      answer->hardwareAddress, answer->vendor));
            }
        };
    });
}

} // namespace netsweep::infra
