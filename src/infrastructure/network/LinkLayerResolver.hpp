#pragma once

#include "core/services/ILinkLayerResolver.hpp"
#include "core/services/IVendorLookup.hpp"
#include "infrastructure/network/ArpFrame.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace netsweep::infra {

struct LinkLayerResolverOptions {
    std::string interfaceName;
    std::chrono::milliseconds timeout{2000};
    size_t workers{10};
    std::chrono::milliseconds rateLimit{0}; ///< Delay before each request, per worker
    int retryCount{2};                      ///< Extra attempts after the first
};

/**
 * @brief AF_PACKET socket bound to one interface, speaking ARP only.
 *
 * Opens and binds in the constructor and closes in the destructor. Reads the
 * interface's hardware and IPv4 address so requests carry a valid sender.
 */
class PacketSocket {
public:
    /**
     * @throws core::DiscoveryError with ResourceUnavailable if the interface
     *         does not exist, has no IPv4 address, or the process lacks
     *         CAP_NET_RAW.
     */
    explicit PacketSocket(const std::string& interfaceName);
    ~PacketSocket();

    PacketSocket(const PacketSocket&) = delete;
    PacketSocket& operator=(const PacketSocket&) = delete;

    /**
     * @brief Sends one who-has request and waits for the matching reply.
     * @return Responder's hardware address, or std::nullopt on timeout.
     */
    std::optional<HardwareAddress> request(const asio::ip::address_v4& target,
                                           std::chrono::milliseconds timeout);

    [[nodiscard]] const HardwareAddress& hardwareAddress() const { return hardwareAddress_; }
    [[nodiscard]] const asio::ip::address_v4& address() const { return address_; }

private:
    int fd_{-1};
    int ifindex_{0};
    HardwareAddress hardwareAddress_{};
    asio::ip::address_v4 address_;
};

/**
 * @brief ARP resolver for targets on the scanning interface's segment.
 */
class LinkLayerResolver : public core::ILinkLayerResolver {
public:
    /**
     * @brief Opens the resolver's socket on the configured interface.
     * @throws core::DiscoveryError InvalidConfiguration for an empty interface
     *         name, ResourceUnavailable if the socket cannot be opened.
     */
    explicit LinkLayerResolver(LinkLayerResolverOptions options,
                               std::shared_ptr<core::IVendorLookup> vendors = nullptr);

    std::optional<core::LinkLayerAnswer> resolve(const asio::ip::address_v4& address) override;

    void resolveMany(const std::vector<asio::ip::address_v4>& addresses,
                     const core::FindingCallback& onFound) override;

    std::string interfaceName() const override { return options_.interfaceName; }

    [[nodiscard]] const LinkLayerResolverOptions& options() const { return options_; }

private:
    std::optional<core::LinkLayerAnswer> resolveWith(PacketSocket& socket,
                                                     const asio::ip::address_v4& address);

    LinkLayerResolverOptions options_;
    std::shared_ptr<core::IVendorLookup> vendors_;
    std::unique_ptr<PacketSocket> socket_;
    std::mutex socketMutex_;
};

} // namespace netsweep::infra
