/**
 * @file ILinkLayerResolver.hpp
 * @brief Interface for hardware-address resolution on the attached segment.
 *
 * Link-layer resolution only makes sense for targets sharing the scanning
 * interface's broadcast domain. Deciding whether a target qualifies is the
 * orchestrator's job, not the resolver's.
 */

#pragma once

#include "core/types/HostRecord.hpp"

#include <asio.hpp>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::core {

/**
 * @brief Answer to a successful address-resolution request.
 */
struct LinkLayerAnswer {
    std::string hardwareAddress; ///< MAC address of the responder
    std::string vendor;          ///< Vendor of the MAC prefix, empty if unknown

    bool operator==(const LinkLayerAnswer& other) const = default;
};

/**
 * @brief Interface for ARP-style resolution of IPv4 addresses.
 */
class ILinkLayerResolver {
public:
    virtual ~ILinkLayerResolver() = default;

    /**
     * @brief Resolves one address, applying the configured retry count.
     * @param address Target on the attached segment.
     * @return The answer, or std::nullopt if the address never replied.
     */
    virtual std::optional<LinkLayerAnswer> resolve(const asio::ip::address_v4& address) = 0;

    /**
     * @brief Resolves a batch of addresses with the resolver's worker pool.
     *
     * Answers are reported through @p onFound as LinkLayer findings while the
     * batch runs. Addresses that never reply are dropped silently.
     *
     * @param addresses Targets on the attached segment.
     * @param onFound Sink for findings; may be called from several threads.
     * @throws DiscoveryError with ResourceUnavailable if a worker cannot open
     *         its socket. The first such error aborts the batch.
     */
    virtual void resolveMany(const std::vector<asio::ip::address_v4>& addresses,
                             const FindingCallback& onFound) = 0;

    /**
     * @brief Name of the interface the resolver is bound to.
     */
    virtual std::string interfaceName() const = 0;
};

} // namespace netsweep::core
