/**
 * @file IEchoProber.hpp
 * @brief Interfaces for echo-based reachability probing.
 *
 * The echo prober hides which technique answered: the caller only sees
 * success and latency. Techniques are strategies chosen once, when the
 * prober is built.
 */

#pragma once

#include "core/types/HostRecord.hpp"

#include <asio.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::core {

/**
 * @brief One way of sending an echo to a host and timing the answer.
 */
class IEchoTechnique {
public:
    virtual ~IEchoTechnique() = default;

    /**
     * @brief Sends one echo and waits for the answer.
     * @param address Target address.
     * @param timeout Maximum time to wait.
     * @return Round-trip time, or std::nullopt if the host did not answer.
     */
    virtual std::optional<std::chrono::microseconds> echo(const asio::ip::address_v4& address,
                                                          std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Short technique name for logging, e.g. "icmp".
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Interface for the echo prober.
 */
class IEchoProber {
public:
    virtual ~IEchoProber() = default;

    /**
     * @brief Probes one address.
     * @param address Target address.
     * @return Round-trip time on success, std::nullopt otherwise.
     */
    virtual std::optional<std::chrono::microseconds> probe(const asio::ip::address_v4& address) = 0;

    /**
     * @brief Probes every address with the prober's worker pool.
     *
     * Returns once all addresses have been probed. Findings arrive in no
     * particular order.
     *
     * @param addresses Target addresses.
     * @param onFound Sink for Echo findings; may be called from several threads.
     */
    virtual void probeMany(const std::vector<asio::ip::address_v4>& addresses,
                           const FindingCallback& onFound) = 0;
};

} // namespace netsweep::core
