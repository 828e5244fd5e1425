/**
 * @file IConnectionProber.hpp
 * @brief Interface for TCP-connect liveness probing.
 */

#pragma once

#include "core/types/HostRecord.hpp"

#include <asio.hpp>
#include <vector>

namespace netsweep::core {

/**
 * @brief Tests liveness by connecting to commonly open TCP ports.
 */
class IConnectionProber {
public:
    virtual ~IConnectionProber() = default;

    /**
     * @brief Tries the port list in order and stops at the first connection.
     * @param address Target address.
     * @return True if any port accepted a connection.
     */
    virtual bool probe(const asio::ip::address_v4& address) = 0;

    /**
     * @brief Probes every address with the prober's worker pool.
     * @param addresses Target addresses.
     * @param onFound Sink for Connection findings; may be called from several threads.
     */
    virtual void probeMany(const std::vector<asio::ip::address_v4>& addresses,
                           const FindingCallback& onFound) = 0;
};

} // namespace netsweep::core
