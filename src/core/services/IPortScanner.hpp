/**
 * @file IPortScanner.hpp
 * @brief Interface for the port and service scanning service.
 *
 * This file defines the abstract interface for scanning the candidate
 * ports of a confirmed-live host.
 */

#pragma once

#include "core/types/PortScanResult.hpp"

#include <string>
#include <vector>

namespace netsweep::core {

/**
 * @brief Interface for port scanning service.
 *
 * Classifies each candidate port as open, closed or filtered and captures
 * service banners where available.
 */
class IPortScanner {
public:
    virtual ~IPortScanner() = default;

    /**
     * @brief Scans every candidate port of one host.
     *
     * Per-port failures never abort the scan; they only shape the state of
     * that port's record.
     *
     * @param address Dotted-quad address of the host.
     * @return One record per candidate port, in candidate order.
     * @throws DiscoveryError with InvalidTarget if the address cannot be parsed.
     */
    virtual std::vector<PortRecord> scanHost(const std::string& address) = 0;
};

} // namespace netsweep::core
