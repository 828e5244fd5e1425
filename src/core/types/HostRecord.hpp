/**
 * @file HostRecord.hpp
 * @brief Discovery findings and the merged per-host record.
 *
 * A ProbeFinding is one method's partial result for one address. A
 * HostRecord is the merged view of every finding for that address and is
 * what the discovery engine returns to its callers.
 */

#pragma once

#include "core/types/PortScanResult.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::core {

/**
 * @brief Probing technique that produced a finding.
 */
enum class DiscoveryMethod : int {
    LinkLayer = 0,  ///< ARP resolution on the attached segment
    Echo = 1,       ///< ICMP echo, or its TCP fallback
    Connection = 2  ///< TCP connect against common ports
};

/**
 * @brief Which probing methods apply to a target group.
 */
enum class DiscoveryStrategy : int {
    Local = 0, ///< Target shares the scanning interface's segment; link-layer enabled
    Remote = 1 ///< Routed target; echo and connection probing only
};

std::string methodToString(DiscoveryMethod method);
std::string strategyToString(DiscoveryStrategy strategy);

/**
 * @brief One partial discovery result produced by a single method.
 */
struct ProbeFinding {
    std::string address;                                ///< Dotted-quad address
    DiscoveryMethod method{DiscoveryMethod::Connection}; ///< Producing method
    std::string hardwareAddress;                        ///< Link-layer only
    std::string vendor;                                 ///< Link-layer only, may be empty
    std::optional<std::chrono::microseconds> roundTripTime; ///< Echo only

    static ProbeFinding linkLayer(std::string address, std::string hardwareAddress,
                                  std::string vendor);
    static ProbeFinding echo(std::string address, std::chrono::microseconds roundTripTime);
    static ProbeFinding connection(std::string address);

    bool operator==(const ProbeFinding& other) const = default;
};

/**
 * @brief Sink receiving findings as a probing method produces them.
 *
 * May be invoked concurrently from several worker threads.
 */
using FindingCallback = std::function<void(const ProbeFinding&)>;

/**
 * @brief Merged discovery result for one address.
 *
 * Created on the first finding for an address and updated in place by
 * later findings. Merging is monotonic: method flags are only ever set, and
 * an optional field is written only while it is still empty and the
 * incoming value is non-empty, so the first non-empty value wins.
 */
struct HostRecord {
    std::string address;                     ///< Key; unique in a result set
    bool foundByLinkLayer{false};            ///< Answered ARP
    bool foundByEcho{false};                 ///< Answered echo (or its fallback)
    bool foundByConnection{false};           ///< Accepted a TCP connection
    std::optional<std::string> hardwareAddress; ///< MAC address, "aa:bb:cc:dd:ee:ff"
    std::optional<std::string> vendor;       ///< Vendor derived from the MAC prefix
    std::optional<std::string> hostname;     ///< Reverse-resolved name
    std::optional<std::chrono::microseconds> roundTripTime; ///< Echo latency
    DiscoveryStrategy strategy{DiscoveryStrategy::Remote}; ///< Strategy of the discovering group
    std::string networkSegment;              ///< Target the host was discovered through
    std::vector<PortRecord> openPorts;       ///< Ordered by transport, then port

    /**
     * @brief Creates a record holding only the address and the finding's data.
     */
    static HostRecord fromFinding(const ProbeFinding& finding);

    /**
     * @brief Applies a finding for the same address.
     *
     * Findings for a different address are ignored. Applying the same
     * finding twice leaves the record unchanged.
     *
     * @param finding Finding to merge.
     */
    void merge(const ProbeFinding& finding);

    /**
     * @brief Adds port records, skipping (port, transport) pairs already present.
     * @param ports Records to add.
     */
    void mergePorts(const std::vector<PortRecord>& ports);

    /**
     * @brief Checks whether any discovery method found the host.
     */
    [[nodiscard]] bool isLive() const {
        return foundByLinkLayer || foundByEcho || foundByConnection;
    }

    /**
     * @brief Methods that found the host, in LinkLayer, Echo, Connection order.
     */
    [[nodiscard]] std::vector<DiscoveryMethod> methods() const;

    /**
     * @brief Comma separated method names, e.g. "arp, icmp".
     */
    [[nodiscard]] std::string methodsToString() const;

    /**
     * @brief Round-trip time in milliseconds, or 0 when unknown.
     */
    [[nodiscard]] double roundTripMs() const {
        return roundTripTime ? static_cast<double>(roundTripTime->count()) / 1000.0 : 0.0;
    }

    bool operator==(const HostRecord& other) const = default;
};

} // namespace netsweep::core
