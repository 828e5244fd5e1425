/**
 * @file NetworkInterface.hpp
 * @brief Network interface types and enumeration utilities.
 *
 * This file defines structures for representing the scanning host's network
 * interfaces, along with a utility class for enumerating them and picking
 * the interface discovery should bind to.
 */

#pragma once

#include <asio.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::core {

/**
 * @brief Statistics for a network interface.
 *
 * Contains packet counters used to pick the busiest interface.
 */
struct NetworkInterfaceStats {
    uint64_t bytesReceived{0};   ///< Total bytes received on the interface
    uint64_t bytesSent{0};       ///< Total bytes sent on the interface
    uint64_t packetsReceived{0}; ///< Total packets received
    uint64_t packetsSent{0};     ///< Total packets sent

    [[nodiscard]] uint64_t totalPackets() const { return packetsReceived + packetsSent; }

    bool operator==(const NetworkInterfaceStats& other) const = default;
};

/**
 * @brief Represents an IPv4-configured network interface of the scanning host.
 */
struct NetworkInterface {
    std::string name;            ///< System name of the interface (e.g., "eth0")
    std::string ipAddress;       ///< IPv4 address assigned to the interface
    std::string netmask;         ///< IPv4 netmask, e.g. "255.255.255.0"
    std::string macAddress;      ///< MAC address of the interface, empty if unknown
    bool isUp{false};            ///< Whether the interface is currently up
    bool isLoopback{false};      ///< Whether this is a loopback interface
    NetworkInterfaceStats stats; ///< Current interface statistics

    /**
     * @brief The directly attached IPv4 network of this interface.
     * @return Network prefix, or std::nullopt if the address or mask is invalid.
     */
    [[nodiscard]] std::optional<asio::ip::network_v4> network() const;

    /**
     * @brief The attached network in canonical CIDR form, e.g. "192.168.1.0/24".
     * @return CIDR string, or empty if network() has no value.
     */
    [[nodiscard]] std::string cidr() const;

    bool operator==(const NetworkInterface& other) const = default;
};

/**
 * @brief Utility class for enumerating network interfaces.
 *
 * Provides static methods to discover and query network interfaces
 * on the local system.
 */
class NetworkInterfaceEnumerator {
public:
    /**
     * @brief Enumerates all IPv4 network interfaces on the system.
     * @return Vector of NetworkInterface objects.
     */
    static std::vector<NetworkInterface> enumerate();

    /**
     * @brief Finds an interface by its system name.
     * @param name Interface name, e.g. "eth0".
     * @return The interface, or std::nullopt if it has no IPv4 address.
     */
    static std::optional<NetworkInterface> findByName(const std::string& name);

    /**
     * @brief Picks the busiest up, non-loopback, non-virtual interface.
     * @return The interface with the highest packet count, if any.
     */
    static std::optional<NetworkInterface> detectPrimary();

    /**
     * @brief Selects the primary interface from an already enumerated list.
     */
    static std::optional<NetworkInterface> selectPrimary(const std::vector<NetworkInterface>& interfaces);

    /**
     * @brief Checks whether an interface name is a candidate for scanning.
     *
     * Loopback and virtual interfaces (docker, veth, br-, virbr, tun, tap)
     * are rejected.
     */
    static bool isCandidateName(const std::string& name);

    /**
     * @brief Gets current statistics for a specific interface.
     * @param interfaceName The system name of the interface (e.g., "eth0").
     * @return Current statistics for the interface.
     */
    static NetworkInterfaceStats getStats(const std::string& interfaceName);
};

} // namespace netsweep::core
