/**
 * @file PortScanResult.hpp
 * @brief Port scanning types, results, and configuration structures.
 *
 * This file defines the types used for port scanning operations including
 * port states, transports, per-port records, scan configuration, and
 * service detection.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace netsweep::core {

/**
 * @brief Possible states of a scanned port.
 */
enum class PortState : int {
    Unknown = 0,  ///< Port state could not be determined
    Open = 1,     ///< Port is accepting connections or answered a datagram
    Closed = 2,   ///< Port is reachable but not accepting connections
    Filtered = 3  ///< No response (firewall, or a silent datagram service)
};

/**
 * @brief Transport protocol a port was probed over.
 */
enum class Transport : int {
    Tcp = 0, ///< Stream transport
    Udp = 1  ///< Datagram transport
};

/**
 * @brief Result of scanning a single port.
 *
 * Created by the port scanner, attached to exactly one HostRecord and
 * never modified afterwards.
 */
struct PortRecord {
    std::string address;                  ///< Address that was scanned
    uint16_t port{0};                     ///< Port number that was scanned
    Transport transport{Transport::Tcp};  ///< Transport used for the probe
    PortState state{PortState::Unknown};  ///< Lifecycle state of the port
    std::string serviceName;              ///< Service name from the static table, or "unknown"
    std::optional<std::string> banner;    ///< Sanitised banner text, if any was captured

    /**
     * @brief Converts this record's port state to a string.
     * @return String representation of the state (e.g., "open", "closed").
     */
    [[nodiscard]] std::string stateToString() const;

    /**
     * @brief Converts this record's transport to a string.
     * @return "tcp" or "udp".
     */
    [[nodiscard]] std::string transportToString() const;

    /**
     * @brief Converts a PortState enum to a string.
     * @param state The port state to convert.
     * @return String representation of the state.
     */
    static std::string portStateToString(PortState state);

    /**
     * @brief Parses a string to get the corresponding PortState.
     * @param str The string to parse (e.g., "open", "closed", "filtered").
     * @return The corresponding PortState enum value.
     */
    static PortState stateFromString(const std::string& str);

    static std::string transportName(Transport transport);
    static Transport transportFromString(const std::string& str);

    /**
     * @brief Cleans raw bytes read from a socket into displayable banner text.
     *
     * Trailing whitespace is removed, non-printable bytes become '.', and the
     * result is truncated to kMaxBannerLength characters.
     *
     * @param raw Bytes as received.
     * @return Sanitised banner, or std::nullopt if nothing printable remains.
     */
    static std::optional<std::string> sanitizeBanner(const std::string& raw);

    static constexpr size_t kMaxBannerLength = 256;

    bool operator==(const PortRecord& other) const = default;
};

/**
 * @brief Configuration for scanning the candidate ports of one host.
 */
struct PortScanConfig {
    std::vector<uint16_t> tcpPorts;          ///< Stream ports to probe
    std::vector<uint16_t> udpPorts;          ///< Datagram ports to probe
    bool scanTcp{true};                      ///< Probe the stream ports
    bool scanUdp{true};                      ///< Probe the datagram ports
    bool captureBanners{true};               ///< Read a banner from open stream ports
    int maxConcurrency{50};                  ///< Maximum concurrent probes per host
    std::chrono::milliseconds timeout{2000}; ///< Timeout per port

    /**
     * @brief Creates a configuration using the common candidate port lists.
     */
    static PortScanConfig defaults();

    /**
     * @brief Gets the list of (port, transport) pairs to probe.
     * @return Stream ports first, then datagram ports, honouring scanTcp/scanUdp.
     */
    [[nodiscard]] std::vector<std::pair<uint16_t, Transport>> getPortsToScan() const;

    /**
     * @brief Common stream ports probed by default.
     */
    static const std::vector<uint16_t>& commonTcpPorts();

    /**
     * @brief Common datagram ports probed by default.
     */
    static const std::vector<uint16_t>& commonUdpPorts();
};

/**
 * @brief Utility class for detecting services by port number and transport.
 *
 * Provides static methods to identify common services running on standard ports.
 */
class ServiceDetector {
public:
    /**
     * @brief Detects the likely service running on a port.
     * @param port The port number to look up.
     * @param transport Transport the port was probed over.
     * @return Service name if known, "unknown" otherwise.
     */
    static std::string detectService(uint16_t port, Transport transport);

    /**
     * @brief Gets the map of known (port, transport) to service mappings.
     * @return Reference to the static service table.
     */
    static const std::map<std::pair<uint16_t, Transport>, std::string>& getKnownServices();
};

} // namespace netsweep::core
