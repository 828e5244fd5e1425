#pragma once

#include "core/services/IPortScanner.hpp"
#include "infrastructure/network/SocketProbe.hpp"

#include <cstdint>
#include <vector>

namespace netsweep::infra {

/**
 * @brief TCP connect and UDP request/response scanner for one host at a time.
 *
 * Ports of a host are probed concurrently, bounded by
 * PortScanConfig::maxConcurrency. TCP ports are classified by the connect
 * outcome; UDP ports are open when any reply arrives and filtered otherwise,
 * since silence cannot tell a closed port from a dropped datagram.
 * Implements the core::IPortScanner interface.
 */
class PortScanner : public core::IPortScanner {
public:
    /**
     * @brief Constructs a PortScanner.
     * @param probe Socket probe used for every port.
     * @param config Candidate ports, timeout and concurrency.
     */
    explicit PortScanner(SocketProbe& probe,
                         core::PortScanConfig config = core::PortScanConfig::defaults());

    std::vector<core::PortRecord> scanHost(const std::string& address) override;

    /**
     * @brief Probes a single TCP port.
     */
    core::PortRecord scanTcpPort(const asio::ip::address_v4& address, uint16_t port);

    /**
     * @brief Probes a single UDP port with its protocol payload.
     */
    core::PortRecord scanUdpPort(const asio::ip::address_v4& address, uint16_t port);

    /**
     * @brief Maps a connect outcome to a port state.
     */
    static core::PortState classifyConnect(ConnectOutcome outcome);

    /**
     * @brief Maps a datagram exchange to a port state: any reply is Open, silence is Filtered.
     */
    static core::PortState classifyDatagram(const UdpProbeResult& result);

    /**
     * @brief Request payload that makes the service on @p port answer.
     *
     * DNS (53) gets a root NS query, NTP (123) a client request and SNMP (161)
     * a GetRequest for sysDescr.0 with community "public". Other ports get an
     * empty datagram.
     */
    static std::vector<uint8_t> probePayloadFor(uint16_t port);

    [[nodiscard]] const core::PortScanConfig& config() const { return config_; }

private:
    SocketProbe& probe_;
    core::PortScanConfig config_;
};

} // namespace netsweep::infra
