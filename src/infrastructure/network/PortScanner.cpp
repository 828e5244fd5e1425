#include "infrastructure/network/PortScanner.hpp"

#include "core/types/AddressRange.hpp"
#include "infrastructure/concurrency/BoundedRunner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>

namespace netsweep::infra {

namespace {

constexpr uint16_t DNS_PORT = 53;
constexpr uint16_t NTP_PORT = 123;
constexpr uint16_t SNMP_PORT = 161;

const std::vector<uint8_t>& dnsRootNsQuery() {
    static const std::vector<uint8_t> query = {
        0x4e, 0x53, // id
        0x01, 0x00, // flags: recursion desired
        0x00, 0x01, // one question
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00,       // root name
        0x00, 0x02, // type NS
        0x00, 0x01  // class IN
    };
    return query;
}

const std::vector<uint8_t>& ntpClientRequest() {
    static const std::vector<uint8_t> request = [] {
        std::vector<uint8_t> packet(48, 0);
        packet[0] = 0x1b; // LI 0, version 3, mode 3 (client)
        return packet;
    }();
    return request;
}

const std::vector<uint8_t>& snmpSysDescrRequest() {
    static const std::vector<uint8_t> request = {
        0x30, 0x29,                                     // SEQUENCE
        0x02, 0x01, 0x00,                               // version: v1
        0x04, 0x06, 'p', 'u', 'b', 'l', 'i', 'c',       // community
        0xa0, 0x1c,                                     // GetRequest PDU
        0x02, 0x04, 0x00, 0x00, 0x00, 0x01,             // request id
        0x02, 0x01, 0x00,                               // error status
        0x02, 0x01, 0x00,                               // error index
        0x30, 0x0e,                                     // varbind list
        0x30, 0x0c,                                     // varbind
        0x06, 0x08, 0x2b, 0x06, 0x01, 0x02, 0x01, 0x01, 0x01, 0x00, // 1.3.6.1.2.1.1.1.0
        0x05, 0x00                                      // NULL
    };
    return request;
}

} // namespace

PortScanner::PortScanner(SocketProbe& probe, core::PortScanConfig config)
    : probe_(probe), config_(std::move(config)) {}

core::PortState PortScanner::classifyConnect(ConnectOutcome outcome) {
    switch (outcome) {
    case ConnectOutcome::Connected:
        return core::PortState::Open;
    case ConnectOutcome::Refused:
        return core::PortState::Closed;
    case ConnectOutcome::TimedOut:
    case ConnectOutcome::Unreachable:
        return core::PortState::Filtered;
    }
    return core::PortState::Filtered;
}

core::PortState PortScanner::classifyDatagram(const UdpProbeResult& result) {
    return result.answered ? core::PortState::Open : core::PortState::Filtered;
}

std::vector<uint8_t> PortScanner::probePayloadFor(uint16_t port) {
    switch (port) {
    case DNS_PORT:
        return dnsRootNsQuery();
    case NTP_PORT:
        return ntpClientRequest();
    case SNMP_PORT:
        return snmpSysDescrRequest();
    default:
        return {};
    }
}

core::PortRecord PortScanner::scanTcpPort(const asio::ip::address_v4& address, uint16_t port) {
    core::PortRecord record;
    record.address = address.to_string();
    record.port = port;
    record.transport = core::Transport::Tcp;
    record.serviceName = core::ServiceDetector::detectService(port, core::Transport::Tcp);

    auto result = probe_.connect(address, port, config_.timeout, config_.captureBanners);
    record.state = classifyConnect(result.outcome);
    if (record.state == core::PortState::Open && !result.banner.empty()) {
        record.banner = core::PortRecord::sanitizeBanner(result.banner);
    }
    return record;
}

core::PortRecord PortScanner::scanUdpPort(const asio::ip::address_v4& address, uint16_t port) {
    core::PortRecord record;
    record.address = address.to_string();
    record.port = port;
    record.transport = core::Transport::Udp;
    record.serviceName = core::ServiceDetector::detectService(port, core::Transport::Udp);

    auto result = probe_.exchange(address, port, probePayloadFor(port), config_.timeout);
    record.state = classifyDatagram(result);
    if (record.state == core::PortState::Open && config_.captureBanners) {
        record.banner = core::PortRecord::sanitizeBanner(result.reply);
    }
    return record;
}

std::vector<core::PortRecord> PortScanner::scanHost(const std::string& address) {
    auto target = core::AddressRange::parseAddress(address);
    auto ports = config_.getPortsToScan();

    spdlog::info("Starting port scan of {} on {} ports", address, ports.size());

    // Each worker writes only its own slot, so records keep candidate order
    std::vector<core::PortRecord> records(ports.size());
    std::vector<size_t> indices(ports.size());
    std::iota(indices.begin(), indices.end(), size_t{0});

    BoundedRunner<size_t> runner(static_cast<size_t>(std::max(config_.maxConcurrency, 1)),
                                 "ports " + address);
    runner.run(indices, [&](const size_t& index) {
        const auto& [port, transport] = ports[index];
        records[index] = transport == core::Transport::Tcp ? scanTcpPort(target, port)
                                                           : scanUdpPort(target, port);
    });

    auto openCount = std::count_if(records.begin(), records.end(), [](const auto& record) {
        return record.state == core::PortState::Open;
    });
    spdlog::info("Port scan of {} complete: {} open", address, openCount);
    return records;
}

} // namespace netsweep::infra
