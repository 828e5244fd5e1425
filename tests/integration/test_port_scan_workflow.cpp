#include <catch2/catch_test_macros.hpp>

#include "infrastructure/discovery/DiscoveryOrchestrator.hpp"
#include "infrastructure/network/ProbeRuntime.hpp"
#include "infrastructure/network/ConnectionProber.hpp"
#include "infrastructure/network/PortScanner.hpp"
#include "infrastructure/network/ReverseDnsResolver.hpp"
#include "infrastructure/network/SocketProbe.hpp"
#include "infrastructure/output/ResultFormatter.hpp"
#include "support/LoopbackServices.hpp"

#include <algorithm>

using namespace netsweep::core;
using namespace netsweep::infra;
using namespace netsweep::testing;
using namespace std::chrono_literals;

TEST_CASE("Port scan workflow - discovery followed by enrichment",
          "[Integration][PortScan]") {
    ProbeRuntime runtime(4);
    SocketProbe socketProbe(runtime);

    LoopbackTcpServer ssh("SSH-2.0-Loopback\r\n");
    LoopbackTcpServer quiet;
    LoopbackUdpResponder responder("datagram reply");
    uint16_t closedTcp = unusedTcpPort();
    uint16_t silentUdp = unusedUdpPort();

    ConnectionProberOptions connectionOptions;
    connectionOptions.timeout = 500ms;
    connectionOptions.ports = {ssh.port()};

    PortScanConfig scanConfig;
    scanConfig.tcpPorts = {quiet.port(), closedTcp, ssh.port()};
    scanConfig.udpPorts = {silentUdp, responder.port()};
    scanConfig.timeout = 500ms;
    scanConfig.maxConcurrency = 4;

    DiscoveryServices services;
    services.connection = std::make_shared<ConnectionProber>(socketProbe, connectionOptions);
    services.portScanner = std::make_shared<PortScanner>(socketProbe, scanConfig);
    services.nameResolver = std::make_shared<ReverseDnsResolver>(runtime);

    DiscoveryOptions options;
    options.hostWorkers = 2;
    DiscoveryOrchestrator orchestrator(services, options);

    auto records = orchestrator.discover("127.0.0.1", true);

    REQUIRE(records.size() == 1);
    const auto& record = records[0];
    REQUIRE(record.foundByConnection);

    SECTION("Only open ports are attached, stream ports first") {
        REQUIRE(record.openPorts.size() == 3);

        std::vector<uint16_t> tcpOpen = {quiet.port(), ssh.port()};
        std::sort(tcpOpen.begin(), tcpOpen.end());
        REQUIRE(record.openPorts[0].transport == Transport::Tcp);
        REQUIRE(record.openPorts[0].port == tcpOpen[0]);
        REQUIRE(record.openPorts[1].transport == Transport::Tcp);
        REQUIRE(record.openPorts[1].port == tcpOpen[1]);
        REQUIRE(record.openPorts[2].transport == Transport::Udp);
        REQUIRE(record.openPorts[2].port == responder.port());

        for (const auto& port : record.openPorts) {
            REQUIRE(port.state == PortState::Open);
            REQUIRE(port.address == "127.0.0.1");
        }
    }

    SECTION("Banners are captured") {
        auto find = [&record](uint16_t port, Transport transport) {
            return std::find_if(record.openPorts.begin(), record.openPorts.end(),
                                [port, transport](const PortRecord& p) {
                                    return p.port == port && p.transport == transport;
                                });
        };

        auto sshPort = find(ssh.port(), Transport::Tcp);
        REQUIRE(sshPort != record.openPorts.end());
        REQUIRE(sshPort->banner == "SSH-2.0-Loopback");

        auto quietPort = find(quiet.port(), Transport::Tcp);
        REQUIRE(quietPort != record.openPorts.end());
        REQUIRE_FALSE(quietPort->banner.has_value());

        auto udpPort = find(responder.port(), Transport::Udp);
        REQUIRE(udpPort != record.openPorts.end());
        REQUIRE(udpPort->banner == "datagram reply");
    }

    SECTION("Hostname is either resolved or absent") {
        if (record.hostname) {
            REQUIRE_FALSE(record.hostname->empty());
            REQUIRE(record.hostname->back() != '.');
        }
    }

    SECTION("Report includes the ports") {
        auto j = ResultFormatter::toJson(records);
        REQUIRE(j["summary"]["open_ports"] == 3);
        REQUIRE(j["hosts"][0]["open_ports"].size() == 3);

        auto text = ResultFormatter::formatText(records);
        REQUIRE(text.find(std::to_string(ssh.port()) + "/tcp") != std::string::npos);
        REQUIRE(text.find("SSH-2.0-Loopback") != std::string::npos);
    }
}
