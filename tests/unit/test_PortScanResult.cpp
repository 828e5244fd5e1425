#include <catch2/catch_test_macros.hpp>

#include "core/types/PortScanResult.hpp"

using namespace netsweep::core;

TEST_CASE("PortRecord default values", "[PortScanResult]") {
    PortRecord record;

    REQUIRE(record.address.empty());
    REQUIRE(record.port == 0);
    REQUIRE(record.transport == Transport::Tcp);
    REQUIRE(record.state == PortState::Unknown);
    REQUIRE(record.serviceName.empty());
    REQUIRE_FALSE(record.banner.has_value());
}

TEST_CASE("PortRecord state string conversion", "[PortScanResult]") {
    SECTION("stateToString instance method") {
        PortRecord record;

        record.state = PortState::Unknown;
        REQUIRE(record.stateToString() == "unknown");

        record.state = PortState::Open;
        REQUIRE(record.stateToString() == "open");

        record.state = PortState::Closed;
        REQUIRE(record.stateToString() == "closed");

        record.state = PortState::Filtered;
        REQUIRE(record.stateToString() == "filtered");
    }

    SECTION("stateFromString") {
        REQUIRE(PortRecord::stateFromString("open") == PortState::Open);
        REQUIRE(PortRecord::stateFromString("closed") == PortState::Closed);
        REQUIRE(PortRecord::stateFromString("filtered") == PortState::Filtered);
        REQUIRE(PortRecord::stateFromString("Invalid") == PortState::Unknown);
    }

    SECTION("transport names") {
        REQUIRE(PortRecord::transportName(Transport::Tcp) == "tcp");
        REQUIRE(PortRecord::transportName(Transport::Udp) == "udp");
        REQUIRE(PortRecord::transportFromString("udp") == Transport::Udp);
        REQUIRE(PortRecord::transportFromString("tcp") == Transport::Tcp);
    }
}

TEST_CASE("PortRecord banner sanitising", "[PortScanResult]") {
    SECTION("line endings become spaces and trailing whitespace is trimmed") {
        auto banner = PortRecord::sanitizeBanner("SSH-2.0-OpenSSH_9.6\r\n");
        REQUIRE(banner == "SSH-2.0-OpenSSH_9.6");
    }

    SECTION("control bytes are replaced") {
        auto banner = PortRecord::sanitizeBanner(std::string("220\x01ready", 9));
        REQUIRE(banner == "220.ready");
    }

    SECTION("long banners are truncated") {
        auto banner = PortRecord::sanitizeBanner(std::string(1000, 'A'));
        REQUIRE(banner.has_value());
        REQUIRE(banner->size() == PortRecord::kMaxBannerLength);
    }

    SECTION("nothing printable yields no banner") {
        REQUIRE_FALSE(PortRecord::sanitizeBanner("").has_value());
        REQUIRE_FALSE(PortRecord::sanitizeBanner(std::string("\x00\x01\x02", 3)).has_value());
        REQUIRE_FALSE(PortRecord::sanitizeBanner("\r\n").has_value());
    }
}

TEST_CASE("PortScanConfig defaults", "[PortScanResult]") {
    auto config = PortScanConfig::defaults();

    REQUIRE(config.tcpPorts.size() == 21);
    REQUIRE(config.udpPorts.size() == 14);
    REQUIRE(config.maxConcurrency == 50);
    REQUIRE(config.timeout == std::chrono::milliseconds(2000));
    REQUIRE(config.captureBanners);

    SECTION("stream ports come before datagram ports") {
        auto ports = config.getPortsToScan();
        REQUIRE(ports.size() == 35);
        REQUIRE(ports.front() == std::pair<uint16_t, Transport>{20, Transport::Tcp});
        REQUIRE(ports.back() == std::pair<uint16_t, Transport>{1900, Transport::Udp});
    }

    SECTION("transports can be disabled") {
        config.scanUdp = false;
        REQUIRE(config.getPortsToScan().size() == 21);

        config.scanTcp = false;
        REQUIRE(config.getPortsToScan().empty());
    }
}

TEST_CASE("ServiceDetector lookups", "[PortScanResult]") {
    REQUIRE(ServiceDetector::detectService(22, Transport::Tcp) == "ssh");
    REQUIRE(ServiceDetector::detectService(80, Transport::Tcp) == "http");
    REQUIRE(ServiceDetector::detectService(161, Transport::Udp) == "snmp");
    REQUIRE(ServiceDetector::detectService(53, Transport::Udp) == "dns");

    SECTION("transport is part of the key") {
        REQUIRE(ServiceDetector::detectService(161, Transport::Tcp) == "unknown");
    }

    SECTION("unknown ports") {
        REQUIRE(ServiceDetector::detectService(31337, Transport::Tcp) == "unknown");
    }

    SECTION("every candidate port has a name") {
        for (uint16_t port : PortScanConfig::commonTcpPorts()) {
            REQUIRE(ServiceDetector::detectService(port, Transport::Tcp) != "unknown");
        }
        for (uint16_t port : PortScanConfig::commonUdpPorts()) {
            REQUIRE(ServiceDetector::detectService(port, Transport::Udp) != "unknown");
        }
    }
}
