#include <catch2/catch_test_macros.hpp>

#include "core/types/NetworkInterface.hpp"

using namespace netsweep::core;

namespace {

NetworkInterface makeInterface(const std::string& name, uint64_t packets, bool up = true,
                               bool loopback = false) {
    NetworkInterface iface;
    iface.name = name;
    iface.ipAddress = "192.168.1.10";
    iface.netmask = "255.255.255.0";
    iface.isUp = up;
    iface.isLoopback = loopback;
    iface.stats.packetsReceived = packets;
    return iface;
}

} // namespace

TEST_CASE("NetworkInterface default values", "[NetworkInterface]") {
    NetworkInterface iface;

    REQUIRE(iface.name.empty());
    REQUIRE(iface.ipAddress.empty());
    REQUIRE_FALSE(iface.isUp);
    REQUIRE_FALSE(iface.isLoopback);
    REQUIRE(iface.stats.totalPackets() == 0);
    REQUIRE_FALSE(iface.network().has_value());
    REQUIRE(iface.cidr().empty());
}

TEST_CASE("NetworkInterface attached network", "[NetworkInterface]") {
    NetworkInterface iface;
    iface.ipAddress = "10.20.30.40";

    SECTION("Canonical prefix") {
        iface.netmask = "255.255.255.0";
        REQUIRE(iface.cidr() == "10.20.30.0/24");
        REQUIRE(iface.network()->prefix_length() == 24);
    }

    SECTION("Wider prefix") {
        iface.netmask = "255.255.240.0";
        REQUIRE(iface.cidr() == "10.20.16.0/20");
    }

    SECTION("Non-contiguous mask") {
        iface.netmask = "255.0.255.0";
        REQUIRE_FALSE(iface.network().has_value());
        REQUIRE(iface.cidr().empty());
    }

    SECTION("Unparseable address") {
        iface.ipAddress = "not-an-ip";
        iface.netmask = "255.255.255.0";
        REQUIRE_FALSE(iface.network().has_value());
    }
}

TEST_CASE("Interface name filtering", "[NetworkInterface]") {
    REQUIRE(NetworkInterfaceEnumerator::isCandidateName("eth0"));
    REQUIRE(NetworkInterfaceEnumerator::isCandidateName("enp3s0"));
    REQUIRE(NetworkInterfaceEnumerator::isCandidateName("wlan0"));

    REQUIRE_FALSE(NetworkInterfaceEnumerator::isCandidateName(""));
    REQUIRE_FALSE(NetworkInterfaceEnumerator::isCandidateName("lo"));
    REQUIRE_FALSE(NetworkInterfaceEnumerator::isCandidateName("docker0"));
    REQUIRE_FALSE(NetworkInterfaceEnumerator::isCandidateName("veth12ab"));
    REQUIRE_FALSE(NetworkInterfaceEnumerator::isCandidateName("br-4f2a"));
    REQUIRE_FALSE(NetworkInterfaceEnumerator::isCandidateName("virbr0"));
    REQUIRE_FALSE(NetworkInterfaceEnumerator::isCandidateName("tun0"));
    REQUIRE_FALSE(NetworkInterfaceEnumerator::isCandidateName("tap1"));
}

TEST_CASE("Primary interface selection", "[NetworkInterface]") {
    SECTION("Busiest candidate wins") {
        auto primary = NetworkInterfaceEnumerator::selectPrimary(
            {makeInterface("eth0", 100), makeInterface("wlan0", 5000), makeInterface("eth1", 10)});
        REQUIRE(primary.has_value());
        REQUIRE(primary->name == "wlan0");
    }

    SECTION("Down, loopback and virtual interfaces are skipped") {
        auto primary = NetworkInterfaceEnumerator::selectPrimary(
            {makeInterface("lo", 90000, true, true), makeInterface("docker0", 80000),
             makeInterface("eth1", 70000, false), makeInterface("eth0", 1)});
        REQUIRE(primary.has_value());
        REQUIRE(primary->name == "eth0");
    }

    SECTION("No candidates") {
        REQUIRE_FALSE(NetworkInterfaceEnumerator::selectPrimary({}).has_value());
        REQUIRE_FALSE(NetworkInterfaceEnumerator::selectPrimary(
                          {makeInterface("lo", 10, true, true)})
                          .has_value());
    }
}

TEST_CASE("Interface enumeration", "[NetworkInterface]") {
    auto interfaces = NetworkInterfaceEnumerator::enumerate();

    for (const auto& iface : interfaces) {
        REQUIRE_FALSE(iface.name.empty());
        REQUIRE_FALSE(iface.ipAddress.empty());
    }

    SECTION("Unknown interface is not found") {
        REQUIRE_FALSE(NetworkInterfaceEnumerator::findByName("nsw-missing0").has_value());
    }

    SECTION("Statistics of an unknown interface are zero") {
        REQUIRE(NetworkInterfaceEnumerator::getStats("nsw-missing0") == NetworkInterfaceStats{});
    }
}
