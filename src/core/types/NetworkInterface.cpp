#include "core/types/NetworkInterface.hpp"

#include <array>
#include <cstdio>
#include <cstring>
#include <fstream>

#ifdef __linux__
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace netsweep::core {

namespace {

#ifdef __linux__
std::string sockaddrToString(const struct sockaddr* sa) {
    if (sa == nullptr || sa->sa_family != AF_INET) {
        return {};
    }
    char ipStr[INET_ADDRSTRLEN];
    const auto* addr = reinterpret_cast<const struct sockaddr_in*>(sa);
    inet_ntop(AF_INET, &addr->sin_addr, ipStr, INET_ADDRSTRLEN);
    return ipStr;
}

std::string readMacAddress(const std::string& interfaceName) {
    int sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        return {};
    }

    struct ifreq ifr {};
    std::strncpy(ifr.ifr_name, interfaceName.c_str(), IFNAMSIZ - 1);
    std::string mac;
    if (ioctl(sock, SIOCGIFHWADDR, &ifr) == 0) {
        const auto* hw = reinterpret_cast<const unsigned char*>(ifr.ifr_hwaddr.sa_data);
        std::array<char, 18> buffer{};
        std::snprintf(buffer.data(), buffer.size(), "%02x:%02x:%02x:%02x:%02x:%02x", hw[0], hw[1],
                      hw[2], hw[3], hw[4], hw[5]);
        mac = buffer.data();
    }
    close(sock);
    return mac;
}
#endif

} // namespace

std::optional<asio::ip::network_v4> NetworkInterface::network() const {
    asio::error_code ec;
    auto address = asio::ip::make_address_v4(ipAddress, ec);
    if (ec) {
        return std::nullopt;
    }
    auto mask = asio::ip::make_address_v4(netmask, ec);
    if (ec) {
        return std::nullopt;
    }

    try {
        return asio::ip::network_v4(address, mask);
    } catch (const std::exception&) {
        // Non-contiguous netmask
        return std::nullopt;
    }
}

std::string NetworkInterface::cidr() const {
    auto net = network();
    return net ? net->canonical().to_string() : std::string();
}

std::vector<NetworkInterface> NetworkInterfaceEnumerator::enumerate() {
    std::vector<NetworkInterface> interfaces;

#ifdef __linux__
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        return interfaces;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) {
            continue;
        }

        if (ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        NetworkInterface iface;
        iface.name = ifa->ifa_name;
        iface.isUp = (ifa->ifa_flags & IFF_UP) != 0;
        iface.isLoopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
        iface.ipAddress = sockaddrToString(ifa->ifa_addr);
        iface.netmask = sockaddrToString(ifa->ifa_netmask);
        iface.macAddress = iface.isLoopback ? std::string() : readMacAddress(iface.name);

        iface.stats = getStats(iface.name);
        interfaces.push_back(std::move(iface));
    }

    freeifaddrs(ifaddr);
#endif

    return interfaces;
}

std::optional<NetworkInterface> NetworkInterfaceEnumerator::findByName(const std::string& name) {
    for (auto& iface : enumerate()) {
        if (iface.name == name) {
            return iface;
        }
    }
    return std::nullopt;
}

std::optional<NetworkInterface> NetworkInterfaceEnumerator::detectPrimary() {
    return selectPrimary(enumerate());
}

std::optional<NetworkInterface>
NetworkInterfaceEnumerator::selectPrimary(const std::vector<NetworkInterface>& interfaces) {
    const NetworkInterface* best = nullptr;
    for (const auto& iface : interfaces) {
        if (!iface.isUp || iface.isLoopback || !isCandidateName(iface.name)) {
            continue;
        }
        if (best == nullptr || iface.stats.totalPackets() > best->stats.totalPackets()) {
            best = &iface;
        }
    }

    if (best == nullptr) {
        return std::nullopt;
    }
    return *best;
}

bool NetworkInterfaceEnumerator::isCandidateName(const std::string& name) {
    if (name.empty() || name == "lo") {
        return false;
    }

    static const std::array<const char*, 6> skipPrefixes = {"docker", "veth", "br-",
                                                            "virbr",  "tun",  "tap"};
    for (const char* prefix : skipPrefixes) {
        if (name.rfind(prefix, 0) == 0) {
            return false;
        }
    }
    return true;
}

NetworkInterfaceStats NetworkInterfaceEnumerator::getStats(const std::string& interfaceName) {
    NetworkInterfaceStats stats;

#ifdef __linux__
    std::string path = "/sys/class/net/" + interfaceName + "/statistics/";

    auto readStat = [&path](const std::string& name) -> uint64_t {
        std::ifstream file(path + name);
        uint64_t value = 0;
        if (file) {
            file >> value;
        }
        return value;
    };

    stats.bytesReceived = readStat("rx_bytes");
    stats.bytesSent = readStat("tx_bytes");
    stats.packetsReceived = readStat("rx_packets");
    stats.packetsSent = readStat("tx_packets");
#endif

    return stats;
}

} // namespace netsweep::core
