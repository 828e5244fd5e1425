#include "core/types/PortScanResult.hpp"

#include <algorithm>

namespace netsweep::core {

std::string PortRecord::stateToString() const {
    return portStateToString(state);
}

std::string PortRecord::transportToString() const {
    return transportName(transport);
}

std::string PortRecord::portStateToString(PortState state) {
    switch (state) {
    case PortState::Unknown:
        return "unknown";
    case PortState::Open:
        return "open";
    case PortState::Closed:
        return "closed";
    case PortState::Filtered:
        return "filtered";
    }
    return "unknown";
}

PortState PortRecord::stateFromString(const std::string& str) {
    if (str == "open")
        return PortState::Open;
    if (str == "closed")
        return PortState::Closed;
    if (str == "filtered")
        return PortState::Filtered;
    return PortState::Unknown;
}

std::string PortRecord::transportName(Transport transport) {
    return transport == Transport::Udp ? "udp" : "tcp";
}

Transport PortRecord::transportFromString(const std::string& str) {
    return str == "udp" ? Transport::Udp : Transport::Tcp;
}

std::optional<std::string> PortRecord::sanitizeBanner(const std::string& raw) {
    std::string cleaned;
    cleaned.reserve(std::min(raw.size(), kMaxBannerLength));

    for (char ch : raw) {
        if (cleaned.size() >= kMaxBannerLength) {
            break;
        }
        auto c = static_cast<unsigned char>(ch);
        if (c == '\r' || c == '\n' || c == '\t') {
            cleaned.push_back(' ');
        } else if (c >= 0x20 && c < 0x7F) {
            cleaned.push_back(static_cast<char>(c));
        } else {
            cleaned.push_back('.');
        }
    }

    while (!cleaned.empty() && cleaned.back() == ' ') {
        cleaned.pop_back();
    }

    bool printable = std::any_of(cleaned.begin(), cleaned.end(),
                                 [](char c) { return c != '.' && c != ' '; });
    if (!printable) {
        return std::nullopt;
    }
    return cleaned;
}

const std::vector<uint16_t>& PortScanConfig::commonTcpPorts() {
    static const std::vector<uint16_t> ports = {20,  21,  22,  23,  25,   53,   80,
                                                110, 111, 135, 139, 143,  443,  445,
                                                993, 995, 1723, 3306, 3389, 5900, 8080};
    return ports;
}

const std::vector<uint16_t>& PortScanConfig::commonUdpPorts() {
    static const std::vector<uint16_t> ports = {53,  67,  68,  69,  123, 135,  137,
                                                138, 161, 162, 445, 514, 631, 1900};
    return ports;
}

PortScanConfig PortScanConfig::defaults() {
    PortScanConfig config;
    config.tcpPorts = commonTcpPorts();
    config.udpPorts = commonUdpPorts();
    return config;
}

std::vector<std::pair<uint16_t, Transport>> PortScanConfig::getPortsToScan() const {
    std::vector<std::pair<uint16_t, Transport>> ports;
    if (scanTcp) {
        for (uint16_t port : tcpPorts) {
            ports.emplace_back(port, Transport::Tcp);
        }
    }
    if (scanUdp) {
        for (uint16_t port : udpPorts) {
            ports.emplace_back(port, Transport::Udp);
        }
    }
    return ports;
}

const std::map<std::pair<uint16_t, Transport>, std::string>& ServiceDetector::getKnownServices() {
    static const std::map<std::pair<uint16_t, Transport>, std::string> services = {
        {{20, Transport::Tcp}, "ftp-data"},    {{21, Transport::Tcp}, "ftp"},
        {{22, Transport::Tcp}, "ssh"},         {{23, Transport::Tcp}, "telnet"},
        {{25, Transport::Tcp}, "smtp"},        {{53, Transport::Tcp}, "dns"},
        {{80, Transport::Tcp}, "http"},        {{110, Transport::Tcp}, "pop3"},
        {{111, Transport::Tcp}, "rpcbind"},    {{135, Transport::Tcp}, "msrpc"},
        {{139, Transport::Tcp}, "netbios-ssn"}, {{143, Transport::Tcp}, "imap"},
        {{443, Transport::Tcp}, "https"},      {{445, Transport::Tcp}, "smb"},
        {{993, Transport::Tcp}, "imaps"},      {{995, Transport::Tcp}, "pop3s"},
        {{1723, Transport::Tcp}, "pptp"},      {{3306, Transport::Tcp}, "mysql"},
        {{3389, Transport::Tcp}, "rdp"},       {{5900, Transport::Tcp}, "vnc"},
        {{8080, Transport::Tcp}, "http-proxy"},

        {{53, Transport::Udp}, "dns"},         {{67, Transport::Udp}, "dhcp-server"},
        {{68, Transport::Udp}, "dhcp-client"}, {{69, Transport::Udp}, "tftp"},
        {{123, Transport::Udp}, "ntp"},        {{135, Transport::Udp}, "msrpc"},
        {{137, Transport::Udp}, "netbios-ns"}, {{138, Transport::Udp}, "netbios-dgm"},
        {{161, Transport::Udp}, "snmp"},       {{162, Transport::Udp}, "snmptrap"},
        {{445, Transport::Udp}, "smb"},        {{514, Transport::Udp}, "syslog"},
        {{631, Transport::Udp}, "ipp"},        {{1900, Transport::Udp}, "ssdp"}};
    return services;
}

std::string ServiceDetector::detectService(uint16_t port, Transport transport) {
    const auto& services = getKnownServices();
    auto it = services.find({port, transport});
    return it != services.end() ? it->second : "unknown";
}

} // namespace netsweep::core
