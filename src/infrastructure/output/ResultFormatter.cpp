#include "infrastructure/output/ResultFormatter.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iomanip>
#include <sstream>

namespace netsweep::infra {

DiscoverySummary DiscoverySummary::of(const std::vector<core::HostRecord>& records) {
    DiscoverySummary summary;
    summary.totalHosts = records.size();
    for (const auto& record : records) {
        summary.byLinkLayer += record.foundByLinkLayer ? 1 : 0;
        summary.byEcho += record.foundByEcho ? 1 : 0;
        summary.byConnection += record.foundByConnection ? 1 : 0;
        if (record.foundByLinkLayer && record.foundByEcho && record.foundByConnection) {
            ++summary.byAllMethods;
        }
        summary.openPorts += record.openPorts.size();
    }
    return summary;
}

nlohmann::json ResultFormatter::toJson(const core::PortRecord& port) {
    nlohmann::json j;
    j["port"] = port.port;
    j["protocol"] = port.transportToString();
    j["state"] = port.stateToString();
    j["service"] = port.serviceName;
    if (port.banner) {
        j["banner"] = *port.banner;
    }
    return j;
}

nlohmann::json ResultFormatter::toJson(const core::HostRecord& record) {
    nlohmann::json j;
    j["ip"] = record.address;
    j["arp_found"] = record.foundByLinkLayer;
    j["icmp_found"] = record.foundByEcho;
    j["tcp_found"] = record.foundByConnection;
    j["methods"] = record.methodsToString();
    j["strategy"] = core::strategyToString(record.strategy);
    j["network"] = record.networkSegment;
    if (record.hardwareAddress) {
        j["mac"] = *record.hardwareAddress;
    }
    if (record.vendor) {
        j["vendor"] = *record.vendor;
    }
    if (record.hostname) {
        j["hostname"] = *record.hostname;
    }
    if (record.roundTripTime) {
        j["rtt_ms"] = record.roundTripMs();
    }

    j["open_ports"] = nlohmann::json::array();
    for (const auto& port : record.openPorts) {
        j["open_ports"].push_back(toJson(port));
    }
    return j;
}

nlohmann::json ResultFormatter::toJson(const std::vector<core::HostRecord>& records) {
    nlohmann::json j;
    j["hosts"] = nlohmann::json::array();
    for (const auto& record : records) {
        j["hosts"].push_back(toJson(record));
    }

    auto summary = DiscoverySummary::of(records);
    j["summary"]["total_hosts"] = summary.totalHosts;
    j["summary"]["arp"] = summary.byLinkLayer;
    j["summary"]["icmp"] = summary.byEcho;
    j["summary"]["tcp"] = summary.byConnection;
    j["summary"]["all_methods"] = summary.byAllMethods;
    j["summary"]["open_ports"] = summary.openPorts;
    return j;
}

std::string ResultFormatter::formatText(const std::vector<core::HostRecord>& records) {
    std::ostringstream oss;

    if (records.empty()) {
        oss << "No live hosts found.\n";
        return oss.str();
    }

    oss << std::left << std::setw(16) << "IP" << std::setw(19) << "MAC" << std::setw(24)
        << "VENDOR" << std::setw(16) << "METHODS" << std::setw(10) << "RTT" << "HOSTNAME\n";

    for (const auto& record : records) {
        std::ostringstream rtt;
        if (record.roundTripTime) {
            rtt << std::fixed << std::setprecision(2) << record.roundTripMs() << "ms";
        } else {
            rtt << "-";
        }

        oss << std::left << std::setw(16) << record.address << std::setw(19)
            << record.hardwareAddress.value_or("-") << std::setw(24)
            << record.vendor.value_or("-").substr(0, 23) << std::setw(16)
            << record.methodsToString() << std::setw(10) << rtt.str()
            << record.hostname.value_or("-") << "\n";

        for (const auto& port : record.openPorts) {
            oss << "    " << port.port << "/" << port.transportToString() << " "
                << port.serviceName;
            if (port.banner) {
                oss << "  " << *port.banner;
            }
            oss << "\n";
        }
    }

    auto summary = DiscoverySummary::of(records);
    oss << "\n"
        << "Hosts found:      " << summary.totalHosts << "\n"
        << "  via ARP:        " << summary.byLinkLayer << "\n"
        << "  via ICMP:       " << summary.byEcho << "\n"
        << "  via TCP:        " << summary.byConnection << "\n"
        << "  via all three:  " << summary.byAllMethods << "\n";
    if (summary.openPorts > 0) {
        oss << "Open ports:       " << summary.openPorts << "\n";
    }

    return oss.str();
}

bool ResultFormatter::writeJson(const std::filesystem::path& path,
                                const std::vector<core::HostRecord>& records) {
    std::ofstream file(path);
    if (!file) {
        spdlog::error("Failed to open output file: {}", path.string());
        return false;
    }

    file << toJson(records).dump(2) << "\n";
    spdlog::info("Wrote {} hosts to {}", records.size(), path.string());
    return static_cast<bool>(file);
}

} // namespace netsweep::infra
