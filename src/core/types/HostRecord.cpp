#include "core/types/HostRecord.hpp"

#include <algorithm>
#include <utility>

namespace netsweep::core {

namespace {

void fillIfEmpty(std::optional<std::string>& field, const std::string& incoming) {
    if (!field && !incoming.empty()) {
        field = incoming;
    }
}

} // namespace

std::string methodToString(DiscoveryMethod method) {
    switch (method) {
    case DiscoveryMethod::LinkLayer:
        return "arp";
    case DiscoveryMethod::Echo:
        return "icmp";
    case DiscoveryMethod::Connection:
        return "tcp";
    }
    return "unknown";
}

std::string strategyToString(DiscoveryStrategy strategy) {
    return strategy == DiscoveryStrategy::Local ? "local" : "remote";
}

ProbeFinding ProbeFinding::linkLayer(std::string address, std::string hardwareAddress,
                                     std::string vendor) {
    ProbeFinding finding;
    finding.address = std::move(address);
    finding.method = DiscoveryMethod::LinkLayer;
    finding.hardwareAddress = std::move(hardwareAddress);
    finding.vendor = std::move(vendor);
    return finding;
}

ProbeFinding ProbeFinding::echo(std::string address, std::chrono::microseconds roundTripTime) {
    ProbeFinding finding;
    finding.address = std::move(address);
    finding.method = DiscoveryMethod::Echo;
    finding.roundTripTime = roundTripTime;
    return finding;
}

ProbeFinding ProbeFinding::connection(std::string address) {
    ProbeFinding finding;
    finding.address = std::move(address);
    finding.method = DiscoveryMethod::Connection;
    return finding;
}

HostRecord HostRecord::fromFinding(const ProbeFinding& finding) {
    HostRecord record;
    record.address = finding.address;
    record.merge(finding);
    return record;
}

void HostRecord::merge(const ProbeFinding& finding) {
    if (finding.address != address) {
        return;
    }

    switch (finding.method) {
    case DiscoveryMethod::LinkLayer:
        foundByLinkLayer = true;
        fillIfEmpty(hardwareAddress, finding.hardwareAddress);
        fillIfEmpty(vendor, finding.vendor);
        break;
    case DiscoveryMethod::Echo:
        foundByEcho = true;
        if (!roundTripTime && finding.roundTripTime && finding.roundTripTime->count() > 0) {
            roundTripTime = finding.roundTripTime;
        }
        break;
    case DiscoveryMethod::Connection:
        foundByConnection = true;
        break;
    }
}

void HostRecord::mergePorts(const std::vector<PortRecord>& ports) {
    for (const auto& port : ports) {
        auto existing = std::find_if(openPorts.begin(), openPorts.end(), [&port](const auto& p) {
            return p.port == port.port && p.transport == port.transport;
        });
        if (existing == openPorts.end()) {
            openPorts.push_back(port);
        }
    }

    std::sort(openPorts.begin(), openPorts.end(), [](const auto& a, const auto& b) {
        if (a.transport != b.transport) {
            return a.transport < b.transport;
        }
        return a.port < b.port;
    });
}

std::vector<DiscoveryMethod> HostRecord::methods() const {
    std::vector<DiscoveryMethod> result;
    if (foundByLinkLayer)
        result.push_back(DiscoveryMethod::LinkLayer);
    if (foundByEcho)
        result.push_back(DiscoveryMethod::Echo);
    if (foundByConnection)
        result.push_back(DiscoveryMethod::Connection);
    return result;
}

std::string HostRecord::methodsToString() const {
    std::string result;
    for (auto method : methods()) {
        if (!result.empty()) {
            result += ", ";
        }
        result += methodToString(method);
    }
    return result;
}

} // namespace netsweep::core
