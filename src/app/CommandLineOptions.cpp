#include "app/CommandLineOptions.hpp"

#include <sstream>
#include <stdexcept>

namespace netsweep::app {

namespace {

int parsePort(const std::string& text) {
    size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid port: '" + text + "'");
    }
    if (consumed != text.size() || port < 1 || port > 65535) {
        throw std::invalid_argument("Invalid port: '" + text + "'");
    }
    return port;
}

} // namespace

std::vector<int> CommandLineOptions::parsePortList(const std::string& text) {
    if (text == "default") {
        return {};
    }

    std::vector<int> ports;
    std::istringstream stream(text);
    std::string entry;
    while (std::getline(stream, entry, ',')) {
        if (entry.empty()) {
            continue;
        }
        auto dash = entry.find('-');
        if (dash == std::string::npos) {
            ports.push_back(parsePort(entry));
            continue;
        }

        int first = parsePort(entry.substr(0, dash));
        int last = parsePort(entry.substr(dash + 1));
        if (first > last) {
            throw std::invalid_argument("Invalid port range: '" + entry + "'");
        }
        for (int port = first; port <= last; ++port) {
            ports.push_back(port);
        }
    }

    if (ports.empty()) {
        throw std::invalid_argument("Empty port list");
    }
    return ports;
}

void CommandLineOptions::applyTo(infra::AppConfig& config) const {
    if (!targets.empty()) {
        config.network.targets = targets;
    }
    if (!targetsFile.empty()) {
        config.network.targetsFile = targetsFile;
    }
    if (!interfaceName.empty()) {
        config.network.interfaceName = interfaceName;
    }
    if (ports) {
        config.portScan.enabled = true;
        config.portScan.tcpPorts = parsePortList(*ports);
    }
    if (noLinkLayer) {
        config.linkLayer.enabled = false;
    }
    if (json) {
        config.output.format = "json";
    }
    if (!outputFile.empty()) {
        config.output.file = outputFile;
    }
    if (verbose) {
        config.logging.level = "debug";
    }
}

} // namespace netsweep::app
