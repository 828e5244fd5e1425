#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <fstream>

namespace netsweep::infra {

namespace {

void checkPositive(std::vector<std::string>& problems, const std::string& key, int value) {
    if (value <= 0) {
        problems.push_back(key + " must be positive (got " + std::to_string(value) + ")");
    }
}

void checkPorts(std::vector<std::string>& problems, const std::string& key,
                const std::vector<int>& ports) {
    for (int port : ports) {
        if (port < 1 || port > 65535) {
            problems.push_back(key + " contains invalid port " + std::to_string(port));
        }
    }
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir, const std::string& fileName)
    : configDir_(configDir.empty() ? std::filesystem::path(".") : configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / fileName;
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }

    auto problems = validate();
    for (const auto& problem : problems) {
        spdlog::error("Invalid configuration: {}", problem);
    }
    if (!problems.empty()) {
        return false;
    }

    spdlog::info("Loaded configuration from {}", configPath_.string());
    return true;
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

std::vector<std::string> ConfigManager::validate() const {
    std::vector<std::string> problems;

    if (config_.network.interfaceName.empty()) {
        problems.emplace_back("network.interface must not be empty (use \"auto\" to detect)");
    }

    checkPositive(problems, "link_layer.timeout_ms", config_.linkLayer.timeoutMs);
    checkPositive(problems, "link_layer.workers", config_.linkLayer.workers);
    if (config_.linkLayer.rateLimitMs < 0) {
        problems.emplace_back("link_layer.rate_limit_ms must not be negative");
    }
    if (config_.linkLayer.retryCount < 0) {
        problems.emplace_back("link_layer.retry_count must not be negative");
    }

    checkPositive(problems, "echo.timeout_ms", config_.echo.timeoutMs);
    checkPositive(problems, "echo.workers", config_.echo.workers);

    checkPositive(problems, "connection_probe.timeout_ms", config_.connectionProbe.timeoutMs);
    checkPositive(problems, "connection_probe.workers", config_.connectionProbe.workers);
    checkPorts(problems, "connection_probe.ports", config_.connectionProbe.ports);
    if (config_.connectionProbe.enabled && config_.connectionProbe.ports.empty()) {
        problems.emplace_back("connection_probe.ports must not be empty");
    }

    checkPositive(problems, "port_scan.timeout_ms", config_.portScan.timeoutMs);
    checkPositive(problems, "port_scan.workers", config_.portScan.workers);
    checkPositive(problems, "port_scan.host_workers", config_.portScan.hostWorkers);
    checkPorts(problems, "port_scan.tcp_ports", config_.portScan.tcpPorts);
    checkPorts(problems, "port_scan.udp_ports", config_.portScan.udpPorts);

    if (!config_.linkLayer.enabled && !config_.echo.enabled && !config_.connectionProbe.enabled) {
        problems.emplace_back("at least one of link_layer, echo and connection_probe must be "
                              "enabled");
    }

    static const std::array<const char*, 7> levels = {"trace", "debug",    "info", "warn",
                                                      "error", "critical", "off"};
    if (std::find(levels.begin(), levels.end(), config_.logging.level) == levels.end()) {
        problems.push_back("logging.level is not a valid level: " + config_.logging.level);
    }

    if (config_.output.format != "text" && config_.output.format != "json") {
        problems.push_back("output.format must be \"text\" or \"json\" (got \"" +
                           config_.output.format + "\")");
    }

    return problems;
}

std::vector<uint16_t> ConfigManager::toPortList(const std::vector<int>& ports) {
    std::vector<uint16_t> result;
    result.reserve(ports.size());
    for (int port : ports) {
        if (port >= 1 && port <= 65535) {
            result.push_back(static_cast<uint16_t>(port));
        }
    }
    return result;
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Network
    j["network"]["interface"] = config_.network.interfaceName;
    j["network"]["targets"] = config_.network.targets;
    j["network"]["targets_file"] = config_.network.targetsFile;
    j["network"]["auto_detect_local"] = config_.network.autoDetectLocal;

    // Link layer
    j["link_layer"]["enabled"] = config_.linkLayer.enabled;
    j["link_layer"]["timeout_ms"] = config_.linkLayer.timeoutMs;
    j["link_layer"]["workers"] = config_.linkLayer.workers;
    j["link_layer"]["rate_limit_ms"] = config_.linkLayer.rateLimitMs;
    j["link_layer"]["retry_count"] = config_.linkLayer.retryCount;
    j["link_layer"]["strict"] = config_.linkLayer.strict;
    j["link_layer"]["vendor_database"] = config_.linkLayer.vendorDatabase;

    // Echo
    j["echo"]["enabled"] = config_.echo.enabled;
    j["echo"]["timeout_ms"] = config_.echo.timeoutMs;
    j["echo"]["workers"] = config_.echo.workers;

    // Connection probe
    j["connection_probe"]["enabled"] = config_.connectionProbe.enabled;
    j["connection_probe"]["timeout_ms"] = config_.connectionProbe.timeoutMs;
    j["connection_probe"]["workers"] = config_.connectionProbe.workers;
    j["connection_probe"]["ports"] = config_.connectionProbe.ports;

    // Port scan
    j["port_scan"]["enabled"] = config_.portScan.enabled;
    j["port_scan"]["timeout_ms"] = config_.portScan.timeoutMs;
    j["port_scan"]["workers"] = config_.portScan.workers;
    j["port_scan"]["host_workers"] = config_.portScan.hostWorkers;
    j["port_scan"]["scan_tcp"] = config_.portScan.scanTcp;
    j["port_scan"]["scan_udp"] = config_.portScan.scanUdp;
    j["port_scan"]["banners"] = config_.portScan.banners;
    j["port_scan"]["tcp_ports"] = config_.portScan.tcpPorts;
    j["port_scan"]["udp_ports"] = config_.portScan.udpPorts;

    // Logging
    j["logging"]["level"] = config_.logging.level;
    j["logging"]["console"] = config_.logging.console;
    j["logging"]["file"] = config_.logging.file;

    // Output
    j["output"]["format"] = config_.output.format;
    j["output"]["file"] = config_.output.file;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    const AppConfig defaults;

    // Network
    if (j.contains("network")) {
        const auto& n = j["network"];
        config_.network.interfaceName = n.value("interface", defaults.network.interfaceName);
        config_.network.targets = n.value("targets", defaults.network.targets);
        config_.network.targetsFile = n.value("targets_file", defaults.network.targetsFile);
        config_.network.autoDetectLocal =
            n.value("auto_detect_local", defaults.network.autoDetectLocal);
    }

    // Link layer
    if (j.contains("link_layer")) {
        const auto& l = j["link_layer"];
        config_.linkLayer.enabled = l.value("enabled", defaults.linkLayer.enabled);
        config_.linkLayer.timeoutMs = l.value("timeout_ms", defaults.linkLayer.timeoutMs);
        config_.linkLayer.workers = l.value("workers", defaults.linkLayer.workers);
        config_.linkLayer.rateLimitMs = l.value("rate_limit_ms", defaults.linkLayer.rateLimitMs);
        config_.linkLayer.retryCount = l.value("retry_count", defaults.linkLayer.retryCount);
        config_.linkLayer.strict = l.value("strict", defaults.linkLayer.strict);
        config_.linkLayer.vendorDatabase =
            l.value("vendor_database", defaults.linkLayer.vendorDatabase);
    }

    // Echo
    if (j.contains("echo")) {
        const auto& e = j["echo"];
        config_.echo.enabled = e.value("enabled", defaults.echo.enabled);
        config_.echo.timeoutMs = e.value("timeout_ms", defaults.echo.timeoutMs);
        config_.echo.workers = e.value("workers", defaults.echo.workers);
    }

    // Connection probe
    if (j.contains("connection_probe")) {
        const auto& c = j["connection_probe"];
        config_.connectionProbe.enabled = c.value("enabled", defaults.connectionProbe.enabled);
        config_.connectionProbe.timeoutMs =
            c.value("timeout_ms", defaults.connectionProbe.timeoutMs);
        config_.connectionProbe.workers = c.value("workers", defaults.connectionProbe.workers);
        config_.connectionProbe.ports = c.value("ports", defaults.connectionProbe.ports);
    }

    // Port scan
    if (j.contains("port_scan")) {
        const auto& p = j["port_scan"];
        config_.portScan.enabled = p.value("enabled", defaults.portScan.enabled);
        config_.portScan.timeoutMs = p.value("timeout_ms", defaults.portScan.timeoutMs);
        config_.portScan.workers = p.value("workers", defaults.portScan.workers);
        config_.portScan.hostWorkers = p.value("host_workers", defaults.portScan.hostWorkers);
        config_.portScan.scanTcp = p.value("scan_tcp", defaults.portScan.scanTcp);
        config_.portScan.scanUdp = p.value("scan_udp", defaults.portScan.scanUdp);
        config_.portScan.banners = p.value("banners", defaults.portScan.banners);
        config_.portScan.tcpPorts = p.value("tcp_ports", defaults.portScan.tcpPorts);
        config_.portScan.udpPorts = p.value("udp_ports", defaults.portScan.udpPorts);
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config_.logging.level = l.value("level", defaults.logging.level);
        config_.logging.console = l.value("console", defaults.logging.console);
        config_.logging.file = l.value("file", defaults.logging.file);
    }

    // Output
    if (j.contains("output")) {
        const auto& o = j["output"];
        config_.output.format = o.value("format", defaults.output.format);
        config_.output.file = o.value("file", defaults.output.file);
    }
}

} // namespace netsweep::infra
