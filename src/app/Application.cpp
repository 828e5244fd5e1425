#include "app/Application.hpp"

#include "core/types/DiscoveryError.hpp"
#include "infrastructure/config/TargetListReader.hpp"
#include "infrastructure/network/ConnectionProber.hpp"
#include "infrastructure/network/EchoProber.hpp"
#include "infrastructure/network/EchoTechniques.hpp"
#include "infrastructure/network/LinkLayerResolver.hpp"
#include "infrastructure/network/OuiVendorLookup.hpp"
#include "infrastructure/network/PortScanner.hpp"
#include "infrastructure/network/ReverseDnsResolver.hpp"
#include "infrastructure/output/ResultFormatter.hpp"

#include <QCommandLineParser>
#include <QStandardPaths>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iostream>

namespace netsweep::app {

namespace {

std::vector<std::string> toStdStrings(const QStringList& list) {
    std::vector<std::string> result;
    result.reserve(static_cast<size_t>(list.size()));
    for (const auto& item : list) {
        result.push_back(item.toStdString());
    }
    return result;
}

} // namespace

Application::Application(int& argc, char** argv) {
    qtApp_ = std::make_unique<QCoreApplication>(argc, argv);
    qtApp_->setApplicationName("netsweep");
    qtApp_->setApplicationVersion("1.0.0");
    qtApp_->setOrganizationName("netsweep");
}

Application::~Application() {
    // Probes still refer to the runtime; it drains before they go away
    if (probeRuntime_) {
        probeRuntime_->shutdown();
    }
}

bool Application::parseArguments() {
    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Discovers live hosts with ARP, ICMP and TCP probing and merges the results");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption({"c", "config"}, "Configuration file.", "file");
    QCommandLineOption targetOption({"t", "target"}, "Prefix or address to scan (repeatable).",
                                    "target");
    QCommandLineOption targetsFileOption("targets-file", "File with one target per line.", "file");
    QCommandLineOption interfaceOption({"i", "interface"}, "Scanning interface, or \"auto\".",
                                       "name");
    QCommandLineOption portsOption({"p", "ports"},
                                   "Scan ports of live hosts: list such as 22,80,8000-8010, or "
                                   "\"default\".",
                                   "ports");
    QCommandLineOption noLinkLayerOption("no-link-layer", "Disable ARP probing.");
    QCommandLineOption jsonOption("json", "Print results as JSON.");
    QCommandLineOption outputOption({"o", "output"}, "Write results to a file.", "file");
    QCommandLineOption verboseOption({"v", "verbose"}, "Enable debug logging.");

    parser.addOptions({configOption, targetOption, targetsFileOption, interfaceOption,
                       portsOption, noLinkLayerOption, jsonOption, outputOption, verboseOption});
    parser.addPositionalArgument("targets", "Additional prefixes or addresses.", "[targets...]");

    parser.process(*qtApp_);

    options_.configFile = parser.value(configOption).toStdString();
    options_.targets = toStdStrings(parser.values(targetOption));
    for (auto& target : toStdStrings(parser.positionalArguments())) {
        options_.targets.push_back(std::move(target));
    }
    options_.targetsFile = parser.value(targetsFileOption).toStdString();
    options_.interfaceName = parser.value(interfaceOption).toStdString();
    if (parser.isSet(portsOption)) {
        options_.ports = parser.value(portsOption).toStdString();
    }
    options_.noLinkLayer = parser.isSet(noLinkLayerOption);
    options_.json = parser.isSet(jsonOption);
    options_.outputFile = parser.value(outputOption).toStdString();
    options_.verbose = parser.isSet(verboseOption);

    if (options_.configFile.empty()) {
        auto configDir =
            QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation).toStdString();
        config_ = std::make_unique<infra::ConfigManager>(configDir);
    } else {
        std::filesystem::path path(options_.configFile);
        config_ = std::make_unique<infra::ConfigManager>(path.parent_path(),
                                                         path.filename().string());
    }

    if (!config_->load()) {
        return false;
    }

    try {
        options_.applyTo(config_->config());
    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        return false;
    }

    auto problems = config_->validate();
    for (const auto& problem : problems) {
        spdlog::error("Invalid option: {}", problem);
    }
    return problems.empty();
}

void Application::initializeLogging() {
    const auto& settings = config_->config().logging;
    auto level = spdlog::level::from_str(settings.level);

    std::vector<spdlog::sink_ptr> sinks;
    if (settings.console) {
        // Results go to stdout, so log lines stay on stderr
        auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        consoleSink->set_level(level);
        sinks.push_back(consoleSink);
    }
    if (!settings.file.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            settings.file, 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("netsweep", sinks.begin(), sinks.end());
    logger->set_level(settings.file.empty() ? level : std::min(level, spdlog::level::debug));
    spdlog::set_default_logger(logger);

    spdlog::info("netsweep {} starting", qtApp_->applicationVersion().toStdString());
    if (!settings.file.empty()) {
        spdlog::info("Log file: {}", settings.file);
    }
}

std::vector<std::string> Application::resolveTargets() const {
    const auto& network = config_->config().network;

    std::vector<std::string> targets = network.targets;
    if (!network.targetsFile.empty()) {
        auto fromFile = infra::TargetListReader::read(network.targetsFile);
        targets.insert(targets.end(), fromFile.begin(), fromFile.end());
    }

    if (targets.empty() && network.autoDetectLocal && interface_) {
        auto cidr = interface_->cidr();
        if (!cidr.empty()) {
            spdlog::info("No targets given, scanning {} on {}", cidr, interface_->name);
            targets.push_back(cidr);
        }
    }

    if (targets.empty()) {
        throw core::DiscoveryError(core::DiscoveryErrc::InvalidConfiguration,
                                   "No targets given and none could be detected");
    }
    return targets;
}

std::shared_ptr<core::ILinkLayerResolver> Application::createLinkLayerResolver() {
    const auto& settings = config_->config().linkLayer;
    if (!settings.enabled) {
        return nullptr;
    }

    if (!interface_) {
        if (settings.strict) {
            throw core::DiscoveryError(core::DiscoveryErrc::InvalidConfiguration,
                                       "Link-layer probing needs a scanning interface");
        }
        spdlog::warn("No scanning interface, link-layer probing disabled");
        return nullptr;
    }

    auto vendors = std::make_shared<infra::OuiVendorLookup>();
    if (!settings.vendorDatabase.empty()) {
        vendors->loadFromFile(settings.vendorDatabase);
    }

    infra::LinkLayerResolverOptions options;
    options.interfaceName = interface_->name;
    options.timeout = std::chrono::milliseconds(settings.timeoutMs);
    options.workers = static_cast<size_t>(settings.workers);
    options.rateLimit = std::chrono::milliseconds(settings.rateLimitMs);
    options.retryCount = settings.retryCount;

    try {
        return std::make_shared<infra::LinkLayerResolver>(options, vendors);
    } catch (const core::DiscoveryError& e) {
        if (settings.strict) {
            throw;
        }
        spdlog::warn("Link-layer probing disabled: {}", e.what());
        return nullptr;
    }
}

// Echo and connection probing overlap; enrichment runs after them
size_t Application::peakConcurrentProbes() const {
    const auto& config = config_->config();
    size_t probing = 0;
    if (config.echo.enabled) {
        probing += static_cast<size_t>(config.echo.workers);
    }
    if (config.connectionProbe.enabled) {
        probing += static_cast<size_t>(config.connectionProbe.workers);
    }
    size_t enriching = 0;
    if (config.portScan.enabled) {
        enriching = static_cast<size_t>(config.portScan.hostWorkers) *
                    static_cast<size_t>(config.portScan.workers);
    }
    return std::max(probing, enriching);
}

std::unique_ptr<infra::DiscoveryOrchestrator> Application::createOrchestrator() {
    const auto& config = config_->config();

    infra::DiscoveryServices services;
    services.linkLayer = createLinkLayerResolver();

    if (config.echo.enabled) {
        infra::EchoProberOptions options;
        options.timeout = std::chrono::milliseconds(config.echo.timeoutMs);
        options.workers = static_cast<size_t>(config.echo.workers);
        services.echo = std::make_shared<infra::EchoProber>(
            infra::makeEchoTechnique(*socketProbe_), options);
    }

    if (config.connectionProbe.enabled) {
        infra::ConnectionProberOptions options;
        options.timeout = std::chrono::milliseconds(config.connectionProbe.timeoutMs);
        options.workers = static_cast<size_t>(config.connectionProbe.workers);
        options.ports = infra::ConfigManager::toPortList(config.connectionProbe.ports);
        services.connection = std::make_shared<infra::ConnectionProber>(*socketProbe_, options);
    }

    if (config.portScan.enabled) {
        auto scanConfig = core::PortScanConfig::defaults();
        scanConfig.timeout = std::chrono::milliseconds(config.portScan.timeoutMs);
        scanConfig.maxConcurrency = config.portScan.workers;
        scanConfig.scanTcp = config.portScan.scanTcp;
        scanConfig.scanUdp = config.portScan.scanUdp;
        scanConfig.captureBanners = config.portScan.banners;
        if (!config.portScan.tcpPorts.empty()) {
            scanConfig.tcpPorts = infra::ConfigManager::toPortList(config.portScan.tcpPorts);
        }
        if (!config.portScan.udpPorts.empty()) {
            scanConfig.udpPorts = infra::ConfigManager::toPortList(config.portScan.udpPorts);
        }
        services.portScanner = std::make_shared<infra::PortScanner>(*socketProbe_, scanConfig);
        services.nameResolver = std::make_shared<infra::ReverseDnsResolver>(*probeRuntime_);
    }

    infra::DiscoveryOptions options;
    options.strictLinkLayer = config.linkLayer.strict;
    options.hostWorkers = static_cast<size_t>(config.portScan.hostWorkers);

    std::optional<asio::ip::network_v4> localNetwork;
    if (interface_) {
        localNetwork = interface_->network();
    }

    auto orchestrator =
        std::make_unique<infra::DiscoveryOrchestrator>(std::move(services), options, localNetwork);
    orchestrator->setRecordCallback([](const core::HostRecord& record) {
        spdlog::debug("{} seen via {}", record.address, record.methodsToString());
    });
    return orchestrator;
}

bool Application::writeResults(const std::vector<core::HostRecord>& records) const {
    const auto& output = config_->config().output;

    if (!output.file.empty()) {
        if (output.format == "json") {
            return infra::ResultFormatter::writeJson(output.file, records);
        }
        std::ofstream file(output.file);
        if (!file) {
            spdlog::error("Failed to open output file: {}", output.file);
            return false;
        }
        file << infra::ResultFormatter::formatText(records);
        return static_cast<bool>(file);
    }

    if (output.format == "json") {
        std::cout << infra::ResultFormatter::toJson(records).dump(2) << std::endl;
    } else {
        std::cout << infra::ResultFormatter::formatText(records) << std::flush;
    }
    return true;
}

int Application::run() {
    if (!parseArguments()) {
        return 1;
    }
    initializeLogging();

    try {
        const auto& network = config_->config().network;
        if (network.interfaceName == "auto") {
            interface_ = core::NetworkInterfaceEnumerator::detectPrimary();
            if (interface_) {
                spdlog::info("Using interface {} ({})", interface_->name, interface_->cidr());
            } else {
                spdlog::warn("No usable network interface detected");
            }
        } else {
            interface_ = core::NetworkInterfaceEnumerator::findByName(network.interfaceName);
            if (!interface_) {
                throw core::DiscoveryError(core::DiscoveryErrc::InvalidConfiguration,
                                           "Interface not found: " + network.interfaceName);
            }
        }

        auto targets = resolveTargets();

        probeRuntime_ = std::make_unique<infra::ProbeRuntime>(
            infra::ProbeRuntime::threadsFor(peakConcurrentProbes()));
        socketProbe_ = std::make_unique<infra::SocketProbe>(*probeRuntime_);

        auto orchestrator = createOrchestrator();
        auto records = orchestrator->discover(targets, config_->config().portScan.enabled);

        return writeResults(records) ? 0 : 1;
    } catch (const core::DiscoveryError& e) {
        spdlog::error("Discovery failed ({}): {}", core::DiscoveryError::codeToString(e.code()),
                      e.what());
        return 1;
    }
}

} // namespace netsweep::app
