#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace netsweep::infra {

/**
 * @brief Where to scan and through which interface.
 */
struct NetworkSettings {
    std::string interfaceName{"auto"};  ///< Interface name, or "auto" to detect the busiest one.
    std::vector<std::string> targets;   ///< Prefixes or single addresses.
    std::string targetsFile;            ///< Optional file with one target per line.
    bool autoDetectLocal{true};         ///< Scan the interface's own prefix when no target is set.
};

struct LinkLayerSettings {
    bool enabled{true};
    int timeoutMs{2000};
    int workers{10};
    int rateLimitMs{0};       ///< Delay before each request, per worker.
    int retryCount{2};        ///< Extra attempts per address.
    bool strict{false};       ///< Abort the scan when the link-layer path fails.
    std::string vendorDatabase; ///< Optional OUI table for vendor names.
};

struct EchoSettings {
    bool enabled{true};
    int timeoutMs{3000};
    int workers{20};
};

struct ConnectionProbeSettings {
    bool enabled{true};
    int timeoutMs{2000};
    int workers{100};
    std::vector<int> ports{22, 23, 25, 53, 80, 135, 139, 443, 445, 993, 995, 3389, 5900};
};

/**
 * @brief Enrichment of live hosts with open ports and services.
 *
 * Empty port lists mean the built-in candidate lists.
 */
struct PortScanSettings {
    bool enabled{false};
    int timeoutMs{2000};
    int workers{50};
    int hostWorkers{8};
    bool scanTcp{true};
    bool scanUdp{true};
    bool banners{true};
    std::vector<int> tcpPorts;
    std::vector<int> udpPorts;
};

struct LoggingSettings {
    std::string level{"info"}; ///< trace, debug, info, warn, error, critical or off.
    bool console{true};
    std::string file;          ///< Rotating log file, disabled when empty.
};

struct OutputSettings {
    std::string format{"text"}; ///< "text" or "json".
    std::string file;           ///< Write results here instead of stdout.
};

/**
 * @brief Complete scanner configuration.
 */
struct AppConfig {
    NetworkSettings network;
    LinkLayerSettings linkLayer;
    EchoSettings echo;
    ConnectionProbeSettings connectionProbe;
    PortScanSettings portScan;
    LoggingSettings logging;
    OutputSettings output;
};

/**
 * @brief Manages scanner configuration persistence.
 *
 * Handles loading and saving of the configuration as a JSON file. Missing
 * keys keep their defaults, so a partial file is valid.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory; created if missing.
     * @param fileName Name of the configuration file inside @p configDir.
     */
    explicit ConfigManager(const std::filesystem::path& configDir,
                           const std::string& fileName = "config.json");

    /**
     * @brief Loads and validates configuration from disk.
     *
     * A missing file is replaced by one holding the defaults.
     *
     * @return True if loaded and valid, false otherwise. Problems are logged.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    /**
     * @brief Checks every setting and describes each problem found.
     * @return Human readable problems; empty when the configuration is valid.
     */
    [[nodiscard]] std::vector<std::string> validate() const;

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }
    std::string configDir() const { return configDir_.string(); }

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    /**
     * @brief Converts validated port numbers to their wire type.
     */
    static std::vector<uint16_t> toPortList(const std::vector<int>& ports);

private:
    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace netsweep::infra
