#pragma once

#include "infrastructure/config/ConfigManager.hpp"

#include <optional>
#include <string>
#include <vector>

namespace netsweep::app {

/**
 * @brief Settings given on the command line, applied on top of the config file.
 */
struct CommandLineOptions {
    std::string configFile;                 ///< Empty: default location.
    std::vector<std::string> targets;       ///< From --target and positional arguments.
    std::string targetsFile;
    std::string interfaceName;
    std::optional<std::string> ports;       ///< --ports; enables port scanning.
    bool noLinkLayer{false};
    bool json{false};
    std::string outputFile;
    bool verbose{false};

    /**
     * @brief Overrides configuration values with the ones given here.
     * @throws std::invalid_argument if the port list cannot be parsed.
     */
    void applyTo(infra::AppConfig& config) const;

    /**
     * @brief Parses "22,80,8000-8010" into individual ports.
     *
     * "default" yields an empty list, meaning the built-in candidates.
     *
     * @throws std::invalid_argument for malformed entries or ports outside 1-65535.
     */
    static std::vector<int> parsePortList(const std::string& text);
};

} // namespace netsweep::app
