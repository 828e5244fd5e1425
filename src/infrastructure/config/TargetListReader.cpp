#include "infrastructure/config/TargetListReader.hpp"

#include "core/types/AddressRange.hpp"
#include "core/types/DiscoveryError.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace netsweep::infra {

using core::DiscoveryErrc;
using core::DiscoveryError;

std::vector<std::string> TargetListReader::parse(const std::string& text) {
    std::vector<std::string> targets;
    std::istringstream stream(text);
    std::string line;
    size_t lineNumber = 0;

    while (std::getline(stream, line)) {
        ++lineNumber;
        auto start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') {
            continue;
        }
        auto end = line.find_last_not_of(" \t\r");
        auto target = line.substr(start, end - start + 1);

        try {
            core::AddressRange::parseTarget(target);
        } catch (const DiscoveryError& e) {
            throw DiscoveryError(DiscoveryErrc::InvalidTarget,
                                 "Line " + std::to_string(lineNumber) + ": " + e.what());
        }
        targets.push_back(std::move(target));
    }

    return targets;
}

std::vector<std::string> TargetListReader::read(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw DiscoveryError(DiscoveryErrc::InvalidConfiguration,
                             "Cannot open targets file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto targets = parse(buffer.str());
    spdlog::info("Read {} targets from {}", targets.size(), path.string());
    return targets;
}

} // namespace netsweep::infra
