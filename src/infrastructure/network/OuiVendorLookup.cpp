#include "infrastructure/network/OuiVendorLookup.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <sstream>

namespace netsweep::infra {

std::string OuiVendorLookup::normalizePrefix(const std::string& text) {
    std::string digits;
    for (char c : text) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            digits += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            if (digits.size() == 6) {
                return digits;
            }
        } else if (c != ':' && c != '-' && c != '.') {
            break;
        }
    }
    return {};
}

bool OuiVendorLookup::add(const std::string& prefix, const std::string& vendor) {
    auto key = normalizePrefix(prefix);
    if (key.empty() || vendor.empty()) {
        return false;
    }
    vendors_[key] = vendor;
    return true;
}

size_t OuiVendorLookup::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::warn("Cannot open vendor database: {}", path.string());
        return 0;
    }

    size_t loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        auto start = line.find_first_not_of(" \t");
        if (start == std::string::npos || line[start] == '#') {
            continue;
        }

        std::istringstream fields(line.substr(start));
        std::string prefix;
        fields >> prefix;

        std::string vendor;
        std::getline(fields >> std::ws, vendor);
        while (!vendor.empty() && std::isspace(static_cast<unsigned char>(vendor.back()))) {
            vendor.pop_back();
        }

        if (add(prefix, vendor)) {
            ++loaded;
        } else {
            spdlog::debug("Skipping vendor line: {}", line);
        }
    }

    spdlog::info("Loaded {} vendor prefixes from {}", loaded, path.string());
    return loaded;
}

std::string OuiVendorLookup::lookup(const std::string& hardwareAddress) const {
    auto key = normalizePrefix(hardwareAddress);
    if (key.empty()) {
        return {};
    }
    auto it = vendors_.find(key);
    return it != vendors_.end() ? it->second : std::string();
}

} // namespace netsweep::infra
