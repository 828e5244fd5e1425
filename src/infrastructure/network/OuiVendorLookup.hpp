#pragma once

#include "core/services/IVendorLookup.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>

namespace netsweep::infra {

/**
 * @brief Vendor lookup backed by an OUI table loaded from a text file.
 *
 * Each line holds a prefix and a vendor name separated by whitespace, e.g.
 * "00:1A:2B Example Corp". The prefix may use ':' or '-' separators or be six
 * bare hex digits. Blank lines and lines starting with '#' are skipped.
 *
 * Load the table before sharing the instance; lookups are read-only.
 */
class OuiVendorLookup : public core::IVendorLookup {
public:
    OuiVendorLookup() = default;

    /**
     * @brief Loads entries from a file, adding to any already present.
     * @return Number of entries read, or 0 if the file could not be opened.
     */
    size_t loadFromFile(const std::filesystem::path& path);

    /**
     * @brief Adds one entry.
     * @return False if @p prefix is not a valid 24-bit prefix.
     */
    bool add(const std::string& prefix, const std::string& vendor);

    std::string lookup(const std::string& hardwareAddress) const override;

    [[nodiscard]] size_t size() const { return vendors_.size(); }

    /**
     * @brief Reduces a MAC address or prefix to its first six hex digits, uppercased.
     * @return The normalised prefix, or an empty string if fewer than six digits are present.
     */
    static std::string normalizePrefix(const std::string& text);

private:
    std::unordered_map<std::string, std::string> vendors_;
};

} // namespace netsweep::infra
