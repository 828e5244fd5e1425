/**
 * @file IVendorLookup.hpp
 * @brief Pluggable hardware-vendor lookup used by link-layer resolution.
 */

#pragma once

#include <string>

namespace netsweep::core {

/**
 * @brief Maps a hardware address to the vendor owning its OUI prefix.
 *
 * Lookups are best-effort enrichment: an unknown prefix yields an empty
 * string and never an error. Implementations must be safe to call from
 * several threads at once.
 */
class IVendorLookup {
public:
    virtual ~IVendorLookup() = default;

    /**
     * @brief Looks up the vendor of a hardware address.
     * @param hardwareAddress MAC address, e.g. "00:1a:2b:3c:4d:5e".
     * @return Vendor name, or an empty string if unknown.
     */
    virtual std::string lookup(const std::string& hardwareAddress) const = 0;
};

/**
 * @brief Default lookup that knows no vendors.
 */
class NullVendorLookup : public IVendorLookup {
public:
    std::string lookup(const std::string& /*hardwareAddress*/) const override { return {}; }
};

} // namespace netsweep::core
