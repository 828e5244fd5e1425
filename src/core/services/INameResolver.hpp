/**
 * @file INameResolver.hpp
 * @brief Interface for reverse name resolution of discovered hosts.
 */

#pragma once

#include <optional>
#include <string>

namespace netsweep::core {

/**
 * @brief Resolves an address back to a host name.
 */
class INameResolver {
public:
    virtual ~INameResolver() = default;

    /**
     * @brief Performs a reverse lookup.
     * @param address Dotted-quad address.
     * @return Host name without a trailing dot, or std::nullopt on failure.
     */
    virtual std::optional<std::string> reverseLookup(const std::string& address) = 0;
};

} // namespace netsweep::core
