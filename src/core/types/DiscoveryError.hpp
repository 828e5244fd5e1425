/**
 * @file DiscoveryError.hpp
 * @brief Error type raised by the discovery engine for hard failures.
 *
 * Only configuration, target parsing and resource acquisition problems are
 * reported through this type. Per-address probe failures never are.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace netsweep::core {

/**
 * @brief Category of a discovery failure.
 */
enum class DiscoveryErrc : int {
    InvalidTarget = 1,        ///< A prefix or address could not be parsed
    InvalidConfiguration = 2, ///< A required setting is missing or out of range
    ResourceUnavailable = 3   ///< A socket or interface could not be acquired
};

/**
 * @brief Exception carrying a DiscoveryErrc alongside the message.
 */
class DiscoveryError : public std::runtime_error {
public:
    DiscoveryError(DiscoveryErrc code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] DiscoveryErrc code() const noexcept { return code_; }

    /**
     * @brief Converts an error code to a short string.
     * @param code The code to convert.
     * @return Name such as "InvalidTarget".
     */
    static std::string codeToString(DiscoveryErrc code) {
        switch (code) {
        case DiscoveryErrc::InvalidTarget:
            return "InvalidTarget";
        case DiscoveryErrc::InvalidConfiguration:
            return "InvalidConfiguration";
        case DiscoveryErrc::ResourceUnavailable:
            return "ResourceUnavailable";
        }
        return "Unknown";
    }

private:
    DiscoveryErrc code_;
};

} // namespace netsweep::core
