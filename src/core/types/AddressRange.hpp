/**
 * @file AddressRange.hpp
 * @brief IPv4 prefix expansion and address ordering helpers.
 *
 * Every probing component works on the ordered address sequences produced
 * here, so this is the single place that knows how a CIDR prefix maps to
 * usable host addresses.
 */

#pragma once

#include <asio.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace netsweep::core {

/**
 * @brief Expands CIDR prefixes and single addresses into host address lists.
 *
 * All functions are pure and safe to call concurrently.
 */
class AddressRange {
public:
    /**
     * @brief Expands a CIDR prefix into its usable host addresses.
     *
     * Network and broadcast addresses are removed when the prefix holds more
     * than two addresses. A /31 yields both addresses and a /32 yields one.
     * Host bits set in the prefix address are ignored.
     *
     * @param prefix Prefix in "a.b.c.d/len" form.
     * @return Ascending list of host addresses.
     * @throws DiscoveryError with InvalidTarget if the prefix cannot be parsed.
     */
    static std::vector<asio::ip::address_v4> expand(const std::string& prefix);

    /**
     * @brief Same as expand() but returns dotted-quad strings.
     */
    static std::vector<std::string> expandToStrings(const std::string& prefix);

    /**
     * @brief Parses a target that is either a prefix or a single address.
     * @param target "a.b.c.d/len" or "a.b.c.d" (surrounding whitespace allowed).
     * @return The expanded addresses; a single address yields itself.
     * @throws DiscoveryError with InvalidTarget for anything else.
     */
    static std::vector<asio::ip::address_v4> parseTarget(const std::string& target);

    /**
     * @brief Parses a prefix without expanding it.
     * @throws DiscoveryError with InvalidTarget if the prefix cannot be parsed.
     */
    static asio::ip::network_v4 parseNetwork(const std::string& prefix);

    /**
     * @brief Parses a single dotted-quad address.
     * @throws DiscoveryError with InvalidTarget if the address cannot be parsed.
     */
    static asio::ip::address_v4 parseAddress(const std::string& address);

    /**
     * @brief Numeric value of a dotted-quad address, 0 if it does not parse.
     */
    static uint32_t toUint(const std::string& address);

    /**
     * @brief Orders two dotted-quad addresses by numeric value.
     * @return True if @p lhs sorts before @p rhs.
     */
    static bool lessByValue(const std::string& lhs, const std::string& rhs);

    /**
     * @brief Number of addresses expand() would return for a prefix length.
     */
    static uint64_t usableHostCount(unsigned short prefixLength);
};

} // namespace netsweep::core
