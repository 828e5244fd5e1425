#include "core/types/AddressRange.hpp"

#include "core/types/DiscoveryError.hpp"

#include <algorithm>
#include <cctype>

namespace netsweep::core {

namespace {

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c) != 0; })
                   .base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

asio::ip::network_v4 AddressRange::parseNetwork(const std::string& prefix) {
    asio::error_code ec;
    auto network = asio::ip::make_network_v4(trim(prefix), ec);
    if (ec) {
        throw DiscoveryError(DiscoveryErrc::InvalidTarget, "Invalid network prefix: " + prefix);
    }
    return network;
}

asio::ip::address_v4 AddressRange::parseAddress(const std::string& address) {
    asio::error_code ec;
    auto parsed = asio::ip::make_address_v4(trim(address), ec);
    if (ec) {
        throw DiscoveryError(DiscoveryErrc::InvalidTarget, "Invalid IPv4 address: " + address);
    }
    return parsed;
}

std::vector<asio::ip::address_v4> AddressRange::expand(const std::string& prefix) {
    auto network = parseNetwork(prefix);

    const uint32_t first = network.network().to_uint();
    const uint32_t last = network.broadcast().to_uint();
    const uint64_t total = static_cast<uint64_t>(last) - first + 1;

    std::vector<asio::ip::address_v4> addresses;
    addresses.reserve(static_cast<size_t>(total > 2 ? total - 2 : total));

    // The first address is the network address and the last is the broadcast
    uint64_t begin = first;
    uint64_t end = last;
    if (total > 2) {
        ++begin;
        --end;
    }

    for (uint64_t value = begin; value <= end; ++value) {
        addresses.emplace_back(static_cast<uint32_t>(value));
    }

    return addresses;
}

std::vector<std::string> AddressRange::expandToStrings(const std::string& prefix) {
    auto addresses = expand(prefix);

    std::vector<std::string> result;
    result.reserve(addresses.size());
    for (const auto& address : addresses) {
        result.push_back(address.to_string());
    }
    return result;
}

std::vector<asio::ip::address_v4> AddressRange::parseTarget(const std::string& target) {
    auto trimmed = trim(target);
    if (trimmed.find('/') != std::string::npos) {
        return expand(trimmed);
    }
    return {parseAddress(trimmed)};
}

uint32_t AddressRange::toUint(const std::string& address) {
    asio::error_code ec;
    auto parsed = asio::ip::make_address_v4(address, ec);
    return ec ? 0 : parsed.to_uint();
}

bool AddressRange::lessByValue(const std::string& lhs, const std::string& rhs) {
    return toUint(lhs) < toUint(rhs);
}

uint64_t AddressRange::usableHostCount(unsigned short prefixLength) {
    if (prefixLength > 32) {
        return 0;
    }
    uint64_t total = uint64_t{1} << (32 - prefixLength);
    return total > 2 ? total - 2 : total;
}

} // namespace netsweep::core
