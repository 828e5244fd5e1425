#include "infrastructure/network/ReverseDnsResolver.hpp"

#include <spdlog/spdlog.h>

namespace netsweep::infra {

ReverseDnsResolver::ReverseDnsResolver(ProbeRuntime& runtime) : runtime_(runtime) {}

std::string ReverseDnsResolver::trimTrailingDot(std::string name) {
    if (!name.empty() && name.back() == '.') {
        name.pop_back();
    }
    return name;
}

std::optional<std::string> ReverseDnsResolver::reverseLookup(const std::string& address) {
    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
        spdlog::debug("Reverse lookup skipped, invalid address: {}", address);
        return std::nullopt;
    }

    asio::ip::tcp::resolver resolver(runtime_.ioContext());
    auto results = resolver.resolve(asio::ip::tcp::endpoint(ip, 0), ec);
    if (ec || results.empty()) {
        spdlog::debug("Reverse lookup for {} failed: {}", address, ec.message());
        return std::nullopt;
    }

    auto name = trimTrailingDot(results.begin()->host_name());
    // getnameinfo falls back to the numeric form when no PTR record exists
    if (name.empty() || name == address) {
        return std::nullopt;
    }
    return name;
}

} // namespace netsweep::infra
