#pragma once

#include "core/services/IConnectionProber.hpp"
#include "infrastructure/network/SocketProbe.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

namespace netsweep::infra {

struct ConnectionProberOptions {
    std::chrono::milliseconds timeout{2000};
    size_t workers{100};
    std::vector<uint16_t> ports{22, 23, 25, 53, 80, 135, 139, 443, 445, 993, 995, 3389, 5900};
};

/**
 * @brief Liveness by full TCP connect against a priority-ordered port list.
 *
 * Refusals and timeouts are normal outcomes, not errors; the first accepted
 * connection ends the probe of that address.
 */
class ConnectionProber : public core::IConnectionProber {
public:
    ConnectionProber(SocketProbe& probe, ConnectionProberOptions options = {});

    bool probe(const asio::ip::address_v4& address) override;

    void probeMany(const std::vector<asio::ip::address_v4>& addresses,
                   const core::FindingCallback& onFound) override;

    [[nodiscard]] const ConnectionProberOptions& options() const { return options_; }

private:
    SocketProbe& probe_;
    ConnectionProberOptions options_;
};

} // namespace netsweep::infra
