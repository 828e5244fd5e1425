#include "infrastructure/network/ConnectionProber.hpp"

#include "infrastructure/concurrency/BoundedRunner.hpp"

#include <spdlog/spdlog.h>

namespace netsweep::infra {

ConnectionProber::ConnectionProber(SocketProbe& probe, ConnectionProberOptions options)
    : probe_(probe), options_(std::move(options)) {}

bool ConnectionProber::probe(const asio::ip::address_v4& address) {
    for (uint16_t port : options_.ports) {
        auto result = probe_.connect(address, port, options_.timeout);
        if (result.outcome == ConnectOutcome::Connected) {
            spdlog::debug("{} accepted a connection on port {}", address.to_string(), port);
            return true;
        }
        spdlog::trace("{}:{} {}", address.to_string(), port,
                      SocketProbe::outcomeToString(result.outcome));
    }
    return false;
}

void ConnectionProber::probeMany(const std::vector<asio::ip::address_v4>& addresses,
                                 const core::FindingCallback& onFound) {
    spdlog::debug("Connection probing {} addresses on {} ports", addresses.size(),
                  options_.ports.size());

    BoundedRunner<asio::ip::address_v4> runner(options_.workers, "connect");
    runner.run(addresses, [this, &onFound](const asio::ip::address_v4& address) {
        if (probe(address) && onFound) {
            onFound(core::ProbeFinding::connection(address.to_string()));
        }
    });
}

} // namespace netsweep::infra
