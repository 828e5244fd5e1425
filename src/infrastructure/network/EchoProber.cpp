#include "infrastructure/network/EchoProber.hpp"

#include "infrastructure/concurrency/BoundedRunner.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace netsweep::infra {

EchoProber::EchoProber(std::shared_ptr<core::IEchoTechnique> technique, EchoProberOptions options)
    : technique_(std::move(technique)), options_(options) {
    if (!technique_) {
        throw std::invalid_argument("EchoProber requires an echo technique");
    }
}

std::optional<std::chrono::microseconds>
EchoProber::probe(const asio::ip::address_v4& address) {
    return technique_->echo(address, options_.timeout);
}

void EchoProber::probeMany(const std::vector<asio::ip::address_v4>& addresses,
                           const core::FindingCallback& onFound) {
    spdlog::debug("Echo probing {} addresses via {}", addresses.size(), technique_->name());

    BoundedRunner<asio::ip::address_v4> runner(options_.workers, "echo");
    runner.run(addresses, [this, &onFound](const asio::ip::address_v4& address) {
        auto rtt = probe(address);
        if (rtt && onFound) {
            onFound(core::ProbeFinding::echo(address.to_string(), *rtt));
        }
    });
}

} // namespace netsweep::infra
