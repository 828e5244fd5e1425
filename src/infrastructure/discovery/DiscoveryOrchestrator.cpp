#include "infrastructure/discovery/DiscoveryOrchestrator.hpp"

#include "core/types/AddressRange.hpp"
#include "core/types/DiscoveryError.hpp"
#include "infrastructure/concurrency/BoundedRunner.hpp"
#include "infrastructure/concurrency/FindingChannel.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <map>
#include <numeric>
#include <thread>
#include <unordered_map>

namespace netsweep::infra {

using core::DiscoveryErrc;
using core::DiscoveryError;

namespace {

struct Producer {
    core::DiscoveryMethod method;
    std::function<void(const core::FindingCallback&)> run;
};

} // namespace

std::string phaseToString(DiscoveryPhase phase) {
    switch (phase) {
    case DiscoveryPhase::Idle:
        return "idle";
    case DiscoveryPhase::Expanding:
        return "expanding";
    case DiscoveryPhase::Probing:
        return "probing";
    case DiscoveryPhase::Merging:
        return "merging";
    case DiscoveryPhase::Enriching:
        return "enriching";
    case DiscoveryPhase::Done:
        return "done";
    }
    return "unknown";
}

DiscoveryOrchestrator::DiscoveryOrchestrator(DiscoveryServices services, DiscoveryOptions options,
                                             std::optional<asio::ip::network_v4> localNetwork)
    : services_(std::move(services)), options_(options), localNetwork_(localNetwork) {
    if (!services_.linkLayer && !services_.echo && !services_.connection) {
        throw DiscoveryError(DiscoveryErrc::InvalidConfiguration,
                             "At least one discovery method must be enabled");
    }
}

std::vector<asio::ip::address_v4> DiscoveryOrchestrator::expand(const std::string& prefix) {
    return core::AddressRange::expand(prefix);
}

core::DiscoveryStrategy
DiscoveryOrchestrator::classify(const asio::ip::address_v4& first,
                                const std::optional<asio::ip::network_v4>& localNetwork,
                                bool linkLayerAvailable) {
    if (!localNetwork || !linkLayerAvailable) {
        return core::DiscoveryStrategy::Remote;
    }
    const uint32_t mask = localNetwork->netmask().to_uint();
    const bool inside = (first.to_uint() & mask) == localNetwork->network().to_uint();
    return inside ? core::DiscoveryStrategy::Local : core::DiscoveryStrategy::Remote;
}

void DiscoveryOrchestrator::setPhase(DiscoveryPhase phase) {
    phase_ = phase;
    spdlog::debug("Discovery phase: {}", phaseToString(phase));
    if (phaseCallback_) {
        phaseCallback_(phase);
    }
}

std::vector<TargetGroup>
DiscoveryOrchestrator::buildGroups(const std::vector<std::string>& targets) const {
    const bool linkLayerAvailable = services_.linkLayer != nullptr;

    std::vector<TargetGroup> groups;
    groups.reserve(targets.size());
    for (const auto& target : targets) {
        TargetGroup group;
        group.target = target;
        group.addresses = core::AddressRange::parseTarget(target);
        if (group.addresses.empty()) {
            continue;
        }

        group.strategy = classify(group.addresses.front(), localNetwork_, linkLayerAvailable);
        if (!linkLayerAvailable && classify(group.addresses.front(), localNetwork_, true) ==
                                       core::DiscoveryStrategy::Local) {
            spdlog::warn("{} is on the local segment but no link-layer resolver is available; "
                         "probing it as remote",
                         target);
        }

        spdlog::info("Target {}: {} addresses, {} strategy", target, group.addresses.size(),
                     core::strategyToString(group.strategy));
        groups.push_back(std::move(group));
    }
    return groups;
}

std::vector<core::HostRecord> DiscoveryOrchestrator::discover(const std::string& target,
                                                              bool enablePortScan) {
    return discover(std::vector<std::string>{target}, enablePortScan);
}

std::vector<core::HostRecord>
DiscoveryOrchestrator::discover(const std::vector<std::string>& targets, bool enablePortScan) {
    setPhase(DiscoveryPhase::Idle);

    if (enablePortScan && !services_.portScanner) {
        throw DiscoveryError(DiscoveryErrc::InvalidConfiguration,
                             "Port scanning requested without a port scanner");
    }

    // Every target is parsed before anything is sent
    setPhase(DiscoveryPhase::Expanding);
    auto groups = buildGroups(targets);

    // An address listed by several targets is probed once and belongs to
    // the first group that named it
    std::unordered_map<uint32_t, size_t> groupOf;
    std::vector<asio::ip::address_v4> allAddresses;
    std::vector<asio::ip::address_v4> localAddresses;
    for (size_t i = 0; i < groups.size(); ++i) {
        for (const auto& address : groups[i].addresses) {
            if (!groupOf.emplace(address.to_uint(), i).second) {
                continue;
            }
            allAddresses.push_back(address);
            if (groups[i].strategy == core::DiscoveryStrategy::Local) {
                localAddresses.push_back(address);
            }
        }
    }

    setPhase(DiscoveryPhase::Probing);

    std::vector<Producer> producers;
    if (services_.linkLayer && !localAddresses.empty()) {
        producers.push_back({core::DiscoveryMethod::LinkLayer,
                             [this, &localAddresses](const core::FindingCallback& sink) {
                                 services_.linkLayer->resolveMany(localAddresses, sink);
                             }});
    }
    if (services_.echo && !allAddresses.empty()) {
        producers.push_back({core::DiscoveryMethod::Echo,
                             [this, &allAddresses](const core::FindingCallback& sink) {
                                 services_.echo->probeMany(allAddresses, sink);
                             }});
    }
    if (services_.connection && !allAddresses.empty()) {
        producers.push_back({core::DiscoveryMethod::Connection,
                             [this, &allAddresses](const core::FindingCallback& sink) {
                                 services_.connection->probeMany(allAddresses, sink);
                             }});
    }

    spdlog::info("Probing {} addresses with {} methods", allAddresses.size(), producers.size());

    FindingChannel channel(producers.size());
    std::vector<std::exception_ptr> errors(producers.size());

    // Keyed by numeric address, so iteration yields the final order
    std::map<uint32_t, core::HostRecord> records;
    {
        std::vector<std::jthread> threads;
        threads.reserve(producers.size());
        for (size_t i = 0; i < producers.size(); ++i) {
            threads.emplace_back([&producers, &channel, &errors, i]() {
                try {
                    producers[i].run(
                        [&channel](const core::ProbeFinding& finding) { channel.push(finding); });
                } catch (...) {
                    // Handled on the consumer thread once the channel closes
                    errors[i] = std::current_exception();
                }
                channel.producerDone();
            });
        }

        while (auto finding = channel.pop()) {
            const uint32_t key = core::AddressRange::toUint(finding->address);
            auto group = groupOf.find(key);
            if (group == groupOf.end()) {
                spdlog::debug("Ignoring finding for untargeted address {}", finding->address);
                continue;
            }

            auto it = records.find(key);
            if (it == records.end()) {
                auto record = core::HostRecord::fromFinding(*finding);
                record.strategy = groups[group->second].strategy;
                record.networkSegment = groups[group->second].target;
                it = records.emplace(key, std::move(record)).first;
            } else {
                it->second.merge(*finding);
            }

            if (recordCallback_) {
                recordCallback_(it->second);
            }
        }
    }

    for (size_t i = 0; i < producers.size(); ++i) {
        if (!errors[i]) {
            continue;
        }
        if (producers[i].method != core::DiscoveryMethod::LinkLayer) {
            std::rethrow_exception(errors[i]);
        }
        try {
            std::rethrow_exception(errors[i]);
        } catch (const std::exception& e) {
            if (options_.strictLinkLayer) {
                throw DiscoveryError(DiscoveryErrc::ResourceUnavailable,
                                     std::string("Link-layer probing failed: ") + e.what());
            }
            spdlog::warn("Link-layer probing failed, continuing with echo and connection "
                         "results: {}",
                         e.what());
        }
    }

    setPhase(DiscoveryPhase::Merging);

    std::vector<core::HostRecord> result;
    result.reserve(records.size());
    for (auto& [key, record] : records) {
        if (record.isLive()) {
            result.push_back(std::move(record));
        }
    }

    if (enablePortScan && !result.empty()) {
        setPhase(DiscoveryPhase::Enriching);
        enrich(result);
    }

    auto countBy = [&result](bool core::HostRecord::*flag) {
        return std::count_if(result.begin(), result.end(),
                             [flag](const core::HostRecord& record) { return record.*flag; });
    };
    spdlog::info("Discovery complete: {} live hosts (arp {}, icmp {}, tcp {})", result.size(),
                 countBy(&core::HostRecord::foundByLinkLayer),
                 countBy(&core::HostRecord::foundByEcho),
                 countBy(&core::HostRecord::foundByConnection));

    setPhase(DiscoveryPhase::Done);
    return result;
}

void DiscoveryOrchestrator::enrich(std::vector<core::HostRecord>& records) {
    std::vector<size_t> indices(records.size());
    std::iota(indices.begin(), indices.end(), size_t{0});

    BoundedRunner<size_t> runner(options_.hostWorkers, "enrich");
    runner.run(indices, [this, &records](const size_t& index) {
        auto& record = records[index];

        if (services_.nameResolver) {
            try {
                record.hostname = services_.nameResolver->reverseLookup(record.address);
            } catch (const std::exception& e) {
                spdlog::warn("Name resolution failed for {}: {}", record.address, e.what());
            }
        }

        try {
            auto ports = services_.portScanner->scanHost(record.address);
            ports.erase(std::remove_if(ports.begin(), ports.end(),
                                       [](const core::PortRecord& port) {
                                           return port.state != core::PortState::Open;
                                       }),
                        ports.end());
            record.mergePorts(ports);
        } catch (const std::exception& e) {
            spdlog::warn("Port scan failed for {}: {}", record.address, e.what());
        }
    });
}

} // namespace netsweep::infra
