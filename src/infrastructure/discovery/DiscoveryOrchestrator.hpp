#pragma once

#include "core/services/IConnectionProber.hpp"
#include "core/services/IEchoProber.hpp"
#include "core/services/ILinkLayerResolver.hpp"
#include "core/services/INameResolver.hpp"
#include "core/services/IPortScanner.hpp"
#include "core/types/HostRecord.hpp"

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::infra {

/**
 * @brief Stage of a discovery invocation.
 */
enum class DiscoveryPhase : int {
    Idle = 0,
    Expanding = 1, ///< Parsing and expanding targets
    Probing = 2,   ///< Methods running, findings being merged
    Merging = 3,   ///< Filtering and ordering merged records
    Enriching = 4, ///< Name resolution and port scanning
    Done = 5
};

std::string phaseToString(DiscoveryPhase phase);

/**
 * @brief Probing collaborators used by the orchestrator.
 *
 * A null prober disables its method. The link-layer resolver is optional
 * even when link-layer probing is wanted: without one, local groups are
 * probed like remote ones.
 */
struct DiscoveryServices {
    std::shared_ptr<core::ILinkLayerResolver> linkLayer;
    std::shared_ptr<core::IEchoProber> echo;
    std::shared_ptr<core::IConnectionProber> connection;
    std::shared_ptr<core::IPortScanner> portScanner;
    std::shared_ptr<core::INameResolver> nameResolver;
};

struct DiscoveryOptions {
    bool strictLinkLayer{false}; ///< Link-layer batch failures abort the invocation
    size_t hostWorkers{8};       ///< Hosts enriched concurrently
};

/**
 * @brief Per-target group: the text it came from, its addresses and strategy.
 */
struct TargetGroup {
    std::string target;
    std::vector<asio::ip::address_v4> addresses;
    core::DiscoveryStrategy strategy{core::DiscoveryStrategy::Remote};
};

/**
 * @brief Runs every applicable discovery method over a target list and
 *        merges the findings into one record per live host.
 *
 * Each method runs on its own producer thread and streams findings into a
 * FindingChannel. The thread calling discover() is the only consumer and the
 * only writer of the merge map. An instance may be reused for consecutive
 * invocations but not for concurrent ones.
 */
class DiscoveryOrchestrator {
public:
    using PhaseCallback = std::function<void(DiscoveryPhase)>;
    using RecordCallback = std::function<void(const core::HostRecord&)>;

    /**
     * @brief Constructs an orchestrator.
     * @param services Probers; at least one of echo, connection or link-layer must be set.
     * @param options Strictness and enrichment concurrency.
     * @param localNetwork Prefix attached to the scanning interface, used to
     *        classify groups as local. Without it every group is remote.
     * @throws core::DiscoveryError InvalidConfiguration if no method is available.
     */
    explicit DiscoveryOrchestrator(DiscoveryServices services, DiscoveryOptions options = {},
                                   std::optional<asio::ip::network_v4> localNetwork = std::nullopt);

    /**
     * @brief Discovers live hosts in the given targets.
     *
     * @param targets Prefixes ("10.0.0.0/24") or single addresses.
     * @param enablePortScan Resolve names and scan ports of every live host.
     * @return Live hosts ordered by numeric address; empty when none answered.
     * @throws core::DiscoveryError InvalidTarget for a malformed target (before
     *         any probing), InvalidConfiguration when a port scan is requested
     *         without a scanner, ResourceUnavailable for a link-layer failure
     *         in strict mode.
     */
    std::vector<core::HostRecord> discover(const std::vector<std::string>& targets,
                                           bool enablePortScan);

    /**
     * @brief Single-target form of discover().
     */
    std::vector<core::HostRecord> discover(const std::string& target, bool enablePortScan);

    /**
     * @brief Expands a prefix into its usable host addresses.
     */
    static std::vector<asio::ip::address_v4> expand(const std::string& prefix);

    /**
     * @brief Decides which methods apply to a group starting at @p first.
     */
    static core::DiscoveryStrategy classify(const asio::ip::address_v4& first,
                                            const std::optional<asio::ip::network_v4>& localNetwork,
                                            bool linkLayerAvailable);

    [[nodiscard]] DiscoveryPhase phase() const { return phase_.load(); }

    /**
     * @brief Sets a callback invoked on every phase change, on the calling thread.
     */
    void setPhaseCallback(PhaseCallback callback) { phaseCallback_ = std::move(callback); }

    /**
     * @brief Sets a callback receiving the updated record after every merge.
     *
     * Invoked on the thread calling discover(). Records may still be dropped
     * or enriched afterwards.
     */
    void setRecordCallback(RecordCallback callback) { recordCallback_ = std::move(callback); }

    [[nodiscard]] const DiscoveryOptions& options() const { return options_; }

private:
    std::vector<TargetGroup> buildGroups(const std::vector<std::string>& targets) const;
    void enrich(std::vector<core::HostRecord>& records);
    void setPhase(DiscoveryPhase phase);

    DiscoveryServices services_;
    DiscoveryOptions options_;
    std::optional<asio::ip::network_v4> localNetwork_;
    std::atomic<DiscoveryPhase> phase_{DiscoveryPhase::Idle};
    PhaseCallback phaseCallback_;
    RecordCallback recordCallback_;
};

} // namespace netsweep::infra
