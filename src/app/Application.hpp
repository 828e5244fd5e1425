#pragma once

#include "app/CommandLineOptions.hpp"
#include "core/types/NetworkInterface.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/discovery/DiscoveryOrchestrator.hpp"
#include "infrastructure/network/ProbeRuntime.hpp"
#include "infrastructure/network/SocketProbe.hpp"

#include <QCoreApplication>
#include <memory>

namespace netsweep::app {

/**
 * @brief Command-line front end running one discovery pass.
 */
class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    /**
     * @brief Runs the scan and prints or writes the results.
     * @return Process exit code: 0 on success (also with no hosts found), 1 on failure.
     */
    int run();

private:
    bool parseArguments();
    void initializeLogging();
    std::vector<std::string> resolveTargets() const;
    std::shared_ptr<core::ILinkLayerResolver> createLinkLayerResolver();
    std::unique_ptr<infra::DiscoveryOrchestrator> createOrchestrator();
    bool writeResults(const std::vector<core::HostRecord>& records) const;
    size_t peakConcurrentProbes() const;

    std::unique_ptr<QCoreApplication> qtApp_;
    CommandLineOptions options_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::optional<core::NetworkInterface> interface_;
    std::unique_ptr<infra::ProbeRuntime> probeRuntime_;
    std::unique_ptr<infra::SocketProbe> socketProbe_;
};

} // namespace netsweep::app
