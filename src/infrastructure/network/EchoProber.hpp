#pragma once

#include "core/services/IEchoProber.hpp"

#include <memory>

namespace netsweep::infra {

struct EchoProberOptions {
    std::chrono::milliseconds timeout{3000};
    size_t workers{20};
};

/**
 * @brief Echo prober running one technique over a bounded worker pool.
 */
class EchoProber : public core::IEchoProber {
public:
    EchoProber(std::shared_ptr<core::IEchoTechnique> technique, EchoProberOptions options = {});

    std::optional<std::chrono::microseconds> probe(const asio::ip::address_v4& address) override;

    void probeMany(const std::vector<asio::ip::address_v4>& addresses,
                   const core::FindingCallback& onFound) override;

    [[nodiscard]] const core::IEchoTechnique& technique() const { return *technique_; }
    [[nodiscard]] const EchoProberOptions& options() const { return options_; }

private:
    std::shared_ptr<core::IEchoTechnique> technique_;
    EchoProberOptions options_;
};

} // namespace netsweep::infra
