#pragma once

#include "core/services/INameResolver.hpp"
#include "infrastructure/network/ProbeRuntime.hpp"

namespace netsweep::infra {

/**
 * @brief Reverse DNS through the system resolver.
 *
 * Lookups are synchronous and may be issued from several threads at once.
 */
class ReverseDnsResolver : public core::INameResolver {
public:
    explicit ReverseDnsResolver(ProbeRuntime& runtime);

    std::optional<std::string> reverseLookup(const std::string& address) override;

    /**
     * @brief Removes the trailing root dot of a fully qualified name.
     */
    static std::string trimTrailingDot(std::string name);

private:
    ProbeRuntime& runtime_;
};

} // namespace netsweep::infra
