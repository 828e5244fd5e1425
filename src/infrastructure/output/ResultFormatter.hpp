#pragma once

#include "core/types/HostRecord.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace netsweep::infra {

/**
 * @brief Per-method counts over a result set.
 */
struct DiscoverySummary {
    size_t totalHosts{0};
    size_t byLinkLayer{0};
    size_t byEcho{0};
    size_t byConnection{0};
    size_t byAllMethods{0};
    size_t openPorts{0};

    static DiscoverySummary of(const std::vector<core::HostRecord>& records);
};

/**
 * @brief Renders discovery results as JSON or as a plain-text table.
 */
class ResultFormatter {
public:
    static nlohmann::json toJson(const core::PortRecord& port);
    static nlohmann::json toJson(const core::HostRecord& record);

    /**
     * @brief Serialises a result set with a summary block.
     */
    static nlohmann::json toJson(const std::vector<core::HostRecord>& records);

    /**
     * @brief Formats a table of hosts followed by per-method statistics.
     */
    static std::string formatText(const std::vector<core::HostRecord>& records);

    /**
     * @brief Writes toJson(records) to @p path, pretty printed.
     * @return True if the file was written.
     */
    static bool writeJson(const std::filesystem::path& path,
                          const std::vector<core::HostRecord>& records);
};

} // namespace netsweep::infra
