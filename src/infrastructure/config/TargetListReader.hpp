#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace netsweep::infra {

/**
 * @brief Reads scan targets from a text file.
 *
 * One prefix or address per line. Blank lines and lines starting with '#'
 * are skipped, surrounding whitespace is ignored.
 */
class TargetListReader {
public:
    /**
     * @brief Reads and validates every target in @p path.
     * @return Targets in file order.
     * @throws core::DiscoveryError InvalidConfiguration if the file cannot be
     *         opened, InvalidTarget naming the line of the first bad entry.
     */
    static std::vector<std::string> read(const std::filesystem::path& path);

    /**
     * @brief Parses target lines from already loaded text.
     */
    static std::vector<std::string> parse(const std::string& text);
};

} // namespace netsweep::infra
