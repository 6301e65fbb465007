/**
 * @file ReadmeCaseParser.hpp
 * @brief Reads the case creation date, grid and compset from README.case.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "domain/SimulationMetadata.hpp"

namespace simboard::application::parsers {

/**
 * @class ReadmeCaseParser
 * @brief Output keys: creation_date, grid_name (from --res) and compset (from --compset).
 */
class ReadmeCaseParser {
public:
    /** @throws domain::FileReadError if the file cannot be read. */
    domain::FieldMap parse(const std::filesystem::path& path) const;
    domain::FieldMap parseText(const std::string& text) const;

    /**
     * @brief Value of flag on the first create_newcase line, as "flag value" or "flag=value".
     */
    static std::optional<std::string> ExtractFlagValue(const std::vector<std::string>& lines,
                                                       const std::string& flag);
};

} // namespace simboard::application::parsers
