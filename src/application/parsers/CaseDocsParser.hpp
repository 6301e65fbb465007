/**
 * @file CaseDocsParser.hpp
 * @brief Reads selected entries from the CIME env_case.xml and env_build.xml captures.
 */

#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include "domain/SimulationMetadata.hpp"

namespace simboard::application::parsers {

/**
 * @class CaseDocsParser
 * @brief Looks up <entry id="X" value="..."/> or <entry id="X">text</entry>.
 *
 * Malformed XML is logged and yields null fields.
 */
class CaseDocsParser {
public:
    explicit CaseDocsParser(std::shared_ptr<spdlog::logger> logger);

    /** @brief env_case.xml: group_name from CASE_GROUP. */
    domain::FieldMap parseEnvCase(const std::filesystem::path& path) const;

    /** @brief env_build.xml: compiler from COMPILER, mpilib from MPILIB. */
    domain::FieldMap parseEnvBuild(const std::filesystem::path& path) const;

    /**
     * @brief Value of the first entry with the given id; the value attribute wins over
     * non-empty text content.
     */
    std::optional<std::string> findEntryValue(const std::string& xml, const std::string& entryId) const;

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace simboard::application::parsers
