/**
 * @file SimulationRecordMapper.hpp
 * @brief Converts assembled metadata into a validated SimulationRecord.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include "domain/DateTime.hpp"
#include "domain/SimulationMetadata.hpp"
#include "domain/SimulationRecord.hpp"

namespace simboard::application {

class SimulationRecordMapper {
public:
    explicit SimulationRecordMapper(std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Maps metadata plus its resolved dedup key to a record.
     *
     * Enums fall back to unknown type and created status, optional dates that do not
     * parse become null, and SSH git remotes are rewritten to HTTPS.
     * @throws domain::SchemaValidationError when required fields are missing.
     */
    domain::SimulationRecord map(const domain::SimulationMetadata& metadata,
                                 const domain::DeduplicationKey& key) const;

    /**
     * @brief git@host:owner/repo.git -> https://host/owner/repo.git.
     *
     * HTTP(S) and unrecognized forms are returned unchanged; null or empty input gives null.
     */
    std::optional<std::string> normalizeGitUrl(const std::optional<std::string>& url) const;

    /** @brief Lenient datetime parse; logs and returns null when the text is not a date. */
    std::optional<domain::UtcTime> parseDateField(const std::optional<std::string>& value) const;

private:
    domain::SimulationStatus normalizeStatus(const std::optional<std::string>& raw) const;
    domain::SimulationType normalizeType(const std::optional<std::string>& raw) const;

    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace simboard::application
