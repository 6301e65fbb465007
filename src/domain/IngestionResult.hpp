/**
 * @file IngestionResult.hpp
 * @brief Aggregate outcome of one archive ingestion.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/SimulationEnums.hpp"
#include "domain/SimulationRecord.hpp"

namespace simboard::domain {

/**
 * @struct IngestionError
 * @brief One experiment that failed to parse, key-extract or validate.
 */
struct IngestionError {
    std::string expDir;
    std::string errorType;
    std::string message;
};

/**
 * @struct IngestArchiveResult
 * @brief Records accepted for creation plus audit counts and per-experiment errors.
 */
struct IngestArchiveResult {
    std::vector<SimulationRecord> simulations;
    int createdCount = 0;
    int duplicateCount = 0;
    int skippedCount = 0; ///< Later runs folded into their case's canonical record.
    std::vector<IngestionError> errors;

    /**
     * @brief Success when nothing failed, Partial when some records were created despite
     * errors, Failed when errors occurred and nothing was created.
     */
    IngestionStatus status() const {
        if (errors.empty()) return IngestionStatus::Success;
        return createdCount > 0 ? IngestionStatus::Partial : IngestionStatus::Failed;
    }
};

nlohmann::json ToJson(const IngestArchiveResult& result);

} // namespace simboard::domain
