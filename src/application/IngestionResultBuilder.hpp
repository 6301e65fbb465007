/**
 * @file IngestionResultBuilder.hpp
 * @brief Accumulates records, counters and errors of one ingestion pass.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "domain/IngestionErrors.hpp"
#include "domain/IngestionResult.hpp"

namespace simboard::application {

class IngestionResultBuilder {
public:
    void addSimulation(domain::SimulationRecord record);
    void recordDuplicate() { ++m_result.duplicateCount; }
    void recordSkipped() { ++m_result.skippedCount; }

    /** @brief Records a per-experiment failure under its kind() tag. */
    void recordError(const std::string& expDir, const domain::ExperimentError& error);

    /**
     * @brief Appends {exp_dir, deltas} to extra.run_config_deltas of the record created
     * for caseName in this pass.
     * @return false when no record for the case was created in this pass.
     */
    bool attachConfigDelta(const std::string& caseName, const std::string& expDir, const nlohmann::json& delta);


    /** @brief Finalizes counts and hands the result over. */
    domain::IngestArchiveResult build();

private:
    domain::IngestArchiveResult m_result;
};

} // namespace simboard::application
