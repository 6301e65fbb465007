/**
 * @file IngestionResultBuilder.cpp
 * @brief Implementation of IngestionResultBuilder.
 */

#include "application/IngestionResultBuilder.hpp"

namespace simboard::application {

void IngestionResultBuilder::addSimulation(domain::SimulationRecord record) {
    m_result.simulations.push_back(std::move(record));
}

void IngestionResultBuilder::recordError(const std::string& expDir, const domain::ExperimentError& error) {
    m_result.errors.push_back(domain::IngestionError{expDir, error.kind(), error.what()});
}

bool IngestionResultBuilder::attachConfigDelta(const std::string& caseName, const std::string& expDir,
                                               const nlohmann::json& delta) {
    for (auto& record : m_result.simulations) {
        if (record.caseName != caseName) {
            continue;
        }
        if (!record.extra.is_object()) {
            record.extra = nlohmann::json::object();
        }
        if (!record.extra.contains("run_config_deltas")) {
            record.extra["run_config_deltas"] = nlohmann::json::array();
        }
        record.extra["run_config_deltas"].push_back({{"exp_dir", expDir}, {"deltas", delta}});
        return true;
    }
    return false;
}

domain::IngestArchiveResult IngestionResultBuilder::build() {
    m_result.createdCount = static_cast<int>(m_result.simulations.size());
    domain::IngestArchiveResult result = std::move(m_result);
    m_result = domain::IngestArchiveResult{};
    return result;
}

} // namespace simboard::application
