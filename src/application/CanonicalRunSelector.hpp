/**
 * @file CanonicalRunSelector.hpp
 * @brief Picks one canonical run per case and reduces later runs to configuration deltas.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "application/DeduplicationGate.hpp"
#include "application/IngestionResultBuilder.hpp"
#include "application/SimulationRecordMapper.hpp"
#include "domain/SimulationMetadata.hpp"

namespace simboard::application {

/**
 * @struct ExperimentRun
 * @brief Assembled metadata of one experiment directory.
 */
struct ExperimentRun {
    std::string expDir;
    domain::SimulationMetadata metadata;
};

/**
 * @class CanonicalRunSelector
 * @brief Walks the runs of one case in directory order.
 *
 * The first run whose key is already persisted, or the first run that maps to a
 * valid record, becomes the canonical baseline. Every later run is counted as
 * skipped and, if its configuration differs, contributes a delta entry to the
 * canonical record created in this pass.
 */
class CanonicalRunSelector {
public:
    CanonicalRunSelector(std::shared_ptr<const DeduplicationGate> gate,
                         std::shared_ptr<const SimulationRecordMapper> mapper,
                         std::vector<std::string> deltaFields,
                         std::shared_ptr<spdlog::logger> logger);

    /** @brief Processes the runs of one case, in order, into the builder. */
    void select(const std::vector<ExperimentRun>& runs, IngestionResultBuilder& builder) const;

    /**
     * @brief {field: {canonical, current}} for every listed field whose values differ.
     * @return An empty object when the runs agree on all listed fields.
     */
    static nlohmann::json ComputeConfigDelta(const domain::SimulationMetadata& canonical,
                                             const domain::SimulationMetadata& current,
                                             const std::vector<std::string>& fields);

private:
    std::shared_ptr<const DeduplicationGate> m_gate;
    std::shared_ptr<const SimulationRecordMapper> m_mapper;
    std::vector<std::string> m_deltaFields;
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace simboard::application
