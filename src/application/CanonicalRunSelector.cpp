/**
 * @file CanonicalRunSelector.cpp
 * @brief Implementation of CanonicalRunSelector.
 */

#include "application/CanonicalRunSelector.hpp"
#include "domain/IngestionErrors.hpp"

namespace simboard::application {

using domain::SimulationMetadata;

namespace {

std::optional<std::string> RawField(const SimulationMetadata& metadata, const std::string& key) {
    auto it = metadata.find(key);
    return it == metadata.end() ? std::nullopt : it->second;
}

nlohmann::json ToJson(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

CanonicalRunSelector::CanonicalRunSelector(std::shared_ptr<const DeduplicationGate> gate,
                                           std::shared_ptr<const SimulationRecordMapper> mapper,
                                           std::vector<std::string> deltaFields,
                                           std::shared_ptr<spdlog::logger> logger)
    : m_gate(std::move(gate)), m_mapper(std::move(mapper)), m_deltaFields(std::move(deltaFields)),
      m_logger(std::move(logger)) {}

void CanonicalRunSelector::select(const std::vector<ExperimentRun>& runs, IngestionResultBuilder& builder) const {
    const ExperimentRun* canonical = nullptr;
    std::string canonicalCase;

    for (const auto& run : runs) {
        try {
            domain::DeduplicationKey key = m_gate->extractKey(run.metadata);

            if (m_gate->exists(key)) {
                m_logger->info("Simulation already exists with case_name='{}', machine_id={}, "
                               "simulation_start_date={}. Skipping duplicate from {}.",
                               key.caseName, key.machineId, domain::FormatIsoUtc(key.simulationStartDate),
                               run.expDir);
                builder.recordDuplicate();
                if (!canonical) {
                    canonical = &run;
                    canonicalCase = key.caseName;
                }
                continue;
            }

            if (!canonical) {
                builder.addSimulation(m_mapper->map(run.metadata, key));
                canonical = &run;
                canonicalCase = key.caseName;
                m_logger->info("Mapped canonical simulation from {}: {}", run.expDir, canonicalCase);
                continue;
            }

            nlohmann::json delta = ComputeConfigDelta(canonical->metadata, run.metadata, m_deltaFields);
            if (!delta.empty()) {
                std::string changed;
                for (const auto& item : delta.items()) {
                    changed += (changed.empty() ? "" : ", ") + item.key();
                }
                m_logger->info("Non-canonical run in '{}' differs from canonical '{}' in: {}", run.expDir,
                               canonical->expDir, changed);
                if (!builder.attachConfigDelta(canonicalCase, run.expDir, delta)) {
                    m_logger->debug("Canonical run '{}' was not created in this pass; delta not attached",
                                    canonical->expDir);
                }
            } else {
                m_logger->info("Non-canonical run in '{}' has identical configuration to canonical '{}'.",
                               run.expDir, canonical->expDir);
            }
            builder.recordSkipped();
        } catch (const domain::ExperimentError& e) {
            m_logger->error("Failed to process simulation from {}: {}", run.expDir, e.what());
            builder.recordError(run.expDir, e);
        }
    }
}

nlohmann::json CanonicalRunSelector::ComputeConfigDelta(const SimulationMetadata& canonical,
                                                        const SimulationMetadata& current,
                                                        const std::vector<std::string>& fields) {
    nlohmann::json delta = nlohmann::json::object();
    for (const auto& field : fields) {
        auto canonicalValue = RawField(canonical, field);
        auto currentValue = RawField(current, field);
        if (canonicalValue != currentValue) {
            delta[field] = {{"canonical", ToJson(canonicalValue)}, {"current", ToJson(currentValue)}};
        }
    }
    return delta;
}

} // namespace simboard::application
