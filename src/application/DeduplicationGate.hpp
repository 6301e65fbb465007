/**
 * @file DeduplicationGate.hpp
 * @brief Resolves the natural key of a run and checks it against the store.
 */

#pragma once
#include <memory>
#include <spdlog/spdlog.h>
#include "domain/MachineRegistry.hpp"
#include "domain/SimulationMetadata.hpp"
#include "domain/SimulationRecord.hpp"
#include "domain/SimulationStore.hpp"

namespace simboard::application {

class DeduplicationGate {
public:
    DeduplicationGate(std::shared_ptr<const domain::MachineRegistry> machines,
                      std::shared_ptr<const domain::SimulationStore> store,
                      std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Builds (case_name, machine_id, simulation_start_date).
     *
     * case_name falls back to name, then to "unknown".
     * @throws domain::InvalidMetadataError if the machine name or start date is missing or unparseable.
     * @throws domain::MachineNotFoundError if the machine is not registered.
     */
    domain::DeduplicationKey extractKey(const domain::SimulationMetadata& metadata) const;

    /** @brief True when a simulation with this key is already persisted. */
    bool exists(const domain::DeduplicationKey& key) const;

private:
    std::shared_ptr<const domain::MachineRegistry> m_machines;
    std::shared_ptr<const domain::SimulationStore> m_store;
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace simboard::application
