/**
 * @file DeduplicationGate.cpp
 * @brief Implementation of DeduplicationGate.
 */

#include "application/DeduplicationGate.hpp"
#include "domain/DateTime.hpp"
#include "domain/IngestionErrors.hpp"

namespace simboard::application {

using domain::GetField;

DeduplicationGate::DeduplicationGate(std::shared_ptr<const domain::MachineRegistry> machines,
                                     std::shared_ptr<const domain::SimulationStore> store,
                                     std::shared_ptr<spdlog::logger> logger)
    : m_machines(std::move(machines)), m_store(std::move(store)), m_logger(std::move(logger)) {}

domain::DeduplicationKey DeduplicationGate::extractKey(const domain::SimulationMetadata& metadata) const {
    auto machineName = GetField(metadata, "machine");
    if (!machineName) {
        throw domain::InvalidMetadataError("Machine name is required but not found in metadata");
    }

    auto machineId = m_machines->findMachineId(*machineName);
    if (!machineId) {
        throw domain::MachineNotFoundError("Machine '" + *machineName +
                                           "' not found in database. "
                                           "Please ensure the machine exists before uploading.");
    }

    std::optional<domain::UtcTime> startDate;
    if (auto raw = GetField(metadata, "simulation_start_date")) {
        startDate = domain::ParseDateTime(*raw);
        if (!startDate) {
            m_logger->warn("Could not parse date '{}'", *raw);
        }
    }
    if (!startDate) {
        throw domain::InvalidMetadataError("simulation_start_date is required but could not be parsed");
    }

    std::string caseName = GetField(metadata, "case_name").value_or(GetField(metadata, "name").value_or("unknown"));
    return domain::DeduplicationKey{caseName, *machineId, *startDate};
}

bool DeduplicationGate::exists(const domain::DeduplicationKey& key) const {
    return m_store->exists(key);
}

} // namespace simboard::application
