/**
 * @file SimulationEnums.hpp
 * @brief Closed enumerations for simulation records and ingestion outcomes.
 */

#pragma once
#include <optional>
#include <string>

namespace simboard::domain {

/**
 * @enum SimulationStatus
 * @brief Lifecycle state of a simulation.
 */
enum class SimulationStatus {
    Unknown,
    Created,
    Queued,
    Running,
    Failed,
    Completed
};

/**
 * @enum SimulationType
 * @brief Purpose classification of a simulation.
 */
enum class SimulationType {
    Unknown,
    Production,
    Experimental,
    Test
};

/**
 * @enum IngestionStatus
 * @brief Overall outcome of one ingestion pass.
 */
enum class IngestionStatus {
    Success,
    Partial,
    Failed
};

std::string ToString(SimulationStatus status);
std::string ToString(SimulationType type);
std::string ToString(IngestionStatus status);

/** @brief Strict lookup by value, case-insensitive ("completed", "COMPLETED"). */
std::optional<SimulationStatus> SimulationStatusFromString(const std::string& raw);
std::optional<SimulationType> SimulationTypeFromString(const std::string& raw);

/**
 * @brief Total conversion of free text to a status.
 * @return The matching status, or SimulationStatus::Created for null, blank or unknown input.
 */
SimulationStatus ParseSimulationStatus(const std::optional<std::string>& raw);

/**
 * @brief Total conversion of free text to a type.
 * @return The matching type, or SimulationType::Unknown for null, blank or unknown input.
 */
SimulationType ParseSimulationType(const std::optional<std::string>& raw);

} // namespace simboard::domain
