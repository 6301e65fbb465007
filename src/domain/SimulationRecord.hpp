/**
 * @file SimulationRecord.hpp
 * @brief Typed simulation record accepted for persistence, and its natural key.
 */

#pragma once
#include <optional>
#include <string>
#include <tuple>
#include <nlohmann/json.hpp>
#include "domain/DateTime.hpp"
#include "domain/SimulationEnums.hpp"

namespace simboard::domain {

/**
 * @struct DeduplicationKey
 * @brief Composite natural key, unique among persisted simulations.
 */
struct DeduplicationKey {
    std::string caseName;
    std::string machineId;
    UtcTime simulationStartDate;

    bool operator==(const DeduplicationKey& other) const {
        return caseName == other.caseName && machineId == other.machineId &&
               simulationStartDate == other.simulationStartDate;
    }
    bool operator<(const DeduplicationKey& other) const {
        return std::tie(caseName, machineId, simulationStartDate) <
               std::tie(other.caseName, other.machineId, other.simulationStartDate);
    }
};

/**
 * @class SimulationRecord
 * @brief Canonical simulation ready to be created by the persistence collaborator.
 */
class SimulationRecord {
public:
    // Identification
    std::string name;
    std::string caseName;

    // Configuration
    std::string compset;
    std::string compsetAlias;
    std::string gridName;
    std::string gridResolution;
    std::string initializationType;
    std::optional<std::string> experimentType;
    std::optional<std::string> campaign;
    std::optional<std::string> groupName;
    std::optional<std::string> parentSimulationId;

    // Status and timeline
    SimulationType simulationType = SimulationType::Unknown;
    SimulationStatus status = SimulationStatus::Created;
    std::string machineId;
    UtcTime simulationStartDate{};
    std::optional<UtcTime> simulationEndDate;
    std::optional<UtcTime> runStartDate;
    std::optional<UtcTime> runEndDate;

    // Software and provenance
    std::optional<std::string> compiler;
    std::optional<std::string> gitRepositoryUrl;
    std::optional<std::string> gitBranch;
    std::optional<std::string> gitTag;
    std::optional<std::string> gitCommitHash;
    std::optional<std::string> hpcUsername;
    std::optional<std::string> createdBy;
    std::optional<std::string> lastUpdatedBy;

    /// Free-form attachments; run_config_deltas lives here.
    nlohmann::json extra = nlohmann::json::object();

    DeduplicationKey key() const {
        return DeduplicationKey{caseName, machineId, simulationStartDate};
    }
};

/** @brief Serializes with camelCase keys and ISO-8601 UTC dates. */
nlohmann::json ToJson(const SimulationRecord& record);

/**
 * @brief Rebuilds a record written by ToJson.
 * @throws nlohmann::json::exception or std::invalid_argument on malformed input.
 */
SimulationRecord SimulationRecordFromJson(const nlohmann::json& j);

} // namespace simboard::domain
