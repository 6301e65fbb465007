/**
 * @file SimulationStore.hpp
 * @brief Interface for the persistence sink of simulation records.
 */

#pragma once
#include <cstddef>
#include <vector>
#include "domain/SimulationRecord.hpp"

namespace simboard::domain {

/**
 * @class SimulationStore
 * @brief Abstract store of persisted simulations, keyed by DeduplicationKey.
 */
class SimulationStore {
public:
    virtual ~SimulationStore() = default;

    /** @brief Exact-match lookup on (case_name, machine_id, simulation_start_date). */
    virtual bool exists(const DeduplicationKey& key) const = 0;

    /**
     * @brief Persists all records as one unit.
     * @return Number of records written.
     * @throws DuplicateSimulationError if any key is already stored or repeated; nothing is written then.
     */
    virtual std::size_t insert(const std::vector<SimulationRecord>& records) = 0;
};

} // namespace simboard::domain
