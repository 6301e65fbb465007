/**
 * @file MachineRegistry.hpp
 * @brief Interface for resolving HPC machine names to machine ids.
 */

#pragma once
#include <optional>
#include <string>

namespace simboard::domain {

/**
 * @class MachineRegistry
 * @brief Abstract lookup of registered machines, supplied by the persistence layer.
 */
class MachineRegistry {
public:
    virtual ~MachineRegistry() = default;

    /**
     * @brief Resolves a machine by exact name.
     * @param name Machine name as written in the timing file (e.g. "chrysalis").
     * @return The machine id, or std::nullopt when no such machine is registered.
     */
    virtual std::optional<std::string> findMachineId(const std::string& name) const = 0;
};

} // namespace simboard::domain
