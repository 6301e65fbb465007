/**
 * @file JsonMachineRegistry.hpp
 * @brief MachineRegistry backed by a JSON file of known machines.
 */

#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include "domain/MachineRegistry.hpp"

namespace simboard::infrastructure {

/**
 * @class JsonMachineRegistry
 * @brief Name to id table read from {"machines": [{"id": "...", "name": "..."}]}.
 */
class JsonMachineRegistry : public domain::MachineRegistry {
public:
    explicit JsonMachineRegistry(std::map<std::string, std::string> idsByName);

    /**
     * @brief Loads the registry file.
     * @throws std::runtime_error if the file is missing or malformed.
     */
    static std::unique_ptr<JsonMachineRegistry> Load(const std::filesystem::path& path);

    std::optional<std::string> findMachineId(const std::string& name) const override;

    std::size_t size() const { return m_idsByName.size(); }

private:
    std::map<std::string, std::string> m_idsByName;
};

} // namespace simboard::infrastructure
