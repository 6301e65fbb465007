/**
 * @file JsonMachineRegistry.cpp
 * @brief Implementation of JsonMachineRegistry.
 */

#include "infrastructure/JsonMachineRegistry.hpp"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace simboard::infrastructure {

namespace fs = std::filesystem;

JsonMachineRegistry::JsonMachineRegistry(std::map<std::string, std::string> idsByName)
    : m_idsByName(std::move(idsByName)) {}

std::unique_ptr<JsonMachineRegistry> JsonMachineRegistry::Load(const fs::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Machine registry not found: " + path.string());
    }

    std::map<std::string, std::string> idsByName;
    try {
        nlohmann::json j;
        f >> j;
        for (const auto& machine : j.at("machines")) {
            idsByName[machine.at("name").get<std::string>()] = machine.at("id").get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed machine registry " + path.string() + ": " + e.what());
    }
    return std::make_unique<JsonMachineRegistry>(std::move(idsByName));
}

std::optional<std::string> JsonMachineRegistry::findMachineId(const std::string& name) const {
    auto it = m_idsByName.find(name);
    if (it == m_idsByName.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace simboard::infrastructure
