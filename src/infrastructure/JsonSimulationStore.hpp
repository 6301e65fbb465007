/**
 * @file JsonSimulationStore.hpp
 * @brief SimulationStore persisted as a single JSON document.
 */

#pragma once
#include <filesystem>
#include <memory>
#include <set>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "domain/SimulationStore.hpp"

namespace simboard::infrastructure {

/**
 * @class JsonSimulationStore
 * @brief Stores records as {"simulations": [...]} and enforces the natural key.
 *
 * Every insert rewrites the file through a temporary sibling and a rename, so a
 * reader never observes a half-written document.
 */
class JsonSimulationStore : public domain::SimulationStore {
public:
    /**
     * @brief Opens the store, loading existing records when the file exists.
     * @throws std::runtime_error if an existing file cannot be parsed.
     */
    JsonSimulationStore(std::filesystem::path path, std::shared_ptr<spdlog::logger> logger);

    bool exists(const domain::DeduplicationKey& key) const override;
    std::size_t insert(const std::vector<domain::SimulationRecord>& records) override;

    std::size_t size() const { return m_keys.size(); }
    std::vector<domain::SimulationRecord> records() const;

private:
    void writeAtomically(const nlohmann::json& document) const;

    std::filesystem::path m_path;
    std::shared_ptr<spdlog::logger> m_logger;
    nlohmann::json m_document;
    std::set<domain::DeduplicationKey> m_keys;
};

} // namespace simboard::infrastructure
