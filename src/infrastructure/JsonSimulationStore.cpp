/**
 * @file JsonSimulationStore.cpp
 * @brief Implementation of JsonSimulationStore.
 */

#include "infrastructure/JsonSimulationStore.hpp"
#include "domain/IngestionErrors.hpp"
#include <chrono>
#include <fstream>
#include <stdexcept>

namespace simboard::infrastructure {

namespace fs = std::filesystem;
using namespace simboard::domain;

namespace {

std::string DescribeKey(const DeduplicationKey& key) {
    return "(" + key.caseName + ", " + key.machineId + ", " + FormatIsoUtc(key.simulationStartDate) + ")";
}

} // namespace

JsonSimulationStore::JsonSimulationStore(fs::path path, std::shared_ptr<spdlog::logger> logger)
    : m_path(std::move(path)), m_logger(std::move(logger)) {
    m_document = {{"simulations", nlohmann::json::array()}};
    if (!fs::exists(m_path)) {
        m_logger->debug("Simulation store {} does not exist yet", m_path.string());
        return;
    }

    try {
        std::ifstream f(m_path);
        nlohmann::json loaded;
        f >> loaded;
        for (const auto& item : loaded.at("simulations")) {
            m_keys.insert(SimulationRecordFromJson(item).key());
        }
        m_document = std::move(loaded);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load simulation store " + m_path.string() + ": " + e.what());
    }
    m_logger->debug("Loaded {} simulations from {}", m_keys.size(), m_path.string());
}

bool JsonSimulationStore::exists(const DeduplicationKey& key) const {
    return m_keys.count(key) > 0;
}

std::size_t JsonSimulationStore::insert(const std::vector<SimulationRecord>& records) {
    std::set<DeduplicationKey> batchKeys;
    for (const auto& record : records) {
        auto key = record.key();
        if (m_keys.count(key) > 0 || !batchKeys.insert(key).second) {
            throw DuplicateSimulationError("Simulation already exists: " + DescribeKey(key));
        }
    }
    if (records.empty()) {
        return 0;
    }

    nlohmann::json updated = m_document;
    for (const auto& record : records) {
        updated["simulations"].push_back(ToJson(record));
    }
    writeAtomically(updated);

    m_document = std::move(updated);
    m_keys.insert(batchKeys.begin(), batchKeys.end());
    m_logger->info("Stored {} simulations in {}", records.size(), m_path.string());
    return records.size();
}

std::vector<SimulationRecord> JsonSimulationStore::records() const {
    std::vector<SimulationRecord> result;
    for (const auto& item : m_document["simulations"]) {
        result.push_back(SimulationRecordFromJson(item));
    }
    return result;
}

void JsonSimulationStore::writeAtomically(const nlohmann::json& document) const {
    // Create unique temp path: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = m_path;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    if (m_path.has_parent_path()) {
        fs::create_directories(m_path.parent_path());
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open temp file: " + tempPath.string());
        }
        ofs << document.dump(2);
        ofs.flush();
        if (ofs.fail()) {
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw std::runtime_error("Write failed during output: " + tempPath.string());
        }
    }

    std::error_code ec;
    fs::rename(tempPath, m_path, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw std::runtime_error("Rename failed for " + m_path.string() + ": " + ec.message());
    }
}

} // namespace simboard::infrastructure
