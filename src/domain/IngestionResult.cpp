/**
 * @file IngestionResult.cpp
 * @brief JSON conversion of IngestArchiveResult.
 */

#include "domain/IngestionResult.hpp"

namespace simboard::domain {

nlohmann::json ToJson(const IngestArchiveResult& result) {
    nlohmann::json j;
    j["status"] = ToString(result.status());
    j["created_count"] = result.createdCount;
    j["duplicate_count"] = result.duplicateCount;
    j["skipped_count"] = result.skippedCount;

    j["simulations"] = nlohmann::json::array();
    for (const auto& record : result.simulations) {
        j["simulations"].push_back(ToJson(record));
    }

    j["errors"] = nlohmann::json::array();
    for (const auto& error : result.errors) {
        j["errors"].push_back({
            {"exp_dir", error.expDir},
            {"error_type", error.errorType},
            {"error", error.message}
        });
    }
    return j;
}

} // namespace simboard::domain
