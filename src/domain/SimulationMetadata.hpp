/**
 * @file SimulationMetadata.hpp
 * @brief Flat string field maps produced by the parsers and the assembler.
 */

#pragma once
#include <array>
#include <map>
#include <optional>
#include <string>

namespace simboard::domain {

/** @brief Field name to optional string value, as produced by a single parser. */
using FieldMap = std::map<std::string, std::optional<std::string>>;

/**
 * @brief Assembled metadata of one experiment.
 *
 * Always carries exactly the keys listed in kMetadataFields, absent values are std::nullopt.
 */
using SimulationMetadata = FieldMap;

/** @brief Recognized keys of an assembled SimulationMetadata. */
inline constexpr std::array<const char*, 29> kMetadataFields = {
    // Identification
    "name",
    "case_name",
    // Configuration
    "compset",
    "compset_alias",
    "grid_name",
    "grid_resolution",
    "campaign",
    "experiment_type",
    "initialization_type",
    "group_name",
    // Timeline and status
    "simulation_start_date",
    "simulation_end_date",
    "run_start_date",
    "run_end_date",
    "status",
    "simulation_type",
    // Software and environment
    "compiler",
    "git_repository_url",
    "git_branch",
    "git_tag",
    "git_commit_hash",
    "machine",
    // Provenance
    "created_by",
    "last_updated_by",
    "hpc_username",
    // Placeholders filled by later stages
    "parent_simulation_id",
    "extra",
    "artifacts",
    "links",
};

/**
 * @brief Looks up a field, treating a missing key and an empty string as absent.
 */
inline std::optional<std::string> GetField(const FieldMap& fields, const std::string& key) {
    auto it = fields.find(key);
    if (it == fields.end() || !it->second || it->second->empty()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace simboard::domain
