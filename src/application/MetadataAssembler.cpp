/**
 * @file MetadataAssembler.cpp
 * @brief Implementation of MetadataAssembler.
 */

#include "application/MetadataAssembler.hpp"

namespace simboard::application {

using domain::FieldMap;
using domain::GetField;
using domain::SimulationMetadata;

MetadataAssembler::MetadataAssembler(std::shared_ptr<const FileSpecRegistry> registry,
                                     std::shared_ptr<spdlog::logger> logger)
    : m_registry(std::move(registry)), m_logger(std::move(logger)) {}

SimulationMetadata MetadataAssembler::assemble(const LocatedFiles& located) const {
    FieldMap merged;

    for (const auto& spec : m_registry->specs()) {
        auto it = located.files.find(spec.key);
        if (it == located.files.end()) {
            continue;
        }

        m_logger->debug("Parsing {} ({})", it->second.string(), spec.key);
        if (spec.singleValueField) {
            std::optional<std::string> value = spec.valueParser(it->second);
            MergeInto(merged, FieldMap{{*spec.singleValueField, value}});
        } else {
            domain::FieldMap parsed = spec.parser(it->second);
            MergeInto(merged, parsed);
            for (const auto& field : spec.ownedFields) {
                auto owned = parsed.find(field);
                merged[field] = owned != parsed.end() ? owned->second : std::nullopt;
            }
        }
    }

    return Normalize(merged);
}

void MetadataAssembler::MergeInto(FieldMap& target, const FieldMap& source) {
    for (const auto& [key, value] : source) {
        if (value) {
            target[key] = value;
        } else {
            target.emplace(key, std::nullopt);
        }
    }
}

SimulationMetadata MetadataAssembler::Normalize(const FieldMap& merged) {
    SimulationMetadata metadata;
    for (const char* field : domain::kMetadataFields) {
        metadata[field] = std::nullopt;
    }

    auto copy = [&](const char* field) {
        auto it = merged.find(field);
        if (it != merged.end()) {
            metadata[field] = it->second;
        }
    };

    for (const char* field : {"case_name", "compset", "compset_alias", "grid_name", "grid_resolution",
                              "campaign", "experiment_type", "initialization_type", "group_name",
                              "simulation_start_date", "simulation_end_date", "run_start_date", "run_end_date",
                              "status", "compiler", "git_repository_url", "git_branch", "git_tag",
                              "git_commit_hash", "machine"}) {
        copy(field);
    }

    metadata["name"] = metadata["case_name"];

    auto user = GetField(merged, "user");
    metadata["created_by"] = user;
    metadata["last_updated_by"] = user;
    metadata["hpc_username"] = user;
    return metadata;
}

} // namespace simboard::application
