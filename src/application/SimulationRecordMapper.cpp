/**
 * @file SimulationRecordMapper.cpp
 * @brief Implementation of SimulationRecordMapper.
 */

#include "application/SimulationRecordMapper.hpp"
#include "domain/IngestionErrors.hpp"
#include <vector>

namespace simboard::application {

using domain::GetField;
using domain::SimulationMetadata;
using domain::SimulationRecord;

namespace {

bool StartsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool IsBlank(const std::optional<std::string>& raw) {
    return !raw || raw->find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

SimulationRecordMapper::SimulationRecordMapper(std::shared_ptr<spdlog::logger> logger)
    : m_logger(std::move(logger)) {}

SimulationRecord SimulationRecordMapper::map(const SimulationMetadata& metadata,
                                             const domain::DeduplicationKey& key) const {
    std::vector<std::string> missing;
    auto required = [&](const char* field) -> std::string {
        auto value = GetField(metadata, field);
        if (!value) {
            missing.push_back(field);
            return {};
        }
        return *value;
    };

    SimulationRecord record;
    record.name = required("name");
    record.caseName = required("case_name");
    record.compset = required("compset");
    record.compsetAlias = required("compset_alias");
    record.gridName = required("grid_name");
    record.gridResolution = required("grid_resolution");
    record.initializationType = required("initialization_type");
    if (key.machineId.empty()) {
        missing.push_back("machine_id");
    }

    if (!missing.empty()) {
        std::string fields;
        for (const auto& f : missing) {
            fields += (fields.empty() ? "" : ", ") + f;
        }
        throw domain::SchemaValidationError(std::to_string(missing.size()) +
                                            " validation error(s) for SimulationRecord: missing " + fields);
    }

    record.machineId = key.machineId;
    record.simulationStartDate = key.simulationStartDate;
    record.simulationEndDate = parseDateField(GetField(metadata, "simulation_end_date"));
    record.runStartDate = parseDateField(GetField(metadata, "run_start_date"));
    record.runEndDate = parseDateField(GetField(metadata, "run_end_date"));

    record.simulationType = normalizeType(GetField(metadata, "simulation_type"));
    record.status = normalizeStatus(GetField(metadata, "status"));

    record.experimentType = GetField(metadata, "experiment_type");
    record.campaign = GetField(metadata, "campaign");
    record.groupName = GetField(metadata, "group_name");
    record.parentSimulationId = GetField(metadata, "parent_simulation_id");

    record.compiler = GetField(metadata, "compiler");
    record.gitRepositoryUrl = normalizeGitUrl(GetField(metadata, "git_repository_url"));
    record.gitBranch = GetField(metadata, "git_branch");
    record.gitTag = GetField(metadata, "git_tag");
    record.gitCommitHash = GetField(metadata, "git_commit_hash");
    record.hpcUsername = GetField(metadata, "hpc_username");

    // Archive usernames are local HPC accounts, not user ids.
    record.createdBy = std::nullopt;
    record.lastUpdatedBy = std::nullopt;
    return record;
}

std::optional<std::string> SimulationRecordMapper::normalizeGitUrl(const std::optional<std::string>& url) const {
    if (!url || url->empty()) {
        return std::nullopt;
    }
    if (StartsWith(*url, "https://") || StartsWith(*url, "http://")) {
        return url;
    }
    if (StartsWith(*url, "git@")) {
        const std::string hostAndPath = url->substr(4);
        auto colon = hostAndPath.find(':');
        if (colon == std::string::npos) {
            m_logger->warn("Could not normalize git URL: {}", *url);
            return url;
        }
        return "https://" + hostAndPath.substr(0, colon) + "/" + hostAndPath.substr(colon + 1);
    }
    return url;
}

std::optional<domain::UtcTime> SimulationRecordMapper::parseDateField(const std::optional<std::string>& value) const {
    if (!value || value->empty()) {
        return std::nullopt;
    }
    auto parsed = domain::ParseDateTime(*value);
    if (!parsed) {
        m_logger->warn("Could not parse date '{}'", *value);
    }
    return parsed;
}

domain::SimulationStatus SimulationRecordMapper::normalizeStatus(const std::optional<std::string>& raw) const {
    if (!IsBlank(raw) && !domain::SimulationStatusFromString(*raw)) {
        m_logger->warn("Unknown status '{}'; defaulting to '{}'.", *raw,
                       domain::ToString(domain::SimulationStatus::Created));
    }
    return domain::ParseSimulationStatus(raw);
}

domain::SimulationType SimulationRecordMapper::normalizeType(const std::optional<std::string>& raw) const {
    if (!IsBlank(raw) && !domain::SimulationTypeFromString(*raw)) {
        m_logger->warn("Unknown simulation_type '{}'; defaulting to '{}'.", *raw,
                       domain::ToString(domain::SimulationType::Unknown));
    }
    return domain::ParseSimulationType(raw);
}

} // namespace simboard::application
