/**
 * @file SimulationRecord.cpp
 * @brief JSON conversion of SimulationRecord.
 */

#include "domain/SimulationRecord.hpp"
#include <stdexcept>

namespace simboard::domain {

using json = nlohmann::json;

namespace {

json OptionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json OptionalToJson(const std::optional<UtcTime>& value) {
    return value ? json(FormatIsoUtc(*value)) : json(nullptr);
}

std::optional<std::string> OptionalString(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

UtcTime RequiredTime(const json& j, const char* key) {
    auto parsed = ParseDateTime(j.at(key).get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string("Invalid timestamp in field '") + key + "'");
    }
    return *parsed;
}

std::optional<UtcTime> OptionalTime(const json& j, const char* key) {
    auto text = OptionalString(j, key);
    if (!text) return std::nullopt;
    return ParseDateTime(*text);
}

} // namespace

json ToJson(const SimulationRecord& record) {
    json j;
    j["name"] = record.name;
    j["caseName"] = record.caseName;
    j["compset"] = record.compset;
    j["compsetAlias"] = record.compsetAlias;
    j["gridName"] = record.gridName;
    j["gridResolution"] = record.gridResolution;
    j["parentSimulationId"] = OptionalToJson(record.parentSimulationId);
    j["simulationType"] = ToString(record.simulationType);
    j["status"] = ToString(record.status);
    j["initializationType"] = record.initializationType;
    j["machineId"] = record.machineId;
    j["simulationStartDate"] = FormatIsoUtc(record.simulationStartDate);
    j["simulationEndDate"] = OptionalToJson(record.simulationEndDate);
    j["experimentType"] = OptionalToJson(record.experimentType);
    j["campaign"] = OptionalToJson(record.campaign);
    j["groupName"] = OptionalToJson(record.groupName);
    j["runStartDate"] = OptionalToJson(record.runStartDate);
    j["runEndDate"] = OptionalToJson(record.runEndDate);
    j["compiler"] = OptionalToJson(record.compiler);
    j["gitRepositoryUrl"] = OptionalToJson(record.gitRepositoryUrl);
    j["gitBranch"] = OptionalToJson(record.gitBranch);
    j["gitTag"] = OptionalToJson(record.gitTag);
    j["gitCommitHash"] = OptionalToJson(record.gitCommitHash);
    j["hpcUsername"] = OptionalToJson(record.hpcUsername);
    j["createdBy"] = OptionalToJson(record.createdBy);
    j["lastUpdatedBy"] = OptionalToJson(record.lastUpdatedBy);
    j["extra"] = record.extra;
    return j;
}

SimulationRecord SimulationRecordFromJson(const json& j) {
    SimulationRecord record;
    record.name = j.at("name").get<std::string>();
    record.caseName = j.at("caseName").get<std::string>();
    record.compset = j.at("compset").get<std::string>();
    record.compsetAlias = j.at("compsetAlias").get<std::string>();
    record.gridName = j.at("gridName").get<std::string>();
    record.gridResolution = j.at("gridResolution").get<std::string>();
    record.parentSimulationId = OptionalString(j, "parentSimulationId");
    record.simulationType = ParseSimulationType(OptionalString(j, "simulationType"));
    record.status = ParseSimulationStatus(OptionalString(j, "status"));
    record.initializationType = j.at("initializationType").get<std::string>();
    record.machineId = j.at("machineId").get<std::string>();
    record.simulationStartDate = RequiredTime(j, "simulationStartDate");
    record.simulationEndDate = OptionalTime(j, "simulationEndDate");
    record.experimentType = OptionalString(j, "experimentType");
    record.campaign = OptionalString(j, "campaign");
    record.groupName = OptionalString(j, "groupName");
    record.runStartDate = OptionalTime(j, "runStartDate");
    record.runEndDate = OptionalTime(j, "runEndDate");
    record.compiler = OptionalString(j, "compiler");
    record.gitRepositoryUrl = OptionalString(j, "gitRepositoryUrl");
    record.gitBranch = OptionalString(j, "gitBranch");
    record.gitTag = OptionalString(j, "gitTag");
    record.gitCommitHash = OptionalString(j, "gitCommitHash");
    record.hpcUsername = OptionalString(j, "hpcUsername");
    record.createdBy = OptionalString(j, "createdBy");
    record.lastUpdatedBy = OptionalString(j, "lastUpdatedBy");
    if (j.contains("extra") && j["extra"].is_object()) {
        record.extra = j["extra"];
    }
    return record;
}

} // namespace simboard::domain
