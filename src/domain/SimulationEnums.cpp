/**
 * @file SimulationEnums.cpp
 * @brief Implementation of the enum conversions.
 */

#include "domain/SimulationEnums.hpp"
#include <algorithm>
#include <cctype>

namespace simboard::domain {

namespace {

std::string NormalizeToken(const std::string& raw) {
    std::string s = raw;
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    if (!s.empty()) s.erase(s.find_last_not_of(" \t\r\n") + 1);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

} // namespace

std::string ToString(SimulationStatus status) {
    switch (status) {
        case SimulationStatus::Unknown: return "unknown";
        case SimulationStatus::Created: return "created";
        case SimulationStatus::Queued: return "queued";
        case SimulationStatus::Running: return "running";
        case SimulationStatus::Failed: return "failed";
        case SimulationStatus::Completed: return "completed";
    }
    return "unknown";
}

std::string ToString(SimulationType type) {
    switch (type) {
        case SimulationType::Unknown: return "unknown";
        case SimulationType::Production: return "production";
        case SimulationType::Experimental: return "experimental";
        case SimulationType::Test: return "test";
    }
    return "unknown";
}

std::string ToString(IngestionStatus status) {
    switch (status) {
        case IngestionStatus::Success: return "success";
        case IngestionStatus::Partial: return "partial";
        case IngestionStatus::Failed: return "failed";
    }
    return "failed";
}

std::optional<SimulationStatus> SimulationStatusFromString(const std::string& raw) {
    const std::string token = NormalizeToken(raw);
    for (auto candidate : {SimulationStatus::Unknown, SimulationStatus::Created, SimulationStatus::Queued,
                           SimulationStatus::Running, SimulationStatus::Failed, SimulationStatus::Completed}) {
        if (ToString(candidate) == token) return candidate;
    }
    return std::nullopt;
}

std::optional<SimulationType> SimulationTypeFromString(const std::string& raw) {
    const std::string token = NormalizeToken(raw);
    for (auto candidate : {SimulationType::Unknown, SimulationType::Production,
                           SimulationType::Experimental, SimulationType::Test}) {
        if (ToString(candidate) == token) return candidate;
    }
    return std::nullopt;
}

SimulationStatus ParseSimulationStatus(const std::optional<std::string>& raw) {
    if (!raw) return SimulationStatus::Created;
    return SimulationStatusFromString(*raw).value_or(SimulationStatus::Created);
}

SimulationType ParseSimulationType(const std::optional<std::string>& raw) {
    if (!raw) return SimulationType::Unknown;
    return SimulationTypeFromString(*raw).value_or(SimulationType::Unknown);
}

} // namespace simboard::domain
