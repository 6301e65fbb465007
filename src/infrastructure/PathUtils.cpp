#include "infrastructure/PathUtils.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <unistd.h>

namespace simboard::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path FromEnvOrHome(const char* variable, const fs::path& homeRelative) {
    const char* value = std::getenv(variable);
    if (value && *value) {
        return fs::path(value);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path(); // Fallback
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return FromEnvOrHome("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return FromEnvOrHome("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / "SimBoard" / "settings.json";
}

fs::path PathUtils::GetDefaultMachinesPath() {
    return GetConfigHome() / "SimBoard" / "machines.json";
}

fs::path PathUtils::GetDefaultStorePath() {
    return GetDataHome() / "SimBoard" / "simulations.json";
}

fs::path PathUtils::CreateWorkDir() {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() /
                   ("simboard_ingest_" + std::to_string(::getpid()) + "_" + std::to_string(stamp));
    if (!fs::create_directories(dir)) {
        throw std::runtime_error("Work directory already exists: " + dir.string());
    }
    return dir;
}

} // namespace simboard::infrastructure
