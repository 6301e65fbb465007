// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace simboard::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /// $XDG_CONFIG_HOME/SimBoard/settings.json
    static std::filesystem::path GetDefaultSettingsPath();
    /// $XDG_CONFIG_HOME/SimBoard/machines.json
    static std::filesystem::path GetDefaultMachinesPath();
    /// $XDG_DATA_HOME/SimBoard/simulations.json
    static std::filesystem::path GetDefaultStorePath();
    /// Fresh directory under the system temp dir for one ingestion pass.
    static std::filesystem::path CreateWorkDir();
};

} // namespace simboard::infrastructure
