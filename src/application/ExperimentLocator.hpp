/**
 * @file ExperimentLocator.hpp
 * @brief Discovers experiment directories and the metadata files inside them.
 */

#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "application/FileSpecRegistry.hpp"

namespace simboard::application {

/**
 * @struct LocatedFiles
 * @brief Files found for one experiment, keyed by FileSpec::key.
 */
struct LocatedFiles {
    std::filesystem::path experimentDir;
    std::map<std::string, std::filesystem::path> files;
    std::vector<std::string> missingRequired;
    std::vector<std::string> missingOptional;

    bool isComplete() const { return missingRequired.empty(); }
};

/**
 * @class ExperimentLocator
 * @brief Filesystem adapter that walks an extracted archive.
 */
class ExperimentLocator {
public:
    ExperimentLocator(std::shared_ptr<const FileSpecRegistry> registry, std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Recursively collects directories named <digits>.<digits>-<digits>.
     * @return Paths sorted lexicographically.
     * @throws domain::NoExperimentDirectoriesError if none exist.
     */
    std::vector<std::filesystem::path> findExperimentDirs(const std::filesystem::path& rootDir) const;

    /**
     * @brief Resolves every FileSpec inside one experiment directory.
     * @throws domain::AmbiguousFileMatchError if one directory holds two matches for a spec.
     */
    LocatedFiles locateFiles(const std::filesystem::path& experimentDir) const;

    /** @brief True when a directory name is an experiment (run attempt) name. */
    static bool IsExperimentDirName(const std::string& name);

private:
    std::optional<std::filesystem::path> findInDirectory(const std::filesystem::path& directory,
                                                         const FileSpec& spec) const;
    std::optional<std::filesystem::path> findInNestedSubdirs(const std::filesystem::path& experimentDir,
                                                             const FileSpec& spec) const;

    std::shared_ptr<const FileSpecRegistry> m_registry;
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace simboard::application
