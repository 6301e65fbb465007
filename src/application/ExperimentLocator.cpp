/**
 * @file ExperimentLocator.cpp
 * @brief Implementation of ExperimentLocator.
 */

#include "application/ExperimentLocator.hpp"
#include "domain/IngestionErrors.hpp"
#include <algorithm>
#include <regex>

namespace simboard::application {

namespace fs = std::filesystem;

namespace {

const std::regex kExperimentDir(R"(\d+\.\d+-\d+)");

std::vector<fs::path> SortedChildren(const fs::path& directory) {
    std::vector<fs::path> children;
    for (const auto& entry : fs::directory_iterator(directory)) {
        children.push_back(entry.path());
    }
    std::sort(children.begin(), children.end());
    return children;
}

} // namespace

ExperimentLocator::ExperimentLocator(std::shared_ptr<const FileSpecRegistry> registry,
                                     std::shared_ptr<spdlog::logger> logger)
    : m_registry(std::move(registry)), m_logger(std::move(logger)) {}

bool ExperimentLocator::IsExperimentDirName(const std::string& name) {
    return std::regex_match(name, kExperimentDir);
}

std::vector<fs::path> ExperimentLocator::findExperimentDirs(const fs::path& rootDir) const {
    std::vector<fs::path> matches;
    if (fs::is_directory(rootDir)) {
        for (const auto& entry : fs::recursive_directory_iterator(rootDir)) {
            if (entry.is_directory() && IsExperimentDirName(entry.path().filename().string())) {
                matches.push_back(entry.path());
            }
        }
    }

    if (matches.empty()) {
        throw domain::NoExperimentDirectoriesError(
            "No experiment directories found in '" + rootDir.string() +
            "'. Expected directory names matching pattern: <digits>.<digits>-<digits>");
    }

    // Plain string order; fs::path compares component-wise and would put "a/x" before "a-b/x".
    std::sort(matches.begin(), matches.end(),
              [](const fs::path& a, const fs::path& b) { return a.string() < b.string(); });
    m_logger->info("Found {} experiment directories.", matches.size());
    return matches;
}

LocatedFiles ExperimentLocator::locateFiles(const fs::path& experimentDir) const {
    LocatedFiles located;
    located.experimentDir = experimentDir;

    for (const auto& spec : m_registry->specs()) {
        std::optional<fs::path> match = spec.location == FileLocation::Root
                                            ? findInDirectory(experimentDir, spec)
                                            : findInNestedSubdirs(experimentDir, spec);
        if (match) {
            located.files[spec.key] = *match;
        } else if (spec.required) {
            located.missingRequired.push_back(spec.key);
        } else {
            located.missingOptional.push_back(spec.key);
        }
    }
    return located;
}

std::optional<fs::path> ExperimentLocator::findInDirectory(const fs::path& directory, const FileSpec& spec) const {
    std::vector<fs::path> matches;
    for (const auto& child : SortedChildren(directory)) {
        if (fs::is_regular_file(child) && spec.matches(child.filename().string())) {
            matches.push_back(child);
        }
    }

    if (matches.size() > 1) {
        std::string names;
        for (const auto& m : matches) {
            names += (names.empty() ? "" : ", ") + m.filename().string();
        }
        throw domain::AmbiguousFileMatchError("Multiple files matching pattern '" + spec.pattern + "' found in " +
                                              directory.string() + ": " + names);
    }
    if (matches.empty()) {
        return std::nullopt;
    }
    return matches.front();
}

std::optional<fs::path> ExperimentLocator::findInNestedSubdirs(const fs::path& experimentDir,
                                                               const FileSpec& spec) const {
    for (const auto& child : SortedChildren(experimentDir)) {
        const std::string name = child.filename().string();
        if (!fs::is_directory(child) || name.rfind(spec.subdirPrefix, 0) != 0) {
            continue;
        }
        if (auto match = findInDirectory(child, spec)) {
            return match;
        }
    }
    return std::nullopt;
}

} // namespace simboard::application
