/**
 * @file FileSpecRegistry.hpp
 * @brief Declarative table of the metadata files expected in an experiment directory.
 */

#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "domain/IngestionConfig.hpp"
#include "domain/SimulationMetadata.hpp"

namespace simboard::application {

/** @brief Where a file is searched relative to the experiment directory. */
enum class FileLocation {
    Root,        ///< Direct children of the experiment directory.
    NestedSubdir ///< Inside child directories whose name starts with FileSpec::subdirPrefix.
};

/**
 * @struct FileSpec
 * @brief One expected file: how to find it and how to turn it into metadata fields.
 *
 * Exactly one of parser and valueParser is set. A valueParser returns a single
 * scalar that the assembler stores under singleValueField.
 */
struct FileSpec {
    std::string key;
    std::string pattern;
    std::regex regex;
    FileLocation location = FileLocation::Root;
    std::string subdirPrefix;
    bool required = false;
    std::function<domain::FieldMap(const std::filesystem::path&)> parser;
    std::function<std::optional<std::string>(const std::filesystem::path&)> valueParser;
    std::optional<std::string> singleValueField;
    /// Fields only this file may set; its null replaces a value merged from an earlier file.
    std::vector<std::string> ownedFields;

    /** @brief Whole-name match of a file name against the spec pattern. */
    bool matches(const std::string& fileName) const;
};

/**
 * @class FileSpecRegistry
 * @brief Ordered list of FileSpecs; the order is also the metadata merge order.
 */
class FileSpecRegistry {
public:
    explicit FileSpecRegistry(std::vector<FileSpec> specs);

    /**
     * @brief The E3SM performance-archive layout: timing, README.case, CaseStatus,
     * env_case.xml, env_build.xml, GIT_DESCRIBE, GIT_CONFIG and GIT_STATUS.
     */
    static std::shared_ptr<FileSpecRegistry> CreateDefault(const domain::IngestionConfig& config,
                                                           std::shared_ptr<spdlog::logger> logger);

    const std::vector<FileSpec>& specs() const { return m_specs; }

private:
    std::vector<FileSpec> m_specs;
};

} // namespace simboard::application
