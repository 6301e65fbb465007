/**
 * @file GitInfoParser.hpp
 * @brief Parsers for the GIT_DESCRIBE, GIT_STATUS and GIT_CONFIG captures.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "domain/SimulationMetadata.hpp"

namespace simboard::application::parsers {

class GitInfoParser {
public:
    /**
     * @brief git describe output to git_tag and git_commit_hash.
     * @throws domain::FileReadError if the file cannot be read.
     */
    domain::FieldMap parseDescribe(const std::filesystem::path& path) const;
    domain::FieldMap parseDescribeText(const std::string& text) const;

    /** @brief Current branch from "On branch <name>". */
    std::optional<std::string> parseStatus(const std::filesystem::path& path) const;
    std::optional<std::string> parseStatusText(const std::string& text) const;

    /** @brief url of the [remote "origin"] section. */
    std::optional<std::string> parseConfig(const std::filesystem::path& path) const;
    std::optional<std::string> parseConfigText(const std::string& text) const;
};

} // namespace simboard::application::parsers
