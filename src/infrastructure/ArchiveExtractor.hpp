/**
 * @file ArchiveExtractor.hpp
 * @brief Validating extractor for .zip, .tar.gz and .tgz archives (libarchive).
 */

#pragma once
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>

namespace simboard::infrastructure {

/**
 * @class ArchiveExtractor
 * @brief Unpacks an archive only after every member has been checked.
 *
 * A member is accepted when it is a regular file or a directory and its path,
 * joined to the output directory and normalized, stays inside that directory.
 * Any rejected member aborts the extraction before a single byte is written.
 */
class ArchiveExtractor {
public:
    explicit ArchiveExtractor(std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Validates, then extracts archivePath into outputDir.
     * @throws domain::UnsupportedArchiveError for unknown extensions.
     * @throws domain::PathTraversalError, domain::UnsafeMemberError for rejected members.
     * @throws domain::ArchiveReadError when the container is corrupt or cannot be written out.
     */
    void extract(const std::filesystem::path& archivePath, const std::filesystem::path& outputDir) const;

    /** @brief True for names ending in .zip, .tar.gz or .tgz (case-insensitive). */
    static bool IsSupportedArchive(const std::filesystem::path& archivePath);

private:
    void validateMembers(const std::filesystem::path& archivePath, const std::filesystem::path& base) const;
    void writeMembers(const std::filesystem::path& archivePath, const std::filesystem::path& base) const;

    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace simboard::infrastructure
