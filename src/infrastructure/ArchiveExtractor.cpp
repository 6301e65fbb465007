/**
 * @file ArchiveExtractor.cpp
 * @brief Implementation of ArchiveExtractor.
 */

#include "infrastructure/ArchiveExtractor.hpp"
#include "domain/IngestionErrors.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <archive.h>
#include <archive_entry.h>

namespace simboard::infrastructure {

namespace fs = std::filesystem;
using namespace simboard::domain;

namespace {

using ArchivePtr = std::unique_ptr<struct archive, int (*)(struct archive*)>;

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool IsZip(const fs::path& archivePath) {
    return EndsWith(ToLower(archivePath.filename().string()), ".zip");
}

std::string ErrorString(struct archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown libarchive error";
}

ArchivePtr OpenReader(const fs::path& archivePath) {
    ArchivePtr reader(archive_read_new(), archive_read_free);
    if (!reader) {
        throw ArchiveReadError("Failed to allocate archive reader");
    }
    if (IsZip(archivePath)) {
        archive_read_support_format_zip(reader.get());
    } else {
        archive_read_support_filter_gzip(reader.get());
        archive_read_support_format_tar(reader.get());
    }
    if (archive_read_open_filename(reader.get(), archivePath.string().c_str(), 10240) != ARCHIVE_OK) {
        throw ArchiveReadError("Failed to open archive " + archivePath.string() + ": " +
                               ErrorString(reader.get()));
    }
    return reader;
}

/// Normalized absolute form without a trailing separator.
fs::path NormalizeBase(const fs::path& outputDir) {
    fs::path base = fs::absolute(outputDir).lexically_normal();
    if (!base.has_filename() && base.has_parent_path() && base != base.root_path()) {
        base = base.parent_path();
    }
    return base;
}

/// Target of a member inside base, or std::nullopt when it would escape base.
std::optional<fs::path> ResolveMember(const fs::path& base, const std::string& memberName) {
    fs::path member(memberName);
    if (member.is_absolute() || member.has_root_name() || member.has_root_directory()) {
        return std::nullopt;
    }
    fs::path target = (base / member).lexically_normal();
    fs::path relative = target.lexically_relative(base);
    if (relative.empty()) {
        return std::nullopt;
    }
    auto first = relative.begin();
    if (first != relative.end() && first->string() == "..") {
        return std::nullopt;
    }
    return target;
}

const char* DescribeType(struct archive_entry* entry) {
    if (archive_entry_hardlink(entry)) return "hard link";
    switch (archive_entry_filetype(entry)) {
        case AE_IFLNK: return "symlink";
        case AE_IFCHR: return "character device";
        case AE_IFBLK: return "block device";
        case AE_IFIFO: return "fifo";
        case AE_IFSOCK: return "socket";
        default: return "unknown type";
    }
}

bool IsSafeType(struct archive_entry* entry) {
    if (archive_entry_hardlink(entry)) return false;
    auto type = archive_entry_filetype(entry);
    return type == AE_IFREG || type == AE_IFDIR;
}

} // namespace

ArchiveExtractor::ArchiveExtractor(std::shared_ptr<spdlog::logger> logger)
    : m_logger(std::move(logger)) {}

bool ArchiveExtractor::IsSupportedArchive(const fs::path& archivePath) {
    const std::string name = ToLower(archivePath.filename().string());
    return EndsWith(name, ".zip") || EndsWith(name, ".tar.gz") || EndsWith(name, ".tgz");
}

void ArchiveExtractor::extract(const fs::path& archivePath, const fs::path& outputDir) const {
    if (!IsSupportedArchive(archivePath)) {
        throw UnsupportedArchiveError("Unsupported archive format: " + archivePath.filename().string());
    }

    const fs::path base = NormalizeBase(outputDir);
    validateMembers(archivePath, base);

    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        throw ArchiveReadError("Failed to create output directory " + base.string() + ": " + ec.message());
    }
    writeMembers(archivePath, base);
    m_logger->info("Extracted {} into {}", archivePath.string(), base.string());
}

void ArchiveExtractor::validateMembers(const fs::path& archivePath, const fs::path& base) const {
    ArchivePtr reader = OpenReader(archivePath);
    struct archive_entry* entry = nullptr;
    std::size_t count = 0;

    while (true) {
        int status = archive_read_next_header(reader.get(), &entry);
        if (status == ARCHIVE_EOF) break;
        if (status == ARCHIVE_WARN) {
            m_logger->warn("Archive warning in {}: {}", archivePath.string(), ErrorString(reader.get()));
        } else if (status != ARCHIVE_OK) {
            throw ArchiveReadError("Corrupt archive " + archivePath.string() + ": " + ErrorString(reader.get()));
        }

        const char* rawName = archive_entry_pathname(entry);
        const std::string name = rawName ? rawName : "";
        if (!ResolveMember(base, name)) {
            throw PathTraversalError("Path traversal detected in archive member: " + name);
        }
        if (!IsSafeType(entry)) {
            throw UnsafeMemberError("Unsafe member type (" + std::string(DescribeType(entry)) +
                                    ") in archive member: " + name);
        }

        if (archive_read_data_skip(reader.get()) != ARCHIVE_OK) {
            throw ArchiveReadError("Corrupt archive " + archivePath.string() + ": " + ErrorString(reader.get()));
        }
        ++count;
    }
    m_logger->debug("Validated {} members of {}", count, archivePath.string());
}

void ArchiveExtractor::writeMembers(const fs::path& archivePath, const fs::path& base) const {
    ArchivePtr reader = OpenReader(archivePath);
    ArchivePtr writer(archive_write_disk_new(), archive_write_free);
    if (!writer) {
        throw ArchiveReadError("Failed to allocate disk writer");
    }
    archive_write_disk_set_options(writer.get(),
                                   ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                       ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(writer.get());

    struct archive_entry* entry = nullptr;
    while (true) {
        int status = archive_read_next_header(reader.get(), &entry);
        if (status == ARCHIVE_EOF) break;
        if (status != ARCHIVE_OK && status != ARCHIVE_WARN) {
            throw ArchiveReadError("Corrupt archive " + archivePath.string() + ": " + ErrorString(reader.get()));
        }

        const char* rawName = archive_entry_pathname(entry);
        auto target = ResolveMember(base, rawName ? rawName : "");
        if (!target) {
            throw PathTraversalError("Path traversal detected in archive member: " +
                                     std::string(rawName ? rawName : ""));
        }
        archive_entry_copy_pathname(entry, target->string().c_str());

        if (archive_write_header(writer.get(), entry) != ARCHIVE_OK) {
            throw ArchiveReadError("Failed to write " + target->string() + ": " + ErrorString(writer.get()));
        }

        if (archive_entry_filetype(entry) == AE_IFREG) {
            const void* block = nullptr;
            size_t size = 0;
            la_int64_t offset = 0;
            while (true) {
                int r = archive_read_data_block(reader.get(), &block, &size, &offset);
                if (r == ARCHIVE_EOF) break;
                if (r != ARCHIVE_OK) {
                    throw ArchiveReadError("Failed to read member data: " + ErrorString(reader.get()));
                }
                if (archive_write_data_block(writer.get(), block, size, offset) != ARCHIVE_OK) {
                    throw ArchiveReadError("Failed to write " + target->string() + ": " +
                                           ErrorString(writer.get()));
                }
            }
        }

        if (archive_write_finish_entry(writer.get()) != ARCHIVE_OK) {
            throw ArchiveReadError("Failed to finish " + target->string() + ": " + ErrorString(writer.get()));
        }
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        throw ArchiveReadError("Failed to close disk writer: " + ErrorString(writer.get()));
    }
}

} // namespace simboard::infrastructure
