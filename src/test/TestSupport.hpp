/**
 * @file TestSupport.hpp
 * @brief Fixture builders shared by the test executables.
 *
 * Experiment trees, gzip files and zip/tar.gz archives (including hostile ones)
 * are generated on the fly inside a temporary directory.
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <archive.h>
#include <archive_entry.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>
#include <zlib.h>
#include "domain/MachineRegistry.hpp"

namespace simboard::test {

namespace fs = std::filesystem;

/** @brief Unique scratch directory removed on destruction. */
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        static int counter = 0;
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = fs::temp_directory_path() /
                 ("simboard_test_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(++counter));
        fs::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

inline std::shared_ptr<spdlog::logger> NullLogger() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

inline void WriteText(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
    if (!out) throw std::runtime_error("Cannot write " + path.string());
}

inline void WriteGz(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    gzFile file = gzopen(path.string().c_str(), "wb");
    if (!file) throw std::runtime_error("Cannot open " + path.string());
    if (!content.empty()) {
        int written = gzwrite(file, content.data(), static_cast<unsigned>(content.size()));
        if (written != static_cast<int>(content.size())) {
            gzclose(file);
            throw std::runtime_error("Short gzip write to " + path.string());
        }
    }
    gzclose(file);
}

enum class EntryKind { File, Directory, Symlink, Hardlink };

struct ArchiveEntrySpec {
    std::string name;
    std::string content;
    EntryKind kind = EntryKind::File;
    std::string linkTarget;
};

/** @brief Writes a .zip (by extension) or a gzip-compressed pax tar. */
inline void WriteArchive(const fs::path& path, const std::vector<ArchiveEntrySpec>& entries) {
    struct archive* a = archive_write_new();
    const bool zip = path.extension() == ".zip";
    if (zip) {
        archive_write_set_format_zip(a);
    } else {
        archive_write_set_format_pax_restricted(a);
        archive_write_add_filter_gzip(a);
    }
    if (archive_write_open_filename(a, path.string().c_str()) != ARCHIVE_OK) {
        std::string error = archive_error_string(a) ? archive_error_string(a) : "unknown";
        archive_write_free(a);
        throw std::runtime_error("Cannot create archive " + path.string() + ": " + error);
    }

    for (const auto& spec : entries) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, spec.name.c_str());
        switch (spec.kind) {
            case EntryKind::File:
                archive_entry_set_filetype(entry, AE_IFREG);
                archive_entry_set_perm(entry, 0644);
                archive_entry_set_size(entry, static_cast<la_int64_t>(spec.content.size()));
                break;
            case EntryKind::Directory:
                archive_entry_set_filetype(entry, AE_IFDIR);
                archive_entry_set_perm(entry, 0755);
                break;
            case EntryKind::Symlink:
                archive_entry_set_filetype(entry, AE_IFLNK);
                archive_entry_set_perm(entry, 0777);
                archive_entry_set_symlink(entry, spec.linkTarget.c_str());
                break;
            case EntryKind::Hardlink:
                archive_entry_set_filetype(entry, AE_IFREG);
                archive_entry_set_perm(entry, 0644);
                archive_entry_set_hardlink(entry, spec.linkTarget.c_str());
                archive_entry_set_size(entry, 0);
                break;
        }
        archive_write_header(a, entry);
        if (spec.kind == EntryKind::File && !spec.content.empty()) {
            archive_write_data(a, spec.content.data(), spec.content.size());
        }
        archive_entry_free(entry);
    }
    archive_write_close(a);
    archive_write_free(a);
}

/** @brief In-memory machine table for tests. */
class FakeMachineRegistry : public domain::MachineRegistry {
public:
    explicit FakeMachineRegistry(std::map<std::string, std::string> ids) : m_ids(std::move(ids)) {}
    std::optional<std::string> findMachineId(const std::string& name) const override {
        auto it = m_ids.find(name);
        if (it == m_ids.end()) return std::nullopt;
        return it->second;
    }

private:
    std::map<std::string, std::string> m_ids;
};

/**
 * @struct ExperimentFixture
 * @brief Contents of one synthetic E3SM run directory.
 *
 * Empty optional strings omit the corresponding file.
 */
struct ExperimentFixture {
    std::string caseName = "v3.LR.historical_0121";
    std::string lid = "231010-120000";
    std::string machine = "chrysalis";
    std::string user = "ac.user";
    std::string currDate = "Tue Oct 10 12:00:00 2023";
    std::string gridAlias = "a%ne30np4.pg2_l%r05_oi%IcoswISC30E3r5";
    std::string compsetAlias = "WCYCL20TR";
    std::string runType = "hybrid";
    std::string res = "ne30pg2_r05";
    std::string compset = "WCYCL20TR";
    std::optional<std::string> runStartDate = std::string("1850-01-01");
    std::string stopOption = "nyears";
    std::string stopN = "5";
    bool runFinished = true;
    std::string caseRunStarted = "2023-10-10 12:00:00";
    std::string caseRunFinished = "2023-10-10 18:30:00";
    std::string gitDescribe = "v3.0.0-12-gabc1234";
    std::optional<std::string> gitUrl = std::string("git@github.com:E3SM-Project/E3SM.git");
    std::optional<std::string> gitBranch = std::string("master");
    std::optional<std::string> compiler = std::string("intel");
    std::optional<std::string> groupName = std::string("e3sm_group");
    bool includeCaseStatus = true;
    bool includeReadme = true;
};

inline std::string TimingText(const ExperimentFixture& f) {
    return "---------------- TIMING PROFILE ---------------------\n"
           "  Case        : " + f.caseName + "\n"
           "  LID         : " + f.lid + "\n"
           "  Machine     : " + f.machine + "\n"
           "  Caseroot    : /lcrc/group/e3sm/" + f.user + "/" + f.caseName + "/case_scripts\n"
           "  Timeroot    : /lcrc/group/e3sm/" + f.user + "/" + f.caseName + "/case_scripts/Tools\n"
           "  User        : " + f.user + "\n"
           "  Curr Date   : " + f.currDate + "\n"
           "  Driver      : cpl\n"
           "  grid        : " + f.gridAlias + "\n"
           "  compset     : " + f.compsetAlias + "\n"
           "  run type    : " + f.runType + ", continue_run = FALSE (inittype = TRUE)\n"
           "  stop option : " + f.stopOption + ", stop_n = " + f.stopN + "\n"
           "  run length  : 1825 days (1824.9791666666667 for ocean)\n";
}

inline std::string CaseStatusText(const ExperimentFixture& f) {
    std::string text = "2023-10-10 11:58:00: case.setup starting\n"
                       "2023-10-10 11:58:30: case.setup success\n";
    if (f.runStartDate) {
        text += "2023-10-10 11:59:00: xmlchange success <command> ./xmlchange RUN_STARTDATE=" +
                *f.runStartDate + " </command>\n";
    }
    text += "2023-10-10 11:59:10: xmlchange success <command> ./xmlchange STOP_OPTION=" + f.stopOption +
            ",STOP_N=" + f.stopN + " </command>\n";
    text += f.caseRunStarted + ": case.run starting 512345\n";
    if (f.runFinished) {
        text += f.caseRunFinished + ": case.run success\n";
    }
    return text;
}

inline std::string EnvXml(const std::string& id, const std::string& value) {
    return "<?xml version=\"1.0\"?>\n<file id=\"env.xml\" version=\"2.0\">\n  <group id=\"build\">\n"
           "    <entry id=\"" + id + "\" value=\"" + value + "\">\n      <type>char</type>\n    </entry>\n"
           "  </group>\n</file>\n";
}

/** @brief Writes the files of one experiment under root/relativeDir. */
inline fs::path WriteExperiment(const fs::path& root, const std::string& relativeDir, const ExperimentFixture& f) {
    const fs::path dir = root / relativeDir;
    const fs::path docs = dir / ("CaseDocs." + f.lid);
    fs::create_directories(docs);

    WriteText(dir / ("e3sm_timing." + f.caseName + "." + f.lid), TimingText(f));
    if (f.includeCaseStatus) {
        WriteGz(dir / ("CaseStatus." + f.lid + ".gz"), CaseStatusText(f));
    }
    WriteGz(dir / ("GIT_DESCRIBE." + f.lid + ".gz"), f.gitDescribe + "\n");
    if (f.gitUrl) {
        WriteGz(dir / ("GIT_CONFIG." + f.lid + ".gz"),
                "[core]\n\trepositoryformatversion = 0\n[remote \"origin\"]\n\turl = " + *f.gitUrl +
                    "\n\tfetch = +refs/heads/*:refs/remotes/origin/*\n[branch \"master\"]\n\tremote = origin\n");
    }
    if (f.gitBranch) {
        WriteGz(dir / ("GIT_STATUS." + f.lid + ".gz"),
                "On branch " + *f.gitBranch + "\nYour branch is up to date with 'origin/" + *f.gitBranch + "'.\n");
    }
    if (f.includeReadme) {
        WriteGz(docs / ("README.case." + f.lid + ".gz"),
                "2023-10-10 11:57:00: ./create_newcase --case " + f.caseName + " --res " + f.res +
                    " --compset " + f.compset + " --mach " + f.machine + "\n");
    }
    if (f.groupName) {
        WriteGz(docs / ("env_case.xml." + f.lid + ".gz"), EnvXml("CASE_GROUP", *f.groupName));
    }
    if (f.compiler) {
        WriteGz(docs / ("env_build.xml." + f.lid + ".gz"), EnvXml("COMPILER", *f.compiler));
    }
    return dir;
}

/** @brief Archive entries mirroring every file under root, with names relative to root. */
inline std::vector<ArchiveEntrySpec> EntriesFromTree(const fs::path& root) {
    std::vector<ArchiveEntrySpec> entries;
    std::vector<fs::path> paths;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        paths.push_back(entry.path());
    }
    std::sort(paths.begin(), paths.end());
    for (const auto& p : paths) {
        ArchiveEntrySpec spec;
        spec.name = p.lexically_relative(root).generic_string();
        if (fs::is_directory(p)) {
            spec.kind = EntryKind::Directory;
            spec.name += "/";
        } else {
            std::ifstream in(p, std::ios::binary);
            spec.content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }
        entries.push_back(std::move(spec));
    }
    return entries;
}

} // namespace simboard::test
