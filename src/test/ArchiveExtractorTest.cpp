#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

#include "domain/IngestionErrors.hpp"
#include "infrastructure/ArchiveExtractor.hpp"
#include "TestSupport.hpp"

using namespace simboard;
using namespace simboard::test;
namespace fs = std::filesystem;

namespace {

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

template <typename Error>
bool Throws(const infrastructure::ArchiveExtractor& extractor, const fs::path& archive, const fs::path& out) {
    try {
        extractor.extract(archive, out);
    } catch (const Error& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

void TestExtractsWellFormedArchives(const infrastructure::ArchiveExtractor& extractor) {
    std::cout << "[Test] Extracting zip and tar.gz archives..." << std::endl;
    TempDir tmp("extract_ok");
    const std::vector<ArchiveEntrySpec> entries = {
        {"case/", "", EntryKind::Directory, ""},
        {"case/1.0-1/", "", EntryKind::Directory, ""},
        {"case/1.0-1/notes.txt", "hello archive\n", EntryKind::File, ""},
        {"case/1.0-1/empty.txt", "", EntryKind::File, ""},
    };

    for (const char* name : {"sample.zip", "sample.tar.gz", "sample.tgz"}) {
        const fs::path archive = tmp.path() / name;
        WriteArchive(archive, entries);
        const fs::path out = tmp.path() / (std::string("out_") + name);
        extractor.extract(archive, out);

        assert(fs::is_directory(out / "case" / "1.0-1"));
        assert(ReadFile(out / "case" / "1.0-1" / "notes.txt") == "hello archive\n");
        assert(fs::is_regular_file(out / "case" / "1.0-1" / "empty.txt"));
        assert(fs::file_size(out / "case" / "1.0-1" / "empty.txt") == 0);
    }
    std::cout << "[PASS] Archives extracted." << std::endl;
}

void TestRejectsUnsupportedFormat(const infrastructure::ArchiveExtractor& extractor) {
    std::cout << "[Test] Rejecting unsupported extensions..." << std::endl;
    TempDir tmp("extract_format");
    const fs::path archive = tmp.path() / "sample.rar";
    WriteText(archive, "not an archive");
    const fs::path out = tmp.path() / "out";

    assert(Throws<domain::UnsupportedArchiveError>(extractor, archive, out));
    assert(!fs::exists(out));
    assert(!infrastructure::ArchiveExtractor::IsSupportedArchive("a.tar"));
    assert(!infrastructure::ArchiveExtractor::IsSupportedArchive("a.gz"));
    assert(infrastructure::ArchiveExtractor::IsSupportedArchive("A.ZIP"));
    assert(infrastructure::ArchiveExtractor::IsSupportedArchive("a.TGZ"));
    std::cout << "[PASS] Unsupported formats rejected." << std::endl;
}

void TestRejectsPathTraversal(const infrastructure::ArchiveExtractor& extractor) {
    std::cout << "[Test] Rejecting path traversal members..." << std::endl;
    TempDir tmp("extract_traversal");

    const std::vector<std::vector<ArchiveEntrySpec>> hostile = {
        {{"ok/a.txt", "fine", EntryKind::File, ""}, {"../evil.txt", "pwned", EntryKind::File, ""}},
        {{"ok/a.txt", "fine", EntryKind::File, ""}, {"a/../../evil.txt", "pwned", EntryKind::File, ""}},
    };

    int index = 0;
    for (const auto& entries : hostile) {
        for (const char* ext : {".zip", ".tar.gz"}) {
            const fs::path archive = tmp.path() / ("hostile" + std::to_string(index++) + ext);
            WriteArchive(archive, entries);
            const fs::path out = tmp.path() / "work" / "out";

            assert(Throws<domain::PathTraversalError>(extractor, archive, out));
            // Validation runs before anything touches the disk.
            assert(!fs::exists(out));
            assert(!fs::exists(tmp.path() / "work" / "evil.txt"));
            assert(!fs::exists(tmp.path() / "evil.txt"));
        }
    }
    std::cout << "[PASS] Traversal members rejected with nothing written." << std::endl;
}

void TestRejectsLinks(const infrastructure::ArchiveExtractor& extractor) {
    std::cout << "[Test] Rejecting symlink and hard link members..." << std::endl;
    TempDir tmp("extract_links");

    const fs::path symlinkArchive = tmp.path() / "symlink.tar.gz";
    WriteArchive(symlinkArchive, {{"data/a.txt", "fine", EntryKind::File, ""},
                                  {"data/link", "", EntryKind::Symlink, "/etc/passwd"}});
    const fs::path out1 = tmp.path() / "out1";
    assert(Throws<domain::UnsafeMemberError>(extractor, symlinkArchive, out1));
    assert(!fs::exists(out1));

    const fs::path hardlinkArchive = tmp.path() / "hardlink.tar.gz";
    WriteArchive(hardlinkArchive, {{"data/a.txt", "fine", EntryKind::File, ""},
                                   {"data/b.txt", "", EntryKind::Hardlink, "data/a.txt"}});
    const fs::path out2 = tmp.path() / "out2";
    assert(Throws<domain::UnsafeMemberError>(extractor, hardlinkArchive, out2));
    assert(!fs::exists(out2));
    std::cout << "[PASS] Link members rejected." << std::endl;
}

void TestRejectsCorruptContainer(const infrastructure::ArchiveExtractor& extractor) {
    std::cout << "[Test] Rejecting corrupt containers..." << std::endl;
    TempDir tmp("extract_corrupt");
    const fs::path archive = tmp.path() / "broken.tar.gz";
    WriteText(archive, std::string(4096, 'x'));
    const fs::path out = tmp.path() / "out";

    assert(Throws<domain::ArchiveReadError>(extractor, archive, out));
    assert(!fs::exists(out));
    std::cout << "[PASS] Corrupt container rejected." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ArchiveExtractor Test..." << std::endl;
    infrastructure::ArchiveExtractor extractor(NullLogger());

    TestExtractsWellFormedArchives(extractor);
    TestRejectsUnsupportedFormat(extractor);
    TestRejectsPathTraversal(extractor);
    TestRejectsLinks(extractor);
    TestRejectsCorruptContainer(extractor);

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
