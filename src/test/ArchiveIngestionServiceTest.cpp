#include <cassert>
#include <filesystem>
#include <iostream>

#include "application/ArchiveIngestionService.hpp"
#include "domain/IngestionErrors.hpp"
#include "infrastructure/ArchiveExtractor.hpp"
#include "infrastructure/JsonSimulationStore.hpp"
#include "TestSupport.hpp"

using namespace simboard;
using namespace simboard::test;
namespace fs = std::filesystem;

namespace {

const std::string kRunDir = "1084937.231010-120000";

std::unique_ptr<application::ArchiveIngestionService> MakeService(
    std::shared_ptr<const domain::SimulationStore> store) {
    auto logger = NullLogger();
    auto machines = std::make_shared<FakeMachineRegistry>(
        std::map<std::string, std::string>{{"chrysalis", "machine-1"}, {"pm-cpu", "machine-2"}});
    return std::make_unique<application::ArchiveIngestionService>(
        std::make_unique<infrastructure::ArchiveExtractor>(logger), machines, std::move(store),
        domain::IngestionConfig{}, logger);
}

std::shared_ptr<infrastructure::JsonSimulationStore> MakeStore(const fs::path& path) {
    return std::make_shared<infrastructure::JsonSimulationStore>(path, NullLogger());
}

void CheckHistoricalRecord(const domain::SimulationRecord& record) {
    assert(record.name == "v3.LR.historical_0121");
    assert(record.caseName == "v3.LR.historical_0121");
    assert(record.machineId == "machine-1");
    assert(record.compset == "WCYCL20TR");
    assert(record.compsetAlias == "WCYCL20TR");
    assert(record.gridName == "ne30pg2_r05");
    assert(record.gridResolution == "a%ne30np4.pg2_l%r05_oi%IcoswISC30E3r5");
    assert(record.initializationType == "hybrid");
    assert(*record.campaign == "v3.LR.historical");
    assert(*record.experimentType == "historical");
    assert(*record.groupName == "e3sm_group");
    assert(record.status == domain::SimulationStatus::Completed);
    assert(record.simulationType == domain::SimulationType::Unknown);
    assert(domain::FormatIsoUtc(record.simulationStartDate) == "1850-01-01T00:00:00+00:00");
    assert(domain::FormatIsoUtc(*record.simulationEndDate) == "1855-01-01T00:00:00+00:00");
    assert(domain::FormatIsoUtc(*record.runStartDate) == "2023-10-10T12:00:00+00:00");
    assert(domain::FormatIsoUtc(*record.runEndDate) == "2023-10-10T18:30:00+00:00");
    assert(*record.compiler == "intel");
    assert(*record.gitRepositoryUrl == "https://github.com/E3SM-Project/E3SM.git");
    assert(*record.gitBranch == "master");
    assert(*record.gitTag == "v3.0.0-12");
    assert(*record.gitCommitHash == "abc1234");
    assert(*record.hpcUsername == "ac.user");
    assert(!record.createdBy);
}

void TestIngestsArchives() {
    std::cout << "[Test] Ingesting a tar.gz and a zip archive..." << std::endl;
    TempDir tmp("ingest_archives");
    const fs::path src = tmp.path() / "src";
    WriteExperiment(src, "v3.LR.historical_0121/" + kRunDir, ExperimentFixture{});

    for (const char* name : {"upload.tar.gz", "upload.zip"}) {
        const fs::path archive = tmp.path() / name;
        WriteArchive(archive, EntriesFromTree(src));

        auto service = MakeService(MakeStore(tmp.path() / (std::string(name) + ".json")));
        auto result = service->ingestArchive(archive, tmp.path() / (std::string("out_") + name));

        assert(result.createdCount == 1);
        assert(result.duplicateCount == 0);
        assert(result.skippedCount == 0);
        assert(result.errors.empty());
        assert(result.status() == domain::IngestionStatus::Success);
        CheckHistoricalRecord(result.simulations.at(0));
    }
    std::cout << "[PASS] Archives ingested." << std::endl;
}

void TestCanonicalRunAndDeltas() {
    std::cout << "[Test] Picking the canonical run in directory order..." << std::endl;
    TempDir tmp("ingest_canonical");
    const fs::path root = tmp.path() / "extracted";

    // The later directory ran first on the wall clock; directory order still decides.
    ExperimentFixture canonical;
    ExperimentFixture recompiled;
    recompiled.compiler = std::string("gnu");
    recompiled.currDate = "Mon Jan 02 08:00:00 2023";
    recompiled.caseRunStarted = "2023-01-02 08:00:00";
    recompiled.caseRunFinished = "2023-01-02 09:00:00";
    WriteExperiment(root, "case/1.0-1", canonical);
    WriteExperiment(root, "case/1.0-2", recompiled);
    WriteExperiment(root, "case/1.0-3", canonical);

    auto service = MakeService(MakeStore(tmp.path() / "store.json"));
    auto result = service->ingestArchive(root, tmp.path() / "unused");

    assert(!fs::exists(tmp.path() / "unused"));
    assert(result.createdCount == 1);
    assert(result.skippedCount == 2);
    assert(result.errors.empty());

    const auto& record = result.simulations.at(0);
    assert(*record.compiler == "intel");
    assert(record.runStartDate && domain::FormatIsoUtc(*record.runStartDate) == "2023-10-10T12:00:00+00:00");
    const auto& deltas = record.extra.at("run_config_deltas");
    assert(deltas.size() == 1);
    assert(deltas[0]["exp_dir"] == (root / "case" / "1.0-2").string());
    assert(deltas[0]["deltas"].size() == 1);
    assert(deltas[0]["deltas"]["compiler"]["canonical"] == "intel");
    assert(deltas[0]["deltas"]["compiler"]["current"] == "gnu");
    std::cout << "[PASS] Canonical run selected with a single delta." << std::endl;
}

void TestIdempotentReingest() {
    std::cout << "[Test] Re-ingesting the same archive..." << std::endl;
    TempDir tmp("ingest_idempotent");
    const fs::path src = tmp.path() / "src";
    WriteExperiment(src, "v3.LR.historical_0121/" + kRunDir, ExperimentFixture{});
    ExperimentFixture control;
    control.caseName = "v3.LR.piControl_0001";
    WriteExperiment(src, "v3.LR.piControl_0001/" + kRunDir, control);

    const fs::path archive = tmp.path() / "upload.tar.gz";
    WriteArchive(archive, EntriesFromTree(src));
    const fs::path storePath = tmp.path() / "store" / "simulations.json";

    auto firstStore = MakeStore(storePath);
    auto first = MakeService(firstStore)->ingestArchive(archive, tmp.path() / "out1");
    assert(first.createdCount == 2);
    assert(firstStore->insert(first.simulations) == 2);

    auto secondStore = MakeStore(storePath);
    assert(secondStore->size() == 2);
    auto second = MakeService(secondStore)->ingestArchive(archive, tmp.path() / "out2");
    assert(second.createdCount == 0);
    assert(second.duplicateCount == first.createdCount);
    assert(second.errors.empty());
    assert(second.status() == domain::IngestionStatus::Success);

    bool threw = false;
    try {
        secondStore->insert(first.simulations);
    } catch (const domain::DuplicateSimulationError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Second pass created nothing." << std::endl;
}

void TestIncompleteRunsAreSkipped() {
    std::cout << "[Test] Skipping runs with missing required files..." << std::endl;
    TempDir tmp("ingest_incomplete");
    const fs::path root = tmp.path() / "extracted";

    WriteExperiment(root, "a/" + kRunDir, ExperimentFixture{});
    ExperimentFixture incomplete;
    incomplete.caseName = "v3.LR.amip_0002";
    incomplete.includeCaseStatus = false;
    WriteExperiment(root, "b/" + kRunDir, incomplete);

    auto result = MakeService(MakeStore(tmp.path() / "store.json"))->ingestArchive(root, tmp.path() / "out");
    assert(result.createdCount == 1);
    assert(result.simulations[0].caseName == "v3.LR.historical_0121");
    assert(result.errors.empty());
    assert(result.status() == domain::IngestionStatus::Success);
    std::cout << "[PASS] Incomplete run excluded without an error." << std::endl;
}

void TestPerExperimentErrors() {
    std::cout << "[Test] Reporting per-experiment errors..." << std::endl;
    TempDir tmp("ingest_errors");
    const fs::path root = tmp.path() / "extracted";

    WriteExperiment(root, "1/" + kRunDir, ExperimentFixture{});

    ExperimentFixture badDate;
    badDate.caseName = "v3.LR.amip_0001";
    badDate.runStartDate.reset();
    WriteExperiment(root, "2/" + kRunDir, badDate);

    ExperimentFixture unknownMachine;
    unknownMachine.caseName = "v3.LR.ssp245_0001";
    unknownMachine.machine = "aurora";
    WriteExperiment(root, "3/" + kRunDir, unknownMachine);

    ExperimentFixture noCompset;
    noCompset.caseName = "v3.LR.ssp585_0001";
    noCompset.includeReadme = false;
    auto dir = WriteExperiment(root, "4/" + kRunDir, noCompset);
    WriteGz(dir / ("CaseDocs." + noCompset.lid) / ("README.case." + noCompset.lid + ".gz"),
            "2023-10-10 11:57:00: ./create_newcase --case x --res ne30pg2_r05\n");

    auto result = MakeService(MakeStore(tmp.path() / "store.json"))->ingestArchive(root, tmp.path() / "out");
    assert(result.createdCount == 1);
    assert(result.errors.size() == 3);
    assert(result.errors[0].errorType == "ValueError");
    assert(result.errors[0].expDir == (root / "2" / kRunDir).string());
    assert(result.errors[1].errorType == "LookupError");
    assert(result.errors[1].message.find("'aurora'") != std::string::npos);
    assert(result.errors[2].errorType == "ValidationError");
    assert(result.errors[2].message.find("compset") != std::string::npos);
    assert(result.status() == domain::IngestionStatus::Partial);

    nlohmann::json j = domain::ToJson(result);
    assert(j["status"] == "partial");
    assert(j["errors"].size() == 3);
    std::cout << "[PASS] Errors reported per experiment." << std::endl;
}

void TestUnreadableFileIsReported() {
    std::cout << "[Test] Reporting unreadable metadata files..." << std::endl;
    TempDir tmp("ingest_unreadable");
    const fs::path root = tmp.path() / "extracted";

    WriteExperiment(root, "1/" + kRunDir, ExperimentFixture{});
    ExperimentFixture corrupt;
    corrupt.caseName = "v3.LR.amip_0003";
    corrupt.includeReadme = false;
    auto dir = WriteExperiment(root, "2/" + kRunDir, corrupt);
    // Valid gzip header followed by an invalid deflate block.
    WriteText(dir / ("CaseDocs." + corrupt.lid) / ("README.case." + corrupt.lid + ".gz"),
              std::string("\x1f\x8b\x08\x00\x00\x00\x00\x00\x00\x03\xff\xff\xff\xff", 14));

    auto result = MakeService(MakeStore(tmp.path() / "store.json"))->ingestArchive(root, tmp.path() / "out");
    assert(result.createdCount == 1);
    assert(result.errors.size() == 1);
    assert(result.errors[0].errorType == "IOError");
    assert(result.errors[0].expDir == (root / "2" / kRunDir).string());
    assert(result.status() == domain::IngestionStatus::Partial);
    std::cout << "[PASS] Unreadable file reported." << std::endl;
}

void TestFailedIngestion() {
    std::cout << "[Test] Reporting a fully failed ingestion..." << std::endl;
    TempDir tmp("ingest_failed");
    const fs::path root = tmp.path() / "extracted";
    ExperimentFixture unknownMachine;
    unknownMachine.machine = "aurora";
    WriteExperiment(root, kRunDir, unknownMachine);

    auto result = MakeService(MakeStore(tmp.path() / "store.json"))->ingestArchive(root, tmp.path() / "out");
    assert(result.createdCount == 0);
    assert(result.errors.size() == 1);
    assert(result.status() == domain::IngestionStatus::Failed);
    std::cout << "[PASS] Failed ingestion reported." << std::endl;
}

void TestArchiveLevelRejections() {
    std::cout << "[Test] Rejecting whole archives..." << std::endl;
    TempDir tmp("ingest_rejected");
    auto service = MakeService(MakeStore(tmp.path() / "store.json"));

    const fs::path rar = tmp.path() / "upload.rar";
    WriteText(rar, "nope");
    bool threw = false;
    try {
        service->ingestArchive(rar, tmp.path() / "out_rar");
    } catch (const domain::UnsupportedArchiveError&) {
        threw = true;
    }
    assert(threw);

    const fs::path empty = tmp.path() / "empty";
    fs::create_directories(empty / "docs");
    threw = false;
    try {
        service->ingestArchive(empty, tmp.path() / "out_empty");
    } catch (const domain::NoExperimentDirectoriesError&) {
        threw = true;
    }
    assert(threw);

    // A later ambiguous experiment aborts the whole archive.
    const fs::path ambiguous = tmp.path() / "ambiguous";
    WriteExperiment(ambiguous, "1.0-1", ExperimentFixture{});
    auto dir = WriteExperiment(ambiguous, "1.0-2", ExperimentFixture{});
    WriteGz(dir / "GIT_DESCRIBE.other.gz", "v1.0.0\n");
    threw = false;
    try {
        service->ingestArchive(ambiguous, tmp.path() / "out_ambiguous");
    } catch (const domain::AmbiguousFileMatchError&) {
        threw = true;
    }
    assert(threw);

    const fs::path hostile = tmp.path() / "hostile.zip";
    WriteArchive(hostile, {{"../escape.txt", "x", EntryKind::File, ""}});
    threw = false;
    try {
        service->ingestArchive(hostile, tmp.path() / "out_hostile");
    } catch (const domain::PathTraversalError&) {
        threw = true;
    }
    assert(threw);
    assert(!fs::exists(tmp.path() / "escape.txt"));
    std::cout << "[PASS] Archives rejected." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ArchiveIngestionService Test..." << std::endl;

    TestIngestsArchives();
    TestCanonicalRunAndDeltas();
    TestIdempotentReingest();
    TestIncompleteRunsAreSkipped();
    TestPerExperimentErrors();
    TestUnreadableFileIsReported();
    TestFailedIngestion();
    TestArchiveLevelRejections();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
