/**
 * @file ArchiveIngestionService.cpp
 * @brief Implementation of ArchiveIngestionService.
 */

#include "application/ArchiveIngestionService.hpp"
#include "domain/IngestionErrors.hpp"
#include <map>

namespace fs = std::filesystem;

namespace simboard::application {

namespace {

std::string JoinKeys(const std::vector<std::string>& keys) {
    std::string joined;
    for (const auto& key : keys) {
        joined += (joined.empty() ? "" : ", ") + key;
    }
    return joined;
}

std::string CaseNameOf(const domain::SimulationMetadata& metadata) {
    if (auto caseName = domain::GetField(metadata, "case_name")) return *caseName;
    if (auto name = domain::GetField(metadata, "name")) return *name;
    return "unknown";
}

} // namespace

ArchiveIngestionService::ArchiveIngestionService(std::unique_ptr<infrastructure::ArchiveExtractor> extractor,
                                                 std::shared_ptr<const domain::MachineRegistry> machines,
                                                 std::shared_ptr<const domain::SimulationStore> store,
                                                 const domain::IngestionConfig& config,
                                                 std::shared_ptr<spdlog::logger> logger)
    : m_extractor(std::move(extractor)), m_logger(std::move(logger)) {
    m_registry = FileSpecRegistry::CreateDefault(config, m_logger);
    m_locator = std::make_unique<ExperimentLocator>(m_registry, m_logger);
    m_assembler = std::make_unique<MetadataAssembler>(m_registry, m_logger);

    auto gate = std::make_shared<DeduplicationGate>(std::move(machines), std::move(store), m_logger);
    auto mapper = std::make_shared<SimulationRecordMapper>(m_logger);
    m_selector = std::make_unique<CanonicalRunSelector>(gate, mapper, config.deltaFields, m_logger);
}

domain::IngestArchiveResult ArchiveIngestionService::ingestArchive(const fs::path& archivePath,
                                                                   const fs::path& outputDir) {
    fs::path root;
    if (fs::is_directory(archivePath)) {
        m_logger->info("Ingesting already extracted directory {}", archivePath.string());
        root = archivePath;
    } else {
        m_extractor->extract(archivePath, outputDir);
        root = outputDir;
    }

    // Locate everything first so an ambiguous match rejects the archive before any parsing.
    std::vector<LocatedFiles> experiments;
    for (const auto& expDir : m_locator->findExperimentDirs(root)) {
        experiments.push_back(m_locator->locateFiles(expDir));
    }

    IngestionResultBuilder builder;
    std::vector<ExperimentRun> runs = parseExperiments(experiments, builder);

    // Group by case, keeping the sorted directory order inside and across groups.
    std::vector<std::string> caseOrder;
    std::map<std::string, std::vector<ExperimentRun>> caseGroups;
    for (auto& run : runs) {
        std::string caseName = CaseNameOf(run.metadata);
        auto [it, inserted] = caseGroups.try_emplace(caseName);
        if (inserted) {
            caseOrder.push_back(caseName);
        }
        it->second.push_back(std::move(run));
    }

    for (const auto& caseName : caseOrder) {
        m_selector->select(caseGroups[caseName], builder);
    }

    domain::IngestArchiveResult result = builder.build();
    m_logger->info("Ingestion of {} finished: {} created, {} duplicate, {} skipped, {} errors ({})",
                   archivePath.string(), result.createdCount, result.duplicateCount, result.skippedCount,
                   result.errors.size(), domain::ToString(result.status()));
    return result;
}

std::vector<ExperimentRun> ArchiveIngestionService::parseExperiments(const std::vector<LocatedFiles>& experiments,
                                                                     IngestionResultBuilder& builder) const {
    std::vector<ExperimentRun> runs;
    for (const auto& located : experiments) {
        const std::string expDir = located.experimentDir.string();

        if (!located.isComplete()) {
            m_logger->warn("Skipping incomplete run in '{}': missing required files: {}", expDir,
                           JoinKeys(located.missingRequired));
            continue;
        }
        if (!located.missingOptional.empty()) {
            m_logger->info("Optional files missing in experiment directory '{}': {}", expDir,
                           JoinKeys(located.missingOptional));
        }

        try {
            runs.push_back(ExperimentRun{expDir, m_assembler->assemble(located)});
        } catch (const domain::ExperimentError& e) {
            m_logger->error("Failed to parse experiment {}: {}", expDir, e.what());
            builder.recordError(expDir, e);
        }
    }
    m_logger->info("Completed parsing {} experiment directories.", experiments.size());
    return runs;
}

} // namespace simboard::application
