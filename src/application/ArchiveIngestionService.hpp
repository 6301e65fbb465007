/**
 * @file ArchiveIngestionService.hpp
 * @brief Orchestrates archive ingestion from extraction to the aggregated result.
 */

#pragma once
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>
#include "application/CanonicalRunSelector.hpp"
#include "application/ExperimentLocator.hpp"
#include "application/MetadataAssembler.hpp"
#include "domain/IngestionConfig.hpp"
#include "domain/IngestionResult.hpp"
#include "domain/MachineRegistry.hpp"
#include "domain/SimulationStore.hpp"
#include "infrastructure/ArchiveExtractor.hpp"

namespace simboard::application {

/**
 * @class ArchiveIngestionService
 * @brief Extract, locate, parse, select, and report.
 *
 * Archive-level problems (unsupported format, unsafe members, no experiments,
 * ambiguous files) are thrown as domain::ArchiveError before any experiment is
 * processed. Experiment-level problems are recorded in the result. The service
 * never writes to the store; callers persist IngestArchiveResult::simulations.
 */
class ArchiveIngestionService {
public:
    ArchiveIngestionService(std::unique_ptr<infrastructure::ArchiveExtractor> extractor,
                            std::shared_ptr<const domain::MachineRegistry> machines,
                            std::shared_ptr<const domain::SimulationStore> store,
                            const domain::IngestionConfig& config,
                            std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Ingests an archive, or an already extracted directory.
     * @param archivePath .zip/.tar.gz/.tgz file, or a directory used in place.
     * @param outputDir Extraction target; unused for directory input.
     * @throws domain::ArchiveError subclasses for fatal archive problems.
     */
    domain::IngestArchiveResult ingestArchive(const std::filesystem::path& archivePath,
                                              const std::filesystem::path& outputDir);

private:
    std::vector<ExperimentRun> parseExperiments(const std::vector<LocatedFiles>& experiments,
                                                IngestionResultBuilder& builder) const;

    std::unique_ptr<infrastructure::ArchiveExtractor> m_extractor;
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<const FileSpecRegistry> m_registry;
    std::unique_ptr<ExperimentLocator> m_locator;
    std::unique_ptr<MetadataAssembler> m_assembler;
    std::unique_ptr<CanonicalRunSelector> m_selector;
};

} // namespace simboard::application
