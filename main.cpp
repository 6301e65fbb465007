#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "application/ArchiveIngestionService.hpp"
#include "domain/IngestionErrors.hpp"
#include "infrastructure/ArchiveExtractor.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonMachineRegistry.hpp"
#include "infrastructure/JsonSimulationStore.hpp"
#include "infrastructure/Logging.hpp"
#include "infrastructure/PathUtils.hpp"

namespace fs = std::filesystem;
using namespace simboard;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitRejected = 2;

struct CliOptions {
    fs::path archive;
    std::optional<fs::path> outputDir;
    fs::path machines = infrastructure::PathUtils::GetDefaultMachinesPath();
    fs::path store = infrastructure::PathUtils::GetDefaultStorePath();
    fs::path settings = infrastructure::PathUtils::GetDefaultSettingsPath();
    std::optional<std::string> logLevel;
    bool commit = false;
};

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " <archive.zip|archive.tar.gz|archive.tgz|directory> [options]\n"
              << "  --output-dir DIR   extraction directory (default: fresh temp dir)\n"
              << "  --machines FILE    machine registry JSON\n"
              << "  --store FILE       simulation store JSON\n"
              << "  --config FILE      settings JSON\n"
              << "  --log-level LEVEL  trace|debug|info|warn|error|critical|off\n"
              << "  --commit           persist created simulations to the store\n";
}

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    CliOptions options;
    bool haveArchive = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--commit") {
            options.commit = true;
        } else if (arg == "--output-dir" || arg == "--machines" || arg == "--store" || arg == "--config" ||
                   arg == "--log-level") {
            auto value = next();
            if (!value) return std::nullopt;
            if (arg == "--output-dir") options.outputDir = fs::path(*value);
            else if (arg == "--machines") options.machines = *value;
            else if (arg == "--store") options.store = *value;
            else if (arg == "--config") options.settings = *value;
            else options.logLevel = *value;
        } else if (!haveArchive && std::strncmp(arg.c_str(), "--", 2) != 0) {
            options.archive = arg;
            haveArchive = true;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (!haveArchive) return std::nullopt;
    return options;
}

} // namespace

int main(int argc, char** argv) {
    auto options = ParseArgs(argc, argv);
    if (!options) {
        PrintUsage(argv[0]);
        return kExitRejected;
    }

    auto logger = infrastructure::Logging::CreateLogger("simboard");
    domain::IngestionConfig config = infrastructure::ConfigLoader::Load(options->settings, *logger);
    const std::string level = options->logLevel.value_or(config.logLevel);
    if (!infrastructure::Logging::ApplyLevel(*logger, level)) {
        logger->warn("Unknown log level '{}', keeping info", level);
    }

    std::shared_ptr<infrastructure::JsonMachineRegistry> machines;
    std::shared_ptr<infrastructure::JsonSimulationStore> store;
    try {
        machines = infrastructure::JsonMachineRegistry::Load(options->machines);
        store = std::make_shared<infrastructure::JsonSimulationStore>(options->store, logger);
    } catch (const std::exception& e) {
        logger->error("{}", e.what());
        return kExitRejected;
    }
    logger->debug("Loaded {} machines from {}", machines->size(), options->machines.string());

    application::ArchiveIngestionService service(
        std::make_unique<infrastructure::ArchiveExtractor>(logger), machines, store, config, logger);

    domain::IngestArchiveResult result;
    try {
        fs::path outputDir = options->outputDir ? *options->outputDir : infrastructure::PathUtils::CreateWorkDir();
        result = service.ingestArchive(options->archive, outputDir);
    } catch (const domain::ArchiveError& e) {
        logger->error("Archive rejected: {}", e.what());
        return kExitRejected;
    } catch (const std::exception& e) {
        logger->error("Ingestion aborted: {}", e.what());
        return kExitRejected;
    }

    if (options->commit && !result.simulations.empty()) {
        try {
            store->insert(result.simulations);
        } catch (const std::exception& e) {
            logger->error("Commit failed: {}", e.what());
            std::cout << domain::ToJson(result).dump(2) << std::endl;
            return kExitFailed;
        }
    }

    std::cout << domain::ToJson(result).dump(2) << std::endl;
    return result.status() == domain::IngestionStatus::Failed ? kExitFailed : kExitOk;
}
