/**
 * @file FileSpecRegistry.cpp
 * @brief Implementation of FileSpecRegistry.
 */

#include "application/FileSpecRegistry.hpp"
#include "application/parsers/CaseDocsParser.hpp"
#include "application/parsers/CaseStatusParser.hpp"
#include "application/parsers/GitInfoParser.hpp"
#include "application/parsers/ReadmeCaseParser.hpp"
#include "application/parsers/TimingFileParser.hpp"

namespace simboard::application {

namespace fs = std::filesystem;

namespace {

FileSpec MakeSpec(std::string key, std::string pattern, FileLocation location, std::string subdirPrefix,
                  bool required) {
    FileSpec spec;
    spec.key = std::move(key);
    spec.regex = std::regex(pattern);
    spec.pattern = std::move(pattern);
    spec.location = location;
    spec.subdirPrefix = std::move(subdirPrefix);
    spec.required = required;
    return spec;
}

} // namespace

bool FileSpec::matches(const std::string& fileName) const {
    return std::regex_match(fileName, regex);
}

FileSpecRegistry::FileSpecRegistry(std::vector<FileSpec> specs) : m_specs(std::move(specs)) {}

std::shared_ptr<FileSpecRegistry> FileSpecRegistry::CreateDefault(const domain::IngestionConfig& config,
                                                                  std::shared_ptr<spdlog::logger> logger) {
    auto timing = std::make_shared<parsers::TimingFileParser>(config.knownExperimentTypes, logger);
    auto caseStatus = std::make_shared<parsers::CaseStatusParser>(logger);
    auto readme = std::make_shared<parsers::ReadmeCaseParser>();
    auto caseDocs = std::make_shared<parsers::CaseDocsParser>(logger);
    auto git = std::make_shared<parsers::GitInfoParser>();
    const std::string& docs = config.caseDocsPrefix;

    std::vector<FileSpec> specs;

    FileSpec spec = MakeSpec("e3sm_timing", R"(e3sm_timing\..*\..*)", FileLocation::Root, "", true);
    spec.parser = [timing](const fs::path& p) { return timing->parse(p); };
    specs.push_back(std::move(spec));

    spec = MakeSpec("readme_case", R"(README\.case\..*\.gz)", FileLocation::NestedSubdir, docs, true);
    spec.parser = [readme](const fs::path& p) { return readme->parse(p); };
    specs.push_back(std::move(spec));

    spec = MakeSpec("case_status", R"(CaseStatus\..*\.gz)", FileLocation::Root, "", true);
    spec.parser = [caseStatus](const fs::path& p) { return caseStatus->parse(p); };
    spec.ownedFields = {"simulation_start_date", "simulation_end_date"};
    specs.push_back(std::move(spec));

    spec = MakeSpec("case_docs_env_case", R"(env_case\.xml\..*\.gz)", FileLocation::NestedSubdir, docs, false);
    spec.parser = [caseDocs](const fs::path& p) { return caseDocs->parseEnvCase(p); };
    specs.push_back(std::move(spec));

    spec = MakeSpec("case_docs_env_build", R"(env_build\.xml\..*\.gz)", FileLocation::NestedSubdir, docs, false);
    spec.parser = [caseDocs](const fs::path& p) { return caseDocs->parseEnvBuild(p); };
    specs.push_back(std::move(spec));

    spec = MakeSpec("git_describe", R"(GIT_DESCRIBE\..*\.gz)", FileLocation::Root, "", true);
    spec.parser = [git](const fs::path& p) { return git->parseDescribe(p); };
    specs.push_back(std::move(spec));

    spec = MakeSpec("git_config", R"(GIT_CONFIG\..*\.gz)", FileLocation::Root, "", false);
    spec.valueParser = [git](const fs::path& p) { return git->parseConfig(p); };
    spec.singleValueField = "git_repository_url";
    specs.push_back(std::move(spec));

    spec = MakeSpec("git_status", R"(GIT_STATUS\..*\.gz)", FileLocation::Root, "", false);
    spec.valueParser = [git](const fs::path& p) { return git->parseStatus(p); };
    spec.singleValueField = "git_branch";
    specs.push_back(std::move(spec));

    return std::make_shared<FileSpecRegistry>(std::move(specs));
}

} // namespace simboard::application
