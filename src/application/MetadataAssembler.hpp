/**
 * @file MetadataAssembler.hpp
 * @brief Runs the parsers of one experiment and merges their output.
 */

#pragma once
#include <memory>
#include <spdlog/spdlog.h>
#include "application/ExperimentLocator.hpp"
#include "application/FileSpecRegistry.hpp"
#include "domain/SimulationMetadata.hpp"

namespace simboard::application {

/**
 * @class MetadataAssembler
 * @brief Produces the fixed-key SimulationMetadata of an experiment.
 *
 * Parsers run in registry order. A later non-null value replaces an earlier one,
 * a null never erases a value that is already set.
 */
class MetadataAssembler {
public:
    MetadataAssembler(std::shared_ptr<const FileSpecRegistry> registry, std::shared_ptr<spdlog::logger> logger);

    /** @throws domain::FileReadError when a located file cannot be read. */
    domain::SimulationMetadata assemble(const LocatedFiles& located) const;

    /** @brief Reduces merged parser output to kMetadataFields. */
    static domain::SimulationMetadata Normalize(const domain::FieldMap& merged);

    /** @brief Copies the non-null values of source into target. */
    static void MergeInto(domain::FieldMap& target, const domain::FieldMap& source);

private:
    std::shared_ptr<const FileSpecRegistry> m_registry;
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace simboard::application
