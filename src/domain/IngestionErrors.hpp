/**
 * @file IngestionErrors.hpp
 * @brief Exception taxonomy of the ingestion engine.
 *
 * ArchiveError subclasses abort a whole ingestion call. ExperimentError subclasses are
 * caught per experiment and recorded in the result under their kind() tag.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace simboard::domain {

/** @brief Archive-level failure; the ingestion call is rejected outright. */
class ArchiveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UnsupportedArchiveError : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

/** @brief A member would be written outside the extraction directory. */
class PathTraversalError : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

/** @brief A member is neither a regular file nor a directory. */
class UnsafeMemberError : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

/** @brief The container could not be opened, read or written out. */
class ArchiveReadError : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

class NoExperimentDirectoriesError : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

/** @brief Two files in one directory match the same file spec. */
class AmbiguousFileMatchError : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

/**
 * @class ExperimentError
 * @brief Failure confined to one experiment directory.
 */
class ExperimentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /** @brief Stable tag stored as error_type in the ingestion result. */
    virtual const char* kind() const noexcept = 0;
};

/** @brief Required metadata missing or unparseable (e.g. simulation start date). */
class InvalidMetadataError : public ExperimentError {
public:
    using ExperimentError::ExperimentError;
    const char* kind() const noexcept override { return "ValueError"; }
};

class MachineNotFoundError : public ExperimentError {
public:
    using ExperimentError::ExperimentError;
    const char* kind() const noexcept override { return "LookupError"; }
};

/** @brief The assembled record lacks fields the output schema requires. */
class SchemaValidationError : public ExperimentError {
public:
    using ExperimentError::ExperimentError;
    const char* kind() const noexcept override { return "ValidationError"; }
};

class FileReadError : public ExperimentError {
public:
    using ExperimentError::ExperimentError;
    const char* kind() const noexcept override { return "IOError"; }
};

/** @brief Store refused a record whose natural key is already persisted. */
class DuplicateSimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace simboard::domain
