/**
 * @file Errors.hpp
 * @brief Error taxonomy of the comparison core.
 */

#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include "domain/Comparison.hpp"

namespace versionlens::domain {

/**
 * @class CatalogError
 * @brief Version enumeration failed. Aborts the call.
 */
class CatalogError : public std::runtime_error {
public:
    enum class Kind { InvalidCaseId, CaseNotFound, StorageUnreachable };

    CatalogError(Kind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

/**
 * @class ExtractionError
 * @brief Every extraction strategy failed or yielded empty text.
 */
class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& message, std::vector<std::string> attempts = {})
        : std::runtime_error(message), m_attempts(std::move(attempts)) {}

    /** @brief One "strategy: reason" entry per strategy tried. */
    const std::vector<std::string>& attempts() const { return m_attempts; }

private:
    std::vector<std::string> m_attempts;
};

/**
 * @class ComparisonError
 * @brief Comparison could not deliver a result; carries the per-version errors seen so far.
 */
class ComparisonError : public std::runtime_error {
public:
    explicit ComparisonError(const std::string& message, std::vector<VersionError> errors = {})
        : std::runtime_error(message), m_errors(std::move(errors)) {}

    const std::vector<VersionError>& versionErrors() const { return m_errors; }

private:
    std::vector<VersionError> m_errors;
};

/** @brief Fewer than two usable versions. */
class InsufficientVersionsError : public ComparisonError {
public:
    using ComparisonError::ComparisonError;
};

/** @brief The caller-supplied deadline expired; no partial result. */
class ComparisonTimeoutError : public ComparisonError {
public:
    using ComparisonError::ComparisonError;
};

/**
 * @class RenderError
 * @brief Unsupported encoding or malformed comparison input.
 */
class RenderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace versionlens::domain
