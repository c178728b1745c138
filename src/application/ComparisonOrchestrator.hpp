/**
 * @file ComparisonOrchestrator.hpp
 * @brief Drives selective and sequential comparisons of case document versions.
 */

#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "application/TextExtractor.hpp"
#include "application/VersionCatalog.hpp"
#include "domain/Comparison.hpp"
#include "domain/ObjectStore.hpp"
#include "domain/SectionSegmenter.hpp"

namespace versionlens::application {

/**
 * @struct OrchestratorSettings
 * @brief Resource limits of one comparison call.
 */
struct OrchestratorSettings {
    size_t workers = 4;                                   ///< Concurrent fetch-and-extract jobs.
    int fetchAttempts = 3;                                ///< Tries per object on transient failures.
    std::chrono::milliseconds initialBackoff{200};        ///< Doubled after each failed try.
    std::chrono::milliseconds timeout{0};                 ///< Whole-call limit, 0 = none.
};

/**
 * @class ComparisonOrchestrator
 * @brief Stateless entry point of the comparison core.
 *
 * Each call builds its own worker pool and returns a self-contained result;
 * nothing is shared or remembered between calls.
 */
class ComparisonOrchestrator {
public:
    ComparisonOrchestrator(std::shared_ptr<domain::ObjectStore> store,
                           std::shared_ptr<TextExtractor> extractor,
                           OrchestratorSettings settings = {},
                           std::shared_ptr<const domain::SectionSegmenter> segmenter = nullptr);

    /** @brief Same as VersionCatalog::listVersions. */
    std::vector<domain::VersionDescriptor> listVersions(const std::string& caseId) const;

    /**
     * @brief Compares versions of a case.
     *
     * Selective: diffs the first usable id against the last usable id of the given
     * ordering. Sequential: diffs every consecutive pair of the catalog.
     * Versions that cannot be fetched or extracted are reported in versionErrors.
     *
     * @throws domain::CatalogError listing failed, or sequential mode on an empty case.
     * @throws domain::InsufficientVersionsError fewer than two usable versions.
     * @throws domain::ComparisonTimeoutError settings.timeout expired.
     */
    domain::ComparisonResult compareVersions(const std::string& caseId,
                                             const domain::ComparisonSelection& selection) const;

    /** @brief As above with a per-call timeout (0 = none) overriding the settings. */
    domain::ComparisonResult compareVersions(const std::string& caseId,
                                             const domain::ComparisonSelection& selection,
                                             std::chrono::milliseconds timeout) const;

    const OrchestratorSettings& settings() const { return m_settings; }

private:
    std::shared_ptr<domain::ObjectStore> m_store;
    std::shared_ptr<TextExtractor> m_extractor;
    std::shared_ptr<const domain::SectionSegmenter> m_segmenter;
    VersionCatalog m_catalog;
    OrchestratorSettings m_settings;
};

} // namespace versionlens::application
