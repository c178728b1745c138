/**
 * @file VersionCatalog.hpp
 * @brief Enumerates the stored versions of a case document.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/ObjectStore.hpp"
#include "domain/VersionDescriptor.hpp"

namespace versionlens::application {

/**
 * @class VersionCatalog
 * @brief Lists storage keys of a case and keeps those that follow the naming convention.
 *
 * Accepted keys:
 *  - <case>/Output/<YYYYMMDDHHMM>-<case>-<CompleteAIGeneratedReport|LCP|LifeCarePlan>*.pdf
 *  - any .pdf under <case>/ whose path carries the "GroundTruth" marker (timestamp = last modified)
 */
class VersionCatalog {
public:
    explicit VersionCatalog(std::shared_ptr<domain::ObjectStore> store);

    /**
     * @brief Versions of a case, ascending by timestamp (ties by key).
     * @return Empty when the case has no matching keys.
     * @throws domain::CatalogError InvalidCaseId or StorageUnreachable.
     */
    std::vector<domain::VersionDescriptor> listVersions(const std::string& caseId) const;

    /** @brief Case ids found at the top level of the store, sorted. */
    std::vector<std::string> listCases() const;

    /** @brief Parses one listing entry; nullopt when the key does not follow the convention. */
    static std::optional<domain::VersionDescriptor> ParseKey(const std::string& caseId, const domain::ObjectInfo& info);

    static bool IsValidCaseId(const std::string& caseId);

private:
    std::shared_ptr<domain::ObjectStore> m_store;
};

} // namespace versionlens::application
