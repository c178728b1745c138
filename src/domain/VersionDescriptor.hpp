/**
 * @file VersionDescriptor.hpp
 * @brief Domain entity describing one stored rendition of a case document.
 */

#pragma once
#include <string>
#include <chrono>

namespace versionlens::domain {

/**
 * @enum DocumentType
 * @brief Kind of rendition, derived from the storage key.
 */
enum class DocumentType {
    AiGeneratedReport,
    LifeCarePlan,
    GroundTruth
};

inline std::string DocumentTypeToString(DocumentType type) {
    switch (type) {
        case DocumentType::AiGeneratedReport: return "ai-generated-report";
        case DocumentType::LifeCarePlan: return "life-care-plan";
        case DocumentType::GroundTruth: return "ground-truth";
    }
    return "ai-generated-report";
}

/**
 * @class VersionDescriptor
 * @brief Immutable description of a version produced by catalog enumeration.
 *
 * Invariant: id is unique within a case.
 */
class VersionDescriptor {
public:
    std::string id;                ///< Opaque storage key.
    std::string caseId;
    std::string filename;          ///< Last path segment of the key.
    DocumentType type;
    std::chrono::system_clock::time_point timestamp;
    std::string timestampLabel;    ///< "YYYY-MM-DD HH:MM" (UTC).
    long long sizeBytes;

    VersionDescriptor() : type(DocumentType::AiGeneratedReport), sizeBytes(0) {}
};

} // namespace versionlens::domain
