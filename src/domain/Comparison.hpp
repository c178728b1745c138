/**
 * @file Comparison.hpp
 * @brief Value types produced by the diff engine and the comparison orchestrator.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/VersionDescriptor.hpp"

namespace versionlens::domain {

/**
 * @struct LineChange
 * @brief One operation of a line-level edit script.
 */
struct LineChange {
    enum class Kind { Added, Removed, Unchanged };
    Kind kind;
    std::string content;

    bool operator==(const LineChange& other) const {
        return kind == other.kind && content == other.content;
    }
};

/**
 * @struct ModifiedPair
 * @brief A removed line immediately replaced by an added line.
 */
struct ModifiedPair {
    std::string oldLine;
    std::string newLine;
};

enum class SectionStatus { Added, Removed, Modified, Unchanged };

inline std::string SectionStatusToString(SectionStatus status) {
    switch (status) {
        case SectionStatus::Added: return "added";
        case SectionStatus::Removed: return "removed";
        case SectionStatus::Modified: return "modified";
        case SectionStatus::Unchanged: return "unchanged";
    }
    return "unchanged";
}

/**
 * @struct SectionDiff
 * @brief Difference of one section between two documents.
 *
 * Invariant: status is derived from the line comparison, never assigned on its own.
 */
struct SectionDiff {
    std::string sectionName;
    SectionStatus status = SectionStatus::Unchanged;
    std::vector<std::string> addedLines;
    std::vector<std::string> removedLines;
    std::vector<ModifiedPair> modifiedPairs;
    std::vector<LineChange> changes;   ///< Full edit script, in document order.
};

/**
 * @struct DiffSummary
 * @brief Section tallies of one pair (or of a whole result).
 */
struct DiffSummary {
    int total = 0;
    int added = 0;
    int removed = 0;
    int modified = 0;
    int unchanged = 0;

    void count(SectionStatus status) {
        ++total;
        switch (status) {
            case SectionStatus::Added: ++added; break;
            case SectionStatus::Removed: ++removed; break;
            case SectionStatus::Modified: ++modified; break;
            case SectionStatus::Unchanged: ++unchanged; break;
        }
    }

    DiffSummary& operator+=(const DiffSummary& other) {
        total += other.total;
        added += other.added;
        removed += other.removed;
        modified += other.modified;
        unchanged += other.unchanged;
        return *this;
    }

    bool operator==(const DiffSummary& other) const {
        return total == other.total && added == other.added && removed == other.removed &&
               modified == other.modified && unchanged == other.unchanged;
    }
    bool operator!=(const DiffSummary& other) const { return !(*this == other); }
};

/**
 * @struct DocumentDiff
 * @brief Output of the diff engine for one pair of documents.
 */
struct DocumentDiff {
    std::vector<SectionDiff> sections;   ///< Left-document order, then right-only names.
    DiffSummary summary;
};

/**
 * @struct VersionError
 * @brief A version that could not be used, and why.
 */
struct VersionError {
    enum class Stage { Resolve, Fetch, Extract };
    std::string versionId;
    Stage stage;
    std::string message;

    static std::string StageToString(Stage s) {
        switch (s) {
            case Stage::Resolve: return "resolve";
            case Stage::Fetch: return "fetch";
            case Stage::Extract: return "extract";
        }
        return "fetch";
    }
};

/**
 * @struct VersionPair
 * @brief One left/right comparison inside a result.
 *
 * A pair whose side failed extraction is not comparable: it carries the failing
 * ids and no section diffs, which keeps it distinct from a section that is absent.
 */
struct VersionPair {
    std::string leftId;
    std::string rightId;
    bool comparable = true;
    std::vector<std::string> unavailableIds;
    DocumentDiff diff;
};

enum class ComparisonMode { Selective, Sequential };

inline std::string ComparisonModeToString(ComparisonMode mode) {
    return mode == ComparisonMode::Selective ? "selective" : "sequential";
}

/**
 * @struct ComparisonSelection
 * @brief Caller request: explicit endpoints or the whole catalog.
 */
struct ComparisonSelection {
    ComparisonMode mode = ComparisonMode::Sequential;
    std::vector<std::string> versionIds;

    static ComparisonSelection Selective(std::vector<std::string> ids) {
        return ComparisonSelection{ComparisonMode::Selective, std::move(ids)};
    }
    static ComparisonSelection Sequential() {
        return ComparisonSelection{ComparisonMode::Sequential, {}};
    }
};

/**
 * @struct ComparisonResult
 * @brief Self-contained outcome of one compareVersions call.
 */
struct ComparisonResult {
    std::string caseId;
    ComparisonMode mode = ComparisonMode::Sequential;
    std::string generatedAt;                    ///< ISO-8601 UTC.
    std::vector<VersionDescriptor> versions;    ///< Versions involved, ascending.
    std::vector<VersionPair> pairs;
    DiffSummary summary;                        ///< Sum over comparable pairs.
    std::vector<VersionError> versionErrors;
};

} // namespace versionlens::domain
