/**
 * @file Section.hpp
 * @brief Extracted text and its segmentation into named sections.
 */

#pragma once
#include <string>
#include <vector>

namespace versionlens::domain {

/**
 * @struct ExtractedDocument
 * @brief Plain text of one version plus the strategy that produced it.
 */
struct ExtractedDocument {
    std::string versionId;
    std::string rawText;
    std::string extractionMethod;
};

/**
 * @struct Section
 * @brief Named, contiguous span of a document.
 */
struct Section {
    std::string name;
    int orderIndex = 0;
    std::string body;
};

/**
 * @class SegmentedDocument
 * @brief Ordered sections of one document.
 *
 * Invariant: section names are unique and orderIndex follows source order.
 */
class SegmentedDocument {
public:
    std::vector<Section> sections;
    std::string wholeText;   ///< Trimmed non-blank lines of the source, headings included.
    bool implicit = false;   ///< True when no heading rule matched.
    std::string ruleName;    ///< Heading rule that fixed the grammar, empty when implicit.

    const Section* find(const std::string& name) const {
        for (const auto& section : sections) {
            if (section.name == name) return &section;
        }
        return nullptr;
    }

    bool contains(const std::string& name) const { return find(name) != nullptr; }
};

} // namespace versionlens::domain
