/**
 * @file DiffEngine.hpp
 * @brief Section-level and line-level comparison of two segmented documents.
 */

#pragma once

#include "domain/Comparison.hpp"
#include "domain/Section.hpp"

namespace versionlens::domain {

/**
 * @brief Stateless comparison of an older (left) and a newer (right) document.
 *
 * Output is deterministic: sections follow left-document order, then right-only
 * sections in right-document order.
 */
class DiffEngine {
public:
    static DocumentDiff Compare(const SegmentedDocument& left, const SegmentedDocument& right);

    /** @brief Classifies one section present on both sides. */
    static SectionDiff CompareSection(const std::string& name,
                                      const std::string& leftBody,
                                      const std::string& rightBody);
};

} // namespace versionlens::domain
