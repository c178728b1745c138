/**
 * @file LineDiff.hpp
 * @brief Longest-common-subsequence line differ (linear space).
 */

#pragma once

#include "domain/Comparison.hpp"
#include <string>
#include <vector>

namespace versionlens::domain {

class LineDiff {
public:
    /**
     * @brief Computes a minimal edit script turning left into right.
     *
     * Lines are compared exactly. Output order follows the documents; where a
     * removal and an addition could be emitted at the same point the removal comes first.
     */
    static std::vector<LineChange> Compute(const std::vector<std::string>& left,
                                           const std::vector<std::string>& right);

    /**
     * @brief Splits an edit script into added lines, removed lines and replacement pairs.
     *
     * A run of removals directly followed by a run of additions is paired element-wise;
     * the surplus of the longer run is reported as plain additions or removals.
     */
    static void Collapse(const std::vector<LineChange>& changes, SectionDiff& out);
};

} // namespace versionlens::domain
