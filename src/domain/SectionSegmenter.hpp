/**
 * @file SectionSegmenter.hpp
 * @brief Splits plain text into named sections using heading rules.
 */

#pragma once

#include "domain/Section.hpp"
#include <functional>
#include <regex>
#include <string>
#include <vector>

namespace versionlens::domain {

/**
 * @brief Service that segments document text into ordered sections.
 * This service is stateless once constructed and safe to share between threads.
 */
class SectionSegmenter {
public:
    static constexpr const char* kPreambleName = "Preamble";
    static constexpr const char* kImplicitName = "Full Document";

    /**
     * @brief A heading recognition rule: a line pattern plus the label it yields.
     */
    struct HeadingRule {
        std::string name;
        std::regex pattern;
        std::function<std::string(const std::smatch&)> label;
    };

    /** @brief Uses DefaultRules(). */
    SectionSegmenter();

    /**
     * @param rules Rules in priority order. The first rule matching any line of a
     *              document fixes the grammar for that whole document.
     */
    explicit SectionSegmenter(std::vector<HeadingRule> rules);

    /** @brief "Section N: ...", "N. Title" and "Part IV: ..." headings, in that order. */
    static std::vector<HeadingRule> DefaultRules();

    SegmentedDocument segment(const std::string& text) const;

    /** @brief Trimmed, non-blank lines of text, in order. */
    static std::vector<std::string> SplitLines(const std::string& text);

private:
    std::vector<HeadingRule> m_rules;

    const HeadingRule* selectRule(const std::vector<std::string>& lines) const;
};

} // namespace versionlens::domain
