#include <cassert>
#include <iostream>

#include "domain/SectionSegmenter.hpp"

using namespace versionlens::domain;

int main() {
    std::cout << "[Test] Starting SectionSegmenter Test..." << std::endl;
    SectionSegmenter segmenter;

    // Keyword headings with text before the first heading
    {
        auto doc = segmenter.segment(
            "Life Care Plan for J. Doe\n"
            "\n"
            "Section 1: Introduction\n"
            "  Claimant was evaluated on site.  \n"
            "Section 2 - Medical History\n"
            "Fracture of the left femur.\n"
            "Surgery in 2019.\n");
        assert(!doc.implicit);
        assert(doc.ruleName == "section-keyword");
        assert(doc.sections.size() == 3);
        assert(doc.sections[0].name == SectionSegmenter::kPreambleName);
        assert(doc.sections[0].body == "Life Care Plan for J. Doe");
        assert(doc.sections[1].name == "Section 1: Introduction");
        assert(doc.sections[1].body == "Claimant was evaluated on site.");
        assert(doc.sections[2].name == "Section 2: Medical History");
        assert(doc.sections[2].body == "Fracture of the left femur.\nSurgery in 2019.");
        for (size_t i = 0; i < doc.sections.size(); ++i) {
            assert(doc.sections[i].orderIndex == static_cast<int>(i));
        }
        std::cout << "[PASS] Keyword headings segmented in source order." << std::endl;
    }

    // Case-insensitive keyword, normalized label
    {
        auto doc = segmenter.segment("SECTION 3: Costs\nWheelchair");
        assert(doc.sections.size() == 1);
        assert(doc.sections[0].name == "Section 3: Costs");
        std::cout << "[PASS] Keyword heading is case-insensitive." << std::endl;
    }

    // Numbered headings; lower-case list items stay body text
    {
        auto doc = segmenter.segment(
            "1. Summary\n"
            "1. the first item\n"
            "2. Findings\n"
            "Stable condition.\n");
        assert(doc.ruleName == "numbered");
        assert(doc.sections.size() == 2);
        assert(doc.sections[0].name == "Section 1: Summary");
        assert(doc.sections[0].body == "1. the first item");
        assert(doc.sections[1].name == "Section 2: Findings");
        std::cout << "[PASS] Numbered headings." << std::endl;
    }

    // Roman part headings
    {
        auto doc = segmenter.segment("part iv - Future Care\nAnnual review\nPart V: Totals\n$1,000");
        assert(doc.ruleName == "part-roman");
        assert(doc.sections.size() == 2);
        assert(doc.sections[0].name == "Part IV: Future Care");
        assert(doc.sections[1].name == "Part V: Totals");
        assert(doc.sections[1].body == "$1,000");
        std::cout << "[PASS] Roman part headings." << std::endl;
    }

    // The highest-priority rule that matches anywhere fixes the grammar
    {
        auto doc = segmenter.segment(
            "1. Overview\n"
            "text\n"
            "Section 1: Background\n"
            "2. Details\n");
        assert(doc.ruleName == "section-keyword");
        assert(doc.sections.size() == 2);
        assert(doc.sections[0].name == SectionSegmenter::kPreambleName);
        assert(doc.sections[0].body == "1. Overview\ntext");
        assert(doc.sections[1].name == "Section 1: Background");
        assert(doc.sections[1].body == "2. Details");
        std::cout << "[PASS] Rule priority applied per document." << std::endl;
    }

    // Repeated heading is folded into the open section
    {
        auto doc = segmenter.segment("Section 1: A\nx\nSection 1: A\ny");
        assert(doc.sections.size() == 1);
        assert(doc.sections[0].body == "x\nSection 1: A\ny");
        std::cout << "[PASS] Duplicate heading keeps names unique." << std::endl;
    }

    // No headings at all
    {
        auto doc = segmenter.segment("Free text report.\n\n  Second paragraph.\n");
        assert(doc.implicit);
        assert(doc.ruleName.empty());
        assert(doc.sections.size() == 1);
        assert(doc.sections[0].name == SectionSegmenter::kImplicitName);
        assert(doc.sections[0].body == "Free text report.\nSecond paragraph.");
        assert(doc.wholeText == doc.sections[0].body);

        auto empty = segmenter.segment("");
        assert(empty.implicit);
        assert(empty.wholeText.empty());
        assert(empty.sections.size() == 1);
        std::cout << "[PASS] Implicit single section." << std::endl;
    }

    // Custom rule set
    {
        std::vector<SectionSegmenter::HeadingRule> rules;
        rules.push_back({"hash", std::regex(R"(^#\s+(.+)$)"),
                         [](const std::smatch& m) { return m[1].str(); }});
        SectionSegmenter custom(rules);
        auto doc = custom.segment("# Goals\nwalk\n# Costs\nSection 1: not a heading here");
        assert(doc.sections.size() == 2);
        assert(doc.sections[0].name == "Goals");
        assert(doc.sections[1].body == "Section 1: not a heading here");
        std::cout << "[PASS] Custom heading rules." << std::endl;
    }

    {
        auto lines = SectionSegmenter::SplitLines("  a \r\n\n\t\nb\n");
        assert(lines.size() == 2);
        assert(lines[0] == "a" && lines[1] == "b");
        std::cout << "[PASS] SplitLines trims and drops blank lines." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
