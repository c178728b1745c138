#include "domain/DiffEngine.hpp"
#include "domain/LineDiff.hpp"
#include "domain/SectionSegmenter.hpp"

namespace versionlens::domain {

namespace {
    SectionDiff WholeSection(const std::string& name, const std::string& body, bool added) {
        SectionDiff diff;
        diff.sectionName = name;
        diff.status = added ? SectionStatus::Added : SectionStatus::Removed;
        for (auto& line : SectionSegmenter::SplitLines(body)) {
            diff.changes.push_back({added ? LineChange::Kind::Added : LineChange::Kind::Removed, line});
            (added ? diff.addedLines : diff.removedLines).push_back(std::move(line));
        }
        return diff;
    }
}

SectionDiff DiffEngine::CompareSection(const std::string& name,
                                       const std::string& leftBody,
                                       const std::string& rightBody) {
    std::vector<std::string> leftLines = SectionSegmenter::SplitLines(leftBody);
    std::vector<std::string> rightLines = SectionSegmenter::SplitLines(rightBody);

    SectionDiff diff;
    diff.sectionName = name;

    if (leftLines == rightLines) {
        diff.status = SectionStatus::Unchanged;
        for (auto& line : leftLines) {
            diff.changes.push_back({LineChange::Kind::Unchanged, std::move(line)});
        }
        return diff;
    }

    diff.status = SectionStatus::Modified;
    diff.changes = LineDiff::Compute(leftLines, rightLines);
    LineDiff::Collapse(diff.changes, diff);
    return diff;
}

DocumentDiff DiffEngine::Compare(const SegmentedDocument& left, const SegmentedDocument& right) {
    DocumentDiff result;

    if (left.wholeText.empty() != right.wholeText.empty()) {
        const bool added = left.wholeText.empty();
        for (const auto& section : (added ? right : left).sections) {
            result.sections.push_back(WholeSection(section.name, section.body, added));
        }
    } else if (left.implicit || right.implicit) {
        // Headings on only one side cannot be matched, so compare the texts as a whole.
        result.sections.push_back(CompareSection(SectionSegmenter::kImplicitName, left.wholeText, right.wholeText));
    } else {
        for (const auto& section : left.sections) {
            const Section* other = right.find(section.name);
            if (!other) {
                result.sections.push_back(WholeSection(section.name, section.body, false));
            } else {
                result.sections.push_back(CompareSection(section.name, section.body, other->body));
            }
        }
        for (const auto& section : right.sections) {
            if (!left.contains(section.name)) {
                result.sections.push_back(WholeSection(section.name, section.body, true));
            }
        }
    }

    for (const auto& section : result.sections) {
        result.summary.count(section.status);
    }
    return result;
}

} // namespace versionlens::domain
