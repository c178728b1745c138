#include "domain/SectionSegmenter.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace versionlens::domain {

namespace {
    std::string Trim(const std::string& s) {
        const char* ws = " \t\r\f\v";
        size_t start = s.find_first_not_of(ws);
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(ws);
        return s.substr(start, end - start + 1);
    }

    std::string Join(const std::vector<std::string>& lines) {
        std::string out;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) out += '\n';
            out += lines[i];
        }
        return out;
    }

    std::string ToUpper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::toupper(c); });
        return s;
    }
}

SectionSegmenter::SectionSegmenter() : m_rules(DefaultRules()) {}

SectionSegmenter::SectionSegmenter(std::vector<HeadingRule> rules) : m_rules(std::move(rules)) {}

std::vector<SectionSegmenter::HeadingRule> SectionSegmenter::DefaultRules() {
    std::vector<HeadingRule> rules;

    rules.push_back({
        "section-keyword",
        std::regex(R"(^section\s+(\d+)[:\-\s]+(\S.*)$)", std::regex::ECMAScript | std::regex::icase),
        [](const std::smatch& m) { return "Section " + m[1].str() + ": " + Trim(m[2].str()); }
    });

    // Title must start upper-case, so "1. the ..." list items stay body text.
    rules.push_back({
        "numbered",
        std::regex(R"(^(\d+)\.\s+([A-Z].*)$)", std::regex::ECMAScript),
        [](const std::smatch& m) { return "Section " + m[1].str() + ": " + Trim(m[2].str()); }
    });

    rules.push_back({
        "part-roman",
        std::regex(R"(^part\s+([ivx]+)[:\-\s]+(\S.*)$)", std::regex::ECMAScript | std::regex::icase),
        [](const std::smatch& m) { return "Part " + ToUpper(m[1].str()) + ": " + Trim(m[2].str()); }
    });

    return rules;
}

std::vector<std::string> SectionSegmenter::SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        std::string trimmed = Trim(line);
        if (!trimmed.empty()) lines.push_back(std::move(trimmed));
    }
    return lines;
}

const SectionSegmenter::HeadingRule* SectionSegmenter::selectRule(const std::vector<std::string>& lines) const {
    for (const auto& rule : m_rules) {
        for (const auto& line : lines) {
            if (std::regex_search(line, rule.pattern)) return &rule;
        }
    }
    return nullptr;
}

SegmentedDocument SectionSegmenter::segment(const std::string& text) const {
    SegmentedDocument doc;
    std::vector<std::string> lines = SplitLines(text);
    doc.wholeText = Join(lines);

    const HeadingRule* rule = selectRule(lines);
    if (!rule) {
        doc.implicit = true;
        doc.sections.push_back(Section{kImplicitName, 0, doc.wholeText});
        return doc;
    }
    doc.ruleName = rule->name;

    std::vector<std::string> preamble;
    std::vector<std::vector<std::string>> bodies;
    std::vector<std::string> names;

    for (const auto& line : lines) {
        std::smatch match;
        if (std::regex_search(line, match, rule->pattern)) {
            std::string label = rule->label(match);
            if (std::find(names.begin(), names.end(), label) == names.end()) {
                names.push_back(label);
                bodies.emplace_back();
                continue;
            }
            // Repeated heading: first occurrence keeps the name, this line stays body text.
        }
        if (bodies.empty()) {
            preamble.push_back(line);
        } else {
            bodies.back().push_back(line);
        }
    }

    int order = 0;
    if (!preamble.empty()) {
        doc.sections.push_back(Section{kPreambleName, order++, Join(preamble)});
    }
    for (size_t i = 0; i < names.size(); ++i) {
        doc.sections.push_back(Section{names[i], order++, Join(bodies[i])});
    }
    return doc;
}

} // namespace versionlens::domain
