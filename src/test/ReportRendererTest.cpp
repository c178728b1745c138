#include <cassert>
#include <iostream>
#include <string>

#include "application/ComparisonResultJson.hpp"
#include "application/ReportRenderer.hpp"
#include "domain/DiffEngine.hpp"
#include "domain/Errors.hpp"
#include "domain/SectionSegmenter.hpp"
#include "infrastructure/PdfDocumentWriter.hpp"

using namespace versionlens;
using application::ReportEncoding;
using application::ReportRenderer;

namespace {
    domain::VersionDescriptor Version(const std::string& id, const std::string& label) {
        domain::VersionDescriptor v;
        v.id = id;
        v.caseId = "3424";
        v.filename = id.substr(id.find_last_of('/') + 1);
        v.type = domain::DocumentType::LifeCarePlan;
        v.timestampLabel = label;
        v.sizeBytes = 2048;
        return v;
    }

    size_t Count(const std::string& haystack, const std::string& needle) {
        size_t n = 0;
        for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
            ++n;
        }
        return n;
    }

    domain::ComparisonResult MakeResult() {
        domain::SectionSegmenter segmenter;
        auto left = segmenter.segment(
            "Section 1: Introduction\nClaimant <John> evaluated.\n"
            "Section 2: Medical History\nFracture.\n"
            "Section 3: Old Notes\nobsolete\n");
        auto right = segmenter.segment(
            "Section 1: Introduction\nClaimant <John> evaluated.\n"
            "Section 2: Medical History\nFracture & surgery.\n"
            "Section 4: Costs\nWheelchair\n");

        domain::ComparisonResult result;
        result.caseId = "3424";
        result.mode = domain::ComparisonMode::Sequential;
        result.generatedAt = "2024-04-01T12:00:00Z";
        result.versions = {
            Version("3424/Output/202401151030-3424-LCP.pdf", "2024-01-15 10:30"),
            Version("3424/Output/202402151030-3424-LCP.pdf", "2024-02-15 10:30"),
            Version("3424/Output/202403151030-3424-LCP.pdf", "2024-03-15 10:30")
        };

        domain::VersionPair first;
        first.leftId = result.versions[0].id;
        first.rightId = result.versions[1].id;
        first.diff = domain::DiffEngine::Compare(left, right);
        result.pairs.push_back(first);

        domain::VersionPair second;
        second.leftId = result.versions[1].id;
        second.rightId = result.versions[2].id;
        second.comparable = false;
        second.unavailableIds = {result.versions[2].id};
        result.pairs.push_back(second);

        result.versionErrors.push_back({result.versions[2].id, domain::VersionError::Stage::Extract,
                                        "Could not extract text"});
        result.summary = first.diff.summary;
        return result;
    }
}

int main() {
    std::cout << "[Test] Starting ReportRenderer Test..." << std::endl;
    const auto result = MakeResult();
    assert(result.summary.total == 4);

    {
        assert(ReportRenderer::ParseEncoding("HTML") == ReportEncoding::InteractiveMarkup);
        assert(ReportRenderer::ParseEncoding("interactive-markup") == ReportEncoding::InteractiveMarkup);
        assert(ReportRenderer::ParseEncoding("pdf") == ReportEncoding::PaginatedDocument);
        assert(!ReportRenderer::ParseEncoding("docx"));
        assert(ReportRenderer::ContentType(ReportEncoding::PaginatedDocument) == "application/pdf");
        assert(ReportRenderer::FileExtension(ReportEncoding::InteractiveMarkup) == ".html");
        assert(ReportRenderer::FormatFileSize(512) == "512.0 B");
        assert(ReportRenderer::FormatFileSize(1536) == "1.5 KB");
        std::cout << "[PASS] Encoding names and helpers." << std::endl;
    }

    // HTML: counts equal the diff, one block per section, content escaped
    {
        std::string html = ReportRenderer::Render(result, ReportEncoding::InteractiveMarkup);
        assert(html.rfind("<!DOCTYPE html>", 0) == 0);
        assert(html.find("<td data-count=\"total\">4</td>") != std::string::npos);
        assert(html.find("<td data-count=\"added\">1</td>") != std::string::npos);
        assert(html.find("<td data-count=\"removed\">1</td>") != std::string::npos);
        assert(html.find("<td data-count=\"modified\">1</td>") != std::string::npos);
        assert(html.find("<td data-count=\"unchanged\">1</td>") != std::string::npos);
        assert(Count(html, "<details class=\"section ") == 4);
        assert(Count(html, "section-modified") == 1);
        assert(html.find("No changes detected in this section.") != std::string::npos);
        assert(html.find("Claimant &lt;John&gt; evaluated.") == std::string::npos);  // unchanged body not listed
        assert(html.find("Fracture &amp; surgery.") != std::string::npos);
        assert(html.find("<John>") == std::string::npos);
        assert(html.find("NOT COMPARABLE") != std::string::npos);
        assert(html.find("id=\"hide-unchanged\"") != std::string::npos);
        assert(html.find("(extract): Could not extract text") != std::string::npos);
        assert(html.find("<p>202403151030-3424-LCP.pdf: text could not be extracted</p>") != std::string::npos);
        std::cout << "[PASS] HTML report." << std::endl;
    }

    // The not-comparable notice follows the stage at which the version failed
    {
        auto fetchFailed = result;
        fetchFailed.versionErrors[0] = {result.versions[2].id, domain::VersionError::Stage::Fetch,
                                        "Object not found: gone"};
        std::string html = ReportRenderer::Render(fetchFailed, ReportEncoding::InteractiveMarkup);
        assert(html.find("<p>202403151030-3424-LCP.pdf: could not be fetched</p>") != std::string::npos);
        assert(html.find("text could not be extracted") == std::string::npos);

        std::string pdf = ReportRenderer::Render(fetchFailed, "pdf");
        assert(pdf.find("[NOT COMPARABLE] 202403151030-3424-LCP.pdf: could not be fetched") != std::string::npos);
        assert(pdf.find("text could not be extracted") == std::string::npos);
        std::cout << "[PASS] Not-comparable reason." << std::endl;
    }

    // Long blocks are truncated for display only
    {
        domain::ComparisonResult big;
        big.caseId = "77";
        domain::VersionPair pair;
        pair.leftId = "77/a.pdf";
        pair.rightId = "77/b.pdf";
        domain::SectionDiff section;
        section.sectionName = "Section 1: Items";
        section.status = domain::SectionStatus::Added;
        for (int i = 0; i < 25; ++i) section.addedLines.push_back("item " + std::to_string(i));
        pair.diff.sections.push_back(section);
        pair.diff.summary.count(section.status);
        big.pairs.push_back(pair);
        big.summary = pair.diff.summary;

        application::RenderOptions options;
        options.maxLinesPerBlock = 10;
        std::string html = ReportRenderer::Render(big, ReportEncoding::InteractiveMarkup, options);
        assert(html.find("Content (25)") != std::string::npos);
        assert(html.find("item 9") != std::string::npos);
        assert(html.find("item 10<") == std::string::npos);
        assert(html.find("... and 15 more lines") != std::string::npos);

        options.maxLinesPerBlock = 0;
        html = ReportRenderer::Render(big, ReportEncoding::InteractiveMarkup, options);
        assert(html.find("item 24") != std::string::npos);
        std::cout << "[PASS] Display truncation." << std::endl;
    }

    // PDF
    {
        std::string pdf = ReportRenderer::Render(result, "pdf");
        assert(pdf.rfind("%PDF-1.4", 0) == 0);
        assert(pdf.find("%%EOF") != std::string::npos);
        assert(pdf.find("startxref") != std::string::npos);
        assert(pdf.find("Section 4: Costs [ADDED]") != std::string::npos);
        assert(pdf.find("NOT COMPARABLE") != std::string::npos);

        infrastructure::PdfDocumentWriter writer("Pages");
        for (int i = 0; i < 200; ++i) writer.addLine("line " + std::to_string(i));
        assert(writer.pageCount() > 1);
        std::string bytes = writer.finish();
        assert(bytes.find("/Count " + std::to_string(writer.pageCount())) != std::string::npos);
        std::cout << "[PASS] PDF report." << std::endl;
    }

    // Rejections
    {
        bool unsupported = false;
        try {
            ReportRenderer::Render(result, "docx");
        } catch (const domain::RenderError&) {
            unsupported = true;
        }
        assert(unsupported);

        auto drifted = result;
        drifted.pairs[0].diff.summary.unchanged += 1;
        bool mismatch = false;
        try {
            ReportRenderer::Render(drifted, ReportEncoding::InteractiveMarkup);
        } catch (const domain::RenderError&) {
            mismatch = true;
        }
        assert(mismatch);

        auto inconsistent = result;
        inconsistent.pairs[1].unavailableIds.clear();
        bool noIds = false;
        try {
            ReportRenderer::Validate(inconsistent);
        } catch (const domain::RenderError&) {
            noIds = true;
        }
        assert(noIds);
        std::cout << "[PASS] Invalid input rejected." << std::endl;
    }

    // Structured export
    {
        auto j = application::ComparisonResultJson::ToJson(result);
        assert(j["case_id"] == "3424");
        assert(j["mode"] == "sequential");
        assert(j["versions"].size() == 3);
        assert(j["pairs"].size() == 2);
        assert(j["pairs"][0]["sections"].size() == 4);
        assert(j["pairs"][0]["sections"][1]["status"] == "modified");
        assert(j["pairs"][0]["sections"][1]["modified_pairs"][0]["new"] == "Fracture & surgery.");
        assert(j["pairs"][1]["comparable"] == false);
        assert(j["pairs"][1]["unavailable"].size() == 1);
        assert(j["summary"]["total"] == 4);
        assert(j["version_errors"][0]["stage"] == "extract");
        std::cout << "[PASS] JSON export." << std::endl;
    }

    // Latin-1 text from an extractor still serialises
    {
        domain::ComparisonResult latin;
        latin.caseId = "3424";
        domain::VersionPair pair;
        pair.leftId = "3424/a.pdf";
        pair.rightId = "3424/b.pdf";
        pair.diff = domain::DiffEngine::Compare(
            domain::SectionSegmenter().segment("Section 1: Notes\nplain\n"),
            domain::SectionSegmenter().segment("Section 1: Notes\nplain\ncaf\xE9 visit\n"));
        latin.pairs.push_back(pair);
        latin.summary = pair.diff.summary;
        assert(latin.pairs[0].diff.sections[0].addedLines[0] == "caf\xE9 visit");

        std::string text = application::ComparisonResultJson::Dump(latin);
        assert(text.find("caf\xEF\xBF\xBD visit") != std::string::npos);
        auto reparsed = nlohmann::json::parse(text);
        assert(reparsed["pairs"][0]["sections"][0]["status"] == "modified");
        std::cout << "[PASS] Invalid UTF-8 replaced in JSON output." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
