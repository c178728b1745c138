/**
 * @file ReportRenderer.cpp
 * @brief Implementation of ReportRenderer (HTML and PDF reports).
 */

#include "application/ReportRenderer.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/PdfDocumentWriter.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace versionlens::application {

using domain::ComparisonResult;
using domain::RenderError;
using domain::SectionDiff;
using domain::SectionStatus;
using infrastructure::PdfDocumentWriter;

namespace {

std::string EscapeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::toupper(c); });
    return s;
}

std::string DisplayName(const ComparisonResult& result, const std::string& id) {
    for (const auto& version : result.versions) {
        if (version.id == id) return version.filename;
    }
    size_t slash = id.find_last_of('/');
    return slash == std::string::npos ? id : id.substr(slash + 1);
}

// "name: reason" for each side of a pair that had no text, reason taken from its VersionError.
std::string UnavailableSides(const ComparisonResult& result, const domain::VersionPair& pair) {
    std::string out;
    for (const auto& id : pair.unavailableIds) {
        auto it = std::find_if(result.versionErrors.begin(), result.versionErrors.end(),
                               [&id](const domain::VersionError& e) { return e.versionId == id; });
        std::string reason = "unavailable";
        if (it != result.versionErrors.end()) {
            switch (it->stage) {
                case domain::VersionError::Stage::Resolve: reason = "not a version of this case"; break;
                case domain::VersionError::Stage::Fetch: reason = "could not be fetched"; break;
                case domain::VersionError::Stage::Extract: reason = "text could not be extracted"; break;
            }
        }
        if (!out.empty()) out += "; ";
        out += DisplayName(result, id) + ": " + reason;
    }
    return out;
}

size_t Shown(size_t count, size_t limit) {
    return limit == 0 ? count : std::min(count, limit);
}

std::string MoreLine(size_t hidden, const char* noun) {
    return "... and " + std::to_string(hidden) + " more " + noun;
}

const char* kStyles = R"(
body { font-family: 'Segoe UI', Tahoma, Geneva, Verdana, sans-serif; max-width: 1200px; margin: 0 auto; padding: 20px; background: #f5f5f5; }
.header { background: linear-gradient(135deg, #667eea 0%, #764ba2 100%); color: white; padding: 30px; border-radius: 10px; margin-bottom: 30px; }
.header table { color: white; border-collapse: collapse; }
.header td { padding: 2px 12px 2px 0; }
.toolbar { margin-bottom: 20px; }
.errors { background: #f8d7da; color: #721c24; padding: 15px 20px; border-radius: 8px; margin-bottom: 20px; }
.pair { margin-bottom: 40px; }
table.summary { border-collapse: collapse; margin-bottom: 20px; background: white; }
table.summary th, table.summary td { border: 1px solid #ddd; padding: 6px 14px; text-align: center; }
.section { background: white; padding: 20px; margin-bottom: 20px; border-radius: 8px; box-shadow: 0 2px 4px rgba(0,0,0,0.1); }
.section-title { font-size: 1.2em; font-weight: bold; color: #333; cursor: pointer; }
.status-badge { display: inline-block; padding: 5px 12px; border-radius: 20px; font-size: 0.85em; font-weight: bold; margin-left: 10px; }
.status-added { background: #d4edda; color: #155724; }
.status-removed { background: #f8d7da; color: #721c24; }
.status-modified { background: #fff3cd; color: #856404; }
.status-unchanged { background: #d1ecf1; color: #0c5460; }
.status-not-comparable { background: #e2e3e5; color: #383d41; }
.change-item { margin: 10px 0; padding: 10px; border-left: 3px solid #ddd; background: #f9f9f9; }
.change-item p { margin: 4px 0; white-space: pre-wrap; }
.added { border-left-color: #28a745; background: #d4edda; }
.removed { border-left-color: #dc3545; background: #f8d7da; }
.changed { border-left-color: #ffc107; background: #fff3cd; }
.change-label { font-weight: bold; margin-bottom: 5px; }
.not-comparable { background: white; border-left: 4px solid #6c757d; padding: 20px; border-radius: 8px; }
body.hide-unchanged .section-unchanged { display: none; }
)";

const char* kScript = R"(
document.getElementById('hide-unchanged').addEventListener('change', function (e) {
  document.body.classList.toggle('hide-unchanged', e.target.checked);
});
)";

void HtmlBlock(std::ostringstream& html, const char* cssClass, const char* label,
               const std::vector<std::string>& lines, size_t limit) {
    if (lines.empty()) return;
    html << "<div class=\"change-item " << cssClass << "\"><div class=\"change-label\">" << label
         << " (" << lines.size() << ")</div>\n";
    size_t shown = Shown(lines.size(), limit);
    for (size_t i = 0; i < shown; ++i) {
        html << "<p>" << EscapeHtml(lines[i]) << "</p>\n";
    }
    if (shown < lines.size()) {
        html << "<p><em>" << MoreLine(lines.size() - shown, "lines") << "</em></p>\n";
    }
    html << "</div>\n";
}

void HtmlSummary(std::ostringstream& html, const domain::DiffSummary& s) {
    html << "<table class=\"summary\"><tr><th>Sections</th><th>Added</th><th>Removed</th>"
         << "<th>Modified</th><th>Unchanged</th></tr>\n"
         << "<tr><td data-count=\"total\">" << s.total << "</td>"
         << "<td data-count=\"added\">" << s.added << "</td>"
         << "<td data-count=\"removed\">" << s.removed << "</td>"
         << "<td data-count=\"modified\">" << s.modified << "</td>"
         << "<td data-count=\"unchanged\">" << s.unchanged << "</td></tr></table>\n";
}

void HtmlSection(std::ostringstream& html, const SectionDiff& section, size_t limit) {
    const std::string status = domain::SectionStatusToString(section.status);
    html << "<details class=\"section section-" << status << "\""
         << (section.status == SectionStatus::Unchanged ? "" : " open") << ">\n"
         << "<summary class=\"section-title\">" << EscapeHtml(section.sectionName)
         << "<span class=\"status-badge status-" << status << "\">" << ToUpper(status) << "</span></summary>\n";

    switch (section.status) {
        case SectionStatus::Unchanged:
            html << "<p>No changes detected in this section.</p>\n";
            break;
        case SectionStatus::Added:
            html << "<div class=\"change-label\">Section added</div>\n";
            HtmlBlock(html, "added", "Content", section.addedLines, limit);
            break;
        case SectionStatus::Removed:
            html << "<div class=\"change-label\">Section removed</div>\n";
            HtmlBlock(html, "removed", "Content", section.removedLines, limit);
            break;
        case SectionStatus::Modified: {
            HtmlBlock(html, "added", "Added lines", section.addedLines, limit);
            HtmlBlock(html, "removed", "Removed lines", section.removedLines, limit);
            if (!section.modifiedPairs.empty()) {
                html << "<div class=\"change-item changed\"><div class=\"change-label\">Modified lines ("
                     << section.modifiedPairs.size() << ")</div>\n";
                size_t shown = Shown(section.modifiedPairs.size(), limit);
                for (size_t i = 0; i < shown; ++i) {
                    html << "<p><strong>Old:</strong> " << EscapeHtml(section.modifiedPairs[i].oldLine) << "</p>\n"
                         << "<p><strong>New:</strong> " << EscapeHtml(section.modifiedPairs[i].newLine) << "</p>\n"
                         << "<hr>\n";
                }
                if (shown < section.modifiedPairs.size()) {
                    html << "<p><em>" << MoreLine(section.modifiedPairs.size() - shown, "changes") << "</em></p>\n";
                }
                html << "</div>\n";
            }
            break;
        }
    }
    html << "</details>\n";
}

PdfDocumentWriter::Tone ToneFor(SectionStatus status) {
    switch (status) {
        case SectionStatus::Added: return PdfDocumentWriter::Tone::Added;
        case SectionStatus::Removed: return PdfDocumentWriter::Tone::Removed;
        case SectionStatus::Modified: return PdfDocumentWriter::Tone::Modified;
        case SectionStatus::Unchanged: return PdfDocumentWriter::Tone::Muted;
    }
    return PdfDocumentWriter::Tone::Normal;
}

void PdfLines(PdfDocumentWriter& pdf, const char* prefix, const std::vector<std::string>& lines,
              PdfDocumentWriter::Tone tone, size_t limit) {
    size_t shown = Shown(lines.size(), limit);
    for (size_t i = 0; i < shown; ++i) {
        pdf.addLine(prefix + lines[i], PdfDocumentWriter::Style::Body, tone, 1);
    }
    if (shown < lines.size()) {
        pdf.addLine(MoreLine(lines.size() - shown, "lines"), PdfDocumentWriter::Style::Body,
                    PdfDocumentWriter::Tone::Muted, 1);
    }
}

std::string SummaryLine(const domain::DiffSummary& s) {
    std::ostringstream ss;
    ss << "Sections: " << s.total << " total, " << s.added << " added, " << s.removed << " removed, "
       << s.modified << " modified, " << s.unchanged << " unchanged";
    return ss.str();
}

} // namespace

std::optional<ReportEncoding> ReportRenderer::ParseEncoding(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
    if (lower == "html" || lower == "interactive-markup") return ReportEncoding::InteractiveMarkup;
    if (lower == "pdf" || lower == "paginated-document") return ReportEncoding::PaginatedDocument;
    return std::nullopt;
}

std::string ReportRenderer::ContentType(ReportEncoding encoding) {
    return encoding == ReportEncoding::PaginatedDocument ? "application/pdf" : "text/html; charset=utf-8";
}

std::string ReportRenderer::FileExtension(ReportEncoding encoding) {
    return encoding == ReportEncoding::PaginatedDocument ? ".pdf" : ".html";
}

std::string ReportRenderer::FormatFileSize(long long bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(bytes);
    for (const char* unit : units) {
        if (size < 1024.0) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(1) << size << " " << unit;
            return ss.str();
        }
        size /= 1024.0;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << size << " TB";
    return ss.str();
}

void ReportRenderer::Validate(const ComparisonResult& result) {
    domain::DiffSummary overall;
    for (const auto& pair : result.pairs) {
        const std::string label = pair.leftId + " -> " + pair.rightId;
        if (!pair.comparable) {
            if (!pair.diff.sections.empty()) {
                throw RenderError("Pair " + label + " is not comparable but carries section diffs");
            }
            if (pair.unavailableIds.empty()) {
                throw RenderError("Pair " + label + " is not comparable but names no unavailable version");
            }
            continue;
        }
        domain::DiffSummary tally;
        for (const auto& section : pair.diff.sections) {
            tally.count(section.status);
        }
        if (tally != pair.diff.summary) {
            throw RenderError("Summary of pair " + label + " does not match its sections");
        }
        overall += tally;
    }
    if (overall != result.summary) {
        throw RenderError("Result summary does not match the summaries of its pairs");
    }
}

std::string ReportRenderer::Render(const ComparisonResult& result, const std::string& encodingName,
                                   const RenderOptions& options) {
    auto encoding = ParseEncoding(encodingName);
    if (!encoding) {
        throw RenderError("Unsupported report encoding: '" + encodingName + "'");
    }
    return Render(result, *encoding, options);
}

std::string ReportRenderer::Render(const ComparisonResult& result, ReportEncoding encoding,
                                   const RenderOptions& options) {
    if (encoding != ReportEncoding::InteractiveMarkup && encoding != ReportEncoding::PaginatedDocument) {
        throw RenderError("Unsupported report encoding: " + std::to_string(static_cast<int>(encoding)));
    }
    Validate(result);
    return encoding == ReportEncoding::InteractiveMarkup ? ToHtml(result, options) : ToPdf(result, options);
}

std::string ReportRenderer::ToHtml(const ComparisonResult& result, const RenderOptions& options) {
    std::ostringstream html;
    html << "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n<meta charset=\"UTF-8\">\n"
         << "<title>Version Comparison - Case " << EscapeHtml(result.caseId) << "</title>\n"
         << "<style>" << kStyles << "</style>\n</head>\n<body>\n";

    html << "<div class=\"header\">\n<h1>Version Comparison Report</h1>\n"
         << "<p><strong>Case ID:</strong> " << EscapeHtml(result.caseId) << "</p>\n"
         << "<p><strong>Comparison Mode:</strong> " << domain::ComparisonModeToString(result.mode) << "</p>\n"
         << "<p><strong>Generated:</strong> " << EscapeHtml(result.generatedAt) << "</p>\n"
         << "<table class=\"versions\">\n";
    for (const auto& version : result.versions) {
        html << "<tr><td>" << EscapeHtml(version.filename) << "</td><td>" << EscapeHtml(version.timestampLabel)
             << "</td><td>" << FormatFileSize(version.sizeBytes) << "</td></tr>\n";
    }
    html << "</table>\n</div>\n";

    html << "<div class=\"toolbar\"><label><input type=\"checkbox\" id=\"hide-unchanged\"> "
         << "Hide unchanged sections</label></div>\n";

    if (!result.versionErrors.empty()) {
        html << "<div class=\"errors\"><strong>Versions that could not be used:</strong>\n<ul>\n";
        for (const auto& error : result.versionErrors) {
            html << "<li>" << EscapeHtml(DisplayName(result, error.versionId)) << " ("
                 << domain::VersionError::StageToString(error.stage) << "): " << EscapeHtml(error.message) << "</li>\n";
        }
        html << "</ul>\n</div>\n";
    }

    for (size_t i = 0; i < result.pairs.size(); ++i) {
        const auto& pair = result.pairs[i];
        html << "<div class=\"pair\" id=\"pair-" << (i + 1) << "\">\n<h2>"
             << EscapeHtml(DisplayName(result, pair.leftId)) << " &rarr; "
             << EscapeHtml(DisplayName(result, pair.rightId)) << "</h2>\n";

        if (!pair.comparable) {
            html << "<div class=\"not-comparable\"><span class=\"status-badge status-not-comparable\">"
                 << "NOT COMPARABLE</span>\n<p>" << EscapeHtml(UnavailableSides(result, pair))
                 << "</p></div>\n</div>\n";
            continue;
        }

        HtmlSummary(html, pair.diff.summary);
        for (const auto& section : pair.diff.sections) {
            HtmlSection(html, section, options.maxLinesPerBlock);
        }
        html << "</div>\n";
    }

    html << "<script>" << kScript << "</script>\n</body>\n</html>\n";
    return html.str();
}

std::string ReportRenderer::ToPdf(const ComparisonResult& result, const RenderOptions& options) {
    using Style = PdfDocumentWriter::Style;
    using Tone = PdfDocumentWriter::Tone;

    PdfDocumentWriter pdf("Version Comparison - Case " + result.caseId);
    pdf.addLine("Version Comparison Report", Style::Title);
    pdf.addLine("Case ID: " + result.caseId);
    pdf.addLine("Mode: " + domain::ComparisonModeToString(result.mode));
    pdf.addLine("Generated: " + result.generatedAt);
    pdf.addLine("Versions:");
    for (const auto& version : result.versions) {
        pdf.addLine(version.filename + " (" + version.timestampLabel + ", " + FormatFileSize(version.sizeBytes) + ")",
                    Style::Body, Tone::Normal, 1);
    }

    if (!result.versionErrors.empty()) {
        pdf.addSpacer();
        pdf.addLine("Versions that could not be used:", Style::Subheading, Tone::Alert);
        for (const auto& error : result.versionErrors) {
            pdf.addLine(DisplayName(result, error.versionId) + " (" + domain::VersionError::StageToString(error.stage) +
                        "): " + error.message, Style::Body, Tone::Alert, 1);
        }
    }

    for (const auto& pair : result.pairs) {
        pdf.addSpacer();
        pdf.addLine(DisplayName(result, pair.leftId) + " -> " + DisplayName(result, pair.rightId), Style::Heading);

        if (!pair.comparable) {
            pdf.addLine("[NOT COMPARABLE] " + UnavailableSides(result, pair),
                        Style::Body, Tone::Alert);
            continue;
        }

        pdf.addLine(SummaryLine(pair.diff.summary));
        for (const auto& section : pair.diff.sections) {
            const std::string status = ToUpper(domain::SectionStatusToString(section.status));
            pdf.addSpacer();
            pdf.addLine(section.sectionName + " [" + status + "]", Style::Subheading, ToneFor(section.status));

            switch (section.status) {
                case SectionStatus::Unchanged:
                    pdf.addLine("No changes detected in this section.", Style::Body, Tone::Muted, 1);
                    break;
                case SectionStatus::Added:
                    PdfLines(pdf, "+ ", section.addedLines, Tone::Added, options.maxLinesPerBlock);
                    break;
                case SectionStatus::Removed:
                    PdfLines(pdf, "- ", section.removedLines, Tone::Removed, options.maxLinesPerBlock);
                    break;
                case SectionStatus::Modified: {
                    PdfLines(pdf, "+ ", section.addedLines, Tone::Added, options.maxLinesPerBlock);
                    PdfLines(pdf, "- ", section.removedLines, Tone::Removed, options.maxLinesPerBlock);
                    size_t shown = Shown(section.modifiedPairs.size(), options.maxLinesPerBlock);
                    for (size_t i = 0; i < shown; ++i) {
                        pdf.addLine("Old: " + section.modifiedPairs[i].oldLine, Style::Body, Tone::Removed, 1);
                        pdf.addLine("New: " + section.modifiedPairs[i].newLine, Style::Body, Tone::Added, 1);
                    }
                    if (shown < section.modifiedPairs.size()) {
                        pdf.addLine(MoreLine(section.modifiedPairs.size() - shown, "changes"),
                                    Style::Body, Tone::Muted, 1);
                    }
                    break;
                }
            }
        }
    }

    return pdf.finish();
}

} // namespace versionlens::application
