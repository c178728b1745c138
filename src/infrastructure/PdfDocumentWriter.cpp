/**
 * @file PdfDocumentWriter.cpp
 * @brief Implementation of PdfDocumentWriter.
 */

#include "infrastructure/PdfDocumentWriter.hpp"
#include <iomanip>
#include <sstream>

namespace versionlens::infrastructure {

namespace {
    constexpr double kPageWidth = 595.0;   // A4, points
    constexpr double kPageHeight = 842.0;
    constexpr double kMargin = 50.0;
    constexpr double kFooterSpace = 20.0;
    constexpr double kIndentStep = 14.0;
    constexpr double kSpacer = 8.0;

    struct Metrics {
        double size;
        double leading;
        bool bold;
    };

    Metrics MetricsFor(PdfDocumentWriter::Style style) {
        switch (style) {
            case PdfDocumentWriter::Style::Title: return {18.0, 26.0, true};
            case PdfDocumentWriter::Style::Heading: return {14.0, 20.0, true};
            case PdfDocumentWriter::Style::Subheading: return {11.0, 16.0, true};
            case PdfDocumentWriter::Style::Body: return {10.0, 14.0, false};
        }
        return {10.0, 14.0, false};
    }

    const char* ColorFor(PdfDocumentWriter::Tone tone) {
        switch (tone) {
            case PdfDocumentWriter::Tone::Normal: return "0.10 0.10 0.10";
            case PdfDocumentWriter::Tone::Muted: return "0.45 0.45 0.45";
            case PdfDocumentWriter::Tone::Added: return "0.08 0.45 0.20";
            case PdfDocumentWriter::Tone::Removed: return "0.70 0.10 0.15";
            case PdfDocumentWriter::Tone::Modified: return "0.60 0.42 0.00";
            case PdfDocumentWriter::Tone::Alert: return "0.75 0.00 0.00";
        }
        return "0 0 0";
    }

    size_t MaxChars(const Metrics& m, int indent) {
        // Helvetica averages roughly half an em per glyph.
        double width = kPageWidth - 2 * kMargin - indent * kIndentStep;
        double chars = width / (m.size * (m.bold ? 0.56 : 0.5));
        return chars < 10 ? 10 : static_cast<size_t>(chars);
    }
}

PdfDocumentWriter::PdfDocumentWriter(std::string title) : m_title(std::move(title)) {}

void PdfDocumentWriter::addLine(const std::string& text, Style style, Tone tone, int indent) {
    Metrics m = MetricsFor(style);
    for (auto& piece : Wrap(text, MaxChars(m, indent))) {
        m_lines.push_back(Line{std::move(piece), style, tone, indent});
    }
}

void PdfDocumentWriter::addSpacer() {
    m_lines.push_back(Line{"", Style::Body, Tone::Normal, -1});
}

std::vector<std::string> PdfDocumentWriter::Wrap(const std::string& text, size_t maxChars) {
    std::vector<std::string> out;
    std::string rest = text;
    while (rest.size() > maxChars) {
        size_t cut = rest.rfind(' ', maxChars);
        if (cut == std::string::npos || cut == 0) cut = maxChars;
        out.push_back(rest.substr(0, cut));
        size_t next = rest.find_first_not_of(' ', cut);
        rest = next == std::string::npos ? "" : rest.substr(next);
    }
    out.push_back(rest);
    return out;
}

std::string PdfDocumentWriter::Escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (c == '(' || c == ')' || c == '\\') {
            out += '\\';
            out += static_cast<char>(c);
        } else if (c == '\t') {
            out += "    ";
        } else if (c < 0x20) {
            continue;
        } else if (c >= 0x7f) {
            // Skip UTF-8 continuation bytes so each multi-byte character becomes one '?'.
            if ((c & 0xC0) != 0x80) out += '?';
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

std::vector<std::vector<PdfDocumentWriter::Line>> PdfDocumentWriter::paginate() const {
    std::vector<std::vector<Line>> pages(1);
    double y = kPageHeight - kMargin;
    const double bottom = kMargin + kFooterSpace;

    for (const auto& line : m_lines) {
        double advance = line.indent < 0 ? kSpacer : MetricsFor(line.style).leading;
        if (y - advance < bottom && !pages.back().empty()) {
            pages.emplace_back();
            y = kPageHeight - kMargin;
            if (line.indent < 0) continue; // no spacer at the top of a page
        }
        pages.back().push_back(line);
        y -= advance;
    }
    return pages;
}

size_t PdfDocumentWriter::pageCount() const {
    return paginate().size();
}

std::string PdfDocumentWriter::finish() const {
    std::vector<std::vector<Line>> pages = paginate();
    const size_t pageCount = pages.size();

    // Object layout: 1 catalog, 2 page tree, 3 regular font, 4 bold font, 5 info,
    // then a (page, content) object pair per page.
    const size_t firstPageObj = 6;
    const size_t objectCount = 5 + 2 * pageCount;

    std::ostringstream pdf;
    std::vector<std::streamoff> offsets(objectCount + 1, 0);
    pdf << "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";

    auto beginObject = [&](size_t id) {
        offsets[id] = pdf.tellp();
        pdf << id << " 0 obj\n";
    };

    beginObject(1);
    pdf << "<< /Type /Catalog /Pages 2 0 R >>\nendobj\n";

    beginObject(2);
    pdf << "<< /Type /Pages /Count " << pageCount << " /Kids [";
    for (size_t i = 0; i < pageCount; ++i) {
        pdf << (i ? " " : "") << (firstPageObj + 2 * i) << " 0 R";
    }
    pdf << "] >>\nendobj\n";

    beginObject(3);
    pdf << "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>\nendobj\n";
    beginObject(4);
    pdf << "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Bold /Encoding /WinAnsiEncoding >>\nendobj\n";

    beginObject(5);
    pdf << "<< /Title (" << Escape(m_title) << ") /Producer (VersionLens) >>\nendobj\n";

    pdf << std::fixed << std::setprecision(2);
    for (size_t p = 0; p < pageCount; ++p) {
        std::ostringstream content;
        content << std::fixed << std::setprecision(2);
        double y = kPageHeight - kMargin;
        for (const auto& line : pages[p]) {
            if (line.indent < 0) {
                y -= kSpacer;
                continue;
            }
            Metrics m = MetricsFor(line.style);
            y -= m.leading;
            content << "BT " << ColorFor(line.tone) << " rg /" << (m.bold ? "F2" : "F1") << " " << m.size
                    << " Tf " << (kMargin + line.indent * kIndentStep) << " " << y
                    << " Td (" << Escape(line.text) << ") Tj ET\n";
        }
        content << "BT " << ColorFor(Tone::Muted) << " rg /F1 8.00 Tf " << kMargin << " " << kMargin
                << " Td (Page " << (p + 1) << " of " << pageCount << ") Tj ET\n";
        const std::string stream = content.str();

        const size_t pageObj = firstPageObj + 2 * p;
        beginObject(pageObj);
        pdf << "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " << kPageWidth << " " << kPageHeight << "]"
            << " /Resources << /Font << /F1 3 0 R /F2 4 0 R >> >>"
            << " /Contents " << (pageObj + 1) << " 0 R >>\nendobj\n";

        beginObject(pageObj + 1);
        pdf << "<< /Length " << stream.size() << " >>\nstream\n" << stream << "endstream\nendobj\n";
    }

    const std::streamoff xrefOffset = pdf.tellp();
    pdf << "xref\n0 " << (objectCount + 1) << "\n";
    pdf << "0000000000 65535 f \n";
    for (size_t id = 1; id <= objectCount; ++id) {
        pdf << std::setw(10) << std::setfill('0') << offsets[id] << " 00000 n \n";
    }
    pdf << "trailer\n<< /Size " << (objectCount + 1) << " /Root 1 0 R /Info 5 0 R >>\n"
        << "startxref\n" << xrefOffset << "\n%%EOF\n";
    return pdf.str();
}

} // namespace versionlens::infrastructure
