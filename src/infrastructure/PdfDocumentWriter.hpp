/**
 * @file PdfDocumentWriter.hpp
 * @brief Minimal paginated text document writer producing PDF 1.4 bytes.
 */

#pragma once
#include <string>
#include <vector>

namespace versionlens::infrastructure {

/**
 * @class PdfDocumentWriter
 * @brief Lays out lines of text on A4 pages using the standard Helvetica fonts.
 *
 * Long lines are wrapped and pages are broken automatically. Text outside
 * printable ASCII is replaced with '?', the standard fonts carry no other glyphs.
 */
class PdfDocumentWriter {
public:
    enum class Style { Title, Heading, Subheading, Body };
    enum class Tone { Normal, Muted, Added, Removed, Modified, Alert };

    explicit PdfDocumentWriter(std::string title);

    void addLine(const std::string& text, Style style = Style::Body, Tone tone = Tone::Normal, int indent = 0);
    void addSpacer();

    /** @brief Serializes the document. Can be called more than once. */
    std::string finish() const;

    /** @brief Number of pages finish() will produce. */
    size_t pageCount() const;

private:
    struct Line {
        std::string text;
        Style style;
        Tone tone;
        int indent;
    };

    std::string m_title;
    std::vector<Line> m_lines;

    std::vector<std::vector<Line>> paginate() const;
    static std::vector<std::string> Wrap(const std::string& text, size_t maxChars);
    static std::string Escape(const std::string& text);
};

} // namespace versionlens::infrastructure
