/**
 * @file ReportRenderer.hpp
 * @brief Turns a ComparisonResult into a downloadable report.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/Comparison.hpp"

namespace versionlens::application {

enum class ReportEncoding {
    InteractiveMarkup,   ///< Self-contained HTML page.
    PaginatedDocument    ///< PDF.
};

struct RenderOptions {
    size_t maxLinesPerBlock = 10;   ///< 0 = no limit. Never affects counts.
};

/**
 * @class ReportRenderer
 * @brief Pure function of its input: reads the diff, never recomputes it.
 */
class ReportRenderer {
public:
    /** @brief Accepts "html", "interactive-markup", "pdf", "paginated-document" (case-insensitive). */
    static std::optional<ReportEncoding> ParseEncoding(const std::string& name);

    static std::string ContentType(ReportEncoding encoding);
    static std::string FileExtension(ReportEncoding encoding);

    /**
     * @brief Renders the report bytes.
     * @throws domain::RenderError unsupported encoding or inconsistent result.
     */
    static std::string Render(const domain::ComparisonResult& result, ReportEncoding encoding,
                              const RenderOptions& options = {});

    /** @brief Rejects an unknown encoding name before any rendering work. */
    static std::string Render(const domain::ComparisonResult& result, const std::string& encodingName,
                              const RenderOptions& options = {});

    /**
     * @brief Checks that summaries match the section statuses they describe.
     * @throws domain::RenderError
     */
    static void Validate(const domain::ComparisonResult& result);

    /** @brief "1.5 KB" style sizes. */
    static std::string FormatFileSize(long long bytes);

private:
    static std::string ToHtml(const domain::ComparisonResult& result, const RenderOptions& options);
    static std::string ToPdf(const domain::ComparisonResult& result, const RenderOptions& options);
};

} // namespace versionlens::application
