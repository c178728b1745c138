/**
 * @file TextExtractor.hpp
 * @brief Ordered fallback chain of text extraction strategies.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "domain/Section.hpp"
#include "domain/TextExtractionStrategy.hpp"

namespace versionlens::application {

/**
 * @class TextExtractor
 * @brief Tries each strategy in turn until one yields non-empty text.
 *
 * Holds no mutable state; one instance may serve concurrent extractions as long
 * as its strategies are thread-safe.
 */
class TextExtractor {
public:
    explicit TextExtractor(std::vector<std::shared_ptr<domain::TextExtractionStrategy>> chain);

    /**
     * @brief Extracts plain text from document bytes.
     * @param bytes Raw document content.
     * @param versionId Recorded in the returned document.
     * @throws domain::ExtractionError when every strategy fails or yields empty text.
     */
    domain::ExtractedDocument extract(const std::string& bytes, const std::string& versionId) const;

    /** @brief Unifies line endings; form feeds (page breaks) become newlines. */
    static std::string NormalizeText(const std::string& text);

    const std::vector<std::shared_ptr<domain::TextExtractionStrategy>>& chain() const { return m_chain; }

private:
    std::vector<std::shared_ptr<domain::TextExtractionStrategy>> m_chain;
};

} // namespace versionlens::application
