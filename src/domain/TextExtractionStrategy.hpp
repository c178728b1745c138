/**
 * @file TextExtractionStrategy.hpp
 * @brief Capability interface for turning document bytes into plain text.
 */

#pragma once
#include <string>

namespace versionlens::domain {

/**
 * @class TextExtractionStrategy
 * @brief One link of the extraction fallback chain.
 */
class TextExtractionStrategy {
public:
    virtual ~TextExtractionStrategy() = default;

    /** @brief Identifier reported as the extraction method. */
    virtual std::string name() const = 0;

    /**
     * @brief Extracts text from raw bytes.
     * @return Extracted text; may be empty when the document has no text layer.
     * @throws std::exception on failure.
     */
    virtual std::string extract(const std::string& bytes) = 0;
};

} // namespace versionlens::domain
