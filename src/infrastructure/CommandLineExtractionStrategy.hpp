/**
 * @file CommandLineExtractionStrategy.hpp
 * @brief Extraction strategy that delegates to an external command (pdftotext, mutool, ...).
 */

#pragma once
#include <string>
#include "domain/TextExtractionStrategy.hpp"

namespace versionlens::infrastructure {

/**
 * @class CommandLineExtractionStrategy
 * @brief Writes the document to a temporary file and captures the command's stdout.
 *
 * The command template must contain "{input}", replaced by the quoted temp file path.
 * Example: "pdftotext -enc UTF-8 {input} -".
 */
class CommandLineExtractionStrategy : public domain::TextExtractionStrategy {
public:
    CommandLineExtractionStrategy(std::string name, std::string commandTemplate);

    std::string name() const override { return m_name; }

    /** @throws std::runtime_error when the command cannot start or exits non-zero. */
    std::string extract(const std::string& bytes) override;

    /** @brief True when the command's executable is found on PATH. */
    bool isAvailable() const;

private:
    std::string m_name;
    std::string m_commandTemplate;

    static std::string GetTempFilePath(const std::string& suffix);
};

} // namespace versionlens::infrastructure
