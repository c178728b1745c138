/**
 * @file TextExtractor.cpp
 * @brief Implementation of TextExtractor.
 */

#include "application/TextExtractor.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace versionlens::application {

namespace {
    bool HasText(const std::string& text) {
        return std::any_of(text.begin(), text.end(), [](unsigned char c) { return !std::isspace(c); });
    }
}

TextExtractor::TextExtractor(std::vector<std::shared_ptr<domain::TextExtractionStrategy>> chain)
    : m_chain(std::move(chain)) {}

std::string TextExtractor::NormalizeText(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else if (c == '\f') {
            out += '\n';
        } else {
            out += c;
        }
    }
    return out;
}

domain::ExtractedDocument TextExtractor::extract(const std::string& bytes, const std::string& versionId) const {
    std::vector<std::string> attempts;

    for (const auto& strategy : m_chain) {
        std::string text;
        try {
            text = strategy->extract(bytes);
        } catch (const std::exception& e) {
            attempts.push_back(strategy->name() + ": " + e.what());
            std::cerr << "[TextExtractor] " << strategy->name() << " failed for " << versionId
                      << ": " << e.what() << std::endl;
            continue;
        }

        if (!HasText(text)) {
            attempts.push_back(strategy->name() + ": no text layer");
            std::cerr << "[TextExtractor] " << strategy->name() << " yielded no text for " << versionId << std::endl;
            continue;
        }

        domain::ExtractedDocument doc;
        doc.versionId = versionId;
        doc.rawText = NormalizeText(text);
        doc.extractionMethod = strategy->name();
        return doc;
    }

    if (m_chain.empty()) {
        attempts.push_back("no extraction strategy configured");
    }

    std::string message = "Could not extract text from " + versionId;
    for (const auto& attempt : attempts) {
        message += "; " + attempt;
    }
    throw domain::ExtractionError(message, attempts);
}

} // namespace versionlens::application
