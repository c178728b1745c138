/**
 * @file PlainTextExtractionStrategy.hpp
 * @brief Passthrough strategy for renditions that are already plain text.
 */

#pragma once
#include <stdexcept>
#include <string>
#include "domain/TextExtractionStrategy.hpp"

namespace versionlens::infrastructure {

class PlainTextExtractionStrategy : public domain::TextExtractionStrategy {
public:
    std::string name() const override { return "text-read"; }

    std::string extract(const std::string& bytes) override {
        if (bytes.compare(0, 5, "%PDF-") == 0) {
            throw std::runtime_error("content is a PDF, not plain text");
        }
        if (bytes.find('\0') != std::string::npos) {
            throw std::runtime_error("content is binary");
        }
        return bytes;
    }
};

} // namespace versionlens::infrastructure
