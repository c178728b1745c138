/**
 * @file ComparisonResultJson.hpp
 * @brief Structured JSON export of a comparison result.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "domain/Comparison.hpp"

namespace versionlens::application {

class ComparisonResultJson {
public:
    /** @brief Pairs, sections and line changes keep their order as arrays. */
    static nlohmann::json ToJson(const domain::ComparisonResult& result);

    /**
     * @brief Serialised ToJson output.
     *
     * Extracted text is not guaranteed to be UTF-8; invalid bytes become U+FFFD.
     */
    static std::string Dump(const domain::ComparisonResult& result, int indent = 2);
};

} // namespace versionlens::application
