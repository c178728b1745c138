/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Keeps JSON parsing in one place; the rest of the code only sees AppSettings.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/ObjectStore.hpp"
#include "domain/TextExtractionStrategy.hpp"

namespace versionlens::infrastructure {

struct StorageSettings {
    std::string backend = "filesystem";   ///< "filesystem" or "http".
    std::string root = "./bucket";
    std::string host = "localhost";
    int port = 9000;
    int readTimeoutSeconds = 60;
};

struct ExtractorCommand {
    std::string name;
    std::string command;
};

/**
 * @struct AppSettings
 * @brief Every tunable of the tool, with defaults used when settings.json omits a key.
 */
struct AppSettings {
    StorageSettings storage;
    std::vector<ExtractorCommand> extractionChain = {
        {"pdftotext", "pdftotext -enc UTF-8 {input} -"},
        {"mutool", "mutool draw -q -F txt -o - {input}"}
    };
    bool acceptPlainText = true;

    int workers = 4;
    int fetchAttempts = 3;
    long long backoffMs = 200;
    long long timeoutMs = 120000;

    int maxLinesPerBlock = 10;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @return Defaults when the file does not exist or cannot be parsed (errors go to stderr).
     */
    static AppSettings Load(const std::string& path);

    /** @brief Applies the keys present in j over the defaults; bad values are logged and skipped. */
    static AppSettings FromJson(const nlohmann::json& j);

    /** @throws std::invalid_argument for an unknown storage backend. */
    static std::shared_ptr<domain::ObjectStore> CreateObjectStore(const AppSettings& settings);

    /** @brief Command strategies in configured order, then the plain-text passthrough if enabled. */
    static std::vector<std::shared_ptr<domain::TextExtractionStrategy>> CreateExtractionChain(const AppSettings& settings);
};

} // namespace versionlens::infrastructure
