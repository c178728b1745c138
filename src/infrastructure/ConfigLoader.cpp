/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/CommandLineExtractionStrategy.hpp"
#include "infrastructure/FileSystemObjectStore.hpp"
#include "infrastructure/HttpObjectStore.hpp"
#include "infrastructure/PlainTextExtractionStrategy.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace versionlens::infrastructure {

using json = nlohmann::json;

namespace {
    template<typename T>
    void ReadValue(const json& node, const char* key, T& target, const std::string& section) {
        if (!node.is_object() || !node.contains(key)) return;
        try {
            target = node.at(key).get<T>();
        } catch (const json::exception& e) {
            std::cerr << "[ConfigLoader] Ignoring " << section << "." << key << ": " << e.what() << std::endl;
        }
    }
}

AppSettings ConfigLoader::FromJson(const json& j) {
    AppSettings settings;
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings root is not an object, using defaults." << std::endl;
        return settings;
    }

    if (j.contains("storage")) {
        const json& storage = j["storage"];
        ReadValue(storage, "backend", settings.storage.backend, "storage");
        ReadValue(storage, "root", settings.storage.root, "storage");
        ReadValue(storage, "host", settings.storage.host, "storage");
        ReadValue(storage, "port", settings.storage.port, "storage");
        ReadValue(storage, "read_timeout_s", settings.storage.readTimeoutSeconds, "storage");
    }

    if (j.contains("extraction")) {
        const json& extraction = j["extraction"];
        ReadValue(extraction, "accept_plain_text", settings.acceptPlainText, "extraction");
        if (extraction.is_object() && extraction.contains("chain")) {
            try {
                std::vector<ExtractorCommand> chain;
                for (const auto& item : extraction.at("chain")) {
                    chain.push_back({item.at("name").get<std::string>(), item.at("command").get<std::string>()});
                }
                settings.extractionChain = chain;
            } catch (const json::exception& e) {
                std::cerr << "[ConfigLoader] Ignoring extraction.chain: " << e.what() << std::endl;
            }
        }
    }

    if (j.contains("comparison")) {
        const json& comparison = j["comparison"];
        ReadValue(comparison, "workers", settings.workers, "comparison");
        ReadValue(comparison, "fetch_attempts", settings.fetchAttempts, "comparison");
        ReadValue(comparison, "backoff_ms", settings.backoffMs, "comparison");
        ReadValue(comparison, "timeout_ms", settings.timeoutMs, "comparison");
    }

    if (j.contains("report")) {
        ReadValue(j["report"], "max_lines_per_block", settings.maxLinesPerBlock, "report");
    }

    settings.workers = std::max(1, settings.workers);
    settings.fetchAttempts = std::max(1, settings.fetchAttempts);
    settings.backoffMs = std::max(0LL, settings.backoffMs);
    settings.timeoutMs = std::max(0LL, settings.timeoutMs);
    settings.maxLinesPerBlock = std::max(0, settings.maxLinesPerBlock);
    return settings;
}

AppSettings ConfigLoader::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return AppSettings{};
    }

    try {
        std::ifstream f(path);
        json j = json::parse(f);
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }
    return AppSettings{};
}

std::shared_ptr<domain::ObjectStore> ConfigLoader::CreateObjectStore(const AppSettings& settings) {
    if (settings.storage.backend == "filesystem") {
        return std::make_shared<FileSystemObjectStore>(settings.storage.root);
    }
    if (settings.storage.backend == "http") {
        return std::make_shared<HttpObjectStore>(settings.storage.host, settings.storage.port,
                                                 settings.storage.readTimeoutSeconds);
    }
    throw std::invalid_argument("Unknown storage backend: " + settings.storage.backend);
}

std::vector<std::shared_ptr<domain::TextExtractionStrategy>> ConfigLoader::CreateExtractionChain(const AppSettings& settings) {
    std::vector<std::shared_ptr<domain::TextExtractionStrategy>> chain;
    for (const auto& command : settings.extractionChain) {
        auto strategy = std::make_shared<CommandLineExtractionStrategy>(command.name, command.command);
        if (!strategy->isAvailable()) {
            std::cerr << "[ConfigLoader] Extraction tool for '" << command.name << "' not found on PATH." << std::endl;
        }
        chain.push_back(strategy);
    }
    if (settings.acceptPlainText) {
        chain.push_back(std::make_shared<PlainTextExtractionStrategy>());
    }
    return chain;
}

} // namespace versionlens::infrastructure
