#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/BoundedWorkerPool.hpp"
#include "application/ComparisonOrchestrator.hpp"
#include "application/ComparisonResultJson.hpp"
#include "application/ReportRenderer.hpp"
#include "application/TextExtractor.hpp"
#include "application/VersionCatalog.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace versionlens;

namespace {

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  versionlens [--config settings.json] cases\n"
              << "  versionlens [--config settings.json] list <case>\n"
              << "  versionlens [--config settings.json] compare <case> [--versions <id>...]\n"
              << "                                     [--format html|pdf|json] [--out <file>]\n";
}

int WriteOutput(const std::string& content, const std::string& outPath) {
    if (outPath.empty()) {
        std::cout.write(content.data(), static_cast<std::streamsize>(content.size()));
        return 0;
    }
    std::ofstream out(outPath, std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "[versionlens] Cannot write " << outPath << std::endl;
        return 2;
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    std::cerr << "[versionlens] Report written to " << outPath << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string configPath = "settings.json";
    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        PrintUsage();
        return 1;
    }

    infrastructure::AppSettings settings = infrastructure::ConfigLoader::Load(configPath);

    try {
        auto store = infrastructure::ConfigLoader::CreateObjectStore(settings);
        application::VersionCatalog catalog(store);
        const std::string& command = args[0];

        if (command == "cases") {
            for (const auto& caseId : catalog.listCases()) {
                std::cout << caseId << "\n";
            }
            return 0;
        }

        if (command == "list" && args.size() == 2) {
            for (const auto& v : catalog.listVersions(args[1])) {
                std::cout << v.timestampLabel << "  " << application::ReportRenderer::FormatFileSize(v.sizeBytes)
                          << "  " << domain::DocumentTypeToString(v.type) << "  " << v.id << "\n";
            }
            return 0;
        }

        if (command == "compare" && args.size() >= 2) {
            const std::string caseId = args[1];
            std::vector<std::string> versionIds;
            std::string format = "html";
            std::string outPath;
            bool selective = false;

            for (size_t i = 2; i < args.size(); ++i) {
                if (args[i] == "--versions") {
                    selective = true;
                    while (i + 1 < args.size() && args[i + 1].rfind("--", 0) != 0) {
                        versionIds.push_back(args[++i]);
                    }
                } else if (args[i] == "--format" && i + 1 < args.size()) {
                    format = args[++i];
                } else if (args[i] == "--out" && i + 1 < args.size()) {
                    outPath = args[++i];
                } else {
                    PrintUsage();
                    return 1;
                }
            }

            auto encoding = application::ReportRenderer::ParseEncoding(format);
            if (format != "json" && !encoding) {
                std::cerr << "[versionlens] Unsupported format: " << format << std::endl;
                return 1;
            }

            application::OrchestratorSettings orchestratorSettings;
            orchestratorSettings.workers = static_cast<size_t>(settings.workers);
            orchestratorSettings.fetchAttempts = settings.fetchAttempts;
            orchestratorSettings.initialBackoff = std::chrono::milliseconds(settings.backoffMs);
            orchestratorSettings.timeout = std::chrono::milliseconds(settings.timeoutMs);

            auto extractor = std::make_shared<application::TextExtractor>(
                infrastructure::ConfigLoader::CreateExtractionChain(settings));
            application::ComparisonOrchestrator orchestrator(store, extractor, orchestratorSettings);

            auto selection = selective ? domain::ComparisonSelection::Selective(versionIds)
                                       : domain::ComparisonSelection::Sequential();
            domain::ComparisonResult result = orchestrator.compareVersions(caseId, selection);

            if (format == "json") {
                return WriteOutput(application::ComparisonResultJson::Dump(result) + "\n", outPath);
            }

            application::RenderOptions options;
            options.maxLinesPerBlock = static_cast<size_t>(settings.maxLinesPerBlock);
            return WriteOutput(application::ReportRenderer::Render(result, *encoding, options), outPath);
        }

        PrintUsage();
        return 1;
    } catch (const domain::ComparisonError& e) {
        std::cerr << "[versionlens] " << e.what() << std::endl;
        for (const auto& error : e.versionErrors()) {
            std::cerr << "  " << error.versionId << " (" << domain::VersionError::StageToString(error.stage)
                      << "): " << error.message << std::endl;
        }
        // After a timeout, give abandoned fetches and extractions a chance to remove their temp files.
        if (!application::BoundedWorkerPool::WaitForAbandoned(std::chrono::seconds(5))) {
            std::cerr << "[versionlens] Exiting with background work still running." << std::endl;
        }
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[versionlens] " << e.what() << std::endl;
        return 2;
    }
}
