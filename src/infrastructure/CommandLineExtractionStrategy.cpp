/**
 * @file CommandLineExtractionStrategy.cpp
 * @brief Implementation of CommandLineExtractionStrategy.
 */

#include "infrastructure/CommandLineExtractionStrategy.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace versionlens::infrastructure {

namespace {
    // Removes the temp file on every exit path.
    class TempFile {
    public:
        explicit TempFile(std::string path) : m_path(std::move(path)) {}
        ~TempFile() {
            std::error_code ec;
            std::filesystem::remove(m_path, ec);
        }
        const std::string& path() const { return m_path; }

    private:
        std::string m_path;
    };
}

CommandLineExtractionStrategy::CommandLineExtractionStrategy(std::string name, std::string commandTemplate)
    : m_name(std::move(name)), m_commandTemplate(std::move(commandTemplate)) {
    if (m_commandTemplate.find("{input}") == std::string::npos) {
        throw std::invalid_argument("Extraction command for '" + m_name + "' has no {input} placeholder.");
    }
}

std::string CommandLineExtractionStrategy::GetTempFilePath(const std::string& suffix) {
    static std::atomic<unsigned long> counter{0};
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::string name = "versionlens_" + std::to_string(getpid()) + "_" + std::to_string(now) + "_" +
                       std::to_string(counter++) + suffix;
    return (std::filesystem::temp_directory_path() / name).string();
}

bool CommandLineExtractionStrategy::isAvailable() const {
    std::string tool = m_commandTemplate.substr(0, m_commandTemplate.find(' '));
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

std::string CommandLineExtractionStrategy::extract(const std::string& bytes) {
    TempFile input(GetTempFilePath(".pdf"));
    {
        std::ofstream out(input.path(), std::ios::binary);
        if (!out.is_open()) {
            throw std::runtime_error("cannot create temporary file " + input.path());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            throw std::runtime_error("cannot write temporary file " + input.path());
        }
    }

    std::string cmd = m_commandTemplate;
    cmd.replace(cmd.find("{input}"), 7, "\"" + input.path() + "\"");
    cmd += " 2>/dev/null";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("popen failed to start command");
    }
    std::string output;
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }
    int returnCode = pclose(pipe);
    if (returnCode != 0) {
        throw std::runtime_error("command exited with code " + std::to_string(returnCode));
    }
    return output;
}

} // namespace versionlens::infrastructure
