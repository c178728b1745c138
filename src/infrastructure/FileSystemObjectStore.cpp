/**
 * @file FileSystemObjectStore.cpp
 * @brief Implementation of the FileSystemObjectStore.
 */

#include "infrastructure/FileSystemObjectStore.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace versionlens::infrastructure {

namespace {
    bool IsSafeKey(const std::string& key) {
        if (key.empty() || key.front() == '/') return false;
        std::stringstream ss(key);
        std::string segment;
        while (std::getline(ss, segment, '/')) {
            if (segment == ".." || segment == ".") return false;
        }
        return true;
    }

    std::chrono::system_clock::time_point ToSystemTime(fs::file_time_type ftime) {
        return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now()
        );
    }
}

FileSystemObjectStore::FileSystemObjectStore(const std::string& rootPath)
    : m_rootPath(rootPath) {}

std::vector<domain::ObjectInfo> FileSystemObjectStore::listObjects(const std::string& prefix) {
    std::error_code ec;
    if (!fs::is_directory(m_rootPath, ec)) {
        throw domain::StoreUnavailableError("Storage root is not a directory: " + m_rootPath);
    }

    std::vector<domain::ObjectInfo> objects;
    fs::recursive_directory_iterator it(m_rootPath, ec);
    if (ec) {
        throw domain::StoreUnavailableError("Cannot read storage root " + m_rootPath + ": " + ec.message());
    }

    try {
        for (const auto& entry : it) {
            if (!entry.is_regular_file()) continue;

            std::string key = fs::relative(entry.path(), m_rootPath).generic_string();
            if (key.compare(0, prefix.size(), prefix) != 0) continue;

            domain::ObjectInfo info;
            info.key = key;
            info.size = static_cast<long long>(entry.file_size());
            info.lastModified = ToSystemTime(entry.last_write_time());
            objects.push_back(info);
        }
    } catch (const fs::filesystem_error& e) {
        throw domain::StoreUnavailableError(std::string("Listing failed: ") + e.what());
    }

    std::sort(objects.begin(), objects.end(), [](const domain::ObjectInfo& a, const domain::ObjectInfo& b) {
        return a.key < b.key;
    });
    return objects;
}

std::string FileSystemObjectStore::getObject(const std::string& key) {
    if (!IsSafeKey(key)) {
        throw domain::ObjectNotFoundError("Invalid key: " + key);
    }

    fs::path path = fs::path(m_rootPath) / key;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw domain::ObjectNotFoundError(key);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw domain::TransientStoreError("Could not open " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw domain::TransientStoreError("Read error on " + path.string());
    }
    return buffer.str();
}

} // namespace versionlens::infrastructure
