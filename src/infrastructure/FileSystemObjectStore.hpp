/**
 * @file FileSystemObjectStore.hpp
 * @brief Object store backed by a local directory tree.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/ObjectStore.hpp"

namespace versionlens::infrastructure {

/**
 * @class FileSystemObjectStore
 * @brief Infrastructure adapter exposing a directory as a bucket.
 *
 * Keys are '/'-separated paths relative to the root directory.
 */
class FileSystemObjectStore : public domain::ObjectStore {
public:
    explicit FileSystemObjectStore(const std::string& rootPath);

    std::vector<domain::ObjectInfo> listObjects(const std::string& prefix) override;
    std::string getObject(const std::string& key) override;

private:
    std::string m_rootPath;
};

} // namespace versionlens::infrastructure
