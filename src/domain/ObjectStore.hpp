/**
 * @file ObjectStore.hpp
 * @brief Interface to the object storage that holds case documents.
 */

#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <stdexcept>

namespace versionlens::domain {

/**
 * @struct ObjectInfo
 * @brief Listing entry for a stored object.
 */
struct ObjectInfo {
    std::string key;
    long long size = 0;
    std::chrono::system_clock::time_point lastModified;
};

/** @brief The requested key does not exist. Not retried. */
class ObjectNotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Temporary failure while fetching; the caller may retry. */
class TransientStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief The backend itself cannot be reached. */
class StoreUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ObjectStore
 * @brief Abstract storage backend. Implementations must be safe to call from several threads.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /**
     * @brief Lists objects whose key starts with prefix, in ascending key order.
     * @throws StoreUnavailableError when the backend cannot be reached.
     */
    virtual std::vector<ObjectInfo> listObjects(const std::string& prefix) = 0;

    /**
     * @brief Reads the full content of an object.
     * @throws ObjectNotFoundError, TransientStoreError
     */
    virtual std::string getObject(const std::string& key) = 0;
};

} // namespace versionlens::domain
