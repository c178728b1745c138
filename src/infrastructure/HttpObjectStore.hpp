/**
 * @file HttpObjectStore.hpp
 * @brief Object store reached through an HTTP storage gateway.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/ObjectStore.hpp"

namespace versionlens::infrastructure {

/**
 * @class HttpObjectStore
 * @brief Adapter for a gateway exposing
 *        GET /objects?prefix=<p>  -> {"objects":[{"key","size","last_modified"}]}
 *        GET /objects/<key>       -> raw bytes
 *
 * last_modified is in seconds since the epoch. A fresh client is used per request,
 * so one instance may serve several threads.
 */
class HttpObjectStore : public domain::ObjectStore {
public:
    HttpObjectStore(const std::string& host = "localhost", int port = 9000, int readTimeoutSeconds = 60);

    std::vector<domain::ObjectInfo> listObjects(const std::string& prefix) override;
    std::string getObject(const std::string& key) override;

    /** @brief Percent-encodes a key for use in a URL path, keeping '/' separators. */
    static std::string EncodeKey(const std::string& key);

private:
    std::string m_host;
    int m_port;
    int m_readTimeoutSeconds;
};

} // namespace versionlens::infrastructure
