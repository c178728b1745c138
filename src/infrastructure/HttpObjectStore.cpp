/**
 * @file HttpObjectStore.cpp
 * @brief Implementation of HttpObjectStore.
 */

#include "infrastructure/HttpObjectStore.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>

namespace versionlens::infrastructure {

using json = nlohmann::json;

HttpObjectStore::HttpObjectStore(const std::string& host, int port, int readTimeoutSeconds)
    : m_host(host), m_port(port), m_readTimeoutSeconds(readTimeoutSeconds) {}

std::string HttpObjectStore::EncodeKey(const std::string& key) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::vector<domain::ObjectInfo> HttpObjectStore::listObjects(const std::string& prefix) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(m_readTimeoutSeconds);

    auto res = cli.Get("/objects", httplib::Params{{"prefix", prefix}}, httplib::Headers{});
    if (!res) {
        std::cerr << "[HttpObjectStore] Connection failed: " << httplib::to_string(res.error()) << std::endl;
        throw domain::StoreUnavailableError("Connection to " + m_host + ":" + std::to_string(m_port) + " failed");
    }
    if (res->status != 200) {
        std::cerr << "[HttpObjectStore] HTTP Error " << res->status << " listing '" << prefix << "'" << std::endl;
        throw domain::StoreUnavailableError("Listing failed with HTTP " + std::to_string(res->status));
    }

    std::vector<domain::ObjectInfo> objects;
    try {
        auto body = json::parse(res->body);
        for (const auto& item : body.at("objects")) {
            domain::ObjectInfo info;
            info.key = item.at("key").get<std::string>();
            info.size = item.value("size", 0LL);
            info.lastModified = std::chrono::system_clock::from_time_t(
                static_cast<std::time_t>(item.value("last_modified", 0LL)));
            objects.push_back(info);
        }
    } catch (const json::exception& e) {
        std::cerr << "[HttpObjectStore] JSON Parse Error: " << e.what() << std::endl;
        throw domain::StoreUnavailableError(std::string("Malformed listing: ") + e.what());
    }

    std::sort(objects.begin(), objects.end(), [](const domain::ObjectInfo& a, const domain::ObjectInfo& b) {
        return a.key < b.key;
    });
    return objects;
}

std::string HttpObjectStore::getObject(const std::string& key) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(m_readTimeoutSeconds);

    auto res = cli.Get("/objects/" + EncodeKey(key));
    if (!res) {
        throw domain::TransientStoreError("Connection failed while fetching " + key + ": " +
                                          httplib::to_string(res.error()));
    }
    if (res->status == 200) {
        return res->body;
    }
    if (res->status >= 500 || res->status == 429) {
        throw domain::TransientStoreError("HTTP " + std::to_string(res->status) + " while fetching " + key);
    }
    throw domain::ObjectNotFoundError("HTTP " + std::to_string(res->status) + " for " + key);
}

} // namespace versionlens::infrastructure
