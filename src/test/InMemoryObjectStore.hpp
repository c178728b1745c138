/**
 * @file InMemoryObjectStore.hpp
 * @brief Test double for ObjectStore with injectable failures.
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <ctime>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "domain/ObjectStore.hpp"

namespace versionlens::test {

inline std::chrono::system_clock::time_point MakeUtc(int year, int month, int day, int hour = 0, int minute = 0) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

class InMemoryObjectStore : public domain::ObjectStore {
public:
    void put(const std::string& key, const std::string& bytes,
             std::chrono::system_clock::time_point lastModified = std::chrono::system_clock::time_point{}) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_objects[key] = Entry{bytes, lastModified};
    }

    /** @brief The next `count` fetches of key throw TransientStoreError. */
    void failTransiently(const std::string& key, int count) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_transientFailures[key] = count;
    }

    void setUnavailable(bool unavailable) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_unavailable = unavailable;
    }

    /** @brief Every fetch sleeps this long before answering. */
    void setFetchDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_fetchDelay = delay;
    }

    int fetchCount(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_fetchCounts.find(key);
        return it == m_fetchCounts.end() ? 0 : it->second;
    }

    std::vector<domain::ObjectInfo> listObjects(const std::string& prefix) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_unavailable) {
            throw domain::StoreUnavailableError("in-memory store switched off");
        }
        std::vector<domain::ObjectInfo> out;
        for (const auto& [key, entry] : m_objects) {
            if (key.compare(0, prefix.size(), prefix) != 0) continue;
            domain::ObjectInfo info;
            info.key = key;
            info.size = static_cast<long long>(entry.bytes.size());
            info.lastModified = entry.lastModified;
            out.push_back(info);
        }
        return out;
    }

    std::string getObject(const std::string& key) override {
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_fetchCounts[key];
            delay = m_fetchDelay;
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);

        std::lock_guard<std::mutex> lock(m_mutex);
        auto failure = m_transientFailures.find(key);
        if (failure != m_transientFailures.end() && failure->second > 0) {
            --failure->second;
            throw domain::TransientStoreError("simulated transient failure for " + key);
        }
        auto it = m_objects.find(key);
        if (it == m_objects.end()) {
            throw domain::ObjectNotFoundError(key);
        }
        return it->second.bytes;
    }

private:
    struct Entry {
        std::string bytes;
        std::chrono::system_clock::time_point lastModified;
    };

    mutable std::mutex m_mutex;
    std::map<std::string, Entry> m_objects;
    std::map<std::string, int> m_transientFailures;
    std::map<std::string, int> m_fetchCounts;
    bool m_unavailable = false;
    std::chrono::milliseconds m_fetchDelay{0};
};

} // namespace versionlens::test
