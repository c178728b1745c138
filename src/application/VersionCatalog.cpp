/**
 * @file VersionCatalog.cpp
 * @brief Implementation of VersionCatalog.
 */

#include "application/VersionCatalog.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>

namespace versionlens::application {

using domain::CatalogError;
using domain::DocumentType;
using domain::VersionDescriptor;

namespace {
    std::string FormatLabel(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::stringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M");
        return ss.str();
    }

    // YYYYMMDDHHMM, UTC. Rejects impossible dates instead of normalizing them.
    std::optional<std::chrono::system_clock::time_point> ParseStamp(const std::string& stamp) {
        std::tm tm{};
        tm.tm_year = std::stoi(stamp.substr(0, 4)) - 1900;
        tm.tm_mon = std::stoi(stamp.substr(4, 2)) - 1;
        tm.tm_mday = std::stoi(stamp.substr(6, 2));
        tm.tm_hour = std::stoi(stamp.substr(8, 2));
        tm.tm_min = std::stoi(stamp.substr(10, 2));

        std::tm check = tm;
        std::time_t t = timegm(&check);
        if (t == static_cast<std::time_t>(-1) ||
            check.tm_year != tm.tm_year || check.tm_mon != tm.tm_mon || check.tm_mday != tm.tm_mday ||
            check.tm_hour != tm.tm_hour || check.tm_min != tm.tm_min) {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(t);
    }

    DocumentType ClassifyType(std::string type) {
        std::transform(type.begin(), type.end(), type.begin(), [](unsigned char c){ return std::tolower(c); });
        if (type == "lcp" || type == "lifecareplan") return DocumentType::LifeCarePlan;
        return DocumentType::AiGeneratedReport;
    }

    bool EndsWithPdf(const std::string& key) {
        if (key.size() < 4) return false;
        std::string ext = key.substr(key.size() - 4);
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
        return ext == ".pdf";
    }
}

VersionCatalog::VersionCatalog(std::shared_ptr<domain::ObjectStore> store)
    : m_store(std::move(store)) {}

bool VersionCatalog::IsValidCaseId(const std::string& caseId) {
    if (caseId.empty() || caseId.size() > 64) return false;
    return std::all_of(caseId.begin(), caseId.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

std::optional<VersionDescriptor> VersionCatalog::ParseKey(const std::string& caseId, const domain::ObjectInfo& info) {
    const std::string& key = info.key;
    if (key.compare(0, caseId.size() + 1, caseId + "/") != 0 || !EndsWithPdf(key)) {
        return std::nullopt;
    }

    VersionDescriptor version;
    version.id = key;
    version.caseId = caseId;
    version.filename = key.substr(key.find_last_of('/') + 1);
    version.sizeBytes = info.size;

    // caseId is restricted to [A-Za-z0-9_-], so it can be embedded in the pattern as is.
    static const std::string kTypes = "(CompleteAIGeneratedReport|LCP|LifeCarePlan)";
    std::regex generated("^" + caseId + "/Output/(\\d{12})-" + caseId + "-" + kTypes + "[^/]*$",
                         std::regex::ECMAScript | std::regex::icase);

    std::smatch match;
    if (std::regex_match(key, match, generated)) {
        auto stamp = ParseStamp(match[1].str());
        if (!stamp) return std::nullopt;
        version.timestamp = *stamp;
        version.type = ClassifyType(match[2].str());
    } else if (key.find("GroundTruth") != std::string::npos) {
        version.timestamp = info.lastModified;
        version.type = DocumentType::GroundTruth;
    } else {
        return std::nullopt;
    }

    version.timestampLabel = FormatLabel(version.timestamp);
    return version;
}

std::vector<VersionDescriptor> VersionCatalog::listVersions(const std::string& caseId) const {
    if (!IsValidCaseId(caseId)) {
        throw CatalogError(CatalogError::Kind::InvalidCaseId, "Invalid case id: '" + caseId + "'");
    }

    std::vector<domain::ObjectInfo> objects;
    try {
        objects = m_store->listObjects(caseId + "/");
    } catch (const domain::StoreUnavailableError& e) {
        throw CatalogError(CatalogError::Kind::StorageUnreachable,
                           "Storage unreachable while listing case " + caseId + ": " + e.what());
    }

    std::vector<VersionDescriptor> versions;
    for (const auto& info : objects) {
        if (auto version = ParseKey(caseId, info)) {
            versions.push_back(std::move(*version));
        }
    }

    std::sort(versions.begin(), versions.end(), [](const VersionDescriptor& a, const VersionDescriptor& b) {
        if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
        return a.id < b.id;
    });

    std::cout << "[VersionCatalog] Case " << caseId << ": " << versions.size() << " version(s), "
              << (objects.size() - versions.size()) << " key(s) ignored." << std::endl;
    return versions;
}

std::vector<std::string> VersionCatalog::listCases() const {
    std::vector<domain::ObjectInfo> objects;
    try {
        objects = m_store->listObjects("");
    } catch (const domain::StoreUnavailableError& e) {
        throw CatalogError(CatalogError::Kind::StorageUnreachable,
                           std::string("Storage unreachable while listing cases: ") + e.what());
    }

    std::set<std::string> cases;
    for (const auto& info : objects) {
        size_t slash = info.key.find('/');
        if (slash == std::string::npos) continue;
        std::string candidate = info.key.substr(0, slash);
        if (IsValidCaseId(candidate)) cases.insert(candidate);
    }
    return std::vector<std::string>(cases.begin(), cases.end());
}

} // namespace versionlens::application
