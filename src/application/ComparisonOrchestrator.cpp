/**
 * @file ComparisonOrchestrator.cpp
 * @brief Implementation of ComparisonOrchestrator.
 */

#include "application/ComparisonOrchestrator.hpp"
#include "application/BoundedWorkerPool.hpp"
#include "domain/DiffEngine.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <thread>

namespace versionlens::application {

using domain::ComparisonResult;
using domain::InsufficientVersionsError;
using domain::VersionDescriptor;
using domain::VersionError;

namespace {

struct PreparedVersion {
    std::optional<domain::SegmentedDocument> document;
    std::optional<VersionError> error;
};

using Launcher = std::function<std::future<PreparedVersion>(const std::string&)>;

class Deadline {
public:
    explicit Deadline(std::chrono::milliseconds timeout)
        : m_enabled(timeout.count() > 0),
          m_at(std::chrono::steady_clock::now() + timeout),
          m_timeout(timeout) {}

    template<typename T>
    T await(std::future<T>& future, const std::vector<VersionError>& errorsSoFar) const {
        if (m_enabled && future.wait_until(m_at) == std::future_status::timeout) {
            expire(errorsSoFar);
        }
        return future.get();
    }

    void check(const std::vector<VersionError>& errorsSoFar) const {
        if (m_enabled && std::chrono::steady_clock::now() >= m_at) {
            expire(errorsSoFar);
        }
    }

private:
    [[noreturn]] void expire(const std::vector<VersionError>& errorsSoFar) const {
        throw domain::ComparisonTimeoutError(
            "Comparison exceeded its time limit of " + std::to_string(m_timeout.count()) + " ms", errorsSoFar);
    }

    bool m_enabled;
    std::chrono::steady_clock::time_point m_at;
    std::chrono::milliseconds m_timeout;
};

std::string NowIso() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string FetchWithRetry(domain::ObjectStore& store, const std::string& key,
                           const OrchestratorSettings& settings, const std::atomic<bool>& cancelled) {
    const int attempts = std::max(1, settings.fetchAttempts);
    auto backoff = settings.initialBackoff;

    for (int attempt = 1;; ++attempt) {
        try {
            return store.getObject(key);
        } catch (const domain::TransientStoreError& e) {
            if (attempt >= attempts || cancelled.load()) throw;
            std::cerr << "[ComparisonOrchestrator] Transient failure fetching " << key
                      << " (attempt " << attempt << "/" << attempts << "): " << e.what()
                      << ". Retrying in " << backoff.count() << " ms." << std::endl;
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
}

// Runs on a pool worker: everything it touches is owned through shared pointers or copies.
PreparedVersion Prepare(const std::shared_ptr<domain::ObjectStore>& store,
                        const std::shared_ptr<TextExtractor>& extractor,
                        const std::shared_ptr<const domain::SectionSegmenter>& segmenter,
                        const std::string& versionId,
                        const OrchestratorSettings& settings,
                        const std::shared_ptr<const std::atomic<bool>>& cancelled) {
    PreparedVersion out;

    std::string bytes;
    try {
        bytes = FetchWithRetry(*store, versionId, settings, *cancelled);
    } catch (const domain::ObjectNotFoundError& e) {
        out.error = VersionError{versionId, VersionError::Stage::Fetch, std::string("Object not found: ") + e.what()};
    } catch (const domain::TransientStoreError& e) {
        out.error = VersionError{versionId, VersionError::Stage::Fetch, std::string("Fetch failed after retries: ") + e.what()};
    } catch (const domain::StoreUnavailableError& e) {
        out.error = VersionError{versionId, VersionError::Stage::Fetch, std::string("Storage unavailable: ") + e.what()};
    }
    if (out.error) {
        std::cerr << "[ComparisonOrchestrator] " << out.error->message << std::endl;
        return out;
    }

    // The call has timed out; do not start an extraction command nobody will wait for.
    if (cancelled->load()) {
        out.error = VersionError{versionId, VersionError::Stage::Extract, "Cancelled before extraction"};
        return out;
    }

    try {
        domain::ExtractedDocument doc = extractor->extract(bytes, versionId);
        out.document = segmenter->segment(doc.rawText);
        std::cout << "[ComparisonOrchestrator] " << versionId << ": extracted via " << doc.extractionMethod
                  << ", " << out.document->sections.size() << " section(s)." << std::endl;
    } catch (const domain::ExtractionError& e) {
        out.error = VersionError{versionId, VersionError::Stage::Extract, e.what()};
        std::cerr << "[ComparisonOrchestrator] " << e.what() << std::endl;
    }
    return out;
}

std::vector<std::string> UniqueInOrder(const std::vector<std::string>& ids) {
    std::vector<std::string> unique;
    for (const auto& id : ids) {
        if (std::find(unique.begin(), unique.end(), id) == unique.end()) unique.push_back(id);
    }
    return unique;
}

domain::VersionPair DiffPair(const VersionDescriptor& left, const PreparedVersion& leftPrep,
                             const VersionDescriptor& right, const PreparedVersion& rightPrep) {
    domain::VersionPair pair;
    pair.leftId = left.id;
    pair.rightId = right.id;
    if (!leftPrep.document || !rightPrep.document) {
        pair.comparable = false;
        if (!leftPrep.document) pair.unavailableIds.push_back(left.id);
        if (!rightPrep.document) pair.unavailableIds.push_back(right.id);
        return pair;
    }
    pair.diff = domain::DiffEngine::Compare(*leftPrep.document, *rightPrep.document);
    return pair;
}

ComparisonResult RunSequential(const VersionCatalog& catalog, const std::string& caseId,
                               const Launcher& launch, const Deadline& deadline) {
    ComparisonResult result;
    result.versions = catalog.listVersions(caseId);

    if (result.versions.empty()) {
        throw domain::CatalogError(domain::CatalogError::Kind::CaseNotFound,
                                   "No document versions found for case " + caseId);
    }
    if (result.versions.size() < 2) {
        throw InsufficientVersionsError("Case " + caseId + " has a single version; nothing to compare");
    }
    deadline.check(result.versionErrors);

    std::vector<std::future<PreparedVersion>> futures;
    for (const auto& version : result.versions) {
        futures.push_back(launch(version.id));
    }

    std::vector<PreparedVersion> prepared;
    size_t usable = 0;
    for (auto& future : futures) {
        prepared.push_back(deadline.await(future, result.versionErrors));
        if (prepared.back().document) {
            ++usable;
        } else {
            result.versionErrors.push_back(*prepared.back().error);
        }
    }

    if (usable < 2) {
        throw InsufficientVersionsError("Only " + std::to_string(usable) + " of " +
                                        std::to_string(result.versions.size()) + " versions of case " + caseId +
                                        " are usable", result.versionErrors);
    }

    for (size_t i = 1; i < result.versions.size(); ++i) {
        deadline.check(result.versionErrors);
        result.pairs.push_back(DiffPair(result.versions[i - 1], prepared[i - 1], result.versions[i], prepared[i]));
    }
    deadline.check(result.versionErrors);
    return result;
}

ComparisonResult RunSelective(const VersionCatalog& catalog, const std::string& caseId,
                              const std::vector<std::string>& requestedIds,
                              const Launcher& launch, const Deadline& deadline) {
    ComparisonResult result;
    std::vector<std::string> ids = UniqueInOrder(requestedIds);
    if (ids.size() < 2) {
        throw InsufficientVersionsError("Selective comparison needs at least 2 distinct versions, got " +
                                        std::to_string(ids.size()));
    }

    std::vector<VersionDescriptor> catalogVersions = catalog.listVersions(caseId);
    std::vector<VersionDescriptor> candidates;
    for (const auto& id : ids) {
        auto it = std::find_if(catalogVersions.begin(), catalogVersions.end(),
                               [&id](const VersionDescriptor& v) { return v.id == id; });
        if (it == catalogVersions.end()) {
            result.versionErrors.push_back({id, VersionError::Stage::Resolve,
                                            "Not a known version of case " + caseId});
        } else {
            candidates.push_back(*it);
        }
    }

    // Endpoints move inward past unusable versions; interior ids are only fetched when needed.
    std::map<size_t, std::future<PreparedVersion>> pending;
    std::map<size_t, PreparedVersion> done;
    auto ensureLaunched = [&](size_t i) {
        if (!done.count(i) && !pending.count(i)) pending[i] = launch(candidates[i].id);
    };
    auto get = [&](size_t i) -> const PreparedVersion& {
        if (!done.count(i)) {
            done[i] = deadline.await(pending[i], result.versionErrors);
            pending.erase(i);
        }
        return done[i];
    };

    size_t lo = 0;
    size_t hi = candidates.empty() ? 0 : candidates.size() - 1;
    while (lo < hi) {
        ensureLaunched(lo);
        ensureLaunched(hi);
        const PreparedVersion& left = get(lo);
        if (!left.document) {
            result.versionErrors.push_back(*left.error);
            ++lo;
            continue;
        }
        const PreparedVersion& right = get(hi);
        if (!right.document) {
            result.versionErrors.push_back(*right.error);
            --hi;
            continue;
        }
        break;
    }

    if (lo >= hi) {
        throw InsufficientVersionsError("Fewer than 2 of the selected versions of case " + caseId +
                                        " are usable", result.versionErrors);
    }

    deadline.check(result.versionErrors);
    result.versions = {candidates[lo], candidates[hi]};
    result.pairs.push_back(DiffPair(candidates[lo], done[lo], candidates[hi], done[hi]));
    deadline.check(result.versionErrors);
    return result;
}

} // namespace

ComparisonOrchestrator::ComparisonOrchestrator(std::shared_ptr<domain::ObjectStore> store,
                                               std::shared_ptr<TextExtractor> extractor,
                                               OrchestratorSettings settings,
                                               std::shared_ptr<const domain::SectionSegmenter> segmenter)
    : m_store(std::move(store)),
      m_extractor(std::move(extractor)),
      m_segmenter(segmenter ? std::move(segmenter) : std::make_shared<const domain::SectionSegmenter>()),
      m_catalog(m_store),
      m_settings(settings) {}

std::vector<VersionDescriptor> ComparisonOrchestrator::listVersions(const std::string& caseId) const {
    return m_catalog.listVersions(caseId);
}

ComparisonResult ComparisonOrchestrator::compareVersions(const std::string& caseId,
                                                         const domain::ComparisonSelection& selection) const {
    return compareVersions(caseId, selection, m_settings.timeout);
}

ComparisonResult ComparisonOrchestrator::compareVersions(const std::string& caseId,
                                                         const domain::ComparisonSelection& selection,
                                                         std::chrono::milliseconds timeout) const {
    std::cout << "[ComparisonOrchestrator] Case " << caseId << ": "
              << domain::ComparisonModeToString(selection.mode) << " comparison." << std::endl;

    Deadline deadline(timeout);
    BoundedWorkerPool pool(m_settings.workers);
    auto cancelled = pool.cancellationToken();

    Launcher launch = [&pool, store = m_store, extractor = m_extractor, segmenter = m_segmenter,
                       settings = m_settings, cancelled](const std::string& id) {
        return pool.submit([store, extractor, segmenter, settings, cancelled, id]() {
            return Prepare(store, extractor, segmenter, id, settings, cancelled);
        });
    };

    ComparisonResult result;
    try {
        if (selection.mode == domain::ComparisonMode::Selective) {
            result = RunSelective(m_catalog, caseId, selection.versionIds, launch, deadline);
        } else {
            result = RunSequential(m_catalog, caseId, launch, deadline);
        }
    } catch (const domain::ComparisonTimeoutError& e) {
        pool.abandon();
        std::cerr << "[ComparisonOrchestrator] " << e.what() << "; pending work abandoned." << std::endl;
        throw;
    }

    result.caseId = caseId;
    result.mode = selection.mode;
    result.generatedAt = NowIso();
    for (const auto& pair : result.pairs) {
        if (pair.comparable) result.summary += pair.diff.summary;
    }

    std::cout << "[ComparisonOrchestrator] Case " << caseId << ": " << result.pairs.size() << " pair(s), "
              << result.versionErrors.size() << " version error(s)." << std::endl;
    return result;
}

} // namespace versionlens::application
