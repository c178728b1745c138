/**
 * @file ComparisonResultJson.cpp
 * @brief Implementation of ComparisonResultJson.
 */

#include "application/ComparisonResultJson.hpp"

using json = nlohmann::json;

namespace versionlens::application {

namespace {
    json SummaryToJson(const domain::DiffSummary& s) {
        return {
            {"total", s.total},
            {"added", s.added},
            {"removed", s.removed},
            {"modified", s.modified},
            {"unchanged", s.unchanged}
        };
    }

    std::string KindToString(domain::LineChange::Kind kind) {
        switch (kind) {
            case domain::LineChange::Kind::Added: return "added";
            case domain::LineChange::Kind::Removed: return "removed";
            case domain::LineChange::Kind::Unchanged: return "unchanged";
        }
        return "unchanged";
    }
}

json ComparisonResultJson::ToJson(const domain::ComparisonResult& result) {
    json j;
    j["case_id"] = result.caseId;
    j["mode"] = domain::ComparisonModeToString(result.mode);
    j["generated_at"] = result.generatedAt;

    j["versions"] = json::array();
    for (const auto& v : result.versions) {
        j["versions"].push_back({
            {"id", v.id},
            {"filename", v.filename},
            {"type", domain::DocumentTypeToString(v.type)},
            {"timestamp", v.timestampLabel},
            {"size", v.sizeBytes}
        });
    }

    j["pairs"] = json::array();
    for (const auto& pair : result.pairs) {
        json p = {
            {"left", pair.leftId},
            {"right", pair.rightId},
            {"comparable", pair.comparable}
        };
        if (!pair.comparable) {
            p["unavailable"] = pair.unavailableIds;
            j["pairs"].push_back(p);
            continue;
        }

        p["summary"] = SummaryToJson(pair.diff.summary);
        p["sections"] = json::array();
        for (const auto& section : pair.diff.sections) {
            json s = {
                {"name", section.sectionName},
                {"status", domain::SectionStatusToString(section.status)},
                {"added_lines", section.addedLines},
                {"removed_lines", section.removedLines},
                {"modified_pairs", json::array()},
                {"changes", json::array()}
            };
            for (const auto& mp : section.modifiedPairs) {
                s["modified_pairs"].push_back({{"old", mp.oldLine}, {"new", mp.newLine}});
            }
            for (const auto& change : section.changes) {
                s["changes"].push_back({{"kind", KindToString(change.kind)}, {"content", change.content}});
            }
            p["sections"].push_back(s);
        }
        j["pairs"].push_back(p);
    }

    j["summary"] = SummaryToJson(result.summary);

    j["version_errors"] = json::array();
    for (const auto& error : result.versionErrors) {
        j["version_errors"].push_back({
            {"version_id", error.versionId},
            {"stage", domain::VersionError::StageToString(error.stage)},
            {"message", error.message}
        });
    }
    return j;
}

std::string ComparisonResultJson::Dump(const domain::ComparisonResult& result, int indent) {
    return ToJson(result).dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace versionlens::application
