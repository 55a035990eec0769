#include "mh/report/ReportSerializer.hpp"

#include "mh/core/Logger.hpp"

#include <fstream>
#include <system_error>

namespace mh::report {

namespace {

constexpr int kIndent = 2;

nlohmann::json KeyList(const std::vector<model::PrototypeKey>& keys) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& key : keys) {
        list.push_back(key.ToString());
    }
    return list;
}

} // namespace

nlohmann::json ReportSerializer::IssueToJson(const model::ConflictIssue& issue) {
    return nlohmann::json{
        {"issue_id", issue.issueId},
        {"severity", model::ToString(issue.severity)},
        {"title", issue.title},
        {"description", issue.description},
        {"affected_keys", KeyList(issue.affectedKeys)},
        {"contributing_packages", issue.contributingPackages},
        {"root_cause", issue.rootCause},
        {"suggested_fixes", issue.suggestedFixes},
        {"field_path", issue.fieldPath},
        {"evidence", issue.evidence}
    };
}

nlohmann::json ReportSerializer::DependencyToJson(const model::Dependency& dependency) {
    return nlohmann::json{
        {"target_kind", dependency.target.kind},
        {"target_name", dependency.target.name},
        {"dependency_kind", model::ToString(dependency.kind)},
        {"required", dependency.required},
        {"amount", dependency.amount ? nlohmann::json(*dependency.amount) : nlohmann::json()}
    };
}

nlohmann::json ReportSerializer::PatchToJson(const model::PatchSuggestion& patch) {
    return nlohmann::json{
        {"patch_id", patch.patchId},
        {"target_package", patch.targetPackage},
        {"target_file", patch.targetFile},
        {"fixes", patch.fixes},
        {"kind", model::ToString(patch.kind)},
        {"description", patch.description},
        {"generated_artifact", patch.generatedArtifact},
        {"structured_overrides", patch.structuredOverrides},
        {"estimated_impact", model::ToString(patch.estimatedImpact)}
    };
}

nlohmann::json ReportSerializer::ToJson(const model::CompatibilityReport& report) {
    nlohmann::json json;
    json["analyzed_packages"] = report.analyzedPackages;
    json["analysis_timestamp"] = report.analysisTimestamp;
    json["summary"] = {
        {"total", report.summary.total},
        {"conflicted", report.summary.conflicted},
        {"critical", report.summary.critical},
        {"high", report.summary.high},
        {"medium", report.summary.medium},
        {"low", report.summary.low}
    };

    nlohmann::json issues = nlohmann::json::array();
    for (const auto& issue : report.issues) {
        issues.push_back(IssueToJson(issue));
    }
    json["issues"] = std::move(issues);

    nlohmann::json graph = nlohmann::json::object();
    for (const auto& [key, dependencies] : report.dependencyGraph) {
        nlohmann::json edges = nlohmann::json::array();
        for (const auto& dependency : dependencies) {
            edges.push_back(DependencyToJson(dependency));
        }
        graph[key.ToString()] = std::move(edges);
    }
    json["dependency_graph"] = std::move(graph);

    nlohmann::json patches = nlohmann::json::array();
    for (const auto& patch : report.patches) {
        patches.push_back(PatchToJson(patch));
    }
    json["patches"] = std::move(patches);
    return json;
}

bool WriteReport(const model::CompatibilityReport& report, const std::filesystem::path& path, std::string& error) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            error = "Cannot create directory '" + path.parent_path().string() + "': " + ec.message();
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) {
        error = "Failed to open '" + path.string() + "' for writing";
        return false;
    }
    file << ReportSerializer::ToJson(report).dump(kIndent, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    if (!file) {
        error = "Failed to write report to '" + path.string() + "'";
        return false;
    }
    core::Logger::Info("[ReportSerializer] Wrote report to '{}'", path.string());
    return true;
}

} // namespace mh::report
