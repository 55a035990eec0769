#pragma once

#include "mh/model/ModelTypes.hpp"

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace mh::report {

class ReportSerializer {
public:
    [[nodiscard]] static nlohmann::json ToJson(const model::CompatibilityReport& report);

    [[nodiscard]] static nlohmann::json IssueToJson(const model::ConflictIssue& issue);
    [[nodiscard]] static nlohmann::json DependencyToJson(const model::Dependency& dependency);
    [[nodiscard]] static nlohmann::json PatchToJson(const model::PatchSuggestion& patch);
};

/// Writes ToJson(report) indented. Creates missing parent directories.
bool WriteReport(const model::CompatibilityReport& report, const std::filesystem::path& path, std::string& error);

} // namespace mh::report
