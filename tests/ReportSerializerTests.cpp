#include "mh/analysis/CompatibilityAnalyzer.hpp"
#include "mh/model/PrototypeKey.hpp"
#include "mh/report/ReportSerializer.hpp"

#include "TestFixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using mh::model::PrototypeKey;
using mh::report::ReportSerializer;

TEST_CASE("Report JSON carries the documented sections", "[report]") {
    mh::history::HistoryStore store;
    RecordIngredientConflict(store);
    const auto report = mh::analysis::CompatibilityAnalyzer().Run(store);

    const auto json = ReportSerializer::ToJson(report);
    REQUIRE(json["analyzed_packages"] == nlohmann::json::array({"base", "A", "B"}));
    REQUIRE(json["analysis_timestamp"].is_string());

    const auto& summary = json["summary"];
    REQUIRE(summary["total"] == 1);
    REQUIRE(summary["conflicted"] == 1);
    REQUIRE(summary["high"] == 1);
    REQUIRE(summary["critical"] == 0);
    REQUIRE_FALSE(summary.contains("info"));

    REQUIRE(json["issues"].size() == 1);
    const auto& issue = json["issues"][0];
    REQUIRE(issue["issue_id"] == "RECIPE_CONFLICT_R");
    REQUIRE(issue["severity"] == "high");
    REQUIRE(issue["field_path"] == "ingredients");
    REQUIRE(issue["evidence"]["resolved_package"] == "B");
    for (const auto& key : issue["affected_keys"]) {
        REQUIRE(PrototypeKey::Parse(key.get<std::string>()) == PrototypeKey("recipe", "r"));
    }

    REQUIRE(json["dependency_graph"].is_object());
    REQUIRE(json["patches"].size() == 1);
    const auto& patch = json["patches"][0];
    REQUIRE(patch["patch_id"] == "PATCH_RECIPE_R_VARIANTS");
    REQUIRE(patch["kind"] == "recipe_variants");
    REQUIRE(patch["estimated_impact"] == "high");
    REQUIRE(patch["fixes"] == nlohmann::json::array({"RECIPE_CONFLICT_R"}));
    REQUIRE(patch["structured_overrides"]["variants"].size() == 2);
    REQUIRE(patch["generated_artifact"].get<std::string>().find("data:extend") != std::string::npos);
}

TEST_CASE("Dependencies serialize with kind names and optional amounts", "[report]") {
    mh::model::Dependency ingredient;
    ingredient.source = PrototypeKey("recipe", "gear");
    ingredient.target = PrototypeKey("item", "iron-plate");
    ingredient.amount = 2.0;

    const auto withAmount = ReportSerializer::DependencyToJson(ingredient);
    REQUIRE(withAmount["target_kind"] == "item");
    REQUIRE(withAmount["target_name"] == "iron-plate");
    REQUIRE(withAmount["dependency_kind"] == "ingredient");
    REQUIRE(withAmount["required"] == true);
    REQUIRE(withAmount["amount"] == 2.0);

    mh::model::Dependency prerequisite;
    prerequisite.source = PrototypeKey("technology", "automation-2");
    prerequisite.target = PrototypeKey("technology", "automation");
    prerequisite.kind = mh::model::DependencyKind::TechPrerequisite;

    const auto withoutAmount = ReportSerializer::DependencyToJson(prerequisite);
    REQUIRE(withoutAmount["dependency_kind"] == "tech_prerequisite");
    REQUIRE(withoutAmount["amount"].is_null());
}

TEST_CASE("WriteReport creates missing directories", "[report]") {
    TempDirectory temp;
    mh::history::HistoryStore store;
    RecordIngredientConflict(store);
    const auto report = mh::analysis::CompatibilityAnalyzer().Run(store);

    const auto path = temp.root / "nested" / "out" / "analysis_data.json";
    std::string error;
    REQUIRE(mh::report::WriteReport(report, path, error));
    REQUIRE(error.empty());

    const auto parsed = nlohmann::json::parse(ReadTextFile(path));
    REQUIRE(parsed == ReportSerializer::ToJson(report));
}

TEST_CASE("WriteReport reports unwritable targets", "[report]") {
    TempDirectory temp;
    const mh::model::CompatibilityReport report{};

    std::string error;
    REQUIRE_FALSE(mh::report::WriteReport(report, temp.root, error));
    REQUIRE_FALSE(error.empty());
}
