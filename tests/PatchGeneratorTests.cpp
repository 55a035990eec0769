#include "mh/patch/LuaPatchRenderer.hpp"
#include "mh/patch/PatchGenerator.hpp"

#include "TestFixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using mh::model::ConflictIssue;
using mh::model::PrototypeKey;
using mh::model::Severity;
using mh::patch::PatchGenerator;

namespace {

ConflictIssue MakeIssue(const std::string& id,
                        const PrototypeKey& key,
                        Severity severity,
                        std::vector<std::string> packages = {}) {
    ConflictIssue issue;
    issue.issueId = id;
    issue.severity = severity;
    issue.affectedKeys = {key};
    issue.contributingPackages = std::move(packages);
    return issue;
}

class TagRenderer final : public mh::patch::PatchRenderer {
public:
    std::string_view Dialect() const override { return "tag"; }
    std::string Render(const mh::model::PatchSuggestion& patch) const override { return "tag:" + patch.patchId; }
    std::string RenderFile(const std::vector<mh::model::PatchSuggestion>& patches) const override {
        return std::to_string(patches.size());
    }
};

void RecordTechnologySplit(mh::history::HistoryStore& store) {
    {
        mh::history::PackageScope base(store, "base", "base/technology.lua");
        base.Add("technology", "t", Technology("t", {"a", "b"}));
    }
    {
        mh::history::PackageScope mod(store, "A", "A/data-updates.lua");
        mod.Modify("technology", "t", "prerequisites", nlohmann::json::array({"a", "b"}),
                   nlohmann::json::array({"a", "c"}));
    }
}

} // namespace

TEST_CASE("Recipe conflicts become one variant per contributing package", "[patch]") {
    mh::history::HistoryStore store;
    RecordIngredientConflict(store);

    const PatchGenerator generator{};
    const auto patches = generator.Generate(
        {MakeIssue("RECIPE_CONFLICT_R", PrototypeKey("recipe", "r"), Severity::High, {"A", "B"})}, store);

    REQUIRE(patches.size() == 1);
    const auto& patch = patches.front();
    REQUIRE(patch.patchId == "PATCH_RECIPE_R_VARIANTS");
    REQUIRE(patch.kind == mh::model::PatchKind::RecipeVariants);
    REQUIRE(patch.fixes == std::vector<std::string>{"RECIPE_CONFLICT_R"});
    REQUIRE(patch.estimatedImpact == Severity::High);
    REQUIRE(patch.targetPackage == "mod-harmonizer-patch");
    REQUIRE(patch.targetFile == "data-final-fixes.lua");

    const auto& variants = patch.structuredOverrides["variants"];
    REQUIRE(patch.structuredOverrides["target"] == "recipe.r");
    REQUIRE(variants.size() == 2);
    REQUIRE(variants[0]["name"] == "r-a");
    REQUIRE(variants[0]["package"] == "A");
    REQUIRE(variants[0]["fields"]["ingredients"] == ItemList({"iron", "wood"}));
    REQUIRE(variants[1]["name"] == "r-b");
    REQUIRE(variants[1]["fields"]["ingredients"] == ItemList({"iron", "steel"}));
}

TEST_CASE("Recipe variants deduplicate ingredients and skip packages without data", "[patch]") {
    mh::history::HistoryStore store;
    {
        mh::history::PackageScope base(store, "base", "base/data.lua");
        base.Add("recipe", "r", Recipe("r", {"iron"}));
    }
    {
        mh::history::PackageScope mod(store, "Doubler", "Doubler/data.lua");
        mod.Modify("recipe", "r", "ingredients", ItemList({"iron"}), ItemList({"iron", "iron", "coal"}));
    }
    {
        mh::history::PackageScope mod(store, "Timer", "Timer/data.lua");
        mod.Modify("recipe", "r", "energy_required", 0.5, 4.0);
    }

    const PatchGenerator generator{};
    const auto issue = MakeIssue("RECIPE_CONFLICT_R", PrototypeKey("recipe", "r"), Severity::High, {"Doubler", "Timer"});
    const auto patch = generator.GenerateRecipePatch(issue, *store.HistoryFor("recipe", "r"));

    REQUIRE(patch.has_value());
    const auto& variants = patch->structuredOverrides["variants"];
    REQUIRE(variants.size() == 1);
    REQUIRE(variants[0]["name"] == "r-doubler");
    REQUIRE(variants[0]["fields"]["ingredients"] == ItemList({"iron", "coal"}));

    const auto timerOnly = MakeIssue("RECIPE_VARIANT_R", PrototypeKey("recipe", "r"), Severity::Medium, {"Timer"});
    REQUIRE_FALSE(generator.GenerateRecipePatch(timerOnly, *store.HistoryFor("recipe", "r")).has_value());
}

TEST_CASE("Reconstruct applies nested edits on top of the resolved value", "[patch]") {
    mh::history::HistoryStore store;
    {
        mh::history::PackageScope base(store, "base", "base/data.lua");
        base.Add("recipe", "r", Recipe("r", {"iron", "copper"}));
    }
    {
        mh::history::PackageScope mod(store, "A", "A/data.lua");
        mod.Modify("recipe", "r", "ingredients[1].amount", 1, 5);
        mod.Modify("recipe", "r", "icon", "old.png", "new.png");
    }

    const auto snapshot = PatchGenerator::Reconstruct(*store.HistoryFor("recipe", "r"), "A", {"ingredients", "results"});
    REQUIRE(snapshot.package == "A");
    REQUIRE(snapshot.fields.size() == 1);
    REQUIRE(snapshot.fields["ingredients"][0]["amount"] == 1);
    REQUIRE(snapshot.fields["ingredients"][1]["name"] == "copper");
    REQUIRE(snapshot.fields["ingredients"][1]["amount"] == 5);

    const auto untouched = PatchGenerator::Reconstruct(*store.HistoryFor("recipe", "r"), "B", {"ingredients"});
    REQUIRE(untouched.fields.empty());
}

TEST_CASE("Technology patches add alternatives and a fallback ladder", "[patch]") {
    mh::history::HistoryStore store;
    RecordTechnologySplit(store);

    const PatchGenerator generator{};
    const auto patches = generator.Generate(
        {MakeIssue("CONFLICT_TECHNOLOGY_T", PrototypeKey("technology", "t"), Severity::Medium)}, store);
    REQUIRE(patches.size() == 1);
    const auto& patch = patches.front();
    REQUIRE(patch.patchId == "PATCH_TECHNOLOGY_T_ALTERNATIVES");
    REQUIRE(patch.kind == mh::model::PatchKind::TechnologyAlternatives);

    const auto& variants = patch.structuredOverrides["variants"];
    REQUIRE(variants.size() == 5);
    REQUIRE(variants[0]["name"] == "t-base");
    REQUIRE(variants[0]["tier"] == "alternative");
    REQUIRE(variants[0]["requires"] == nlohmann::json::array({"a", "b"}));
    REQUIRE(variants[1]["name"] == "t-a");
    REQUIRE(variants[1]["requires"] == nlohmann::json::array({"a", "c"}));

    REQUIRE(variants[2]["name"] == "t-basic");
    REQUIRE(variants[2]["requires"].empty());
    REQUIRE(variants[2]["cost_multiplier"] == 2.0);
    REQUIRE(variants[3]["name"] == "t-advanced");
    REQUIRE(variants[3]["requires"] == nlohmann::json::array({"a"}));
    REQUIRE(variants[3]["cost_multiplier"] == 1.5);
    REQUIRE(variants[4]["name"] == "t-higher");
    REQUIRE(variants[4]["requires"] == nlohmann::json::array({"a", "b", "c"}));
    REQUIRE(variants[4]["cost_multiplier"] == 1.0);

    const auto& lua = patch.generatedArtifact;
    REQUIRE(lua.find("if data.raw[\"technology\"][\"a\"] and data.raw[\"technology\"][\"c\"] then") != std::string::npos);
    REQUIRE(lua.find("variant.unit.count = math.ceil(variant.unit.count * 1.5)") != std::string::npos);
}

TEST_CASE("Technology ladders omit rungs without distinct prerequisites", "[patch]") {
    mh::history::HistoryStore store;
    {
        mh::history::PackageScope base(store, "base", "base/technology.lua");
        base.Add("technology", "t", Technology("t", {"a"}));
    }
    {
        mh::history::PackageScope mod(store, "A", "A/data.lua");
        mod.Add("technology", "t", Technology("t", {"a"}));
    }

    const PatchGenerator generator{};
    const auto issue = MakeIssue("CONFLICT_TECHNOLOGY_T", PrototypeKey("technology", "t"), Severity::Medium);
    const auto patch = generator.GenerateTechnologyPatch(issue, *store.HistoryFor("technology", "t"));
    REQUIRE(patch.has_value());

    const auto& variants = patch->structuredOverrides["variants"];
    REQUIRE(variants.size() == 4);
    REQUIRE(variants[2]["tier"] == "basic");
    REQUIRE(variants[3]["tier"] == "advanced");
}

TEST_CASE("Generic variants require an icon on the resolved definition", "[patch]") {
    mh::history::HistoryStore store;
    {
        mh::history::PackageScope base(store, "base", "base/data.lua");
        base.Add("item", "plate", nlohmann::json{
            {"type", "item"}, {"name", "plate"}, {"icon", "plate.png"}, {"stack_size", 1}, {"durability", 40}
        });
        base.Add("item", "ghost", nlohmann::json{{"type", "item"}, {"name", "ghost"}, {"stack_size", 100}});
    }

    const PatchGenerator generator{};
    const auto plate = generator.GenerateGenericPatch(
        MakeIssue("CONFLICT_ITEM_PLATE", PrototypeKey("item", "plate"), Severity::Medium),
        *store.HistoryFor("item", "plate"));
    REQUIRE(plate.has_value());
    REQUIRE(plate->patchId == "PATCH_ITEM_PLATE_VARIANTS");
    const auto& variants = plate->structuredOverrides["variants"];
    REQUIRE(variants.size() == 1);
    REQUIRE(variants[0]["name"] == "plate-reinforced");
    REQUIRE(variants[0]["fields"]["stack_size"] == 2);
    REQUIRE(variants[0]["fields"]["durability"] == 80.0);

    const auto ghost = generator.GenerateGenericPatch(
        MakeIssue("CONFLICT_ITEM_GHOST", PrototypeKey("item", "ghost"), Severity::Medium),
        *store.HistoryFor("item", "ghost"));
    REQUIRE_FALSE(ghost.has_value());
}

TEST_CASE("Generic variants scale cost and size parameters the prototype has", "[patch]") {
    mh::history::HistoryStore store;
    {
        mh::history::PackageScope base(store, "base", "base/entities.lua");
        base.Add("assembling-machine", "press", nlohmann::json{
            {"type", "assembling-machine"}, {"name", "press"}, {"icon", "press.png"},
            {"minable", {{"mining_time", 0.5}, {"result", "press"}}}, {"max_health", 300}
        });
        base.Add("simple-entity", "statue", nlohmann::json{
            {"type", "simple-entity"}, {"name", "statue"}, {"icon", "statue.png"}, {"subgroup", "decor"}
        });
    }

    const PatchGenerator generator{};
    const auto press = generator.GenerateGenericPatch(
        MakeIssue("CONFLICT_ASSEMBLING_MACHINE_PRESS", PrototypeKey("assembling-machine", "press"), Severity::Low),
        *store.HistoryFor("assembling-machine", "press"));
    REQUIRE(press.has_value());
    const auto& variants = press->structuredOverrides["variants"];
    REQUIRE(variants.size() == 2);
    REQUIRE(variants[0]["name"] == "press-lite");
    REQUIRE(variants[0]["fields"]["minable"]["mining_time"] == 0.25);
    REQUIRE(variants[0]["fields"]["minable"]["result"] == "press");
    REQUIRE(variants[1]["name"] == "press-reinforced");
    REQUIRE(variants[1]["fields"]["max_health"] == 600.0);
    REQUIRE(press->generatedArtifact.find("variant.max_health = 600") != std::string::npos);

    const auto statue = generator.GenerateGenericPatch(
        MakeIssue("CONFLICT_SIMPLE_ENTITY_STATUE", PrototypeKey("simple-entity", "statue"), Severity::Low),
        *store.HistoryFor("simple-entity", "statue"));
    REQUIRE_FALSE(statue.has_value());
}

TEST_CASE("Recipe variants keep every key of each ingredient and result", "[patch]") {
    const nlohmann::json steam{{"type", "fluid"}, {"name", "steam"}, {"amount", 10}, {"minimum_temperature", 500}};
    const nlohmann::json ore{{"type", "item"}, {"name", "ore"}, {"amount_min", 1}, {"amount_max", 3}, {"probability", 0.25}};

    mh::history::HistoryStore store;
    {
        mh::history::PackageScope base(store, "base", "base/data.lua");
        base.Add("recipe", "r", nlohmann::json{
            {"type", "recipe"}, {"name", "r"},
            {"ingredients", nlohmann::json::array({steam})},
            {"results", nlohmann::json::array({ore})}
        });
    }
    auto hotter = steam;
    hotter["amount"] = 20;
    auto cooler = steam;
    cooler["minimum_temperature"] = 165;
    {
        mh::history::PackageScope mod(store, "A", "A/data.lua");
        mod.Modify("recipe", "r", "ingredients", nlohmann::json::array({steam}), nlohmann::json::array({hotter, steam}));
        mod.Modify("recipe", "r", "results", nlohmann::json::array({ore}), nlohmann::json::array({ore}));
    }
    {
        mh::history::PackageScope mod(store, "B", "B/data.lua");
        mod.Modify("recipe", "r", "ingredients", nlohmann::json::array({steam}), nlohmann::json::array({cooler}));
    }

    const PatchGenerator generator{};
    const auto patches = generator.Generate(
        {MakeIssue("RECIPE_CONFLICT_R", PrototypeKey("recipe", "r"), Severity::High, {"A", "B"})}, store);
    REQUIRE(patches.size() == 1);

    const auto& variants = patches.front().structuredOverrides["variants"];
    REQUIRE(variants.size() == 2);
    REQUIRE(variants[0]["fields"]["ingredients"] == nlohmann::json::array({hotter}));
    REQUIRE(variants[0]["fields"]["results"] == nlohmann::json::array({ore}));
    REQUIRE_FALSE(variants[0]["fields"]["results"][0].contains("amount"));
    REQUIRE(variants[1]["fields"]["ingredients"] == nlohmann::json::array({cooler}));

    const auto& lua = patches.front().generatedArtifact;
    REQUIRE(lua.find("minimum_temperature = 500") != std::string::npos);
    REQUIRE(lua.find("probability = 0.25") != std::string::npos);
}

TEST_CASE("Generate emits one patch per key from the most severe issue", "[patch]") {
    mh::history::HistoryStore store;
    RecordIngredientConflict(store);
    RecordTechnologySplit(store);

    const std::vector<ConflictIssue> issues{
        MakeIssue("CONFLICT_TECHNOLOGY_T", PrototypeKey("technology", "t"), Severity::Medium),
        MakeIssue("RECIPE_CONFLICT_R", PrototypeKey("recipe", "r"), Severity::High, {"A", "B"}),
        MakeIssue("ESSENTIAL_RECIPE_R", PrototypeKey("recipe", "r"), Severity::Critical, {"base", "A", "B"}),
        MakeIssue("MISSING_DEPENDENCY_ITEM_NOWHERE", PrototypeKey("item", "nowhere"), Severity::High)
    };

    const PatchGenerator generator{};
    const auto first = generator.Generate(issues, store);
    REQUIRE(first.size() == 2);
    REQUIRE(first[0].patchId == "PATCH_RECIPE_R_VARIANTS");
    REQUIRE(first[0].fixes == std::vector<std::string>{"ESSENTIAL_RECIPE_R"});
    REQUIRE(first[0].estimatedImpact == Severity::Critical);
    REQUIRE(first[1].patchId == "PATCH_TECHNOLOGY_T_ALTERNATIVES");

    const auto second = generator.Generate(issues, store);
    REQUIRE(second.size() == first.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        REQUIRE(second[i].patchId == first[i].patchId);
        REQUIRE(second[i].generatedArtifact == first[i].generatedArtifact);
    }
}

TEST_CASE("Patch options and renderers are injectable", "[patch]") {
    mh::history::HistoryStore store;
    RecordIngredientConflict(store);

    mh::patch::PatchOptions options;
    options.targetPackage = "my-fixes";
    options.targetFile = "data-updates.lua";
    const PatchGenerator generator(options, std::make_shared<TagRenderer>());
    REQUIRE(generator.Renderer().Dialect() == "tag");

    const auto patches = generator.Generate(
        {MakeIssue("RECIPE_CONFLICT_R", PrototypeKey("recipe", "r"), Severity::High, {"A", "B"})}, store);
    REQUIRE(patches.size() == 1);
    REQUIRE(patches[0].targetPackage == "my-fixes");
    REQUIRE(patches[0].targetFile == "data-updates.lua");
    REQUIRE(patches[0].generatedArtifact == "tag:PATCH_RECIPE_R_VARIANTS");
}

TEST_CASE("Lua patches copy the resolved prototype and only extend data", "[patch]") {
    mh::history::HistoryStore store;
    RecordIngredientConflict(store);

    const PatchGenerator generator{};
    const auto patches = generator.Generate(
        {MakeIssue("RECIPE_CONFLICT_R", PrototypeKey("recipe", "r"), Severity::High, {"A", "B"})}, store);
    REQUIRE(patches.size() == 1);

    const auto& lua = patches.front().generatedArtifact;
    REQUIRE(lua.rfind("-- PATCH_RECIPE_R_VARIANTS: ", 0) == 0);
    REQUIRE(lua.find("-- Fixes: RECIPE_CONFLICT_R") != std::string::npos);
    REQUIRE(lua.find("if data.raw[\"recipe\"] and data.raw[\"recipe\"][\"r\"] then") != std::string::npos);
    REQUIRE(lua.find("local variant = table.deepcopy(original)") != std::string::npos);
    REQUIRE(lua.find("variant.name = \"r-a\"") != std::string::npos);
    REQUIRE(lua.find("variant.ingredients = {{amount = 1, name = \"iron\", type = \"item\"}, "
                     "{amount = 1, name = \"wood\", type = \"item\"}}") != std::string::npos);
    REQUIRE(lua.find("data:extend({variant})") != std::string::npos);
    REQUIRE(lua.find("= nil") == std::string::npos);

    const mh::patch::LuaPatchRenderer renderer{};
    const auto file = renderer.RenderFile(patches);
    REQUIRE(file.rfind("-- Generated by mod-harmonizer\n-- 1 compatibility patch(es)\n", 0) == 0);
    REQUIRE(file.find("--   PATCH_RECIPE_R_VARIANTS fixes RECIPE_CONFLICT_R") != std::string::npos);
    REQUIRE(file.find(lua) != std::string::npos);
}

TEST_CASE("Lua literals cover every JSON shape", "[patch]") {
    using mh::patch::ToLuaLiteral;
    REQUIRE(ToLuaLiteral(nlohmann::json()) == "nil");
    REQUIRE(ToLuaLiteral(true) == "true");
    REQUIRE(ToLuaLiteral(-3) == "-3");
    REQUIRE(ToLuaLiteral(1.5) == "1.5");
    REQUIRE(ToLuaLiteral("say \"hi\"") == "\"say \\\"hi\\\"\"");
    REQUIRE(ToLuaLiteral(nlohmann::json::array({"a", 2})) == "{\"a\", 2}");
    REQUIRE(ToLuaLiteral(nlohmann::json{{"stack-size", 5}, {"name", "x"}}) == "{name = \"x\", [\"stack-size\"] = 5}");
    REQUIRE(ToLuaLiteral(nlohmann::json{{"end", 1}}) == "{[\"end\"] = 1}");
    REQUIRE(mh::patch::QuoteLua("a\nb") == "\"a\\nb\"");
}

TEST_CASE("Package slugs and field paths are normalized", "[patch]") {
    REQUIRE(mh::patch::PackageSlug("Space Exploration_2") == "space-exploration-2");
    REQUIRE(mh::patch::PackageSlug("--Krastorio2--") == "krastorio2");
    REQUIRE(mh::patch::FieldPathToPointer("ingredients[1].amount").to_string() == "/ingredients/1/amount");
    REQUIRE(mh::patch::FieldPathToPointer("energy_required").to_string() == "/energy_required");
}
