#include "mh/utils/Config.hpp"

#include "TestFixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using mh::utils::ConfigLoader;

TEST_CASE("Missing config file falls back to defaults", "[config]") {
    TempDirectory temp;
    const auto result = ConfigLoader::Load(temp.root / "absent.json");

    REQUIRE_FALSE(result.loadedFromFile);
    REQUIRE_FALSE(result.HasErrors());
    REQUIRE(result.config.configDirectory == temp.root);

    const auto& options = result.config.analysis;
    REQUIRE(options.detector.basePackage == "base");
    REQUIRE(options.detector.essentialRecipes.empty());
    REQUIRE(options.contextKinds == std::set<std::string>{"planet"});
    REQUIRE(options.wideAvailabilityThreshold == mh::analysis::kDefaultWideAvailabilityThreshold);
    REQUIRE(options.patches.targetPackage == "mod-harmonizer-patch");
    REQUIRE(options.patches.targetFile == "data-final-fixes.lua");
    REQUIRE(result.config.logging.file.empty());
}

TEST_CASE("Config file values override defaults", "[config]") {
    TempDirectory temp;
    const auto path = temp.root / "harmonizer.json";
    WriteTextFile(path, R"({
        "analysis": {
            "essentialRecipes": ["electronic-circuit", "iron-gear-wheel"],
            "referenceContext": "nauvis",
            "basePackage": "core",
            "wideAvailabilityThreshold": 0.5,
            "defaultCraftingCategory": "basic-crafting",
            "contextKinds": ["planet", "surface"]
        },
        "contexts": [
            {"id": "nauvis", "resources": ["iron-ore", "copper-ore"], "technologies": ["automation"]},
            {"id": "vulcanus", "resources": ["tungsten-ore"], "machines": ["foundry"]}
        ],
        "patches": {"targetPackage": "my-patch", "targetFile": "data-updates.lua"},
        "logging": {"file": "logs/harmonizer.log", "debug": true}
    })");

    const auto result = ConfigLoader::Load(path);
    REQUIRE(result.loadedFromFile);
    REQUIRE_FALSE(result.HasErrors());

    const auto& options = result.config.analysis;
    REQUIRE(options.detector.essentialRecipes == std::set<std::string>{"electronic-circuit", "iron-gear-wheel"});
    REQUIRE(options.detector.referenceContext == "nauvis");
    REQUIRE(options.detector.basePackage == "core");
    REQUIRE(options.wideAvailabilityThreshold == 0.5);
    REQUIRE(options.graph.defaultCraftingCategory == "basic-crafting");
    REQUIRE(options.contextKinds == std::set<std::string>{"planet", "surface"});

    REQUIRE(options.contexts.size() == 2);
    REQUIRE(options.contexts[0].id == "nauvis");
    REQUIRE(options.contexts[0].availableResources == std::set<std::string>{"copper-ore", "iron-ore"});
    REQUIRE(options.contexts[0].knownTechnologies == std::set<std::string>{"automation"});
    REQUIRE(options.contexts[1].knownMachines == std::set<std::string>{"foundry"});

    REQUIRE(options.patches.targetPackage == "my-patch");
    REQUIRE(options.patches.targetFile == "data-updates.lua");

    REQUIRE(result.config.logging.debug);
    REQUIRE(result.config.logging.file.filename() == "harmonizer.log");
    REQUIRE(result.config.logging.file.is_absolute());
    REQUIRE(result.HasWarnings());
}

TEST_CASE("Invalid JSON is reported as an error", "[config]") {
    TempDirectory temp;
    const auto path = temp.root / "broken.json";
    WriteTextFile(path, "{ \"analysis\": ");

    const auto result = ConfigLoader::Load(path);
    REQUIRE(result.HasErrors());
    REQUIRE_FALSE(result.loadedFromFile);
    REQUIRE(result.config.analysis.detector.basePackage == "base");
}

TEST_CASE("Out-of-range values are clamped or restored with warnings", "[config]") {
    const nlohmann::json json{
        {"analysis", {{"wideAvailabilityThreshold", 1.5}, {"basePackage", ""}, {"contextKinds", nlohmann::json::array()}}},
        {"patches", {{"targetPackage", ""}, {"targetFile", ""}}}
    };

    const auto result = ConfigLoader::FromJson(json, std::filesystem::temp_directory_path());
    REQUIRE_FALSE(result.HasErrors());
    REQUIRE(result.warnings.size() == 5);

    const auto& options = result.config.analysis;
    REQUIRE(options.wideAvailabilityThreshold == 1.0);
    REQUIRE(options.detector.basePackage == "base");
    REQUIRE(options.patches.targetPackage == "mod-harmonizer-patch");
    REQUIRE(options.patches.targetFile == "data-final-fixes.lua");
    REQUIRE(options.contextKinds.empty());
}

TEST_CASE("Unknown reference contexts are warned about", "[config]") {
    const nlohmann::json json{
        {"analysis", {{"referenceContext", "fulgora"}}},
        {"contexts", {{{"id", "nauvis"}, {"resources", {"iron-ore"}}}}}
    };

    const auto result = ConfigLoader::FromJson(json, std::filesystem::temp_directory_path());
    REQUIRE_FALSE(result.HasErrors());
    REQUIRE(result.warnings.size() == 1);
    REQUIRE(result.warnings.front().find("fulgora") != std::string::npos);
}

TEST_CASE("Malformed context entries are errors", "[config]") {
    SECTION("duplicate and anonymous entries are dropped") {
        const nlohmann::json json{
            {"contexts", {
                {{"id", "nauvis"}, {"resources", {"iron-ore"}}},
                {{"id", "nauvis"}, {"resources", {"coal"}}},
                {{"resources", {"stone"}}}
            }}
        };

        const auto result = ConfigLoader::FromJson(json, std::filesystem::temp_directory_path());
        REQUIRE(result.errors.size() == 2);
        REQUIRE(result.config.analysis.contexts.size() == 1);
        REQUIRE(result.config.analysis.contexts[0].availableResources == std::set<std::string>{"iron-ore"});
    }

    SECTION("contexts must be an array") {
        const nlohmann::json json{{"contexts", {{"id", "nauvis"}}}};
        const auto result = ConfigLoader::FromJson(json, std::filesystem::temp_directory_path());
        REQUIRE(result.HasErrors());
        REQUIRE(result.config.analysis.contexts.empty());
    }
}
