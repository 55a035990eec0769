#pragma once

#include "mh/model/PrototypeKey.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mh::model {

// Declared least to most severe so that the built-in ordering ranks Critical highest.
enum class Severity {
    Info,
    Low,
    Medium,
    High,
    Critical
};

enum class DependencyKind {
    Ingredient,
    Result,
    TechPrerequisite,
    TechUnlock,
    CraftingCategory,
    FuelCategory,
    ResourceCategory
};

enum class PatchKind {
    RecipeVariants,
    TechnologyAlternatives,
    PrototypeVariants
};

const char* ToString(Severity severity);
const char* ToString(DependencyKind kind);
const char* ToString(PatchKind kind);

std::optional<Severity> ParseSeverity(std::string_view text);
std::optional<DependencyKind> ParseDependencyKind(std::string_view text);

/// Normalized ingredient/result reference. Raw shapes are folded into this at ingestion.
struct Ingredient {
    std::string type = "item";
    std::string name;
    double amount = 1.0;
};

/**
 * @brief Reads a normalized ingredient or result list.
 *
 * Entries that are not objects with a string "name" are skipped.
 */
std::vector<Ingredient> ReadIngredientList(const nlohmann::json& value);

/**
 * @brief Drops later entries that repeat an earlier (type, name) pair.
 *
 * Kept entries are copied unchanged, extra keys such as probability or
 * minimum_temperature included.
 */
nlohmann::json DeduplicateIngredientList(const nlohmann::json& value);

struct Dependency {
    PrototypeKey source;
    PrototypeKey target;
    DependencyKind kind = DependencyKind::Ingredient;
    bool required = true;
    std::optional<double> amount;
};

struct AvailabilityContext {
    std::string id;
    std::set<std::string> availableResources;
    std::set<std::string> knownTechnologies;
    std::set<std::string> knownMachines;
};

struct ConflictIssue {
    std::string issueId;
    Severity severity = Severity::Info;
    std::string title;
    std::string description;
    std::vector<PrototypeKey> affectedKeys;
    std::vector<std::string> contributingPackages;
    std::string rootCause;
    std::vector<std::string> suggestedFixes;
    std::string fieldPath;
    nlohmann::json evidence = nlohmann::json::object();

    [[nodiscard]] bool Affects(const PrototypeKey& key) const;
};

struct PrototypeAnalysis {
    PrototypeKey key;
    std::size_t modificationCount = 0;
    std::vector<std::string> packages;
    bool conflicted = false;
    std::vector<Dependency> dependencies;
    std::vector<Dependency> dependents;
    std::vector<Dependency> missingDependencies;
    std::vector<std::string> availableContexts;
    std::vector<std::string> unavailableContexts;
    std::vector<ConflictIssue> issues;
};

struct PatchSuggestion {
    std::string patchId;
    std::string targetPackage;
    std::string targetFile;
    std::vector<std::string> fixes;
    PatchKind kind = PatchKind::RecipeVariants;
    PrototypeKey target;
    std::string description;
    std::string generatedArtifact;
    nlohmann::json structuredOverrides = nlohmann::json::object();
    Severity estimatedImpact = Severity::Low;
};

struct ReportSummary {
    std::size_t total = 0;
    std::size_t conflicted = 0;
    std::size_t critical = 0;
    std::size_t high = 0;
    std::size_t medium = 0;
    std::size_t low = 0;
    std::size_t info = 0;
};

using DependencyGraph = std::map<PrototypeKey, std::vector<Dependency>>;

struct CompatibilityReport {
    std::vector<std::string> analyzedPackages;
    std::string analysisTimestamp;
    ReportSummary summary;
    std::map<PrototypeKey, PrototypeAnalysis> analyses;
    std::vector<ConflictIssue> issues;
    DependencyGraph dependencyGraph;
    std::vector<PatchSuggestion> patches;

    [[nodiscard]] std::vector<ConflictIssue> CriticalIssues() const;
    [[nodiscard]] std::vector<ConflictIssue> IssuesByPackage(std::string_view package) const;
    [[nodiscard]] std::vector<PrototypeKey> ConflictedKeys() const;
};

/**
 * Upper-cased id fragment: "iron-gear" -> "IRON_GEAR". Any other character is
 * written as "_x" plus two lowercase hex digits, so distinct names never share a token.
 */
std::string MakeIssueToken(std::string_view text);

ReportSummary Summarize(const std::map<PrototypeKey, PrototypeAnalysis>& analyses,
                        const std::vector<ConflictIssue>& issues);

} // namespace mh::model
