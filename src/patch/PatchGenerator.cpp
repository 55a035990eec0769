#include "mh/patch/PatchGenerator.hpp"

#include "mh/core/Logger.hpp"
#include "mh/patch/LuaPatchRenderer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <set>
#include <utility>

#include <fmt/format.h>

namespace mh::patch {

namespace {

const std::vector<std::string> kRecipeFields{"ingredients", "results", "energy_required", "category"};
const std::vector<std::string> kTechnologyFields{"prerequisites", "unit", "effects"};

struct FallbackTier {
    const char* tier;
    double costMultiplier;
};

constexpr FallbackTier kBasicTier{"basic", 2.0};
constexpr FallbackTier kAdvancedTier{"advanced", 1.5};
constexpr FallbackTier kHigherTier{"higher", 1.0};

struct ScaledParameter {
    const char* path;
    double factor;
    bool integral;
};

// Cost parameters shrink for the lite variant, capacity parameters grow for the reinforced one.
const std::vector<ScaledParameter> kCostParameters{
    {"energy_required", 0.5, false},
    {"unit.count", 0.5, true},
    {"minable.mining_time", 0.5, false}
};
const std::vector<ScaledParameter> kSizeParameters{
    {"stack_size", 2.0, true},
    {"durability", 2.0, false},
    {"max_health", 2.0, false},
    {"inventory_size", 2.0, true}
};

bool IsNonEmptyArray(const nlohmann::json& fields, const char* name) {
    auto it = fields.find(name);
    return it != fields.end() && it->is_array() && !it->empty();
}

void DeduplicateList(nlohmann::json& fields, const char* name) {
    auto it = fields.find(name);
    if (it == fields.end() || !it->is_array()) {
        return;
    }
    *it = model::DeduplicateIngredientList(*it);
}

std::vector<std::string> StringList(const nlohmann::json& value) {
    std::vector<std::string> strings;
    if (!value.is_array()) {
        return strings;
    }
    for (const auto& entry : value) {
        if (entry.is_string()) {
            strings.push_back(entry.get<std::string>());
        }
    }
    return strings;
}

bool Contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

// Applies one record's effect on the listed fields to @p fields; @p fallback supplies the
// base value when a nested edit lands on a field not yet present.
void ApplyRecord(nlohmann::json& fields,
                 const history::ModificationRecord& record,
                 const std::vector<std::string>& tracked,
                 const nlohmann::json* fallback) {
    if (record.fieldPath.empty()) {
        if (!record.newValue.is_object()) {
            return;
        }
        for (const auto& field : tracked) {
            if (auto it = record.newValue.find(field); it != record.newValue.end()) {
                fields[field] = *it;
            }
        }
        return;
    }

    const std::string root = record.fieldPath.substr(0, record.fieldPath.find_first_of(".["));
    if (!Contains(tracked, root)) {
        return;
    }
    if (root == record.fieldPath) {
        fields[root] = record.newValue;
        return;
    }

    if (!fields.contains(root)) {
        if (!fallback || !fallback->contains(root)) {
            core::Logger::Debug("[PatchGenerator] No base value for '{}' on {}", record.fieldPath, record.key.ToString());
            return;
        }
        fields[root] = fallback->at(root);
    }
    try {
        fields[FieldPathToPointer(record.fieldPath)] = record.newValue;
    } catch (const nlohmann::json::exception& e) {
        core::Logger::Warning("[PatchGenerator] Cannot apply '{}' on {}: {}",
                              record.fieldPath, record.key.ToString(), e.what());
    }
}

// Writes the scaled value into @p fields, copying the enclosing top-level field from
// @p original for nested paths. Absent parameters and values that would not change are skipped.
void ScaleParameter(nlohmann::json& fields, const nlohmann::json& original, const ScaledParameter& parameter) {
    const auto pointer = FieldPathToPointer(parameter.path);
    if (!original.contains(pointer) || !original.at(pointer).is_number()) {
        return;
    }
    const double current = original.at(pointer).get<double>();
    nlohmann::json scaled = current * parameter.factor;
    if (parameter.integral) {
        const auto rounded = std::max<std::int64_t>(1, static_cast<std::int64_t>(std::ceil(current * parameter.factor)));
        if (static_cast<double>(rounded) == current) {
            return;
        }
        scaled = rounded;
    } else if (scaled.get<double>() == current) {
        return;
    }

    const std::string_view path = parameter.path;
    const std::string root(path.substr(0, path.find('.')));
    if (!fields.contains(root)) {
        fields[root] = original.at(root);
    }
    fields[pointer] = std::move(scaled);
}

nlohmann::json ScaledFields(const nlohmann::json& original, const std::vector<ScaledParameter>& parameters) {
    nlohmann::json fields = nlohmann::json::object();
    for (const auto& parameter : parameters) {
        ScaleParameter(fields, original, parameter);
    }
    return fields;
}

nlohmann::json FallbackVariant(const std::string& name, const FallbackTier& tier,
                               const std::vector<std::string>& prerequisites) {
    return nlohmann::json{
        {"name", fmt::format("{}-{}", name, tier.tier)},
        {"tier", tier.tier},
        {"requires", prerequisites},
        {"fields", nlohmann::json{{"prerequisites", prerequisites}}},
        {"cost_multiplier", tier.costMultiplier}
    };
}

} // namespace

std::string PackageSlug(std::string_view package) {
    std::string slug;
    slug.reserve(package.size());
    for (char c : package) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            slug.push_back(static_cast<char>(std::tolower(uc)));
        } else if (!slug.empty() && slug.back() != '-') {
            slug.push_back('-');
        }
    }
    while (!slug.empty() && slug.back() == '-') {
        slug.pop_back();
    }
    return slug;
}

nlohmann::json::json_pointer FieldPathToPointer(std::string_view fieldPath) {
    std::string pointer;
    std::string segment;
    auto flush = [&]() {
        if (segment.empty()) {
            return;
        }
        pointer.push_back('/');
        for (char c : segment) {
            if (c == '~') {
                pointer += "~0";
            } else if (c == '/') {
                pointer += "~1";
            } else {
                pointer.push_back(c);
            }
        }
        segment.clear();
    };
    for (char c : fieldPath) {
        if (c == '.' || c == '[' || c == ']') {
            flush();
        } else {
            segment.push_back(c);
        }
    }
    flush();
    return nlohmann::json::json_pointer(pointer);
}

PatchGenerator::PatchGenerator(PatchOptions options, std::shared_ptr<const PatchRenderer> renderer)
    : m_options(std::move(options)),
      m_renderer(renderer ? std::move(renderer) : std::make_shared<LuaPatchRenderer>()) {}

PackageSnapshot PatchGenerator::Reconstruct(const history::PrototypeHistory& history,
                                            const std::string& package,
                                            const std::vector<std::string>& fields) {
    PackageSnapshot snapshot;
    snapshot.package = package;
    nlohmann::json resolved = nlohmann::json::object();
    for (const auto& record : history.Modifications()) {
        if (record.package == package) {
            ApplyRecord(snapshot.fields, record, fields, &resolved);
        }
        ApplyRecord(resolved, record, fields, nullptr);
    }
    return snapshot;
}

std::vector<std::string> PatchGenerator::PackagesFor(const model::ConflictIssue& issue,
                                                     const history::PrototypeHistory& history) const {
    const auto touched = history.Packages();
    if (issue.contributingPackages.empty()) {
        return touched;
    }
    std::vector<std::string> packages;
    for (const auto& package : issue.contributingPackages) {
        if (Contains(touched, package) && !Contains(packages, package)) {
            packages.push_back(package);
        }
    }
    return packages;
}

model::PatchSuggestion PatchGenerator::MakeSuggestion(const model::ConflictIssue& issue,
                                                      const model::PrototypeKey& key,
                                                      model::PatchKind kind) const {
    model::PatchSuggestion patch;
    patch.targetPackage = m_options.targetPackage;
    patch.targetFile = m_options.targetFile;
    patch.fixes = {issue.issueId};
    patch.kind = kind;
    patch.target = key;
    patch.estimatedImpact = issue.severity;
    return patch;
}

std::optional<model::PatchSuggestion> PatchGenerator::GenerateRecipePatch(const model::ConflictIssue& issue,
                                                                          const history::PrototypeHistory& history) const {
    const auto& key = history.Key();
    nlohmann::json variants = nlohmann::json::array();
    for (const auto& package : PackagesFor(issue, history)) {
        auto snapshot = Reconstruct(history, package, kRecipeFields);
        DeduplicateList(snapshot.fields, "ingredients");
        DeduplicateList(snapshot.fields, "results");

        const auto categoryIt = snapshot.fields.find("category");
        const bool usable = IsNonEmptyArray(snapshot.fields, "ingredients") ||
                            IsNonEmptyArray(snapshot.fields, "results") ||
                            (categoryIt != snapshot.fields.end() && categoryIt->is_string());
        if (!usable) {
            core::Logger::Debug("[PatchGenerator] {} has no usable data from '{}'", key.ToString(), package);
            continue;
        }
        variants.push_back(nlohmann::json{
            {"package", package},
            {"name", fmt::format("{}-{}", key.name, PackageSlug(package))},
            {"fields", std::move(snapshot.fields)}
        });
    }
    if (variants.empty()) {
        return std::nullopt;
    }

    auto patch = MakeSuggestion(issue, key, model::PatchKind::RecipeVariants);
    patch.patchId = fmt::format("PATCH_RECIPE_{}_VARIANTS", model::MakeIssueToken(key.name));
    patch.description = fmt::format("Adds {} package variant(s) of recipe '{}' next to the resolved definition",
                                    variants.size(), key.name);
    patch.structuredOverrides = {{"target", key.ToString()}, {"variants", std::move(variants)}};
    return patch;
}

std::optional<model::PatchSuggestion> PatchGenerator::GenerateTechnologyPatch(const model::ConflictIssue& issue,
                                                                              const history::PrototypeHistory& history) const {
    const auto& key = history.Key();
    nlohmann::json variants = nlohmann::json::array();
    std::vector<std::vector<std::string>> prerequisiteLists;
    for (const auto& package : PackagesFor(issue, history)) {
        auto snapshot = Reconstruct(history, package, kTechnologyFields);
        if (snapshot.fields.empty()) {
            continue;
        }
        std::vector<std::string> prerequisites;
        if (auto it = snapshot.fields.find("prerequisites"); it != snapshot.fields.end()) {
            prerequisites = StringList(*it);
            prerequisiteLists.push_back(prerequisites);
        }
        variants.push_back(nlohmann::json{
            {"package", package},
            {"name", fmt::format("{}-{}", key.name, PackageSlug(package))},
            {"tier", "alternative"},
            {"requires", prerequisites},
            {"fields", std::move(snapshot.fields)}
        });
    }
    if (variants.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> shared;
    std::vector<std::string> combined;
    if (!prerequisiteLists.empty()) {
        for (const auto& prerequisite : prerequisiteLists.front()) {
            const bool everywhere = std::all_of(prerequisiteLists.begin(), prerequisiteLists.end(),
                                                [&](const auto& list) { return Contains(list, prerequisite); });
            if (everywhere && !Contains(shared, prerequisite)) {
                shared.push_back(prerequisite);
            }
        }
        for (const auto& list : prerequisiteLists) {
            for (const auto& prerequisite : list) {
                if (!Contains(combined, prerequisite)) {
                    combined.push_back(prerequisite);
                }
            }
        }
    }

    // Rungs that would gate on the same prerequisites as a cheaper one are left out.
    variants.push_back(FallbackVariant(key.name, kBasicTier, {}));
    if (!shared.empty()) {
        variants.push_back(FallbackVariant(key.name, kAdvancedTier, shared));
    }
    if (!combined.empty() && combined != shared) {
        variants.push_back(FallbackVariant(key.name, kHigherTier, combined));
    }

    auto patch = MakeSuggestion(issue, key, model::PatchKind::TechnologyAlternatives);
    patch.patchId = fmt::format("PATCH_TECHNOLOGY_{}_ALTERNATIVES", model::MakeIssueToken(key.name));
    patch.description = fmt::format("Adds alternative research paths for technology '{}'", key.name);
    patch.structuredOverrides = {{"target", key.ToString()}, {"variants", std::move(variants)}};
    return patch;
}

std::optional<model::PatchSuggestion> PatchGenerator::GenerateGenericPatch(const model::ConflictIssue& issue,
                                                                           const history::PrototypeHistory& history) const {
    const auto& key = history.Key();
    const auto& original = history.CurrentValue();
    if (!original.is_object() || (!original.contains("icon") && !original.contains("icons"))) {
        core::Logger::Debug("[PatchGenerator] Skipping variants of {}: no icon on the resolved definition", key.ToString());
        return std::nullopt;
    }

    nlohmann::json variants = nlohmann::json::array();
    if (auto lite = ScaledFields(original, kCostParameters); !lite.empty()) {
        variants.push_back(nlohmann::json{
            {"name", fmt::format("{}-lite", key.name)},
            {"tier", "lite"},
            {"fields", std::move(lite)}
        });
    }
    if (auto reinforced = ScaledFields(original, kSizeParameters); !reinforced.empty()) {
        variants.push_back(nlohmann::json{
            {"name", fmt::format("{}-reinforced", key.name)},
            {"tier", "reinforced"},
            {"fields", std::move(reinforced)}
        });
    }
    if (variants.empty()) {
        core::Logger::Debug("[PatchGenerator] Skipping variants of {}: no cost or size parameter to scale", key.ToString());
        return std::nullopt;
    }

    auto patch = MakeSuggestion(issue, key, model::PatchKind::PrototypeVariants);
    patch.patchId = fmt::format("PATCH_{}_{}_VARIANTS", model::MakeIssueToken(key.kind), model::MakeIssueToken(key.name));
    patch.description = fmt::format("Adds {} reduced-cost or reinforced variant(s) of {} '{}'",
                                    variants.size(), key.kind, key.name);
    patch.structuredOverrides = {{"target", key.ToString()}, {"variants", std::move(variants)}};
    return patch;
}

std::vector<model::PatchSuggestion> PatchGenerator::Generate(const std::vector<model::ConflictIssue>& issues,
                                                             const history::HistoryStore& store) const {
    std::vector<const model::ConflictIssue*> recipeIssues;
    std::vector<const model::ConflictIssue*> technologyIssues;
    std::vector<const model::ConflictIssue*> otherIssues;
    for (const auto& issue : issues) {
        if (issue.affectedKeys.empty()) {
            continue;
        }
        const auto& kind = issue.affectedKeys.front().kind;
        if (kind == "recipe") {
            recipeIssues.push_back(&issue);
        } else if (kind == "technology") {
            technologyIssues.push_back(&issue);
        } else {
            otherIssues.push_back(&issue);
        }
    }

    auto bySeverity = [](const model::ConflictIssue* lhs, const model::ConflictIssue* rhs) {
        return lhs->severity > rhs->severity;
    };

    std::vector<model::PatchSuggestion> patches;
    std::set<model::PrototypeKey> patchedKeys;
    for (auto* bucket : {&recipeIssues, &technologyIssues, &otherIssues}) {
        std::stable_sort(bucket->begin(), bucket->end(), bySeverity);
        for (const auto* issue : *bucket) {
            const auto& key = issue->affectedKeys.front();
            if (patchedKeys.count(key) > 0) {
                continue;
            }
            const auto* history = store.HistoryFor(key);
            if (!history) {
                continue;
            }

            std::optional<model::PatchSuggestion> patch;
            try {
                if (bucket == &recipeIssues) {
                    patch = GenerateRecipePatch(*issue, *history);
                } else if (bucket == &technologyIssues) {
                    patch = GenerateTechnologyPatch(*issue, *history);
                } else {
                    patch = GenerateGenericPatch(*issue, *history);
                }
            } catch (const nlohmann::json::exception& e) {
                core::Logger::Error("[PatchGenerator] Failed to build patch for {}: {}", key.ToString(), e.what());
                continue;
            }
            if (!patch) {
                continue;
            }

            patch->generatedArtifact = m_renderer->Render(*patch);
            patchedKeys.insert(key);
            patches.push_back(std::move(*patch));
        }
    }

    core::Logger::Info("[PatchGenerator] Generated {} patch(es) for {} issue(s)", patches.size(), issues.size());
    return patches;
}

} // namespace mh::patch
