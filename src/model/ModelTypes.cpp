#include "mh/model/ModelTypes.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iterator>
#include <utility>

namespace mh::model {

const char* ToString(Severity severity) {
    switch (severity) {
        case Severity::Critical: return "critical";
        case Severity::High:     return "high";
        case Severity::Medium:   return "medium";
        case Severity::Low:      return "low";
        case Severity::Info:     return "info";
    }
    return "info";
}

const char* ToString(DependencyKind kind) {
    switch (kind) {
        case DependencyKind::Ingredient:       return "ingredient";
        case DependencyKind::Result:           return "result";
        case DependencyKind::TechPrerequisite: return "tech_prerequisite";
        case DependencyKind::TechUnlock:       return "tech_unlock";
        case DependencyKind::CraftingCategory: return "crafting_category";
        case DependencyKind::FuelCategory:     return "fuel_category";
        case DependencyKind::ResourceCategory: return "resource_category";
    }
    return "ingredient";
}

const char* ToString(PatchKind kind) {
    switch (kind) {
        case PatchKind::RecipeVariants:         return "recipe_variants";
        case PatchKind::TechnologyAlternatives: return "technology_alternatives";
        case PatchKind::PrototypeVariants:      return "prototype_variants";
    }
    return "recipe_variants";
}

std::optional<Severity> ParseSeverity(std::string_view text) {
    for (auto severity : {Severity::Critical, Severity::High, Severity::Medium, Severity::Low, Severity::Info}) {
        if (text == ToString(severity)) {
            return severity;
        }
    }
    return std::nullopt;
}

std::optional<DependencyKind> ParseDependencyKind(std::string_view text) {
    for (auto kind : {DependencyKind::Ingredient, DependencyKind::Result, DependencyKind::TechPrerequisite,
                      DependencyKind::TechUnlock, DependencyKind::CraftingCategory,
                      DependencyKind::FuelCategory, DependencyKind::ResourceCategory}) {
        if (text == ToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

std::vector<Ingredient> ReadIngredientList(const nlohmann::json& value) {
    std::vector<Ingredient> ingredients;
    if (!value.is_array()) {
        return ingredients;
    }
    ingredients.reserve(value.size());
    for (const auto& entry : value) {
        if (!entry.is_object()) {
            continue;
        }
        const auto nameIt = entry.find("name");
        if (nameIt == entry.end() || !nameIt->is_string()) {
            continue;
        }
        Ingredient ingredient;
        ingredient.name = nameIt->get<std::string>();
        if (auto typeIt = entry.find("type"); typeIt != entry.end() && typeIt->is_string()) {
            ingredient.type = typeIt->get<std::string>();
        }
        if (auto amountIt = entry.find("amount"); amountIt != entry.end() && amountIt->is_number()) {
            ingredient.amount = amountIt->get<double>();
        }
        ingredients.push_back(std::move(ingredient));
    }
    return ingredients;
}

nlohmann::json DeduplicateIngredientList(const nlohmann::json& value) {
    if (!value.is_array()) {
        return value;
    }
    nlohmann::json unique = nlohmann::json::array();
    std::vector<std::pair<std::string, std::string>> seen;
    for (const auto& entry : value) {
        const auto nameIt = entry.find("name");
        if (nameIt == entry.end() || !nameIt->is_string()) {
            unique.push_back(entry);
            continue;
        }
        const auto typeIt = entry.find("type");
        std::pair<std::string, std::string> id{
            typeIt != entry.end() && typeIt->is_string() ? typeIt->get<std::string>() : "item",
            nameIt->get<std::string>()};
        if (std::find(seen.begin(), seen.end(), id) != seen.end()) {
            continue;
        }
        seen.push_back(std::move(id));
        unique.push_back(entry);
    }
    return unique;
}

bool ConflictIssue::Affects(const PrototypeKey& key) const {
    return std::find(affectedKeys.begin(), affectedKeys.end(), key) != affectedKeys.end();
}

std::vector<ConflictIssue> CompatibilityReport::CriticalIssues() const {
    std::vector<ConflictIssue> critical;
    std::copy_if(issues.begin(), issues.end(), std::back_inserter(critical), [](const ConflictIssue& issue) {
        return issue.severity == Severity::Critical;
    });
    return critical;
}

std::vector<ConflictIssue> CompatibilityReport::IssuesByPackage(std::string_view package) const {
    std::vector<ConflictIssue> matching;
    for (const auto& issue : issues) {
        const auto& packages = issue.contributingPackages;
        if (std::find(packages.begin(), packages.end(), package) != packages.end()) {
            matching.push_back(issue);
        }
    }
    return matching;
}

std::vector<PrototypeKey> CompatibilityReport::ConflictedKeys() const {
    std::vector<PrototypeKey> keys;
    for (const auto& [key, analysis] : analyses) {
        if (analysis.conflicted) {
            keys.push_back(key);
        }
    }
    return keys;
}

std::string MakeIssueToken(std::string_view text) {
    std::string token;
    token.reserve(text.size());
    for (char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::islower(uc) || std::isdigit(uc)) {
            token.push_back(static_cast<char>(std::toupper(uc)));
        } else if (c == '-') {
            token.push_back('_');
        } else {
            char escaped[5];
            std::snprintf(escaped, sizeof(escaped), "_x%02x", uc);
            token += escaped;
        }
    }
    return token;
}

ReportSummary Summarize(const std::map<PrototypeKey, PrototypeAnalysis>& analyses,
                        const std::vector<ConflictIssue>& issues) {
    ReportSummary summary;
    summary.total = analyses.size();
    summary.conflicted = static_cast<std::size_t>(
        std::count_if(analyses.begin(), analyses.end(), [](const auto& entry) {
            return entry.second.conflicted;
        }));
    for (const auto& issue : issues) {
        switch (issue.severity) {
            case Severity::Critical: ++summary.critical; break;
            case Severity::High:     ++summary.high; break;
            case Severity::Medium:   ++summary.medium; break;
            case Severity::Low:      ++summary.low; break;
            case Severity::Info:     ++summary.info; break;
        }
    }
    return summary;
}

} // namespace mh::model
