#include "mh/analysis/ConflictDetector.hpp"

#include "mh/core/Logger.hpp"
#include "mh/graph/DependencyGraphBuilder.hpp"

#include <algorithm>
#include <cctype>
#include <deque>
#include <iterator>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace mh::analysis {

namespace {

constexpr std::string_view kIngredientsField = "ingredients";

std::string TitleCase(std::string_view text) {
    std::string titled(text);
    bool startOfWord = true;
    for (auto& c : titled) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            c = static_cast<char>(startOfWord ? std::toupper(uc) : std::tolower(uc));
            startOfWord = false;
        } else {
            startOfWord = true;
        }
    }
    return titled;
}

std::string JoinNames(const std::vector<std::string>& names, std::string_view separator = ", ") {
    return fmt::format("{}", fmt::join(names, separator));
}

// Runs one pass step for a single prototype so that malformed data only costs that prototype.
template <typename Fn>
void Isolated(std::string_view pass, const model::PrototypeKey& key, Fn&& fn) {
    try {
        fn();
    } catch (const nlohmann::json::exception& e) {
        core::Logger::Error("[ConflictDetector] Pass '{}' failed on {}: {}", pass, key.ToString(), e.what());
    }
}

std::vector<std::string> IngredientNames(const nlohmann::json& ingredients) {
    std::vector<std::string> names;
    for (const auto& ingredient : model::ReadIngredientList(ingredients)) {
        names.push_back(ingredient.name);
    }
    return names;
}

bool HasIssueWithPrefix(const std::vector<model::ConflictIssue>& issues,
                        const model::PrototypeKey& key,
                        std::string_view prefix) {
    return std::any_of(issues.begin(), issues.end(), [&](const model::ConflictIssue& issue) {
        return issue.issueId.rfind(prefix, 0) == 0 && issue.Affects(key);
    });
}

std::vector<model::Dependency> FindMissing(const std::vector<model::Dependency>& dependencies,
                                           const history::HistoryStore& store,
                                           const std::set<std::string>& builtinNamespaces) {
    std::vector<model::Dependency> missing;
    for (const auto& dependency : dependencies) {
        if (builtinNamespaces.count(dependency.target.kind) > 0) {
            continue;
        }
        if (!store.Contains(dependency.target)) {
            missing.push_back(dependency);
        }
    }
    return missing;
}

} // namespace

std::optional<nlohmann::json> IngredientsAfter(const history::ModificationRecord& record) {
    if (record.fieldPath == kIngredientsField) {
        return record.newValue;
    }
    if (record.fieldPath.empty() && record.newValue.is_object()) {
        if (auto it = record.newValue.find(kIngredientsField); it != record.newValue.end()) {
            return *it;
        }
    }
    return std::nullopt;
}

void EssentialRecipePass::Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const {
    for (const auto& recipeName : inputs.config.essentialRecipes) {
        const model::PrototypeKey key("recipe", recipeName);
        const auto* history = inputs.store.HistoryFor(key);
        if (!history) {
            continue;
        }
        Isolated(Name(), key, [&] {
            const auto packages = history->Packages();
            if (packages.size() <= 1) {
                return;
            }

            const auto& records = history->Modifications();
            const auto finalChange = std::find_if(records.rbegin(), records.rend(), [](const auto& record) {
                return IngredientsAfter(record).has_value();
            });
            if (finalChange == records.rend()) {
                return;
            }

            const nlohmann::json finalIngredients = *IngredientsAfter(*finalChange);
            std::vector<std::string> problematic;
            for (const auto& name : IngredientNames(finalIngredients)) {
                if (!inputs.availability.IsWidelyAvailable(name)) {
                    problematic.push_back(name);
                }
            }

            model::ConflictIssue issue;
            issue.issueId = std::string(IssuePrefix()) + model::MakeIssueToken(recipeName);
            issue.severity = problematic.empty() ? model::Severity::High : model::Severity::Critical;
            issue.title = fmt::format("Essential Recipe Conflict: {}", recipeName);
            issue.description = fmt::format(
                "Essential recipe '{}' modified by multiple packages with potentially incompatible ingredients",
                recipeName);
            if (!problematic.empty()) {
                issue.description += fmt::format(". Problematic ingredients: {}", JoinNames(problematic));
            }
            issue.affectedKeys = {key};
            issue.contributingPackages = packages;
            issue.rootCause = fmt::format(
                "Multiple packages modify the {} recipe, potentially making it uncraftable in some contexts",
                recipeName);
            issue.suggestedFixes = {
                "Create conditional recipe based on available items",
                "Add alternative recipes for different contexts",
                "Use compatibility patch to resolve ingredient conflicts"
            };
            issue.fieldPath = std::string(kIngredientsField);
            issue.evidence = {
                {"final_package", finalChange->package},
                {"final_ingredients", finalIngredients},
                {"problematic_ingredients", problematic}
            };
            issues.push_back(std::move(issue));
        });
    }
}

void AvailabilityPass::Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const {
    for (const auto& [key, analysis] : inputs.analyses) {
        if (analysis.unavailableContexts.empty()) {
            continue;
        }
        const auto& unavailable = analysis.unavailableContexts;
        const bool referenceBlocked = !inputs.config.referenceContext.empty() &&
            std::find(unavailable.begin(), unavailable.end(), inputs.config.referenceContext) != unavailable.end();

        model::ConflictIssue issue;
        issue.issueId = fmt::format("{}{}_{}", IssuePrefix(), model::MakeIssueToken(key.kind), model::MakeIssueToken(key.name));
        issue.severity = referenceBlocked ? model::Severity::Critical : model::Severity::High;
        issue.title = fmt::format("Availability Conflict: {}", key.name);
        issue.description = fmt::format("{} '{}' not available in contexts: {}",
                                        TitleCase(key.kind), key.name, JoinNames(unavailable));
        issue.affectedKeys = {key};
        issue.contributingPackages = analysis.packages;
        issue.rootCause = "Requires ingredients that cannot be produced from the resources of some contexts";
        issue.suggestedFixes = {
            "Add context-specific alternative recipes",
            "Modify ingredients to use locally available items",
            "Add resource processing chains for missing items"
        };
        issue.evidence = {
            {"available_contexts", analysis.availableContexts},
            {"unavailable_contexts", unavailable},
            {"reference_context_blocked", referenceBlocked}
        };
        issues.push_back(std::move(issue));
    }
}

void MissingDependencyPass::Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const {
    for (const auto& [key, dependencies] : inputs.graph) {
        const auto missing = FindMissing(dependencies, inputs.store, inputs.config.builtinNamespaces);
        if (missing.empty()) {
            continue;
        }

        std::vector<std::string> missingKeys;
        for (const auto& dependency : missing) {
            const auto target = dependency.target.ToString();
            if (std::find(missingKeys.begin(), missingKeys.end(), target) == missingKeys.end()) {
                missingKeys.push_back(target);
            }
        }

        const auto* history = inputs.store.HistoryFor(key);
        model::ConflictIssue issue;
        issue.issueId = fmt::format("{}{}_{}", IssuePrefix(), model::MakeIssueToken(key.kind), model::MakeIssueToken(key.name));
        issue.severity = model::Severity::High;
        issue.title = fmt::format("Missing Dependencies: {}", key.name);
        issue.description = fmt::format("{} '{}' references prototypes that are never defined: {}",
                                        TitleCase(key.kind), key.name, JoinNames(missingKeys));
        issue.affectedKeys = {key};
        issue.contributingPackages = history ? history->Packages() : std::vector<std::string>{};
        issue.rootCause = fmt::format("Undefined references: {}", JoinNames(missingKeys));
        issue.suggestedFixes = {
            "Install the package that defines the missing prototypes",
            "Replace the missing references with existing prototypes",
            "Guard the reference behind a presence check"
        };
        issue.evidence = {{"missing", missingKeys}};
        issues.push_back(std::move(issue));
    }
}

void BrokenPrerequisiteChainPass::Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const {
    std::map<std::string, std::vector<std::string>> prerequisites;
    for (const auto& [key, history] : inputs.store.Histories()) {
        if (key.kind != "technology") {
            continue;
        }
        auto& list = prerequisites[key.name];
        for (const auto& dependency : graph::DependenciesOf(inputs.graph, key)) {
            if (dependency.kind != model::DependencyKind::TechPrerequisite) {
                continue;
            }
            if (std::find(list.begin(), list.end(), dependency.target.name) == list.end()) {
                list.push_back(dependency.target.name);
            }
        }
    }

    std::map<std::string, std::size_t> remaining;
    std::map<std::string, std::vector<std::string>> unlocks;
    std::set<std::string> reachable;
    std::deque<std::string> frontier;
    for (const auto& [technology, prereqs] : prerequisites) {
        remaining[technology] = prereqs.size();
        for (const auto& prereq : prereqs) {
            unlocks[prereq].push_back(technology);
        }
        if (prereqs.empty()) {
            reachable.insert(technology);
            frontier.push_back(technology);
        }
    }

    while (!frontier.empty()) {
        const std::string current = frontier.front();
        frontier.pop_front();
        auto it = unlocks.find(current);
        if (it == unlocks.end()) {
            continue;
        }
        for (const auto& dependent : it->second) {
            if (--remaining[dependent] == 0 && reachable.insert(dependent).second) {
                frontier.push_back(dependent);
            }
        }
    }

    for (const auto& [technology, prereqs] : prerequisites) {
        if (reachable.count(technology) > 0) {
            continue;
        }
        std::vector<std::string> undefined;
        for (const auto& prereq : prereqs) {
            if (prerequisites.count(prereq) == 0) {
                undefined.push_back(prereq);
            }
        }
        if (undefined.empty()) {
            core::Logger::Debug("[ConflictDetector] Technology '{}' unreachable without undefined prerequisites",
                                technology);
            continue;
        }

        const model::PrototypeKey key("technology", technology);
        const auto* history = inputs.store.HistoryFor(key);
        model::ConflictIssue issue;
        issue.issueId = std::string(IssuePrefix()) + model::MakeIssueToken(technology);
        issue.severity = model::Severity::High;
        issue.title = fmt::format("Broken Research Chain: {}", technology);
        issue.description = fmt::format("Technology '{}' can never be researched: prerequisites {} are not defined",
                                        technology, JoinNames(undefined));
        issue.affectedKeys = {key};
        issue.contributingPackages = history ? history->Packages() : std::vector<std::string>{};
        issue.rootCause = fmt::format("Undefined prerequisite technologies: {}", JoinNames(undefined));
        issue.suggestedFixes = {
            "Restore the removed prerequisite technologies",
            "Point the prerequisites at technologies that exist",
            "Add an alternative research path"
        };
        issue.fieldPath = "prerequisites";
        issue.evidence = {
            {"missing_prereqs", undefined},
            {"prerequisites", prereqs}
        };
        issues.push_back(std::move(issue));
    }
}

void RecipeConflictPass::Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const {
    for (const auto& [key, history] : inputs.store.Histories()) {
        if (key.kind != "recipe") {
            continue;
        }
        Isolated(Name(), key, [&, &key = key, &history = history] {
            if (history.Packages().size() < 2) {
                return;
            }

            std::vector<std::string> order;
            nlohmann::json perPackage = nlohmann::json::object();
            for (const auto& record : history.Modifications()) {
                if (record.fieldPath != kIngredientsField) {
                    continue;
                }
                if (!perPackage.contains(record.package)) {
                    order.push_back(record.package);
                }
                perPackage[record.package] = record.newValue;
            }
            if (order.size() < 2) {
                return;
            }

            const bool essential = inputs.config.essentialRecipes.count(key.name) > 0;
            std::vector<std::string> versions;
            for (const auto& package : order) {
                versions.push_back(fmt::format("{}: {}", package, JoinNames(IngredientNames(perPackage[package]), " + ")));
            }

            model::ConflictIssue issue;
            issue.issueId = std::string(IssuePrefix()) + model::MakeIssueToken(key.name);
            issue.severity = essential ? model::Severity::Critical : model::Severity::High;
            issue.title = fmt::format("Recipe Conflict: {}", key.name);
            issue.description = fmt::format("Recipe '{}' has its ingredients replaced by {} packages ({}); only the last one survives",
                                            key.name, order.size(), JoinNames(versions, "; "));
            issue.affectedKeys = {key};
            issue.contributingPackages = order;
            issue.rootCause = fmt::format("Packages {} each rewrite the ingredients of '{}'", JoinNames(order), key.name);
            issue.suggestedFixes = {
                "Add one variant recipe per package",
                "Use conditional recipe modification",
                "Agree on a shared ingredient list"
            };
            issue.fieldPath = std::string(kIngredientsField);
            issue.evidence = {
                {"package_ingredients", perPackage},
                {"package_order", order},
                {"resolved_package", order.back()}
            };
            issues.push_back(std::move(issue));
        });
    }
}

void RecipeVariantPass::Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const {
    const auto& basePackage = inputs.config.basePackage;
    for (const auto& [key, history] : inputs.store.Histories()) {
        if (key.kind != "recipe") {
            continue;
        }
        Isolated(Name(), key, [&, &key = key, &history = history] {
            const auto packages = history.Packages();
            if (std::find(packages.begin(), packages.end(), basePackage) == packages.end()) {
                return;
            }
            std::vector<std::string> others;
            std::copy_if(packages.begin(), packages.end(), std::back_inserter(others),
                         [&](const std::string& package) { return package != basePackage; });
            if (others.size() != 1) {
                return;
            }
            if (HasIssueWithPrefix(issues, key, RecipeConflictPass::kIssuePrefix)) {
                return;
            }

            const std::string& package = others.front();
            std::optional<nlohmann::json> variantIngredients;
            std::optional<nlohmann::json> baseIngredients;
            for (const auto& record : history.Modifications()) {
                auto ingredients = IngredientsAfter(record);
                if (!ingredients) {
                    continue;
                }
                if (record.package == package) {
                    variantIngredients = std::move(ingredients);
                } else if (record.package == basePackage) {
                    baseIngredients = std::move(ingredients);
                }
            }
            if (!variantIngredients) {
                return;
            }

            const bool essential = inputs.config.essentialRecipes.count(key.name) > 0;
            model::ConflictIssue issue;
            issue.issueId = std::string(IssuePrefix()) + model::MakeIssueToken(key.name);
            issue.severity = essential ? model::Severity::High : model::Severity::Medium;
            issue.title = fmt::format("Recipe Variant: {}", key.name);
            issue.description = fmt::format("Package '{}' changes the ingredients of recipe '{}' to {}",
                                            package, key.name,
                                            JoinNames(IngredientNames(*variantIngredients), " + "));
            issue.affectedKeys = {key};
            issue.contributingPackages = {package};
            issue.rootCause = fmt::format("'{}' diverges from the {} definition of '{}'", package, basePackage, key.name);
            issue.suggestedFixes = {
                "Keep the original recipe and add the package version as a variant",
                "Review whether the new ingredients exist in every context"
            };
            issue.fieldPath = std::string(kIngredientsField);
            issue.evidence = {
                {"package", package},
                {"ingredients", *variantIngredients},
                {"base_ingredients", baseIngredients.value_or(nlohmann::json())}
            };
            issues.push_back(std::move(issue));
        });
    }
}

model::Severity GenericConflictPass::DefaultSeverity(std::string_view kind) {
    if (kind == "recipe") {
        return model::Severity::High;
    }
    if (kind == "item" || kind == "technology") {
        return model::Severity::Medium;
    }
    return model::Severity::Low;
}

void GenericConflictPass::Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const {
    for (const auto& conflict : inputs.store.Conflicts()) {
        const auto& key = conflict.key;
        const bool covered = std::any_of(issues.begin(), issues.end(), [&](const model::ConflictIssue& issue) {
            return issue.Affects(key);
        });
        if (covered) {
            continue;
        }

        model::ConflictIssue issue;
        issue.issueId = fmt::format("{}{}_{}", IssuePrefix(), model::MakeIssueToken(key.kind), model::MakeIssueToken(key.name));
        issue.severity = DefaultSeverity(key.kind);
        issue.title = fmt::format("{} Conflict: {}", TitleCase(key.kind), key.name);
        issue.description = fmt::format("{} '{}' modified by multiple packages", TitleCase(key.kind), key.name);
        issue.affectedKeys = {key};
        issue.contributingPackages = conflict.packages;
        issue.rootCause = fmt::format("Multiple packages modify the same {}", key.kind);
        issue.suggestedFixes = {
            "Review modification order",
            "Create compatibility patch",
            "Use conditional modifications"
        };
        issue.evidence = {{"modification_chain", conflict.packages}};
        issues.push_back(std::move(issue));
    }
}

ConflictDetector::ConflictDetector(DetectorConfig config)
    : m_config(std::move(config)) {}

ConflictDetector ConflictDetector::CreateDefault(DetectorConfig config) {
    ConflictDetector detector(std::move(config));
    detector.AddPass(std::make_unique<EssentialRecipePass>());
    detector.AddPass(std::make_unique<AvailabilityPass>());
    detector.AddPass(std::make_unique<MissingDependencyPass>());
    detector.AddPass(std::make_unique<BrokenPrerequisiteChainPass>());
    detector.AddPass(std::make_unique<RecipeConflictPass>());
    detector.AddPass(std::make_unique<RecipeVariantPass>());
    detector.AddPass(std::make_unique<GenericConflictPass>());
    return detector;
}

void ConflictDetector::AddPass(std::unique_ptr<DetectionPass> pass) {
    if (pass) {
        m_passes.push_back(std::move(pass));
    }
}

std::vector<std::string_view> ConflictDetector::PassNames() const {
    std::vector<std::string_view> names;
    names.reserve(m_passes.size());
    for (const auto& pass : m_passes) {
        names.push_back(pass->Name());
    }
    return names;
}

std::vector<model::ConflictIssue> ConflictDetector::Detect(
    const history::HistoryStore& store,
    const model::DependencyGraph& graph,
    const AvailabilityAnalyzer& availability,
    const std::map<model::PrototypeKey, model::PrototypeAnalysis>& analyses) const {
    const DetectionInputs inputs{store, graph, availability, analyses, m_config};
    std::vector<model::ConflictIssue> issues;
    for (const auto& pass : m_passes) {
        const auto before = issues.size();
        pass->Run(inputs, issues);
        core::Logger::Debug("[ConflictDetector] Pass '{}' produced {} issue(s)", pass->Name(), issues.size() - before);
    }
    core::Logger::Info("[ConflictDetector] Detected {} issue(s) across {} pass(es)", issues.size(), m_passes.size());
    return issues;
}

void ConflictDetector::AttachIssues(const std::vector<model::ConflictIssue>& issues,
                                    std::map<model::PrototypeKey, model::PrototypeAnalysis>& analyses) {
    for (const auto& issue : issues) {
        for (const auto& key : issue.affectedKeys) {
            if (auto it = analyses.find(key); it != analyses.end()) {
                it->second.issues.push_back(issue);
            }
        }
    }
}

std::vector<model::Dependency> FindMissingDependencies(const std::vector<model::Dependency>& dependencies,
                                                       const history::HistoryStore& store,
                                                       const std::set<std::string>& builtinNamespaces) {
    return FindMissing(dependencies, store, builtinNamespaces);
}

} // namespace mh::analysis
