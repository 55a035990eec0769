#pragma once

#include "mh/analysis/AvailabilityAnalyzer.hpp"
#include "mh/history/HistoryStore.hpp"
#include "mh/model/ModelTypes.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mh::analysis {

struct DetectorConfig {
    std::set<std::string> essentialRecipes;
    std::string referenceContext;
    std::set<std::string> builtinNamespaces{"recipe-category", "fuel-category", "resource-category"};
    std::string basePackage = "base";
};

/// Read-only view handed to every detection pass.
struct DetectionInputs {
    const history::HistoryStore& store;
    const model::DependencyGraph& graph;
    const AvailabilityAnalyzer& availability;
    const std::map<model::PrototypeKey, model::PrototypeAnalysis>& analyses;
    const DetectorConfig& config;
};

/**
 * @brief One independent heuristic. Passes append to the shared issue list and
 * may read what earlier passes produced, but never edit it.
 */
class DetectionPass {
public:
    virtual ~DetectionPass() = default;

    [[nodiscard]] virtual std::string_view Name() const = 0;
    /// Prefix every issue id produced by this pass starts with.
    [[nodiscard]] virtual std::string_view IssuePrefix() const = 0;
    virtual void Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const = 0;
};

class EssentialRecipePass final : public DetectionPass {
public:
    std::string_view Name() const override { return "essential-recipe"; }
    std::string_view IssuePrefix() const override { return "ESSENTIAL_RECIPE_"; }
    void Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const override;
};

class AvailabilityPass final : public DetectionPass {
public:
    std::string_view Name() const override { return "availability"; }
    std::string_view IssuePrefix() const override { return "AVAILABILITY_"; }
    void Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const override;
};

class MissingDependencyPass final : public DetectionPass {
public:
    std::string_view Name() const override { return "missing-dependency"; }
    std::string_view IssuePrefix() const override { return "MISSING_DEPENDENCY_"; }
    void Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const override;
};

/**
 * Flags technologies that cannot be researched because a prerequisite has no
 * definition at all. Technologies blocked only by a cycle or by a defined but
 * unreachable ancestor are not reported here.
 */
class BrokenPrerequisiteChainPass final : public DetectionPass {
public:
    std::string_view Name() const override { return "broken-prerequisite-chain"; }
    std::string_view IssuePrefix() const override { return "BROKEN_CHAIN_"; }
    void Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const override;
};

class RecipeConflictPass final : public DetectionPass {
public:
    static constexpr std::string_view kIssuePrefix = "RECIPE_CONFLICT_";

    std::string_view Name() const override { return "multi-package-recipe"; }
    std::string_view IssuePrefix() const override { return kIssuePrefix; }
    void Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const override;
};

class RecipeVariantPass final : public DetectionPass {
public:
    std::string_view Name() const override { return "single-package-variant"; }
    std::string_view IssuePrefix() const override { return "RECIPE_VARIANT_"; }
    void Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const override;
};

class GenericConflictPass final : public DetectionPass {
public:
    std::string_view Name() const override { return "generic"; }
    std::string_view IssuePrefix() const override { return "CONFLICT_"; }
    void Run(const DetectionInputs& inputs, std::vector<model::ConflictIssue>& issues) const override;

    static model::Severity DefaultSeverity(std::string_view kind);
};

/**
 * @brief Runs the detection passes in order and collects their issues.
 *
 * Issues are not deduplicated across passes: the same prototype can carry an
 * availability issue, a missing-dependency issue and a recipe-conflict issue at
 * once, each with its own evidence.
 */
class ConflictDetector {
public:
    explicit ConflictDetector(DetectorConfig config);

    /// Detector with the seven standard passes in their fixed order.
    static ConflictDetector CreateDefault(DetectorConfig config);

    void AddPass(std::unique_ptr<DetectionPass> pass);
    [[nodiscard]] std::vector<std::string_view> PassNames() const;
    [[nodiscard]] const DetectorConfig& Config() const noexcept { return m_config; }

    [[nodiscard]] std::vector<model::ConflictIssue> Detect(
        const history::HistoryStore& store,
        const model::DependencyGraph& graph,
        const AvailabilityAnalyzer& availability,
        const std::map<model::PrototypeKey, model::PrototypeAnalysis>& analyses) const;

    /// Copies each issue onto the analysis record of every key it affects.
    static void AttachIssues(const std::vector<model::ConflictIssue>& issues,
                             std::map<model::PrototypeKey, model::PrototypeAnalysis>& analyses);

private:
    DetectorConfig m_config;
    std::vector<std::unique_ptr<DetectionPass>> m_passes;
};

/// Final value of the "ingredients" field after @p record, if the record touched it.
std::optional<nlohmann::json> IngredientsAfter(const history::ModificationRecord& record);

/// Dependencies whose target has no history, ignoring targets in @p builtinNamespaces.
std::vector<model::Dependency> FindMissingDependencies(const std::vector<model::Dependency>& dependencies,
                                                       const history::HistoryStore& store,
                                                       const std::set<std::string>& builtinNamespaces);

} // namespace mh::analysis
