#pragma once

#include "mh/history/HistoryStore.hpp"
#include "mh/model/ModelTypes.hpp"

#include <string>
#include <vector>

namespace mh::graph {

struct GraphOptions {
    std::string defaultCraftingCategory = "crafting";
};

/**
 * @brief Derives typed dependency edges from each prototype's current value.
 *
 * Recipes yield ingredient edges (plus a crafting-category edge when the
 * category is not the default), technologies yield prerequisite edges and
 * items yield a fuel-category edge. Other kinds contribute nothing. Keys
 * without edges are left out of the graph.
 */
class DependencyGraphBuilder {
public:
    DependencyGraphBuilder() = default;
    explicit DependencyGraphBuilder(GraphOptions options);

    [[nodiscard]] model::DependencyGraph Build(const history::HistoryStore& store) const;

    [[nodiscard]] std::vector<model::Dependency> ExtractDependencies(const model::PrototypeKey& key,
                                                                     const nlohmann::json& value) const;

private:
    std::vector<model::Dependency> ExtractRecipe(const model::PrototypeKey& key, const nlohmann::json& value) const;
    std::vector<model::Dependency> ExtractTechnology(const model::PrototypeKey& key, const nlohmann::json& value) const;
    std::vector<model::Dependency> ExtractItem(const model::PrototypeKey& key, const nlohmann::json& value) const;

    GraphOptions m_options;
};

/// Every edge in @p graph whose target is @p key, in source-key order.
std::vector<model::Dependency> Dependents(const model::DependencyGraph& graph, const model::PrototypeKey& key);

const std::vector<model::Dependency>& DependenciesOf(const model::DependencyGraph& graph,
                                                     const model::PrototypeKey& key);

} // namespace mh::graph
