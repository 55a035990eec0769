#include "mh/graph/DependencyGraphBuilder.hpp"

#include "mh/core/Logger.hpp"

#include <utility>

namespace mh::graph {

DependencyGraphBuilder::DependencyGraphBuilder(GraphOptions options)
    : m_options(std::move(options)) {}

model::DependencyGraph DependencyGraphBuilder::Build(const history::HistoryStore& store) const {
    model::DependencyGraph graph;
    for (const auto& [key, history] : store.Histories()) {
        const auto& current = history.CurrentValue();
        if (!current.is_object()) {
            core::Logger::Debug("[DependencyGraph] Skipping {}: invalid data type {}", key.ToString(), current.type_name());
            continue;
        }

        auto dependencies = ExtractDependencies(key, current);
        if (!dependencies.empty()) {
            core::Logger::Debug("[DependencyGraph] Found {} dependencies for {}", dependencies.size(), key.ToString());
            graph.emplace(key, std::move(dependencies));
        }
    }
    return graph;
}

std::vector<model::Dependency> DependencyGraphBuilder::ExtractDependencies(const model::PrototypeKey& key,
                                                                           const nlohmann::json& value) const {
    if (!value.is_object()) {
        return {};
    }
    if (key.kind == "recipe") {
        return ExtractRecipe(key, value);
    }
    if (key.kind == "technology") {
        return ExtractTechnology(key, value);
    }
    if (key.kind == "item") {
        return ExtractItem(key, value);
    }
    return {};
}

std::vector<model::Dependency> DependencyGraphBuilder::ExtractRecipe(const model::PrototypeKey& key,
                                                                     const nlohmann::json& value) const {
    std::vector<model::Dependency> dependencies;
    if (auto it = value.find("ingredients"); it != value.end()) {
        for (const auto& ingredient : model::ReadIngredientList(*it)) {
            model::Dependency dependency;
            dependency.source = key;
            dependency.target = model::PrototypeKey(ingredient.type, ingredient.name);
            dependency.kind = model::DependencyKind::Ingredient;
            dependency.amount = ingredient.amount;
            dependencies.push_back(std::move(dependency));
        }
    }

    const auto categoryIt = value.find("category");
    if (categoryIt != value.end() && categoryIt->is_string()) {
        const auto category = categoryIt->get<std::string>();
        if (category != m_options.defaultCraftingCategory) {
            model::Dependency dependency;
            dependency.source = key;
            dependency.target = model::PrototypeKey("recipe-category", category);
            dependency.kind = model::DependencyKind::CraftingCategory;
            dependencies.push_back(std::move(dependency));
        }
    }
    return dependencies;
}

std::vector<model::Dependency> DependencyGraphBuilder::ExtractTechnology(const model::PrototypeKey& key,
                                                                         const nlohmann::json& value) const {
    std::vector<model::Dependency> dependencies;
    const auto it = value.find("prerequisites");
    if (it == value.end() || !it->is_array()) {
        return dependencies;
    }
    for (const auto& prerequisite : *it) {
        if (!prerequisite.is_string()) {
            continue;
        }
        model::Dependency dependency;
        dependency.source = key;
        dependency.target = model::PrototypeKey("technology", prerequisite.get<std::string>());
        dependency.kind = model::DependencyKind::TechPrerequisite;
        dependencies.push_back(std::move(dependency));
    }
    return dependencies;
}

std::vector<model::Dependency> DependencyGraphBuilder::ExtractItem(const model::PrototypeKey& key,
                                                                   const nlohmann::json& value) const {
    std::vector<model::Dependency> dependencies;
    const auto it = value.find("fuel_category");
    if (it != value.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
        model::Dependency dependency;
        dependency.source = key;
        dependency.target = model::PrototypeKey("fuel-category", it->get<std::string>());
        dependency.kind = model::DependencyKind::FuelCategory;
        dependencies.push_back(std::move(dependency));
    }
    return dependencies;
}

std::vector<model::Dependency> Dependents(const model::DependencyGraph& graph, const model::PrototypeKey& key) {
    std::vector<model::Dependency> dependents;
    for (const auto& [_, dependencies] : graph) {
        for (const auto& dependency : dependencies) {
            if (dependency.target == key) {
                dependents.push_back(dependency);
            }
        }
    }
    return dependents;
}

const std::vector<model::Dependency>& DependenciesOf(const model::DependencyGraph& graph,
                                                     const model::PrototypeKey& key) {
    static const std::vector<model::Dependency> kEmpty;
    auto it = graph.find(key);
    return it == graph.end() ? kEmpty : it->second;
}

} // namespace mh::graph
