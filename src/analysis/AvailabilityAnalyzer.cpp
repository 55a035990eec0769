#include "mh/analysis/AvailabilityAnalyzer.hpp"

#include "mh/core/Logger.hpp"
#include "mh/graph/DependencyGraphBuilder.hpp"

#include <algorithm>
#include <utility>

namespace mh::analysis {

AvailabilityAnalyzer::AvailabilityAnalyzer(const history::HistoryStore& store,
                                           const model::DependencyGraph& graph,
                                           std::vector<model::AvailabilityContext> contexts,
                                           double wideAvailabilityThreshold)
    : m_store(store),
      m_graph(graph),
      m_contexts(std::move(contexts)),
      m_threshold(wideAvailabilityThreshold) {
    IndexProducers();
}

void AvailabilityAnalyzer::IndexProducers() {
    for (const auto& [key, history] : m_store.Histories()) {
        if (key.kind != "recipe") {
            continue;
        }
        const auto& current = history.CurrentValue();
        if (!current.is_object()) {
            continue;
        }
        const auto resultsIt = current.find("results");
        if (resultsIt == current.end()) {
            continue;
        }
        for (const auto& result : model::ReadIngredientList(*resultsIt)) {
            auto& producers = m_producers[result.name];
            if (std::find(producers.begin(), producers.end(), key) == producers.end()) {
                producers.push_back(key);
            }
        }
    }
}

std::vector<model::PrototypeKey> AvailabilityAnalyzer::ProducersOf(const std::string& itemName) const {
    auto it = m_producers.find(itemName);
    if (it == m_producers.end()) {
        return {};
    }
    return it->second;
}

const model::AvailabilityContext* AvailabilityAnalyzer::FindContext(const std::string& id) const {
    auto it = std::find_if(m_contexts.begin(), m_contexts.end(), [&](const model::AvailabilityContext& context) {
        return context.id == id;
    });
    return it == m_contexts.end() ? nullptr : &*it;
}

bool AvailabilityAnalyzer::IsItemAvailable(const std::string& itemName,
                                           const model::AvailabilityContext& context) const {
    Walk walk;
    bool cutCycle = false;
    return ItemAvailable(itemName, context, walk, cutCycle);
}

bool AvailabilityAnalyzer::IsRecipeAvailable(const model::PrototypeKey& recipeKey,
                                             const model::AvailabilityContext& context) const {
    Walk walk;
    bool cutCycle = false;
    return RecipeAvailable(recipeKey, context, walk, cutCycle);
}

bool AvailabilityAnalyzer::ItemAvailable(const std::string& itemName,
                                         const model::AvailabilityContext& context,
                                         Walk& walk,
                                         bool& cutCycle) const {
    if (context.availableResources.count(itemName) > 0) {
        return true;
    }

    NodeKey node{"item", itemName, context.id};
    if (auto settled = walk.settled.find(node); settled != walk.settled.end()) {
        return settled->second;
    }
    if (walk.onPath.count(node) > 0) {
        core::Logger::Debug("[Availability] Cycle through item '{}' in context '{}'", itemName, context.id);
        cutCycle = true;
        return false;
    }

    walk.onPath.insert(node);
    bool subtreeCut = false;
    bool available = false;
    auto producers = m_producers.find(itemName);
    if (producers != m_producers.end() && !producers->second.empty()) {
        available = RecipeAvailable(producers->second.front(), context, walk, subtreeCut);
    }
    walk.onPath.erase(node);

    // Results computed without cutting a cycle do not depend on the path taken.
    if (!subtreeCut) {
        walk.settled.emplace(node, available);
    }
    cutCycle = cutCycle || subtreeCut;
    return available;
}

bool AvailabilityAnalyzer::RecipeAvailable(const model::PrototypeKey& recipeKey,
                                           const model::AvailabilityContext& context,
                                           Walk& walk,
                                           bool& cutCycle) const {
    NodeKey node{recipeKey.kind, recipeKey.name, context.id};
    if (auto settled = walk.settled.find(node); settled != walk.settled.end()) {
        return settled->second;
    }
    if (walk.onPath.count(node) > 0) {
        cutCycle = true;
        return false;
    }

    walk.onPath.insert(node);
    bool subtreeCut = false;
    bool available = true;
    for (const auto& dependency : graph::DependenciesOf(m_graph, recipeKey)) {
        if (dependency.kind != model::DependencyKind::Ingredient) {
            continue;
        }
        if (!ItemAvailable(dependency.target.name, context, walk, subtreeCut)) {
            available = false;
            break;
        }
    }
    walk.onPath.erase(node);

    if (!subtreeCut) {
        walk.settled.emplace(node, available);
    }
    cutCycle = cutCycle || subtreeCut;
    return available;
}

AvailabilityVerdict AvailabilityAnalyzer::Analyze(const model::PrototypeKey& key,
                                                  const std::vector<model::Dependency>& dependencies) const {
    AvailabilityVerdict verdict;
    for (const auto& context : m_contexts) {
        Walk walk;
        bool available = true;
        for (const auto& dependency : dependencies) {
            if (dependency.kind != model::DependencyKind::Ingredient) {
                continue;
            }
            bool cutCycle = false;
            if (!ItemAvailable(dependency.target.name, context, walk, cutCycle)) {
                available = false;
                break;
            }
        }
        if (available) {
            verdict.available.push_back(context.id);
        } else {
            verdict.unavailable.push_back(context.id);
        }
    }
    if (!verdict.unavailable.empty()) {
        core::Logger::Debug("[Availability] {} unavailable in {} context(s)", key.ToString(), verdict.unavailable.size());
    }
    return verdict;
}

bool AvailabilityAnalyzer::IsWidelyAvailable(const std::string& itemName) const {
    std::size_t availableCount = 0;
    for (const auto& context : m_contexts) {
        if (IsItemAvailable(itemName, context)) {
            ++availableCount;
        }
    }
    return static_cast<double>(availableCount) >= static_cast<double>(m_contexts.size()) * m_threshold;
}

std::vector<model::AvailabilityContext> AvailabilityAnalyzer::DeriveContexts(const history::HistoryStore& store,
                                                                             const std::set<std::string>& contextKinds) {
    std::vector<model::AvailabilityContext> contexts;
    for (const auto& [key, history] : store.Histories()) {
        if (contextKinds.count(key.kind) == 0) {
            continue;
        }
        const auto& current = history.CurrentValue();
        if (!current.is_object()) {
            core::Logger::Warning("[Availability] Skipping context source {}: not a structured prototype",
                                  key.ToString());
            continue;
        }

        model::AvailabilityContext context;
        context.id = key.name;
        if (auto it = current.find("resources"); it != current.end() && it->is_array()) {
            for (const auto& resource : *it) {
                if (resource.is_string()) {
                    context.availableResources.insert(resource.get<std::string>());
                }
            }
        }
        const auto pointer = nlohmann::json::json_pointer("/map_gen_settings/autoplace_settings/entity/settings");
        if (current.contains(pointer) && current.at(pointer).is_object()) {
            for (const auto& [resource, _] : current.at(pointer).items()) {
                context.availableResources.insert(resource);
            }
        }
        contexts.push_back(std::move(context));
    }
    return contexts;
}

} // namespace mh::analysis
