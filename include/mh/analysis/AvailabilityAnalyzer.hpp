#pragma once

#include "mh/history/HistoryStore.hpp"
#include "mh/model/ModelTypes.hpp"

#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace mh::analysis {

constexpr double kDefaultWideAvailabilityThreshold = 0.75;

struct AvailabilityVerdict {
    std::vector<std::string> available;
    std::vector<std::string> unavailable;
};

/**
 * @brief Answers whether items and recipes can be produced within a context.
 *
 * An item is available when it is a base resource of the context, or when the
 * first recipe (in key order) that lists it as a result is itself available.
 * A recipe is available when all of its ingredient targets are. Each query
 * tracks the (kind, name, context) nodes on its current path and treats a
 * revisit as unavailable, so cyclic ingredient chains terminate.
 */
class AvailabilityAnalyzer {
public:
    AvailabilityAnalyzer(const history::HistoryStore& store,
                         const model::DependencyGraph& graph,
                         std::vector<model::AvailabilityContext> contexts,
                         double wideAvailabilityThreshold = kDefaultWideAvailabilityThreshold);

    [[nodiscard]] bool IsItemAvailable(const std::string& itemName, const model::AvailabilityContext& context) const;
    [[nodiscard]] bool IsRecipeAvailable(const model::PrototypeKey& recipeKey,
                                         const model::AvailabilityContext& context) const;

    /// Splits the configured contexts by whether every ingredient dependency is available there.
    [[nodiscard]] AvailabilityVerdict Analyze(const model::PrototypeKey& key,
                                              const std::vector<model::Dependency>& dependencies) const;

    /// True when the item is available in at least the threshold fraction of contexts.
    [[nodiscard]] bool IsWidelyAvailable(const std::string& itemName) const;

    [[nodiscard]] const std::vector<model::AvailabilityContext>& Contexts() const noexcept { return m_contexts; }
    [[nodiscard]] const model::AvailabilityContext* FindContext(const std::string& id) const;
    [[nodiscard]] double WideAvailabilityThreshold() const noexcept { return m_threshold; }

    /// Recipes whose results name @p itemName, in key order.
    [[nodiscard]] std::vector<model::PrototypeKey> ProducersOf(const std::string& itemName) const;

    /**
     * @brief Builds contexts from tracked prototypes of the given kinds (e.g. "planet").
     *
     * Resources come from the prototype's "resources" list and the keys of
     * map_gen_settings.autoplace_settings.entity.settings.
     */
    static std::vector<model::AvailabilityContext> DeriveContexts(const history::HistoryStore& store,
                                                                  const std::set<std::string>& contextKinds);

private:
    using NodeKey = std::tuple<std::string, std::string, std::string>;

    struct Walk {
        std::set<NodeKey> onPath;
        std::map<NodeKey, bool> settled;
    };

    bool ItemAvailable(const std::string& itemName, const model::AvailabilityContext& context,
                       Walk& walk, bool& cutCycle) const;
    bool RecipeAvailable(const model::PrototypeKey& recipeKey, const model::AvailabilityContext& context,
                         Walk& walk, bool& cutCycle) const;

    void IndexProducers();

    const history::HistoryStore& m_store;
    const model::DependencyGraph& m_graph;
    std::vector<model::AvailabilityContext> m_contexts;
    double m_threshold = kDefaultWideAvailabilityThreshold;
    std::map<std::string, std::vector<model::PrototypeKey>> m_producers;
};

} // namespace mh::analysis
