#pragma once

#include "mh/analysis/AvailabilityAnalyzer.hpp"
#include "mh/analysis/ConflictDetector.hpp"
#include "mh/graph/DependencyGraphBuilder.hpp"
#include "mh/history/HistoryStore.hpp"
#include "mh/model/ModelTypes.hpp"
#include "mh/patch/PatchGenerator.hpp"

#include <set>
#include <string>
#include <vector>

namespace mh::analysis {

struct AnalysisOptions {
    graph::GraphOptions graph;
    DetectorConfig detector;
    patch::PatchOptions patches;
    /// Explicit contexts. When empty, contexts are derived from tracked prototypes of contextKinds.
    std::vector<model::AvailabilityContext> contexts;
    std::set<std::string> contextKinds{"planet"};
    double wideAvailabilityThreshold = kDefaultWideAvailabilityThreshold;
};

/**
 * @brief End-to-end pipeline: graph, availability, detection, patches.
 *
 * The store is only read; running twice over the same store yields the same
 * report apart from the timestamp.
 */
class CompatibilityAnalyzer {
public:
    explicit CompatibilityAnalyzer(AnalysisOptions options = {});

    /// Graph, availability and detection. Patches are left empty.
    [[nodiscard]] model::CompatibilityReport Analyze(const history::HistoryStore& store) const;

    /// Patch suggestions for an analyzed report. Deterministic for the same report.
    [[nodiscard]] std::vector<model::PatchSuggestion> GeneratePatches(const model::CompatibilityReport& report,
                                                                      const history::HistoryStore& store) const;

    /// Analyze() followed by GeneratePatches().
    [[nodiscard]] model::CompatibilityReport Run(const history::HistoryStore& store) const;

    [[nodiscard]] const AnalysisOptions& Options() const noexcept { return m_options; }

private:
    std::map<model::PrototypeKey, model::PrototypeAnalysis> BuildAnalyses(
        const history::HistoryStore& store,
        const model::DependencyGraph& graph,
        const AvailabilityAnalyzer& availability) const;

    AnalysisOptions m_options;
};

} // namespace mh::analysis
