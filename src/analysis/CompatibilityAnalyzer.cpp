#include "mh/analysis/CompatibilityAnalyzer.hpp"

#include "mh/core/Logger.hpp"

#include <chrono>
#include <utility>

namespace mh::analysis {

CompatibilityAnalyzer::CompatibilityAnalyzer(AnalysisOptions options)
    : m_options(std::move(options)) {}

std::map<model::PrototypeKey, model::PrototypeAnalysis> CompatibilityAnalyzer::BuildAnalyses(
    const history::HistoryStore& store,
    const model::DependencyGraph& graph,
    const AvailabilityAnalyzer& availability) const {
    std::map<model::PrototypeKey, model::PrototypeAnalysis> analyses;
    for (const auto& [key, history] : store.Histories()) {
        model::PrototypeAnalysis analysis;
        analysis.key = key;
        analysis.modificationCount = history.Modifications().size();
        analysis.packages = history.Packages();
        analysis.conflicted = analysis.packages.size() > 1;
        analysis.dependencies = graph::DependenciesOf(graph, key);
        analysis.dependents = graph::Dependents(graph, key);
        analysis.missingDependencies =
            FindMissingDependencies(analysis.dependencies, store, m_options.detector.builtinNamespaces);

        auto verdict = availability.Analyze(key, analysis.dependencies);
        analysis.availableContexts = std::move(verdict.available);
        analysis.unavailableContexts = std::move(verdict.unavailable);

        analyses.emplace(key, std::move(analysis));
    }
    return analyses;
}

model::CompatibilityReport CompatibilityAnalyzer::Analyze(const history::HistoryStore& store) const {
    core::Logger::Info("[Analyzer] Analyzing {} prototype(s)", store.Histories().size());

    model::CompatibilityReport report;
    report.analysisTimestamp = history::FormatTimestamp(std::chrono::system_clock::now());
    report.analyzedPackages = store.Packages();

    graph::DependencyGraphBuilder builder(m_options.graph);
    report.dependencyGraph = builder.Build(store);

    auto contexts = m_options.contexts;
    if (contexts.empty()) {
        contexts = AvailabilityAnalyzer::DeriveContexts(store, m_options.contextKinds);
        core::Logger::Debug("[Analyzer] Derived {} context(s) from tracked prototypes", contexts.size());
    }
    const AvailabilityAnalyzer availability(store, report.dependencyGraph, std::move(contexts),
                                            m_options.wideAvailabilityThreshold);

    report.analyses = BuildAnalyses(store, report.dependencyGraph, availability);

    const auto detector = ConflictDetector::CreateDefault(m_options.detector);
    report.issues = detector.Detect(store, report.dependencyGraph, availability, report.analyses);
    ConflictDetector::AttachIssues(report.issues, report.analyses);
    report.summary = model::Summarize(report.analyses, report.issues);

    core::Logger::Info("[Analyzer] {} issue(s) for {} package(s)", report.issues.size(), report.analyzedPackages.size());
    return report;
}

std::vector<model::PatchSuggestion> CompatibilityAnalyzer::GeneratePatches(const model::CompatibilityReport& report,
                                                                           const history::HistoryStore& store) const {
    const patch::PatchGenerator generator(m_options.patches);
    return generator.Generate(report.issues, store);
}

model::CompatibilityReport CompatibilityAnalyzer::Run(const history::HistoryStore& store) const {
    auto report = Analyze(store);
    report.patches = GeneratePatches(report, store);
    return report;
}

} // namespace mh::analysis
