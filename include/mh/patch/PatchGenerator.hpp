#pragma once

#include "mh/history/HistoryStore.hpp"
#include "mh/model/ModelTypes.hpp"
#include "mh/patch/PatchRenderer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mh::patch {

inline constexpr std::string_view kDefaultTargetPackage = "mod-harmonizer-patch";
inline constexpr std::string_view kDefaultTargetFile = "data-final-fixes.lua";

struct PatchOptions {
    std::string targetPackage{kDefaultTargetPackage};
    std::string targetFile{kDefaultTargetFile};
};

/// One package's reconstructed view of a prototype.
struct PackageSnapshot {
    std::string package;
    nlohmann::json fields = nlohmann::json::object();
};

/**
 * @brief Synthesizes additive remediation patches from detected issues.
 *
 * Issues are bucketed by the kind of their first affected key (recipe,
 * technology, other), each bucket stable-sorted by descending severity, and
 * processed in that order. At most one patch is produced per prototype key.
 * A patch that would carry no reconstructed data is not produced at all.
 */
class PatchGenerator {
public:
    explicit PatchGenerator(PatchOptions options = {}, std::shared_ptr<const PatchRenderer> renderer = nullptr);

    [[nodiscard]] std::vector<model::PatchSuggestion> Generate(const std::vector<model::ConflictIssue>& issues,
                                                               const history::HistoryStore& store) const;

    [[nodiscard]] std::optional<model::PatchSuggestion> GenerateRecipePatch(const model::ConflictIssue& issue,
                                                                            const history::PrototypeHistory& history) const;
    [[nodiscard]] std::optional<model::PatchSuggestion> GenerateTechnologyPatch(const model::ConflictIssue& issue,
                                                                                const history::PrototypeHistory& history) const;
    [[nodiscard]] std::optional<model::PatchSuggestion> GenerateGenericPatch(const model::ConflictIssue& issue,
                                                                             const history::PrototypeHistory& history) const;

    [[nodiscard]] const PatchOptions& Options() const noexcept { return m_options; }
    [[nodiscard]] const PatchRenderer& Renderer() const noexcept { return *m_renderer; }

    /**
     * @brief Replays @p package's records for one prototype and keeps the listed fields.
     *
     * Whole-object records set every listed field they carry; field records
     * replace a listed field or, for dotted/indexed paths such as
     * "ingredients[1].amount", edit inside it.
     */
    static PackageSnapshot Reconstruct(const history::PrototypeHistory& history,
                                       const std::string& package,
                                       const std::vector<std::string>& fields);

private:
    model::PatchSuggestion MakeSuggestion(const model::ConflictIssue& issue,
                                          const model::PrototypeKey& key,
                                          model::PatchKind kind) const;
    std::vector<std::string> PackagesFor(const model::ConflictIssue& issue,
                                         const history::PrototypeHistory& history) const;

    PatchOptions m_options;
    std::shared_ptr<const PatchRenderer> m_renderer;
};

/// Lower-case, dash-separated fragment usable in a prototype name.
std::string PackageSlug(std::string_view package);

/// "ingredients[1].amount" -> "/ingredients/1/amount".
nlohmann::json::json_pointer FieldPathToPointer(std::string_view fieldPath);

} // namespace mh::patch
