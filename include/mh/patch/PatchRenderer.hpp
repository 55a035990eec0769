#pragma once

#include "mh/model/ModelTypes.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mh::patch {

/**
 * @brief Turns a structured patch description into script text for one dialect.
 *
 * Renderers only read PatchSuggestion::structuredOverrides and the identifying
 * fields; they never consult the history or the issues.
 */
class PatchRenderer {
public:
    virtual ~PatchRenderer() = default;

    [[nodiscard]] virtual std::string_view Dialect() const = 0;
    [[nodiscard]] virtual std::string Render(const model::PatchSuggestion& patch) const = 0;

    /// Full file body for patches sharing one target file.
    [[nodiscard]] virtual std::string RenderFile(const std::vector<model::PatchSuggestion>& patches) const = 0;
};

} // namespace mh::patch
