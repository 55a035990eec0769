#pragma once

#include "mh/patch/PatchRenderer.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace mh::patch {

/**
 * Emits data-stage Lua. Every variant is a deep copy of the resolved prototype
 * with the reconstructed fields overridden, appended through data:extend.
 * Existing definitions are never modified or removed.
 */
class LuaPatchRenderer final : public PatchRenderer {
public:
    std::string_view Dialect() const override { return "lua"; }
    std::string Render(const model::PatchSuggestion& patch) const override;
    std::string RenderFile(const std::vector<model::PatchSuggestion>& patches) const override;
};

/// Lua table constructor syntax for a JSON value. Null renders as nil.
std::string ToLuaLiteral(const nlohmann::json& value);

/// Quoted, escaped Lua string literal.
std::string QuoteLua(std::string_view text);

} // namespace mh::patch
