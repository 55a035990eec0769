#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace mh::ingest {

/**
 * @brief Folds the raw shapes extractors produce into the form the analysis expects.
 *
 * - ingredient/result entries: `["iron-plate", 2]` and `"iron-plate"` become
 *   `{type = "item", name, amount}`; objects missing type or amount get defaults
 * - legacy `result` (+ `result_count`) becomes a one-element `results` list
 * - a single-string `prerequisites` becomes a one-element list
 */
class PrototypeNormalizer {
public:
    [[nodiscard]] static nlohmann::json Normalize(const nlohmann::json& prototype);

    /// Same rules for the value of a targeted edit ("ingredients", "results[1]", "prerequisites").
    [[nodiscard]] static nlohmann::json NormalizeFieldValue(std::string_view fieldPath, const nlohmann::json& value);

    [[nodiscard]] static nlohmann::json NormalizeIngredientList(const nlohmann::json& value);

    /// Null when the entry carries no usable name.
    [[nodiscard]] static nlohmann::json NormalizeIngredient(const nlohmann::json& entry);
};

} // namespace mh::ingest
