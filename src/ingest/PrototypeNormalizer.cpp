#include "mh/ingest/PrototypeNormalizer.hpp"

#include "mh/core/Logger.hpp"

#include <string>

namespace mh::ingest {

namespace {

constexpr const char* kDefaultType = "item";

bool IsListField(std::string_view field) {
    return field == "ingredients" || field == "results";
}

} // namespace

nlohmann::json PrototypeNormalizer::NormalizeIngredient(const nlohmann::json& entry) {
    if (entry.is_string()) {
        return nlohmann::json{{"type", kDefaultType}, {"name", entry.get<std::string>()}, {"amount", 1}};
    }

    if (entry.is_array()) {
        if (entry.empty() || !entry[0].is_string()) {
            return nullptr;
        }
        nlohmann::json normalized{{"type", kDefaultType}, {"name", entry[0].get<std::string>()}, {"amount", 1}};
        if (entry.size() > 1 && entry[1].is_number()) {
            normalized["amount"] = entry[1];
        }
        return normalized;
    }

    if (entry.is_object()) {
        auto nameIt = entry.find("name");
        if (nameIt == entry.end() || !nameIt->is_string()) {
            return nullptr;
        }
        nlohmann::json normalized = entry;
        if (!normalized.contains("type") || !normalized["type"].is_string()) {
            normalized["type"] = kDefaultType;
        }
        if (!normalized.contains("amount") && !normalized.contains("amount_min")) {
            normalized["amount"] = 1;
        }
        return normalized;
    }

    return nullptr;
}

nlohmann::json PrototypeNormalizer::NormalizeIngredientList(const nlohmann::json& value) {
    if (!value.is_array()) {
        return value;
    }
    nlohmann::json list = nlohmann::json::array();
    for (const auto& entry : value) {
        auto normalized = NormalizeIngredient(entry);
        if (normalized.is_null()) {
            core::Logger::Debug("[PrototypeNormalizer] Dropping unusable entry {}", entry.dump());
            continue;
        }
        list.push_back(std::move(normalized));
    }
    return list;
}

nlohmann::json PrototypeNormalizer::Normalize(const nlohmann::json& prototype) {
    if (!prototype.is_object()) {
        return prototype;
    }
    nlohmann::json normalized = prototype;

    for (const char* field : {"ingredients", "results"}) {
        if (auto it = normalized.find(field); it != normalized.end()) {
            *it = NormalizeIngredientList(*it);
        }
    }

    if (auto resultIt = normalized.find("result"); resultIt != normalized.end() && resultIt->is_string()) {
        if (!normalized.contains("results")) {
            nlohmann::json single{{"type", kDefaultType}, {"name", resultIt->get<std::string>()}, {"amount", 1}};
            if (auto countIt = normalized.find("result_count"); countIt != normalized.end() && countIt->is_number()) {
                single["amount"] = *countIt;
            }
            normalized["results"] = nlohmann::json::array({single});
        }
        normalized.erase("result");
        normalized.erase("result_count");
    }

    if (auto it = normalized.find("prerequisites"); it != normalized.end() && it->is_string()) {
        *it = nlohmann::json::array({it->get<std::string>()});
    }
    return normalized;
}

nlohmann::json PrototypeNormalizer::NormalizeFieldValue(std::string_view fieldPath, const nlohmann::json& value) {
    if (IsListField(fieldPath)) {
        return NormalizeIngredientList(value);
    }
    if (fieldPath == "prerequisites" && value.is_string()) {
        return nlohmann::json::array({value.get<std::string>()});
    }

    const auto bracket = fieldPath.find('[');
    if (bracket != std::string_view::npos && IsListField(fieldPath.substr(0, bracket)) && fieldPath.back() == ']') {
        auto normalized = NormalizeIngredient(value);
        return normalized.is_null() ? value : normalized;
    }
    return value;
}

} // namespace mh::ingest
