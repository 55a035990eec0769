#include "mh/patch/LuaPatchRenderer.hpp"

#include <cctype>
#include <cstdint>
#include <iterator>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace mh::patch {

namespace {

constexpr std::string_view kIndent = "    ";

bool IsLuaIdentifier(std::string_view text) {
    static constexpr std::string_view kKeywords[] = {
        "and", "break", "do", "else", "elseif", "end", "false", "for", "function", "goto", "if",
        "in", "local", "nil", "not", "or", "repeat", "return", "then", "true", "until", "while"
    };
    if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front()))) {
        return false;
    }
    for (char c : text) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    for (auto keyword : kKeywords) {
        if (text == keyword) {
            return false;
        }
    }
    return true;
}

std::string FieldAccess(std::string_view table, std::string_view field) {
    if (IsLuaIdentifier(field)) {
        return fmt::format("{}.{}", table, field);
    }
    return fmt::format("{}[{}]", table, QuoteLua(field));
}

std::string RawLookup(std::string_view kind, std::string_view name) {
    return fmt::format("data.raw[{}][{}]", QuoteLua(kind), QuoteLua(name));
}

std::string PresenceCheck(const nlohmann::json& technologies) {
    std::vector<std::string> checks;
    for (const auto& technology : technologies) {
        if (technology.is_string()) {
            checks.push_back(RawLookup("technology", technology.get<std::string>()));
        }
    }
    return fmt::format("{}", fmt::join(checks, " and "));
}

void RenderVariant(fmt::memory_buffer& out, const nlohmann::json& variant, std::string_view indent) {
    const std::string name = variant.value("name", std::string());
    const std::string package = variant.value("package", std::string());
    const std::string tier = variant.value("tier", std::string());

    if (!package.empty()) {
        fmt::format_to(std::back_inserter(out), "{}-- {} version from {}\n", indent, name, package);
    } else if (!tier.empty()) {
        fmt::format_to(std::back_inserter(out), "{}-- {} ({})\n", indent, name, tier);
    }

    std::string body(indent);
    const auto gates = variant.find("requires");
    const bool gated = gates != variant.end() && gates->is_array() && !gates->empty();
    if (gated) {
        fmt::format_to(std::back_inserter(out), "{}if {} then\n", indent, PresenceCheck(*gates));
        body += kIndent;
    } else {
        fmt::format_to(std::back_inserter(out), "{}do\n", indent);
        body += kIndent;
    }

    fmt::format_to(std::back_inserter(out), "{}local variant = table.deepcopy(original)\n", body);
    fmt::format_to(std::back_inserter(out), "{}variant.name = {}\n", body, QuoteLua(name));
    if (auto fields = variant.find("fields"); fields != variant.end() && fields->is_object()) {
        for (const auto& [field, value] : fields->items()) {
            fmt::format_to(std::back_inserter(out), "{}{} = {}\n", body, FieldAccess("variant", field), ToLuaLiteral(value));
        }
    }
    if (auto multiplier = variant.find("cost_multiplier"); multiplier != variant.end() && multiplier->is_number()) {
        fmt::format_to(std::back_inserter(out), "{}if variant.unit and variant.unit.count then\n", body);
        fmt::format_to(std::back_inserter(out), "{}{}variant.unit.count = math.ceil(variant.unit.count * {})\n",
                       body, kIndent, ToLuaLiteral(*multiplier));
        fmt::format_to(std::back_inserter(out), "{}end\n", body);
    }
    fmt::format_to(std::back_inserter(out), "{}data:extend({{variant}})\n", body);
    fmt::format_to(std::back_inserter(out), "{}end\n", indent);
}

} // namespace

std::string QuoteLua(std::string_view text) {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted.push_back('"');
    for (char c : text) {
        switch (c) {
            case '"':  quoted += "\\\""; break;
            case '\\': quoted += "\\\\"; break;
            case '\n': quoted += "\\n"; break;
            case '\r': quoted += "\\r"; break;
            case '\t': quoted += "\\t"; break;
            default:   quoted.push_back(c); break;
        }
    }
    quoted.push_back('"');
    return quoted;
}

std::string ToLuaLiteral(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return "nil";
        case nlohmann::json::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        case nlohmann::json::value_t::number_integer:
            return fmt::format("{}", value.get<std::int64_t>());
        case nlohmann::json::value_t::number_unsigned:
            return fmt::format("{}", value.get<std::uint64_t>());
        case nlohmann::json::value_t::number_float:
            return fmt::format("{}", value.get<double>());
        case nlohmann::json::value_t::string:
            return QuoteLua(value.get_ref<const std::string&>());
        case nlohmann::json::value_t::array: {
            std::vector<std::string> elements;
            elements.reserve(value.size());
            for (const auto& element : value) {
                elements.push_back(ToLuaLiteral(element));
            }
            return fmt::format("{{{}}}", fmt::join(elements, ", "));
        }
        case nlohmann::json::value_t::object: {
            std::vector<std::string> entries;
            entries.reserve(value.size());
            for (const auto& [key, element] : value.items()) {
                if (IsLuaIdentifier(key)) {
                    entries.push_back(fmt::format("{} = {}", key, ToLuaLiteral(element)));
                } else {
                    entries.push_back(fmt::format("[{}] = {}", QuoteLua(key), ToLuaLiteral(element)));
                }
            }
            return fmt::format("{{{}}}", fmt::join(entries, ", "));
        }
        case nlohmann::json::value_t::binary:
            break;
    }
    return "nil";
}

std::string LuaPatchRenderer::Render(const model::PatchSuggestion& patch) const {
    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "-- {}: {}\n", patch.patchId, patch.description);
    if (!patch.fixes.empty()) {
        fmt::format_to(std::back_inserter(out), "-- Fixes: {}\n", fmt::join(patch.fixes, ", "));
    }

    const auto& kind = patch.target.kind;
    const auto& name = patch.target.name;
    fmt::format_to(std::back_inserter(out), "if data.raw[{}] and {} then\n", QuoteLua(kind), RawLookup(kind, name));
    fmt::format_to(std::back_inserter(out), "{}local original = {}\n", kIndent, RawLookup(kind, name));

    if (auto variants = patch.structuredOverrides.find("variants");
        variants != patch.structuredOverrides.end() && variants->is_array()) {
        for (const auto& variant : *variants) {
            RenderVariant(out, variant, kIndent);
        }
    }
    fmt::format_to(std::back_inserter(out), "end\n");
    return fmt::to_string(out);
}

std::string LuaPatchRenderer::RenderFile(const std::vector<model::PatchSuggestion>& patches) const {
    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "-- Generated by mod-harmonizer\n");
    fmt::format_to(std::back_inserter(out), "-- {} compatibility patch(es)\n", patches.size());
    for (const auto& patch : patches) {
        fmt::format_to(std::back_inserter(out), "--   {} fixes {}\n", patch.patchId, fmt::join(patch.fixes, ", "));
    }
    for (const auto& patch : patches) {
        fmt::format_to(std::back_inserter(out), "\n{}", patch.generatedArtifact.empty() ? Render(patch)
                                                                                         : patch.generatedArtifact);
    }
    return fmt::to_string(out);
}

} // namespace mh::patch
