#include "mh/ingest/PackageFeed.hpp"

#include "mh/core/Logger.hpp"
#include "mh/ingest/PrototypeNormalizer.hpp"

#include <fstream>

namespace mh::ingest {
namespace {

bool RequireString(const nlohmann::json& json, const char* key, std::string& out,
                   std::vector<std::string>& errors, const std::string& context) {
    if (!json.contains(key)) {
        errors.push_back(context + ": missing required key '" + std::string(key) + "'");
        return false;
    }
    if (!json[key].is_string()) {
        errors.push_back(context + ": expected key '" + std::string(key) + "' to be a string");
        return false;
    }
    out = json[key].get<std::string>();
    return true;
}

bool ParseEntry(const nlohmann::json& entryJson, PackageFeed::Entry& entry,
                std::vector<std::string>& warnings, const std::string& context) {
    if (!entryJson.is_object()) {
        warnings.push_back(context + ": entry must be an object, skipped");
        return false;
    }
    std::string op;
    if (!RequireString(entryJson, "op", op, warnings, context)) {
        return false;
    }
    if (entryJson.contains("location") && entryJson["location"].is_string()) {
        entry.location = entryJson["location"].get<std::string>();
    }

    if (op == "extend") {
        entry.op = PackageFeed::Entry::Op::Extend;
        if (!entryJson.contains("prototypes") || !entryJson["prototypes"].is_array()) {
            warnings.push_back(context + ": extend entry needs a 'prototypes' array, skipped");
            return false;
        }
        entry.prototypes = entryJson["prototypes"];
        return true;
    }

    if (op == "modify") {
        entry.op = PackageFeed::Entry::Op::Modify;
        bool ok = RequireString(entryJson, "kind", entry.kind, warnings, context);
        ok = RequireString(entryJson, "name", entry.name, warnings, context) && ok;
        ok = RequireString(entryJson, "field", entry.field, warnings, context) && ok;
        if (!ok) {
            return false;
        }
        entry.oldValue = entryJson.contains("old") ? entryJson["old"] : nlohmann::json();
        entry.newValue = entryJson.contains("new") ? entryJson["new"] : nlohmann::json();
        return true;
    }

    warnings.push_back(context + ": unknown op '" + op + "', skipped");
    return false;
}

} // namespace

PackageFeedLoadResult ParsePackageFeed(const nlohmann::json& json) {
    PackageFeedLoadResult result;
    if (!json.is_object() || !json.contains("packages") || !json["packages"].is_array()) {
        result.errors.push_back("Package feed must be an object with a 'packages' array");
        return result;
    }

    std::size_t packageIndex = 0;
    for (const auto& packageJson : json["packages"]) {
        const std::string packageContext = "Package #" + std::to_string(packageIndex++);
        if (!packageJson.is_object()) {
            result.warnings.push_back(packageContext + ": must be an object, skipped");
            continue;
        }

        PackageFeed::Package package;
        if (!RequireString(packageJson, "name", package.name, result.warnings, packageContext)) {
            continue;
        }
        if (packageJson.contains("location") && packageJson["location"].is_string()) {
            package.location = packageJson["location"].get<std::string>();
        }

        if (packageJson.contains("entries")) {
            if (!packageJson["entries"].is_array()) {
                result.warnings.push_back("Package '" + package.name + "': 'entries' must be an array");
            } else {
                std::size_t entryIndex = 0;
                for (const auto& entryJson : packageJson["entries"]) {
                    const std::string context = "Package '" + package.name + "' entry #" + std::to_string(entryIndex++);
                    PackageFeed::Entry entry;
                    if (ParseEntry(entryJson, entry, result.warnings, context)) {
                        package.entries.push_back(std::move(entry));
                    }
                }
            }
        }
        result.feed.packages.push_back(std::move(package));
    }

    result.success = true;
    return result;
}

PackageFeedLoadResult LoadPackageFeed(const std::filesystem::path& feedPath) {
    std::ifstream file(feedPath);
    if (!file.is_open()) {
        PackageFeedLoadResult result;
        result.errors.push_back("Failed to open package feed: " + feedPath.string());
        return result;
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const std::exception& ex) {
        PackageFeedLoadResult result;
        result.errors.push_back(std::string("Failed to parse package feed JSON: ") + ex.what());
        return result;
    }

    auto result = ParsePackageFeed(json);
    for (const auto& warning : result.warnings) {
        core::Logger::Warning("[PackageFeed] {}", warning);
    }
    return result;
}

ReplayStats ReplayPackageFeed(const PackageFeed& feed, history::HistoryStore& store) {
    ReplayStats stats;
    for (const auto& package : feed.packages) {
        ++stats.packages;
        for (const auto& entry : package.entries) {
            history::PackageScope scope(store, package.name, entry.location.empty() ? package.location : entry.location);

            if (entry.op == PackageFeed::Entry::Op::Modify) {
                const bool recorded = scope.Modify(entry.kind,
                                                   entry.name,
                                                   entry.field,
                                                   PrototypeNormalizer::NormalizeFieldValue(entry.field, entry.oldValue),
                                                   PrototypeNormalizer::NormalizeFieldValue(entry.field, entry.newValue));
                if (recorded) {
                    ++stats.modifications;
                } else {
                    ++stats.skipped;
                }
                continue;
            }

            for (const auto& prototype : entry.prototypes) {
                const auto typeIt = prototype.find("type");
                const auto nameIt = prototype.find("name");
                if (typeIt == prototype.end() || nameIt == prototype.end() ||
                    !typeIt->is_string() || !nameIt->is_string()) {
                    core::Logger::Warning("[PackageFeed] Skipping prototype without string type/name from '{}'",
                                          package.name);
                    ++stats.skipped;
                    continue;
                }
                const bool recorded = scope.Add(typeIt->get<std::string>(), nameIt->get<std::string>(),
                                                PrototypeNormalizer::Normalize(prototype));
                if (recorded) {
                    ++stats.additions;
                } else {
                    ++stats.skipped;
                }
            }
        }
    }
    core::Logger::Info("[PackageFeed] Replayed {} package(s): {} addition(s), {} modification(s), {} skipped",
                       stats.packages, stats.additions, stats.modifications, stats.skipped);
    return stats;
}

} // namespace mh::ingest
