#pragma once

#include "mh/history/HistoryStore.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mh::ingest {

/**
 * @brief Recorded extractor output: what each package did, in load order.
 *
 * {"packages": [{"name", "location", "entries": [
 *     {"op": "extend", "location"?, "prototypes": [...]},
 *     {"op": "modify", "location"?, "kind", "name", "field", "old", "new"}]}]}
 */
struct PackageFeed {
    struct Entry {
        enum class Op {
            Extend,
            Modify
        };

        Op op = Op::Extend;
        std::string location;
        nlohmann::json prototypes = nlohmann::json::array();
        std::string kind;
        std::string name;
        std::string field;
        nlohmann::json oldValue;
        nlohmann::json newValue;
    };

    struct Package {
        std::string name;
        std::string location;
        std::vector<Entry> entries;
    };

    std::vector<Package> packages;
};

struct PackageFeedLoadResult {
    bool success = false;
    PackageFeed feed;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

struct ReplayStats {
    std::size_t packages = 0;
    std::size_t additions = 0;
    std::size_t modifications = 0;
    std::size_t skipped = 0;
};

PackageFeedLoadResult LoadPackageFeed(const std::filesystem::path& feedPath);
PackageFeedLoadResult ParsePackageFeed(const nlohmann::json& json);

/// Records every entry through one package context per entry, normalizing values first.
ReplayStats ReplayPackageFeed(const PackageFeed& feed, history::HistoryStore& store);

} // namespace mh::ingest
