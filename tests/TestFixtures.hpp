#pragma once

#include "mh/history/HistoryStore.hpp"

#include <filesystem>
#include <initializer_list>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

struct TempDirectory {
    std::filesystem::path root;

    TempDirectory();
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
};

std::string ReadTextFile(const std::filesystem::path& path);
void WriteTextFile(const std::filesystem::path& path, const std::string& contents);

/// {type = "item", name, amount}
nlohmann::json ItemRef(const std::string& name, int amount = 1);

/// List of ItemRef entries with amount 1.
nlohmann::json ItemList(std::initializer_list<std::string> names);

nlohmann::json Recipe(const std::string& name,
                      std::initializer_list<std::string> ingredients,
                      std::initializer_list<std::string> results = {});

nlohmann::json Technology(const std::string& name, std::initializer_list<std::string> prerequisites);

/**
 * base defines recipe r = [iron]; package A rewrites r.ingredients to
 * [iron, wood]; package B rewrites it to [iron, steel].
 */
void RecordIngredientConflict(mh::history::HistoryStore& store);
