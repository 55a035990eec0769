#pragma once

#include "mh/analysis/CompatibilityAnalyzer.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mh::utils {

struct LoggingConfig {
    std::filesystem::path file;
    bool debug = false;
};

struct AppConfig {
    analysis::AnalysisOptions analysis;
    LoggingConfig logging;
    std::filesystem::path configDirectory;
};

struct ConfigLoadResult {
    AppConfig config;
    bool loadedFromFile = false;
    std::vector<std::string> errors;      // Critical errors that should prevent a run
    std::vector<std::string> warnings;    // Non-critical issues that should be logged

    bool HasErrors() const { return !errors.empty(); }
    bool HasWarnings() const { return !warnings.empty(); }
};

class ConfigLoader {
public:
    /// Missing file yields defaults with loadedFromFile == false.
    static ConfigLoadResult Load(const std::filesystem::path& path);

    /// Applies an already parsed document; relative paths resolve against @p baseDir.
    static ConfigLoadResult FromJson(const nlohmann::json& json, const std::filesystem::path& baseDir);

private:
    static AppConfig CreateDefault(const std::filesystem::path& baseDir);
    static void ReadContexts(const nlohmann::json& contexts, AppConfig& config, ConfigLoadResult& result);
    static void ValidateConfig(AppConfig& config, ConfigLoadResult& result);
    static void ValidateAnalysisConfig(analysis::AnalysisOptions& options, ConfigLoadResult& result);
    static void ValidatePatchConfig(patch::PatchOptions& patches, ConfigLoadResult& result);
};

} // namespace mh::utils
