#include "mh/utils/Config.hpp"

#include <fstream>
#include <system_error>
#include <algorithm>
#include <set>
#include <fmt/format.h>

#include "mh/core/Logger.hpp"

namespace mh::utils {

namespace {

constexpr double kMinThreshold = 0.0;
constexpr double kMaxThreshold = 1.0;

static std::filesystem::path NormalizePath(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path normalized = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        normalized = std::filesystem::absolute(path);
    }
    return normalized.lexically_normal();
}

static std::filesystem::path ResolvePath(const std::filesystem::path& baseDir,
                                         const std::string& value) {
    std::filesystem::path raw(value);
    if (raw.is_relative()) {
        return NormalizePath(baseDir / raw);
    }
    return NormalizePath(raw);
}

template <typename T>
static T GetOrDefault(const nlohmann::json& obj, const char* key, const T& fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        mh::core::Logger::Warning("[ConfigLoader] Failed to parse key '{}': {}", key, e.what());
        return fallback;
    }
}

static std::set<std::string> GetStringSet(const nlohmann::json& obj, const char* key,
                                          const std::set<std::string>& fallback) {
    const std::vector<std::string> defaults(fallback.begin(), fallback.end());
    const auto values = GetOrDefault<std::vector<std::string>>(obj, key, defaults);
    return std::set<std::string>(values.begin(), values.end());
}

static const nlohmann::json& Section(const nlohmann::json& json, const char* name) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (!json.is_object()) {
        return kEmpty;
    }
    auto it = json.find(name);
    return it != json.end() && it->is_object() ? *it : kEmpty;
}

} // namespace

AppConfig ConfigLoader::CreateDefault(const std::filesystem::path& baseDir) {
    AppConfig config{};
    config.configDirectory = baseDir;
    return config;
}

ConfigLoadResult ConfigLoader::Load(const std::filesystem::path& path) {
    const std::filesystem::path baseDir = path.empty() ? std::filesystem::current_path()
                                                       : path.parent_path();

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        mh::core::Logger::Warning(
            "[ConfigLoader] Config file '{}' not found, using defaults",
            path.empty() ? "<none>" : path.string());
        ConfigLoadResult result;
        result.config = CreateDefault(baseDir);
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        mh::core::Logger::Error("[ConfigLoader] Failed to open config file '{}'", path.string());
        ConfigLoadResult result;
        result.config = CreateDefault(baseDir);
        result.errors.push_back(fmt::format("Cannot open config file '{}'", path.string()));
        return result;
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        mh::core::Logger::Error("[ConfigLoader] Failed to parse JSON '{}': {}",
                                path.string(), e.what());
        ConfigLoadResult result;
        result.config = CreateDefault(baseDir);
        result.errors.push_back(fmt::format("Config file '{}' is not valid JSON", path.string()));
        return result;
    }

    auto result = FromJson(json, baseDir);
    mh::core::Logger::Info("[ConfigLoader] Loaded config from '{}'", path.string());
    return result;
}

ConfigLoadResult ConfigLoader::FromJson(const nlohmann::json& json, const std::filesystem::path& baseDir) {
    ConfigLoadResult result;
    result.config = CreateDefault(baseDir);
    auto& options = result.config.analysis;

    const auto& analysisObj = Section(json, "analysis");
    options.detector.essentialRecipes =
        GetStringSet(analysisObj, "essentialRecipes", options.detector.essentialRecipes);
    options.detector.referenceContext =
        GetOrDefault<std::string>(analysisObj, "referenceContext", options.detector.referenceContext);
    options.detector.basePackage =
        GetOrDefault<std::string>(analysisObj, "basePackage", options.detector.basePackage);
    options.detector.builtinNamespaces =
        GetStringSet(analysisObj, "builtinNamespaces", options.detector.builtinNamespaces);
    options.wideAvailabilityThreshold =
        GetOrDefault<double>(analysisObj, "wideAvailabilityThreshold", options.wideAvailabilityThreshold);
    options.graph.defaultCraftingCategory =
        GetOrDefault<std::string>(analysisObj, "defaultCraftingCategory", options.graph.defaultCraftingCategory);
    options.contextKinds = GetStringSet(analysisObj, "contextKinds", options.contextKinds);

    if (json.is_object()) {
        if (auto it = json.find("contexts"); it != json.end()) {
            ReadContexts(*it, result.config, result);
        }
    }

    const auto& patchesObj = Section(json, "patches");
    options.patches.targetPackage =
        GetOrDefault<std::string>(patchesObj, "targetPackage", options.patches.targetPackage);
    options.patches.targetFile =
        GetOrDefault<std::string>(patchesObj, "targetFile", options.patches.targetFile);

    const auto& loggingObj = Section(json, "logging");
    const auto logFile = GetOrDefault<std::string>(loggingObj, "file", std::string());
    if (!logFile.empty()) {
        result.config.logging.file = ResolvePath(baseDir, logFile);
    }
    result.config.logging.debug = GetOrDefault<bool>(loggingObj, "debug", result.config.logging.debug);

    result.loadedFromFile = true;

    ValidateConfig(result.config, result);

    for (const auto& warning : result.warnings) {
        mh::core::Logger::Warning("[ConfigLoader] {}", warning);
    }
    for (const auto& error : result.errors) {
        mh::core::Logger::Error("[ConfigLoader] {}", error);
    }
    return result;
}

void ConfigLoader::ReadContexts(const nlohmann::json& contexts, AppConfig& config, ConfigLoadResult& result) {
    if (!contexts.is_array()) {
        result.errors.push_back("'contexts' must be an array");
        return;
    }
    auto& target = config.analysis.contexts;
    for (const auto& entry : contexts) {
        const auto id = GetOrDefault<std::string>(entry, "id", std::string());
        if (id.empty()) {
            result.errors.push_back("Context entry without an id ignored");
            continue;
        }
        const bool duplicate = std::any_of(target.begin(), target.end(), [&](const model::AvailabilityContext& context) {
            return context.id == id;
        });
        if (duplicate) {
            result.errors.push_back(fmt::format("Duplicate context id '{}' ignored", id));
            continue;
        }

        model::AvailabilityContext context;
        context.id = id;
        context.availableResources = GetStringSet(entry, "resources", {});
        context.knownTechnologies = GetStringSet(entry, "technologies", {});
        context.knownMachines = GetStringSet(entry, "machines", {});
        target.push_back(std::move(context));
    }
}

void ConfigLoader::ValidateConfig(AppConfig& config, ConfigLoadResult& result) {
    ValidateAnalysisConfig(config.analysis, result);
    ValidatePatchConfig(config.analysis.patches, result);

    if (!config.logging.file.empty()) {
        std::error_code ec;
        const auto directory = config.logging.file.parent_path();
        if (!directory.empty() && !std::filesystem::exists(directory, ec)) {
            result.warnings.push_back(
                fmt::format("Log directory does not exist yet: {}", directory.string()));
        }
    }
}

void ConfigLoader::ValidateAnalysisConfig(analysis::AnalysisOptions& options, ConfigLoadResult& result) {
    if (options.wideAvailabilityThreshold < kMinThreshold || options.wideAvailabilityThreshold > kMaxThreshold) {
        result.warnings.push_back(
            fmt::format("analysis.wideAvailabilityThreshold ({:.3f}) should be between {:.1f} and {:.1f}, clamping",
                        options.wideAvailabilityThreshold, kMinThreshold, kMaxThreshold));
        options.wideAvailabilityThreshold = std::clamp(options.wideAvailabilityThreshold, kMinThreshold, kMaxThreshold);
    }

    if (options.detector.basePackage.empty()) {
        result.warnings.push_back("analysis.basePackage is empty, using default");
        options.detector.basePackage = analysis::DetectorConfig{}.basePackage;
    }

    const auto& reference = options.detector.referenceContext;
    if (!reference.empty() && !options.contexts.empty()) {
        const bool known = std::any_of(options.contexts.begin(), options.contexts.end(),
                                       [&](const model::AvailabilityContext& context) { return context.id == reference; });
        if (!known) {
            result.warnings.push_back(
                fmt::format("analysis.referenceContext '{}' does not name a configured context", reference));
        }
    }

    if (options.contexts.empty() && options.contextKinds.empty()) {
        result.warnings.push_back("No contexts configured and no context kinds to derive them from");
    }
}

void ConfigLoader::ValidatePatchConfig(patch::PatchOptions& patches, ConfigLoadResult& result) {
    if (patches.targetPackage.empty()) {
        result.warnings.push_back("patches.targetPackage is empty, using default");
        patches.targetPackage = std::string(patch::kDefaultTargetPackage);
    }
    if (patches.targetFile.empty()) {
        result.warnings.push_back("patches.targetFile is empty, using default");
        patches.targetFile = std::string(patch::kDefaultTargetFile);
    }
}

} // namespace mh::utils
