#include "mh/analysis/CompatibilityAnalyzer.hpp"
#include "mh/core/Logger.hpp"
#include "mh/history/HistoryStore.hpp"
#include "mh/ingest/PackageFeed.hpp"
#include "mh/patch/LuaPatchRenderer.hpp"
#include "mh/report/ReportSerializer.hpp"
#include "mh/utils/Config.hpp"

#include <fmt/core.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

namespace {

constexpr const char* kReportFileName = "analysis_data.json";

struct CommandLine {
    std::filesystem::path feedPath;
    std::filesystem::path configPath;
    std::filesystem::path outputDirectory = "harmonizer-output";
    bool quiet = false;
};

void PrintUsage() {
    fmt::print("Usage: mod-harmonizer <feed.json> [--config <config.json>] [--out <dir>] [--quiet]\n");
}

std::optional<CommandLine> ParseCommandLine(int argc, char** argv) {
    CommandLine commandLine;
    for (int i = 1; i < argc; ++i) {
        const std::string_view argument = argv[i];
        if (argument == "--config" || argument == "--out") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} expects a value.\n", argument);
                return std::nullopt;
            }
            if (argument == "--config") {
                commandLine.configPath = argv[++i];
            } else {
                commandLine.outputDirectory = argv[++i];
            }
        } else if (argument == "--quiet" || argument == "-q") {
            commandLine.quiet = true;
        } else if (argument == "--help" || argument == "-h") {
            return std::nullopt;
        } else if (commandLine.feedPath.empty()) {
            commandLine.feedPath = argument;
        } else {
            fmt::print(stderr, "Error: unexpected argument '{}'.\n", argument);
            return std::nullopt;
        }
    }
    if (commandLine.feedPath.empty()) {
        return std::nullopt;
    }
    return commandLine;
}

bool WriteTextFile(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }
    file << contents;
    return static_cast<bool>(file);
}

} // namespace

int main(int argc, char** argv) {
    mh::core::Logger::ConfigureFromEnvironment();

    const auto commandLine = ParseCommandLine(argc, argv);
    if (!commandLine) {
        PrintUsage();
        return EXIT_FAILURE;
    }

    if (!std::filesystem::exists(commandLine->feedPath)) {
        fmt::print(stderr, "Error: file '{}' does not exist.\n", commandLine->feedPath.string());
        return EXIT_FAILURE;
    }

    if (commandLine->quiet) {
        mh::core::Logger::SetConsoleLevel(mh::core::LogLevel::Warning);
    }

    const auto configResult = mh::utils::ConfigLoader::Load(commandLine->configPath);
    if (configResult.HasErrors()) {
        for (const auto& error : configResult.errors) {
            fmt::print(stderr, "Config error: {}\n", error);
        }
        return EXIT_FAILURE;
    }
    const auto& config = configResult.config;
    if (config.logging.debug) {
        mh::core::Logger::SetDebugEnabled(true);
    }
    if (!config.logging.file.empty()) {
        mh::core::Logger::SetLogFile(config.logging.file);
    }

    const auto feedResult = mh::ingest::LoadPackageFeed(commandLine->feedPath);
    if (!feedResult.success) {
        for (const auto& error : feedResult.errors) {
            fmt::print(stderr, "Feed error: {}\n", error);
        }
        return EXIT_FAILURE;
    }

    mh::history::HistoryStore store;
    const auto stats = mh::ingest::ReplayPackageFeed(feedResult.feed, store);

    const mh::analysis::CompatibilityAnalyzer analyzer(config.analysis);
    const auto report = analyzer.Run(store);

    std::error_code ec;
    std::filesystem::create_directories(commandLine->outputDirectory, ec);
    if (ec) {
        fmt::print(stderr, "Error: cannot create '{}': {}\n", commandLine->outputDirectory.string(), ec.message());
        return EXIT_FAILURE;
    }

    std::string error;
    const auto reportPath = commandLine->outputDirectory / kReportFileName;
    if (!mh::report::WriteReport(report, reportPath, error)) {
        fmt::print(stderr, "Error: {}\n", error);
        return EXIT_FAILURE;
    }

    const auto patchPath = commandLine->outputDirectory / config.analysis.patches.targetFile;
    if (!report.patches.empty()) {
        const mh::patch::LuaPatchRenderer renderer{};
        if (!WriteTextFile(patchPath, renderer.RenderFile(report.patches))) {
            fmt::print(stderr, "Error: failed to write '{}'\n", patchPath.string());
            return EXIT_FAILURE;
        }
    }

    fmt::print("Analyzed {} package(s), {} prototype(s) ({} record(s) skipped)\n",
               report.analyzedPackages.size(), report.summary.total, stats.skipped);
    fmt::print("  Conflicted:    {}\n", report.summary.conflicted);
    fmt::print("  Critical:      {}\n", report.summary.critical);
    fmt::print("  High:          {}\n", report.summary.high);
    fmt::print("  Medium:        {}\n", report.summary.medium);
    fmt::print("  Low:           {}\n", report.summary.low);
    fmt::print("  Patches:       {}\n", report.patches.size());
    fmt::print("\nReport: {}\n", reportPath.string());
    if (!report.patches.empty()) {
        fmt::print("Patch file: {}\n", patchPath.string());
    }

    return EXIT_SUCCESS;
}
