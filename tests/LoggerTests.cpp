#include "mh/core/Logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

struct LoggerFileGuard {
    std::filesystem::path path;
    LoggerFileGuard() = default;
    explicit LoggerFileGuard(std::filesystem::path p) : path(std::move(p)) {}
    ~LoggerFileGuard() {
        mh::core::Logger::SetLogFile({});
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    }
};

} // namespace

TEST_CASE("Logger mirrors formatted messages into the log file", "[logger]") {
    const std::filesystem::path tempFile =
        std::filesystem::temp_directory_path() / "mod_harmonizer_logger_test.log";
    std::error_code ec;
    std::filesystem::remove(tempFile, ec);

    LoggerFileGuard guard(tempFile);

    mh::core::Logger::SetLogFile(tempFile);
    mh::core::Logger::Info("[HistoryStore] Prototype {} being overwritten by {}", "recipe.r", "A");

    std::ifstream file(tempFile);
    REQUIRE(file.is_open());

    std::string line;
    std::getline(file, line);
    file.close();

    REQUIRE(line.find("[Info] [HistoryStore] Prototype recipe.r being overwritten by A") != std::string::npos);
}

TEST_CASE("Logger listeners receive lines until unregistered", "[logger]") {
    std::vector<std::string> captured;
    const auto token = mh::core::Logger::RegisterListener(
        [&captured](mh::core::LogLevel level, const std::string& line) {
            if (level == mh::core::LogLevel::Warning) {
                captured.push_back(line);
            }
        });
    REQUIRE(token != 0);

    mh::core::Logger::Warning("Captured warning {}", 7);
    mh::core::Logger::Info("Ignored info");
    mh::core::Logger::UnregisterListener(token);
    mh::core::Logger::Warning("Not captured");

    REQUIRE(captured.size() == 1);
    REQUIRE(captured.front().find("[Warning] Captured warning 7") != std::string::npos);
}

TEST_CASE("Logger ignores empty listener callbacks", "[logger]") {
    REQUIRE(mh::core::Logger::RegisterListener({}) == 0);
    mh::core::Logger::UnregisterListener(0);
}

TEST_CASE("Scoped listeners unregister when they go out of scope", "[logger]") {
    std::vector<std::string> captured;
    {
        const mh::core::ScopedLogListener listener([&captured](mh::core::LogLevel, const std::string& line) {
            captured.push_back(line);
        });
        REQUIRE(listener.Token() != 0);
        mh::core::Logger::Error("[PatchGenerator] Failed to build patch for {}", "recipe.r");
    }
    mh::core::Logger::Error("After scope");

    REQUIRE(captured.size() == 1);
    REQUIRE(captured.front().find("[Error] [PatchGenerator] Failed to build patch for recipe.r") != std::string::npos);
}

TEST_CASE("Console level filters stderr but not listeners", "[logger]") {
    const auto previous = mh::core::Logger::ConsoleLevel();
    mh::core::Logger::SetConsoleLevel(mh::core::LogLevel::Error);
    REQUIRE(mh::core::Logger::ConsoleLevel() == mh::core::LogLevel::Error);

    std::vector<mh::core::LogLevel> levels;
    {
        const mh::core::ScopedLogListener listener([&levels](mh::core::LogLevel level, const std::string&) {
            levels.push_back(level);
        });
        mh::core::Logger::Info("quiet on the console");
        mh::core::Logger::Warning("also quiet on the console");
    }
    mh::core::Logger::SetConsoleLevel(previous);

    REQUIRE(levels == std::vector<mh::core::LogLevel>{mh::core::LogLevel::Info, mh::core::LogLevel::Warning});
}
