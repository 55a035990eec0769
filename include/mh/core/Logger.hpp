#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace mh::core {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Process-wide logger. Call sites tag messages with their module, e.g.
 * "[HistoryStore] ...".
 *
 * Every line goes to the log file and to listeners. stderr only receives lines at
 * or above the console level, so the CLI and the test runner can keep progress
 * output quiet without losing it from the file. Debug lines exist only in MH_DEBUG
 * builds and are off unless MH_LOG_DEBUG or SetDebugEnabled turns them on.
 */
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    template<typename... Args>
    static void Debug(fmt::format_string<Args...> format, Args&&... args) {
#ifdef MH_DEBUG
        if (DebugEnabled()) {
            Write(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
        }
#else
        (void)format;
        (void)std::initializer_list<int>{((void)args, 0)...};
#endif
    }

    template<typename... Args>
    static void Info(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void Warning(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Warning, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void Error(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }

    static void SetDebugEnabled(bool enabled) {
        s_debugEnabled.store(enabled, std::memory_order_release);
        s_debugConfigured.store(true, std::memory_order_release);
    }

    /// Reads MH_LOG_DEBUG (1/true/on/yes or 0/false/off/no). Unset leaves the current state.
    static void ConfigureFromEnvironment() {
        const char* env = std::getenv("MH_LOG_DEBUG");
        s_debugConfigured.store(true, std::memory_order_release);
        if (!env) {
            return;
        }
        std::string value(env);
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (value == "1" || value == "true" || value == "on" || value == "yes") {
            s_debugEnabled.store(true, std::memory_order_release);
        } else if (value == "0" || value == "false" || value == "off" || value == "no") {
            s_debugEnabled.store(false, std::memory_order_release);
        }
    }

    static void SetConsoleLevel(LogLevel level) {
        s_consoleLevel.store(level, std::memory_order_release);
    }

    static LogLevel ConsoleLevel() {
        return s_consoleLevel.load(std::memory_order_acquire);
    }

    /// Mirror every line into @p path (appending). An empty path closes the mirror.
    static void SetLogFile(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(s_mutex);
        if (s_file.is_open()) {
            s_file.close();
        }
        if (path.empty()) {
            return;
        }
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        s_file.open(path, std::ios::out | std::ios::app);
    }

    /// Returns 0 for an empty callback; otherwise a token for UnregisterListener.
    static size_t RegisterListener(LogCallback callback) {
        if (!callback) {
            return 0;
        }
        std::lock_guard<std::mutex> lock(s_mutex);
        const size_t token = s_nextToken++;
        s_listeners.emplace_back(token, std::move(callback));
        return token;
    }

    static void UnregisterListener(size_t token) {
        if (token == 0) {
            return;
        }
        std::lock_guard<std::mutex> lock(s_mutex);
        s_listeners.erase(std::remove_if(s_listeners.begin(), s_listeners.end(),
                                         [token](const auto& entry) { return entry.first == token; }),
                          s_listeners.end());
    }

private:
    static bool DebugEnabled() {
        if (!s_debugConfigured.load(std::memory_order_acquire)) {
            ConfigureFromEnvironment();
        }
        return s_debugEnabled.load(std::memory_order_acquire);
    }

    static void Write(LogLevel level, const std::string& message) {
        const std::string line = fmt::format("[{}] [{}] {}", Timestamp(), LevelName(level), message);
        if (level >= ConsoleLevel()) {
            fmt::print(stderr, "{}\n", line);
        }

        std::vector<LogCallback> listeners;
        {
            std::lock_guard<std::mutex> lock(s_mutex);
            if (s_file.is_open()) {
                s_file << line << '\n';
                s_file.flush();
            }
            listeners.reserve(s_listeners.size());
            for (const auto& entry : s_listeners) {
                listeners.push_back(entry.second);
            }
        }
        for (const auto& callback : listeners) {
            callback(level, line);
        }
    }

    static constexpr std::string_view LevelName(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "Debug";
            case LogLevel::Info:    return "Info";
            case LogLevel::Warning: return "Warning";
            case LogLevel::Error:   return "Error";
        }
        return "Info";
    }

    static std::string Timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto timeT = system_clock::to_time_t(now);
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &timeT);
#else
        localtime_r(&timeT, &tm);
#endif
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
        return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}",
                           tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                           tm.tm_hour, tm.tm_min, tm.tm_sec, ms.count());
    }

    static inline std::atomic<bool> s_debugEnabled{false};
    static inline std::atomic<bool> s_debugConfigured{false};
    static inline std::atomic<LogLevel> s_consoleLevel{LogLevel::Debug};

    static inline std::mutex s_mutex{};
    static inline std::ofstream s_file{};
    static inline std::vector<std::pair<size_t, LogCallback>> s_listeners{};
    static inline size_t s_nextToken = 1;
};

/// Keeps a listener registered for the lifetime of the scope.
class ScopedLogListener {
public:
    explicit ScopedLogListener(Logger::LogCallback callback)
        : m_token(Logger::RegisterListener(std::move(callback))) {}
    ~ScopedLogListener() { Logger::UnregisterListener(m_token); }

    ScopedLogListener(const ScopedLogListener&) = delete;
    ScopedLogListener& operator=(const ScopedLogListener&) = delete;

    size_t Token() const { return m_token; }

private:
    size_t m_token = 0;
};

} // namespace mh::core
