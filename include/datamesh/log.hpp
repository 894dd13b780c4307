#pragma once
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <utility>

namespace datamesh {

enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel lvl) noexcept
{
    switch (lvl) {
        case LogLevel::trace: return "TRACE";
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info:  return "INFO ";
        case LogLevel::warn:  return "WARN ";
        case LogLevel::error: return "ERROR";
        case LogLevel::fatal: return "FATAL";
        default:              return "?????";
    }
}

// Case-insensitive; accepts "warning" as an alias for warn.
[[nodiscard]] inline std::optional<LogLevel> parse_log_level(std::string_view s)
{
    std::string lower(s);
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return LogLevel::trace;
    if (lower == "debug") return LogLevel::debug;
    if (lower == "info") return LogLevel::info;
    if (lower == "warn" || lower == "warning") return LogLevel::warn;
    if (lower == "error") return LogLevel::error;
    if (lower == "fatal") return LogLevel::fatal;
    if (lower == "off") return LogLevel::off;
    return std::nullopt;
}

// --- Global logger (all-static, no instances) ---
class Logger final {
public:
    Logger() = delete;

    static void set_level(LogLevel level) noexcept
    {
        auto lock = std::lock_guard{mutex_()};
        level_() = level;
    }

    [[nodiscard]] static LogLevel level() noexcept
    {
        auto lock = std::lock_guard{mutex_()};
        return level_();
    }

    // Picks up DATAMESH_LOG_LEVEL if set and valid. Returns the active level.
    static LogLevel configure_from_env() noexcept
    {
        if (const char* v = std::getenv("DATAMESH_LOG_LEVEL")) {
            if (auto lvl = parse_log_level(v)) set_level(*lvl);
        }
        return level();
    }

    // Additional output file (nullptr disables it).
    static void set_file(std::FILE* f) noexcept
    {
        auto lock = std::lock_guard{mutex_()};
        file_() = f;
    }

    // Stderr output is on by default; tests turn it off to keep runs quiet.
    static void set_stderr(bool enabled) noexcept
    {
        auto lock = std::lock_guard{mutex_()};
        stderr_() = enabled;
    }

    using Sink = std::function<void(LogLevel, std::string_view)>;
    static void set_sink(Sink sink)
    {
        auto lock = std::lock_guard{mutex_()};
        sink_() = std::move(sink);
    }

    [[nodiscard]] static bool enabled(LogLevel lvl) noexcept
    {
        return static_cast<std::uint8_t>(lvl) >= static_cast<std::uint8_t>(level());
    }

    template <typename... Args>
    static void log(LogLevel lvl, std::format_string<Args...> fmt, Args&&... args)
    {
        if (!enabled(lvl)) return;

        auto msg = std::format(fmt, std::forward<Args>(args)...);

        auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        auto tod = std::chrono::hh_mm_ss{now - std::chrono::floor<std::chrono::days>(now)};
        auto line = std::format("[{}] [{:%H:%M:%S}] datamesh: {}\n", log_level_name(lvl), tod, msg);

        Sink sink;
        {
            auto lock = std::lock_guard{mutex_()};
            if (stderr_()) std::print(stderr, "{}", line);
            if (file_()) {
                std::print(file_(), "{}", line);
                std::fflush(file_());
            }
            sink = sink_();
        }
        // outside the lock: a sink may log itself
        if (sink) sink(lvl, line);
    }

    template <typename... Args>
    static void trace(std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void fatal(std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::fatal, fmt, std::forward<Args>(args)...);
    }

private:
    static std::mutex& mutex_()
    {
        static std::mutex m;
        return m;
    }

    static LogLevel& level_()
    {
        static LogLevel lvl = LogLevel::info;
        return lvl;
    }

    static bool& stderr_()
    {
        static bool on = true;
        return on;
    }

    static std::FILE*& file_()
    {
        static std::FILE* f = nullptr;
        return f;
    }

    static Sink& sink_()
    {
        static Sink s;
        return s;
    }
};

// --- RAII scoped log level override ---
class ScopedLogLevel final {
    LogLevel prev_;

public:
    explicit ScopedLogLevel(LogLevel level) noexcept
        : prev_{Logger::level()}
    {
        Logger::set_level(level);
    }

    ~ScopedLogLevel() noexcept { Logger::set_level(prev_); }

    ScopedLogLevel(const ScopedLogLevel&) = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;
    ScopedLogLevel(ScopedLogLevel&&) = delete;
    ScopedLogLevel& operator=(ScopedLogLevel&&) = delete;
};

} // namespace datamesh
