#pragma once
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <string_view>
#include <string>
#include <mutex>
#include <cstdio>
#include <cstdint>
#include <chrono>
#include <ctime>
#include <utility>
#include <functional>

namespace metacache {

// --- Log severity levels ---
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

// --- Level name for output ---
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

    [[nodiscard]] static bool enabled(LogLevel lvl) noexcept
    {
        return static_cast<std::uint8_t>(lvl) >= static_cast<std::uint8_t>(level());
    }

    // Suppress the stderr copy (file and sink output are unaffected).
    static void set_stderr(bool on) noexcept
    {
        auto lock = std::lock_guard{mutex_()};
        stderr_() = on;
    }

    // Set an additional output file (nullptr to disable file output).
    static void set_file(std::FILE* f) noexcept
    {
        auto lock = std::lock_guard{mutex_()};
        file_() = f;
    }

    // Set a custom sink callback. Called after stderr/file output.
    using Sink = std::function<void(LogLevel, std::string_view)>;
    static void set_sink(Sink sink)
    {
        auto lock = std::lock_guard{mutex_()};
        sink_() = std::move(sink);
    }

    // Core log function. Early-returns before formatting if level is filtered.
    template <typename... Args>
    static void log(LogLevel lvl, std::string_view component,
                    fmt::format_string<Args...> fmt_str, Args&&... args)
    {
        if (!enabled(lvl)) {
            return;
        }

        auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;
        auto tm = fmt::localtime(std::chrono::system_clock::to_time_t(now));

        auto line = component.empty()
            ? fmt::format("[{}] [{:%H:%M:%S}.{:03}] {}\n",
                          log_level_name(lvl), tm, ms, msg)
            : fmt::format("[{}] [{:%H:%M:%S}.{:03}] [{}] {}\n",
                          log_level_name(lvl), tm, ms, component, msg);

        auto lock = std::lock_guard{mutex_()};

        if (stderr_()) {
            fmt::print(stderr, "{}", line);
        }

        if (file_()) {
            fmt::print(file_(), "{}", line);
            std::fflush(file_());
        }

        if (sink_()) {
            sink_()(lvl, line);
        }
    }

    // --- Convenience methods (no component) ---
    template <typename... Args>
    static void trace(fmt::format_string<Args...> fmt_str, Args&&... args)
    {
        log(LogLevel::trace, {}, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(fmt::format_string<Args...> fmt_str, Args&&... args)
    {
        log(LogLevel::debug, {}, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(fmt::format_string<Args...> fmt_str, Args&&... args)
    {
        log(LogLevel::info, {}, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(fmt::format_string<Args...> fmt_str, Args&&... args)
    {
        log(LogLevel::warn, {}, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(fmt::format_string<Args...> fmt_str, Args&&... args)
    {
        log(LogLevel::error, {}, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void fatal(fmt::format_string<Args...> fmt_str, Args&&... args)
    {
        log(LogLevel::fatal, {}, fmt_str, std::forward<Args>(args)...);
    }

private:
    // Use function-local statics to avoid static-init-order fiasco.
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

// --- Component-tagged front end ---
// Each engine component owns one of these so its lines carry a "[name]" tag.
class LogChannel final {
public:
    explicit constexpr LogChannel(std::string_view name) noexcept : name_{name} {}

    [[nodiscard]] constexpr std::string_view name() const noexcept { return name_; }

    template <typename... Args>
    void trace(fmt::format_string<Args...> fmt_str, Args&&... args) const
    {
        Logger::log(LogLevel::trace, name_, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> fmt_str, Args&&... args) const
    {
        Logger::log(LogLevel::debug, name_, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> fmt_str, Args&&... args) const
    {
        Logger::log(LogLevel::info, name_, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> fmt_str, Args&&... args) const
    {
        Logger::log(LogLevel::warn, name_, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> fmt_str, Args&&... args) const
    {
        Logger::log(LogLevel::error, name_, fmt_str, std::forward<Args>(args)...);
    }

private:
    std::string_view name_;
};

namespace channel {
inline constexpr LogChannel disk{"disk"};
inline constexpr LogChannel cache{"cache"};
inline constexpr LogChannel loader{"loader"};
inline constexpr LogChannel orchestrator{"orchestrator"};
} // namespace channel

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

} // namespace metacache
