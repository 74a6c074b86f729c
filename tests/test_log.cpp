#include <metacache/test.hpp>
#include <metacache/log.hpp>
#include <cstdio>
#include <string>
#include <vector>
#include <utility>

using namespace metacache;

// Restores logger state after each test and keeps stderr quiet.
struct LoggerGuard {
    LogLevel prev_level;
    LoggerGuard() : prev_level(Logger::level()) { Logger::set_stderr(false); }
    ~LoggerGuard() {
        Logger::set_level(prev_level);
        Logger::set_sink(nullptr);
        Logger::set_file(nullptr);
        Logger::set_stderr(true);
    }
};

static_assert(log_level_name(LogLevel::trace) == "TRACE");
static_assert(log_level_name(LogLevel::warn)  == "WARN ");
static_assert(channel::cache.name() == "cache");
static_assert(channel::disk.name() == "disk");

TEST_CASE("Logger: sink receives formatted line") {
    LoggerGuard guard;

    std::vector<std::pair<LogLevel, std::string>> captured;
    Logger::set_sink([&](LogLevel lvl, std::string_view msg) {
        captured.emplace_back(lvl, std::string(msg));
    });

    Logger::set_level(LogLevel::trace);
    Logger::info("hello {}", "world");

    REQUIRE_EQ(captured.size(), std::size_t{1});
    REQUIRE_EQ(static_cast<int>(captured[0].first), static_cast<int>(LogLevel::info));
    REQUIRE(captured[0].second.find("hello world") != std::string::npos);
    REQUIRE(captured[0].second.find("INFO") != std::string::npos);
    REQUIRE_EQ(captured[0].second.back(), '\n');
}

TEST_CASE("Logger: messages below threshold are dropped") {
    LoggerGuard guard;

    std::vector<LogLevel> levels;
    Logger::set_sink([&](LogLevel lvl, std::string_view) { levels.push_back(lvl); });
    Logger::set_level(LogLevel::warn);

    Logger::trace("no");
    Logger::debug("no");
    Logger::info("no");
    Logger::warn("yes");
    Logger::error("yes");

    REQUIRE_EQ(levels.size(), std::size_t{2});
    REQUIRE_EQ(static_cast<int>(levels[0]), static_cast<int>(LogLevel::warn));
    REQUIRE_EQ(static_cast<int>(levels[1]), static_cast<int>(LogLevel::error));

    Logger::set_level(LogLevel::off);
    Logger::fatal("no");
    REQUIRE_EQ(levels.size(), std::size_t{2});
}

TEST_CASE("LogChannel: lines carry the component tag") {
    LoggerGuard guard;

    std::vector<std::string> lines;
    Logger::set_sink([&](LogLevel, std::string_view msg) { lines.emplace_back(msg); });
    Logger::set_level(LogLevel::trace);

    channel::cache.debug("hit '{}'", "a.mp3");
    channel::loader.warn("unit {} failed", 3);
    channel::orchestrator.info("done");
    channel::disk.error("full");

    REQUIRE_EQ(lines.size(), std::size_t{4});
    REQUIRE(lines[0].find("[cache] hit 'a.mp3'") != std::string::npos);
    REQUIRE(lines[1].find("[loader] unit 3 failed") != std::string::npos);
    REQUIRE(lines[2].find("[orchestrator] done") != std::string::npos);
    REQUIRE(lines[3].find("[disk] full") != std::string::npos);
}

TEST_CASE("LogChannel: respects the global level") {
    LoggerGuard guard;

    int count = 0;
    Logger::set_sink([&](LogLevel, std::string_view) { ++count; });
    Logger::set_level(LogLevel::info);

    channel::cache.trace("no");
    channel::cache.debug("no");
    channel::cache.info("yes");
    REQUIRE_EQ(count, 1);
}

TEST_CASE("ScopedLogLevel: nested scopes restore") {
    LoggerGuard guard;

    Logger::set_level(LogLevel::error);
    {
        ScopedLogLevel outer(LogLevel::warn);
        REQUIRE_EQ(static_cast<int>(Logger::level()), static_cast<int>(LogLevel::warn));
        {
            ScopedLogLevel inner(LogLevel::trace);
            REQUIRE(Logger::enabled(LogLevel::trace));
        }
        REQUIRE(!Logger::enabled(LogLevel::info));
    }
    REQUIRE_EQ(static_cast<int>(Logger::level()), static_cast<int>(LogLevel::error));
}

TEST_CASE("Logger: file and sink both receive output") {
    LoggerGuard guard;

    auto* tmpf = std::tmpfile();
    REQUIRE(tmpf != nullptr);

    int sink_count = 0;
    Logger::set_file(tmpf);
    Logger::set_sink([&](LogLevel, std::string_view) { sink_count++; });
    Logger::set_level(LogLevel::trace);

    channel::disk.info("namespace at {}", "/tmp/x");
    REQUIRE_EQ(sink_count, 1);

    std::fflush(tmpf);
    std::rewind(tmpf);
    char buf[256] = {};
    auto n = std::fread(buf, 1, sizeof(buf) - 1, tmpf);
    Logger::set_file(nullptr);
    std::fclose(tmpf);

    std::string_view content(buf, n);
    REQUIRE(content.find("[disk] namespace at /tmp/x") != std::string_view::npos);
}

METACACHE_TEST_MAIN()
