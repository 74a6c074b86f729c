#pragma once
#include <vector>
#include <string>
#include <string_view>
#include <functional>
#include <source_location>
#include <chrono>
#include <thread>
#include <cstdlib>
#include <cmath>
#include <concepts>
#include <type_traits>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cstring>
#include <atomic>

#include <fmt/format.h>

#include "executor.hpp"

namespace metacache::test {

// ---------------------------------------------------------------------------
// Concepts
// ---------------------------------------------------------------------------

template<typename T>
concept Printable = fmt::is_formattable<T, char>::value;

// ---------------------------------------------------------------------------
// Colors
// ---------------------------------------------------------------------------

namespace color {
    inline constexpr const char* green  = "\033[32m";
    inline constexpr const char* red    = "\033[31m";
    inline constexpr const char* yellow = "\033[33m";
    inline constexpr const char* reset  = "\033[0m";
    inline constexpr const char* bold   = "\033[1m";
} // namespace color

// ---------------------------------------------------------------------------
// Global state
// ---------------------------------------------------------------------------

struct TestCase {
    std::string_view name;
    std::string_view file;
    int line;
    std::function<void()> func;
};

struct TestFailure {};

struct Context {
    std::atomic<int> passed{0};
    std::atomic<int> failed{0};
    std::atomic<int> checks{0};
    bool current_failed  = false;
    bool use_color       = true;
    bool verbose         = false;
    std::string filter;
};

inline std::vector<TestCase>& registry() {
    static std::vector<TestCase> r;
    return r;
}

inline Context& ctx() {
    static Context c;
    return c;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

inline const char* col(const char* code) {
    return ctx().use_color ? code : "";
}

template<typename T>
std::string to_string_val(const T& v) {
    if constexpr (Printable<T>) {
        return fmt::format("{}", v);
    } else {
        return "<non-printable>";
    }
}

// ---------------------------------------------------------------------------
// Assertion reporting
// ---------------------------------------------------------------------------

inline void fail_assert(const char* expr,
                        std::string_view lhs,
                        std::string_view rhs,
                        std::source_location loc) {
    ctx().current_failed = true;
    fmt::print(stderr, "    {}{}:{}{}: {}REQUIRE/CHECK({}) failed{}\n",
               col(color::bold), loc.file_name(), col(color::reset),
               loc.line(),
               col(color::red), expr, col(color::reset));
    if (!lhs.empty() || !rhs.empty()) {
        fmt::print(stderr, "      lhs = {}\n", lhs);
        fmt::print(stderr, "      rhs = {}\n", rhs);
    }
}

template<typename A, typename B>
void fail_cmp(const char* expr, const A& a, const B& b,
              std::source_location loc) {
    fail_assert(expr, to_string_val(a), to_string_val(b), loc);
}

inline void pass_assert(const char* expr, std::source_location loc) {
    ctx().checks++;
    if (ctx().verbose) {
        fmt::print("    {}PASS{}: {} ({}:{})\n",
                     col(color::green), col(color::reset),
                     expr, loc.file_name(), loc.line());
    }
}

// ---------------------------------------------------------------------------
// Auto-registration
// ---------------------------------------------------------------------------

struct AutoRegister {
    AutoRegister(std::string_view name, std::function<void()> func,
                 std::source_location loc = std::source_location::current()) {
        registry().push_back({name, loc.file_name(), static_cast<int>(loc.line()), std::move(func)});
    }
};

// ---------------------------------------------------------------------------
// Async helpers
// ---------------------------------------------------------------------------

/// Poll `pred` until it holds or `timeout` passes. Returns pred().
template<typename Pred>
bool wait_until(Pred&& pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline)
            return pred();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

/// Pump `loop` on this thread until `pred` holds or `timeout` passes.
template<typename Pred>
bool pump_until(RunLoop& loop, Pred&& pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    return loop.run_until(std::forward<Pred>(pred), timeout);
}

// ---------------------------------------------------------------------------
// Runner
// ---------------------------------------------------------------------------

inline int run_all(int argc = 0, const char** argv = nullptr) {
    auto& c = ctx();
    c.passed = 0;
    c.failed = 0;
    c.checks = 0;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg.starts_with("--filter=")) {
            c.filter = std::string(arg.substr(9));
        } else if (arg == "--no-color") {
            c.use_color = false;
        } else if (arg == "--verbose") {
            c.verbose = true;
        } else if (arg == "--list") {
            for (auto& tc : registry())
                fmt::print("{}\n", tc.name);
            return 0;
        }
    }

    // Collect matching tests
    std::vector<TestCase*> to_run;
    for (auto& tc : registry()) {
        if (c.filter.empty() ||
            std::string_view(tc.name).find(c.filter) != std::string_view::npos) {
            to_run.push_back(&tc);
        }
    }

    fmt::print("{}[==========]{} Running {} test{}\n",
               col(color::bold), col(color::reset),
                 to_run.size(), to_run.size() == 1 ? "" : "s");

    auto wall_start = std::chrono::high_resolution_clock::now();

    for (auto* tc : to_run) {
        fmt::print("{}[ RUN      ]{} {}\n", col(color::green), col(color::reset), tc->name);
        c.current_failed = false;
        auto t0 = std::chrono::high_resolution_clock::now();

        try {
            tc->func();
        } catch (const TestFailure&) {
            // Fatal assertion -- already recorded
        } catch (const std::exception& e) {
            c.current_failed = true;
            fmt::print(stderr, "    {}Unhandled exception{}: {}\n", col(color::red), col(color::reset), e.what());
        } catch (...) {
            c.current_failed = true;
            fmt::print(stderr, "    {}Unhandled unknown exception{}\n", col(color::red), col(color::reset));
        }

        auto t1 = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

        if (c.current_failed) {
            c.failed++;
            fmt::print("{}[  FAILED  ]{} {} ({:.1f}ms)\n", col(color::red), col(color::reset), tc->name, ms);
        } else {
            c.passed++;
            fmt::print("{}[       OK ]{} {} ({:.1f}ms)\n", col(color::green), col(color::reset), tc->name, ms);
        }
    }

    auto wall_end = std::chrono::high_resolution_clock::now();
    double total_ms = std::chrono::duration<double, std::milli>(wall_end - wall_start).count();

    const int p = c.passed.load();
    const int f = c.failed.load();
    fmt::print("{}[==========]{} {}{} passed{}, {}{} failed{} ({:.1f}ms total)\n",
               col(color::bold), col(color::reset),
               col(color::green), p, col(color::reset),
               f ? col(color::red) : col(color::green), f, col(color::reset),
               total_ms);

    return f > 0 ? 1 : 0;
}

// ---------------------------------------------------------------------------
// Static assertion support
// ---------------------------------------------------------------------------

#define STATIC_REQUIRE(expr) static_assert(expr, "STATIC_REQUIRE(" #expr ") failed")

} // namespace metacache::test

// ===========================================================================
// Macros  (must be outside namespace)
// ===========================================================================

// Unique identifier helpers
#define METACACHE_TEST_CAT2(a, b) a##b
#define METACACHE_TEST_CAT(a, b) METACACHE_TEST_CAT2(a, b)

// ---------------------------------------------------------------------------
// TEST_CASE
// ---------------------------------------------------------------------------

#define TEST_CASE(tname)                                                       \
    static void METACACHE_TEST_CAT(metacache_test_func_, __LINE__)();          \
    static ::metacache::test::AutoRegister                                     \
        METACACHE_TEST_CAT(metacache_test_reg_, __LINE__)(                     \
            tname, METACACHE_TEST_CAT(metacache_test_func_, __LINE__));        \
    static void METACACHE_TEST_CAT(metacache_test_func_, __LINE__)()

// ---------------------------------------------------------------------------
// SECTION
// ---------------------------------------------------------------------------

#define SECTION(sname)                                                         \
    if (::metacache::test::ctx().verbose)                                      \
        fmt::print("  {}-- {}{}\n", ::metacache::test::col(::metacache::test::color::yellow), sname, \
                     ::metacache::test::col(::metacache::test::color::reset)); \
    if (true)

// ---------------------------------------------------------------------------
// REQUIRE / CHECK  (boolean)
// ---------------------------------------------------------------------------

#define REQUIRE(expr)                                                          \
    do {                                                                       \
        if (!(expr)) {                                                         \
            ::metacache::test::fail_assert(#expr, "", "",                      \
                std::source_location::current());                              \
            throw ::metacache::test::TestFailure{};                            \
        }                                                                      \
        ::metacache::test::pass_assert(#expr, std::source_location::current()); \
    } while (0)

#define CHECK(expr)                                                            \
    do {                                                                       \
        if (!(expr)) {                                                         \
            ::metacache::test::fail_assert(#expr, "", "",                      \
                std::source_location::current());                              \
        } else {                                                               \
            ::metacache::test::pass_assert(#expr, std::source_location::current()); \
        }                                                                      \
    } while (0)

// ---------------------------------------------------------------------------
// Comparison macros  (generic helper)
// ---------------------------------------------------------------------------

#define METACACHE_CMP_ASSERT(a, b, op, fatal)                                  \
    do {                                                                       \
        const auto _mc_a = (a);                                                \
        const auto _mc_b = (b);                                                \
        if (!(_mc_a op _mc_b)) {                                               \
            ::metacache::test::fail_cmp(#a " " #op " " #b,                     \
                _mc_a, _mc_b, std::source_location::current());                \
            if constexpr (fatal) throw ::metacache::test::TestFailure{};       \
        } else {                                                               \
            ::metacache::test::pass_assert(#a " " #op " " #b,                  \
                std::source_location::current());                              \
        }                                                                      \
    } while (0)

#define REQUIRE_EQ(a, b) METACACHE_CMP_ASSERT(a, b, ==, true)
#define CHECK_EQ(a, b)   METACACHE_CMP_ASSERT(a, b, ==, false)
#define REQUIRE_NE(a, b) METACACHE_CMP_ASSERT(a, b, !=, true)
#define CHECK_NE(a, b)   METACACHE_CMP_ASSERT(a, b, !=, false)
#define REQUIRE_LT(a, b) METACACHE_CMP_ASSERT(a, b, <,  true)
#define CHECK_LT(a, b)   METACACHE_CMP_ASSERT(a, b, <,  false)
#define REQUIRE_GT(a, b) METACACHE_CMP_ASSERT(a, b, >,  true)
#define CHECK_GT(a, b)   METACACHE_CMP_ASSERT(a, b, >,  false)
#define REQUIRE_LE(a, b) METACACHE_CMP_ASSERT(a, b, <=, true)
#define CHECK_LE(a, b)   METACACHE_CMP_ASSERT(a, b, <=, false)
#define REQUIRE_GE(a, b) METACACHE_CMP_ASSERT(a, b, >=, true)
#define CHECK_GE(a, b)   METACACHE_CMP_ASSERT(a, b, >=, false)

// ---------------------------------------------------------------------------
// REQUIRE_NEAR / CHECK_NEAR  (floating point)
// ---------------------------------------------------------------------------

#define METACACHE_NEAR_ASSERT(a, b, eps, fatal)                                \
    do {                                                                       \
        const auto _mc_a = static_cast<double>(a);                             \
        const auto _mc_b = static_cast<double>(b);                             \
        const auto _mc_e = static_cast<double>(eps);                           \
        if (std::fabs(_mc_a - _mc_b) > _mc_e) {                                \
            ::metacache::test::fail_assert(                                    \
                #a " ~= " #b " (eps=" #eps ")",                                \
                ::metacache::test::to_string_val(_mc_a),                       \
                ::metacache::test::to_string_val(_mc_b),                       \
                std::source_location::current());                              \
            if constexpr (fatal) throw ::metacache::test::TestFailure{};       \
        } else {                                                               \
            ::metacache::test::pass_assert(#a " ~= " #b,                       \
                std::source_location::current());                              \
        }                                                                      \
    } while (0)

#define REQUIRE_NEAR(a, b, eps) METACACHE_NEAR_ASSERT(a, b, eps, true)
#define CHECK_NEAR(a, b, eps)   METACACHE_NEAR_ASSERT(a, b, eps, false)

// ---------------------------------------------------------------------------
// REQUIRE_THROWS / CHECK_THROWS
// ---------------------------------------------------------------------------

#define REQUIRE_THROWS(expr)                                                   \
    do {                                                                       \
        bool _mc_threw = false;                                                \
        try { (void)(expr); } catch (...) { _mc_threw = true; }                \
        if (!_mc_threw) {                                                      \
            ::metacache::test::fail_assert(#expr " throws", "", "",            \
                std::source_location::current());                              \
            throw ::metacache::test::TestFailure{};                            \
        }                                                                      \
        ::metacache::test::pass_assert(#expr " throws",                        \
            std::source_location::current());                                  \
    } while (0)

#define CHECK_THROWS(expr)                                                     \
    do {                                                                       \
        bool _mc_threw = false;                                                \
        try { (void)(expr); } catch (...) { _mc_threw = true; }                \
        if (!_mc_threw) {                                                      \
            ::metacache::test::fail_assert(#expr " throws", "", "",            \
                std::source_location::current());                              \
        } else {                                                               \
            ::metacache::test::pass_assert(#expr " throws",                    \
                std::source_location::current());                              \
        }                                                                      \
    } while (0)

// ---------------------------------------------------------------------------
// METACACHE_TEST_MAIN
// ---------------------------------------------------------------------------

#define METACACHE_TEST_MAIN()                                                  \
    int main(int argc, const char** argv) {                                    \
        return ::metacache::test::run_all(argc, argv);                         \
    }
