// metacache/bench.hpp -- self-registering benchmark runner
//
// Each BENCHMARK body is timed call by call until the time budget or the
// sample cap is reached. The workloads here are whole cache or load
// round trips, so there is no inner-loop calibration.

#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace metacache::bench {

using Clock = std::chrono::steady_clock;

struct Case {
    std::string_view      name;
    std::function<void()> body;
};

struct Options {
    std::string               filter;
    std::chrono::milliseconds budget{300};
    std::size_t               max_samples = 100'000;
};

inline std::vector<Case>& cases() {
    static std::vector<Case> c;
    return c;
}

inline Options& options() {
    static Options o;
    return o;
}

struct Registrar {
    Registrar(std::string_view name, std::function<void()> body) {
        cases().push_back({name, std::move(body)});
    }
};

struct Summary {
    std::size_t samples = 0;
    double      min_ns  = 0;
    double      p50_ns  = 0;
    double      p90_ns  = 0;
    double      mean_ns = 0;
};

inline Summary summarize(std::vector<double> ns) {
    Summary s;
    if (ns.empty()) return s;
    std::ranges::sort(ns);
    double sum = 0;
    for (double v : ns) sum += v;
    s.samples = ns.size();
    s.min_ns  = ns.front();
    s.p50_ns  = ns[ns.size() / 2];
    s.p90_ns  = ns[std::min(ns.size() - 1, ns.size() * 9 / 10)];
    s.mean_ns = sum / static_cast<double>(ns.size());
    return s;
}

inline std::string human(double ns) {
    if (ns < 1e3) return fmt::format("{:.0f} ns", ns);
    if (ns < 1e6) return fmt::format("{:.2f} us", ns / 1e3);
    if (ns < 1e9) return fmt::format("{:.2f} ms", ns / 1e6);
    return fmt::format("{:.2f} s", ns / 1e9);
}

inline Summary measure(const std::function<void()>& body) {
    const auto& opt = options();
    body();  // warm up caches and lazily built statics

    std::vector<double> ns;
    const auto stop_at = Clock::now() + opt.budget;
    while (ns.size() < opt.max_samples && Clock::now() < stop_at) {
        auto t0 = Clock::now();
        body();
        ns.push_back(std::chrono::duration<double, std::nano>(Clock::now() - t0).count());
    }
    return summarize(std::move(ns));
}

inline int run(int argc, const char** argv) {
    auto& opt = options();
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg.starts_with("--filter=")) {
            opt.filter = std::string(arg.substr(9));
        } else if (arg.starts_with("--time=")) {
            opt.budget = std::chrono::milliseconds(std::stoll(std::string(arg.substr(7))));
        } else if (arg == "--list") {
            for (const auto& c : cases()) fmt::print("{}\n", c.name);
            return 0;
        }
    }

    for (const auto& c : cases()) {
        if (!opt.filter.empty() && c.name.find(opt.filter) == std::string_view::npos)
            continue;
        auto s = measure(c.body);
        fmt::print("{:<44} p50 {:>10}  p90 {:>10}  min {:>10}  mean {:>10}  ({} runs)\n",
                   c.name, human(s.p50_ns), human(s.p90_ns), human(s.min_ns),
                   human(s.mean_ns), s.samples);
    }
    return 0;
}

} // namespace metacache::bench

#define METACACHE_BENCH_JOIN2(a, b) a##b
#define METACACHE_BENCH_JOIN(a, b)  METACACHE_BENCH_JOIN2(a, b)

#define BENCHMARK(bname)                                                       \
    static void METACACHE_BENCH_JOIN(metacache_bench_body_, __LINE__)();       \
    static const ::metacache::bench::Registrar                                 \
        METACACHE_BENCH_JOIN(metacache_bench_reg_, __LINE__){                  \
            bname, METACACHE_BENCH_JOIN(metacache_bench_body_, __LINE__)};     \
    static void METACACHE_BENCH_JOIN(metacache_bench_body_, __LINE__)()

#define BENCH_MAIN()                                                           \
    int main(int argc, const char** argv) {                                    \
        return ::metacache::bench::run(argc, argv);                            \
    }
