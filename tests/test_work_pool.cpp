#include <metacache/test.hpp>
#include <metacache/work_pool.hpp>
#include "fixtures.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using metacache::ExecutionOrder;
using metacache::WorkPool;

namespace {

struct OrderLog {
    std::mutex               mu;
    std::vector<std::string> order;

    void add(std::string s) {
        std::lock_guard lk(mu);
        order.push_back(std::move(s));
    }
};

} // namespace

TEST_CASE("WorkPool runs every job") {
    WorkPool pool(3);
    std::atomic<int> counter{0};
    for (int i = 0; i < 64; ++i)
        pool.submit([&counter] { counter.fetch_add(1); });
    pool.wait_idle();
    REQUIRE_EQ(counter.load(), 64);
    REQUIRE_EQ(pool.max_concurrent(), std::size_t(3));
}

TEST_CASE("WorkPool never exceeds its concurrency bound") {
    constexpr std::size_t K = 3;
    WorkPool pool(K);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    for (int i = 0; i < 24; ++i) {
        pool.submit([&] {
            int now = running.fetch_add(1) + 1;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(2ms);
            running.fetch_sub(1);
        });
    }
    pool.wait_idle();
    REQUIRE_LE(peak.load(), int(K));
    REQUIRE_GE(peak.load(), 1);
}

TEST_CASE("WorkPool fifo starts the oldest queued job first") {
    WorkPool pool(1, ExecutionOrder::fifo, /*suspended=*/true);
    OrderLog log;
    for (const char* k : {"a", "b", "c"})
        pool.submit([&log, k] { log.add(k); });

    REQUIRE_EQ(pool.pending(), std::size_t(3));
    pool.set_suspended(false);
    pool.wait_idle();

    REQUIRE_EQ(log.order.size(), std::size_t(3));
    REQUIRE_EQ(log.order[0], std::string("a"));
    REQUIRE_EQ(log.order[1], std::string("b"));
    REQUIRE_EQ(log.order[2], std::string("c"));
}

TEST_CASE("WorkPool lifo starts the newest queued job first") {
    WorkPool pool(1, ExecutionOrder::lifo);
    OrderLog log;
    fixtures::Gate gate;
    std::atomic<bool> blocker_started{false};

    // Occupy the only worker so the next three jobs queue up.
    pool.submit([&] { blocker_started = true; gate.wait(); });
    REQUIRE(metacache::test::wait_until([&] { return blocker_started.load(); }));

    for (const char* k : {"a", "b", "c"})
        pool.submit([&log, k] { log.add(k); });
    gate.open();
    pool.wait_idle();

    REQUIRE_EQ(log.order.size(), std::size_t(3));
    REQUIRE_EQ(log.order[0], std::string("c"));
    REQUIRE_EQ(log.order[1], std::string("b"));
    REQUIRE_EQ(log.order[2], std::string("a"));
}

TEST_CASE("WorkPool order can change while jobs are queued") {
    WorkPool pool(1, ExecutionOrder::fifo, /*suspended=*/true);
    OrderLog log;
    for (const char* k : {"a", "b", "c"})
        pool.submit([&log, k] { log.add(k); });

    pool.set_order(ExecutionOrder::lifo);
    REQUIRE(pool.order() == ExecutionOrder::lifo);
    pool.set_suspended(false);
    pool.wait_idle();

    REQUIRE_EQ(log.order[0], std::string("c"));
    REQUIRE_EQ(log.order[2], std::string("a"));
}

TEST_CASE("WorkPool cancel removes only queued jobs") {
    WorkPool pool(1, ExecutionOrder::fifo, /*suspended=*/true);
    OrderLog log;
    auto a = pool.submit([&] { log.add("a"); });
    auto b = pool.submit([&] { log.add("b"); });
    pool.submit([&] { log.add("c"); });

    REQUIRE(pool.cancel(b));
    REQUIRE(!pool.cancel(b));
    pool.set_suspended(false);
    pool.wait_idle();

    REQUIRE(!pool.cancel(a));  // already ran
    REQUIRE_EQ(log.order.size(), std::size_t(2));
    REQUIRE_EQ(log.order[0], std::string("a"));
    REQUIRE_EQ(log.order[1], std::string("c"));
}

TEST_CASE("WorkPool cancel_pending keeps the running job") {
    WorkPool pool(1);
    fixtures::Gate gate;
    std::atomic<bool> started{false};
    std::atomic<int> ran{0};

    pool.submit([&] { started = true; gate.wait(); ran.fetch_add(1); });
    REQUIRE(metacache::test::wait_until([&] { return started.load(); }));
    for (int i = 0; i < 5; ++i)
        pool.submit([&] { ran.fetch_add(1); });

    REQUIRE_EQ(pool.cancel_pending(), std::size_t(5));
    REQUIRE_EQ(pool.active(), std::size_t(1));
    gate.open();
    pool.wait_idle();
    REQUIRE_EQ(ran.load(), 1);
}

TEST_CASE("WorkPool suspended pool starts nothing") {
    WorkPool pool(2, ExecutionOrder::fifo, /*suspended=*/true);
    std::atomic<int> ran{0};
    pool.submit([&] { ran.fetch_add(1); });
    std::this_thread::sleep_for(20ms);
    REQUIRE_EQ(ran.load(), 0);
    REQUIRE(pool.suspended());

    pool.set_suspended(false);
    pool.wait_idle();
    REQUIRE_EQ(ran.load(), 1);
}

METACACHE_TEST_MAIN()
