#include <metacache/test.hpp>
#include <metacache/executor.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("ThreadPool submit returns a future") {
    metacache::ThreadPool pool(2);
    auto fut = pool.submit([] { return 42; });
    REQUIRE_EQ(fut.get(), 42);
}

TEST_CASE("ThreadPool post and wait_idle") {
    metacache::ThreadPool pool(4);
    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i)
        pool.post([&counter] { counter.fetch_add(1); });

    pool.wait_idle();
    REQUIRE_EQ(counter.load(), 100);
    REQUIRE_EQ(pool.pending(), std::size_t(0));
    REQUIRE_EQ(pool.active(), std::size_t(0));
    REQUIRE_EQ(pool.worker_count(), std::size_t(4));
}

TEST_CASE("ThreadPool is_current only on its own workers") {
    metacache::ThreadPool pool(2);
    metacache::ThreadPool other(1);
    REQUIRE(!pool.is_current());

    auto inside = pool.submit([&] { return pool.is_current(); });
    auto cross  = pool.submit([&] { return other.is_current(); });
    REQUIRE(inside.get());
    REQUIRE(!cross.get());
}

TEST_CASE("ThreadPool drains queued tasks on destruction") {
    std::atomic<int> counter{0};
    {
        metacache::ThreadPool pool(1);
        for (int i = 0; i < 20; ++i)
            pool.post([&counter] {
                std::this_thread::sleep_for(100us);
                counter.fetch_add(1);
            });
    }
    REQUIRE_EQ(counter.load(), 20);
}

TEST_CASE("SerialQueue runs tasks one at a time in order") {
    metacache::SerialQueue queue;
    std::vector<int> order;
    std::atomic<int> running{0};
    std::atomic<int> max_running{0};

    for (int i = 0; i < 50; ++i) {
        queue.post([&, i] {
            int now = running.fetch_add(1) + 1;
            int prev = max_running.load();
            while (now > prev && !max_running.compare_exchange_weak(prev, now)) {}
            order.push_back(i);
            running.fetch_sub(1);
        });
    }
    queue.wait_idle();

    REQUIRE_EQ(order.size(), std::size_t(50));
    for (int i = 0; i < 50; ++i)
        REQUIRE_EQ(order[static_cast<std::size_t>(i)], i);
    REQUIRE_EQ(max_running.load(), 1);
}

TEST_CASE("SerialQueue is_current inside its tasks") {
    metacache::SerialQueue queue;
    std::atomic<bool> inside{false};
    queue.post([&] { inside = queue.is_current(); });
    queue.wait_idle();
    REQUIRE(inside.load());
    REQUIRE(!queue.is_current());
}

TEST_CASE("RunLoop runs nothing until pumped") {
    metacache::RunLoop loop;
    int ran = 0;
    loop.post([&] { ++ran; });
    loop.post([&] { ++ran; });
    REQUIRE_EQ(ran, 0);
    REQUIRE_EQ(loop.pending(), std::size_t(2));

    REQUIRE_EQ(loop.run_once(), std::size_t(2));
    REQUIRE_EQ(ran, 2);
    REQUIRE_EQ(loop.run_once(), std::size_t(0));
}

TEST_CASE("RunLoop run_until picks up work posted from other threads") {
    metacache::RunLoop loop;
    metacache::ThreadPool pool(2);
    std::thread::id delivered_on;
    bool done = false;

    pool.post([&] {
        std::this_thread::sleep_for(5ms);
        loop.post([&] {
            delivered_on = std::this_thread::get_id();
            done = true;
        });
    });

    REQUIRE(loop.run_until([&] { return done; }, 2s));
    REQUIRE(delivered_on == std::this_thread::get_id());
}

TEST_CASE("RunLoop run_until times out") {
    metacache::RunLoop loop;
    auto t0 = std::chrono::steady_clock::now();
    REQUIRE(!loop.run_until([] { return false; }, 30ms));
    REQUIRE(std::chrono::steady_clock::now() - t0 >= 30ms);
}

TEST_CASE("dispatch runs inline on the current executor, posts otherwise") {
    metacache::RunLoop loop;
    std::vector<int> order;

    metacache::dispatch(loop, [&] { order.push_back(1); });
    REQUIRE(order.empty());

    loop.post([&] {
        REQUIRE(loop.is_current());
        metacache::dispatch(loop, [&] { order.push_back(2); });
        order.push_back(3);
    });
    loop.run_once();

    REQUIRE_EQ(order.size(), std::size_t(3));
    REQUIRE_EQ(order[0], 1);
    REQUIRE_EQ(order[1], 2);
    REQUIRE_EQ(order[2], 3);
    REQUIRE(!loop.is_current());
}

METACACHE_TEST_MAIN()
