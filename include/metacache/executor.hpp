#pragma once
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <queue>
#include <deque>
#include <vector>
#include <cstddef>
#include <atomic>
#include <chrono>
#include <type_traits>
#include <utility>
#include <algorithm>

namespace metacache {

using Task = std::function<void()>;

class Executor;

namespace detail {

// The executor whose task is running on this thread, if any.
inline const Executor*& current_executor() noexcept {
    thread_local const Executor* current = nullptr;
    return current;
}

class CurrentExecutorScope final {
public:
    explicit CurrentExecutorScope(const Executor* ex) noexcept
        : prev_{current_executor()} { current_executor() = ex; }
    ~CurrentExecutorScope() { current_executor() = prev_; }

    CurrentExecutorScope(const CurrentExecutorScope&) = delete;
    CurrentExecutorScope& operator=(const CurrentExecutorScope&) = delete;

private:
    const Executor* prev_;
};

} // namespace detail

// ---------------------------------------------------------------------------
// Executor
//
// Execution context that components are handed at construction. The cache I/O
// context, the completion (delivery) context and test loops all implement it.
// ---------------------------------------------------------------------------
class Executor {
public:
    virtual ~Executor() = default;

    virtual void post(Task task) = 0;

    /// True when called from a task this executor is running.
    [[nodiscard]] bool is_current() const noexcept {
        return detail::current_executor() == this;
    }
};

/// Run inline when already on `ex`, otherwise post.
inline void dispatch(Executor& ex, Task task) {
    if (ex.is_current())
        task();
    else
        ex.post(std::move(task));
}

// ---------------------------------------------------------------------------
// ThreadPool
//
// FIFO worker pool using std::jthread with cooperative shutdown via
// stop_token. Queued tasks are drained before the workers exit.
// ---------------------------------------------------------------------------
class ThreadPool final : public Executor {
public:
    explicit ThreadPool(std::size_t num_workers = 0)
        : active_{0}
    {
        if (num_workers == 0)
            num_workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());

        workers_.reserve(num_workers);
        for (std::size_t i = 0; i < num_workers; ++i) {
            workers_.emplace_back([this](std::stop_token stop) {
                worker_loop(stop);
            });
        }
    }

    ~ThreadPool() override {
        for (auto& w : workers_)
            w.request_stop();
        cv_.notify_all();
    }

    void post(Task task) override {
        {
            std::lock_guard lk(mu_);
            queue_.push(std::move(task));
        }
        cv_.notify_one();
    }

    // Submit a callable, returning a future for the result.
    template <typename F>
    [[nodiscard]] auto submit(F&& func) -> std::future<std::invoke_result_t<F>>
    {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(func));
        auto fut = task->get_future();
        post([t = std::move(task)]() { (*t)(); });
        return fut;
    }

    [[nodiscard]] std::size_t worker_count() const noexcept {
        return workers_.size();
    }

    [[nodiscard]] std::size_t pending() const {
        std::lock_guard lk(mu_);
        return queue_.size();
    }

    [[nodiscard]] std::size_t active() const noexcept {
        return active_.load(std::memory_order_relaxed);
    }

    // Block until queue is drained and no workers are active.
    void wait_idle() {
        std::unique_lock lk(mu_);
        idle_cv_.wait(lk, [this] {
            return queue_.empty() && active_.load(std::memory_order_relaxed) == 0;
        });
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

private:
    void worker_loop(std::stop_token stop) {
        detail::CurrentExecutorScope scope{this};
        for (;;) {
            Task task;
            {
                std::unique_lock lk(mu_);
                cv_.wait(lk, [&] {
                    return stop.stop_requested() || !queue_.empty();
                });
                if (queue_.empty())
                    return;
                task = std::move(queue_.front());
                queue_.pop();
                active_.fetch_add(1, std::memory_order_relaxed);
            }
            task();
            {
                std::lock_guard lk(mu_);
                active_.fetch_sub(1, std::memory_order_relaxed);
            }
            idle_cv_.notify_all();
        }
    }

    std::queue<Task>                     queue_;
    mutable std::mutex                   mu_;
    std::condition_variable              cv_;
    std::condition_variable              idle_cv_;
    std::atomic<std::size_t>             active_;
    std::vector<std::jthread>            workers_;  // Must be last: destroyed first to join threads
};

/// Single-worker pool: tasks run one at a time in submission order.
class SerialQueue final : public Executor {
public:
    SerialQueue() : pool_{1} {}

    void post(Task task) override {
        pool_.post([this, t = std::move(task)] {
            detail::CurrentExecutorScope scope{this};
            t();
        });
    }

    void wait_idle() { pool_.wait_idle(); }
    [[nodiscard]] std::size_t pending() const { return pool_.pending(); }

private:
    ThreadPool pool_;
};

// ---------------------------------------------------------------------------
// RunLoop
//
// Manually pumped queue. Whichever thread calls run_once()/run_until() is the
// context; typically the application's main thread, used as the single
// designated delivery context for completion callbacks.
// ---------------------------------------------------------------------------
class RunLoop final : public Executor {
public:
    using Clock = std::chrono::steady_clock;

    RunLoop() = default;
    RunLoop(const RunLoop&) = delete;
    RunLoop& operator=(const RunLoop&) = delete;

    void post(Task task) override {
        {
            std::lock_guard lk(mu_);
            queue_.push_back(std::move(task));
        }
        cv_.notify_all();
    }

    /// Run every task queued at the time of the call (and those they post
    /// inline). Returns the number of tasks run.
    std::size_t run_once() {
        std::deque<Task> batch;
        {
            std::lock_guard lk(mu_);
            batch.swap(queue_);
        }
        detail::CurrentExecutorScope scope{this};
        for (auto& t : batch)
            t();
        return batch.size();
    }

    /// Pump until `pred` holds or `timeout` elapses. Returns pred().
    template <typename Pred>
    bool run_until(Pred&& pred, std::chrono::milliseconds timeout) {
        const auto deadline = Clock::now() + timeout;
        for (;;) {
            run_once();
            if (pred())
                return true;
            if (Clock::now() >= deadline)
                return false;
            std::unique_lock lk(mu_);
            cv_.wait_until(lk, std::min(deadline, Clock::now() + std::chrono::milliseconds(10)),
                           [this] { return !queue_.empty(); });
        }
    }

    /// Pump for the whole duration.
    void run_for(std::chrono::milliseconds duration) {
        (void)run_until([] { return false; }, duration);
    }

    [[nodiscard]] std::size_t pending() const {
        std::lock_guard lk(mu_);
        return queue_.size();
    }

private:
    std::deque<Task>        queue_;
    mutable std::mutex      mu_;
    std::condition_variable cv_;
};

} // namespace metacache
