#pragma once
#include "executor.hpp"
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <deque>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <atomic>
#include <algorithm>
#include <string_view>

namespace metacache {

enum class ExecutionOrder : std::uint8_t {
    fifo = 0,   // oldest queued job starts first
    lifo,       // newest queued job starts first
};

[[nodiscard]] constexpr std::string_view execution_order_name(ExecutionOrder o) noexcept {
    return o == ExecutionOrder::fifo ? "fifo" : "lifo";
}

// ---------------------------------------------------------------------------
// WorkPool
//
// Bounded worker pool with an explicit ready queue. At most `max_concurrent`
// jobs run at once; jobs waiting for a slot are started oldest-first (fifo)
// or newest-first (lifo). The order only affects jobs still queued.
//
// Queued jobs can be cancelled individually by id. A suspended pool keeps
// accepting jobs but starts none until resumed.
// ---------------------------------------------------------------------------
class WorkPool final {
public:
    using JobId = std::uint64_t;

    explicit WorkPool(std::size_t max_concurrent,
                      ExecutionOrder order = ExecutionOrder::fifo,
                      bool suspended = false)
        : order_{order}, suspended_{suspended}, next_id_{1}, active_{0}
    {
        max_concurrent = std::max<std::size_t>(1, max_concurrent);
        workers_.reserve(max_concurrent);
        for (std::size_t i = 0; i < max_concurrent; ++i) {
            workers_.emplace_back([this](std::stop_token stop) {
                worker_loop(stop);
            });
        }
    }

    // Queued jobs are dropped; running jobs finish before the workers join.
    ~WorkPool() {
        cancel_pending();
        for (auto& w : workers_)
            w.request_stop();
        cv_.notify_all();
    }

    JobId submit(Task task) {
        JobId id;
        {
            std::lock_guard lk(mu_);
            id = next_id_++;
            ready_.push_back(Entry{id, std::move(task)});
        }
        cv_.notify_one();
        return id;
    }

    /// Removes a job that has not started. False once it has started or
    /// was already removed.
    bool cancel(JobId id) {
        {
            std::lock_guard lk(mu_);
            auto it = std::find_if(ready_.begin(), ready_.end(),
                                   [id](const Entry& e) { return e.id == id; });
            if (it == ready_.end())
                return false;
            ready_.erase(it);
        }
        idle_cv_.notify_all();
        return true;
    }

    // Discard all pending jobs; in-flight jobs continue to completion.
    std::size_t cancel_pending() {
        std::size_t n;
        {
            std::lock_guard lk(mu_);
            n = ready_.size();
            ready_.clear();
        }
        idle_cv_.notify_all();
        return n;
    }

    void set_suspended(bool suspended) {
        {
            std::lock_guard lk(mu_);
            suspended_ = suspended;
        }
        if (!suspended)
            cv_.notify_all();
    }

    [[nodiscard]] bool suspended() const {
        std::lock_guard lk(mu_);
        return suspended_;
    }

    void set_order(ExecutionOrder order) {
        std::lock_guard lk(mu_);
        order_ = order;
    }

    [[nodiscard]] ExecutionOrder order() const {
        std::lock_guard lk(mu_);
        return order_;
    }

    [[nodiscard]] std::size_t pending() const {
        std::lock_guard lk(mu_);
        return ready_.size();
    }

    [[nodiscard]] std::size_t active() const noexcept {
        return active_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::size_t max_concurrent() const noexcept {
        return workers_.size();
    }

    // Block until nothing is queued or running. Never returns while the
    // pool is suspended with queued jobs.
    void wait_idle() {
        std::unique_lock lk(mu_);
        idle_cv_.wait(lk, [this] {
            return ready_.empty() && active_.load(std::memory_order_relaxed) == 0;
        });
    }

    WorkPool(const WorkPool&) = delete;
    WorkPool& operator=(const WorkPool&) = delete;

private:
    struct Entry {
        JobId id;
        Task  task;
    };

    void worker_loop(std::stop_token stop) {
        for (;;) {
            Task task;
            {
                std::unique_lock lk(mu_);
                cv_.wait(lk, [&] {
                    return stop.stop_requested() || (!suspended_ && !ready_.empty());
                });
                if (stop.stop_requested())
                    return;

                if (order_ == ExecutionOrder::fifo) {
                    task = std::move(ready_.front().task);
                    ready_.pop_front();
                } else {
                    task = std::move(ready_.back().task);
                    ready_.pop_back();
                }
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

    std::deque<Entry>                    ready_;
    ExecutionOrder                       order_;
    bool                                 suspended_;
    JobId                                next_id_;
    mutable std::mutex                   mu_;
    std::condition_variable              cv_;
    std::condition_variable              idle_cv_;
    std::atomic<std::size_t>             active_;
    std::vector<std::jthread>            workers_;  // Must be last: destroyed first to join threads
};

} // namespace metacache
