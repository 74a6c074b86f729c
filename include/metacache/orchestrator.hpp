#pragma once
#include "cache_store.hpp"
#include "error.hpp"
#include "executor.hpp"
#include "load_coordinator.hpp"
#include "log.hpp"
#include "traits.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace metacache {

struct MetadataOptions {
    bool        query_data_when_in_memory = false;
    bool        query_disk_sync           = false;
    bool        from_cache_only           = false;  // never load on a miss
    bool        cache_memory_only         = false;  // loaded results skip the disk tier
    LoadOptions load{};
};

template<Asset A, Metadata M>
struct MetadataResult {
    std::optional<M>     metadata;
    std::optional<Error> error;
    CacheTier            tier     = CacheTier::none;
    bool                 finished = false;
    std::optional<A>     asset;
};

template<Asset A, Metadata M>
class Orchestrator;

// ---------------------------------------------------------------------------
// CombinedOperation -- handle for one load_metadata() call.
//
// Spans the cache query and the load fallback. Cancelling is idempotent and
// suppresses every later delivery for the call.
// ---------------------------------------------------------------------------
class CombinedOperation final {
public:
    using CancelLoad = std::function<bool(const LoadToken&)>;

    CombinedOperation(const CombinedOperation&)            = delete;
    CombinedOperation& operator=(const CombinedOperation&) = delete;

    void cancel()
    {
        std::lock_guard lock{mu_};
        if (cancelled_ || done_)
            return;
        cancelled_ = true;
        if (query_) {
            query_->cancel();
            query_.reset();
        }
        if (token_) {
            cancel_load_(*token_);
            token_.reset();
        }
        leave_running_set();
    }

    [[nodiscard]] bool cancelled() const
    {
        std::lock_guard lock{mu_};
        return cancelled_;
    }

    /// Terminal result delivered.
    [[nodiscard]] bool done() const
    {
        std::lock_guard lock{mu_};
        return done_;
    }

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }

private:
    template<Asset A, Metadata M>
    friend class Orchestrator;

    struct RunningSet {
        std::mutex                                                        mu;
        std::unordered_map<std::uint64_t, std::shared_ptr<CombinedOperation>> ops;
    };

    CombinedOperation(std::uint64_t id, std::weak_ptr<RunningSet> running, CancelLoad cancel_load)
        : id_{id}, running_{std::move(running)}, cancel_load_{std::move(cancel_load)}
    {}

    [[nodiscard]] bool active() const
    {
        std::lock_guard lock{mu_};
        return !cancelled_ && !done_;
    }

    void attach_query(std::shared_ptr<QueryHandle> handle)
    {
        if (!handle) return;
        std::lock_guard lock{mu_};
        if (cancelled_ || done_)
            handle->cancel();
        else
            query_ = std::move(handle);
    }

    void attach_token(LoadToken token)
    {
        std::lock_guard lock{mu_};
        if (cancelled_ || done_)
            cancel_load_(token);
        else
            token_ = std::move(token);
    }

    // Marks the call terminal. False if it was already cancelled or done.
    bool complete()
    {
        std::lock_guard lock{mu_};
        if (cancelled_ || done_)
            return false;
        done_ = true;
        query_.reset();
        token_.reset();
        leave_running_set();
        return true;
    }

    // Caller holds mu_.
    void leave_running_set()
    {
        if (auto set = running_.lock()) {
            std::lock_guard lock{set->mu};
            set->ops.erase(id_);
        }
    }

    const std::uint64_t                id_;
    mutable std::mutex                 mu_;
    bool                               cancelled_ = false;
    bool                               done_      = false;
    std::shared_ptr<QueryHandle>       query_;
    std::optional<LoadToken>           token_;
    std::weak_ptr<RunningSet>          running_;
    CancelLoad                         cancel_load_;
};

// ---------------------------------------------------------------------------
// Orchestrator -- cache lookup with load fallback, as one cancellable call.
//
// The cache store, coordinator and completion executor are borrowed and must
// outlive the orchestrator. Destroy it on the completion executor (or once
// that executor is drained); the destructor cancels every running call.
// ---------------------------------------------------------------------------
template<Asset A, Metadata M>
class Orchestrator final {
public:
    using Result             = MetadataResult<A, M>;
    using ProgressCallback   = std::function<void(double)>;
    using CompletionCallback = std::function<void(const Result&)>;
    using ExistsCallback     = std::function<void(bool)>;

    Orchestrator(CacheStore<M>& cache, LoadCoordinator<A, M>& coordinator, Executor& completion)
        : cache_{cache}
        , coordinator_{coordinator}
        , completion_{completion}
        , running_{std::make_shared<CombinedOperation::RunningSet>()}
    {}

    ~Orchestrator() { cancel_all(); }

    Orchestrator(const Orchestrator&)            = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Answers from the cache when it can, otherwise loads and writes the
    /// result back. `completion` runs on the completion executor; it may see
    /// partial results (finished == false) before the terminal one.
    std::shared_ptr<CombinedOperation> load_metadata(const std::optional<A>& asset,
                                                     const MetadataOptions& options = {},
                                                     ProgressCallback progress = {},
                                                     CompletionCallback completion = {})
    {
        auto op = std::shared_ptr<CombinedOperation>(new CombinedOperation(
            next_id_.fetch_add(1, std::memory_order_relaxed), running_,
            [&coordinator = coordinator_](const LoadToken& token) {
                return coordinator.cancel(token);
            }));
        {
            std::lock_guard lock{running_->mu};
            running_->ops.emplace(op->id(), op);
        }

        if (!asset) {
            deliver(op, completion, Result{std::nullopt, Error::not_found(), CacheTier::none, true, std::nullopt});
            return op;
        }

        const std::string key = cache_key(*asset);
        CacheQueryOptions query_options{options.query_data_when_in_memory, options.query_disk_sync};

        auto handle = cache_.query(key, query_options,
            [this, op, asset = *asset, options, progress, completion](std::optional<M> cached, CacheTier tier) {
                if (!op->active())
                    return;
                if (cached) {
                    deliver(op, completion, Result{std::move(cached), std::nullopt, tier, true, asset});
                    return;
                }
                if (options.from_cache_only) {
                    deliver(op, completion, Result{std::nullopt, std::nullopt, CacheTier::none, true, asset});
                    return;
                }
                start_load(op, asset, options, progress, completion);
            });
        op->attach_query(std::move(handle));
        return op;
    }

    /// Cancels every call still running.
    void cancel_all()
    {
        std::vector<std::shared_ptr<CombinedOperation>> ops;
        {
            std::lock_guard lock{running_->mu};
            ops.reserve(running_->ops.size());
            for (auto& [id, op] : running_->ops)
                ops.push_back(op);
        }
        for (auto& op : ops)
            op->cancel();
    }

    [[nodiscard]] bool is_running() const
    {
        std::lock_guard lock{running_->mu};
        return !running_->ops.empty();
    }

    [[nodiscard]] std::size_t running_count() const
    {
        std::lock_guard lock{running_->mu};
        return running_->ops.size();
    }

    /// Write-through into both tiers, bypassing any load.
    void save_metadata(const M& metadata, const A& asset,
                       typename CacheStore<M>::DoneCallback on_done = {})
    {
        cache_.store(metadata, cache_key(asset), true, std::move(on_done));
    }

    /// Memory tier first, then a disk probe. `on_done` always runs on the
    /// completion executor (inline when the caller is already on it).
    void cached_exists(const std::optional<A>& asset, ExistsCallback on_done)
    {
        if (!asset) {
            answer(std::move(on_done), false);
            return;
        }
        const auto key = cache_key(*asset);
        if (cache_.in_memory(key)) {
            answer(std::move(on_done), true);
            return;
        }
        cache_.query_exists(key, std::move(on_done));
    }

    void disk_exists(const std::optional<A>& asset, ExistsCallback on_done)
    {
        if (!asset) {
            answer(std::move(on_done), false);
            return;
        }
        cache_.query_exists(cache_key(*asset), std::move(on_done));
    }

    [[nodiscard]] std::string cache_key(const A& asset) const { return asset.identifier(); }

    [[nodiscard]] CacheStore<M>& cache() noexcept { return cache_; }
    [[nodiscard]] LoadCoordinator<A, M>& coordinator() noexcept { return coordinator_; }

private:
    void start_load(const std::shared_ptr<CombinedOperation>& op, const A& asset,
                    const MetadataOptions& options, const ProgressCallback& progress,
                    const CompletionCallback& completion)
    {
        auto token = coordinator_.load(asset, options.load,
            [op, progress](double fraction) {
                if (progress && op->active())
                    progress(fraction);
            },
            [this, op, asset, to_disk = !options.cache_memory_only,
             completion](const LoadOutcome<M>& outcome) {
                if (!op->active())
                    return;
                if (outcome.error) {
                    deliver(op, completion, Result{std::nullopt, outcome.error, CacheTier::none, true, asset});
                    return;
                }
                if (!outcome.finished) {
                    deliver(op, completion, Result{outcome.metadata, std::nullopt, CacheTier::none, false, asset});
                    return;
                }
                if (outcome.metadata)
                    cache_.store(*outcome.metadata, cache_key(asset), to_disk);
                deliver(op, completion, Result{outcome.metadata, std::nullopt, CacheTier::none, true, asset});
            });
        if (token)
            op->attach_token(std::move(*token));
    }

    void answer(ExistsCallback on_done, bool found)
    {
        if (!on_done) return;
        dispatch(completion_, [on_done = std::move(on_done), found] { on_done(found); });
    }

    // Terminal results go through complete() so the call leaves the running
    // set exactly once; partial results leave it in place.
    void deliver(const std::shared_ptr<CombinedOperation>& op, const CompletionCallback& completion,
                 Result result)
    {
        dispatch(completion_, [op, completion, result = std::move(result)] {
            if (result.finished) {
                if (!op->complete())
                    return;
            } else if (!op->active()) {
                return;
            }
            if (completion)
                completion(result);
        });
    }

    CacheStore<M>&                                    cache_;
    LoadCoordinator<A, M>&                            coordinator_;
    Executor&                                         completion_;
    std::shared_ptr<CombinedOperation::RunningSet>    running_;
    std::atomic<std::uint64_t>                        next_id_{1};
};

} // namespace metacache
