#pragma once
#include "error.hpp"
#include "executor.hpp"
#include "log.hpp"
#include "traits.hpp"
#include "work_pool.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace metacache {

struct LoadCoordinatorConfig {
    std::size_t               max_concurrent_loads = 6;
    ExecutionOrder            order                = ExecutionOrder::fifo;
    std::chrono::milliseconds load_timeout         = std::chrono::seconds(15);  // advisory
    bool                      start_suspended      = false;
};

/// What a subscriber receives. `finished` is false for partial results.
template<Metadata M>
struct LoadOutcome {
    std::optional<M>     metadata;
    std::optional<Error> error;
    bool                 finished = false;
};

/// Identifies one subscriber on one loader unit. Plain data: a token whose
/// unit has already finished or been cancelled is simply stale.
struct LoadToken {
    std::string   key;
    std::uint64_t unit_id       = 0;
    std::uint64_t subscriber_id = 0;

    friend bool operator==(const LoadToken&, const LoadToken&) = default;
};

enum class UnitState : std::uint8_t {
    pending = 0,
    running,
    completed,
    failed,
    cancelled,
};

// ---------------------------------------------------------------------------
// LoadCoordinator
//
// Deduplicates loads by asset identifier: every request for a key that
// already has a unit in flight subscribes to that unit instead of creating a
// new one. Units run on a bounded WorkPool; progress, partial results and the
// terminal result fan out to the subscribers on the completion executor.
//
// Lock order is registry, then unit. No lock is held while a callback runs.
// ---------------------------------------------------------------------------
template<Asset A, Metadata M>
class LoadCoordinator final {
public:
    using Outcome            = LoadOutcome<M>;
    using ProgressCallback   = std::function<void(double)>;
    using CompletionCallback = std::function<void(const Outcome&)>;

    LoadCoordinator(LoaderFactory<A, M> factory, Executor& completion,
                    LoadCoordinatorConfig config = {})
        : factory_{std::move(factory)}
        , completion_{completion}
        , config_{config}
        , pool_{config.max_concurrent_loads, config.order, config.start_suspended}
    {
    }

    ~LoadCoordinator() { cancel_all(); }

    LoadCoordinator(const LoadCoordinator&)            = delete;
    LoadCoordinator& operator=(const LoadCoordinator&) = delete;

    /// Subscribes to the unit for `asset`, creating and scheduling it if none
    /// is in flight. An absent asset completes synchronously with an empty,
    /// unfinished outcome and returns nullopt.
    ///
    /// The factory runs under the registry lock and must not call back into
    /// the coordinator.
    std::optional<LoadToken> load(const std::optional<A>& asset, const LoadOptions& options = {},
                                  ProgressCallback progress = {},
                                  CompletionCallback completion = {})
    {
        if (!asset) {
            if (completion) completion(Outcome{});
            return std::nullopt;
        }

        std::string key = asset->identifier();
        std::optional<Error> factory_error;
        LoadToken token;
        {
            std::lock_guard reg_lock{registry_mu_};

            auto it = registry_.find(key);
            if (it != registry_.end()) {
                auto& unit = it->second;
                std::lock_guard unit_lock{unit->mu};
                token = LoadToken{key, unit->id, next_subscriber_id_++};
                unit->subscribers.emplace(token.subscriber_id,
                                          Subscriber{std::move(progress), std::move(completion)});
                channel::loader.debug("'{}' joins unit {} ({} subscribers)", key, unit->id,
                                      unit->subscribers.size());
                return token;
            }

            std::unique_ptr<LoaderUnit<A, M>> loader;
            try {
                loader = factory_(*asset, options);
                if (!loader)
                    factory_error = Error::load_failure("loader factory returned no unit");
            } catch (const std::exception& e) {
                factory_error = Error::load_failure(e.what());
            }

            if (!factory_error) {
                auto unit = std::make_shared<Unit>();
                unit->id = next_unit_id_++;
                unit->key = key;
                unit->loader = std::move(loader);
                token = LoadToken{key, unit->id, next_subscriber_id_++};
                unit->subscribers.emplace(token.subscriber_id,
                                          Subscriber{std::move(progress), std::move(completion)});
                registry_.emplace(key, unit);
                unit->job = pool_.submit([this, unit] { run(unit); });
                channel::loader.debug("new unit {} for '{}'", unit->id, key);
                return token;
            }
        }

        channel::loader.error("cannot create loader for '{}': {}", key, factory_error->message);
        if (completion) {
            completion_.post([completion = std::move(completion), error = *factory_error] {
                completion(Outcome{std::nullopt, error, true});
            });
        }
        return std::nullopt;
    }

    /// Removes one subscriber. When the last one leaves, the unit is dropped
    /// from the registry, dequeued if it has not started, and asked to stop.
    /// False for a stale or already-cancelled token.
    bool cancel(const LoadToken& token)
    {
        std::shared_ptr<Unit> unit;
        {
            std::lock_guard reg_lock{registry_mu_};
            auto it = registry_.find(token.key);
            if (it == registry_.end() || it->second->id != token.unit_id)
                return false;

            bool last;
            {
                std::lock_guard unit_lock{it->second->mu};
                if (it->second->subscribers.erase(token.subscriber_id) == 0)
                    return false;
                last = it->second->subscribers.empty();
                if (last)
                    it->second->state = UnitState::cancelled;
            }
            if (!last) {
                channel::loader.debug("subscriber left unit {}", token.unit_id);
                return true;
            }
            unit = std::move(it->second);
            registry_.erase(it);
        }

        pool_.cancel(unit->job);
        unit->stop.request_stop();
        channel::loader.debug("unit {} for '{}' cancelled", unit->id, unit->key);
        return true;
    }

    /// Cancels every scheduled or running unit. Nothing is delivered for them.
    void cancel_all()
    {
        std::vector<std::shared_ptr<Unit>> units;
        {
            std::lock_guard reg_lock{registry_mu_};
            units.reserve(registry_.size());
            for (auto& [key, unit] : registry_)
                units.push_back(unit);
            registry_.clear();
        }
        for (auto& unit : units) {
            {
                std::lock_guard unit_lock{unit->mu};
                unit->state = UnitState::cancelled;
                unit->subscribers.clear();
            }
            pool_.cancel(unit->job);
            unit->stop.request_stop();
        }
        if (!units.empty())
            channel::loader.debug("cancelled {} units", units.size());
    }

    // -- scheduling ----------------------------------------------------------

    void set_suspended(bool suspended) { pool_.set_suspended(suspended); }
    [[nodiscard]] bool suspended() const { return pool_.suspended(); }

    void set_execution_order(ExecutionOrder order) { pool_.set_order(order); }
    [[nodiscard]] ExecutionOrder execution_order() const { return pool_.order(); }

    /// Units registered and not yet finished or fully cancelled.
    [[nodiscard]] std::size_t current_load_count() const
    {
        std::lock_guard reg_lock{registry_mu_};
        return registry_.size();
    }

    [[nodiscard]] bool in_flight(std::string_view key) const
    {
        std::lock_guard reg_lock{registry_mu_};
        return registry_.contains(std::string(key));
    }

    [[nodiscard]] std::size_t max_concurrent_loads() const noexcept
    {
        return pool_.max_concurrent();
    }

    [[nodiscard]] std::chrono::milliseconds load_timeout() const noexcept
    {
        return config_.load_timeout;
    }

    /// Block until no unit is queued or running. Callbacks may still be
    /// pending on the completion executor.
    void wait_idle() { pool_.wait_idle(); }

private:
    struct Subscriber {
        ProgressCallback   progress;
        CompletionCallback completion;
    };

    struct Unit {
        std::uint64_t                          id = 0;
        std::string                            key;
        std::unique_ptr<LoaderUnit<A, M>>      loader;
        std::mutex                             mu;
        UnitState                              state = UnitState::pending;
        std::map<std::uint64_t, Subscriber>    subscribers;
        std::stop_source                       stop;
        WorkPool::JobId                        job = 0;
    };

    void run(const std::shared_ptr<Unit>& unit)
    {
        {
            std::lock_guard unit_lock{unit->mu};
            if (unit->state != UnitState::pending)
                return;
            unit->state = UnitState::running;
        }

        Executor& completion = completion_;
        LoadContext<M> ctx{
            unit->stop.get_token(),
            LoadContext<M>::Clock::now() + config_.load_timeout,
            [unit, &completion](double fraction) {
                std::vector<ProgressCallback> targets;
                {
                    std::lock_guard unit_lock{unit->mu};
                    if (unit->state != UnitState::running)
                        return;
                    for (auto& [id, sub] : unit->subscribers)
                        if (sub.progress) targets.push_back(sub.progress);
                }
                if (targets.empty())
                    return;
                completion.post([targets = std::move(targets), fraction] {
                    for (auto& cb : targets) cb(fraction);
                });
            },
            [unit, &completion](const M& partial) {
                std::vector<CompletionCallback> targets;
                {
                    std::lock_guard unit_lock{unit->mu};
                    if (unit->state != UnitState::running)
                        return;
                    for (auto& [id, sub] : unit->subscribers)
                        if (sub.completion) targets.push_back(sub.completion);
                }
                if (targets.empty())
                    return;
                completion.post([targets = std::move(targets), outcome = Outcome{partial, std::nullopt, false}] {
                    for (auto& cb : targets) cb(outcome);
                });
            }};

        LoadResult<M> result;
        try {
            result = unit->loader->run(ctx);
        } catch (const std::exception& e) {
            result = LoadResult<M>::failure(Error::load_failure(e.what()));
        }
        finish(unit, std::move(result));
    }

    void finish(const std::shared_ptr<Unit>& unit, LoadResult<M> result)
    {
        {
            std::lock_guard reg_lock{registry_mu_};
            auto it = registry_.find(unit->key);
            if (it != registry_.end() && it->second == unit)
                registry_.erase(it);
        }

        std::vector<CompletionCallback> targets;
        {
            std::lock_guard unit_lock{unit->mu};
            if (unit->state == UnitState::cancelled) {
                channel::loader.debug("unit {} finished after cancellation", unit->id);
                return;
            }
            unit->state = result.error ? UnitState::failed : UnitState::completed;
            for (auto& [id, sub] : unit->subscribers)
                if (sub.completion) targets.push_back(sub.completion);
            unit->subscribers.clear();
        }

        if (result.error)
            channel::loader.warn("unit {} for '{}' failed: {}", unit->id, unit->key,
                                 result.error->describe());
        if (targets.empty())
            return;
        completion_.post([targets = std::move(targets),
                          outcome = Outcome{std::move(result.metadata), std::move(result.error), true}] {
            for (auto& cb : targets) cb(outcome);
        });
    }

    LoaderFactory<A, M>                                      factory_;
    Executor&                                                completion_;
    LoadCoordinatorConfig                                    config_;
    mutable std::mutex                                       registry_mu_;
    std::unordered_map<std::string, std::shared_ptr<Unit>>  registry_;
    std::uint64_t                                            next_unit_id_ = 1;
    std::uint64_t                                            next_subscriber_id_ = 1;
    WorkPool                                                 pool_;  // Must be last: joins running units first
};

} // namespace metacache
