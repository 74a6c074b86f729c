#pragma once
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <atomic>
#include <vector>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace metacache {

// ---------------------------------------------------------------------------
// MemoryCache -- count-bounded, thread-safe memory tier.
//
// Reads stamp a generation counter; once the entry count exceeds the limit,
// the oldest-stamped entries are dropped until the count is back under
// limit * evict_ratio. Eviction is approximate: entries touched while an
// eviction pass is collecting candidates may survive or be dropped.
// ---------------------------------------------------------------------------
template<typename V>
class MemoryCache final {
public:
    struct Config {
        std::size_t count_limit = 500;     // 0 disables the bound
        double      evict_ratio = 15.0 / 16.0; // fraction kept after eviction, in (0, 1]
    };

    /// Throws std::invalid_argument when evict_ratio is outside (0, 1].
    explicit MemoryCache(Config config = {})
        : config_{config}
        , generation_{0}
        , hits_{0}
        , misses_{0}
        , evictions_{0}
    {
        if (!(config_.evict_ratio > 0.0 && config_.evict_ratio <= 1.0))
            throw std::invalid_argument("MemoryCache: evict_ratio must be in (0, 1]");
    }

    MemoryCache(const MemoryCache&)            = delete;
    MemoryCache& operator=(const MemoryCache&) = delete;

    // -- read ---------------------------------------------------------------

    [[nodiscard]] std::optional<V> get(std::string_view key) const
    {
        std::shared_lock lock{mutex_};
        auto it = map_.find(std::string(key));
        if (it == map_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }
        it->second.generation.store(generation_.fetch_add(1, std::memory_order_relaxed),
                                    std::memory_order_relaxed);
        hits_.fetch_add(1, std::memory_order_relaxed);
        return it->second.value;
    }

    [[nodiscard]] bool contains(std::string_view key) const
    {
        std::shared_lock lock{mutex_};
        return map_.contains(std::string(key));
    }

    // -- write --------------------------------------------------------------

    void put(std::string_view key, V value)
    {
        bool over;
        {
            std::unique_lock lock{mutex_};
            auto gen = generation_.fetch_add(1, std::memory_order_relaxed);
            if (auto it = map_.find(std::string(key)); it != map_.end()) {
                it->second.value = std::move(value);
                it->second.generation.store(gen, std::memory_order_relaxed);
                return;
            }
            map_.emplace(std::string(key), Entry{std::move(value), gen});
            over = config_.count_limit != 0 && map_.size() > config_.count_limit;
        }
        if (over)
            evict();
    }

    bool remove(std::string_view key)
    {
        std::unique_lock lock{mutex_};
        return map_.erase(std::string(key)) != 0;
    }

    void clear()
    {
        std::unique_lock lock{mutex_};
        map_.clear();
    }

    // -- stats --------------------------------------------------------------

    [[nodiscard]] std::size_t size() const
    {
        std::shared_lock lock{mutex_};
        return map_.size();
    }

    [[nodiscard]] std::size_t count_limit() const noexcept { return config_.count_limit; }

    [[nodiscard]] std::uint64_t hits() const noexcept
    {
        return hits_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t misses() const noexcept
    {
        return misses_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t evictions() const noexcept
    {
        return evictions_.load(std::memory_order_relaxed);
    }

private:
    struct Entry {
        V                                  value;
        mutable std::atomic<std::uint64_t> generation;

        Entry(V v, std::uint64_t g) : value(std::move(v)), generation(g) {}
        Entry(Entry&& o) noexcept(std::is_nothrow_move_constructible_v<V>)
            : value(std::move(o.value))
            , generation(o.generation.load(std::memory_order_relaxed)) {}
    };

    void evict()
    {
        // Never below one entry, so the newest put always survives.
        const auto target = std::max<std::size_t>(1, static_cast<std::size_t>(
            static_cast<double>(config_.count_limit) * config_.evict_ratio));

        struct Candidate {
            std::string   key;
            std::uint64_t generation;
        };
        std::vector<Candidate> candidates;

        {
            std::shared_lock lock{mutex_};
            candidates.reserve(map_.size());
            for (const auto& [k, entry] : map_)
                candidates.push_back({k, entry.generation.load(std::memory_order_relaxed)});
        }

        std::sort(candidates.begin(), candidates.end(),
                  [](const Candidate& a, const Candidate& b) {
                      return a.generation < b.generation;
                  });

        std::unique_lock lock{mutex_};
        for (const auto& cand : candidates) {
            if (map_.size() <= target)
                break;
            auto it = map_.find(cand.key);
            if (it == map_.end())
                continue;
            // Touched since the candidate list was built.
            if (it->second.generation.load(std::memory_order_relaxed) != cand.generation)
                continue;
            map_.erase(it);
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    Config config_;

    mutable std::unordered_map<std::string, Entry> map_;
    mutable std::shared_mutex                      mutex_;
    mutable std::atomic<std::uint64_t>             generation_;
    mutable std::atomic<std::uint64_t>             hits_;
    mutable std::atomic<std::uint64_t>             misses_;
    std::atomic<std::uint64_t>                     evictions_;
};

} // namespace metacache
