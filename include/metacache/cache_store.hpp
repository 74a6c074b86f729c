#pragma once
#include "compression.hpp"
#include "error.hpp"
#include "executor.hpp"
#include "log.hpp"
#include "memory_cache.hpp"
#include "persistence_directory.hpp"
#include "traits.hpp"
#include <atomic>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace metacache {

// ---------------------------------------------------------------------------
// CacheConfig
// ---------------------------------------------------------------------------
struct CacheConfig {
    std::size_t memory_count_limit     = 500;
    double      evict_ratio            = 15.0 / 16.0;
    bool        should_cache_in_memory = true;
    Codec       disk_codec             = Codec::none;
    int         codec_level            = 5;
};

struct CacheQueryOptions {
    bool query_data_when_in_memory = false;  // probe disk even on a memory hit
    bool query_disk_sync           = false;  // run the disk phase on the caller
};

/// Cancellation flag for the disk phase of one query.
class QueryHandle final {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool cancelled() const noexcept
    {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

// ---------------------------------------------------------------------------
// CacheStore -- memory tier over a PersistenceDirectory.
//
// Disk work runs on the `io` executor and every asynchronous callback is
// delivered on `completion`. Both executors must outlive the store; queued
// disk tasks keep the store's internals alive on their own.
// ---------------------------------------------------------------------------
template<Metadata M>
class CacheStore final {
public:
    using QueryCallback  = std::function<void(std::optional<M>, CacheTier)>;
    using DoneCallback   = std::function<void()>;
    using ExistsCallback = std::function<void(bool)>;
    using SizeCallback   = std::function<void(std::size_t file_count, std::size_t total_bytes)>;

    /// Throws PersistenceError if the namespace directory cannot be created,
    /// CodecError if the configured disk codec is not built in, and
    /// std::invalid_argument if evict_ratio is outside (0, 1].
    CacheStore(std::string_view name_space, const std::filesystem::path& root,
               Executor& io, Executor& completion, CacheConfig config = {})
        : state_{std::make_shared<State>(name_space, root, io, completion, config)}
    {
        if (!codec_available(config.disk_codec))
            throw CodecError(std::string("disk codec not available: ")
                             + std::string(codec_name(config.disk_codec)));
    }

    CacheStore(const CacheStore&)            = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    [[nodiscard]] const CacheConfig& config() const noexcept { return state_->config; }
    [[nodiscard]] const std::filesystem::path& directory() const noexcept
    {
        return state_->disk.directory();
    }

    // -- store ----------------------------------------------------------------

    /// Memory tier is written before returning. The disk write is queued on
    /// the io executor; its failures are logged and `on_done` still fires.
    void store(const M& metadata, std::string_view key, bool to_disk = true,
               DoneCallback on_done = {})
    {
        if (key.empty()) {
            if (on_done) on_done();
            return;
        }
        if (state_->config.should_cache_in_memory)
            state_->memory.put(key, metadata);

        if (!to_disk) {
            if (on_done) on_done();
            return;
        }

        state_->io.post([state = state_, metadata, key = std::string(key),
                         on_done = std::move(on_done)]() {
            try {
                auto payload = state->encode(metadata);
                state->disk.save(payload, key);
                channel::cache.trace("stored '{}' ({} bytes)", key, payload.size());
            } catch (const std::exception& e) {
                channel::cache.error("disk write for '{}' failed: {}", key, e.what());
            }
            if (on_done)
                state->completion.post(std::move(on_done));
        });
    }

    // -- query ----------------------------------------------------------------

    /// Memory first, then disk. A memory hit (unless query_data_when_in_memory)
    /// and an empty key answer synchronously and return nullptr; otherwise
    /// the returned handle can suppress the pending delivery.
    std::shared_ptr<QueryHandle> query(std::string_view key, CacheQueryOptions options,
                                       QueryCallback on_done)
    {
        if (key.empty()) {
            if (on_done) on_done(std::nullopt, CacheTier::none);
            return nullptr;
        }

        auto in_memory = state_->memory.get(key);
        if (in_memory && !options.query_data_when_in_memory) {
            channel::cache.trace("memory hit '{}'", key);
            if (on_done) on_done(std::move(in_memory), CacheTier::memory);
            return nullptr;
        }

        auto handle = std::make_shared<QueryHandle>();
        auto disk_phase = [state = state_, handle, key = std::string(key),
                           in_memory = std::move(in_memory), sync = options.query_disk_sync,
                           on_done = std::move(on_done)]() mutable {
            if (handle->cancelled())
                return;

            std::optional<M> result;
            CacheTier tier = CacheTier::none;
            if (in_memory) {
                // The memory value wins; the probe only confirms the disk copy.
                if (!state->disk.exists(key))
                    channel::cache.debug("'{}' is in memory but not on disk", key);
                result = std::move(in_memory);
                tier = CacheTier::memory;
            } else if ((result = state->read_disk(key))) {
                tier = CacheTier::disk;
            }

            auto deliver = [handle, on_done = std::move(on_done),
                            result = std::move(result), tier]() mutable {
                if (handle->cancelled())
                    return;
                if (on_done) on_done(std::move(result), tier);
            };
            if (sync)
                deliver();
            else
                state->completion.post(std::move(deliver));
        };

        if (options.query_disk_sync)
            disk_phase();
        else
            state_->io.post(std::move(disk_phase));
        return handle;
    }

    /// Disk-only existence probe. Blocks until the io executor has run every
    /// write queued before it. Does not decode.
    [[nodiscard]] bool query_exists(std::string_view key) const
    {
        if (key.empty()) return false;
        return on_io([state = state_, key = std::string(key)] { return state->disk.exists(key); });
    }

    /// Disk-only existence probe on the io executor.
    void query_exists(std::string_view key, ExistsCallback on_done) const
    {
        state_->io.post([state = state_, key = std::string(key),
                         on_done = std::move(on_done)]() mutable {
            bool found = !key.empty() && state->disk.exists(key);
            if (on_done)
                state->completion.post([on_done = std::move(on_done), found] { on_done(found); });
        });
    }

    [[nodiscard]] bool in_memory(std::string_view key) const
    {
        return state_->memory.contains(key);
    }

    // -- synchronous reads ---------------------------------------------------

    [[nodiscard]] std::optional<M> from_memory(std::string_view key) const
    {
        return state_->memory.get(key);
    }

    /// Blocking disk read, ordered after queued writes like query_exists().
    /// A hit also populates the memory tier.
    [[nodiscard]] std::optional<M> from_disk(std::string_view key) const
    {
        if (key.empty()) return std::nullopt;
        return on_io([state = state_, key = std::string(key)] { return state->read_disk(key); });
    }

    [[nodiscard]] std::optional<M> from_either(std::string_view key) const
    {
        if (auto m = from_memory(key)) return m;
        return from_disk(key);
    }

    // -- removal ---------------------------------------------------------------

    void remove(std::string_view key, bool from_disk = true, DoneCallback on_done = {})
    {
        state_->memory.remove(key);
        if (!from_disk || key.empty()) {
            if (on_done) on_done();
            return;
        }
        state_->io.post([state = state_, key = std::string(key),
                         on_done = std::move(on_done)]() mutable {
            state->disk.remove(key);
            if (on_done)
                state->completion.post(std::move(on_done));
        });
    }

    void clear_memory() { state_->memory.clear(); }

    void clear_disk(DoneCallback on_done = {})
    {
        state_->io.post([state = state_, on_done = std::move(on_done)]() mutable {
            state->disk.clear();
            channel::cache.debug("cleared {}", state->disk.directory().string());
            if (on_done)
                state->completion.post(std::move(on_done));
        });
    }

    [[nodiscard]] std::optional<std::filesystem::path> path_for(std::string_view key) const
    {
        if (key.empty()) return std::nullopt;
        return state_->disk.path_for(key);
    }

    // -- stats ---------------------------------------------------------------

    void calculate_size(SizeCallback on_done) const
    {
        state_->io.post([state = state_, on_done = std::move(on_done)]() mutable {
            auto count = state->disk.file_count();
            auto bytes = state->disk.total_bytes();
            if (on_done)
                state->completion.post([on_done = std::move(on_done), count, bytes] {
                    on_done(count, bytes);
                });
        });
    }

    [[nodiscard]] std::size_t memory_count() const { return state_->memory.size(); }
    [[nodiscard]] std::size_t disk_file_count() const { return state_->disk.file_count(); }
    [[nodiscard]] std::size_t disk_bytes() const { return state_->disk.total_bytes(); }

private:
    // Runs `fn` on the io executor and waits for it, or inline when already
    // there. Must not be called from a task the io executor is waiting on.
    template <typename Fn>
    auto on_io(Fn fn) const -> decltype(fn())
    {
        if (state_->io.is_current())
            return fn();
        using R = decltype(fn());
        auto done = std::make_shared<std::promise<R>>();
        auto result = done->get_future();
        state_->io.post([done, fn = std::move(fn)]() mutable {
            try {
                done->set_value(fn());
            } catch (...) {
                done->set_exception(std::current_exception());
            }
        });
        return result.get();
    }

    struct State {
        State(std::string_view name_space, const std::filesystem::path& root,
              Executor& io_ex, Executor& completion_ex, const CacheConfig& cfg)
            : config{cfg}
            , memory{typename MemoryCache<M>::Config{cfg.memory_count_limit, cfg.evict_ratio}}
            , disk{name_space, root}
            , io{io_ex}
            , completion{completion_ex}
        {}

        [[nodiscard]] Bytes encode(const M& metadata) const
        {
            Bytes raw = metadata.encode();
            if (config.disk_codec == Codec::none)
                return raw;
            return compress(raw, CompressParams{config.disk_codec, config.codec_level});
        }

        [[nodiscard]] M decode(const Bytes& payload) const
        {
            if (config.disk_codec == Codec::none)
                return M::decode(payload);
            auto raw = decompress(payload, config.disk_codec);
            return M::decode(raw);
        }

        // A payload that fails to decode reads as a miss.
        [[nodiscard]] std::optional<M> read_disk(std::string_view key)
        {
            auto payload = disk.load(key);
            if (!payload)
                return std::nullopt;
            try {
                M metadata = decode(*payload);
                if (config.should_cache_in_memory)
                    memory.put(key, metadata);
                channel::cache.trace("disk hit '{}'", key);
                return metadata;
            } catch (const std::exception& e) {
                channel::cache.warn("cannot decode '{}': {}", key, e.what());
                return std::nullopt;
            }
        }

        CacheConfig          config;
        MemoryCache<M>       memory;
        PersistenceDirectory disk;
        Executor&            io;
        Executor&            completion;
    };

    std::shared_ptr<State> state_;
};

} // namespace metacache
