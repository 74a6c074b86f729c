#pragma once
#include "error.hpp"
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace metacache {

using Bytes = std::vector<std::byte>;

// ---------------------------------------------------------------------------
// Capability concepts
// ---------------------------------------------------------------------------

/// Anything with a stable, non-empty string identity.
template<typename A>
concept Asset = std::copyable<A> && requires(const A& a) {
    { a.identifier() } -> std::convertible_to<std::string>;
};

/// An immutable value that round-trips through bytes. decode() may throw.
template<typename M>
concept Metadata = std::copyable<M> && requires(const M& m, std::span<const std::byte> b) {
    { m.encode() } -> std::convertible_to<Bytes>;
    { M::decode(b) } -> std::same_as<M>;
};

/// Where a delivered result was found.
enum class CacheTier : std::uint8_t {
    none = 0,   // not cached: freshly loaded, or not found at all
    memory,
    disk,
};

[[nodiscard]] constexpr std::string_view cache_tier_name(CacheTier t) noexcept
{
    switch (t) {
        case CacheTier::none:   return "none";
        case CacheTier::memory: return "memory";
        case CacheTier::disk:   return "disk";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Loader unit interface
// ---------------------------------------------------------------------------

/// Options forwarded verbatim to the loader factory. Opaque to the engine.
struct LoadOptions {
    std::uint32_t flags = 0;
};

/// Terminal output of one loader unit run.
template<Metadata M>
struct LoadResult {
    std::optional<M>     metadata;
    std::optional<Error> error;

    [[nodiscard]] static LoadResult success(M m) { return {std::move(m), std::nullopt}; }
    [[nodiscard]] static LoadResult failure(Error e) { return {std::nullopt, std::move(e)}; }
};

/// Handed to a running loader unit. Progress and partial results fan out to
/// every subscriber attached at the time of the call.
template<Metadata M>
class LoadContext final {
public:
    using Clock        = std::chrono::steady_clock;
    using ProgressSink = std::function<void(double)>;
    using PartialSink  = std::function<void(const M&)>;

    LoadContext(std::stop_token stop, Clock::time_point deadline,
                ProgressSink progress, PartialSink partial)
        : stop_{std::move(stop)}
        , deadline_{deadline}
        , progress_{std::move(progress)}
        , partial_{std::move(partial)}
    {}

    void report_progress(double fraction) const
    {
        if (progress_) progress_(fraction);
    }

    void publish_partial(const M& m) const
    {
        if (partial_) partial_(m);
    }

    /// Set once every subscriber has cancelled. Cooperative only.
    [[nodiscard]] bool stop_requested() const noexcept { return stop_.stop_requested(); }
    [[nodiscard]] std::stop_token stop_token() const noexcept { return stop_; }

    /// Advisory deadline derived from the configured load timeout.
    [[nodiscard]] Clock::time_point deadline() const noexcept { return deadline_; }
    [[nodiscard]] bool expired() const noexcept { return Clock::now() >= deadline_; }

private:
    std::stop_token   stop_;
    Clock::time_point deadline_;
    ProgressSink      progress_;
    PartialSink       partial_;
};

/// One concrete execution of a fetch strategy for one asset.
template<Asset A, Metadata M>
class LoaderUnit {
public:
    virtual ~LoaderUnit() = default;

    /// Runs on a load worker. Throwing std::exception is a load failure.
    virtual LoadResult<M> run(const LoadContext<M>& ctx) = 0;
};

template<Asset A, Metadata M>
using LoaderFactory =
    std::function<std::unique_ptr<LoaderUnit<A, M>>(const A&, const LoadOptions&)>;

/// Adapts a plain callable into a loader unit.
template<Asset A, Metadata M>
class FunctionLoader final : public LoaderUnit<A, M> {
public:
    using Fn = std::function<LoadResult<M>(const A&, const LoadContext<M>&)>;

    FunctionLoader(A asset, Fn fn) : asset_{std::move(asset)}, fn_{std::move(fn)} {}

    LoadResult<M> run(const LoadContext<M>& ctx) override { return fn_(asset_, ctx); }

    /// Factory that wraps `fn` for every requested asset.
    [[nodiscard]] static LoaderFactory<A, M> factory(Fn fn)
    {
        return [fn = std::move(fn)](const A& asset, const LoadOptions&)
                   -> std::unique_ptr<LoaderUnit<A, M>> {
            return std::make_unique<FunctionLoader>(asset, fn);
        };
    }

private:
    A  asset_;
    Fn fn_;
};

} // namespace metacache
