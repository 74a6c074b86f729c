#include <metacache/bench.hpp>
#include <metacache/load_coordinator.hpp>
#include <atomic>
#include <string>

namespace {

struct Asset {
    std::string id;
    [[nodiscard]] std::string identifier() const { return id; }
};

struct Meta {
    int v = 0;
    [[nodiscard]] metacache::Bytes encode() const { return metacache::Bytes(4); }
    [[nodiscard]] static Meta decode(std::span<const std::byte>) { return {}; }
};

using Coordinator = metacache::LoadCoordinator<Asset, Meta>;
using Loader      = metacache::FunctionLoader<Asset, Meta>;

metacache::LoaderFactory<Asset, Meta> trivial_factory()
{
    return Loader::factory([](const Asset& a, const metacache::LoadContext<Meta>&) {
        return metacache::LoadResult<Meta>::success(Meta{static_cast<int>(a.id.size())});
    });
}

} // namespace

BENCH_MAIN()

BENCHMARK("LoadCoordinator 256 distinct loads") {
    metacache::RunLoop loop;
    Coordinator coordinator(trivial_factory(), loop);
    std::atomic<int> done{0};
    for (int i = 0; i < 256; ++i)
        coordinator.load(Asset{std::to_string(i)}, {}, {},
                         [&](const Coordinator::Outcome&) { done.fetch_add(1); });
    (void)loop.run_until([&] { return done.load() == 256; }, std::chrono::seconds(10));
}

BENCHMARK("LoadCoordinator 256 subscribers on one key") {
    metacache::RunLoop loop;
    Coordinator coordinator(trivial_factory(), loop, {.start_suspended = true});
    std::atomic<int> done{0};
    for (int i = 0; i < 256; ++i)
        coordinator.load(Asset{"shared"}, {}, {},
                         [&](const Coordinator::Outcome&) { done.fetch_add(1); });
    coordinator.set_suspended(false);
    (void)loop.run_until([&] { return done.load() == 256; }, std::chrono::seconds(10));
}
