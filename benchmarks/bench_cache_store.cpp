#include <metacache/bench.hpp>
#include <metacache/cache_store.hpp>
#include <metacache/compression.hpp>
#include <metacache/memory_cache.hpp>
#include <cstring>
#include <filesystem>
#include <random>
#include <string>

namespace {

struct Blob {
    std::string body;

    [[nodiscard]] metacache::Bytes encode() const
    {
        metacache::Bytes out(body.size());
        std::memcpy(out.data(), body.data(), body.size());
        return out;
    }

    [[nodiscard]] static Blob decode(std::span<const std::byte> b)
    {
        return Blob{std::string(reinterpret_cast<const char*>(b.data()), b.size())};
    }
};

std::string key_of(int i) { return "asset/" + std::to_string(i) + ".json"; }

std::filesystem::path bench_root()
{
    auto p = std::filesystem::temp_directory_path() / "metacache_bench";
    std::filesystem::remove_all(p);
    return p;
}

} // namespace

BENCH_MAIN()

BENCHMARK("MemoryCache put 1K entries") {
    metacache::MemoryCache<int> cache({.count_limit = 0});
    for (int i = 0; i < 1000; ++i)
        cache.put(key_of(i), i);
}

BENCHMARK("MemoryCache get (hit) 1K lookups") {
    static metacache::MemoryCache<int> cache;
    static bool filled = [] {
        for (int i = 0; i < 500; ++i) cache.put(key_of(i), i);
        return true;
    }();
    (void)filled;
    static std::mt19937 rng(42);
    static std::uniform_int_distribution<int> dist(0, 499);
    for (int i = 0; i < 1000; ++i)
        (void)cache.get(key_of(dist(rng)));
}

BENCHMARK("MemoryCache put with eviction") {
    metacache::MemoryCache<int> cache({.count_limit = 64});
    for (int i = 0; i < 1000; ++i)
        cache.put(key_of(i), i);
}

BENCHMARK("zlib compress 64 KiB") {
    static metacache::Bytes payload = [] {
        metacache::Bytes b(64 * 1024);
        std::mt19937 rng(7);
        for (auto& x : b) x = static_cast<std::byte>(rng() % 16);
        return b;
    }();
    (void)metacache::compress(payload, {metacache::Codec::zlib, 5});
}

BENCHMARK("CacheStore disk round trip 100 entries") {
    static auto root = bench_root();
    metacache::RunLoop loop;
    metacache::SerialQueue io;
    metacache::CacheStore<Blob> store("bench", root, io, loop,
                                      {.should_cache_in_memory = false});
    for (int i = 0; i < 100; ++i)
        store.store(Blob{std::string(256, 'x')}, key_of(i));
    io.wait_idle();
    for (int i = 0; i < 100; ++i)
        (void)store.from_disk(key_of(i));
}
