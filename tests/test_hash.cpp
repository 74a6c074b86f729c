#include <metacache/test.hpp>
#include <metacache/hash.hpp>
#include <string>
#include <string_view>
#include <unordered_set>

using namespace metacache;

// ============================================================================
// Compile-time tests
// ============================================================================

static_assert(fnv1a(std::string_view("")) == fnv_offset_basis);
static_assert(fnv1a(std::string_view("a")) != fnv1a(std::string_view("b")));
static_assert(hash_combine(0, 42) == hash_combine(0, 42));
static_assert(hash_combine(0, 42) != hash_combine(1, 42), "seed matters");

// ============================================================================
// Runtime tests
// ============================================================================

TEST_CASE("FNV-1a: basic consistency") {
    auto h1 = fnv1a("hello");
    auto h2 = fnv1a("hello");
    REQUIRE_EQ(h1, h2);
    REQUIRE_NE(h1, fnv1a("world"));
}

TEST_CASE("FNV-1a: raw bytes and string_view agree") {
    const char data[] = "test";
    REQUIRE_EQ(fnv1a(data, 4), fnv1a(std::string_view("test")));
}

TEST_CASE("FNV-1a: seed continues a running hash") {
    auto whole = fnv1a("foobar");
    auto split = fnv1a("bar", fnv1a("foo"));
    REQUIRE_EQ(whole, split);
}

TEST_CASE("to_hex: fixed width lowercase") {
    REQUIRE_EQ(to_hex(0), std::string("0000000000000000"));
    REQUIRE_EQ(to_hex(0xdeadbeefULL), std::string("00000000deadbeef"));
    REQUIRE_EQ(to_hex(~0ULL), std::string("ffffffffffffffff"));
}

TEST_CASE("key_digest: 32 hex chars, deterministic") {
    auto d = key_digest("https://example.com/a.mp3");
    REQUIRE_EQ(d.size(), std::size_t{32});
    for (char c : d)
        REQUIRE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
    REQUIRE_EQ(d, key_digest("https://example.com/a.mp3"));
}

TEST_CASE("key_digest: low half is the plain FNV-1a hash") {
    auto d = key_digest("asset-17");
    REQUIRE_EQ(d.substr(16), to_hex(fnv1a("asset-17")));
}

TEST_CASE("key_digest: no collisions across 10K keys") {
    std::unordered_set<std::string> seen;
    for (int i = 0; i < 10000; ++i)
        seen.insert(key_digest("asset/" + std::to_string(i)));
    REQUIRE_EQ(seen.size(), std::size_t{10000});
}

TEST_CASE("key_digest: empty key is still a valid name") {
    auto d = key_digest("");
    REQUIRE_EQ(d.size(), std::size_t{32});
    REQUIRE_NE(d, key_digest(" "));
}

METACACHE_TEST_MAIN()
