#include <metacache/test.hpp>
#include <metacache/compression.hpp>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <string>

using namespace metacache;

static std::vector<std::byte> make_compressible_data(std::size_t size) {
    std::vector<std::byte> data(size);
    for (std::size_t i = 0; i < size; ++i)
        data[i] = static_cast<std::byte>(i % 4);
    return data;
}

static std::vector<std::byte> make_noise(std::size_t size) {
    std::vector<std::byte> data(size);
    std::uint32_t x = 2463534242u;
    for (auto& b : data) {
        x ^= x << 13; x ^= x >> 17; x ^= x << 5;
        b = static_cast<std::byte>(x & 0xff);
    }
    return data;
}

static void round_trip(Codec codec, std::span<const std::byte> input) {
    auto packed = compress(input, CompressParams{codec, 5});
    auto unpacked = decompress(packed, codec);
    REQUIRE_EQ(unpacked.size(), input.size());
    REQUIRE(std::equal(unpacked.begin(), unpacked.end(), input.begin()));
}

static_assert(codec_name(Codec::gzip) == "gzip");
static_assert(parse_codec("zlib") == Codec::zlib);
static_assert(!parse_codec("lzma").has_value());

TEST_CASE("built-in codecs are registered") {
    REQUIRE(codec_available(Codec::none));
    REQUIRE(codec_available(Codec::zlib));
    REQUIRE(codec_available(Codec::gzip));
    REQUIRE_EQ(codec_available(Codec::zstd), bool(METACACHE_HAS_ZSTD));
}

TEST_CASE("none codec is a copy") {
    auto data = make_noise(100);
    auto out = compress(data);
    REQUIRE(out == data);
}

TEST_CASE("zlib round trip: compressible and noisy data") {
    auto data = make_compressible_data(64 * 1024);
    auto packed = compress(data, CompressParams{Codec::zlib, 6});
    REQUIRE_LT(packed.size(), data.size() / 4);
    round_trip(Codec::zlib, data);
    round_trip(Codec::zlib, make_noise(5000));
}

TEST_CASE("gzip round trip") {
    round_trip(Codec::gzip, make_compressible_data(10000));
    round_trip(Codec::gzip, make_noise(1));
}

TEST_CASE("empty payloads survive every codec") {
    std::vector<std::byte> empty;
    for (auto c : {Codec::none, Codec::zlib, Codec::gzip, Codec::zstd}) {
        if (!codec_available(c)) continue;
        round_trip(c, empty);
    }
}

TEST_CASE("zstd round trip when built in") {
    if (!codec_available(Codec::zstd)) {
        REQUIRE_THROWS(compress(make_noise(10), CompressParams{Codec::zstd, 3}));
        return;
    }
    round_trip(Codec::zstd, make_compressible_data(20000));
}

TEST_CASE("corrupt zlib payload throws CodecError") {
    auto packed = compress(make_compressible_data(4096), CompressParams{Codec::zlib, 5});
    for (std::size_t i = 4; i < packed.size(); ++i)
        packed[i] = std::byte{0x5a};

    bool threw = false;
    try {
        (void)decompress(packed, Codec::zlib);
    } catch (const CodecError&) {
        threw = true;
    }
    REQUIRE(threw);
}

TEST_CASE("truncated size prefix throws") {
    std::vector<std::byte> tiny{std::byte{1}, std::byte{2}};
    REQUIRE_THROWS(decompress(tiny, Codec::zlib));
}

METACACHE_TEST_MAIN()
