#pragma once
#include "error.hpp"
#include <vector>
#include <span>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <functional>
#include <optional>
#include <unordered_map>
#include <mutex>
#include <algorithm>
#include <cstring>

#include <zlib.h>

// zstd is optional; the build defines METACACHE_HAS_ZSTD when it links libzstd.
#ifndef METACACHE_HAS_ZSTD
#   define METACACHE_HAS_ZSTD 0
#endif
#if METACACHE_HAS_ZSTD
#   include <zstd.h>
#endif

namespace metacache {

// ---------------------------------------------------------------------------
// Codec enum -- payload transform applied on the disk tier
// ---------------------------------------------------------------------------

enum class Codec : std::uint8_t {
    none = 0,
    zlib,
    gzip,
    zstd,
};

[[nodiscard]] constexpr std::string_view codec_name(Codec c) noexcept {
    switch (c) {
        case Codec::none: return "none";
        case Codec::zlib: return "zlib";
        case Codec::gzip: return "gzip";
        case Codec::zstd: return "zstd";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<Codec> parse_codec(std::string_view name) noexcept {
    for (auto c : {Codec::none, Codec::zlib, Codec::gzip, Codec::zstd})
        if (codec_name(c) == name) return c;
    return std::nullopt;
}

struct CompressParams {
    Codec codec = Codec::none;
    int level   = 5;
};

// ---------------------------------------------------------------------------
// Codec registry
// ---------------------------------------------------------------------------

using CompressFn   = std::function<std::vector<std::byte>(std::span<const std::byte>, int level)>;
using DecompressFn = std::function<std::vector<std::byte>(std::span<const std::byte>)>;

struct CodecImpl {
    CompressFn compress;
    DecompressFn decompress;
};

namespace detail {

struct CodecRegistry {
    std::mutex mutex;
    std::unordered_map<std::uint8_t, CodecImpl> codecs;
};

inline CodecRegistry& codec_registry() noexcept {
    static CodecRegistry reg;
    return reg;
}

// Helper: prepend a 4-byte little-endian size prefix
inline std::vector<std::byte> prepend_size(std::span<const std::byte> compressed,
                                           std::uint32_t original_size) {
    std::vector<std::byte> out(4 + compressed.size());
    for (int i = 0; i < 4; ++i)
        out[static_cast<std::size_t>(i)] = static_cast<std::byte>((original_size >> (8 * i)) & 0xff);
    std::copy(compressed.begin(), compressed.end(), out.begin() + 4);
    return out;
}

// Helper: read 4-byte LE size prefix
inline std::uint32_t read_size_prefix(std::span<const std::byte> data) {
    if (data.size() < 4)
        throw CodecError("compression: data too small for size prefix");
    std::uint32_t sz = 0;
    for (int i = 0; i < 4; ++i)
        sz |= static_cast<std::uint32_t>(data[static_cast<std::size_t>(i)]) << (8 * i);
    return sz;
}

} // namespace detail

inline void register_codec(Codec id, CodecImpl impl) {
    auto& reg = detail::codec_registry();
    std::lock_guard lock{reg.mutex};
    reg.codecs[static_cast<std::uint8_t>(id)] = std::move(impl);
}

// ---------------------------------------------------------------------------
// Backend implementations
// ---------------------------------------------------------------------------

namespace detail::zlib_backend {

// Output carries a size prefix so decompression can allocate exactly once.
inline std::vector<std::byte> do_compress(std::span<const std::byte> in,
                                          int level, bool gzip_mode) {
    z_stream strm{};
    int window_bits = gzip_mode ? (15 + 16) : 15;
    if (deflateInit2(&strm, level, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw CodecError("zlib deflateInit2 failed");
    auto bound = deflateBound(&strm, static_cast<uLong>(in.size()));
    std::vector<std::byte> out(bound);
    strm.next_in  = reinterpret_cast<Bytef*>(const_cast<std::byte*>(in.data()));
    strm.avail_in = static_cast<uInt>(in.size());
    strm.next_out = reinterpret_cast<Bytef*>(out.data());
    strm.avail_out = static_cast<uInt>(out.size());
    auto rc = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (rc != Z_STREAM_END)
        throw CodecError("zlib deflate failed with code " + std::to_string(rc));
    out.resize(strm.total_out);
    return prepend_size(out, static_cast<std::uint32_t>(in.size()));
}

inline std::vector<std::byte> do_decompress(std::span<const std::byte> in, bool gzip_mode) {
    const auto expected = read_size_prefix(in);
    in = in.subspan(4);

    z_stream strm{};
    int window_bits = gzip_mode ? (15 + 16) : 15;
    if (inflateInit2(&strm, window_bits) != Z_OK)
        throw CodecError("zlib inflateInit2 failed");

    // zlib rejects a null output pointer, so never hand it an empty buffer.
    std::vector<std::byte> out(std::max<std::size_t>(expected, 1));
    strm.next_in   = reinterpret_cast<Bytef*>(const_cast<std::byte*>(in.data()));
    strm.avail_in  = static_cast<uInt>(in.size());
    strm.next_out  = reinterpret_cast<Bytef*>(out.data());
    strm.avail_out = static_cast<uInt>(out.size());
    auto rc = inflate(&strm, Z_FINISH);
    auto total = strm.total_out;
    inflateEnd(&strm);
    if (rc != Z_STREAM_END)
        throw CodecError("zlib inflate failed with code " + std::to_string(rc));
    if (total != expected)
        throw CodecError("zlib inflate: size mismatch");
    out.resize(expected);
    return out;
}

} // namespace detail::zlib_backend

#if METACACHE_HAS_ZSTD
namespace detail::zstd_backend {

inline std::vector<std::byte> do_compress(std::span<const std::byte> in, int level) {
    auto bound = ZSTD_compressBound(in.size());
    std::vector<std::byte> out(bound);
    auto rc = ZSTD_compress(out.data(), out.size(), in.data(), in.size(), level);
    if (ZSTD_isError(rc))
        throw CodecError(std::string("zstd compress: ") + ZSTD_getErrorName(rc));
    out.resize(rc);
    return out;
}

inline std::vector<std::byte> do_decompress(std::span<const std::byte> in) {
    auto content_size = ZSTD_getFrameContentSize(in.data(), in.size());
    if (content_size == ZSTD_CONTENTSIZE_ERROR)
        throw CodecError("zstd decompress: not a valid zstd frame");
    if (content_size == ZSTD_CONTENTSIZE_UNKNOWN)
        throw CodecError("zstd decompress: unknown content size");
    std::vector<std::byte> out(static_cast<std::size_t>(content_size));
    auto rc = ZSTD_decompress(out.data(), out.size(), in.data(), in.size());
    if (ZSTD_isError(rc))
        throw CodecError(std::string("zstd decompress: ") + ZSTD_getErrorName(rc));
    out.resize(rc);
    return out;
}

} // namespace detail::zstd_backend
#endif

// ---------------------------------------------------------------------------
// Auto-registration
// ---------------------------------------------------------------------------

namespace detail {

inline const bool backends_registered = [] {
    register_codec(Codec::none, CodecImpl{
        [](std::span<const std::byte> in, int) {
            return std::vector<std::byte>(in.begin(), in.end());
        },
        [](std::span<const std::byte> in) {
            return std::vector<std::byte>(in.begin(), in.end());
        }
    });

    register_codec(Codec::zlib, CodecImpl{
        [](std::span<const std::byte> in, int level) {
            return zlib_backend::do_compress(in, level, false);
        },
        [](std::span<const std::byte> in) {
            return zlib_backend::do_decompress(in, false);
        }
    });
    register_codec(Codec::gzip, CodecImpl{
        [](std::span<const std::byte> in, int level) {
            return zlib_backend::do_compress(in, level, true);
        },
        [](std::span<const std::byte> in) {
            return zlib_backend::do_decompress(in, true);
        }
    });

#if METACACHE_HAS_ZSTD
    register_codec(Codec::zstd, CodecImpl{
        zstd_backend::do_compress, zstd_backend::do_decompress});
#endif

    return true;
}();

inline std::optional<CodecImpl> find_codec(Codec c) {
    (void)backends_registered;
    auto& reg = codec_registry();
    std::lock_guard lock{reg.mutex};
    auto it = reg.codecs.find(static_cast<std::uint8_t>(c));
    if (it == reg.codecs.end()) return std::nullopt;
    return it->second;
}

} // namespace detail

[[nodiscard]] inline bool codec_available(Codec c) {
    return detail::find_codec(c).has_value();
}

// ---------------------------------------------------------------------------
// Public API -- throws CodecError on failure or unavailable codec
// ---------------------------------------------------------------------------

[[nodiscard]] inline std::vector<std::byte>
compress(std::span<const std::byte> data, const CompressParams& params = {}) {
    auto impl = detail::find_codec(params.codec);
    if (!impl)
        throw CodecError(std::string("codec not available: ") + std::string(codec_name(params.codec)));
    return impl->compress(data, params.level);
}

[[nodiscard]] inline std::vector<std::byte>
decompress(std::span<const std::byte> data, Codec codec) {
    auto impl = detail::find_codec(codec);
    if (!impl)
        throw CodecError(std::string("codec not available: ") + std::string(codec_name(codec)));
    return impl->decompress(data);
}

} // namespace metacache
