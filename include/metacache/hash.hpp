#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace metacache {

// --- FNV-1a constants (64-bit) ---
inline constexpr std::uint64_t fnv_offset_basis = 14695981039346656037ULL;
inline constexpr std::uint64_t fnv_prime = 1099511628211ULL;

// --- FNV-1a hash from raw bytes, continuing from `seed` ---
[[nodiscard]] constexpr std::uint64_t
fnv1a(const void* data, std::size_t len,
      std::uint64_t seed = fnv_offset_basis) noexcept
{
    auto p = static_cast<const unsigned char*>(data);
    auto h = seed;
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint64_t>(p[i]);
        h *= fnv_prime;
    }
    return h;
}

// --- FNV-1a hash from string_view ---
[[nodiscard]] constexpr std::uint64_t
fnv1a(std::string_view sv, std::uint64_t seed = fnv_offset_basis) noexcept
{
    auto h = seed;
    for (auto c : sv) {
        h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
        h *= fnv_prime;
    }
    return h;
}

// --- boost-style hash_combine ---
[[nodiscard]] constexpr std::size_t
hash_combine(std::size_t seed, std::size_t value) noexcept
{
    seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
}

// --- Lowercase hex of a 64-bit value, always 16 characters ---
[[nodiscard]] inline std::string to_hex(std::uint64_t h)
{
    static constexpr char hex[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = hex[h & 0xf];
        h >>= 4;
    }
    return out;
}

// --- 128-bit filesystem-safe digest of a key (32 hex chars) ---
// Two FNV-1a lanes: the second is seeded from the first so that keys which
// collide in one lane are unlikely to collide in both.
[[nodiscard]] inline std::string key_digest(std::string_view key)
{
    const auto lo = fnv1a(key);
    const auto hi = fnv1a(key, hash_combine(fnv_offset_basis, lo));
    return to_hex(hi) + to_hex(lo);
}

} // namespace metacache
