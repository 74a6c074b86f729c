#pragma once
#include <metacache/traits.hpp>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>

// Shared asset/metadata types and helpers for the metacache tests.
namespace fixtures {

namespace fs = std::filesystem;

struct TestAsset {
    std::string id;

    [[nodiscard]] std::string identifier() const { return id; }
};

// Encoded as a 4-byte little-endian value followed by the raw text.
struct TestMetadata {
    std::int32_t v = 0;
    std::string  text;

    [[nodiscard]] metacache::Bytes encode() const
    {
        metacache::Bytes out(4 + text.size());
        auto u = static_cast<std::uint32_t>(v);
        for (int i = 0; i < 4; ++i)
            out[static_cast<std::size_t>(i)] = static_cast<std::byte>((u >> (8 * i)) & 0xff);
        if (!text.empty())
            std::memcpy(out.data() + 4, text.data(), text.size());
        return out;
    }

    [[nodiscard]] static TestMetadata decode(std::span<const std::byte> b)
    {
        if (b.size() < 4)
            throw std::runtime_error("truncated metadata payload");
        std::uint32_t u = 0;
        for (int i = 0; i < 4; ++i)
            u |= static_cast<std::uint32_t>(b[static_cast<std::size_t>(i)]) << (8 * i);
        TestMetadata m;
        m.v = static_cast<std::int32_t>(u);
        m.text.assign(reinterpret_cast<const char*>(b.data()) + 4, b.size() - 4);
        return m;
    }

    friend bool operator==(const TestMetadata&, const TestMetadata&) = default;
};

static_assert(metacache::Asset<TestAsset>);
static_assert(metacache::Metadata<TestMetadata>);

/// Fresh, empty directory under the system temp path.
inline fs::path make_temp_dir(const std::string& suffix)
{
    auto p = fs::temp_directory_path() / ("metacache_test_" + suffix);
    fs::remove_all(p);
    return p;
}

/// One-shot gate that loader units block on until the test opens it.
class Gate {
public:
    void open()
    {
        {
            std::lock_guard lock{mu_};
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait()
    {
        std::unique_lock lock{mu_};
        cv_.wait(lock, [this] { return open_; });
    }

private:
    std::mutex              mu_;
    std::condition_variable cv_;
    bool                    open_ = false;
};

} // namespace fixtures
