#pragma once
#include "error.hpp"
#include "hash.hpp"
#include "log.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <vector>
#include <span>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <optional>
#include <system_error>

namespace metacache {

/// Per-user cache root: $XDG_CACHE_HOME/metacache, else ~/.cache/metacache,
/// else a directory under the system temp path.
[[nodiscard]] inline std::filesystem::path default_cache_root()
{
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg)
        return std::filesystem::path{xdg} / "metacache";
    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path{home} / ".cache" / "metacache";
    return std::filesystem::temp_directory_path() / "metacache";
}

// ---------------------------------------------------------------------------
// PersistenceDirectory -- one file per key under <root>/<digest(namespace)>/.
//
// File names are <digest(key)>[.<ext>] where ext is whatever follows the
// last '.' of the key. Writes are atomic (temp file + rename) and serialized
// per key through a small lock pool. All calls are synchronous.
// ---------------------------------------------------------------------------
class PersistenceDirectory final {
public:
    static constexpr std::size_t lock_pool_size = 32;

    // In-flight writes are named "<prefix><final name>". Final names start
    // with a hex digest, so no key can collide with this prefix.
    static constexpr std::string_view partial_prefix = ".partial-";

    PersistenceDirectory(std::string_view name_space, const std::filesystem::path& root)
        : name_space_{name_space}
        , dir_{root / key_digest(name_space)}
        , locks_(lock_pool_size)
    {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec)
            throw PersistenceError("cannot create cache directory " + dir_.string()
                                   + ": " + ec.message());
        channel::disk.info("namespace '{}' at {}", name_space_, dir_.string());
    }

    PersistenceDirectory(const PersistenceDirectory&)            = delete;
    PersistenceDirectory& operator=(const PersistenceDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }
    [[nodiscard]] const std::string& name_space() const noexcept { return name_space_; }

    /// Location of the file backing `key`, whether or not it exists.
    [[nodiscard]] std::filesystem::path path_for(std::string_view key) const
    {
        auto name = key_digest(key);
        auto ext = extension_of(key);
        if (!ext.empty()) {
            name += '.';
            name += ext;
        }
        return dir_ / name;
    }

    /// Write atomically. Throws PersistenceError if the file cannot be written.
    void save(std::span<const std::byte> data, std::string_view key)
    {
        auto path = path_for(key);
        auto tmp_path = dir_ / (std::string(partial_prefix) + path.filename().string());

        std::lock_guard lock{lock_for(key)};

        // clear() may have removed the directory since construction.
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec)
            throw PersistenceError("cannot create " + dir_.string() + ": " + ec.message());

        {
            std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
            if (!ofs)
                throw PersistenceError("cannot open " + tmp_path.string());
            ofs.write(reinterpret_cast<const char*>(data.data()),
                      static_cast<std::streamsize>(data.size()));
            ofs.close();
            if (!ofs) {
                std::filesystem::remove(tmp_path, ec);
                throw PersistenceError("short write to " + tmp_path.string());
            }
        }

        std::filesystem::rename(tmp_path, path, ec);
        if (ec) {
            std::error_code rm_ec;
            std::filesystem::remove(tmp_path, rm_ec);
            throw PersistenceError("cannot rename into " + path.string() + ": " + ec.message());
        }
    }

    /// Read the whole file. nullopt if missing or unreadable.
    [[nodiscard]] std::optional<std::vector<std::byte>> load(std::string_view key) const
    {
        auto path = path_for(key);

        std::lock_guard lock{lock_for(key)};

        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (ec) return std::nullopt;

        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) return std::nullopt;

        std::vector<std::byte> buf(size);
        ifs.read(reinterpret_cast<char*>(buf.data()),
                 static_cast<std::streamsize>(size));
        if (!ifs) return std::nullopt;

        return buf;
    }

    [[nodiscard]] bool exists(std::string_view key) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(path_for(key), ec);
    }

    /// Returns true if the file existed.
    bool remove(std::string_view key)
    {
        auto path = path_for(key);
        std::lock_guard lock{lock_for(key)};
        std::error_code ec;
        return std::filesystem::remove(path, ec) && !ec;
    }

    /// Remove the whole namespace directory. A missing directory is fine.
    void clear()
    {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
        if (ec)
            channel::disk.warn("clear {}: {}", dir_.string(), ec.message());
    }

    // -- stats ---------------------------------------------------------------

    [[nodiscard]] std::size_t file_count() const
    {
        std::size_t count = 0;
        std::error_code ec;
        for (auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
            if (entry.is_regular_file(ec) && !is_partial(entry.path()))
                ++count;
        }
        return count;
    }

    [[nodiscard]] std::size_t total_bytes() const
    {
        std::size_t total = 0;
        std::error_code ec;
        for (auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
            if (!entry.is_regular_file(ec) || is_partial(entry.path()))
                continue;
            auto sz = entry.file_size(ec);
            if (!ec) total += sz;
        }
        return total;
    }

    /// Text after the last '.' of the key; empty when there is none or it
    /// would not make a plain file suffix.
    [[nodiscard]] static std::string_view extension_of(std::string_view key) noexcept
    {
        auto dot = key.rfind('.');
        if (dot == std::string_view::npos || dot + 1 == key.size())
            return {};
        auto ext = key.substr(dot + 1);
        if (ext.find_first_of("/\\") != std::string_view::npos)
            return {};
        return ext;
    }

private:
    [[nodiscard]] static bool is_partial(const std::filesystem::path& p)
    {
        return p.filename().string().starts_with(partial_prefix);
    }

    [[nodiscard]] std::mutex& lock_for(std::string_view key) const
    {
        return locks_[fnv1a(key) % locks_.size()];
    }

    std::string                        name_space_;
    std::filesystem::path              dir_;
    mutable std::vector<std::mutex>    locks_;
};

} // namespace metacache
