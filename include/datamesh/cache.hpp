#pragma once
#include "datamesh/config.hpp"
#include "datamesh/dataset.hpp"
#include "datamesh/error.hpp"
#include "datamesh/lock_pool.hpp"
#include "datamesh/log.hpp"
#include "datamesh/query.hpp"
#include "datamesh/table.hpp"
#include "datamesh/zarr.hpp"
#include "datamesh/zip.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <variant>

namespace datamesh {

// Eagerly materialised query results the cache can hold.
using CachedResult = std::variant<std::monostate, Dataset, GeoTable, Table>;

struct CacheConfig {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "oceanum-io-cache";
    std::chrono::seconds ttl{600};
    std::chrono::seconds lock_timeout{60};
    Millis poll_interval{100};

    [[nodiscard]] static CacheConfig from_config(const Config& cfg, std::chrono::seconds ttl)
    {
        return CacheConfig{cfg.cache_dir, ttl, cfg.lock_timeout, cfg.lock_poll_interval};
    }
};

// ---------------------------------------------------------------------------
// LocalResultCache
//
// Content-addressed results under `dir`: {hash}.zarr.zip (arrays, a zipped
// zarr store), {hash}.gpq (geo-tables) and {hash}.pq (tables), where hash is
// the SHA-224 of the query's canonical JSON. A sibling {hash}.lock marks a
// fetch in flight. The lock is advisory: it expires after lock_timeout so a
// crashed writer cannot wedge the cache, and two writers that both see it
// free may both proceed. Artifacts only ever appear at their final path by
// rename, so a reader never sees a partial file.
// ---------------------------------------------------------------------------

class LocalResultCache final {
public:
    explicit LocalResultCache(CacheConfig config = {}) : cfg_{std::move(config)}
    {
        std::filesystem::create_directories(cfg_.dir);
    }

    [[nodiscard]] const CacheConfig& config() const noexcept { return cfg_; }

    /// Artifact path without extension.
    [[nodiscard]] std::filesystem::path cache_path(const Query& query) const
    {
        return cfg_.dir / query.hash();
    }

    [[nodiscard]] static constexpr std::string_view extension(Container c) noexcept
    {
        switch (c) {
            case Container::dataset:  return ".zarr.zip";
            case Container::geotable: return ".gpq";
            case Container::table:    return ".pq";
        }
        return ".zarr.zip";
    }

    /// Unique scratch path beside the artifact for `query`, for downloads
    /// later handed to copy(). Unique across threads and processes.
    [[nodiscard]] std::filesystem::path temp_path(const Query& query, std::string_view ext) const
    {
        auto dest = cache_path(query);
        dest += ext;
        return temp_sibling(dest);
    }

    // -----------------------------------------------------------------------
    // Lock file
    // -----------------------------------------------------------------------

    /// Create the lock file. An existing live lock is left alone and false
    /// is returned; an expired one is replaced.
    bool lock(const Query& query)
    {
        auto path = lock_path(query);
        if (std::filesystem::exists(path) && !locked(query)) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
        int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
        if (fd < 0) {
            if (errno == EEXIST) return false;
            throw CacheError(std::format("cache: cannot create lock {}: {}", path.string(), std::strerror(errno)));
        }
        ::close(fd);
        return true;
    }

    /// True while the lock file exists and is younger than lock_timeout.
    [[nodiscard]] bool locked(const Query& query) const
    {
        std::error_code ec;
        auto mtime = std::filesystem::last_write_time(lock_path(query), ec);
        if (ec) return false;
        return std::filesystem::file_time_type::clock::now() - mtime < cfg_.lock_timeout;
    }

    void unlock(const Query& query)
    {
        if (!locked(query)) return;
        std::error_code ec;
        std::filesystem::remove(lock_path(query), ec);
    }

    // -----------------------------------------------------------------------
    // Read
    // -----------------------------------------------------------------------

    /// Cached result, or nullopt when absent, stale, corrupt, or still
    /// locked after `timeout`. Never throws for a bad entry.
    [[nodiscard]] std::optional<CachedResult> get(const Query& query)
    {
        return get(query, std::chrono::duration_cast<Millis>(cfg_.lock_timeout));
    }

    [[nodiscard]] std::optional<CachedResult> get(const Query& query, Millis timeout)
    {
        auto key = query.hash();
        auto guard = pool().try_lock_for(key, timeout);
        if (!guard.owns_lock()) {
            Logger::debug("cache: in-process lock on {} timed out", key);
            return std::nullopt;
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (locked(query)) {
            if (std::chrono::steady_clock::now() >= deadline) {
                Logger::debug("cache: {} still locked after {}ms", key, timeout.count());
                return std::nullopt;
            }
            std::this_thread::sleep_for(cfg_.poll_interval);
        }
        return read(query);
    }

    // -----------------------------------------------------------------------
    // Write
    // -----------------------------------------------------------------------

    /// Throws std::invalid_argument for an empty result and CacheError when
    /// the artifact cannot be written.
    void put(const Query& query, const CachedResult& result)
    {
        auto key = query.hash();
        auto guard = pool().lock(key);
        auto base = cache_path(query);

        std::visit([&](const auto& data) {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                throw std::invalid_argument("Unsupported data type");
            } else if constexpr (std::is_same_v<T, Dataset>) {
                publish(base, extension(Container::dataset), [&](const std::filesystem::path& tmp) {
                    auto store = std::make_shared<MemoryStore>();
                    write_dataset(store, data);
                    zip_store(*store, tmp);
                });
            } else if constexpr (std::is_same_v<T, GeoTable>) {
                publish(base, extension(Container::geotable),
                        [&](const std::filesystem::path& tmp) { data.write(tmp); });
            } else {
                publish(base, extension(Container::table),
                        [&](const std::filesystem::path& tmp) { data.write(tmp); });
            }
        }, result);
        Logger::debug("cache: stored {}", key);
    }

    /// Move a file produced out of band to the cache path with extension
    /// `ext`. Falls back to copy-then-rename across file systems.
    void copy(const Query& query, const std::filesystem::path& tmp_path, std::string_view ext)
    {
        auto dest = cache_path(query);
        dest += ext;
        std::error_code ec;
        std::filesystem::rename(tmp_path, dest, ec);
        if (!ec) return;

        auto staging = temp_sibling(dest);
        try {
            std::filesystem::copy_file(tmp_path, staging, std::filesystem::copy_options::overwrite_existing);
            std::filesystem::rename(staging, dest);
        } catch (const std::filesystem::filesystem_error& e) {
            std::filesystem::remove(staging, ec);
            throw CacheError(std::format("cache: cannot move {} into the cache: {}", tmp_path.string(), e.what()));
        }
        std::filesystem::remove(tmp_path, ec);
    }

private:
    [[nodiscard]] std::filesystem::path lock_path(const Query& query) const
    {
        auto p = cache_path(query);
        p += ".lock";
        return p;
    }

    [[nodiscard]] static std::filesystem::path temp_sibling(const std::filesystem::path& dest)
    {
        static std::atomic<unsigned> counter{0};
        auto p = dest;
        p += std::format(".tmp{}-{}", ::getpid(), counter.fetch_add(1));
        return p;
    }

    // Serialize into a temporary sibling, then rename into place.
    template <typename WriteFn>
    void publish(const std::filesystem::path& base, std::string_view ext, WriteFn&& write)
    {
        auto dest = base;
        dest += ext;
        auto tmp = temp_sibling(dest);
        std::error_code ec;
        try {
            write(tmp);
            std::filesystem::rename(tmp, dest);
        } catch (const std::exception& e) {
            std::filesystem::remove(tmp, ec);
            throw CacheError(std::format("cache: cannot write {}: {}", dest.string(), e.what()));
        }
    }

    [[nodiscard]] bool stale(const std::filesystem::path& p) const
    {
        auto age = std::filesystem::file_time_type::clock::now() - std::filesystem::last_write_time(p);
        return age >= cfg_.ttl;
    }

    [[nodiscard]] std::optional<CachedResult> read(const Query& query)
    {
        auto base = cache_path(query);
        for (auto kind : {Container::dataset, Container::geotable, Container::table}) {
            auto path = base;
            path += extension(kind);
            try {
                if (!std::filesystem::exists(path)) continue;
                if (stale(path)) {
                    Logger::debug("cache: {} is stale", path.filename().string());
                    std::filesystem::remove(path);
                    return std::nullopt;
                }
                Logger::debug("cache: hit {}", path.filename().string());
                switch (kind) {
                    case Container::dataset:
                        return CachedResult{load_dataset(unzip_store(path))};
                    case Container::geotable:
                        return CachedResult{GeoTable::read(path)};
                    case Container::table:
                        return CachedResult{Table::read(path)};
                }
            } catch (const std::exception& e) {
                Logger::warn("cache: unreadable entry {}: {}", path.string(), e.what());
                return std::nullopt;
            }
        }
        Logger::debug("cache: miss {}", base.filename().string());
        return std::nullopt;
    }

    static LockPool<64>& pool() noexcept
    {
        static LockPool<64> p;
        return p;
    }

    CacheConfig cfg_;
};

} // namespace datamesh
