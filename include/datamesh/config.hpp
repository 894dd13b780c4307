#pragma once
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

namespace datamesh {

using Millis = std::chrono::milliseconds;
// nullopt means "no limit".
using OptMillis = std::optional<Millis>;

// ---------------------------------------------------------------------------
// Per-request timeouts
// ---------------------------------------------------------------------------

struct Timeouts {
    OptMillis connect{Millis{3050}};
    OptMillis read{Millis{10'000}};

    [[nodiscard]] Timeouts with_read(OptMillis r) const noexcept
    {
        Timeouts t = *this;
        t.read = r;
        return t;
    }
};

// ---------------------------------------------------------------------------
// Retry policy: bounded attempts, backoff = backoff_base * 2^attempt
// ---------------------------------------------------------------------------

struct RetryPolicy {
    std::size_t retries = 8;
    Millis backoff_base{100};
    Millis bad_gateway_cooldown{30'000};

    [[nodiscard]] Millis backoff(std::size_t attempt) const noexcept
    {
        // Cap the shift; 2^20 * base is already far beyond any useful wait.
        auto shift = attempt < 20 ? attempt : std::size_t{20};
        return backoff_base * (std::int64_t{1} << shift);
    }
};

// ---------------------------------------------------------------------------
// Connection-wide configuration
// ---------------------------------------------------------------------------

struct Config {
    std::string token;
    std::string service = "https://datamesh.oceanum.io";
    std::optional<std::string> gateway;   // derived from service when unset
    std::optional<std::string> user;

    OptMillis connect_timeout{Millis{3050}};
    OptMillis read_timeout{Millis{10'000}};
    OptMillis stage_read_timeout{Millis{900'000}};
    OptMillis download_timeout{Millis{900'000}};
    OptMillis write_timeout{};
    OptMillis chunk_read_timeout{Millis{60'000}};
    OptMillis chunk_write_timeout{Millis{600'000}};
    Millis chunk_delete_timeout{10'000};

    RetryPolicy retry{};
    std::size_t chunk_retries = 10;
    std::size_t query_server_retries = 5;

    // Zero leaves the duration to the service.
    std::chrono::seconds session_duration{3600};
    std::string session_header = "X-SESSION-ID";

    std::filesystem::path cache_dir = std::filesystem::temp_directory_path() / "oceanum-io-cache";
    std::chrono::seconds lock_timeout{60};
    Millis lock_poll_interval{100};

    double lazy_threshold_bytes = 1e9;
    std::size_t row_warning_threshold = 2'000'000;

    std::size_t async_workers = std::thread::hardware_concurrency();

    [[nodiscard]] Timeouts timeouts(OptMillis read) const noexcept
    {
        return Timeouts{connect_timeout, read};
    }

    [[nodiscard]] Timeouts default_timeouts() const noexcept { return timeouts(read_timeout); }

    /// Overlay DATAMESH_* environment variables onto the defaults.
    /// Throws std::invalid_argument for an unparsable timeout value.
    [[nodiscard]] static Config from_env();
};

namespace config_detail {

// Seconds as a decimal ("3.05"); the literal "None" disables the limit.
[[nodiscard]] inline OptMillis parse_timeout(std::string_view name, std::string_view text)
{
    if (text == "None") return std::nullopt;
    double secs = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), secs);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(secs) || secs < 0)
        throw std::invalid_argument("config: " + std::string(name) + " is not a number of seconds: '" +
                                    std::string(text) + "'");
    return Millis{static_cast<std::int64_t>(std::llround(secs * 1000.0))};
}

inline void overlay_timeout(const char* name, OptMillis& field)
{
    if (const char* v = std::getenv(name)) field = parse_timeout(name, v);
}

} // namespace config_detail

inline Config Config::from_env()
{
    Config cfg;
    if (const char* v = std::getenv("DATAMESH_TOKEN"))   cfg.token = v;
    if (const char* v = std::getenv("DATAMESH_SERVICE")) cfg.service = v;
    if (const char* v = std::getenv("DATAMESH_GATEWAY")) cfg.gateway = std::string(v);
    if (const char* v = std::getenv("DATAMESH_USER"))    cfg.user = std::string(v);
    if (const char* v = std::getenv("DATAMESH_CACHE_DIR")) cfg.cache_dir = v;

    config_detail::overlay_timeout("DATAMESH_CONNECT_TIMEOUT", cfg.connect_timeout);
    config_detail::overlay_timeout("DATAMESH_READ_TIMEOUT", cfg.read_timeout);
    config_detail::overlay_timeout("DATAMESH_STAGE_READ_TIMEOUT", cfg.stage_read_timeout);
    config_detail::overlay_timeout("DATAMESH_DOWNLOAD_TIMEOUT", cfg.download_timeout);
    config_detail::overlay_timeout("DATAMESH_WRITE_TIMEOUT", cfg.write_timeout);
    config_detail::overlay_timeout("DATAMESH_CHUNK_READ_TIMEOUT", cfg.chunk_read_timeout);
    config_detail::overlay_timeout("DATAMESH_CHUNK_WRITE_TIMEOUT", cfg.chunk_write_timeout);

    if (cfg.async_workers == 0) cfg.async_workers = 1;
    return cfg;
}

} // namespace datamesh
