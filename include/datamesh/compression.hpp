#pragma once
#include <zlib.h>

#ifdef DATAMESH_HAS_ZSTD
#   include <zstd.h>
#endif

#ifdef DATAMESH_HAS_BLOSC
#   include <blosc.h>
#endif

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace datamesh {

// ---------------------------------------------------------------------------
// Codec enum
// ---------------------------------------------------------------------------

// Chunk compressors understood by the zarr layer. zlib and gzip are always
// built; zstd and blosc only when the build found their libraries.
enum class Codec : std::uint8_t {
    none = 0,
    zlib,
    gzip,
    zstd,
    blosc,
};

[[nodiscard]] constexpr std::string_view codec_name(Codec c) noexcept {
    switch (c) {
        case Codec::none:  return "none";
        case Codec::zlib:  return "zlib";
        case Codec::gzip:  return "gzip";
        case Codec::zstd:  return "zstd";
        case Codec::blosc: return "blosc";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<Codec> parse_codec(std::string_view name) noexcept {
    if (name == "none" || name.empty()) return Codec::none;
    if (name == "zlib")  return Codec::zlib;
    if (name == "gzip")  return Codec::gzip;
    if (name == "zstd")  return Codec::zstd;
    if (name == "blosc") return Codec::blosc;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Compression parameters
// ---------------------------------------------------------------------------

struct CompressParams {
    Codec codec           = Codec::none;
    int level             = 5;
    int shuffle           = 1;      // 0=none, 1=byte, 2=bit (blosc)
    std::size_t typesize  = 1;      // element size for shuffle (blosc)
    std::size_t blocksize = 0;      // 0 = auto (blosc)
    std::string cname     = "lz4";  // inner compressor (blosc)

    friend bool operator==(const CompressParams&, const CompressParams&) = default;
};

// ---------------------------------------------------------------------------
// Codec registry
// ---------------------------------------------------------------------------

using CompressFn = std::function<std::vector<std::byte>(
    std::span<const std::byte>, const CompressParams&)>;
using DecompressFn = std::function<std::vector<std::byte>(
    std::span<const std::byte>, std::size_t expected_size)>;

struct CodecImpl {
    CompressFn compress;
    DecompressFn decompress;
};

namespace detail {

inline auto& codec_registry() noexcept {
    static std::unordered_map<std::uint8_t, CodecImpl> reg;
    return reg;
}

} // namespace detail

inline void register_codec(Codec id, CodecImpl impl) {
    detail::codec_registry()[static_cast<std::uint8_t>(id)] = std::move(impl);
}

// ---------------------------------------------------------------------------
// Backend implementations
// ---------------------------------------------------------------------------

namespace detail::zlib_backend {

inline std::vector<std::byte> do_compress(std::span<const std::byte> in,
                                          const CompressParams& p, bool gzip_mode) {
    z_stream strm{};
    int window_bits = gzip_mode ? (15 + 16) : 15;
    if (deflateInit2(&strm, p.level, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw std::runtime_error("zlib: deflateInit2 failed");
    auto bound = deflateBound(&strm, static_cast<uLong>(in.size()));
    std::vector<std::byte> out(bound);
    strm.next_in  = reinterpret_cast<Bytef*>(const_cast<std::byte*>(in.data()));
    strm.avail_in = static_cast<uInt>(in.size());
    strm.next_out = reinterpret_cast<Bytef*>(out.data());
    strm.avail_out = static_cast<uInt>(out.size());
    auto rc = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (rc != Z_STREAM_END)
        throw std::runtime_error("zlib: deflate failed with code " + std::to_string(rc));
    out.resize(strm.total_out);
    return out;
}

// expected == 0 grows the output until the stream ends.
inline std::vector<std::byte> do_decompress(std::span<const std::byte> in,
                                            std::size_t expected, bool gzip_mode) {
    z_stream strm{};
    // 32 auto-detects a zlib or gzip header
    int window_bits = gzip_mode ? (15 + 32) : 15;
    if (inflateInit2(&strm, window_bits) != Z_OK)
        throw std::runtime_error("zlib: inflateInit2 failed");

    if (expected == 0) expected = in.size() * 4 + 64;
    std::vector<std::byte> out(expected);
    strm.next_in  = reinterpret_cast<Bytef*>(const_cast<std::byte*>(in.data()));
    strm.avail_in = static_cast<uInt>(in.size());

    std::size_t total = 0;
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        if (total == out.size()) out.resize(out.size() * 2);
        strm.next_out  = reinterpret_cast<Bytef*>(out.data() + total);
        strm.avail_out = static_cast<uInt>(out.size() - total);
        rc = inflate(&strm, Z_NO_FLUSH);
        if (rc == Z_BUF_ERROR && strm.avail_in == 0) {
            inflateEnd(&strm);
            throw std::runtime_error("zlib: truncated stream");
        }
        if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
            inflateEnd(&strm);
            throw std::runtime_error("zlib: inflate failed with code " + std::to_string(rc));
        }
        total = strm.total_out;
    }
    inflateEnd(&strm);
    out.resize(total);
    return out;
}

} // namespace detail::zlib_backend

#ifdef DATAMESH_HAS_ZSTD
namespace detail::zstd_backend {

inline std::vector<std::byte> do_compress(std::span<const std::byte> in,
                                          const CompressParams& p) {
    auto bound = ZSTD_compressBound(in.size());
    std::vector<std::byte> out(bound);
    auto rc = ZSTD_compress(out.data(), out.size(), in.data(), in.size(), p.level);
    if (ZSTD_isError(rc))
        throw std::runtime_error(std::string("zstd: compress: ") + ZSTD_getErrorName(rc));
    out.resize(rc);
    return out;
}

inline std::vector<std::byte> do_decompress(std::span<const std::byte> in,
                                            std::size_t expected) {
    if (expected == 0) {
        auto content_size = ZSTD_getFrameContentSize(in.data(), in.size());
        if (content_size == ZSTD_CONTENTSIZE_ERROR)
            throw std::runtime_error("zstd: not a valid zstd frame");
        if (content_size == ZSTD_CONTENTSIZE_UNKNOWN)
            throw std::runtime_error("zstd: unknown content size");
        expected = static_cast<std::size_t>(content_size);
    }
    std::vector<std::byte> out(expected);
    auto rc = ZSTD_decompress(out.data(), out.size(), in.data(), in.size());
    if (ZSTD_isError(rc))
        throw std::runtime_error(std::string("zstd: decompress: ") + ZSTD_getErrorName(rc));
    out.resize(rc);
    return out;
}

} // namespace detail::zstd_backend
#endif

#ifdef DATAMESH_HAS_BLOSC
namespace detail::blosc_backend {

inline std::vector<std::byte> do_compress(std::span<const std::byte> in,
                                          const CompressParams& p) {
    std::vector<std::byte> out(in.size() + BLOSC_MAX_OVERHEAD);
    auto rc = blosc_compress_ctx(
        p.level, p.shuffle,
        p.typesize, in.size(),
        in.data(), out.data(), out.size(),
        p.cname.c_str(),
        p.blocksize, 1);
    if (rc <= 0)
        throw std::runtime_error("blosc: compress failed with code " + std::to_string(rc));
    out.resize(static_cast<std::size_t>(rc));
    return out;
}

inline std::vector<std::byte> do_decompress(std::span<const std::byte> in,
                                            std::size_t expected) {
    if (expected == 0) {
        std::size_t nbytes{}, cbytes{}, blocksize{};
        blosc_cbuffer_sizes(in.data(), &nbytes, &cbytes, &blocksize);
        expected = nbytes;
    }
    std::vector<std::byte> out(expected);
    auto rc = blosc_decompress_ctx(in.data(), out.data(), out.size(), 1);
    if (rc < 0)
        throw std::runtime_error("blosc: decompress failed with code " + std::to_string(rc));
    out.resize(static_cast<std::size_t>(rc));
    return out;
}

} // namespace detail::blosc_backend
#endif

namespace detail {

inline const bool backends_registered = [] {
    register_codec(Codec::none, CodecImpl{
        [](std::span<const std::byte> in, const CompressParams&) {
            return std::vector<std::byte>(in.begin(), in.end());
        },
        [](std::span<const std::byte> in, std::size_t) {
            return std::vector<std::byte>(in.begin(), in.end());
        }
    });

    register_codec(Codec::zlib, CodecImpl{
        [](std::span<const std::byte> in, const CompressParams& p) {
            return zlib_backend::do_compress(in, p, false);
        },
        [](std::span<const std::byte> in, std::size_t expected) {
            return zlib_backend::do_decompress(in, expected, false);
        }
    });
    register_codec(Codec::gzip, CodecImpl{
        [](std::span<const std::byte> in, const CompressParams& p) {
            return zlib_backend::do_compress(in, p, true);
        },
        [](std::span<const std::byte> in, std::size_t expected) {
            return zlib_backend::do_decompress(in, expected, true);
        }
    });

#ifdef DATAMESH_HAS_ZSTD
    register_codec(Codec::zstd, CodecImpl{
        zstd_backend::do_compress, zstd_backend::do_decompress});
#endif

#ifdef DATAMESH_HAS_BLOSC
    register_codec(Codec::blosc, CodecImpl{
        blosc_backend::do_compress, blosc_backend::do_decompress});
#endif

    return true;
}();

} // namespace detail

[[nodiscard]] inline bool codec_available(Codec c) noexcept {
    (void)detail::backends_registered;
    return detail::codec_registry().contains(static_cast<std::uint8_t>(c));
}

// ---------------------------------------------------------------------------
// Core compress / decompress
// ---------------------------------------------------------------------------

[[nodiscard]] inline std::vector<std::byte> compress(
    std::span<const std::byte> input,
    const CompressParams& params)
{
    (void)detail::backends_registered;
    auto& reg = detail::codec_registry();
    auto it = reg.find(static_cast<std::uint8_t>(params.codec));
    if (it == reg.end())
        throw std::runtime_error(
            std::string("compress: codec '") + std::string(codec_name(params.codec)) + "' not available");
    return it->second.compress(input, params);
}

/// expected_size may be 0 when the frame records its own size.
[[nodiscard]] inline std::vector<std::byte> decompress(
    std::span<const std::byte> input,
    Codec codec,
    std::size_t expected_size)
{
    (void)detail::backends_registered;
    auto& reg = detail::codec_registry();
    auto it = reg.find(static_cast<std::uint8_t>(codec));
    if (it == reg.end())
        throw std::runtime_error(
            std::string("decompress: codec '") + std::string(codec_name(codec)) + "' not available");
    return it->second.decompress(input, expected_size);
}

} // namespace datamesh
