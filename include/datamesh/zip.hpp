#pragma once
#include "datamesh/zarr.hpp"

#include <zlib.h>

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace datamesh {

// ---------------------------------------------------------------------------
// Zipped zarr stores
//
// A .zarr.zip archive holds one entry per store key. Archives are written
// with stored (uncompressed) entries since zarr chunks carry their own
// compressor; reading also accepts deflated entries. Zip64 and encrypted
// archives are rejected.
// ---------------------------------------------------------------------------

namespace zip_detail {

inline constexpr std::uint32_t local_sig = 0x04034b50;
inline constexpr std::uint32_t central_sig = 0x02014b50;
inline constexpr std::uint32_t end_sig = 0x06054b50;
inline constexpr std::size_t end_size = 22;
inline constexpr std::uint16_t version = 20;
inline constexpr std::uint16_t dos_date = 0x21;  // 1980-01-01

// Little-endian reads over an archive held in memory
struct ByteReader {
    std::span<const std::byte> data;

    [[nodiscard]] std::uint16_t u16(std::size_t off) const {
        if (off > data.size() || data.size() - off < 2) throw std::runtime_error("zip: read out of bounds");
        std::uint16_t v;
        std::memcpy(&v, data.data() + off, 2);
        if constexpr (std::endian::native == std::endian::big) v = std::byteswap(v);
        return v;
    }

    [[nodiscard]] std::uint32_t u32(std::size_t off) const {
        if (off > data.size() || data.size() - off < 4) throw std::runtime_error("zip: read out of bounds");
        std::uint32_t v;
        std::memcpy(&v, data.data() + off, 4);
        if constexpr (std::endian::native == std::endian::big) v = std::byteswap(v);
        return v;
    }

    [[nodiscard]] std::span<const std::byte> bytes(std::size_t off, std::size_t len) const {
        if (off > data.size() || data.size() - off < len) throw std::runtime_error("zip: entry runs past the archive");
        return data.subspan(off, len);
    }
};

struct ByteWriter {
    std::vector<std::byte> buf;

    void u16(std::uint16_t v) {
        if constexpr (std::endian::native == std::endian::big) v = std::byteswap(v);
        auto off = buf.size();
        buf.resize(off + 2);
        std::memcpy(buf.data() + off, &v, 2);
    }

    void u32(std::uint32_t v) {
        if constexpr (std::endian::native == std::endian::big) v = std::byteswap(v);
        auto off = buf.size();
        buf.resize(off + 4);
        std::memcpy(buf.data() + off, &v, 4);
    }

    void raw(std::span<const std::byte> data) { buf.insert(buf.end(), data.begin(), data.end()); }
};

[[nodiscard]] inline std::uint32_t crc(std::span<const std::byte> data) {
    uLong c = crc32(0L, Z_NULL, 0);
    // crc32 takes a uInt length
    constexpr std::size_t step = std::numeric_limits<uInt>::max();
    for (std::size_t off = 0; off < data.size(); off += step) {
        auto n = std::min(step, data.size() - off);
        c = crc32(c, reinterpret_cast<const Bytef*>(data.data() + off), static_cast<uInt>(n));
    }
    return static_cast<std::uint32_t>(c);
}

// Raw deflate stream, as zip stores it
[[nodiscard]] inline std::vector<std::byte> inflate_raw(std::span<const std::byte> in, std::size_t size) {
    z_stream strm{};
    if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) throw std::runtime_error("zip: inflateInit2 failed");
    // one spare byte so an empty entry still has somewhere to land
    std::vector<std::byte> out(size + 1);
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(in.data()));
    strm.avail_in = static_cast<uInt>(in.size());
    strm.next_out = reinterpret_cast<Bytef*>(out.data());
    strm.avail_out = static_cast<uInt>(out.size());
    auto rc = inflate(&strm, Z_FINISH);
    auto produced = strm.total_out;
    inflateEnd(&strm);
    if (rc != Z_STREAM_END || produced != size)
        throw std::runtime_error("zip: corrupt deflate entry");
    out.resize(size);
    return out;
}

[[nodiscard]] inline std::size_t find_end(const ByteReader& r) {
    if (r.data.size() < end_size) throw std::runtime_error("zip: archive too short");
    // the end record is followed by at most a 64 KiB comment
    std::size_t last = r.data.size() - end_size;
    std::size_t first = last > 0xFFFF ? last - 0xFFFF : 0;
    for (std::size_t off = last + 1; off-- > first;)
        if (r.u32(off) == end_sig) return off;
    throw std::runtime_error("zip: end of central directory not found");
}

} // namespace zip_detail

/// Unpack an archive into a MemoryStore keyed by entry name.
[[nodiscard]] inline std::shared_ptr<MemoryStore> unzip_store(std::span<const std::byte> archive) {
    using namespace zip_detail;
    ByteReader r{archive};
    auto end = find_end(r);
    std::size_t entries = r.u16(end + 10);
    std::uint32_t cd_size = r.u32(end + 12);
    std::uint32_t cd_off = r.u32(end + 16);
    if (entries == 0xFFFF || cd_size == 0xFFFFFFFF || cd_off == 0xFFFFFFFF)
        throw std::runtime_error("zip: zip64 archives are not supported");

    auto store = std::make_shared<MemoryStore>();
    std::size_t off = cd_off;
    for (std::size_t i = 0; i < entries; ++i) {
        if (r.u32(off) != central_sig) throw std::runtime_error("zip: bad central directory entry");
        auto flags = r.u16(off + 8);
        auto method = r.u16(off + 10);
        auto sum = r.u32(off + 16);
        std::size_t csize = r.u32(off + 20);
        std::size_t usize = r.u32(off + 24);
        std::size_t nlen = r.u16(off + 28);
        std::size_t elen = r.u16(off + 30);
        std::size_t clen = r.u16(off + 32);
        std::size_t local = r.u32(off + 42);
        auto raw_name = r.bytes(off + 46, nlen);
        std::string name(reinterpret_cast<const char*>(raw_name.data()), raw_name.size());
        off += 46 + nlen + elen + clen;

        if (name.empty() || name.back() == '/') continue;
        if (flags & 0x1) throw std::runtime_error("zip: entry '" + name + "' is encrypted");
        if (r.u32(local) != local_sig) throw std::runtime_error("zip: bad local header for '" + name + "'");
        auto payload = r.bytes(local + 30 + r.u16(local + 26) + r.u16(local + 28), csize);

        std::vector<std::byte> value;
        switch (method) {
            case 0:
                if (csize != usize) throw std::runtime_error("zip: stored entry '" + name + "' has mismatched sizes");
                value.assign(payload.begin(), payload.end());
                break;
            case 8:
                value = inflate_raw(payload, usize);
                break;
            default:
                throw std::runtime_error("zip: entry '" + name + "' uses unsupported method " + std::to_string(method));
        }
        if (crc(value) != sum) throw std::runtime_error("zip: checksum mismatch in '" + name + "'");
        store->set(name, value);
    }
    return store;
}

[[nodiscard]] inline std::shared_ptr<MemoryStore> unzip_store(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("zip: cannot open " + path.string());
    std::vector<char> raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) throw std::runtime_error("zip: cannot read " + path.string());
    return unzip_store(std::as_bytes(std::span(raw)));
}

/// Pack every key of `store` into an archive of stored entries.
[[nodiscard]] inline std::vector<std::byte> zip_store(const Store& store) {
    using namespace zip_detail;
    ByteWriter out;
    ByteWriter cd;
    auto keys = store.list();
    if (keys.size() >= 0xFFFF) throw std::runtime_error("zip: too many entries");

    auto fits = [](std::size_t n) { return n < 0xFFFFFFFF; };
    for (const auto& key : keys) {
        auto value = store.get(key);
        if (key.size() > 0xFFFF) throw std::runtime_error("zip: entry name too long");
        if (!fits(value.size()) || !fits(out.buf.size())) throw std::runtime_error("zip: archive needs zip64");
        auto sum = crc(value);
        auto size = static_cast<std::uint32_t>(value.size());
        auto local = static_cast<std::uint32_t>(out.buf.size());
        auto name = std::as_bytes(std::span(key.data(), key.size()));

        out.u32(local_sig);
        out.u16(version);
        out.u16(0);  // flags
        out.u16(0);  // stored
        out.u16(0);
        out.u16(dos_date);
        out.u32(sum);
        out.u32(size);
        out.u32(size);
        out.u16(static_cast<std::uint16_t>(key.size()));
        out.u16(0);
        out.raw(name);
        out.raw(value);

        cd.u32(central_sig);
        cd.u16(version);
        cd.u16(version);
        cd.u16(0);
        cd.u16(0);
        cd.u16(0);
        cd.u16(dos_date);
        cd.u32(sum);
        cd.u32(size);
        cd.u32(size);
        cd.u16(static_cast<std::uint16_t>(key.size()));
        cd.u16(0);  // extra
        cd.u16(0);  // comment
        cd.u16(0);  // disk
        cd.u16(0);  // internal attributes
        cd.u32(0);  // external attributes
        cd.u32(local);
        cd.raw(name);
    }

    if (!fits(out.buf.size() + cd.buf.size())) throw std::runtime_error("zip: archive needs zip64");
    auto cd_off = static_cast<std::uint32_t>(out.buf.size());
    out.raw(cd.buf);
    out.u32(end_sig);
    out.u16(0);
    out.u16(0);
    out.u16(static_cast<std::uint16_t>(keys.size()));
    out.u16(static_cast<std::uint16_t>(keys.size()));
    out.u32(static_cast<std::uint32_t>(cd.buf.size()));
    out.u32(cd_off);
    out.u16(0);
    return std::move(out.buf);
}

inline void zip_store(const Store& store, const std::filesystem::path& path) {
    auto bytes = zip_store(store);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    f.close();
    if (!f) throw std::runtime_error("zip: cannot write " + path.string());
}

} // namespace datamesh
