#pragma once
#include "datamesh/compression.hpp"
#include "datamesh/error.hpp"
#include "datamesh/json.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace datamesh {

// ---------------------------------------------------------------------------
// ZarrDtype
// ---------------------------------------------------------------------------

enum class ZarrDtype : std::uint8_t {
    bool_,
    uint8, uint16, uint32, uint64,
    int8, int16, int32, int64,
    float32, float64,
};

[[nodiscard]] constexpr std::size_t dtype_size(ZarrDtype dt) noexcept {
    switch (dt) {
        case ZarrDtype::bool_:   return 1;
        case ZarrDtype::uint8:   return 1;
        case ZarrDtype::uint16:  return 2;
        case ZarrDtype::uint32:  return 4;
        case ZarrDtype::uint64:  return 8;
        case ZarrDtype::int8:    return 1;
        case ZarrDtype::int16:   return 2;
        case ZarrDtype::int32:   return 4;
        case ZarrDtype::int64:   return 8;
        case ZarrDtype::float32: return 4;
        case ZarrDtype::float64: return 8;
    }
    return 0;
}

/// The zarr v2 dtype string WITHOUT the byte-order prefix (e.g. "u2").
[[nodiscard]] constexpr std::string_view dtype_string(ZarrDtype dt) noexcept {
    switch (dt) {
        case ZarrDtype::bool_:   return "b1";
        case ZarrDtype::uint8:   return "u1";
        case ZarrDtype::uint16:  return "u2";
        case ZarrDtype::uint32:  return "u4";
        case ZarrDtype::uint64:  return "u8";
        case ZarrDtype::int8:    return "i1";
        case ZarrDtype::int16:   return "i2";
        case ZarrDtype::int32:   return "i4";
        case ZarrDtype::int64:   return "i8";
        case ZarrDtype::float32: return "f4";
        case ZarrDtype::float64: return "f8";
    }
    return "";
}

/// numpy-style name used in dataset schemas ("float64", "int32", ...).
[[nodiscard]] constexpr std::string_view dtype_name(ZarrDtype dt) noexcept {
    switch (dt) {
        case ZarrDtype::bool_:   return "bool";
        case ZarrDtype::uint8:   return "uint8";
        case ZarrDtype::uint16:  return "uint16";
        case ZarrDtype::uint32:  return "uint32";
        case ZarrDtype::uint64:  return "uint64";
        case ZarrDtype::int8:    return "int8";
        case ZarrDtype::int16:   return "int16";
        case ZarrDtype::int32:   return "int32";
        case ZarrDtype::int64:   return "int64";
        case ZarrDtype::float32: return "float32";
        case ZarrDtype::float64: return "float64";
    }
    return "";
}

/// Parses a v2 dtype string such as "<u2", "<f8", "|b1". Big-endian
/// dtypes are not supported.
[[nodiscard]] constexpr std::optional<ZarrDtype> parse_dtype(std::string_view s) noexcept {
    if (!s.empty() && s.front() == '>') return std::nullopt;
    if (!s.empty() && (s.front() == '<' || s.front() == '|'))
        s.remove_prefix(1);
    if (s == "b1") return ZarrDtype::bool_;
    if (s == "u1") return ZarrDtype::uint8;
    if (s == "u2") return ZarrDtype::uint16;
    if (s == "u4") return ZarrDtype::uint32;
    if (s == "u8") return ZarrDtype::uint64;
    if (s == "i1") return ZarrDtype::int8;
    if (s == "i2") return ZarrDtype::int16;
    if (s == "i4") return ZarrDtype::int32;
    if (s == "i8") return ZarrDtype::int64;
    if (s == "f4") return ZarrDtype::float32;
    if (s == "f8") return ZarrDtype::float64;
    return std::nullopt;
}

template <typename T>
[[nodiscard]] consteval ZarrDtype dtype_of() noexcept {
    if constexpr (std::is_same_v<T, bool>)          return ZarrDtype::bool_;
    else if constexpr (std::is_same_v<T, std::uint8_t>)  return ZarrDtype::uint8;
    else if constexpr (std::is_same_v<T, std::uint16_t>) return ZarrDtype::uint16;
    else if constexpr (std::is_same_v<T, std::uint32_t>) return ZarrDtype::uint32;
    else if constexpr (std::is_same_v<T, std::uint64_t>) return ZarrDtype::uint64;
    else if constexpr (std::is_same_v<T, std::int8_t>)   return ZarrDtype::int8;
    else if constexpr (std::is_same_v<T, std::int16_t>)  return ZarrDtype::int16;
    else if constexpr (std::is_same_v<T, std::int32_t>)  return ZarrDtype::int32;
    else if constexpr (std::is_same_v<T, std::int64_t>)  return ZarrDtype::int64;
    else if constexpr (std::is_same_v<T, float>)         return ZarrDtype::float32;
    else {
        static_assert(std::is_same_v<T, double>, "unsupported element type");
        return ZarrDtype::float64;
    }
}

namespace detail {

template <typename F>
decltype(auto) visit_dtype(ZarrDtype dt, F&& f) {
    switch (dt) {
        case ZarrDtype::bool_:   return f(bool{});
        case ZarrDtype::uint8:   return f(std::uint8_t{});
        case ZarrDtype::uint16:  return f(std::uint16_t{});
        case ZarrDtype::uint32:  return f(std::uint32_t{});
        case ZarrDtype::uint64:  return f(std::uint64_t{});
        case ZarrDtype::int8:    return f(std::int8_t{});
        case ZarrDtype::int16:   return f(std::int16_t{});
        case ZarrDtype::int32:   return f(std::int32_t{});
        case ZarrDtype::int64:   return f(std::int64_t{});
        case ZarrDtype::float32: return f(float{});
        case ZarrDtype::float64: return f(double{});
    }
    throw std::invalid_argument("zarr: unknown dtype");
}

} // namespace detail

/// Element i of a raw buffer, widened to double.
[[nodiscard]] inline double element_as_double(std::span<const std::byte> buf, ZarrDtype dt, std::size_t i) {
    return detail::visit_dtype(dt, [&](auto tag) {
        using T = decltype(tag);
        T v{};
        std::memcpy(&v, buf.data() + i * sizeof(T), sizeof(T));
        return static_cast<double>(v);
    });
}

/// One element of dtype `dt` holding `value` (zero bytes when nullopt).
[[nodiscard]] inline std::vector<std::byte> fill_bytes(ZarrDtype dt, std::optional<double> value) {
    std::vector<std::byte> out(dtype_size(dt));
    if (!value) return out;
    detail::visit_dtype(dt, [&](auto tag) {
        using T = decltype(tag);
        T v{};
        if constexpr (std::is_floating_point_v<T>) {
            v = static_cast<T>(*value);
        } else {
            if (std::isfinite(*value)) v = static_cast<T>(*value);
        }
        std::memcpy(out.data(), &v, sizeof(T));
        return 0;
    });
    return out;
}

// ---------------------------------------------------------------------------
// ZarrMetadata (.zarray, v2)
// ---------------------------------------------------------------------------

struct ZarrMetadata {
    std::vector<std::size_t> shape;
    std::vector<std::size_t> chunks;
    ZarrDtype dtype = ZarrDtype::float64;
    std::optional<double> fill_value;
    CompressParams compressor{};        // Codec::none serializes as null
    std::string dimension_separator = ".";

    [[nodiscard]] std::size_t ndim() const noexcept { return shape.size(); }

    [[nodiscard]] std::size_t num_chunks_along(std::size_t dim) const noexcept {
        if (dim >= shape.size() || dim >= chunks.size() || chunks[dim] == 0) return 0;
        return (shape[dim] + chunks[dim] - 1) / chunks[dim];
    }

    [[nodiscard]] std::size_t chunk_elements() const noexcept {
        std::size_t n = 1;
        for (auto c : chunks) n *= c;
        return n;
    }

    [[nodiscard]] std::size_t chunk_byte_size() const noexcept {
        return chunk_elements() * dtype_size(dtype);
    }

    [[nodiscard]] std::size_t size() const noexcept {
        std::size_t n = 1;
        for (auto s : shape) n *= s;
        return n;
    }
};

namespace detail {

[[nodiscard]] inline CompressParams parse_compressor(const JsonValue& v, ZarrDtype dtype) {
    CompressParams p;
    if (v.is_null()) return p;
    if (!v.is_object()) throw std::runtime_error("zarr: compressor must be an object or null");

    auto id = v.get_string("id").value_or("");
    auto codec = parse_codec(id);
    if (!codec || *codec == Codec::none)
        throw std::runtime_error("zarr: unsupported compressor: " + id);
    p.codec = *codec;
    p.typesize = dtype_size(dtype);
    if (p.codec == Codec::blosc) {
        p.cname = v.get_string("cname").value_or("lz4");
        p.level = static_cast<int>(v.get_number("clevel").value_or(5));
        p.shuffle = static_cast<int>(v.get_number("shuffle").value_or(1));
        p.blocksize = static_cast<std::size_t>(v.get_number("blocksize").value_or(0));
    } else {
        p.level = static_cast<int>(v.get_number("level").value_or(p.codec == Codec::zstd ? 1 : 5));
    }
    return p;
}

[[nodiscard]] inline JsonValue serialize_compressor(const CompressParams& p) {
    switch (p.codec) {
        case Codec::none:
            return JsonValue{};
        case Codec::blosc:
            return json_object({{"id", "blosc"}, {"cname", p.cname}, {"clevel", p.level},
                                {"shuffle", p.shuffle}, {"blocksize", p.blocksize}});
        default:
            return json_object({{"id", std::string(codec_name(p.codec))}, {"level", p.level}});
    }
}

[[nodiscard]] inline std::optional<double> parse_fill_value(const JsonValue& v) {
    if (v.is_number()) return v.as_number();
    if (v.is_bool()) return v.as_bool() ? 1.0 : 0.0;
    if (v.is_string()) {
        const auto& s = v.as_string();
        if (s == "NaN") return std::numeric_limits<double>::quiet_NaN();
        if (s == "Infinity") return std::numeric_limits<double>::infinity();
        if (s == "-Infinity") return -std::numeric_limits<double>::infinity();
        throw std::runtime_error("zarr: unsupported fill_value: " + s);
    }
    return std::nullopt;
}

[[nodiscard]] inline JsonValue serialize_fill_value(const std::optional<double>& fv) {
    if (!fv) return JsonValue{};
    if (std::isnan(*fv)) return JsonValue{"NaN"};
    if (std::isinf(*fv)) return JsonValue{*fv > 0 ? "Infinity" : "-Infinity"};
    return JsonValue{*fv};
}

} // namespace detail

[[nodiscard]] inline ZarrMetadata zarray_from_json(const JsonValue& root) {
    if (!root.is_object())
        throw std::runtime_error("zarr: .zarray root must be a JSON object");
    if (auto fmt = root.get_number("zarr_format"); fmt && *fmt != 2)
        throw std::runtime_error("zarr: only zarr_format 2 is supported");

    ZarrMetadata meta;
    if (auto* p = root.find("shape"); p && p->is_array())
        for (const auto& v : p->as_array())
            meta.shape.push_back(v.as_int<std::size_t>());
    if (auto* p = root.find("chunks"); p && p->is_array())
        for (const auto& v : p->as_array())
            meta.chunks.push_back(v.as_int<std::size_t>());
    if (meta.shape.size() != meta.chunks.size())
        throw std::runtime_error("zarr: shape and chunks differ in rank");

    auto ds = root.get_string("dtype").value_or("");
    auto dt = parse_dtype(ds);
    if (!dt) throw std::runtime_error("zarr: unsupported dtype: " + ds);
    meta.dtype = *dt;

    if (auto order = root.get_string("order"); order && *order != "C")
        throw std::runtime_error("zarr: only C order is supported");
    if (auto* p = root.find("filters"); p && !p->is_null() && !p->empty())
        throw std::runtime_error("zarr: filters are not supported");

    if (auto* p = root.find("compressor")) meta.compressor = detail::parse_compressor(*p, meta.dtype);
    if (auto* p = root.find("fill_value")) meta.fill_value = detail::parse_fill_value(*p);
    if (auto sep = root.get_string("dimension_separator")) meta.dimension_separator = *sep;
    return meta;
}

[[nodiscard]] inline JsonValue zarray_to_json(const ZarrMetadata& meta) {
    return json_object({
        {"zarr_format", 2},
        {"shape", json_array_of(meta.shape)},
        {"chunks", json_array_of(meta.chunks)},
        {"dtype", std::string(meta.dtype == ZarrDtype::bool_ || dtype_size(meta.dtype) == 1 ? "|" : "<")
                      + std::string(dtype_string(meta.dtype))},
        {"compressor", detail::serialize_compressor(meta.compressor)},
        {"fill_value", detail::serialize_fill_value(meta.fill_value)},
        {"order", "C"},
        {"filters", JsonValue{}},
        {"dimension_separator", meta.dimension_separator},
    });
}

// ---------------------------------------------------------------------------
// Store abstraction
// ---------------------------------------------------------------------------

// A mutable key -> bytes mapping backing a zarr hierarchy. Keys use '/'
// separators ("temp/.zarray", "temp/0.0").
class Store {
public:
    virtual ~Store() = default;

    [[nodiscard]] virtual bool exists(const std::string& key) const = 0;
    /// Throws KeyNotFound when the key is absent.
    [[nodiscard]] virtual std::vector<std::byte> get(const std::string& key) const = 0;
    virtual void set(const std::string& key, std::span<const std::byte> value) = 0;
    virtual void erase(const std::string& key) = 0;
    /// Keys below the root, in no particular order.
    [[nodiscard]] virtual std::vector<std::string> list() const = 0;

    virtual void clear() {
        for (const auto& key : list()) erase(key);
    }

    [[nodiscard]] virtual std::optional<std::vector<std::byte>> get_if_exists(const std::string& key) const {
        try {
            return get(key);
        } catch (const KeyNotFound&) {
            return std::nullopt;
        }
    }

    [[nodiscard]] std::string get_string(const std::string& key) const {
        auto data = get(key);
        return {reinterpret_cast<const char*>(data.data()), data.size()};
    }

    void set_string(const std::string& key, std::string_view value) {
        set(key, {reinterpret_cast<const std::byte*>(value.data()), value.size()});
    }

    [[nodiscard]] std::optional<JsonValue> get_json(const std::string& key) const {
        auto data = get_if_exists(key);
        if (!data) return std::nullopt;
        return json_parse(as_string_view(*data));
    }

    void set_json(const std::string& key, const JsonValue& value) {
        set_string(key, json_serialize(value, 4));
    }

private:
    [[nodiscard]] static std::string_view as_string_view(std::span<const std::byte> b) noexcept {
        return {reinterpret_cast<const char*>(b.data()), b.size()};
    }
};

// ---------------------------------------------------------------------------
// MemoryStore
// ---------------------------------------------------------------------------

class MemoryStore final : public Store {
public:
    [[nodiscard]] bool exists(const std::string& key) const override {
        std::lock_guard lock(mutex_);
        return data_.contains(key);
    }

    [[nodiscard]] std::vector<std::byte> get(const std::string& key) const override {
        std::lock_guard lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) throw KeyNotFound(key);
        return it->second;
    }

    void set(const std::string& key, std::span<const std::byte> value) override {
        std::lock_guard lock(mutex_);
        data_.insert_or_assign(key, std::vector<std::byte>(value.begin(), value.end()));
    }

    // An empty key or a "dir/" style prefix removes everything below it.
    void erase(const std::string& key) override {
        std::lock_guard lock(mutex_);
        if (data_.erase(key)) return;
        auto prefix = key.empty() || key.back() == '/' ? key : key + "/";
        std::erase_if(data_, [&](const auto& kv) { return kv.first.starts_with(prefix); });
    }

    [[nodiscard]] std::vector<std::string> list() const override {
        std::lock_guard lock(mutex_);
        std::vector<std::string> keys;
        keys.reserve(data_.size());
        for (const auto& [k, _] : data_) keys.push_back(k);
        return keys;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return data_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::byte>> data_;
};

// ---------------------------------------------------------------------------
// FileSystemStore
// ---------------------------------------------------------------------------

class FileSystemStore final : public Store {
public:
    explicit FileSystemStore(std::filesystem::path root) : root_(std::move(root)) {}

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    [[nodiscard]] bool exists(const std::string& key) const override {
        return std::filesystem::is_regular_file(root_ / key);
    }

    [[nodiscard]] std::vector<std::byte> get(const std::string& key) const override {
        auto p = root_ / key;
        std::ifstream f(p, std::ios::binary | std::ios::ate);
        if (!f) throw KeyNotFound(key);
        auto sz = f.tellg();
        f.seekg(0);
        std::vector<std::byte> buf(static_cast<std::size_t>(sz));
        if (!f.read(reinterpret_cast<char*>(buf.data()), sz))
            throw std::runtime_error("zarr store: short read: " + p.string());
        return buf;
    }

    void set(const std::string& key, std::span<const std::byte> value) override {
        auto p = root_ / key;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream f(p, std::ios::binary | std::ios::trunc);
        if (!f) throw std::runtime_error("zarr store: cannot write: " + p.string());
        f.write(reinterpret_cast<const char*>(value.data()),
                static_cast<std::streamsize>(value.size()));
        if (!f) throw std::runtime_error("zarr store: write failed: " + p.string());
    }

    // Removes a file, or a whole subtree when the key names a directory.
    void erase(const std::string& key) override {
        if (key.empty()) {
            clear();
            return;
        }
        std::filesystem::remove_all(root_ / key);
    }

    void clear() override {
        std::error_code ec;
        if (!std::filesystem::exists(root_, ec)) return;
        for (const auto& entry : std::filesystem::directory_iterator(root_))
            std::filesystem::remove_all(entry.path());
    }

    [[nodiscard]] std::vector<std::string> list() const override {
        std::vector<std::string> keys;
        std::error_code ec;
        if (!std::filesystem::exists(root_, ec)) return keys;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(root_)) {
            if (entry.is_regular_file())
                keys.push_back(std::filesystem::relative(entry.path(), root_).generic_string());
        }
        return keys;
    }

private:
    std::filesystem::path root_;
};

// ---------------------------------------------------------------------------
// n-d block copy
// ---------------------------------------------------------------------------

namespace detail {

[[nodiscard]] inline std::vector<std::size_t> c_strides(std::span<const std::size_t> shape) {
    std::vector<std::size_t> strides(shape.size(), 1);
    for (std::size_t d = shape.size(); d-- > 1;)
        strides[d - 1] = strides[d] * shape[d];
    return strides;
}

// Copies an `extent`-shaped block between two C-ordered buffers. Rows along
// the last axis are contiguous in both, so each is one memcpy.
inline void copy_block(const std::byte* src, std::span<const std::size_t> src_shape,
                       std::span<const std::size_t> src_off,
                       std::byte* dst, std::span<const std::size_t> dst_shape,
                       std::span<const std::size_t> dst_off,
                       std::span<const std::size_t> extent, std::size_t elem)
{
    const auto ndim = extent.size();
    if (ndim == 0) {
        std::memcpy(dst, src, elem);
        return;
    }
    for (auto e : extent)
        if (e == 0) return;

    auto ss = c_strides(src_shape);
    auto ds = c_strides(dst_shape);
    const std::size_t row = extent[ndim - 1] * elem;

    std::vector<std::size_t> idx(ndim, 0);
    while (true) {
        std::size_t so = 0, d_o = 0;
        for (std::size_t d = 0; d < ndim; ++d) {
            so += (src_off[d] + idx[d]) * ss[d];
            d_o += (dst_off[d] + idx[d]) * ds[d];
        }
        std::memcpy(dst + d_o * elem, src + so * elem, row);

        // odometer over every axis but the last
        std::size_t d = ndim - 1;
        while (d-- > 0) {
            if (++idx[d] < extent[d]) break;
            idx[d] = 0;
        }
        if (d == static_cast<std::size_t>(-1)) return;
    }
}

} // namespace detail

// ---------------------------------------------------------------------------
// ZarrArray
// ---------------------------------------------------------------------------

class ZarrArray final {
public:
    /// Write `.zarray` under `path` (empty path = store root) and return the array.
    static ZarrArray create(std::shared_ptr<Store> store, std::string path, ZarrMetadata meta) {
        if (meta.shape.size() != meta.chunks.size())
            throw std::invalid_argument("zarr: shape and chunks differ in rank");
        for (auto& c : meta.chunks)
            if (c == 0) c = 1;
        if (meta.compressor.codec != Codec::none && !codec_available(meta.compressor.codec))
            throw std::runtime_error("zarr: compressor '" + std::string(codec_name(meta.compressor.codec))
                                     + "' not available in this build");
        meta.compressor.typesize = dtype_size(meta.dtype);
        ZarrArray arr(std::move(store), std::move(path), std::move(meta));
        arr.write_metadata();
        return arr;
    }

    static ZarrArray open(std::shared_ptr<Store> store, std::string path) {
        auto key = join(path, ".zarray");
        auto json = store->get_json(key);
        if (!json) throw std::runtime_error("zarr: no array metadata at '" + key + "'");
        auto meta = zarray_from_json(*json);
        return ZarrArray(std::move(store), std::move(path), std::move(meta));
    }

    /// Open with metadata already known (e.g. from .zmetadata).
    static ZarrArray open(std::shared_ptr<Store> store, std::string path, ZarrMetadata meta) {
        return ZarrArray(std::move(store), std::move(path), std::move(meta));
    }

    [[nodiscard]] const ZarrMetadata& metadata() const noexcept { return meta_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::vector<std::size_t>& shape() const noexcept { return meta_.shape; }
    [[nodiscard]] std::size_t ndim() const noexcept { return meta_.ndim(); }
    [[nodiscard]] ZarrDtype dtype() const noexcept { return meta_.dtype; }
    [[nodiscard]] std::size_t element_size() const noexcept { return dtype_size(meta_.dtype); }

    [[nodiscard]] std::string chunk_key(std::span<const std::size_t> idx) const {
        std::string name;
        if (idx.empty()) name = "0";
        for (std::size_t i = 0; i < idx.size(); ++i) {
            if (i) name += meta_.dimension_separator;
            name += std::to_string(idx[i]);
        }
        return join(path_, name);
    }

    /// Decoded chunk; a missing chunk reads as the fill value.
    [[nodiscard]] std::vector<std::byte> read_chunk(std::span<const std::size_t> idx) const {
        auto raw = store_->get_if_exists(chunk_key(idx));
        if (!raw) return filled_chunk();
        auto data = meta_.compressor.codec == Codec::none
            ? std::move(*raw)
            : decompress(*raw, meta_.compressor.codec, meta_.chunk_byte_size());
        if (data.size() != meta_.chunk_byte_size())
            throw std::runtime_error("zarr: chunk '" + chunk_key(idx) + "' has "
                                     + std::to_string(data.size()) + " bytes, expected "
                                     + std::to_string(meta_.chunk_byte_size()));
        return data;
    }

    void write_chunk(std::span<const std::size_t> idx, std::span<const std::byte> data) {
        if (data.size() != meta_.chunk_byte_size())
            throw std::invalid_argument("zarr: chunk buffer has the wrong size");
        if (meta_.compressor.codec == Codec::none) {
            store_->set(chunk_key(idx), data);
            return;
        }
        auto packed = compress(data, meta_.compressor);
        store_->set(chunk_key(idx), packed);
    }

    /// Read the hyperslab [offset, offset+count) as a C-ordered buffer.
    [[nodiscard]] std::vector<std::byte> read_region(std::span<const std::size_t> offset,
                                                     std::span<const std::size_t> count) const {
        check_region(offset, count);
        std::size_t n = 1;
        for (auto c : count) n *= c;
        std::vector<std::byte> out(n * element_size());
        for_each_chunk(offset, count, [&](std::span<const std::size_t> cidx,
                                          std::span<const std::size_t> in_chunk,
                                          std::span<const std::size_t> in_region,
                                          std::span<const std::size_t> extent) {
            auto chunk = read_chunk(cidx);
            detail::copy_block(chunk.data(), meta_.chunks, in_chunk,
                               out.data(), count, in_region, extent, element_size());
        });
        return out;
    }

    /// Write a C-ordered buffer into the hyperslab [offset, offset+count).
    /// Partially covered chunks are read, patched and rewritten.
    void write_region(std::span<const std::size_t> offset, std::span<const std::size_t> count,
                      std::span<const std::byte> data) {
        check_region(offset, count);
        std::size_t n = 1;
        for (auto c : count) n *= c;
        if (data.size() != n * element_size())
            throw std::invalid_argument("zarr: region buffer has the wrong size");

        for_each_chunk(offset, count, [&](std::span<const std::size_t> cidx,
                                          std::span<const std::size_t> in_chunk,
                                          std::span<const std::size_t> in_region,
                                          std::span<const std::size_t> extent) {
            bool full = true;
            for (std::size_t d = 0; d < extent.size(); ++d)
                full = full && in_chunk[d] == 0 && extent[d] == meta_.chunks[d];
            auto chunk = full ? std::vector<std::byte>(meta_.chunk_byte_size()) : read_chunk(cidx);
            detail::copy_block(data.data(), count, in_region,
                               chunk.data(), meta_.chunks, in_chunk, extent, element_size());
            write_chunk(cidx, chunk);
        });
    }

    [[nodiscard]] std::vector<std::byte> read_all() const {
        std::vector<std::size_t> offset(ndim(), 0);
        return read_region(offset, meta_.shape);
    }

    void write_all(std::span<const std::byte> data) {
        std::vector<std::size_t> offset(ndim(), 0);
        write_region(offset, meta_.shape, data);
    }

    /// Change the shape and rewrite `.zarray`. Chunks wholly outside a
    /// shrunken shape are deleted.
    void resize(std::vector<std::size_t> new_shape) {
        if (new_shape.size() != ndim())
            throw std::invalid_argument("zarr: resize cannot change the rank");
        auto old = meta_;
        meta_.shape = std::move(new_shape);
        write_metadata();

        for (std::size_t d = 0; d < ndim(); ++d) {
            auto keep = meta_.num_chunks_along(d);
            auto had = old.num_chunks_along(d);
            if (keep >= had) continue;
            // chunk grid of the old shape, restricted to the dropped band on axis d
            std::vector<std::size_t> off(ndim(), 0), cnt(old.shape);
            off[d] = keep * meta_.chunks[d];
            cnt[d] = old.shape[d] - off[d];
            for_each_chunk_of(old, off, cnt, [&](std::span<const std::size_t> cidx,
                                                 std::span<const std::size_t>,
                                                 std::span<const std::size_t>,
                                                 std::span<const std::size_t>) {
                store_->erase(chunk_key(cidx));
            });
        }
    }

    [[nodiscard]] JsonValue attrs() const {
        return store_->get_json(join(path_, ".zattrs")).value_or(JsonValue{JsonObject{}});
    }

    void set_attrs(const JsonValue& attrs) { store_->set_json(join(path_, ".zattrs"), attrs); }

    [[nodiscard]] static std::string join(const std::string& path, std::string_view name) {
        if (path.empty()) return std::string(name);
        return path + "/" + std::string(name);
    }

private:
    ZarrArray(std::shared_ptr<Store> store, std::string path, ZarrMetadata meta)
        : store_(std::move(store)), path_(std::move(path)), meta_(std::move(meta))
    {
        if (!store_) throw std::invalid_argument("zarr: store must not be null");
    }

    void write_metadata() { store_->set_json(join(path_, ".zarray"), zarray_to_json(meta_)); }

    [[nodiscard]] std::vector<std::byte> filled_chunk() const {
        auto one = fill_bytes(meta_.dtype, meta_.fill_value);
        std::vector<std::byte> out(meta_.chunk_byte_size());
        const auto elem = one.size();
        for (std::size_t i = 0; i < out.size(); i += elem)
            std::memcpy(out.data() + i, one.data(), elem);
        return out;
    }

    void check_region(std::span<const std::size_t> offset, std::span<const std::size_t> count) const {
        if (offset.size() != ndim() || count.size() != ndim())
            throw std::invalid_argument("zarr: region rank does not match array rank");
        for (std::size_t d = 0; d < ndim(); ++d)
            if (offset[d] + count[d] > meta_.shape[d])
                throw std::out_of_range("zarr: region exceeds array bounds on axis " + std::to_string(d));
    }

    template <typename F>
    void for_each_chunk(std::span<const std::size_t> offset, std::span<const std::size_t> count, F&& f) const {
        for_each_chunk_of(meta_, offset, count, std::forward<F>(f));
    }

    // Calls f(chunk index, offset within chunk, offset within region, extent)
    // for every chunk the region touches.
    template <typename F>
    static void for_each_chunk_of(const ZarrMetadata& meta, std::span<const std::size_t> offset,
                                  std::span<const std::size_t> count, F&& f) {
        const auto ndim = meta.ndim();
        if (ndim == 0) {
            f(std::span<const std::size_t>{}, std::span<const std::size_t>{},
              std::span<const std::size_t>{}, std::span<const std::size_t>{});
            return;
        }
        for (auto c : count)
            if (c == 0) return;

        std::vector<std::size_t> first(ndim), last(ndim);
        for (std::size_t d = 0; d < ndim; ++d) {
            first[d] = offset[d] / meta.chunks[d];
            last[d] = (offset[d] + count[d] - 1) / meta.chunks[d];
        }

        std::vector<std::size_t> cidx = first;
        std::vector<std::size_t> in_chunk(ndim), in_region(ndim), extent(ndim);
        while (true) {
            for (std::size_t d = 0; d < ndim; ++d) {
                auto c0 = cidx[d] * meta.chunks[d];
                auto lo = std::max(c0, offset[d]);
                auto hi = std::min(c0 + meta.chunks[d], offset[d] + count[d]);
                in_chunk[d] = lo - c0;
                in_region[d] = lo - offset[d];
                extent[d] = hi - lo;
            }
            f(std::span<const std::size_t>(cidx), std::span<const std::size_t>(in_chunk),
              std::span<const std::size_t>(in_region), std::span<const std::size_t>(extent));

            std::size_t d = ndim;
            while (d-- > 0) {
                if (++cidx[d] <= last[d]) break;
                cidx[d] = first[d];
            }
            if (d == static_cast<std::size_t>(-1)) return;
        }
    }

    std::shared_ptr<Store> store_;
    std::string path_;
    ZarrMetadata meta_;
};

// ---------------------------------------------------------------------------
// Consolidated metadata (.zmetadata)
// ---------------------------------------------------------------------------

struct ConsolidatedMetadata {
    JsonObject entries;   // ".zgroup", ".zattrs", "var/.zarray", "var/.zattrs", ...

    [[nodiscard]] static ConsolidatedMetadata from_json(const JsonValue& root) {
        ConsolidatedMetadata cm;
        auto* meta = root.find("metadata");
        if (!meta || !meta->is_object())
            throw std::runtime_error("zarr: .zmetadata has no metadata object");
        cm.entries = meta->as_object();
        return cm;
    }

    [[nodiscard]] JsonValue to_json() const {
        return json_object({{"metadata", JsonValue{entries}}, {"zarr_consolidated_format", 1}});
    }

    /// Names of the arrays directly below the group root.
    [[nodiscard]] std::vector<std::string> arrays() const {
        std::vector<std::string> out;
        for (const auto& [key, _] : entries) {
            if (key.ends_with("/.zarray")) out.push_back(key.substr(0, key.size() - 8));
        }
        return out;
    }

    [[nodiscard]] const JsonValue* find(std::string_view key) const {
        auto it = entries.find(key);
        return it == entries.end() ? nullptr : &it->second;
    }
};

/// Gather `.zgroup`, `.zattrs` and the given arrays' metadata into `.zmetadata`.
inline ConsolidatedMetadata consolidate_metadata(Store& store, const std::vector<std::string>& arrays) {
    ConsolidatedMetadata cm;
    for (const char* key : {".zgroup", ".zattrs"}) {
        if (auto v = store.get_json(key)) cm.entries.insert_or_assign(key, std::move(*v));
    }
    for (const auto& name : arrays) {
        for (const char* leaf : {"/.zarray", "/.zattrs"}) {
            if (auto v = store.get_json(name + leaf)) cm.entries.insert_or_assign(name + leaf, std::move(*v));
        }
    }
    store.set_json(".zmetadata", cm.to_json());
    return cm;
}

} // namespace datamesh
