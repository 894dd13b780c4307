#pragma once
#include "datamesh/json.hpp"
#include "datamesh/zarr.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace datamesh {

class SessionLease;

// ---------------------------------------------------------------------------
// Variable
// ---------------------------------------------------------------------------

// A named-axis n-d array: C-ordered raw bytes of `dtype`, one entry in
// `shape` per entry in `dims`.
struct Variable {
    std::vector<std::string> dims;
    std::vector<std::size_t> shape;
    ZarrDtype dtype = ZarrDtype::float64;
    std::vector<std::byte> data;
    JsonObject attrs;
    std::optional<double> fill_value;

    template <typename T>
    [[nodiscard]] static Variable from_values(std::vector<std::string> dims, std::vector<std::size_t> shape,
                                              const std::vector<T>& values, JsonObject attrs = {})
    {
        if (dims.size() != shape.size())
            throw std::invalid_argument("variable: dims and shape differ in rank");
        Variable v;
        v.dims = std::move(dims);
        v.shape = std::move(shape);
        v.dtype = dtype_of<T>();
        v.attrs = std::move(attrs);
        if (values.size() != v.size())
            throw std::invalid_argument("variable: " + std::to_string(values.size())
                                        + " values do not fill shape of " + std::to_string(v.size()));
        v.data.resize(values.size() * sizeof(T));
        if constexpr (std::is_same_v<T, bool>) {
            for (std::size_t i = 0; i < values.size(); ++i)
                v.data[i] = static_cast<std::byte>(values[i] ? 1 : 0);
        } else {
            std::memcpy(v.data.data(), values.data(), v.data.size());
        }
        return v;
    }

    /// One-dimensional variable along `dim`, typical for index coordinates.
    template <typename T>
    [[nodiscard]] static Variable coord(std::string dim, const std::vector<T>& values, JsonObject attrs = {})
    {
        return from_values<T>({std::move(dim)}, {values.size()}, values, std::move(attrs));
    }

    [[nodiscard]] std::size_t size() const noexcept {
        std::size_t n = 1;
        for (auto s : shape) n *= s;
        return n;
    }

    [[nodiscard]] std::size_t nbytes() const noexcept { return data.size(); }

    [[nodiscard]] std::optional<std::size_t> axis(std::string_view dim) const noexcept {
        for (std::size_t i = 0; i < dims.size(); ++i)
            if (dims[i] == dim) return i;
        return std::nullopt;
    }

    [[nodiscard]] bool has_dim(std::string_view dim) const noexcept { return axis(dim).has_value(); }

    /// Values as T; throws std::invalid_argument when T is not the stored dtype.
    template <typename T>
    [[nodiscard]] std::vector<T> values() const
    {
        if (dtype_of<T>() != dtype)
            throw std::invalid_argument("variable: stored dtype is " + std::string(dtype_name(dtype)));
        std::vector<T> out(size());
        if constexpr (std::is_same_v<T, bool>) {
            for (std::size_t i = 0; i < out.size(); ++i) out[i] = data[i] != std::byte{0};
        } else {
            std::memcpy(out.data(), data.data(), data.size());
        }
        return out;
    }

    [[nodiscard]] std::vector<double> as_double() const
    {
        std::vector<double> out(size());
        for (std::size_t i = 0; i < out.size(); ++i) out[i] = element_as_double(data, dtype, i);
        return out;
    }

    /// Slice [start, stop) along `dim`; variables without `dim` are returned unchanged.
    [[nodiscard]] Variable isel(std::string_view dim, std::size_t start, std::size_t stop) const
    {
        auto ax = axis(dim);
        if (!ax) return *this;
        stop = std::min(stop, shape[*ax]);
        start = std::min(start, stop);

        Variable out = *this;
        out.shape[*ax] = stop - start;
        out.data.assign(out.size() * dtype_size(dtype), std::byte{0});
        std::vector<std::size_t> src_off(shape.size(), 0), dst_off(shape.size(), 0);
        src_off[*ax] = start;
        detail::copy_block(data.data(), shape, src_off, out.data.data(), out.shape, dst_off,
                           out.shape, dtype_size(dtype));
        return out;
    }

    [[nodiscard]] bool equals(const Variable& other) const
    {
        return dims == other.dims && shape == other.shape && dtype == other.dtype
            && data == other.data && attrs == other.attrs;
    }
};

// ---------------------------------------------------------------------------
// Dataset
// ---------------------------------------------------------------------------

using VariableMap = std::map<std::string, Variable, std::less<>>;

struct Dataset {
    JsonObject attrs;
    VariableMap coords;
    VariableMap data_vars;

    /// Dimension sizes; throws std::invalid_argument on conflicting lengths.
    [[nodiscard]] std::map<std::string, std::size_t, std::less<>> dims() const { return collect_dims(); }

    /// Throws std::invalid_argument when two variables disagree on the
    /// length of a shared dimension.
    void validate() const { collect_dims(); }

private:
    std::map<std::string, std::size_t, std::less<>> collect_dims() const
    {
        std::map<std::string, std::size_t, std::less<>> out;
        auto add = [&](const std::string& name, const Variable& v) {
            for (std::size_t i = 0; i < v.dims.size(); ++i) {
                auto [it, inserted] = out.emplace(v.dims[i], v.shape[i]);
                if (!inserted && it->second != v.shape[i])
                    throw std::invalid_argument("dataset: variable '" + name + "' has length "
                                                + std::to_string(v.shape[i]) + " on dimension '"
                                                + v.dims[i] + "', expected " + std::to_string(it->second));
            }
        };
        for (const auto& [name, v] : coords) add(name, v);
        for (const auto& [name, v] : data_vars) add(name, v);
        return out;
    }

public:

    [[nodiscard]] const Variable* find(std::string_view name) const noexcept
    {
        if (auto it = coords.find(name); it != coords.end()) return &it->second;
        if (auto it = data_vars.find(name); it != data_vars.end()) return &it->second;
        return nullptr;
    }

    [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

    [[nodiscard]] const Variable& operator[](std::string_view name) const
    {
        if (auto* v = find(name)) return *v;
        throw std::out_of_range("dataset: no variable '" + std::string(name) + "'");
    }

    [[nodiscard]] std::vector<std::string> variables() const
    {
        std::vector<std::string> out;
        for (const auto& [name, _] : coords) out.push_back(name);
        for (const auto& [name, _] : data_vars) out.push_back(name);
        return out;
    }

    [[nodiscard]] bool empty() const noexcept { return coords.empty() && data_vars.empty(); }

    [[nodiscard]] std::size_t nbytes() const noexcept
    {
        std::size_t n = 0;
        for (const auto& [_, v] : coords) n += v.nbytes();
        for (const auto& [_, v] : data_vars) n += v.nbytes();
        return n;
    }

    [[nodiscard]] Dataset isel(std::string_view dim, std::size_t start, std::size_t stop) const
    {
        Dataset out;
        out.attrs = attrs;
        for (const auto& [name, v] : coords) out.coords.emplace(name, v.isel(dim, start, stop));
        for (const auto& [name, v] : data_vars) out.data_vars.emplace(name, v.isel(dim, start, stop));
        return out;
    }

    [[nodiscard]] Dataset drop_vars(const std::vector<std::string>& names) const
    {
        Dataset out = *this;
        for (const auto& n : names) {
            out.coords.erase(n);
            out.data_vars.erase(n);
        }
        return out;
    }

    [[nodiscard]] bool equals(const Dataset& other) const
    {
        auto same = [](const VariableMap& a, const VariableMap& b) {
            if (a.size() != b.size()) return false;
            for (const auto& [name, v] : a) {
                auto it = b.find(name);
                if (it == b.end() || !v.equals(it->second)) return false;
            }
            return true;
        };
        return attrs == other.attrs && same(coords, other.coords) && same(data_vars, other.data_vars);
    }

    /// {attrs, dims, coords, data_vars} with per-variable {dims, attrs, dtype, shape}.
    [[nodiscard]] JsonValue schema() const
    {
        auto entry = [](const Variable& v) {
            return json_object({{"dims", json_array_of(v.dims)}, {"attrs", JsonValue{v.attrs}},
                                {"dtype", std::string(dtype_name(v.dtype))},
                                {"shape", json_array_of(v.shape)}});
        };
        JsonObject c, d, dm;
        for (const auto& [name, v] : coords) c.emplace(name, entry(v));
        for (const auto& [name, v] : data_vars) d.emplace(name, entry(v));
        for (const auto& [name, n] : dims()) dm.emplace(name, JsonValue{n});
        return json_object({{"attrs", JsonValue{attrs}}, {"dims", JsonValue{std::move(dm)}},
                            {"coords", JsonValue{std::move(c)}}, {"data_vars", JsonValue{std::move(d)}}});
    }
};

// ---------------------------------------------------------------------------
// Group I/O helpers
// ---------------------------------------------------------------------------

struct WriteOptions {
    // Chunk length per dimension; unlisted dimensions are a single chunk.
    std::map<std::string, std::size_t, std::less<>> chunks;
    CompressParams compressor{.codec = Codec::zlib, .level = 5};
};

namespace detail {

inline constexpr std::string_view dims_attr = "_ARRAY_DIMENSIONS";
inline constexpr std::string_view coords_attr = "coordinates";

[[nodiscard]] inline std::string join_words(const std::vector<std::string>& words)
{
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out += ' ';
        out += w;
    }
    return out;
}

[[nodiscard]] inline std::vector<std::string> split_words(std::string_view s)
{
    std::vector<std::string> out;
    std::istringstream in{std::string(s)};
    for (std::string w; in >> w;) out.push_back(w);
    return out;
}

// Coordinates that are not a dimension's own index.
[[nodiscard]] inline std::vector<std::string> auxiliary_coords(const Dataset& ds)
{
    std::vector<std::string> out;
    for (const auto& [name, v] : ds.coords)
        if (!(v.dims.size() == 1 && v.dims[0] == name)) out.push_back(name);
    return out;
}

[[nodiscard]] inline ZarrMetadata array_metadata(const Variable& v, const WriteOptions& opts)
{
    ZarrMetadata meta;
    meta.shape = v.shape;
    meta.dtype = v.dtype;
    meta.compressor = opts.compressor;
    for (std::size_t i = 0; i < v.dims.size(); ++i) {
        auto it = opts.chunks.find(v.dims[i]);
        auto c = it != opts.chunks.end() ? it->second : v.shape[i];
        meta.chunks.push_back(std::max<std::size_t>(1, std::min(c, std::max<std::size_t>(1, v.shape[i]))));
    }
    if (v.fill_value) meta.fill_value = v.fill_value;
    else if (v.dtype == ZarrDtype::float32 || v.dtype == ZarrDtype::float64)
        meta.fill_value = std::numeric_limits<double>::quiet_NaN();
    return meta;
}

[[nodiscard]] inline JsonValue array_attrs(const Variable& v, const std::vector<std::string>& aux)
{
    JsonObject attrs = v.attrs;
    attrs.insert_or_assign(std::string(dims_attr), json_array_of(v.dims));
    if (!aux.empty()) attrs.insert_or_assign(std::string(coords_attr), join_words(aux));
    return JsonValue{std::move(attrs)};
}

inline void write_variable(const std::shared_ptr<Store>& store, const std::string& name, const Variable& v,
                           const WriteOptions& opts, const std::vector<std::string>& aux)
{
    if (v.data.size() != v.size() * dtype_size(v.dtype))
        throw std::invalid_argument("dataset: variable '" + name + "' data does not match its shape");
    store->erase(name);
    auto arr = ZarrArray::create(store, name, array_metadata(v, opts));
    arr.set_attrs(array_attrs(v, aux));
    if (v.size() > 0) arr.write_all(v.data);
}

inline void write_group(Store& store, const JsonObject& attrs)
{
    store.set_json(".zgroup", json_object({{"zarr_format", 2}}));
    store.set_json(".zattrs", JsonValue{attrs});
}

} // namespace detail

/// Write every variable as a zarr array plus group and consolidated metadata.
/// Arrays already in the store under other names are left alone.
inline void write_dataset(const std::shared_ptr<Store>& store, const Dataset& ds, const WriteOptions& opts = {})
{
    ds.validate();
    auto aux = detail::auxiliary_coords(ds);
    JsonObject root_attrs = ds.attrs;
    if (ds.data_vars.empty() && !aux.empty())
        root_attrs.insert_or_assign(std::string(detail::coords_attr), detail::join_words(aux));
    detail::write_group(*store, root_attrs);

    for (const auto& [name, v] : ds.coords) detail::write_variable(store, name, v, opts, {});
    for (const auto& [name, v] : ds.data_vars) detail::write_variable(store, name, v, opts, aux);
    consolidate_metadata(*store, ds.variables());
}

// ---------------------------------------------------------------------------
// LazyDataset
// ---------------------------------------------------------------------------

// A dataset whose variables are read from the store on demand. Holds the
// store (and, for remote stores, the session lease) alive while in use.
class LazyDataset final {
public:
    struct VariableInfo {
        std::vector<std::string> dims;
        ZarrMetadata meta;
        JsonObject attrs;
        bool is_coord = false;
    };

    LazyDataset(std::shared_ptr<Store> store, const ConsolidatedMetadata& cm,
                std::shared_ptr<SessionLease> lease = {})
        : store_{std::move(store)}, lease_{std::move(lease)}
    {
        if (auto* a = cm.find(".zattrs"); a && a->is_object()) attrs_ = a->as_object();

        std::set<std::string, std::less<>> coord_names;
        auto take_coords = [&](JsonObject& attrs) {
            auto it = attrs.find(detail::coords_attr);
            if (it == attrs.end()) return;
            if (it->second.is_string())
                for (auto& w : detail::split_words(it->second.as_string())) coord_names.insert(std::move(w));
            attrs.erase(it);
        };
        take_coords(attrs_);

        for (const auto& name : cm.arrays()) {
            VariableInfo info;
            info.meta = zarray_from_json(*cm.find(name + "/.zarray"));
            if (auto* a = cm.find(name + "/.zattrs"); a && a->is_object()) info.attrs = a->as_object();
            auto it = info.attrs.find(detail::dims_attr);
            if (it == info.attrs.end())
                throw std::runtime_error("dataset: array '" + name + "' has no _ARRAY_DIMENSIONS");
            info.dims = json_string_list(it->second);
            info.attrs.erase(it);
            if (info.dims.size() != info.meta.ndim())
                throw std::runtime_error("dataset: array '" + name + "' dimension names do not match its rank");
            take_coords(info.attrs);
            vars_.emplace(name, std::move(info));
        }
        for (auto& [name, info] : vars_)
            info.is_coord = coord_names.contains(name) || (info.dims.size() == 1 && info.dims[0] == name);
    }

    [[nodiscard]] const JsonObject& attrs() const noexcept { return attrs_; }
    [[nodiscard]] const std::shared_ptr<Store>& store() const noexcept { return store_; }
    [[nodiscard]] const std::map<std::string, VariableInfo, std::less<>>& info() const noexcept { return vars_; }
    [[nodiscard]] bool contains(std::string_view name) const noexcept { return vars_.contains(name); }

    [[nodiscard]] std::vector<std::string> coord_names() const { return names(true); }
    [[nodiscard]] std::vector<std::string> data_var_names() const { return names(false); }

    [[nodiscard]] std::map<std::string, std::size_t, std::less<>> dims() const
    {
        std::map<std::string, std::size_t, std::less<>> out;
        for (const auto& [_, info] : vars_)
            for (std::size_t i = 0; i < info.dims.size(); ++i) out.emplace(info.dims[i], info.meta.shape[i]);
        return out;
    }

    [[nodiscard]] std::size_t nbytes() const noexcept
    {
        std::size_t n = 0;
        for (const auto& [_, info] : vars_) n += info.meta.size() * dtype_size(info.meta.dtype);
        return n;
    }

    [[nodiscard]] JsonValue schema() const
    {
        JsonObject c, d, dm;
        for (const auto& [name, info] : vars_) {
            auto entry = json_object({{"dims", json_array_of(info.dims)}, {"attrs", JsonValue{info.attrs}},
                                      {"dtype", std::string(dtype_name(info.meta.dtype))},
                                      {"shape", json_array_of(info.meta.shape)}});
            (info.is_coord ? c : d).emplace(name, std::move(entry));
        }
        for (const auto& [name, n] : dims()) dm.emplace(name, JsonValue{n});
        return json_object({{"attrs", JsonValue{attrs_}}, {"dims", JsonValue{std::move(dm)}},
                            {"coords", JsonValue{std::move(c)}}, {"data_vars", JsonValue{std::move(d)}}});
    }

    [[nodiscard]] Variable load(std::string_view name) const
    {
        const auto& info = lookup(name);
        std::vector<std::size_t> offset(info.meta.ndim(), 0);
        return read(name, info, offset, info.meta.shape);
    }

    /// Read only [start, stop) along `dim` from every variable spanning it.
    [[nodiscard]] Variable load(std::string_view name, std::string_view dim,
                                std::size_t start, std::size_t stop) const
    {
        const auto& info = lookup(name);
        std::vector<std::size_t> offset(info.meta.ndim(), 0);
        auto count = info.meta.shape;
        for (std::size_t i = 0; i < info.dims.size(); ++i) {
            if (info.dims[i] != dim) continue;
            stop = std::min(stop, count[i]);
            offset[i] = std::min(start, stop);
            count[i] = stop - offset[i];
        }
        return read(name, info, offset, count);
    }

    [[nodiscard]] Dataset load() const
    {
        Dataset ds;
        ds.attrs = attrs_;
        for (const auto& [name, info] : vars_)
            (info.is_coord ? ds.coords : ds.data_vars).emplace(name, load(name));
        return ds;
    }

    [[nodiscard]] Dataset isel(std::string_view dim, std::size_t start, std::size_t stop) const
    {
        Dataset ds;
        ds.attrs = attrs_;
        for (const auto& [name, info] : vars_)
            (info.is_coord ? ds.coords : ds.data_vars).emplace(name, load(name, dim, start, stop));
        return ds;
    }

private:
    [[nodiscard]] const VariableInfo& lookup(std::string_view name) const
    {
        auto it = vars_.find(name);
        if (it == vars_.end()) throw std::out_of_range("dataset: no variable '" + std::string(name) + "'");
        return it->second;
    }

    [[nodiscard]] Variable read(std::string_view name, const VariableInfo& info,
                                std::span<const std::size_t> offset, std::span<const std::size_t> count) const
    {
        auto arr = ZarrArray::open(store_, std::string(name), info.meta);
        Variable v;
        v.dims = info.dims;
        v.shape.assign(count.begin(), count.end());
        v.dtype = info.meta.dtype;
        v.attrs = info.attrs;
        v.fill_value = info.meta.fill_value;
        v.data = arr.read_region(offset, count);
        return v;
    }

    [[nodiscard]] std::vector<std::string> names(bool coord) const
    {
        std::vector<std::string> out;
        for (const auto& [name, info] : vars_)
            if (info.is_coord == coord) out.push_back(name);
        return out;
    }

    std::shared_ptr<Store> store_;
    std::shared_ptr<SessionLease> lease_;
    JsonObject attrs_;
    std::map<std::string, VariableInfo, std::less<>> vars_;
};

/// Falls back to scanning the store listing when `.zmetadata` is absent.
[[nodiscard]] inline ConsolidatedMetadata read_consolidated(Store& store)
{
    if (auto zm = store.get_json(".zmetadata")) return ConsolidatedMetadata::from_json(*zm);

    ConsolidatedMetadata cm;
    for (const char* key : {".zgroup", ".zattrs"})
        if (auto v = store.get_json(key)) cm.entries.insert_or_assign(key, std::move(*v));
    for (const auto& key : store.list()) {
        auto slash = key.find('/');
        if (slash == std::string::npos || key.find('/', slash + 1) != std::string::npos) continue;
        if (!key.ends_with("/.zarray") && !key.ends_with("/.zattrs")) continue;
        if (auto v = store.get_json(key)) cm.entries.insert_or_assign(key, std::move(*v));
    }
    if (cm.entries.empty()) throw std::runtime_error("dataset: store holds no zarr group");
    return cm;
}

[[nodiscard]] inline LazyDataset open_dataset(std::shared_ptr<Store> store, std::shared_ptr<SessionLease> lease = {})
{
    auto cm = read_consolidated(*store);
    return LazyDataset(std::move(store), cm, std::move(lease));
}

[[nodiscard]] inline Dataset load_dataset(std::shared_ptr<Store> store)
{
    return open_dataset(std::move(store)).load();
}

// ---------------------------------------------------------------------------
// Region and append writes
// ---------------------------------------------------------------------------

/// Throws std::invalid_argument unless every variable in `ds` exists in
/// `lazy`, spans `dim` and fits [start, start + len) of the stored array.
inline void validate_region(const LazyDataset& lazy, const Dataset& ds, std::string_view dim, std::size_t start)
{
    ds.validate();
    for (const auto& name : ds.variables()) {
        const auto& v = ds[name];
        auto ax = v.axis(dim);
        if (!ax)
            throw std::invalid_argument("region: variable '" + name + "' does not span dimension '"
                                        + std::string(dim) + "'");
        auto it = lazy.info().find(name);
        if (it == lazy.info().end())
            throw std::invalid_argument("region: variable '" + name + "' is not in the store");
        const auto& info = it->second;
        if (info.dims != v.dims || info.meta.dtype != v.dtype)
            throw std::invalid_argument("region: variable '" + name + "' does not match the stored array");
        for (std::size_t i = 0; i < v.dims.size(); ++i) {
            if (i == *ax) {
                if (start > info.meta.shape[i] || v.shape[i] > info.meta.shape[i] - start)
                    throw std::invalid_argument("region: variable '" + name + "' rows ["
                                                + std::to_string(start) + ", "
                                                + std::to_string(start + v.shape[i])
                                                + ") fall outside the stored length "
                                                + std::to_string(info.meta.shape[i]));
            } else if (v.shape[i] != info.meta.shape[i]) {
                throw std::invalid_argument("region: variable '" + name + "' has length "
                                            + std::to_string(v.shape[i]) + " on '" + v.dims[i]
                                            + "', stored " + std::to_string(info.meta.shape[i]));
            }
        }
    }
}

/// Throws std::invalid_argument unless `ds` can be appended along `dim`.
inline void validate_append(const LazyDataset& lazy, const Dataset& ds, std::string_view dim)
{
    ds.validate();
    const auto& existing = lazy.info();
    for (const auto& name : ds.variables()) {
        const auto& v = ds[name];
        auto it = existing.find(name);
        if (it == existing.end()) {
            if (v.has_dim(dim))
                throw std::invalid_argument("append: variable '" + name + "' spans '" + std::string(dim)
                                            + "' but is not in the store");
            continue;
        }
        const auto& info = it->second;
        if (!v.has_dim(dim)) continue;
        if (info.dims != v.dims || info.meta.dtype != v.dtype)
            throw std::invalid_argument("append: variable '" + name + "' does not match the stored array");
        for (std::size_t i = 0; i < v.dims.size(); ++i)
            if (v.dims[i] != dim && v.shape[i] != info.meta.shape[i])
                throw std::invalid_argument("append: variable '" + name + "' has length "
                                            + std::to_string(v.shape[i]) + " on '" + v.dims[i]
                                            + "', stored " + std::to_string(info.meta.shape[i]));
    }
}

/// Overwrite [start, start + len) along `dim` of existing arrays. Every
/// variable in `ds` must exist in the store and span `dim`.
inline void write_region(const std::shared_ptr<Store>& store, const Dataset& ds,
                         std::string_view dim, std::size_t start)
{
    auto lazy = open_dataset(store);
    validate_region(lazy, ds, dim, start);
    for (const auto& name : ds.variables()) {
        const auto& v = ds[name];
        auto ax = v.axis(dim);
        std::vector<std::size_t> offset(v.dims.size(), 0);
        offset[*ax] = start;
        auto arr = ZarrArray::open(store, name, lazy.info().at(name).meta);
        arr.write_region(offset, v.shape, v.data);
    }
}

/// Extend every variable spanning `dim` by the batch in `ds`; variables
/// without `dim` are rewritten whole. Re-consolidates the metadata.
inline void append_dataset(const std::shared_ptr<Store>& store, const Dataset& ds,
                           std::string_view dim, const WriteOptions& opts = {})
{
    auto lazy = open_dataset(store);
    const auto& existing = lazy.info();
    validate_append(lazy, ds, dim);

    auto aux = detail::auxiliary_coords(ds);
    for (const auto& name : ds.variables()) {
        const auto& v = ds[name];
        auto it = existing.find(name);
        auto ax = v.axis(dim);
        if (!ax) {
            detail::write_variable(store, name, v, opts, ds.coords.contains(name) ? std::vector<std::string>{} : aux);
            continue;
        }
        auto arr = ZarrArray::open(store, name, it->second.meta);
        auto new_shape = arr.shape();
        std::vector<std::size_t> offset(v.dims.size(), 0);
        offset[*ax] = new_shape[*ax];
        new_shape[*ax] += v.shape[*ax];
        arr.resize(new_shape);
        arr.write_region(offset, v.shape, v.data);
    }

    JsonObject root_attrs = lazy.attrs();
    for (const auto& [k, val] : ds.attrs) root_attrs.insert_or_assign(k, val);
    if (auto group = store->get_json(".zattrs"); group && group->is_object())
        if (auto* c = group->find(detail::coords_attr)) root_attrs.insert_or_assign(std::string(detail::coords_attr), *c);
    detail::write_group(*store, root_attrs);

    std::set<std::string> names;
    for (const auto& [name, _] : existing) names.insert(name);
    for (const auto& name : ds.variables()) names.insert(name);
    consolidate_metadata(*store, {names.begin(), names.end()});
}

} // namespace datamesh
