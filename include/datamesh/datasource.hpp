#pragma once
#include "datamesh/dataset.hpp"
#include "datamesh/json.hpp"
#include "datamesh/log.hpp"
#include "datamesh/query.hpp"
#include "datamesh/table.hpp"
#include "datamesh/timestamp.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace datamesh {

// ---------------------------------------------------------------------------
// Coordinate roles
// ---------------------------------------------------------------------------

// Semantic axis roles, keyed on the wire by a single letter. Station and
// season share 's'.
enum class CoordRole : char {
    ensemble   = 'e',
    rasterband = 'b',
    category   = 'c',
    quantile   = 'q',
    season     = 's',
    month      = 'm',
    time       = 't',
    vertical   = 'z',
    northing   = 'y',
    easting    = 'x',
    station    = 's',
    geometry   = 'g',
    frequency  = 'f',
    direction  = 'd',
    other_i    = 'i',
    other_j    = 'j',
    other_k    = 'k',
};

[[nodiscard]] constexpr char role_key(CoordRole r) noexcept { return static_cast<char>(r); }

[[nodiscard]] constexpr std::optional<CoordRole> parse_coord_role(std::string_view key) noexcept
{
    if (key.size() != 1) return std::nullopt;
    switch (key.front()) {
        case 'e': case 'b': case 'c': case 'q': case 's': case 'm': case 't': case 'z':
        case 'y': case 'x': case 'g': case 'f': case 'd': case 'i': case 'j': case 'k':
            return static_cast<CoordRole>(key.front());
        default:
            return std::nullopt;
    }
}

using CoordinateMap = std::map<CoordRole, std::string>;

namespace datasource_detail {

struct PrefixRole {
    std::string_view prefix;
    CoordRole role;
};

inline constexpr std::array<PrefixRole, 20> coord_mapping{{
    {"lon", CoordRole::easting},  {"x", CoordRole::easting},    {"eas", CoordRole::easting},
    {"lat", CoordRole::northing}, {"y", CoordRole::northing},   {"nor", CoordRole::northing},
    {"dep", CoordRole::vertical}, {"lev", CoordRole::vertical}, {"z", CoordRole::vertical},
    {"ens", CoordRole::ensemble}, {"tim", CoordRole::time},     {"ban", CoordRole::rasterband},
    {"mon", CoordRole::month},    {"sta", CoordRole::station},  {"sit", CoordRole::station},
    {"fre", CoordRole::frequency},{"dir", CoordRole::direction},{"cat", CoordRole::category},
    {"sea", CoordRole::season},   {"geo", CoordRole::geometry},
}};

[[nodiscard]] inline std::string lower(std::string_view s)
{
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

[[nodiscard]] inline JsonValue coordinates_to_json(const CoordinateMap& m)
{
    JsonObject o;
    for (const auto& [role, name] : m) o.insert_or_assign(std::string(1, role_key(role)), JsonValue{name});
    return o;
}

[[nodiscard]] inline CoordinateMap coordinates_from_json(const JsonValue& j)
{
    CoordinateMap out;
    if (!j.is_object()) return out;
    for (const auto& [k, v] : j.as_object()) {
        auto role = parse_coord_role(k);
        if (!role) throw std::invalid_argument("datasource: unknown coordinate key '" + k + "'");
        if (v.is_string()) out.insert_or_assign(*role, v.as_string());
    }
    return out;
}

[[nodiscard]] inline JsonValue opt_time(const std::optional<TimePoint>& t)
{
    return t ? JsonValue{format_timestamp(*t)} : JsonValue{};
}

[[nodiscard]] inline std::optional<TimePoint> get_time(const JsonValue& j, std::string_view key)
{
    auto s = j.get_string(key);
    if (!s || s->empty()) return std::nullopt;
    return parse_timestamp(*s);
}

[[nodiscard]] inline std::optional<Period> get_period(const JsonValue& j, std::string_view key)
{
    auto s = j.get_string(key);
    if (!s || s->empty()) return std::nullopt;
    return parse_period(*s);
}

[[nodiscard]] inline std::vector<std::string> get_strings(const JsonValue& j, std::string_view key)
{
    auto* p = j.find(key);
    return p && p->is_array() ? json_string_list(*p) : std::vector<std::string>{};
}

[[nodiscard]] inline JsonObject get_object(const JsonValue& j, std::string_view key)
{
    auto* p = j.find(key);
    return p && p->is_object() ? p->as_object() : JsonObject{};
}

// Recursively widen a box over every [x, y, ...] position in a GeoJSON
// coordinates array.
inline void extend_bounds(const JsonValue& coords, std::optional<std::array<double, 4>>& box)
{
    if (!coords.is_array() || coords.empty()) return;
    const auto& arr = coords.as_array();
    if (arr[0].is_number()) {
        if (arr.size() < 2 || !arr[1].is_number()) return;
        double x = arr[0].as_number(), y = arr[1].as_number();
        if (!box) box = std::array<double, 4>{x, y, x, y};
        else *box = {std::min((*box)[0], x), std::min((*box)[1], y),
                     std::max((*box)[2], x), std::max((*box)[3], y)};
        return;
    }
    for (const auto& c : arr) extend_bounds(c, box);
}

inline void append_position(std::string& out, const JsonValue& p)
{
    const auto& a = p.as_array();
    if (a.size() < 2) throw std::invalid_argument("geometry: position needs two numbers");
    out += std::format("{} {}", a[0].as_number(), a[1].as_number());
}

inline void append_ring(std::string& out, const JsonValue& ring)
{
    out += '(';
    bool first = true;
    for (const auto& p : ring.as_array()) {
        if (!first) out += ", ";
        first = false;
        append_position(out, p);
    }
    out += ')';
}

inline void append_rings(std::string& out, const JsonValue& rings)
{
    out += '(';
    bool first = true;
    for (const auto& r : rings.as_array()) {
        if (!first) out += ", ";
        first = false;
        append_ring(out, r);
    }
    out += ')';
}

[[nodiscard]] inline std::pair<double, double> finite_range(const std::vector<double>& values)
{
    double lo = std::numeric_limits<double>::infinity();
    double hi = -lo;
    for (double v : values) {
        if (std::isnan(v)) continue;
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }
    if (lo > hi) throw std::invalid_argument("datasource: coordinate has no finite values");
    return {lo, hi};
}

} // namespace datasource_detail

/// Role from the first three characters of each name (case-insensitive);
/// names with no known prefix are skipped. A later name wins a role.
[[nodiscard]] inline CoordinateMap guess_coordinates(const std::vector<std::string>& names)
{
    CoordinateMap out;
    for (const auto& name : names) {
        auto pref = datasource_detail::lower(std::string_view(name).substr(0, 3));
        for (const auto& [prefix, role] : datasource_detail::coord_mapping) {
            if (prefix == pref) {
                out.insert_or_assign(role, name);
                break;
            }
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Geometry helpers
// ---------------------------------------------------------------------------

/// GeoJSON Polygon for the box: one counter-clockwise ring starting at the
/// lower-right corner.
[[nodiscard]] inline JsonValue bbox_geometry(double x0, double y0, double x1, double y1)
{
    auto pt = [](double x, double y) { return json_array({x, y}); };
    return json_object({{"type", "Polygon"},
                        {"coordinates", json_array({json_array({pt(x1, y0), pt(x1, y1), pt(x0, y1),
                                                                pt(x0, y0), pt(x1, y0)})})}});
}

/// [minx, miny, maxx, maxy] of a GeoJSON geometry or Feature.
[[nodiscard]] inline std::optional<std::array<double, 4>> geojson_bounds(const JsonValue& geom)
{
    std::optional<std::array<double, 4>> box;
    if (!geom.is_object()) return box;
    if (auto* g = geom.find("geometry")) return geojson_bounds(*g);
    if (auto* gs = geom.find("geometries"); gs && gs->is_array()) {
        for (const auto& g : gs->as_array()) {
            auto b = geojson_bounds(g);
            if (!b) continue;
            datasource_detail::extend_bounds(json_array({(*b)[0], (*b)[1]}), box);
            datasource_detail::extend_bounds(json_array({(*b)[2], (*b)[3]}), box);
        }
        return box;
    }
    if (auto* c = geom.find("coordinates")) datasource_detail::extend_bounds(*c, box);
    return box;
}

/// WKT for a GeoJSON geometry (or Feature). Throws std::invalid_argument
/// for unsupported types.
[[nodiscard]] inline std::string geojson_to_wkt(const JsonValue& geom)
{
    using namespace datasource_detail;
    if (auto* g = geom.find("geometry")) return geojson_to_wkt(*g);
    auto type = geom.get_string("type").value_or("");
    const auto* c = geom.find("coordinates");
    if (!c || !c->is_array()) throw std::invalid_argument("geometry: '" + type + "' has no coordinates");

    std::string out;
    if (type == "Point") {
        out = "POINT (";
        append_position(out, *c);
        out += ')';
    } else if (type == "MultiPoint" || type == "LineString") {
        out = type == "LineString" ? "LINESTRING " : "MULTIPOINT ";
        append_ring(out, *c);
    } else if (type == "Polygon" || type == "MultiLineString") {
        out = type == "Polygon" ? "POLYGON " : "MULTILINESTRING ";
        append_rings(out, *c);
    } else if (type == "MultiPolygon") {
        out = "MULTIPOLYGON (";
        bool first = true;
        for (const auto& poly : c->as_array()) {
            if (!first) out += ", ";
            first = false;
            append_rings(out, poly);
        }
        out += ')';
    } else {
        throw std::invalid_argument("geometry: unsupported type '" + type + "'");
    }
    return out;
}

// ---------------------------------------------------------------------------
// Time values
// ---------------------------------------------------------------------------

/// Decode a numeric time value with CF units ("hours since 2000-01-01").
/// Throws std::invalid_argument for units it does not understand.
[[nodiscard]] inline TimePoint decode_time(double value, std::string_view units)
{
    auto pos = units.find(" since ");
    if (pos == std::string_view::npos)
        throw std::invalid_argument("time: units '" + std::string(units) + "' are not '<unit> since <epoch>'");
    auto unit = datasource_detail::lower(units.substr(0, pos));
    auto epoch = parse_timestamp(units.substr(pos + 7));

    double us_per = 0;
    if (unit == "microseconds" || unit == "us") us_per = 1;
    else if (unit == "milliseconds" || unit == "ms") us_per = 1e3;
    else if (unit == "seconds" || unit == "s") us_per = 1e6;
    else if (unit == "minutes") us_per = 60e6;
    else if (unit == "hours" || unit == "h") us_per = 3600e6;
    else if (unit == "days" || unit == "d") us_per = 86400e6;
    else throw std::invalid_argument("time: unknown unit '" + unit + "'");
    return epoch + std::chrono::microseconds{static_cast<std::int64_t>(std::llround(value * us_per))};
}

// ---------------------------------------------------------------------------
// Schema and Datasource
// ---------------------------------------------------------------------------

struct Schema {
    JsonObject attrs;
    JsonObject dims;
    JsonObject coords;
    JsonObject data_vars;

    [[nodiscard]] bool empty() const noexcept { return dims.empty() && coords.empty() && data_vars.empty(); }

    [[nodiscard]] JsonValue to_json() const
    {
        return json_object({{"attrs", JsonValue{attrs}}, {"dims", JsonValue{dims}},
                            {"coords", JsonValue{coords}}, {"data_vars", JsonValue{data_vars}}});
    }

    [[nodiscard]] static Schema from_json(const JsonValue& j)
    {
        using datasource_detail::get_object;
        return Schema{get_object(j, "attrs"), get_object(j, "dims"), get_object(j, "coords"),
                      get_object(j, "data_vars")};
    }
};

enum class DetailLevel : std::uint8_t { summary, detailed };

struct Datasource {
    std::string id;
    std::string name;
    std::string description;
    JsonObject parameters;
    std::optional<JsonValue> geom;  // GeoJSON geometry, WGS84
    std::optional<TimePoint> tstart;
    std::optional<TimePoint> tend;
    std::optional<Period> pforecast;
    std::optional<Period> parchive;
    std::vector<std::string> tags;
    std::vector<std::string> labels;
    JsonObject info;
    Schema schema;
    CoordinateMap coordinates;
    std::optional<std::string> details;
    std::optional<TimePoint> created;
    std::optional<TimePoint> modified;
    std::optional<TimePoint> expires;
    std::string driver = "_null";
    JsonObject driver_args;

    [[nodiscard]] std::optional<std::array<double, 4>> bounds() const
    {
        return geom ? geojson_bounds(*geom) : std::nullopt;
    }

    [[nodiscard]] JsonValue to_json() const
    {
        using namespace datasource_detail;
        JsonValue j = JsonObject{};
        j["id"] = id;
        j["name"] = name;
        j["description"] = description;
        j["parameters"] = parameters;
        j["geom"] = geom ? *geom : JsonValue{};
        j["tstart"] = opt_time(tstart);
        j["tend"] = opt_time(tend);
        j["pforecast"] = pforecast ? JsonValue{format_period(*pforecast)} : JsonValue{};
        j["parchive"] = parchive ? JsonValue{format_period(*parchive)} : JsonValue{};
        j["tags"] = json_array_of(tags);
        j["labels"] = json_array_of(labels);
        j["info"] = info;
        j["schema"] = schema.to_json();
        j["coordinates"] = coordinates_to_json(coordinates);
        j["details"] = details ? JsonValue{*details} : JsonValue{};
        j["created"] = opt_time(created);
        j["modified"] = opt_time(modified);
        j["expires"] = opt_time(expires);
        j["driver"] = driver;
        j["args"] = driver_args;
        return j;
    }

    /// From a flat property object (the to_json() shape). The geometry may
    /// be under "geom" or "geometry".
    [[nodiscard]] static Datasource from_json(const JsonValue& j)
    {
        using namespace datasource_detail;
        if (!j.is_object()) throw std::invalid_argument("datasource: expected a JSON object");
        Datasource d;
        d.id = lower(j.get_string("id").value_or(""));
        d.name = j.get_string("name").value_or(d.id);
        d.description = j.get_string("description").value_or("");
        d.parameters = get_object(j, "parameters");
        for (const char* key : {"geom", "geometry"}) {
            if (auto* g = j.find(key); g && g->is_object()) {
                d.geom = *g;
                break;
            }
        }
        d.tstart = get_time(j, "tstart");
        d.tend = get_time(j, "tend");
        d.pforecast = get_period(j, "pforecast");
        d.parchive = get_period(j, "parchive");
        d.tags = get_strings(j, "tags");
        d.labels = get_strings(j, "labels");
        d.info = get_object(j, "info");
        if (auto* s = j.find("schema"); s && s->is_object()) d.schema = Schema::from_json(*s);
        if (auto* c = j.find("coordinates")) d.coordinates = coordinates_from_json(*c);
        d.details = j.get_string("details");
        d.created = get_time(j, "created");
        d.modified = get_time(j, "modified");
        d.expires = get_time(j, "expires");
        d.driver = j.get_string("driver").value_or("_null");
        d.driver_args = get_object(j, "args");
        return d;
    }

    /// From a GeoJSON Feature {id, geometry, properties}. `id` overrides the
    /// feature's own id when given.
    [[nodiscard]] static Datasource from_feature(const JsonValue& feature, std::string_view id = {})
    {
        JsonValue props = JsonObject{};
        if (auto* p = feature.find("properties"); p && p->is_object()) props = *p;
        if (!id.empty()) props["id"] = id;
        else if (auto fid = feature.get_string("id")) props["id"] = *fid;
        if (auto* g = feature.find("geometry"); g && g->is_object()) props["geom"] = *g;
        return from_json(props);
    }
};

// Immutable snapshot returned by lookups.
struct DatasourceInfo {
    Datasource datasource;
    DetailLevel detail = DetailLevel::summary;
};

// ---------------------------------------------------------------------------
// Property guessing
// ---------------------------------------------------------------------------

/// Mapped coordinate names found in neither the coords nor the data_vars
/// of the schema.
[[nodiscard]] inline std::vector<std::string> check_coordinates(const Datasource& ds)
{
    std::vector<std::string> bad;
    for (const auto& [role, name] : ds.coordinates)
        if (!ds.schema.coords.contains(name) && !ds.schema.data_vars.contains(name)) bad.push_back(name);
    return bad;
}

namespace datasource_detail {

[[nodiscard]] inline bool is_null_island(const JsonValue& g)
{
    if (g.get_string("type").value_or("") != "Point") return false;
    auto* c = g.find("coordinates");
    return c && c->is_array() && c->size() >= 2 && (*c)[0].is_number() && (*c)[1].is_number()
        && (*c)[0].as_number() == 0.0 && (*c)[1].as_number() == 0.0;
}

// Shared tail of guess_props: geometry and time bounds from extracted
// coordinate values. `values(name)` yields doubles, `times(name)` the
// decoded [min, max] instants or nullopt.
template <typename ValuesFn, typename TimesFn>
void guess_extent(Datasource& ds, bool append, ValuesFn&& values, TimesFn&& times)
{
    if (!ds.geom || is_null_island(*ds.geom)) {
        auto x = ds.coordinates.find(CoordRole::easting);
        auto y = ds.coordinates.find(CoordRole::northing);
        if (x != ds.coordinates.end() && y != ds.coordinates.end()) {
            Logger::warn("Setting geometry as a bbox from x and y coordinates");
            auto [x0, x1] = finite_range(values(x->second));
            auto [y0, y1] = finite_range(values(y->second));
            ds.geom = bbox_geometry(x0, y0, x1, y1);
        }
    }

    std::optional<std::pair<TimePoint, TimePoint>> trange;
    if (auto t = ds.coordinates.find(CoordRole::time); t != ds.coordinates.end()) trange = times(t->second);

    if (!ds.tstart) {
        if (trange) {
            ds.tstart = trange->first;
        } else {
            ds.tstart = TimePoint{};
            Logger::warn("Setting tstart to 1970-01-01T00:00:00Z");
        }
    }
    if (!ds.tend && !ds.pforecast && !append) {
        if (trange) {
            ds.tend = trange->second;
        } else {
            ds.tend = std::chrono::floor<std::chrono::microseconds>(std::chrono::system_clock::now());
            Logger::warn("Setting tend to current time");
        }
    }
}

[[nodiscard]] inline std::optional<std::pair<TimePoint, TimePoint>> time_range(const Variable& v)
{
    auto units = v.attrs.find("units");
    if (units == v.attrs.end() || !units->second.is_string()) return std::nullopt;
    try {
        auto [lo, hi] = finite_range(v.as_double());
        const auto& u = units->second.as_string();
        return std::pair{decode_time(lo, u), decode_time(hi, u)};
    } catch (const std::invalid_argument& e) {
        Logger::debug("datasource: cannot decode time coordinate: {}", e.what());
        return std::nullopt;
    }
}

} // namespace datasource_detail

/// Fill the schema, coordinate roles, geometry and time bounds that `ds`
/// leaves unset from the data about to be written to it.
inline void guess_props(Datasource& ds, const Dataset& data, bool append)
{
    if (ds.schema.dims.empty()) ds.schema = Schema::from_json(data.schema());
    if (ds.coordinates.empty()) {
        std::vector<std::string> names;
        for (const auto& [name, _] : data.coords) names.push_back(name);
        ds.coordinates = guess_coordinates(names);
    }
    datasource_detail::guess_extent(
        ds, append,
        [&](const std::string& name) { return data[name].as_double(); },
        [&](const std::string& name) -> std::optional<std::pair<TimePoint, TimePoint>> {
            if (!data.contains(name)) return std::nullopt;
            return datasource_detail::time_range(data[name]);
        });
}

/// Tables take their coordinate roles from the index column.
inline void guess_props(Datasource& ds, const Table& data, bool append)
{
    if (ds.schema.dims.empty()) ds.schema = Schema::from_json(data.schema());
    if (ds.coordinates.empty() && data.index) ds.coordinates = guess_coordinates({*data.index});
    datasource_detail::guess_extent(
        ds, append,
        [&](const std::string& name) { return column_as_double(*data.data, name); },
        [&](const std::string& name) -> std::optional<std::pair<TimePoint, TimePoint>> {
            auto field = data.data->schema()->GetFieldByName(name);
            if (!field || field->type()->id() != arrow::Type::TIMESTAMP) return std::nullopt;
            auto [lo, hi] = datasource_detail::finite_range(column_as_double(*data.data, name));
            using std::chrono::microseconds;
            return std::pair{TimePoint{microseconds{static_cast<std::int64_t>(lo)}},
                             TimePoint{microseconds{static_cast<std::int64_t>(hi)}}};
        });
}

/// As for tables; a geometry still unset afterwards becomes the bounding
/// box of the geometry column.
inline void guess_props(Datasource& ds, const GeoTable& data, bool append)
{
    guess_props(ds, data.as_table(), append);
    if (!ds.geom || datasource_detail::is_null_island(*ds.geom)) {
        if (auto b = data.bounds()) {
            Logger::warn("Setting geometry as a bbox from the geometry column");
            ds.geom = bbox_geometry((*b)[0], (*b)[1], (*b)[2], (*b)[3]);
        }
    }
}

// Storage driver the service uses for each container kind.
[[nodiscard]] constexpr std::string_view datasource_driver(Container c) noexcept
{
    switch (c) {
        case Container::dataset:  return "onzarr";
        case Container::geotable: return "postgis";
        case Container::table:    return "onsql";
    }
    return "onzarr";
}

// ---------------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------------

// Read-only, id-indexed view of a GeoJSON FeatureCollection of datasources.
class Catalog final {
public:
    Catalog() = default;

    [[nodiscard]] static Catalog from_json(const JsonValue& collection)
    {
        Catalog cat;
        const auto* features = collection.find("features");
        if (!features || !features->is_array())
            throw std::invalid_argument("catalog: expected a FeatureCollection");
        for (const auto& f : features->as_array()) {
            auto ds = Datasource::from_feature(f);
            cat.ids_.push_back(ds.id);
            cat.entries_.push_back(std::move(ds));
        }
        return cat;
    }

    [[nodiscard]] const std::vector<std::string>& ids() const noexcept { return ids_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] bool contains(std::string_view id) const noexcept
    {
        return std::find(ids_.begin(), ids_.end(), id) != ids_.end();
    }

    /// Summary-level entry. Throws std::out_of_range for an unknown id.
    [[nodiscard]] const Datasource& at(std::string_view id) const
    {
        auto it = std::find(ids_.begin(), ids_.end(), id);
        if (it == ids_.end()) throw std::out_of_range(std::format("Datasource {} not in catalog", id));
        return entries_[static_cast<std::size_t>(it - ids_.begin())];
    }

    [[nodiscard]] auto begin() const noexcept { return entries_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return entries_.cend(); }

private:
    std::vector<std::string> ids_;
    std::vector<Datasource> entries_;
};

} // namespace datamesh
