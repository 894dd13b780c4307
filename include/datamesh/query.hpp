#pragma once
#include "datamesh/digest.hpp"
#include "datamesh/json.hpp"
#include "datamesh/timestamp.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace datamesh {

// ---------------------------------------------------------------------------
// Enumerations and their wire names
// ---------------------------------------------------------------------------

enum class GeoFilterType : std::uint8_t { bbox, radius, feature };
enum class AggregateOp : std::uint8_t { mean, min, max, stddev, sum };
enum class RequestKind : std::uint8_t { data, schema, coords };

// Result container kinds: labeled arrays, geo-tables and plain tables.
enum class Container : std::uint8_t { dataset, geotable, table };

[[nodiscard]] constexpr std::string_view geofilter_type_name(GeoFilterType t) noexcept
{
    switch (t) {
        case GeoFilterType::bbox:    return "bbox";
        case GeoFilterType::radius:  return "radius";
        case GeoFilterType::feature: return "feature";
    }
    return "bbox";
}

[[nodiscard]] constexpr std::string_view aggregate_op_name(AggregateOp op) noexcept
{
    switch (op) {
        case AggregateOp::mean:   return "mean";
        case AggregateOp::min:    return "min";
        case AggregateOp::max:    return "max";
        case AggregateOp::stddev: return "std";
        case AggregateOp::sum:    return "sum";
    }
    return "mean";
}

[[nodiscard]] constexpr std::string_view request_kind_name(RequestKind k) noexcept
{
    switch (k) {
        case RequestKind::data:   return "data";
        case RequestKind::schema: return "schema";
        case RequestKind::coords: return "coords";
    }
    return "data";
}

[[nodiscard]] constexpr std::string_view container_name(Container c) noexcept
{
    switch (c) {
        case Container::dataset:  return "dataset";
        case Container::geotable: return "geodataframe";
        case Container::table:    return "dataframe";
    }
    return "dataset";
}

namespace query_detail {

template <typename E, std::size_t N, typename NameFn>
[[nodiscard]] E parse_enum(std::string_view s, const std::array<E, N>& all, NameFn name, std::string_view what)
{
    for (E e : all)
        if (name(e) == s) return e;
    throw std::invalid_argument("query: unknown " + std::string(what) + " '" + std::string(s) + "'");
}

[[nodiscard]] inline const std::string& require_string(const JsonValue& j, std::string_view key, std::string_view what)
{
    auto* p = j.find(key);
    if (!p || !p->is_string())
        throw std::invalid_argument("query: " + std::string(what) + " requires string field '" + std::string(key) + "'");
    return p->as_string();
}

// Byte and element counts arrive as JSON numbers.
[[nodiscard]] inline std::uint64_t require_count(const JsonValue& j, std::string_view key, std::string_view what)
{
    constexpr double limit = 18446744073709551616.0;  // 2^64
    double v = j.get_number(key).value_or(0.0);
    if (!(v >= 0.0 && v < limit))
        throw std::invalid_argument("query: " + std::string(what) + " field '" + std::string(key)
                                    + "' is not a valid count");
    return static_cast<std::uint64_t>(v);
}

} // namespace query_detail

[[nodiscard]] inline GeoFilterType parse_geofilter_type(std::string_view s)
{
    return query_detail::parse_enum(s, std::array{GeoFilterType::bbox, GeoFilterType::radius, GeoFilterType::feature},
                                    geofilter_type_name, "geofilter type");
}

[[nodiscard]] inline AggregateOp parse_aggregate_op(std::string_view s)
{
    return query_detail::parse_enum(s, std::array{AggregateOp::mean, AggregateOp::min, AggregateOp::max,
                                                  AggregateOp::stddev, AggregateOp::sum},
                                    aggregate_op_name, "aggregate operation");
}

[[nodiscard]] inline RequestKind parse_request_kind(std::string_view s)
{
    return query_detail::parse_enum(s, std::array{RequestKind::data, RequestKind::schema, RequestKind::coords},
                                    request_kind_name, "request kind");
}

[[nodiscard]] inline Container parse_container(std::string_view s)
{
    return query_detail::parse_enum(s, std::array{Container::dataset, Container::geotable, Container::table},
                                    container_name, "container");
}

// ---------------------------------------------------------------------------
// Filters
// ---------------------------------------------------------------------------

// Open end, absolute instant, or offset relative to "now" evaluated server side.
using TimeBound = std::variant<std::monostate, TimePoint, Period>;

[[nodiscard]] inline JsonValue time_bound_to_json(const TimeBound& b)
{
    if (auto* tp = std::get_if<TimePoint>(&b)) return format_timestamp(*tp);
    if (auto* p = std::get_if<Period>(&b)) return format_period(*p);
    return nullptr;
}

[[nodiscard]] inline TimeBound time_bound_from_json(const JsonValue& j)
{
    if (j.is_null()) return std::monostate{};
    if (!j.is_string()) throw std::invalid_argument("query: time bound must be a string or null");
    const auto& s = j.as_string();
    if (s.starts_with('P') || s.starts_with("-P") || s.starts_with("+P")) return parse_period(s);
    return parse_timestamp(s);
}

struct TimeFilter {
    std::array<TimeBound, 2> times{};
    std::string resolution = "native";
    std::string resample = "mean";

    [[nodiscard]] static TimeFilter range(TimeBound start, TimeBound end)
    {
        TimeFilter f;
        f.times = {std::move(start), std::move(end)};
        return f;
    }

    [[nodiscard]] JsonValue to_json() const
    {
        return json_object({
            {"type", "range"},
            {"times", json_array({time_bound_to_json(times[0]), time_bound_to_json(times[1])})},
            {"resolution", resolution},
            {"resample", resample},
        });
    }

    [[nodiscard]] static TimeFilter from_json(const JsonValue& j)
    {
        TimeFilter f;
        if (auto t = j.get_string("type"); t && *t != "range")
            throw std::invalid_argument("query: unsupported timefilter type '" + *t + "'");
        const auto* times = j.find("times");
        if (!times || !times->is_array() || times->size() != 2)
            throw std::invalid_argument("query: timefilter.times must be a pair");
        f.times = {time_bound_from_json((*times)[0]), time_bound_from_json((*times)[1])};
        if (auto r = j.get_string("resolution")) f.resolution = *r;
        if (auto r = j.get_string("resample")) f.resample = *r;
        return f;
    }

    friend bool operator==(const TimeFilter&, const TimeFilter&) = default;
};

struct GeoFilter {
    GeoFilterType type = GeoFilterType::bbox;
    // bbox: [x0, y0, x1, y1]; radius: [x, y, r]; feature: a GeoJSON Feature.
    JsonValue geom;
    double resolution = 0.0;

    [[nodiscard]] static GeoFilter bbox(double x0, double y0, double x1, double y1)
    {
        return GeoFilter{GeoFilterType::bbox, json_array({x0, y0, x1, y1}), 0.0};
    }

    [[nodiscard]] static GeoFilter radius(double x, double y, double r)
    {
        return GeoFilter{GeoFilterType::radius, json_array({x, y, r}), 0.0};
    }

    [[nodiscard]] static GeoFilter feature(JsonValue feature)
    {
        return GeoFilter{GeoFilterType::feature, std::move(feature), 0.0};
    }

    [[nodiscard]] JsonValue to_json() const
    {
        return json_object({
            {"type", geofilter_type_name(type)},
            {"geom", geom},
            {"resolution", resolution},
        });
    }

    [[nodiscard]] static GeoFilter from_json(const JsonValue& j)
    {
        GeoFilter f;
        if (auto t = j.get_string("type")) f.type = parse_geofilter_type(*t);
        const auto* geom = j.find("geom");
        if (!geom) throw std::invalid_argument("query: geofilter requires 'geom'");
        f.geom = *geom;
        const std::size_t want = f.type == GeoFilterType::bbox ? 4 : 3;
        if (f.type != GeoFilterType::feature && (!f.geom.is_array() || f.geom.size() != want))
            throw std::invalid_argument("query: geofilter " + std::string(geofilter_type_name(f.type)) +
                                        " needs " + std::to_string(want) + " numbers");
        if (f.type == GeoFilterType::feature && !f.geom.is_object())
            throw std::invalid_argument("query: geofilter feature must be a GeoJSON object");
        f.resolution = j.get_number("resolution").value_or(0.0);
        return f;
    }

    friend bool operator==(const GeoFilter&, const GeoFilter&) = default;
};

struct CoordSelector {
    std::string coord;
    JsonArray values;

    [[nodiscard]] JsonValue to_json() const
    {
        return json_object({{"coord", coord}, {"values", JsonValue{values}}});
    }

    [[nodiscard]] static CoordSelector from_json(const JsonValue& j)
    {
        CoordSelector c;
        c.coord = query_detail::require_string(j, "coord", "coordfilter");
        if (auto* v = j.find("values"); v && v->is_array()) c.values = v->as_array();
        return c;
    }

    friend bool operator==(const CoordSelector&, const CoordSelector&) = default;
};

struct Aggregate {
    std::vector<AggregateOp> operations{AggregateOp::mean};
    bool spatial = true;
    bool temporal = true;

    [[nodiscard]] JsonValue to_json() const
    {
        JsonArray ops;
        for (auto op : operations) ops.emplace_back(aggregate_op_name(op));
        return json_object({{"operations", JsonValue{std::move(ops)}}, {"spatial", spatial}, {"temporal", temporal}});
    }

    [[nodiscard]] static Aggregate from_json(const JsonValue& j)
    {
        Aggregate a;
        if (auto* ops = j.find("operations"); ops && ops->is_array()) {
            a.operations.clear();
            for (const auto& op : ops->as_array()) {
                if (!op.is_string()) throw std::invalid_argument("query: aggregate operation must be a string");
                a.operations.push_back(parse_aggregate_op(op.as_string()));
            }
        }
        a.spatial = j.get_bool("spatial").value_or(true);
        a.temporal = j.get_bool("temporal").value_or(true);
        return a;
    }

    friend bool operator==(const Aggregate&, const Aggregate&) = default;
};

// ---------------------------------------------------------------------------
// Query
// ---------------------------------------------------------------------------

struct Query {
    std::string datasource;
    JsonObject parameters;
    std::optional<std::string> description;
    std::optional<std::vector<std::string>> variables;
    std::optional<TimeFilter> timefilter;
    std::optional<GeoFilter> geofilter;
    std::vector<CoordSelector> coordfilter;
    std::optional<std::string> crs;
    std::optional<Aggregate> aggregate;
    RequestKind kind = RequestKind::data;
    std::optional<std::uint64_t> limit;

    /// Every field is emitted (absent ones as null) so equal queries
    /// serialize to identical text.
    [[nodiscard]] JsonValue to_json() const
    {
        JsonValue j = JsonObject{};
        j["datasource"] = datasource;
        j["parameters"] = parameters;
        j["description"] = description ? JsonValue{*description} : JsonValue{};
        j["variables"] = variables ? json_array_of(*variables) : JsonValue{};
        j["timefilter"] = timefilter ? timefilter->to_json() : JsonValue{};
        j["geofilter"] = geofilter ? geofilter->to_json() : JsonValue{};
        if (coordfilter.empty()) {
            j["coordfilter"] = nullptr;
        } else {
            JsonArray cf;
            for (const auto& c : coordfilter) cf.push_back(c.to_json());
            j["coordfilter"] = std::move(cf);
        }
        j["crs"] = crs ? JsonValue{*crs} : JsonValue{};
        j["aggregate"] = aggregate ? aggregate->to_json() : JsonValue{};
        j["request"] = request_kind_name(kind);
        j["limit"] = limit ? JsonValue{static_cast<double>(*limit)} : JsonValue{};
        return j;
    }

    [[nodiscard]] static Query from_json(const JsonValue& j)
    {
        if (!j.is_object()) throw std::invalid_argument("query: expected a JSON object");
        Query q;
        q.datasource = query_detail::require_string(j, "datasource", "query");
        if (auto* p = j.find("parameters"); p && p->is_object()) q.parameters = p->as_object();
        q.description = j.get_string("description");
        if (auto* v = j.find("variables"); v && v->is_array()) q.variables = json_string_list(*v);
        if (auto* t = j.find("timefilter"); t && t->is_object()) q.timefilter = TimeFilter::from_json(*t);
        if (auto* g = j.find("geofilter"); g && g->is_object()) q.geofilter = GeoFilter::from_json(*g);
        if (auto* c = j.find("coordfilter"); c && c->is_array()) {
            for (const auto& item : c->as_array()) q.coordfilter.push_back(CoordSelector::from_json(item));
        }
        if (auto* crs = j.find("crs")) {
            // EPSG codes may arrive as integers.
            if (crs->is_string()) q.crs = crs->as_string();
            else if (crs->is_number()) q.crs = "EPSG:" + std::to_string(crs->as_int());
        }
        if (auto* a = j.find("aggregate"); a && a->is_object()) q.aggregate = Aggregate::from_json(*a);
        if (auto r = j.get_string("request")) q.kind = parse_request_kind(*r);
        if (auto l = j.get_number("limit")) q.limit = static_cast<std::uint64_t>(*l);
        return q;
    }

    [[nodiscard]] std::string canonical_json() const { return json_serialize(to_json()); }

    /// SHA-224 of the canonical serialization; the local cache key.
    [[nodiscard]] std::string hash() const { return sha224_hex(canonical_json()); }

    friend bool operator==(const Query& a, const Query& b) { return a.canonical_json() == b.canonical_json(); }
};

// ---------------------------------------------------------------------------
// Stage: the service's description of what a query would return
// ---------------------------------------------------------------------------

struct Stage {
    Query query;
    std::string qhash;
    std::vector<std::string> formats;
    std::uint64_t size = 0;  // bytes
    std::uint64_t dlen = 0;  // elements (rows for tables)
    JsonObject coords;
    Container container = Container::dataset;

    [[nodiscard]] static Stage from_json(const JsonValue& j)
    {
        if (!j.is_object()) throw std::invalid_argument("stage: expected a JSON object");
        Stage s;
        if (auto* q = j.find("query"); q && q->is_object()) s.query = Query::from_json(*q);
        s.qhash = query_detail::require_string(j, "qhash", "stage");
        if (auto* f = j.find("formats")) s.formats = json_string_list(*f);
        s.size = query_detail::require_count(j, "size", "stage");
        s.dlen = query_detail::require_count(j, "dlen", "stage");
        if (auto* c = j.find("coords"); c && c->is_object()) s.coords = c->as_object();
        s.container = parse_container(query_detail::require_string(j, "container", "stage"));
        return s;
    }

    [[nodiscard]] JsonValue to_json() const
    {
        return json_object({
            {"query", query.to_json()},
            {"qhash", qhash},
            {"formats", json_array_of(formats)},
            {"size", static_cast<double>(size)},
            {"dlen", static_cast<double>(dlen)},
            {"coords", JsonValue{coords}},
            {"container", container_name(container)},
        });
    }
};

} // namespace datamesh
