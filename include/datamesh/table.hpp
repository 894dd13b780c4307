#pragma once
#include "datamesh/json.hpp"

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace datamesh {

namespace table_detail {

inline void check(const arrow::Status& st, std::string_view what)
{
    if (!st.ok()) throw std::runtime_error("table: " + std::string(what) + ": " + st.ToString());
}

template <typename T>
[[nodiscard]] T unwrap(arrow::Result<T> r, std::string_view what)
{
    check(r.status(), what);
    return std::move(r).ValueOrDie();
}

inline constexpr std::int64_t row_group_length = 64 * 1024;

[[nodiscard]] inline std::shared_ptr<arrow::Table> read_parquet(std::shared_ptr<arrow::io::RandomAccessFile> input)
{
    parquet::arrow::FileReaderBuilder builder;
    check(builder.Open(std::move(input)), "open parquet");
    std::unique_ptr<parquet::arrow::FileReader> reader;
    check(builder.Build(&reader), "build parquet reader");
    std::shared_ptr<arrow::Table> table;
    check(reader->ReadTable(&table), "read parquet");
    return table;
}

inline void write_parquet(const arrow::Table& table, std::shared_ptr<arrow::io::OutputStream> sink)
{
    auto arrow_props = parquet::ArrowWriterProperties::Builder().store_schema()->build();
    check(parquet::arrow::WriteTable(table, arrow::default_memory_pool(), std::move(sink), row_group_length,
                                     parquet::default_writer_properties(), arrow_props),
          "write parquet");
}

[[nodiscard]] inline std::vector<std::byte> encode(const arrow::Table& table)
{
    auto sink = unwrap(arrow::io::BufferOutputStream::Create(), "allocate buffer");
    write_parquet(table, sink);
    auto buffer = unwrap(sink->Finish(), "finish buffer");
    std::vector<std::byte> out(static_cast<std::size_t>(buffer->size()));
    std::memcpy(out.data(), buffer->data(), out.size());
    return out;
}

[[nodiscard]] inline std::shared_ptr<arrow::Table> decode(std::span<const std::byte> bytes)
{
    auto buffer = arrow::Buffer::FromString(std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    return read_parquet(std::make_shared<arrow::io::BufferReader>(std::move(buffer)));
}

[[nodiscard]] inline std::optional<std::string> metadata_value(const arrow::Table& table, const std::string& key)
{
    auto md = table.schema()->metadata();
    if (!md) return std::nullopt;
    auto i = md->FindKey(key);
    if (i < 0) return std::nullopt;
    return md->value(i);
}

[[nodiscard]] inline std::shared_ptr<arrow::Table> with_metadata(const std::shared_ptr<arrow::Table>& table,
                                                                 const std::string& key, const std::string& value)
{
    auto existing = table->schema()->metadata();
    auto md = existing ? existing->Copy() : std::make_shared<arrow::KeyValueMetadata>();
    if (auto i = md->FindKey(key); i >= 0) check(md->Delete(i), "replace metadata");
    md->Append(key, value);
    return table->ReplaceSchemaMetadata(md);
}

// Index column recorded the way pandas does it.
[[nodiscard]] inline std::optional<std::string> pandas_index(const arrow::Table& table)
{
    auto text = metadata_value(table, "pandas");
    if (!text) return std::nullopt;
    try {
        auto idx = json_string_list(json_parse(*text).get("index_columns", JsonValue{}));
        if (!idx.empty() && table.schema()->GetFieldIndex(idx.front()) >= 0) return idx.front();
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return std::nullopt;
}

[[nodiscard]] inline std::string pandas_metadata(const std::optional<std::string>& index)
{
    return json_serialize(json_object({
        {"index_columns", index ? json_array({*index}) : json_array({})},
        {"column_indexes", json_array({})},
        {"columns", json_array({})},
        {"creator", json_object({{"library", "datamesh-cpp"}})},
    }));
}

[[nodiscard]] inline std::string dtype_label(const arrow::DataType& type)
{
    switch (type.id()) {
        case arrow::Type::BOOL:      return "bool";
        case arrow::Type::INT8:      return "int8";
        case arrow::Type::INT16:     return "int16";
        case arrow::Type::INT32:     return "int32";
        case arrow::Type::INT64:     return "int64";
        case arrow::Type::UINT8:     return "uint8";
        case arrow::Type::UINT16:    return "uint16";
        case arrow::Type::UINT32:    return "uint32";
        case arrow::Type::UINT64:    return "uint64";
        case arrow::Type::FLOAT:     return "float32";
        case arrow::Type::DOUBLE:    return "float64";
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
        case arrow::Type::BINARY:
        case arrow::Type::LARGE_BINARY: return "object";
        case arrow::Type::TIMESTAMP: return "datetime64[ns]";
        default:                     return type.ToString();
    }
}

template <typename ArrayT>
void append_numeric(const arrow::Array& chunk, std::vector<double>& out, double scale = 1.0)
{
    const auto& arr = static_cast<const ArrayT&>(chunk);
    for (std::int64_t i = 0; i < arr.length(); ++i)
        out.push_back(arr.IsNull(i) ? std::numeric_limits<double>::quiet_NaN()
                                    : static_cast<double>(arr.Value(i)) * scale);
}

// ----- WKB bounds -----

struct WkbReader {
    std::span<const std::uint8_t> buf;
    std::size_t pos = 0;
    bool little = true;

    void need(std::size_t n) const {
        if (pos + n > buf.size()) throw std::runtime_error("wkb: truncated geometry");
    }
    std::uint8_t u8() {
        need(1);
        return buf[pos++];
    }
    std::uint32_t u32() {
        need(4);
        std::uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            auto b = static_cast<std::uint32_t>(buf[pos + (little ? i : 3 - i)]);
            v |= b << (8 * i);
        }
        pos += 4;
        return v;
    }
    double f64() {
        need(8);
        std::uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            auto b = static_cast<std::uint64_t>(buf[pos + (little ? i : 7 - i)]);
            v |= b << (8 * i);
        }
        pos += 8;
        double d;
        std::memcpy(&d, &v, sizeof d);
        return d;
    }
};

using Bounds = std::array<double, 4>;   // minx, miny, maxx, maxy

inline void wkb_extend(WkbReader& r, std::optional<Bounds>& box)
{
    r.little = r.u8() == 1;
    auto type = r.u32();
    bool has_z = (type & 0x80000000u) != 0;
    bool has_m = (type & 0x40000000u) != 0;
    if (type & 0x20000000u) (void)r.u32();   // EWKB srid
    type &= 0x0FFFFFFFu;
    if (type >= 3000) { has_z = has_m = true; type -= 3000; }
    else if (type >= 2000) { has_m = true; type -= 2000; }
    else if (type >= 1000) { has_z = true; type -= 1000; }
    const std::size_t extra = (has_z ? 1 : 0) + (has_m ? 1 : 0);

    auto point = [&] {
        double x = r.f64(), y = r.f64();
        for (std::size_t i = 0; i < extra; ++i) (void)r.f64();
        if (std::isnan(x) || std::isnan(y)) return;   // empty point
        if (!box) box = Bounds{x, y, x, y};
        else *box = {std::min((*box)[0], x), std::min((*box)[1], y),
                     std::max((*box)[2], x), std::max((*box)[3], y)};
    };

    switch (type) {
        case 1: point(); break;
        case 2: for (auto n = r.u32(); n > 0; --n) point(); break;
        case 3:
            for (auto rings = r.u32(); rings > 0; --rings)
                for (auto n = r.u32(); n > 0; --n) point();
            break;
        case 4: case 5: case 6: case 7:
            for (auto n = r.u32(); n > 0; --n) {
                auto outer = r.little;
                wkb_extend(r, box);
                r.little = outer;
            }
            break;
        default:
            throw std::runtime_error("wkb: unsupported geometry type " + std::to_string(type));
    }
}

} // namespace table_detail

/// Bounding box of one WKB geometry; nullopt for an empty geometry.
[[nodiscard]] inline std::optional<table_detail::Bounds> wkb_bounds(std::span<const std::uint8_t> wkb)
{
    table_detail::WkbReader r{wkb};
    std::optional<table_detail::Bounds> box;
    table_detail::wkb_extend(r, box);
    return box;
}

/// Column values widened to double. Timestamps become microseconds since
/// the epoch; nulls become NaN. Throws for non-numeric columns.
[[nodiscard]] inline std::vector<double> column_as_double(const arrow::Table& table, const std::string& name)
{
    auto col = table.GetColumnByName(name);
    if (!col) throw std::out_of_range("table: no column '" + name + "'");
    std::vector<double> out;
    out.reserve(static_cast<std::size_t>(col->length()));
    for (const auto& chunk : col->chunks()) {
        switch (chunk->type_id()) {
            case arrow::Type::INT8:   table_detail::append_numeric<arrow::Int8Array>(*chunk, out); break;
            case arrow::Type::INT16:  table_detail::append_numeric<arrow::Int16Array>(*chunk, out); break;
            case arrow::Type::INT32:  table_detail::append_numeric<arrow::Int32Array>(*chunk, out); break;
            case arrow::Type::INT64:  table_detail::append_numeric<arrow::Int64Array>(*chunk, out); break;
            case arrow::Type::UINT8:  table_detail::append_numeric<arrow::UInt8Array>(*chunk, out); break;
            case arrow::Type::UINT16: table_detail::append_numeric<arrow::UInt16Array>(*chunk, out); break;
            case arrow::Type::UINT32: table_detail::append_numeric<arrow::UInt32Array>(*chunk, out); break;
            case arrow::Type::UINT64: table_detail::append_numeric<arrow::UInt64Array>(*chunk, out); break;
            case arrow::Type::FLOAT:  table_detail::append_numeric<arrow::FloatArray>(*chunk, out); break;
            case arrow::Type::DOUBLE: table_detail::append_numeric<arrow::DoubleArray>(*chunk, out); break;
            case arrow::Type::TIMESTAMP: {
                const auto& ts = static_cast<const arrow::TimestampType&>(*chunk->type());
                double scale = 1.0;
                switch (ts.unit()) {
                    case arrow::TimeUnit::SECOND: scale = 1e6; break;
                    case arrow::TimeUnit::MILLI:  scale = 1e3; break;
                    case arrow::TimeUnit::MICRO:  scale = 1.0; break;
                    case arrow::TimeUnit::NANO:   scale = 1e-3; break;
                }
                table_detail::append_numeric<arrow::TimestampArray>(*chunk, out, scale);
                break;
            }
            default:
                throw std::invalid_argument("table: column '" + name + "' is not numeric");
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Table
// ---------------------------------------------------------------------------

// A plain columnar table. `index` names the column acting as the row index.
struct Table {
    std::shared_ptr<arrow::Table> data;
    std::optional<std::string> index;

    [[nodiscard]] std::int64_t num_rows() const noexcept { return data ? data->num_rows() : 0; }

    [[nodiscard]] std::vector<std::string> column_names() const {
        return data ? data->ColumnNames() : std::vector<std::string>{};
    }

    [[nodiscard]] bool equals(const Table& other) const {
        if (!data || !other.data) return data == other.data;
        return index == other.index && data->Equals(*other.data, false);
    }

    /// {attrs, dims, coords, data_vars}: the index column is the coordinate,
    /// every other column a variable along it.
    [[nodiscard]] JsonValue schema() const {
        auto dim = index.value_or("index");
        JsonObject coords, vars;
        if (data) {
            for (const auto& field : data->schema()->fields()) {
                auto entry = json_object({{"dims", json_array({dim})}, {"attrs", JsonValue{JsonObject{}}},
                                          {"dtype", table_detail::dtype_label(*field->type())}});
                (index && field->name() == *index ? coords : vars).emplace(field->name(), std::move(entry));
            }
        }
        return json_object({{"attrs", JsonValue{JsonObject{}}},
                            {"dims", json_object({{dim, num_rows()}})},
                            {"coords", JsonValue{std::move(coords)}},
                            {"data_vars", JsonValue{std::move(vars)}}});
    }

    [[nodiscard]] std::vector<std::byte> to_parquet() const {
        if (!data) throw std::invalid_argument("table: empty table");
        return table_detail::encode(*table_detail::with_metadata(data, "pandas", table_detail::pandas_metadata(index)));
    }

    [[nodiscard]] static Table from_arrow(std::shared_ptr<arrow::Table> t) {
        Table out;
        out.index = table_detail::pandas_index(*t);
        out.data = std::move(t);
        return out;
    }

    [[nodiscard]] static Table from_parquet(std::span<const std::byte> bytes) {
        return from_arrow(table_detail::decode(bytes));
    }

    void write(const std::filesystem::path& path) const {
        if (!data) throw std::invalid_argument("table: empty table");
        auto out = table_detail::unwrap(arrow::io::FileOutputStream::Open(path.string()), "open " + path.string());
        table_detail::write_parquet(*table_detail::with_metadata(data, "pandas", table_detail::pandas_metadata(index)), out);
        table_detail::check(out->Close(), "close " + path.string());
    }

    [[nodiscard]] static Table read(const std::filesystem::path& path) {
        auto in = table_detail::unwrap(arrow::io::ReadableFile::Open(path.string()), "open " + path.string());
        return from_arrow(table_detail::read_parquet(in));
    }
};

// ---------------------------------------------------------------------------
// GeoTable
// ---------------------------------------------------------------------------

// A table whose geometry column holds WKB, written with GeoParquet `geo`
// schema metadata.
struct GeoTable {
    std::shared_ptr<arrow::Table> data;
    std::string geometry_column = "geometry";
    std::string crs = "EPSG:4326";
    std::optional<std::string> index;

    [[nodiscard]] std::int64_t num_rows() const noexcept { return data ? data->num_rows() : 0; }

    [[nodiscard]] bool equals(const GeoTable& other) const {
        if (!data || !other.data) return data == other.data;
        return geometry_column == other.geometry_column && crs == other.crs && index == other.index
            && data->Equals(*other.data, false);
    }

    [[nodiscard]] JsonValue schema() const { return as_table().schema(); }

    [[nodiscard]] Table as_table() const { return Table{data, index}; }

    /// Union bounding box of every geometry.
    [[nodiscard]] std::optional<table_detail::Bounds> bounds() const {
        std::optional<table_detail::Bounds> box;
        if (!data) return box;
        auto col = data->GetColumnByName(geometry_column);
        if (!col) throw std::out_of_range("geotable: no geometry column '" + geometry_column + "'");
        for (const auto& chunk : col->chunks()) {
            if (chunk->type_id() != arrow::Type::BINARY)
                throw std::invalid_argument("geotable: geometry column is not WKB binary");
            const auto& arr = static_cast<const arrow::BinaryArray&>(*chunk);
            for (std::int64_t i = 0; i < arr.length(); ++i) {
                if (arr.IsNull(i)) continue;
                std::int32_t len = 0;
                const auto* p = arr.GetValue(i, &len);
                auto b = wkb_bounds({p, static_cast<std::size_t>(len)});
                if (!b) continue;
                if (!box) box = b;
                else *box = {std::min((*box)[0], (*b)[0]), std::min((*box)[1], (*b)[1]),
                             std::max((*box)[2], (*b)[2]), std::max((*box)[3], (*b)[3])};
            }
        }
        return box;
    }

    [[nodiscard]] std::vector<std::byte> to_parquet() const {
        return table_detail::encode(*annotated());
    }

    /// Throws std::invalid_argument when the payload carries no `geo` metadata.
    [[nodiscard]] static GeoTable from_arrow(std::shared_ptr<arrow::Table> t) {
        auto geo = table_detail::metadata_value(*t, "geo");
        if (!geo) throw std::invalid_argument("geotable: parquet payload has no 'geo' metadata");
        auto meta = json_parse(*geo);
        GeoTable out;
        out.geometry_column = meta.get_string("primary_column").value_or("geometry");
        if (auto* cols = meta.find("columns")) {
            if (auto* col = cols->find(out.geometry_column)) {
                if (auto* c = col->find("crs"); c && c->is_string()) out.crs = c->as_string();
                else if (c && c->is_object()) {
                    // PROJJSON: keep the authority code when there is one
                    if (auto* id = c->find("id"); id && id->is_object())
                        out.crs = id->get_string("authority").value_or("EPSG") + ":"
                                + std::to_string(static_cast<long long>(id->get_number("code").value_or(4326)));
                }
            }
        }
        out.data = std::move(t);
        if (out.data->schema()->GetFieldIndex(out.geometry_column) < 0)
            throw std::invalid_argument("geotable: no geometry column '" + out.geometry_column + "'");
        out.index = table_detail::pandas_index(*out.data);
        return out;
    }

    [[nodiscard]] static GeoTable from_parquet(std::span<const std::byte> bytes) {
        return from_arrow(table_detail::decode(bytes));
    }

    void write(const std::filesystem::path& path) const {
        auto out = table_detail::unwrap(arrow::io::FileOutputStream::Open(path.string()), "open " + path.string());
        table_detail::write_parquet(*annotated(), out);
        table_detail::check(out->Close(), "close " + path.string());
    }

    [[nodiscard]] static GeoTable read(const std::filesystem::path& path) {
        auto in = table_detail::unwrap(arrow::io::ReadableFile::Open(path.string()), "open " + path.string());
        return from_arrow(table_detail::read_parquet(in));
    }

private:
    [[nodiscard]] std::shared_ptr<arrow::Table> annotated() const {
        if (!data) throw std::invalid_argument("geotable: empty table");
        JsonObject column{{"encoding", JsonValue{"WKB"}}, {"geometry_types", json_array({})},
                          {"crs", JsonValue{crs}}};
        if (auto b = bounds()) column.emplace("bbox", json_array({(*b)[0], (*b)[1], (*b)[2], (*b)[3]}));
        auto geo = json_object({{"version", "1.0.0"}, {"primary_column", geometry_column},
                                {"columns", json_object({{geometry_column, JsonValue{std::move(column)}}})}});
        auto t = table_detail::with_metadata(data, "geo", json_serialize(geo));
        return table_detail::with_metadata(t, "pandas", table_detail::pandas_metadata(index));
    }
};

} // namespace datamesh
