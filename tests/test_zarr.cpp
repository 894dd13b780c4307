#include <datamesh/test.hpp>
#include <datamesh/zarr.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <memory>
#include <numeric>
#include <vector>

using namespace datamesh;

namespace {

template <typename T>
std::vector<std::byte> bytes_of(const std::vector<T>& v)
{
    std::vector<std::byte> out(v.size() * sizeof(T));
    std::memcpy(out.data(), v.data(), out.size());
    return out;
}

template <typename T>
std::vector<T> values_of(const std::vector<std::byte>& b)
{
    std::vector<T> out(b.size() / sizeof(T));
    std::memcpy(out.data(), b.data(), b.size());
    return out;
}

ZarrMetadata grid(std::vector<std::size_t> shape, std::vector<std::size_t> chunks,
                  ZarrDtype dtype = ZarrDtype::float64)
{
    ZarrMetadata m;
    m.shape = std::move(shape);
    m.chunks = std::move(chunks);
    m.dtype = dtype;
    return m;
}

} // namespace

// ===========================================================================
// dtype and metadata
// ===========================================================================

TEST_CASE("dtype: parse and size") {
    REQUIRE(parse_dtype("<u2") == ZarrDtype::uint16);
    REQUIRE(parse_dtype("|b1") == ZarrDtype::bool_);
    REQUIRE(parse_dtype("i8") == ZarrDtype::int64);
    REQUIRE(!parse_dtype(">f4").has_value());
    REQUIRE(!parse_dtype("xyz").has_value());
    REQUIRE_EQ(dtype_size(ZarrDtype::float32), std::size_t(4));
    REQUIRE_EQ(dtype_name(ZarrDtype::float64), std::string_view("float64"));
    static_assert(dtype_of<std::int16_t>() == ZarrDtype::int16);
}

TEST_CASE("metadata: chunk grid") {
    auto m = grid({100, 35}, {10, 20}, ZarrDtype::uint16);
    REQUIRE_EQ(m.num_chunks_along(0), std::size_t(10));
    REQUIRE_EQ(m.num_chunks_along(1), std::size_t(2));
    REQUIRE_EQ(m.chunk_byte_size(), std::size_t(10 * 20 * 2));
    REQUIRE_EQ(m.size(), std::size_t(3500));
}

TEST_CASE("metadata: .zarray round trip") {
    auto m = grid({8, 4}, {4, 4});
    m.fill_value = std::numeric_limits<double>::quiet_NaN();
    m.compressor = CompressParams{.codec = Codec::zlib, .level = 5};

    auto j = zarray_to_json(m);
    REQUIRE_EQ(j["dtype"].as_string(), std::string("<f8"));
    REQUIRE_EQ(j["fill_value"].as_string(), std::string("NaN"));
    REQUIRE_EQ(j["compressor"]["id"].as_string(), std::string("zlib"));
    REQUIRE(j["filters"].is_null());

    auto back = zarray_from_json(j);
    REQUIRE(back.shape == m.shape);
    REQUIRE(back.chunks == m.chunks);
    REQUIRE(back.compressor.codec == Codec::zlib);
    REQUIRE(std::isnan(back.fill_value.value()));
}

TEST_CASE("metadata: unsupported layouts are rejected") {
    REQUIRE_THROWS_AS(zarray_from_json(json_parse(R"({"zarr_format": 3})")), std::runtime_error);
    REQUIRE_THROWS_AS(zarray_from_json(json_parse(
                          R"({"shape": [2], "chunks": [2], "dtype": "<f8", "order": "F"})")),
                      std::runtime_error);
    REQUIRE_THROWS_AS(zarray_from_json(json_parse(
                          R"({"shape": [2], "chunks": [2], "dtype": "<f8", "filters": [{"id": "delta"}]})")),
                      std::runtime_error);
    REQUIRE_THROWS_AS(zarray_from_json(json_parse(R"({"shape": [2], "chunks": [2], "dtype": "<c16"})")),
                      std::runtime_error);
}

// ===========================================================================
// Stores
// ===========================================================================

TEST_CASE("memory store: basic operations") {
    MemoryStore s;
    s.set_string("a/.zarray", "{}");
    s.set_json("a/.zattrs", json_object({{"units", "m"}}));
    s.set_string("b/0", "x");

    REQUIRE(s.exists("a/.zarray"));
    REQUIRE_EQ(s.get_string("a/.zarray"), std::string("{}"));
    REQUIRE_EQ(s.get_json("a/.zattrs")->get_string("units").value(), std::string("m"));
    REQUIRE_THROWS_AS(s.get("missing"), KeyNotFound);
    REQUIRE(!s.get_if_exists("missing").has_value());
    REQUIRE(!s.get_json("missing").has_value());

    SECTION("prefix erase") {
        s.erase("a");
        REQUIRE_EQ(s.size(), std::size_t(1));
        REQUIRE(s.exists("b/0"));
    }
    SECTION("empty key clears") {
        s.erase("");
        REQUIRE_EQ(s.size(), std::size_t(0));
    }
}

TEST_CASE("filesystem store: basic operations") {
    test::TempDir dir("zarr_fs_store");
    FileSystemStore s(dir.path());
    s.set_string("hs/.zarray", "{}");
    s.set_string("hs/0.0", "abc");
    s.set_string(".zgroup", R"({"zarr_format": 2})");

    REQUIRE(std::filesystem::is_regular_file(dir / "hs/0.0"));
    REQUIRE_EQ(s.get_string("hs/0.0"), std::string("abc"));
    REQUIRE_THROWS_AS(s.get("hs/1.0"), KeyNotFound);

    auto keys = s.list();
    std::ranges::sort(keys);
    REQUIRE_EQ(keys.size(), std::size_t(3));
    REQUIRE_EQ(keys[0], std::string(".zgroup"));
    REQUIRE_EQ(keys[2], std::string("hs/0.0"));

    s.erase("hs");
    REQUIRE(!s.exists("hs/0.0"));
    REQUIRE(s.exists(".zgroup"));

    s.clear();
    REQUIRE(s.list().empty());
    REQUIRE(std::filesystem::exists(dir.path()));
}

// ===========================================================================
// ZarrArray
// ===========================================================================

TEST_CASE("array: create writes .zarray") {
    auto store = std::make_shared<MemoryStore>();
    auto arr = ZarrArray::create(store, "hs", grid({6, 4}, {4, 0}));
    REQUIRE(store->exists("hs/.zarray"));
    REQUIRE_EQ(arr.metadata().chunks[1], std::size_t(1));

    auto reopened = ZarrArray::open(store, "hs");
    REQUIRE(reopened.shape() == arr.shape());
    REQUIRE_THROWS_AS(ZarrArray::open(store, "tp"), std::runtime_error);
    REQUIRE_THROWS_AS(ZarrArray::create(store, "bad", grid({2, 2}, {2})), std::invalid_argument);
}

TEST_CASE("array: whole array round trip across chunk edges") {
    auto store = std::make_shared<MemoryStore>();
    auto meta = grid({5, 7}, {2, 3});
    meta.compressor = CompressParams{.codec = Codec::zlib, .level = 5};
    auto arr = ZarrArray::create(store, "temp", meta);

    std::vector<double> v(35);
    std::iota(v.begin(), v.end(), 0.0);
    arr.write_all(bytes_of(v));

    REQUIRE(store->exists("temp/2.2"));
    REQUIRE(values_of<double>(arr.read_all()) == v);
}

TEST_CASE("array: missing chunks read as fill value") {
    auto store = std::make_shared<MemoryStore>();
    auto meta = grid({4}, {2});
    meta.fill_value = -999.0;
    auto arr = ZarrArray::create(store, "", meta);
    auto out = values_of<double>(arr.read_all());
    REQUIRE_EQ(out.size(), std::size_t(4));
    for (auto x : out) REQUIRE_EQ(x, -999.0);
    REQUIRE(store->exists(".zarray"));
}

TEST_CASE("array: region write patches partial chunks") {
    auto store = std::make_shared<MemoryStore>();
    auto meta = grid({4, 4}, {3, 3}, ZarrDtype::int32);
    meta.fill_value = 0.0;
    auto arr = ZarrArray::create(store, "m", meta);

    std::vector<std::int32_t> patch{1, 2, 3, 4};
    std::vector<std::size_t> off{2, 2}, cnt{2, 2};
    arr.write_region(off, cnt, bytes_of(patch));

    auto all = values_of<std::int32_t>(arr.read_all());
    REQUIRE_EQ(all[2 * 4 + 2], 1);
    REQUIRE_EQ(all[2 * 4 + 3], 2);
    REQUIRE_EQ(all[3 * 4 + 2], 3);
    REQUIRE_EQ(all[3 * 4 + 3], 4);
    REQUIRE_EQ(std::accumulate(all.begin(), all.end(), 0), 10);

    auto back = values_of<std::int32_t>(arr.read_region(off, cnt));
    REQUIRE(back == patch);
}

TEST_CASE("array: region validation") {
    auto store = std::make_shared<MemoryStore>();
    auto arr = ZarrArray::create(store, "v", grid({4}, {2}));
    std::vector<std::size_t> off{3}, cnt{2};
    REQUIRE_THROWS_AS(arr.read_region(off, cnt), std::out_of_range);
    std::vector<std::size_t> off2{0}, cnt2{2};
    std::vector<std::byte> short_buf(8);
    REQUIRE_THROWS_AS(arr.write_region(off2, cnt2, short_buf), std::invalid_argument);
}

TEST_CASE("array: resize grows and shrinks") {
    auto store = std::make_shared<MemoryStore>();
    auto arr = ZarrArray::create(store, "t", grid({4}, {2}));
    arr.write_all(bytes_of(std::vector<double>{1, 2, 3, 4}));

    arr.resize({6});
    REQUIRE_EQ(ZarrArray::open(store, "t").shape()[0], std::size_t(6));
    std::vector<std::size_t> off{4}, cnt{2};
    arr.write_region(off, cnt, bytes_of(std::vector<double>{5, 6}));
    REQUIRE(values_of<double>(arr.read_all()) == std::vector<double>({1, 2, 3, 4, 5, 6}));

    arr.resize({2});
    REQUIRE(store->exists("t/0"));
    REQUIRE(!store->exists("t/1"));
    REQUIRE(!store->exists("t/2"));
    REQUIRE_THROWS_AS(arr.resize({2, 2}), std::invalid_argument);
}

TEST_CASE("array: attributes") {
    auto store = std::make_shared<MemoryStore>();
    auto arr = ZarrArray::create(store, "hs", grid({1}, {1}));
    REQUIRE(arr.attrs().empty());
    arr.set_attrs(json_object({{"units", "m"}}));
    REQUIRE_EQ(arr.attrs()["units"].as_string(), std::string("m"));
}

TEST_CASE("array: corrupt chunk size is an error") {
    auto store = std::make_shared<MemoryStore>();
    auto arr = ZarrArray::create(store, "x", grid({4}, {4}));
    store->set_string("x/0", "short");
    REQUIRE_THROWS_AS((void)arr.read_all(), std::runtime_error);
}

// ===========================================================================
// Consolidated metadata
// ===========================================================================

TEST_CASE("consolidated: gathers group and array metadata") {
    auto store = std::make_shared<MemoryStore>();
    store->set_json(".zgroup", json_object({{"zarr_format", 2}}));
    store->set_json(".zattrs", json_object({{"title", "wave hindcast"}}));
    auto hs = ZarrArray::create(store, "hs", grid({3}, {3}));
    hs.set_attrs(json_object({{"units", "m"}}));
    (void)ZarrArray::create(store, "time", grid({3}, {3}, ZarrDtype::int64));

    auto cm = consolidate_metadata(*store, {"hs", "time"});
    REQUIRE(store->exists(".zmetadata"));
    REQUIRE(cm.find("hs/.zattrs") != nullptr);
    REQUIRE(cm.find("time/.zattrs") == nullptr);

    auto back = ConsolidatedMetadata::from_json(*store->get_json(".zmetadata"));
    auto names = back.arrays();
    std::ranges::sort(names);
    REQUIRE_EQ(names.size(), std::size_t(2));
    REQUIRE_EQ(names[0], std::string("hs"));
    REQUIRE_EQ(back.find(".zattrs")->get_string("title").value(), std::string("wave hindcast"));
    REQUIRE_THROWS_AS(ConsolidatedMetadata::from_json(json_object({})), std::runtime_error);
}

DATAMESH_TEST_MAIN()
