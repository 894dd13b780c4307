#include <datamesh/append.hpp>
#include <datamesh/test.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace datamesh;

namespace {

// hs(time, station) = hour + offset, two stations.
Dataset series(const std::vector<std::int64_t>& hours, double offset = 0.0)
{
    std::vector<double> hs;
    for (auto h : hours) {
        hs.push_back(static_cast<double>(h) + offset);
        hs.push_back(static_cast<double>(h) + offset + 0.5);
    }
    Dataset ds;
    ds.coords.emplace("time", Variable::coord("time", hours, {{"units", JsonValue{"hours since 2000-01-01"}}}));
    ds.coords.emplace("station", Variable::coord("station", std::vector<std::int32_t>{7, 8}));
    ds.data_vars.emplace("hs", Variable::from_values<double>({"time", "station"}, {hours.size(), 2}, hs));
    return ds;
}

struct Fixture {
    std::shared_ptr<MemoryStore> store = std::make_shared<MemoryStore>();
    std::optional<Datasource> existing;

    AppendWriter writer()
    {
        return AppendWriter(store, [this](const std::string&) { return existing; },
                            WriteOptions{.chunks = {{"time", 2}}});
    }

    void seed(const std::vector<std::int64_t>& hours)
    {
        existing = writer().write("wave", series(hours));
    }

    [[nodiscard]] std::vector<std::int64_t> times() const
    {
        return load_dataset(store)["time"].values<std::int64_t>();
    }

    [[nodiscard]] std::vector<double> hs() const { return load_dataset(store)["hs"].as_double(); }
};

} // namespace

TEST_CASE("append writer: first write creates the store") {
    Fixture f;
    auto ds = f.writer().write("wave", series({0, 1, 2}), "time");
    REQUIRE_EQ(ds.id, std::string("wave"));
    REQUIRE_EQ(ds.driver, std::string("onzarr"));
    REQUIRE(ds.schema.coords.contains("time"));
    REQUIRE_EQ(ds.schema.dims.at("time").as_int<std::size_t>(), std::size_t(3));
    REQUIRE(f.times() == std::vector<std::int64_t>({0, 1, 2}));
}

TEST_CASE("append writer: extends past the end") {
    Fixture f;
    f.seed({0, 1, 2});
    auto ds = f.writer().write("wave", series({3, 4}), "time");
    REQUIRE(f.times() == std::vector<std::int64_t>({0, 1, 2, 3, 4}));
    REQUIRE_EQ(ds.schema.dims.at("time").as_int<std::size_t>(), std::size_t(5));
    REQUIRE_EQ(f.hs()[8], 4.0);
}

TEST_CASE("append writer: overlapping tail is replaced") {
    Fixture f;
    f.seed({0, 1, 2});
    (void)f.writer().write("wave", series({2, 3}, 100.0), "time");
    REQUIRE(f.times() == std::vector<std::int64_t>({0, 1, 2, 3}));
    auto hs = f.hs();
    REQUIRE_EQ(hs[2], 1.0);
    REQUIRE_EQ(hs[4], 102.0);
    REQUIRE_EQ(hs[7], 103.5);
}

TEST_CASE("append writer: inner section is overwritten in place") {
    Fixture f;
    f.seed({0, 1, 2, 3, 4});
    (void)f.writer().write("wave", series({1, 2}, 50.0), "time");
    REQUIRE(f.times() == std::vector<std::int64_t>({0, 1, 2, 3, 4}));
    auto hs = f.hs();
    REQUIRE_EQ(hs[0], 0.0);
    REQUIRE_EQ(hs[2], 51.0);
    REQUIRE_EQ(hs[5], 52.5);
    REQUIRE_EQ(hs[6], 3.0);
}

TEST_CASE("append writer: inconsistent inner section is rejected") {
    Fixture f;
    f.seed({0, 2, 4, 6});
    REQUIRE_THROWS_AS(f.writer().write("wave", series({1, 2, 3}), "time"), WriteError);
    REQUIRE(f.times() == std::vector<std::int64_t>({0, 2, 4, 6}));
}

TEST_CASE("append writer: region larger than the batch is rejected") {
    Fixture f;
    f.seed({0, 1, 2, 3});
    auto before = f.hs();
    REQUIRE_THROWS_AS(f.writer().write("wave", series({0, 3}), "time"), WriteError);
    REQUIRE(f.times() == std::vector<std::int64_t>({0, 1, 2, 3}));
    REQUIRE(f.hs() == before);
}

TEST_CASE("append writer: a variable missing from the store leaves it untouched") {
    Fixture f;
    f.seed({0, 1, 2});
    auto before = f.hs();

    auto batch = series({2, 3}, 100.0);
    batch.data_vars.emplace("tp", Variable::from_values<double>({"time"}, {2}, {9.0, 10.0}));
    REQUIRE_THROWS_AS(f.writer().write("wave", batch, "time"), WriteError);

    REQUIRE(f.times() == std::vector<std::int64_t>({0, 1, 2}));
    REQUIRE(f.hs() == before);
    REQUIRE(!load_dataset(f.store).contains("tp"));
}

TEST_CASE("append writer: unsorted coordinates are rejected") {
    Fixture f;
    f.seed({0, 1});
    REQUIRE_THROWS_AS(f.writer().write("wave", series({5, 3}), "time"), WriteError);
}

TEST_CASE("append writer: unknown append coordinate") {
    Fixture f;
    f.seed({0, 1});
    try {
        (void)f.writer().write("wave", series({2}), "depth");
        REQUIRE(false);
    } catch (const WriteError& e) {
        REQUIRE_EQ(std::string(e.what()), std::string("Append coordinate depth not in existing zarr"));
    }
}

TEST_CASE("append writer: overwrite replaces the store") {
    Fixture f;
    f.seed({0, 1, 2});
    f.store->set_string("stale/.zarray", "{}");
    (void)f.writer().write("wave", series({10}), "time", true);
    REQUIRE(!f.store->exists("stale/.zarray"));
    REQUIRE(f.times() == std::vector<std::int64_t>({10}));
}

TEST_CASE("append writer: without an append coordinate the data is replaced") {
    Fixture f;
    f.seed({0, 1, 2});
    auto ds = f.writer().write("wave", series({5, 6}));
    REQUIRE(f.times() == std::vector<std::int64_t>({5, 6}));
    REQUIRE_EQ(ds.id, std::string("wave"));
}

TEST_CASE("append writer: arguments are validated") {
    REQUIRE_THROWS_AS(AppendWriter(nullptr, [](const std::string&) { return std::optional<Datasource>{}; }),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(AppendWriter(std::make_shared<MemoryStore>(), DatasourceLookup{}), std::invalid_argument);
}

DATAMESH_TEST_MAIN()
