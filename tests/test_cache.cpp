#include <datamesh/cache.hpp>
#include <datamesh/test.hpp>
#include "fake_service.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>

using namespace datamesh;
using namespace datamesh::testing;
using namespace std::chrono_literals;

namespace {

Query query(std::string id)
{
    Query q;
    q.datasource = std::move(id);
    return q;
}

CacheConfig config(const test::TempDir& dir, std::chrono::seconds ttl = 600s)
{
    return CacheConfig{dir.path(), ttl, 60s, Millis{5}};
}

Dataset small_dataset()
{
    Dataset ds;
    ds.attrs = {{"source", JsonValue{"model"}}};
    ds.coords.emplace("time", Variable::coord("time", std::vector<std::int64_t>{0, 3600},
                                              {{"units", JsonValue{"seconds since 2000-01-01"}}}));
    ds.data_vars.emplace("hs", Variable::from_values<double>({"time"}, {2}, {1.5, 1.75}));
    return ds;
}

} // namespace

TEST_CASE("cache: paths are keyed on the query hash") {
    test::TempDir dir("cache_paths");
    LocalResultCache cache(config(dir));
    auto q = query("wave");
    REQUIRE(cache.cache_path(q) == dir.path() / q.hash());
    REQUIRE_EQ(LocalResultCache::extension(Container::dataset), std::string_view(".zarr.zip"));

    auto tmp = cache.temp_path(q, ".pq");
    REQUIRE(tmp.parent_path() == dir.path());
    REQUIRE(tmp.filename().string().starts_with(q.hash() + ".pq.tmp"));
    REQUIRE(cache.temp_path(q, ".pq") != tmp);
    REQUIRE_EQ(LocalResultCache::extension(Container::geotable), std::string_view(".gpq"));
    REQUIRE_EQ(LocalResultCache::extension(Container::table), std::string_view(".pq"));
}

TEST_CASE("cache: miss on an empty cache") {
    test::TempDir dir("cache_miss");
    LocalResultCache cache(config(dir));
    REQUIRE(!cache.get(query("nothing")).has_value());
}

TEST_CASE("cache: dataset round trip") {
    test::TempDir dir("cache_dataset");
    LocalResultCache cache(config(dir));
    auto q = query("wave");
    cache.put(q, small_dataset());
    REQUIRE(std::filesystem::is_regular_file(dir / (q.hash() + ".zarr.zip")));
    REQUIRE(unzip_store(dir / (q.hash() + ".zarr.zip"))->exists(".zmetadata"));

    auto hit = cache.get(q);
    REQUIRE(hit.has_value());
    REQUIRE(std::holds_alternative<Dataset>(*hit));
    REQUIRE(std::get<Dataset>(*hit).equals(small_dataset()));

    // a second put replaces the archive
    REQUIRE_NOTHROW(cache.put(q, small_dataset()));
    REQUIRE(std::get<Dataset>(*cache.get(q)).equals(small_dataset()));
}

TEST_CASE("cache: table and geotable round trip") {
    test::TempDir dir("cache_tables");
    LocalResultCache cache(config(dir));

    auto obs = observation_table(0, 6);
    cache.put(query("obs"), obs);
    auto t = cache.get(query("obs"));
    REQUIRE(std::holds_alternative<Table>(*t));
    REQUIRE(std::get<Table>(*t).equals(obs));

    auto stations = station_table({{170.0, -40.0}, {171.0, -41.0}});
    cache.put(query("stations"), stations);
    auto g = cache.get(query("stations"));
    REQUIRE(std::holds_alternative<GeoTable>(*g));
    REQUIRE(std::get<GeoTable>(*g).equals(stations));
}

TEST_CASE("cache: empty results are rejected") {
    test::TempDir dir("cache_empty");
    LocalResultCache cache(config(dir));
    REQUIRE_THROWS_AS(cache.put(query("x"), std::monostate{}), std::invalid_argument);
}

TEST_CASE("cache: stale entries are evicted") {
    test::TempDir dir("cache_stale");
    LocalResultCache cache(config(dir, 0s));
    auto q = query("obs");
    cache.put(q, observation_table(0, 2));
    REQUIRE(!cache.get(q).has_value());
    REQUIRE(!std::filesystem::exists(dir / (q.hash() + ".pq")));
}

TEST_CASE("cache: corrupt entries read as a miss") {
    test::TempDir dir("cache_corrupt");
    LogCapture logs(LogLevel::warn);
    LocalResultCache cache(config(dir));
    auto q = query("obs");
    std::ofstream(dir / (q.hash() + ".pq")) << "garbage";
    REQUIRE(!cache.get(q).has_value());
    REQUIRE(logs.contains("unreadable entry"));

    auto arrays = query("wave");
    std::ofstream(dir / (arrays.hash() + ".zarr.zip")) << "not an archive";
    REQUIRE(!cache.get(arrays).has_value());
}

TEST_CASE("cache: lock file protocol") {
    test::TempDir dir("cache_lock");
    LocalResultCache cache(config(dir));
    auto q = query("obs");

    REQUIRE(!cache.locked(q));
    REQUIRE(cache.lock(q));
    REQUIRE(cache.locked(q));
    REQUIRE(std::filesystem::exists(dir / (q.hash() + ".lock")));
    REQUIRE(!cache.lock(q));

    SECTION("readers give up while the lock is held") {
        cache.put(q, observation_table(0, 1));
        REQUIRE(!cache.get(q, Millis{20}).has_value());
    }
    SECTION("unlock releases") {
        cache.unlock(q);
        REQUIRE(!cache.locked(q));
        REQUIRE(cache.get(q, Millis{20}).has_value());
    }
}

TEST_CASE("cache: expired locks are replaced") {
    test::TempDir dir("cache_expired_lock");
    LocalResultCache cache(CacheConfig{dir.path(), 600s, 0s, Millis{5}});
    auto q = query("obs");
    REQUIRE(cache.lock(q));
    REQUIRE(!cache.locked(q));
    REQUIRE(cache.lock(q));
}

TEST_CASE("cache: copy moves an external file into place") {
    test::TempDir dir("cache_copy");
    LocalResultCache cache(config(dir));
    auto q = query("obs");
    auto tmp = dir / "download.part";
    observation_table(0, 3).write(tmp);

    cache.copy(q, tmp, ".pq");
    REQUIRE(!std::filesystem::exists(tmp));
    REQUIRE(std::get<Table>(*cache.get(q)).equals(observation_table(0, 3)));
    REQUIRE_THROWS_AS(cache.copy(q, dir / "absent", ".pq"), CacheError);
}

TEST_CASE("cache: configured from the client config") {
    Config cfg;
    cfg.cache_dir = "/tmp/datamesh-cache";
    cfg.lock_timeout = 5s;
    auto c = CacheConfig::from_config(cfg, 120s);
    REQUIRE(c.dir == std::filesystem::path("/tmp/datamesh-cache"));
    REQUIRE(c.ttl == 120s);
    REQUIRE(c.lock_timeout == 5s);
}

DATAMESH_TEST_MAIN()
