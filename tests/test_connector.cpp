#include <datamesh/connector.hpp>
#include <datamesh/test.hpp>
#include "fake_service.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace datamesh;
using namespace datamesh::testing;
using namespace std::chrono_literals;

namespace {

Config config()
{
    Config c;
    c.token = "abc";
    c.service = "https://datamesh.test";
    c.async_workers = 2;
    return c;
}

void no_sleep(Millis) {}

Query query(std::string id)
{
    Query q;
    q.datasource = std::move(id);
    return q;
}

Dataset wave_dataset(const std::vector<std::int64_t>& hours)
{
    std::vector<double> hs;
    for (auto h : hours) hs.push_back(1.0 + 0.25 * static_cast<double>(h));
    Dataset ds;
    ds.attrs = {{"title", JsonValue{"wave hindcast"}}};
    ds.coords.emplace("time", Variable::coord("time", hours, {{"units", JsonValue{"hours since 2020-01-01"}}}));
    ds.data_vars.emplace("hs", Variable::from_values<double>({"time"}, {hours.size()}, hs));
    return ds;
}

std::size_t count_method(const std::vector<HttpRequest>& reqs, HttpMethod m)
{
    std::size_t n = 0;
    for (const auto& r : reqs) n += r.method == m;
    return n;
}

} // namespace

TEST_CASE("connector: a service with an info endpoint is session aware") {
    auto service = std::make_shared<FakeService>();
    Connector c(config(), service, no_sleep);
    REQUIRE(c.session_aware());
    REQUIRE_EQ(c.gateway(), std::string("https://datamesh.test"));
    REQUIRE_EQ(c.host(), std::string("datamesh.test"));
    REQUIRE_EQ(service->counters().info, std::size_t(1));

    auto info = service->requests_to("info/");
    REQUIRE_EQ(info.size(), std::size_t(1));
    REQUIRE_EQ(info[0].url, std::string("https://datamesh.test/info/oceanum_python/1.0.0"));
}

TEST_CASE("connector: a failed info request selects the legacy gateway") {
    auto service = std::make_shared<FakeService>();
    service->legacy = true;
    Connector c(config(), service, no_sleep);
    REQUIRE(!c.session_aware());
    REQUIRE_EQ(c.gateway(), std::string("https://gateway.datamesh.test"));
}

TEST_CASE("connector: mismatched gateway domain is reported") {
    LogCapture log(LogLevel::warn);
    auto cfg = config();
    cfg.gateway = "https://gateway.example.org";
    Connector c(cfg, std::make_shared<FakeService>(), no_sleep);
    REQUIRE_EQ(c.gateway(), std::string("https://gateway.example.org"));
    REQUIRE(log.contains("Gateway and service domain do not match"));
}

TEST_CASE("connector: constructor arguments are validated") {
    auto service = std::make_shared<FakeService>();
    auto cfg = config();
    cfg.token.clear();
    REQUIRE_THROWS_AS(Connector(cfg, service, no_sleep), std::invalid_argument);

    cfg = config();
    cfg.session_duration = -5s;
    REQUIRE_THROWS_AS(Connector(cfg, service, no_sleep), std::invalid_argument);

    cfg = config();
    cfg.service = "datamesh.test";
    REQUIRE_THROWS_AS(Connector(cfg, service, no_sleep), std::invalid_argument);
}

TEST_CASE("connector: auth headers") {
    auto service = std::make_shared<FakeService>();
    SECTION("token") {
        auto cfg = config();
        cfg.user = "alice";
        Connector c(cfg, service, no_sleep);
        const auto& h = c.auth_headers();
        REQUIRE_EQ(h.at("Authorization"), std::string("Token abc"));
        REQUIRE_EQ(h.at("X-DATAMESH-TOKEN"), std::string("abc"));
        REQUIRE_EQ(h.at("X-DATAMESH-USER"), std::string("alice"));
        auto info = service->requests_to("info/");
        REQUIRE(info.back().header("X-DATAMESH-TOKEN"));
    }
    SECTION("bearer") {
        auto cfg = config();
        cfg.token = "Bearer jwt.payload";
        Connector c(cfg, service, no_sleep);
        const auto& h = c.auth_headers();
        REQUIRE_EQ(h.at("Authorization"), std::string("Bearer jwt.payload"));
        REQUIRE(!h.contains("X-DATAMESH-TOKEN"));
        REQUIRE(!h.contains("X-DATAMESH-USER"));
    }
}

TEST_CASE("connector: catalog search") {
    auto service = std::make_shared<FakeService>();
    service->add_datasource("wave", json_object({{"driver", "onzarr"}}));
    service->add_datasource("wind", json_object({{"driver", "onzarr"}}));
    Connector c(config(), service, no_sleep);

    CatalogFilter filter;
    filter.search = "wave";
    filter.limit = 5;
    filter.geofilter = GeoFilter::bbox(170.0, -45.0, 175.0, -40.0);
    filter.timefilter = TimeFilter::range(parse_timestamp("2020-01-01T00:00:00Z"), TimeBound{});
    auto cat = c.get_catalog(filter);
    REQUIRE_EQ(cat.size(), std::size_t(2));
    REQUIRE(cat.contains("wave"));
    REQUIRE(cat.contains("wind"));

    auto req = service->requests_to("datasource/").back();
    REQUIRE_EQ(req.url, std::string("https://datamesh.test/datasource/"));
    REQUIRE_EQ(*req.param("search"), std::string("wave"));
    REQUIRE_EQ(*req.param("limit"), std::string("5"));
    REQUIRE(req.param("geom_intersects")->starts_with("POLYGON"));
    REQUIRE_EQ(*req.param("in_trange"), std::string("2020-01-01T00:00:00Z,2500-01-01T00:00:00Z"));
}

TEST_CASE("connector: datasource lookup") {
    auto service = std::make_shared<FakeService>();
    service->add_datasource("wave", json_object({{"driver", "onzarr"}, {"name", "Wave hindcast"}}));
    Connector c(config(), service, no_sleep);

    auto info = c.get_datasource("wave");
    REQUIRE_EQ(info.datasource.id, std::string("wave"));
    REQUIRE_EQ(info.datasource.name, std::string("Wave hindcast"));
    REQUIRE_EQ(info.datasource.driver, std::string("onzarr"));

    try {
        (void)c.get_datasource("missing");
        REQUIRE(false);
    } catch (const ConnectError& e) {
        REQUIRE_EQ(std::string(e.what()), std::string("Datasource missing not found"));
    }
}

TEST_CASE("connector: invalid datasource ids are rejected before any request") {
    auto service = std::make_shared<FakeService>();
    Connector c(config(), service, no_sleep);
    auto before = service->requests().size();
    REQUIRE_THROWS_AS(c.write_datasource("Bad Id", WriteRequest{.data = wave_dataset({0})}), WriteError);
    REQUIRE_THROWS_AS(c.write_datasource("wave/1", WriteRequest{}), WriteError);
    REQUIRE_EQ(service->requests().size(), before);
}

TEST_CASE("connector: dataset write, load and query") {
    LogCapture log(LogLevel::warn);
    auto service = std::make_shared<FakeService>();
    Connector c(config(), service, no_sleep);

    auto ds = c.write_datasource("wave_hindcast", WriteRequest{.data = wave_dataset({0, 1, 2, 3})});
    REQUIRE_EQ(ds.id, std::string("wave_hindcast"));
    REQUIRE_EQ(ds.name, std::string("Wave hindcast"));
    REQUIRE_EQ(ds.driver, std::string("onzarr"));
    REQUIRE(ds.tstart.has_value());
    REQUIRE(log.contains("Geometry not set for datasource"));

    auto counters = service->counters();
    REQUIRE_GT(counters.chunk_writes, std::size_t(0));
    REQUIRE_EQ(counters.sessions_finalised, std::size_t(1));
    REQUIRE(service->has_datasource("wave_hindcast"));
    REQUIRE_EQ(service->metadata("wave_hindcast")["driver"].as_string(), std::string("onzarr"));

    SECTION("load is lazy for arrays") {
        auto r = c.load_datasource("wave_hindcast");
        REQUIRE(std::holds_alternative<LazyDataset>(r));
        const auto& lazy = std::get<LazyDataset>(r);
        REQUIRE(lazy.contains("hs"));
        REQUIRE(lazy.load("hs").as_double() == std::vector<double>({1.0, 1.25, 1.5, 1.75}));
    }

    SECTION("eager query loads the whole result") {
        auto before = service->counters().downloads;
        auto r = c.query(query("wave_hindcast"));
        REQUIRE(std::holds_alternative<Dataset>(r));
        const auto& out = std::get<Dataset>(r);
        REQUIRE(out["time"].values<std::int64_t>() == std::vector<std::int64_t>({0, 1, 2, 3}));
        REQUIRE(out["hs"].as_double() == std::vector<double>({1.0, 1.25, 1.5, 1.75}));
        REQUIRE(out.attrs.at("title").as_string() == "wave hindcast");

        // one direct download, no chunk traffic
        REQUIRE(service->requests_to("zarr/query/").empty());
        REQUIRE_EQ(service->counters().downloads, before + 1);
        auto posts = service->requests_to("oceanql/");
        std::erase_if(posts, [](const HttpRequest& req) { return !req.url.ends_with("/oceanql/"); });
        REQUIRE_EQ(posts.size(), std::size_t(1));
        const auto* accept = posts.back().header("Accept");
        REQUIRE(accept != nullptr);
        REQUIRE_EQ(*accept, std::string("application/zarr+zip"));
    }

    SECTION("lazy query stays remote") {
        auto r = c.query(query("wave_hindcast"), QueryOptions{.lazy = true});
        REQUIRE(std::holds_alternative<LazyDataset>(r));
    }

    SECTION("append extends the time axis") {
        (void)c.write_datasource("wave_hindcast",
                                 WriteRequest{.data = wave_dataset({4, 5}), .append = std::string("time")});
        auto r = c.query(query("wave_hindcast"));
        REQUIRE(std::get<Dataset>(r)["time"].values<std::int64_t>()
                == std::vector<std::int64_t>({0, 1, 2, 3, 4, 5}));
    }

    // every session that was opened was handed back
    auto end = service->counters();
    REQUIRE_EQ(end.sessions_closed, end.sessions_opened);
}

TEST_CASE("connector: lazy results outlive the connector") {
    auto service = std::make_shared<FakeService>();
    std::optional<QueryResult> kept;
    {
        Connector c(config(), service, no_sleep);
        (void)c.write_datasource("wave", WriteRequest{.data = wave_dataset({0, 1, 2})});
        kept.emplace(c.query(query("wave"), QueryOptions{.lazy = true}));
    }
    REQUIRE(std::holds_alternative<LazyDataset>(*kept));
    REQUIRE(std::get<LazyDataset>(*kept).load("hs").as_double() == std::vector<double>({1.0, 1.25, 1.5}));
    auto opened = service->counters().sessions_opened;
    REQUIRE_EQ(service->counters().sessions_closed, opened - 1);

    kept.reset();
    REQUIRE_EQ(service->counters().sessions_closed, opened);
}

TEST_CASE("connector: array downloads share the table error handling") {
    auto service = std::make_shared<FakeService>();
    std::vector<Millis> sleeps;
    Connector c(config(), service, [&sleeps](Millis d) { sleeps.push_back(d); });
    (void)c.write_datasource("wave", WriteRequest{.data = wave_dataset({0, 1})});

    SECTION("server errors are retried") {
        service->fail_downloads = 1;
        auto r = c.query(query("wave"));
        REQUIRE(std::get<Dataset>(r)["hs"].as_double() == std::vector<double>({1.0, 1.25}));
        REQUIRE_EQ(service->counters().downloads, std::size_t(2));
        REQUIRE(sleeps == std::vector<Millis>({Millis{0}}));
    }
    SECTION("service detail becomes a query error") {
        service->download_error = "variable tp not in datasource";
        try {
            (void)c.query(query("wave"));
            REQUIRE(false);
        } catch (const QueryError& e) {
            REQUIRE_EQ(std::string(e.what()), std::string("variable tp not in datasource"));
        }
        service->download_error.reset();
    }
    SECTION("an unreadable archive is a connect error") {
        service->download_body = to_bytes("not an archive at all");
        REQUIRE_THROWS_AS(c.query(query("wave")), ConnectError);
        service->download_body.reset();
    }
    REQUIRE(service->requests_to("zarr/query/").empty());
}

TEST_CASE("connector: large array results fall back to lazy access") {
    LogCapture log(LogLevel::warn);
    auto service = std::make_shared<FakeService>();
    Connector c(config(), service, no_sleep);
    (void)c.write_datasource("wave", WriteRequest{.data = wave_dataset({0, 1})});

    service->stage_size = 2'000'000'000;
    auto r = c.query(query("wave"));
    REQUIRE(std::holds_alternative<LazyDataset>(r));
    REQUIRE(log.contains("Query is too large for direct access, using lazy access"));
}

TEST_CASE("connector: legacy service writes and reads arrays") {
    auto service = std::make_shared<FakeService>();
    service->legacy = true;
    Connector c(config(), service, no_sleep);
    (void)c.write_datasource("wave", WriteRequest{.data = wave_dataset({0, 1, 2})});
    REQUIRE_EQ(service->counters().sessions_opened, std::size_t(0));

    auto r = c.query(query("wave"));
    REQUIRE(std::holds_alternative<Dataset>(r));
    REQUIRE(std::get<Dataset>(r)["hs"].as_double() == std::vector<double>({1.0, 1.25, 1.5}));
    REQUIRE(service->requests_to("zarr/query/").empty());
}

TEST_CASE("connector: table write, append and load") {
    auto service = std::make_shared<FakeService>();
    Connector c(config(), service, no_sleep);

    auto ds = c.write_datasource("buoy_obs", WriteRequest{.data = observation_table(0, 3)});
    REQUIRE_EQ(ds.id, std::string("buoy_obs"));
    REQUIRE_EQ(ds.driver, std::string("onsql"));
    auto puts = service->requests_to("data/buoy_obs");
    REQUIRE_EQ(count_method(puts, HttpMethod::put), std::size_t(1));

    (void)c.write_datasource("buoy_obs",
                             WriteRequest{.data = observation_table(3, 2), .append = std::string("time")});
    auto patches = service->requests_to("data/buoy_obs");
    REQUIRE_EQ(count_method(patches, HttpMethod::patch), std::size_t(1));
    REQUIRE_EQ(*patches.back().header("X-Append"), std::string("time"));

    auto r = c.load_datasource("buoy_obs");
    REQUIRE(std::holds_alternative<Table>(r));
    const auto& table = std::get<Table>(r);
    REQUIRE_EQ(table.num_rows(), std::int64_t(5));
    auto hs = column_as_double(*table.data, "hs");
    REQUIRE_NEAR(hs[4], 1.4, 1e-9);
}

TEST_CASE("connector: overwrite replaces a table") {
    auto service = std::make_shared<FakeService>();
    Connector c(config(), service, no_sleep);
    (void)c.write_datasource("buoy_obs", WriteRequest{.data = observation_table(0, 4)});
    (void)c.write_datasource("buoy_obs", WriteRequest{.data = observation_table(10, 2), .overwrite = true});

    auto deletes = service->requests_to("data/buoy_obs");
    REQUIRE_EQ(count_method(deletes, HttpMethod::del), std::size_t(1));
    auto r = c.query(query("buoy_obs"));
    REQUIRE_EQ(std::get<Table>(r).num_rows(), std::int64_t(2));
}

TEST_CASE("connector: geotables carry their geometry") {
    auto service = std::make_shared<FakeService>();
    Connector c(config(), service, no_sleep);

    auto ds = c.write_datasource("stations",
                                 WriteRequest{.data = station_table({{174.0, -41.0}, {175.0, -40.0}})});
    REQUIRE_EQ(ds.driver, std::string("postgis"));
    REQUIRE(ds.geom.has_value());
    auto b = ds.bounds();
    REQUIRE(b.has_value());
    REQUIRE_NEAR((*b)[0], 174.0, 1e-9);
    REQUIRE_NEAR((*b)[3], -40.0, 1e-9);

    auto r = c.query(query("stations"));
    REQUIRE(std::holds_alternative<GeoTable>(r));
    REQUIRE_EQ(std::get<GeoTable>(r).num_rows(), std::int64_t(2));
}

TEST_CASE("connector: a non-WGS84 crs is recorded") {
    auto service = std::make_shared<FakeService>();
    Connector c(config(), service, no_sleep);
    auto ds = c.write_datasource("nztm", WriteRequest{.data = observation_table(0, 2),
                                                       .crs = std::string("EPSG:2193")});
    REQUIRE_EQ(ds.schema.attrs.at("crs").as_string(), std::string("EPSG:2193"));
}

TEST_CASE("connector: metadata only writes") {
    auto service = std::make_shared<FakeService>();
    Connector c(config(), service, no_sleep);
    auto ds = c.write_datasource("forecast_points",
                                 WriteRequest{.geom = json_object({{"type", "Point"},
                                                                   {"coordinates", json_array({174.5, -41.2})}}),
                                              .properties = {{"description", JsonValue{"forecast sites"}}}});
    REQUIRE_EQ(ds.driver, std::string("_null"));
    REQUIRE_EQ(ds.description, std::string("forecast sites"));
    REQUIRE_EQ(service->metadata("forecast_points")["description"].as_string(), std::string("forecast sites"));
    REQUIRE_EQ(count_method(service->requests_to("datasource/"), HttpMethod::post), std::size_t(1));
}

TEST_CASE("connector: queries with no match return nothing") {
    LogCapture log(LogLevel::warn);
    auto service = std::make_shared<FakeService>();
    Connector c(config(), service, no_sleep);
    auto r = c.query(query("nothing_here"));
    REQUIRE(std::holds_alternative<std::monostate>(r));
    REQUIRE(log.contains("No data found for query"));

    auto loaded = c.load_datasource("nothing_here");
    REQUIRE(std::holds_alternative<std::monostate>(loaded));
}

TEST_CASE("connector: server errors on download are retried") {
    auto service = std::make_shared<FakeService>();
    service->add_table("buoy_obs", observation_table(0, 4));
    std::vector<Millis> sleeps;
    Connector c(config(), service, [&sleeps](Millis d) { sleeps.push_back(d); });

    service->fail_downloads = 2;
    auto r = c.query(query("buoy_obs"));
    REQUIRE_EQ(std::get<Table>(r).num_rows(), std::int64_t(4));
    REQUIRE_EQ(service->counters().downloads, std::size_t(3));
    REQUIRE(sleeps == std::vector<Millis>({Millis{0}, Millis{1000}}));
}

TEST_CASE("connector: download retries are bounded") {
    auto service = std::make_shared<FakeService>();
    service->add_table("buoy_obs", observation_table(0, 4));
    auto cfg = config();
    cfg.query_server_retries = 2;
    Connector c(cfg, service, no_sleep);

    service->fail_downloads = 10;
    REQUIRE_THROWS_AS(c.query(query("buoy_obs")), ConnectError);
    REQUIRE_EQ(service->counters().downloads, std::size_t(3));
}

TEST_CASE("connector: query errors carry the service detail") {
    auto service = std::make_shared<FakeService>();
    service->add_table("buoy_obs", observation_table(0, 4));
    Connector c(config(), service, no_sleep);

    SECTION("download") {
        service->download_error = "variable tp not in datasource";
        try {
            (void)c.query(query("buoy_obs"));
            REQUIRE(false);
        } catch (const QueryError& e) {
            REQUIRE_EQ(std::string(e.what()), std::string("variable tp not in datasource"));
        }
        service->download_error.reset();
    }
    SECTION("stage") {
        service->stage_error = "invalid timefilter";
        REQUIRE_THROWS_AS(c.query(query("buoy_obs")), QueryError);
        service->stage_error.reset();
    }
}

TEST_CASE("connector: large tables are reported") {
    LogCapture log(LogLevel::warn);
    auto service = std::make_shared<FakeService>();
    service->add_table("buoy_obs", observation_table(0, 4));
    auto cfg = config();
    cfg.row_warning_threshold = 3;
    Connector c(cfg, service, no_sleep);

    auto r = c.query(query("buoy_obs"));
    REQUIRE(std::holds_alternative<Table>(r));
    REQUIRE(log.contains("Query limited to 3 rows"));
}

TEST_CASE("connector: cached queries skip the service") {
    test::TempDir dir("connector_cache");
    auto service = std::make_shared<FakeService>();
    service->add_table("buoy_obs", observation_table(0, 4));
    auto cfg = config();
    cfg.cache_dir = dir.path();
    Connector c(cfg, service, no_sleep);

    QueryOptions opts{.cache_timeout = 600s};
    auto first = c.query(query("buoy_obs"), opts);
    auto counters = service->counters();
    REQUIRE_EQ(counters.downloads, std::size_t(1));

    auto second = c.query(query("buoy_obs"), opts);
    REQUIRE(std::holds_alternative<Table>(second));
    REQUIRE(std::get<Table>(second).equals(std::get<Table>(first)));
    REQUIRE_EQ(service->counters().stages, counters.stages);
    REQUIRE_EQ(service->counters().downloads, counters.downloads);

    // without a timeout the cache is bypassed
    (void)c.query(query("buoy_obs"));
    REQUIRE_EQ(service->counters().downloads, counters.downloads + 1);

    // only the published artifact remains
    std::vector<std::string> files;
    for (const auto& e : std::filesystem::directory_iterator(dir.path())) files.push_back(e.path().filename().string());
    REQUIRE(files == std::vector<std::string>({query("buoy_obs").hash() + ".pq"}));
}

TEST_CASE("connector: cached array queries skip the service") {
    test::TempDir dir("connector_array_cache");
    auto service = std::make_shared<FakeService>();
    auto cfg = config();
    cfg.cache_dir = dir.path();
    Connector c(cfg, service, no_sleep);
    (void)c.write_datasource("wave", WriteRequest{.data = wave_dataset({0, 1, 2})});

    QueryOptions opts{.cache_timeout = 600s};
    auto first = c.query(query("wave"), opts);
    REQUIRE(std::filesystem::is_regular_file(dir / (query("wave").hash() + ".zarr.zip")));
    auto downloads = service->counters().downloads;

    auto second = c.query(query("wave"), opts);
    REQUIRE(std::holds_alternative<Dataset>(second));
    REQUIRE(std::get<Dataset>(second).equals(std::get<Dataset>(first)));
    REQUIRE_EQ(service->counters().downloads, downloads);
}

TEST_CASE("connector: failed downloads leave nothing in the cache") {
    test::TempDir dir("connector_cache_failure");
    auto service = std::make_shared<FakeService>();
    auto cfg = config();
    cfg.cache_dir = dir.path();
    Connector c(cfg, service, no_sleep);
    (void)c.write_datasource("wave", WriteRequest{.data = wave_dataset({0, 1})});

    service->download_body = to_bytes("truncated");
    REQUIRE_THROWS_AS(c.query(query("wave"), QueryOptions{.cache_timeout = 600s}), ConnectError);
    REQUIRE(std::filesystem::is_empty(dir.path()));
}

TEST_CASE("connector: metadata updates") {
    LogCapture log(LogLevel::warn);
    auto service = std::make_shared<FakeService>();
    service->add_datasource("wave", json_object({{"driver", "onzarr"}}));
    Connector c(config(), service, no_sleep);

    auto ds = c.update_metadata("wave", {{"name", JsonValue{"Wave hindcast"}}, {"driver", JsonValue{"onsql"}}});
    REQUIRE_EQ(ds.name, std::string("Wave hindcast"));
    REQUIRE_EQ(ds.driver, std::string("onzarr"));
    REQUIRE(log.contains("driver is not an updatable property of a datasource"));
    REQUIRE_EQ(service->metadata("wave")["name"].as_string(), std::string("Wave hindcast"));
    REQUIRE_EQ(count_method(service->requests_to("datasource/wave/"), HttpMethod::patch), std::size_t(1));
}

TEST_CASE("connector: delete removes data and registration") {
    auto service = std::make_shared<FakeService>();
    Connector c(config(), service, no_sleep);
    (void)c.write_datasource("buoy_obs", WriteRequest{.data = observation_table(0, 2)});
    REQUIRE(c.delete_datasource("buoy_obs"));
    REQUIRE(!service->has_datasource("buoy_obs"));
    REQUIRE_THROWS_AS(c.get_datasource("buoy_obs"), ConnectError);
    REQUIRE_THROWS_AS(c.delete_datasource("buoy_obs"), ConnectError);
}

TEST_CASE("connector: async calls run on the pool") {
    auto service = std::make_shared<FakeService>();
    service->add_table("buoy_obs", observation_table(0, 3));
    Connector c(config(), service, no_sleep);

    auto written = c.write_datasource_async("wave", WriteRequest{.data = wave_dataset({0, 1})});
    auto catalog = c.get_catalog_async();
    auto result = c.query_async(query("buoy_obs"));
    auto info = c.get_datasource_async("buoy_obs");

    REQUIRE_EQ(written.get().id, std::string("wave"));
    REQUIRE(catalog.get().contains("buoy_obs"));
    REQUIRE_EQ(std::get<Table>(result.get()).num_rows(), std::int64_t(3));
    REQUIRE_EQ(info.get().datasource.driver, std::string("onsql"));

    auto loaded = c.load_datasource_async("wave");
    REQUIRE(std::holds_alternative<LazyDataset>(loaded.get()));
    auto updated = c.update_metadata_async("wave", {{"name", JsonValue{"Waves"}}});
    REQUIRE_EQ(updated.get().name, std::string("Waves"));
    REQUIRE(c.delete_datasource_async("wave").get());
    REQUIRE_THROWS_AS(c.get_datasource_async("missing").get(), ConnectError);
}

DATAMESH_TEST_MAIN()
