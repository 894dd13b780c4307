#pragma once
#include "datamesh/append.hpp"
#include "datamesh/cache.hpp"
#include "datamesh/chunk_store.hpp"
#include "datamesh/config.hpp"
#include "datamesh/dataset.hpp"
#include "datamesh/datasource.hpp"
#include "datamesh/error.hpp"
#include "datamesh/http.hpp"
#include "datamesh/json.hpp"
#include "datamesh/log.hpp"
#include "datamesh/query.hpp"
#include "datamesh/retry.hpp"
#include "datamesh/session.hpp"
#include "datamesh/stage.hpp"
#include "datamesh/table.hpp"
#include "datamesh/thread_pool.hpp"
#include "datamesh/zip.hpp"

#include <cctype>
#include <chrono>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <future>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace datamesh {

// Client version reported to the service's info endpoint.
inline constexpr std::string_view client_version = "1.0.0";

// Accept formats for direct downloads.
inline constexpr std::string_view array_transfer_format = "application/zarr+zip";
inline constexpr std::string_view table_transfer_format = "application/parquet";

[[nodiscard]] constexpr std::string_view transfer_format(Container c) noexcept
{
    return c == Container::dataset ? array_transfer_format : table_transfer_format;
}

// A query or load result. monostate means the service found no data.
using QueryResult = std::variant<std::monostate, Dataset, LazyDataset, GeoTable, Table>;

// Data for write_datasource; monostate updates metadata only.
using WriteData = std::variant<std::monostate, Dataset, GeoTable, Table>;

struct CatalogFilter {
    std::optional<std::string> search;
    std::optional<TimeFilter> timefilter;
    std::optional<GeoFilter> geofilter;
    std::optional<std::size_t> limit;
};

struct QueryOptions {
    // Array results stay remote and are read chunk by chunk.
    bool lazy = false;
    // Zero disables the local cache.
    std::chrono::seconds cache_timeout{0};
};

struct WriteRequest {
    WriteData data;
    // Coordinate to append along; unset replaces the data.
    std::optional<std::string> append;
    bool overwrite = false;
    std::optional<JsonValue> geom;
    // Recorded in the schema attributes when it is not WGS84. Geometries
    // are not reprojected.
    std::optional<std::string> crs;
    // Further datasource properties, keyed as on the wire (name, tags, ...).
    JsonObject properties;
};

namespace connector_detail {

[[nodiscard]] inline std::string last_label(std::string_view host)
{
    if (auto p = host.find("://"); p != std::string_view::npos) host.remove_prefix(p + 3);
    if (auto p = host.find('/'); p != std::string_view::npos) host = host.substr(0, p);
    if (auto p = host.find(':'); p != std::string_view::npos) host = host.substr(0, p);
    auto dot = host.rfind('.');
    return std::string(dot == std::string_view::npos ? host : host.substr(dot + 1));
}

// "my_data-set" -> "My data set"
[[nodiscard]] inline std::string default_name(std::string_view id)
{
    std::string out(id);
    for (auto& c : out)
        if (c == '_' || c == '-') c = ' ';
    if (!out.empty()) out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

[[nodiscard]] inline std::string join(const std::vector<std::string>& words)
{
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out += ", ";
        out += w;
    }
    return out;
}

// Overlay wire-keyed properties onto a datasource, skipping `excluded`.
[[nodiscard]] inline Datasource with_properties(const Datasource& ds, const JsonObject& props,
                                                std::initializer_list<std::string_view> excluded)
{
    auto j = ds.to_json();
    for (const auto& [key, value] : props) {
        bool skip = false;
        for (auto e : excluded) skip = skip || key == e;
        if (!skip) j[key] = value;
    }
    return Datasource::from_json(j);
}

[[nodiscard]] inline std::string catalog_time(const TimeBound& b, std::string_view open)
{
    if (auto* tp = std::get_if<TimePoint>(&b)) return format_timestamp(*tp);
    if (auto* p = std::get_if<Period>(&b))
        return format_timestamp(std::chrono::floor<std::chrono::microseconds>(std::chrono::system_clock::now())
                                + p->value);
    return std::string(open);
}

[[nodiscard]] inline std::string geofilter_wkt(const GeoFilter& f)
{
    switch (f.type) {
        case GeoFilterType::feature:
            return geojson_to_wkt(f.geom);
        case GeoFilterType::bbox:
            return geojson_to_wkt(bbox_geometry(f.geom[0].as_number(), f.geom[1].as_number(),
                                                f.geom[2].as_number(), f.geom[3].as_number()));
        case GeoFilterType::radius: {
            // the circle's bounding box
            double x = f.geom[0].as_number(), y = f.geom[1].as_number(), r = f.geom[2].as_number();
            return geojson_to_wkt(bbox_geometry(x - r, y - r, x + r, y + r));
        }
    }
    throw std::invalid_argument("catalog: unknown geofilter type");
}

// Removes the cache lock file when the fetch holding it ends.
class CacheLockGuard final {
public:
    CacheLockGuard(LocalResultCache* cache, const Query& query) : cache_{cache}, query_{&query}
    {
        if (!cache_) return;
        try {
            held_ = cache_->lock(*query_);
        } catch (const CacheError& e) {
            Logger::warn("Failed to lock cache entry: {}", e.what());
        }
    }

    ~CacheLockGuard()
    {
        if (held_) cache_->unlock(*query_);
    }

    CacheLockGuard(const CacheLockGuard&) = delete;
    CacheLockGuard& operator=(const CacheLockGuard&) = delete;

private:
    LocalResultCache* cache_;
    const Query* query_;
    bool held_ = false;
};

// Removes a scratch file when the scope holding it ends, whether or not
// the file was moved away in the meantime.
class TempFile final {
public:
    explicit TempFile(std::filesystem::path path) : path_{std::move(path)} {}

    ~TempFile()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace connector_detail

// ---------------------------------------------------------------------------
// Connector
//
// Composition root: owns the transport stack, sessions, staging and the
// local cache, and exposes catalog search, datasource load, queries and
// writes. Every blocking call has an *_async twin run on a ThreadPool.
// ---------------------------------------------------------------------------

class Connector final {
public:
    explicit Connector(Config config,
                       std::shared_ptr<Transport> transport = std::make_shared<CurlTransport>(),
                       RetryTransport::Sleeper sleeper = RetryTransport::default_sleeper())
        : cfg_{std::move(config)}
        , sleep_{sleeper ? std::move(sleeper) : RetryTransport::default_sleeper()}
    {
        if (cfg_.token.empty())
            throw std::invalid_argument("A valid key must be supplied as a connection constructor argument "
                                        "or defined in environment variables as DATAMESH_TOKEN");
        if (cfg_.session_duration.count() < 0)
            throw std::invalid_argument(std::format("Session duration must be a valid number: {}s",
                                                    cfg_.session_duration.count()));

        auto scheme = cfg_.service.find("://");
        if (scheme == std::string::npos)
            throw std::invalid_argument("datamesh: service '" + cfg_.service + "' is not a URL");
        proto_ = cfg_.service.substr(0, scheme);
        host_ = cfg_.service.substr(scheme + 3);
        if (auto slash = host_.find('/'); slash != std::string::npos) host_.resize(slash);

        init_auth_headers();
        http_ = std::make_shared<RetryTransport>(std::move(transport), cfg_.retry, sleep_);
        check_info();
        if (connector_detail::last_label(host_) != connector_detail::last_label(gateway_))
            Logger::warn("Gateway and service domain do not match");

        sessions_ = std::make_shared<SessionManager>(
            http_, SessionOptions{gateway_, auth_, !v1_, cfg_.session_duration, cfg_.session_header,
                                  cfg_.default_timeouts()});
        stager_ = std::make_unique<StageNegotiator>(
            http_, StageOptions{gateway_, auth_, cfg_.timeouts(cfg_.stage_read_timeout)});
    }

    Connector(const Connector&) = delete;
    Connector& operator=(const Connector&) = delete;

    [[nodiscard]] const Config& config() const noexcept { return cfg_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] std::string service_url() const { return proto_ + "://" + host_; }
    [[nodiscard]] const std::string& gateway() const noexcept { return gateway_; }
    [[nodiscard]] const Headers& auth_headers() const noexcept { return auth_; }
    // False when the service predates session negotiation.
    [[nodiscard]] bool session_aware() const noexcept { return v1_; }
    [[nodiscard]] SessionManager& sessions() noexcept { return *sessions_; }

    // -----------------------------------------------------------------------
    // Catalog and metadata
    // -----------------------------------------------------------------------

    [[nodiscard]] Catalog get_catalog(const CatalogFilter& filter = {})
    {
        Params params;
        if (filter.limit) params.emplace_back("limit", std::to_string(*filter.limit));
        if (filter.search) params.emplace_back("search", *filter.search);
        if (filter.timefilter) {
            const auto& t = filter.timefilter->times;
            params.emplace_back("in_trange",
                                connector_detail::catalog_time(t[0], "0001-01-01T00:00:00Z") + "," +
                                connector_detail::catalog_time(t[1], "2500-01-01T00:00:00Z"));
        }
        if (filter.geofilter) params.emplace_back("geom_intersects", connector_detail::geofilter_wkt(*filter.geofilter));
        auto resp = metadata_request("", std::move(params));
        return Catalog::from_json(resp.json());
    }

    /// Throws ConnectError when the datasource is unknown or not authorized.
    [[nodiscard]] DatasourceInfo get_datasource(const std::string& id)
    {
        auto resp = metadata_request(id);
        return DatasourceInfo{Datasource::from_feature(resp.json(), id), DetailLevel::detailed};
    }

    /// Arrays (or anything, when `lazy`) come back as a LazyDataset that
    /// keeps its session until it is destroyed; tables are downloaded.
    [[nodiscard]] QueryResult load_datasource(const std::string& id, const JsonObject& parameters = {},
                                              bool lazy = false)
    {
        auto lease = std::make_shared<SessionLease>(SessionLease::acquire(sessions_));
        Query q;
        q.datasource = id;
        q.parameters = parameters;
        auto stage = stager_->stage(q, lease->session());
        if (!stage) {
            Logger::warn("No data found for query");
            return std::monostate{};
        }
        if (stage->container == Container::dataset || lazy) {
            auto store = chunk_store(id, ChunkApi::zarr, lease->session(), JsonValue{parameters});
            return open_dataset(std::move(store), lease);
        }

        auto body = data_request(id, table_transfer_format);
        if (stage->container == Container::geotable) return GeoTable::from_parquet(body);
        return Table::from_parquet(body);
    }

    /// Runs a query. Returns monostate when nothing matches.
    [[nodiscard]] QueryResult query(const Query& query, const QueryOptions& opts = {})
    {
        bool lazy = opts.lazy;
        std::optional<LocalResultCache> cache;
        if (opts.cache_timeout.count() > 0 && !lazy) {
            cache.emplace(CacheConfig::from_config(cfg_, opts.cache_timeout));
            if (auto hit = cache->get(query)) {
                return std::visit([](auto&& r) -> QueryResult { return std::move(r); }, std::move(*hit));
            }
        }

        auto lease = std::make_shared<SessionLease>(SessionLease::acquire(sessions_));
        auto stage = stager_->stage(query, lease->session());
        if (!stage) {
            Logger::warn("No data found for query");
            return std::monostate{};
        }
        const bool tabular = stage->container != Container::dataset;
        if (tabular && stage->dlen >= cfg_.row_warning_threshold) {
            Logger::warn("Query limited to {} rows, not all data may be returned. Use a more specific query.",
                         cfg_.row_warning_threshold);
        } else if (static_cast<double>(stage->size) > cfg_.lazy_threshold_bytes) {
            Logger::warn("Query is too large for direct access, using lazy access");
            lazy = true;
        }

        if (!tabular && lazy) {
            auto store = chunk_store(stage->qhash, ChunkApi::query, lease->session());
            return open_dataset(std::move(store), lease);
        }

        LocalResultCache* c = cache ? &*cache : nullptr;
        connector_detail::CacheLockGuard guard(c, query);
        return fetch(query, *stage, lease->session(), c);
    }

    /// Write data and/or metadata to a datasource. Every failure surfaces
    /// as WriteError.
    Datasource write_datasource(const std::string& id, const WriteRequest& req)
    {
        static const std::regex valid_id("^[a-z0-9_-]*$");
        if (!std::regex_match(id, valid_id))
            throw WriteError("Datasource ID must only contain lowercase letters, numbers, dashes and underscores");

        Datasource initial;
        try {
            JsonValue props = req.properties;
            props["id"] = id;
            if (!req.properties.contains("name")) props["name"] = connector_detail::default_name(id);
            if (!req.properties.contains("driver")) props["driver"] = "_null";
            if (req.geom) props["geom"] = *req.geom;
            initial = Datasource::from_json(props);
        } catch (const std::exception& e) {
            throw WriteError(std::format("Cannot create datasource: {}. Check that the properties are valid", e.what()));
        }

        bool overwrite = req.overwrite;
        bool exists = true;
        Datasource ds;
        try {
            ds = get_datasource(id).datasource;
        } catch (const ConnectError&) {
            overwrite = true;
            exists = false;
            ds = initial;
        }

        if (exists && overwrite) {
            try {
                delete_datasource(id);
            } catch (const std::exception& e) {
                Logger::debug("write: delete of {} failed: {}", id, e.what());
                throw WriteError("Cannot delete existing datasource");
            }
            exists = false;
        }

        const bool has_data = !std::holds_alternative<std::monostate>(req.data);
        if (has_data) {
            try {
                ds = write_data(id, req, ds, initial, exists, overwrite);
                exists = true;
            } catch (const WriteError&) {
                throw;
            } catch (const std::exception& e) {
                throw WriteError(e.what());
            }
        } else if (overwrite) {
            ds = initial;
        }

        try {
            ds = connector_detail::with_properties(ds, req.properties, {"driver", "schema", "crs", "id"});
            if (req.geom) ds.geom = *req.geom;
            if (has_data && !req.append) {
                std::visit([&](const auto& data) {
                    using T = std::decay_t<decltype(data)>;
                    if constexpr (!std::is_same_v<T, std::monostate>) guess_props(ds, data, false);
                }, req.data);
            }
        } catch (const std::exception& e) {
            throw WriteError(std::format("Cannot create datasource: {}. Check that the properties are valid", e.what()));
        }

        if (req.crs && *req.crs != "EPSG:4326" && *req.crs != "4326")
            ds.schema.attrs.insert_or_assign("crs", JsonValue{*req.crs});
        if (auto bad = check_coordinates(ds); !bad.empty())
            throw WriteError(std::format("Coordinates {} not found in data", connector_detail::join(bad)));
        if (!ds.geom)
            Logger::warn("Geometry not set for datasource, will have a default geometry of Point(0,0)");

        try {
            metadata_write(ds, exists);
        } catch (const std::exception& e) {
            throw WriteError(std::format("Cannot register datasource {}: {}", id, e.what()));
        }
        return ds;
    }

    /// Patch metadata properties. driver and driver_args cannot be changed
    /// and schema is owned by the data; those keys are ignored.
    Datasource update_metadata(const std::string& id, const JsonObject& properties)
    {
        auto ds = get_datasource(id).datasource;
        for (const auto& [key, _] : properties)
            if (key == "driver" || key == "driver_args" || key == "args")
                Logger::warn("{} is not an updatable property of a datasource", key);
        ds = connector_detail::with_properties(ds, properties, {"driver", "driver_args", "args", "schema", "id"});
        metadata_write(ds, true);
        return ds;
    }

    /// Deletes the registration and all stored data.
    bool delete_datasource(const std::string& id)
    {
        HttpRequest req;
        req.method = HttpMethod::del;
        req.url = gateway_ + "/data/" + id;
        req.headers = auth_;
        req.timeout = cfg_.default_timeouts();
        validate_response(http_->execute(req));
        return true;
    }

    // -----------------------------------------------------------------------
    // Async facade
    // -----------------------------------------------------------------------

    [[nodiscard]] std::future<Catalog> get_catalog_async(CatalogFilter filter = {})
    {
        return pool().submit([this, f = std::move(filter)] { return get_catalog(f); });
    }

    [[nodiscard]] std::future<DatasourceInfo> get_datasource_async(std::string id)
    {
        return pool().submit([this, id = std::move(id)] { return get_datasource(id); });
    }

    [[nodiscard]] std::future<QueryResult> load_datasource_async(std::string id, JsonObject parameters = {},
                                                                 bool lazy = false)
    {
        return pool().submit([this, id = std::move(id), p = std::move(parameters), lazy] {
            return load_datasource(id, p, lazy);
        });
    }

    [[nodiscard]] std::future<QueryResult> query_async(Query q, QueryOptions opts = {})
    {
        return pool().submit([this, q = std::move(q), opts] { return query(q, opts); });
    }

    [[nodiscard]] std::future<Datasource> write_datasource_async(std::string id, WriteRequest req)
    {
        return pool().submit([this, id = std::move(id), r = std::move(req)] { return write_datasource(id, r); });
    }

    [[nodiscard]] std::future<Datasource> update_metadata_async(std::string id, JsonObject properties)
    {
        return pool().submit([this, id = std::move(id), p = std::move(properties)] {
            return update_metadata(id, p);
        });
    }

    [[nodiscard]] std::future<bool> delete_datasource_async(std::string id)
    {
        return pool().submit([this, id = std::move(id)] { return delete_datasource(id); });
    }

private:
    void init_auth_headers()
    {
        if (cfg_.token.starts_with("Bearer ")) {
            auth_.insert_or_assign("Authorization", cfg_.token);
            return;
        }
        auth_.insert_or_assign("Authorization", "Token " + cfg_.token);
        auth_.insert_or_assign("X-DATAMESH-TOKEN", cfg_.token);
        if (cfg_.user) auth_.insert_or_assign("X-DATAMESH-USER", *cfg_.user);
    }

    // Picks the API generation and the gateway. Any failure of the info request
    // selects the legacy API.
    void check_info()
    {
        auto candidate = cfg_.gateway.value_or(service_url());
        try {
            HttpRequest req;
            req.url = std::format("{}/info/oceanum_python/{}", candidate, client_version);
            req.headers = auth_;
            req.timeout = cfg_.default_timeouts();
            auto resp = http_->execute(req);
            if (resp.status_code != 200)
                throw ConnectError(std::format("Failed to reach datamesh: {}-{}", resp.status_code, resp.body_string()));
            auto info = resp.json();
            if (auto msg = info.get_string("message")) Logger::info("{}", *msg);
            Logger::info("Using datamesh API version 1");
            gateway_ = candidate;
            v1_ = true;
        } catch (const std::exception& e) {
            Logger::debug("info request failed: {}", e.what());
            gateway_ = cfg_.gateway.value_or(std::format("{}://gateway.{}", proto_, host_));
            v1_ = false;
            Logger::info("Using datamesh API version beta");
        }
    }

    static void validate_response(const HttpResponse& resp)
    {
        if (resp.status_code < 400) return;
        if (auto detail = resp.detail()) throw ConnectError(*detail);
        throw ConnectError(std::format("Datamesh server error: {}", resp.body_string()));
    }

    HttpResponse metadata_request(const std::string& id, Params params = {})
    {
        HttpRequest req;
        req.url = std::format("{}/datasource/{}", service_url(), id);
        req.headers = auth_;
        req.params = std::move(params);
        req.timeout = cfg_.default_timeouts();
        auto resp = http_->execute(req);
        if (resp.status_code == 404) throw ConnectError(std::format("Datasource {} not found", id));
        if (resp.status_code == 401) throw ConnectError(std::format("Datasource {} not Authorized", id));
        validate_response(resp);
        return resp;
    }

    void metadata_write(const Datasource& ds, bool exists)
    {
        HttpRequest req;
        req.method = exists ? HttpMethod::patch : HttpMethod::post;
        req.url = exists ? std::format("{}/datasource/{}/", service_url(), ds.id)
                         : std::format("{}/datasource/", service_url());
        req.headers = auth_;
        req.headers.insert_or_assign("Content-Type", "application/json");
        req.body = to_bytes(json_serialize(ds.to_json()));
        req.timeout = cfg_.default_timeouts();
        validate_response(http_->execute(req));
    }

    std::vector<std::byte> data_request(const std::string& id, std::string_view accept)
    {
        HttpRequest req;
        req.url = std::format("{}/data/{}", gateway_, id);
        req.headers = auth_;
        req.headers.insert_or_assign("Accept", std::string(accept));
        req.timeout = cfg_.timeouts(cfg_.download_timeout);
        auto resp = http_->execute(req);
        validate_response(resp);
        return std::move(resp.body);
    }

    Datasource data_write(const std::string& id, std::vector<std::byte> payload,
                          const std::optional<std::string>& append, bool overwrite)
    {
        HttpRequest req;
        req.method = overwrite ? HttpMethod::put : HttpMethod::patch;
        req.url = std::format("{}/data/{}", gateway_, id);
        req.headers = auth_;
        req.headers.insert_or_assign("Content-Type", "application/parquet");
        if (!overwrite && append) req.headers.insert_or_assign("X-Append", *append);
        req.body = std::move(payload);
        req.timeout = cfg_.timeouts(cfg_.write_timeout);
        auto resp = http_->execute(req);
        validate_response(resp);
        return Datasource::from_json(resp.json());
    }

    Datasource write_data(const std::string& id, const WriteRequest& req, const Datasource& current,
                          const Datasource& initial, bool exists, bool overwrite)
    {
        if (const auto* data = std::get_if<Dataset>(&req.data)) {
            auto lease = SessionLease::acquire(sessions_);
            auto store = chunk_store(id, ChunkApi::zarr, lease.session(), {}, true);
            AppendWriter writer(store, [&](const std::string&) -> std::optional<Datasource> {
                if (!exists) return std::nullopt;
                return current;
            });
            auto written = writer.write(id, *data, req.append, overwrite);
            lease.commit();
            if (exists) return written;
            auto ds = initial;
            ds.schema = written.schema;
            ds.driver = written.driver;
            return ds;
        }
        if (const auto* geo = std::get_if<GeoTable>(&req.data))
            return data_write(id, geo->to_parquet(), req.append, overwrite);
        if (const auto* table = std::get_if<Table>(&req.data))
            return data_write(id, table->to_parquet(), req.append, overwrite);
        throw WriteError("Data must be a Table, GeoTable or Dataset");
    }

    std::shared_ptr<RemoteChunkStore> chunk_store(const std::string& resource, ChunkApi api, const Session& session,
                                                  JsonValue parameters = {}, bool nocache = false)
    {
        auto opts = ChunkStoreOptions::from_config(cfg_);
        opts.gateway = gateway_;
        opts.resource = resource;
        opts.api = api;
        opts.nocache = nocache;
        opts.session_aware = v1_;
        opts.parameters = std::move(parameters);
        opts.auth_headers = auth_;
        return std::make_shared<RemoteChunkStore>(http_, std::move(opts), session);
    }

    // Direct download of an eager result, retrying service-side failures.
    QueryResult fetch(const Query& query, const Stage& stage, const Session& session, LocalResultCache* cache)
    {
        HttpRequest req;
        req.method = HttpMethod::post;
        req.url = gateway_ + "/oceanql/";
        req.headers = session.add_header(auth_);
        req.headers.insert_or_assign("Accept", std::string(transfer_format(stage.container)));
        req.headers.insert_or_assign("Content-Type", "application/json");
        req.body = to_bytes(query.canonical_json());
        req.timeout = cfg_.timeouts(cfg_.download_timeout);

        for (std::size_t retry = 0;; ++retry) {
            auto resp = http_->execute(req);
            if (resp.status_code >= 500) {
                if (retry >= cfg_.query_server_retries)
                    throw ConnectError(std::format("Datamesh server error: {}", resp.body_string()));
                Logger::debug("query: server returned {}, retry {}", resp.status_code, retry + 1);
                sleep_(std::chrono::seconds{retry});
                continue;
            }
            if (resp.status_code >= 400) {
                if (auto detail = resp.detail()) throw QueryError(*detail);
                throw ConnectError(std::format("Datamesh server error: {}", resp.body_string()));
            }
            return decode(query, stage.container, resp.body, cache);
        }
    }

    static QueryResult decode(const Query& query, Container kind, const std::vector<std::byte>& body,
                              LocalResultCache* cache)
    {
        auto result = [&]() -> QueryResult {
            try {
                switch (kind) {
                    case Container::dataset:  return load_dataset(unzip_store(body));
                    case Container::geotable: return GeoTable::from_parquet(body);
                    case Container::table:    return Table::from_parquet(body);
                }
            } catch (const DatameshError&) {
                throw;
            } catch (const std::exception& e) {
                throw ConnectError(std::format("Datamesh returned an unreadable {} result: {}",
                                               container_name(kind), e.what()));
            }
            throw std::invalid_argument("query: unknown container");
        }();
        if (cache) store_download(*cache, query, kind, body);
        return result;
    }

    // Publish the downloaded bytes as they came off the wire. A failure here
    // costs only the cache entry.
    static void store_download(LocalResultCache& cache, const Query& query, Container kind,
                               const std::vector<std::byte>& body)
    {
        auto ext = LocalResultCache::extension(kind);
        try {
            connector_detail::TempFile tmp(cache.temp_path(query, ext));
            std::ofstream f(tmp.path(), std::ios::binary | std::ios::trunc);
            f.write(reinterpret_cast<const char*>(body.data()), static_cast<std::streamsize>(body.size()));
            f.close();
            if (!f) throw CacheError(std::format("cache: cannot write {}", tmp.path().string()));
            cache.copy(query, tmp.path(), ext);
        } catch (const std::exception& e) {
            Logger::warn("Failed to cache query result: {}", e.what());
        }
    }

    ThreadPool& pool()
    {
        std::call_once(pool_once_, [this] { pool_ = std::make_unique<ThreadPool>(cfg_.async_workers); });
        return *pool_;
    }

    Config cfg_;
    RetryTransport::Sleeper sleep_;
    std::string proto_;
    std::string host_;
    std::string gateway_;
    bool v1_ = false;
    Headers auth_;
    std::shared_ptr<RetryTransport> http_;
    std::shared_ptr<SessionManager> sessions_;
    std::unique_ptr<StageNegotiator> stager_;
    std::once_flag pool_once_;
    std::unique_ptr<ThreadPool> pool_;  // last: drained before the members its tasks use
};

} // namespace datamesh
