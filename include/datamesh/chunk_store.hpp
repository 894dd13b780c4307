#pragma once
#include "datamesh/config.hpp"
#include "datamesh/error.hpp"
#include "datamesh/http.hpp"
#include "datamesh/json.hpp"
#include "datamesh/log.hpp"
#include "datamesh/retry.hpp"
#include "datamesh/session.hpp"
#include "datamesh/zarr.hpp"

#include <cstddef>
#include <format>
#include <memory>
#include <optional>
#include <regex>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace datamesh {

// ---------------------------------------------------------------------------
// Directory listing contract
// ---------------------------------------------------------------------------

// Version of the HTML listing format parse_listing understands: one anchor
// per key, the key in the href attribute.
inline constexpr int listing_format_version = 1;

/// Keys named by the anchors of a listing page. An empty body, or HTML
/// without anchors, is an empty listing; anything else without anchors
/// raises ConnectError.
[[nodiscard]] inline std::vector<std::string> parse_listing(std::string_view body)
{
    static const std::regex anchor(R"(<(a|A)\s+(?:[^>]*?\s+)?(href|HREF)=["']([^"']+))");

    std::vector<std::string> keys;
    auto first = body.begin(), last = body.end();
    for (std::regex_iterator<std::string_view::const_iterator> it(first, last, anchor), end; it != end; ++it)
        keys.push_back((*it)[3].str());
    if (!keys.empty()) return keys;

    auto lead = body.find_first_not_of(" \t\r\n");
    if (lead == std::string_view::npos || body[lead] == '<') return keys;
    throw ConnectError(std::format("chunk store: unrecognised listing format (version {} expected)",
                                   listing_format_version));
}

// ---------------------------------------------------------------------------
// RemoteChunkStore
// ---------------------------------------------------------------------------

enum class ChunkApi : std::uint8_t { zarr, query };

[[nodiscard]] constexpr std::string_view chunk_api_name(ChunkApi a) noexcept
{
    return a == ChunkApi::zarr ? "zarr" : "query";
}

struct OperationPolicy {
    std::size_t retries = 10;
    Timeouts timeouts{};
};

struct ChunkStoreOptions {
    std::string gateway;
    // Datasource id for ChunkApi::zarr, stage qhash for ChunkApi::query.
    std::string resource;
    ChunkApi api = ChunkApi::query;
    bool nocache = false;
    // Sessions negotiated with the service: existence checks may use HEAD.
    bool session_aware = true;
    JsonValue parameters;
    Headers auth_headers;

    OperationPolicy read{};
    OperationPolicy exists{};
    OperationPolicy write{};
    OperationPolicy erase{};
    OperationPolicy list{};

    /// Per-operation retries and timeouts from the connection configuration.
    [[nodiscard]] static ChunkStoreOptions from_config(const Config& cfg)
    {
        ChunkStoreOptions o;
        o.read = {cfg.chunk_retries, cfg.timeouts(cfg.chunk_read_timeout)};
        o.exists = o.read;
        o.list = o.read;
        o.write = {cfg.chunk_retries, cfg.timeouts(cfg.chunk_write_timeout)};
        o.erase = {cfg.chunk_retries, cfg.timeouts(cfg.chunk_delete_timeout)};
        return o;
    }
};

// Key -> bytes mapping over the service's chunk endpoints, so a zarr
// hierarchy can be read and written remotely one key at a time.
class RemoteChunkStore final : public Store {
public:
    RemoteChunkStore(std::shared_ptr<RetryTransport> http, ChunkStoreOptions options, const Session& session)
        : http_{std::move(http)}, opts_{std::move(options)}
    {
        if (!http_) throw std::invalid_argument("chunk store: transport must not be null");
        if (!opts_.session_aware) opts_.api = ChunkApi::zarr;
        base_ = opts_.gateway + (opts_.api == ChunkApi::zarr ? "/zarr/" : "/zarr/query/") + opts_.resource;

        headers_ = session.add_header(opts_.auth_headers);
        if (opts_.nocache) headers_.insert_or_assign("cache-control", "no-transform,no-cache");
        if (opts_.parameters.is_object() && !opts_.parameters.empty())
            headers_.insert_or_assign("X-PARAMETERS", json_serialize(opts_.parameters));
    }

    [[nodiscard]] const std::string& base_url() const noexcept { return base_; }
    [[nodiscard]] const Headers& headers() const noexcept { return headers_; }
    [[nodiscard]] ChunkApi api() const noexcept { return opts_.api; }
    [[nodiscard]] const ChunkStoreOptions& options() const noexcept { return opts_; }

    [[nodiscard]] std::vector<std::byte> get(const std::string& key) const override
    {
        auto resp = request(HttpMethod::get, key, opts_.read);
        if (resp.status_code >= 300) throw KeyNotFound(key);
        return std::move(resp.body);
    }

    [[nodiscard]] bool exists(const std::string& key) const override
    {
        auto method = opts_.session_aware ? HttpMethod::head : HttpMethod::get;
        return request(method, key, opts_.exists).status_code == 200;
    }

    void set(const std::string& key, std::span<const std::byte> value) override
    {
        refuse_in_query_mode("write");
        auto resp = request(HttpMethod::post, key, opts_.write, value);
        if (resp.status_code >= 300)
            throw WriteError(std::format("Failed to write {}: {} - {}", key, resp.status_code, resp.body_string()));
    }

    void erase(const std::string& key) override
    {
        refuse_in_query_mode("delete");
        auto resp = request(HttpMethod::del, key, opts_.erase);
        if (!resp.ok() && !resp.not_found())
            Logger::debug("chunk store: delete {} returned {}", key, resp.status_code);
    }

    [[nodiscard]] std::vector<std::string> list() const override
    {
        auto resp = request(HttpMethod::get, "", opts_.list);
        if (!resp.ok()) return {};
        return parse_listing(resp.body_string());
    }

    // The empty key names the whole resource.
    void clear() override { erase(""); }

private:
    void refuse_in_query_mode(std::string_view op) const
    {
        if (opts_.api == ChunkApi::query)
            throw ConnectError(std::format("Query api does not support {} operations", op));
    }

    HttpResponse request(HttpMethod method, const std::string& key, const OperationPolicy& op,
                         std::span<const std::byte> body = {}) const
    {
        HttpRequest req;
        req.method = method;
        req.url = base_ + "/" + key;
        req.headers = headers_;
        req.body.assign(body.begin(), body.end());
        req.timeout = op.timeouts;

        auto policy = http_->policy();
        policy.retries = op.retries;
        auto resp = http_->execute(req, policy);
        if (resp.status_code == 401) throw ConnectError(std::format("Not Authorized {}", resp.body_string()));
        return resp;
    }

    std::shared_ptr<RetryTransport> http_;
    ChunkStoreOptions opts_;
    std::string base_;
    Headers headers_;
};

} // namespace datamesh
