#pragma once
#include "datamesh/error.hpp"
#include "datamesh/http.hpp"
#include "datamesh/log.hpp"
#include "datamesh/query.hpp"
#include "datamesh/retry.hpp"
#include "datamesh/session.hpp"

#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace datamesh {

struct StageOptions {
    std::string gateway;
    Headers auth_headers;
    Timeouts timeouts{};
};

// First half of the two-phase query protocol: asks the service what a query
// would return (container kind, size, element count, qhash) without moving data.
class StageNegotiator final {
public:
    StageNegotiator(std::shared_ptr<RetryTransport> http, StageOptions options)
        : http_{std::move(http)}, opts_{std::move(options)}
    {
        if (!http_) throw std::invalid_argument("stage: transport must not be null");
    }

    /// nullopt when nothing matches the query (HTTP 204). Throws QueryError
    /// with the service's detail, or ConnectError when no detail is given.
    [[nodiscard]] std::optional<Stage> stage(const Query& query, const Session& session)
    {
        HttpRequest req;
        req.method = HttpMethod::post;
        req.url = opts_.gateway + "/oceanql/stage/";
        req.headers = session.add_header(opts_.auth_headers);
        req.headers.insert_or_assign("Content-Type", "application/json");
        req.body = to_bytes(query.canonical_json());
        req.timeout = opts_.timeouts;

        auto resp = http_->execute(req);
        if (resp.status_code >= 400) {
            if (auto detail = resp.detail()) throw QueryError(*detail);
            throw ConnectError(std::format("Datamesh server error: {}", resp.body_string()));
        }
        if (resp.status_code == 204) return std::nullopt;

        try {
            auto stage = Stage::from_json(resp.json());
            Logger::debug("staged {}: {} ({} bytes, {} elements, qhash {})",
                          query.datasource, container_name(stage.container),
                          stage.size, stage.dlen, stage.qhash);
            return stage;
        } catch (const std::exception& e) {
            throw ConnectError(std::format("Datamesh server error: malformed stage response: {}", e.what()),
                               e.what());
        }
    }

private:
    std::shared_ptr<RetryTransport> http_;
    StageOptions opts_;
};

} // namespace datamesh
