#pragma once
#include "datamesh/config.hpp"
#include "datamesh/error.hpp"
#include "datamesh/http.hpp"
#include "datamesh/log.hpp"

#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace datamesh {

// ---------------------------------------------------------------------------
// RetryTransport
//
// Runs a request through a Transport with bounded exponential backoff.
// Transient transport failures and 502 responses consume attempts; every
// other HTTP status is handed back untouched. When all attempts are used up
// the last cause is raised as a ConnectError.
// ---------------------------------------------------------------------------

class RetryTransport final {
public:
    using Sleeper = std::function<void(Millis)>;

    explicit RetryTransport(std::shared_ptr<Transport> transport,
                            RetryPolicy policy = {},
                            Sleeper sleeper = default_sleeper())
        : transport_{std::move(transport)}
        , policy_{policy}
        , sleep_{std::move(sleeper)}
    {
        if (!transport_) throw std::invalid_argument("retry: transport must not be null");
        if (!sleep_) sleep_ = default_sleeper();
    }

    [[nodiscard]] static Sleeper default_sleeper()
    {
        return [](Millis d) { std::this_thread::sleep_for(d); };
    }

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] Transport& transport() noexcept { return *transport_; }

    [[nodiscard]] HttpResponse execute(const HttpRequest& req) { return execute(req, policy_); }

    [[nodiscard]] HttpResponse execute(const HttpRequest& req, const RetryPolicy& policy)
    {
        const std::size_t attempts = policy.retries == 0 ? 1 : policy.retries;
        std::string cause;

        for (std::size_t attempt = 0; attempt < attempts; ++attempt) {
            try {
                auto resp = transport_->send(req);
                if (resp.status_code != 502) return resp;

                cause = std::format("502 Bad Gateway: {}", resp.body_string());
                Logger::debug("{} {} returned 502, cooling down {}ms",
                              method_name(req.method), req.url, policy.bad_gateway_cooldown.count());
                sleep_(policy.bad_gateway_cooldown);
            } catch (const TransportError& e) {
                if (!e.transient()) throw ConnectError(e.what(), e.what());
                cause = e.what();
                Logger::debug("{} {} failed ({}), attempt {}/{}",
                              method_name(req.method), req.url,
                              transport_failure_name(e.kind()), attempt + 1, attempts);
            }
            if (attempt + 1 < attempts) sleep_(policy.backoff(attempt));
        }

        throw ConnectError(std::format("Failed to connect to {} after {} retries with error: {}",
                                       req.url, attempts, cause),
                           cause);
    }

private:
    std::shared_ptr<Transport> transport_;
    RetryPolicy policy_;
    Sleeper sleep_;
};

} // namespace datamesh
