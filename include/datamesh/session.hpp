#pragma once
#include "datamesh/config.hpp"
#include "datamesh/error.hpp"
#include "datamesh/http.hpp"
#include "datamesh/log.hpp"
#include "datamesh/retry.hpp"
#include "datamesh/timestamp.hpp"

#include <chrono>
#include <exception>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace datamesh {

// ---------------------------------------------------------------------------
// Session value
// ---------------------------------------------------------------------------

struct Session {
    std::string id;
    std::string user;
    TimePoint creation_time{};
    TimePoint end_time{};
    bool write = false;
    bool allow_multiwrite = false;
    bool verified = false;
    // Synthesized for a service without session support; never sent anywhere.
    bool local = false;
    bool closed = false;
    std::string header_name = "X-SESSION-ID";

    [[nodiscard]] Headers header() const { return Headers{{header_name, id}}; }

    /// Copy of headers with the session header overlaid.
    [[nodiscard]] Headers add_header(Headers headers) const
    {
        headers.insert_or_assign(header_name, id);
        return headers;
    }

    [[nodiscard]] static Session from_json(const JsonValue& j, std::string header_name)
    {
        Session s;
        s.header_name = std::move(header_name);
        s.id = j["id"].as_string();
        s.user = j.get_string("user").value_or("");
        if (auto t = j.get_string("creation_time")) s.creation_time = parse_timestamp(*t);
        if (auto t = j.get_string("end_time")) s.end_time = parse_timestamp(*t);
        s.write = j.get_bool("write").value_or(false);
        s.allow_multiwrite = j.get_bool("allow_multiwrite").value_or(false);
        s.verified = j.get_bool("verified").value_or(false);
        return s;
    }
};

// ---------------------------------------------------------------------------
// SessionManager
// ---------------------------------------------------------------------------

struct SessionOptions {
    std::string gateway;
    Headers auth_headers;
    bool legacy = false;
    std::chrono::seconds duration{3600};
    std::string header_name = "X-SESSION-ID";
    Timeouts timeouts{};
};

class SessionManager final {
public:
    SessionManager(std::shared_ptr<RetryTransport> http, SessionOptions options)
        : http_{std::move(http)}, opts_{std::move(options)}
    {
        if (!http_) throw std::invalid_argument("session: transport must not be null");
    }

    [[nodiscard]] const SessionOptions& options() const noexcept { return opts_; }

    /// Throws SessionError if the service refuses or cannot be reached.
    [[nodiscard]] Session acquire(bool allow_multiwrite = false)
    {
        if (opts_.legacy) {
            Session s;
            s.id = "dummy_session";
            s.user = "dummy_user";
            s.creation_time = std::chrono::floor<std::chrono::microseconds>(std::chrono::system_clock::now());
            s.end_time = s.creation_time + (opts_.duration.count() > 0 ? opts_.duration : std::chrono::seconds{3600});
            s.allow_multiwrite = allow_multiwrite;
            s.local = true;
            s.header_name = opts_.header_name;
            return s;
        }

        HttpRequest req;
        req.url = opts_.gateway + "/session/";
        req.headers = opts_.auth_headers;
        req.headers.insert_or_assign("Cache-Control", "no-store");
        if (opts_.duration.count() > 0)
            req.params.emplace_back("duration", std::to_string(opts_.duration.count()));
        req.params.emplace_back("allow_multiwrite", std::string(param_bool(allow_multiwrite)));
        req.timeout = opts_.timeouts;

        try {
            auto resp = http_->execute(req);
            if (resp.status_code != 200)
                throw SessionError(std::format("Error when acquiring datamesh session: "
                                               "Failed to create session with error: {}", resp.body_string()));
            auto s = Session::from_json(resp.json(), opts_.header_name);
            Logger::debug("acquired session {} (user {})", s.id, s.user);
            return s;
        } catch (const SessionError&) {
            throw;
        } catch (const std::exception& e) {
            throw SessionError(std::format("Error when acquiring datamesh session: {}", e.what()));
        }
    }

    /// Re-attach to a session by id. Not available without session support.
    [[nodiscard]] Session from_session_id(const std::string& session_id)
    {
        if (opts_.legacy)
            throw SessionError("Cannot acquire session from id when the service has no session support");

        HttpRequest req;
        req.url = opts_.gateway + "/session/" + session_id;
        req.headers = opts_.auth_headers;
        req.timeout = opts_.timeouts;
        try {
            auto resp = http_->execute(req);
            if (resp.status_code != 200)
                throw SessionError(std::format("Failed to retrieve session {} with error: {}",
                                               session_id, resp.body_string()));
            return Session::from_json(resp.json(), opts_.header_name);
        } catch (const SessionError&) {
            throw;
        } catch (const std::exception& e) {
            throw SessionError(std::format("Error when acquiring datamesh session: {}", e.what()));
        }
    }

    /// Idempotent. A failure is raised only when finalise_write was requested;
    /// otherwise it is logged and the service reclaims the session on expiry.
    void close(Session& session, bool finalise_write = false)
    {
        if (session.closed) return;
        session.closed = true;
        if (session.local) return;

        HttpRequest req;
        req.method = HttpMethod::del;
        req.url = opts_.gateway + "/session/" + session.id;
        req.headers = session.header();
        req.params.emplace_back("finalise_write", std::string(param_bool(finalise_write)));
        req.timeout = opts_.timeouts;

        std::string failure;
        try {
            auto resp = http_->execute(req);
            if (resp.status_code == 204) {
                Logger::debug("closed session {}", session.id);
                return;
            }
            failure = std::string(resp.body_string());
        } catch (const ConnectError& e) {
            failure = e.what();
        }
        if (finalise_write)
            throw SessionError("Failed to finalise write with error: " + failure);
        Logger::warn("Failed to close session {} with error: {}", session.id, failure);
    }

private:
    std::shared_ptr<RetryTransport> http_;
    SessionOptions opts_;
};

// ---------------------------------------------------------------------------
// SessionLease: scoped acquisition with guaranteed release
// ---------------------------------------------------------------------------

// Closes the session (without finalising) on destruction unless release()
// or commit() already did. Use commit() once a write has fully succeeded.
class SessionLease final {
public:
    // Shares ownership of the manager, so a lease handed to a lazy dataset
    // may outlive the connector that opened it.
    SessionLease(std::shared_ptr<SessionManager> manager, Session session)
        : manager_{std::move(manager)}, session_{std::move(session)}
    {
        if (!manager_) throw std::invalid_argument("session: lease needs a manager");
    }

    static SessionLease acquire(std::shared_ptr<SessionManager> manager, bool allow_multiwrite = false)
    {
        if (!manager) throw std::invalid_argument("session: lease needs a manager");
        auto session = manager->acquire(allow_multiwrite);
        return SessionLease(std::move(manager), std::move(session));
    }

    ~SessionLease()
    {
        if (!manager_ || session_.closed) return;
        try {
            manager_->close(session_, false);
        } catch (const std::exception& e) {
            Logger::error("releasing session {}: {}", session_.id, e.what());
        }
    }

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    SessionLease(SessionLease&& other) noexcept
        : manager_{std::move(other.manager_)}, session_{std::move(other.session_)} {}
    SessionLease& operator=(SessionLease&&) = delete;

    [[nodiscard]] const Session& session() const noexcept { return session_; }
    [[nodiscard]] Headers add_header(Headers headers) const { return session_.add_header(std::move(headers)); }
    [[nodiscard]] bool released() const noexcept { return session_.closed; }

    void release(bool finalise_write = false)
    {
        if (manager_) manager_->close(session_, finalise_write);
    }

    void commit() { release(true); }

private:
    std::shared_ptr<SessionManager> manager_;
    Session session_;
};

} // namespace datamesh
