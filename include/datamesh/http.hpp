#pragma once
#include "datamesh/config.hpp"
#include "datamesh/error.hpp"
#include "datamesh/json.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <format>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace datamesh {

// ---------------------------------------------------------------------------
// Request / response values
// ---------------------------------------------------------------------------

enum class HttpMethod : std::uint8_t { get, head, post, put, patch, del };

[[nodiscard]] constexpr std::string_view method_name(HttpMethod m) noexcept
{
    switch (m) {
        case HttpMethod::get:   return "GET";
        case HttpMethod::head:  return "HEAD";
        case HttpMethod::post:  return "POST";
        case HttpMethod::put:   return "PUT";
        case HttpMethod::patch: return "PATCH";
        case HttpMethod::del:   return "DELETE";
    }
    return "GET";
}

using Headers = std::map<std::string, std::string, std::less<>>;
// Ordered; the service sees parameters in insertion order.
using Params = std::vector<std::pair<std::string, std::string>>;

// Boolean query parameters are spelled the way the service's Python side
// renders them.
[[nodiscard]] constexpr std::string_view param_bool(bool b) noexcept { return b ? "True" : "False"; }

[[nodiscard]] inline std::vector<std::byte> to_bytes(std::string_view s)
{
    auto* p = reinterpret_cast<const std::byte*>(s.data());
    return {p, p + s.size()};
}

[[nodiscard]] inline std::string_view as_string_view(std::span<const std::byte> b) noexcept
{
    return {reinterpret_cast<const char*>(b.data()), b.size()};
}

struct HttpRequest {
    HttpMethod method = HttpMethod::get;
    std::string url;
    Headers headers;
    Params params;
    std::vector<std::byte> body;
    Timeouts timeout{};

    [[nodiscard]] std::string_view body_string() const noexcept { return as_string_view(body); }

    [[nodiscard]] const std::string* param(std::string_view name) const noexcept
    {
        for (const auto& [k, v] : params)
            if (k == name) return &v;
        return nullptr;
    }

    [[nodiscard]] const std::string* header(std::string_view name) const noexcept
    {
        auto it = headers.find(name);
        return it == headers.end() ? nullptr : &it->second;
    }
};

struct HttpResponse {
    long status_code = 0;
    std::vector<std::byte> body;
    std::string content_type;

    [[nodiscard]] bool ok() const noexcept { return status_code >= 200 && status_code < 300; }
    [[nodiscard]] bool not_found() const noexcept { return status_code == 404; }

    [[nodiscard]] std::string_view body_string() const noexcept { return as_string_view(body); }

    /// Parse the body as JSON. Throws std::runtime_error on malformed input.
    [[nodiscard]] JsonValue json() const { return json_parse(body_string()); }

    /// The service's error "detail" field, when the body is a JSON object carrying one.
    [[nodiscard]] std::optional<std::string> detail() const
    {
        try {
            auto j = json();
            if (auto d = j.find("detail")) {
                if (d->is_string()) return d->as_string();
                return json_serialize(*d);
            }
        } catch (const std::runtime_error&) {
            // not JSON
        }
        return std::nullopt;
    }
};

// ---------------------------------------------------------------------------
// Transport interface
// ---------------------------------------------------------------------------

// Performs one HTTP exchange. Every HTTP status comes back as a response;
// only transport-level failures throw (TransportError).
class Transport {
public:
    virtual ~Transport() = default;
    [[nodiscard]] virtual HttpResponse send(const HttpRequest& request) = 0;
};

// ---------------------------------------------------------------------------
// libcurl implementation
// ---------------------------------------------------------------------------

namespace detail {

struct CurlDeleter {
    void operator()(CURL* c) const noexcept { curl_easy_cleanup(c); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct SlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};
using CurlSlist = std::unique_ptr<curl_slist, SlistDeleter>;

struct CurlGlobal {
    CurlGlobal() {
        if (ref_count_.fetch_add(1, std::memory_order_relaxed) == 0)
            curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobal() {
        if (ref_count_.fetch_sub(1, std::memory_order_acq_rel) == 1)
            curl_global_cleanup();
    }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

private:
    static inline std::atomic<int> ref_count_{0};
};

inline CurlHandle make_curl() {
    static CurlGlobal global;
    return CurlHandle{curl_easy_init()};
}

[[nodiscard]] inline std::string curl_escape(CURL* curl, std::string_view s)
{
    char* out = curl_easy_escape(curl, s.data(), static_cast<int>(s.size()));
    if (!out) throw TransportError(TransportFailure::invalid_request, "http: failed to escape parameter");
    std::string result(out);
    curl_free(out);
    return result;
}

[[nodiscard]] inline TransportFailure classify(CURLcode code, bool connected) noexcept
{
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return connected ? TransportFailure::read_timeout : TransportFailure::connect_timeout;
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
            return TransportFailure::connect;
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return TransportFailure::connection_lost;
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_BAD_FUNCTION_ARGUMENT:
            return TransportFailure::invalid_request;
        default:
            return TransportFailure::connect;
    }
}

} // namespace detail

class CurlTransport final : public Transport {
public:
    struct Config {
        bool follow_redirects{true};
        std::string user_agent{"datamesh-cpp/1.0"};
    };

    CurlTransport() = default;
    explicit CurlTransport(Config config) : config_(std::move(config)) {}

    // One easy handle per call: a CurlTransport is shared across the async
    // worker pool and libcurl handles must not be used concurrently.
    [[nodiscard]] HttpResponse send(const HttpRequest& req) override
    {
        auto handle = detail::make_curl();
        if (!handle)
            throw TransportError(TransportFailure::invalid_request, "http: failed to create curl handle");
        CURL* curl = handle.get();

        auto url = req.url;
        char sep = url.find('?') == std::string::npos ? '?' : '&';
        for (const auto& [k, v] : req.params) {
            url += sep;
            url += detail::curl_escape(curl, k);
            url += '=';
            url += detail::curl_escape(curl, v);
            sep = '&';
        }

        HttpResponse resp;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        if (req.timeout.connect)
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(req.timeout.connect->count()));
        if (req.timeout.read) {
            // Read timeout means "no bytes for this long", not a total deadline.
            auto secs = std::max<long>(1, static_cast<long>((req.timeout.read->count() + 999) / 1000));
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, secs);
        }
        if (config_.follow_redirects) {
            curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        }
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp);

        switch (req.method) {
            case HttpMethod::get:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::head:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::post:
            case HttpMethod::put:
            case HttpMethod::patch:
            case HttpMethod::del: {
                auto name = std::string(method_name(req.method));
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, name.c_str());
                if (!req.body.empty() || req.method != HttpMethod::del) {
                    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                     static_cast<curl_off_t>(req.body.size()));
                    const char* data = req.body.empty()
                        ? "" : reinterpret_cast<const char*>(req.body.data());
                    curl_easy_setopt(curl, CURLOPT_COPYPOSTFIELDS, data);
                }
                break;
            }
        }

        detail::CurlSlist headers;
        for (const auto& [k, v] : req.headers) {
            auto line = std::format("{}: {}", k, v);
            auto* next = curl_slist_append(headers.get(), line.c_str());
            if (!next) throw TransportError(TransportFailure::invalid_request, "http: out of memory building headers");
            if (!headers) headers.reset(next);
        }
        // Suppress libcurl's default "Expect: 100-continue" on large uploads.
        if (auto* next = curl_slist_append(headers.get(), "Expect:"); next && !headers) headers.reset(next);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

        auto code = curl_easy_perform(curl);
        if (code != CURLE_OK) {
            curl_off_t connect_us = 0;
            curl_easy_getinfo(curl, CURLINFO_CONNECT_TIME_T, &connect_us);
            throw TransportError(detail::classify(code, connect_us > 0),
                                 std::format("http: {} {}: {}", method_name(req.method), req.url,
                                             curl_easy_strerror(code)));
        }
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status_code);
        return resp;
    }

private:
    static std::size_t write_callback(char* ptr, std::size_t size,
                                      std::size_t nmemb, void* userdata) noexcept {
        auto& buf = *static_cast<std::vector<std::byte>*>(userdata);
        auto total = size * nmemb;
        auto* src = reinterpret_cast<const std::byte*>(ptr);
        buf.insert(buf.end(), src, src + total);
        return total;
    }

    static std::size_t header_callback(char* ptr, std::size_t size,
                                       std::size_t nmemb, void* userdata) noexcept {
        auto& resp = *static_cast<HttpResponse*>(userdata);
        auto total = size * nmemb;
        std::string_view line(ptr, total);
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
            line.remove_suffix(1);

        constexpr std::string_view prefix = "content-type:";
        if (line.size() < prefix.size()) return total;
        for (std::size_t i = 0; i < prefix.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(line[i])) != prefix[i]) return total;
        }
        auto val = line.substr(prefix.size());
        while (!val.empty() && val.front() == ' ') val.remove_prefix(1);
        resp.content_type = std::string{val};
        return total;
    }

    Config config_;
};

} // namespace datamesh
