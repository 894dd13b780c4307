#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace datamesh {

// Base for every error the library raises on purpose.
class DatameshError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Service unreachable, retries exhausted, or the service answered with a
// non-business failure. cause() holds the last underlying error text.
class ConnectError : public DatameshError {
    std::string cause_;

public:
    explicit ConnectError(const std::string& msg, std::string cause = {})
        : DatameshError(msg), cause_{std::move(cause)} {}

    [[nodiscard]] const std::string& cause() const noexcept { return cause_; }
};

// The service rejected a query; what() is the service's detail text verbatim.
class QueryError : public DatameshError {
public:
    using DatameshError::DatameshError;
};

// Never retried: a partial write is not idempotent.
class WriteError : public DatameshError {
public:
    using DatameshError::DatameshError;
};

class SessionError : public DatameshError {
public:
    using DatameshError::DatameshError;
};

class CacheError : public DatameshError {
public:
    using DatameshError::DatameshError;
};

// Chunk absent. Array readers treat this as "use the fill value".
class KeyNotFound : public DatameshError {
    std::string key_;

public:
    explicit KeyNotFound(std::string key)
        : DatameshError("key not found: " + key), key_{std::move(key)} {}

    [[nodiscard]] const std::string& key() const noexcept { return key_; }
};

// ---------------------------------------------------------------------------
// Transport-level failures
// ---------------------------------------------------------------------------

enum class TransportFailure : std::uint8_t {
    connect,          // could not resolve or connect
    connect_timeout,
    read_timeout,     // stalled while waiting for the response
    connection_lost,  // peer hung up mid-transfer
    invalid_request   // malformed URL or option; retrying cannot help
};

[[nodiscard]] constexpr std::string_view transport_failure_name(TransportFailure f) noexcept
{
    switch (f) {
        case TransportFailure::connect:         return "connection error";
        case TransportFailure::connect_timeout: return "connect timeout";
        case TransportFailure::read_timeout:    return "read timeout";
        case TransportFailure::connection_lost: return "connection lost";
        case TransportFailure::invalid_request: return "invalid request";
    }
    return "unknown";
}

class TransportError : public DatameshError {
    TransportFailure kind_;

public:
    TransportError(TransportFailure kind, const std::string& msg)
        : DatameshError(msg), kind_{kind} {}

    [[nodiscard]] TransportFailure kind() const noexcept { return kind_; }

    [[nodiscard]] bool transient() const noexcept
    {
        return kind_ != TransportFailure::invalid_request;
    }
};

} // namespace datamesh
