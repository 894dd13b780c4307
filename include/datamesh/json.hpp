#pragma once
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <initializer_list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace datamesh {

// ---------------------------------------------------------------------------
// JSON value types
// ---------------------------------------------------------------------------

struct JsonValue;
// Ordered so that serialization is canonical without a separate sort step.
using JsonObject = std::map<std::string, JsonValue, std::less<>>;
using JsonArray  = std::vector<JsonValue>;

struct JsonValue {
    std::variant<
        std::nullptr_t,
        bool,
        double,
        std::string,
        JsonArray,
        JsonObject
    > data = nullptr;

    JsonValue() = default;
    JsonValue(std::nullptr_t)        : data(nullptr) {}
    JsonValue(bool v)                : data(v) {}
    JsonValue(double v)              : data(v) {}
    JsonValue(int v)                 : data(static_cast<double>(v)) {}
    JsonValue(std::int64_t v)        : data(static_cast<double>(v)) {}
    JsonValue(std::size_t v)         : data(static_cast<double>(v)) {}
    JsonValue(const char* v)         : data(std::string(v)) {}
    JsonValue(std::string v)         : data(std::move(v)) {}
    JsonValue(std::string_view v)    : data(std::string(v)) {}
    JsonValue(JsonArray v)           : data(std::move(v)) {}
    JsonValue(JsonObject v)          : data(std::move(v)) {}

    [[nodiscard]] bool is_null()   const noexcept { return std::holds_alternative<std::nullptr_t>(data); }
    [[nodiscard]] bool is_bool()   const noexcept { return std::holds_alternative<bool>(data); }
    [[nodiscard]] bool is_number() const noexcept { return std::holds_alternative<double>(data); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(data); }
    [[nodiscard]] bool is_array()  const noexcept { return std::holds_alternative<JsonArray>(data); }
    [[nodiscard]] bool is_object() const noexcept { return std::holds_alternative<JsonObject>(data); }

    [[nodiscard]] bool               as_bool()   const { return std::get<bool>(data); }
    [[nodiscard]] double             as_number() const { return std::get<double>(data); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data); }
    [[nodiscard]] const JsonArray&   as_array()  const { return std::get<JsonArray>(data); }
    [[nodiscard]] const JsonObject&  as_object() const { return std::get<JsonObject>(data); }

    [[nodiscard]] std::string& as_string() { return std::get<std::string>(data); }
    [[nodiscard]] JsonArray&   as_array()  { return std::get<JsonArray>(data); }
    [[nodiscard]] JsonObject&  as_object() { return std::get<JsonObject>(data); }

    template <typename T = std::int64_t>
    [[nodiscard]] T as_int() const { return static_cast<T>(as_number()); }

    /// Look up a key in an object. Throws std::out_of_range if missing.
    [[nodiscard]] const JsonValue& operator[](std::string_view key) const {
        const auto& obj = as_object();
        auto it = obj.find(key);
        if (it == obj.end()) throw std::out_of_range("json: missing key '" + std::string(key) + "'");
        return it->second;
    }

    /// Insert-or-access. A null value becomes an empty object first.
    JsonValue& operator[](std::string_view key) {
        if (is_null()) data = JsonObject{};
        auto& obj = as_object();
        auto it = obj.find(key);
        if (it == obj.end()) it = obj.emplace(std::string(key), JsonValue{}).first;
        return it->second;
    }

    [[nodiscard]] const JsonValue& operator[](std::size_t index) const {
        return as_array().at(index);
    }

    JsonValue& operator[](std::size_t index) { return as_array().at(index); }

    /// Pointer to the value for key, or nullptr if not found / not an object.
    [[nodiscard]] const JsonValue* find(std::string_view key) const noexcept {
        if (!is_object()) return nullptr;
        const auto& obj = std::get<JsonObject>(data);
        auto it = obj.find(key);
        return it == obj.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }

    [[nodiscard]] const JsonValue& get(std::string_view key, const JsonValue& fallback) const noexcept {
        if (auto* p = find(key)) return *p;
        return fallback;
    }

    // Typed lookups. A present key of the wrong type counts as missing.
    [[nodiscard]] std::optional<std::string> get_string(std::string_view key) const {
        auto* p = find(key);
        if (!p || !p->is_string()) return std::nullopt;
        return p->as_string();
    }

    [[nodiscard]] std::optional<double> get_number(std::string_view key) const noexcept {
        auto* p = find(key);
        if (!p || !p->is_number()) return std::nullopt;
        return p->as_number();
    }

    [[nodiscard]] std::optional<bool> get_bool(std::string_view key) const noexcept {
        auto* p = find(key);
        if (!p || !p->is_bool()) return std::nullopt;
        return p->as_bool();
    }

    [[nodiscard]] std::size_t size() const noexcept {
        if (is_array())  return as_array().size();
        if (is_object()) return as_object().size();
        return 0;
    }

    [[nodiscard]] bool empty() const noexcept {
        if (is_null()) return true;
        return size() == 0;
    }

    friend bool operator==(const JsonValue& a, const JsonValue& b) { return a.data == b.data; }
};

// ---------------------------------------------------------------------------
// JSON parser  (recursive descent)
// ---------------------------------------------------------------------------

namespace json_detail {

inline void skip_ws(std::string_view& s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' ||
                          s.front() == '\n' || s.front() == '\r'))
        s.remove_prefix(1);
}

inline unsigned parse_hex4(std::string_view s) {
    if (s.size() < 4) throw std::runtime_error("json: incomplete \\u escape");
    unsigned cp = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        cp <<= 4;
        char c = s[i];
        if (c >= '0' && c <= '9')      cp |= static_cast<unsigned>(c - '0');
        else if (c >= 'a' && c <= 'f') cp |= static_cast<unsigned>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') cp |= static_cast<unsigned>(c - 'A' + 10);
        else throw std::runtime_error("json: invalid \\u hex digit");
    }
    return cp;
}

inline void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

inline JsonValue parse_value(std::string_view& s, int depth);

inline std::string parse_string(std::string_view& s) {
    if (s.empty() || s.front() != '"')
        throw std::runtime_error("json: expected '\"'");
    s.remove_prefix(1);
    std::string out;
    while (!s.empty() && s.front() != '"') {
        if (s.front() != '\\') {
            out += s.front();
            s.remove_prefix(1);
            continue;
        }
        s.remove_prefix(1);
        if (s.empty()) throw std::runtime_error("json: unexpected end of string escape");
        char esc = s.front();
        s.remove_prefix(1);
        switch (esc) {
            case '"':  out += '"';  break;
            case '\\': out += '\\'; break;
            case '/':  out += '/';  break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u': {
                unsigned cp = parse_hex4(s);
                s.remove_prefix(4);
                // Surrogate pair.
                if (cp >= 0xD800 && cp <= 0xDBFF && s.starts_with("\\u")) {
                    unsigned lo = parse_hex4(s.substr(2));
                    if (lo >= 0xDC00 && lo <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        s.remove_prefix(6);
                    }
                }
                append_utf8(out, cp);
                break;
            }
            default: throw std::runtime_error("json: invalid escape");
        }
    }
    if (s.empty()) throw std::runtime_error("json: unterminated string");
    s.remove_prefix(1);
    return out;
}

inline double parse_number(std::string_view& s) {
    std::size_t len = 0;
    if (!s.empty() && s[0] == '-') ++len;
    while (len < s.size() && ((s[len] >= '0' && s[len] <= '9') ||
           s[len] == '.' || s[len] == 'e' || s[len] == 'E' ||
           (s[len] == '+' && len > 0) || (s[len] == '-' && len > 0)))
        ++len;
    double val = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + len, val);
    if (ec != std::errc{} || len == 0)
        throw std::runtime_error("json: bad number");
    s.remove_prefix(static_cast<std::size_t>(ptr - s.data()));
    return val;
}

inline constexpr int max_depth = 512;

inline JsonValue parse_value(std::string_view& s, int depth) {
    if (depth > max_depth) throw std::runtime_error("json: nesting too deep");
    skip_ws(s);
    if (s.empty()) throw std::runtime_error("json: unexpected end of input");

    JsonValue v;
    if (s.front() == '"') {
        v.data = parse_string(s);
    } else if (s.front() == '{') {
        s.remove_prefix(1);
        JsonObject obj;
        skip_ws(s);
        if (!s.empty() && s.front() == '}') {
            s.remove_prefix(1);
        } else {
            for (;;) {
                skip_ws(s);
                auto key = parse_string(s);
                skip_ws(s);
                if (s.empty() || s.front() != ':')
                    throw std::runtime_error("json: expected ':' in object");
                s.remove_prefix(1);
                obj.insert_or_assign(std::move(key), parse_value(s, depth + 1));
                if (s.empty()) throw std::runtime_error("json: unterminated object");
                if (s.front() == ',') { s.remove_prefix(1); continue; }
                if (s.front() == '}') { s.remove_prefix(1); break; }
                throw std::runtime_error("json: expected ',' or '}' in object");
            }
        }
        v.data = std::move(obj);
    } else if (s.front() == '[') {
        s.remove_prefix(1);
        JsonArray arr;
        skip_ws(s);
        if (!s.empty() && s.front() == ']') {
            s.remove_prefix(1);
        } else {
            for (;;) {
                arr.push_back(parse_value(s, depth + 1));
                if (s.empty()) throw std::runtime_error("json: unterminated array");
                if (s.front() == ',') { s.remove_prefix(1); continue; }
                if (s.front() == ']') { s.remove_prefix(1); break; }
                throw std::runtime_error("json: expected ',' or ']' in array");
            }
        }
        v.data = std::move(arr);
    } else if (s.starts_with("true")) {
        v.data = true;
        s.remove_prefix(4);
    } else if (s.starts_with("false")) {
        v.data = false;
        s.remove_prefix(5);
    } else if (s.starts_with("null")) {
        v.data = nullptr;
        s.remove_prefix(4);
    } else if (s.starts_with("NaN")) {
        // Python's json module emits bare NaN; the service forwards it.
        v.data = std::nan("");
        s.remove_prefix(3);
    } else {
        v.data = parse_number(s);
    }
    skip_ws(s);
    return v;
}

} // namespace json_detail

/// Parse a complete JSON document. Throws std::runtime_error on failure,
/// including trailing non-whitespace input.
[[nodiscard]] inline JsonValue json_parse(std::string_view text) {
    auto v = json_detail::parse_value(text, 0);
    if (!text.empty()) throw std::runtime_error("json: trailing characters");
    return v;
}

// ---------------------------------------------------------------------------
// JSON serializer
// ---------------------------------------------------------------------------

namespace json_detail {

inline void escape_string(std::string& out, std::string_view sv) {
    out += '"';
    for (char c : sv) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

inline void append_number(std::string& out, double d) {
    if (!std::isfinite(d)) {
        out += "null";
    } else if (d == static_cast<double>(static_cast<std::int64_t>(d)) && std::abs(d) < 1e15) {
        out += std::to_string(static_cast<std::int64_t>(d));
    } else {
        char buf[64];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
        out.append(buf, static_cast<std::size_t>(ptr - buf));
    }
}

inline void serialize_impl(std::string& out, const JsonValue& v,
                           int indent, int depth) {
    const bool pretty = indent > 0;
    auto pad = [&](int extra = 0) {
        if (pretty) out.append(static_cast<std::size_t>((depth + extra) * indent), ' ');
    };

    if (v.is_null()) {
        out += "null";
    } else if (v.is_bool()) {
        out += v.as_bool() ? "true" : "false";
    } else if (v.is_number()) {
        append_number(out, v.as_number());
    } else if (v.is_string()) {
        escape_string(out, v.as_string());
    } else if (v.is_array()) {
        const auto& arr = v.as_array();
        if (arr.empty()) { out += "[]"; return; }
        out += '[';
        if (pretty) out += '\n';
        for (std::size_t i = 0; i < arr.size(); ++i) {
            pad(1);
            serialize_impl(out, arr[i], indent, depth + 1);
            if (i + 1 < arr.size()) out += ',';
            if (pretty) out += '\n';
        }
        pad();
        out += ']';
    } else {
        const auto& obj = v.as_object();
        if (obj.empty()) { out += "{}"; return; }
        out += '{';
        if (pretty) out += '\n';
        std::size_t idx = 0;
        for (const auto& [k, item] : obj) {
            pad(1);
            escape_string(out, k);
            out += ':';
            if (pretty) out += ' ';
            serialize_impl(out, item, indent, depth + 1);
            if (++idx < obj.size()) out += ',';
            if (pretty) out += '\n';
        }
        pad();
        out += '}';
    }
}

} // namespace json_detail

/// Serialize with keys in sorted order. indent > 0 pretty-prints.
[[nodiscard]] inline std::string json_serialize(const JsonValue& v, int indent = 0) {
    std::string out;
    json_detail::serialize_impl(out, v, indent, 0);
    return out;
}

// ---------------------------------------------------------------------------
// Builder helpers
// ---------------------------------------------------------------------------

[[nodiscard]] inline JsonValue json_object(std::initializer_list<std::pair<std::string, JsonValue>> pairs) {
    JsonObject obj;
    for (auto& [k, v] : pairs) obj.insert_or_assign(k, v);
    return JsonValue{std::move(obj)};
}

[[nodiscard]] inline JsonValue json_array(std::initializer_list<JsonValue> values) {
    return JsonValue{JsonArray(values)};
}

template <typename T>
[[nodiscard]] JsonValue json_array_of(const std::vector<T>& values) {
    JsonArray arr;
    arr.reserve(values.size());
    for (const auto& v : values) arr.emplace_back(v);
    return JsonValue{std::move(arr)};
}

[[nodiscard]] inline std::vector<std::string> json_string_list(const JsonValue& v) {
    std::vector<std::string> out;
    if (!v.is_array()) return out;
    for (const auto& item : v.as_array()) {
        if (item.is_string()) out.push_back(item.as_string());
    }
    return out;
}

} // namespace datamesh
