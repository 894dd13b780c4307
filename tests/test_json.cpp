#include <datamesh/json.hpp>
#include <datamesh/test.hpp>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using namespace datamesh;

// ===========================================================================
// Parsing
// ===========================================================================

TEST_CASE("json: parse scalars") {
    REQUIRE(json_parse("null").is_null());
    REQUIRE_EQ(json_parse("true").as_bool(), true);
    REQUIRE_EQ(json_parse("false").as_bool(), false);
    REQUIRE_NEAR(json_parse("-12.5e1").as_number(), -125.0, 1e-12);
    REQUIRE_EQ(json_parse("42").as_int(), 42);
    REQUIRE_EQ(json_parse("\"ocean\"").as_string(), std::string("ocean"));
}

TEST_CASE("json: parse nested stage response") {
    auto v = json_parse(R"({
        "qhash": "abc123",
        "size": 1024,
        "dlen": 10,
        "formats": ["application/parquet", "application/x-netcdf"],
        "coords": {"time": {"size": 10}},
        "container": "table"
    })");
    REQUIRE(v.is_object());
    REQUIRE_EQ(v["qhash"].as_string(), std::string("abc123"));
    REQUIRE_EQ(v["formats"].size(), std::size_t(2));
    REQUIRE_EQ(v["coords"]["time"]["size"].as_int(), 10);
}

TEST_CASE("json: bare NaN from the service parses") {
    auto v = json_parse(R"({"fill": NaN})");
    REQUIRE(std::isnan(v["fill"].as_number()));
}

TEST_CASE("json: string escapes and unicode") {
    auto v = json_parse(R"("line\nbreak \"quoted\" é 🌊")");
    const auto& s = v.as_string();
    REQUIRE(s.starts_with("line\nbreak \"quoted\" "));
    REQUIRE(s.find("\xc3\xa9") != std::string::npos);
    REQUIRE(s.find("\xf0\x9f\x8c\x8a") != std::string::npos);
}

TEST_CASE("json: malformed input throws") {
    REQUIRE_THROWS_AS(json_parse(""), std::runtime_error);
    REQUIRE_THROWS_AS(json_parse("{\"a\" 1}"), std::runtime_error);
    REQUIRE_THROWS_AS(json_parse("[1, 2"), std::runtime_error);
    REQUIRE_THROWS_AS(json_parse("{} trailing"), std::runtime_error);
    REQUIRE_THROWS_AS(json_parse("\"unterminated"), std::runtime_error);
}

TEST_CASE("json: nesting depth is bounded") {
    std::string deep(600, '[');
    deep += std::string(600, ']');
    REQUIRE_THROWS_AS(json_parse(deep), std::runtime_error);

    std::string ok(100, '[');
    ok += std::string(100, ']');
    REQUIRE_NOTHROW(json_parse(ok));
}

// ===========================================================================
// Access
// ===========================================================================

TEST_CASE("json: typed lookups treat wrong types as missing") {
    auto v = json_parse(R"({"name": "swan", "size": 3, "flag": true})");
    REQUIRE_EQ(v.get_string("name").value(), std::string("swan"));
    REQUIRE(!v.get_string("size").has_value());
    REQUIRE_EQ(v.get_number("size").value(), 3.0);
    REQUIRE(!v.get_number("missing").has_value());
    REQUIRE_EQ(v.get_bool("flag").value(), true);
    REQUIRE(!v.get_bool("name").has_value());
}

TEST_CASE("json: const lookup of a missing key throws") {
    const auto v = json_parse(R"({"a": 1})");
    REQUIRE_THROWS_AS(v["b"], std::out_of_range);
    REQUIRE(v.find("b") == nullptr);
    REQUIRE(v.contains("a"));
}

TEST_CASE("json: mutable index builds objects from null") {
    JsonValue v;
    v["outer"]["inner"] = 5;
    REQUIRE(v.is_object());
    REQUIRE_EQ(v["outer"]["inner"].as_int(), 5);
}

TEST_CASE("json: empty covers null and empty containers") {
    REQUIRE(JsonValue{}.empty());
    REQUIRE(JsonValue{JsonObject{}}.empty());
    REQUIRE(JsonValue{JsonArray{}}.empty());
    REQUIRE(!json_array({1}).empty());
}

TEST_CASE("json: string list skips non-strings") {
    auto v = json_parse(R"(["time", 3, "latitude", null])");
    auto names = json_string_list(v);
    REQUIRE_EQ(names.size(), std::size_t(2));
    REQUIRE_EQ(names[1], std::string("latitude"));
    REQUIRE(json_string_list(json_parse("{}")).empty());
}

// ===========================================================================
// Serialization
// ===========================================================================

TEST_CASE("json: keys serialize sorted") {
    auto v = json_object({{"zeta", 1}, {"alpha", 2}, {"mid", 3}});
    REQUIRE_EQ(json_serialize(v), std::string(R"({"alpha":2,"mid":3,"zeta":1})"));
}

TEST_CASE("json: equal documents serialize identically regardless of input order") {
    auto a = json_parse(R"({"b": [1, 2], "a": {"y": null, "x": "s"}})");
    auto b = json_parse(R"({"a": {"x": "s", "y": null}, "b": [1, 2]})");
    REQUIRE_EQ(json_serialize(a), json_serialize(b));
    REQUIRE(a == b);
}

TEST_CASE("json: numbers") {
    REQUIRE_EQ(json_serialize(JsonValue{3.0}), std::string("3"));
    REQUIRE_EQ(json_serialize(JsonValue{-0.25}), std::string("-0.25"));
    REQUIRE_EQ(json_serialize(JsonValue{std::nan("")}), std::string("null"));
    REQUIRE_NEAR(json_parse(json_serialize(JsonValue{1.0 / 3.0})).as_number(), 1.0 / 3.0, 1e-15);
}

TEST_CASE("json: control characters are escaped") {
    auto s = json_serialize(JsonValue{std::string("a\tb\x01")});
    REQUIRE_EQ(s, std::string("\"a\\tb\\u0001\""));
}

TEST_CASE("json: pretty printing") {
    auto v = json_object({{"a", json_array({1, 2})}});
    auto s = json_serialize(v, 2);
    REQUIRE(s.find('\n') != std::string::npos);
    REQUIRE(json_parse(s) == v);
}

TEST_CASE("json: array_of") {
    std::vector<std::string> tags{"wave", "model"};
    auto v = json_array_of(tags);
    REQUIRE_EQ(json_serialize(v), std::string(R"(["wave","model"])"));
}

DATAMESH_TEST_MAIN()
