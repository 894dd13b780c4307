#include <datamesh/compression.hpp>
#include <datamesh/test.hpp>

#include <cstdint>
#include <cstring>
#include <numeric>
#include <stdexcept>
#include <vector>

using namespace datamesh;

namespace {

std::vector<std::byte> ramp(std::size_t n)
{
    std::vector<std::byte> out(n);
    for (std::size_t i = 0; i < n; ++i) out[i] = static_cast<std::byte>(i % 251);
    return out;
}

std::vector<std::byte> float_field(std::size_t n)
{
    std::vector<double> values(n);
    std::iota(values.begin(), values.end(), 273.15);
    std::vector<std::byte> out(n * sizeof(double));
    std::memcpy(out.data(), values.data(), out.size());
    return out;
}

} // namespace

// ===========================================================================
// Names
// ===========================================================================

TEST_CASE("codec: names round trip") {
    for (auto c : {Codec::none, Codec::zlib, Codec::gzip, Codec::zstd, Codec::blosc})
        REQUIRE(parse_codec(codec_name(c)) == c);
    REQUIRE(parse_codec("") == Codec::none);
    REQUIRE(!parse_codec("lz4").has_value());
}

TEST_CASE("codec: zlib family is always available") {
    REQUIRE(codec_available(Codec::none));
    REQUIRE(codec_available(Codec::zlib));
    REQUIRE(codec_available(Codec::gzip));
#ifdef DATAMESH_HAS_ZSTD
    REQUIRE(codec_available(Codec::zstd));
#else
    REQUIRE(!codec_available(Codec::zstd));
#endif
}

// ===========================================================================
// zlib / gzip
// ===========================================================================

TEST_CASE("zlib: compresses a chunk of floats") {
    auto input = float_field(4096);
    auto packed = compress(input, CompressParams{.codec = Codec::zlib, .level = 5});
    REQUIRE_LT(packed.size(), input.size());
    REQUIRE_EQ(static_cast<unsigned>(packed[0]), 0x78u);

    auto back = decompress(packed, Codec::zlib, input.size());
    REQUIRE(back == input);
}

TEST_CASE("zlib: unknown expected size") {
    auto input = ramp(100'000);
    auto packed = compress(input, CompressParams{.codec = Codec::zlib, .level = 1});
    REQUIRE(decompress(packed, Codec::zlib, 0) == input);
}

TEST_CASE("gzip: framed output") {
    auto input = ramp(1000);
    auto packed = compress(input, CompressParams{.codec = Codec::gzip, .level = 9});
    REQUIRE_EQ(static_cast<unsigned>(packed[0]), 0x1fu);
    REQUIRE_EQ(static_cast<unsigned>(packed[1]), 0x8bu);
    REQUIRE(decompress(packed, Codec::gzip, input.size()) == input);
}

TEST_CASE("zlib: empty input") {
    std::vector<std::byte> empty;
    auto packed = compress(empty, CompressParams{.codec = Codec::zlib});
    REQUIRE(decompress(packed, Codec::zlib, 0).empty());
}

TEST_CASE("zlib: corrupt input throws") {
    auto packed = compress(ramp(500), CompressParams{.codec = Codec::zlib});
    packed.resize(packed.size() / 2);
    REQUIRE_THROWS_AS(decompress(packed, Codec::zlib, 500), std::runtime_error);

    std::vector<std::byte> garbage(64, std::byte{0x42});
    REQUIRE_THROWS_AS(decompress(garbage, Codec::zlib, 64), std::runtime_error);
}

TEST_CASE("none: passes bytes through") {
    auto input = ramp(17);
    REQUIRE(compress(input, CompressParams{}) == input);
    REQUIRE(decompress(input, Codec::none, 17) == input);
}

// ===========================================================================
// Optional backends
// ===========================================================================

TEST_CASE("zstd: round trip when built in") {
    auto input = float_field(2048);
    if (!codec_available(Codec::zstd)) {
        REQUIRE_THROWS_AS(compress(input, CompressParams{.codec = Codec::zstd}), std::runtime_error);
        return;
    }
    auto packed = compress(input, CompressParams{.codec = Codec::zstd, .level = 3});
    REQUIRE_LT(packed.size(), input.size());
    REQUIRE(decompress(packed, Codec::zstd, 0) == input);
}

TEST_CASE("blosc: round trip when built in") {
    auto input = float_field(2048);
    CompressParams p{.codec = Codec::blosc, .level = 5, .shuffle = 1, .typesize = sizeof(double)};
    if (!codec_available(Codec::blosc)) {
        REQUIRE_THROWS_AS(compress(input, p), std::runtime_error);
        return;
    }
    auto packed = compress(input, p);
    REQUIRE(decompress(packed, Codec::blosc, input.size()) == input);
}

DATAMESH_TEST_MAIN()
