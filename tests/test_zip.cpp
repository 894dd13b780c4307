#include <datamesh/dataset.hpp>
#include <datamesh/test.hpp>
#include <datamesh/zip.hpp>

#include <zlib.h>

#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace datamesh;

namespace {

std::vector<std::byte> text(std::string_view s)
{
    auto b = std::as_bytes(std::span(s.data(), s.size()));
    return {b.begin(), b.end()};
}

// One deflated entry, laid out the way common zip tools write it.
std::vector<std::byte> deflated_archive(const std::string& name, const std::vector<std::byte>& value)
{
    z_stream strm{};
    REQUIRE_EQ(deflateInit2(&strm, 6, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY), Z_OK);
    std::vector<std::byte> packed(deflateBound(&strm, static_cast<uLong>(value.size())));
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(value.data()));
    strm.avail_in = static_cast<uInt>(value.size());
    strm.next_out = reinterpret_cast<Bytef*>(packed.data());
    strm.avail_out = static_cast<uInt>(packed.size());
    REQUIRE_EQ(deflate(&strm, Z_FINISH), Z_STREAM_END);
    packed.resize(strm.total_out);
    deflateEnd(&strm);

    auto sum = zip_detail::crc(value);
    auto nlen = static_cast<std::uint16_t>(name.size());
    auto csize = static_cast<std::uint32_t>(packed.size());
    auto usize = static_cast<std::uint32_t>(value.size());
    auto raw_name = std::as_bytes(std::span(name.data(), name.size()));

    zip_detail::ByteWriter w;
    w.u32(zip_detail::local_sig);
    w.u16(20); w.u16(0); w.u16(8); w.u16(0); w.u16(0x21);
    w.u32(sum); w.u32(csize); w.u32(usize);
    w.u16(nlen); w.u16(0);
    w.raw(raw_name);
    w.raw(packed);

    auto cd_off = static_cast<std::uint32_t>(w.buf.size());
    w.u32(zip_detail::central_sig);
    w.u16(20); w.u16(20); w.u16(0); w.u16(8); w.u16(0); w.u16(0x21);
    w.u32(sum); w.u32(csize); w.u32(usize);
    w.u16(nlen); w.u16(0); w.u16(0); w.u16(0); w.u16(0); w.u32(0);
    w.u32(0);
    w.raw(raw_name);
    auto cd_size = static_cast<std::uint32_t>(w.buf.size()) - cd_off;

    w.u32(zip_detail::end_sig);
    w.u16(0); w.u16(0); w.u16(1); w.u16(1);
    w.u32(cd_size); w.u32(cd_off);
    w.u16(0);
    return w.buf;
}

Dataset temperatures()
{
    Dataset ds;
    ds.attrs = {{"source", JsonValue{"buoy"}}};
    ds.coords.emplace("time", Variable::coord("time", std::vector<std::int64_t>{0, 6, 12}));
    ds.data_vars.emplace("sst", Variable::from_values<double>({"time"}, {3}, {14.5, 14.75, 15.0}));
    return ds;
}

} // namespace

TEST_CASE("zip: keys and values survive packing") {
    MemoryStore store;
    store.set(".zgroup", text("{\"zarr_format\": 2}"));
    store.set("sst/0", text("chunk"));
    store.set("empty", std::vector<std::byte>{});

    auto archive = zip_store(store);
    auto out = unzip_store(archive);
    REQUIRE_EQ(out->size(), std::size_t(3));
    REQUIRE(out->get("sst/0") == text("chunk"));
    REQUIRE(out->get("empty").empty());
}

TEST_CASE("zip: a dataset reads back from an archive") {
    auto store = std::make_shared<MemoryStore>();
    write_dataset(store, temperatures(), WriteOptions{.chunks = {{"time", 2}}});
    auto loaded = load_dataset(unzip_store(zip_store(*store)));
    REQUIRE(loaded.equals(temperatures()));
}

TEST_CASE("zip: archive files") {
    test::TempDir dir("zip_files");
    MemoryStore store;
    store.set("a/b", text("payload"));
    zip_store(store, dir / "one.zarr.zip");
    REQUIRE(unzip_store(dir / "one.zarr.zip")->get("a/b") == text("payload"));
    REQUIRE_THROWS_AS(unzip_store(dir / "absent.zip"), std::runtime_error);
}

TEST_CASE("zip: deflated entries are inflated") {
    std::vector<std::byte> value;
    for (int i = 0; i < 400; ++i) {
        auto line = text("station 7 hs 1.25\n");
        value.insert(value.end(), line.begin(), line.end());
    }
    auto out = unzip_store(deflated_archive("hs/0.0", value));
    REQUIRE(out->get("hs/0.0") == value);
}

TEST_CASE("zip: damaged archives are rejected") {
    MemoryStore store;
    store.set("sst/0", text("chunk bytes"));
    auto archive = zip_store(store);

    SECTION("not an archive") {
        REQUIRE_THROWS_AS(unzip_store(text("definitely not a zip file")), std::runtime_error);
    }
    SECTION("truncated") {
        std::vector<std::byte> cut(archive.begin(), archive.begin() + 20);
        REQUIRE_THROWS_AS(unzip_store(cut), std::runtime_error);
    }
    SECTION("flipped payload byte") {
        auto bad = archive;
        // local header (30) + name (5) puts the payload at offset 35
        bad[35] ^= std::byte{0xFF};
        try {
            (void)unzip_store(bad);
            REQUIRE(false);
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string(e.what()).starts_with("zip: checksum mismatch"));
        }
    }
}

DATAMESH_TEST_MAIN()
