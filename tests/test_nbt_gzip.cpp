
#include "nbt/nbt.hpp"

#include "nbt_test_util.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using nbt::ErrorKind;
using nbt::TagType;
using nbt_test::Bytes;

static std::vector<std::uint8_t> make_player() {
    Bytes b;
    b.root("Player");
    b.named(TagType::String, "Name").str("Steve");
    b.named(TagType::Int, "XpLevel").i32(30);
    b.named(TagType::IntArray, "UUID").i32(4).i32(1).i32(2).i32(3).i32(4);
    b.end();
    return b.b;
}

static void test_gzip_gate_round_trip() {
    std::vector<std::uint8_t> plain = make_player();
    std::vector<std::uint8_t> gz = nbt_test::gzip(plain);

    CHECK(nbt::is_gzip(gz));
    CHECK(!nbt::is_gzip(plain));
    CHECK_THROWS_KIND(nbt::parse(gz), ErrorKind::StillCompressed);

    std::vector<std::uint8_t> inflated = nbt::decompress(gz);
    CHECK(inflated == plain);
    CHECK(inflated[0] == 0x0A);

    nbt::NamedTag r = nbt::parse(inflated);
    CHECK(r.name == "Player");
    CHECK(r.tag.as_compound().at("Name").as_string() == "Steve");
}

static void test_plain_input_passes_through() {
    std::vector<std::uint8_t> plain = make_player();
    std::vector<std::uint8_t> out = nbt::decompress(plain);
    CHECK(out == plain);
    CHECK(out.data() != plain.data());

    std::vector<std::uint8_t> empty;
    CHECK(nbt::decompress(empty).empty());
}

static void test_truncated_stream() {
    std::vector<std::uint8_t> gz = nbt_test::gzip(make_player());

    // Drop the trailer.
    std::vector<std::uint8_t> no_trailer(gz.begin(), gz.end() - 8);
    CHECK_THROWS_KIND(nbt::decompress(no_trailer), ErrorKind::DecompressionFailure);

    std::vector<std::uint8_t> half(gz.begin(), gz.begin() + static_cast<std::ptrdiff_t>(gz.size() / 2));
    CHECK_THROWS_KIND(nbt::decompress(half), ErrorKind::DecompressionFailure);

    std::vector<std::uint8_t> magic_only = {0x1F, 0x8B};
    CHECK_THROWS_KIND(nbt::decompress(magic_only), ErrorKind::DecompressionFailure);
}

static void test_corrupt_stream() {
    // Compression method 7 does not exist.
    std::vector<std::uint8_t> bad_method = {0x1F, 0x8B, 0x07, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xFF, 0x01, 0x02};
    CHECK_THROWS_KIND(nbt::decompress(bad_method), ErrorKind::DecompressionFailure);

    // Valid header, garbage body.
    std::vector<std::uint8_t> gz = nbt_test::gzip(make_player());
    for (std::size_t i = 10; i < gz.size() - 8; ++i) gz[i] = 0xFF;
    CHECK_THROWS_KIND(nbt::decompress(gz), ErrorKind::DecompressionFailure);
}

static void test_inflated_size_limit() {
    Bytes b;
    b.root().named(TagType::ByteArray, "zeros").i32(1 << 20);
    b.b.resize(b.b.size() + (1u << 20), 0);
    b.end();
    std::vector<std::uint8_t> gz = nbt_test::gzip(b.b);
    CHECK(gz.size() < b.b.size());

    nbt::ParseOptions small;
    small.max_inflated_size = 4096;
    CHECK_THROWS_KIND(nbt::decompress(gz, small), ErrorKind::DecompressionFailure);

    std::vector<std::uint8_t> full = nbt::decompress(gz);
    CHECK(full.size() == b.b.size());
    CHECK(nbt::parse(full).tag.as_compound().at("zeros").as_byte_array().size() == (1u << 20));
}

static void test_document_owns_buffer() {
    nbt::Document gz_doc = nbt::Document::from_bytes(nbt_test::gzip(make_player()));
    CHECK(gz_doc.was_compressed());
    CHECK(gz_doc.name() == "Player");
    CHECK(gz_doc.bytes()[0] == 0x0A);

    nbt::Document plain_doc = nbt::Document::from_bytes(make_player());
    CHECK(!plain_doc.was_compressed());

    // Views stay valid after the document moves and when it is copied.
    std::vector<nbt::Document> docs;
    docs.push_back(std::move(gz_doc));
    docs.push_back(plain_doc);
    docs.reserve(64);
    for (const auto& d : docs) {
        CHECK(d.compound().at("Name").as_string() == "Steve");
        CHECK(d.compound().at("UUID").as_int_array()[3] == 4);
        const auto* p = reinterpret_cast<const std::uint8_t*>(d.name().data());
        CHECK(p >= d.bytes().data() && p < d.bytes().data() + d.bytes().size());
    }

    CHECK_THROWS_KIND(nbt::Document::from_bytes({0x08, 0x00, 0x00}), ErrorKind::InvalidRoot);
}

static void test_document_read_file() {
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "nbt_cpp_test_player.dat";
    std::filesystem::remove(tmp);
    {
        std::vector<std::uint8_t> gz = nbt_test::gzip(make_player());
        std::ofstream os(tmp, std::ios::binary);
        os.write(reinterpret_cast<const char*>(gz.data()), static_cast<std::streamsize>(gz.size()));
        CHECK(static_cast<bool>(os));
    }

    nbt::Document doc = nbt::Document::read_file(tmp);
    CHECK(doc.was_compressed());
    CHECK(doc.compound().at("XpLevel").as_int() == 30);
    std::filesystem::remove(tmp);

    CHECK_THROWS_KIND(nbt::Document::read_file(tmp), ErrorKind::Io);
}

int main() {
    try {
        test_gzip_gate_round_trip();
        test_plain_input_passes_through();
        test_truncated_stream();
        test_corrupt_stream();
        test_inflated_size_limit();
        test_document_owns_buffer();
        test_document_read_file();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::cout << "All tests passed.\n";
    return 0;
}
