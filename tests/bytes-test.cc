#include <arrayx/bytes.hh>

#include <nexus/test.hh>

#include <map>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "test-helpers.hh"

namespace
{
using bytes = std::vector<ax::u8>;

bytes bytes_of(std::string_view s) { return bytes(s.begin(), s.end()); }
} // namespace

TEST("bytes - hex")
{
    CHECK(ax::to_hex(bytes{0x00, 0xAB, 0xFF, 0x10}) == "00ABFF10");
    CHECK(ax::to_hex_lower(bytes{0x00, 0xAB, 0xFF, 0x10}) == "00abff10");
    CHECK(ax::to_hex(bytes{}) == "");

    CHECK(ax::from_hex("00abFF10") == bytes({0x00, 0xAB, 0xFF, 0x10}));
    CHECK(ax::from_hex("").empty());

    CHECK(test::error_kind_of([] { return ax::from_hex("abc"); }) == ax::error_kind::invalid_argument);
    CHECK(test::error_kind_of([] { return ax::from_hex("zz"); }) == ax::error_kind::invalid_argument);
    CHECK(test::error_kind_of([] { return ax::from_hex("0x12"); }) == ax::error_kind::invalid_argument);
}

TEST("bytes - base64")
{
    // RFC 4648 test vectors
    CHECK(ax::to_base64(bytes_of("")) == "");
    CHECK(ax::to_base64(bytes_of("f")) == "Zg==");
    CHECK(ax::to_base64(bytes_of("fo")) == "Zm8=");
    CHECK(ax::to_base64(bytes_of("foo")) == "Zm9v");
    CHECK(ax::to_base64(bytes_of("foob")) == "Zm9vYg==");
    CHECK(ax::to_base64(bytes_of("fooba")) == "Zm9vYmE=");
    CHECK(ax::to_base64(bytes_of("foobar")) == "Zm9vYmFy");

    CHECK(ax::from_base64("") == bytes_of(""));
    CHECK(ax::from_base64("Zg==") == bytes_of("f"));
    CHECK(ax::from_base64("Zm8=") == bytes_of("fo"));
    CHECK(ax::from_base64("Zm9vYmFy") == bytes_of("foobar"));
    CHECK(ax::from_base64("+/+/") == bytes({0xFB, 0xFF, 0xBF}));

    SECTION("binary data survives")
    {
        bytes all(256);
        for (auto i = 0; i < 256; ++i)
            all[i] = ax::u8(i);
        CHECK(ax::from_base64(ax::to_base64(all)) == all);
    }

    SECTION("malformed input")
    {
        for (auto text : {"Zg=", "Zm9v!A==", "Z===", "Zg=A", "====", "Zm 9v"})
            CHECK(test::error_kind_of([&] { return ax::from_base64(text); }) == ax::error_kind::invalid_argument);
    }
}

TEST("bytes - text conversion")
{
    CHECK(ax::to_utf8_string(bytes{0x68, 0xC3, 0xA9}) == "h\xC3\xA9");
    CHECK(ax::to_ascii_string(bytes{0x68, 0xC3, 0xA9, 0x69}) == "h??i");
    CHECK(ax::to_ascii_string(bytes{0x7F}) == "\x7F");
}

TEST("bytes - digests")
{
    auto const abc = bytes_of("abc");

    CHECK(ax::to_hex_lower(ax::md5(abc)) == "900150983cd24fb0d6963f7d28e17f72");
    CHECK(ax::to_hex_lower(ax::sha1(abc)) == "a9993e364706816aba3e25717850c26c9cd0d89d");
    CHECK(ax::to_hex_lower(ax::sha256(abc)) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(ax::to_hex_lower(ax::sha512(abc))
          == "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
             "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");

    CHECK(ax::to_hex_lower(ax::sha256(bytes{})) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    CHECK(ax::md5(abc).size() == 16);
    CHECK(ax::sha1(abc).size() == 20);
    CHECK(ax::sha256(abc).size() == 32);
    CHECK(ax::sha512(abc).size() == 64);
}

TEST("bytes - bitwise")
{
    auto const a = bytes{0b1100, 0xFF};
    auto const b = bytes{0b1010, 0x0F};

    CHECK(ax::and_bytes(a, b) == bytes({0b1000, 0x0F}));
    CHECK(ax::or_bytes(a, b) == bytes({0b1110, 0xFF}));
    CHECK(ax::xor_bytes(a, b) == bytes({0b0110, 0xF0}));
    CHECK(ax::not_bytes(bytes{0x00, 0xF0}) == bytes({0xFF, 0x0F}));

    CHECK(test::error_kind_of([&] { return ax::and_bytes(a, bytes{1}); }) == ax::error_kind::length_mismatch);
    CHECK(test::error_kind_of([&] { return ax::or_bytes(bytes{}, b); }) == ax::error_kind::length_mismatch);
    CHECK(test::error_kind_of([&] { return ax::xor_bytes(a, bytes{1, 2, 3}); }) == ax::error_kind::length_mismatch);

    SECTION("shifts drop bits per byte")
    {
        CHECK(ax::shift_left_each(bytes{0x81, 0x01}, 1) == bytes({0x02, 0x02}));
        CHECK(ax::shift_right_each(bytes{0x81, 0x01}, 1) == bytes({0x40, 0x00}));
        CHECK(ax::shift_left_each(bytes{0xFF}, 7) == bytes({0x80}));
        CHECK(ax::shift_right_each(bytes{0xAB}, 0) == bytes({0xAB}));

        CHECK(test::error_kind_of([] { return ax::shift_left_each(bytes{1}, 8); }) == ax::error_kind::value_out_of_range);
        CHECK(test::error_kind_of([] { return ax::shift_right_each(bytes{1}, -1); }) == ax::error_kind::value_out_of_range);
    }

    CHECK(ax::count_set_bits(bytes{0xFF, 0x01, 0x00, 0x18}) == 11);
    CHECK(ax::count_set_bits(bytes{}) == 0);
}

TEST("bytes - statistics")
{
    CHECK(ax::most_frequent_byte(bytes{3, 1, 3, 2}) == 3);
    // ties go to the value seen first
    CHECK(ax::most_frequent_byte(bytes{3, 1, 3, 1, 2}) == 3);
    CHECK(ax::most_frequent_byte(bytes{5, 5, 2, 2}) == 5);
    CHECK(ax::most_frequent_byte(bytes{2, 5, 5, 2}) == 2);
    CHECK(ax::most_frequent_byte(bytes{9, 0, 0xFF}) == 9);
    CHECK(test::error_kind_of([] { return ax::most_frequent_byte(bytes{}); }) == ax::error_kind::invalid_argument);

    CHECK(ax::byte_frequencies(bytes{9, 1, 9}) == (std::map<ax::u8, ax::isize>{{1, 1}, {9, 2}}));
    CHECK(ax::byte_frequencies(bytes{}).empty());

    CHECK(ax::entropy(bytes{}) == 0);
    CHECK(ax::entropy(bytes{7, 7, 7}) == 0);
    CHECK(test::is_near(ax::entropy(bytes{0, 1}), 1));
    CHECK(test::is_near(ax::entropy(bytes{0, 1, 2, 3}), 2));

    bytes all(256);
    for (auto i = 0; i < 256; ++i)
        all[i] = ax::u8(i);
    CHECK(test::is_near(ax::entropy(all), 8));
}

TEST("bytes - compression")
{
    auto const text = bytes_of("the quick brown fox jumps over the lazy dog, the quick brown fox jumps over the lazy dog");

    SECTION("gzip")
    {
        auto const packed = ax::compress_gzip(text);
        REQUIRE(packed.size() >= 18);
        // gzip member magic
        CHECK(packed[0] == 0x1F);
        CHECK(packed[1] == 0x8B);
        CHECK(ax::decompress_gzip(packed) == text);
    }

    SECTION("raw deflate")
    {
        auto const packed = ax::compress_deflate(text);
        CHECK(packed.size() < text.size());
        CHECK(ax::decompress_deflate(packed) == text);
    }

    SECTION("more than one buffer")
    {
        std::mt19937_64 rng(5);
        std::uniform_int_distribution<int> letter('a', 'e');
        bytes big(100000);
        for (auto& b : big)
            b = ax::u8(letter(rng));

        CHECK(ax::decompress_gzip(ax::compress_gzip(big)) == big);
        CHECK(ax::decompress_deflate(ax::compress_deflate(big)) == big);

        auto const zeros = bytes(200000, 0);
        auto const packed = ax::compress_deflate(zeros);
        CHECK(packed.size() < 1000);
        CHECK(ax::decompress_deflate(packed) == zeros);
    }

    SECTION("empty input")
    {
        CHECK(ax::decompress_gzip(ax::compress_gzip(bytes{})).empty());
        CHECK(ax::decompress_deflate(ax::compress_deflate(bytes{})).empty());
        CHECK(ax::decompress_gzip(bytes{}).empty());
        CHECK(ax::decompress_deflate(bytes{}).empty());
    }

    SECTION("corrupt input")
    {
        CHECK(test::error_kind_of([] { return ax::decompress_gzip(bytes{1, 2, 3, 4, 5}); }) == ax::error_kind::invalid_argument);
        CHECK(test::error_kind_of([] { return ax::decompress_deflate(bytes{0xFF, 0xFF}); }) == ax::error_kind::invalid_argument);

        // raw deflate is not a gzip member
        auto const raw = ax::compress_deflate(text);
        CHECK(test::error_kind_of([&] { return ax::decompress_gzip(raw); }) == ax::error_kind::invalid_argument);
    }

    SECTION("truncated input")
    {
        auto packed = ax::compress_gzip(text);
        packed.resize(packed.size() - 10);
        CHECK(test::error_kind_of([&] { return ax::decompress_gzip(packed); }) == ax::error_kind::invalid_argument);

        auto raw = ax::compress_deflate(text);
        raw.resize(raw.size() / 2);
        CHECK(test::error_kind_of([&] { return ax::decompress_deflate(raw); }) == ax::error_kind::invalid_argument);
    }
}

TEST("bytes - patterns")
{
    SECTION("find_pattern includes overlapping matches")
    {
        CHECK(ax::find_pattern(bytes{1, 1, 1, 2}, bytes{1, 1}) == std::vector<ax::isize>({0, 1}));
        CHECK(ax::find_pattern(bytes{1, 2, 3, 1, 2}, bytes{1, 2}) == std::vector<ax::isize>({0, 3}));
        CHECK(ax::find_pattern(bytes{1, 2}, bytes{}).empty());
        CHECK(ax::find_pattern(bytes{1}, bytes{1, 2}).empty());
    }

    SECTION("replace_pattern is a single left-to-right pass")
    {
        CHECK(ax::replace_pattern(bytes{1, 2, 1, 2, 3}, bytes{1, 2}, bytes{9}) == bytes({9, 9, 3}));
        CHECK(ax::replace_pattern(bytes{1, 1, 1}, bytes{1, 1}, bytes{7}) == bytes({7, 1}));
        CHECK(ax::replace_pattern(bytes{1, 2}, bytes{1, 2}, bytes{1, 2, 1, 2}) == bytes({1, 2, 1, 2}));
        CHECK(ax::replace_pattern(bytes{4, 1, 2}, bytes{1, 2}, bytes{}) == bytes({4}));
        CHECK(ax::replace_pattern(bytes{4, 5}, bytes{}, bytes{9}) == bytes({4, 5}));
    }

    SECTION("prefix and suffix")
    {
        auto const v = bytes{1, 2, 3};
        CHECK(ax::starts_with(v, bytes{1, 2}));
        CHECK(!ax::starts_with(v, bytes{2}));
        CHECK(ax::ends_with(v, bytes{2, 3}));
        CHECK(!ax::ends_with(v, bytes{1}));
        CHECK(ax::starts_with(v, bytes{}));
        CHECK(ax::ends_with(v, bytes{}));
        CHECK(!ax::starts_with(v, bytes{1, 2, 3, 4}));
        CHECK(!ax::ends_with(v, bytes{0, 1, 2, 3}));
    }
}

TEST("bytes - chunks and randomness")
{
    CHECK(ax::split_chunks(bytes{1, 2, 3, 4, 5}, 2) == std::vector<bytes>({{1, 2}, {3, 4}, {5}}));
    CHECK(ax::split_chunks(bytes{}, 3).empty());
    CHECK(test::error_kind_of([] { return ax::split_chunks(bytes{1}, 0); }) == ax::error_kind::value_out_of_range);

    CHECK(ax::secure_random_bytes(32).size() == 32);
    CHECK(ax::secure_random_bytes(0).empty());
    CHECK(ax::secure_random_bytes(32) != ax::secure_random_bytes(32));
    CHECK(test::error_kind_of([] { return ax::secure_random_bytes(-1); }) == ax::error_kind::value_out_of_range);
}
