#include "bytes.hh"

#include <arrayx/bit.hh>
#include <arrayx/char_predicates.hh>
#include <arrayx/error.hh>
#include <arrayx/utility.hh>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <zlib.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <new>
#include <stdexcept>

namespace
{
// =========================================================================================================
// library failures
// =========================================================================================================

[[noreturn]] AX_COLD_FUNC void raise_openssl_failure(char const* operation)
{
    char reason[256] = {};
    ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
    throw std::runtime_error(std::string(operation) + ": OpenSSL failure: " + reason);
}

[[noreturn]] AX_COLD_FUNC void raise_zlib_failure(char const* operation, int status, z_stream const& zs)
{
    if (status == Z_MEM_ERROR)
        throw std::bad_alloc();
    throw std::runtime_error(std::string(operation) + ": zlib failure " + std::to_string(status) + (zs.msg ? std::string(": ") + zs.msg : ""));
}

void check_stream_size(ax::isize size, char const* operation)
{
    if (size > ax::isize(std::numeric_limits<uInt>::max())) [[unlikely]]
        ax::impl::raise_error(ax::error_kind::invalid_argument, std::string(operation) + ": input larger than 4 GiB",
                              ax::source_location::current());
}

// =========================================================================================================
// hashing
// =========================================================================================================

std::vector<ax::u8> digest(ax::span<ax::u8 const> bytes, EVP_MD const* md, char const* operation)
{
    auto* ctx = EVP_MD_CTX_new();
    if (!ctx)
        raise_openssl_failure(operation);
    AX_DEFER { EVP_MD_CTX_free(ctx); };

    if (!md || EVP_DigestInit_ex(ctx, md, nullptr) != 1)
        raise_openssl_failure(operation);
    if (EVP_DigestUpdate(ctx, bytes.data(), size_t(bytes.size())) != 1)
        raise_openssl_failure(operation);

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &length) != 1)
        raise_openssl_failure(operation);

    return std::vector<ax::u8>(hash, hash + length);
}

// =========================================================================================================
// compression
// =========================================================================================================

// deflateInit2 / inflateInit2 window bits
constexpr int gzip_window_bits = 15 + 16;
constexpr int raw_window_bits = -15;

constexpr ax::isize stream_buffer_size = 16 * 1024;

std::vector<ax::u8> deflate_stream(ax::span<ax::u8 const> bytes, int window_bits, char const* operation)
{
    check_stream_size(bytes.size(), operation);

    z_stream zs = {};
    auto status = deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY);
    if (status != Z_OK)
        raise_zlib_failure(operation, status, zs);
    AX_DEFER { deflateEnd(&zs); };

    // zlib does not write through next_in
    zs.next_in = const_cast<Bytef*>(bytes.data());
    zs.avail_in = uInt(bytes.size());

    std::vector<ax::u8> result;
    ax::u8 buffer[stream_buffer_size];
    do
    {
        zs.next_out = buffer;
        zs.avail_out = uInt(stream_buffer_size);
        status = deflate(&zs, Z_FINISH);
        if (status == Z_STREAM_ERROR)
            raise_zlib_failure(operation, status, zs);
        result.insert(result.end(), buffer, buffer + (stream_buffer_size - zs.avail_out));
    } while (status != Z_STREAM_END);

    return result;
}

std::vector<ax::u8> inflate_stream(ax::span<ax::u8 const> bytes, int window_bits, char const* operation)
{
    if (bytes.empty())
        return {};
    check_stream_size(bytes.size(), operation);

    z_stream zs = {};
    auto status = inflateInit2(&zs, window_bits);
    if (status != Z_OK)
        raise_zlib_failure(operation, status, zs);
    AX_DEFER { inflateEnd(&zs); };

    zs.next_in = const_cast<Bytef*>(bytes.data());
    zs.avail_in = uInt(bytes.size());

    std::vector<ax::u8> result;
    ax::u8 buffer[stream_buffer_size];
    do
    {
        zs.next_out = buffer;
        zs.avail_out = uInt(stream_buffer_size);
        status = inflate(&zs, Z_NO_FLUSH);

        switch (status)
        {
        case Z_OK:
        case Z_STREAM_END:
            break;
        case Z_NEED_DICT:
        case Z_DATA_ERROR:
            ax::impl::raise_error(ax::error_kind::invalid_argument,
                                  std::string(operation) + ": corrupt input" + (zs.msg ? std::string(" (") + zs.msg + ")" : ""),
                                  ax::source_location::current());
        case Z_BUF_ERROR:
            // a fresh output buffer was supplied, so no progress means the input ended early
            ax::impl::raise_error(ax::error_kind::invalid_argument, std::string(operation) + ": truncated input",
                                  ax::source_location::current());
        default:
            raise_zlib_failure(operation, status, zs);
        }

        result.insert(result.end(), buffer, buffer + (stream_buffer_size - zs.avail_out));
    } while (status != Z_STREAM_END);

    return result;
}

// =========================================================================================================
// misc
// =========================================================================================================

std::string hex_string(ax::span<ax::u8 const> bytes, char const* digits)
{
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto b : bytes)
    {
        result += digits[b >> 4];
        result += digits[b & 0xF];
    }
    return result;
}

bool matches_at(ax::span<ax::u8 const> bytes, ax::isize offset, ax::span<ax::u8 const> pattern)
{
    if (offset < 0 || offset + pattern.size() > bytes.size())
        return false;
    return std::equal(pattern.begin(), pattern.end(), bytes.begin() + offset);
}

template <class Op>
std::vector<ax::u8> combine(ax::span<ax::u8 const> a, ax::span<ax::u8 const> b, char const* operation, Op op)
{
    ax::impl::check_same_length(a.size(), b.size(), operation);

    std::vector<ax::u8> result(a.size());
    for (ax::isize i = 0; i < a.size(); ++i)
        result[i] = ax::u8(op(a[i], b[i]));
    return result;
}

constexpr bool is_base64_char(char c)
{
    return ax::is_alphanumeric(c) || c == '+' || c == '/';
}
} // namespace

// =========================================================================================================
// Encoding
// =========================================================================================================

std::string ax::to_hex(span<u8 const> bytes) { return hex_string(bytes, "0123456789ABCDEF"); }
std::string ax::to_hex_lower(span<u8 const> bytes) { return hex_string(bytes, "0123456789abcdef"); }

std::vector<ax::u8> ax::from_hex(std::string_view text)
{
    if (text.size() % 2 != 0)
        impl::raise_error(error_kind::invalid_argument, "from_hex: odd number of digits (" + std::to_string(text.size()) + ")",
                          ax::source_location::current());

    std::vector<u8> result;
    result.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2)
    {
        auto const hi = hex_digit_value(text[i]);
        auto const lo = hex_digit_value(text[i + 1]);
        if (hi < 0 || lo < 0)
            impl::raise_error(error_kind::invalid_argument, "from_hex: non-hex digit near position " + std::to_string(i),
                              ax::source_location::current());
        result.push_back(u8(hi << 4 | lo));
    }
    return result;
}

std::string ax::to_base64(span<u8 const> bytes)
{
    if (bytes.empty())
        return {};
    if (bytes.size() > isize(std::numeric_limits<int>::max() / 4 * 3))
        impl::raise_error(error_kind::invalid_argument, "to_base64: input too large", ax::source_location::current());

    // EVP_EncodeBlock writes a terminating zero
    std::string result(int_div_round_up(bytes.size(), isize(3)) * 4 + 1, '\0');
    auto const length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(result.data()), bytes.data(), int(bytes.size()));
    result.resize(length);
    return result;
}

std::vector<ax::u8> ax::from_base64(std::string_view text)
{
    if (text.empty())
        return {};

    if (text.size() % 4 != 0)
        impl::raise_error(error_kind::invalid_argument, "from_base64: length " + std::to_string(text.size()) + " is not a multiple of 4",
                          ax::source_location::current());

    // up to two '=' only at the very end
    isize padding = 0;
    while (padding < 2 && text[text.size() - 1 - padding] == '=')
        ++padding;
    for (size_t i = 0; i < text.size() - padding; ++i)
        if (!is_base64_char(text[i]))
            impl::raise_error(error_kind::invalid_argument, "from_base64: invalid character at position " + std::to_string(i),
                              ax::source_location::current());

    std::vector<u8> result(text.size() / 4 * 3);
    auto const length = EVP_DecodeBlock(result.data(), reinterpret_cast<unsigned char const*>(text.data()), int(text.size()));
    if (length < 0)
        impl::raise_error(error_kind::invalid_argument, "from_base64: malformed input", ax::source_location::current());

    // EVP_DecodeBlock counts padding as decoded zero bytes
    result.resize(length - padding);
    return result;
}

std::string ax::to_utf8_string(span<u8 const> bytes)
{
    return std::string(reinterpret_cast<char const*>(bytes.data()), bytes.size());
}

std::string ax::to_ascii_string(span<u8 const> bytes)
{
    std::string result;
    result.reserve(bytes.size());
    for (auto b : bytes)
        result += b > 0x7F ? '?' : char(b);
    return result;
}

// =========================================================================================================
// Hashing
// =========================================================================================================

std::vector<ax::u8> ax::md5(span<u8 const> bytes) { return digest(bytes, EVP_md5(), "md5"); }
std::vector<ax::u8> ax::sha1(span<u8 const> bytes) { return digest(bytes, EVP_sha1(), "sha1"); }
std::vector<ax::u8> ax::sha256(span<u8 const> bytes) { return digest(bytes, EVP_sha256(), "sha256"); }
std::vector<ax::u8> ax::sha512(span<u8 const> bytes) { return digest(bytes, EVP_sha512(), "sha512"); }

// =========================================================================================================
// Bitwise
// =========================================================================================================

std::vector<ax::u8> ax::and_bytes(span<u8 const> a, span<u8 const> b)
{
    return combine(a, b, "and_bytes", [](u8 x, u8 y) { return x & y; });
}

std::vector<ax::u8> ax::or_bytes(span<u8 const> a, span<u8 const> b)
{
    return combine(a, b, "or_bytes", [](u8 x, u8 y) { return x | y; });
}

std::vector<ax::u8> ax::xor_bytes(span<u8 const> a, span<u8 const> b)
{
    return combine(a, b, "xor_bytes", [](u8 x, u8 y) { return x ^ y; });
}

std::vector<ax::u8> ax::not_bytes(span<u8 const> bytes)
{
    std::vector<u8> result;
    result.reserve(bytes.size());
    for (auto b : bytes)
        result.push_back(u8(~b));
    return result;
}

std::vector<ax::u8> ax::shift_left_each(span<u8 const> bytes, int shift)
{
    impl::check_value(shift, 0, 7, "shift_left_each", "shift");

    std::vector<u8> result;
    result.reserve(bytes.size());
    for (auto b : bytes)
        result.push_back(shift_byte_left(b, shift));
    return result;
}

std::vector<ax::u8> ax::shift_right_each(span<u8 const> bytes, int shift)
{
    impl::check_value(shift, 0, 7, "shift_right_each", "shift");

    std::vector<u8> result;
    result.reserve(bytes.size());
    for (auto b : bytes)
        result.push_back(shift_byte_right(b, shift));
    return result;
}

ax::isize ax::count_set_bits(span<u8 const> bytes)
{
    isize count = 0;
    for (auto b : bytes)
        count += popcount(b);
    return count;
}

// =========================================================================================================
// Statistics
// =========================================================================================================

ax::u8 ax::most_frequent_byte(span<u8 const> bytes)
{
    impl::check_not_empty(bytes.size(), "most_frequent_byte");

    isize counts[256] = {};
    for (auto b : bytes)
        ++counts[b];

    // scanning in input order with a strict comparison keeps the first seen value on ties
    auto best = bytes[0];
    for (auto b : bytes)
        if (counts[b] > counts[best])
            best = b;
    return best;
}

std::map<ax::u8, ax::isize> ax::byte_frequencies(span<u8 const> bytes)
{
    std::map<u8, isize> result;
    for (auto b : bytes)
        ++result[b];
    return result;
}

ax::f64 ax::entropy(span<u8 const> bytes)
{
    if (bytes.empty())
        return 0;

    isize counts[256] = {};
    for (auto b : bytes)
        ++counts[b];

    f64 result = 0;
    for (auto c : counts)
    {
        if (c == 0)
            continue;
        auto const p = f64(c) / f64(bytes.size());
        result -= p * std::log2(p);
    }
    return result;
}

// =========================================================================================================
// Compression
// =========================================================================================================

std::vector<ax::u8> ax::compress_gzip(span<u8 const> bytes) { return deflate_stream(bytes, gzip_window_bits, "compress_gzip"); }
std::vector<ax::u8> ax::decompress_gzip(span<u8 const> bytes) { return inflate_stream(bytes, gzip_window_bits, "decompress_gzip"); }
std::vector<ax::u8> ax::compress_deflate(span<u8 const> bytes) { return deflate_stream(bytes, raw_window_bits, "compress_deflate"); }
std::vector<ax::u8> ax::decompress_deflate(span<u8 const> bytes)
{
    return inflate_stream(bytes, raw_window_bits, "decompress_deflate");
}

// =========================================================================================================
// Patterns
// =========================================================================================================

std::vector<ax::isize> ax::find_pattern(span<u8 const> bytes, span<u8 const> pattern)
{
    std::vector<isize> result;
    if (pattern.empty())
        return result;

    for (isize i = 0; i + pattern.size() <= bytes.size(); ++i)
        if (matches_at(bytes, i, pattern))
            result.push_back(i);
    return result;
}

std::vector<ax::u8> ax::replace_pattern(span<u8 const> bytes, span<u8 const> old_pattern, span<u8 const> new_pattern)
{
    if (old_pattern.empty())
        return std::vector<u8>(bytes.begin(), bytes.end());

    std::vector<u8> result;
    result.reserve(bytes.size());
    isize i = 0;
    while (i < bytes.size())
    {
        if (matches_at(bytes, i, old_pattern))
        {
            result.insert(result.end(), new_pattern.begin(), new_pattern.end());
            i += old_pattern.size();
        }
        else
            result.push_back(bytes[i++]);
    }
    return result;
}

bool ax::starts_with(span<u8 const> bytes, span<u8 const> pattern)
{
    return matches_at(bytes, 0, pattern);
}

bool ax::ends_with(span<u8 const> bytes, span<u8 const> pattern)
{
    return matches_at(bytes, bytes.size() - pattern.size(), pattern);
}

// =========================================================================================================
// Misc
// =========================================================================================================

std::vector<std::vector<ax::u8>> ax::split_chunks(span<u8 const> bytes, isize size)
{
    impl::check_at_least(size, 1, "split_chunks", "size");

    std::vector<std::vector<u8>> result;
    for (isize i = 0; i < bytes.size(); i += size)
    {
        auto const piece = bytes.subspan(i, ax::min(size, bytes.size() - i));
        result.emplace_back(piece.begin(), piece.end());
    }
    return result;
}

std::vector<ax::u8> ax::secure_random_bytes(isize count)
{
    impl::check_value(f64(count), 0, f64(std::numeric_limits<int>::max()), "secure_random_bytes", "count");

    std::vector<u8> result(count);
    if (count > 0 && RAND_bytes(result.data(), int(count)) != 1)
        raise_openssl_failure("secure_random_bytes");
    return result;
}
