#pragma once

#include <arrayx/fwd.hh>
#include <arrayx/span.hh>

#include <map>
#include <string>
#include <string_view>
#include <vector>

// =========================================================================================================
// Operations on byte arrays
// =========================================================================================================
//
// Bytes are u8, results are owned std::vector<u8>.
// Hashing and secure randomness use OpenSSL (libcrypto), compression uses zlib.
//
// Encoding:
//   to_hex / to_hex_lower           - two digits per byte, upper / lower case
//   from_hex(text)                  - either case, odd length or non-hex digit -> invalid_argument
//   to_base64 / from_base64         - RFC 4648 with '=' padding, malformed input -> invalid_argument
//   to_utf8_string(bytes)           - bytes copied verbatim
//   to_ascii_string(bytes)          - bytes above 0x7F become '?'
//
// Hashing (digests as raw bytes):
//   md5 (16), sha1 (20), sha256 (32), sha512 (64)
//
// Bitwise:
//   and_bytes / or_bytes / xor_bytes(a, b)     - element-wise, length_mismatch on unequal lengths
//   not_bytes(bytes)
//   shift_left_each / shift_right_each(b, s)   - per byte, s in [0, 7] else value_out_of_range
//   count_set_bits(bytes)
//
// Statistics:
//   most_frequent_byte              - first seen value wins ties, empty -> invalid_argument
//   byte_frequencies                - byte -> count
//   entropy                         - Shannon entropy in bits per byte, in [0, 8], 0 for empty input
//
// Compression:
//   compress_gzip / decompress_gzip         - RFC 1952 gzip member
//   compress_deflate / decompress_deflate   - raw RFC 1951 stream, no header
//   corrupt or truncated input -> invalid_argument, empty input decompresses to nothing
//
// Patterns:
//   find_pattern(bytes, pattern)              - all start offsets, overlapping matches included,
//                                               empty pattern finds nothing
//   replace_pattern(bytes, old, new)          - left-to-right, non-overlapping, single pass
//                                               (inserted bytes are never rescanned), empty old -> copy
//   starts_with / ends_with(bytes, pattern)   - false if the pattern is longer than the input
//
// Misc:
//   split_chunks(bytes, size)       - size <= 0 -> value_out_of_range, last chunk may be shorter
//   secure_random_bytes(n)          - n < 0 -> value_out_of_range
//
// Failures of the underlying libraries that are not caused by the arguments
// (allocation, an unavailable digest or entropy source) are reported as std::runtime_error.

namespace ax
{
// encoding
[[nodiscard]] std::string to_hex(span<u8 const> bytes);
[[nodiscard]] std::string to_hex_lower(span<u8 const> bytes);
[[nodiscard]] std::vector<u8> from_hex(std::string_view text);
[[nodiscard]] std::string to_base64(span<u8 const> bytes);
[[nodiscard]] std::vector<u8> from_base64(std::string_view text);
[[nodiscard]] std::string to_utf8_string(span<u8 const> bytes);
[[nodiscard]] std::string to_ascii_string(span<u8 const> bytes);

// hashing
[[nodiscard]] std::vector<u8> md5(span<u8 const> bytes);
[[nodiscard]] std::vector<u8> sha1(span<u8 const> bytes);
[[nodiscard]] std::vector<u8> sha256(span<u8 const> bytes);
[[nodiscard]] std::vector<u8> sha512(span<u8 const> bytes);

// bitwise
[[nodiscard]] std::vector<u8> and_bytes(span<u8 const> a, span<u8 const> b);
[[nodiscard]] std::vector<u8> or_bytes(span<u8 const> a, span<u8 const> b);
[[nodiscard]] std::vector<u8> xor_bytes(span<u8 const> a, span<u8 const> b);
[[nodiscard]] std::vector<u8> not_bytes(span<u8 const> bytes);
[[nodiscard]] std::vector<u8> shift_left_each(span<u8 const> bytes, int shift);
[[nodiscard]] std::vector<u8> shift_right_each(span<u8 const> bytes, int shift);
[[nodiscard]] isize count_set_bits(span<u8 const> bytes);

// statistics
[[nodiscard]] u8 most_frequent_byte(span<u8 const> bytes);
[[nodiscard]] std::map<u8, isize> byte_frequencies(span<u8 const> bytes);
[[nodiscard]] f64 entropy(span<u8 const> bytes);

// compression
[[nodiscard]] std::vector<u8> compress_gzip(span<u8 const> bytes);
[[nodiscard]] std::vector<u8> decompress_gzip(span<u8 const> bytes);
[[nodiscard]] std::vector<u8> compress_deflate(span<u8 const> bytes);
[[nodiscard]] std::vector<u8> decompress_deflate(span<u8 const> bytes);

// patterns
[[nodiscard]] std::vector<isize> find_pattern(span<u8 const> bytes, span<u8 const> pattern);
[[nodiscard]] std::vector<u8> replace_pattern(span<u8 const> bytes, span<u8 const> old_pattern, span<u8 const> new_pattern);
[[nodiscard]] bool starts_with(span<u8 const> bytes, span<u8 const> pattern);
[[nodiscard]] bool ends_with(span<u8 const> bytes, span<u8 const> pattern);

// misc
[[nodiscard]] std::vector<std::vector<u8>> split_chunks(span<u8 const> bytes, isize size);
[[nodiscard]] std::vector<u8> secure_random_bytes(isize count);
} // namespace ax
