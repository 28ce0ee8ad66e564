#pragma once

#include <arrayx/error.hh>
#include <arrayx/fwd.hh>
#include <arrayx/random.hh>
#include <arrayx/span.hh>

#include <array>
#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// =========================================================================================================
// 128 bit identifiers (RFC 4122 GUID / UUID)
// =========================================================================================================
//
// ax::guid stores its 16 bytes in canonical order, i.e. the order in which the hex digits of the
// hyphenated text form appear: "00112233-4455-6677-8899-aabbccddeeff" is bytes 00 11 22 ... ff.
// Comparison is lexicographic over these bytes.
//
// Byte layouts for import / export:
//   canonical     - as stored (RFC 4122 network order)
//   mixed_endian  - the first three fields (4, 2 and 2 bytes) little endian, the rest unchanged.
//                   This is the in-memory layout of a Windows GUID; byte 7 carries the version nibble.
//
// Text formats:
//   digits        - 32 digits                         00112233445566778899aabbccddeeff
//   hyphenated    - 8-4-4-4-12 digits (default)       00112233-4455-6677-8899-aabbccddeeff
//   braces        - hyphenated in {}                  {00112233-4455-6677-8899-aabbccddeeff}
//   parentheses   - hyphenated in ()                  (00112233-4455-6677-8899-aabbccddeeff)
//
// parse() accepts all four formats in either letter case, surrounded by optional whitespace.
//
// The version is the high nibble of the time_hi_and_version field (canonical byte 6).
// generate_v4 produces random (version 4, RFC 4122 variant) identifiers.

namespace ax
{
enum class guid_layout
{
    canonical,
    mixed_endian,
};

enum class guid_format
{
    digits,
    hyphenated,
    braces,
    parentheses,
};

enum class letter_case
{
    lower,
    upper,
};
} // namespace ax

struct ax::guid
{
    using byte_array = std::array<u8, 16>;

    // construction
public:
    /// nil guid
    constexpr guid() = default;
    constexpr explicit guid(byte_array const& canonical_bytes) : _bytes(canonical_bytes) {}

    [[nodiscard]] static constexpr guid nil() { return guid(); }

    [[nodiscard]] static std::optional<guid> parse(std::string_view text);

    /// Throws invalid_argument if bytes does not hold exactly 16 bytes
    [[nodiscard]] static guid from_bytes(span<u8 const> bytes, guid_layout layout = guid_layout::canonical);

    /// random version 4 guid
    template <std::uniform_random_bit_generator Rng>
    [[nodiscard]] static guid generate_v4(Rng& rng)
    {
        std::uniform_int_distribution<unsigned> byte_dist(0, 255);
        byte_array b;
        for (auto& v : b)
            v = u8(byte_dist(rng));
        b[6] = u8((b[6] & 0x0F) | 0x40);
        b[8] = u8((b[8] & 0x3F) | 0x80);
        return guid(b);
    }

    // queries
public:
    [[nodiscard]] constexpr byte_array const& bytes() const { return _bytes; }
    [[nodiscard]] byte_array to_bytes(guid_layout layout = guid_layout::canonical) const;

    [[nodiscard]] constexpr bool is_nil() const { return _bytes == byte_array{}; }
    [[nodiscard]] constexpr int version() const { return _bytes[6] >> 4; }

    [[nodiscard]] std::string to_string(guid_format format = guid_format::hyphenated, letter_case letters = letter_case::lower) const;

    constexpr bool operator==(guid const&) const = default;
    constexpr std::strong_ordering operator<=>(guid const&) const = default;

private:
    byte_array _bytes = {};
};

template <>
struct std::hash<ax::guid>
{
    [[nodiscard]] std::size_t operator()(ax::guid const& g) const noexcept
    {
        // 64-bit FNV-1a over the canonical bytes
        std::size_t h = 14695981039346656037ull;
        for (auto b : g.bytes())
            h = (h ^ b) * 1099511628211ull;
        return h;
    }
};

// =========================================================================================================
// Operations on guid arrays
// =========================================================================================================
//
//   remove_nil / any_nil / all_nil(values)       - all_nil is true for empty input
//   all_unique(values)
//   find_duplicate_guids(values)                 - each value occurring more than once, first-occurrence order
//   to_strings(values, format)
//   to_byte_arrays(values, layout)
//   sort_ascending / sort_descending(values)
//   min_guid / max_guid(values)                  - empty -> invalid_argument
//   filter_by_version(values, v)                 - v in [1, 5] else value_out_of_range
//   group_by_version(values)                     - (version, guids) in order of first appearance
//   versions(values)
//   index_of(values, g)                          - first index or -1
//   generate_guids(n[, rng])                     - n random v4 guids, n < 0 -> value_out_of_range
//   replace_nil_with_new(values[, rng])          - nil entries replaced by fresh v4 guids
//   join_guids(values, separator = ",")          - hyphenated lower case text
//

namespace ax
{
[[nodiscard]] std::vector<guid> remove_nil(span<guid const> values);
[[nodiscard]] bool any_nil(span<guid const> values);
[[nodiscard]] bool all_nil(span<guid const> values);
[[nodiscard]] bool all_unique(span<guid const> values);
[[nodiscard]] std::vector<guid> find_duplicate_guids(span<guid const> values);

[[nodiscard]] std::vector<std::string> to_strings(span<guid const> values, guid_format format = guid_format::hyphenated);
[[nodiscard]] std::vector<guid::byte_array> to_byte_arrays(span<guid const> values, guid_layout layout = guid_layout::canonical);

[[nodiscard]] std::vector<guid> sort_ascending(span<guid const> values);
[[nodiscard]] std::vector<guid> sort_descending(span<guid const> values);
[[nodiscard]] guid min_guid(span<guid const> values);
[[nodiscard]] guid max_guid(span<guid const> values);

[[nodiscard]] std::vector<guid> filter_by_version(span<guid const> values, int version);
[[nodiscard]] std::vector<std::pair<int, std::vector<guid>>> group_by_version(span<guid const> values);
[[nodiscard]] std::vector<int> versions(span<guid const> values);

[[nodiscard]] isize index_of(span<guid const> values, guid const& g);

[[nodiscard]] std::string join_guids(span<guid const> values, std::string_view separator = ",");

template <std::uniform_random_bit_generator Rng>
[[nodiscard]] std::vector<guid> generate_guids(isize count, Rng& rng)
{
    impl::check_at_least(count, 0, "generate_guids", "count");

    std::vector<guid> result;
    result.reserve(count);
    for (isize i = 0; i < count; ++i)
        result.push_back(guid::generate_v4(rng));
    return result;
}

[[nodiscard]] inline std::vector<guid> generate_guids(isize count)
{
    auto rng = impl::fresh_engine();
    return ax::generate_guids(count, rng);
}

template <std::uniform_random_bit_generator Rng>
[[nodiscard]] std::vector<guid> replace_nil_with_new(span<guid const> values, Rng& rng)
{
    std::vector<guid> result;
    result.reserve(values.size());
    for (auto const& g : values)
        result.push_back(g.is_nil() ? guid::generate_v4(rng) : g);
    return result;
}

[[nodiscard]] inline std::vector<guid> replace_nil_with_new(span<guid const> values)
{
    auto rng = impl::fresh_engine();
    return ax::replace_nil_with_new(values, rng);
}
} // namespace ax
