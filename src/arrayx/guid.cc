#include "guid.hh"

#include <arrayx/char_predicates.hh>
#include <arrayx/query.hh>
#include <arrayx/set_ops.hh>

#include <algorithm>

namespace
{
// positions of the hyphens in the 36 char form
constexpr bool is_hyphen_position(size_t i) { return i == 8 || i == 13 || i == 18 || i == 23; }

// the three leading fields are swapped in place, the swap is its own inverse
ax::guid::byte_array swap_field_order(ax::guid::byte_array b)
{
    std::reverse(b.begin(), b.begin() + 4);
    std::reverse(b.begin() + 4, b.begin() + 6);
    std::reverse(b.begin() + 6, b.begin() + 8);
    return b;
}

std::optional<ax::guid> parse_hyphenated(std::string_view text)
{
    if (text.size() != 36)
        return std::nullopt;

    ax::guid::byte_array bytes;
    auto out = 0;
    for (size_t i = 0; i < text.size();)
    {
        if (is_hyphen_position(i))
        {
            if (text[i] != '-')
                return std::nullopt;
            ++i;
            continue;
        }

        auto const hi = ax::hex_digit_value(text[i]);
        auto const lo = ax::hex_digit_value(text[i + 1]);
        if (hi < 0 || lo < 0 || is_hyphen_position(i + 1))
            return std::nullopt;
        bytes[out++] = ax::u8(hi << 4 | lo);
        i += 2;
    }
    return ax::guid(bytes);
}

std::optional<ax::guid> parse_digits(std::string_view text)
{
    if (text.size() != 32)
        return std::nullopt;

    ax::guid::byte_array bytes;
    for (size_t i = 0; i < 16; ++i)
    {
        auto const hi = ax::hex_digit_value(text[2 * i]);
        auto const lo = ax::hex_digit_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        bytes[i] = ax::u8(hi << 4 | lo);
    }
    return ax::guid(bytes);
}
} // namespace

// =========================================================================================================
// guid
// =========================================================================================================

std::optional<ax::guid> ax::guid::parse(std::string_view text)
{
    while (!text.empty() && is_space(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && is_space(text.back()))
        text.remove_suffix(1);

    switch (text.size())
    {
    case 32:
        return parse_digits(text);
    case 36:
        return parse_hyphenated(text);
    case 38:
        if ((text.front() == '{' && text.back() == '}') || (text.front() == '(' && text.back() == ')'))
            return parse_hyphenated(text.substr(1, 36));
        return std::nullopt;
    default:
        return std::nullopt;
    }
}

ax::guid ax::guid::from_bytes(span<u8 const> bytes, guid_layout layout)
{
    if (bytes.size() != 16)
        impl::raise_error(error_kind::invalid_argument, "guid::from_bytes: expected 16 bytes, got " + std::to_string(bytes.size()),
                          ax::source_location::current());

    byte_array b;
    std::copy(bytes.begin(), bytes.end(), b.begin());
    return guid(layout == guid_layout::mixed_endian ? swap_field_order(b) : b);
}

ax::guid::byte_array ax::guid::to_bytes(guid_layout layout) const
{
    return layout == guid_layout::mixed_endian ? swap_field_order(_bytes) : _bytes;
}

std::string ax::guid::to_string(guid_format format, letter_case letters) const
{
    auto const* digits = letters == letter_case::upper ? "0123456789ABCDEF" : "0123456789abcdef";
    auto const hyphens = format != guid_format::digits;

    std::string s;
    s.reserve(38);
    if (format == guid_format::braces)
        s += '{';
    else if (format == guid_format::parentheses)
        s += '(';

    for (auto i = 0; i < 16; ++i)
    {
        if (hyphens && (i == 4 || i == 6 || i == 8 || i == 10))
            s += '-';
        s += digits[_bytes[i] >> 4];
        s += digits[_bytes[i] & 0xF];
    }

    if (format == guid_format::braces)
        s += '}';
    else if (format == guid_format::parentheses)
        s += ')';
    return s;
}

// =========================================================================================================
// guid arrays
// =========================================================================================================

std::vector<ax::guid> ax::remove_nil(span<guid const> values)
{
    std::vector<guid> result;
    for (auto const& g : values)
        if (!g.is_nil())
            result.push_back(g);
    return result;
}

bool ax::any_nil(span<guid const> values)
{
    return std::any_of(values.begin(), values.end(), [](guid const& g) { return g.is_nil(); });
}

bool ax::all_nil(span<guid const> values)
{
    return std::all_of(values.begin(), values.end(), [](guid const& g) { return g.is_nil(); });
}

bool ax::all_unique(span<guid const> values)
{
    return is_unique(values);
}

std::vector<ax::guid> ax::find_duplicate_guids(span<guid const> values)
{
    return find_duplicates(values);
}

std::vector<std::string> ax::to_strings(span<guid const> values, guid_format format)
{
    std::vector<std::string> result;
    result.reserve(values.size());
    for (auto const& g : values)
        result.push_back(g.to_string(format));
    return result;
}

std::vector<ax::guid::byte_array> ax::to_byte_arrays(span<guid const> values, guid_layout layout)
{
    std::vector<guid::byte_array> result;
    result.reserve(values.size());
    for (auto const& g : values)
        result.push_back(g.to_bytes(layout));
    return result;
}

std::vector<ax::guid> ax::sort_ascending(span<guid const> values)
{
    std::vector<guid> result(values.begin(), values.end());
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<ax::guid> ax::sort_descending(span<guid const> values)
{
    std::vector<guid> result(values.begin(), values.end());
    std::sort(result.begin(), result.end(), std::greater<>());
    return result;
}

ax::guid ax::min_guid(span<guid const> values)
{
    impl::check_not_empty(values.size(), "min_guid");
    return *std::min_element(values.begin(), values.end());
}

ax::guid ax::max_guid(span<guid const> values)
{
    impl::check_not_empty(values.size(), "max_guid");
    return *std::max_element(values.begin(), values.end());
}

std::vector<ax::guid> ax::filter_by_version(span<guid const> values, int version)
{
    impl::check_value(version, 1, 5, "filter_by_version", "version");

    std::vector<guid> result;
    for (auto const& g : values)
        if (g.version() == version)
            result.push_back(g);
    return result;
}

std::vector<std::pair<int, std::vector<ax::guid>>> ax::group_by_version(span<guid const> values)
{
    std::vector<std::pair<int, std::vector<guid>>> groups;
    for (auto const& g : values)
    {
        auto const v = g.version();
        auto it = std::find_if(groups.begin(), groups.end(), [&](auto const& entry) { return entry.first == v; });
        if (it == groups.end())
            groups.emplace_back(v, std::vector<guid>{g});
        else
            it->second.push_back(g);
    }
    return groups;
}

std::vector<int> ax::versions(span<guid const> values)
{
    std::vector<int> result;
    result.reserve(values.size());
    for (auto const& g : values)
        result.push_back(g.version());
    return result;
}

ax::isize ax::index_of(span<guid const> values, guid const& g)
{
    auto const it = std::find(values.begin(), values.end(), g);
    return it == values.end() ? -1 : isize(it - values.begin());
}

std::string ax::join_guids(span<guid const> values, std::string_view separator)
{
    std::string result;
    for (isize i = 0; i < values.size(); ++i)
    {
        if (i > 0)
            result += separator;
        result += values[i].to_string();
    }
    return result;
}
