#include "chars.hh"

#include <arrayx/error.hh>
#include <arrayx/query.hh>

#include <algorithm>

namespace
{
template <class Pred>
ax::isize count_if(ax::span<char const> values, Pred pred)
{
    return ax::isize(std::count_if(values.begin(), values.end(), pred));
}

template <class Pred>
std::vector<char> keep_if(ax::span<char const> values, Pred pred)
{
    std::vector<char> result;
    for (auto c : values)
        if (pred(c))
            result.push_back(c);
    return result;
}

template <class F>
std::vector<char> map_chars(ax::span<char const> values, F fn)
{
    std::vector<char> result;
    result.reserve(values.size());
    for (auto c : values)
        result.push_back(fn(c));
    return result;
}
} // namespace

ax::isize ax::count_vowels(span<char const> values) { return count_if(values, is_vowel); }
ax::isize ax::count_consonants(span<char const> values) { return count_if(values, is_consonant); }
ax::isize ax::count_digits(span<char const> values) { return count_if(values, is_digit); }
ax::isize ax::count_letters(span<char const> values) { return count_if(values, is_letter); }
ax::isize ax::count_upper(span<char const> values) { return count_if(values, is_upper); }
ax::isize ax::count_lower(span<char const> values) { return count_if(values, is_lower); }
ax::isize ax::count_whitespace(span<char const> values) { return count_if(values, is_space); }
ax::isize ax::count_punctuation(span<char const> values) { return count_if(values, is_punctuation); }

std::vector<char> ax::to_upper(span<char const> values)
{
    return map_chars(values, [](char c) { return to_upper(c); });
}

std::vector<char> ax::to_lower(span<char const> values)
{
    return map_chars(values, [](char c) { return to_lower(c); });
}

std::vector<char> ax::remove_whitespace(span<char const> values)
{
    return keep_if(values, [](char c) { return !is_space(c); });
}

std::vector<char> ax::keep_letters(span<char const> values) { return keep_if(values, is_letter); }
std::vector<char> ax::keep_digits(span<char const> values) { return keep_if(values, is_digit); }
std::vector<char> ax::keep_alphanumeric(span<char const> values) { return keep_if(values, is_alphanumeric); }

std::vector<char> ax::capitalize_first(span<char const> values)
{
    std::vector<char> result(values.begin(), values.end());
    if (!result.empty() && is_letter(result[0]))
        result[0] = to_upper(result[0]);
    return result;
}

std::vector<char> ax::to_title_case(span<char const> values)
{
    std::vector<char> result;
    result.reserve(values.size());

    // digits and punctuation pass through without ending the word start
    auto at_word_start = true;
    for (auto c : values)
    {
        if (is_space(c))
        {
            result.push_back(c);
            at_word_start = true;
        }
        else if (is_letter(c))
        {
            result.push_back(at_word_start ? to_upper(c) : to_lower(c));
            at_word_start = false;
        }
        else
            result.push_back(c);
    }
    return result;
}

std::vector<char> ax::replace_char(span<char const> values, char from, char to)
{
    return map_chars(values, [&](char c) { return c == from ? to : c; });
}

std::vector<char> ax::sort_chars(span<char const> values)
{
    std::vector<char> result(values.begin(), values.end());
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<char> ax::distinct_chars(span<char const> values)
{
    bool seen[256] = {};
    std::vector<char> result;
    for (auto c : values)
    {
        auto& s = seen[static_cast<unsigned char>(c)];
        if (!s)
            result.push_back(c);
        s = true;
    }
    return result;
}

std::string ax::as_string(span<char const> values) { return std::string(values.data(), values.size()); }

char ax::most_frequent_char(span<char const> values)
{
    impl::check_not_empty(values.size(), "most_frequent_char");
    return most_common(values);
}

std::map<char, ax::isize> ax::char_frequencies(span<char const> values)
{
    std::map<char, isize> result;
    for (auto c : values)
        ++result[c];
    return result;
}

std::vector<ax::isize> ax::find_char_indices(span<char const> values, char c)
{
    std::vector<isize> result;
    for (isize i = 0; i < values.size(); ++i)
        if (values[i] == c)
            result.push_back(i);
    return result;
}

bool ax::is_ascii_only(span<char const> values)
{
    return std::all_of(values.begin(), values.end(), is_ascii);
}

bool ax::is_char_palindrome(span<char const> values)
{
    return is_palindrome(values);
}

std::vector<std::pair<ax::char_category, std::vector<char>>> ax::group_by_category(span<char const> values)
{
    std::vector<std::pair<char_category, std::vector<char>>> groups;
    for (auto c : values)
    {
        auto const category = category_of(c);
        auto it = std::find_if(groups.begin(), groups.end(), [&](auto const& g) { return g.first == category; });
        if (it == groups.end())
            groups.emplace_back(category, std::vector<char>{c});
        else
            it->second.push_back(c);
    }
    return groups;
}
