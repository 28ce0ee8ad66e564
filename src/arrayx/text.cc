#include "text.hh"

#include <arrayx/char_predicates.hh>
#include <arrayx/error.hh>
#include <arrayx/set_ops.hh>

#include <algorithm>
#include <regex>

namespace
{
bool is_blank_string(std::string_view s)
{
    return std::all_of(s.begin(), s.end(), [](char c) { return ax::is_space(c); });
}

std::regex compile_pattern(std::string const& pattern, char const* operation)
{
    try
    {
        return std::regex(pattern, std::regex::ECMAScript);
    }
    catch (std::regex_error const& e)
    {
        ax::impl::raise_error(ax::error_kind::invalid_argument,
                              std::string(operation) + ": invalid pattern '" + pattern + "': " + e.what(),
                              ax::source_location::current());
    }
}

std::string trim(std::string_view s)
{
    auto begin = ax::isize(0);
    auto end = ax::isize(s.size());
    while (begin < end && ax::is_space(s[begin]))
        ++begin;
    while (end > begin && ax::is_space(s[end - 1]))
        --end;
    return std::string(s.substr(begin, end - begin));
}

// calls fn(string) for every input and collects the results
template <class F>
std::vector<std::string> map_strings(ax::span<std::string const> values, F&& fn)
{
    std::vector<std::string> result;
    result.reserve(values.size());
    for (auto const& s : values)
        result.push_back(fn(s));
    return result;
}
} // namespace

// =========================================================================================================
// Checks
// =========================================================================================================

bool ax::any_empty(span<std::string const> values)
{
    return std::any_of(values.begin(), values.end(), [](std::string const& s) { return s.empty(); });
}

bool ax::any_blank(span<std::string const> values)
{
    return std::any_of(values.begin(), values.end(), [](std::string const& s) { return is_blank_string(s); });
}

bool ax::has_duplicates(span<std::string const> values)
{
    impl::seen_set<std::string> seen;
    for (auto const& s : values)
        if (!seen.insert(s))
            return true;
    return false;
}

bool ax::all_of_length(span<std::string const> values, isize length)
{
    return std::all_of(values.begin(), values.end(), [&](std::string const& s) { return isize(s.size()) == length; });
}

bool ax::any_contains(span<std::string const> values, std::string_view substring)
{
    return std::any_of(values.begin(), values.end(),
                       [&](std::string const& s) { return s.find(substring) != std::string::npos; });
}

bool ax::any_starts_with(span<std::string const> values, std::string_view prefix)
{
    return std::any_of(values.begin(), values.end(), [&](std::string const& s) { return s.starts_with(prefix); });
}

bool ax::any_ends_with(span<std::string const> values, std::string_view suffix)
{
    return std::any_of(values.begin(), values.end(), [&](std::string const& s) { return s.ends_with(suffix); });
}

// =========================================================================================================
// Filtering
// =========================================================================================================

std::vector<std::string> ax::remove_empty(span<std::string const> values)
{
    std::vector<std::string> result;
    for (auto const& s : values)
        if (!s.empty())
            result.push_back(s);
    return result;
}

std::vector<std::string> ax::remove_blank(span<std::string const> values)
{
    std::vector<std::string> result;
    for (auto const& s : values)
        if (!is_blank_string(s))
            result.push_back(s);
    return result;
}

std::vector<std::string> ax::filter_by_pattern(span<std::string const> values, std::string const& pattern)
{
    auto const re = compile_pattern(pattern, "filter_by_pattern");
    std::vector<std::string> result;
    for (auto const& s : values)
        if (std::regex_search(s, re))
            result.push_back(s);
    return result;
}

ax::isize ax::count_matching(span<std::string const> values, std::string const& pattern)
{
    auto const re = compile_pattern(pattern, "count_matching");
    isize count = 0;
    for (auto const& s : values)
        if (std::regex_search(s, re))
            ++count;
    return count;
}

std::vector<std::string> ax::unique(span<std::string const> values)
{
    return distinct(values);
}

// =========================================================================================================
// Transforms
// =========================================================================================================

std::vector<std::string> ax::trim_all(span<std::string const> values)
{
    return map_strings(values, [](std::string const& s) { return trim(s); });
}

std::vector<std::string> ax::to_upper_all(span<std::string const> values)
{
    return map_strings(values,
                       [](std::string s)
                       {
                           for (auto& c : s)
                               c = to_upper(c);
                           return s;
                       });
}

std::vector<std::string> ax::to_lower_all(span<std::string const> values)
{
    return map_strings(values,
                       [](std::string s)
                       {
                           for (auto& c : s)
                               c = to_lower(c);
                           return s;
                       });
}

std::vector<std::string> ax::reverse_each(span<std::string const> values)
{
    return map_strings(values, [](std::string const& s) { return std::string(s.rbegin(), s.rend()); });
}

std::vector<std::string> ax::normalize_whitespace(span<std::string const> values)
{
    return map_strings(values,
                       [](std::string const& s)
                       {
                           std::string out;
                           out.reserve(s.size());
                           auto in_run = false;
                           for (auto c : s)
                           {
                               if (is_space(c))
                               {
                                   if (!in_run)
                                       out += ' ';
                                   in_run = true;
                               }
                               else
                               {
                                   out += c;
                                   in_run = false;
                               }
                           }
                           return out;
                       });
}

std::vector<std::string> ax::capitalize_first_letter(span<std::string const> values)
{
    return map_strings(values,
                       [](std::string s)
                       {
                           for (auto i = 0u; i < s.size(); ++i)
                               s[i] = i == 0 ? to_upper(s[i]) : to_lower(s[i]);
                           return s;
                       });
}

std::vector<std::string> ax::replace_in_all(span<std::string const> values, std::string_view old_value, std::string_view new_value)
{
    if (old_value.empty())
        impl::raise_error(error_kind::invalid_argument, "replace_in_all: search string must not be empty", ax::source_location::current());

    return map_strings(values,
                       [&](std::string const& s)
                       {
                           std::string out;
                           size_t pos = 0;
                           while (true)
                           {
                               auto const hit = s.find(old_value, pos);
                               if (hit == std::string::npos)
                                   break;
                               out.append(s, pos, hit - pos);
                               out += new_value;
                               pos = hit + old_value.size();
                           }
                           out.append(s, pos);
                           return out;
                       });
}

std::vector<std::string> ax::sort_alphabetically(span<std::string const> values)
{
    std::vector<std::string> result(values.begin(), values.end());
    std::sort(result.begin(), result.end());
    return result;
}

// =========================================================================================================
// Reductions
// =========================================================================================================

std::string ax::join(span<std::string const> values, std::string_view separator)
{
    std::string result;
    for (isize i = 0; i < values.size(); ++i)
    {
        if (i > 0)
            result += separator;
        result += values[i];
    }
    return result;
}

std::string ax::join_non_empty(span<std::string const> values, std::string_view separator)
{
    return join(remove_empty(values), separator);
}

ax::isize ax::count_substring(span<std::string const> values, std::string_view substring)
{
    if (substring.empty())
        impl::raise_error(error_kind::invalid_argument, "count_substring: search string must not be empty", ax::source_location::current());

    isize count = 0;
    for (auto const& s : values)
        for (auto pos = s.find(substring); pos != std::string::npos; pos = s.find(substring, pos + substring.size()))
            ++count;
    return count;
}

std::optional<std::string> ax::longest(span<std::string const> values)
{
    if (values.empty())
        return std::nullopt;

    auto const* best = &values[0];
    for (auto const& s : values)
        if (s.size() > best->size())
            best = &s;
    return *best;
}

std::optional<std::string> ax::shortest(span<std::string const> values)
{
    if (values.empty())
        return std::nullopt;

    auto const* best = &values[0];
    for (auto const& s : values)
        if (s.size() < best->size())
            best = &s;
    return *best;
}

std::string ax::aggregate(span<std::string const> values, function_ref<std::string(std::string const&, std::string const&)> fn)
{
    impl::check_not_empty(values.size(), "aggregate");

    std::string acc = values[0];
    for (isize i = 1; i < values.size(); ++i)
        acc = fn(acc, values[i]);
    return acc;
}
