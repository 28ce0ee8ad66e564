#pragma once

#include <arrayx/function_ref.hh>
#include <arrayx/fwd.hh>
#include <arrayx/span.hh>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// =========================================================================================================
// Operations on string arrays
// =========================================================================================================
//
// Classification and case mapping are ASCII only and locale independent (see <arrayx/char_predicates.hh>).
// "Blank" means empty or whitespace only.
// Patterns are ECMAScript regular expressions (std::regex), matched anywhere in the string.
//
// Checks:
//   any_empty(values) / any_blank(values)
//   has_duplicates(values)
//   all_of_length(values, n)
//   any_contains(values, s) / any_starts_with(values, s) / any_ends_with(values, s)
//
// Filtering:
//   remove_empty(values) / remove_blank(values)
//   filter_by_pattern(values, regex) / count_matching(values, regex)
//   unique(values)                            - first occurrences, input order
//
// Transforms (one output string per input string):
//   trim_all, to_upper_all, to_lower_all, reverse_each
//   normalize_whitespace                      - every whitespace run becomes one ' ' (no trimming)
//   capitalize_first_letter                   - first char upper, rest lower, "" stays ""
//   replace_in_all(values, old, new)          - every non-overlapping occurrence, left to right
//   sort_alphabetically                       - ordinal (byte-wise) ascending
//
// Reductions:
//   join(values, sep) / join_non_empty(values, sep)
//   count_substring(values, s)                - non-overlapping occurrences summed over all strings
//   longest(values) / shortest(values)        - first one wins ties, nullopt for empty input
//   aggregate(values, fn)                     - fn(fn(v0, v1), v2) ...
//
// Errors:
//   invalid_argument  - malformed regex, empty search string for count_substring / replace_in_all,
//                       aggregate on empty input
//

namespace ax
{
// checks
[[nodiscard]] bool any_empty(span<std::string const> values);
[[nodiscard]] bool any_blank(span<std::string const> values);
[[nodiscard]] bool has_duplicates(span<std::string const> values);
[[nodiscard]] bool all_of_length(span<std::string const> values, isize length);
[[nodiscard]] bool any_contains(span<std::string const> values, std::string_view substring);
[[nodiscard]] bool any_starts_with(span<std::string const> values, std::string_view prefix);
[[nodiscard]] bool any_ends_with(span<std::string const> values, std::string_view suffix);

// filtering
[[nodiscard]] std::vector<std::string> remove_empty(span<std::string const> values);
[[nodiscard]] std::vector<std::string> remove_blank(span<std::string const> values);
[[nodiscard]] std::vector<std::string> filter_by_pattern(span<std::string const> values, std::string const& pattern);
[[nodiscard]] isize count_matching(span<std::string const> values, std::string const& pattern);
[[nodiscard]] std::vector<std::string> unique(span<std::string const> values);

// transforms
[[nodiscard]] std::vector<std::string> trim_all(span<std::string const> values);
[[nodiscard]] std::vector<std::string> to_upper_all(span<std::string const> values);
[[nodiscard]] std::vector<std::string> to_lower_all(span<std::string const> values);
[[nodiscard]] std::vector<std::string> reverse_each(span<std::string const> values);
[[nodiscard]] std::vector<std::string> normalize_whitespace(span<std::string const> values);
[[nodiscard]] std::vector<std::string> capitalize_first_letter(span<std::string const> values);
[[nodiscard]] std::vector<std::string> replace_in_all(span<std::string const> values, std::string_view old_value, std::string_view new_value);
[[nodiscard]] std::vector<std::string> sort_alphabetically(span<std::string const> values);

// reductions
[[nodiscard]] std::string join(span<std::string const> values, std::string_view separator);
[[nodiscard]] std::string join_non_empty(span<std::string const> values, std::string_view separator);
[[nodiscard]] isize count_substring(span<std::string const> values, std::string_view substring);
[[nodiscard]] std::optional<std::string> longest(span<std::string const> values);
[[nodiscard]] std::optional<std::string> shortest(span<std::string const> values);

/// Left fold seeded with the first string
/// Usage:
///   ax::aggregate(words, [](std::string const& acc, std::string const& w) { return acc + "/" + w; });
[[nodiscard]] std::string aggregate(span<std::string const> values,
                                    function_ref<std::string(std::string const&, std::string const&)> fn);
} // namespace ax
