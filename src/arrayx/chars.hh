#pragma once

#include <arrayx/char_predicates.hh>
#include <arrayx/fwd.hh>
#include <arrayx/span.hh>

#include <map>
#include <string>
#include <utility>
#include <vector>

// =========================================================================================================
// Operations on char arrays
// =========================================================================================================
//
// All classification is ASCII (see <arrayx/char_predicates.hh>), bytes >= 0x80 are never letters, digits, ...
// Any contiguous char range works as input, in particular std::string and std::vector<char>.
//
// Counting:
//   count_vowels, count_consonants, count_digits, count_letters,
//   count_upper, count_lower, count_whitespace, count_punctuation
//
// Transforms (return a new std::vector<char>):
//   to_upper / to_lower
//   remove_whitespace, keep_letters, keep_digits, keep_alphanumeric
//   capitalize_first         - upper-cases the first char if it is a letter
//   to_title_case            - first letter after whitespace upper, other letters lower
//   replace_char(values, from, to)
//   sort_chars / distinct_chars
//
// Queries:
//   as_string(values)
//   most_frequent_char       - ties go to the char seen first
//   char_frequencies         - char -> count
//   find_char_indices(values, c)
//   is_ascii_only / is_char_palindrome
//   group_by_category        - (category, chars) in order of first appearance of the category
//

namespace ax
{
// counting
[[nodiscard]] isize count_vowels(span<char const> values);
[[nodiscard]] isize count_consonants(span<char const> values);
[[nodiscard]] isize count_digits(span<char const> values);
[[nodiscard]] isize count_letters(span<char const> values);
[[nodiscard]] isize count_upper(span<char const> values);
[[nodiscard]] isize count_lower(span<char const> values);
[[nodiscard]] isize count_whitespace(span<char const> values);
[[nodiscard]] isize count_punctuation(span<char const> values);

// transforms
[[nodiscard]] std::vector<char> to_upper(span<char const> values);
[[nodiscard]] std::vector<char> to_lower(span<char const> values);
[[nodiscard]] std::vector<char> remove_whitespace(span<char const> values);
[[nodiscard]] std::vector<char> keep_letters(span<char const> values);
[[nodiscard]] std::vector<char> keep_digits(span<char const> values);
[[nodiscard]] std::vector<char> keep_alphanumeric(span<char const> values);
[[nodiscard]] std::vector<char> capitalize_first(span<char const> values);
[[nodiscard]] std::vector<char> to_title_case(span<char const> values);
[[nodiscard]] std::vector<char> replace_char(span<char const> values, char from, char to);
[[nodiscard]] std::vector<char> sort_chars(span<char const> values);
[[nodiscard]] std::vector<char> distinct_chars(span<char const> values);

// queries
[[nodiscard]] std::string as_string(span<char const> values);
[[nodiscard]] char most_frequent_char(span<char const> values);
[[nodiscard]] std::map<char, isize> char_frequencies(span<char const> values);
[[nodiscard]] std::vector<isize> find_char_indices(span<char const> values, char c);
[[nodiscard]] bool is_ascii_only(span<char const> values);
[[nodiscard]] bool is_char_palindrome(span<char const> values);
[[nodiscard]] std::vector<std::pair<char_category, std::vector<char>>> group_by_category(span<char const> values);
} // namespace ax
