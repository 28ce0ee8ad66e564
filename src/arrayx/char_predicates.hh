#pragma once

// =========================================================================================================
// Locale independent character predicates on 'char's
// =========================================================================================================
//
// All text operations of arrayx classify and convert with these, never with <cctype>,
// so results do not depend on the global locale and negative chars are well-defined.
//
// Character classification:
//   is_space(c)         - whitespace character (space, \f, \t, \n, \r, \v)
//   is_digit(c)         - decimal digit ('0' to '9')
//   is_hex_digit(c)     - hexadecimal digit ('0'-'9', 'a'-'f', 'A'-'F')
//   is_letter(c)        - ASCII letter ('a'-'z', 'A'-'Z')
//   is_alphanumeric(c)  - letter or digit
//   is_lower(c)         - lowercase letter ('a' to 'z')
//   is_upper(c)         - uppercase letter ('A' to 'Z')
//   is_vowel(c)         - a, e, i, o, u in either case
//   is_consonant(c)     - letter that is not a vowel
//   is_punctuation(c)   - ASCII punctuation character
//   is_control(c)       - control character
//   is_ascii(c)         - 0x00 to 0x7F
//
// Character conversion:
//   to_lower(c)         - convert uppercase to lowercase (identity if not uppercase)
//   to_upper(c)         - convert lowercase to uppercase (identity if not lowercase)
//   hex_digit_value(c)  - value 0..15 of a hex digit, -1 otherwise
//
// Categories:
//   char_category       - upper, lower, digit, whitespace, punctuation, control, other
//   category_of(c)      - the category of a character
//   to_string(category) - its name
//

namespace ax
{
// =========================================================================================================
// Character classification
// =========================================================================================================

/// Matches: space, form feed, tab, newline, carriage return, vertical tab
/// Usage:
///   if (ax::is_space(' '))  // true
///   if (ax::is_space('a'))  // false
[[nodiscard]] constexpr bool is_space(char c)
{
    return c == ' ' || c == '\f' || c == '\t' || c == '\n' || c == '\r' || c == '\v';
}

[[nodiscard]] constexpr bool is_digit(char c)
{
    return '0' <= c && c <= '9';
}

[[nodiscard]] constexpr bool is_hex_digit(char c)
{
    return ('0' <= c && c <= '9') || ('a' <= c && c <= 'f') || ('A' <= c && c <= 'F');
}

[[nodiscard]] constexpr bool is_lower(char c)
{
    return 'a' <= c && c <= 'z';
}

[[nodiscard]] constexpr bool is_upper(char c)
{
    return 'A' <= c && c <= 'Z';
}

[[nodiscard]] constexpr bool is_letter(char c)
{
    return is_lower(c) || is_upper(c);
}

[[nodiscard]] constexpr bool is_alphanumeric(char c)
{
    return is_digit(c) || is_letter(c);
}

/// Check if a character is an ASCII vowel
/// Matches: a, e, i, o, u (and uppercase). 'y' is a consonant.
[[nodiscard]] constexpr bool is_vowel(char c)
{
    switch (c)
    {
    case 'a':
    case 'e':
    case 'i':
    case 'o':
    case 'u':
    case 'A':
    case 'E':
    case 'I':
    case 'O':
    case 'U':
        return true;
    default:
        return false;
    }
}

[[nodiscard]] constexpr bool is_consonant(char c)
{
    return is_letter(c) && !is_vowel(c);
}

/// Check if a character is punctuation
/// Ranges: 0x21-0x2F, 0x3A-0x40, 0x5B-0x60, 0x7B-0x7E
/// Usage:
///   if (ax::is_punctuation('!'))  // true
///   if (ax::is_punctuation('a'))  // false
[[nodiscard]] constexpr bool is_punctuation(char c)
{
    return ('\x21' <= c && c <= '\x2F') || ('\x3A' <= c && c <= '\x40') || ('\x5B' <= c && c <= '\x60')
        || ('\x7B' <= c && c <= '\x7E');
}

/// Matches: 0x00-0x1F and 0x7F (DEL)
[[nodiscard]] constexpr bool is_control(char c)
{
    return ('\x00' <= c && c <= '\x1F') || c == '\x7F';
}

/// True for 0x00..0x7F, false for the upper half (negative if char is signed)
[[nodiscard]] constexpr bool is_ascii(char c)
{
    return static_cast<unsigned char>(c) <= 0x7F;
}

// =========================================================================================================
// Character conversion
// =========================================================================================================

/// Returns the lowercase equivalent if c is uppercase, otherwise returns c unchanged
/// Usage:
///   char lower = ax::to_lower('A');  // 'a'
///   char same = ax::to_lower('5');   // '5'
[[nodiscard]] constexpr char to_lower(char c)
{
    return is_upper(c) ? char('a' + (c - 'A')) : c;
}

/// Returns the uppercase equivalent if c is lowercase, otherwise returns c unchanged
[[nodiscard]] constexpr char to_upper(char c)
{
    return is_lower(c) ? char('A' + (c - 'a')) : c;
}

/// Usage:
///   ax::hex_digit_value('b')  // 11
///   ax::hex_digit_value('x')  // -1
[[nodiscard]] constexpr int hex_digit_value(char c)
{
    if ('0' <= c && c <= '9')
        return c - '0';
    if ('a' <= c && c <= 'f')
        return 10 + (c - 'a');
    if ('A' <= c && c <= 'F')
        return 10 + (c - 'A');
    return -1;
}

// =========================================================================================================
// Categories
// =========================================================================================================

enum class char_category
{
    upper,
    lower,
    digit,
    whitespace,
    punctuation,
    control,
    other,
};

/// Each char belongs to exactly one category.
/// Whitespace wins over control for \t, \n, \v, \f, \r.
[[nodiscard]] constexpr char_category category_of(char c)
{
    if (is_upper(c))
        return char_category::upper;
    if (is_lower(c))
        return char_category::lower;
    if (is_digit(c))
        return char_category::digit;
    if (is_space(c))
        return char_category::whitespace;
    if (is_punctuation(c))
        return char_category::punctuation;
    if (is_control(c))
        return char_category::control;
    return char_category::other;
}

[[nodiscard]] constexpr char const* to_string(char_category category)
{
    switch (category)
    {
    case char_category::upper:
        return "upper";
    case char_category::lower:
        return "lower";
    case char_category::digit:
        return "digit";
    case char_category::whitespace:
        return "whitespace";
    case char_category::punctuation:
        return "punctuation";
    case char_category::control:
        return "control";
    case char_category::other:
        return "other";
    }
    return "<unknown char_category>";
}

} // namespace ax
