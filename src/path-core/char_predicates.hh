#pragma once

#include <path-core/fwd.hh>

// =========================================================================================================
// Locale independent byte predicates
// =========================================================================================================
//
// All case handling in path-core is ASCII only: bytes >= 0x80 are never folded.
//
// Character classification:
//   is_space(c)            - whitespace character (space, \f, \t, \n, \r, \v)
//   is_lower(c)            - lowercase letter ('a' to 'z')
//   is_upper(c)            - uppercase letter ('A' to 'Z')
//   is_ascii(c)            - byte below the high-bit boundary (< 0x80)
//   is_lower_invariant(c)  - byte equals its lowercase fold
//
// Character conversion:
//   to_lower(c)            - convert uppercase to lowercase (identity if not uppercase)
//   to_upper(c)            - convert lowercase to uppercase (identity if not lowercase)
//
// Predicate functors:
//   equal_case_insensitive         - functor for case-insensitive byte equality
//   compare_ascii_case_sensitive   - functor for unsigned three-way byte comparison
//   compare_ascii_case_insensitive - functor for unsigned three-way comparison of folded bytes
//

namespace pc
{
// =========================================================================================================
// Character classification
// =========================================================================================================

/// Check if a character is whitespace
/// Matches: space, form feed, tab, newline, carriage return, vertical tab
[[nodiscard]] constexpr bool is_space(char c)
{
    return c == ' ' || c == '\f' || c == '\t' || c == '\n' || c == '\r' || c == '\v';
}

/// Check if a character is lowercase
/// Matches: 'a' through 'z'
[[nodiscard]] constexpr bool is_lower(char c)
{
    return 'a' <= c && c <= 'z';
}

/// Check if a character is uppercase
/// Matches: 'A' through 'Z'
[[nodiscard]] constexpr bool is_upper(char c)
{
    return 'A' <= c && c <= 'Z';
}

/// Check if a byte is 7-bit ASCII
/// Usage:
///   pc::is_ascii('a')    // true
///   pc::is_ascii('\xC3') // false
[[nodiscard]] constexpr bool is_ascii(char c)
{
    return u8(c) < 0x80;
}

// =========================================================================================================
// Character conversion
// =========================================================================================================

/// Convert uppercase to lowercase
/// Returns the lowercase equivalent if c is uppercase, otherwise returns c unchanged
[[nodiscard]] constexpr char to_lower(char c)
{
    return is_upper(c) ? char('a' + (c - 'A')) : c;
}

/// Convert lowercase to uppercase
/// Returns the uppercase equivalent if c is lowercase, otherwise returns c unchanged
[[nodiscard]] constexpr char to_upper(char c)
{
    return is_lower(c) ? char('A' + (c - 'a')) : c;
}

/// True if lowercasing leaves the byte unchanged
/// This is what "ASCII lowercase" means for a whole string: digits, '/', '.' and non-ASCII bytes all qualify
/// Usage:
///   pc::is_lower_invariant('a')  // true
///   pc::is_lower_invariant('/')  // true
///   pc::is_lower_invariant('A')  // false
[[nodiscard]] constexpr bool is_lower_invariant(char c)
{
    return !is_upper(c);
}

// =========================================================================================================
// Predicate functors
// =========================================================================================================

/// Functor for case-insensitive byte equality comparison
/// Only handles ASCII letters (a-z, A-Z)
/// Usage:
///   pc::equal_case_insensitive{}('a', 'A')  // true
struct equal_case_insensitive
{
    [[nodiscard]] constexpr bool operator()(char a, char b) const { return to_lower(a) == to_lower(b); }
};

/// Functor for case-sensitive three-way byte comparison
/// Bytes compare as unsigned values, like memcmp
/// Returns:
///   < 0 if a < b
///   0 if a == b
///   > 0 if a > b
struct compare_ascii_case_sensitive
{
    [[nodiscard]] constexpr int operator()(char a, char b) const { return int(u8(a)) - int(u8(b)); }
};

/// Functor for case-insensitive three-way byte comparison
/// Converts both bytes to lowercase, then compares as unsigned values
/// Usage:
///   pc::compare_ascii_case_insensitive{}('A', 'a')  // 0
///   pc::compare_ascii_case_insensitive{}('a', 'B')  // < 0
struct compare_ascii_case_insensitive
{
    [[nodiscard]] constexpr int operator()(char a, char b) const
    {
        return int(u8(to_lower(a))) - int(u8(to_lower(b)));
    }
};

} // namespace pc
