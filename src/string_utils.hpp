#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Character classes for the ASCII-only grammars used when classifying form input. Unlike <cctype> these are safe for
// negative (non-ASCII) chars and ignore the current locale.
[[nodiscard]] constexpr bool is_ascii_digit(const char c) noexcept { return c >= '0' && c <= '9'; }
[[nodiscard]] constexpr bool is_ascii_space(const char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Returns true if the string is non-empty and consists only of the digits 0-9. No sign is permitted.
[[nodiscard]] bool is_all_digits(std::string_view sv);
// Parses a string of digits. The caller must have checked is_all_digits(); the result is unspecified otherwise.
[[nodiscard]] unsigned parse_digits(std::string_view sv);
// Returns true if any character is whitespace.
[[nodiscard]] bool has_whitespace(std::string_view sv);

// Returns the string, lower-cased.
[[nodiscard]] std::string lower_case(std::string_view str);

// Compares two strings: are they referring to the same thing. That currently means "case insensitive comparison".
[[nodiscard]] bool matches(std::string_view lhs, std::string_view rhs);

// Similar to matches() but checks if rhs starts with lhs, case insensitively.
// lhs must be at least one character long and must not be longer than rhs.
[[nodiscard]] bool matches_start(std::string_view lhs, std::string_view rhs);
