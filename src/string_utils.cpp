#include "string_utils.hpp"

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>
#include <range/v3/view/zip.hpp>

namespace {
char to_lower(char c) noexcept { return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c; }
}

bool is_all_digits(std::string_view sv) { return !sv.empty() && ranges::all_of(sv, is_ascii_digit); }

unsigned parse_digits(std::string_view sv) {
    unsigned result = 0;
    for (auto c : sv)
        result = result * 10u + static_cast<unsigned>(c - '0');
    return result;
}

bool has_whitespace(std::string_view sv) { return ranges::any_of(sv, is_ascii_space); }

std::string lower_case(std::string_view str) {
    return str | ranges::views::transform(to_lower) | ranges::to<std::string>;
}

bool matches(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size())
        return false;
    return ranges::all_of(ranges::views::zip(lhs, rhs),
                          [](auto pr) { return to_lower(pr.first) == to_lower(pr.second); });
}

bool matches_start(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() > rhs.size() || lhs.empty())
        return false;
    return matches(lhs, rhs.substr(0, lhs.size()));
}
