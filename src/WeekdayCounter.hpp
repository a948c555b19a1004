#pragma once

#include "Weekday.hpp"

#include <string>
#include <string_view>
#include <variant>

#include <date/date.h>
#include <fmt/format.h>

// Why a date string was rejected by parse_dmy_date().
struct DateParseError {
    enum class Reason {
        // Not two digits, '-', two digits, '-', four digits.
        Malformed,
        // The right shape, but no such day, e.g. 31-02-2021.
        NotACalendarDate
    };
    std::string text;
    Reason reason{Reason::Malformed};

    bool operator==(const DateParseError &) const = default;
};

template <>
struct fmt::formatter<DateParseError> {
    constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }
    template <typename FormatContext>
    auto format(const DateParseError &error, FormatContext &ctx) const {
        switch (error.reason) {
        case DateParseError::Reason::Malformed:
            return fmt::format_to(ctx.out(), "'{}' is not a date of the form dd-mm-yyyy", error.text);
        case DateParseError::Reason::NotACalendarDate:
            return fmt::format_to(ctx.out(), "'{}' is not a valid calendar date", error.text);
        }
        return fmt::format_to(ctx.out(), "'{}' could not be parsed", error.text);
    }
};

// Parses a date written as dd-mm-yyyy. Leading zeros are required: "1-5-2021" is malformed.
[[nodiscard]] std::variant<date::sys_days, DateParseError> parse_dmy_date(std::string_view text);

// Counts the days in the inclusive range [from, to] that fall on target. An empty range (from after to) has none.
[[nodiscard]] unsigned count_weekday(date::sys_days from, date::sys_days to, Weekday target);
[[nodiscard]] std::variant<unsigned, DateParseError> count_weekday(std::string_view date_from, std::string_view date_to,
                                                                   Weekday target);
[[nodiscard]] std::variant<unsigned, DateParseError> count_sundays(std::string_view date_from,
                                                                   std::string_view date_to);
