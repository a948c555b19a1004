#include "WeekdayCounter.hpp"

#include "common/Logger.hpp"
#include "string_utils.hpp"

namespace {

constexpr auto DaysPerWeek = 7;

Logger &logger() {
    static auto log = logger_for("WeekdayCounter");
    return log;
}

DateParseError error_for(std::string_view text, DateParseError::Reason reason) {
    return DateParseError{std::string(text), reason};
}

}

std::variant<date::sys_days, DateParseError> parse_dmy_date(std::string_view text) {
    if (text.size() != 10 || text[2] != '-' || text[5] != '-')
        return error_for(text, DateParseError::Reason::Malformed);
    const auto day = text.substr(0, 2);
    const auto month = text.substr(3, 2);
    const auto year = text.substr(6, 4);
    if (!is_all_digits(day) || !is_all_digits(month) || !is_all_digits(year))
        return error_for(text, DateParseError::Reason::Malformed);

    const auto ymd = date::year{static_cast<int>(parse_digits(year))} / date::month{parse_digits(month)}
                     / date::day{parse_digits(day)};
    if (!ymd.ok())
        return error_for(text, DateParseError::Reason::NotACalendarDate);
    return date::sys_days{ymd};
}

unsigned count_weekday(date::sys_days from, date::sys_days to, Weekday target) {
    if (from > to)
        return 0;
    const auto span = (to - from).count();
    // Days from `from` until the first `target` on or after it, 0-6.
    const auto first_weekday = date::weekday{from};
    const auto first_offset = (to_calendar_weekday(target) - first_weekday).count();
    const auto count = span < first_offset ? 0u : static_cast<unsigned>((span - first_offset) / DaysPerWeek + 1);
    logger().trace("{} {} day(s) in a range of {} day(s) starting on a {}", count, target, span + 1,
                   from_calendar_weekday(first_weekday));
    return count;
}

std::variant<unsigned, DateParseError> count_weekday(std::string_view date_from, std::string_view date_to,
                                                     Weekday target) {
    const auto from = parse_dmy_date(date_from);
    if (const auto *error = std::get_if<DateParseError>(&from))
        return *error;
    const auto to = parse_dmy_date(date_to);
    if (const auto *error = std::get_if<DateParseError>(&to))
        return *error;
    return count_weekday(std::get<date::sys_days>(from), std::get<date::sys_days>(to), target);
}

std::variant<unsigned, DateParseError> count_sundays(std::string_view date_from, std::string_view date_to) {
    return count_weekday(date_from, date_to, Weekday::Sun);
}
