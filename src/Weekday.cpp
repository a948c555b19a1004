#include "Weekday.hpp"

#include "string_utils.hpp"

#include <magic_enum.hpp>

#include <stdexcept>

std::string_view to_string(Weekday day) {
    const auto name = magic_enum::enum_name(day);
    if (name.empty())
        throw std::runtime_error(fmt::format("Bad weekday {}", magic_enum::enum_integer(day)));
    return name;
}

std::string_view long_name(Weekday day) {
    using namespace std::literals;
    switch (day) {
    case Weekday::Mon: return "Monday"sv;
    case Weekday::Tue: return "Tuesday"sv;
    case Weekday::Wed: return "Wednesday"sv;
    case Weekday::Thu: return "Thursday"sv;
    case Weekday::Fri: return "Friday"sv;
    case Weekday::Sat: return "Saturday"sv;
    case Weekday::Sun: return "Sunday"sv;
    }
    throw std::runtime_error(fmt::format("Bad weekday {}", magic_enum::enum_integer(day)));
}

std::optional<Weekday> try_parse_weekday(std::string_view name) {
    std::optional<Weekday> found;
    for (auto day : all_weekdays) {
        if (!matches_start(name, long_name(day)))
            continue;
        if (found)
            return {};
        found = day;
    }
    return found;
}

date::weekday to_calendar_weekday(Weekday day) {
    // date::weekday takes 0-6 from Sunday, but also accepts the ISO 7 for Sunday.
    return date::weekday{static_cast<unsigned>(magic_enum::enum_integer(day)) + 1u};
}

Weekday from_calendar_weekday(date::weekday day) {
    if (auto weekday = magic_enum::enum_cast<Weekday>(static_cast<int>(day.iso_encoding()) - 1))
        return *weekday;
    throw std::runtime_error(fmt::format("Bad calendar weekday {}", day.c_encoding()));
}
