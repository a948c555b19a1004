#pragma once

#include <array>
#include <optional>
#include <string_view>

#include <date/date.h>
#include <fmt/format.h>

// Days of the week, Monday first as in ISO 8601.
enum class Weekday { Mon, Tue, Wed, Thu, Fri, Sat, Sun };

static inline constexpr std::array<Weekday, 7> all_weekdays = {
    {Weekday::Mon, Weekday::Tue, Weekday::Wed, Weekday::Thu, Weekday::Fri, Weekday::Sat, Weekday::Sun}};

// The three letter abbreviation, e.g. "Mon".
[[nodiscard]] std::string_view to_string(Weekday day);
// The full English name, e.g. "Monday".
[[nodiscard]] std::string_view long_name(Weekday day);
// Accepts any case-insensitive prefix of a day's full name ("sun", "Sunday", "W"). Prefixes shared by two days, like
// "t" or "s", don't identify one and are rejected.
[[nodiscard]] std::optional<Weekday> try_parse_weekday(std::string_view name);

[[nodiscard]] date::weekday to_calendar_weekday(Weekday day);
[[nodiscard]] Weekday from_calendar_weekday(date::weekday day);

template <>
struct fmt::formatter<Weekday> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const Weekday day, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(to_string(day), ctx);
    }
};
