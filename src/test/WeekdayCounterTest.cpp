#include "WeekdayCounter.hpp"

#include "CatchFormatters.hpp"

#include <date/date.h>

using namespace date::literals;

namespace {

unsigned count_of(std::string_view from, std::string_view to, Weekday target) {
    const auto result = count_weekday(from, to, target);
    REQUIRE(std::holds_alternative<unsigned>(result));
    return std::get<unsigned>(result);
}

DateParseError error_of(std::string_view from, std::string_view to) {
    const auto result = count_weekday(from, to, Weekday::Sun);
    REQUIRE(std::holds_alternative<DateParseError>(result));
    return std::get<DateParseError>(result);
}

}

TEST_CASE("date parsing") {
    SECTION("should parse dd-mm-yyyy") {
        const auto parsed = parse_dmy_date("01-05-2021");
        REQUIRE(std::holds_alternative<date::sys_days>(parsed));
        CHECK(std::get<date::sys_days>(parsed) == date::sys_days{2021_y / date::May / 1_d});
    }
    SECTION("should accept leap days") {
        CHECK(std::holds_alternative<date::sys_days>(parse_dmy_date("29-02-2020")));
        CHECK(std::holds_alternative<date::sys_days>(parse_dmy_date("29-02-2000")));
    }
    SECTION("should reject the wrong shape") {
        auto text = GENERATE("1-5-2021", "01/05/2021", "2021-05-01", "01-05-21", "", "0a-05-2021", "01-05-2021 ",
                             " 01-05-2021", "+1-05-2021", "01-05-20x1");
        const auto parsed = parse_dmy_date(text);
        REQUIRE(std::holds_alternative<DateParseError>(parsed));
        CHECK(std::get<DateParseError>(parsed) == DateParseError{text, DateParseError::Reason::Malformed});
    }
    SECTION("should reject days that don't exist") {
        auto text = GENERATE("31-02-2021", "29-02-2021", "29-02-1900", "00-05-2021", "32-01-2021", "01-00-2021",
                             "01-13-2021", "31-04-2021");
        const auto parsed = parse_dmy_date(text);
        REQUIRE(std::holds_alternative<DateParseError>(parsed));
        CHECK(std::get<DateParseError>(parsed) == DateParseError{text, DateParseError::Reason::NotACalendarDate});
    }
    SECTION("should describe errors") {
        CHECK(fmt::to_string(DateParseError{"1-5-2021", DateParseError::Reason::Malformed})
              == "'1-5-2021' is not a date of the form dd-mm-yyyy");
        CHECK(fmt::to_string(DateParseError{"31-02-2021", DateParseError::Reason::NotACalendarDate})
              == "'31-02-2021' is not a valid calendar date");
    }
}

TEST_CASE("counting weekdays") {
    SECTION("sundays in May 2021") {
        CHECK(count_of("01-05-2021", "30-05-2021", Weekday::Sun) == 5);
        CHECK(std::get<unsigned>(count_sundays("01-05-2021", "30-05-2021")) == 5);
    }
    SECTION("every weekday in May 2021") {
        auto [target, expected] = GENERATE(table<Weekday, unsigned>({{Weekday::Mon, 4},
                                                                     {Weekday::Tue, 4},
                                                                     {Weekday::Wed, 4},
                                                                     {Weekday::Thu, 4},
                                                                     {Weekday::Fri, 4},
                                                                     {Weekday::Sat, 5},
                                                                     {Weekday::Sun, 5}}));
        CHECK(count_of("01-05-2021", "30-05-2021", target) == expected);
    }
    SECTION("a partial fortnight") {
        auto [target, expected] = GENERATE(table<Weekday, unsigned>({{Weekday::Mon, 2},
                                                                     {Weekday::Tue, 2},
                                                                     {Weekday::Wed, 2},
                                                                     {Weekday::Thu, 2},
                                                                     {Weekday::Fri, 1},
                                                                     {Weekday::Sat, 2},
                                                                     {Weekday::Sun, 2}}));
        CHECK(count_of("01-05-2021", "13-05-2021", target) == expected);
    }
    SECTION("a single week has one of each") {
        for (auto day : all_weekdays)
            CHECK(count_of("01-05-2021", "07-05-2021", day) == 1);
    }
    SECTION("a single day counts only its own weekday") {
        // 1st May 2021 was a Saturday.
        for (auto day : all_weekdays)
            CHECK(count_of("01-05-2021", "01-05-2021", day) == (day == Weekday::Sat ? 1u : 0u));
    }
    SECTION("a reversed range is empty") {
        for (auto day : all_weekdays)
            CHECK(count_of("02-05-2021", "01-05-2021", day) == 0);
    }
    SECTION("ranges crossing a year end") {
        CHECK(count_of("25-12-2020", "10-01-2021", Weekday::Fri) == 3);
        CHECK(count_of("25-12-2020", "10-01-2021", Weekday::Sun) == 3);
        CHECK(count_of("25-12-2020", "10-01-2021", Weekday::Mon) == 2);
    }
    SECTION("a whole year") {
        // 2021 started and ended on a Friday.
        CHECK(count_of("01-01-2021", "31-12-2021", Weekday::Fri) == 53);
        CHECK(count_of("01-01-2021", "31-12-2021", Weekday::Sat) == 52);
    }
    SECTION("a leap year February") {
        CHECK(count_of("01-02-2020", "29-02-2020", Weekday::Sat) == 5);
        CHECK(count_of("01-02-2020", "29-02-2020", Weekday::Sun) == 4);
    }
    SECTION("decades") {
        // 3652 days: 521 whole weeks and 5 days, from a Friday.
        CHECK(count_of("01-01-2010", "31-12-2019", Weekday::Fri) == 522);
        CHECK(count_of("01-01-2010", "31-12-2019", Weekday::Thu) == 521);
    }
    SECTION("parsed days") {
        CHECK(count_weekday(date::sys_days{2021_y / date::May / 1_d}, date::sys_days{2021_y / date::May / 30_d},
                            Weekday::Sun)
              == 5);
    }
}

TEST_CASE("counting weekdays with bad dates") {
    SECTION("a malformed start") {
        CHECK(error_of("1-5-2021", "30-05-2021") == DateParseError{"1-5-2021", DateParseError::Reason::Malformed});
    }
    SECTION("an impossible end") {
        CHECK(error_of("01-02-2021", "31-02-2021")
              == DateParseError{"31-02-2021", DateParseError::Reason::NotACalendarDate});
    }
    SECTION("the start is reported first") {
        CHECK(error_of("31-02-2021", "xx").text == "31-02-2021");
    }
    SECTION("even a reversed range needs valid dates") {
        CHECK(error_of("30-05-2021", "1-5-2021").reason == DateParseError::Reason::Malformed);
    }
}
