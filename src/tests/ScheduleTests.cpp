// SPDX-License-Identifier: Apache-2.0
#include <clockr/Schedule.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using namespace clockr;
using namespace std::chrono_literals;

namespace
{
auto marchDay(unsigned day) -> std::chrono::year_month_day
{
    return std::chrono::year { 2025 } / std::chrono::March / std::chrono::day { day };
}

auto localAt(unsigned day, int hour, int minute) -> TimePoint
{
    return localTimePoint(marchDay(day), ClockTime { .hour = hour, .minute = minute });
}
} // namespace

TEST_CASE("singleInterval ends now and spans the configured minutes", "[schedule]")
{
    auto const now = localAt(10, 11, 0);
    auto const interval = singleInterval(now, 45);
    CHECK(interval.end == now);
    CHECK(interval.start == now - 45min);
    CHECK(interval.minutes() == 45);
}

TEST_CASE("buildDaySlots keeps configured work days only", "[schedule]")
{
    auto const schedule = ScheduleConfig {};

    // 2025-03-07 is a Friday, 2025-03-11 a Tuesday.
    auto const days = buildDaySlots(marchDay(7), marchDay(11), schedule);
    REQUIRE(days.has_value());
    REQUIRE(days->size() == 3);

    CHECK((*days)[0].date == "2025-03-07");
    CHECK((*days)[0].weekday == "Friday");
    CHECK((*days)[1].date == "2025-03-10");
    CHECK((*days)[1].weekday == "Monday");
    CHECK((*days)[2].date == "2025-03-11");

    CHECK((*days)[1].workStart == localAt(10, 9, 0));
    CHECK((*days)[1].workEnd == localAt(10, 17, 0));
    CHECK((*days)[1].totalMinutes == 480);
}

TEST_CASE("buildDaySlots honours custom hours and days", "[schedule]")
{
    auto schedule = ScheduleConfig {};
    schedule.workStart = "08:30";
    schedule.workEnd = "12:00";
    schedule.workDays = { 6 };

    auto const days = buildDaySlots(marchDay(3), marchDay(16), schedule);
    REQUIRE(days.has_value());
    REQUIRE(days->size() == 2);
    CHECK((*days)[0].date == "2025-03-08");
    CHECK((*days)[1].date == "2025-03-15");
    CHECK((*days)[0].totalMinutes == 210);
}

TEST_CASE("buildDaySlots rejects bad ranges and settings", "[schedule]")
{
    auto schedule = ScheduleConfig {};

    SECTION("reversed range")
    {
        auto const days = buildDaySlots(marchDay(11), marchDay(10), schedule);
        REQUIRE(!days.has_value());
        CHECK(days.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("weekend only")
    {
        auto const days = buildDaySlots(marchDay(8), marchDay(9), schedule);
        REQUIRE(!days.has_value());
        CHECK(days.error().message.find("no work days") != std::string::npos);
    }

    SECTION("more than the batch limit")
    {
        auto const days = buildDaySlots(marchDay(3), marchDay(17), schedule);
        REQUIRE(!days.has_value());
        CHECK(days.error().message.find("batch limited to 10 work days, got 11") != std::string::npos);
    }

    SECTION("exactly the batch limit")
    {
        auto const days = buildDaySlots(marchDay(3), marchDay(14), schedule);
        REQUIRE(days.has_value());
        CHECK(days->size() == MaxBatchDays);
    }

    SECTION("unparsable work hours")
    {
        schedule.workStart = "nine";
        auto const days = buildDaySlots(marchDay(10), marchDay(10), schedule);
        REQUIRE(!days.has_value());
        CHECK(days.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("isWorkTime checks the day and the inclusive hours", "[schedule]")
{
    auto const schedule = ScheduleConfig {};

    CHECK(isWorkTime(localAt(10, 9, 0), schedule));
    CHECK(isWorkTime(localAt(10, 12, 30), schedule));
    CHECK(isWorkTime(localAt(10, 17, 0), schedule));
    CHECK(!isWorkTime(localAt(10, 8, 59), schedule));
    CHECK(!isWorkTime(localAt(10, 17, 1), schedule));
    CHECK(!isWorkTime(localAt(8, 12, 0), schedule));
}

TEST_CASE("nextAlignedTick rounds up to the next interval boundary", "[schedule]")
{
    CHECK(nextAlignedTick(localAt(10, 9, 7), 15) == localAt(10, 9, 15));
    CHECK(nextAlignedTick(localAt(10, 9, 15), 15) == localAt(10, 9, 30));
    CHECK(nextAlignedTick(localAt(10, 9, 50), 15) == localAt(10, 10, 0));
    CHECK(nextAlignedTick(localAt(10, 9, 20), 60) == localAt(10, 10, 0));
    CHECK(nextAlignedTick(localAt(10, 9, 20), 0) == localAt(10, 10, 0));
}
