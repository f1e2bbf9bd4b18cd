// SPDX-License-Identifier: Apache-2.0
#include "Schedule.hpp"

#include <algorithm>
#include <format>

namespace clockr
{

namespace
{
    auto isoWeekday(std::chrono::year_month_day date) -> int
    {
        return static_cast<int>(std::chrono::weekday { std::chrono::sys_days { date } }.iso_encoding());
    }

    auto isWorkDay(std::chrono::year_month_day date, ScheduleConfig const& schedule) -> bool
    {
        return std::ranges::find(schedule.workDays, isoWeekday(date)) != schedule.workDays.end();
    }
} // namespace

auto singleInterval(TimePoint now, int minutes) -> Interval
{
    return Interval { .start = now - std::chrono::minutes(minutes), .end = now };
}

auto buildDaySlots(std::chrono::year_month_day from,
                   std::chrono::year_month_day to,
                   ScheduleConfig const& schedule) -> Result<std::vector<ai::DaySlot>>
{
    auto const workStart = parseClockTime(schedule.workStart);
    if (!workStart)
        return makeError(ErrorCode::ConfigError, std::format("parsing work_start: {}", workStart.error().message));

    auto const workEnd = parseClockTime(schedule.workEnd);
    if (!workEnd)
        return makeError(ErrorCode::ConfigError, std::format("parsing work_end: {}", workEnd.error().message));

    auto const first = std::chrono::sys_days { from };
    auto const last = std::chrono::sys_days { to };
    if (last < first)
        return makeError(ErrorCode::InvalidArgument, "--to date must be on or after --from date");

    auto days = std::vector<ai::DaySlot> {};
    for (auto day = first; day <= last; day += std::chrono::days { 1 })
    {
        auto const date = std::chrono::year_month_day { day };
        if (!isWorkDay(date, schedule))
            continue;

        auto slot = ai::DaySlot {};
        slot.date = formatDate(date);
        slot.weekday = std::string(weekdayName(std::chrono::weekday { day }));
        slot.workStart = localTimePoint(date, *workStart);
        slot.workEnd = localTimePoint(date, *workEnd);
        slot.totalMinutes = static_cast<int>(
            std::chrono::duration_cast<std::chrono::minutes>(slot.workEnd - slot.workStart).count());
        days.push_back(std::move(slot));
    }

    if (days.empty())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("no work days in the range {} to {} (check work_days config)",
                                     formatDate(from),
                                     formatDate(to)));

    if (days.size() > MaxBatchDays)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("batch limited to {} work days, got {} (narrow the date range)",
                                     MaxBatchDays,
                                     days.size()));

    return days;
}

auto isWorkTime(TimePoint tp, ScheduleConfig const& schedule) -> bool
{
    if (!isWorkDay(localDate(tp), schedule))
        return false;

    // Unparsable work hours fall back to 09:00-17:00.
    auto const start = parseClockTime(schedule.workStart).value_or(ClockTime { .hour = 9, .minute = 0 });
    auto const end = parseClockTime(schedule.workEnd).value_or(ClockTime { .hour = 17, .minute = 0 });

    auto const local = std::chrono::current_zone()->to_local(tp);
    auto const sinceMidnight = std::chrono::duration_cast<std::chrono::minutes>(
        local - std::chrono::floor<std::chrono::days>(local));
    auto const nowMinutes = static_cast<int>(sinceMidnight.count());

    return nowMinutes >= start.minutesOfDay() && nowMinutes <= end.minutesOfDay();
}

auto nextAlignedTick(TimePoint now, int intervalMinutes) -> TimePoint
{
    auto const step = intervalMinutes > 0 ? intervalMinutes : 60;

    auto const* const zone = std::chrono::current_zone();
    auto const local = zone->to_local(now);
    auto const hourStart = std::chrono::floor<std::chrono::hours>(local);
    auto const minute =
        static_cast<int>(std::chrono::duration_cast<std::chrono::minutes>(local - hourStart).count());
    auto const nextMinute = ((minute / step) + 1) * step;

    auto const next = hourStart + std::chrono::minutes(nextMinute);
    return std::chrono::floor<std::chrono::seconds>(zone->to_sys(next, std::chrono::choose::earliest));
}

} // namespace clockr
