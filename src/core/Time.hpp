// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace clockr
{

/// @brief Instant in time with second precision (UTC based).
using TimePoint = std::chrono::sys_seconds;

/// @brief Wall-clock time of day without a date.
struct ClockTime
{
    int hour = 0;
    int minute = 0;

    [[nodiscard]] constexpr auto minutesOfDay() const noexcept -> int { return hour * 60 + minute; }

    constexpr auto operator<=>(ClockTime const&) const = default;
};

/// @brief Parses a calendar date in strict YYYY-MM-DD form.
[[nodiscard]] auto parseDate(std::string_view text) -> Result<std::chrono::year_month_day>;

/// @brief Parses a date given either as YYYY-MM-DD or as a past-relative expression.
///
/// Relative forms, case-insensitive and resolved against @p today:
/// "today", "yesterday", "N days ago", a weekday name ("monday") and
/// "last <weekday>". Weekdays resolve to the most recent such day strictly before @p today.
[[nodiscard]] auto parseDateExpression(std::string_view text, std::chrono::year_month_day today)
    -> Result<std::chrono::year_month_day>;

/// @brief Parses a time of day in H:MM or HH:MM form (24h).
[[nodiscard]] auto parseClockTime(std::string_view text) -> Result<ClockTime>;

/// @brief Parses a UTC timestamp in YYYY-MM-DDTHH:MM:SSZ form.
[[nodiscard]] auto parseUtcTimestamp(std::string_view text) -> Result<TimePoint>;

/// @brief Combines a date and a time of day in the local time zone into an instant.
///
/// Non-existent local times (DST gaps) resolve to the earliest valid mapping.
[[nodiscard]] auto localTimePoint(std::chrono::year_month_day date, ClockTime time) -> TimePoint;

/// @brief Parses a local "YYYY-MM-DD" date and "HH:MM" time into an instant.
[[nodiscard]] auto parseLocalDateTime(std::string_view date, std::string_view time) -> Result<TimePoint>;

/// @brief Returns the local calendar date of an instant.
[[nodiscard]] auto localDate(TimePoint tp) -> std::chrono::year_month_day;

/// @brief Returns the instant of local midnight starting the day containing @p tp.
[[nodiscard]] auto startOfLocalDay(TimePoint tp) -> TimePoint;

/// @brief Formats a date as YYYY-MM-DD.
[[nodiscard]] auto formatDate(std::chrono::year_month_day date) -> std::string;

/// @brief Formats an instant as UTC YYYY-MM-DDTHH:MM:SSZ.
[[nodiscard]] auto formatUtcTimestamp(TimePoint tp) -> std::string;

/// @brief Formats the local time of day of an instant as HH:MM.
[[nodiscard]] auto formatLocalClock(TimePoint tp) -> std::string;

/// @brief Formats a time of day as HH:MM.
[[nodiscard]] auto formatClockTime(ClockTime time) -> std::string;

/// @brief Formats a waiting duration as "Xs" or "Xm Ys".
[[nodiscard]] auto formatElapsed(std::chrono::seconds elapsed) -> std::string;

/// @brief English weekday name ("Monday").
[[nodiscard]] auto weekdayName(std::chrono::weekday day) noexcept -> std::string_view;

/// @brief Three-letter English weekday name ("Mon").
[[nodiscard]] auto shortWeekdayName(std::chrono::weekday day) noexcept -> std::string_view;

/// @brief Current instant truncated to seconds.
[[nodiscard]] auto now() -> TimePoint;

} // namespace clockr
