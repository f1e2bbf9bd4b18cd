// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/Models.hpp>
#include <core/Error.hpp>
#include <core/Time.hpp>

#include "Config.hpp"

#include <chrono>
#include <cstddef>
#include <vector>

namespace clockr
{

/// @brief Upper bound on the number of work days reviewed in one batch.
inline constexpr auto MaxBatchDays = std::size_t { 10 };

/// @brief A closed time range [start, end].
struct Interval
{
    TimePoint start {};
    TimePoint end {};

    [[nodiscard]] auto minutes() const noexcept -> int
    {
        return static_cast<int>(std::chrono::duration_cast<std::chrono::minutes>(end - start).count());
    }
};

/// @brief The interval of @p minutes ending at @p now.
[[nodiscard]] auto singleInterval(TimePoint now, int minutes) -> Interval;

/// @brief One DaySlot per configured work day in the inclusive local date range.
///
/// Fails if the work hours do not parse, if the range contains no work day,
/// or if it contains more than MaxBatchDays work days.
[[nodiscard]] auto buildDaySlots(std::chrono::year_month_day from,
                                 std::chrono::year_month_day to,
                                 ScheduleConfig const& schedule) -> Result<std::vector<ai::DaySlot>>;

/// @brief True if @p tp falls on a work day within the configured work hours (inclusive).
[[nodiscard]] auto isWorkTime(TimePoint tp, ScheduleConfig const& schedule) -> bool;

/// @brief The next local wall-clock instant aligned to a multiple of @p intervalMinutes past the hour.
[[nodiscard]] auto nextAlignedTick(TimePoint now, int intervalMinutes) -> TimePoint;

} // namespace clockr
