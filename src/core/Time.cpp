// SPDX-License-Identifier: Apache-2.0
#include <core/Time.hpp>

#include <array>
#include <charconv>
#include <format>
#include <optional>

namespace clockr
{

namespace
{
    constexpr auto WeekdayNames = std::array<std::string_view, 7> {
        "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday",
    };

    /// Parses exactly text.size() decimal digits.
    auto parseDigits(std::string_view text, int& out) -> bool
    {
        if (text.empty())
            return false;
        for (auto const ch: text)
            if (ch < '0' || ch > '9')
                return false;
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        return ec == std::errc {} && ptr == text.data() + text.size();
    }

    auto toLower(std::string_view text) -> std::string
    {
        auto lowered = std::string {};
        lowered.reserve(text.size());
        for (auto const ch: text)
            lowered += (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
        return lowered;
    }

    auto parseWeekday(std::string_view name) -> std::optional<std::chrono::weekday>
    {
        for (auto i = 0u; i < WeekdayNames.size(); ++i)
            if (toLower(WeekdayNames[i]) == name)
                return std::chrono::weekday { i };
        return std::nullopt;
    }
} // namespace

auto parseDate(std::string_view text) -> Result<std::chrono::year_month_day>
{
    auto year = 0;
    auto month = 0;
    auto day = 0;
    if (text.size() != 10 || text[4] != '-' || text[7] != '-' || !parseDigits(text.substr(0, 4), year)
        || !parseDigits(text.substr(5, 2), month) || !parseDigits(text.substr(8, 2), day))
        return makeError(ErrorCode::ParseError, std::format("expected YYYY-MM-DD format, got \"{}\"", text));

    auto const date = std::chrono::year_month_day { std::chrono::year { year },
                                                    std::chrono::month { static_cast<unsigned>(month) },
                                                    std::chrono::day { static_cast<unsigned>(day) } };
    if (!date.ok())
        return makeError(ErrorCode::ParseError, std::format("invalid date \"{}\"", text));
    return date;
}

auto parseDateExpression(std::string_view text, std::chrono::year_month_day today)
    -> Result<std::chrono::year_month_day>
{
    if (auto date = parseDate(text); date)
        return date;

    auto const unknown = [&] {
        return makeError(
            ErrorCode::ParseError,
            std::format("cannot parse date \"{}\" (use YYYY-MM-DD or e.g. 'monday', 'last friday')", text));
    };

    auto const lowered = toLower(text);
    auto expression = std::string_view { lowered };
    while (!expression.empty() && expression.front() == ' ')
        expression.remove_prefix(1);
    while (!expression.empty() && expression.back() == ' ')
        expression.remove_suffix(1);

    auto const base = std::chrono::sys_days { today };
    if (expression == "today")
        return today;
    if (expression == "yesterday")
        return std::chrono::year_month_day { base - std::chrono::days { 1 } };

    if (expression.ends_with(" days ago") || expression.ends_with(" day ago"))
    {
        auto count = 0;
        if (!parseDigits(expression.substr(0, expression.find(' ')), count))
            return unknown();
        return std::chrono::year_month_day { base - std::chrono::days { count } };
    }

    if (expression.starts_with("last "))
        expression.remove_prefix(5);
    auto const weekday = parseWeekday(expression);
    if (!weekday)
        return unknown();

    // Never today: "monday" on a Monday means the previous week's.
    auto back = (std::chrono::weekday { base } - *weekday).count();
    if (back == 0)
        back = 7;
    return std::chrono::year_month_day { base - std::chrono::days { back } };
}

auto parseClockTime(std::string_view text) -> Result<ClockTime>
{
    auto const colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon > 2 || text.size() - colon - 1 != 2)
        return makeError(ErrorCode::ParseError, std::format("expected HH:MM format, got \"{}\"", text));

    auto time = ClockTime {};
    if (!parseDigits(text.substr(0, colon), time.hour) || !parseDigits(text.substr(colon + 1), time.minute))
        return makeError(ErrorCode::ParseError, std::format("expected HH:MM format, got \"{}\"", text));
    if (time.hour > 23 || time.minute > 59)
        return makeError(ErrorCode::ParseError, std::format("time out of range: \"{}\"", text));
    return time;
}

auto parseUtcTimestamp(std::string_view text) -> Result<TimePoint>
{
    // YYYY-MM-DDTHH:MM:SSZ
    if (text.size() != 20 || text[10] != 'T' || text[13] != ':' || text[16] != ':' || text[19] != 'Z')
        return makeError(ErrorCode::ParseError, std::format("invalid UTC timestamp \"{}\"", text));

    auto const date = parseDate(text.substr(0, 10));
    if (!date)
        return std::unexpected(date.error());

    auto hour = 0;
    auto minute = 0;
    auto second = 0;
    if (!parseDigits(text.substr(11, 2), hour) || !parseDigits(text.substr(14, 2), minute)
        || !parseDigits(text.substr(17, 2), second) || hour > 23 || minute > 59 || second > 60)
        return makeError(ErrorCode::ParseError, std::format("invalid UTC timestamp \"{}\"", text));

    return std::chrono::sys_days { *date } + std::chrono::hours { hour } + std::chrono::minutes { minute }
           + std::chrono::seconds { second };
}

auto localTimePoint(std::chrono::year_month_day date, ClockTime time) -> TimePoint
{
    auto const local = std::chrono::local_days { date } + std::chrono::hours { time.hour }
                       + std::chrono::minutes { time.minute };
    return std::chrono::floor<std::chrono::seconds>(
        std::chrono::current_zone()->to_sys(local, std::chrono::choose::earliest));
}

auto parseLocalDateTime(std::string_view date, std::string_view time) -> Result<TimePoint>
{
    auto const day = parseDate(date);
    if (!day)
        return std::unexpected(day.error());
    auto const clock = parseClockTime(time);
    if (!clock)
        return std::unexpected(clock.error());
    return localTimePoint(*day, *clock);
}

auto localDate(TimePoint tp) -> std::chrono::year_month_day
{
    auto const local = std::chrono::current_zone()->to_local(tp);
    return std::chrono::year_month_day { std::chrono::floor<std::chrono::days>(local) };
}

auto startOfLocalDay(TimePoint tp) -> TimePoint
{
    return localTimePoint(localDate(tp), ClockTime {});
}

auto formatDate(std::chrono::year_month_day date) -> std::string
{
    return std::format("{:04}-{:02}-{:02}",
                       static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()),
                       static_cast<unsigned>(date.day()));
}

auto formatUtcTimestamp(TimePoint tp) -> std::string
{
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", tp);
}

auto formatLocalClock(TimePoint tp) -> std::string
{
    auto const local = std::chrono::current_zone()->to_local(tp);
    auto const day = std::chrono::floor<std::chrono::days>(local);
    auto const hms = std::chrono::hh_mm_ss { local - day };
    return std::format("{:02}:{:02}", hms.hours().count(), hms.minutes().count());
}

auto formatClockTime(ClockTime time) -> std::string
{
    return std::format("{:02}:{:02}", time.hour, time.minute);
}

auto formatElapsed(std::chrono::seconds elapsed) -> std::string
{
    auto const total = elapsed.count();
    if (total < 60)
        return std::format("{}s", total);
    return std::format("{}m {}s", total / 60, total % 60);
}

auto weekdayName(std::chrono::weekday day) noexcept -> std::string_view
{
    return WeekdayNames[day.c_encoding() % 7];
}

auto shortWeekdayName(std::chrono::weekday day) noexcept -> std::string_view
{
    return weekdayName(day).substr(0, 3);
}

auto now() -> TimePoint
{
    return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

} // namespace clockr
