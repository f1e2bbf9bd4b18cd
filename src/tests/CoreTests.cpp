// SPDX-License-Identifier: Apache-2.0
#include <core/Error.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Time.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace clockr;
using namespace std::chrono_literals;

TEST_CASE("Error formats as code and message", "[core]")
{
    auto const error = Error { ErrorCode::ApiError, "API error (status 500): boom" };
    CHECK(std::format("{}", error) == "[api] API error (status 500): boom");
    CHECK(errorCodeName(ErrorCode::StorageError) == "storage");
}

TEST_CASE("parseDate accepts strict YYYY-MM-DD only", "[core][time]")
{
    auto const date = parseDate("2025-03-10");
    REQUIRE(date.has_value());
    CHECK(*date == std::chrono::year { 2025 } / 3 / 10);

    CHECK(!parseDate("2025-3-10").has_value());
    CHECK(!parseDate("yesterday").has_value());
    CHECK(!parseDate("2025-02-30").has_value());
    CHECK(parseDate("10/03/2025").error().code == ErrorCode::ParseError);
}

TEST_CASE("parseDateExpression resolves relative dates into the past", "[core][time]")
{
    // 2025-03-12 is a Wednesday.
    auto const today = std::chrono::year { 2025 } / 3 / 12;

    SECTION("absolute dates win")
    {
        CHECK(parseDateExpression("2025-01-02", today).value() == std::chrono::year { 2025 } / 1 / 2);
    }

    SECTION("today, yesterday and day offsets")
    {
        CHECK(parseDateExpression("today", today).value() == today);
        CHECK(parseDateExpression("Yesterday", today).value() == std::chrono::year { 2025 } / 3 / 11);
        CHECK(parseDateExpression("3 days ago", today).value() == std::chrono::year { 2025 } / 3 / 9);
        CHECK(parseDateExpression("1 day ago", today).value() == std::chrono::year { 2025 } / 3 / 11);
    }

    SECTION("weekdays look backwards and never return today")
    {
        CHECK(parseDateExpression("monday", today).value() == std::chrono::year { 2025 } / 3 / 10);
        CHECK(parseDateExpression("last friday", today).value() == std::chrono::year { 2025 } / 3 / 7);
        CHECK(parseDateExpression("Wednesday", today).value() == std::chrono::year { 2025 } / 3 / 5);
        CHECK(parseDateExpression("thursday", today).value() == std::chrono::year { 2025 } / 3 / 6);
    }

    SECTION("month boundaries")
    {
        auto const first = std::chrono::year { 2025 } / 3 / 1;
        CHECK(parseDateExpression("yesterday", first).value() == std::chrono::year { 2025 } / 2 / 28);
    }

    SECTION("unknown phrases are parse errors")
    {
        CHECK(parseDateExpression("next friday", today).error().code == ErrorCode::ParseError);
        CHECK(!parseDateExpression("someday", today).has_value());
        CHECK(!parseDateExpression("x days ago", today).has_value());
        CHECK(!parseDateExpression("", today).has_value());
    }
}

TEST_CASE("parseClockTime accepts H:MM and HH:MM", "[core][time]")
{
    auto const morning = parseClockTime("9:05");
    REQUIRE(morning.has_value());
    CHECK(morning->hour == 9);
    CHECK(morning->minute == 5);

    auto const evening = parseClockTime("17:30");
    REQUIRE(evening.has_value());
    CHECK(evening->minutesOfDay() == 17 * 60 + 30);

    CHECK(!parseClockTime("24:00").has_value());
    CHECK(!parseClockTime("12:60").has_value());
    CHECK(!parseClockTime("1230").has_value());
    CHECK(!parseClockTime("12:3").has_value());
    CHECK(!parseClockTime("").has_value());
}

TEST_CASE("UTC timestamps format and parse with second precision", "[core][time]")
{
    auto const tp = TimePoint { std::chrono::sys_days { std::chrono::year { 2025 } / 3 / 10 } + 14h + 5min + 7s };
    CHECK(formatUtcTimestamp(tp) == "2025-03-10T14:05:07Z");

    auto const parsed = parseUtcTimestamp("2025-03-10T14:05:07Z");
    REQUIRE(parsed.has_value());
    CHECK(*parsed == tp);

    CHECK(!parseUtcTimestamp("2025-03-10 14:05:07").has_value());
    CHECK(!parseUtcTimestamp("2025-03-10T14:05:07+01:00").has_value());
}

TEST_CASE("Local date and time helpers agree with each other", "[core][time]")
{
    auto const date = std::chrono::year_month_day { std::chrono::year { 2025 } / 6 / 4 };
    auto const tp = localTimePoint(date, ClockTime { .hour = 13, .minute = 45 });

    CHECK(localDate(tp) == date);
    CHECK(formatLocalClock(tp) == "13:45");
    CHECK(formatLocalClock(startOfLocalDay(tp)) == "00:00");
    CHECK(localDate(startOfLocalDay(tp)) == date);

    auto const viaText = parseLocalDateTime("2025-06-04", "13:45");
    REQUIRE(viaText.has_value());
    CHECK(*viaText == tp);

    CHECK(!parseLocalDateTime("2025-06-04", "1:2").has_value());
    CHECK(!parseLocalDateTime("06/04/2025", "13:45").has_value());
}

TEST_CASE("Formatting helpers", "[core][time]")
{
    CHECK(formatDate(std::chrono::year { 2025 } / 1 / 2) == "2025-01-02");
    CHECK(formatClockTime(ClockTime { .hour = 7, .minute = 5 }) == "07:05");
    CHECK(formatElapsed(42s) == "42s");
    CHECK(formatElapsed(125s) == "2m 5s");
    CHECK(weekdayName(std::chrono::Monday) == "Monday");
    CHECK(weekdayName(std::chrono::Sunday) == "Sunday");
    CHECK(shortWeekdayName(std::chrono::Wednesday) == "Wed");
}

TEST_CASE("JSON helpers fall back to defaults on missing or mistyped keys", "[core][json]")
{
    auto const doc = json::parse(R"({"name": "x", "count": "7", "days": [1, 2, "three"], "flag": true})");
    REQUIRE(doc.has_value());

    CHECK(json::getStringOr(*doc, "name", "d") == "x");
    CHECK(json::getStringOr(*doc, "missing", "d") == "d");
    CHECK(json::getIntOr(*doc, "count", 3) == 3);
    CHECK(json::getBoolOr(*doc, "flag", false));
    CHECK(!json::getString(*doc, "missing").has_value());

    auto const days = json::getIntArrayOr(*doc, "days", {});
    CHECK(days == std::vector<int> { 1, 2 });
}

TEST_CASE("json::parse reports malformed input", "[core][json]")
{
    auto const doc = json::parse("{not json");
    REQUIRE(!doc.has_value());
    CHECK(doc.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("Log routes messages through the callback and honours the level", "[core][log]")
{
    auto captured = std::vector<std::pair<log::Level, std::string>> {};
    log::setCallback([&](log::Level level, std::string_view message) { captured.emplace_back(level, message); });
    auto const previousLevel = log::getLevel();
    log::setLevel(log::Level::Info);

    log::info("hello {}", 42);
    log::debug("hidden");
    log::warning("careful");

    log::setCallback({});
    log::setLevel(previousLevel);

    REQUIRE(captured.size() == 2);
    CHECK(captured[0].first == log::Level::Info);
    CHECK(captured[0].second == "hello 42");
    CHECK(captured[1].first == log::Level::Warning);
    CHECK(log::levelPrefix(log::Level::Warning) == "WARN ");
}

TEST_CASE("Log writes into a log file while one is set", "[core][log]")
{
    auto const path = std::filesystem::temp_directory_path() / "clockr_test_logs" / "clockr.log";
    std::filesystem::remove_all(path.parent_path());

    REQUIRE(log::setLogFile(path).has_value());
    log::error("written to file");
    log::closeLogFile();

    auto file = std::ifstream(path);
    auto ss = std::stringstream {};
    ss << file.rdbuf();
    CHECK(ss.str().find("[ERROR] written to file") != std::string::npos);

    std::filesystem::remove_all(path.parent_path());
}
