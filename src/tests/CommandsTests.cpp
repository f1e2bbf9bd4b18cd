// SPDX-License-Identifier: Apache-2.0
#include <clockr/Commands.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using namespace clockr;

namespace
{
auto localAt(unsigned day, int hour, int minute) -> TimePoint
{
    return localTimePoint(std::chrono::year { 2025 } / std::chrono::March / std::chrono::day { day },
                          ClockTime { .hour = hour, .minute = minute });
}

auto sampleEntry() -> store::Entry
{
    return store::Entry {
        .clockifyId = "ce-1",
        .projectId = "p1",
        .projectName = "Alpha",
        .clientName = "Acme",
        .description = "Login fix",
        .start = localAt(10, 9, 0),
        .end = localAt(10, 9, 45),
        .minutes = 45,
    };
}
} // namespace

TEST_CASE("validateLogOptions rejects contradictory flags", "[commands]")
{
    CHECK(validateLogOptions(LogOptions {}).has_value());
    CHECK(validateLogOptions(LogOptions { .repeat = true, .text = "prefill" }).has_value());
    CHECK(validateLogOptions(LogOptions { .from = "2025-03-10", .to = "2025-03-14" }).has_value());

    SECTION("half a range")
    {
        auto const result = validateLogOptions(LogOptions { .from = "2025-03-10" });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
        CHECK(result.error().message == "both --from and --to must be provided together");
        CHECK(!validateLogOptions(LogOptions { .to = "2025-03-10" }).has_value());
    }

    SECTION("--same with a range")
    {
        auto const result =
            validateLogOptions(LogOptions { .same = true, .from = "2025-03-10", .to = "2025-03-14" });
        REQUIRE(!result.has_value());
        CHECK(result.error().message == "--same cannot be combined with --from/--to");
    }

    SECTION("--same with --repeat")
    {
        auto const result = validateLogOptions(LogOptions { .same = true, .repeat = true });
        REQUIRE(!result.has_value());
        CHECK(result.error().message == "--same cannot be combined with --repeat");
    }
}

TEST_CASE("LogOptions::isBatch follows --from", "[commands]")
{
    CHECK(!LogOptions {}.isBatch());
    CHECK(LogOptions { .from = "2025-03-10", .to = "2025-03-11" }.isBatch());
}

TEST_CASE("entryProjectLabel includes the client when known", "[commands]")
{
    auto entry = sampleEntry();
    CHECK(entryProjectLabel(entry) == "Acme / Alpha");
    entry.clientName.clear();
    CHECK(entryProjectLabel(entry) == "Alpha");
}

TEST_CASE("formatStatusLine shows the window, project and status", "[commands]")
{
    auto entry = sampleEntry();
    CHECK(formatStatusLine(entry)
          == "  09:00–09:45  45min  Acme / Alpha                    Login fix  [logged]");

    entry.status = store::EntryStatus::Failed;
    CHECK(formatStatusLine(entry).ends_with("Login fix  [failed]"));
}

TEST_CASE("formatStatusTotal splits hours and minutes", "[commands]")
{
    CHECK(formatStatusTotal(0, 0) == "Total: 0h 0min (0 entries)");
    CHECK(formatStatusTotal(135, 3) == "Total: 2h 15min (3 entries)");
}

TEST_CASE("formatScheduleHint reports the next interval during work hours", "[commands]")
{
    auto schedule = ScheduleConfig {};
    schedule.intervalMinutes = 30;

    CHECK(formatScheduleHint(localAt(10, 10, 10), schedule) == "Next interval ends at 10:30.");
    CHECK(formatScheduleHint(localAt(10, 20, 0), schedule) == "Outside working hours.");
    CHECK(formatScheduleHint(localAt(9, 10, 0), schedule) == "Outside working hours.");
}

TEST_CASE("formatProjectLine and formatLoggedLine", "[commands]")
{
    CHECK(formatProjectLine(clockify::Project { .id = "p1", .name = "Alpha" }) == "  p1  Alpha");
    CHECK(formatProjectLine(clockify::Project { .id = "p2", .name = "Beta", .clientName = "Acme" })
          == "  p2  Acme / Beta");

    CHECK(formatLoggedLine(sampleEntry()) == "Logged: Acme / Alpha - Login fix (45min) [logged]");
}

TEST_CASE("formatSkippedOutcome lists entries submitted before a cancel", "[commands]")
{
    CHECK(formatSkippedOutcome({}, "Entry skipped.") == "Entry skipped.");

    auto failed = sampleEntry();
    failed.status = store::EntryStatus::Failed;
    failed.description = "Review";

    CHECK(formatSkippedOutcome({ sampleEntry(), failed }, "Batch entry skipped.")
          == "Submission canceled after 2 entries:\n"
             "Logged: Acme / Alpha - Login fix (45min) [logged]\n"
             "Logged: Acme / Alpha - Review (45min) [failed]");
}
