// SPDX-License-Identifier: Apache-2.0
#include <core/Time.hpp>
#include <review/SubmissionPipeline.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <stop_token>
#include <string>
#include <vector>

#include "TestFakes.hpp"

using namespace clockr;
using namespace clockr::review;
using namespace std::chrono_literals;

namespace
{
auto intervalStart() -> TimePoint
{
    return TimePoint { std::chrono::sys_days { std::chrono::year { 2025 } / 3 / 10 } + 9h };
}

auto threeAllocations() -> std::vector<ai::Allocation>
{
    return {
        ai::Allocation { .projectId = "p1", .projectName = "Alpha", .minutes = 30, .description = "A" },
        ai::Allocation { .projectId = "p2", .projectName = "Beta", .minutes = 20, .description = "B" },
        ai::Allocation { .projectId = "p3", .projectName = "Gamma", .minutes = 40, .description = "C" },
    };
}
} // namespace

TEST_CASE("submitInterval lays out entries back to back and clamps the last", "[submission]")
{
    auto client = test::FakeTimeEntryClient {};
    auto store = test::MemoryEntryStore {};
    auto pipeline = SubmissionPipeline(client, &store, "ws1");

    auto const start = intervalStart();
    auto const entries = pipeline.submitInterval(threeAllocations(), start, start + 1h, "worked on stuff");

    REQUIRE(entries.has_value());
    REQUIRE(entries->size() == 3);
    CHECK((*entries)[0].start == start);
    CHECK((*entries)[0].end == start + 30min);
    CHECK((*entries)[1].start == start + 30min);
    CHECK((*entries)[1].end == start + 50min);
    CHECK((*entries)[2].start == start + 50min);
    CHECK((*entries)[2].end == start + 1h);
    CHECK((*entries)[2].minutes == 40);

    REQUIRE(client.requests.size() == 3);
    CHECK(client.workspaces == std::vector<std::string> { "ws1", "ws1", "ws1" });
    CHECK(client.requests[1].projectId == "p2");
    CHECK(client.requests[1].description == "B");

    REQUIRE(store.entries.size() == 3);
    CHECK(store.entries[0].rawInput == "worked on stuff");
    CHECK(store.entries[0].clockifyId == "ce-1");
}

TEST_CASE("submitInterval records failed creations and keeps going", "[submission]")
{
    auto client = test::FakeTimeEntryClient({ 1 });
    auto store = test::MemoryEntryStore {};
    auto pipeline = SubmissionPipeline(client, &store, "ws1");

    auto const start = intervalStart();
    auto const entries = pipeline.submitInterval(threeAllocations(), start, start + 2h, "input");

    REQUIRE(entries.has_value());
    REQUIRE(entries->size() == 3);
    CHECK((*entries)[0].status == store::EntryStatus::Logged);
    CHECK((*entries)[0].clockifyId == "ce-1");
    CHECK((*entries)[1].status == store::EntryStatus::Failed);
    CHECK((*entries)[1].clockifyId.empty());
    CHECK((*entries)[2].status == store::EntryStatus::Logged);
    CHECK((*entries)[2].clockifyId == "ce-3");

    CHECK(client.requests.size() == 3);
    REQUIRE(store.entries.size() == 3);
    CHECK(store.entries[1].status == store::EntryStatus::Failed);
    CHECK((*entries)[1].id == store.entries[1].id);
}

TEST_CASE("submitBatch uses each allocation's own local window", "[submission]")
{
    auto client = test::FakeTimeEntryClient {};
    auto store = test::MemoryEntryStore {};
    auto pipeline = SubmissionPipeline(client, &store, "ws1");

    auto const entries = pipeline.submitBatch(
        {
            ai::BatchAllocation { .date = "2025-03-10", .startTime = "09:00", .endTime = "12:30",
                                  .projectId = "p1", .minutes = 210 },
            ai::BatchAllocation { .date = "2025-03-11", .startTime = "13:00", .endTime = "17:00",
                                  .projectId = "p2", .minutes = 240 },
        },
        "(batch)");

    REQUIRE(entries.has_value());
    REQUIRE(entries->size() == 2);
    auto const expectedStart = parseLocalDateTime("2025-03-10", "09:00");
    auto const expectedEnd = parseLocalDateTime("2025-03-11", "17:00");
    REQUIRE(expectedStart.has_value());
    REQUIRE(expectedEnd.has_value());
    CHECK((*entries)[0].start == *expectedStart);
    CHECK((*entries)[1].end == *expectedEnd);
    CHECK(client.requests[1].start == (*entries)[1].start);
    CHECK(store.entries.size() == 2);
}

TEST_CASE("submitBatch records a failed creation and keeps going", "[submission]")
{
    auto client = test::FakeTimeEntryClient({ 1 });
    auto store = test::MemoryEntryStore {};
    auto pipeline = SubmissionPipeline(client, &store, "ws1");

    auto const entries = pipeline.submitBatch(
        {
            ai::BatchAllocation { .date = "2025-03-10", .startTime = "09:00", .endTime = "12:00",
                                  .projectId = "p1", .minutes = 180 },
            ai::BatchAllocation { .date = "2025-03-10", .startTime = "13:00", .endTime = "17:00",
                                  .projectId = "p2", .minutes = 240 },
            ai::BatchAllocation { .date = "2025-03-11", .startTime = "09:00", .endTime = "17:00",
                                  .projectId = "p3", .minutes = 480 },
        },
        "(batch)");

    REQUIRE(entries.has_value());
    REQUIRE(entries->size() == 3);
    CHECK((*entries)[0].status == store::EntryStatus::Logged);
    CHECK((*entries)[0].clockifyId == "ce-1");
    CHECK((*entries)[1].status == store::EntryStatus::Failed);
    CHECK((*entries)[1].clockifyId.empty());
    CHECK((*entries)[2].status == store::EntryStatus::Logged);
    CHECK((*entries)[2].clockifyId == "ce-3");

    CHECK(client.requests.size() == 3);
    REQUIRE(store.entries.size() == 3);
    CHECK(store.entries[1].status == store::EntryStatus::Failed);
    CHECK(store.entries[1].projectId == "p2");
}

TEST_CASE("submitBatch rejects an unparsable window before creating anything", "[submission]")
{
    auto client = test::FakeTimeEntryClient {};
    auto store = test::MemoryEntryStore {};
    auto pipeline = SubmissionPipeline(client, &store, "ws1");

    auto const entries = pipeline.submitBatch(
        {
            ai::BatchAllocation { .date = "2025-03-10", .startTime = "09:00", .endTime = "12:00", .minutes = 180 },
            ai::BatchAllocation { .date = "2025-03-11", .startTime = "9am", .endTime = "12:00", .minutes = 180 },
        },
        "(batch)");

    REQUIRE(!entries.has_value());
    CHECK(entries.error().code == ErrorCode::ParseError);
    CHECK(entries.error().message.find("2025-03-11") != std::string::npos);
    CHECK(client.requests.empty());
    CHECK(store.entries.empty());
}

TEST_CASE("SubmissionPipeline tolerates store failures and a missing store", "[submission]")
{
    auto client = test::FakeTimeEntryClient {};
    auto const start = intervalStart();

    SECTION("insert failure")
    {
        auto store = test::MemoryEntryStore {};
        store.failInserts = true;
        auto pipeline = SubmissionPipeline(client, &store, "ws1");

        auto const entries = pipeline.submitInterval(threeAllocations(), start, start + 2h, "input");
        REQUIRE(entries.has_value());
        CHECK(entries->size() == 3);
        CHECK((*entries)[0].id == 0);
        CHECK((*entries)[0].status == store::EntryStatus::Logged);
    }

    SECTION("no store")
    {
        auto pipeline = SubmissionPipeline(client, nullptr, "ws1");
        auto const entries = pipeline.submitInterval(threeAllocations(), start, start + 2h, "input");
        REQUIRE(entries.has_value());
        CHECK(entries->size() == 3);
        CHECK(client.requests.size() == 3);
    }
}

TEST_CASE("SubmissionPipeline stops between allocations once canceled", "[submission]")
{
    auto client = test::FakeTimeEntryClient {};
    auto store = test::MemoryEntryStore {};
    auto pipeline = SubmissionPipeline(client, &store, "ws1");
    auto const start = intervalStart();

    SECTION("canceled before the first allocation")
    {
        auto stop = std::stop_source {};
        stop.request_stop();

        auto const entries = pipeline.submitInterval(threeAllocations(), start, start + 2h, "input", stop.get_token());
        REQUIRE(entries.has_value());
        CHECK(entries->empty());
        CHECK(client.requests.empty());
        CHECK(store.entries.empty());
    }

    SECTION("canceled while an entry is in flight")
    {
        client.blockingCalls = { 1 };
        auto stop = std::stop_source {};

        auto pending = std::async(std::launch::async, [&] {
            return pipeline.submitInterval(threeAllocations(), start, start + 2h, "input", stop.get_token());
        });
        client.waitUntilBlocked();
        stop.request_stop();

        auto const entries = pending.get();
        REQUIRE(entries.has_value());
        REQUIRE(entries->size() == 1);
        CHECK((*entries)[0].projectId == "p1");
        CHECK((*entries)[0].status == store::EntryStatus::Logged);
        CHECK(client.requests.size() == 2);
        REQUIRE(store.entries.size() == 1);
        CHECK(store.entries[0].projectId == "p1");
    }
}
