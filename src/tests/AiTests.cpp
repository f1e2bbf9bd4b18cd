// SPDX-License-Identifier: Apache-2.0
#include <ai/ClaudeCli.hpp>
#include <ai/Envelope.hpp>
#include <ai/Models.hpp>
#include <ai/Prompt.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace clockr;
using namespace clockr::ai;

namespace
{
auto sampleProjects() -> std::vector<clockify::Project>
{
    return {
        clockify::Project { .id = "p1", .name = "Alpha", .clientName = "Acme" },
        clockify::Project { .id = "p2", .name = "Beta" },
    };
}

/// Writes an executable shell script standing in for the claude CLI.
auto writeFakeCli(std::string_view name, std::string_view body) -> std::filesystem::path
{
    auto const dir = std::filesystem::temp_directory_path() / "clockr_ai_tests";
    std::filesystem::create_directories(dir);
    auto const path = dir / name;
    {
        auto file = std::ofstream(path, std::ios::trunc);
        file << "#!/bin/sh\n" << body;
    }
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_all | std::filesystem::perms::group_read
                                     | std::filesystem::perms::others_read);
    return path;
}
} // namespace

// =============================================================================
// Envelope
// =============================================================================

TEST_CASE("unwrapEnvelope prefers structured_output", "[ai][envelope]")
{
    auto const text =
        unwrapEnvelope(R"({"type":"result","structured_output":{"allocations":[]},"result":"ignored"})");
    CHECK(text == R"({"allocations":[]})");
}

TEST_CASE("unwrapEnvelope falls back to result string, then raw result", "[ai][envelope]")
{
    CHECK(unwrapEnvelope(R"({"type":"result","result":"{\"clarification\":\"which?\"}"})")
          == R"({"clarification":"which?"})");
    CHECK(unwrapEnvelope(R"({"type":"result","result":{"allocations":[]}})") == R"({"allocations":[]})");
}

TEST_CASE("unwrapEnvelope returns text unchanged when it is not an envelope", "[ai][envelope]")
{
    CHECK(unwrapEnvelope("not json at all") == "not json at all");
    CHECK(unwrapEnvelope(R"({"result":""})") == R"({"result":""})");
}

TEST_CASE("parseStreamLine extracts deltas, assistant text and the result", "[ai][envelope]")
{
    SECTION("content_block_delta")
    {
        auto const line = parseStreamLine(R"({"type":"content_block_delta","delta":{"text":"Thinking"}})");
        REQUIRE(line.has_value());
        CHECK(line->chunks == std::vector<std::string> { "Thinking" });
        CHECK(!line->result.has_value());
    }

    SECTION("assistant message with several blocks")
    {
        auto const line = parseStreamLine(
            R"({"type":"assistant","message":{"content":[{"type":"text","text":"a"},{"type":"tool_use"},{"type":"text","text":"b"}]}})");
        REQUIRE(line.has_value());
        CHECK(line->chunks == std::vector<std::string> { "a", "b" });
    }

    SECTION("result event")
    {
        auto const line = parseStreamLine(R"({"type":"result","result":"{\"allocations\":[]}"})");
        REQUIRE(line.has_value());
        REQUIRE(line->result.has_value());
        CHECK(*line->result == R"({"allocations":[]})");
    }

    SECTION("garbage is skipped")
    {
        CHECK(!parseStreamLine("").has_value());
        CHECK(!parseStreamLine("{broken").has_value());
    }
}

TEST_CASE("unwrapNestedResult unwraps a result wrapper once", "[ai][envelope]")
{
    CHECK(unwrapNestedResult(R"({"result":{"allocations":[]}})") == R"({"allocations":[]})");
    CHECK(unwrapNestedResult(R"({"allocations":[]})") == R"({"allocations":[]})");
    CHECK(unwrapNestedResult("plain") == "plain");
}

TEST_CASE("truncatePreview never splits a UTF-8 sequence", "[ai][envelope]")
{
    CHECK(truncatePreview("short", 10) == "short");
    CHECK(truncatePreview("abcdef", 3) == "abc...");
    // "é" is two bytes; cutting after the first byte must back off.
    CHECK(truncatePreview("a\xC3\xA9z", 2) == "a...");
}

// =============================================================================
// Models
// =============================================================================

TEST_CASE("decodeSuggestion reads allocations", "[ai][models]")
{
    auto const suggestion = decodeSuggestion(R"({
        "allocations": [
            {"project_id": "p1", "project_name": "Alpha", "client_name": "Acme",
             "minutes": 45, "description": "Fixed login bug", "confidence": 0.9},
            {"project_id": "p2", "project_name": "Beta", "minutes": 15,
             "description": "Standup", "confidence": 1}
        ]
    })");

    REQUIRE(suggestion.has_value());
    CHECK(!suggestion->needsClarification());
    REQUIRE(suggestion->allocations.size() == 2);
    CHECK(suggestion->allocations[0].clientName == "Acme");
    CHECK(suggestion->allocations[0].minutes == 45);
    CHECK(suggestion->allocations[0].confidence == 0.9);
    CHECK(suggestion->allocations[1].clientName.empty());
}

TEST_CASE("decodeSuggestion reads a clarification request", "[ai][models]")
{
    auto const suggestion = decodeSuggestion(R"({"allocations": [], "clarification": "Which client?"})");
    REQUIRE(suggestion.has_value());
    CHECK(suggestion->needsClarification());
    CHECK(suggestion->clarification == "Which client?");
}

TEST_CASE("decodeSuggestion rejects malformed payloads with a preview", "[ai][models]")
{
    auto const notJson = decodeSuggestion("I could not decide");
    REQUIRE(!notJson.has_value());
    CHECK(notJson.error().code == ErrorCode::ParseError);
    CHECK(notJson.error().message.find("I could not decide") != std::string::npos);

    auto const wrongType = decodeSuggestion(R"({"allocations": [{"minutes": "sixty"}]})");
    REQUIRE(!wrongType.has_value());
    CHECK(wrongType.error().message.find("minutes") != std::string::npos);

    auto const longPayload = std::string(5000, 'x');
    auto const truncated = decodeSuggestion(longPayload);
    REQUIRE(!truncated.has_value());
    CHECK(truncated.error().message.size() < longPayload.size());
}

TEST_CASE("decodeSuggestion enforces positive minutes and bounded confidence", "[ai][models]")
{
    SECTION("zero or negative minutes are rejected")
    {
        for (auto const* text: { R"({"allocations": [{"project_id": "p1", "minutes": 0}]})",
                                 R"({"allocations": [{"project_id": "p1", "minutes": -30}]})",
                                 R"({"allocations": [{"project_id": "p1"}]})" })
        {
            auto const suggestion = decodeSuggestion(text);
            REQUIRE(!suggestion.has_value());
            CHECK(suggestion.error().code == ErrorCode::ParseError);
            CHECK(suggestion.error().message.find("minutes must be positive") != std::string::npos);
        }

        auto const batch = decodeBatchSuggestion(
            R"({"allocations": [{"date": "2025-03-10", "start_time": "09:00", "end_time": "10:00",
                                 "project_id": "p1", "minutes": -60}]})");
        CHECK(!batch.has_value());
    }

    SECTION("a clarification is accepted whatever the allocations say")
    {
        auto const suggestion =
            decodeSuggestion(R"({"allocations": [{"project_id": "p1", "minutes": 0}], "clarification": "Which?"})");
        REQUIRE(suggestion.has_value());
        CHECK(suggestion->needsClarification());
    }

    SECTION("confidence is clamped")
    {
        auto const suggestion = decodeSuggestion(R"({"allocations": [
            {"project_id": "p1", "minutes": 30, "confidence": 1.7},
            {"project_id": "p2", "minutes": 30, "confidence": -0.2}
        ]})");
        REQUIRE(suggestion.has_value());
        CHECK(suggestion->allocations[0].confidence == 1.0);
        CHECK(suggestion->allocations[1].confidence == 0.0);
    }
}

TEST_CASE("decodeBatchSuggestion reads dates and time windows", "[ai][models]")
{
    auto const suggestion = decodeBatchSuggestion(R"({"allocations": [
        {"date": "2025-03-10", "start_time": "09:00", "end_time": "12:00", "project_id": "p1",
         "project_name": "Alpha", "minutes": 180, "description": "Feature work", "confidence": 0.8}
    ]})");

    REQUIRE(suggestion.has_value());
    REQUIRE(suggestion->allocations.size() == 1);
    auto const& allocation = suggestion->allocations.front();
    CHECK(allocation.date == "2025-03-10");
    CHECK(allocation.startTime == "09:00");
    CHECK(allocation.endTime == "12:00");
    CHECK(allocation.minutes == 180);
}

TEST_CASE("toJson omits an empty client name", "[ai][models]")
{
    auto const withClient = toJson(Allocation { .projectId = "p1", .projectName = "Alpha", .clientName = "Acme" });
    CHECK(withClient["client_name"] == "Acme");

    auto const withoutClient = toJson(Allocation { .projectId = "p2", .projectName = "Beta" });
    CHECK(!withoutClient.contains("client_name"));
}

// =============================================================================
// Prompt
// =============================================================================

TEST_CASE("projectCatalogJson lists ids, names and known clients", "[ai][prompt]")
{
    auto const projects = sampleProjects();
    CHECK(projectCatalogJson(projects)
          == R"([{"id":"p1","name":"Alpha","client_name":"Acme"},{"id":"p2","name":"Beta"}])");
}

TEST_CASE("buildSystemPrompt states the interval and the context", "[ai][prompt]")
{
    auto const projects = sampleProjects();
    auto const context = std::vector<std::string> { "Meeting: Sprint planning", "Commit: fix login" };

    auto const prompt = buildSystemPrompt(projects, 90, context);
    CHECK(prompt.find("The time period is 90 minutes total") != std::string::npos);
    CHECK(prompt.find("Allocations must sum to exactly 90 minutes") != std::string::npos);
    CHECK(prompt.find("  - Meeting: Sprint planning\n") != std::string::npos);
    CHECK(prompt.find(R"("id":"p2")") != std::string::npos);

    auto const bare = buildSystemPrompt(projects, 60, {});
    CHECK(bare.find("Context (calendar events") == std::string::npos);
}

TEST_CASE("buildBatchSystemPrompt lists one schedule line per day", "[ai][prompt]")
{
    auto const projects = sampleProjects();
    auto const date = std::chrono::year_month_day { std::chrono::year { 2025 } / 3 / 10 };
    auto const days = std::vector<DaySlot> {
        DaySlot {
            .date = "2025-03-10",
            .weekday = "Monday",
            .workStart = localTimePoint(date, ClockTime { .hour = 9 }),
            .workEnd = localTimePoint(date, ClockTime { .hour = 17 }),
            .totalMinutes = 480,
            .calendarEvents = { "Standup" },
        },
    };

    auto const line = formatScheduleLine(days.front());
    CHECK(line == "  2025-03-10 Monday: 09:00–17:00 (480 min), calendar: [Standup], commits: none\n");

    auto const prompt = buildBatchSystemPrompt(projects, days);
    CHECK(prompt.find("Work schedule:\n" + line) != std::string::npos);
    CHECK(prompt.find("Create allocations for EACH work day") != std::string::npos);
}

TEST_CASE("buildUserPrompt wraps the description", "[ai][prompt]")
{
    CHECK(buildUserPrompt("fixed bugs") == "What I worked on: fixed bugs");
}

// =============================================================================
// ClaudeCli
// =============================================================================

TEST_CASE("ClaudeCli builds the expected argument list", "[ai][cli]")
{
    auto const cli = ClaudeCli(ClaudeCliConfig { .executable = "claude", .model = "opus" });

    auto const args = cli.buildArgs("system", "user", "{}", false);
    REQUIRE(args.size() >= 6);
    CHECK(args[0] == "-p");
    CHECK(args[1] == "user");
    CHECK(args[2] == "--output-format");
    CHECK(args[3] == "json");
    CHECK(std::ranges::find(args, std::string("opus")) != args.end());
    CHECK(std::ranges::find(args, std::string("--verbose")) == args.end());

    auto const streaming = cli.buildArgs("system", "user", "{}", true);
    CHECK(streaming[3] == "stream-json");
    CHECK(streaming.back() == "--verbose");
}

TEST_CASE("ClaudeCli decodes the JSON envelope of a non-streaming run", "[ai][cli]")
{
    auto const script = writeFakeCli("claude-json", R"(cat <<'EOF'
{"type":"result","subtype":"success","structured_output":{"allocations":[{"project_id":"p1","project_name":"Alpha","minutes":60,"description":"Work","confidence":0.7}]}}
EOF
)");

    auto cli = ClaudeCli(ClaudeCliConfig { .executable = script.string() });
    auto const request = MatchRequest { .description = "work", .projects = sampleProjects(), .intervalMinutes = 60 };
    auto const result = cli.matchSingle(request, {}, {});

    REQUIRE(result.has_value());
    REQUIRE(result->allocations.size() == 1);
    CHECK(result->allocations.front().projectId == "p1");
}

TEST_CASE("ClaudeCli streams thinking text and reads the final result", "[ai][cli]")
{
    auto const script = writeFakeCli("claude-stream", R"(cat <<'EOF'
{"type":"content_block_delta","delta":{"text":"Looking at "}}
{"type":"content_block_delta","delta":{"text":"projects"}}
{"type":"result","result":"{\"allocations\":[],\"clarification\":\"Which project?\"}"}
EOF
)");

    auto chunks = std::vector<std::string> {};
    auto cli = ClaudeCli(ClaudeCliConfig { .executable = script.string() });
    auto const request = MatchRequest { .description = "stuff", .projects = sampleProjects(), .intervalMinutes = 60 };
    auto const result =
        cli.matchSingle(request, [&](std::string_view chunk) { chunks.emplace_back(chunk); }, {});

    REQUIRE(result.has_value());
    CHECK(result->clarification == "Which project?");
    CHECK(chunks == std::vector<std::string> { "Looking at ", "projects" });
}

TEST_CASE("ClaudeCli reports a failing CLI with its stderr", "[ai][cli]")
{
    auto const script = writeFakeCli("claude-fail", "echo 'not logged in' >&2\nexit 2\n");

    auto cli = ClaudeCli(ClaudeCliConfig { .executable = script.string() });
    auto const request = MatchRequest { .description = "x", .projects = sampleProjects(), .intervalMinutes = 60 };
    auto const result = cli.matchSingle(request, {}, {});

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProcessError);
    CHECK(result.error().message.find("not logged in") != std::string::npos);
}

TEST_CASE("ClaudeCli fails when the stream carries no result", "[ai][cli]")
{
    auto const script = writeFakeCli("claude-noresult", R"(echo '{"type":"content_block_delta","delta":{"text":"hmm"}}'
)");

    auto cli = ClaudeCli(ClaudeCliConfig { .executable = script.string() });
    auto const result = cli.matchBatch(BatchMatchRequest { .description = "x", .projects = sampleProjects() },
                                       [](std::string_view) {},
                                       {});

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::AiError);
}

TEST_CASE("ClaudeCli hides nested-session variables from the child", "[ai][cli]")
{
    auto const blocked = ClaudeCli::blockedEnvironment();
    CHECK(std::ranges::find(blocked, std::string("CLAUDECODE")) != blocked.end());
}
