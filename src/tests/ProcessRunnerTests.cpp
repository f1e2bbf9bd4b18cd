// SPDX-License-Identifier: Apache-2.0
#include <process/ProcessRunner.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace clockr;
using namespace std::chrono_literals;

TEST_CASE("runProcess captures stdout, stderr and exit status", "[process]")
{
    auto const output = runProcess(ProcessSpec {
        .command = "sh",
        .args = { "-c", "echo out; echo err >&2; exit 3" },
    });

    REQUIRE(output.has_value());
    CHECK(output->exitCode == 3);
    CHECK(!output->cancelled);
    CHECK(output->stdoutData == "out\n");
    CHECK(output->stderrData == "err\n");
}

TEST_CASE("runProcess streams stdout lines to the callback", "[process]")
{
    auto lines = std::vector<std::string> {};
    auto const output = runProcess(
        ProcessSpec {
            .command = "sh",
            .args = { "-c", "printf 'one\\ntwo\\nthree'" },
        },
        [&](std::string_view line) { lines.emplace_back(line); });

    REQUIRE(output.has_value());
    CHECK(lines == std::vector<std::string> { "one", "two", "three" });
}

TEST_CASE("runProcess feeds stdin data to the child", "[process]")
{
    auto const output = runProcess(ProcessSpec {
        .command = "cat",
        .stdinData = "hello from stdin",
    });

    REQUIRE(output.has_value());
    CHECK(output->exitCode == 0);
    CHECK(output->stdoutData == "hello from stdin");
}

TEST_CASE("runProcess applies environment overrides and removals", "[process]")
{
    ::setenv("CLOCKR_TEST_REMOVED", "present", 1);

    auto const output = runProcess(ProcessSpec {
        .command = "sh",
        .args = { "-c", "echo \"${CLOCKR_TEST_ADDED}:${CLOCKR_TEST_REMOVED:-gone}\"" },
        .env = { { "CLOCKR_TEST_ADDED", "added" } },
        .unsetEnv = { "CLOCKR_TEST_REMOVED" },
    });

    ::unsetenv("CLOCKR_TEST_REMOVED");

    REQUIRE(output.has_value());
    CHECK(output->stdoutData == "added:gone\n");
}

TEST_CASE("runProcess reports programs that cannot be spawned", "[process]")
{
    auto const output = runProcess(ProcessSpec { .command = "/nonexistent/clockr-no-such-binary" });
    REQUIRE(!output.has_value());
    CHECK(output.error().code == ErrorCode::ProcessError);
}

TEST_CASE("runProcess terminates the child when the stop token fires", "[process]")
{
    auto source = std::stop_source {};
    auto stopper = std::jthread([&] {
        std::this_thread::sleep_for(200ms);
        source.request_stop();
    });

    auto const started = std::chrono::steady_clock::now();
    auto const output = runProcess(ProcessSpec { .command = "sleep", .args = { "30" } }, {}, source.get_token());
    auto const elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(output.has_value());
    CHECK(output->cancelled);
    CHECK(elapsed < 10s);
}

TEST_CASE("buildEnvironment merges overrides and drops unset names", "[process]")
{
    auto const env = buildEnvironment({ "PATH=/bin", "HOME=/root", "CLAUDECODE=1" },
                                      { { "HOME", "/tmp" }, { "EXTRA", "x" } },
                                      { "CLAUDECODE" });

    CHECK(std::ranges::find(env, std::string("PATH=/bin")) != env.end());
    CHECK(std::ranges::find(env, std::string("HOME=/tmp")) != env.end());
    CHECK(std::ranges::find(env, std::string("HOME=/root")) == env.end());
    CHECK(std::ranges::find(env, std::string("EXTRA=x")) != env.end());
    CHECK(std::ranges::find(env, std::string("CLAUDECODE=1")) == env.end());
}
