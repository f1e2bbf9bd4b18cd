// SPDX-License-Identifier: Apache-2.0
#include <review/ChunkChannel.hpp>
#include <review/CommandRunner.hpp>
#include <review/MessageQueue.hpp>
#include <review/StreamingInvoker.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <variant>

using namespace clockr;
using namespace clockr::review;
using namespace std::chrono_literals;

namespace
{
auto waitOnToken(std::stop_token const& token, std::chrono::milliseconds limit) -> bool
{
    auto const until = std::chrono::steady_clock::now() + limit;
    while (!token.stop_requested() && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(5ms);
    return token.stop_requested();
}
} // namespace

// =============================================================================
// ChunkChannel
// =============================================================================

TEST_CASE("ChunkChannel delivers chunks in order and ends after close", "[streaming][channel]")
{
    auto channel = ChunkChannel {};
    CHECK(channel.capacity() == 100);

    CHECK(channel.trySend("one"));
    CHECK(channel.trySend("two"));
    channel.close();
    CHECK(channel.isClosed());
    CHECK(!channel.trySend("late"));

    CHECK(channel.receive({}) == "one");
    CHECK(channel.receive({}) == "two");
    CHECK(!channel.receive({}).has_value());
}

TEST_CASE("ChunkChannel drops chunks when full", "[streaming][channel]")
{
    auto channel = ChunkChannel(2);
    CHECK(channel.trySend("a"));
    CHECK(channel.trySend("b"));
    CHECK(!channel.trySend("c"));
    CHECK(channel.size() == 2);

    CHECK(channel.receive({}) == "a");
    CHECK(channel.trySend("d"));
    CHECK(channel.receive({}) == "b");
    CHECK(channel.receive({}) == "d");
}

TEST_CASE("ChunkChannel receive wakes for a late producer and for stop requests", "[streaming][channel]")
{
    auto channel = ChunkChannel {};

    SECTION("producer")
    {
        auto producer = std::jthread([&] {
            std::this_thread::sleep_for(50ms);
            static_cast<void>(channel.trySend("hello"));
        });
        CHECK(channel.receive({}) == "hello");
    }

    SECTION("stop request")
    {
        auto source = std::stop_source {};
        auto stopper = std::jthread([&] {
            std::this_thread::sleep_for(50ms);
            source.request_stop();
        });
        CHECK(!channel.receive(source.get_token()).has_value());
    }
}

// =============================================================================
// CancellationWatchdog
// =============================================================================

TEST_CASE("CancellationWatchdog keeps the first cancel reason", "[streaming][watchdog]")
{
    auto watchdog = CancellationWatchdog(StreamingOptions {}, {});
    CHECK(!watchdog.token().stop_requested());
    CHECK(watchdog.reason() == CancelReason::None);

    CHECK(watchdog.cancel(CancelReason::Cancelled));
    CHECK(!watchdog.cancel(CancelReason::IdleTimeout));
    CHECK(watchdog.token().stop_requested());
    CHECK(watchdog.reason() == CancelReason::Cancelled);
}

TEST_CASE("CancellationWatchdog follows the outer stop token", "[streaming][watchdog]")
{
    auto outer = std::stop_source {};
    auto watchdog = CancellationWatchdog(StreamingOptions {}, outer.get_token());

    outer.request_stop();
    CHECK(watchdog.token().stop_requested());
    CHECK(watchdog.reason() == CancelReason::Cancelled);
}

TEST_CASE("CancellationWatchdog cancels an idle call", "[streaming][watchdog]")
{
    auto watchdog = CancellationWatchdog(
        StreamingOptions { .idleLimit = 50ms, .pollPeriod = 10ms, .hardCeiling = 10s }, {});

    CHECK(waitOnToken(watchdog.token(), 5s));
    CHECK(watchdog.reason() == CancelReason::IdleTimeout);
}

TEST_CASE("CancellationWatchdog enforces the hard ceiling despite activity", "[streaming][watchdog]")
{
    auto watchdog = CancellationWatchdog(
        StreamingOptions { .idleLimit = 10s, .pollPeriod = 10ms, .hardCeiling = 100ms }, {});

    auto const until = std::chrono::steady_clock::now() + 5s;
    while (!watchdog.token().stop_requested() && std::chrono::steady_clock::now() < until)
    {
        watchdog.touch();
        std::this_thread::sleep_for(5ms);
    }

    CHECK(watchdog.token().stop_requested());
    CHECK(watchdog.reason() == CancelReason::Deadline);
}

// =============================================================================
// StreamingInvoker
// =============================================================================

TEST_CASE("StreamingInvoker relays chunks and closes the channel", "[streaming][invoker]")
{
    auto const invoker = StreamingInvoker {};
    auto channel = ChunkChannel {};

    auto const call = MatchCall<int> { [](ai::ThinkingCallback const& onThinking, std::stop_token) -> Result<int> {
        onThinking("thinking ");
        onThinking("hard");
        return 42;
    } };

    auto const result = invoker.invoke(call, channel, {});
    REQUIRE(result.has_value());
    CHECK(*result == 42);
    CHECK(channel.isClosed());
    CHECK(channel.receive({}) == "thinking ");
    CHECK(channel.receive({}) == "hard");
    CHECK(!channel.receive({}).has_value());
}

TEST_CASE("StreamingInvoker passes through errors of calls that were not canceled", "[streaming][invoker]")
{
    auto const invoker = StreamingInvoker {};
    auto channel = ChunkChannel {};

    auto const call = MatchCall<int> { [](ai::ThinkingCallback const&, std::stop_token) -> Result<int> {
        return makeError(ErrorCode::AiError, "claude exited with status 1");
    } };

    auto const result = invoker.invoke(call, channel, {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::AiError);
    CHECK(channel.isClosed());
}

TEST_CASE("StreamingInvoker reports an idle timeout after the stream stalls", "[streaming][invoker]")
{
    auto const invoker = StreamingInvoker(StreamingOptions { .idleLimit = 50ms, .pollPeriod = 10ms, .hardCeiling = 10s });
    auto channel = ChunkChannel {};

    auto const call = MatchCall<int> { [](ai::ThinkingCallback const& onThinking, std::stop_token token) -> Result<int> {
        onThinking("Let me check the projects");
        if (waitOnToken(token, 5s))
            return makeError(ErrorCode::ProcessError, "killed");
        return 1;
    } };

    auto const result = invoker.invoke(call, channel, {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    CHECK(result.error().message.find("no response from AI") != std::string::npos);
    CHECK(channel.receive({}) == "Let me check the projects");
    CHECK(!channel.receive({}).has_value());
}

TEST_CASE("StreamingInvoker lets a steadily streaming call outlive the idle limit", "[streaming][invoker]")
{
    auto const invoker = StreamingInvoker(StreamingOptions { .idleLimit = 100ms, .pollPeriod = 10ms, .hardCeiling = 10s });
    auto channel = ChunkChannel {};

    auto const call = MatchCall<int> { [](ai::ThinkingCallback const& onThinking, std::stop_token token) -> Result<int> {
        auto const started = std::chrono::steady_clock::now();
        while (std::chrono::steady_clock::now() - started < 400ms)
        {
            onThinking(".");
            if (waitOnToken(token, 20ms))
                return makeError(ErrorCode::ProcessError, "killed");
        }
        return 7;
    } };

    auto const result = invoker.invoke(call, channel, {});
    REQUIRE(result.has_value());
    CHECK(*result == 7);

    auto chunks = 0;
    while (channel.receive({}))
        ++chunks;
    CHECK(chunks >= 4);
}

TEST_CASE("StreamingInvoker reports outer cancellation", "[streaming][invoker]")
{
    auto const invoker = StreamingInvoker {};
    auto channel = ChunkChannel {};
    auto outer = std::stop_source {};

    auto const call = MatchCall<int> { [&](ai::ThinkingCallback const&, std::stop_token token) -> Result<int> {
        outer.request_stop();
        if (waitOnToken(token, 5s))
            return makeError(ErrorCode::ProcessError, "killed");
        return 1;
    } };

    auto const result = invoker.invoke(call, channel, outer.get_token());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Cancelled);
}

// =============================================================================
// MessageQueue and CommandRunner
// =============================================================================

TEST_CASE("MessageQueue drains in arrival order and wakes the consumer", "[streaming][queue]")
{
    auto queue = MessageQueue {};
    auto wakes = 0;
    queue.setWakeCallback([&] { ++wakes; });

    CHECK(queue.empty());
    queue.push(TickMsg { .generation = 1 });
    queue.push(ChunkMsg { .generation = 1, .text = "x" });
    CHECK(wakes == 2);

    auto const messages = queue.drain();
    REQUIRE(messages.size() == 2);
    CHECK(std::holds_alternative<TickMsg>(messages[0]));
    CHECK(std::get<ChunkMsg>(messages[1]).text == "x");
    CHECK(queue.empty());
}

TEST_CASE("CommandRunner posts command results and stops long-running commands", "[streaming][runner]")
{
    auto queue = MessageQueue {};
    auto runner = CommandRunner(queue);

    runner.dispatch(Command {
        .kind = CommandKind::ReadChunk,
        .run = [](std::stop_token) -> std::optional<Message> { return ChunkMsg { .generation = 7, .text = "hi" }; },
    });
    runner.dispatch(Command {
        .kind = CommandKind::Tick,
        .run = [](std::stop_token token) -> std::optional<Message> {
            if (!sleepFor(30s, token))
                return std::nullopt;
            return TickMsg { .generation = 7 };
        },
    });

    auto const until = std::chrono::steady_clock::now() + 5s;
    while (queue.empty() && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(5ms);

    auto const started = std::chrono::steady_clock::now();
    runner.shutdown();
    CHECK(std::chrono::steady_clock::now() - started < 10s);
    CHECK(runner.running() == 0);

    auto const messages = queue.drain();
    REQUIRE(messages.size() == 1);
    CHECK(std::get<ChunkMsg>(messages[0]).text == "hi");
}

TEST_CASE("sleepFor returns early when stopped", "[streaming]")
{
    CHECK(sleepFor(1ms, {}));

    auto source = std::stop_source {};
    source.request_stop();
    CHECK(!sleepFor(30s, source.get_token()));
}
