// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/Models.hpp>
#include <core/Error.hpp>
#include <store/Entry.hpp>
#include <tui/InputEvent.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

namespace clockr::review
{

/// @brief A key press forwarded from the terminal.
struct KeyMsg
{
    tui::KeyEvent key;
};

/// @brief Text pasted into the terminal.
struct PasteMsg
{
    std::string text;
};

/// @brief The terminal was resized.
struct ResizeMsg
{
    int columns = 80;
    int rows = 24;
};

/// @brief One-second heartbeat while waiting for the AI.
///
/// Messages tagged with a generation belong to one AI request; handlers drop
/// them once a newer request (or a cancellation) has bumped the generation.
struct TickMsg
{
    std::uint64_t generation = 0;
};

/// @brief A streamed text fragment of the AI response.
struct ChunkMsg
{
    std::uint64_t generation = 0;
    std::string text;
};

/// @brief The stream of text fragments has ended.
struct ChunksDoneMsg
{
    std::uint64_t generation = 0;
};

/// @brief The AI call finished.
template <typename S>
struct MatchDoneMsg
{
    std::uint64_t generation = 0;
    Result<S> result;
};

/// @brief The submission of accepted allocations finished.
struct SubmitDoneMsg
{
    Result<std::vector<store::Entry>> result;
};

using Message = std::variant<KeyMsg,
                             PasteMsg,
                             ResizeMsg,
                             TickMsg,
                             ChunkMsg,
                             ChunksDoneMsg,
                             MatchDoneMsg<ai::Suggestion>,
                             MatchDoneMsg<ai::BatchSuggestion>,
                             SubmitDoneMsg>;

/// @brief What a scheduled command does. Used by tests and the runner's diagnostics.
enum class CommandKind : std::uint8_t
{
    Match,     ///< Runs the AI call.
    ReadChunk, ///< Pulls the next streamed fragment.
    Tick,      ///< Sleeps for the tick interval.
    Submit,    ///< Submits accepted allocations.
};

[[nodiscard]] constexpr auto commandKindName(CommandKind kind) noexcept -> std::string_view
{
    switch (kind)
    {
        case CommandKind::Match: return "match";
        case CommandKind::ReadChunk: return "read-chunk";
        case CommandKind::Tick: return "tick";
        case CommandKind::Submit: return "submit";
    }
    return "unknown";
}

/// @brief Asynchronous work scheduled by a state machine update.
///
/// run() executes off the UI thread. The message it returns, if any, is fed
/// back into the machine; it must return promptly once its stop token fires.
struct Command
{
    CommandKind kind;
    std::function<std::optional<Message>(std::stop_token)> run;
};

/// @brief Sleeps for @p duration unless @p stopToken fires first.
/// @return True if the full duration elapsed.
inline auto sleepFor(std::chrono::milliseconds duration, std::stop_token const& stopToken) -> bool
{
    auto mutex = std::mutex {};
    auto cv = std::condition_variable_any {};
    auto lock = std::unique_lock { mutex };
    return !cv.wait_for(lock, stopToken, duration, [] { return false; }) && !stopToken.stop_requested();
}

} // namespace clockr::review
