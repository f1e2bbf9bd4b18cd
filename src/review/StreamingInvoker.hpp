// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/Matcher.hpp>
#include <core/Error.hpp>

#include <review/ChunkChannel.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace clockr::review
{

/// @brief Time limits applied to one AI call.
struct StreamingOptions
{
    std::chrono::milliseconds idleLimit = std::chrono::minutes(2); ///< Longest allowed gap between chunks.
    std::chrono::milliseconds pollPeriod = std::chrono::seconds(5); ///< How often the watchdog checks for idleness.
    std::chrono::milliseconds hardCeiling = std::chrono::seconds(60); ///< Overall limit for the call.
};

/// @brief Why a call was canceled. The first reason recorded wins.
enum class CancelReason : std::uint8_t
{
    None,
    IdleTimeout,
    Deadline,
    Cancelled,
};

/// @brief Cancels a shared stop source on idleness, on the hard deadline or on outer cancellation.
///
/// touch() records activity and may be called from any thread. A background
/// thread wakes every poll period and cancels once the time since the last
/// activity reaches the idle limit, or once the deadline passes. Cancelling
/// is idempotent.
class CancellationWatchdog
{
  public:
    CancellationWatchdog(StreamingOptions options, std::stop_token outer);
    ~CancellationWatchdog() = default;

    CancellationWatchdog(CancellationWatchdog const&) = delete;
    auto operator=(CancellationWatchdog const&) -> CancellationWatchdog& = delete;
    CancellationWatchdog(CancellationWatchdog&&) = delete;
    auto operator=(CancellationWatchdog&&) -> CancellationWatchdog& = delete;

    /// @brief Records activity, resetting the idle window.
    void touch();

    /// @brief Cancels with @p reason unless already canceled.
    /// @return True if this call performed the cancellation.
    auto cancel(CancelReason reason) -> bool;

    /// @brief The token handed to the guarded call.
    [[nodiscard]] auto token() const noexcept -> std::stop_token { return _source.get_token(); }

    [[nodiscard]] auto reason() const noexcept -> CancelReason { return _reason.load(); }

  private:
    void run(std::stop_token self);

    StreamingOptions _options;
    std::stop_source _source;
    std::atomic<CancelReason> _reason = CancelReason::None;
    std::mutex _mutex;
    std::condition_variable_any _cv;
    std::chrono::steady_clock::time_point _lastActivity; ///< Guarded by _mutex.
    std::chrono::steady_clock::time_point _deadline;
    std::optional<std::stop_callback<std::function<void()>>> _outerLink;
    std::jthread _thread; ///< Declared last so it stops before the state it reads goes away.
};

/// @brief A match call bound to its arguments, waiting for the streaming callback and stop token.
template <typename T>
using MatchCall = std::function<Result<T>(ai::ThinkingCallback const&, std::stop_token)>;

/// @brief Runs an AI call under a CancellationWatchdog and relays its streamed text into a ChunkChannel.
///
/// Every chunk the call reports resets the idle window and is offered to the
/// channel (dropped when the channel is full). The channel is closed once the
/// call returns, so a consumer pulling chunks always terminates. If the
/// watchdog canceled the call, its error is replaced by one naming the cause.
class StreamingInvoker
{
  public:
    explicit StreamingInvoker(StreamingOptions options = {}): _options(options) {}

    template <typename T>
    [[nodiscard]] auto invoke(MatchCall<T> const& call, ChunkChannel& channel, std::stop_token stopToken) const
        -> Result<T>
    {
        auto watchdog = CancellationWatchdog(_options, std::move(stopToken));
        auto const onThinking = ai::ThinkingCallback { [&](std::string_view chunk) {
            watchdog.touch();
            static_cast<void>(channel.trySend(std::string(chunk)));
        } };

        auto result = call(onThinking, watchdog.token());
        channel.close();

        auto const reason = watchdog.reason();
        if (!result && reason != CancelReason::None)
            return std::unexpected(cancellationError(reason));
        return result;
    }

    [[nodiscard]] auto options() const noexcept -> StreamingOptions const& { return _options; }

    /// @brief The error reported for a call canceled for @p reason.
    [[nodiscard]] auto cancellationError(CancelReason reason) const -> Error;

  private:
    StreamingOptions _options;
};

} // namespace clockr::review
