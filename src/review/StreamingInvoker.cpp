// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <review/StreamingInvoker.hpp>

#include <algorithm>
#include <format>

namespace clockr::review
{

namespace
{
    auto wholeSeconds(std::chrono::milliseconds duration) -> long long
    {
        return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    }
} // namespace

CancellationWatchdog::CancellationWatchdog(StreamingOptions options, std::stop_token outer):
    _options(options),
    _lastActivity(std::chrono::steady_clock::now()),
    _deadline(_lastActivity + options.hardCeiling)
{
    if (outer.stop_possible())
        _outerLink.emplace(outer, std::function<void()> { [this] { cancel(CancelReason::Cancelled); } });

    _thread = std::jthread([this](std::stop_token self) { run(std::move(self)); });
}

void CancellationWatchdog::touch()
{
    auto const lock = std::lock_guard { _mutex };
    _lastActivity = std::chrono::steady_clock::now();
}

auto CancellationWatchdog::cancel(CancelReason reason) -> bool
{
    auto expected = CancelReason::None;
    if (!_reason.compare_exchange_strong(expected, reason))
        return false;
    _source.request_stop();
    return true;
}

void CancellationWatchdog::run(std::stop_token self)
{
    auto lock = std::unique_lock { _mutex };
    while (!self.stop_requested() && !_source.stop_requested())
    {
        auto const now = std::chrono::steady_clock::now();
        if (now >= _deadline)
        {
            lock.unlock();
            if (cancel(CancelReason::Deadline))
                log::warning("AI request exceeded {}s, canceling", wholeSeconds(_options.hardCeiling));
            return;
        }
        if (now - _lastActivity >= _options.idleLimit)
        {
            lock.unlock();
            if (cancel(CancelReason::IdleTimeout))
                log::warning("no AI output for {}s, canceling", wholeSeconds(_options.idleLimit));
            return;
        }

        auto const wakeAt = std::min(now + _options.pollPeriod, _deadline);
        _cv.wait_until(lock, self, wakeAt, [] { return false; });
    }
}

auto StreamingInvoker::cancellationError(CancelReason reason) const -> Error
{
    switch (reason)
    {
        case CancelReason::IdleTimeout:
            return Error { .code = ErrorCode::TimeoutError,
                           .message = std::format("no response from AI for {}s, request canceled",
                                                  wholeSeconds(_options.idleLimit)) };
        case CancelReason::Deadline:
            return Error { .code = ErrorCode::TimeoutError,
                           .message = std::format("AI request timed out after {}s",
                                                  wholeSeconds(_options.hardCeiling)) };
        case CancelReason::Cancelled:
            return Error { .code = ErrorCode::Cancelled, .message = "AI request canceled" };
        case CancelReason::None: break;
    }
    return Error { .code = ErrorCode::Unknown, .message = "AI request failed" };
}

} // namespace clockr::review
